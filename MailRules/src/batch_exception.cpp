#include "mailrules/batch_exception.hpp"
#include "mailrules/constants.hpp"

using namespace std;

static string _keyForErrorCode(mailcore::ErrorCode c) {
    if (ErrorCodeToTypeMap.count(c)) {
        return ErrorCodeToTypeMap[c];
    }
    return "ErrorUnknown";
}

BatchException::BatchException(string key, string di, bool retryable) :
    GenericException(key + ": " + di),
    retryable(retryable),
    key(key),
    debuginfo(di)
{
}

BatchException::BatchException(mailcore::ErrorCode c, string di) :
    GenericException(_keyForErrorCode(c) + ": " + di),
    key(_keyForErrorCode(c)),
    debuginfo(di)
{
    if (c == mailcore::ErrorConnection) {
        retryable = true;
    }
    if (c == mailcore::ErrorParse) {
        // Parse errors are usually caused by the connection dropping mid-response.
        retryable = true;
    }
}

bool BatchException::isRetryable() {
    return retryable;
}

bool BatchException::isMalformedInput() {
    return key == BATCH_MALFORMED_INPUT;
}

nlohmann::json BatchException::toJSON() {
    return {
        {"key", key},
        {"debuginfo", debuginfo},
        {"retryable", retryable},
    };
}
