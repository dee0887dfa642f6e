#include <algorithm>
#include <cstdlib>

#include "mailrules/mail_utils.hpp"
#include "mailrules/models/account.hpp"
#include "mailrules/constants.hpp"
#include "picosha2.h"
#include "spdlog/spdlog.h"

using namespace std;
using namespace mailcore;

static bool _verboseLogging = false;

// Forwards IMAP protocol traffic to the shared logger when --verbose is passed.

class SPDLogConnectionLogger : public ConnectionLogger {
public:
    void log(void * sender, ConnectionLogType logType, Data * buffer) {
        if (buffer == nullptr) {
            return;
        }
        string str(buffer->bytes(), buffer->length());
        if (logType == ConnectionLogTypeSentPrivate) {
            str = "(private data omitted)";
        }
        spdlog::get("logger")->debug("IMAP {}", str);
    }
};

static SPDLogConnectionLogger _connectionLogger;

string MailUtils::getEnvUTF8(string key) {
    const char * val = getenv(key.c_str());
    if (val == nullptr) {
        return "";
    }
    return string(val);
}

string MailUtils::roleForFolder(IMAPFolder * folder) {
    IMAPFolderFlag flags = folder->flags();
    if (flags & IMAPFolderFlagAll) {
        return "all";
    }
    if (flags & IMAPFolderFlagTrash) {
        return "trash";
    }
    if (flags & IMAPFolderFlagJunk) {
        return "spam";
    }
    if (flags & IMAPFolderFlagSpam) {
        return "spam";
    }
    if (flags & IMAPFolderFlagImportant) {
        return "important";
    }
    if (flags & IMAPFolderFlagArchive) {
        return "archive";
    }
    if (flags & IMAPFolderFlagInbox) {
        return "inbox";
    }

    string path = string(folder->path()->UTF8Characters());
    transform(path.begin(), path.end(), path.begin(), ::tolower);

    if (COMMON_FOLDER_NAMES.find(path) != COMMON_FOLDER_NAMES.end()) {
        return COMMON_FOLDER_NAMES[path];
    }
    return "";
}

string MailUtils::idForFolder(string accountId, string folderPath) {
    vector<unsigned char> hash(32);
    string src_str = accountId + ":" + folderPath;
    picosha2::hash256(src_str.begin(), src_str.end(), hash.begin(), hash.end());
    return picosha2::bytes_to_hex_string(hash.begin(), hash.end());
}

string MailUtils::qmarks(size_t count) {
    if (count == 0) {
        return "";
    }
    string qmarks{"?"};
    for (size_t i = 1; i < count; i ++) {
        qmarks = qmarks + ",?";
    }
    return qmarks;
}

void MailUtils::enableVerboseLogging() {
    _verboseLogging = true;
    spdlog::get("logger")->set_level(spdlog::level::debug);
}

void MailUtils::configureSessionForAccount(IMAPSession & session, shared_ptr<Account> account) {
    session.setHostname(AS_MCSTR(account->IMAPHost()));
    session.setPort(account->IMAPPort());
    session.setUsername(AS_MCSTR(account->IMAPUsername()));

    string token = account->IMAPOAuth2Token();
    if (token != "") {
        session.setOAuth2Token(AS_MCSTR(token));
        session.setAuthType(AuthTypeXOAuth2);
    } else {
        session.setPassword(AS_MCSTR(account->IMAPPassword()));
    }

    string security = account->IMAPSecurity();
    if (security == "SSL / TLS") {
        session.setConnectionType(ConnectionTypeTLS);
    } else if (security == "STARTTLS") {
        session.setConnectionType(ConnectionTypeStartTLS);
    } else {
        session.setConnectionType(ConnectionTypeClear);
    }
    session.setCheckCertificateEnabled(!account->IMAPAllowInsecureSSL());

    if (_verboseLogging) {
        session.setConnectionLogger(&_connectionLogger);
    }
}
