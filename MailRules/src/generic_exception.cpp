#include "mailrules/generic_exception.hpp"
#include "StanfordCPPLib/exceptions.h"

GenericException::GenericException() :
    _what("generic")
{
    stacktrace::call_stack trace;
    _stackentries = trace.stack;
}

GenericException::GenericException(std::string what) :
    _what(what)
{
    stacktrace::call_stack trace;
    _stackentries = trace.stack;
}

const char * GenericException::what() const noexcept {
    return _what.c_str();
}

void GenericException::printStackTrace() {
    exceptions::printStackTrace(_stackentries);
}

nlohmann::json GenericException::toJSON() {
    return {
        {"what", what()},
    };
}
