#include "mailrules/models/account.hpp"


std::string Account::TABLE_NAME = "Account";

Account::Account(nlohmann::json json) : MailModel(json) {

}

std::string Account::valid() {
    if (!_data.count("id") || !_data.count("settings")) {
        return "id or settings";
    }
    if (!_data.count("provider")) {
        return "provider";
    }

    nlohmann::json & s = _data["settings"];

    if (!(s.count("xoauth2_token") || s.count("imap_password"))) {
        return "imap_password or xoauth2_token";
    }
    if (!(s.count("imap_port") && s.count("imap_host") && s.count("imap_username"))) {
        return "imap configuration";
    }
    if (!(s.count("imap_allow_insecure_ssl") && s["imap_allow_insecure_ssl"].is_boolean())) {
        return "imap_allow_insecure_ssl";
    }
    return ""; // true
}

std::string Account::provider() {
    return _data["provider"].get<std::string>();
}

std::string Account::emailAddress() {
    return _data.count("emailAddress") ? _data["emailAddress"].get<std::string>() : "";
}

unsigned int Account::IMAPPort() {
    nlohmann::json & val = _data["settings"]["imap_port"];
    return val.is_string() ? std::stoi(val.get<std::string>()) : val.get<unsigned int>();
}

std::string Account::IMAPHost() {
    return _data["settings"]["imap_host"].get<std::string>();
}

std::string Account::IMAPUsername() {
    nlohmann::json & s = _data["settings"];
    return s.count("imap_username") ? s["imap_username"].get<std::string>() : "";
}

std::string Account::IMAPPassword() {
    nlohmann::json & s = _data["settings"];
    return s.count("imap_password") ? s["imap_password"].get<std::string>() : "";
}

std::string Account::IMAPSecurity() {
    nlohmann::json & s = _data["settings"];
    return s.count("imap_security") ? s["imap_security"].get<std::string>() : "SSL / TLS";
}

std::string Account::IMAPOAuth2Token() {
    nlohmann::json & s = _data["settings"];
    return s.count("xoauth2_token") ? s["xoauth2_token"].get<std::string>() : "";
}

bool Account::IMAPAllowInsecureSSL() {
    return _data["settings"]["imap_allow_insecure_ssl"].get<bool>();
}

std::string Account::tableName() {
    return Account::TABLE_NAME;
}

/* Account objects are not stored in the database. */
std::vector<std::string> Account::columnsForQuery() {
    return std::vector<std::string>{};
}
