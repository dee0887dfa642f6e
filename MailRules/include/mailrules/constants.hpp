/** Constants [MailRules]
 */

/* LICENSE
* Copyright (C) 2017-2021 Foundry 376.
*
* This program is free software: you can redistribute it and/or modify
* it under the terms of the GNU General Public License as published by
* the Free Software Foundation, either version 3 of the License, or
* (at your option) any later version.
*
* This program is distributed in the hope that it will be useful,
* but WITHOUT ANY WARRANTY; without even the implied warranty of
* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
* GNU General Public License for more details.
*
* You should have received a copy of the GNU General Public License
* along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

#ifndef constants_h
#define constants_h

#include <map>
#include <string>
#include <vector>
#include "MailCore/MailCore.h"

#define AS_MCSTR(X)         mailcore::String::uniquedStringWithUTF8Characters(X.c_str())

#if defined(_MSC_VER)
#define FS_PATH_SEP         "\\"
#else
#define FS_PATH_SEP         "/"
#endif

static std::string MAILRULES_FOLDER_PREFIX = "[Mailrules]";

// Subset of the sync engine's schema. The batch engine only reads threads
// and messages; migrate() creates these tables for fresh stores and tests.

static std::vector<std::string> SETUP_QUERIES = {
    "CREATE TABLE IF NOT EXISTS Thread ("
        "id VARCHAR(42) PRIMARY KEY,"
        "accountId VARCHAR(8),"
        "version INTEGER,"
        "data TEXT,"
        "gThrId VARCHAR(20),"
        "subject VARCHAR(500),"
        "lastMessageTimestamp DATETIME)",

    "CREATE INDEX IF NOT EXISTS ThreadGmailLookup ON `Thread` (gThrId) WHERE gThrId IS NOT NULL",

    "CREATE TABLE IF NOT EXISTS Message ("
        "id VARCHAR(40) PRIMARY KEY,"
        "accountId VARCHAR(8),"
        "version INTEGER,"
        "data TEXT,"
        "headerMessageId VARCHAR(255),"
        "gThrId VARCHAR(255),"
        "subject VARCHAR(500),"
        "date DATETIME,"
        "remoteUID INTEGER,"
        "remoteFolderId VARCHAR(40),"
        "threadId VARCHAR(40))",

    "CREATE INDEX IF NOT EXISTS MessageListThreadIndex ON Message(threadId, date ASC)",
};

static std::map<std::string, std::string> COMMON_FOLDER_NAMES = {
    {"gel\xc3\xb6scht", "trash"},
    {"papierkorb", "trash"},
    {"[imap]/trash", "trash"},
    {"papelera", "trash"},
    {"deleted items", "trash"},
    {"gel\xc3\xb6schte elemente", "trash"},
    {"deleted messages", "trash"},
    {"[gmail]/trash", "trash"},
    {"inbox/trash", "trash"},
    {"trash", "trash"},
    {"mail/trash", "trash"},
    {"inbox.trash", "trash"},

    {"inbox.spam", "spam"},
    {"spam", "spam"},
    {"[gmail]/spam", "spam"},
    {"[imap]/spam", "spam"},
    {"junk", "spam"},
    {"junk mail", "spam"},
    {"junk e-mail", "spam"},

    {"inbox", "inbox"},

    {"archive", "archive"},
    {"archives", "archive"},
    {"inbox.archive", "archive"},
    {"[gmail]/all mail", "all"},
};

static std::map<mailcore::ErrorCode, std::string> ErrorCodeToTypeMap = {
    {mailcore::ErrorNone, "ErrorNone"},
    {mailcore::ErrorConnection, "ErrorConnection"},
    {mailcore::ErrorTLSNotAvailable, "ErrorTLSNotAvailable"},
    {mailcore::ErrorParse, "ErrorParse"},
    {mailcore::ErrorCertificate, "ErrorCertificate"},
    {mailcore::ErrorAuthentication, "ErrorAuthentication"},
    {mailcore::ErrorGmailIMAPNotEnabled, "ErrorGmailIMAPNotEnabled"},
    {mailcore::ErrorGmailExceededBandwidthLimit, "ErrorGmailExceededBandwidthLimit"},
    {mailcore::ErrorGmailTooManySimultaneousConnections, "ErrorGmailTooManySimultaneousConnections"},
    {mailcore::ErrorMobileMeMoved, "ErrorMobileMeMoved"},
    {mailcore::ErrorYahooUnavailable, "ErrorYahooUnavailable"},
    {mailcore::ErrorNonExistantFolder, "ErrorNonExistantFolder"},
    {mailcore::ErrorRename, "ErrorRename"},
    {mailcore::ErrorDelete, "ErrorDelete"},
    {mailcore::ErrorCreate, "ErrorCreate"},
    {mailcore::ErrorSubscribe, "ErrorSubscribe"},
    {mailcore::ErrorAppend, "ErrorAppend"},
    {mailcore::ErrorCopy, "ErrorCopy"},
    {mailcore::ErrorExpunge, "ErrorExpunge"},
    {mailcore::ErrorFetch, "ErrorFetch"},
    {mailcore::ErrorIdle, "ErrorIdle"},
    {mailcore::ErrorIdentity, "ErrorIdentity"},
    {mailcore::ErrorNamespace, "ErrorNamespace"},
    {mailcore::ErrorStore, "ErrorStore"},
    {mailcore::ErrorCapability, "ErrorCapability"},
    {mailcore::ErrorStartTLSNotAvailable, "ErrorStartTLSNotAvailable"},
    {mailcore::ErrorGmailApplicationSpecificPasswordRequired, "ErrorGmailApplicationSpecificPasswordRequired"},
    {mailcore::ErrorOutlookLoginViaWebBrowser, "ErrorOutlookLoginViaWebBrowser"},
    {mailcore::ErrorNeedsConnectToWebmail, "ErrorNeedsConnectToWebmail"},
    {mailcore::ErrorNoValidServerFound, "ErrorNoValidServerFound"},
    {mailcore::ErrorAuthenticationRequired, "ErrorAuthenticationRequired"},
    {mailcore::ErrorServerDate, "ErrorServerDate"},
    {mailcore::ErrorNoop, "ErrorNoop"},
    {mailcore::ErrorCustomCommand, "ErrorCustomCommand"},
};

#endif /* constants_h */
