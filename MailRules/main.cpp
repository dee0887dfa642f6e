//
//  main.cpp
//  MailRules
//
//  Use of this file is subject to the terms and conditions defined
//  in 'LICENSE.md', which is part of the Mailspring-Sync package.
//

#include <fstream>
#include <iostream>
#include <string>
#include <time.h>
#include <sqlite3.h>

#include <MailCore/MailCore.h>
#include <SQLiteCpp/SQLiteCpp.h>
#include <StanfordCPPLib/exceptions.h>
#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"
#include "spdlog/sinks/ansicolor_sink.h"
#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/sinks/stdout_sinks.h"
#include "optionparser.h"

#include "mailrules/action_engine.hpp"
#include "mailrules/batch_exception.hpp"
#include "mailrules/constants.hpp"
#include "mailrules/dataset_loader.hpp"
#include "mailrules/imap_mailbox_service.hpp"
#include "mailrules/mail_store.hpp"
#include "mailrules/mail_utils.hpp"
#include "mailrules/session_context.hpp"
#include "mailrules/models/account.hpp"

using namespace nlohmann;
using namespace mailcore;
using namespace std;
using option::Option;
using option::Descriptor;
using option::Parser;
using option::Stats;
using option::ArgStatus;


class AccumulatorLogger : public ConnectionLogger {
public:
    string accumulated;

    void log(string str) {
        accumulated = accumulated + str;
    }

    void log(void * sender, ConnectionLogType logType, Data * buffer) {
        if (buffer && logType != ConnectionLogTypeSentPrivate) {
            accumulated = accumulated + string(buffer->bytes(), buffer->length());
        }
    }
};

struct CArg: public option::Arg
{
    static ArgStatus Required(const Option& option, bool)
    {
        return option.arg == 0 ? option::ARG_ILLEGAL : option::ARG_OK;
    }
    static ArgStatus Optional(const Option& option, bool)
    {
        return option.arg == 0 ? option::ARG_IGNORE : option::ARG_OK;
    }
};

#define USAGE_STRING "USAGE: CONFIG_DIR_PATH=/path mailrules [options]\n\nOptions:"

enum  optionIndex { UNKNOWN, HELP, ACCOUNT, CONFIG, BATCH, GRANULARITY, MODE, ORPHAN, VERBOSE };
const option::Descriptor usage[] =
{
    {UNKNOWN,     0,"" , "",            CArg::None,      USAGE_STRING },
    {HELP,        0,"" , "help",        CArg::None,      "  --help  \tPrint usage and exit." },
    {ACCOUNT,     0,"a", "account",     CArg::Optional,  "  --account, -a  \tRequired: Account JSON with credentials. Read from stdin when omitted." },
    {CONFIG,      0,"c", "config",      CArg::Required,  "  --config, -c  \tRequired for apply: session JSON with the processed and unprocessed label names." },
    {BATCH,       0,"b", "batch",       CArg::Required,  "  --batch, -b  \tRequired for apply: path to the batch JSON produced by the rule stage." },
    {GRANULARITY, 0,"g", "granularity", CArg::Required,  "  --granularity, -g  \tOptional: thread (default) or message." },
    {MODE,        0,"m", "mode",        CArg::Required,  "  --mode, -m  \tRequired: apply or test." },
    {ORPHAN,      0,"o", "orphan",      CArg::None,      "  --orphan, -o  \tOptional: log to the console instead of the account's log file." },
    {VERBOSE,     0,"v", "verbose",     CArg::None,      "  --verbose, -v  \tOptional: log all IMAP traffic for debugging purposes." },
    {0,0,0,0,0,0}
};

int runTestAuth(shared_ptr<Account> account) {
    IMAPSession session;
    AccumulatorLogger logger;
    Array * folders;
    ErrorCode err = ErrorNone;
    bool hasRequiredFolder = false;

    logger.log("----------IMAP----------\n");
    MailUtils::configureSessionForAccount(session, account);
    session.setConnectionLogger(&logger);
    session.connect(&err);
    if (err != ErrorNone) {
        goto done;
    }
    folders = session.fetchAllFolders(&err);
    if (err != ErrorNone) {
        goto done;
    }

    // Batches always change labels, so only servers with X-GM-LABELS qualify.
    if (session.storedCapabilities() == nullptr || !session.storedCapabilities()->containsIndex(IMAPCapabilityGmail)) {
        err = ErrorCapability;
        logger.log("\n\nThis server does not support Gmail labels (X-GM-LABELS), which mail rules need to mark messages as processed.\n");
        goto done;
    }
    for (unsigned int i = 0; i < folders->count(); i ++) {
        string role = MailUtils::roleForFolder((IMAPFolder *)folders->objectAtIndex(i));
        if (role == "all") {
            hasRequiredFolder = true;
            break;
        }
    }
    if (!hasRequiredFolder) {
        err = ErrorNonExistantFolder;
        logger.log("\n\nRequired folder not found. Verify that `All Mail` is enabled for IMAP in your Gmail settings.\n");
    }

done:
    json resp = {
        {"error", nullptr},
        {"log", logger.accumulated},
        {"account", nullptr}
    };
    if (err == ErrorNone) {
        resp["account"] = account->toJSON();
        cout << resp.dump();
        return 0;
    }
    resp["error"] = ErrorCodeToTypeMap.count(err) ? ErrorCodeToTypeMap[err] : "Unknown";
    cout << resp.dump();
    return 1;
}

int runApply(shared_ptr<Account> account, SessionConfig config, json batch, string granularity) {
    auto logger = spdlog::get("logger");
    json resp = {{"error", nullptr}, {"report", nullptr}};

    try {
        AutoreleasePool pool;
        IMAPSession imap;
        MailUtils::configureSessionForAccount(imap, account);

        ErrorCode err = ErrorNone;
        imap.connect(&err);
        if (err != ErrorNone) {
            throw BatchException(err, "connect");
        }

        MailStore store;
        IMAPMailboxService service{&imap, account, config};
        SessionContext session{config, &service};
        DatasetLoader loader{&store, &session};

        if (granularity == "message") {
            auto dataset = loader.loadMessages(batch);
            ActionEngine<Message> engine{&service, &session};
            resp["report"] = engine.applyAllActions(dataset).toJSON();
        } else {
            auto dataset = loader.loadThreads(batch);
            ActionEngine<Thread> engine{&service, &session};
            resp["report"] = engine.applyAllActions(dataset).toJSON();
        }
        imap.disconnect();

    } catch (BatchException & ex) {
        logger->error("Batch failed: {}", ex.toJSON().dump());
        if (!ex.isMalformedInput()) {
            ex.printStackTrace();
        }
        resp["error"] = ex.toJSON();
        cout << "\n" << resp.dump();
        return 1;
    } catch (SQLite::Exception & ex) {
        logger->error("Batch failed: could not read the mail store: {}", ex.what());
        resp["error"] = {{"key", "mail-store"}, {"debuginfo", ex.what()}, {"retryable", false}};
        cout << "\n" << resp.dump();
        return 1;
    }

    cout << "\n" << resp.dump();
    return 0;
}

int main(int argc, const char * argv[]) {
    // initialize the stanford exception handler
    exceptions::setProgramNameForStackTrace(argv[0]);
    exceptions::setTopLevelExceptionHandlerEnabled(true);

    // parse launch arguments, skip program name argv[0] if present
    argc-=(argc>0); argv+=(argc>0);
    option::Stats  stats(usage, argc, argv);
    option::Option options[20], buffer[20];
    option::Parser parse(usage, argc, argv, options, buffer);

    if (parse.error())
        return 1;

    if (options[HELP] || argc == 0 || !options[MODE]) {
        option::printUsage(std::cout, usage);
        return 1;
    }

    // check required environment
    string eConfigDirPath = MailUtils::getEnvUTF8("CONFIG_DIR_PATH");
    if (eConfigDirPath == "") {
        option::printUsage(std::cout, usage);
        return 1;
    }

    // keep SQLite's temporary files beside the mail store
    sqlite3_temp_directory = sqlite3_mprintf("%s", eConfigDirPath.c_str());

    string mode(options[MODE].arg);
    if (mode != "apply" && mode != "test") {
        option::printUsage(std::cout, usage);
        return 1;
    }

    // get the account via param or stdin
    shared_ptr<Account> account = nullptr;
    try {
        if (options[ACCOUNT].count() > 0 && options[ACCOUNT].arg) {
            account = make_shared<Account>(json::parse(options[ACCOUNT].arg));
        } else {
            cout << "\nWaiting for Account JSON:\n";
            string inputLine;
            getline(cin, inputLine);
            account = make_shared<Account>(json::parse(inputLine.c_str()));
        }
    } catch (std::exception & ex) {
        json resp = { { "error", string("Account JSON could not be read: ") + ex.what() } };
        cout << "\n" << resp.dump();
        return 1;
    }

    if (account->valid() != "") {
        json resp = { { "error", "Account is missing required fields:" + account->valid() } };
        cout << "\n" << resp.dump();
        return 1;
    }

    // setup logging to file or console
    std::vector<spdlog::sink_ptr> sinks;
    string pattern;

    if (!options[ORPHAN]) {
        // When run by the mail client, log everything to a rotating log
        // file with the default logger format.
        pattern = "%P %+";
        string logPath = eConfigDirPath + FS_PATH_SEP + "mailrules-" + account->id() + ".log";
        sinks.push_back(make_shared<spdlog::sinks::rotating_file_sink_mt>(logPath, 1048576 * 5, 3));
    } else {
        // When attached to a console, log everything to stdout in an
        // abbreviated format.
        pattern = "%l: %v";
        sinks.push_back(make_shared<spdlog::sinks::ansicolor_stdout_sink_mt>());
    }

    // Always log critical errors to the stderr as well as a log file / stdout.
    auto stderr_sink = make_shared<spdlog::sinks::stderr_sink_mt>();
    stderr_sink->set_level(spdlog::level::critical);
    sinks.push_back(stderr_sink);

    auto logger = make_shared<spdlog::logger>("logger", std::begin(sinks), std::end(sinks));
    logger->set_pattern(pattern);
    logger->flush_on(spdlog::level::info);
    spdlog::register_logger(logger);

    if (options[VERBOSE]) {
        MailUtils::enableVerboseLogging();
    }

    if (mode == "test") {
        return runTestAuth(account);
    }

    // apply
    if (!options[CONFIG] || !options[BATCH]) {
        option::printUsage(std::cout, usage);
        return 1;
    }

    string granularity = options[GRANULARITY] ? string(options[GRANULARITY].arg) : "thread";
    if (granularity != "thread" && granularity != "message") {
        json resp = { { "error", "Unknown granularity: " + granularity } };
        cout << "\n" << resp.dump();
        return 1;
    }

    json configJSON;
    json batch;
    try {
        configJSON = json::parse(options[CONFIG].arg);
        std::ifstream batchFile(options[BATCH].arg);
        if (!batchFile.good()) {
            throw std::invalid_argument(string("cannot open ") + options[BATCH].arg);
        }
        batchFile >> batch;
    } catch (std::exception & ex) {
        json resp = { { "error", string("Input could not be read: ") + ex.what() } };
        cout << "\n" << resp.dump();
        return 1;
    }

    if (!configJSON.is_object()) {
        json resp = { { "error", "Session configuration must be a JSON object" } };
        cout << "\n" << resp.dump();
        return 1;
    }
    SessionConfig config{configJSON};
    if (config.valid() != "") {
        json resp = { { "error", "Session configuration has an invalid field: " + config.valid() } };
        cout << "\n" << resp.dump();
        return 1;
    }

    logger->info("------------- Applying Batch ({}, {}) ---------------", account->emailAddress(), granularity);
    return runApply(account, config, batch, granularity);
}
