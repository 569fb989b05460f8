//
//  main.cpp
//  MailGate
//

#include <iostream>
#include <string>
#include <time.h>

#include <MailCore/MailCore.h>
#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"
#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/sinks/ansicolor_sink.h"
#include "spdlog/sinks/stdout_sinks.h"
#include "optionparser.h"

#include "mailgate/gateway_config.hpp"
#include "mailgate/gateway_exception.hpp"
#include "mailgate/session_store.hpp"
#include "mailgate/mailbox_connector.hpp"
#include "mailgate/mail_gateway.hpp"
#include "mailgate/command_processor.hpp"
#include "mailgate/comm_stream.hpp"
#include "mailgate/mail_utils.hpp"
#include "mailgate/thread_utils.hpp"
#include "mailgate/request_dispatcher.hpp"
#include "mailgate/spd_log_extensions.hpp"
#include "mailgate/constants.hpp"

using namespace mailcore;
using namespace nlohmann;
using option::Option;
using option::Descriptor;
using option::Parser;
using option::Stats;
using option::ArgStatus;

class AccumulatorLogger : public ConnectionLogger {
public:
    std::string accumulated;

    void log(std::string str) {
        accumulated = accumulated + str;
    }

    void log(void * sender, ConnectionLogType logType, Data * buffer) {
        if (logType == ConnectionLogTypeSentPrivate) {
            accumulated = accumulated + "[credentials redacted]\n";
            return;
        }
        if (buffer) {
            accumulated = accumulated + std::string(buffer->bytes(), buffer->length());
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

#define USAGE_STRING "USAGE: CONFIG_DIR_PATH=/path mailgate [options]\n\nOptions:"

enum  optionIndex { UNKNOWN, HELP, CONFIG, ACCOUNT, MODE, ORPHAN, VERBOSE };
const option::Descriptor usage[] =
{
    {UNKNOWN, 0,"" , "",        CArg::None,      USAGE_STRING },
    {HELP,    0,"" , "help",    CArg::None,      "  --help  \tPrint usage and exit." },
    {CONFIG,  0,"c", "config",  CArg::Optional,  "  --config, -c  \tOptional: Gateway config JSON. Read from the first line of stdin when omitted." },
    {ACCOUNT, 0,"a", "account", CArg::Optional,  "  --account, -a  \tRequired for test: Account JSON with `email` and `password`." },
    {MODE,    0,"m", "mode",    CArg::Required,  "  --mode, -m  \tRequired: serve or test." },
    {ORPHAN,  0,"o", "orphan",  CArg::None,      "  --orphan, -o  \tOptional: log to stdout instead of the log file in CONFIG_DIR_PATH." },
    {VERBOSE, 0,"v", "verbose", CArg::None,      "  --verbose, -v  \tOptional: log all IMAP and SMTP traffic for debugging purposes." },
    {0,0,0,0,0,0}
};

int runTestAuth(std::shared_ptr<GatewayConfig> config, json account) {
    AutoreleasePool pool;
    AccumulatorLogger logger;
    MailboxConnector connector(config);
    connector.setConnectionLogger(&logger);

    Credentials creds {
        account.value("email", ""),
        account.value("password", ""),
    };
    std::string errorService = "imap";

    json resp = {
        {"error", nullptr},
        {"error_service", nullptr},
        {"log", ""},
        {"email", creds.emailAddress},
    };

    try {
        logger.log("----------IMAP----------\n");
        connector.probe(creds);

        logger.log("\n\n----------SMTP----------\n");
        errorService = "smtp";
        std::unique_ptr<SMTPConnection> smtp = connector.openSMTP(creds);
        smtp->verify(Address::addressWithMailbox(AS_TRANSIENT_MCSTR(creds.emailAddress)));

    } catch (GatewayException & ex) {
        resp["error"] = ex.toJSON();
        resp["error_service"] = errorService;
    }

    resp["log"] = logger.accumulated;
    std::cout << resp.dump();
    return resp["error"].is_null() ? 0 : 1;
}

void runListenOnMainThread(std::shared_ptr<CommandProcessor> processor) {
    CommStream stream;
    auto logger = spdlog::get("logger");

    RequestDispatcher dispatcher(MAILGATE_MAX_INFLIGHT);

    while (true) {
        json packet;
        try {
            packet = stream.waitForJSON();
        } catch (std::invalid_argument & ex) {
            json resp = CommandProcessor::malformedResponse(ex.what());
            logger->error(resp.dump());
            stream.sendJSON(resp);
            continue;
        }

        if (packet.is_null()) {
            if (!stream.good()) {
                // stdin was closed, our parent is gone.
                break;
            }
            continue;
        }

        dispatcher.dispatch([&stream, processor, packet]() {
            AutoreleasePool pool;
            json resp = processor->perform(packet);
            stream.sendJSON(resp);
        });
    }

    logger->info("stdin closed, waiting for in-flight requests to finish.");
    dispatcher.waitForIdle();
}

int main(int argc, const char * argv[]) {
    SetThreadName("main");

    // indicate we use cout, not stdout
    std::cout.sync_with_stdio(false);

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
    std::string eConfigDirPath = MailUtils::getEnvUTF8("CONFIG_DIR_PATH");
    if (eConfigDirPath == "" && !options[ORPHAN]) {
        option::printUsage(std::cout, usage);
        return 1;
    }

    std::string mode(options[MODE].arg);
    if (mode != "serve" && mode != "test") {
        option::printUsage(std::cout, usage);
        return 1;
    }

    // get the config via param or stdin
    json configJSON;
    try {
        if (options[CONFIG].count() > 0 && options[CONFIG].arg) {
            configJSON = json::parse(options[CONFIG].arg);
        } else {
            std::cout << "\nWaiting for Config JSON:\n";
            std::string inputLine;
            std::getline(std::cin, inputLine);
            configJSON = json::parse(inputLine);
        }
    } catch (json::parse_error & ex) {
        json resp = { { "error", std::string("Config is not valid JSON: ") + ex.what() } };
        std::cout << "\n" << resp.dump();
        return 1;
    }

    auto config = std::make_shared<GatewayConfig>(configJSON);
    if (config->valid() != "") {
        json resp = { { "error", "Config has a malformed field: " + config->valid() } };
        std::cout << "\n" << resp.dump();
        return 1;
    }

    // setup logging to file or console
    std::vector<std::shared_ptr<spdlog::sinks::sink>> sinks;
    std::string pattern;

    if (!options[ORPHAN]) {
        // If we're attached to a parent process, log everything to a
        // rotating log file with the full format.
        pattern = "%P [%Y-%m-%d %H:%M:%S.%e] [%*] [%l] %v";
        std::string logPath = eConfigDirPath + "/mailgate.log";
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logPath, 1048576 * 5, 3));
        sinks.push_back(std::make_shared<SPDFlusherSink>());
    } else {
        // If we're attached to a console, log everything to
        // stdout in an abbreviated format.
        pattern = "%l: %v";
        sinks.push_back(std::make_shared<spdlog::sinks::ansicolor_stdout_sink_mt>());
    }

    // Always log critical errors to the stderr as well as a log file / stdout.
    auto stderr_sink = std::make_shared<spdlog::sinks::stderr_sink_mt>();
    stderr_sink->set_level(spdlog::level::critical);
    sinks.push_back(stderr_sink);

    auto logger = std::make_shared<spdlog::logger>("logger", std::begin(sinks), std::end(sinks));
    logger->set_formatter(SPDFormatterWithThreadNames(pattern));
    spdlog::register_logger(logger);

    if (mode == "test") {
        json account;
        try {
            account = json::parse(options[ACCOUNT].arg ? options[ACCOUNT].arg : "");
        } catch (json::parse_error &) {
            json resp = { { "error", "--account must be JSON with `email` and `password`." } };
            std::cout << "\n" << resp.dump();
            return 1;
        }
        if (!account.is_object()) {
            json resp = { { "error", "--account must be JSON with `email` and `password`." } };
            std::cout << "\n" << resp.dump();
            return 1;
        }
        return runTestAuth(config, account);
    }

    logger->info("------------- Starting MailGate ({}:{}, {}:{}) ---------------", config->IMAPHost(), config->IMAPPort(), config->SMTPHost(), config->SMTPPort());

    auto connector = std::make_shared<MailboxConnector>(config);
    std::unique_ptr<ProtocolTraceLogger> traceLogger;
    if (options[VERBOSE]) {
        logger->set_level(spdlog::level::debug);
        traceLogger.reset(new ProtocolTraceLogger());
        connector->setConnectionLogger(traceLogger.get());
    }

    auto store = std::make_shared<SessionStore>(config->sessionTTL());
    auto gateway = std::make_shared<MailGateway>(store, connector);
    auto processor = std::make_shared<CommandProcessor>(gateway);

    runListenOnMainThread(processor);

    logger->info("------------- MailGate exiting ---------------");
    logger->flush();
    return 0;
}
