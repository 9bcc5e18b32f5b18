#include "Logger.hpp"
#include "Receiver.hpp"
#include "Sender.hpp"
#include "Utils.hpp"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace filepush {

namespace {
    constexpr int EXIT_OK = 0;
    constexpr int EXIT_SESSION_FAILED = 1;
    constexpr int EXIT_USAGE = 2;

    struct UsageError : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    void printUsage(std::ostream& out) {
        out << "Usage:\n"
               "  filepush send [options] HOST:PORT FILE...\n"
               "      --bind HOST:PORT     local address to bind before connecting\n"
               "      --timeout            bound every socket operation by a timeout\n"
               "      --timeout-secs N     timeout length in seconds (default 30)\n"
               "      --name NAME          wire name for a single file\n"
               "  filepush recv [options] [HOST:]PORT\n"
               "      --dest DIR           directory for received files (default: .)\n"
               "      --timeout-secs N     timeout used when the sender asks for one\n"
               "  common options:\n"
               "      --log-file PATH      append log lines to PATH\n"
               "      --verbose            log every handshake step\n"
               "      --quiet              log errors only\n"
               "      --help               show this text\n";
    }

    std::chrono::seconds parseTimeout(const std::string& text) {
        try {
            return Utils::parseTimeout(text);
        }
        catch (const TransferError& e) {
            throw UsageError(e.what());
        }
    }

    struct CommandLine {
        std::string mode;
        std::vector<std::string> positional;
        std::optional<std::string> bind;
        std::optional<std::string> name;
        std::optional<std::string> dest;
        std::optional<std::string> logFile;
        bool useTimeout = false;
        std::chrono::seconds timeout = protocol::DEFAULT_TIMEOUT;
        bool verbose = false;
        bool quiet = false;
        bool help = false;
    };

    CommandLine parseArguments(int argc, char* argv[]) {
        CommandLine cmd;
        if (argc < 2) {
            throw UsageError("Missing mode");
        }

        int i = 1;
        std::string first = argv[1];
        if (first == "--help" || first == "-h") {
            cmd.help = true;
            return cmd;
        }
        cmd.mode = first;
        if (cmd.mode != "send" && cmd.mode != "recv") {
            throw UsageError("Unknown mode: " + cmd.mode);
        }

        auto valueFor = [&](const std::string& flag) -> std::string {
            if (i + 1 >= argc) {
                throw UsageError(flag + " requires a value");
            }
            return argv[++i];
        };

        for (i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--help" || arg == "-h") {
                cmd.help = true;
            } else if (arg == "--bind" && cmd.mode == "send") {
                cmd.bind = valueFor(arg);
            } else if (arg == "--name" && cmd.mode == "send") {
                cmd.name = valueFor(arg);
            } else if (arg == "--timeout" && cmd.mode == "send") {
                cmd.useTimeout = true;
            } else if (arg == "--timeout-secs") {
                cmd.timeout = parseTimeout(valueFor(arg));
            } else if (arg == "--dest" && cmd.mode == "recv") {
                cmd.dest = valueFor(arg);
            } else if (arg == "--log-file") {
                cmd.logFile = valueFor(arg);
            } else if (arg == "--verbose" || arg == "-v") {
                cmd.verbose = true;
            } else if (arg == "--quiet" || arg == "-q") {
                cmd.quiet = true;
            } else if (arg.size() > 1 && arg[0] == '-') {
                throw UsageError("Unknown option for " + cmd.mode + ": " + arg);
            } else {
                cmd.positional.push_back(arg);
            }
        }
        return cmd;
    }

    int runSend(const CommandLine& cmd) {
        if (cmd.positional.size() < 2) {
            throw UsageError("send needs HOST:PORT and at least one FILE");
        }
        if (cmd.name && cmd.positional.size() != 2) {
            throw UsageError("--name applies to a single file only");
        }

        SenderOptions options;
        try {
            options.remote = Utils::parseEndpoint(cmd.positional[0]);
            if (cmd.bind) {
                options.local = Utils::parseEndpoint(*cmd.bind);
            }
        }
        catch (const TransferError& e) {
            throw UsageError(e.what());
        }
        options.useTimeout = cmd.useTimeout;
        options.timeout = cmd.timeout;

        Sender sender(options);
        for (size_t i = 1; i < cmd.positional.size(); ++i) {
            sender.addFile(cmd.positional[i], cmd.name);
        }

        SessionReport report = sender.run();
        for (const auto& record : report) {
            std::cout << "sent " << record.name << " " << record.size << " bytes" << std::endl;
        }
        return EXIT_OK;
    }

    int runRecv(const CommandLine& cmd) {
        if (cmd.positional.size() != 1) {
            throw UsageError("recv needs exactly one [HOST:]PORT");
        }

        ReceiverOptions options;
        try {
            options.local = Utils::parseEndpoint(cmd.positional[0], true);
        }
        catch (const TransferError& e) {
            throw UsageError(e.what());
        }
        if (cmd.dest) {
            options.destination = *cmd.dest;
        }
        options.timeout = cmd.timeout;

        Receiver receiver(options);
        uint16_t port = receiver.listen();
        std::cout << "listening on port " << port << std::endl;

        SessionReport report = receiver.run();
        for (const auto& record : report) {
            std::cout << "received " << record.name << " " << record.size << " bytes" << std::endl;
        }
        return EXIT_OK;
    }
}

} // namespace filepush

int main(int argc, char* argv[]) {
    using namespace filepush;

    CommandLine cmd;
    try {
        cmd = parseArguments(argc, argv);
    }
    catch (const UsageError& e) {
        std::cerr << "filepush: " << e.what() << "\n";
        printUsage(std::cerr);
        return EXIT_USAGE;
    }
    if (cmd.help) {
        printUsage(std::cout);
        return EXIT_OK;
    }

    // Configure logging
    Logger::setLogLevel(cmd.verbose ? LogLevel::Debug
                        : cmd.quiet ? LogLevel::Error
                                    : LogLevel::Info);
    if (cmd.logFile) {
        Logger::setLogFile(*cmd.logFile);
    }

    int status = EXIT_SESSION_FAILED;
    try {
        status = cmd.mode == "send" ? runSend(cmd) : runRecv(cmd);
    }
    catch (const UsageError& e) {
        std::cerr << "filepush: " << e.what() << "\n";
        printUsage(std::cerr);
        status = EXIT_USAGE;
    }
    catch (const TransferError& e) {
        std::cerr << "filepush: " << toString(e.code()) << ": " << e.what() << std::endl;
        status = EXIT_SESSION_FAILED;
    }
    catch (const std::exception& e) {
        Logger::logEvent(LogLevel::Fatal, std::string("Fatal error: ") + e.what());
        status = EXIT_SESSION_FAILED;
    }

    Logger::flush();
    return status;
}
