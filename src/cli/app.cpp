// SECPCORE - Command Line Application Implementation
// Copyright (c) 2024 SECPCORE Developers
// MIT License

#include "secpcore/cli/app.h"

#include "secpcore/crypto/bignum.h"
#include "secpcore/crypto/errors.h"
#include "secpcore/crypto/field.h"
#include "secpcore/crypto/point.h"
#include "secpcore/crypto/secp256k1.h"
#include "secpcore/util/config.h"
#include "secpcore/util/logging.h"

#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace secpcore {
namespace cli {

namespace {

// ============================================================================
// CLI Configuration
// ============================================================================

struct CLIConfig {
    std::string configFile;

    // Logging
    util::LogLevel logLevel{util::LogLevel::Warn};
    std::string logFile;
    bool printToConsole{true};
    bool color{true};

    bool showHelp{false};
    bool showVersion{false};

    // Command and its arguments
    std::string command;
    std::vector<std::string> params;
};

/// Streams and parsed options shared by every command
struct Context {
    CLIConfig config;
    std::ostream& out;
    std::ostream& err;
};

// ============================================================================
// Help and Version
// ============================================================================

void PrintHelp(std::ostream& out) {
    out << CLIENT_NAME << " v" << VERSION << "\n\n";
    out << "Usage: secpcore-cli [options] <command> [params]\n\n";
    out << "Options:\n";
    out << "  --help                     Show this help message\n";
    out << "  --version                  Show version information\n";
    out << "  --conf=FILE                Config file path\n";
    out << "  --loglevel=LEVEL           trace, debug, info, warn, error, off\n";
    out << "                             (default: warn)\n";
    out << "  --logfile=FILE             Also write log output to FILE\n";
    out << "  --noprinttoconsole         Do not log to the console\n";
    out << "  --nocolor                  Disable colored log output\n";
    out << "\nCommands:\n";
    out << "  sample                     Print FieldElement(255), the identity and G\n";
    out << "  field <hex>                Validate and print a field element\n";
    out << "  point <x> <y>              Validate and print a curve point\n";
    out << "  lift <x> [even|odd]        Find the curve point with x coordinate x\n";
    out << "  mul <k>                    Print k*G (decimal or 0x hex, may be negative)\n";
    out << "  add <x1> <y1> <x2> <y2>    Print the sum of two curve points\n";
    out << "\nExamples:\n";
    out << "  secpcore-cli sample\n";
    out << "  secpcore-cli mul 2\n";
    out << "  secpcore-cli mul -1\n";
    out << "  secpcore-cli --loglevel=debug point 0x1 0x2\n";
    out << "\n";
}

void PrintVersion(std::ostream& out) {
    out << CLIENT_NAME << " version " << VERSION << "\n";
    out << "Copyright (c) 2024 SECPCORE Developers\n";
    out << "MIT License\n";
}

// ============================================================================
// Argument Handling
// ============================================================================

void PrintParseError(std::ostream& err, const util::ConfigParseResult& result) {
    err << "Error: " << result.errorMessage;
    if (result.errorLine > 0) {
        err << " (" << result.errorFile << ":" << result.errorLine << ")";
    }
    err << "\n";
}

bool LoadConfig(int argc, const char* const argv[], CLIConfig& config, std::ostream& err) {
    util::ConfigManager manager;

    auto result = manager.ParseCommandLine(argc, argv);
    if (!result.success) {
        PrintParseError(err, result);
        return false;
    }

    config.configFile = manager.GetPath(util::ConfigKeys::CONF);
    if (!config.configFile.empty()) {
        result = manager.ParseFile(config.configFile);
        if (!result.success) {
            PrintParseError(err, result);
            return false;
        }
        // Command-line options take precedence over the file
        result = manager.ParseCommandLine(argc, argv);
        if (!result.success) {
            PrintParseError(err, result);
            return false;
        }
    }

    manager.SetDefault(util::ConfigKeys::LOGLEVEL, "warn");

    config.logLevel = util::LogLevelFromString(
        manager.GetString(util::ConfigKeys::LOGLEVEL, "warn"));
    config.logFile = manager.GetPath(util::ConfigKeys::LOGFILE);
    config.printToConsole = manager.GetBool(util::ConfigKeys::PRINTTOCONSOLE, true);
    config.color = manager.GetBool(util::ConfigKeys::COLOR, true);
    config.showHelp = manager.GetBool(util::ConfigKeys::HELP, false);
    config.showVersion = manager.GetBool(util::ConfigKeys::VERSION, false);

    const auto& positional = manager.GetPositionalArgs();
    if (!positional.empty()) {
        config.command = positional.front();
        config.params.assign(positional.begin() + 1, positional.end());
    }

    return true;
}

bool SetupLogging(const CLIConfig& config, std::ostream& err) {
    auto& logger = util::Logger::Instance();
    logger.ClearSinks();
    logger.SetLevel(config.logLevel);

    if (config.printToConsole) {
        util::ConsoleSink::Config sinkConfig;
        sinkConfig.useColors = config.color;
        sinkConfig.level = config.logLevel;
        logger.AddSink(std::make_shared<util::ConsoleSink>(sinkConfig));
    }

    if (!config.logFile.empty()) {
        util::FileSink::Config sinkConfig;
        sinkConfig.path = config.logFile;
        sinkConfig.level = config.logLevel;
        auto sink = std::make_shared<util::FileSink>(sinkConfig);
        if (!sink->IsOpen()) {
            err << "Error: Cannot open log file: " << config.logFile << "\n";
            return false;
        }
        logger.AddSink(sink);
    }

    return true;
}

// ============================================================================
// Commands
// ============================================================================

bool ArgCountOk(const Context& ctx, size_t min, size_t max) {
    size_t count = ctx.config.params.size();
    if (count < min || count > max) {
        ctx.err << "Error: Wrong number of arguments for '" << ctx.config.command << "'.\n";
        ctx.err << "Use 'secpcore-cli --help' for usage information.\n";
        return false;
    }
    return true;
}

int CmdSample(const Context& ctx) {
    if (!ArgCountOk(ctx, 0, 0)) return EXIT_USAGE;

    ctx.out << FieldElement::FromUInt(255) << "\n";
    ctx.out << Point::Infinity() << "\n";
    ctx.out << secp256k1::Generator() << "\n";
    return EXIT_OK;
}

int CmdField(const Context& ctx) {
    if (!ArgCountOk(ctx, 1, 1)) return EXIT_USAGE;
    ctx.out << FieldElement::FromHex(ctx.config.params[0]) << "\n";
    return EXIT_OK;
}

int CmdPoint(const Context& ctx) {
    if (!ArgCountOk(ctx, 2, 2)) return EXIT_USAGE;
    ctx.out << Point::FromHex(ctx.config.params[0], ctx.config.params[1]) << "\n";
    return EXIT_OK;
}

int CmdLift(const Context& ctx) {
    if (!ArgCountOk(ctx, 1, 2)) return EXIT_USAGE;

    const auto& params = ctx.config.params;
    bool odd = false;
    if (params.size() == 2) {
        if (params[1] == "odd") {
            odd = true;
        } else if (params[1] != "even") {
            ctx.err << "Error: Parity must be 'even' or 'odd', got '" << params[1] << "'\n";
            return EXIT_USAGE;
        }
    }

    ctx.out << Point::LiftX(FieldElement::FromHex(params[0]), odd) << "\n";
    return EXIT_OK;
}

int CmdMul(const Context& ctx) {
    if (!ArgCountOk(ctx, 1, 1)) return EXIT_USAGE;

    BigInt k = BigInt::FromString(ctx.config.params[0]);
    LOG_DEBUG(util::LogCategory::CLI) << "Multiplying G by " << k;

    Point result;
    {
        SECPCORE_LOG_TIMER(util::LogCategory::BENCH, "scalar multiplication");
        result = secp256k1::Generator() * k;
    }
    ctx.out << result << "\n";
    return EXIT_OK;
}

int CmdAdd(const Context& ctx) {
    if (!ArgCountOk(ctx, 4, 4)) return EXIT_USAGE;

    const auto& params = ctx.config.params;
    Point p = Point::FromHex(params[0], params[1]);
    Point q = Point::FromHex(params[2], params[3]);
    ctx.out << (p + q) << "\n";
    return EXIT_OK;
}

int RunCommand(const Context& ctx) {
    const std::string& cmd = ctx.config.command;

    if (cmd == "sample") return CmdSample(ctx);
    if (cmd == "field") return CmdField(ctx);
    if (cmd == "point") return CmdPoint(ctx);
    if (cmd == "lift") return CmdLift(ctx);
    if (cmd == "mul") return CmdMul(ctx);
    if (cmd == "add") return CmdAdd(ctx);

    ctx.err << "Error: Unknown command '" << cmd << "'.\n";
    ctx.err << "Use 'secpcore-cli --help' for usage information.\n";
    return EXIT_USAGE;
}

} // anonymous namespace

// ============================================================================
// Entry Point
// ============================================================================

int Run(int argc, const char* const argv[], std::ostream& out, std::ostream& err) {
    Context ctx{CLIConfig{}, out, err};

    if (!LoadConfig(argc, argv, ctx.config, err)) {
        err << "Error parsing command line. Use --help for usage.\n";
        return EXIT_USAGE;
    }

    if (ctx.config.showHelp) {
        PrintHelp(out);
        return EXIT_OK;
    }

    if (ctx.config.showVersion) {
        PrintVersion(out);
        return EXIT_OK;
    }

    if (ctx.config.command.empty()) {
        err << "Error: No command specified.\n";
        err << "Use 'secpcore-cli --help' for usage information.\n";
        return EXIT_USAGE;
    }

    if (!SetupLogging(ctx.config, err)) {
        return EXIT_USAGE;
    }

    LOG_DEBUG(util::LogCategory::CLI) << "Running command '" << ctx.config.command << "'";

    int rc = EXIT_USAGE;
    try {
        rc = RunCommand(ctx);
    } catch (const EcException& e) {
        LOG_DEBUG(util::LogCategory::CLI) << "Command failed: " << EcErrorString(e.Code());
        err << "Error: " << e.what() << "\n";
        rc = EXIT_EC_ERROR;
    } catch (const std::invalid_argument& e) {
        err << "Error: Invalid number: " << e.what() << "\n";
        rc = EXIT_USAGE;
    }

    out.flush();
    util::Logger::Instance().Shutdown();
    return rc;
}

} // namespace cli
} // namespace secpcore
