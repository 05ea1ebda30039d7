#include "sandbox/sandbox_factory.h"
#include "sandbox/sandbox_manager.h"
#include "infrastructure/error_handling.h"
#include "utils/config.h"
#include "utils/logger.h"
#include <nlohmann/json.hpp>
#include <iostream>
#include <fstream>
#include <sstream>
#include <iterator>
#include <optional>
#include <csignal>
#include <getopt.h>

namespace quantbox {

using json = nlohmann::ordered_json;

struct RunConfig {
    std::string preset = "default";
    std::string level;
    std::string contextPath;
    std::string configPath;
    std::string scriptPath;
    uint32_t timeoutSec = 0;
    bool captureScript = false;
    bool validateOnly = false;
    bool verbose = false;
    bool showHelp = false;
};

static constexpr int EXIT_OK = 0;
static constexpr int EXIT_FAILED = 1;
static constexpr int EXIT_USAGE = 2;

void printHelp(const char* progName) {
    std::cout << "Usage: " << progName << " [options] [script-file]\n\n";
    std::cout << "Runs a Python analysis script in an isolated child process and prints\n";
    std::cout << "the execution result as JSON. The script is read from stdin when no\n";
    std::cout << "file is given; it returns data by binding a global named 'result'.\n";
    std::cout << "\nOptions:\n";
    std::cout << "  -p, --preset NAME       Sandbox preset: analysis, filtering, default\n";
    std::cout << "  -l, --level LEVEL       Custom sandbox tier: development, production, hardened\n";
    std::cout << "  -t, --timeout SEC       Override the policy timeout\n";
    std::cout << "  -c, --context FILE      JSON object whose keys become script globals\n";
    std::cout << "  -C, --config FILE       Configuration file (key = value)\n";
    std::cout << "  -s, --capture-script    Include the generated program in the result\n";
    std::cout << "  -V, --validate-only     Only run the dangerous-pattern scan\n";
    std::cout << "  -v, --verbose           Debug logging on stderr\n";
    std::cout << "  -h, --help              Show this help\n";
}

bool parseArgs(int argc, char* argv[], RunConfig& config) {
    static struct option longOptions[] = {
        {"preset", required_argument, nullptr, 'p'},
        {"level", required_argument, nullptr, 'l'},
        {"timeout", required_argument, nullptr, 't'},
        {"context", required_argument, nullptr, 'c'},
        {"config", required_argument, nullptr, 'C'},
        {"capture-script", no_argument, nullptr, 's'},
        {"validate-only", no_argument, nullptr, 'V'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    int optionIndex = 0;

    while ((opt = getopt_long(argc, argv, "p:l:t:c:C:sVvh", longOptions, &optionIndex)) != -1) {
        switch (opt) {
            case 'p':
                config.preset = optarg;
                break;
            case 'l':
                config.level = optarg;
                break;
            case 't':
                try {
                    long value = std::stol(optarg);
                    if (value <= 0) {
                        std::cerr << "Timeout must be positive\n";
                        return false;
                    }
                    config.timeoutSec = static_cast<uint32_t>(value);
                } catch (const std::exception&) {
                    std::cerr << "Invalid timeout: " << optarg << "\n";
                    return false;
                }
                break;
            case 'c':
                config.contextPath = optarg;
                break;
            case 'C':
                config.configPath = optarg;
                break;
            case 's':
                config.captureScript = true;
                break;
            case 'V':
                config.validateOnly = true;
                break;
            case 'v':
                config.verbose = true;
                break;
            case 'h':
                config.showHelp = true;
                return true;
            default:
                return false;
        }
    }

    if (optind < argc) {
        config.scriptPath = argv[optind++];
    }
    if (optind < argc) {
        std::cerr << "Unexpected argument: " << argv[optind] << "\n";
        return false;
    }
    return true;
}

static std::optional<std::string> readAll(const std::string& path) {
    if (path.empty() || path == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return std::nullopt;
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

void setupLogging(const RunConfig& config) {
    auto settings = utils::Config::instance().getLogSettings();
    utils::LogLevel level = utils::Logger::levelFromString(settings.level, utils::LogLevel::INFO);
    if (config.verbose) level = utils::LogLevel::DEBUG;
    utils::Logger::setLevel(level);
    if (!settings.file.empty()) {
        utils::Logger::init(settings.file, settings.maxFileBytes, settings.maxFiles);
    } else {
        utils::Logger::enableFile(false);
    }
}

Result<sandbox::SandboxManager> buildManager(const RunConfig& config) {
    try {
        if (!config.level.empty()) {
            auto level = sandbox::levelFromString(config.level);
            return sandbox::SandboxFactory::createCustomSandbox(level);
        }
        return sandbox::SandboxFactory::createPreset(config.preset);
    } catch (const PolicyError& e) {
        return Error(ErrorCode::POLICY_INVALID, e.what());
    }
}

int run(const RunConfig& config) {
    if (!config.configPath.empty() && !utils::Config::instance().load(config.configPath)) {
        std::cerr << "Cannot read config file: " << config.configPath << "\n";
        return EXIT_USAGE;
    }
    setupLogging(config);

    auto script = readAll(config.scriptPath);
    if (!script) {
        std::cerr << "Cannot read script: " << config.scriptPath << "\n";
        return EXIT_USAGE;
    }

    if (config.validateOnly) {
        auto check = sandbox::SandboxManager::validateCode(*script);
        json out;
        out["valid"] = check.valid;
        out["pattern"] = check.valid ? json(nullptr) : json(check.pattern);
        out["message"] = check.valid ? json(nullptr) : json(check.message);
        std::cout << out.dump(2) << "\n";
        return check.valid ? EXIT_OK : EXIT_FAILED;
    }

    json context = json::object();
    if (!config.contextPath.empty()) {
        auto text = readAll(config.contextPath);
        if (!text) {
            std::cerr << "Cannot read context file: " << config.contextPath << "\n";
            return EXIT_USAGE;
        }
        context = json::parse(*text, nullptr, false);
        if (context.is_discarded() || !context.is_object()) {
            std::cerr << "Context file must contain a JSON object: " << config.contextPath << "\n";
            return EXIT_USAGE;
        }
    }

    auto manager = buildManager(config);
    if (!manager.ok()) {
        std::cerr << errorCodeName(manager.error().code) << ": " << manager.error().message << "\n";
        return EXIT_USAGE;
    }

    LOG_INFO("Running " + (config.scriptPath.empty() ? std::string("<stdin>") : config.scriptPath) +
             " under " + manager.value().policy().describe());
    auto result = manager.value().execute(*script, context, config.timeoutSec, config.captureScript);
    std::cout << result.toJson().dump(2) << "\n";
    return result.success ? EXIT_OK : EXIT_FAILED;
}

}

int main(int argc, char* argv[]) {
    std::signal(SIGPIPE, SIG_IGN);

    quantbox::RunConfig config;
    if (!quantbox::parseArgs(argc, argv, config)) {
        quantbox::printHelp(argv[0]);
        return 2;
    }

    if (config.showHelp) {
        quantbox::printHelp(argv[0]);
        return 0;
    }

    return quantbox::run(config);
}
