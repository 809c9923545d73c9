#include <fstream>
#include <iostream>
#include <string>
#include "core/telemetry_engine.hpp"
#include "telemetry/capture_reader.hpp"
#include "utils/config.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

using namespace voicegate;

namespace {

const int EXIT_PASS = 0;
const int EXIT_GATE_FAILED = 1;
const int EXIT_USAGE = 2;

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options] <capture-file>\n"
              << "Options:\n"
              << "  --config <file>      Load latency targets and quality thresholds\n"
              << "  --log-level <level>  DEBUG, INFO, WARN, ERROR or OFF\n"
              << "  --expect-turns <n>   Fail unless n turns complete\n"
              << "  --timeout-ms <ms>    Time allowed for the expected turns (default: 5000)\n"
              << "  --help, -h           Show this help message\n";
}

bool parseCount(const std::string& text, long long& value) {
    try {
        size_t consumed = 0;
        value = std::stoll(text, &consumed);
        return consumed == text.size() && value >= 0;
    } catch (const std::exception&) {
        return false;
    }
}

void printFailures(const std::string& label, const std::vector<std::string>& failures) {
    for (const auto& failure : failures) {
        std::cout << "  FAIL " << label << ": " << failure << "\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    utils::Logger::initialize();

    std::string configPath;
    std::string logLevel;
    std::string capturePath;
    long long expectTurns = -1;
    long long timeoutMs = 5000;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return EXIT_PASS;
        } else if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            logLevel = argv[++i];
        } else if (arg == "--expect-turns" && i + 1 < argc) {
            if (!parseCount(argv[++i], expectTurns)) {
                std::cerr << "Error: --expect-turns needs a non-negative integer" << std::endl;
                return EXIT_USAGE;
            }
        } else if (arg == "--timeout-ms" && i + 1 < argc) {
            if (!parseCount(argv[++i], timeoutMs)) {
                std::cerr << "Error: --timeout-ms needs a non-negative integer" << std::endl;
                return EXIT_USAGE;
            }
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: unknown option " << arg << std::endl;
            printUsage(argv[0]);
            return EXIT_USAGE;
        } else if (capturePath.empty()) {
            capturePath = arg;
        } else {
            std::cerr << "Error: more than one capture file given" << std::endl;
            return EXIT_USAGE;
        }
    }

    if (capturePath.empty()) {
        printUsage(argv[0]);
        return EXIT_USAGE;
    }

    utils::EngineConfig config;
    if (!configPath.empty()) {
        try {
            config = utils::EngineConfig::loadFromFile(configPath);
        } catch (const utils::ConfigurationException& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            return EXIT_USAGE;
        }
    }
    if (!logLevel.empty()) {
        utils::LogLevel level = utils::Logger::parseLevel(logLevel, utils::LogLevel::OFF);
        if (level != utils::Logger::parseLevel(logLevel, utils::LogLevel::DEBUG)) {
            std::cerr << "Error: unknown log level " << logLevel << std::endl;
            return EXIT_USAGE;
        }
        config.setLogLevel(level);
    }
    utils::Logger::setLevel(config.getLogLevel());

    std::ifstream capture(capturePath);
    if (!capture.is_open()) {
        std::cerr << "Error: cannot open capture file " << capturePath << std::endl;
        return EXIT_USAGE;
    }

    core::TelemetryEngine engine(config);
    telemetry::CaptureReader reader(capture);

    auto pump = [&engine, &reader]() {
        telemetry::RawRecord record;
        if (!reader.next(record)) {
            return false;
        }
        engine.recordEvent(record);
        return true;
    };

    bool pass = true;

    if (expectTurns >= 0) {
        core::TurnWaitResult wait = engine.waitForTurns(static_cast<size_t>(expectTurns), pump, timeoutMs);
        if (!wait.satisfied()) {
            pass = false;
        }
        // Remaining records still count toward metrics
        while (pump()) {
        }
        if (!wait.satisfied() && engine.getTurns().size() >= static_cast<size_t>(expectTurns)) {
            utils::Logger::warn("Expected turns completed only after the timeout");
        }
        std::cout << (wait.satisfied() ? "PASS" : "FAIL") << " turns: " << wait.wait.description << "\n";
    } else {
        while (pump()) {
        }
    }

    std::cout << engine.getSummary();

    std::cout << "Verdicts:\n";
    for (const auto& target : engine.assertConfiguredTargets()) {
        if (target.noData) {
            std::cout << "  NO DATA " << target.note << "\n";
        } else if (target.pass) {
            std::cout << "  PASS " << target.note << "\n";
        } else {
            pass = false;
            printFailures(target.metric, target.failures);
        }
    }

    metrics::GateResult gate = engine.assertConfiguredThresholds();
    if (!gate.pass) {
        pass = false;
        printFailures("quality", gate.failures);
    }
    for (const auto& note : gate.notes) {
        std::cout << "  NO DATA " << note << "\n";
    }

    if (!reader.getProblems().empty()) {
        std::cout << "Skipped " << reader.getProblems().size() << " unreadable capture line(s)\n";
    }

    std::cout << (pass ? "RESULT: PASS" : "RESULT: FAIL") << std::endl;
    return pass ? EXIT_PASS : EXIT_GATE_FAILED;
}
