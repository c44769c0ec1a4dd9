#include "photon/config/ConfigLoader.hpp"
#include "photon/devices/InterlockDropTimer.hpp"
#include "photon/devices/SimulatedDevices.hpp"
#include "photon/engine/ExecutionEngine.hpp"
#include "photon/engine/ExecutionRecord.hpp"
#include "photon/exec/ExecService.hpp"
#include "photon/log/Log.hpp"
#include "photon/protocol/ProtocolWire.hpp"
#include "photon/safety/InterlockSignal.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

using namespace photon;

namespace {

struct Options {
    std::string protocolPath;
    std::optional<std::string> configPath;
    std::optional<std::string> recordPath;
    std::optional<double> interlockDropAfterS;
    bool stopOnError = true;
};

void printUsage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " <protocol.json> [options]\n"
              << "  --config <file>              engine and safety settings\n"
              << "  --continue-on-error          skip failed lines instead of aborting\n"
              << "  --record <file>              write the execution record as JSON\n"
              << "  --interlock-drop-after <s>   revoke laser enable after s seconds\n";
}

std::optional<Options> parseArgs(int argc, char** argv) {
    Options options;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << arg << " needs a value\n";
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "--config") {
            if (!(options.configPath = next())) return std::nullopt;
        } else if (arg == "--record") {
            if (!(options.recordPath = next())) return std::nullopt;
        } else if (arg == "--continue-on-error") {
            options.stopOnError = false;
        } else if (arg == "--interlock-drop-after") {
            auto value = next();
            if (!value) return std::nullopt;
            char* end = nullptr;
            const double seconds = std::strtod(value->c_str(), &end);
            if (end == value->c_str() || seconds < 0.0) {
                std::cerr << "invalid duration '" << *value << "'\n";
                return std::nullopt;
            }
            options.interlockDropAfterS = seconds;
        } else if (arg == "-h" || arg == "--help") {
            return std::nullopt;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "unknown option " << arg << "\n";
            return std::nullopt;
        } else if (options.protocolPath.empty()) {
            options.protocolPath = arg;
        } else {
            std::cerr << "unexpected argument " << arg << "\n";
            return std::nullopt;
        }
    }
    if (options.protocolPath.empty()) {
        return std::nullopt;
    }
    return options;
}

std::optional<std::string> readFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

} // namespace

int main(int argc, char** argv) {
    auto options = parseArgs(argc, argv);
    if (!options) {
        printUsage(argv[0]);
        return 2;
    }

    config::RuntimeConfig runtime;
    if (options->configPath) {
        auto loaded = config::ConfigLoader(*options->configPath).load();
        if (!loaded) {
            std::cerr << "Config error: " << loaded.error().message << "\n";
            return 2;
        }
        runtime = *loaded;
    }

    auto text = readFile(options->protocolPath);
    if (!text) {
        std::cerr << "Cannot read " << options->protocolPath << "\n";
        return 2;
    }
    auto protocol = protocol::fromWire(*text);
    if (!protocol) {
        std::cerr << "Protocol error: " << protocol.error().message << "\n";
        return 2;
    }

    // The protocol's own limits must also fit inside the site envelope.
    if (auto site = protocol->validate(runtime.safetyLimits); !site) {
        for (const auto& error : site.error()) {
            std::cerr << "Outside site safety limits: " << error.describe() << "\n";
        }
        return 2;
    }

    logInfo("[photon_run] '", protocol->name, "' v", protocol->version, ": ",
            protocol->lines.size(), " line(s), estimated ", protocol->totalDurationSeconds(),
            "s / ", protocol->totalEnergyJoules(), "J\n");

    exec::ExecService service;
    auto actuator = std::make_shared<devices::SimulatedActuator>();
    auto laser = std::make_shared<devices::SimulatedLaser>();
    auto interlock = std::make_shared<safety::InterlockSignal>(true, "simulated interlock closed");

    engine::EngineCallbacks callbacks;
    callbacks.onStateChanged = [](engine::ExecutionState state) {
        std::cout << "state: " << engine::toString(state) << std::endl;
    };
    callbacks.onProgress = [](double fraction) {
        std::cout << "progress: " << static_cast<int>(fraction * 100.0 + 0.5) << "%" << std::endl;
    };

    engine::ExecutionEngine engine(actuator, laser, interlock, runtime.engine,
                                   std::move(callbacks), service.io());

    exec::asio::signal_set signals(*service.io(), SIGINT, SIGTERM);
    signals.async_wait([&engine](const std::error_code& ec, int signal) {
        if (ec) return;
        logWarning("[photon_run] signal ", signal, " received, stopping\n");
        engine.stop();
    });

    devices::InterlockDropTimer interlockDrop(*service.io(), interlock);
    if (options->interlockDropAfterS) {
        const auto delay = std::chrono::duration<double>(*options->interlockDropAfterS);
        interlockDrop.schedule(std::chrono::duration_cast<exec::Clock::duration>(delay),
                               "simulated interlock opened");
    }

    const auto result = engine.execute(*protocol, options->stopOnError);
    std::cout << (result.success ? "OK: " : "FAILED: ") << result.message << std::endl;

    interlockDrop.cancel();
    exec::asio::post(*service.io(), [&signals] { signals.cancel(); });
    exec::drain(*service.io());

    const auto record = engine::toJson(engine.lastSummary());
    if (options->recordPath) {
        std::ofstream out(*options->recordPath);
        if (!out) {
            std::cerr << "Cannot write " << *options->recordPath << "\n";
            return 1;
        }
        out << record.dump(2) << "\n";
    } else {
        std::cout << record.dump(2) << std::endl;
    }

    return result.success ? 0 : 1;
}
