/**
 * @file main_cli.cpp
 * @brief Command-line entry point for the X.509 device simulator
 *
 * Configuration is layered: TOML file, then environment variables, then
 * command-line flags. SIGINT/SIGTERM request an orderly shutdown.
 */

#include "DeviceRunner.hpp"
#include "PahoMqttClient.hpp"
#include "TomlConfig.hpp"
#include "Console.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>

using namespace devsim;

/// Global flag for graceful shutdown coordination
static volatile std::sig_atomic_t g_running = 1;

void signalHandler(int signal) {
    (void)signal;
    g_running = 0;
}

void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " [options]\n"
              << "Options:\n"
              << "  --config <file>      Configuration file (default: simulator.toml)\n"
              << "  --bundle <file>      PKCS#12 certificate bundle (.pfx/.p12)\n"
              << "  --password <value>   Bundle password (default: 1234)\n"
              << "  --scope <id>         DPS ID scope\n"
              << "  --endpoint <host>    DPS global endpoint\n"
              << "  --interval-ms <n>    Delay between messages of each loop (default: 1000)\n"
              << "  --no-color           Disable colored output\n"
              << "  --help               Show this help message\n"
              << "\nEnvironment: DPS_ID_SCOPE, DPS_GLOBAL_ENDPOINT, CERT_BUNDLE_PATH, CERT_BUNDLE_PASSWORD\n"
              << "\nConfiguration file format (TOML):\n"
              << "  [dps]\n"
              << "  id_scope = \"0ne00000000\"\n"
              << "  [identity]\n"
              << "  bundle_path = \"device.pfx\"\n"
              << std::endl;
}

/**
 * @brief Safe environment variable getter
 * @return Environment variable value or empty string if not found
 */
std::string safeGetEnv(const char* name) {
#ifdef _WIN32
    char* buffer = nullptr;
    size_t size = 0;
    if (_dupenv_s(&buffer, &size, name) == 0 && buffer != nullptr) {
        std::string result(buffer);
        free(buffer);
        return result;
    }
    return "";
#else
    const char* value = std::getenv(name);
    return value ? std::string(value) : "";
#endif
}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    DeviceConfig config;
    try {
        // The config file is located first so flags can override its values
        std::string configFile = "simulator.toml";
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--help") {
                printUsage(argv[0]);
                return 0;
            }
            if (arg == "--config" && i + 1 < argc) {
                configFile = argv[i + 1];
            }
        }

        config = TomlConfig::loadFromFile(configFile);
        TomlConfig::applyEnvironment(config, safeGetEnv);

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            auto requireValue = [&]() -> std::string {
                if (i + 1 >= argc) {
                    throw std::runtime_error("Missing value for " + arg);
                }
                return argv[++i];
            };

            if (arg == "--config") {
                requireValue();
            } else if (arg == "--bundle") {
                config.bundlePath = requireValue();
            } else if (arg == "--password") {
                config.bundlePassword = requireValue();
            } else if (arg == "--scope") {
                config.idScope = requireValue();
            } else if (arg == "--endpoint") {
                config.globalEndpoint = requireValue();
            } else if (arg == "--interval-ms") {
                config.telemetryInterval = std::chrono::milliseconds(
                    TomlConfig::parsePositive("--interval-ms", requireValue()));
            } else if (arg == "--no-color") {
                console::setColorEnabled(false);
            } else {
                std::cerr << "Unknown option: " << arg << std::endl;
                printUsage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        console::error(std::string("Error: ") + e.what());
        return 1;
    }

    if (!config.hasRequiredSettings()) {
        console::error("Error: Missing required configuration");
        console::error("Required: id_scope (or --scope / DPS_ID_SCOPE) and bundle_path (or --bundle / CERT_BUNDLE_PATH)");
        console::error("telemetry.interval_ms (or --interval-ms) must be positive");
        return 1;
    }

    console::highlight("Starting X.509 Device Simulator");
    console::info("ID Scope: " + config.idScope);
    console::info("Certificate bundle: " + config.bundlePath);
    console::info("DPS endpoint: " + config.globalEndpoint);

    CancellationToken cancel;

    // Signal handlers may only touch g_running; this thread forwards it
    std::atomic<bool> finished{false};
    std::thread signalWatcher([&]() {
        while (!finished.load()) {
            if (!g_running) {
                console::highlight("\nShutdown requested, stopping...");
                cancel.cancel();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    auto clientFactory = [] { return std::make_shared<PahoMqttClient>(); };
    DeviceRunner runner(clientFactory, clientFactory);
    int exitCode = runner.run(config, cancel);

    finished = true;
    signalWatcher.join();

    console::info(exitCode == 0 ? "Simulator stopped." : "Simulator stopped with errors.");
    return exitCode;
}
