/**
 * @file TomlConfig.hpp
 * @brief TOML configuration file parser for the desktop device simulator
 *
 * Supported Sections:
 * - [dps]: id_scope, global_endpoint, port, timeout_seconds
 * - [identity]: bundle_path, bundle_password, root_ca_path, verify_server_cert
 * - [hub]: port
 * - [telemetry]: interval_ms
 *
 * Only the subset of TOML the sample configuration uses is understood:
 * sections, `key = value` pairs, quoted strings, numbers, booleans and
 * `#` comments. Unknown sections and keys are ignored.
 *
 * @note Environment overrides are applied separately by applyEnvironment()
 */

#pragma once

#include "DeviceRunner.hpp"
#include "Console.hpp"
#include <filesystem>
#include <fstream>
#include <functional>
#include <istream>
#include <stdexcept>
#include <string>

namespace devsim {

class TomlConfig {
public:
    /// Returns the value of an environment variable, or an empty string
    using EnvLookup = std::function<std::string(const char* name)>;

    /**
     * @brief Load configuration from a TOML file
     * @param filename Path to the configuration file
     * @return Defaults overlaid with the file's values; defaults only if the
     *         file does not exist
     * @throws std::runtime_error on an invalid value
     */
    static DeviceConfig loadFromFile(const std::string& filename) {
        std::ifstream file(filename);

        if (!file.is_open()) {
            console::info("[Config] Could not open config file: " + filename + ", using defaults");
            return DeviceConfig{};
        }

        DeviceConfig config = loadFromStream(file);
        validatePaths(config);
        return config;
    }

    /**
     * @brief Parse TOML text onto @p config
     * @throws std::runtime_error on an invalid value
     */
    static DeviceConfig loadFromStream(std::istream& in, DeviceConfig config = {}) {
        std::string currentSection;
        std::string line;
        while (std::getline(in, line)) {
            stripComment(line);
            trim(line);

            if (line.empty()) {
                continue;
            }

            if (line[0] == '[') {
                if (line.back() == ']') {
                    currentSection = line.substr(1, line.length() - 2);
                    trim(currentSection);
                }
                continue;
            }

            size_t equalPos = line.find('=');
            if (equalPos == std::string::npos) {
                continue;
            }

            std::string key = line.substr(0, equalPos);
            std::string value = line.substr(equalPos + 1);
            trim(key);
            trim(value);
            unquote(value);

            if (currentSection == "dps") {
                if (key == "id_scope") {
                    config.idScope = value;
                } else if (key == "global_endpoint") {
                    config.globalEndpoint = value;
                } else if (key == "port") {
                    config.dpsPort = parsePort("dps.port", value);
                } else if (key == "timeout_seconds") {
                    config.provisioningTimeout = std::chrono::seconds(parsePositive("dps.timeout_seconds", value));
                }
            } else if (currentSection == "identity") {
                if (key == "bundle_path") {
                    config.bundlePath = value;
                } else if (key == "bundle_password") {
                    config.bundlePassword = value;
                } else if (key == "root_ca_path") {
                    config.rootCaPath = value;
                } else if (key == "verify_server_cert") {
                    config.verifyServerCert = parseBool("identity.verify_server_cert", value);
                }
            } else if (currentSection == "hub") {
                if (key == "port") {
                    config.hubPort = parsePort("hub.port", value);
                }
            } else if (currentSection == "telemetry") {
                if (key == "interval_ms") {
                    config.telemetryInterval = std::chrono::milliseconds(parsePositive("telemetry.interval_ms", value));
                }
            }
        }

        return config;
    }

    /**
     * @brief Overlay DPS_ID_SCOPE, DPS_GLOBAL_ENDPOINT, CERT_BUNDLE_PATH and
     *        CERT_BUNDLE_PASSWORD when set
     */
    static void applyEnvironment(DeviceConfig& config, const EnvLookup& lookup) {
        std::string idScope = lookup("DPS_ID_SCOPE");
        std::string endpoint = lookup("DPS_GLOBAL_ENDPOINT");
        std::string bundlePath = lookup("CERT_BUNDLE_PATH");
        std::string bundlePassword = lookup("CERT_BUNDLE_PASSWORD");

        if (!idScope.empty()) config.idScope = idScope;
        if (!endpoint.empty()) config.globalEndpoint = endpoint;
        if (!bundlePath.empty()) config.bundlePath = bundlePath;
        if (!bundlePassword.empty()) config.bundlePassword = bundlePassword;
    }

    static long parsePositive(const std::string& key, const std::string& value) {
        long parsed = 0;
        try {
            size_t consumed = 0;
            parsed = std::stol(value, &consumed);
            if (consumed != value.size()) {
                throw std::invalid_argument(value);
            }
        } catch (const std::exception&) {
            throw std::runtime_error("Invalid number for " + key + ": '" + value + "'");
        }
        if (parsed <= 0) {
            throw std::runtime_error(key + " must be positive, got " + value);
        }
        return parsed;
    }

    static std::uint16_t parsePort(const std::string& key, const std::string& value) {
        long port = parsePositive(key, value);
        if (port > 65535) {
            throw std::runtime_error(key + " is not a valid port: " + value);
        }
        return static_cast<std::uint16_t>(port);
    }

private:
    /**
     * @brief Warn about configured files that do not exist
     * @param config Device configuration to check
     */
    static void validatePaths(const DeviceConfig& config) {
        namespace fs = std::filesystem;

        if (!config.bundlePath.empty() && !fs::exists(config.bundlePath)) {
            console::error("[Config] Warning: Certificate bundle not found: " + config.bundlePath);
        }

        if (!config.rootCaPath.empty() && !fs::exists(config.rootCaPath)) {
            console::error("[Config] Warning: Root CA certificate not found: " + config.rootCaPath);
        }
    }

    static bool parseBool(const std::string& key, const std::string& value) {
        if (value == "true" || value == "1") return true;
        if (value == "false" || value == "0") return false;
        throw std::runtime_error("Invalid boolean for " + key + ": '" + value + "'");
    }

    /// Drop a trailing # comment that is not inside a quoted string
    static void stripComment(std::string& line) {
        bool quoted = false;
        for (size_t i = 0; i < line.size(); ++i) {
            if (line[i] == '"') {
                quoted = !quoted;
            } else if (line[i] == '#' && !quoted) {
                line.erase(i);
                return;
            }
        }
    }

    static void trim(std::string& str) {
        str.erase(0, str.find_first_not_of(" \t\r"));
        str.erase(str.find_last_not_of(" \t\r") + 1);
    }

    static void unquote(std::string& value) {
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }
    }
};

} // namespace devsim
