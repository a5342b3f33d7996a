#include "tally/configuration.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

namespace tally {

log_level log_level_from_string(const std::string& name) {
    if (name == "off") return log_level::off;
    if (name == "error") return log_level::error;
    if (name == "warn") return log_level::warn;
    if (name == "info") return log_level::info;
    if (name == "debug") return log_level::debug;
    throw configuration_error("Unknown log level: " + name);
}

configuration configuration::from_json(const std::string& text) {
    configuration config;

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        LOG_ERROR("config", "Invalid configuration JSON: %s", e.what());
        throw configuration_error(std::string("Invalid configuration JSON: ") + e.what());
    }

    if (!doc.is_object()) {
        throw configuration_error("Configuration must be a JSON object");
    }

    try {
        if (doc.contains("path")) {
            config.path = doc.at("path").get<std::string>();
        }
        if (doc.contains("report_cleared_ids")) {
            config.report_cleared_ids = doc.at("report_cleared_ids").get<bool>();
        }
        if (doc.contains("log_level")) {
            config.log = log_level_from_string(doc.at("log_level").get<std::string>());
        }
    } catch (const nlohmann::json::type_error& e) {
        LOG_ERROR("config", "Invalid configuration value: %s", e.what());
        throw configuration_error(std::string("Invalid configuration value: ") + e.what());
    }

    return config;
}

configuration configuration::from_file(const std::string& file_path) {
    std::ifstream in(file_path);
    if (!in) {
        throw configuration_error("Cannot read configuration file: " + file_path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return from_json(buffer.str());
}

} // namespace tally
