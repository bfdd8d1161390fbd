// =============================================================================
// config.cpp - ManagerConfig loading
// =============================================================================

#include "hookgate/config.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace hookgate {

ManagerConfig ManagerConfig::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

ManagerConfig ManagerConfig::from_json(std::string_view content) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(std::string("Invalid config JSON: ") + e.what());
    }
    if (!doc.is_object()) {
        throw std::runtime_error("Config root must be a JSON object");
    }

    ManagerConfig config;
    try {
        if (doc.contains("max_fee_pips")) {
            config.max_fee_pips = doc.at("max_fee_pips").get<uint32_t>();
        }
        if (doc.contains("max_swap_steps")) {
            config.max_swap_steps = doc.at("max_swap_steps").get<uint32_t>();
        }
        if (doc.contains("log_level")) {
            config.log_level = doc.at("log_level").get<std::string>();
        }
        if (doc.contains("manager_address")) {
            config.manager_address = addresses::from_hex(doc.at("manager_address").get<std::string>());
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Invalid config value: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("Invalid config value: ") + e.what());
    }

    config.validate();
    return config;
}

void ManagerConfig::validate() const {
    if (max_fee_pips >= fees::FEE_DENOMINATOR) {
        throw std::runtime_error("max_fee_pips must be below 100%");
    }
    if (max_swap_steps == 0) {
        throw std::runtime_error("max_swap_steps must be positive");
    }
}

std::string ManagerConfig::to_json() const {
    nlohmann::json doc = {
        {"max_fee_pips", max_fee_pips},
        {"max_swap_steps", max_swap_steps},
        {"log_level", log_level},
        {"manager_address", addresses::to_hex(manager_address)},
    };
    return doc.dump();
}

} // namespace hookgate
