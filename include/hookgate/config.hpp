#ifndef HOOKGATE_CONFIG_HPP
#define HOOKGATE_CONFIG_HPP

#include <cstdint>
#include <string>
#include <string_view>

#include "types.hpp"

namespace hookgate {

// =============================================================================
// Manager Configuration
// =============================================================================

struct ManagerConfig {
    // Upper bound for pool fees and for fee overrides returned by extensions
    uint32_t max_fee_pips = fees::FEE_MAX;

    // Tick-crossing steps a single swap may take before giving up
    uint32_t max_swap_steps = 1000;

    std::string log_level = "info";

    // Vault account that holds the manager's reserves
    Address manager_address = addresses::POOL_MANAGER;

    // Load from a JSON document, e.g.
    // {"max_fee_pips": 50000, "log_level": "debug", "manager_address": "0x..."}
    // Missing keys keep their defaults; malformed values throw std::runtime_error.
    static ManagerConfig from_json(std::string_view content);

    static ManagerConfig from_file(std::string_view path);

    std::string to_json() const;

    // Throws std::runtime_error for values the engine cannot run with
    void validate() const;

    ManagerConfig& with_max_fee(uint32_t pips) {
        max_fee_pips = pips;
        return *this;
    }

    ManagerConfig& with_log_level(std::string_view level) {
        log_level = std::string(level);
        return *this;
    }

    ManagerConfig& with_manager_address(const Address& addr) {
        manager_address = addr;
        return *this;
    }
};

} // namespace hookgate

#endif // HOOKGATE_CONFIG_HPP
