#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

namespace tvlink {

struct CoreConfig {
    std::string subnet = "192.168.1";
    int range_start = 1;
    int range_end = 50;

    std::chrono::milliseconds per_host_timeout{500};
    std::chrono::milliseconds fingerprint_timeout{3000};
    std::chrono::milliseconds request_timeout{5000};
    std::size_t max_in_flight = 16;
    std::chrono::milliseconds inter_command_delay{300};

    std::string devices_path = "devices.json";

    // Overlay keys present in `j` (throws std::runtime_error on a mistyped key).
    void apply_json(const nlohmann::json& j);
    // TVLINK_DEVICES_PATH
    void apply_env();

    nlohmann::json to_json() const;

    // Defaults, then the file (if any), then the environment.
    static CoreConfig load(const std::string& path);
    // --config takes precedence over TVLINK_CONFIG; empty when neither is set.
    static std::string resolve_config_path(const std::string& cli_path);
};

} // namespace tvlink
