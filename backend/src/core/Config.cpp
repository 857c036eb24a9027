#include "core/Config.hpp"
#include "core/ErrorCatalog.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace tvlink {

namespace {

void require_type(const char* key, bool ok) {
    if (!ok) throw std::runtime_error(std::string(errors::D3400_CONFIG_BAD_TYPE) + key);
}

void read_int(const json& j, const char* key, int& out) {
    if (!j.contains(key)) return;
    require_type(key, j[key].is_number_integer());
    out = j[key].get<int>();
}

void read_ms(const json& j, const char* key, std::chrono::milliseconds& out) {
    if (!j.contains(key)) return;
    require_type(key, j[key].is_number_integer() && j[key].get<int64_t>() >= 0);
    out = std::chrono::milliseconds(j[key].get<int64_t>());
}

void read_string(const json& j, const char* key, std::string& out) {
    if (!j.contains(key)) return;
    require_type(key, j[key].is_string());
    out = j[key].get<std::string>();
}

} // namespace

void CoreConfig::apply_json(const json& j) {
    if (!j.is_object()) throw std::runtime_error(errors::D3400_CONFIG_MALFORMED);

    read_string(j, "subnet", subnet);
    read_int(j, "range_start", range_start);
    read_int(j, "range_end", range_end);
    read_ms(j, "per_host_timeout_ms", per_host_timeout);
    read_ms(j, "fingerprint_timeout_ms", fingerprint_timeout);
    read_ms(j, "request_timeout_ms", request_timeout);
    read_ms(j, "inter_command_delay_ms", inter_command_delay);
    read_string(j, "devices_path", devices_path);

    if (j.contains("max_in_flight")) {
        require_type("max_in_flight", j["max_in_flight"].is_number_integer() && j["max_in_flight"].get<int64_t>() > 0);
        max_in_flight = static_cast<std::size_t>(j["max_in_flight"].get<int64_t>());
    }
}

void CoreConfig::apply_env() {
    const char* env = std::getenv("TVLINK_DEVICES_PATH");
    if (env && *env) devices_path = std::string(env);
}

json CoreConfig::to_json() const {
    return {
        {"subnet", subnet},
        {"range_start", range_start},
        {"range_end", range_end},
        {"per_host_timeout_ms", per_host_timeout.count()},
        {"fingerprint_timeout_ms", fingerprint_timeout.count()},
        {"request_timeout_ms", request_timeout.count()},
        {"max_in_flight", max_in_flight},
        {"inter_command_delay_ms", inter_command_delay.count()},
        {"devices_path", devices_path}
    };
}

CoreConfig CoreConfig::load(const std::string& path) {
    CoreConfig cfg;
    if (!path.empty()) {
        std::ifstream f(path);
        if (!f) throw std::runtime_error(std::string(errors::D3400_CONFIG_OPEN_FAILED) + ": " + path);
        json j = json::parse(f, nullptr, false);
        if (j.is_discarded()) throw std::runtime_error(std::string(errors::D3400_CONFIG_MALFORMED) + ": " + path);
        cfg.apply_json(j);
        std::cerr << "Config: loaded " << path << std::endl;
    }
    cfg.apply_env();
    return cfg;
}

std::string CoreConfig::resolve_config_path(const std::string& cli_path) {
    if (!cli_path.empty()) return cli_path;
    const char* env = std::getenv("TVLINK_CONFIG");
    if (env && *env) return std::string(env);
    return {};
}

} // namespace tvlink
