#pragma once

#include <string>
#include <string_view>

namespace tvlink::errors {

// 3100-3199: TransportError (transient, retry at the caller's discretion)
// 3200-3299: ProtocolError (permanent, data/config mismatch)
// 3300:      discovery cancelled (normal termination, not a failure)
// 3400-3499: configuration / store errors

inline constexpr int E3100_UNREACHABLE = 3100;
inline constexpr int E3110_HTTP_STATUS = 3110;
inline constexpr int E3120_PERSISTENT_CONNECT = 3120;
inline constexpr int E3130_SEND_FAILED = 3130;

inline constexpr int E3200_UNSUPPORTED_PROTOCOL = 3200;
inline constexpr int E3210_UNSUPPORTED_COMMAND = 3210;
inline constexpr int E3220_INVALID_PAYLOAD = 3220;

inline constexpr int E3300_CANCELLED = 3300;

inline constexpr int E3400_CONFIG = 3400;
inline constexpr int E3410_STORE = 3410;

// Reason strings that cross the core boundary.
inline constexpr const char* MSG_UNREACHABLE_PREFIX = "could not reach device: ";
inline constexpr const char* MSG_UNSUPPORTED_PROTOCOL = "unsupported protocol";
inline constexpr const char* MSG_UNSUPPORTED_COMMAND = "unsupported command for brand";
inline constexpr const char* MSG_INVALID_PAYLOAD = "invalid payload for command";
inline constexpr const char* MSG_CANCELLED = "discovery cancelled";

// Transport details appended after MSG_UNREACHABLE_PREFIX.
inline constexpr const char* D3100_TIMED_OUT = "connection timed out";
inline constexpr const char* D3110_HTTP_STATUS_PREFIX = "device responded with HTTP ";
inline constexpr const char* D3120_PERSISTENT_CONNECT = "persistent connection failed";
inline constexpr const char* D3130_SEND_FAILED = "send failed";

// Configuration / store details (thrown as std::runtime_error).
inline constexpr const char* D3400_INVALID_RANGE = "invalid address range";
inline constexpr const char* D3400_RANGE_TOO_LARGE = "address range exceeds 65536 hosts";
inline constexpr const char* D3400_DISCOVERY_ACTIVE = "discovery pass already active";
inline constexpr const char* D3400_CONFIG_OPEN_FAILED = "failed to open config file";
inline constexpr const char* D3400_CONFIG_MALFORMED = "malformed config file";
inline constexpr const char* D3400_CONFIG_BAD_TYPE = "config key has wrong type: ";
inline constexpr const char* D3410_MALFORMED_DEVICE = "malformed device record";
inline constexpr const char* D3410_UNKNOWN_DEVICE = "unknown device id: ";
inline constexpr const char* D3410_INVALID_MAC = "invalid MAC address";

inline std::string code_string(int code) {
    return std::to_string(code);
}

inline std::string format_unreachable(std::string_view detail) {
    std::string out(MSG_UNREACHABLE_PREFIX);
    if (detail.empty()) {
        out.append(D3100_TIMED_OUT);
    } else {
        out.append(detail.data(), detail.size());
    }
    return out;
}

inline std::string format_http_status(long status) {
    return format_unreachable(std::string(D3110_HTTP_STATUS_PREFIX) + std::to_string(status));
}

} // namespace tvlink::errors
