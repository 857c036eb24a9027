#pragma once
#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tvlink::net {

/**
 * @brief Wake-on-LAN magic packet sender (UDP broadcast).
 */
class WakeOnLan {
public:
    explicit WakeOnLan(std::string broadcast_address = "255.255.255.255", uint16_t port = 9);

    // 12 hex digits, optionally separated by ':', '-' or '.'.
    static bool is_valid_mac(const std::string& text);
    static std::optional<std::array<uint8_t, 6>> parse_mac(const std::string& text);
    // Six 0xFF bytes followed by the MAC repeated 16 times (102 bytes). Empty for an invalid MAC.
    static std::vector<uint8_t> build_magic_packet(const std::string& mac);

    // True when at least one of `attempts` sends succeeded.
    bool wake(const std::string& mac, int attempts = 3, std::chrono::milliseconds spacing = std::chrono::milliseconds(100));

private:
    std::string broadcast_address_;
    uint16_t port_;
};

} // namespace tvlink::net
