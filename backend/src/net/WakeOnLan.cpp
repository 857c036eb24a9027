#include "net/WakeOnLan.hpp"

#include <cctype>
#include <iostream>
#include <thread>
#include <utility>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>

namespace asio = boost::asio;
using udp = asio::ip::udp;

namespace tvlink::net {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

} // namespace

WakeOnLan::WakeOnLan(std::string broadcast_address, uint16_t port)
    : broadcast_address_(std::move(broadcast_address)), port_(port) {}

std::optional<std::array<uint8_t, 6>> WakeOnLan::parse_mac(const std::string& text) {
    std::string digits;
    for (char c : text) {
        if (c == ':' || c == '-' || c == '.') continue;
        if (hex_value(c) < 0) return std::nullopt;
        digits.push_back(c);
    }
    if (digits.size() != 12) return std::nullopt;

    std::array<uint8_t, 6> mac{};
    for (size_t i = 0; i < mac.size(); ++i) {
        mac[i] = static_cast<uint8_t>((hex_value(digits[2 * i]) << 4) | hex_value(digits[2 * i + 1]));
    }
    return mac;
}

bool WakeOnLan::is_valid_mac(const std::string& text) {
    return parse_mac(text).has_value();
}

std::vector<uint8_t> WakeOnLan::build_magic_packet(const std::string& mac) {
    auto parsed = parse_mac(mac);
    if (!parsed) return {};
    std::vector<uint8_t> packet(6, 0xFF);
    packet.reserve(102);
    for (int i = 0; i < 16; ++i) packet.insert(packet.end(), parsed->begin(), parsed->end());
    return packet;
}

bool WakeOnLan::wake(const std::string& mac, int attempts, std::chrono::milliseconds spacing) {
    const auto packet = build_magic_packet(mac);
    if (packet.empty()) {
        std::cerr << "WakeOnLan: invalid MAC '" << mac << "'" << std::endl;
        return false;
    }

    boost::system::error_code ec;
    auto addr = asio::ip::make_address_v4(broadcast_address_, ec);
    if (ec) {
        std::cerr << "WakeOnLan: bad broadcast address " << broadcast_address_ << ": " << ec.message() << std::endl;
        return false;
    }

    asio::io_context ioc;
    udp::socket socket(ioc);
    socket.open(udp::v4(), ec);
    if (ec) {
        std::cerr << "WakeOnLan: socket open failed: " << ec.message() << std::endl;
        return false;
    }
    socket.set_option(asio::socket_base::broadcast(true), ec);
    if (ec) std::cerr << "WakeOnLan: broadcast option refused: " << ec.message() << std::endl;

    const udp::endpoint target(addr, port_);
    bool any_sent = false;
    for (int i = 0; i < attempts; ++i) {
        if (i > 0) std::this_thread::sleep_for(spacing);
        socket.send_to(asio::buffer(packet), target, 0, ec);
        if (ec) {
            std::cerr << "WakeOnLan: send " << (i + 1) << "/" << attempts << " failed: " << ec.message() << std::endl;
        } else {
            any_sent = true;
        }
    }
    socket.close(ec);
    return any_sent;
}

} // namespace tvlink::net
