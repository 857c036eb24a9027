#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <boost/system/error_code.hpp>

namespace tvlink::net {

struct Endpoint {
    std::string host;
    uint16_t port = 0;
    std::string target = "/";
};

/**
 * @brief One long-lived full-duplex connection to a device.
 *
 * Callers serialize access (ConnectionManager's Connection holds the lock).
 */
class IPersistentSocket {
public:
    virtual ~IPersistentSocket() = default;
    virtual void write_text(const std::string& payload, std::chrono::milliseconds timeout, boost::system::error_code& ec) = 0;
    virtual void close() = 0;
    virtual bool is_open() const = 0;
};

class ISocketConnector {
public:
    virtual ~ISocketConnector() = default;
    // Returns nullptr and sets `ec` when the connection or handshake fails within `timeout`.
    virtual std::unique_ptr<IPersistentSocket> connect(const Endpoint& endpoint, std::chrono::milliseconds timeout, boost::system::error_code& ec) = 0;
};

} // namespace tvlink::net
