#pragma once
#include <chrono>
#include <cstdint>
#include <string>

namespace tvlink::net {

// Bounded-time TCP connect attempt; the connection is closed immediately.
class IPortProber {
public:
    virtual ~IPortProber() = default;
    virtual bool try_connect(const std::string& host, uint16_t port, std::chrono::milliseconds timeout) = 0;
};

class AsioPortProber : public IPortProber {
public:
    bool try_connect(const std::string& host, uint16_t port, std::chrono::milliseconds timeout) override;
};

} // namespace tvlink::net
