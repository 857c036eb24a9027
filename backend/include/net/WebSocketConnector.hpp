#pragma once
#include "net/PersistentSocket.hpp"

namespace tvlink::net {

// Boost.Beast client WebSocket (ws://host:port/target), text frames only.
class WebSocketConnector : public ISocketConnector {
public:
    std::unique_ptr<IPersistentSocket> connect(const Endpoint& endpoint, std::chrono::milliseconds timeout, boost::system::error_code& ec) override;
};

} // namespace tvlink::net
