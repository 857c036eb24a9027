#include "net/PortProber.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace tvlink::net {

bool AsioPortProber::try_connect(const std::string& host, uint16_t port, std::chrono::milliseconds timeout) {
    boost::system::error_code ec;
    auto addr = asio::ip::make_address(host, ec);
    if (ec) return false;

    // One io_context per attempt so concurrent probes never share state.
    asio::io_context ioc;
    tcp::socket socket(ioc);
    boost::system::error_code connect_ec = asio::error::would_block;
    socket.async_connect(tcp::endpoint(addr, port), [&connect_ec](const boost::system::error_code& e) {
        connect_ec = e;
    });

    ioc.run_for(timeout);
    if (connect_ec == asio::error::would_block) {
        // timed out: cancel and let the handler drain before the socket goes away
        socket.close(ec);
        ioc.restart();
        ioc.run();
        return false;
    }

    bool ok = !connect_ec;
    socket.close(ec);
    return ok;
}

} // namespace tvlink::net
