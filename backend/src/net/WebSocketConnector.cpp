#include "net/WebSocketConnector.hpp"

#include <iostream>
// Boost.Beast / Asio for WebSocket
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/version.hpp>

namespace beast = boost::beast;         // from <boost/beast.hpp>
namespace http = beast::http;
namespace websocket = beast::websocket; // from <boost/beast/websocket.hpp>
namespace asio = boost::asio;           // from <boost/asio.hpp>
using tcp = asio::ip::tcp;              // from <boost/asio/ip/tcp.hpp>

namespace tvlink::net {

namespace {

constexpr std::chrono::milliseconds kCloseGrace{500};

// Each session drives its own io_context synchronously from the calling thread;
// the owning Connection serializes calls.
class WebSocketSession : public IPersistentSocket {
public:
    WebSocketSession() : ws_(ioc_) {}

    ~WebSocketSession() override {
        close();
    }

    bool open(const Endpoint& ep, std::chrono::milliseconds timeout, boost::system::error_code& ec) {
        tcp::resolver resolver(ioc_);
        auto const results = resolver.resolve(ep.host, std::to_string(ep.port), ec);
        if (ec) return false;

        boost::system::error_code op_ec;
        auto& layer = beast::get_lowest_layer(ws_);
        layer.expires_after(timeout);
        layer.async_connect(results, [&op_ec](const beast::error_code& e, const tcp::endpoint&) {
            op_ec = e;
        });
        ioc_.restart();
        ioc_.run();
        if (op_ec) {
            ec = op_ec;
            return false;
        }

        // websocket stream handles its own timeouts from here on
        layer.expires_never();
        websocket::stream_base::timeout opt{
            timeout,                         // handshake
            websocket::stream_base::none(),  // idle
            false                            // keep-alive pings
        };
        ws_.set_option(opt);
        ws_.set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
            req.set(http::field::user_agent, std::string(BOOST_BEAST_VERSION_STRING) + " tvlink");
        }));

        ws_.async_handshake(ep.host + ":" + std::to_string(ep.port), ep.target, [&op_ec](const beast::error_code& e) {
            op_ec = e;
        });
        ioc_.restart();
        ioc_.run();
        if (op_ec) {
            ec = op_ec;
            return false;
        }

        ws_.text(true);
        open_ = true;
        return true;
    }

    void write_text(const std::string& payload, std::chrono::milliseconds timeout, boost::system::error_code& ec) override {
        if (!open_) {
            ec = asio::error::not_connected;
            return;
        }
        bool done = false;
        boost::system::error_code op_ec;
        ws_.async_write(asio::buffer(payload), [&](const beast::error_code& e, std::size_t) {
            op_ec = e;
            done = true;
        });
        ioc_.restart();
        ioc_.run_for(timeout);
        if (!done) {
            std::cerr << "WebSocketConnector: write timed out after " << timeout.count() << "ms" << std::endl;
            abort_socket();
            ec = asio::error::timed_out;
            return;
        }
        if (op_ec) {
            open_ = false;
            ec = op_ec;
        }
    }

    void close() override {
        if (!open_) return;
        open_ = false;
        ws_.async_close(websocket::close_code::normal, [](const beast::error_code&) {});
        ioc_.restart();
        ioc_.run_for(kCloseGrace);
        abort_socket();
    }

    bool is_open() const override {
        return open_ && ws_.is_open();
    }

private:
    void abort_socket() {
        open_ = false;
        beast::get_lowest_layer(ws_).close();
        // drain aborted handlers
        ioc_.restart();
        ioc_.run();
    }

    asio::io_context ioc_;
    websocket::stream<beast::tcp_stream> ws_;
    bool open_ = false;
};

} // namespace

std::unique_ptr<IPersistentSocket> WebSocketConnector::connect(const Endpoint& endpoint, std::chrono::milliseconds timeout, boost::system::error_code& ec) {
    auto session = std::make_unique<WebSocketSession>();
    if (!session->open(endpoint, timeout, ec)) {
        std::cerr << "WebSocketConnector: ws://" << endpoint.host << ":" << endpoint.port << endpoint.target
                  << " failed: " << ec.message() << std::endl;
        return nullptr;
    }
    return session;
}

} // namespace tvlink::net
