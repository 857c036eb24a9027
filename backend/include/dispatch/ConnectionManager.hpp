#pragma once
#include "Device.hpp"
#include "net/PersistentSocket.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <boost/system/error_code.hpp>

namespace tvlink {

enum class ConnectionState {
    Absent,
    Connecting,
    Established
};

/** @brief An established persistent connection to one device. */
class Connection {
public:
    Connection(std::string device_id, std::unique_ptr<net::IPersistentSocket> socket);

    // Serialized per connection; updates last_activity on success.
    void send(const std::string& payload, std::chrono::milliseconds timeout, boost::system::error_code& ec);
    void close();
    bool is_open() const;

    const std::string& device_id() const { return device_id_; }
    std::chrono::steady_clock::time_point created_at() const { return created_at_; }
    std::chrono::steady_clock::time_point last_activity() const;

private:
    std::string device_id_;
    std::chrono::steady_clock::time_point created_at_;
    std::chrono::steady_clock::time_point last_activity_;
    std::unique_ptr<net::IPersistentSocket> socket_;
    mutable std::mutex m_;
};

/**
 * @brief Owns at most one persistent connection per device id.
 *
 * State per id: Absent -> Connecting -> Established, back to Absent on failure or release.
 * Each id has its own lock, so a slow connect to one device never holds up another, and a
 * second acquire for the same id waits for the first one and reuses its connection.
 */
class ConnectionManager {
public:
    ConnectionManager(net::ISocketConnector& connector, std::chrono::milliseconds connect_timeout);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    // Returns the live connection, opening it if needed. nullptr with `ec` set on failure,
    // or when `protocol` is not a persistent-socket protocol.
    std::shared_ptr<Connection> acquire(const std::string& device_id, Protocol protocol,
                                        const net::Endpoint& endpoint, boost::system::error_code& ec);

    void release(const std::string& device_id);
    // Tears down `conn` only if it is still the current connection for the id.
    void drop(const std::string& device_id, const std::shared_ptr<Connection>& conn);
    void release_all();

    ConnectionState state(const std::string& device_id) const;
    std::size_t size() const;
    std::size_t connects_attempted() const { return connects_.load(); }

private:
    struct Slot {
        std::mutex m;
        std::atomic<ConnectionState> state{ConnectionState::Absent};
        std::shared_ptr<Connection> conn;
        bool retired = false;   // removed from the table; acquirers must look again
    };

    std::shared_ptr<Slot> slot_for(const std::string& device_id);
    void retire(const std::string& device_id, const std::shared_ptr<Slot>& slot);

    net::ISocketConnector& connector_;
    std::chrono::milliseconds connect_timeout_;
    mutable std::mutex table_m_;
    std::unordered_map<std::string, std::shared_ptr<Slot>> slots_;
    std::atomic<std::size_t> connects_{0};
};

} // namespace tvlink
