#include "dispatch/ConnectionManager.hpp"

#include <iostream>
#include <utility>
#include <vector>
#include <boost/system/error_code.hpp>

namespace tvlink {

// ---- Connection -------------------------------------------------------------

Connection::Connection(std::string device_id, std::unique_ptr<net::IPersistentSocket> socket)
    : device_id_(std::move(device_id)),
      created_at_(std::chrono::steady_clock::now()),
      last_activity_(created_at_),
      socket_(std::move(socket)) {}

void Connection::send(const std::string& payload, std::chrono::milliseconds timeout, boost::system::error_code& ec) {
    std::lock_guard<std::mutex> lk(m_);
    if (!socket_ || !socket_->is_open()) {
        ec = boost::system::errc::make_error_code(boost::system::errc::not_connected);
        return;
    }
    socket_->write_text(payload, timeout, ec);
    if (!ec) last_activity_ = std::chrono::steady_clock::now();
}

void Connection::close() {
    std::lock_guard<std::mutex> lk(m_);
    if (socket_) socket_->close();
}

bool Connection::is_open() const {
    std::lock_guard<std::mutex> lk(m_);
    return socket_ && socket_->is_open();
}

std::chrono::steady_clock::time_point Connection::last_activity() const {
    std::lock_guard<std::mutex> lk(m_);
    return last_activity_;
}

// ---- ConnectionManager ------------------------------------------------------

ConnectionManager::ConnectionManager(net::ISocketConnector& connector, std::chrono::milliseconds connect_timeout)
    : connector_(connector), connect_timeout_(connect_timeout) {}

ConnectionManager::~ConnectionManager() {
    release_all();
}

std::shared_ptr<ConnectionManager::Slot> ConnectionManager::slot_for(const std::string& device_id) {
    std::lock_guard<std::mutex> lk(table_m_);
    auto& slot = slots_[device_id];
    if (!slot) slot = std::make_shared<Slot>();
    return slot;
}

// Caller holds slot->m. Lock order is always slot, then table.
void ConnectionManager::retire(const std::string& device_id, const std::shared_ptr<Slot>& slot) {
    slot->retired = true;
    slot->conn.reset();
    slot->state.store(ConnectionState::Absent);
    std::lock_guard<std::mutex> lk(table_m_);
    auto it = slots_.find(device_id);
    if (it != slots_.end() && it->second == slot) slots_.erase(it);
}

std::shared_ptr<Connection> ConnectionManager::acquire(const std::string& device_id, Protocol protocol,
                                                       const net::Endpoint& endpoint, boost::system::error_code& ec) {
    if (protocol != Protocol::WebSocket) {
        ec = boost::system::errc::make_error_code(boost::system::errc::operation_not_supported);
        return nullptr;
    }

    for (;;) {
        auto slot = slot_for(device_id);
        std::lock_guard<std::mutex> lk(slot->m);
        if (slot->retired) continue;

        if (slot->conn) {
            if (slot->conn->is_open()) {
                ec.clear();
                return slot->conn;
            }
            // peer went away since the last command
            slot->conn->close();
            slot->conn.reset();
        }

        slot->state.store(ConnectionState::Connecting);
        connects_++;
        ec.clear();
        auto socket = connector_.connect(endpoint, connect_timeout_, ec);
        if (!socket) {
            if (!ec) ec = boost::system::errc::make_error_code(boost::system::errc::not_connected);
            std::cerr << "ConnectionManager: " << device_id << " connect to " << endpoint.host << ":" << endpoint.port
                      << " failed: " << ec.message() << std::endl;
            retire(device_id, slot);
            return nullptr;
        }

        slot->conn = std::make_shared<Connection>(device_id, std::move(socket));
        slot->state.store(ConnectionState::Established);
        return slot->conn;
    }
}

void ConnectionManager::release(const std::string& device_id) {
    std::shared_ptr<Slot> slot;
    {
        std::lock_guard<std::mutex> lk(table_m_);
        auto it = slots_.find(device_id);
        if (it == slots_.end()) return;
        slot = it->second;
    }
    std::lock_guard<std::mutex> lk(slot->m);
    if (slot->retired) return;
    if (slot->conn) slot->conn->close();
    retire(device_id, slot);
}

void ConnectionManager::drop(const std::string& device_id, const std::shared_ptr<Connection>& conn) {
    std::shared_ptr<Slot> slot;
    {
        std::lock_guard<std::mutex> lk(table_m_);
        auto it = slots_.find(device_id);
        if (it == slots_.end()) return;
        slot = it->second;
    }
    std::lock_guard<std::mutex> lk(slot->m);
    if (slot->retired || slot->conn != conn) return;
    std::cerr << "ConnectionManager: dropping connection to " << device_id << std::endl;
    if (slot->conn) slot->conn->close();
    retire(device_id, slot);
}

void ConnectionManager::release_all() {
    std::vector<std::pair<std::string, std::shared_ptr<Slot>>> all;
    {
        std::lock_guard<std::mutex> lk(table_m_);
        all.assign(slots_.begin(), slots_.end());
    }
    for (auto& [id, slot] : all) {
        std::lock_guard<std::mutex> lk(slot->m);
        if (slot->retired) continue;
        if (slot->conn) slot->conn->close();
        retire(id, slot);
    }
}

ConnectionState ConnectionManager::state(const std::string& device_id) const {
    std::lock_guard<std::mutex> lk(table_m_);
    auto it = slots_.find(device_id);
    if (it == slots_.end()) return ConnectionState::Absent;
    return it->second->state.load();
}

std::size_t ConnectionManager::size() const {
    std::lock_guard<std::mutex> lk(table_m_);
    std::size_t n = 0;
    for (const auto& [id, slot] : slots_) {
        if (slot->state.load() == ConnectionState::Established) ++n;
    }
    return n;
}

} // namespace tvlink
