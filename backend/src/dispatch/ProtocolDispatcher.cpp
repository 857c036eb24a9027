#include "dispatch/ProtocolDispatcher.hpp"
#include "core/ErrorCatalog.hpp"

#include <iostream>
#include <thread>

using json = nlohmann::json;

namespace tvlink {

namespace {

std::string http_url(const std::string& ip, uint16_t port, const std::string& target) {
    return "http://" + ip + ":" + std::to_string(port) + target;
}

} // namespace

ProtocolDispatcher::ProtocolDispatcher(const BrandRegistry& registry, ConnectionManager& connections,
                                       net::IHttpClient& http, std::chrono::milliseconds request_timeout)
    : registry_(registry), connections_(connections), http_(http), request_timeout_(request_timeout) {}

std::shared_ptr<std::mutex> ProtocolDispatcher::device_lock(const std::string& device_id) {
    std::lock_guard<std::mutex> lk(locks_m_);
    auto& m = device_locks_[device_id];
    if (!m) m = std::make_shared<std::mutex>();
    return m;
}

void ProtocolDispatcher::prune_lock(const std::string& device_id) {
    std::lock_guard<std::mutex> lk(locks_m_);
    auto it = device_locks_.find(device_id);
    if (it != device_locks_.end() && it->second.use_count() == 1) device_locks_.erase(it);
}

std::size_t ProtocolDispatcher::busy_devices() {
    std::lock_guard<std::mutex> lk(locks_m_);
    return device_locks_.size();
}

CommandOutcome ProtocolDispatcher::send(const Device& device, const CommandRequest& request) {
    const BrandProfile* profile = registry_.resolve(device.brand, device.protocol);
    if (!profile || !profile->build) {
        return CommandOutcome::rejected(errors::E3200_UNSUPPORTED_PROTOCOL, errors::MSG_UNSUPPORTED_PROTOCOL);
    }

    auto code = registry_.translate(*profile, request.command);
    if (!code) {
        return CommandOutcome::rejected(errors::E3210_UNSUPPORTED_COMMAND, errors::MSG_UNSUPPORTED_COMMAND);
    }

    CommandOutcome out;
    {
        auto lock = device_lock(device.id);
        std::lock_guard<std::mutex> lk(*lock);

        const CommandContext ctx{device, request.command, *code, request.payload, sequence_++};
        auto wire = profile->build(ctx);
        if (wire) {
            out = deliver(device, *profile, *wire);
        } else {
            out = CommandOutcome::rejected(errors::E3220_INVALID_PAYLOAD, errors::MSG_INVALID_PAYLOAD);
        }
    }
    prune_lock(device.id);
    return out;
}

CommandOutcome ProtocolDispatcher::deliver(const Device& device, const BrandProfile& profile, const WireRequest& wire) {
    if (wire.transport == Transport::Http) {
        auto res = http_.post(http_url(device.ip, wire.port, wire.target), wire.body, request_timeout_);
        if (!res.completed()) {
            std::cerr << "ProtocolDispatcher: " << device.id << " POST " << wire.target << " failed: " << res.error << std::endl;
            return CommandOutcome::transport_error(errors::E3100_UNREACHABLE, errors::format_unreachable(res.error));
        }
        if (!res.success()) {
            std::cerr << "ProtocolDispatcher: " << device.id << " POST " << wire.target << " returned " << res.code << std::endl;
            return CommandOutcome::transport_error(errors::E3110_HTTP_STATUS, errors::format_http_status(res.code));
        }
        return CommandOutcome::ok();
    }

    boost::system::error_code ec;
    const net::Endpoint endpoint{device.ip, wire.port, wire.target};
    auto conn = connections_.acquire(device.id, profile.protocol, endpoint, ec);
    if (!conn) {
        return CommandOutcome::transport_error(errors::E3120_PERSISTENT_CONNECT,
            errors::format_unreachable(std::string(errors::D3120_PERSISTENT_CONNECT) + ": " + ec.message()));
    }

    conn->send(wire.body, request_timeout_, ec);
    if (ec) {
        std::cerr << "ProtocolDispatcher: " << device.id << " send failed: " << ec.message() << std::endl;
        connections_.drop(device.id, conn);
        return CommandOutcome::transport_error(errors::E3130_SEND_FAILED,
            errors::format_unreachable(std::string(errors::D3130_SEND_FAILED) + ": " + ec.message()));
    }
    return CommandOutcome::ok();
}

SequenceOutcome ProtocolDispatcher::send_sequence(const Device& device, const std::vector<CommandRequest>& requests,
                                                  std::chrono::milliseconds delay) {
    SequenceOutcome out;
    for (std::size_t i = 0; i < requests.size(); ++i) {
        if (i > 0 && delay.count() > 0) std::this_thread::sleep_for(delay);
        out.outcome = send(device, requests[i]);
        out.attempted++;
        if (!out.outcome.delivered()) {
            std::cerr << "ProtocolDispatcher: sequence for " << device.id << " aborted at " << (i + 1) << "/"
                      << requests.size() << " (" << requests[i].command << "): " << out.outcome.reason << std::endl;
            break;
        }
    }
    return out;
}

std::optional<json> ProtocolDispatcher::query_status(const Device& device) {
    const BrandProfile* profile = registry_.find(device.brand);
    if (!profile || profile->status_path.empty()) return std::nullopt;

    const uint16_t port = profile->status_port ? profile->status_port : device.port;
    auto res = http_.get(http_url(device.ip, port, profile->status_path), request_timeout_);
    if (!res.completed() || res.code != 200) {
        std::cerr << "ProtocolDispatcher: status of " << device.id << " unavailable: "
                  << (res.completed() ? "HTTP " + std::to_string(res.code) : res.error) << std::endl;
        return std::nullopt;
    }

    json j = json::parse(res.body, nullptr, false);
    if (j.is_discarded()) return json{{"raw", res.body}};
    return j;
}

} // namespace tvlink
