#pragma once
#include "BrandRegistry.hpp"
#include "Device.hpp"
#include "dispatch/Command.hpp"
#include "dispatch/ConnectionManager.hpp"
#include "net/HttpClient.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace tvlink {

/**
 * @brief Translates logical commands through the BrandRegistry and delivers them.
 *
 * Persistent-socket brands go through the ConnectionManager; everything else is one HTTP
 * request per command. Commands to one device are serialized; different devices proceed
 * independently. No call throws for network or protocol failures; they come back as outcomes.
 */
class ProtocolDispatcher {
public:
    ProtocolDispatcher(const BrandRegistry& registry, ConnectionManager& connections, net::IHttpClient& http,
                       std::chrono::milliseconds request_timeout);

    CommandOutcome send(const Device& device, const CommandRequest& request);

    // In order, `delay` between consecutive commands, stops at the first non-delivered outcome.
    SequenceOutcome send_sequence(const Device& device, const std::vector<CommandRequest>& requests,
                                  std::chrono::milliseconds delay);

    // Brand status endpoint, parsed. nullopt on any failure or when the brand has none.
    std::optional<nlohmann::json> query_status(const Device& device);

    // Devices with a command currently in flight or queued.
    std::size_t busy_devices();

private:
    std::shared_ptr<std::mutex> device_lock(const std::string& device_id);
    // Drops the device's mutex once no sender holds it.
    void prune_lock(const std::string& device_id);
    CommandOutcome deliver(const Device& device, const BrandProfile& profile, const WireRequest& wire);

    const BrandRegistry& registry_;
    ConnectionManager& connections_;
    net::IHttpClient& http_;
    std::chrono::milliseconds request_timeout_;

    std::mutex locks_m_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> device_locks_;
    std::atomic<uint64_t> sequence_{1};
};

} // namespace tvlink
