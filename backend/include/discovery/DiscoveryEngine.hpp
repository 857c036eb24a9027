#pragma once
#include "BrandRegistry.hpp"
#include "Device.hpp"
#include "core/CancellationToken.hpp"
#include "discovery/AddressRange.hpp"
#include "net/HttpClient.hpp"
#include "net/PortProber.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace tvlink {

struct DiscoveryProgress {
    std::size_t completed = 0;
    std::size_t total = 0;
    std::string current_address;
    std::size_t found = 0;
};

// One event per address. `device` is set when that address was identified as a known brand.
struct DiscoveryEvent {
    DiscoveryProgress progress;
    std::optional<Device> device;
};

struct DiscoverySummary {
    std::size_t total_candidates = 0;
    std::size_t scanned = 0;
    std::size_t found = 0;
    bool cancelled = false;
};

struct DiscoveryOptions {
    std::size_t max_in_flight = 16;
    std::chrono::milliseconds fingerprint_timeout{3000};
};

/**
 * @brief Lazy, single-use sequence of discovery events.
 *
 * Probes run ahead of the consumer up to the engine's in-flight bound; events are still
 * released strictly in ascending address order. Destroying the stream early waits for
 * the probes already started. The engine and the token must outlive the stream.
 */
class DiscoveryStream {
public:
    DiscoveryStream(DiscoveryStream&&) noexcept;
    DiscoveryStream& operator=(DiscoveryStream&&) noexcept;
    DiscoveryStream(const DiscoveryStream&) = delete;
    DiscoveryStream& operator=(const DiscoveryStream&) = delete;
    ~DiscoveryStream();

    // Blocks until the next address completes; nullopt once the pass is over.
    std::optional<DiscoveryEvent> next();
    bool done() const;
    // Final once next() has returned nullopt.
    const DiscoverySummary& summary() const;

private:
    friend class DiscoveryEngine;
    struct State;
    explicit DiscoveryStream(std::unique_ptr<State> state);

    std::unique_ptr<State> state_;
};

class DiscoveryEngine {
public:
    DiscoveryEngine(const BrandRegistry& registry, net::IPortProber& prober, net::IHttpClient& http,
                    DiscoveryOptions options = {});

    // Throws std::runtime_error if a previous stream from this engine is still alive.
    DiscoveryStream discover(const AddressRange& range, std::chrono::milliseconds per_host_timeout,
                             const CancellationToken& token);

    bool active() const { return active_->load(); }
    const DiscoveryOptions& options() const { return options_; }

private:
    const BrandRegistry& registry_;
    net::IPortProber& prober_;
    net::IHttpClient& http_;
    DiscoveryOptions options_;
    std::shared_ptr<std::atomic<bool>> active_;
};

} // namespace tvlink
