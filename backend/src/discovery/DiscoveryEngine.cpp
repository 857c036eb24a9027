#include "discovery/DiscoveryEngine.hpp"
#include "core/ErrorCatalog.hpp"
#include "discovery/Probe.hpp"

#include <algorithm>
#include <cctype>
#include <deque>
#include <future>
#include <iostream>
#include <stdexcept>

namespace tvlink {

namespace {

Device make_found_device(const ProbeResult& r) {
    Device d;
    d.id = make_device_id();
    std::string label = brand_name(r.brand);
    std::transform(label.begin(), label.end(), label.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    d.name = "TV " + label;
    d.ip = r.address;
    d.port = r.port;
    d.brand = r.brand;
    d.protocol = r.protocol;
    d.online = true;
    d.last_seen_ms = now_ms();
    return d;
}

} // namespace

struct DiscoveryStream::State {
    State(const BrandRegistry& registry, net::IPortProber& prober, net::IHttpClient& http,
          AddressRange r, std::chrono::milliseconds timeout, const CancellationToken& t,
          DiscoveryOptions opts, std::shared_ptr<std::atomic<bool>> flag)
        : probe(registry, prober, http), range(std::move(r)), per_host_timeout(timeout), token(t),
          options(opts), active(std::move(flag)) {
        summary.total_candidates = range.size();
    }

    ~State() {
        drain();
        if (!finished) active->store(false);
    }

    void launch_ready() {
        while (in_flight.size() < options.max_in_flight && next_index < range.size()) {
            if (token.cancelled()) return;
            const std::string address = range.at(next_index++);
            in_flight.push_back(std::async(std::launch::async, [this, address]() {
                try {
                    return probe.run(address, per_host_timeout, options.fingerprint_timeout);
                } catch (const std::exception& e) {
                    std::cerr << "DiscoveryEngine: probe of " << address << " failed: " << e.what() << std::endl;
                    ProbeResult failed;
                    failed.address = address;
                    return failed;
                }
            }));
        }
    }

    // Let started probes finish or time out; their results are discarded.
    void drain() {
        while (!in_flight.empty()) {
            in_flight.front().wait();
            in_flight.pop_front();
        }
    }

    void finish(bool was_cancelled) {
        drain();
        summary.cancelled = was_cancelled;
        finished = true;
        active->store(false);
        if (was_cancelled) {
            std::cerr << "DiscoveryEngine: " << errors::MSG_CANCELLED << " after " << summary.scanned
                      << "/" << summary.total_candidates << std::endl;
        }
    }

    Probe probe;
    AddressRange range;
    std::chrono::milliseconds per_host_timeout;
    const CancellationToken& token;
    DiscoveryOptions options;
    std::shared_ptr<std::atomic<bool>> active;

    std::deque<std::future<ProbeResult>> in_flight;
    std::size_t next_index = 0;
    DiscoverySummary summary;
    bool finished = false;
};

DiscoveryStream::DiscoveryStream(std::unique_ptr<State> state) : state_(std::move(state)) {}
DiscoveryStream::DiscoveryStream(DiscoveryStream&&) noexcept = default;
DiscoveryStream& DiscoveryStream::operator=(DiscoveryStream&&) noexcept = default;
DiscoveryStream::~DiscoveryStream() = default;

std::optional<DiscoveryEvent> DiscoveryStream::next() {
    if (!state_ || state_->finished) return std::nullopt;
    State& s = *state_;

    s.launch_ready();
    if (s.in_flight.empty()) {
        s.finish(s.next_index < s.range.size());
        return std::nullopt;
    }

    ProbeResult result = s.in_flight.front().get();
    s.in_flight.pop_front();

    // Observed cancellation: nothing more is emitted, including this address.
    if (s.token.cancelled()) {
        s.finish(true);
        return std::nullopt;
    }

    DiscoveryEvent ev;
    s.summary.scanned++;
    if (result.identified()) {
        s.summary.found++;
        ev.device = make_found_device(result);
    }
    ev.progress.completed = s.summary.scanned;
    ev.progress.total = s.summary.total_candidates;
    ev.progress.current_address = result.address;
    ev.progress.found = s.summary.found;

    if (s.summary.scanned == s.summary.total_candidates) s.finish(false);
    return ev;
}

bool DiscoveryStream::done() const {
    return !state_ || state_->finished;
}

const DiscoverySummary& DiscoveryStream::summary() const {
    static const DiscoverySummary empty{};
    return state_ ? state_->summary : empty;
}

DiscoveryEngine::DiscoveryEngine(const BrandRegistry& registry, net::IPortProber& prober, net::IHttpClient& http,
                                 DiscoveryOptions options)
    : registry_(registry), prober_(prober), http_(http), options_(options),
      active_(std::make_shared<std::atomic<bool>>(false)) {
    if (options_.max_in_flight == 0) options_.max_in_flight = 1;
}

DiscoveryStream DiscoveryEngine::discover(const AddressRange& range, std::chrono::milliseconds per_host_timeout,
                                          const CancellationToken& token) {
    bool expected = false;
    if (!active_->compare_exchange_strong(expected, true)) {
        throw std::runtime_error(errors::D3400_DISCOVERY_ACTIVE);
    }
    auto state = std::make_unique<DiscoveryStream::State>(registry_, prober_, http_, range, per_host_timeout,
                                                          token, options_, active_);
    if (range.empty()) state->finish(false);
    return DiscoveryStream(std::move(state));
}

} // namespace tvlink
