#pragma once
#include <atomic>

namespace tvlink {

// Polled cooperatively by DiscoveryEngine before each address is started.
class CancellationToken {
public:
    void cancel() { cancelled_.store(true); }
    bool cancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

} // namespace tvlink
