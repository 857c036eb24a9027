#pragma once
#include "core/ErrorCatalog.hpp"

#include <cstddef>
#include <string>
#include <utility>
#include <nlohmann/json.hpp>

namespace tvlink {

// The target device is passed alongside the request to ProtocolDispatcher::send.
struct CommandRequest {
    std::string command;                 // logical, vendor-neutral name
    nlohmann::json payload = nullptr;    // e.g. volume level or app id
};

enum class CommandStatus {
    Delivered,
    Rejected,        // ProtocolError: permanent, do not retry
    TransportError   // transient, caller may retry
};

struct CommandOutcome {
    CommandStatus status = CommandStatus::Delivered;
    int code = 0;
    std::string reason;

    bool delivered() const { return status == CommandStatus::Delivered; }

    static CommandOutcome ok() { return {}; }
    static CommandOutcome rejected(int code, std::string reason) {
        return {CommandStatus::Rejected, code, std::move(reason)};
    }
    static CommandOutcome transport_error(int code, std::string reason) {
        return {CommandStatus::TransportError, code, std::move(reason)};
    }
};

struct SequenceOutcome {
    CommandOutcome outcome;        // last outcome: the failure that aborted, or the final success
    std::size_t attempted = 0;     // commands actually sent (including the failing one)
};

inline const char* status_name(CommandStatus s) {
    switch (s) {
        case CommandStatus::Delivered: return "delivered";
        case CommandStatus::Rejected: return "rejected";
        case CommandStatus::TransportError: return "transport_error";
    }
    return "unknown";
}

} // namespace tvlink
