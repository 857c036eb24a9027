#include "BrandRegistry.hpp"
#include "DeviceRegistry.hpp"
#include "core/BuildInfo.hpp"
#include "core/CancellationToken.hpp"
#include "core/Config.hpp"
#include "core/ErrorCatalog.hpp"
#include "discovery/AddressRange.hpp"
#include "discovery/DiscoveryEngine.hpp"
#include "dispatch/ConnectionManager.hpp"
#include "dispatch/ProtocolDispatcher.hpp"
#include "net/HttpClient.hpp"
#include "net/PortProber.hpp"
#include "net/WakeOnLan.hpp"
#include "net/WebSocketConnector.hpp"

#include <csignal>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <nlohmann/json.hpp>

namespace asio = boost::asio;
using json = nlohmann::json;
using namespace tvlink;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;

struct UsageError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [options] <command> [args]\n"
              << "Options:\n"
              << "  -h, --help          Show this help message and exit\n"
              << "  -c, --config PATH   JSON config file (default: $TVLINK_CONFIG)\n"
              << "  -d, --devices PATH  Device store file (default: devices.json)\n"
              << "  -q, --quiet         Suppress scan progress output\n"
              << "Commands:\n"
              << "  scan [FIRST LAST] [--timeout MS] [--parallel N] [--register]\n"
              << "  list\n"
              << "  send ID COMMAND [PAYLOAD_JSON]\n"
              << "  sequence ID CMD[,CMD...] [--delay MS]\n"
              << "  status ID\n"
              << "  wake ID\n"
              << "  version\n"
              << std::flush;
}

int parse_int(const std::string& flag, const std::string& text) {
    try {
        std::size_t used = 0;
        int v = std::stoi(text, &used);
        if (used != text.size()) throw std::invalid_argument(text);
        return v;
    } catch (const std::exception&) {
        throw UsageError(flag + " expects an integer, got '" + text + "'");
    }
}

std::vector<std::string> split_commas(const std::string& s) {
    std::vector<std::string> out;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

// Payload arguments are JSON when they parse as JSON, else taken as a plain string.
json parse_payload(const std::string& text) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded()) return json(text);
    return j;
}

Device require_device(const DeviceRegistry& store, const std::string& id) {
    auto dev = store.find(id);
    if (!dev) throw std::runtime_error(std::string(errors::D3410_UNKNOWN_DEVICE) + id);
    return *dev;
}

void print_device(const Device& d) {
    std::cout << d.id << "  " << (d.name.empty() ? "-" : d.name) << "  " << d.ip << ":" << d.port << "  "
              << brand_name(d.brand) << "/" << protocol_name(d.protocol)
              << (d.online ? "  online" : "") << (d.paired ? "  paired" : "") << "\n";
}

int report(const CommandOutcome& outcome) {
    if (outcome.delivered()) {
        std::cout << "delivered" << std::endl;
        return kExitOk;
    }
    std::cout << status_name(outcome.status) << " (" << errors::code_string(outcome.code) << "): "
              << outcome.reason << std::endl;
    return kExitFailed;
}

// Runtime wiring shared by the dispatch commands. Destruction releases every persistent connection.
struct DispatchStack {
    explicit DispatchStack(const CoreConfig& cfg)
        : connections(connector, cfg.request_timeout),
          dispatcher(registry, connections, http, cfg.request_timeout) {}

    BrandRegistry registry;
    net::CurlHttpClient http;
    net::WebSocketConnector connector;
    ConnectionManager connections;
    ProtocolDispatcher dispatcher;
};

int cmd_scan(const CoreConfig& cfg, DeviceRegistry& store, const std::vector<std::string>& args, bool quiet) {
    std::vector<std::string> positional;
    auto timeout = cfg.per_host_timeout;
    std::size_t parallel = cfg.max_in_flight;
    bool do_register = false;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];
        if (a == "--timeout" && i + 1 < args.size()) {
            timeout = std::chrono::milliseconds(parse_int(a, args[++i]));
        } else if (a == "--parallel" && i + 1 < args.size()) {
            int n = parse_int(a, args[++i]);
            if (n <= 0) throw UsageError("--parallel must be positive");
            parallel = static_cast<std::size_t>(n);
        } else if (a == "--register") {
            do_register = true;
        } else if (a.rfind("--", 0) == 0) {
            throw UsageError("unknown scan option " + a);
        } else {
            positional.push_back(a);
        }
    }

    AddressRange range;
    if (positional.empty()) {
        range = AddressRange::from_subnet(cfg.subnet, cfg.range_start, cfg.range_end);
    } else if (positional.size() == 2) {
        if (positional[0].find('.') != std::string::npos) {
            range = AddressRange(positional[0], positional[1]);
        } else {
            range = AddressRange::from_subnet(cfg.subnet, parse_int("FIRST", positional[0]), parse_int("LAST", positional[1]));
        }
    } else {
        throw UsageError("scan takes either no range or FIRST LAST");
    }

    BrandRegistry registry;
    net::AsioPortProber prober;
    net::CurlHttpClient http;
    DiscoveryOptions options;
    options.max_in_flight = parallel;
    options.fingerprint_timeout = cfg.fingerprint_timeout;
    DiscoveryEngine engine(registry, prober, http, options);

    CancellationToken token;
    asio::io_context sig_ioc;
    asio::signal_set signals(sig_ioc, SIGINT);
    signals.async_wait([&token](const boost::system::error_code& ec, int) {
        if (ec) return;
        std::cerr << "\nDiscoveryEngine: interrupt received, finishing in-flight probes" << std::endl;
        token.cancel();
    });
    std::thread sig_thread([&sig_ioc]() { sig_ioc.run(); });

    if (!quiet) {
        std::cout << "Scanning " << range.first() << " - " << range.last() << " (" << range.size()
                  << " hosts, " << parallel << " in flight)" << std::endl;
    }

    std::vector<Device> found;
    DiscoverySummary summary;
    try {
        auto stream = engine.discover(range, timeout, token);
        while (auto ev = stream.next()) {
            if (!quiet) {
                std::cout << "[" << ev->progress.completed << "/" << ev->progress.total << "] "
                          << ev->progress.current_address << std::endl;
            }
            if (ev->device) {
                std::cout << "found: ";
                print_device(*ev->device);
                found.push_back(*ev->device);
            }
        }
        summary = stream.summary();
    } catch (...) {
        sig_ioc.stop();
        sig_thread.join();
        throw;
    }
    sig_ioc.stop();
    sig_thread.join();

    std::cout << "scanned " << summary.scanned << "/" << summary.total_candidates << ", found " << summary.found
              << (summary.cancelled ? " (cancelled)" : "") << std::endl;

    if (do_register && !found.empty()) {
        std::size_t added = 0;
        for (const auto& d : found) {
            if (store.find_by_ip(d.ip)) continue;
            if (store.upsert(d)) ++added;
        }
        store.save(cfg.devices_path);
        std::cout << "registered " << added << " new device(s) in " << cfg.devices_path << std::endl;
    }
    return kExitOk;
}

int cmd_send(const CoreConfig& cfg, DeviceRegistry& store, const std::vector<std::string>& args) {
    if (args.size() < 2 || args.size() > 3) throw UsageError("send ID COMMAND [PAYLOAD_JSON]");
    Device dev = require_device(store, args[0]);

    CommandRequest req;
    req.command = args[1];
    if (args.size() == 3) req.payload = parse_payload(args[2]);

    DispatchStack stack(cfg);
    const CommandOutcome outcome = stack.dispatcher.send(dev, req);
    if (outcome.delivered()) {
        dev.last_command_ms = now_ms();
        if (store.upsert(dev)) store.save(cfg.devices_path);
    }
    return report(outcome);
}

int cmd_sequence(const CoreConfig& cfg, DeviceRegistry& store, const std::vector<std::string>& args) {
    std::vector<std::string> positional;
    auto delay = cfg.inter_command_delay;
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--delay" && i + 1 < args.size()) {
            delay = std::chrono::milliseconds(parse_int(args[i], args[i + 1]));
            ++i;
        } else {
            positional.push_back(args[i]);
        }
    }
    if (positional.size() != 2) throw UsageError("sequence ID CMD[,CMD...] [--delay MS]");

    Device dev = require_device(store, positional[0]);
    std::vector<CommandRequest> requests;
    for (const auto& name : split_commas(positional[1])) requests.push_back(CommandRequest{name, nullptr});
    if (requests.empty()) throw UsageError("sequence needs at least one command");

    DispatchStack stack(cfg);
    const SequenceOutcome out = stack.dispatcher.send_sequence(dev, requests, delay);
    std::cout << out.attempted << "/" << requests.size() << " sent" << std::endl;
    if (out.attempted > 0) {
        dev.last_command_ms = now_ms();
        if (store.upsert(dev)) store.save(cfg.devices_path);
    }
    return report(out.outcome);
}

int cmd_status(const CoreConfig& cfg, DeviceRegistry& store, const std::vector<std::string>& args) {
    if (args.size() != 1) throw UsageError("status ID");
    const Device dev = require_device(store, args[0]);
    DispatchStack stack(cfg);
    auto status = stack.dispatcher.query_status(dev);
    if (!status) {
        std::cout << "status unavailable for " << dev.id << std::endl;
        return kExitFailed;
    }
    std::cout << status->dump(2) << std::endl;
    return kExitOk;
}

int cmd_wake(DeviceRegistry& store, const std::vector<std::string>& args) {
    if (args.size() != 1) throw UsageError("wake ID");
    const Device dev = require_device(store, args[0]);
    if (!net::WakeOnLan::is_valid_mac(dev.mac_address)) {
        std::cout << errors::D3410_INVALID_MAC << " for " << dev.id << ": '" << dev.mac_address << "'" << std::endl;
        return kExitFailed;
    }
    net::WakeOnLan wol;
    if (!wol.wake(dev.mac_address, 3)) return kExitFailed;
    std::cout << "magic packet sent to " << dev.mac_address << std::endl;
    return kExitOk;
}

int run(int argc, char** argv) {
    std::string config_cli;
    std::string devices_cli;
    bool quiet = false;
    std::string command;
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        if (!command.empty()) {
            args.push_back(a);
            continue;
        }
        if (a == "-h" || a == "--help") {
            print_usage(argv[0]);
            return kExitOk;
        }
        if ((a == "--config" || a == "-c") && i + 1 < argc) {
            config_cli = argv[++i];
        } else if (a.rfind("--config=", 0) == 0) {
            config_cli = a.substr(9);
        } else if ((a == "--devices" || a == "-d") && i + 1 < argc) {
            devices_cli = argv[++i];
        } else if (a.rfind("--devices=", 0) == 0) {
            devices_cli = a.substr(10);
        } else if (a == "--quiet" || a == "-q") {
            quiet = true;
        } else if (a.rfind("-", 0) == 0) {
            throw UsageError("unknown option " + a);
        } else {
            command = a;
        }
    }

    if (command.empty()) {
        print_usage(argv[0]);
        return kExitUsage;
    }
    if (command == "version") {
        std::cout << "tvlink " << buildinfo::version() << " (" << buildinfo::git_commit() << ", built "
                  << buildinfo::build_time_utc_approx() << ")" << std::endl;
        return kExitOk;
    }

    CoreConfig cfg = CoreConfig::load(CoreConfig::resolve_config_path(config_cli));
    if (!devices_cli.empty()) cfg.devices_path = devices_cli;

    DeviceRegistry store;
    store.load(cfg.devices_path);

    if (command == "scan") return cmd_scan(cfg, store, args, quiet);
    if (command == "list") {
        store.for_each_device([](const Device& d) { print_device(d); });
        return kExitOk;
    }
    if (command == "send") return cmd_send(cfg, store, args);
    if (command == "sequence") return cmd_sequence(cfg, store, args);
    if (command == "status") return cmd_status(cfg, store, args);
    if (command == "wake") return cmd_wake(store, args);

    throw UsageError("unknown command " + command);
}

} // namespace

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const UsageError& e) {
        std::cerr << "tvlink: " << e.what() << "\n";
        print_usage(argv[0]);
        return kExitUsage;
    } catch (const std::exception& e) {
        std::cerr << "tvlink: " << e.what() << std::endl;
        return kExitUsage;
    }
}
