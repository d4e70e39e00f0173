#include "config/Config.h"

#include <boost/program_options.hpp>

#include <chrono>
#include <stdexcept>

namespace sessionrelay::config {

namespace po = boost::program_options;

static long require_positive(const po::variables_map& vm, const char* name, long max) {
    const long v = vm[name].as<long>();
    if (v < 1 || v > max) {
        throw std::invalid_argument(std::string("--") + name + " must be between 1 and " + std::to_string(max));
    }
    return v;
}

std::optional<Config> parse_command_line(int argc, const char* const argv[], std::ostream& out) {
    Config defaults;

    po::options_description desc("SessionRelay options");
    desc.add_options()
        ("help,h", "print this help")
        ("address", po::value<std::string>()->default_value(defaults.address), "listen address")
        ("port", po::value<long>()->default_value(defaults.port), "listen port")
        ("threads", po::value<long>()->default_value(defaults.threads), "io threads")
        ("max-events", po::value<long>()->default_value(static_cast<long>(defaults.relay.max_events_per_session)),
            "events kept per session for replay")
        ("session-timeout", po::value<long>()->default_value(defaults.relay.session_timeout.count()),
            "seconds of inactivity before a session is evicted")
        ("heartbeat", po::value<long>()->default_value(defaults.relay.heartbeat_interval.count()),
            "seconds between heartbeat frames")
        ("sweep-interval", po::value<long>()->default_value(defaults.relay.sweep_interval.count()),
            "minimum seconds between retention sweeps")
        ("max-queued-frames", po::value<long>()->default_value(static_cast<long>(defaults.relay.max_queued_frames)),
            "unsent frames a slow stream may hold before it is dropped");

    po::variables_map vm;
    po::store(po::parse_command_line(argc, argv, desc), vm);
    po::notify(vm);

    if (vm.count("help")) {
        out << desc << "\n";
        return std::nullopt;
    }

    constexpr long kDay = 24 * 3600;

    Config cfg;
    cfg.address = vm["address"].as<std::string>();
    if (cfg.address.empty()) throw std::invalid_argument("--address must not be empty");

    cfg.port = static_cast<unsigned short>(require_positive(vm, "port", 65535));
    cfg.threads = static_cast<unsigned>(require_positive(vm, "threads", 256));
    cfg.relay.max_events_per_session = static_cast<std::size_t>(require_positive(vm, "max-events", 1000000));
    cfg.relay.session_timeout = std::chrono::seconds(require_positive(vm, "session-timeout", 30 * kDay));
    cfg.relay.heartbeat_interval = std::chrono::seconds(require_positive(vm, "heartbeat", kDay));
    cfg.relay.sweep_interval = std::chrono::seconds(require_positive(vm, "sweep-interval", kDay));
    cfg.relay.max_queued_frames = static_cast<std::size_t>(require_positive(vm, "max-queued-frames", 1000000));
    return cfg;
}

} // namespace sessionrelay::config
