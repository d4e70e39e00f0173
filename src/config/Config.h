#pragma once

#include "relay/RelayOptions.hpp"

#include <optional>
#include <ostream>
#include <string>

namespace sessionrelay::config {

struct Config {
    std::string address = "0.0.0.0";
    unsigned short port = 9002;
    unsigned threads = 1;
    relay::RelayOptions relay;
};

// Throws on unknown options or out-of-range values. Returns nullopt after
// printing usage to `out` when --help was given.
std::optional<Config> parse_command_line(int argc, const char* const argv[], std::ostream& out);

} // namespace sessionrelay::config
