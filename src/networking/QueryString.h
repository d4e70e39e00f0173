#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace sessionrelay::networking {

struct RequestTarget {
    std::string path;
    std::unordered_map<std::string, std::string> params;  // first occurrence wins

    std::optional<std::string> param(const std::string& key) const;
};

// %XX and '+' decoding; malformed escapes are kept verbatim.
std::string percent_decode(std::string_view in);

RequestTarget parse_target(std::string_view target);

} // namespace sessionrelay::networking
