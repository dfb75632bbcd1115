#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace ferry::core {

struct Target {
    std::string host;
    std::uint16_t port;
};

// Accepts "host", "host:port", "[v6-addr]", "[v6-addr]:port" and a bare IPv6 literal.
// A port is only split off when the text holds a single colon or uses brackets.
// Throws std::invalid_argument for an empty host or a port outside 1..65535.
Target ParseTarget(std::string_view text, std::uint16_t default_port);

} // namespace ferry::core
