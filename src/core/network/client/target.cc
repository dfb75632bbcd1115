#include <algorithm>
#include <charconv>
#include <core/network/client/target.h>
#include <spdlog/fmt/fmt.h>
#include <stdexcept>

namespace ferry::core {

namespace {

std::uint16_t parsePort(std::string_view text, std::string_view target) {
    unsigned int port = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), port);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size() || port == 0
        || port > 65535) {
        throw std::invalid_argument(fmt::format("invalid port in {}", target));
    }
    return static_cast<std::uint16_t>(port);
}

} // namespace

Target ParseTarget(std::string_view text, std::uint16_t default_port) {
    Target target{std::string(text), default_port};

    if (!text.empty() && text.front() == '[') {
        auto close = text.find(']');
        if (close == std::string_view::npos) {
            throw std::invalid_argument(fmt::format("missing ']' in {}", text));
        }
        target.host = std::string(text.substr(1, close - 1));
        auto rest = text.substr(close + 1);
        if (!rest.empty()) {
            if (rest.front() != ':') {
                throw std::invalid_argument(fmt::format("unexpected text after ']' in {}", text));
            }
            target.port = parsePort(rest.substr(1), text);
        }
    } else if (std::count(text.begin(), text.end(), ':') == 1) {
        auto pos = text.find(':');
        target.host = std::string(text.substr(0, pos));
        target.port = parsePort(text.substr(pos + 1), text);
    }

    if (target.host.empty()) {
        throw std::invalid_argument(fmt::format("missing host in {}", text));
    }
    return target;
}

} // namespace ferry::core
