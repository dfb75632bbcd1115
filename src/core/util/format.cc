#include <core/util/format.h>
#include <spdlog/fmt/fmt.h>

namespace ferry::core {

std::string FormatBytes(std::uint64_t bytes) {
    constexpr std::uint64_t kUnit = 1024;
    if (bytes < kUnit) {
        return fmt::format("{} B", bytes);
    }
    std::uint64_t div = kUnit;
    int exp = 0;
    for (std::uint64_t n = bytes / kUnit; n >= kUnit; n /= kUnit) {
        div *= kUnit;
        ++exp;
    }
    return fmt::format("{:.2f} {}B", static_cast<double>(bytes) / static_cast<double>(div),
                       "KMGTPE"[exp]);
}

std::string FormatSpeed(double bytes_per_second) {
    if (bytes_per_second < 0.0) {
        bytes_per_second = 0.0;
    }
    return FormatBytes(static_cast<std::uint64_t>(bytes_per_second)) + "/s";
}

} // namespace ferry::core
