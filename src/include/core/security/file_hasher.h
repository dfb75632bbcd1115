#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>

namespace ferry::core {

// SHA-256 digests rendered as lowercase hex, shared by sender and receiver.
class FileHasher {
public:
    static constexpr std::size_t kChecksumLength = 64;

    static std::string CalculateFileChecksum(const std::filesystem::path& file_path);
    static std::string CalculateDataChecksum(std::span<const std::uint8_t> data);
    static std::string CalculateDataChecksum(std::string_view data);
};

} // namespace ferry::core
