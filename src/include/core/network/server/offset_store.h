#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace ferry::core {

// Last offset flushed to disk per sanitized file name, kept for the lifetime of the server.
// Two sessions uploading the same name concurrently race here: the last Set wins.
class OffsetStore {
public:
    OffsetStore() = default;
    OffsetStore(const OffsetStore&) = delete;
    OffsetStore& operator=(const OffsetStore&) = delete;

    std::optional<std::uint64_t> Get(const std::string& file_name) const;
    void Set(const std::string& file_name, std::uint64_t offset);
    std::size_t Size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::uint64_t> offsets_;
};

} // namespace ferry::core
