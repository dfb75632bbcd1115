#include <core/network/server/offset_store.h>

namespace ferry::core {

std::optional<std::uint64_t> OffsetStore::Get(const std::string& file_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto it = offsets_.find(file_name); it != offsets_.end()) {
        return it->second;
    }
    return std::nullopt;
}

void OffsetStore::Set(const std::string& file_name, std::uint64_t offset) {
    std::lock_guard<std::mutex> lock(mutex_);
    offsets_.insert_or_assign(file_name, offset);
}

std::size_t OffsetStore::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return offsets_.size();
}

} // namespace ferry::core
