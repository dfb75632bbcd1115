#include <core/security/file_hasher.h>
#include <fstream>
#include <iomanip>
#include <memory>
#include <openssl/evp.h>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace ferry::core {

namespace {

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

DigestContext newSha256Context() {
    DigestContext mdctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!mdctx || EVP_DigestInit_ex(mdctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Failed to initialize SHA-256 context");
    }
    return mdctx;
}

void update(EVP_MD_CTX* mdctx, const void* data, std::size_t size) {
    if (EVP_DigestUpdate(mdctx, data, size) != 1) {
        throw std::runtime_error("SHA-256 update failed");
    }
}

std::string finalizeHex(EVP_MD_CTX* mdctx) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(mdctx, hash, &hash_len) != 1) {
        throw std::runtime_error("SHA-256 finalization failed");
    }

    // Convert hash to hex string
    std::stringstream ss;
    for (unsigned int i = 0; i < hash_len; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}

} // namespace

std::string FileHasher::CalculateFileChecksum(const std::filesystem::path& file_path) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open " + file_path.string()
                                 + " for checksum calculation");
    }

    auto mdctx = newSha256Context();

    constexpr std::size_t buffer_size = 64 * 1024;
    std::vector<char> buffer(buffer_size);

    while (file) {
        file.read(buffer.data(), buffer_size);
        std::size_t bytes_read = static_cast<std::size_t>(file.gcount());
        if (bytes_read > 0) {
            update(mdctx.get(), buffer.data(), bytes_read);
        }
    }
    if (file.bad()) {
        throw std::runtime_error("Failed to read " + file_path.string()
                                 + " during checksum calculation");
    }

    return finalizeHex(mdctx.get());
}

std::string FileHasher::CalculateDataChecksum(std::span<const std::uint8_t> data) {
    auto mdctx = newSha256Context();
    update(mdctx.get(), data.data(), data.size());
    return finalizeHex(mdctx.get());
}

std::string FileHasher::CalculateDataChecksum(std::string_view data) {
    auto mdctx = newSha256Context();
    update(mdctx.get(), data.data(), data.size());
    return finalizeHex(mdctx.get());
}

} // namespace ferry::core
