#include <algorithm>
#include <charconv>
#include <core/protocol/handshake.h>
#include <core/util/transfer_error.h>
#include <spdlog/fmt/fmt.h>

namespace ferry::core::handshake {

namespace {

constexpr std::string_view kWhitespace = " \t\r\n\v\f";

std::vector<std::string_view> splitFields(std::string_view info) {
    std::vector<std::string_view> fields;
    std::size_t start = 0;
    while (true) {
        auto pos = info.find(transfer::kFieldDelimiter, start);
        if (pos == std::string_view::npos) {
            fields.push_back(info.substr(start));
            break;
        }
        fields.push_back(info.substr(start, pos - start));
        start = pos + 1;
    }
    return fields;
}

bool parseUnsigned(std::string_view text, std::uint64_t& value) {
    if (text.empty()) {
        return false;
    }
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    return ec == std::errc{} && ptr == text.data() + text.size();
}

} // namespace

void ValidateFileName(std::string_view file_name) {
    if (file_name.empty()) {
        throw TransferError(TransferErrc::kMalformedHandshake, "File name is empty");
    }
    if (file_name.find(transfer::kFieldDelimiter) != std::string_view::npos) {
        throw TransferError(TransferErrc::kMalformedHandshake,
                            fmt::format("File name {} contains the field delimiter '{}'",
                                        file_name,
                                        transfer::kFieldDelimiter));
    }
}

std::string EncodeRequest(const TransferRequest& request) {
    ValidateFileName(request.file_name);
    return fmt::format("{}{}{}{}{}{}{}",
                       request.file_name,
                       transfer::kFieldDelimiter,
                       request.file_size,
                       transfer::kFieldDelimiter,
                       request.source_hash,
                       transfer::kFieldDelimiter,
                       request.resume ? "true" : "false");
}

std::vector<std::uint8_t> FrameRequest(const TransferRequest& request) {
    std::string info = EncodeRequest(request);
    auto length = static_cast<std::uint32_t>(info.size());

    std::vector<std::uint8_t> frame;
    frame.reserve(transfer::kHandshakeLengthPrefixSize + info.size());
    frame.push_back(static_cast<std::uint8_t>(length >> 24));
    frame.push_back(static_cast<std::uint8_t>(length >> 16));
    frame.push_back(static_cast<std::uint8_t>(length >> 8));
    frame.push_back(static_cast<std::uint8_t>(length));
    frame.insert(frame.end(), info.begin(), info.end());
    return frame;
}

std::uint32_t DecodeLength(const LengthPrefix& prefix) {
    std::uint32_t length = (static_cast<std::uint32_t>(prefix[0]) << 24)
                           | (static_cast<std::uint32_t>(prefix[1]) << 16)
                           | (static_cast<std::uint32_t>(prefix[2]) << 8)
                           | static_cast<std::uint32_t>(prefix[3]);
    if (length == 0 || length > transfer::kMaxHandshakeLength) {
        throw TransferError(TransferErrc::kMalformedHandshake,
                            fmt::format("Invalid handshake length {}", length));
    }
    return length;
}

TransferRequest DecodeRequest(std::string_view info) {
    auto fields = splitFields(info);
    if (fields.size() < 4) {
        throw TransferError(TransferErrc::kMalformedHandshake,
                            fmt::format("Incomplete file info: {} fields", fields.size()));
    }

    TransferRequest request;
    if (!parseUnsigned(fields[1], request.file_size)) {
        throw TransferError(TransferErrc::kMalformedHandshake,
                            fmt::format("Invalid file size \"{}\"", fields[1]));
    }

    request.file_name = SanitizeFileName(fields[0]);
    if (request.file_name.empty() || request.file_name == ".") {
        throw TransferError(TransferErrc::kMalformedHandshake,
                            fmt::format("Unusable file name \"{}\"", fields[0]));
    }
    request.source_hash = std::string(fields[2]);
    request.resume = fields[3] == "true";
    return request;
}

std::string SanitizeFileName(std::string_view file_name) {
    auto is_separator = [](char c) { return c == '/' || c == '\\'; };

    // Trailing separators do not start a new component
    while (!file_name.empty() && is_separator(file_name.back())) {
        file_name.remove_suffix(1);
    }
    auto last = std::find_if(file_name.rbegin(), file_name.rend(), is_separator);
    std::string base(last.base(), file_name.end());

    std::erase(base, '\0');

    std::size_t pos;
    while ((pos = base.find("..")) != std::string::npos) {
        base.erase(pos, 2);
    }
    return base;
}

std::string EncodeOffset(std::uint64_t offset) {
    return std::to_string(offset);
}

std::uint64_t DecodeOffset(std::string_view reply) {
    auto begin = reply.find_first_not_of(kWhitespace);
    if (begin == std::string_view::npos) {
        throw TransferError(TransferErrc::kInvalidOffsetAck, "Empty resume offset reply");
    }
    auto end = reply.find_last_not_of(kWhitespace);
    auto trimmed = reply.substr(begin, end - begin + 1);

    std::uint64_t offset = 0;
    if (!parseUnsigned(trimmed, offset)) {
        throw TransferError(TransferErrc::kInvalidOffsetAck,
                            fmt::format("Invalid resume offset \"{}\"", trimmed));
    }
    return offset;
}

} // namespace ferry::core::handshake
