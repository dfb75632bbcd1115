#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace ferry::core {

enum class TransferErrc {
    kMalformedHandshake, // bad length, too few fields or unparsable size
    kInvalidOffsetAck,   // server reply is not a decimal offset
    kConnectFailure,     // resolve or dial failed
    kReadFault,          // read from socket or local file failed
    kWriteFault,         // write to socket or destination file failed
    kStorageFault,       // destination file cannot be created or opened
    kRetriesExhausted,   // every attempt of the retry loop failed
};

std::string_view ToString(TransferErrc code);

class TransferError : public std::runtime_error {
public:
    TransferError(TransferErrc code, const std::string& message);

    TransferErrc code() const noexcept { return code_; }

private:
    TransferErrc code_;
};

} // namespace ferry::core
