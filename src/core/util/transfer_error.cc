#include <core/util/transfer_error.h>

namespace ferry::core {

std::string_view ToString(TransferErrc code) {
    switch (code) {
    case TransferErrc::kMalformedHandshake:
        return "MalformedHandshake";
    case TransferErrc::kInvalidOffsetAck:
        return "InvalidOffsetAck";
    case TransferErrc::kConnectFailure:
        return "ConnectFailure";
    case TransferErrc::kReadFault:
        return "ReadFault";
    case TransferErrc::kWriteFault:
        return "WriteFault";
    case TransferErrc::kStorageFault:
        return "StorageFault";
    case TransferErrc::kRetriesExhausted:
        return "RetriesExhausted";
    }
    return "Unknown";
}

TransferError::TransferError(TransferErrc code, const std::string& message)
    : std::runtime_error(message)
    , code_(code) {}

} // namespace ferry::core
