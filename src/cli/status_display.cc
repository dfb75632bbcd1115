#include <cli/status_display.h>
#include <core/util/format.h>
#include <spdlog/fmt/fmt.h>

namespace ferry::cli {

namespace {

constexpr const char* kBanner = R"(
  ______
 |  ____|
 | |__ ___ _ __ _ __ _   _
 |  __/ _ \ '__| '__| | | |
 | | |  __/ |  | |  | |_| |
 |_|  \___|_|  |_|   \__, |
                      __/ |
                     |___/
)";

constexpr const char* kSeparator = "------------------------------------------------------------";

int CountLines(const char* text) {
    int lines = 0;
    for (const char* p = text; *p != '\0'; ++p) {
        if (*p == '\n') {
            ++lines;
        }
    }
    return lines;
}

} // namespace

StatusDisplay::StatusDisplay(std::ostream& out)
    : out_(out)
    , status_line_(1) {}

void StatusDisplay::PrintBanner(std::uint16_t port, const std::string& storage_dir) {
    // Clear the screen and home the cursor
    out_ << "\033[2J\033[H" << kBanner << "\n";
    out_ << fmt::format("Listening on port {}, storing files in {}\n", port, storage_dir) << "\n";
    out_.flush();
    status_line_ = CountLines(kBanner) + 4;
}

void StatusDisplay::Render(const core::StatusSnapshot& snapshot) {
    out_ << fmt::format("\033[{};1H", status_line_) << "\033[J" << Format(snapshot) << std::flush;
}

std::string StatusDisplay::Format(const core::StatusSnapshot& snapshot) {
    std::string text = fmt::format(
        "Active Connections: {} | Total Bytes Transferred: {} | Current Speed: {}\n",
        snapshot.stats.active_connections,
        core::FormatBytes(snapshot.stats.total_bytes),
        core::FormatSpeed(snapshot.stats.AverageSpeed()));
    text += kSeparator;
    text += "\n";

    if (snapshot.active.empty() && snapshot.completed.empty()) {
        text += "No active clients.\n";
        return text;
    }

    for (const auto& record : snapshot.active) {
        text += fmt::format("Client {}: {} | File: {} | Size: {} | Received: {} | Speed: {}\n",
                            record.peer_address,
                            core::SessionStatusToString(record.status),
                            record.file_name,
                            core::FormatBytes(record.file_size),
                            core::FormatBytes(record.received_bytes),
                            core::FormatSpeed(record.speed));
    }
    for (const auto& record : snapshot.completed) {
        text += fmt::format("Client {}: {} | File: {} | Size: {} | Hash: {}\n",
                            record.peer_address,
                            core::SessionStatusToString(record.status),
                            record.file_name,
                            core::FormatBytes(record.file_size),
                            record.computed_hash);
    }
    return text;
}

} // namespace ferry::cli
