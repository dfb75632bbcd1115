#include <cli/progress_display.h>
#include <core/util/format.h>
#include <iomanip>
#include <string>

namespace ferry::cli {

ProgressDisplay::ProgressDisplay(std::string file_name, std::ostream& out)
    : file_name_(std::move(file_name))
    , out_(out)
    , start_time_(std::chrono::steady_clock::now())
    , first_transferred_(0)
    , started_(false) {}

void ProgressDisplay::printProgress(std::uint64_t transferred, std::uint64_t total, double speed) {
    double percentage = total == 0 ? 100.0
                                   : static_cast<double>(transferred) * 100.0
                                         / static_cast<double>(total);
    out_ << "\rFile: " << file_name_ << " | Progress: " << std::fixed << std::setprecision(2)
         << percentage << "%"
         << " | Transferred: " << core::FormatBytes(transferred) << " / "
         << core::FormatBytes(total) << " | Speed: " << core::FormatSpeed(speed) << std::flush;
}

void ProgressDisplay::UpdateProgress(std::uint64_t transferred, std::uint64_t total) {
    // Speed only counts this attempt's bytes, the offset was already on the server
    if (!started_) {
        started_ = true;
        first_transferred_ = transferred;
        start_time_ = std::chrono::steady_clock::now();
    }
    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time_)
                         .count();
    double speed = elapsed > 0.0 ? static_cast<double>(transferred - first_transferred_) / elapsed
                                 : 0.0;
    printProgress(transferred, total, speed);
}

void ProgressDisplay::ClearProgress() {
    out_ << "\r" << std::string(120, ' ') << "\r" << std::flush;
    started_ = false;
}

} // namespace ferry::cli
