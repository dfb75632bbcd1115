#pragma once

#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>

namespace ferry::cli {

// Single-line upload progress, redrawn in place with '\r'
class ProgressDisplay {
public:
    explicit ProgressDisplay(std::string file_name, std::ostream& out = std::cout);

    void UpdateProgress(std::uint64_t transferred, std::uint64_t total);
    void ClearProgress();

private:
    void printProgress(std::uint64_t transferred, std::uint64_t total, double speed);

    std::string file_name_;
    std::ostream& out_;
    std::chrono::steady_clock::time_point start_time_;
    std::uint64_t first_transferred_;
    bool started_;
};

} // namespace ferry::cli
