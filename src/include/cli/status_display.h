#pragma once

#include <core/network/server/status_reporter.h>
#include <iostream>
#include <string>

namespace ferry::cli {

// Server dashboard: a banner once, then the status block redrawn below it
class StatusDisplay {
public:
    explicit StatusDisplay(std::ostream& out = std::cout);

    void PrintBanner(std::uint16_t port, const std::string& storage_dir);
    void Render(const core::StatusSnapshot& snapshot);

    static std::string Format(const core::StatusSnapshot& snapshot);

private:
    std::ostream& out_;
    int status_line_;
};

} // namespace ferry::cli
