#pragma once

#include <core/transfer/progress_channel.h>
#include <iostream>
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace peerdrop::cli {

// Draws transfer status as one updating terminal line, or one JSON object per line
class ProgressDisplay {
public:
    explicit ProgressDisplay(bool json_output = false,
                             std::ostream& out = std::cout,
                             std::ostream& err = std::cerr);

    void Update(const core::ProgressChannel::Value& status);

    // Ends the progress line so that later output starts on a fresh line
    void Finish();

    void PrintInfo(const std::string& message);
    void PrintError(const std::string& message);

    // JSON mode only, printed as is
    void PrintJson(const nlohmann::json& object);

    bool json_output() const { return json_output_; }

private:
    void printLine(const core::TransferStatus& status);

    bool json_output_;
    std::ostream& out_;
    std::ostream& err_;
    bool line_open_{false};
};

} // namespace peerdrop::cli
