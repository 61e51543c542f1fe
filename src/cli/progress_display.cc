#include <cli/progress_display.h>
#include <core/model/transfer_status.h>
#include <iomanip>

using json = nlohmann::json;

namespace peerdrop::cli {

namespace {

constexpr int kBarWidth = 30;

} // namespace

ProgressDisplay::ProgressDisplay(bool json_output, std::ostream& out, std::ostream& err)
    : json_output_(json_output)
    , out_(out)
    , err_(err) {}

void ProgressDisplay::Update(const core::ProgressChannel::Value& status) {
    if (!status) {
        return;
    }
    if (json_output_) {
        PrintJson(json(*status));
        return;
    }

    switch (status->phase) {
    case core::TransferPhase::kConnecting:
        PrintInfo("Waiting for the peer...");
        break;
    case core::TransferPhase::kTransferring:
        printLine(*status);
        break;
    case core::TransferPhase::kCompleted:
        printLine(*status);
        Finish();
        break;
    case core::TransferPhase::kErrored:
        Finish();
        PrintError(std::string(core::TransferErrorToString(
                       status->error.value_or(core::TransferError::kChannelError)))
                   + ": " + status->error_detail.value_or("unknown"));
        break;
    }
}

void ProgressDisplay::Finish() {
    if (line_open_) {
        out_ << std::endl;
        line_open_ = false;
    }
}

void ProgressDisplay::PrintInfo(const std::string& message) {
    if (json_output_) {
        return;
    }
    Finish();
    out_ << "\033[32m[INFO] " << message << "\033[0m" << std::endl;
}

void ProgressDisplay::PrintError(const std::string& message) {
    Finish();
    err_ << "\033[31m[ERROR] " << message << "\033[0m" << std::endl;
}

void ProgressDisplay::PrintJson(const json& object) {
    if (json_output_) {
        out_ << object.dump() << std::endl;
    }
}

void ProgressDisplay::printLine(const core::TransferStatus& status) {
    int filled = status.percentage * kBarWidth / 100;
    out_ << "\r" << status.file_name << " [" << std::string(filled, '#')
         << std::string(kBarWidth - filled, '.') << "] " << std::setw(3)
         << static_cast<int>(status.percentage) << "% " << status.bytes_transferred << "/"
         << status.total_bytes << " bytes" << std::flush;
    line_open_ = true;
}

} // namespace peerdrop::cli
