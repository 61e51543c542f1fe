#include <algorithm>
#include <cmath>
#include <core/model/transfer_status.h>
#include <utility>

namespace peerdrop::core {

std::uint8_t ProgressPercentage(std::uint64_t bytes_transferred,
                                std::uint64_t total_bytes,
                                TransferPhase phase) {
    if (total_bytes == 0) {
        return phase == TransferPhase::kCompleted ? 100 : 0;
    }
    auto percentage = std::lround(100.0 * static_cast<double>(bytes_transferred)
                                  / static_cast<double>(total_bytes));
    return static_cast<std::uint8_t>(std::clamp(percentage, 0L, 100L));
}

TransferStatus TransferStatus::Connecting() {
    return TransferStatus{};
}

TransferStatus TransferStatus::Transferring(std::string file_name,
                                            std::uint64_t bytes_transferred,
                                            std::uint64_t total_bytes) {
    TransferStatus status;
    status.bytes_transferred = bytes_transferred;
    status.total_bytes = total_bytes;
    status.phase = TransferPhase::kTransferring;
    status.percentage = ProgressPercentage(bytes_transferred, total_bytes, status.phase);
    status.file_name = std::move(file_name);
    return status;
}

TransferStatus TransferStatus::Completed(std::string file_name,
                                         std::uint64_t bytes_transferred,
                                         std::uint64_t total_bytes,
                                         std::shared_ptr<const ReceivedFile> payload) {
    TransferStatus status;
    status.bytes_transferred = bytes_transferred;
    status.total_bytes = total_bytes;
    status.phase = TransferPhase::kCompleted;
    status.percentage = ProgressPercentage(bytes_transferred, total_bytes, status.phase);
    status.file_name = std::move(file_name);
    status.payload = std::move(payload);
    return status;
}

TransferStatus TransferStatus::Errored(std::string file_name,
                                       std::uint64_t bytes_transferred,
                                       std::uint64_t total_bytes,
                                       TransferError error,
                                       std::string error_detail) {
    TransferStatus status;
    status.bytes_transferred = bytes_transferred;
    status.total_bytes = total_bytes;
    status.phase = TransferPhase::kErrored;
    status.percentage = ProgressPercentage(bytes_transferred, total_bytes, status.phase);
    status.file_name = std::move(file_name);
    status.error = error;
    status.error_detail = std::move(error_detail);
    return status;
}

void to_json(nlohmann::json& j, const TransferStatus& status) {
    j = nlohmann::json{
        {"phase", status.phase},
        {"file_name", status.file_name},
        {"bytes_transferred", status.bytes_transferred},
        {"total_bytes", status.total_bytes},
        {"percentage", status.percentage},
    };
    if (status.error) {
        j["error"] = *status.error;
    }
    if (status.error_detail) {
        j["error_detail"] = *status.error_detail;
    }
}

} // namespace peerdrop::core
