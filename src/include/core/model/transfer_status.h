#pragma once

#include "received_file.h"
#include "transfer_error.h"
#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace peerdrop::core {

enum class TransferPhase {
    kConnecting,   // Channel is being established, counters are 0
    kTransferring, // Metadata seen, chunks flowing
    kCompleted,    // All bytes delivered (receiver side carries the payload)
    kErrored,      // Transfer abandoned, see error and error_detail
};

NLOHMANN_JSON_SERIALIZE_ENUM(TransferPhase,
                             {
                                 {TransferPhase::kConnecting, "Connecting"},
                                 {TransferPhase::kTransferring, "Transferring"},
                                 {TransferPhase::kCompleted, "Completed"},
                                 {TransferPhase::kErrored, "Errored"},
                             });

std::uint8_t ProgressPercentage(std::uint64_t bytes_transferred,
                                std::uint64_t total_bytes,
                                TransferPhase phase);

struct TransferStatus {
    std::uint64_t bytes_transferred{0};
    std::uint64_t total_bytes{0};
    std::uint8_t percentage{0};
    std::string file_name;
    TransferPhase phase{TransferPhase::kConnecting};
    std::optional<TransferError> error;
    std::optional<std::string> error_detail;
    std::shared_ptr<const ReceivedFile> payload; // Only set on a receiver's Completed status

    static TransferStatus Connecting();
    static TransferStatus Transferring(std::string file_name,
                                       std::uint64_t bytes_transferred,
                                       std::uint64_t total_bytes);
    static TransferStatus Completed(std::string file_name,
                                    std::uint64_t bytes_transferred,
                                    std::uint64_t total_bytes,
                                    std::shared_ptr<const ReceivedFile> payload = nullptr);
    static TransferStatus Errored(std::string file_name,
                                  std::uint64_t bytes_transferred,
                                  std::uint64_t total_bytes,
                                  TransferError error,
                                  std::string error_detail);
};

// The payload is never serialized
void to_json(nlohmann::json& j, const TransferStatus& status);

} // namespace peerdrop::core
