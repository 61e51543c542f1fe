#include <core/model/transfer_error.h>
#include <string>

namespace peerdrop::core {

namespace {

class TransferErrorCategoryImpl : public std::error_category {
public:
    const char* name() const noexcept override { return "peerdrop.transfer"; }

    std::string message(int value) const override {
        return std::string(TransferErrorToString(static_cast<TransferError>(value)));
    }
};

} // namespace

std::string_view TransferErrorToString(TransferError error) {
    switch (error) {
    case TransferError::kChannelNotReady:
        return "channel is not open";
    case TransferError::kChunkIndexOutOfRange:
        return "chunk index out of range";
    case TransferError::kChunkSizeMismatch:
        return "chunk size does not match its slot";
    case TransferError::kIncompleteTransfer:
        return "transfer completed with missing chunks";
    case TransferError::kChannelError:
        return "channel error";
    case TransferError::kCancelled:
        return "transfer cancelled";
    case TransferError::kTimedOut:
        return "transfer stalled";
    case TransferError::kFileUnreadable:
        return "file could not be read";
    case TransferError::kFileTooLarge:
        return "file is too large";
    }
    return "unknown transfer error";
}

const std::error_category& TransferErrorCategory() noexcept {
    static const TransferErrorCategoryImpl category;
    return category;
}

std::error_code make_error_code(TransferError error) noexcept {
    return {static_cast<int>(error), TransferErrorCategory()};
}

} // namespace peerdrop::core
