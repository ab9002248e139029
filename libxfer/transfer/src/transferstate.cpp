#include "transferstate.hpp"

namespace xfer::transfer
{
const char *to_string(TransferState state)
{
    switch (state)
    {
        case TransferState::WAITING: return "WAITING";
        case TransferState::IN_PROGRESS: return "IN_PROGRESS";
        case TransferState::PARTIALLY_COMPLETED: return "PARTIALLY_COMPLETED";
        case TransferState::COMPLETED: return "COMPLETED";
        case TransferState::FAILED: return "FAILED";
        case TransferState::CANCELED: return "CANCELED";
        default: return "INVALID_STATE";
    }
}
}  // namespace xfer::transfer
