#ifndef XFER_TRANSFER_TRANSFERSTATE_HPP_
#define XFER_TRANSFER_TRANSFERSTATE_HPP_

#include <ostream>

namespace xfer::transfer
{
enum class TransferState
{
    WAITING,
    IN_PROGRESS,
    PARTIALLY_COMPLETED,
    COMPLETED,
    FAILED,
    CANCELED
};

// Terminal states have no outgoing transitions
constexpr bool is_terminal(TransferState state)
{
    return state == TransferState::COMPLETED || state == TransferState::FAILED ||
           state == TransferState::CANCELED;
}

const char *to_string(TransferState state);

inline std::ostream &operator<<(std::ostream &os, TransferState state)
{
    return os << to_string(state);
}
}  // namespace xfer::transfer

#endif  // XFER_TRANSFER_TRANSFERSTATE_HPP_
