#ifndef XFER_TRANSFER_TRANSFERSTATECHANGELISTENER_HPP_
#define XFER_TRANSFER_TRANSFERSTATECHANGELISTENER_HPP_

#include "transferstate.hpp"

namespace xfer::transfer
{
// Forward declarations
class Transfer;

// Runs on the thread changing the state, before set_state() returns
class TransferStateChangeListener
{
public:
    virtual ~TransferStateChangeListener() = default;

    virtual void transfer_state_changed(Transfer &transfer, TransferState new_state) = 0;
};
}  // namespace xfer::transfer

#endif  // XFER_TRANSFER_TRANSFERSTATECHANGELISTENER_HPP_
