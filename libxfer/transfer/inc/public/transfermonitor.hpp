#ifndef XFER_TRANSFER_TRANSFERMONITOR_HPP_
#define XFER_TRANSFER_TRANSFERMONITOR_HPP_

#include <memory>

namespace xfer::transfer
{
// Forward declarations
class AsyncHandle;

// Hands out the unit of work currently outstanding (e.g. one part of a multipart upload)
class TransferMonitor
{
public:
    virtual ~TransferMonitor() = default;

    [[nodiscard]] virtual bool                         is_done() const = 0;
    [[nodiscard]] virtual std::shared_ptr<AsyncHandle> current_handle() = 0;
};
}  // namespace xfer::transfer

#endif  // XFER_TRANSFER_TRANSFERMONITOR_HPP_
