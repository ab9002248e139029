#ifndef XFER_TRANSFER_WAITPROTOCOL_HPP_
#define XFER_TRANSFER_WAITPROTOCOL_HPP_

#include <exception>

namespace xfer::errors
{
// Forward declarations
class ExecutionError;
}  // namespace xfer::errors

namespace xfer::transfer
{
// Forward declarations
class TransferMonitor;

struct AwaitStep
{
    bool               done;
    std::exception_ptr error;
};

// Waits once on the outstanding unit of work. A missing monitor or unit counts as a failure.
AwaitStep await_next_unit(TransferMonitor *monitor);

// The cause itself if it is an errors::ClientException, else a ClientException wrapping it
std::exception_ptr unwrap_execution_error(const errors::ExecutionError &error);

[[noreturn]] void rethrow_execution_error(const errors::ExecutionError &error);
}  // namespace xfer::transfer

#endif  // XFER_TRANSFER_WAITPROTOCOL_HPP_
