#ifndef XFER_TRANSFER_ASYNCHANDLE_HPP_
#define XFER_TRANSFER_ASYNCHANDLE_HPP_

#include <any>

namespace xfer::transfer
{
// One outstanding unit of asynchronous work
class AsyncHandle
{
public:
    virtual ~AsyncHandle() = default;

    // Blocks until the unit finishes and returns its result.
    // Throws errors::ExecutionError if the unit failed, errors::CancellationError if it was
    // cancelled and errors::InterruptedError if the wait was interrupted.
    virtual std::any await() = 0;
};
}  // namespace xfer::transfer

#endif  // XFER_TRANSFER_ASYNCHANDLE_HPP_
