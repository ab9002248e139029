#ifndef XFER_TRANSFER_PROMISEHANDLE_HPP_
#define XFER_TRANSFER_PROMISEHANDLE_HPP_

#include <any>
#include <condition_variable>
#include <exception>
#include <mutex>

#include "asynchandle.hpp"
#include "xferapidefs.h"

namespace xfer::transfer
{
// Only the first of set_value(), set_error() and cancel() has an effect
class XFER_API PromiseHandle : public AsyncHandle
{
public:
    PromiseHandle();
    PromiseHandle(const PromiseHandle &) = delete;
    PromiseHandle &operator=(const PromiseHandle &) = delete;

    bool set_value(std::any value);

    // await() will throw an errors::ExecutionError with the given cause
    bool set_error(std::exception_ptr error);

    // await() will throw errors::CancellationError
    bool cancel();

    // Threads blocked in await() right now wake up with errors::InterruptedError
    void interrupt_waiters();

    [[nodiscard]] bool is_ready() const;

public:  // from AsyncHandle
    std::any await() override;

private:
    enum class Status
    {
        PENDING,
        SUCCEEDED,
        FAILED,
        CANCELLED
    };

    bool settle(Status status, std::any value, std::exception_ptr error);

    Status                  status_;
    std::any                value_;
    std::exception_ptr      error_;
    unsigned long long      interrupt_generation_;
    mutable std::mutex      mutex_;
    std::condition_variable cv_;
};
}  // namespace xfer::transfer

#endif  // XFER_TRANSFER_PROMISEHANDLE_HPP_
