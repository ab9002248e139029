#include "promisehandle.hpp"

#include <utility>

#include "asyncerrors.hpp"

namespace xfer::transfer
{
PromiseHandle::PromiseHandle()
    : status_ {Status::PENDING}
    , interrupt_generation_ {0}
{
}

bool PromiseHandle::set_value(std::any value)
{
    return settle(Status::SUCCEEDED, std::move(value), nullptr);
}

bool PromiseHandle::set_error(std::exception_ptr error)
{
    return settle(Status::FAILED, {}, std::move(error));
}

bool PromiseHandle::cancel()
{
    return settle(Status::CANCELLED, {}, nullptr);
}

void PromiseHandle::interrupt_waiters()
{
    {
        std::lock_guard lock {mutex_};
        ++interrupt_generation_;
    }
    cv_.notify_all();
}

bool PromiseHandle::is_ready() const
{
    std::lock_guard lock {mutex_};
    return status_ != Status::PENDING;
}

std::any PromiseHandle::await()
{
    std::unique_lock lock {mutex_};
    auto             generation = interrupt_generation_;
    cv_.wait(lock,
        [&] { return status_ != Status::PENDING || interrupt_generation_ != generation; });

    switch (status_)
    {
        case Status::SUCCEEDED: return value_;
        case Status::FAILED: throw errors::ExecutionError {error_};
        case Status::CANCELLED: throw errors::CancellationError {};
        case Status::PENDING:
        default: throw errors::InterruptedError {};
    }
}

bool PromiseHandle::settle(Status status, std::any value, std::exception_ptr error)
{
    {
        std::lock_guard lock {mutex_};
        if (status_ != Status::PENDING)
        {
            return false;
        }
        status_ = status;
        value_  = std::move(value);
        error_  = std::move(error);
    }
    cv_.notify_all();
    return true;
}
}  // namespace xfer::transfer
