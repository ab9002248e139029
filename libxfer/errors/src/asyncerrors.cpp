#include "asyncerrors.hpp"

#include <utility>

namespace xfer::errors
{
ExecutionError::ExecutionError(std::exception_ptr cause)
    : std::runtime_error {"Execution failed: " + describe(cause)}
    , cause_ {std::move(cause)}
{
}

std::exception_ptr ExecutionError::cause() const noexcept
{
    return cause_;
}

InterruptedError::InterruptedError()
    : std::runtime_error {"Interrupted while waiting"}
{
}

CancellationError::CancellationError()
    : std::runtime_error {"Operation was cancelled"}
{
}

std::string describe(const std::exception_ptr &error)
{
    if (!error)
    {
        return "no error";
    }

    try
    {
        std::rethrow_exception(error);
    }
    catch (const std::exception &e)
    {
        return e.what();
    }
    catch (...)
    {
        return "unknown error";
    }
}
}  // namespace xfer::errors
