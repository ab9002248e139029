#ifndef XFER_ERRORS_ASYNCERRORS_HPP_
#define XFER_ERRORS_ASYNCERRORS_HPP_

#include <exception>
#include <stdexcept>
#include <string>

#include "xferapidefs.h"

namespace xfer::errors
{
// Raised by an async handle when the unit of work it represents failed; cause() is the failure
class XFER_API ExecutionError : public std::runtime_error
{
public:
    explicit ExecutionError(std::exception_ptr cause);

    [[nodiscard]] std::exception_ptr cause() const noexcept;

private:
    std::exception_ptr cause_;
};

// Raised when a thread blocked on an async handle was interrupted
class XFER_API InterruptedError : public std::runtime_error
{
public:
    InterruptedError();
};

// Raised when the unit of work represented by an async handle was cancelled before completing
class XFER_API CancellationError : public std::runtime_error
{
public:
    CancellationError();
};

// what() of an arbitrary exception_ptr, for diagnostics
std::string describe(const std::exception_ptr &error);
}  // namespace xfer::errors

#endif  // XFER_ERRORS_ASYNCERRORS_HPP_
