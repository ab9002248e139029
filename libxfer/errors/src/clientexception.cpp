#include "clientexception.hpp"

#include <utility>

namespace xfer::errors
{
ClientException::ClientException(const std::string &message, std::exception_ptr cause)
    : std::runtime_error {message}
    , cause_ {std::move(cause)}
{
}

std::exception_ptr ClientException::cause() const noexcept
{
    return cause_;
}
}  // namespace xfer::errors
