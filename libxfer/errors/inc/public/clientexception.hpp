#ifndef XFER_ERRORS_CLIENTEXCEPTION_HPP_
#define XFER_ERRORS_CLIENTEXCEPTION_HPP_

#include <exception>
#include <stdexcept>
#include <string>

#include "xferapidefs.h"

namespace xfer::errors
{
class XFER_API ClientException : public std::runtime_error
{
public:
    explicit ClientException(const std::string &message, std::exception_ptr cause = nullptr);

    [[nodiscard]] std::exception_ptr cause() const noexcept;

private:
    std::exception_ptr cause_;
};
}  // namespace xfer::errors

#endif  // XFER_ERRORS_CLIENTEXCEPTION_HPP_
