#ifndef XFER_ERRORS_SERVICEEXCEPTION_HPP_
#define XFER_ERRORS_SERVICEEXCEPTION_HPP_

#include <string>

#include "clientexception.hpp"
#include "xferapidefs.h"

namespace xfer::errors
{
// Error response of the remote storage service
class XFER_API ServiceException : public ClientException
{
public:
    enum class ErrorType
    {
        CLIENT,
        SERVICE,
        UNKNOWN
    };

    struct Details
    {
        std::string error_message;
        std::string error_code;
        std::string request_id;
        std::string service_name;
        int         status_code = 0;
        ErrorType   error_type  = ErrorType::UNKNOWN;
    };

    explicit ServiceException(Details details);

    [[nodiscard]] const std::string &error_message() const noexcept;
    [[nodiscard]] const std::string &error_code() const noexcept;
    [[nodiscard]] const std::string &request_id() const noexcept;
    [[nodiscard]] const std::string &service_name() const noexcept;
    [[nodiscard]] int                status_code() const noexcept;
    [[nodiscard]] ErrorType          error_type() const noexcept;

private:
    Details details_;
};

const char *to_string(ServiceException::ErrorType error_type);
}  // namespace xfer::errors

#endif  // XFER_ERRORS_SERVICEEXCEPTION_HPP_
