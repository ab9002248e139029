#include "serviceexception.hpp"

#include <sstream>
#include <utility>

namespace xfer::errors
{
namespace
{
std::string format_message(const ServiceException::Details &details)
{
    std::ostringstream ss;
    ss << details.error_message << " (Service: " << details.service_name
       << "; Status Code: " << details.status_code << "; Error Code: " << details.error_code
       << "; Request ID: " << details.request_id << ')';
    return ss.str();
}
}  // namespace

ServiceException::ServiceException(Details details)
    : ClientException {format_message(details)}
    , details_ {std::move(details)}
{
}

const std::string &ServiceException::error_message() const noexcept
{
    return details_.error_message;
}

const std::string &ServiceException::error_code() const noexcept
{
    return details_.error_code;
}

const std::string &ServiceException::request_id() const noexcept
{
    return details_.request_id;
}

const std::string &ServiceException::service_name() const noexcept
{
    return details_.service_name;
}

int ServiceException::status_code() const noexcept
{
    return details_.status_code;
}

ServiceException::ErrorType ServiceException::error_type() const noexcept
{
    return details_.error_type;
}

const char *to_string(ServiceException::ErrorType error_type)
{
    switch (error_type)
    {
        case ServiceException::ErrorType::CLIENT: return "Client";
        case ServiceException::ErrorType::SERVICE: return "Service";
        case ServiceException::ErrorType::UNKNOWN: return "Unknown";
        default: return "Invalid";
    }
}
}  // namespace xfer::errors
