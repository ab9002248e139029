#include "waitprotocol.hpp"

#include <string>

#include "asyncerrors.hpp"
#include "asynchandle.hpp"
#include "clientexception.hpp"
#include "transfermonitor.hpp"

namespace xfer::transfer
{
AwaitStep await_next_unit(TransferMonitor *monitor)
{
    if (!monitor)
    {
        return {true, std::make_exception_ptr(
                          errors::ClientException {"No monitor attached to the transfer"})};
    }

    auto handle = monitor->current_handle();
    if (!handle)
    {
        return {true, std::make_exception_ptr(errors::ClientException {
                          "Transfer monitor has no outstanding work to wait on"})};
    }

    try
    {
        handle->await();
    }
    catch (const errors::ExecutionError &e)
    {
        return {true, unwrap_execution_error(e)};
    }

    return {monitor->is_done(), nullptr};
}

std::exception_ptr unwrap_execution_error(const errors::ExecutionError &error)
{
    auto cause = error.cause();
    if (!cause)
    {
        return std::make_exception_ptr(
            errors::ClientException {"Unable to complete transfer: unknown error"});
    }

    try
    {
        std::rethrow_exception(cause);
    }
    catch (const errors::ClientException &)
    {
        return cause;
    }
    catch (const std::exception &e)
    {
        return std::make_exception_ptr(errors::ClientException {
            std::string {"Unable to complete transfer: "} + e.what(), cause});
    }
    catch (...)
    {
        return std::make_exception_ptr(
            errors::ClientException {"Unable to complete transfer: unknown error", cause});
    }
}

void rethrow_execution_error(const errors::ExecutionError &error)
{
    std::rethrow_exception(unwrap_execution_error(error));
}
}  // namespace xfer::transfer
