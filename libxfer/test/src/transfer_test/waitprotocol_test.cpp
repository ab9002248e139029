#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <any>
#include <exception>
#include <memory>
#include <stdexcept>

#include "asyncerrors.hpp"
#include "clientexception.hpp"
#include "serviceexception.hpp"
#include "waitprotocol.hpp"

#include "asynchandle_mock.hpp"
#include "transfermonitor_mock.hpp"

using namespace ::testing;
using namespace ::xfer::transfer;
using namespace ::xfer::errors;

namespace
{
class WaitProtocolTest : public Test
{
protected:
    void SetUp() override
    {
        handle_ = std::make_shared<NiceMock<AsyncHandleMock>>();
        ON_CALL(monitor_, current_handle()).WillByDefault(Return(handle_));
    }

    // Message of the ClientException stored in error
    static std::string client_error_message(const std::exception_ptr &error)
    {
        try
        {
            std::rethrow_exception(error);
        }
        catch (const ClientException &e)
        {
            return e.what();
        }
        catch (const std::exception &e)
        {
            ADD_FAILURE() << "Not a ClientException: " << e.what();
        }
        return {};
    }

    NiceMock<TransferMonitorMock>    monitor_;
    std::shared_ptr<AsyncHandleMock> handle_;
};
}  // namespace

TEST_F(WaitProtocolTest, UnitSucceeded_MonitorDone)
{
    EXPECT_CALL(*handle_, await()).WillOnce(Return(std::any {}));
    EXPECT_CALL(monitor_, is_done()).WillOnce(Return(true));

    auto step = await_next_unit(&monitor_);
    EXPECT_TRUE(step.done);
    EXPECT_FALSE(step.error);
}

TEST_F(WaitProtocolTest, UnitSucceeded_MoreUnitsOutstanding)
{
    EXPECT_CALL(*handle_, await()).WillOnce(Return(std::any {}));
    EXPECT_CALL(monitor_, is_done()).WillOnce(Return(false));

    auto step = await_next_unit(&monitor_);
    EXPECT_FALSE(step.done);
    EXPECT_FALSE(step.error);
}

TEST_F(WaitProtocolTest, UnitFailed_ClientExceptionPassedThrough)
{
    auto cause = std::make_exception_ptr(ClientException {"network timeout"});
    EXPECT_CALL(*handle_, await()).WillOnce(Throw(ExecutionError {cause}));
    EXPECT_CALL(monitor_, is_done()).Times(0);

    auto step = await_next_unit(&monitor_);
    EXPECT_TRUE(step.done);
    EXPECT_EQ(step.error, cause);
}

TEST_F(WaitProtocolTest, InterruptionNotCaught)
{
    EXPECT_CALL(*handle_, await()).WillOnce(Throw(InterruptedError {}));
    EXPECT_THROW(await_next_unit(&monitor_), InterruptedError);
}

TEST_F(WaitProtocolTest, CancellationNotCaught)
{
    EXPECT_CALL(*handle_, await()).WillOnce(Throw(CancellationError {}));
    EXPECT_THROW(await_next_unit(&monitor_), CancellationError);
}

TEST_F(WaitProtocolTest, NoMonitor)
{
    auto step = await_next_unit(nullptr);
    EXPECT_TRUE(step.done);
    EXPECT_EQ(client_error_message(step.error), "No monitor attached to the transfer");
}

TEST_F(WaitProtocolTest, NoOutstandingUnit)
{
    EXPECT_CALL(monitor_, current_handle()).WillOnce(Return(nullptr));

    auto step = await_next_unit(&monitor_);
    EXPECT_TRUE(step.done);
    EXPECT_EQ(client_error_message(step.error),
        "Transfer monitor has no outstanding work to wait on");
}

TEST_F(WaitProtocolTest, Unwrap_ServiceExceptionPassedThrough)
{
    ServiceException::Details details;
    details.error_message = "Slow Down";
    details.status_code   = 503;
    details.error_type    = ServiceException::ErrorType::SERVICE;
    auto cause            = std::make_exception_ptr(ServiceException {details});

    EXPECT_EQ(unwrap_execution_error(ExecutionError {cause}), cause);
}

TEST_F(WaitProtocolTest, Unwrap_OtherExceptionWrapped)
{
    auto cause     = std::make_exception_ptr(std::runtime_error {"boom"});
    auto unwrapped = unwrap_execution_error(ExecutionError {cause});

    try
    {
        std::rethrow_exception(unwrapped);
    }
    catch (const ClientException &e)
    {
        EXPECT_STREQ(e.what(), "Unable to complete transfer: boom");
        EXPECT_EQ(e.cause(), cause);
        return;
    }
    FAIL() << "Not wrapped in a ClientException";
}

TEST_F(WaitProtocolTest, Unwrap_UnknownCause)
{
    auto cause = std::make_exception_ptr(42);
    EXPECT_EQ(client_error_message(unwrap_execution_error(ExecutionError {cause})),
        "Unable to complete transfer: unknown error");
    EXPECT_EQ(client_error_message(unwrap_execution_error(ExecutionError {nullptr})),
        "Unable to complete transfer: unknown error");
}

TEST_F(WaitProtocolTest, RethrowExecutionError)
{
    auto cause = std::make_exception_ptr(ClientException {"network timeout"});
    EXPECT_THROW(rethrow_execution_error(ExecutionError {cause}), ClientException);
}
