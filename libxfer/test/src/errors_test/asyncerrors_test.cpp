#include <gtest/gtest.h>

#include <exception>
#include <stdexcept>

#include "asyncerrors.hpp"
#include "clientexception.hpp"

using namespace ::testing;
using namespace ::xfer::errors;

TEST(AsyncErrorsTest, ExecutionError_KeepsCause)
{
    auto           cause = std::make_exception_ptr(ClientException {"network timeout"});
    ExecutionError e {cause};

    EXPECT_EQ(e.cause(), cause);
    EXPECT_STREQ(e.what(), "Execution failed: network timeout");
}

TEST(AsyncErrorsTest, ExecutionError_NullCause)
{
    ExecutionError e {nullptr};

    EXPECT_FALSE(e.cause());
    EXPECT_STREQ(e.what(), "Execution failed: no error");
}

TEST(AsyncErrorsTest, Describe)
{
    EXPECT_EQ(describe(std::make_exception_ptr(std::runtime_error {"boom"})), "boom");
    EXPECT_EQ(describe(std::make_exception_ptr(42)), "unknown error");
    EXPECT_EQ(describe(nullptr), "no error");
}

TEST(AsyncErrorsTest, InterruptionAndCancellationAreNotClientErrors)
{
    auto interrupted = std::make_exception_ptr(InterruptedError {});
    auto cancelled   = std::make_exception_ptr(CancellationError {});

    EXPECT_THROW(std::rethrow_exception(interrupted), InterruptedError);
    EXPECT_THROW(std::rethrow_exception(cancelled), CancellationError);

    try
    {
        std::rethrow_exception(interrupted);
    }
    catch (const ClientException &)
    {
        FAIL() << "InterruptedError must not be a ClientException";
    }
    catch (const InterruptedError &e)
    {
        EXPECT_STREQ(e.what(), "Interrupted while waiting");
    }
}
