#include <gtest/gtest.h>

#include <exception>
#include <stdexcept>

#include "clientexception.hpp"
#include "serviceexception.hpp"

using namespace ::testing;
using namespace ::xfer::errors;

namespace
{
class ServiceExceptionTest : public Test
{
protected:
    ServiceException::Details details() const
    {
        ServiceException::Details d;
        d.error_message = "Access Denied";
        d.error_code    = "AccessDenied";
        d.request_id    = "4442587FB7D0A2F9";
        d.service_name  = "ObjectStorage";
        d.status_code   = 403;
        d.error_type    = ServiceException::ErrorType::CLIENT;
        return d;
    }
};
}  // namespace

TEST_F(ServiceExceptionTest, Fields)
{
    ServiceException e {details()};

    EXPECT_EQ(e.error_message(), "Access Denied");
    EXPECT_EQ(e.error_code(), "AccessDenied");
    EXPECT_EQ(e.request_id(), "4442587FB7D0A2F9");
    EXPECT_EQ(e.service_name(), "ObjectStorage");
    EXPECT_EQ(e.status_code(), 403);
    EXPECT_EQ(e.error_type(), ServiceException::ErrorType::CLIENT);
    EXPECT_FALSE(e.cause());
}

TEST_F(ServiceExceptionTest, MessageEmbedsServiceResponse)
{
    ServiceException e {details()};
    EXPECT_STREQ(e.what(), "Access Denied (Service: ObjectStorage; Status Code: 403; "
                           "Error Code: AccessDenied; Request ID: 4442587FB7D0A2F9)");
}

TEST_F(ServiceExceptionTest, CaughtAsClientException)
{
    try
    {
        throw ServiceException {details()};
    }
    catch (const ClientException &e)
    {
        EXPECT_NE(dynamic_cast<const ServiceException *>(&e), nullptr);
        return;
    }
    FAIL() << "ServiceException not caught as ClientException";
}

TEST_F(ServiceExceptionTest, ErrorTypeNames)
{
    EXPECT_STREQ(to_string(ServiceException::ErrorType::CLIENT), "Client");
    EXPECT_STREQ(to_string(ServiceException::ErrorType::SERVICE), "Service");
    EXPECT_STREQ(to_string(ServiceException::ErrorType::UNKNOWN), "Unknown");
}

TEST(ClientExceptionTest, KeepsCause)
{
    auto            cause = std::make_exception_ptr(std::logic_error {"root cause"});
    ClientException e {"wrapper", cause};

    EXPECT_STREQ(e.what(), "wrapper");
    EXPECT_EQ(e.cause(), cause);
}
