#ifndef XFER_TEST_ASYNCHANDLE_MOCK_HPP_
#define XFER_TEST_ASYNCHANDLE_MOCK_HPP_

#include <gmock/gmock.h>

#include "asynchandle.hpp"

using namespace ::xfer::transfer;

class AsyncHandleMock : public AsyncHandle
{
public:
    MOCK_METHOD(std::any, await, (), (override));
};

#endif  // XFER_TEST_ASYNCHANDLE_MOCK_HPP_
