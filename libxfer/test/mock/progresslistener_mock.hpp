#ifndef XFER_TEST_PROGRESSLISTENER_MOCK_HPP_
#define XFER_TEST_PROGRESSLISTENER_MOCK_HPP_

#include <gmock/gmock.h>

#include "progresslistener.hpp"

using namespace ::xfer::event;

class ProgressListenerMock : public ProgressListener
{
public:
    MOCK_METHOD(void, progress_changed, (const ProgressEvent &), (override));
};

#endif  // XFER_TEST_PROGRESSLISTENER_MOCK_HPP_
