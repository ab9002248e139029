#ifndef XFER_TEST_TRANSFERSTATECHANGELISTENER_MOCK_HPP_
#define XFER_TEST_TRANSFERSTATECHANGELISTENER_MOCK_HPP_

#include <gmock/gmock.h>

#include "transfer.hpp"
#include "transferstatechangelistener.hpp"

using namespace ::xfer::transfer;

class TransferStateChangeListenerMock : public TransferStateChangeListener
{
public:
    MOCK_METHOD(void, transfer_state_changed, (Transfer &, TransferState), (override));
};

#endif  // XFER_TEST_TRANSFERSTATECHANGELISTENER_MOCK_HPP_
