#ifndef XFER_TRANSFER_TRANSFERCONFIGURATION_HPP_
#define XFER_TRANSFER_TRANSFERCONFIGURATION_HPP_

#include <memory>
#include <string>

#include "executer.hpp"
#include "progresslistenerchain.hpp"
#include "transferstatechangelistener.hpp"

namespace xfer::transfer
{
struct TransferConfiguration
{
    // Human readable, used for logging only
    std::string description;

    // A fresh chain is created when null
    std::shared_ptr<event::ProgressListenerChain> progress_listener_chain;

    // Runs progress listeners; progress events are dropped when null
    std::shared_ptr<utils::Executer> progress_callback_executer;

    // Registered before any state change can happen, may be null
    std::shared_ptr<TransferStateChangeListener> state_change_listener;

    bool log_state_transitions = true;
    bool log_progress_events   = false;
};
}  // namespace xfer::transfer

#endif  // XFER_TRANSFER_TRANSFERCONFIGURATION_HPP_
