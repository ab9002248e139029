#include "transfercoordinator.hpp"

#include <optional>
#include <utility>

#include <glog/logging.h>

#include "legacyprogresslistener.hpp"
#include "transfermonitor.hpp"
#include "waitprotocol.hpp"

namespace xfer::transfer
{
namespace
{
std::shared_ptr<event::ProgressListenerChain> make_chain_if_missing(
    std::shared_ptr<event::ProgressListenerChain> chain)
{
    return chain ? std::move(chain) : std::make_shared<event::ProgressListenerChain>();
}

// Progress event announcing that a transfer entered the given state, if there is one
std::optional<event::ProgressEventType> progress_event_for_state(TransferState state)
{
    switch (state)
    {
        case TransferState::IN_PROGRESS: return event::ProgressEventType::STARTED;
        case TransferState::COMPLETED: return event::ProgressEventType::COMPLETED;
        case TransferState::FAILED: return event::ProgressEventType::FAILED;
        case TransferState::CANCELED: return event::ProgressEventType::CANCELED;
        default: return std::nullopt;
    }
}
}  // namespace

TransferCoordinator::TransferCoordinator(TransferConfiguration configuration)
    : description_ {std::move(configuration.description)}
    , state_ {TransferState::WAITING}
    , progress_listener_chain_ {make_chain_if_missing(
          std::move(configuration.progress_listener_chain))}
    , progress_event_dispatcher_ {progress_listener_chain_,
          std::move(configuration.progress_callback_executer), configuration.log_progress_events}
    , log_state_transitions_ {configuration.log_state_transitions}
    , notifying_ {false}
{
    state_change_listeners_.add(configuration.state_change_listener);
}

TransferCoordinator::~TransferCoordinator() = default;

bool TransferCoordinator::is_done() const
{
    return is_terminal(state_);
}

TransferState TransferCoordinator::state() const
{
    return state_;
}

const std::string &TransferCoordinator::description() const
{
    return description_;
}

const TransferProgress &TransferCoordinator::progress() const
{
    return progress_;
}

void TransferCoordinator::wait_for_completion()
{
    for (;;)
    {
        auto step = await_next_unit(monitor().get());
        if (step.error)
        {
            std::rethrow_exception(step.error);
        }
        if (step.done)
        {
            return;
        }
    }
}

std::exception_ptr TransferCoordinator::wait_for_exception()
{
    for (;;)
    {
        auto step = await_next_unit(monitor().get());
        if (step.done)
        {
            return step.error;
        }
    }
}

bool TransferCoordinator::add_progress_listener(
    const std::shared_ptr<event::ProgressListener> &listener)
{
    return progress_listener_chain_->add_progress_listener(listener);
}

bool TransferCoordinator::remove_progress_listener(
    const std::shared_ptr<event::ProgressListener> &listener)
{
    return progress_listener_chain_->remove_progress_listener(listener);
}

bool TransferCoordinator::add_legacy_progress_listener(
    const std::shared_ptr<event::LegacyProgressListener> &listener)
{
    if (!listener)
    {
        return false;
    }

    auto adapter = std::make_shared<event::LegacyProgressListenerAdapter>(listener);

    std::lock_guard lock {mutex_};
    if (!progress_listener_chain_->add_progress_listener(adapter))
    {
        return false;
    }
    legacy_listener_adapters_.emplace(listener.get(), std::move(adapter));
    return true;
}

bool TransferCoordinator::remove_legacy_progress_listener(
    const std::shared_ptr<event::LegacyProgressListener> &listener)
{
    std::lock_guard lock {mutex_};
    // lower_bound finds the earliest registration of this listener
    auto it = legacy_listener_adapters_.lower_bound(listener.get());
    if (it == legacy_listener_adapters_.end() || it->first != listener.get())
    {
        return false;
    }
    bool removed = progress_listener_chain_->remove_progress_listener(it->second);
    legacy_listener_adapters_.erase(it);
    return removed;
}

bool TransferCoordinator::add_state_change_listener(
    const std::shared_ptr<TransferStateChangeListener> &listener)
{
    return state_change_listeners_.add(listener);
}

bool TransferCoordinator::remove_state_change_listener(
    const std::shared_ptr<TransferStateChangeListener> &listener)
{
    return state_change_listeners_.remove(listener);
}

bool TransferCoordinator::set_state(TransferState new_state)
{
    std::lock_guard lock {state_change_mutex_};

    TransferState current_state = state_;
    if (is_terminal(current_state))
    {
        if (new_state != current_state)
        {
            LOG(WARNING) << "Transfer \"" << description_ << "\" is already "
                         << to_string(current_state) << ", ignoring transition to "
                         << to_string(new_state);
        }
        return false;
    }

    state_ = new_state;

    if (log_state_transitions_)
    {
        LOG(INFO) << "Transfer \"" << description_ << "\": " << to_string(current_state)
                  << " -> " << to_string(new_state);
    }

    if (auto event_type = progress_event_for_state(new_state))
    {
        fire_progress_event(*event_type);
    }

    notify_state_change_listeners(new_state);
    return true;
}

void TransferCoordinator::notify_state_change_listeners(TransferState state)
{
    // Held for the whole pass, so only the notifying thread gets back in here (from a listener)
    std::lock_guard lock {state_change_mutex_};
    pending_notifications_.push_back(state);
    if (!notifying_)
    {
        deliver_pending_notifications();
    }
}

void TransferCoordinator::deliver_pending_notifications()
{
    notifying_ = true;
    try
    {
        while (!pending_notifications_.empty())
        {
            TransferState state = pending_notifications_.front();
            pending_notifications_.pop_front();
            state_change_listeners_.notify(
                &TransferStateChangeListener::transfer_state_changed, *this, state);
        }
    }
    catch (...)
    {
        pending_notifications_.clear();
        notifying_ = false;
        throw;
    }
    notifying_ = false;
}

void TransferCoordinator::set_monitor(std::shared_ptr<TransferMonitor> monitor)
{
    std::lock_guard lock {mutex_};
    monitor_ = std::move(monitor);
}

std::shared_ptr<TransferMonitor> TransferCoordinator::monitor() const
{
    std::lock_guard lock {mutex_};
    return monitor_;
}

void TransferCoordinator::add_bytes_transferred(long long byte_count)
{
    progress_.add_bytes_transferred(byte_count);
    fire_progress_event(event::ProgressEventType::BYTE_TRANSFER, byte_count);
}

void TransferCoordinator::set_total_bytes_to_transfer(long long total_bytes)
{
    progress_.set_total_bytes_to_transfer(total_bytes);
}

void TransferCoordinator::fire_progress_event(
    event::ProgressEventType event_type, long long byte_count)
{
    progress_event_dispatcher_.fire(event::ProgressEvent {event_type, byte_count});
}

void TransferCoordinator::wait_for_progress_events()
{
    progress_event_dispatcher_.wait_for_pending_events();
}
}  // namespace xfer::transfer
