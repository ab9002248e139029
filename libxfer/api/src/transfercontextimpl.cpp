#include "transfercontextimpl.hpp"

#include <utility>

#include <glog/logging.h>

#include "defaultconfigvalues.hpp"
#include "threadpool.hpp"
#include "transferconfiguration.hpp"
#include "transfercoordinator.hpp"

namespace xfer
{
namespace
{
size_t thread_count_from_config(const config::Config &cfg)
{
    auto thread_count = cfg.get_integer(config::ConfigKey::PROGRESS_CALLBACK_THREAD_COUNT);
    if (thread_count < 1)
    {
        LOG(WARNING) << "Invalid progress callback thread count " << thread_count
                     << ", using a single thread";
        thread_count = 1;
    }
    else if (thread_count > TransferContextImpl::max_progress_callback_threads)
    {
        LOG(WARNING) << "Progress callback thread count " << thread_count << " is too large, using "
                     << TransferContextImpl::max_progress_callback_threads << " threads";
        thread_count = TransferContextImpl::max_progress_callback_threads;
    }
    return size_t(thread_count);
}
}  // namespace

TransferContextImpl::TransferContextImpl(const config::ConfigLoader &config_loader)
    : cfg_ {config_loader, std::make_unique<DefaultConfigValues>()}
    , progress_callback_pool_ {std::make_shared<utils::ThreadPool>(thread_count_from_config(cfg_))}
{
    LOG(INFO) << "Delivering progress events on " << progress_callback_pool_->thread_count()
              << " thread(s)";
}

TransferContextImpl::~TransferContextImpl() = default;

std::shared_ptr<transfer::TransferCoordinator> TransferContextImpl::create_transfer(
    const std::string &                                    description,
    std::shared_ptr<transfer::TransferStateChangeListener> state_change_listener)
{
    transfer::TransferConfiguration configuration;
    configuration.description                = description;
    configuration.progress_listener_chain    = std::make_shared<event::ProgressListenerChain>();
    configuration.progress_callback_executer = progress_callback_pool_;
    configuration.state_change_listener      = std::move(state_change_listener);
    configuration.log_state_transitions = cfg_.get_bool(config::ConfigKey::LOG_STATE_TRANSITIONS);
    configuration.log_progress_events   = cfg_.get_bool(config::ConfigKey::LOG_PROGRESS_EVENTS);

    return std::make_shared<transfer::TransferCoordinator>(std::move(configuration));
}

void TransferContextImpl::flush_progress_events()
{
    progress_callback_pool_->process_all_jobs();
}

size_t TransferContextImpl::progress_callback_thread_count() const
{
    return progress_callback_pool_->thread_count();
}
}  // namespace xfer
