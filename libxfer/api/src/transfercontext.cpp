#include "transfercontext.hpp"

#include <utility>

#include "jsonconfigloader.hpp"
#include "transfercontextimpl.hpp"
#include "transfercoordinator.hpp"

namespace xfer
{
TransferContext::TransferContext(const std::string &config_file_path)
    : impl_ {std::make_unique<TransferContextImpl>(config::JSONConfigLoader {config_file_path})}
{}

TransferContext::TransferContext(const config::ConfigLoader &config_loader)
    : impl_ {std::make_unique<TransferContextImpl>(config_loader)}
{}

TransferContext::TransferContext(TransferContext &&other) noexcept
    : impl_ {std::move(other.impl_)}
{}

TransferContext &TransferContext::operator=(TransferContext &&rhs) noexcept
{
    impl_ = std::move(rhs.impl_);
    return *this;
}

TransferContext::~TransferContext() = default;

std::shared_ptr<transfer::TransferCoordinator> TransferContext::create_transfer(
    const std::string &                                    description,
    std::shared_ptr<transfer::TransferStateChangeListener> state_change_listener)
{
    return impl_->create_transfer(description, std::move(state_change_listener));
}

void TransferContext::flush_progress_events()
{
    impl_->flush_progress_events();
}

size_t TransferContext::progress_callback_thread_count() const
{
    return impl_->progress_callback_thread_count();
}
}  // namespace xfer
