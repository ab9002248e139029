#include "defaultconfigvalues.hpp"

#include <glog/logging.h>

namespace xfer
{
DefaultConfigValues::DefaultConfigValues()
    : default_values_ {/* PROGRESS_CALLBACK_THREAD_COUNT */ 1LL,
          /* LOG_STATE_TRANSITIONS */ true, /* LOG_PROGRESS_EVENTS */ false}
{}

std::any DefaultConfigValues::default_value(config::ConfigKey key) const
{
    if (key < config::ConfigKey::FIRST_KEY || key >= config::ConfigKey::KEY_COUNT)
    {
        LOG(ERROR) << "Invalid key " << key;
        return {};
    }
    return default_values_[key];
}
}  // namespace xfer
