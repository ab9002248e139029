#include "config.hpp"

#include <typeinfo>
#include <utility>

#include <glog/logging.h>

#include "configloader.hpp"

namespace xfer::config
{
Config::Config(const ConfigLoader &config_loader, std::shared_ptr<const ConfigDefaults> defaults)
    : defaults_ {std::move(defaults)}
{
    for (auto &[name, value] : config_loader.load())
    {
        ConfigKey key {name};
        if (key == ConfigKey::KEY_COUNT)
        {
            LOG(WARNING) << "Ignoring unknown configuration key " << name;
            continue;
        }
        values_[key] = std::move(value);
    }
}

long long Config::get_integer(ConfigKey key) const
{
    return lookup<long long>(key);
}

bool Config::get_bool(ConfigKey key) const
{
    return lookup<bool>(key);
}

template<typename T>
T Config::lookup(ConfigKey key) const
{
    if (key < ConfigKey::FIRST_KEY || key >= ConfigKey::KEY_COUNT)
    {
        LOG(FATAL) << "Invalid configuration key " << key;
        return T {};
    }

    const std::any &value = values_[key];
    if (!value.has_value())
    {
        LOG(INFO) << key.to_string() << " is not configured, using the default value";
        return default_for<T>(key);
    }
    if (value.type() != typeid(T))
    {
        LOG(ERROR) << key.to_string() << " has a value of the wrong type (" << value.type().name()
                   << " instead of " << typeid(T).name() << "), using the default value";
        return default_for<T>(key);
    }
    return std::any_cast<T>(value);
}

// A missing or mistyped default is a programming error
template<typename T>
T Config::default_for(ConfigKey key) const
{
    if (!defaults_)
    {
        LOG(FATAL) << "No default values to fall back on for " << key.to_string();
        return T {};
    }

    std::any value = defaults_->default_value(key);
    if (!value.has_value())
    {
        LOG(FATAL) << "No default value for " << key.to_string();
        return T {};
    }
    if (value.type() != typeid(T))
    {
        LOG(FATAL) << "Default value of " << key.to_string() << " has the wrong type ("
                   << value.type().name() << " instead of " << typeid(T).name() << ")";
        return T {};
    }
    return std::any_cast<T>(value);
}
}  // namespace xfer::config
