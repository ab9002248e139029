#ifndef XFER_CONFIG_CONFIG_HPP_
#define XFER_CONFIG_CONFIG_HPP_

#include <any>
#include <array>
#include <memory>

#include "configdefaults.hpp"
#include "configkeys.hpp"

namespace xfer::config
{
// Forward declarations
class ConfigLoader;

class Config
{
public:
    explicit Config(
        const ConfigLoader &config_loader, std::shared_ptr<const ConfigDefaults> defaults = nullptr);

    [[nodiscard]] long long get_integer(ConfigKey key) const;
    [[nodiscard]] bool      get_bool(ConfigKey key) const;

private:
    template<typename T>
    [[nodiscard]] T lookup(ConfigKey key) const;
    template<typename T>
    [[nodiscard]] T default_for(ConfigKey key) const;

    std::array<std::any, ConfigKey::KEY_COUNT> values_;
    std::shared_ptr<const ConfigDefaults>      defaults_;
};
}  // namespace xfer::config

#endif  // XFER_CONFIG_CONFIG_HPP_
