#ifndef XFER_CONFIG_CONFIGDEFAULTS_HPP_
#define XFER_CONFIG_CONFIGDEFAULTS_HPP_

#include <any>

#include "configkeys.hpp"

namespace xfer::config
{
// Values used for keys the configuration source leaves out or gets wrong
class ConfigDefaults
{
public:
    virtual ~ConfigDefaults() = default;

    // Empty if the key has no default
    [[nodiscard]] virtual std::any default_value(ConfigKey key) const = 0;
};
}  // namespace xfer::config

#endif  // XFER_CONFIG_CONFIGDEFAULTS_HPP_
