#ifndef XFER_API_DEFAULTCONFIGVALUES_HPP_
#define XFER_API_DEFAULTCONFIGVALUES_HPP_

#include "configdefaults.hpp"

namespace xfer
{
class DefaultConfigValues : public config::ConfigDefaults
{
public:
    DefaultConfigValues();
    [[nodiscard]] std::any default_value(config::ConfigKey key) const override;

private:
    const std::any default_values_[config::ConfigKey::KEY_COUNT];
};
}  // namespace xfer

#endif  // XFER_API_DEFAULTCONFIGVALUES_HPP_
