#ifndef XFER_CONFIG_CONFIGLOADER_HPP_
#define XFER_CONFIG_CONFIGLOADER_HPP_

#include <any>
#include <map>
#include <string>

namespace xfer::config
{
// Values are bool, long long, double or std::string
using ConfigValues = std::map<std::string, std::any>;

class ConfigLoader
{
public:
    virtual ~ConfigLoader() = default;

    [[nodiscard]] virtual ConfigValues load() const = 0;
};
}  // namespace xfer::config

#endif  // XFER_CONFIG_CONFIGLOADER_HPP_
