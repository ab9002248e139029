#ifndef XFER_CONFIG_JSONCONFIGLOADER_HPP_
#define XFER_CONFIG_JSONCONFIGLOADER_HPP_

#include <string>

#include "configloader.hpp"

namespace xfer::config
{
// Members of nested objects are read as if they were top level keys. A file that cannot be
// read or parsed yields no values.
class JSONConfigLoader : public ConfigLoader
{
public:
    explicit JSONConfigLoader(std::string file_path);

    [[nodiscard]] ConfigValues load() const override;

private:
    const std::string file_path_;
};
}  // namespace xfer::config

#endif  // XFER_CONFIG_JSONCONFIGLOADER_HPP_
