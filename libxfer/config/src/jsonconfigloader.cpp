#include "jsonconfigloader.hpp"

#include <fstream>
#include <utility>

#include <glog/logging.h>
#include <nlohmann/json.hpp>

namespace xfer::config
{
namespace
{
void collect_values(const nlohmann::json &object, ConfigValues &values)
{
    for (const auto &[name, value] : object.items())
    {
        switch (value.type())
        {
            case nlohmann::json::value_t::boolean: values.emplace(name, value.get<bool>()); break;
            case nlohmann::json::value_t::number_integer:
            case nlohmann::json::value_t::number_unsigned:
                values.emplace(name, value.get<long long>());
                break;
            case nlohmann::json::value_t::number_float:
                values.emplace(name, value.get<double>());
                break;
            case nlohmann::json::value_t::string:
                values.emplace(name, value.get<std::string>());
                break;
            case nlohmann::json::value_t::object: collect_values(value, values); break;
            default: LOG(WARNING) << "Unsupported value for configuration key " << name; break;
        }
    }
}
}  // namespace

JSONConfigLoader::JSONConfigLoader(std::string file_path)
    : file_path_ {std::move(file_path)}
{}

ConfigValues JSONConfigLoader::load() const
{
    ConfigValues values;

    std::ifstream file {file_path_};
    if (!file)
    {
        LOG(ERROR) << "Cannot open configuration file " << file_path_;
        return values;
    }

    auto root = nlohmann::json::parse(file, nullptr, false);
    if (root.is_discarded() || !root.is_object())
    {
        LOG(ERROR) << "Configuration file " << file_path_ << " does not hold a JSON object";
        return values;
    }

    collect_values(root, values);
    return values;
}
}  // namespace xfer::config
