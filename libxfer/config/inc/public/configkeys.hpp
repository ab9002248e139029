#ifndef XFER_CONFIG_CONFIGKEYS_HPP_
#define XFER_CONFIG_CONFIGKEYS_HPP_

#include <string>

namespace xfer::config
{
class ConfigKey
{
public:
    enum EnumType
    {
        FIRST_KEY = 0,

        PROGRESS_CALLBACK_THREAD_COUNT = FIRST_KEY,
        LOG_STATE_TRANSITIONS,
        LOG_PROGRESS_EVENTS,

        KEY_COUNT
    };

    // Yields KEY_COUNT if there is no key with the given name
    explicit ConfigKey(const std::string &str_key);

    ConfigKey(EnumType k)
        : key_ {k}
    {}

    [[nodiscard]] std::string to_string() const
    {
        if (key_ >= 0 && key_ < KEY_COUNT)
        {
            return string_vals[key_];
        }
        return "";
    }

    [[nodiscard]] EnumType to_enum_type() const
    {
        return key_;
    }

    operator EnumType() const
    {
        return to_enum_type();
    }

    explicit operator std::string() const
    {
        return to_string();
    }

private:
    EnumType key_;

    static constexpr char const *string_vals[] {
        "progress_callback_thread_count", "log_state_transitions", "log_progress_events"};
};
}  // namespace xfer::config

#endif  // XFER_CONFIG_CONFIGKEYS_HPP_
