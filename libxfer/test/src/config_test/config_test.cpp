#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>

#include "config.hpp"
#include "configdefaults.hpp"

#include "configloader_mock.hpp"

using namespace ::testing;
using namespace ::xfer::config;

namespace
{
class ConfigTest : public Test
{
protected:
    class CompleteDefaults : public ConfigDefaults
    {
    public:
        [[nodiscard]] std::any default_value(ConfigKey key) const override
        {
            if (key == ConfigKey::LOG_PROGRESS_EVENTS)
            {
                return log_progress_events_;
            }
            else if (key == ConfigKey::PROGRESS_CALLBACK_THREAD_COUNT)
            {
                return thread_count_;
            }
            return {};
        }

        static constexpr bool      log_progress_events_ = true;
        static constexpr long long thread_count_        = 3LL;
    };

    class NoDefaults : public ConfigDefaults
    {
    public:
        [[nodiscard]] std::any default_value(ConfigKey) const override
        {
            return {};
        }
    };

    class MistypedDefaults : public ConfigDefaults
    {
    public:
        [[nodiscard]] std::any default_value(ConfigKey key) const override
        {
            if (key == ConfigKey::PROGRESS_CALLBACK_THREAD_COUNT)
            {
                return std::string {"three"};
            }
            return {};
        }
    };

    void SetUp() override
    {
        ON_CALL(config_loader_, load())
            .WillByDefault(Return(ConfigValues {
                {ConfigKey(ConfigKey::PROGRESS_CALLBACK_THREAD_COUNT).to_string(), thread_count_},
                {ConfigKey(ConfigKey::LOG_STATE_TRANSITIONS).to_string(), log_state_transitions_},
                {"no_such_key", std::string {"ignored"}}}));

        ON_CALL(wrong_type_config_loader_, load())
            .WillByDefault(Return(ConfigValues {
                {ConfigKey(ConfigKey::PROGRESS_CALLBACK_THREAD_COUNT).to_string(), 2.5}}));
    }

    NiceMock<ConfigLoaderMock> config_loader_;
    NiceMock<ConfigLoaderMock> wrong_type_config_loader_;

    const long long thread_count_          = 8LL;
    const bool      log_state_transitions_ = false;
};
}  // namespace

TEST_F(ConfigTest, GetInt)
{
    Config conf {config_loader_};
    EXPECT_EQ(conf.get_integer(ConfigKey::PROGRESS_CALLBACK_THREAD_COUNT), thread_count_);
}

TEST_F(ConfigTest, GetBool)
{
    Config conf {config_loader_};
    EXPECT_EQ(conf.get_bool(ConfigKey::LOG_STATE_TRANSITIONS), log_state_transitions_);
}

TEST_F(ConfigTest, KeyNames)
{
    EXPECT_EQ(ConfigKey {"progress_callback_thread_count"},
        ConfigKey::PROGRESS_CALLBACK_THREAD_COUNT);
    EXPECT_EQ(ConfigKey {"log_state_transitions"}, ConfigKey::LOG_STATE_TRANSITIONS);
    EXPECT_EQ(ConfigKey {"log_progress_events"}, ConfigKey::LOG_PROGRESS_EVENTS);
    EXPECT_EQ(ConfigKey {"no_such_key"}, ConfigKey::KEY_COUNT);
    EXPECT_EQ(ConfigKey(ConfigKey::KEY_COUNT).to_string(), "");
}

TEST_F(ConfigTest, GetMissingValue)
{
    Config conf {config_loader_, std::make_unique<CompleteDefaults>()};
    EXPECT_EQ(conf.get_bool(ConfigKey::LOG_PROGRESS_EVENTS),
        CompleteDefaults::log_progress_events_);
}

TEST_F(ConfigTest, GetMissingValue_NoDefaults)
{
    Config conf {config_loader_};
    EXPECT_DEATH(static_cast<void>(conf.get_bool(ConfigKey::LOG_PROGRESS_EVENTS)), "");
}

TEST_F(ConfigTest, GetMissingValue_NoDefaultForKey)
{
    Config conf {config_loader_, std::make_unique<NoDefaults>()};
    EXPECT_DEATH(static_cast<void>(conf.get_bool(ConfigKey::LOG_PROGRESS_EVENTS)), "");
}

TEST_F(ConfigTest, GetValue_WrongType)
{
    Config conf {wrong_type_config_loader_, std::make_unique<CompleteDefaults>()};
    EXPECT_EQ(conf.get_integer(ConfigKey::PROGRESS_CALLBACK_THREAD_COUNT),
        CompleteDefaults::thread_count_);
}

TEST_F(ConfigTest, GetValue_WrongType_NoDefaults)
{
    Config conf {wrong_type_config_loader_};
    EXPECT_DEATH(
        static_cast<void>(conf.get_integer(ConfigKey::PROGRESS_CALLBACK_THREAD_COUNT)), "");
}

TEST_F(ConfigTest, GetValue_WrongType_MistypedDefault)
{
    Config conf {wrong_type_config_loader_, std::make_unique<MistypedDefaults>()};
    EXPECT_DEATH(
        static_cast<void>(conf.get_integer(ConfigKey::PROGRESS_CALLBACK_THREAD_COUNT)), "");
}
