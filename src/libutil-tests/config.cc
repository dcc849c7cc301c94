#include "diskxfer/util/config-global.hh"
#include "diskxfer/util/configuration.hh"
#include "diskxfer/util/file-descriptor.hh"

#include "diskxfer/util/terminal.hh"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdlib>
#include <fcntl.h>
#include <unistd.h>

namespace diskxfer {

/* ----------------------------------------------------------------------------
 * Config
 * --------------------------------------------------------------------------*/

struct TestConfig : Config
{
    Setting<bool> unbuffered{this, false, "unbuffered", "Write without coalescing."};
    Setting<uint64_t> bufferSize{this, 1024, "buffer-size", "Bytes to coalesce."};
    Setting<std::string> suffix{this, "", "user-agent-suffix", "Appended to the user agent.", {"ua-suffix"}};
};

TEST(Config, setUndefinedSetting)
{
    TestConfig config;
    ASSERT_EQ(config.set("undefined-key", "value"), false);
}

TEST(Config, setDefinedSetting)
{
    TestConfig config;
    ASSERT_EQ(config.set("unbuffered", "true"), true);
    ASSERT_TRUE(config.unbuffered.get());
}

TEST(Config, setThroughAlias)
{
    TestConfig config;
    ASSERT_TRUE(config.set("ua-suffix", "test-harness"));
    ASSERT_EQ(config.suffix.get(), "test-harness");
}

TEST(Config, invalidBooleanIsAUsageError)
{
    TestConfig config;
    ASSERT_THROW(config.set("unbuffered", "maybe"), UsageError);
}

TEST(Config, integersAcceptUnitPrefixes)
{
    TestConfig config;
    config.set("buffer-size", "4M");
    ASSERT_EQ(config.bufferSize.get(), 4u * 1024 * 1024);
    ASSERT_THROW(config.set("buffer-size", "lots"), UsageError);
}

TEST(Config, getDefinedSettingSet1)
{
    TestConfig config;
    std::map<std::string, Config::SettingInfo> settings;
    config.set("unbuffered", "yes");

    config.getSettings(settings);
    const auto iter = settings.find("unbuffered");
    ASSERT_NE(iter, settings.end());
    ASSERT_EQ(iter->second.value, "true");
    ASSERT_EQ(iter->second.description, "Write without coalescing.\n");
}

TEST(Config, getOverriddenOnly)
{
    TestConfig config;
    std::map<std::string, Config::SettingInfo> settings;
    config.set("buffer-size", "2048");

    config.getSettings(settings, true);
    ASSERT_EQ(settings.size(), 1u);
    ASSERT_EQ(settings["buffer-size"].value, "2048");

    config.resetOverridden();
    settings.clear();
    config.getSettings(settings, true);
    ASSERT_TRUE(settings.empty());
}

TEST(Config, aliasesAreNotListed)
{
    TestConfig config;
    std::map<std::string, Config::SettingInfo> settings;
    config.getSettings(settings);
    ASSERT_EQ(settings.count("ua-suffix"), 0u);
    ASSERT_EQ(settings.count("user-agent-suffix"), 1u);
}

TEST(Config, toKeyValue)
{
    TestConfig config;
    config.set("unbuffered", "1");
    ASSERT_EQ(config.toKeyValue(), "buffer-size = 1024\nunbuffered = true\nuser-agent-suffix = \n");
}

/* ----------------------------------------------------------------------------
 * applyConfig
 * --------------------------------------------------------------------------*/

TEST(Config, applyConfigWithComments)
{
    TestConfig config;
    config.applyConfig(
        "# a comment\n"
        "unbuffered = true # trailing\n"
        "\n"
        "user-agent-suffix = from the file\n");
    ASSERT_TRUE(config.unbuffered.get());
    ASSERT_EQ(config.suffix.get(), "from the file");
}

TEST(Config, applyConfigSyntaxError)
{
    TestConfig config;
    ASSERT_THROW(config.applyConfig("unbuffered true\n"), UsageError);
    ASSERT_THROW(config.applyConfig("unbuffered\n"), UsageError);
}

TEST(Config, applyConfigSyntaxErrorNamesTheLine)
{
    TestConfig config;
    try {
        config.applyConfig("# header\n\nunbuffered = true\nbuffer-size 12\n", "/etc/diskxfer/diskxfer.conf");
        FAIL() << "expected a usage error";
    } catch (UsageError & e) {
        ASSERT_THAT(
            filterANSIEscapes(e.message(), true),
            ::testing::HasSubstr("syntax error in '/etc/diskxfer/diskxfer.conf' line 4: 'buffer-size 12'"));
    }
}

TEST(Config, canonicalNameWinsOverAlias)
{
    TestConfig config;
    config.applyConfig("late-alias = alias\nlate-suffix = canonical\n");

    Setting<std::string> late{&config, "", "late-suffix", "Registered late.", {"late-alias"}};
    ASSERT_EQ(late.get(), "canonical");
}

TEST(Config, applyConfigKeepsUnknownSettingsForLater)
{
    TestConfig config;
    config.applyConfig("not-yet-known = 12\n");

    Setting<uint64_t> late{&config, 0, "not-yet-known", "Registered after the file was read."};
    ASSERT_EQ(late.get(), 12u);
    ASSERT_TRUE(late.overridden);
}

TEST(Config, applyConfigMissingIncludeFails)
{
    TestConfig config;
    ASSERT_THROW(config.applyConfig("include /does/not/exist.conf\n", "/tmp/x.conf"), Error);
    ASSERT_NO_THROW(config.applyConfig("!include /does/not/exist.conf\n", "/tmp/x.conf"));
}

TEST(Config, applyConfigFollowsRelativeIncludes)
{
    char dirTemplate[] = "/tmp/diskxfer-config-XXXXXX";
    ASSERT_NE(mkdtemp(dirTemplate), nullptr);
    std::string dir = dirTemplate;

    {
        AutoCloseFD fd = open((dir + "/extra.conf").c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
        ASSERT_TRUE(fd);
        writeFull(fd.get(), "buffer-size = 99\n");
    }

    TestConfig config;
    config.applyConfig("include extra.conf\n", dir + "/diskxfer.conf");
    ASSERT_EQ(config.bufferSize.get(), 99u);

    unlink((dir + "/extra.conf").c_str());
    rmdir(dir.c_str());
}

/* ----------------------------------------------------------------------------
 * GlobalConfig
 * --------------------------------------------------------------------------*/

TEST(GlobalConfig, reachesRegisteredConfigs)
{
    static TestConfig registered;
    static GlobalConfig::Register r(&registered);

    ASSERT_TRUE(globalConfig.set("user-agent-suffix", "global"));
    ASSERT_EQ(registered.suffix.get(), "global");
    ASSERT_FALSE(globalConfig.set("no-such-setting", "x"));
}

} // namespace diskxfer
