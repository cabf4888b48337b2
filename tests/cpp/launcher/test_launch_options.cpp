#include "mpd_launcher/launcher/launch_options.h"

#include <functional>
#include <gtest/gtest.h>
#include <string>
#include <unordered_map>
#include <vector>

using namespace mpd_launcher;
using namespace mpd_launcher::launcher;

namespace {

std::vector<char*> makeArgv(const std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size());
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    return argv;
}

using EnvMap = std::unordered_map<std::string, std::string>;

class LaunchOptionsTest : public ::testing::Test {
   protected:
    EnvMap env{{"HOME", "/home/alice"}};
    std::optional<std::filesystem::path> exeDir{"/opt/app"};
    std::optional<std::filesystem::path> passwdHome{"/home/from-passwd"};

    LaunchEnvironment makeEnvironment() {
        LaunchEnvironment launchEnv;
        launchEnv.getenvFn = [this](const char* name) -> const char* {
            auto it = env.find(name ? std::string{name} : std::string{});
            if (it == env.end()) {
                return nullptr;
            }
            return it->second.c_str();
        };
        launchEnv.executableDirFn = [this] { return exeDir; };
        launchEnv.passwdHomeFn = [this] { return passwdHome; };
        return launchEnv;
    }

    ParseOptionsResult parse(const std::vector<std::string>& args) {
        auto argv = makeArgv(args);
        return parseLaunchOptions(static_cast<int>(argv.size()), argv.data(), makeEnvironment());
    }
};

}  // namespace

TEST_F(LaunchOptionsTest, DefaultsWhenNoArgs) {
    auto parsed = parse({"mpd-launcher"});

    ASSERT_FALSE(parsed.hasError);
    ASSERT_TRUE(parsed.options.has_value());
    EXPECT_EQ(parsed.options->home.string(), "/home/alice");
    EXPECT_EQ(parsed.options->root.string(), "/opt/app");
    EXPECT_EQ(parsed.options->configPath.string(), "/opt/app/mpd-launcher.json");
    EXPECT_FALSE(parsed.options->mpdBinary.has_value());
    EXPECT_FALSE(parsed.options->logLevel.has_value());
    EXPECT_TRUE(parsed.options->forwardedArgs.empty());
}

TEST_F(LaunchOptionsTest, ForwardsEveryArgumentVerbatim) {
    auto parsed = parse({"mpd-launcher", "--help", "-v", "", "--no-daemon", "a b"});

    ASSERT_FALSE(parsed.hasError);
    ASSERT_TRUE(parsed.options.has_value());
    EXPECT_EQ(parsed.options->forwardedArgs,
              (std::vector<std::string>{"--help", "-v", "", "--no-daemon", "a b"}));
}

TEST_F(LaunchOptionsTest, EnvironmentOverrides) {
    env["MPD_LAUNCHER_ROOT"] = "/srv/music-box";
    env["MPD_LAUNCHER_CONFIG"] = "/etc/mpd-launcher.json";
    env["MPD_LAUNCHER_MPD"] = "/usr/local/bin/mpd";
    env["MPD_LAUNCHER_LOG_LEVEL"] = "DEBUG";

    auto parsed = parse({"mpd-launcher"});

    ASSERT_FALSE(parsed.hasError);
    ASSERT_TRUE(parsed.options.has_value());
    EXPECT_EQ(parsed.options->root.string(), "/srv/music-box");
    EXPECT_EQ(parsed.options->configPath.string(), "/etc/mpd-launcher.json");
    ASSERT_TRUE(parsed.options->mpdBinary.has_value());
    EXPECT_EQ(*parsed.options->mpdBinary, "/usr/local/bin/mpd");
    ASSERT_TRUE(parsed.options->logLevel.has_value());
    EXPECT_TRUE(*parsed.options->logLevel == logging::LogLevel::Debug);
}

TEST_F(LaunchOptionsTest, RelativeRootOverrideIsMadeAbsolute) {
    env["MPD_LAUNCHER_ROOT"] = "relative/root";

    auto parsed = parse({"mpd-launcher"});

    ASSERT_TRUE(parsed.options.has_value());
    EXPECT_TRUE(parsed.options->root.is_absolute());
    EXPECT_EQ(parsed.options->root.filename().string(), "root");
}

TEST_F(LaunchOptionsTest, EmptyEnvironmentValuesAreIgnored) {
    env["MPD_LAUNCHER_MPD"] = "";
    env["MPD_LAUNCHER_ROOT"] = "";

    auto parsed = parse({"mpd-launcher"});

    ASSERT_TRUE(parsed.options.has_value());
    EXPECT_FALSE(parsed.options->mpdBinary.has_value());
    EXPECT_EQ(parsed.options->root.string(), "/opt/app");
}

TEST_F(LaunchOptionsTest, FallsBackToPasswdHome) {
    env.erase("HOME");

    auto parsed = parse({"mpd-launcher"});

    ASSERT_TRUE(parsed.options.has_value());
    EXPECT_EQ(parsed.options->home.string(), "/home/from-passwd");
}

TEST_F(LaunchOptionsTest, EmptyHomeIsTreatedAsUnset) {
    env["HOME"] = "";

    auto parsed = parse({"mpd-launcher"});

    ASSERT_TRUE(parsed.options.has_value());
    EXPECT_EQ(parsed.options->home.string(), "/home/from-passwd");
}

TEST_F(LaunchOptionsTest, MissingHomeIsAnError) {
    env["HOME"] = "";
    passwdHome.reset();

    auto parsed = parse({"mpd-launcher"});

    EXPECT_TRUE(parsed.hasError);
    EXPECT_FALSE(parsed.options.has_value());
    EXPECT_EQ(parsed.error.code, ErrorCode::VALIDATION_HOME_NOT_FOUND);
}

TEST_F(LaunchOptionsTest, MissingRootIsAnError) {
    exeDir.reset();

    auto parsed = parse({"mpd-launcher"});

    EXPECT_TRUE(parsed.hasError);
    EXPECT_EQ(parsed.error.code, ErrorCode::VALIDATION_ROOT_NOT_FOUND);
}

TEST_F(LaunchOptionsTest, RejectsInvalidLogLevel) {
    env["MPD_LAUNCHER_LOG_LEVEL"] = "verbose";

    auto parsed = parse({"mpd-launcher"});

    EXPECT_TRUE(parsed.hasError);
    EXPECT_FALSE(parsed.options.has_value());
    EXPECT_EQ(parsed.error.code, ErrorCode::VALIDATION_INVALID_LOG_LEVEL);
    EXPECT_EQ(toExitStatus(parsed.error.code), 1);
}

TEST(ExecutableDirectory, PointsAtTheTestBinaryDirectory) {
    auto dir = executableDirectory();

    ASSERT_TRUE(dir.has_value());
    EXPECT_TRUE(std::filesystem::is_directory(*dir));
}
