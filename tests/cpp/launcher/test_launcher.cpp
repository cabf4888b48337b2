#include "mpd_launcher/launcher/launcher.h"

#include "../mock_daemon.h"
#include "mpd_launcher/runtime/mpd_config_writer.h"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;
using namespace mpd_launcher;
using namespace mpd_launcher::launcher;

namespace {

LaunchOptions makeOptions(const fs::path& root, const fs::path& home) {
    LaunchOptions options;
    options.root = root;
    options.home = home;
    options.configPath = root / "mpd-launcher.json";
    return options;
}

std::string readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

}  // namespace

// ============================================================
// makeSettings
// ============================================================

TEST(MakeSettings, UsesConfiguredBinaryByDefault) {
    LauncherConfig config;
    auto settings = makeSettings(makeOptions("/opt/app", "/home/alice"), config);
    EXPECT_EQ(settings.mpdBinary, "mpd");

    config.mpdBinary = "/usr/local/bin/mpd";
    settings = makeSettings(makeOptions("/opt/app", "/home/alice"), config);
    EXPECT_EQ(settings.mpdBinary, "/usr/local/bin/mpd");
}

TEST(MakeSettings, EnvironmentBinaryWins) {
    LauncherConfig config;
    config.mpdBinary = "/usr/local/bin/mpd";
    auto options = makeOptions("/opt/app", "/home/alice");
    options.mpdBinary = "/opt/mpd-git/bin/mpd";

    auto settings = makeSettings(options, config);

    EXPECT_EQ(settings.mpdBinary, "/opt/mpd-git/bin/mpd");
}

TEST(MakeSettings, CarriesLayoutAndForwardedArgs) {
    auto options = makeOptions("/opt/app", "/home/alice");
    options.forwardedArgs = {"--verbose"};

    auto settings = makeSettings(options, LauncherConfig{});

    EXPECT_EQ(settings.layout.configFile.string(), "/opt/app/.mpd/mpd.conf");
    EXPECT_EQ(settings.layout.musicDir.string(), "/home/alice/Music");
    EXPECT_EQ(settings.forwardedArgs, (std::vector<std::string>{"--verbose"}));
}

// ============================================================
// Launcher
// ============================================================

TEST(Launcher, DaemonArgvForScenario) {
    auto options = makeOptions("/opt/app", "/home/alice");
    Launcher launcher(makeSettings(options, LauncherConfig{}));

    EXPECT_EQ(launcher.daemonArgv(),
              (std::vector<std::string>{"mpd", "--no-daemon", "/opt/app/.mpd/mpd.conf"}));
}

TEST(Launcher, DaemonArgvAppendsForwardedArgs) {
    auto options = makeOptions("/opt/app", "/home/alice");
    options.forwardedArgs = {"--verbose", "--stderr"};
    Launcher launcher(makeSettings(options, LauncherConfig{}));

    EXPECT_EQ(launcher.daemonArgv(),
              (std::vector<std::string>{"mpd", "--no-daemon", "/opt/app/.mpd/mpd.conf",
                                        "--verbose", "--stderr"}));
}

class LauncherTest : public ::testing::Test {
   protected:
    fs::path tempDir;
    fs::path root;

    void SetUp() override {
        tempDir = fs::temp_directory_path() /
                  ("mpd_launcher_launcher_test_" + std::to_string(getpid()));
        root = tempDir / "app";
        fs::remove_all(tempDir);
        fs::create_directories(root);
    }

    void TearDown() override {
        fs::remove_all(tempDir);
    }

    // Runs Launcher::run() in a child and returns its exit status
    static int runInChild(const Launcher& launcher) {
        pid_t pid = fork();
        if (pid == 0) {
            auto error = launcher.run();
            _exit(toExitStatus(error.code));
        }
        int status = 0;
        if (pid < 0 || waitpid(pid, &status, 0) != pid || !WIFEXITED(status)) {
            return -1;
        }
        return WEXITSTATUS(status);
    }
};

TEST_F(LauncherTest, PrepareBuildsRuntimeDirectory) {
    Launcher launcher(makeSettings(makeOptions(root, "/home/alice"), LauncherConfig{}));
    const auto& layout = launcher.settings().layout;

    auto error = launcher.prepare();

    ASSERT_FALSE(error.has_value()) << error->describe();
    EXPECT_TRUE(fs::is_directory(layout.playlistDir));
    EXPECT_EQ(readFile(layout.configFile), runtime::renderMpdConfig(layout));
}

TEST_F(LauncherTest, PrepareDiscardsPreviousRunState) {
    Launcher launcher(makeSettings(makeOptions(root, "/home/alice"), LauncherConfig{}));
    const auto& layout = launcher.settings().layout;
    fs::create_directories(layout.playlistDir);
    std::ofstream(layout.dbFile) << "stale database";
    std::ofstream(layout.playlistDir / "old.m3u") << "stale playlist";

    ASSERT_FALSE(launcher.prepare().has_value());

    EXPECT_FALSE(fs::exists(layout.dbFile));
    EXPECT_TRUE(fs::is_empty(layout.playlistDir));
    EXPECT_TRUE(fs::exists(layout.configFile));
}

TEST_F(LauncherTest, RunExecsDaemonWithForwardedArgs) {
    test_support::MockDaemon daemon(tempDir, 0);
    auto options = makeOptions(root, "/home/alice");
    options.mpdBinary = daemon.script().string();
    options.forwardedArgs = {"--verbose", "--stderr"};
    Launcher launcher(makeSettings(options, LauncherConfig{}));

    const int status = runInChild(launcher);

    EXPECT_EQ(status, 0);
    auto recorded = daemon.recordedArgs();
    ASSERT_TRUE(recorded.has_value());
    EXPECT_EQ(*recorded,
              (std::vector<std::string>{"--no-daemon",
                                        launcher.settings().layout.configFile.string(),
                                        "--verbose", "--stderr"}));
    EXPECT_TRUE(fs::exists(launcher.settings().layout.configFile));
}

TEST_F(LauncherTest, DaemonExitStatusBecomesProcessStatus) {
    test_support::MockDaemon daemon(tempDir, 3);
    auto options = makeOptions(root, "/home/alice");
    options.mpdBinary = daemon.script().string();
    Launcher launcher(makeSettings(options, LauncherConfig{}));

    EXPECT_EQ(runInChild(launcher), 3);
}

TEST_F(LauncherTest, MissingDaemonExitsWith127) {
    auto options = makeOptions(root, "/home/alice");
    options.mpdBinary = (tempDir / "no-such-mpd").string();
    Launcher launcher(makeSettings(options, LauncherConfig{}));

    EXPECT_EQ(runInChild(launcher), 127);
    // Preparation happened before the exec attempt
    EXPECT_TRUE(fs::exists(launcher.settings().layout.configFile));
}

TEST_F(LauncherTest, PreparationFailureNeverStartsDaemon) {
    test_support::MockDaemon daemon(tempDir, 0);
    const fs::path fileRoot = tempDir / "not-a-directory";
    std::ofstream(fileRoot) << "occupied";
    auto options = makeOptions(fileRoot, "/home/alice");
    options.mpdBinary = daemon.script().string();
    Launcher launcher(makeSettings(options, LauncherConfig{}));

    auto error = launcher.prepare();
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->code, ErrorCode::FS_RUNTIME_DIR_CREATE_FAILED);

    EXPECT_EQ(runInChild(launcher), 1);
    EXPECT_FALSE(daemon.wasInvoked());
}
