#include <gtest/gtest.h>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <sstream>
#include <string>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace {

const std::string binary = KBDOSD_BINARY;
const std::string data = KBDOSD_TEST_DATA;

pid_t
spawn(const std::vector<std::string>& args, const std::string& outputPath)
{
  pid_t pid = fork();
  if (pid == 0) {
    FILE* out = std::fopen(outputPath.c_str(), "w");
    if (out != nullptr) {
      dup2(fileno(out), STDOUT_FILENO);
      dup2(fileno(out), STDERR_FILENO);
    }
    std::vector<char*> argv;
    for (const auto& arg : args) {
      argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    execv(argv[0], argv.data());
    std::_Exit(127);
  }
  return pid;
}

int
exitCode(pid_t pid)
{
  int status = 0;
  if (waitpid(pid, &status, 0) != pid) {
    return -1;
  }
  return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

std::string
slurp(const std::string& path)
{
  std::ifstream in(path);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

struct Run
{
  int code;
  std::string output;
};

Run
run(const std::vector<std::string>& args)
{
  std::string outputPath = (fs::temp_directory_path() / "kbdosd-startup.log").string();
  std::vector<std::string> full = { binary };
  full.insert(full.end(), args.begin(), args.end());
  int code = exitCode(spawn(full, outputPath));
  return { code, slurp(outputPath) };
}

bool
waitFor(const std::function<bool()>& ready, int attempts = 100, int sleepMs = 100)
{
  for (int i = 0; i < attempts; ++i) {
    if (ready()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(sleepMs));
  }
  return false;
}

}

TEST(StartupSpec, CheckReportsAValidLayout)
{
  auto result = run({ "--check", "--config-path", data + "/keys.yaml" });
  EXPECT_EQ(result.code, 0) << result.output;
  EXPECT_NE(result.output.find("Basic validation (overlaps, duplicates, positive "
                               "dimensions) passed."),
            std::string::npos);
  EXPECT_NE(result.output.find("Label (Name)"), std::string::npos);
  EXPECT_NE(result.output.find("Position:             bottom-center"),
            std::string::npos);
  EXPECT_NE(result.output.find("Configuration check finished."), std::string::npos);
}

TEST(StartupSpec, CheckRejectsOverlappingKeys)
{
  auto result = run({ "--check", "--config-path", data + "/overlapping.yaml" });
  EXPECT_EQ(result.code, 1) << result.output;
  EXPECT_NE(result.output.find("Configuration validation failed:"), std::string::npos);
  EXPECT_NE(result.output.find("overlaps with key 'W'"), std::string::npos);
}

TEST(StartupSpec, UnknownKeycodeFailsToLoad)
{
  auto result = run({ "--check", "--config-path", data + "/bad_keycode.yaml" });
  EXPECT_EQ(result.code, 1) << result.output;
  EXPECT_NE(result.output.find("Unknown key name: 'notakey'"), std::string::npos);
}

TEST(StartupSpec, MissingConfigFailsToLoad)
{
  auto result = run({ "--check", "--config-path", data + "/does-not-exist.yaml" });
  EXPECT_EQ(result.code, 1);
  EXPECT_NE(result.output.find("Failed to read configuration file"), std::string::npos);
}

TEST(StartupSpec, UnknownArgumentPrintsUsage)
{
  auto result = run({ "--frobnicate" });
  EXPECT_EQ(result.code, 1);
  EXPECT_NE(result.output.find("Usage:"), std::string::npos);
}

TEST(StartupSpec, FlagWithoutValuePrintsUsage)
{
  auto result = run({ "--config-path" });
  EXPECT_EQ(result.code, 1);
  EXPECT_NE(result.output.find("config-path"), std::string::npos);
  EXPECT_NE(result.output.find("Usage:"), std::string::npos);
}

TEST(StartupSpec, HelpListsEveryFlag)
{
  auto result = run({ "--help" });
  EXPECT_EQ(result.code, 0);
  for (const char* flag : { "--config-path", "--check", "--window-color",
                            "--log-level", "--log-file", "--help" }) {
    EXPECT_NE(result.output.find(flag), std::string::npos) << flag;
  }
}

TEST(StartupSpec, NoDisplayIsASessionError)
{
  std::string outputPath = (fs::temp_directory_path() / "kbdosd-nodisplay.log").string();
  pid_t pid = fork();
  if (pid == 0) {
    setenv("WAYLAND_DISPLAY", "kbdosd-test-no-such-display", 1);
    std::vector<std::string> args = { binary, "--config-path", data + "/keys.yaml" };
    pid_t child = spawn(args, outputPath);
    std::_Exit(exitCode(child));
  }
  EXPECT_EQ(exitCode(pid), 1);
  EXPECT_NE(slurp(outputPath).find("display session failed"), std::string::npos);
}

// Runs the overlay inside a headless sway and stops it with SIGTERM.
class HeadlessSmokeTest : public ::testing::Test
{
protected:
  pid_t swayPid = -1;
  std::string runtimeDir;

  void SetUp() override
  {
    if (std::system("command -v sway >/dev/null 2>&1") != 0) {
      GTEST_SKIP() << "sway is not installed";
    }
    runtimeDir = (fs::temp_directory_path() / "kbdosd-xdg").string();
    fs::remove_all(runtimeDir);
    fs::create_directories(runtimeDir);
    std::error_code ec;
    fs::permissions(
      runtimeDir, fs::perms::owner_all, fs::perm_options::replace, ec);
    std::string swayConfig = runtimeDir + "/sway.conf";
    std::ofstream(swayConfig, std::ios::trunc).close();

    setenv("XDG_RUNTIME_DIR", runtimeDir.c_str(), 1);
    setenv("WLR_BACKENDS", "headless", 1);
    setenv("WLR_LIBINPUT_NO_DEVICES", "1", 1);
    unsetenv("WAYLAND_DISPLAY");

    swayPid = fork();
    if (swayPid == 0) {
      execlp("sway", "sway", "-c", swayConfig.c_str(), (char*)nullptr);
      std::_Exit(127);
    }
    ASSERT_GT(swayPid, 0);

    std::string socket;
    bool up = waitFor([&]() {
      for (const auto& entry : fs::directory_iterator(runtimeDir)) {
        auto name = entry.path().filename().string();
        if (name.rfind("wayland-", 0) == 0 && entry.is_socket()) {
          socket = name;
          return true;
        }
      }
      return false;
    });
    if (!up) {
      GTEST_SKIP() << "headless sway did not come up";
    }
    setenv("WAYLAND_DISPLAY", socket.c_str(), 1);
  }

  void TearDown() override
  {
    if (swayPid > 0) {
      kill(swayPid, SIGTERM);
      exitCode(swayPid);
      swayPid = -1;
    }
  }
};

TEST_F(HeadlessSmokeTest, StartsAndStopsCleanly)
{
  std::string outputPath = runtimeDir + "/kbdosd.log";
  pid_t pid = spawn({ binary, "--config-path", data + "/keys.yaml" }, outputPath);
  ASSERT_GT(pid, 0);

  bool looping = waitFor([&]() {
    return slurp(outputPath).find("entering event loop") != std::string::npos;
  });
  kill(pid, SIGTERM);
  int code = exitCode(pid);

  auto output = slurp(outputPath);
  ASSERT_TRUE(looping) << output;
  EXPECT_EQ(code, 0) << output;
  EXPECT_NE(output.find("stop requested; shutting down"), std::string::npos);
}
