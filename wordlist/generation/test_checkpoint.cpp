#include <ostream>
#include <sstream>
#include <streambuf>

#include "gtest/gtest.h"
#include "checkpoint.h"
#include "internal/temp_dir.h"

namespace {

using internal::TempDir;

GitCheckpoint::Settings SettingsFor(std::string program, const TempDir& dir) {
  GitCheckpoint::Settings s;
  s.program = std::move(program);
  s.work_tree = dir.path();
  s.timeout = std::chrono::seconds(30);
  return s;
}

TEST(GitCheckpoint, Steps) {
  TempDir dir;
  std::ostringstream log;
  auto settings = SettingsFor("git", dir);
  settings.remote = "backup";
  settings.branch = "wordlist";
  GitCheckpoint c(settings, &log);

  auto steps = c.Steps(20, "combos_000020.txt");
  ASSERT_EQ(3u, steps.size());

  auto work_tree = dir.path().string();
  EXPECT_EQ((std::vector<std::string>{"-C", work_tree, "add", "."}), steps[0]);
  EXPECT_EQ((std::vector<std::string>{"-C", work_tree, "commit", "-m",
                                      "Wordlist progress: added files up to combos_000020.txt (20 files)"}), steps[1]);
  EXPECT_EQ((std::vector<std::string>{"-C", work_tree, "push", "backup", "wordlist"}), steps[2]);
}

TEST(GitCheckpoint, Success) {
  TempDir dir;
  std::ostringstream log;
  GitCheckpoint c(SettingsFor("true", dir), &log);
  EXPECT_TRUE(c.Attempt(3, "combos_000003.txt"));
  EXPECT_NE(std::string::npos, log.str().find("Successfully"));
}

TEST(GitCheckpoint, FailedStepStopsAttempt) {
  TempDir dir;
  std::ostringstream log;
  GitCheckpoint c(SettingsFor("false", dir), &log);
  EXPECT_FALSE(c.Attempt(3, "combos_000003.txt"));
  EXPECT_NE(std::string::npos, log.str().find("WARNING: false add failed: exit code 1"));
  EXPECT_EQ(std::string::npos, log.str().find("commit failed"));
}

TEST(GitCheckpoint, MissingProgram) {
  TempDir dir;
  std::ostringstream log;
  GitCheckpoint c(SettingsFor((dir / "no-such-git").string(), dir), &log);
  EXPECT_FALSE(c.Attempt(1, "combos_000001.txt"));
  EXPECT_NE(std::string::npos, log.str().find("WARNING"));
}

// rejects every character
struct FullBuffer : std::streambuf { };

TEST(GitCheckpoint, BrokenLogIsNotFatal) {
  TempDir dir;
  FullBuffer buffer;
  std::ostream log(&buffer);
  log.exceptions(std::ios_base::badbit);

  GitCheckpoint c(SettingsFor("true", dir), &log);
  testing::internal::CaptureStderr();
  bool result = true;
  EXPECT_NO_THROW(result = c.Attempt(2, "combos_000002.txt"));
  auto err = testing::internal::GetCapturedStderr();
  EXPECT_FALSE(result);
  EXPECT_NE(std::string::npos, err.find("WARNING: checkpoint failed"));
}

TEST(GitCheckpoint, Timeout) {
  TempDir dir;
  auto script = dir / "slow-git";
  internal::WriteFile(script, "#!/bin/sh\nsleep 30\n");
  boost::filesystem::permissions(script, boost::filesystem::owner_all);

  std::ostringstream log;
  auto settings = SettingsFor(script.string(), dir);
  settings.timeout = std::chrono::seconds(1);
  GitCheckpoint c(settings, &log);

  auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(c.Attempt(1, "combos_000001.txt"));
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(10));
  EXPECT_NE(std::string::npos, log.str().find("timed out"));
}

TEST(NoCheckpoint, AlwaysSucceeds) {
  NoCheckpoint c;
  EXPECT_TRUE(c.Attempt(20, "combos_000020.txt"));
}

} //anonymous
