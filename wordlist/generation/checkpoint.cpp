#include "checkpoint.h"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <iostream>

#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/format.h>
#include <fmt/ostream.h>

extern char** environ;

GitCheckpoint::GitCheckpoint(Settings settings, std::ostream* log)
    : settings_(std::move(settings))
    , log_(log)
{ }

std::string GitCheckpoint::CommitMessage(uint64_t files_completed, const std::string& last_file_name) {
  return fmt::format("Wordlist progress: added files up to {} ({} files)", last_file_name, files_completed);
}

std::vector<std::vector<std::string>> GitCheckpoint::Steps(uint64_t files_completed,
                                                          const std::string& last_file_name) const {
  auto work_tree = settings_.work_tree.string();
  return {
      {"-C", work_tree, "add", "."},
      {"-C", work_tree, "commit", "-m", CommitMessage(files_completed, last_file_name)},
      {"-C", work_tree, "push", settings_.remote, settings_.branch},
  };
}

bool GitCheckpoint::Attempt(uint64_t files_completed, const std::string& last_file_name) noexcept {
  try {
    fmt::print(*log_, "Committing and pushing progress ({} files completed)...\n", files_completed);
    for (auto&& step : Steps(files_completed, last_file_name)) {
      auto error = Run(step);
      if (!error.empty()) {
        fmt::print(*log_, "WARNING: {} {} failed: {}, checkpoint skipped\n", settings_.program, step[2], error);
        return false;
      }
    }
    fmt::print(*log_, "Successfully committed and pushed\n");
    return true;
  } catch (const std::exception& e) {
    // out of memory or a broken log stream, still not a reason to stop the generation
    fmt::print(std::cerr, "WARNING: checkpoint failed: {}\n", e.what());
    return false;
  }
}

std::string GitCheckpoint::Run(const std::vector<std::string>& args) const {
  std::vector<char*> argv;
  argv.reserve(args.size() + 2);
  argv.push_back(const_cast<char*>(settings_.program.c_str()));
  for (auto&& arg : args) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);

  log_->flush();

  // signals may be blocked for the signal thread, the child gets the default mask
  posix_spawnattr_t attr;
  posix_spawnattr_init(&attr);
  sigset_t no_signals;
  sigemptyset(&no_signals);
  posix_spawnattr_setsigmask(&attr, &no_signals);
  posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETSIGMASK);

  pid_t pid = 0;
  auto spawn_error = posix_spawnp(&pid, argv[0], nullptr, &attr, argv.data(), environ);
  posix_spawnattr_destroy(&attr);
  if (spawn_error != 0) {
    return fmt::format("can't start: {}", std::strerror(spawn_error));
  }

  auto start = std::chrono::steady_clock::now();
  int status = 0;
  while (true) {
    auto waited = waitpid(pid, &status, settings_.timeout.count() == 0 ? 0 : WNOHANG);
    if (waited == pid) {
      break;
    }
    if (waited == -1) {
      if (errno == EINTR) {
        continue;
      }
      return fmt::format("waitpid failed: {}", std::strerror(errno));
    }
    if (std::chrono::steady_clock::now() - start > settings_.timeout) {
      kill(pid, SIGKILL);
      while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {
      }
      return fmt::format("timed out after {}s", settings_.timeout.count());
    }
    usleep(10000);
  }

  if (WIFEXITED(status)) {
    if (WEXITSTATUS(status) == 0) {
      return {};
    }
    return fmt::format("exit code {}", WEXITSTATUS(status));
  }
  if (WIFSIGNALED(status)) {
    return fmt::format("killed by signal {}", WTERMSIG(status));
  }
  return "stopped";
}
