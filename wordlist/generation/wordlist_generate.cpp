#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>

#include <fmt/format.h>
#include <fmt/ostream.h>

#include <sys/resource.h>
#include <sys/time.h>

#include "BatchWriter.h"
#include "checkpoint.h"
#include "config.h"
#include "human_readable.h"
#include "stopwatch.h"
#include "Terminator.h"

static std::unique_ptr<Checkpoint> MakeCheckpoint(const Config& config) {
  if (!config.checkpoint_enabled_) {
    return std::make_unique<NoCheckpoint>();
  }

  GitCheckpoint::Settings settings;
  settings.program = config.git_program_;
  settings.work_tree = config.checkpoint_dir();
  settings.remote = config.git_remote_;
  settings.branch = config.git_branch_;
  settings.timeout = config.checkpoint_timeout_;
  return std::make_unique<GitCheckpoint>(std::move(settings), &std::cout);
}

static std::chrono::microseconds TimevalToDuration(timeval t) {
  return std::chrono::seconds(t.tv_sec) + std::chrono::microseconds(t.tv_usec);
}

static void PrintResourceUsage(std::ostream* out) {
  struct rusage usage;
  if (getrusage(RUSAGE_SELF, &usage) == -1) {
    throw fmt::system_error(errno, "Can't query resource usage");
  }

  fmt::print(*out, "{} CPU time in user mode\n", ToHumanString(TimevalToDuration(usage.ru_utime)));
  fmt::print(*out, "{} CPU time in kernel mode\n", ToHumanString(TimevalToDuration(usage.ru_stime)));
  fmt::print(*out, "Used {} max RAM\n", ToHumanReadableByteCount(static_cast<uint64_t>(usage.ru_maxrss) * 1024));
}

int GenerateWordlist(int argc, char* argv[]) {
  if (argc > 2) {
    fmt::print(std::cerr, "Usage: {} [wordlist.conf.json]\n", argv[0]);
    return EXIT_FAILURE;
  }

  Terminator t;

  Config config;
  if (argc == 2) {
    config.LoadFromJson(path(argv[1]));
  }

  SteadyClock clock;
  auto checkpoint = MakeCheckpoint(config);

  BatchWriter writer(config, &clock, checkpoint.get(), &std::cout, &std::clog);
  writer.SetStopPredicate([&t] { return t.ShouldTerminate(); });

  auto summary = writer.Run();
  PrintResourceUsage(&std::clog);
  if (summary.interrupted) {
    std::clog << "Interrupted, it is safe to run again to continue" << std::endl;
  }
  return EXIT_SUCCESS;
}

int main(int argc, char* argv[]) {
  try {
    return GenerateWordlist(argc, argv);
  } catch (const std::exception& e) {
    std::cout.flush();
    fmt::print(std::cerr, "\nFATAL: {}\n", e.what());
    fmt::print(std::cerr, "The last completed file is recorded, run again to resume\n");
    return EXIT_FAILURE;
  }
}
