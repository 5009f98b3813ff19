#include "BatchWriter.h"

#include <algorithm>
#include <vector>

#include <fmt/format.h>
#include <fmt/ostream.h>

#include "human_readable.h"
#include "output_file.h"
#include "progress_reporter.h"

using Index = BatchWriter::Index;

static Config Validated(Config config) {
  config.Validate();
  return config;
}

BatchWriter::BatchWriter(Config config,
                         const Clock* clock,
                         Checkpoint* checkpoint,
                         std::ostream* console,
                         std::ostream* log)
    : config_(Validated(std::move(config)))
    , mapper_(config_.alphabet_, config_.max_length_)
    , clock_(clock)
    , checkpoint_(checkpoint)
    , console_(console)
    , log_(log)
    , cursor_(config_.state_file(), log)
{ }

Index BatchWriter::ResumePosition() const {
  auto last = cursor_.Load();
  if (!last) {
    return 0;
  }

  const auto kTotal = mapper_.total();
  if (*last >= kTotal) {
    fmt::print(*log_, "Position {} in {} is beyond the last index {}, starting from scratch\n",
        *last, cursor_.state_file().string(), kTotal - 1);
    return 0;
  }

  Index next = *last + 1;
  auto in_file = next % config_.entries_per_file_;
  if (next != kTotal && in_file != 0) {
    // written with another file size, the file containing it is redone from the beginning
    fmt::print(*log_, "Position {} is inside file {}, the file is generated again from index {}\n",
        *last, next / config_.entries_per_file_ + 1, next - in_file);
    next -= in_file;
  }
  return next;
}

uint64_t BatchWriter::FilesBefore(Index next) const {
  if (next >= mapper_.total()) {
    return FilesCount();
  }
  return next / config_.entries_per_file_;
}

void BatchWriter::PrintBanner() const {
  const auto kTotal = mapper_.total();
  const auto kBytes = mapper_.TotalBytes();

  fmt::print(*console_, "Wordlist generator\n");
  fmt::print(*console_, "Alphabet  : {}  ({} symbols)\n", mapper_.alphabet(), mapper_.alphabet().size());
  fmt::print(*console_, "Lengths   : 1 to {} symbols\n", mapper_.max_length());
  fmt::print(*console_, "Total     : {} combinations (~{:.3f} billion)\n",
      GroupThousands(kTotal), static_cast<double>(kTotal) / 1e9);
  fmt::print(*console_, "Per file  : {} entries (~{})\n",
      GroupThousands(config_.entries_per_file_),
      ToHumanReadableByteCount(kBytes / FilesCount()));
  fmt::print(*console_, "Files     : {} total, ~{} uncompressed\n", FilesCount(), ToHumanReadableByteCount(kBytes));
  fmt::print(*console_, "{}\n", std::string(60, '-'));
}

void BatchWriter::PrintSummary(const RunSummary& summary) const {
  auto seconds = std::chrono::duration<double>(summary.elapsed).count();
  auto speed = seconds > 0 ? static_cast<double>(summary.generated) / seconds : 0.0;

  fmt::print(*console_, "\nGeneration complete\n");
  fmt::print(*console_, "Total combinations : {}\n", GroupThousands(mapper_.total()));
  fmt::print(*console_, "Generated this run : {}\n", GroupThousands(summary.generated));
  fmt::print(*console_, "Time taken         : {}\n", ToHumanString(summary.elapsed));
  fmt::print(*console_, "Average speed      : {:.0f} combinations/sec\n", speed);
  fmt::print(*console_, "Total files        : {}\n", summary.files_completed);
  fmt::print(*console_, "All files saved as {}\n",
      (config_.output_dir() / path(config_.file_prefix_ + "XXXXXX" + config_.file_suffix_)).string());
  if (summary.checkpoints_attempted != 0) {
    fmt::print(*console_, "Checkpoints        : {} taken, {} failed\n",
        summary.checkpoints_attempted, summary.checkpoints_failed);
  }
}

bool BatchWriter::WriteFile(uint64_t file_number, Index first, Index end, ProgressReporter* progress) {
  OutputFile out(config_.OutputFile(file_number));

  fmt::memory_buffer batch;
  std::vector<char> word(mapper_.max_length());

  auto pos = first;
  while (pos < end) {
    if (pos != first && should_stop_ && should_stop_()) {
      // the incomplete file is regenerated by the next run
      return false;
    }

    auto batch_end = pos + std::min<Index>(config_.batch_size_, end - pos);
    auto batch_first = pos;

    batch.clear();
    for (; pos < batch_end; ++pos) {
      auto length = mapper_.Render(pos, word.data());
      batch.append(word.data(), word.data() + length);
      batch.push_back('\n');
    }
    out.Write(batch.data(), batch.size());

    progress->Update(pos, file_number, pos - batch_first);
  }

  out.Close();
  return true;
}

void BatchWriter::PersistCursor(Index last_written) const {
  try {
    cursor_.Save(last_written);
  } catch (const std::exception& e) {
    fmt::print(*log_, "ERROR: can't persist position {}: {}\n"
        "ERROR: a restart will generate the completed files again\n", last_written, e.what());
  }
}

void BatchWriter::TakeCheckpoint(uint64_t files_completed, uint64_t file_number, RunSummary* summary) {
  ++summary->checkpoints_attempted;
  if (!checkpoint_->Attempt(files_completed, config_.OutputFileName(file_number))) {
    ++summary->checkpoints_failed;
  }
}

RunSummary BatchWriter::Run() {
  ClickTimer timer(clock_);
  PrintBanner();

  const auto kTotal = mapper_.total();
  const auto kPerFile = config_.entries_per_file_;

  RunSummary summary;
  auto next = ResumePosition();
  summary.first_index = next;
  if (next == 0) {
    fmt::print(*console_, "Starting fresh generation\n\n");
  } else {
    fmt::print(*console_, "Resuming from position {} ({:.4f}% complete)\n\n",
        GroupThousands(next), 100.0 * static_cast<double>(next) / static_cast<double>(kTotal));
  }

  fs::create_directories(config_.output_dir());

  auto files_completed = FilesBefore(next);
  ProgressReporter progress(clock_, kTotal, config_.progress_interval_, console_);

  while (next < kTotal) {
    if (should_stop_ && should_stop_()) {
      summary.interrupted = true;
      break;
    }

    auto file_number = next / kPerFile + 1;
    auto end = kTotal - next > kPerFile ? next + kPerFile : kTotal;

    if (!WriteFile(file_number, next, end, &progress)) {
      summary.interrupted = true;
      break;
    }
    progress.BreakLine();

    PersistCursor(end - 1);

    fmt::print(*console_, "Completed: {} ({} entries), total files: {}\n",
        config_.OutputFileName(file_number), GroupThousands(end - next), files_completed + 1);

    summary.generated += end - next;
    ++summary.files_written;
    ++files_completed;
    next = end;

    if (files_completed % config_.checkpoint_every_ == 0) {
      TakeCheckpoint(files_completed, file_number, &summary);
    }
  }
  progress.BreakLine();

  summary.next_index = next;
  summary.files_completed = files_completed;

  if (summary.interrupted) {
    summary.elapsed = timer.Total();
    fmt::print(*console_, "Stopped, the next run resumes from position {} ({})\n",
        GroupThousands(next), config_.OutputFileName(next / kPerFile + 1));
    return summary;
  }

  summary.finished = true;
  if (files_completed % config_.checkpoint_every_ != 0) {
    TakeCheckpoint(files_completed, FilesCount(), &summary);
  }

  summary.elapsed = timer.Total();
  PrintSummary(summary);
  return summary;
}
