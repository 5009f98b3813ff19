#ifndef WORDLIST_BATCH_WRITER_H
#define WORDLIST_BATCH_WRITER_H

#include <cstdint>
#include <functional>
#include <ostream>
#include <string>

#include <wordlist/enumeration/index_mapper.h>

#include "checkpoint.h"
#include "config.h"
#include "cursor_store.h"
#include "stopwatch.h"

class ProgressReporter;

struct RunSummary {
  //! The index the run started from
  uint64_t first_index = 0;

  //! The index the next run would start from
  uint64_t next_index = 0;

  //! Entries written to files completed by this run
  uint64_t generated = 0;

  uint64_t files_written = 0;

  //! Completed files, including the ones from the previous runs
  uint64_t files_completed = 0;

  uint64_t checkpoints_attempted = 0;
  uint64_t checkpoints_failed = 0;

  bool finished = false;
  bool interrupted = false;

  Clock::Duration elapsed{};
};

//! Writes all strings of the universe into numbered files, resuming from the persisted cursor
/**
 * Files are created and completed strictly in the increasing order. The cursor
 * is persisted only after a file is flushed and closed, so an interrupted run
 * redoes at most one file, from its first entry.
 */
class BatchWriter {
 public:
  using Index = wordlist::IndexMapper::Index;

  //! Returns true when the generation should stop at the next batch boundary
  using StopPredicate = std::function<bool()>;

  //! Validates the config; clock, checkpoint and streams must outlive the writer
  BatchWriter(Config config, const Clock* clock, Checkpoint* checkpoint, std::ostream* console, std::ostream* log);

  void SetStopPredicate(StopPredicate should_stop) {
    should_stop_ = std::move(should_stop);
  }

  //! Runs until the universe is exhausted or the stop predicate fires
  /**
   * Throws on a failure to create or write an output file.
   */
  RunSummary Run();

  //! The index to continue from, derived from the persisted cursor
  Index ResumePosition() const;

  //! Completed files before the index, the index is a file boundary or total
  uint64_t FilesBefore(Index next) const;

  uint64_t FilesCount() const {
    const auto kPerFile = config_.entries_per_file_;
    return mapper_.total() / kPerFile + (mapper_.total() % kPerFile != 0 ? 1 : 0);
  }

  const wordlist::IndexMapper& mapper() const {
    return mapper_;
  }

  const Config& config() const {
    return config_;
  }

 private:
  void PrintBanner() const;
  void PrintSummary(const RunSummary& summary) const;

  //! Writes the whole file which starts at first, returns false if stopped before its end
  bool WriteFile(uint64_t file_number, Index first, Index end, ProgressReporter* progress);

  void PersistCursor(Index last_written) const;
  void TakeCheckpoint(uint64_t files_completed, uint64_t file_number, RunSummary* summary);

  const Config config_;
  const wordlist::IndexMapper mapper_;
  const Clock* clock_;
  Checkpoint* checkpoint_;
  std::ostream* console_;
  std::ostream* log_;
  CursorStore cursor_;
  StopPredicate should_stop_;
};

#endif //WORDLIST_BATCH_WRITER_H
