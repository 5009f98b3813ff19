#ifndef WORDLIST_PROGRESS_REPORTER_H
#define WORDLIST_PROGRESS_REPORTER_H

#include <chrono>
#include <cstdint>
#include <ostream>

#include <boost/optional.hpp>

#include "stopwatch.h"

//! Live progress line, redrawn in place at most once per interval
/**
 * Purely observational: it never influences what is generated.
 */
class ProgressReporter {
 public:
  struct Snapshot {
    uint64_t file_number = 0;
    uint64_t position = 0;
    uint64_t total = 0;
    double percent = 0;

    //! Entries per second since the previous report
    double speed = 0;

    //! Unknown while the speed is zero
    boost::optional<std::chrono::seconds> eta;
  };

  static constexpr unsigned kBarWidth = 50;

  ProgressReporter(const Clock* clock, uint64_t total, Clock::Duration interval, std::ostream* out);

  //! Accounts emitted entries, position is the next index to be generated
  //! Returns true if the line was redrawn
  bool Update(uint64_t position, uint64_t file_number, uint64_t emitted);

  //! Ends the redrawn line, so the next output starts on a fresh one
  void BreakLine();

  const boost::optional<Snapshot>& last() const {
    return last_;
  }

  unsigned reports_count() const {
    return reports_count_;
  }

 private:
  void Print(const Snapshot& s);

  ClickTimer timer_;
  uint64_t total_;
  Clock::Duration interval_;
  std::ostream* out_;

  uint64_t emitted_since_report_ = 0;
  bool line_open_ = false;
  unsigned reports_count_ = 0;
  boost::optional<Snapshot> last_;
};

#endif //WORDLIST_PROGRESS_REPORTER_H
