#include "progress_reporter.h"

#include <algorithm>
#include <cmath>

#include <fmt/format.h>
#include <fmt/ostream.h>

#include "human_readable.h"

constexpr unsigned ProgressReporter::kBarWidth;

ProgressReporter::ProgressReporter(const Clock* clock, uint64_t total, Clock::Duration interval, std::ostream* out)
    : timer_(clock)
    , total_(total)
    , interval_(interval)
    , out_(out)
{ }

bool ProgressReporter::Update(uint64_t position, uint64_t file_number, uint64_t emitted) {
  emitted_since_report_ += emitted;

  auto elapsed = timer_.SinceClick();
  if (elapsed < interval_ || elapsed <= Clock::Duration::zero()) {
    return false;
  }
  timer_.Click();

  Snapshot s;
  s.file_number = file_number;
  s.position = position;
  s.total = total_;
  s.percent = total_ == 0 ? 100.0 : 100.0 * static_cast<double>(position) / static_cast<double>(total_);
  s.speed = static_cast<double>(emitted_since_report_) / std::chrono::duration<double>(elapsed).count();
  if (s.speed > 0) {
    auto remaining = static_cast<double>(total_ - std::min(position, total_));
    s.eta = std::chrono::seconds(static_cast<std::chrono::seconds::rep>(std::ceil(remaining / s.speed)));
  }

  emitted_since_report_ = 0;
  ++reports_count_;
  last_ = s;
  Print(s);
  return true;
}

void ProgressReporter::Print(const Snapshot& s) {
  auto filled = std::min(kBarWidth, static_cast<unsigned>(s.percent / 100.0 * kBarWidth));
  std::string bar(filled, '#');
  bar.append(kBarWidth - filled, '.');

  fmt::print(*out_, "\rFile {:06} | {} {:8.4f}% | {:>13} / {} | Speed: {:>10.0f}/s | ETA: {:<12}",
      s.file_number,
      bar,
      s.percent,
      GroupThousands(s.position),
      GroupThousands(s.total),
      s.speed,
      s.eta ? ToHumanString(*s.eta) : std::string("--"));
  out_->flush();
  line_open_ = true;
}

void ProgressReporter::BreakLine() {
  if (line_open_) {
    *out_ << "\n";
    line_open_ = false;
  }
}
