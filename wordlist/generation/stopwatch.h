#ifndef WORDLIST_STOPWATCH_H
#define WORDLIST_STOPWATCH_H

#include <chrono>
#include <type_traits>

//! Source of time, may be replaced to simulate elapsed time
class Clock {
 public:
  using Base = typename std::conditional<
      std::chrono::high_resolution_clock::is_steady,
            std::chrono::high_resolution_clock,
            std::chrono::steady_clock>::type;
  using Duration = Base::duration;
  using TimePoint = Base::time_point;

  virtual TimePoint Now() const = 0;

  virtual ~Clock() = default;
};

class SteadyClock : public Clock {
 public:
  TimePoint Now() const override {
    return Base::now();
  }
};

//! Measures time between clicks
class ClickTimer {
 public:
  using Duration = Clock::Duration;

  //! The first interval starts at construction
  explicit ClickTimer(const Clock* clock)
      : clock_(clock)
      , started_(clock->Now())
      , last_click_(started_)
  { }

  //! Click and return time since the last click
  Duration Click() {
    auto now = clock_->Now();
    auto since_last = now - last_click_;
    last_click_ = now;
    return since_last;
  }

  //! Time since the last click, without clicking
  Duration SinceClick() const {
    return clock_->Now() - last_click_;
  }

  Duration Total() const {
    return clock_->Now() - started_;
  }

 private:
  const Clock* clock_;
  Clock::TimePoint started_;
  Clock::TimePoint last_click_;
};

#endif //WORDLIST_STOPWATCH_H
