#ifndef WORDLIST_INTERNAL_MANUAL_CLOCK_H
#define WORDLIST_INTERNAL_MANUAL_CLOCK_H

#include "../stopwatch.h"

namespace internal {

//! Time moves only when told to
class ManualClock : public Clock {
 public:
  TimePoint Now() const override {
    now_ += step_;
    return now_;
  }

  void Advance(Duration d) {
    now_ += d;
  }

  //! Every call to Now() moves the time by step
  void SetStep(Duration step) {
    step_ = step;
  }

 private:
  mutable TimePoint now_{};
  Duration step_{};
};

} //namespace internal

#endif //WORDLIST_INTERNAL_MANUAL_CLOCK_H
