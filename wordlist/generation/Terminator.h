#ifndef WORDLIST_TERMINATOR_H
#define WORDLIST_TERMINATOR_H

#include <atomic>
#include <thread>

//! Some handle over SIGTERM/SIGINT
/**
 * Spawns a separate thread which waits for the signals with sigwait.
 * Must be created in the main thread before any other thread is started,
 * so that the blocked signal mask is inherited.
 */
class Terminator
{
 public:
  //! thread-safe, always false then true after the first SIGTERM/SIGINT
  bool ShouldTerminate() const {
    return should_terminate_.load();
  }

  //! Since it must be unique for the whole program,
  //! constructor will throw if called twice
  Terminator();

  //! Non-movable, non-copyable
  Terminator(const Terminator&)=delete;
  Terminator& operator=(const Terminator&)=delete;

  //! Wakes up the signal thread if no signal came and joins it
  ~Terminator();

 private:
  void ScheduleTermination();

  std::thread signal_handler_;
  std::atomic_bool should_terminate_{false};
  std::atomic_bool stopping_{false};
};

#endif //WORDLIST_TERMINATOR_H
