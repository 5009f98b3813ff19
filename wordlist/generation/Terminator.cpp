#include "Terminator.h"

#include <cstdlib>
#include <iostream>
#include <stdexcept>

#include <pthread.h>
#include <signal.h>

#include <fmt/format.h>

static sigset_t TerminationSignals() {
  sigset_t set;
  sigemptyset(&set);
  sigaddset(&set, SIGINT);
  sigaddset(&set, SIGTERM);
  return set;
}

Terminator::Terminator() {
  static std::atomic_flag created = ATOMIC_FLAG_INIT;
  if (created.test_and_set()) {
    throw std::runtime_error("Terminator may be created exactly once.");
  }

  // threads created after this point inherit the mask
  auto set = TerminationSignals();
  int s = pthread_sigmask(SIG_BLOCK, &set, nullptr);
  if (s != 0) {
    throw fmt::system_error(s, "Can't block SIGINT/SIGTERM");
  }

  signal_handler_ = std::thread([this] {
    auto listen_to = TerminationSignals();
    while (true) {
      int sig = 0;
      auto wait_err = sigwait(&listen_to, &sig);
      if (wait_err != 0) {
        std::cerr << "sigwait failed, signals are ignored from now on" << std::endl;
        return;
      }
      if (stopping_.load()) {
        return;
      }
      if (should_terminate_.load()) {
        // the cursor is persisted only for completed files, nothing to lose
        std::_Exit(128 + sig);
      }
      ScheduleTermination();
    }
  });
}

void Terminator::ScheduleTermination() {
  if (should_terminate_.exchange(true) == false) {
    std::clog << "\nTerminating after the current batch (second signal will terminate the process immediately)"
              << std::endl;
  }
}

Terminator::~Terminator() {
  stopping_.store(true);
  // wake up the thread waiting in sigwait
  pthread_kill(signal_handler_.native_handle(), SIGTERM);
  signal_handler_.join();

  auto set = TerminationSignals();
  pthread_sigmask(SIG_UNBLOCK, &set, nullptr);
}
