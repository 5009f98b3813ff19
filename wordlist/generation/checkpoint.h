#ifndef WORDLIST_CHECKPOINT_H
#define WORDLIST_CHECKPOINT_H

#include <chrono>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include <boost/filesystem.hpp>

//! Periodic external persistence of the completed files
/**
 * Best effort: a failed attempt is reported through the return value
 * and must never stop the generation.
 */
class Checkpoint {
 public:
  virtual bool Attempt(uint64_t files_completed, const std::string& last_file_name) noexcept = 0;

  virtual ~Checkpoint() = default;
};

class NoCheckpoint : public Checkpoint {
 public:
  bool Attempt(uint64_t, const std::string&) noexcept override {
    return true;
  }
};

//! Stages everything in a working tree, commits and pushes it
class GitCheckpoint : public Checkpoint {
 public:
  struct Settings {
    std::string program = "git";
    boost::filesystem::path work_tree = ".";
    std::string remote = "origin";
    std::string branch = "main";

    //! Zero waits forever
    std::chrono::seconds timeout{600};
  };

  //! Progress and warnings are printed to log
  GitCheckpoint(Settings settings, std::ostream* log);

  bool Attempt(uint64_t files_completed, const std::string& last_file_name) noexcept override;

  static std::string CommitMessage(uint64_t files_completed, const std::string& last_file_name);

  //! The commands of a single attempt, without the program name
  std::vector<std::vector<std::string>> Steps(uint64_t files_completed, const std::string& last_file_name) const;

 private:
  //! Returns an empty string on success and the failure description otherwise
  std::string Run(const std::vector<std::string>& args) const;

  Settings settings_;
  std::ostream* log_;
};

#endif //WORDLIST_CHECKPOINT_H
