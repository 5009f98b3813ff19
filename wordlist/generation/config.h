#ifndef WORDLIST_CONFIG_H
#define WORDLIST_CONFIG_H

#include <chrono>
#include <cstdint>
#include <string>

#include <boost/filesystem.hpp>
#include <nlohmann/json.hpp>

using boost::filesystem::path;
using json = nlohmann::json;
namespace fs = boost::filesystem;

/*
 * Files of a run, all relative to the base directory unless absolute:
 *  - wordlist.conf.json (optional)
 *  - state.txt          index of the last entry of the last completed file
 *  - combos_000001.txt
 *  - combos_000002.txt
 *  - ...
 */
struct Config {

  //! The base path for all data files, current_path by default
  path base_dir_ = ".";

  //! Path to the config file, with which this config is synchronised
  path config_path_ = "./wordlist.conf.json";

  //! Symbols the strings are built from, in enumeration order
  std::string alphabet_ = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789_.";

  //! Strings of length 1 to max_length_ are generated
  unsigned max_length_ = 4;

  uint64_t entries_per_file_ = 2000000;

  //! Granularity of writes and progress updates, independent of the file size
  uint64_t batch_size_ = 250000;

  //! Checkpoint is taken every that many completed files
  uint64_t checkpoint_every_ = 20;

  path output_dir_ = ".";

  //! Output file is file_prefix_ + 6-digit file number + file_suffix_, ".gz" compresses it
  std::string file_prefix_ = "combos_";
  std::string file_suffix_ = ".txt";

  path state_file_ = "state.txt";

  std::chrono::milliseconds progress_interval_{150};

  bool checkpoint_enabled_ = true;
  std::string git_program_ = "git";
  std::string git_remote_ = "origin";
  std::string git_branch_ = "main";

  //! Each checkpoint step is killed after that time, zero means wait forever
  std::chrono::seconds checkpoint_timeout_{600};

  path output_dir() const {
    if (output_dir_.is_absolute()) {
      return output_dir_;
    }
    return base_dir_ / output_dir_;
  }

  path state_file() const {
    if (state_file_.is_absolute()) {
      return state_file_;
    }
    return base_dir_ / state_file_;
  }

  //! git work tree of a checkpoint, holds both the output files and the state file by default
  path checkpoint_dir() const {
    return base_dir_;
  }

  std::string OutputFileName(uint64_t file_number) const;

  path OutputFile(uint64_t file_number) const {
    return output_dir() / path(OutputFileName(file_number));
  }

  bool CompressOutput() const {
    return path(file_suffix_).extension() == ".gz";
  }

  Config()
      : base_dir_(boost::filesystem::current_path())
  { }

  //! Throws std::runtime_error on a configuration which can't be run
  void Validate() const;

  std::string ConfigAsString() const {
    return AsJson().dump(4);
  }

  json AsJson() const;

  void DumpConfig() const;

  //! Overrides only the keys which are present
  void LoadFromJson(const json& config);

  //! Loads the file, or creates it with the current values if it does not exist
  void LoadFromJson(path json_path);

 private:
  template<typename T>
  static void ConfigFromJson(const json& config, const char* name, T* var);

  static void ConfigFromJson(const json& config, const char* name, path* var) {
    std::string temp;
    ConfigFromJson(config, name, &temp);
    if (!temp.empty()) {
      *var = temp;
    }
  }
};

template<typename T>
void Config::ConfigFromJson(const json& config, const char* name, T* var) {
  auto val = config.find(name);
  if (val == config.end()) {
    return;
  }
  try {
    *var = val->get<T>();
  } catch (const json::exception& e) {
    throw std::runtime_error(std::string("Config key '") + name + "' has a wrong type: " + e.what());
  }
}

#endif //WORDLIST_CONFIG_H
