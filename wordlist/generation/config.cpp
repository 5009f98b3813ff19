#include "config.h"

#include <cerrno>
#include <stdexcept>

#include <boost/filesystem/fstream.hpp>
#include <fmt/format.h>

#include <wordlist/enumeration/index_mapper.h>

std::string Config::OutputFileName(uint64_t file_number) const {
  return fmt::format("{}{:06}{}", file_prefix_, file_number, file_suffix_);
}

void Config::Validate() const {
  if (entries_per_file_ == 0) {
    throw std::runtime_error("entries_per_file must be positive");
  }
  if (batch_size_ == 0) {
    throw std::runtime_error("batch_size must be positive");
  }
  if (checkpoint_every_ == 0) {
    throw std::runtime_error("checkpoint_every must be positive");
  }
  if (state_file_.empty()) {
    throw std::runtime_error("state_file must not be empty");
  }

  // the mapper checks the alphabet and that the universe fits into 64 bits
  try {
    wordlist::IndexMapper mapper(alphabet_, max_length_);
  } catch (const std::exception& e) {
    throw std::runtime_error(fmt::format("Bad alphabet or max_length: {}", e.what()));
  }
}

json Config::AsJson() const {
  json dump;
  // base_dir is not dumped, because in general it should be derived from the config path
  dump["alphabet"] = alphabet_;
  dump["max_length"] = max_length_;
  dump["entries_per_file"] = entries_per_file_;
  dump["batch_size"] = batch_size_;
  dump["checkpoint_every"] = checkpoint_every_;
  dump["output_dir"] = output_dir_.generic_string();
  dump["file_prefix"] = file_prefix_;
  dump["file_suffix"] = file_suffix_;
  dump["state_file"] = state_file_.generic_string();
  dump["progress_interval_ms"] = progress_interval_.count();
  dump["checkpoint_enabled"] = checkpoint_enabled_;
  dump["git_program"] = git_program_;
  dump["git_remote"] = git_remote_;
  dump["git_branch"] = git_branch_;
  dump["checkpoint_timeout_s"] = checkpoint_timeout_.count();
  return dump;
}

void Config::DumpConfig() const {
  fs::ofstream config_file(config_path_);
  if (config_file.fail()) {
    throw fmt::system_error(errno, "Can't write to {}", config_path_.string());
  }
  config_file << ConfigAsString() << "\n";
}

void Config::LoadFromJson(const json& config) {
  if (!config.is_object()) {
    throw std::runtime_error("Config must be a json object");
  }

  ConfigFromJson(config, "base_dir", &base_dir_);
  ConfigFromJson(config, "alphabet", &alphabet_);
  ConfigFromJson(config, "max_length", &max_length_);
  ConfigFromJson(config, "entries_per_file", &entries_per_file_);
  ConfigFromJson(config, "batch_size", &batch_size_);
  ConfigFromJson(config, "checkpoint_every", &checkpoint_every_);
  ConfigFromJson(config, "output_dir", &output_dir_);
  ConfigFromJson(config, "file_prefix", &file_prefix_);
  ConfigFromJson(config, "file_suffix", &file_suffix_);
  ConfigFromJson(config, "state_file", &state_file_);
  ConfigFromJson(config, "checkpoint_enabled", &checkpoint_enabled_);
  ConfigFromJson(config, "git_program", &git_program_);
  ConfigFromJson(config, "git_remote", &git_remote_);
  ConfigFromJson(config, "git_branch", &git_branch_);

  int64_t temp = progress_interval_.count();
  ConfigFromJson(config, "progress_interval_ms", &temp);
  progress_interval_ = std::chrono::milliseconds(temp);

  temp = checkpoint_timeout_.count();
  ConfigFromJson(config, "checkpoint_timeout_s", &temp);
  checkpoint_timeout_ = std::chrono::seconds(temp);
  if (progress_interval_.count() < 0 || checkpoint_timeout_.count() < 0) {
    throw std::runtime_error("progress_interval_ms and checkpoint_timeout_s must not be negative");
  }
}

void Config::LoadFromJson(path json_path) {
  if (!fs::exists(json_path)) {
    // no config yet, keep the defaults and save them for the next runs
    config_path_ = fs::absolute(json_path);
    base_dir_ = config_path_.parent_path();
    DumpConfig();
    return;
  }

  json_path = fs::canonical(json_path);
  fs::ifstream config_file(json_path);
  if (!config_file) {
    throw fmt::system_error(errno, "Can't open config file {}", json_path.string());
  }

  json config;
  try {
    config_file >> config;
  } catch (const json::parse_error& e) {
    throw std::runtime_error(fmt::format("Can't parse {}: {}", json_path.string(), e.what()));
  }
  if (config.is_object() && !config.count("base_dir")) {
    config["base_dir"] = json_path.parent_path().string();
  }

  config_path_ = json_path;

  LoadFromJson(config);
}
