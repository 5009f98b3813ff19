#ifndef WORDLIST_INTERNAL_TEMP_DIR_H
#define WORDLIST_INTERNAL_TEMP_DIR_H

#include <iterator>
#include <string>

#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>

namespace internal {

//! Unique directory, removed with everything inside on destruction
class TempDir {
 public:
  TempDir()
      : path_(boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("wordlist-%%%%-%%%%-%%%%"))
  {
    boost::filesystem::create_directories(path_);
  }

  TempDir(const TempDir&)=delete;
  TempDir& operator=(const TempDir&)=delete;

  ~TempDir() {
    boost::system::error_code ec;
    boost::filesystem::remove_all(path_, ec);
  }

  const boost::filesystem::path& path() const {
    return path_;
  }

  boost::filesystem::path operator/(const std::string& name) const {
    return path_ / name;
  }

 private:
  boost::filesystem::path path_;
};

inline std::string ReadFile(const boost::filesystem::path& p) {
  boost::filesystem::ifstream in(p, std::ios_base::binary);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline void WriteFile(const boost::filesystem::path& p, const std::string& content) {
  boost::filesystem::ofstream out(p, std::ios_base::binary | std::ios_base::trunc);
  out << content;
}

} //namespace internal

#endif //WORDLIST_INTERNAL_TEMP_DIR_H
