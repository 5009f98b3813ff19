#ifndef WORDLIST_OUTPUT_FILE_H
#define WORDLIST_OUTPUT_FILE_H

#include <cstddef>
#include <memory>

#include <boost/filesystem.hpp>
#include <boost/iostreams/filtering_stream.hpp>

//! One output file, truncated on open
/**
 * Goes through a gzip compressor when the name ends with ".gz".
 * Any failure to open, write or close is reported by an exception,
 * a file which was not closed successfully must be considered incomplete.
 */
class OutputFile {
 public:
  explicit OutputFile(boost::filesystem::path p);

  OutputFile(const OutputFile&)=delete;
  OutputFile& operator=(const OutputFile&)=delete;
  OutputFile(OutputFile&&)=default;
  OutputFile& operator=(OutputFile&&)=default;

  //! Closes without reporting errors, unless Close() was called before
  ~OutputFile();

  void Write(const char* data, size_t size);

  //! Flushes all the data and closes the file
  void Close();

  bool is_open() const {
    return static_cast<bool>(out_);
  }

  const boost::filesystem::path& path() const {
    return path_;
  }

 private:
  boost::filesystem::path path_;
  std::unique_ptr<boost::iostreams::filtering_ostream> out_;
};

#endif //WORDLIST_OUTPUT_FILE_H
