#ifndef WORDLIST_CURSOR_STORE_H
#define WORDLIST_CURSOR_STORE_H

#include <cstdint>
#include <ostream>

#include <boost/filesystem.hpp>
#include <boost/optional.hpp>

//! Durable copy of the index of the last entry of the last completed file
/**
 * The file holds the decimal value only. Whitespace around it is tolerated
 * on load, anything else makes the value unusable.
 */
class CursorStore {
 public:
  using Index = uint64_t;

  //! Notices about unusable state go to log
  CursorStore(boost::filesystem::path state_file, std::ostream* log);

  //! none if the file is missing, unreadable or does not hold a number
  boost::optional<Index> Load() const;

  //! Replaces the stored value, throws std::system_error on failure
  void Save(Index last_written) const;

  const boost::filesystem::path& state_file() const {
    return state_file_;
  }

  static boost::optional<Index> Parse(const std::string& content);

 private:
  boost::filesystem::path state_file_;
  std::ostream* log_;
};

#endif //WORDLIST_CURSOR_STORE_H
