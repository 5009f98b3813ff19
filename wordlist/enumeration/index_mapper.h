/**
* @file
*
* @brief Bijection between enumeration indices and strings over an alphabet
*/

#ifndef WORDLIST_INDEX_MAPPER_H
#define WORDLIST_INDEX_MAPPER_H

#include <cstdint>
#include <string>
#include <vector>

namespace wordlist {

//! Maps a global index to the string it denotes and back
/**
 * Strings are ordered by length first; inside a length block the string is
 * the fixed-width base-N representation of the offset in the block, with the
 * alphabet used as digits, most significant digit first.
 *
 * For {a, b, c} and max length 2 the order is a, b, c, aa, ab, ..., cc.
 */
class IndexMapper {
 public:
  using Index = uint64_t;

  //! Throws std::invalid_argument on an empty alphabet, a repeated symbol or zero length,
  //! std::overflow_error if the number of strings does not fit into Index
  IndexMapper(std::string alphabet, unsigned max_length);

  Index total() const {
    return cumulative_.back();
  }

  //! Count of all strings of length <= length
  Index cumulative(unsigned length) const {
    return cumulative_.at(length);
  }

  //! Count of strings of exactly this length, i.e. N^length
  Index count(unsigned length) const {
    return length == 0 ? 0 : cumulative_.at(length) - cumulative_.at(length - 1);
  }

  const std::string& alphabet() const {
    return alphabet_;
  }

  unsigned max_length() const {
    return max_length_;
  }

  //! Length of the string at pos, pos must be less than total()
  unsigned LengthOf(Index pos) const;

  //! Writes the string at pos into out, which must hold at least max_length() chars
  //! Returns the length of the string
  unsigned Render(Index pos, char* out) const;

  std::string At(Index pos) const;

  //! Inverse of At
  Index IndexOf(const std::string& word) const;

  //! Bytes needed for every string followed by a line terminator
  Index TotalBytes() const;

 private:
  std::string alphabet_;
  unsigned max_length_;

  // symbol -> digit, -1 for symbols not in the alphabet
  std::vector<int> digits_;

  // cumulative_[l] is the number of strings of length <= l
  std::vector<Index> cumulative_;
};

} //namespace wordlist

#endif //WORDLIST_INDEX_MAPPER_H
