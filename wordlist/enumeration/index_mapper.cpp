#include "index_mapper.h"

#include <algorithm>
#include <limits>
#include <stdexcept>

#include <fmt/format.h>

namespace wordlist {

using Index = IndexMapper::Index;

IndexMapper::IndexMapper(std::string alphabet, unsigned max_length)
    : alphabet_(std::move(alphabet))
    , max_length_(max_length)
    , digits_(std::numeric_limits<unsigned char>::max() + 1, -1)
{
  if (alphabet_.empty()) {
    throw std::invalid_argument("alphabet is empty");
  }
  if (max_length_ == 0) {
    throw std::invalid_argument("max length must be positive");
  }

  for (size_t i = 0; i < alphabet_.size(); ++i) {
    auto& digit = digits_[static_cast<unsigned char>(alphabet_[i])];
    if (digit != -1) {
      throw std::invalid_argument(fmt::format("symbol '{}' appears twice in the alphabet", alphabet_[i]));
    }
    digit = static_cast<int>(i);
  }

  const Index kMax = std::numeric_limits<Index>::max();
  const Index n = alphabet_.size();

  cumulative_.reserve(max_length_ + 1);
  cumulative_.push_back(0);
  Index power = 1;
  for (unsigned l = 1; l <= max_length_; ++l) {
    if (power > kMax / n) {
      throw std::overflow_error(fmt::format("{}^{} strings do not fit into 64 bits", n, l));
    }
    power *= n;
    if (cumulative_.back() > kMax - power) {
      throw std::overflow_error(fmt::format("strings up to length {} do not fit into 64 bits", l));
    }
    cumulative_.push_back(cumulative_.back() + power);
  }
}

unsigned IndexMapper::LengthOf(Index pos) const {
  if (pos >= total()) {
    throw std::out_of_range(fmt::format("index {} is out of [0, {})", pos, total()));
  }
  // cumulative_ is strictly increasing, the first l with pos < cumulative_[l] is the length
  auto upper = std::upper_bound(cumulative_.begin(), cumulative_.end(), pos);
  return static_cast<unsigned>(upper - cumulative_.begin());
}

unsigned IndexMapper::Render(Index pos, char* out) const {
  auto length = LengthOf(pos);
  auto offset = pos - cumulative_[length - 1];
  const Index n = alphabet_.size();

  for (auto j = length; j > 0; --j) {
    out[j - 1] = alphabet_[offset % n];
    offset /= n;
  }
  return length;
}

std::string IndexMapper::At(Index pos) const {
  std::string result(max_length_, '\0');
  result.resize(Render(pos, &result[0]));
  return result;
}

Index IndexMapper::IndexOf(const std::string& word) const {
  if (word.empty() || word.size() > max_length_) {
    throw std::invalid_argument(fmt::format("'{}' has length out of [1, {}]", word, max_length_));
  }

  const Index n = alphabet_.size();
  Index offset = 0;
  for (char c : word) {
    auto digit = digits_[static_cast<unsigned char>(c)];
    if (digit == -1) {
      throw std::invalid_argument(fmt::format("'{}' contains symbol '{}' outside of the alphabet", word, c));
    }
    offset = offset * n + static_cast<Index>(digit);
  }

  return cumulative_[word.size() - 1] + offset;
}

Index IndexMapper::TotalBytes() const {
  Index bytes = 0;
  for (unsigned l = 1; l <= max_length_; ++l) {
    bytes += count(l) * (l + 1);
  }
  return bytes;
}

} //namespace wordlist
