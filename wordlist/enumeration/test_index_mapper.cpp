#include <algorithm>
#include <set>
#include <stdexcept>

#include "gtest/gtest.h"
#include "index_mapper.h"

namespace wordlist {
namespace {

const char kDefaultAlphabet[] = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789_.";

TEST(IndexMapper, DefaultTotal) {
  IndexMapper m(kDefaultAlphabet, 4);
  EXPECT_EQ(64u, m.alphabet().size());
  EXPECT_EQ(17043520u, m.total());
  EXPECT_EQ(64u + 4096u + 262144u + 16777216u, m.total());
  EXPECT_EQ(0u, m.cumulative(0));
  EXPECT_EQ(64u, m.cumulative(1));
  EXPECT_EQ(4160u, m.cumulative(2));
  EXPECT_EQ(262144u, m.count(3));
}

TEST(IndexMapper, SmallScenario) {
  IndexMapper m("abc", 2);
  EXPECT_EQ(12u, m.total());
  EXPECT_EQ("a", m.At(0));
  EXPECT_EQ("c", m.At(2));
  EXPECT_EQ("aa", m.At(3));
  EXPECT_EQ("ab", m.At(4));
  EXPECT_EQ("ba", m.At(6));
  EXPECT_EQ("cc", m.At(11));
}

TEST(IndexMapper, Boundaries) {
  IndexMapper m(kDefaultAlphabet, 4);
  EXPECT_EQ("a", m.At(0));
  EXPECT_EQ(".", m.At(m.cumulative(1) - 1));
  EXPECT_EQ("ab", m.At(m.cumulative(1) + 1));
  EXPECT_EQ("aa", m.At(m.cumulative(1)));
  EXPECT_EQ("..", m.At(m.cumulative(2) - 1));
  EXPECT_EQ("aaaa", m.At(m.cumulative(3)));
  EXPECT_EQ("....", m.At(m.total() - 1));
}

TEST(IndexMapper, LengthMonotonicity) {
  IndexMapper m("xyz01", 4);
  IndexMapper::Index pos = 0;
  for (unsigned l = 1; l <= 4; ++l) {
    for (; pos < m.cumulative(l); ++pos) {
      ASSERT_EQ(l, m.LengthOf(pos)) << "Index " << pos;
      ASSERT_EQ(l, m.At(pos).size()) << "Index " << pos;
    }
  }
  EXPECT_EQ(m.total(), pos);
}

TEST(IndexMapper, Bijection) {
  IndexMapper m("ab.", 5);
  auto rank = [&m](char c) {
    return m.alphabet().find(c);
  };

  std::set<std::string> seen;
  std::string previous;
  for (IndexMapper::Index pos = 0; pos < m.total(); ++pos) {
    auto word = m.At(pos);
    ASSERT_TRUE(seen.insert(word).second) << word;
    ASSERT_EQ(pos, m.IndexOf(word));
    if (word.size() == previous.size()) {
      // inside a length block words follow the alphabet order, not the ASCII one
      ASSERT_TRUE(std::lexicographical_compare(previous.begin(), previous.end(), word.begin(), word.end(),
          [&rank](char lhs, char rhs) { return rank(lhs) < rank(rhs); })) << previous << " " << word;
    }
    previous = word;
  }
  // 3 + 9 + 27 + 81 + 243
  EXPECT_EQ(363u, seen.size());
}

TEST(IndexMapper, RenderMatchesAt) {
  IndexMapper m(kDefaultAlphabet, 4);
  char buffer[4];
  for (IndexMapper::Index pos : {0ull, 63ull, 64ull, 4159ull, 4160ull, 123456ull, 17043519ull}) {
    auto length = m.Render(pos, buffer);
    EXPECT_EQ(m.At(pos), std::string(buffer, length));
  }
}

TEST(IndexMapper, RejectsOutOfRange) {
  IndexMapper m("abc", 2);
  EXPECT_THROW(m.At(12), std::out_of_range);
  EXPECT_THROW(m.LengthOf(100), std::out_of_range);
  EXPECT_THROW(m.At(static_cast<IndexMapper::Index>(-1)), std::out_of_range);
}

TEST(IndexMapper, RejectsForeignWords) {
  IndexMapper m("abc", 2);
  EXPECT_THROW(m.IndexOf(""), std::invalid_argument);
  EXPECT_THROW(m.IndexOf("abc"), std::invalid_argument);
  EXPECT_THROW(m.IndexOf("ad"), std::invalid_argument);
}

TEST(IndexMapper, RejectsBadUniverse) {
  EXPECT_THROW(IndexMapper("", 3), std::invalid_argument);
  EXPECT_THROW(IndexMapper("abc", 0), std::invalid_argument);
  EXPECT_THROW(IndexMapper("abca", 2), std::invalid_argument);
  EXPECT_THROW(IndexMapper(kDefaultAlphabet, 11), std::overflow_error);
  EXPECT_NO_THROW(IndexMapper(kDefaultAlphabet, 10));
}

TEST(IndexMapper, TotalBytes) {
  IndexMapper m("abc", 2);
  // 3 * "x\n" + 9 * "xy\n"
  EXPECT_EQ(3u * 2u + 9u * 3u, m.TotalBytes());
}

} //anonymous
} //wordlist
