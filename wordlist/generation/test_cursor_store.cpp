#include <sstream>
#include <system_error>

#include "gtest/gtest.h"
#include "cursor_store.h"
#include "internal/temp_dir.h"

namespace {

using internal::TempDir;

TEST(CursorStore, Parse) {
  EXPECT_EQ(CursorStore::Index(0), *CursorStore::Parse("0"));
  EXPECT_EQ(CursorStore::Index(12345), *CursorStore::Parse("  12345 \n"));
  EXPECT_EQ(CursorStore::Index(17043519), *CursorStore::Parse("\t17043519\r\n"));
  EXPECT_EQ(CursorStore::Index(18446744073709551615ull), *CursorStore::Parse("18446744073709551615"));

  EXPECT_FALSE(CursorStore::Parse(""));
  EXPECT_FALSE(CursorStore::Parse(" \n"));
  EXPECT_FALSE(CursorStore::Parse("abc"));
  EXPECT_FALSE(CursorStore::Parse("-1"));
  EXPECT_FALSE(CursorStore::Parse("+1"));
  EXPECT_FALSE(CursorStore::Parse("12x"));
  EXPECT_FALSE(CursorStore::Parse("1 2"));
  EXPECT_FALSE(CursorStore::Parse("18446744073709551616"));
}

TEST(CursorStore, Missing) {
  TempDir dir;
  std::ostringstream log;
  CursorStore store(dir / "state.txt", &log);
  EXPECT_FALSE(store.Load());
  EXPECT_TRUE(log.str().empty());
}

TEST(CursorStore, Garbage) {
  TempDir dir;
  std::ostringstream log;
  internal::WriteFile(dir / "state.txt", "not a number");
  CursorStore store(dir / "state.txt", &log);
  EXPECT_FALSE(store.Load());
  EXPECT_NE(std::string::npos, log.str().find("starting from scratch"));
}

TEST(CursorStore, Unreadable) {
  TempDir dir;
  std::ostringstream log;
  // a directory in place of the file
  boost::filesystem::create_directories(dir / "state.txt");
  CursorStore store(dir / "state.txt", &log);
  boost::optional<CursorStore::Index> loaded;
  EXPECT_NO_THROW(loaded = store.Load());
  EXPECT_FALSE(loaded);
  EXPECT_NE(std::string::npos, log.str().find("starting from scratch"));
}

TEST(CursorStore, SaveLoad) {
  TempDir dir;
  std::ostringstream log;
  CursorStore store(dir / "state.txt", &log);

  store.Save(1999999);
  EXPECT_EQ("1999999", internal::ReadFile(dir / "state.txt"));
  EXPECT_EQ(CursorStore::Index(1999999), *store.Load());

  store.Save(3999999);
  EXPECT_EQ("3999999", internal::ReadFile(dir / "state.txt"));
  EXPECT_FALSE(boost::filesystem::exists(dir / "state.txt.tmp"));
}

TEST(CursorStore, SaveFailure) {
  TempDir dir;
  std::ostringstream log;
  CursorStore store(dir / "no_such_dir" / "state.txt", &log);
  EXPECT_THROW(store.Save(10), std::system_error);
}

} //anonymous
