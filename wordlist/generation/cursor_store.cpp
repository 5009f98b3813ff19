#include "cursor_store.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <iterator>
#include <limits>
#include <system_error>

#include <boost/algorithm/string/trim.hpp>
#include <boost/filesystem/fstream.hpp>
#include <fmt/format.h>
#include <fmt/ostream.h>

namespace fs = boost::filesystem;

using Index = CursorStore::Index;

CursorStore::CursorStore(fs::path state_file, std::ostream* log)
    : state_file_(std::move(state_file))
    , log_(log)
{ }

boost::optional<Index> CursorStore::Parse(const std::string& content) {
  auto value = boost::algorithm::trim_copy(content);
  if (value.empty() || !std::all_of(value.begin(), value.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
    return boost::none;
  }

  const Index kMax = std::numeric_limits<Index>::max();
  Index result = 0;
  for (char c : value) {
    Index digit = static_cast<Index>(c - '0');
    if (result > (kMax - digit) / 10) {
      return boost::none;
    }
    result = result * 10 + digit;
  }
  return result;
}

boost::optional<Index> CursorStore::Load() const {
  boost::system::error_code ec;
  if (!fs::exists(state_file_, ec)) {
    return boost::none;
  }

  std::string content;
  try {
    fs::ifstream in(state_file_);
    if (!in) {
      fmt::print(*log_, "Can't read {}: {}, starting from scratch\n", state_file_.string(), std::strerror(errno));
      return boost::none;
    }
    content.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (in.bad()) {
      fmt::print(*log_, "Can't read {}, starting from scratch\n", state_file_.string());
      return boost::none;
    }
  } catch (const std::exception& e) {
    // libstdc++ reports read errors such as EISDIR from the stream buffer by throwing
    fmt::print(*log_, "Can't read {}: {}, starting from scratch\n", state_file_.string(), e.what());
    return boost::none;
  }

  auto result = Parse(content);
  if (!result) {
    fmt::print(*log_, "{} does not hold a position, starting from scratch\n", state_file_.string());
  }
  return result;
}

void CursorStore::Save(Index last_written) const {
  // write aside and rename, so a crash never leaves a truncated value behind
  auto temp = state_file_;
  temp += ".tmp";

  {
    fs::ofstream out(temp, std::ios_base::out | std::ios_base::trunc);
    if (!out) {
      throw fmt::system_error(errno, "Can't open {}", temp.string());
    }
    out << last_written;
    out.flush();
    if (!out) {
      throw fmt::system_error(errno, "Can't write {}", temp.string());
    }
  }

  boost::system::error_code ec;
  fs::rename(temp, state_file_, ec);
  if (ec) {
    throw std::system_error(ec.value(), std::system_category(),
        fmt::format("Can't replace {}", state_file_.string()));
  }
}
