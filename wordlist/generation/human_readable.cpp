#include "human_readable.h"

#include <cmath>
#include <iterator>

#include <fmt/format.h>

std::string ToHumanReadableByteCount(uint64_t bytes) {
  static const char* suffix[] = {"B", "KiB", "MiB", "GiB", "TiB", "PiB", "EiB"};
  const auto kSuffixCount = sizeof(suffix) / sizeof(suffix[0]);

  auto exp = 0u;
  auto coeff = static_cast<double>(bytes);
  while (coeff >= 1024 && exp + 1 < kSuffixCount) {
    coeff /= 1024;
    ++exp;
  }

  // round up to 2 digits and drop trailing zeroes
  auto int_coeff = static_cast<uint64_t>(std::ceil(coeff * 100));
  auto precision = 2;
  if (int_coeff % 10 == 0) {
    --precision;
  }
  if (int_coeff % 100 == 0) {
    --precision;
  }

  return fmt::format("{0:.{1}f}{2}", static_cast<double>(int_coeff) / 100, precision, suffix[exp]);
}

std::string GroupThousands(uint64_t value) {
  auto digits = fmt::format("{}", value);
  std::string result;
  result.reserve(digits.size() + digits.size() / 3);

  auto lead = digits.size() % 3;
  for (size_t i = 0; i < digits.size(); ++i) {
    if (i != 0 && (i + 3 - lead) % 3 == 0) {
      result.push_back(',');
    }
    result.push_back(digits[i]);
  }
  return result;
}

std::string ToHumanString(std::chrono::nanoseconds time) {
  using namespace std::chrono;

  if (time < nanoseconds::zero()) {
    return "-" + ToHumanString(-time);
  }

  if (time < seconds(1)) {
    auto milliseconds_count = duration_cast<milliseconds>(time).count();
    if (milliseconds_count != 0) {
      return fmt::format("{}ms", milliseconds_count);
    }
    return fmt::format("{}us", duration_cast<microseconds>(time).count());
  }

  if (time < minutes(1)) {
    auto whole = duration_cast<seconds>(time);
    return fmt::format("{}.{:03}s", whole.count(), duration_cast<milliseconds>(time - whole).count());
  }

  static const struct {
    int64_t length;
    char suffix;
  } kUnits[] = {{24 * 3600, 'd'}, {3600, 'h'}, {60, 'm'}, {1, 's'}};

  // the largest nonzero unit leads, the smaller ones are zero padded
  auto rest = duration_cast<seconds>(time).count();
  fmt::memory_buffer out;
  for (auto&& unit : kUnits) {
    auto count = rest / unit.length;
    rest %= unit.length;
    if (out.size() == 0) {
      if (count != 0) {
        fmt::format_to(std::back_inserter(out), "{}{}", count, unit.suffix);
      }
    } else {
      fmt::format_to(std::back_inserter(out), ":{:02}{}", count, unit.suffix);
    }
  }
  return fmt::to_string(out);
}
