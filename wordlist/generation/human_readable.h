#ifndef WORDLIST_HUMAN_READABLE_H
#define WORDLIST_HUMAN_READABLE_H

#include <chrono>
#include <cstdint>
#include <string>

//! 1.5KiB, 17.34MiB, 2GiB
std::string ToHumanReadableByteCount(uint64_t bytes);

//! 17043520 -> 17,043,520
std::string GroupThousands(uint64_t value);

std::string ToHumanString(std::chrono::nanoseconds time);

template<typename Rep, typename Unit>
std::string ToHumanString(std::chrono::duration<Rep, Unit> time) {
  return ToHumanString(std::chrono::duration_cast<std::chrono::nanoseconds>(time));
}

#endif //WORDLIST_HUMAN_READABLE_H
