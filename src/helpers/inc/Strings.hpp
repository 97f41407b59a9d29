#ifndef TICKRATE_HELPERS_STRINGS_HPP
#define TICKRATE_HELPERS_STRINGS_HPP
/**
 * @file Strings.hpp
 * @brief Bounded string scanning helpers for counter-line parsing.
 *
 * Operates on null-terminated buffers and std::string_view without heap
 * allocation. Shared by the /proc/stat parser and the command-output
 * splitters used by the remote adapters.
 *
 * @note RT-SAFE: All functions are noexcept with no allocations.
 */

#include <cerrno> // errno, ERANGE
#include <cstddef>
#include <cstdint>
#include <cstdlib> // strtoull
#include <cstring> // strlen, strncmp
#include <string_view>

namespace tickrate {
namespace helpers {
namespace strings {

/* ----------------------------- Parsing ----------------------------- */

/**
 * @brief Skip leading whitespace (spaces and tabs).
 * @param ptr Pointer into string.
 * @return Pointer to first non-whitespace character (or end of string).
 * @note RT-SAFE: No allocation.
 */
[[nodiscard]] inline const char* skipWhitespace(const char* ptr) noexcept {
  if (ptr == nullptr) {
    return nullptr;
  }
  while (*ptr == ' ' || *ptr == '\t') {
    ++ptr;
  }
  return ptr;
}

/**
 * @brief Parse one unsigned decimal field and advance past it.
 * @param ptr In/out cursor; left unchanged when no digits are found.
 * @param out Parsed value.
 * @return true if a field was consumed.
 * @note RT-SAFE: No allocation. Rejects a leading '-' (strtoull would wrap it)
 *       and values above UINT64_MAX.
 */
[[nodiscard]] inline bool nextUint64(const char*& ptr, std::uint64_t& out) noexcept {
  const char* start = skipWhitespace(ptr);
  if (start == nullptr || *start < '0' || *start > '9') {
    return false;
  }

  char* end = nullptr;
  errno = 0;
  const unsigned long long VAL = std::strtoull(start, &end, 10);
  if (end == start || errno == ERANGE) {
    return false;
  }

  out = static_cast<std::uint64_t>(VAL);
  ptr = end;
  return true;
}

/**
 * @brief Check if string starts with prefix.
 * @param str String to check.
 * @param prefix Prefix to look for.
 * @return true if str starts with prefix.
 * @note RT-SAFE: No allocation.
 */
[[nodiscard]] inline bool startsWith(const char* str, const char* prefix) noexcept {
  if (str == nullptr || prefix == nullptr) {
    return false;
  }
  const std::size_t PREFIX_LEN = std::strlen(prefix);
  return std::strncmp(str, prefix, PREFIX_LEN) == 0;
}

/* ----------------------------- Views ----------------------------- */

/// Trim spaces, tabs, CR and LF from both ends of a view.
[[nodiscard]] inline std::string_view trim(std::string_view s) noexcept {
  constexpr std::string_view WS = " \t\r\n";
  const std::size_t FIRST = s.find_first_not_of(WS);
  if (FIRST == std::string_view::npos) {
    return {};
  }
  const std::size_t LAST = s.find_last_not_of(WS);
  return s.substr(FIRST, LAST - FIRST + 1);
}

/**
 * @brief Iterate over newline-separated lines of a buffer.
 * @tparam Fn Callable taking std::string_view (line without terminator).
 * @param text Buffer to split.
 * @param fn Invoked once per line, empty lines included except a trailing one.
 * @note RT-SAFE: No allocation.
 */
template <typename Fn> inline void forEachLine(std::string_view text, Fn&& fn) {
  std::size_t pos = 0;
  while (pos < text.size()) {
    std::size_t eol = text.find('\n', pos);
    if (eol == std::string_view::npos) {
      eol = text.size();
    }
    fn(text.substr(pos, eol - pos));
    pos = eol + 1;
  }
}

} // namespace strings
} // namespace helpers
} // namespace tickrate

#endif // TICKRATE_HELPERS_STRINGS_HPP
