#ifndef TICKRATE_HELPERS_ARGS_HPP
#define TICKRATE_HELPERS_ARGS_HPP
/**
 * @file Args.hpp
 * @brief Command-line flag parsing for the tickrate tools.
 *
 * Flags are declared up front in an ArgMap. Each flag takes a fixed number of
 * values, given either as following tokens ("--port 22") or, for single-value
 * flags, inline ("--port=22"). Unknown "--" flags are rejected so typos do not
 * silently fall back to defaults.
 *
 * @note Cold-path: Allocates std::unordered_map / std::string for parsed results.
 */

#include <algorithm>
#include <cstdint>
#include <cstdlib> // strtoull
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <fmt/core.h>

namespace tickrate {
namespace helpers {
namespace args {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Definition for a CLI argument flag.
 */
struct ArgDef {
  std::string_view flag;   ///< Flag string, e.g. "--host"
  std::uint8_t nargs;      ///< Number of values required after the flag
  bool required;           ///< True if flag must be provided
  std::string_view desc{}; ///< Description for help output (optional)
};

/// Map from key to argument definition.
using ArgMap = std::unordered_map<std::uint8_t, ArgDef>;

/// Map from key to parsed values. Values are owned (inline "--f=v" forms are split).
using ParsedArgs = std::unordered_map<std::uint8_t, std::vector<std::string>>;

/* ----------------------------- Parsing ----------------------------- */

/**
 * @brief Parse arguments according to a flag map.
 * @param args  Argument tokens, program name excluded.
 * @param map   Accepted flags.
 * @param pargs Output; a repeated flag keeps its last occurrence.
 * @param error Set to a one-line message on failure.
 * @return true on success.
 * @note Cold-path: Allocates.
 *
 * Tokens that do not start with "--" and are not consumed as values are
 * ignored, matching the positional-free style of the tools.
 */
[[nodiscard]] inline bool parseArgs(std::span<const std::string_view> args, const ArgMap& map,
                                    ParsedArgs& pargs, std::string& error) {
  std::unordered_map<std::string_view, std::uint8_t> byFlag;
  byFlag.reserve(map.size());
  for (const auto& [KEY, DEF] : map) {
    byFlag.emplace(DEF.flag, KEY);
  }

  for (std::size_t i = 0; i < args.size(); ++i) {
    std::string_view tok = args[i];
    if (tok.substr(0, 2) != "--") {
      continue;
    }

    std::string_view inlineVal;
    bool hasInline = false;
    const std::size_t EQ = tok.find('=');
    if (EQ != std::string_view::npos) {
      inlineVal = tok.substr(EQ + 1);
      tok = tok.substr(0, EQ);
      hasInline = true;
    }

    const auto IT = byFlag.find(tok);
    if (IT == byFlag.end()) {
      error = fmt::format("Unknown flag '{}'", tok);
      return false;
    }

    const ArgDef& DEF = map.at(IT->second);
    std::vector<std::string>& out = pargs[IT->second];
    out.clear();

    if (hasInline) {
      if (DEF.nargs != 1) {
        error = fmt::format("Flag '{}' does not take an inline value", DEF.flag);
        return false;
      }
      out.emplace_back(inlineVal);
      continue;
    }

    if (DEF.nargs > 0 && i + DEF.nargs >= args.size()) {
      error = fmt::format("Flag '{}' expects {} value(s)", DEF.flag, DEF.nargs);
      return false;
    }
    for (std::uint8_t k = 0; k < DEF.nargs; ++k) {
      out.emplace_back(args[i + 1 + k]);
    }
    i += DEF.nargs;
  }

  for (const auto& [KEY, DEF] : map) {
    if (DEF.required && pargs.count(KEY) == 0) {
      error = fmt::format("Missing required flag '{}'", DEF.flag);
      return false;
    }
  }

  return true;
}

/* ----------------------------- Accessors ----------------------------- */

/// True if the flag was given.
[[nodiscard]] inline bool has(const ParsedArgs& pargs, std::uint8_t key) {
  return pargs.count(key) != 0;
}

/// First value of a flag, or fallback.
[[nodiscard]] inline std::string getString(const ParsedArgs& pargs, std::uint8_t key,
                                           std::string fallback = {}) {
  const auto IT = pargs.find(key);
  if (IT == pargs.end() || IT->second.empty()) {
    return fallback;
  }
  return IT->second.front();
}

/**
 * @brief First value of a flag as an unsigned integer clamped to [lo, hi].
 * @return fallback when absent or not a number.
 */
[[nodiscard]] inline std::uint64_t getUint(const ParsedArgs& pargs, std::uint8_t key,
                                           std::uint64_t fallback, std::uint64_t lo,
                                           std::uint64_t hi) {
  const std::string RAW = getString(pargs, key);
  if (RAW.empty() || RAW.front() < '0' || RAW.front() > '9') {
    return fallback;
  }
  char* end = nullptr;
  const unsigned long long VAL = std::strtoull(RAW.c_str(), &end, 10);
  if (end == RAW.c_str() || *end != '\0') {
    return fallback;
  }
  return std::clamp<std::uint64_t>(VAL, lo, hi);
}

/* ----------------------------- Usage ----------------------------- */

/**
 * @brief Print usage information for a tool.
 * @param progName    Program name (typically argv[0]).
 * @param description Brief description of the tool's purpose.
 * @param map         Argument definitions to document.
 * @note Cold-path: Performs I/O.
 */
inline void printUsage(const char* progName, std::string_view description, const ArgMap& map) {
  fmt::print("Usage: {} [OPTIONS]\n\n", progName);
  if (!description.empty()) {
    fmt::print("{}\n\n", description);
  }
  fmt::print("Options:\n");

  std::vector<std::pair<std::string, const ArgDef*>> entries;
  entries.reserve(map.size());
  std::size_t width = 16;
  for (const auto& [KEY, DEF] : map) {
    std::string label(DEF.flag);
    if (DEF.nargs == 1) {
      label += " <value>";
    } else if (DEF.nargs > 1) {
      label += " <value> ...";
    }
    width = std::max(width, label.size());
    entries.emplace_back(std::move(label), &DEF);
  }
  std::sort(entries.begin(), entries.end(),
            [](const auto& a, const auto& b) { return a.first < b.first; });

  for (const auto& [LABEL, DEF] : entries) {
    fmt::print("  {:<{}}  {}{}\n", LABEL, width, DEF->desc, DEF->required ? " (required)" : "");
  }
}

} // namespace args
} // namespace helpers
} // namespace tickrate

#endif // TICKRATE_HELPERS_ARGS_HPP
