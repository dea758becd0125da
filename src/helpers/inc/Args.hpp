#ifndef GPUPROBE_HELPERS_ARGS_HPP
#define GPUPROBE_HELPERS_ARGS_HPP
/**
 * @file Args.hpp
 * @brief CLI argument parsing utilities.
 *
 * Provides fixed-arity, repeatable argument parsing for CLI tools. Cold-path only.
 *
 * @note Cold-path: Allocates std::unordered_map for parsed results.
 */

#include <algorithm>
#include <bitset>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <fmt/core.h>

namespace gpuprobe {
namespace helpers {
namespace args {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Definition for a CLI argument flag.
 */
struct ArgDef {
  std::string_view flag;   ///< Short flag string, e.g. "-w"
  std::string_view alias;  ///< Long flag string, e.g. "--warning" (optional)
  std::uint8_t nargs;      ///< Number of values required after the flag
  bool required;           ///< True if flag must be provided
  std::string_view desc{}; ///< Description for help output (empty hides the flag)
};

/// Map from key to argument definition.
using ArgMap = std::unordered_map<std::uint8_t, ArgDef>;

/**
 * @brief Map from key to parsed values.
 *
 * Values of repeated flags are appended in command-line order. A zero-arity
 * flag records the matched token once per occurrence, so size() is its count.
 */
using ParsedArgs = std::unordered_map<std::uint8_t, std::vector<std::string_view>>;

namespace detail {

/// Compact, parse-ready view of an argument definition.
struct ArgDefView {
  std::uint8_t key;
  std::uint8_t need;
  bool required;
  std::string_view flag;
};

} // namespace detail

/* ----------------------------- API ----------------------------- */

/**
 * @brief Parse user-provided arguments according to a flag map.
 *
 * Fixed-arity parser: when a flag (or its alias) is matched, it consumes the
 * next nargs tokens literally as its values. Any token that is neither a known
 * flag nor a consumed value is rejected.
 *
 * @param args   Argument list (non-owning views; must outlive the call).
 * @param map    Definitions of accepted flags and their requirements.
 * @param pargs  Output map of parsed values (appended per key).
 * @param error  Optional error message target (set on failure when provided).
 * @return true on success; false on error (and sets error if provided).
 * @note Cold-path: Allocates internally.
 */
[[nodiscard]] inline bool
parseArgs(std::span<const std::string_view> args, const ArgMap& map, ParsedArgs& pargs,
          std::optional<std::reference_wrapper<std::string>> error = std::nullopt) noexcept {
  const std::size_t N = args.size();
  if (N == 0) {
    if (error) {
      error->get() = "No arguments provided";
    }
    return false;
  }

  // Build reverse LUT once: flag/alias -> compact view
  std::unordered_map<std::string_view, detail::ArgDefView> lut;
  lut.reserve(map.size() * 2);
  for (const auto& KV : map) {
    const std::uint8_t KEY = KV.first;
    const ArgDef& DEF = KV.second;
    lut.emplace(DEF.flag, detail::ArgDefView{KEY, DEF.nargs, DEF.required, DEF.flag});
    if (!DEF.alias.empty()) {
      lut.emplace(DEF.alias, detail::ArgDefView{KEY, DEF.nargs, DEF.required, DEF.alias});
    }
  }

  std::bitset<256> seen;
  const std::string_view* const ARGV = args.data();

  for (std::size_t i = 0; i < N; ++i) {
    const std::string_view TOK = ARGV[i];
    auto it = lut.find(TOK);
    if (it == lut.end()) {
      if (error) {
        error->get() = fmt::format("Unrecognized argument: '{}'", TOK);
      }
      return false;
    }

    const detail::ArgDefView& D = it->second;

    // Need tokens in [i+1, i+D.need]
    if (i + static_cast<std::size_t>(D.need) >= N) {
      if (error) {
        error->get() = fmt::format("Missing value for '{}': expected {}", D.flag,
                                   static_cast<unsigned int>(D.need));
      }
      return false;
    }

    auto& out = pargs[D.key];
    if (D.need == 0) {
      out.emplace_back(TOK);
    }
    for (std::uint8_t k = 0; k < D.need; ++k) {
      out.emplace_back(ARGV[i + 1 + k]);
    }

    seen.set(D.key);
    i += D.need;
  }

  // Validate required flags
  for (const auto& KV : map) {
    const ArgDef& DEF = KV.second;
    if (DEF.required && !seen.test(KV.first)) {
      if (error) {
        error->get() = fmt::format("Missing required argument: '{}'", DEF.flag);
      }
      return false;
    }
  }

  return true;
}

/**
 * @brief Print usage information for a CLI tool.
 *
 * Generates formatted help text from the argument map. Flags without a
 * description are accepted by the parser but not listed.
 *
 * @param progName    Program name (typically argv[0]).
 * @param description Brief description of the tool's purpose.
 * @param map         Argument definitions to document.
 * @note Cold-path: Performs I/O.
 */
inline void printUsage(const char* progName, std::string_view description,
                       const ArgMap& map) noexcept {
  fmt::print("Usage: {} [OPTIONS]\n\n", progName);

  if (!description.empty()) {
    fmt::print("{}\n\n", description);
  }

  fmt::print("Options:\n");

  // Collect and sort flags for consistent output
  std::vector<std::pair<std::string_view, const ArgDef*>> entries;
  entries.reserve(map.size());
  for (const auto& KV : map) {
    if (!KV.second.desc.empty()) {
      entries.emplace_back(KV.second.flag, &KV.second);
    }
  }
  std::sort(entries.begin(), entries.end(),
            [](const auto& a, const auto& b) { return a.first < b.first; });

  std::vector<std::string> flagStrs;
  flagStrs.reserve(entries.size());
  std::size_t maxFlagWidth = 16;
  for (const auto& ENTRY : entries) {
    const ArgDef& DEF = *ENTRY.second;

    std::string flagStr;
    flagStr.reserve(40);
    flagStr.append(DEF.flag);
    if (!DEF.alias.empty()) {
      flagStr.append(", ");
      flagStr.append(DEF.alias);
    }
    if (DEF.nargs == 1) {
      flagStr.append(" <value>");
    }
    maxFlagWidth = std::max(maxFlagWidth, flagStr.size());
    flagStrs.push_back(std::move(flagStr));
  }

  // Cap so descriptions stay on one line
  if (maxFlagWidth > 34) {
    maxFlagWidth = 34;
  }

  for (std::size_t i = 0; i < entries.size(); ++i) {
    const ArgDef& DEF = *entries[i].second;
    fmt::print("  {:<{}}  {}", flagStrs[i], maxFlagWidth, DEF.desc);
    if (DEF.required) {
      fmt::print(" (required)");
    }
    fmt::print("\n");
  }
}

} // namespace args
} // namespace helpers
} // namespace gpuprobe

#endif // GPUPROBE_HELPERS_ARGS_HPP
