#ifndef GPUPROBE_HELPERS_STRINGS_HPP
#define GPUPROBE_HELPERS_STRINGS_HPP
/**
 * @file Strings.hpp
 * @brief String helpers for sensor names, option lists, and numeric text.
 *
 * @note NOT RT-SAFE: List splitting allocates. Predicates do not.
 */

#include <cctype>      // std::isdigit, std::isspace, std::tolower
#include <cstddef>     // std::size_t
#include <string>      // std::string
#include <string_view> // std::string_view
#include <vector>      // std::vector

namespace gpuprobe {
namespace helpers {
namespace strings {

/* ----------------------------- Predicates ----------------------------- */

/**
 * @brief Check if string starts with prefix.
 * @param str String to check.
 * @param prefix Prefix to look for.
 * @return true if str starts with prefix.
 */
[[nodiscard]] inline bool startsWith(std::string_view str, std::string_view prefix) noexcept {
  return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

/**
 * @brief Check if string ends with suffix.
 * @param str String to check.
 * @param suffix Suffix to look for.
 * @return true if str ends with suffix.
 */
[[nodiscard]] inline bool endsWith(std::string_view str, std::string_view suffix) noexcept {
  return str.size() >= suffix.size() &&
         str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

/**
 * @brief Check if text is an integer literal: optional sign, one or more digits.
 */
[[nodiscard]] inline bool isIntegerText(std::string_view text) noexcept {
  std::size_t i = 0;
  if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
    ++i;
  }
  if (i == text.size()) {
    return false;
  }
  for (; i < text.size(); ++i) {
    if (std::isdigit(static_cast<unsigned char>(text[i])) == 0) {
      return false;
    }
  }
  return true;
}

/**
 * @brief Check if text is a decimal literal: optional sign, digits, '.', one or more digits.
 * @note "12.5" and ".5" match; "12." and "12" do not.
 */
[[nodiscard]] inline bool isDecimalText(std::string_view text) noexcept {
  std::size_t i = 0;
  if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
    ++i;
  }
  while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i])) != 0) {
    ++i;
  }
  if (i == text.size() || text[i] != '.') {
    return false;
  }
  ++i;
  if (i == text.size()) {
    return false;
  }
  for (; i < text.size(); ++i) {
    if (std::isdigit(static_cast<unsigned char>(text[i])) == 0) {
      return false;
    }
  }
  return true;
}

/* ----------------------------- Ordering ----------------------------- */

/**
 * @brief Case-insensitive strict weak ordering; ties broken case-sensitively.
 */
struct CaseInsensitiveLess {
  [[nodiscard]] bool operator()(std::string_view a, std::string_view b) const noexcept {
    const std::size_t N = a.size() < b.size() ? a.size() : b.size();
    for (std::size_t i = 0; i < N; ++i) {
      const int CA = std::tolower(static_cast<unsigned char>(a[i]));
      const int CB = std::tolower(static_cast<unsigned char>(b[i]));
      if (CA != CB) {
        return CA < CB;
      }
    }
    if (a.size() != b.size()) {
      return a.size() < b.size();
    }
    return a < b;
  }
};

/* ----------------------------- Manipulation ----------------------------- */

/**
 * @brief Strip leading and trailing whitespace.
 */
[[nodiscard]] inline std::string_view trim(std::string_view text) noexcept {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
    text.remove_suffix(1);
  }
  return text;
}

/**
 * @brief Split a delimited list, trimming each field.
 * @param text List text (e.g., "85,d,90").
 * @param delim Field delimiter.
 * @return Fields in order. Empty input yields an empty vector; empty fields are kept.
 */
[[nodiscard]] inline std::vector<std::string> splitList(std::string_view text, char delim = ',') {
  std::vector<std::string> out;
  if (text.empty()) {
    return out;
  }
  std::size_t start = 0;
  while (true) {
    const std::size_t POS = text.find(delim, start);
    const std::string_view FIELD =
        text.substr(start, POS == std::string_view::npos ? std::string_view::npos : POS - start);
    out.emplace_back(trim(FIELD));
    if (POS == std::string_view::npos) {
      break;
    }
    start = POS + 1;
  }
  return out;
}

/**
 * @brief Join strings with a separator.
 */
[[nodiscard]] inline std::string join(const std::vector<std::string>& parts,
                                      std::string_view sep) {
  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i != 0) {
      out.append(sep);
    }
    out.append(parts[i]);
  }
  return out;
}

} // namespace strings
} // namespace helpers
} // namespace gpuprobe

#endif // GPUPROBE_HELPERS_STRINGS_HPP
