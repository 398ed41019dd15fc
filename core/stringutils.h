#pragma once

#include <cctype>
#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

namespace StringUtils {

inline bool NaturalLess(const std::string &a, const std::string &b) {
  auto extract = [](const std::string &s) -> std::pair<std::string, long> {
    size_t i = s.size();
    while (i > 0 && std::isdigit(static_cast<unsigned char>(s[i - 1]))) {
      --i;
    }
    long num = 0;
    if (i < s.size()) {
      num = std::strtol(s.c_str() + i, nullptr, 10);
    }
    return {s.substr(0, i), num};
  };

  auto [prefixA, numA] = extract(a);
  auto [prefixB, numB] = extract(b);

  bool aHasNum = prefixA.size() != a.size();
  bool bHasNum = prefixB.size() != b.size();
  if (prefixA == prefixB && (aHasNum || bHasNum)) {
    if (numA != numB)
      return numA < numB;
    return a.size() < b.size();
  }
  return a < b;
}

inline std::string Trim(const std::string &s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start])))
    ++start;
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])))
    --end;
  return s.substr(start, end - start);
}

// Splits on runs of ASCII whitespace. Never returns empty tokens.
inline std::vector<std::string> SplitWhitespace(const std::string &s) {
  std::vector<std::string> tokens;
  std::string current;
  for (char ch : s) {
    if (std::isspace(static_cast<unsigned char>(ch))) {
      if (!current.empty()) {
        tokens.push_back(current);
        current.clear();
      }
    } else {
      current.push_back(ch);
    }
  }
  if (!current.empty())
    tokens.push_back(current);
  return tokens;
}

inline std::vector<std::string> SplitLines(const std::string &s) {
  std::vector<std::string> lines;
  size_t start = 0;
  while (true) {
    size_t end = s.find('\n', start);
    if (end == std::string::npos) {
      lines.push_back(s.substr(start));
      break;
    }
    lines.push_back(s.substr(start, end - start));
    start = end + 1;
  }
  return lines;
}

inline std::string Join(const std::vector<std::string> &parts,
                        const std::string &separator) {
  std::string out;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0)
      out += separator;
    out += parts[i];
  }
  return out;
}

constexpr char kEscapeChar = '\\';

inline bool IsEscaped(const std::string &token) {
  return token.size() > 1 && token[0] == kEscapeChar;
}

// Removes exactly one leading escape character. A lone backslash is kept.
inline std::string StripLeadingEscape(const std::string &token) {
  return IsEscaped(token) ? token.substr(1) : token;
}

} // namespace StringUtils
