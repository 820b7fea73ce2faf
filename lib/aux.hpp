#ifndef __KERNVAL_AUX_HPP__
#define __KERNVAL_AUX_HPP__

#include <algorithm>
#include <cassert>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <type_traits>
#include <vector>

[[noreturn]] inline void
kernval_unreachable_impl(const char* file, int line,
                         const std::string& msg = "Unreachable code reached") {
  std::cerr << file << ":" << line << ": Assertion failed: ";
  std::cerr << msg << std::endl;
  std::abort();
}

// Note: __VA_OPT__ is a C++20 feature, but gcc-8.1 and clang-6 accept it in
// C++17 mode as an extension.

#if defined(__GNUC__) && !defined(__clang__)
  #if (__GNUC__ < 8) || (__GNUC__ == 8 && __GNUC_MINOR__ < 1)
    #error "GCC version must be at least 8.1"
  #endif
#endif

#if defined(__clang__)
  #if (__clang_major__ < 6)
    #error "Clang version must be at least 6"
  #endif
#endif

// Macro that captures the file and line
#define kernval_unreachable(...)                                               \
  kernval_unreachable_impl(__FILE__, __LINE__ __VA_OPT__(, ) __VA_ARGS__)

template <typename Container>
inline static std::string DelimitedString(const Container& container,
                                          std::string delimiter = ", ") {
  std::ostringstream oss;
  auto it = container.begin();
  if (it != container.end()) {
    if constexpr (std::is_same_v<typename Container::value_type, std::string>)
      oss << *it;
    else
      oss << std::to_string(*it);
    ++it;
  }
  for (; it != container.end(); ++it) {
    if constexpr (std::is_same_v<typename Container::value_type, std::string>)
      oss << delimiter << *it;
    else
      oss << delimiter << std::to_string(*it);
  }
  return oss.str();
}

// quote each item: 'a', 'b'
template <typename Container>
inline static std::string QuotedList(const Container& container,
                                     std::string delimiter = ", ") {
  std::ostringstream oss;
  bool first = true;
  for (const auto& item : container) {
    if (!first) oss << delimiter;
    oss << "'" << item << "'";
    first = false;
  }
  return oss.str();
}

// Function to check if 'str' starts with 'prefix'
inline static bool PrefixedWith(const std::string& str,
                                const std::string& prefix) {
  if (prefix.size() > str.size()) return false;
  return str.compare(0, prefix.size(), prefix) == 0;
}

// remove suffix
inline static std::string RemoveSuffix(const std::string& str,
                                       const std::string& suffix) {
  if (suffix.size() > str.size()) return str;
  if (str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0)
    return str.substr(0, str.size() - suffix.size());
  else
    return str;
}

inline static std::string Ordinal(int n) {
  assert(n > 0);
  static const char* suffixes[] = {"th", "st", "nd", "rd", "th"};
  int v = n % 100;
  int index = (v >= 11 && v <= 13) ? 0 : std::min(v % 10, 4);
  return std::to_string(n) + suffixes[index];
}

inline static const std::string ToLower(const std::string& s) {
  std::string r(s.size(), '\0');
  std::transform(s.begin(), s.end(), r.begin(), [](unsigned char c) {
    return static_cast<char>(::tolower(c));
  });
  return r;
}

inline const std::string RemoveDirectoryPrefix(const std::string& path) {
  size_t pos = path.find_last_of("/\\");
  if (pos == std::string::npos) { return path; }
  return path.substr(pos + 1);
}

template <typename T>
inline bool Contains(const std::vector<T>& vec, const T& value) {
  return std::find(vec.begin(), vec.end(), value) != vec.end();
}

#endif // __KERNVAL_AUX_HPP__
