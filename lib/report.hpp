#ifndef __KERNVAL_REPORT_HPP__
#define __KERNVAL_REPORT_HPP__

// Prints diagnostics the way a compiler does:
//
//   file.kmd:12.3: error: <message>
//     <source line>
//     ^
//
// Warnings honour '-w' and '-Werror'.

#include <ostream>

#include "diagnostics.hpp"

namespace Kernval {

class DiagnosticReporter {
private:
  std::ostream& os;
  int error_count = 0;
  int warning_count = 0;

  static constexpr const char* color_red = "\033[31m";
  static constexpr const char* color_yellow = "\033[33m";
  static constexpr const char* color_blue = "\033[34m";
  static constexpr const char* color_reset = "\033[0m";

  void ShowSourceLocation(const location& l) const;
  void Emit(const location&, Severity, const std::string& message) const;

public:
  explicit DiagnosticReporter(std::ostream& o);

  static bool shell_supports_colors();
  static bool should_use_colors();

  // '-Werror' turns a warning into an error before it is counted
  void Report(const Diagnostic&);
  void Report(const Diagnostics&);

  void Error(const location&, const std::string& message);
  void Warning(const location&, const std::string& message);
  void Note(const location&, const std::string& message) const;

  int ErrorCount() const { return error_count; }
  int WarningCount() const { return warning_count; }
  bool HasError() const { return error_count > 0; }

  // "N error(s) and M warning(s) generated."; prints nothing when clean
  void Summary() const;
};

} // end namespace Kernval

#endif // __KERNVAL_REPORT_HPP__
