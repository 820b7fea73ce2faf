#include "report.hpp"
#include "context.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <unistd.h>

using namespace Kernval;

DiagnosticReporter::DiagnosticReporter(std::ostream& o) : os(o) {}

bool DiagnosticReporter::shell_supports_colors() {
  const char* term = getenv("TERM");
  return term &&
         (strcmp(term, "xterm-256color") == 0 || strcmp(term, "xterm") == 0);
}

bool DiagnosticReporter::should_use_colors() {
  return isatty(fileno(stdout)) && shell_supports_colors();
}

void DiagnosticReporter::ShowSourceLocation(const location& l) const {
  if (!CCtx().ShowSourceLocation() || !l.Known()) return;

  std::string line = CCtx().GetSourceLine(l.begin.line);
  if (line.empty()) return;

  os << "  " << line << "\n";
  os << "  ";
  for (int i = 1; i < l.begin.column; ++i) os << " ";
  os << "^" << "\n";
}

void DiagnosticReporter::Emit(const location& l, Severity s,
                              const std::string& message) const {
  const char* color = color_red;
  if (s == Severity::Warning) color = color_yellow;
  if (s == Severity::Note) color = color_blue;

  if (l.Known()) os << l << ": ";
  os << (should_use_colors() ? color : "") << STR(s) << ": "
     << (should_use_colors() ? color_reset : "");
  os << message << "\n";
  ShowSourceLocation(l);
}

void DiagnosticReporter::Error(const location& l, const std::string& message) {
  Emit(l, Severity::Error, message);
  error_count++;
}

void DiagnosticReporter::Warning(const location& l,
                                 const std::string& message) {
  if (CCtx().WarningAsError()) {
    Error(l, message);
    return;
  }
  if (CCtx().InhibitWarning()) return;
  Emit(l, Severity::Warning, message);
  warning_count++;
}

void DiagnosticReporter::Note(const location& l,
                              const std::string& message) const {
  if (CCtx().InhibitWarning()) return;
  Emit(l, Severity::Note, message);
}

void DiagnosticReporter::Report(const Diagnostic& d) {
  switch (d.severity) {
  case Severity::Error: Error(d.loc, d.message); break;
  case Severity::Warning: Warning(d.loc, d.message); break;
  case Severity::Note: Note(d.loc, d.message); break;
  default: kernval_unreachable("unsupported severity.");
  }
}

void DiagnosticReporter::Report(const Diagnostics& ds) {
  for (auto& d : ds) Report(d);
}

void DiagnosticReporter::Summary() const {
  if (error_count == 0 && warning_count == 0) return;
  os << error_count << " error(s) and " << warning_count
     << " warning(s) generated.\n";
}
