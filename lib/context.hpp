#ifndef __KERNVAL_CONTEXT_HPP__
#define __KERNVAL_CONTEXT_HPP__

// shared global context for a validation process: the configuration that the
// command line sets, and the source lines used when showing diagnostics.
// Kernel contracts are not kept here; they live in the ContractRegistry that
// each compilation unit owns.

#include <cstddef>
#include <istream>
#include <string>
#include <vector>

#include "access_rules.hpp"
#include "loc.hpp"

namespace Kernval {

class CompilationContext {
private:
  // validator configurations
  size_t jobs = 1;                   // worker threads
  bool single_reduction = false;     // flag more than one reduction
  bool dump_contracts = false;       // print the contracts and stop
  bool print_bindings = false;       // print each bound invocation
  bool verbose = false;              // trace the validation stages
  bool show_source_loc = true;   // show source code location when error, etc.
  bool inhibit_warning = false;  // Inhibit all warning messages.
  bool warning_as_error = false; // Make all warnings into errors.
  bool warn_unbound_kernel = false; // unknown kernels are warnings

private:
  std::vector<std::string> source_lines;

public:
  size_t Jobs() const { return jobs; }
  bool SingleReduction() const { return single_reduction; }
  bool DumpContracts() const { return dump_contracts; }
  bool PrintBindings() const { return print_bindings; }
  bool Verbose() const { return verbose; }
  bool ShowSourceLocation() const { return show_source_loc; }
  bool InhibitWarning() const { return inhibit_warning; }
  bool WarningAsError() const { return warning_as_error; }
  bool WarnUnboundKernel() const { return warn_unbound_kernel; }

  void SetJobs(size_t n) { jobs = (n == 0) ? 1 : n; }
  void SetSingleReduction(bool value) { single_reduction = value; }
  void SetDumpContracts(bool value) { dump_contracts = value; }
  void SetPrintBindings(bool value) { print_bindings = value; }
  void SetVerbose(bool value) { verbose = value; }
  void SetShowSourceLocation(bool value) { show_source_loc = value; }
  void SetInhibitWarning(bool value) { inhibit_warning = value; }
  void SetWarningAsError(bool value) { warning_as_error = value; }
  void SetWarnUnboundKernel(bool value) { warn_unbound_kernel = value; }

  // the options the rule engine needs, detached from the global state
  CheckOptions GetCheckOptions() const {
    CheckOptions co;
    co.single_reduction = single_reduction;
    return co;
  }

  void ReadSourceLines(std::istream& input) {
    source_lines.clear();
    std::string line;
    while (std::getline(input, line)) source_lines.push_back(line);
  }

  std::string GetSourceLine(int line_no) const {
    if (line_no > 0 && line_no <= (int)source_lines.size())
      return source_lines[line_no - 1];
    return "";
  }

  void Reset() { *this = CompilationContext(); }

public:
  static CompilationContext& GetInstance() {
    static CompilationContext instance;
    return instance;
  }
};

inline CompilationContext& CCtx() { return CompilationContext::GetInstance(); }

} // end namespace Kernval

#endif //__KERNVAL_CONTEXT_HPP__
