#include "command_line.hpp"
#include "context.hpp"
#include "io.hpp"
#include <fstream>
#include <sys/stat.h>

using namespace Kernval;

Option<std::string> output(OptionKind::User, "-o", "", "",
                           "Write the report into <file>.", "-o <file>", true);
Option<size_t> jobs(OptionKind::User, "--jobs", "-j", 1,
                    "Validate with <n> worker threads.", "--jobs <n>", true);
Option<bool>
    single_reduction(OptionKind::User, "--single-reduction", "", false,
                     "Reject a kernel or builtin with more than one reduction.");
Option<bool> dump_contracts(OptionKind::User, "--dump-contracts", "-e", false,
                            "Print the parsed kernel contracts and exit.");
Option<bool> print_bindings(OptionKind::User, "--print-bindings", "-pb", false,
                            "Print how each invocation binds to its kernel.");
Option<bool> warn_unbound_kernel(
    OptionKind::User, "--warn-unbound-kernel", "", false,
    "Report the invocation of an undeclared kernel as a warning.");

Option<bool> verbose(OptionKind::User, "--verbose", "-v", false,
                     "Trace the validation stages.");
Option<bool> inhibit_warning(OptionKind::User, "-w", "", false,
                             "Inhibit all warning messages.");
Option<bool> warning_as_error(OptionKind::User, "-Werror", "", false,
                              "Make all warnings into errors.");

Option<bool> no_show_source(
    OptionKind::Hidden, "-fno-show-source-location", "", false,
    "Do not show the source code location when error/warning/etc..");

// Some system missed c++17 filesystem support. Use POSIX instead
inline bool file_exists(const std::string& filename) {
  struct stat buffer;
  return (stat(filename.c_str(), &buffer) == 0);
}

bool CommandLine::Parse(int argc, char** argv) {
  auto& r = OptionRegistry::GetInstance();
  if (!r.Parse(argc, argv)) {
    if (!r.Message().empty()) errs() << r.Message() << "\n";
    ret_code = r.ReturnCode();
    return false;
  }

  if (jobs.GetValue() == 0) {
    errs() << "error: the number of jobs must be positive.\n";
    ret_code = 1;
    return false;
  }

  if (!r.SetOutputStream(output.GetValue())) {
    errs() << "error: unable to open '" << output.GetValue()
           << "' for writing.\n";
    ret_code = 1;
    return false;
  }

  // save the options to the global context
  CCtx().SetJobs(jobs.GetValue());
  CCtx().SetSingleReduction(single_reduction.GetValue());
  CCtx().SetDumpContracts(dump_contracts.GetValue());
  CCtx().SetPrintBindings(print_bindings.GetValue());
  CCtx().SetWarnUnboundKernel(warn_unbound_kernel.GetValue());
  CCtx().SetVerbose(verbose.GetValue());
  CCtx().SetInhibitWarning(inhibit_warning.GetValue());
  CCtx().SetWarningAsError(warning_as_error.GetValue());
  CCtx().SetShowSourceLocation(!no_show_source.GetValue());

  if (!r.StdinAsInput()) {
    std::string filename = r.GetInputFileName();
    if (!file_exists(filename)) {
      errs() << "error: The input file '" << filename << "' does not exist."
             << std::endl;
      ret_code = 1;
      return false;
    }

    // read the source file into memory
    std::ifstream ifs(filename);
    CCtx().ReadSourceLines(ifs);
  }

  return true;
}
