#ifndef __KERNVAL_KMD_READER_HPP__
#define __KERNVAL_KMD_READER_HPP__

// Reader of the contract description files (.kmd). A file declares kernel
// contracts and the invocations made against them:
//
//   builtin kernel setval_c operates_on dof {
//     field  real write any_space_1;
//     scalar real read;
//   }
//   invoke setval_c(f1 : field real, c);

#include <istream>
#include <string>
#include <vector>

#include "binder.hpp"
#include "contract.hpp"
#include "io.hpp"
#include "report.hpp"

namespace Kernval {

struct ContractUnit {
  std::vector<KernelContract> contracts; // declaration order
  std::vector<Invocation> invocations;   // call order
};

// Shared by the parser actions: collects the result and reports syntax errors.
class PContext {
private:
  ContractUnit& unit;
  DiagnosticReporter reporter;

public:
  explicit PContext(ContractUnit& u, std::ostream& es = errs())
      : unit(u), reporter(es) {}

  void AddContract(KernelContract kc) { unit.contracts.push_back(std::move(kc)); }
  void AddInvocation(Invocation inv) {
    unit.invocations.push_back(std::move(inv));
  }

  void Error(const location& l, const std::string& message) {
    reporter.Error(l, message);
  }
  bool HasError() const { return reporter.HasError(); }
  int ErrorCount() const { return reporter.ErrorCount(); }
};

// Parses `is` into `unit`. Syntax errors are printed to `es` with the
// location inside `filename`; returns false when any was found.
bool ReadDescription(std::istream& is, const std::string& filename,
                     ContractUnit& unit, std::ostream& es = errs());

} // end namespace Kernval

#endif // __KERNVAL_KMD_READER_HPP__
