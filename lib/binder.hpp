#ifndef __KERNVAL_BINDER_HPP__
#define __KERNVAL_BINDER_HPP__

// Matches the actual arguments of an invocation against the contracts that
// carry the invoked name. The binder never guesses: when more than one
// contract fits, the invocation is rejected as ambiguous.

#include <optional>
#include <string>
#include <vector>

#include "contract.hpp"
#include "diagnostics.hpp"

namespace Kernval {

// An actual argument at a call site. Kind and data type are unknown when the
// call-site scanner could not resolve them; unknown matches anything.
struct InvocationArgument {
  std::string handle;
  std::optional<ArgKind> kind;
  std::optional<DataType> dtype;

  InvocationArgument(const std::string& h,
                     std::optional<ArgKind> k = std::nullopt,
                     std::optional<DataType> dt = std::nullopt)
      : handle(h), kind(k), dtype(dt) {}

  bool IsResolved() const { return kind.has_value(); }
};

// e.g. "f1 : real field", or just "f1" when nothing is known
const std::string STR(const InvocationArgument&);

struct Invocation {
  std::string kernel;
  std::vector<InvocationArgument> args;
  location loc;
};

struct ArgBinding {
  ArgumentDescriptor formal;
  InvocationArgument actual;
};

class BindingResult {
private:
  const KernelContract* contract = nullptr; // owned by the registry
  std::vector<ArgBinding> mapping;
  Diagnostics diags;

  BindingResult() {}

public:
  static BindingResult Bound(const KernelContract&, std::vector<ArgBinding>);
  static BindingResult Rejected(Diagnostics);

  bool IsBound() const { return contract != nullptr; }

  // throws std::logic_error on a rejected result
  const KernelContract& Contract() const;
  const std::vector<ArgBinding>& Mapping() const { return mapping; }

  const Diagnostics& GetDiagnostics() const { return diags; }
  // the unit validator demotes or adds diagnostics after binding
  Diagnostics& GetDiagnostics() { return diags; }

  void Print(std::ostream&) const;
};

// Arity filter, then kind/type filter, then uniqueness. Candidates are tried
// in the given order; the result only refers to contracts from `candidates`.
BindingResult Bind(const Invocation&,
                   const std::vector<const KernelContract*>& candidates);

} // end namespace Kernval

#endif // __KERNVAL_BINDER_HPP__
