#ifndef __KERNVAL_UNIT_VALIDATOR_HPP__
#define __KERNVAL_UNIT_VALIDATOR_HPP__

// Validates everything of one compilation unit: each contract on its own, then
// each invocation against the sealed registry. All diagnostics are gathered so
// that a user sees every defect in one run.
//
// Work may be spread over several threads. Every task writes only its own
// result slot and the registry is read-only once sealed, so no locking is
// needed and the output order does not depend on the number of threads.

#include <algorithm>
#include <optional>
#include <system_error>
#include <thread>
#include <vector>

#include "access_rules.hpp"
#include "binder.hpp"
#include "registry.hpp"

namespace Kernval {

struct ContractReport {
  const KernelContract* contract; // owned by the registry
  Diagnostics diags;

  bool IsValid() const { return !HasErrors(diags); }
};

struct ValidatorOptions {
  CheckOptions check;
  size_t jobs = 1;
  bool warn_unbound_kernel = false; // UnknownKernel as a warning
};

struct UnitResult {
  std::vector<ContractReport> contracts; // declaration order
  std::vector<BindingResult> bindings;   // invocation order
  Diagnostics all; // registry, then contracts, then invocations

  bool HasErrors() const { return Kernval::HasErrors(all); }
  size_t ErrorCount() const;
};

class UnitValidator {
private:
  const ContractRegistry& registry;
  ValidatorOptions opts;

  // runs `task(i)` for i in [0, n) on up to `opts.jobs` threads
  template <typename Task>
  void ParallelFor(size_t n, Task&& task) const {
    size_t workers = std::min(opts.jobs, n);
    if (workers <= 1) {
      for (size_t i = 0; i < n; ++i) task(i);
      return;
    }
    std::vector<std::thread> pool;
    pool.reserve(workers);
    try {
      for (size_t w = 0; w < workers; ++w)
        pool.emplace_back([&task, w, workers, n]() {
          for (size_t i = w; i < n; i += workers) task(i);
        });
    } catch (const std::system_error&) {
      // the started workers still reference `task`
      for (auto& t : pool) t.join();
      throw;
    }
    for (auto& t : pool) t.join();
  }

public:
  // throws std::logic_error if the registry is not sealed
  explicit UnitValidator(const ContractRegistry&,
                         const ValidatorOptions& = ValidatorOptions());

  // access rules for every contract, plus the shape rules for built-ins
  static Diagnostics Check(const KernelContract&, const CheckOptions&);

  std::vector<ContractReport> ValidateContracts() const;

  // An invocation that binds to a contract with errors is rejected.
  std::vector<BindingResult>
  BindInvocations(const std::vector<Invocation>&,
                  const std::vector<ContractReport>&) const;

  UnitResult Run(const std::vector<Invocation>&) const;
};

} // end namespace Kernval

#endif // __KERNVAL_UNIT_VALIDATOR_HPP__
