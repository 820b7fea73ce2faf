#include "unit_validator.hpp"
#include "shape_check.hpp"

#include <stdexcept>
#include <unordered_set>

using namespace Kernval;

size_t UnitResult::ErrorCount() const {
  size_t n = 0;
  for (auto& d : all)
    if (d.IsError()) ++n;
  return n;
}

UnitValidator::UnitValidator(const ContractRegistry& r,
                             const ValidatorOptions& o)
    : registry(r), opts(o) {
  if (!registry.IsSealed())
    throw std::logic_error("the contract registry must be sealed before "
                           "validation starts.");
  if (opts.jobs == 0) opts.jobs = 1;
}

Diagnostics UnitValidator::Check(const KernelContract& kc,
                                 const CheckOptions& co) {
  auto diags = ValidateContract(kc, co);
  if (kc.IsBuiltIn()) {
    auto shape = ValidateBuiltIn(kc);
    diags.insert(diags.end(), shape.begin(), shape.end());
  }
  return diags;
}

std::vector<ContractReport> UnitValidator::ValidateContracts() const {
  auto& contracts = registry.Contracts();
  std::vector<ContractReport> reports(contracts.size());
  ParallelFor(contracts.size(), [&](size_t i) {
    reports[i].contract = &contracts[i];
    reports[i].diags = Check(contracts[i], opts.check);
  });
  return reports;
}

std::vector<BindingResult>
UnitValidator::BindInvocations(const std::vector<Invocation>& invocations,
                               const std::vector<ContractReport>& reports) const {
  std::unordered_set<const KernelContract*> invalid;
  for (auto& r : reports)
    if (!r.IsValid()) invalid.insert(r.contract);

  std::vector<std::optional<BindingResult>> slots(invocations.size());
  ParallelFor(invocations.size(), [&](size_t i) {
    auto& inv = invocations[i];
    auto br = Bind(inv, registry.Candidates(inv.kernel));

    if (br.IsBound() && invalid.count(&br.Contract()))
      br = BindingResult::Rejected(
          {Diag::InvalidContractBinding(br.Contract(), inv.loc)});

    if (opts.warn_unbound_kernel)
      for (auto& d : br.GetDiagnostics())
        if (d.kind == DiagKind::UnknownKernel) d.severity = Severity::Warning;

    slots[i] = std::move(br);
  });

  std::vector<BindingResult> results;
  results.reserve(slots.size());
  for (auto& s : slots) {
    if (!s) kernval_unreachable("invocation was not processed.");
    results.push_back(std::move(*s));
  }
  return results;
}

UnitResult UnitValidator::Run(const std::vector<Invocation>& invocations) const {
  UnitResult res;
  res.contracts = ValidateContracts();
  res.bindings = BindInvocations(invocations, res.contracts);

  auto& reg_diags = registry.RegistrationDiagnostics();
  res.all.insert(res.all.end(), reg_diags.begin(), reg_diags.end());
  for (auto& r : res.contracts)
    res.all.insert(res.all.end(), r.diags.begin(), r.diags.end());
  for (auto& b : res.bindings)
    res.all.insert(res.all.end(), b.GetDiagnostics().begin(),
                   b.GetDiagnostics().end());
  return res;
}
