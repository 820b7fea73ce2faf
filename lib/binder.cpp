#include "binder.hpp"

#include <cstdint>
#include <set>
#include <stdexcept>

using namespace Kernval;

namespace {

std::string Describe(std::optional<ArgKind> k, std::optional<DataType> dt) {
  std::string res;
  if (dt) res = STR(*dt);
  if (k) res += (res.empty() ? "" : " ") + STR(*k);
  return res.empty() ? "unknown" : res;
}

std::string Describe(const ArgumentDescriptor& ad) {
  return Describe(ad.Kind(), ad.GetDataType());
}

// candidate-local check: one TypeMismatch per disagreeing argument
Diagnostics MatchCandidate(const KernelContract& kc, const Invocation& inv) {
  Diagnostics diags;
  for (size_t i = 0; i < kc.ArgCount(); ++i) {
    auto& formal = kc.Argument(i);
    auto& actual = inv.args[i];
    bool kind_ok = !actual.kind || *actual.kind == formal.Kind();
    bool type_ok = !actual.dtype || *actual.dtype == formal.GetDataType();
    if (kind_ok && type_ok) continue;
    diags.push_back(Diag::TypeMismatch(kc, i, Describe(formal),
                                       Describe(actual.kind, actual.dtype),
                                       inv.loc));
  }
  return diags;
}

} // end anonymous namespace

const std::string Kernval::STR(const InvocationArgument& ia) {
  if (!ia.kind && !ia.dtype) return ia.handle;
  return ia.handle + " : " + Describe(ia.kind, ia.dtype);
}

BindingResult BindingResult::Bound(const KernelContract& kc,
                                   std::vector<ArgBinding> m) {
  BindingResult br;
  br.contract = &kc;
  br.mapping = std::move(m);
  return br;
}

BindingResult BindingResult::Rejected(Diagnostics ds) {
  BindingResult br;
  br.diags = std::move(ds);
  return br;
}

const KernelContract& BindingResult::Contract() const {
  if (!contract)
    throw std::logic_error("a rejected invocation is not bound to a kernel.");
  return *contract;
}

void BindingResult::Print(std::ostream& os) const {
  if (!IsBound()) {
    os << "rejected (" << diags.size() << " diagnostic(s))\n";
    return;
  }
  os << "bound to " << STR(*contract) << "\n";
  for (size_t i = 0; i < mapping.size(); ++i)
    os << "  [" << i << "] " << STR(mapping[i].formal) << " <- "
       << STR(mapping[i].actual) << "\n";
}

BindingResult
Kernval::Bind(const Invocation& inv,
              const std::vector<const KernelContract*>& candidates) {
  if (candidates.empty())
    return BindingResult::Rejected({Diag::UnknownKernel(inv.kernel, inv.loc)});

  // 1. arity filter
  std::vector<const KernelContract*> same_arity;
  std::vector<size_t> arities;
  for (auto* kc : candidates) {
    if (kc->ArgCount() == inv.args.size())
      same_arity.push_back(kc);
    else if (!Contains(arities, kc->ArgCount()))
      arities.push_back(kc->ArgCount());
  }
  if (same_arity.empty())
    return BindingResult::Rejected(
        {Diag::ArityMismatch(inv.kernel, inv.args.size(), arities, inv.loc)});

  // 2. kind/type filter
  std::vector<const KernelContract*> matched;
  Diagnostics local;
  for (auto* kc : same_arity) {
    auto ds = MatchCandidate(*kc, inv);
    if (ds.empty())
      matched.push_back(kc);
    else
      local.insert(local.end(), ds.begin(), ds.end());
  }

  // 3. unique match
  if (matched.size() == 1) {
    auto* kc = matched.front();
    std::vector<ArgBinding> mapping;
    for (size_t i = 0; i < kc->ArgCount(); ++i)
      mapping.push_back({kc->Argument(i), inv.args[i]});
    return BindingResult::Bound(*kc, std::move(mapping));
  }

  // 5. ambiguity
  if (matched.size() > 1)
    return BindingResult::Rejected(
        {Diag::AmbiguousInvocation(inv.kernel, matched, inv.loc)});

  // 4. no match: merge the candidate-local diagnostics
  Diagnostics merged;
  std::set<std::pair<DiagKind, size_t>> seen;
  for (auto& d : local) {
    auto key = std::make_pair(d.kind, d.arg_index.value_or(SIZE_MAX));
    if (seen.insert(key).second) merged.push_back(d);
  }
  return BindingResult::Rejected(std::move(merged));
}
