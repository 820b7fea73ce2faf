#include "shape_check.hpp"
#include <algorithm>

using namespace Kernval;

namespace {

struct ShapeSummary {
  std::vector<size_t> fields;
  std::vector<size_t> written_fields;
  std::vector<size_t> operators;
  std::vector<size_t> reductions;
  std::optional<size_t> first_readwrite;
  std::optional<size_t> first_write;

  explicit ShapeSummary(const KernelContract& kc) {
    for (size_t i = 0; i < kc.ArgCount(); ++i) {
      auto& arg = kc.Argument(i);
      if (arg.IsReduction()) reductions.push_back(i);
      if (arg.IsOperator()) operators.push_back(i);
      if (!arg.IsField()) continue;
      fields.push_back(i);
      if (!arg.IsWritten()) continue;
      written_fields.push_back(i);
      if (arg.GetAccess() == Access::READWRITE && !first_readwrite)
        first_readwrite = i;
      if (arg.GetAccess() == Access::WRITE && !first_write) first_write = i;
    }
  }
};

void CheckSingleWriter(const KernelContract& kc, const ShapeSummary& ss,
                       Diagnostics& diags) {
  if (ss.fields.empty()) return; // nothing to write to, see rule 5
  if (ss.written_fields.size() != 1)
    diags.push_back(Diag::InvalidWriteCount(kc, ss.written_fields.size()));
}

void CheckNoOperator(const KernelContract& kc, const ShapeSummary& ss,
                     Diagnostics& diags) {
  for (auto i : ss.operators)
    diags.push_back(Diag::OperatorArgumentInBuiltIn(kc, i));
}

void CheckReductionIsolation(const KernelContract& kc, const ShapeSummary& ss,
                             Diagnostics& diags) {
  if (ss.reductions.empty()) return;

  Diagnostics found;
  for (auto i : ss.reductions)
    if (!kc.Argument(i).IsScalar())
      found.push_back(Diag::ReductionNotScalar(kc, i));

  // a fused accumulate (sum + readwrite) is fine on its own, but not together
  // with another field that is plainly overwritten
  if (ss.first_readwrite && ss.first_write)
    found.push_back(Diag::ConflictingReductionAndWrite(
        kc, *ss.first_write, ss.reductions.front(), *ss.first_readwrite));

  // both kinds of conflict are reported by argument position
  std::stable_sort(found.begin(), found.end(),
                   [](const Diagnostic& a, const Diagnostic& b) {
                     return a.arg_index < b.arg_index;
                   });
  diags.insert(diags.end(), found.begin(), found.end());
}

void CheckSharedSpace(const KernelContract& kc, const ShapeSummary& ss,
                      Diagnostics& diags) {
  if (kc.IsCrossSpaceConversion() || ss.fields.empty()) return;

  const SpaceRef* expected = nullptr;
  for (auto i : ss.fields) {
    auto* space = kc.Argument(i).FunctionSpace();
    if (!space) continue; // malformed already, reported as InvalidSpaceCount
    if (!expected)
      expected = space;
    else if (*space != *expected)
      diags.push_back(Diag::SpaceMismatch(kc, *expected, i));
  }
}

void CheckEffectiveOutput(const KernelContract& kc, const ShapeSummary& ss,
                          Diagnostics& diags) {
  if (ss.fields.empty() && ss.reductions.empty())
    diags.push_back(Diag::NoEffectiveOutput(kc));
}

void CheckSharedDataType(const KernelContract& kc, const ShapeSummary& ss,
                         Diagnostics& diags) {
  if (kc.IsCrossSpaceConversion() || ss.fields.empty()) return;

  auto expected = kc.Argument(ss.fields.front()).GetDataType();
  for (auto i : ss.fields)
    if (kc.Argument(i).GetDataType() != expected)
      diags.push_back(Diag::DataTypeMismatch(kc, expected, i));
}

void CheckOperatesOn(const KernelContract& kc, Diagnostics& diags) {
  if (kc.GetOperatesOn() != OperatesOn::DOF)
    diags.push_back(Diag::InvalidOperatesOn(kc));
}

} // end anonymous namespace

Diagnostics Kernval::ValidateBuiltIn(const KernelContract& kc) {
  Diagnostics diags;
  if (!kc.IsBuiltIn()) return diags;

  ShapeSummary ss(kc);
  CheckSingleWriter(kc, ss, diags);
  CheckNoOperator(kc, ss, diags);
  CheckReductionIsolation(kc, ss, diags);
  CheckSharedSpace(kc, ss, diags);
  CheckEffectiveOutput(kc, ss, diags);
  CheckSharedDataType(kc, ss, diags);
  CheckOperatesOn(kc, diags);
  return diags;
}
