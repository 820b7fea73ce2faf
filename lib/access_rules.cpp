#include "access_rules.hpp"

using namespace Kernval;

bool Kernval::IsLegalAccess(ArgKind k, Access a) {
  switch (k) {
  case ArgKind::FIELD:
    return a == Access::READ || a == Access::WRITE || a == Access::READWRITE ||
           a == Access::INC;
  case ArgKind::SCALAR: return a == Access::READ || a == Access::SUM;
  case ArgKind::OPERATOR: return a == Access::READ;
  default: break;
  }
  return false;
}

const std::vector<Access> Kernval::LegalAccesses(ArgKind k) {
  std::vector<Access> res;
  for (auto a : all_accesses)
    if (IsLegalAccess(k, a)) res.push_back(a);
  return res;
}

bool Kernval::IsLegalDataType(ArgKind k, DataType dt) {
  switch (k) {
  case ArgKind::FIELD:
    return dt == DataType::REAL || dt == DataType::INTEGER;
  case ArgKind::SCALAR: return true;
  case ArgKind::OPERATOR: return dt == DataType::REAL;
  default: break;
  }
  return false;
}

const std::vector<DataType> Kernval::LegalDataTypes(ArgKind k) {
  std::vector<DataType> res;
  for (auto dt : {DataType::REAL, DataType::INTEGER, DataType::LOGICAL})
    if (IsLegalDataType(k, dt)) res.push_back(dt);
  return res;
}

Diagnostics Kernval::ValidateContract(const KernelContract& kc,
                                      const CheckOptions& opts) {
  Diagnostics diags;
  std::optional<size_t> first_sum;

  for (size_t i = 0; i < kc.ArgCount(); ++i) {
    auto& arg = kc.Argument(i);

    if (!IsLegalAccess(arg.Kind(), arg.GetAccess()))
      diags.push_back(Diag::IllegalAccessMode(kc, i));

    if (arg.Spaces().size() != ExpectedSpaceCount(arg.Kind()))
      diags.push_back(Diag::InvalidSpaceCount(kc, i));

    if (!IsLegalDataType(arg.Kind(), arg.GetDataType()) ||
        (arg.IsReduction() && !IsReducibleType(arg.GetDataType())))
      diags.push_back(Diag::IllegalDataType(kc, i));

    if (arg.IsReduction()) {
      if (!first_sum)
        first_sum = i;
      else if (opts.single_reduction)
        diags.push_back(Diag::MultipleReductions(kc, i, *first_sum));
    }
  }

  return diags;
}
