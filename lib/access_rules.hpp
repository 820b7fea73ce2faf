#ifndef __KERNVAL_ACCESS_RULES_HPP__
#define __KERNVAL_ACCESS_RULES_HPP__

// Per-argument legality of kind/access/type/space combinations. The checks
// apply to user kernels and to built-ins alike.

#include "contract.hpp"
#include "diagnostics.hpp"

namespace Kernval {

struct CheckOptions {
  // flag a contract that declares more than one reduction argument
  bool single_reduction = false;
};

// The fixed access table:
//   field    -> read, write, readwrite, inc
//   scalar   -> read, sum
//   operator -> read
// Total over all (kind, access) pairs.
bool IsLegalAccess(ArgKind, Access);
const std::vector<Access> LegalAccesses(ArgKind);

// fields hold real or integer data, operators real only, scalars any type
bool IsLegalDataType(ArgKind, DataType);
const std::vector<DataType> LegalDataTypes(ArgKind);

// A reduction accumulates numbers: logical sums are meaningless.
inline bool IsReducibleType(DataType dt) {
  return dt == DataType::REAL || dt == DataType::INTEGER;
}

Diagnostics ValidateContract(const KernelContract&,
                             const CheckOptions& = CheckOptions());

} // end namespace Kernval

#endif // __KERNVAL_ACCESS_RULES_HPP__
