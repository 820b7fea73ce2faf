#ifndef __KERNVAL_DIAGNOSTICS_HPP__
#define __KERNVAL_DIAGNOSTICS_HPP__

// Diagnostics are data: the checkers return them, they never throw them. The
// reporting layer decides how they are shown and what the exit code is.

#include <optional>
#include <string>
#include <vector>

#include "contract.hpp"
#include "loc.hpp"

namespace Kernval {

enum class DiagKind {
  // contract level
  IllegalAccessMode,
  InvalidSpaceCount,
  IllegalDataType,
  MultipleReductions,
  InvalidWriteCount,
  OperatorArgumentInBuiltIn,
  ConflictingReductionAndWrite,
  SpaceMismatch,
  NoEffectiveOutput,
  DataTypeMismatch,
  InvalidOperatesOn,
  DuplicateContract,
  // call-site level
  ArityMismatch,
  TypeMismatch,
  AmbiguousInvocation,
  UnknownKernel,
  InvalidContractBinding,
};

enum class Severity { Error, Warning, Note };

inline static const std::string STR(DiagKind dk) {
  switch (dk) {
  case DiagKind::IllegalAccessMode: return "IllegalAccessMode";
  case DiagKind::InvalidSpaceCount: return "InvalidSpaceCount";
  case DiagKind::IllegalDataType: return "IllegalDataType";
  case DiagKind::MultipleReductions: return "MultipleReductions";
  case DiagKind::InvalidWriteCount: return "InvalidWriteCount";
  case DiagKind::OperatorArgumentInBuiltIn: return "OperatorArgumentInBuiltIn";
  case DiagKind::ConflictingReductionAndWrite:
    return "ConflictingReductionAndWrite";
  case DiagKind::SpaceMismatch: return "SpaceMismatch";
  case DiagKind::NoEffectiveOutput: return "NoEffectiveOutput";
  case DiagKind::DataTypeMismatch: return "DataTypeMismatch";
  case DiagKind::InvalidOperatesOn: return "InvalidOperatesOn";
  case DiagKind::DuplicateContract: return "DuplicateContract";
  case DiagKind::ArityMismatch: return "ArityMismatch";
  case DiagKind::TypeMismatch: return "TypeMismatch";
  case DiagKind::AmbiguousInvocation: return "AmbiguousInvocation";
  case DiagKind::UnknownKernel: return "UnknownKernel";
  case DiagKind::InvalidContractBinding: return "InvalidContractBinding";
  default: kernval_unreachable("unsupported diagnostic kind.");
  }
}

inline static const std::string STR(Severity s) {
  switch (s) {
  case Severity::Error: return "error";
  case Severity::Warning: return "warning";
  case Severity::Note: return "info";
  default: kernval_unreachable("unsupported severity.");
  }
}

struct Diagnostic {
  DiagKind kind;
  Severity severity = Severity::Error;
  std::string subject;              // the contract or the invoked kernel
  std::optional<size_t> arg_index;  // 0-based, when the defect has one
  std::string message;
  location loc;

  // structured payload, only the fields relevant to `kind` are set
  std::optional<size_t> expected_count; // InvalidWriteCount/InvalidSpaceCount
  std::optional<size_t> actual_count;
  std::string expected; // SpaceMismatch, TypeMismatch, DataTypeMismatch
  std::string actual;
  std::optional<ArgKind> arg_kind; // IllegalAccessMode, IllegalDataType
  std::optional<Access> access;
  std::vector<std::string> candidates; // AmbiguousInvocation, ArityMismatch

  bool IsError() const { return severity == Severity::Error; }
};

using Diagnostics = std::vector<Diagnostic>;

// "error: <message>", without the location
const std::string STR(const Diagnostic&);

inline bool HasErrors(const Diagnostics& ds) {
  for (auto& d : ds)
    if (d.IsError()) return true;
  return false;
}

// Constructors of the individual diagnostics. They own the message templates.
namespace Diag {

Diagnostic IllegalAccessMode(const KernelContract&, size_t index);
Diagnostic InvalidSpaceCount(const KernelContract&, size_t index);
Diagnostic IllegalDataType(const KernelContract&, size_t index);
Diagnostic MultipleReductions(const KernelContract&, size_t index,
                              size_t first);
Diagnostic InvalidWriteCount(const KernelContract&, size_t actual);
Diagnostic OperatorArgumentInBuiltIn(const KernelContract&, size_t index);
Diagnostic ReductionNotScalar(const KernelContract&, size_t index);
Diagnostic ConflictingReductionAndWrite(const KernelContract&, size_t index,
                                        size_t sum_index, size_t rw_index);
Diagnostic SpaceMismatch(const KernelContract&, const SpaceRef& expected,
                         size_t index);
Diagnostic NoEffectiveOutput(const KernelContract&);
Diagnostic DataTypeMismatch(const KernelContract&, DataType expected,
                            size_t index);
Diagnostic InvalidOperatesOn(const KernelContract&);
Diagnostic DuplicateContract(const KernelContract&);

Diagnostic ArityMismatch(const std::string& kernel, size_t actual,
                         const std::vector<size_t>& arities,
                         const location& = location());
Diagnostic TypeMismatch(const KernelContract&, size_t index,
                        const std::string& expected, const std::string& actual,
                        const location& = location());
Diagnostic AmbiguousInvocation(const std::string& kernel,
                               const std::vector<const KernelContract*>&,
                               const location& = location());
Diagnostic UnknownKernel(const std::string& kernel,
                         const location& = location());
Diagnostic InvalidContractBinding(const KernelContract&,
                                  const location& = location());

} // end namespace Diag

} // end namespace Kernval

#endif // __KERNVAL_DIAGNOSTICS_HPP__
