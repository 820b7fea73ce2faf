#include "diagnostics.hpp"
#include "access_rules.hpp"

using namespace Kernval;

namespace {

Diagnostic Make(DiagKind dk, const KernelContract& kc,
                std::optional<size_t> index, const std::string& msg) {
  Diagnostic d;
  d.kind = dk;
  d.subject = kc.Name();
  d.arg_index = index;
  d.message = msg;
  d.loc = kc.LOC();
  return d;
}

// "the 2nd argument (field/real/write@w1) of kernel 'foo'"
std::string ArgPhrase(const KernelContract& kc, size_t index) {
  return "the " + Ordinal(index + 1) + " argument (" +
         STR(kc.Argument(index)) + ") of kernel '" + kc.Name() + "'";
}

std::string KernelPhrase(const KernelContract& kc) {
  return std::string(kc.IsBuiltIn() ? "built-in" : "kernel") + " '" +
         kc.Name() + "'";
}

template <typename E>
std::vector<std::string> Names(const std::vector<E>& items) {
  std::vector<std::string> res;
  for (auto& i : items) res.push_back(STR(i));
  return res;
}

} // end anonymous namespace

const std::string Kernval::STR(const Diagnostic& d) {
  return STR(d.severity) + ": " + d.message;
}

Diagnostic Diag::IllegalAccessMode(const KernelContract& kc, size_t index) {
  auto& arg = kc.Argument(index);
  auto d = Make(DiagKind::IllegalAccessMode, kc, index,
                ArgPhrase(kc, index) + " has access '" +
                    STR(arg.GetAccess()) + "', but allowed accesses for " +
                    STR(arg.Kind()) + " arguments are " +
                    QuotedList(Names(LegalAccesses(arg.Kind()))) + ".");
  d.arg_kind = arg.Kind();
  d.access = arg.GetAccess();
  return d;
}

Diagnostic Diag::InvalidSpaceCount(const KernelContract& kc, size_t index) {
  auto& arg = kc.Argument(index);
  auto expected = ExpectedSpaceCount(arg.Kind());
  auto d = Make(DiagKind::InvalidSpaceCount, kc, index,
                ArgPhrase(kc, index) + " is declared over " +
                    std::to_string(arg.Spaces().size()) +
                    " function space(s), but a " + STR(arg.Kind()) +
                    " requires " + std::to_string(expected) + ".");
  d.arg_kind = arg.Kind();
  d.expected_count = expected;
  d.actual_count = arg.Spaces().size();
  return d;
}

Diagnostic Diag::IllegalDataType(const KernelContract& kc, size_t index) {
  auto& arg = kc.Argument(index);
  std::string msg = ArgPhrase(kc, index) + " has data type '" +
                    STR(arg.GetDataType()) + "', ";
  if (arg.IsReduction() && IsLegalDataType(arg.Kind(), arg.GetDataType()))
    msg += "but a reduction must be of data type 'real' or 'integer'.";
  else
    msg += "but allowed data types for " + STR(arg.Kind()) +
           " arguments are " +
           QuotedList(Names(LegalDataTypes(arg.Kind()))) + ".";
  auto d = Make(DiagKind::IllegalDataType, kc, index, msg);
  d.arg_kind = arg.Kind();
  d.actual = STR(arg.GetDataType());
  return d;
}

Diagnostic Diag::MultipleReductions(const KernelContract& kc, size_t index,
                                    size_t first) {
  return Make(DiagKind::MultipleReductions, kc, index,
              ArgPhrase(kc, index) +
                  " is a second reduction; only a single reduction per "
                  "kernel is supported (the first is the " +
                  Ordinal(first + 1) + " argument).");
}

Diagnostic Diag::InvalidWriteCount(const KernelContract& kc, size_t actual) {
  auto d = Make(DiagKind::InvalidWriteCount, kc, std::nullopt,
                KernelPhrase(kc) +
                    " must have exactly one field argument that is written "
                    "('write', 'readwrite' or 'inc'), but " +
                    std::to_string(actual) + " found.");
  d.expected_count = 1;
  d.actual_count = actual;
  return d;
}

Diagnostic Diag::OperatorArgumentInBuiltIn(const KernelContract& kc,
                                           size_t index) {
  auto d = Make(DiagKind::OperatorArgumentInBuiltIn, kc, index,
                ArgPhrase(kc, index) +
                    " is an operator; built-ins may only take field and "
                    "scalar arguments.");
  d.arg_kind = ArgKind::OPERATOR;
  return d;
}

Diagnostic Diag::ReductionNotScalar(const KernelContract& kc, size_t index) {
  auto d = Make(DiagKind::ConflictingReductionAndWrite, kc, index,
                ArgPhrase(kc, index) +
                    " has access 'sum', but in a built-in only scalar "
                    "arguments may be reductions.");
  d.arg_kind = kc.Argument(index).Kind();
  d.access = Access::SUM;
  return d;
}

Diagnostic Diag::ConflictingReductionAndWrite(const KernelContract& kc,
                                              size_t index, size_t sum_index,
                                              size_t rw_index) {
  return Make(DiagKind::ConflictingReductionAndWrite, kc, index,
              KernelPhrase(kc) + " mixes the reduction in its " +
                  Ordinal(sum_index + 1) +
                  " argument and the 'readwrite' field in its " +
                  Ordinal(rw_index + 1) +
                  " argument with a separate 'write' field (the " +
                  Ordinal(index + 1) + " argument).");
}

Diagnostic Diag::SpaceMismatch(const KernelContract& kc,
                               const SpaceRef& expected, size_t index) {
  auto* actual = kc.Argument(index).FunctionSpace();
  auto d = Make(DiagKind::SpaceMismatch, kc, index,
                ArgPhrase(kc, index) + " is on function space '" +
                    (actual ? actual->Name() : std::string("<none>")) +
                    "', but all field arguments of " + KernelPhrase(kc) +
                    " must be on the same space ('" + expected.Name() +
                    "').");
  d.expected = expected.Name();
  d.actual = actual ? actual->Name() : "";
  return d;
}

Diagnostic Diag::NoEffectiveOutput(const KernelContract& kc) {
  return Make(DiagKind::NoEffectiveOutput, kc, std::nullopt,
              KernelPhrase(kc) +
                  " neither writes a field nor performs a reduction.");
}

Diagnostic Diag::DataTypeMismatch(const KernelContract& kc, DataType expected,
                                  size_t index) {
  auto actual = kc.Argument(index).GetDataType();
  auto d = Make(DiagKind::DataTypeMismatch, kc, index,
                ArgPhrase(kc, index) + " has data type '" + STR(actual) +
                    "', but all field arguments of " + KernelPhrase(kc) +
                    " must have the same data type ('" + STR(expected) +
                    "') unless it is a conversion.");
  d.expected = STR(expected);
  d.actual = STR(actual);
  return d;
}

Diagnostic Diag::InvalidOperatesOn(const KernelContract& kc) {
  auto d = Make(DiagKind::InvalidOperatesOn, kc, std::nullopt,
                KernelPhrase(kc) + " operates on '" +
                    STR(kc.GetOperatesOn()) +
                    "', but built-ins must operate on 'dof'.");
  d.expected = STR(OperatesOn::DOF);
  d.actual = STR(kc.GetOperatesOn());
  return d;
}

Diagnostic Diag::DuplicateContract(const KernelContract& kc) {
  return Make(DiagKind::DuplicateContract, kc, std::nullopt,
              KernelPhrase(kc) +
                  " is declared twice with the same argument list.");
}

Diagnostic Diag::ArityMismatch(const std::string& kernel, size_t actual,
                               const std::vector<size_t>& arities,
                               const location& l) {
  Diagnostic d;
  d.kind = DiagKind::ArityMismatch;
  d.subject = kernel;
  d.loc = l;
  d.actual_count = actual;
  d.message = "invocation of kernel '" + kernel + "' passes " +
              std::to_string(actual) +
              " argument(s), but the kernel expects " +
              DelimitedString(arities, " or ") + ".";
  return d;
}

Diagnostic Diag::TypeMismatch(const KernelContract& kc, size_t index,
                              const std::string& expected,
                              const std::string& actual, const location& l) {
  Diagnostic d;
  d.kind = DiagKind::TypeMismatch;
  d.subject = kc.Name();
  d.arg_index = index;
  d.loc = l;
  d.expected = expected;
  d.actual = actual;
  d.message = "the " + Ordinal(index + 1) + " actual argument of the call to '" +
              kc.Name() + "' is a " + actual + ", but the kernel expects a " +
              expected + ".";
  return d;
}

Diagnostic
Diag::AmbiguousInvocation(const std::string& kernel,
                          const std::vector<const KernelContract*>& cands,
                          const location& l) {
  Diagnostic d;
  d.kind = DiagKind::AmbiguousInvocation;
  d.subject = kernel;
  d.loc = l;
  std::vector<std::string> sigs;
  for (auto* kc : cands) {
    d.candidates.push_back(kc->Name());
    sigs.push_back(STR(*kc));
  }
  d.message = "invocation of kernel '" + kernel +
              "' is ambiguous; candidates are: " +
              DelimitedString(sigs, "; ") + ".";
  return d;
}

Diagnostic Diag::UnknownKernel(const std::string& kernel, const location& l) {
  Diagnostic d;
  d.kind = DiagKind::UnknownKernel;
  d.subject = kernel;
  d.loc = l;
  d.message = "no kernel named '" + kernel + "' is declared.";
  return d;
}

Diagnostic Diag::InvalidContractBinding(const KernelContract& kc,
                                        const location& l) {
  Diagnostic d;
  d.kind = DiagKind::InvalidContractBinding;
  d.subject = kc.Name();
  d.loc = l;
  d.message = "invocation binds to " + KernelPhrase(kc) +
              ", whose contract is invalid; no code is generated for it.";
  return d;
}
