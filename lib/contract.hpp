#ifndef __KERNVAL_CONTRACT_HPP__
#define __KERNVAL_CONTRACT_HPP__

// The argument contract of a kernel: what each formal argument is, which type
// of data it holds, how the kernel accesses it and over which function spaces
// it is defined. Contracts are built once, when the metadata is extracted, and
// are read-only afterwards.

#include <optional>
#include <string>
#include <vector>

#include "aux.hpp"
#include "loc.hpp"

namespace Kernval {

enum class ArgKind {
  FIELD,
  SCALAR,
  OPERATOR, // couples a 'to' and a 'from' function space
};

enum class Access {
  READ,
  WRITE,
  READWRITE,
  INC, // accumulate in place
  SUM, // global reduction
};

enum class DataType {
  REAL,
  INTEGER,
  LOGICAL,
};

enum class OperatesOn {
  CELL_COLUMN,
  DOF,
  DOMAIN,
};

inline static const std::string STR(ArgKind k) {
  switch (k) {
  case ArgKind::FIELD: return "field";
  case ArgKind::SCALAR: return "scalar";
  case ArgKind::OPERATOR: return "operator";
  default: kernval_unreachable("unsupported argument kind.");
  }
}

inline static const std::string STR(Access a) {
  switch (a) {
  case Access::READ: return "read";
  case Access::WRITE: return "write";
  case Access::READWRITE: return "readwrite";
  case Access::INC: return "inc";
  case Access::SUM: return "sum";
  default: kernval_unreachable("unsupported access mode.");
  }
}

inline static const std::string STR(DataType dt) {
  switch (dt) {
  case DataType::REAL: return "real";
  case DataType::INTEGER: return "integer";
  case DataType::LOGICAL: return "logical";
  default: kernval_unreachable("unsupported data type.");
  }
}

inline static const std::string STR(OperatesOn on) {
  switch (on) {
  case OperatesOn::CELL_COLUMN: return "cell_column";
  case OperatesOn::DOF: return "dof";
  case OperatesOn::DOMAIN: return "domain";
  default: kernval_unreachable("unsupported iteration space.");
  }
}

// Keyword lookups, case-insensitive. The metadata spelling ("gh_field",
// "gh_inc", ...) is accepted as well as the short one.
std::optional<ArgKind> ArgKindFromString(const std::string&);
std::optional<Access> AccessFromString(const std::string&);
std::optional<DataType> DataTypeFromString(const std::string&);
std::optional<OperatesOn> OperatesOnFromString(const std::string&);

inline constexpr ArgKind all_arg_kinds[] = {ArgKind::FIELD, ArgKind::SCALAR,
                                            ArgKind::OPERATOR};
inline constexpr Access all_accesses[] = {Access::READ, Access::WRITE,
                                          Access::READWRITE, Access::INC,
                                          Access::SUM};

// A function space name. Placeholders such as "any_space_1" are ordinary
// symbolic names: "any_space_1" and "any_space_2" never compare equal.
class SpaceRef {
private:
  std::string name; // stored lower-case, the DSL is case-insensitive

public:
  explicit SpaceRef(const std::string& n) : name(ToLower(n)) {}

  const std::string& Name() const { return name; }
  bool IsPlaceholder() const {
    return PrefixedWith(name, "any_space_") ||
           PrefixedWith(name, "any_discontinuous_space_");
  }

  bool operator==(const SpaceRef& other) const { return name == other.name; }
  bool operator!=(const SpaceRef& other) const { return !(*this == other); }
};

inline static const std::string STR(const SpaceRef& s) { return s.Name(); }

using SpaceList = std::vector<SpaceRef>;

// Number of function spaces an argument of the kind is declared over.
inline size_t ExpectedSpaceCount(ArgKind k) {
  switch (k) {
  case ArgKind::SCALAR: return 0;
  case ArgKind::FIELD: return 1;
  case ArgKind::OPERATOR: return 2;
  default: kernval_unreachable("unsupported argument kind.");
  }
}

class ArgumentDescriptor {
private:
  ArgKind kind;
  DataType dtype;
  Access access;
  SpaceList spaces;

public:
  ArgumentDescriptor(ArgKind k, DataType dt, Access a, SpaceList s = {})
      : kind(k), dtype(dt), access(a), spaces(std::move(s)) {}

  static ArgumentDescriptor Field(DataType dt, Access a,
                                  const std::string& space) {
    return ArgumentDescriptor(ArgKind::FIELD, dt, a, {SpaceRef(space)});
  }
  static ArgumentDescriptor Scalar(DataType dt, Access a) {
    return ArgumentDescriptor(ArgKind::SCALAR, dt, a);
  }
  static ArgumentDescriptor Operator(DataType dt, Access a,
                                     const std::string& to,
                                     const std::string& from) {
    return ArgumentDescriptor(ArgKind::OPERATOR, dt, a,
                              {SpaceRef(to), SpaceRef(from)});
  }

  ArgKind Kind() const { return kind; }
  DataType GetDataType() const { return dtype; }
  Access GetAccess() const { return access; }
  const SpaceList& Spaces() const { return spaces; }

  // the (first) space of a field, nullptr if nothing is declared
  const SpaceRef* FunctionSpace() const {
    return spaces.empty() ? nullptr : &spaces.front();
  }

  bool IsField() const { return kind == ArgKind::FIELD; }
  bool IsScalar() const { return kind == ArgKind::SCALAR; }
  bool IsOperator() const { return kind == ArgKind::OPERATOR; }

  bool IsWritten() const {
    return access == Access::WRITE || access == Access::READWRITE ||
           access == Access::INC;
  }
  bool IsReduction() const { return access == Access::SUM; }

  bool operator==(const ArgumentDescriptor& other) const {
    return kind == other.kind && dtype == other.dtype &&
           access == other.access && spaces == other.spaces;
  }
  bool operator!=(const ArgumentDescriptor& other) const {
    return !(*this == other);
  }
};

// e.g. "field/real/write@any_space_1"
const std::string STR(const ArgumentDescriptor&);

class KernelContract {
private:
  std::string name;
  std::vector<ArgumentDescriptor> args;
  OperatesOn operates_on;
  bool builtin;
  bool conversion; // cross-space conversion, e.g. an integer-to-real cast
  location loc;

public:
  // throws std::invalid_argument when `args` is empty
  KernelContract(const std::string& name, std::vector<ArgumentDescriptor> args,
                 OperatesOn on, bool builtin, bool conversion = false,
                 const location& l = location());

  const std::string& Name() const { return name; }
  const std::vector<ArgumentDescriptor>& Arguments() const { return args; }
  const ArgumentDescriptor& Argument(size_t i) const { return args.at(i); }
  size_t ArgCount() const { return args.size(); }
  OperatesOn GetOperatesOn() const { return operates_on; }
  bool IsBuiltIn() const { return builtin; }
  bool IsCrossSpaceConversion() const { return conversion; }
  const location& LOC() const { return loc; }

  // same name (case-insensitively) and same formal argument list
  bool SameSignature(const KernelContract&) const;

  void Print(std::ostream&) const;
};

// name(kind/type/access@space, ...)
const std::string STR(const KernelContract&);

// Assembles a KernelContract. Every property has to be given explicitly:
// Build() refuses a contract whose iteration space was never set.
class ContractBuilder {
private:
  std::string name;
  std::vector<ArgumentDescriptor> args;
  std::optional<OperatesOn> operates_on;
  bool builtin = false;
  bool conversion = false;
  location loc;

public:
  explicit ContractBuilder(const std::string& n) : name(n) {}

  ContractBuilder& On(OperatesOn on) {
    operates_on = on;
    return *this;
  }
  ContractBuilder& BuiltIn(bool b = true) {
    builtin = b;
    return *this;
  }
  ContractBuilder& CrossSpaceConversion(bool c = true) {
    conversion = c;
    return *this;
  }
  ContractBuilder& At(const location& l) {
    loc = l;
    return *this;
  }
  ContractBuilder& Arg(const ArgumentDescriptor& ad) {
    args.push_back(ad);
    return *this;
  }
  ContractBuilder& Field(DataType dt, Access a, const std::string& space) {
    return Arg(ArgumentDescriptor::Field(dt, a, space));
  }
  ContractBuilder& Scalar(DataType dt, Access a) {
    return Arg(ArgumentDescriptor::Scalar(dt, a));
  }
  ContractBuilder& Operator(DataType dt, Access a, const std::string& to,
                            const std::string& from) {
    return Arg(ArgumentDescriptor::Operator(dt, a, to, from));
  }

  // throws std::logic_error if the iteration space is unset, and
  // std::invalid_argument if no argument was added
  KernelContract Build() const;
};

} // end namespace Kernval

#endif // __KERNVAL_CONTRACT_HPP__
