#include "contract.hpp"

#include <stdexcept>
#include <unordered_map>

using namespace Kernval;

namespace {

template <typename E>
std::optional<E> Lookup(const std::unordered_map<std::string, E>& table,
                        const std::string& word) {
  auto it = table.find(ToLower(word));
  if (it == table.end()) return std::nullopt;
  return it->second;
}

} // end anonymous namespace

std::optional<ArgKind> Kernval::ArgKindFromString(const std::string& s) {
  static const std::unordered_map<std::string, ArgKind> table = {
      {"field", ArgKind::FIELD},         {"gh_field", ArgKind::FIELD},
      {"scalar", ArgKind::SCALAR},       {"gh_scalar", ArgKind::SCALAR},
      {"operator", ArgKind::OPERATOR},   {"gh_operator", ArgKind::OPERATOR},
  };
  return Lookup(table, s);
}

std::optional<Access> Kernval::AccessFromString(const std::string& s) {
  static const std::unordered_map<std::string, Access> table = {
      {"read", Access::READ},           {"gh_read", Access::READ},
      {"write", Access::WRITE},         {"gh_write", Access::WRITE},
      {"readwrite", Access::READWRITE}, {"gh_readwrite", Access::READWRITE},
      {"inc", Access::INC},             {"gh_inc", Access::INC},
      {"sum", Access::SUM},             {"gh_sum", Access::SUM},
  };
  return Lookup(table, s);
}

std::optional<DataType> Kernval::DataTypeFromString(const std::string& s) {
  static const std::unordered_map<std::string, DataType> table = {
      {"real", DataType::REAL},       {"gh_real", DataType::REAL},
      {"integer", DataType::INTEGER}, {"gh_integer", DataType::INTEGER},
      {"logical", DataType::LOGICAL}, {"gh_logical", DataType::LOGICAL},
  };
  return Lookup(table, s);
}

std::optional<OperatesOn> Kernval::OperatesOnFromString(const std::string& s) {
  static const std::unordered_map<std::string, OperatesOn> table = {
      {"cell_column", OperatesOn::CELL_COLUMN},
      {"dof", OperatesOn::DOF},
      {"domain", OperatesOn::DOMAIN},
  };
  return Lookup(table, s);
}

const std::string Kernval::STR(const ArgumentDescriptor& ad) {
  std::ostringstream oss;
  oss << STR(ad.Kind()) << "/" << STR(ad.GetDataType()) << "/"
      << STR(ad.GetAccess());
  bool first = true;
  for (auto& s : ad.Spaces()) {
    oss << (first ? "@" : ",") << s.Name();
    first = false;
  }
  return oss.str();
}

KernelContract::KernelContract(const std::string& n,
                               std::vector<ArgumentDescriptor> a,
                               OperatesOn on, bool b, bool c,
                               const location& l)
    : name(n), args(std::move(a)), operates_on(on), builtin(b),
      conversion(c), loc(l) {
  if (args.empty())
    throw std::invalid_argument("kernel contract '" + name +
                                "' must declare at least one argument.");
}

bool KernelContract::SameSignature(const KernelContract& other) const {
  return ToLower(name) == ToLower(other.name) && args == other.args;
}

void KernelContract::Print(std::ostream& os) const {
  if (conversion) os << "conversion ";
  if (builtin) os << "builtin ";
  os << "kernel " << name << " operates_on " << STR(operates_on) << " {\n";
  for (auto& a : args) {
    os << "  " << STR(a.Kind()) << " " << STR(a.GetDataType()) << " "
       << STR(a.GetAccess());
    for (auto& s : a.Spaces()) os << " " << s.Name();
    os << ";\n";
  }
  os << "}\n";
}

const std::string Kernval::STR(const KernelContract& kc) {
  std::ostringstream oss;
  oss << kc.Name() << "(";
  for (size_t i = 0; i < kc.ArgCount(); ++i) {
    if (i) oss << ", ";
    oss << STR(kc.Argument(i));
  }
  oss << ")";
  return oss.str();
}

KernelContract ContractBuilder::Build() const {
  if (!operates_on)
    throw std::logic_error("kernel contract '" + name +
                           "' has no iteration space (operates_on).");
  return KernelContract(name, args, *operates_on, builtin, conversion, loc);
}
