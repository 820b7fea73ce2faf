#ifndef __KERNVAL_REGISTRY_HPP__
#define __KERNVAL_REGISTRY_HPP__

// The contracts known to one compilation unit. It is filled while the metadata
// is extracted, then sealed once; from then on it is read-only and may be
// shared by any number of concurrent validators and binders.

#include <deque>
#include <string>
#include <unordered_map>
#include <vector>

#include "contract.hpp"
#include "diagnostics.hpp"

namespace Kernval {

class ContractRegistry {
private:
  // a deque keeps the addresses handed out by Candidates() stable
  std::deque<KernelContract> contracts;
  std::unordered_map<std::string, std::vector<size_t>> by_name; // lower-case
  Diagnostics diags; // duplicated declarations
  bool sealed = false;

public:
  ContractRegistry() {}
  ContractRegistry(const ContractRegistry&) = delete;
  ContractRegistry& operator=(const ContractRegistry&) = delete;

  // Returns false, and records a DuplicateContract diagnostic, when a contract
  // with the same name and argument list is already registered. Throws
  // std::logic_error once sealed.
  bool Register(const KernelContract&);

  void Seal() { sealed = true; }
  bool IsSealed() const { return sealed; }

  // Contracts named `name` (case-insensitive), in declaration order. Throws
  // std::logic_error if the registry is not sealed yet.
  const std::vector<const KernelContract*>
  Candidates(const std::string& name) const;

  const std::deque<KernelContract>& Contracts() const { return contracts; }
  size_t Size() const { return contracts.size(); }

  const Diagnostics& RegistrationDiagnostics() const { return diags; }
};

} // end namespace Kernval

#endif // __KERNVAL_REGISTRY_HPP__
