#include "registry.hpp"

#include <stdexcept>

using namespace Kernval;

bool ContractRegistry::Register(const KernelContract& kc) {
  if (sealed)
    throw std::logic_error("can not register kernel '" + kc.Name() +
                           "': the contract registry is sealed.");

  auto key = ToLower(kc.Name());
  auto& slots = by_name[key];
  for (auto idx : slots)
    if (contracts[idx].SameSignature(kc)) {
      diags.push_back(Diag::DuplicateContract(kc));
      return false;
    }

  slots.push_back(contracts.size());
  contracts.push_back(kc);
  return true;
}

const std::vector<const KernelContract*>
ContractRegistry::Candidates(const std::string& name) const {
  if (!sealed)
    throw std::logic_error("looking up kernel '" + name +
                           "' before the contract registry is sealed.");

  std::vector<const KernelContract*> res;
  auto it = by_name.find(ToLower(name));
  if (it == by_name.end()) return res;
  for (auto idx : it->second) res.push_back(&contracts[idx]);
  return res;
}
