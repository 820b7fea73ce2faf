#include "kmd_reader.hpp"
#include "scanner.hpp"

using namespace Kernval;

bool Kernval::ReadDescription(std::istream& is, const std::string& filename,
                              ContractUnit& unit, std::ostream& es) {
  Scanner s(filename);
  PContext pctx(unit, es);
  Parser p(pctx, s);

  s.Reset(is, filename);
  return p.parse() == 0 && !pctx.HasError();
}
