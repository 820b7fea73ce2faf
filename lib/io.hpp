#ifndef __KERNVAL_IO_HPP__
#define __KERNVAL_IO_HPP__

#include "options.hpp"

namespace Kernval {

// the report stream: stdout, or the file given by '-o'
inline std::ostream& outs() {
  return OptionRegistry::GetInstance().GetOutputStream();
}
inline std::ostream& dbgs() { return std::cout; }
inline std::ostream& errs() { return std::cerr; }

} // end namespace Kernval

#endif //__KERNVAL_IO_HPP__
