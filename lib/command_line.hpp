#ifndef __KERNVAL_COMMAND_LINE_HPP__
#define __KERNVAL_COMMAND_LINE_HPP__

#include <string>

namespace Kernval {

class CommandLine {
private:
  int ret_code = 0;

public:
  // Parses the options into the compilation context and loads the source
  // lines of the input file. Returns false when the driver has to stop.
  bool Parse(int argc, char** argv);
  int ReturnCode() const { return ret_code; }
}; // CommandLine

} // end namespace Kernval

#endif // __KERNVAL_COMMAND_LINE_HPP__
