#include "command_line.hpp"
#include "context.hpp"
#include "io.hpp"
#include "options.hpp"
#include "pipeline.hpp"
#include <sstream>

using namespace Kernval;

int main(int argc, char* argv[]) {
  CommandLine cl;
  if (!cl.Parse(argc, argv)) return cl.ReturnCode();

  auto& r = OptionRegistry::GetInstance();

  std::string filename = r.StdinAsInput() ? "<stdin>" : r.GetInputFileName();
  if (CCtx().Verbose()) dbgs() << "<file: " << filename << ">\n";

  // standard input can be read only once: keep a copy for the diagnostics
  std::stringstream source;
  source << r.GetInputStream().rdbuf();
  source.clear(); // an empty input sets failbit
  if (r.StdinAsInput()) {
    std::istringstream lines(source.str());
    CCtx().ReadSourceLines(lines);
  }

  auto& pl = ValidationPipeline::Get().PlanRoutine();
  pl.Run(source, filename);
  return pl.Status();
}
