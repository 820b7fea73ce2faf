#include "pipeline.hpp"
#include "context.hpp"
#include "io.hpp"

using namespace Kernval;

std::once_flag ValidationPipeline::init_flag;
std::unique_ptr<ValidationPipeline> ValidationPipeline::instance;

void ValidationPipeline::Dump() const {
  dbgs() << "++ Pipeline Stages\n";
  for (auto& ps : pl)
    if ((ps.pred && ps.pred()) || !ps.pred) dbgs() << " |-" << ps.name << "\n";

  dbgs() << "++ END Pipeline\n";
}

bool ValidationPipeline::Run(std::istream& is, const std::string& file) {
  input = &is;
  filename = file;

  if (CCtx().Verbose()) Dump();

  for (auto& ps : pl) {
    if (ps.pred && !ps.pred()) continue;
    if (CCtx().Verbose()) dbgs() << "|- " << ps.name << "\n";
    if (!ps.run(*this)) {
      if (state == 0) state = 1;
      return false; // abend immediately
    }
    if (abend) break;
  }
  return state == 0;
}

bool ValidationPipeline::ReadInput() {
  if (!ReadDescription(*input, filename, unit, errs())) {
    errs() << "Parsing failed due to syntax errors." << std::endl;
    return false;
  }
  if (CCtx().Verbose())
    dbgs() << "   " << unit.contracts.size() << " contract(s), "
           << unit.invocations.size() << " invocation(s)\n";
  return true;
}

bool ValidationPipeline::RegisterContracts() {
  // a duplicate is kept as a registration diagnostic and reported later
  for (auto& kc : unit.contracts) registry.Register(kc);
  registry.Seal();
  return true;
}

bool ValidationPipeline::DumpContracts() {
  for (auto& kc : registry.Contracts()) kc.Print(outs());
  SetAbend();
  return true;
}

bool ValidationPipeline::Validate() {
  ValidatorOptions vo;
  vo.check = CCtx().GetCheckOptions();
  vo.jobs = CCtx().Jobs();
  vo.warn_unbound_kernel = CCtx().WarnUnboundKernel();

  result = UnitValidator(registry, vo).Run(unit.invocations);
  return true;
}

bool ValidationPipeline::ReportResult() {
  reporter.Report(result.all);

  if (CCtx().PrintBindings())
    for (auto& br : result.bindings)
      if (br.IsBound()) br.Print(outs());

  reporter.Summary();
  state = reporter.HasError() ? 1 : 0;
  return true;
}

ValidationPipeline& ValidationPipeline::PlanRoutine() {
  AddStage("read contract description",
           [](ValidationPipeline& p) { return p.ReadInput(); });
  AddStage("register contracts",
           [](ValidationPipeline& p) { return p.RegisterContracts(); });
  AddStageIf(
      "dump contracts", []() { return CCtx().DumpContracts(); },
      [](ValidationPipeline& p) { return p.DumpContracts(); });
  AddStage("validate contracts and bind invocations",
           [](ValidationPipeline& p) { return p.Validate(); });
  AddStage("report", [](ValidationPipeline& p) { return p.ReportResult(); });
  return *this;
}

ValidationPipeline& ValidationPipeline::Get() {
  std::call_once(init_flag, []() {
    instance = std::make_unique<ValidationPipeline>(outs());
  });
  return *instance;
}
