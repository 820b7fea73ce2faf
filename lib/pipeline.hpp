#ifndef __KERNVAL_PIPELINE_HPP__
#define __KERNVAL_PIPELINE_HPP__

#include "kmd_reader.hpp"
#include "registry.hpp"
#include "report.hpp"
#include "unit_validator.hpp"
#include <functional>
#include <memory>
#include <mutex>

namespace Kernval {

class ValidationPipeline;

struct PipelineStage {
  std::string name;
  std::function<bool(ValidationPipeline&)> run; // false: stop the pipeline
  std::function<bool()> pred = {};
  PipelineStage(const std::string& n, std::function<bool(ValidationPipeline&)> r,
                std::function<bool()> p = {})
      : name(n), run(r), pred(p) {}
};

// The stages a contract description goes through in the driver:
// read -> register -> [dump] -> validate -> report.
class ValidationPipeline {
private:
  std::vector<PipelineStage> pl;

  ContractUnit unit;
  ContractRegistry registry;
  UnitResult result;
  DiagnosticReporter reporter;

  std::istream* input = nullptr;
  std::string filename;

  bool abend = false;
  int state = 0; // no error

public:
  explicit ValidationPipeline(std::ostream& os) : reporter(os) {}

  void Append(PipelineStage&& ps) { pl.push_back(std::move(ps)); }

  void AddStage(const std::string& name,
                std::function<bool(ValidationPipeline&)> run) {
    Append({name, run});
  }

  void AddStageIf(const std::string& name, std::function<bool()> pred,
                  std::function<bool(ValidationPipeline&)> run) {
    Append({name, run, pred});
  }

  // stop after the current stage; the status is kept
  void SetAbend() { abend = true; }
  void SetStatus(int s) { state = s; }
  int Status() const { return state; }

  void Dump() const;

  bool Run(std::istream& is, const std::string& file);

  const ContractUnit& Unit() const { return unit; }
  const ContractRegistry& Registry() const { return registry; }
  const UnitResult& Result() const { return result; }
  DiagnosticReporter& Reporter() { return reporter; }

  ValidationPipeline& PlanRoutine();

private:
  // stages
  bool ReadInput();
  bool RegisterContracts();
  bool DumpContracts();
  bool Validate();
  bool ReportResult();

private:
  static std::once_flag init_flag;
  static std::unique_ptr<ValidationPipeline> instance;

public:
  // the pipeline of the driver, reporting to outs()
  static ValidationPipeline& Get();
}; // ValidationPipeline

} // end namespace Kernval

#endif // __KERNVAL_PIPELINE_HPP__
