#include "unit_validator.hpp"
#include <gtest/gtest.h>

using namespace Kernval;

using A = Access;
using DT = DataType;
using K = ArgKind;

class UnitValidatorTest : public ::testing::Test {
protected:
  ContractRegistry registry;
  std::vector<Invocation> invocations;

  static Invocation Call(const std::string& kernel,
                         std::vector<InvocationArgument> args, int line) {
    Invocation inv;
    inv.kernel = kernel;
    inv.args = std::move(args);
    inv.loc = location("alg.kmd", line, 10);
    return inv;
  }

  void SetUp() override {
    // 0: a valid built-in
    registry.Register(ContractBuilder("aX_plus_Y")
                          .On(OperatesOn::DOF)
                          .BuiltIn()
                          .Field(DT::REAL, A::WRITE, "any_space_1")
                          .Scalar(DT::REAL, A::READ)
                          .Field(DT::REAL, A::READ, "any_space_1")
                          .Build());
    // 1: a built-in with two writers
    registry.Register(ContractBuilder("bad_copy")
                          .On(OperatesOn::DOF)
                          .BuiltIn()
                          .Field(DT::REAL, A::WRITE, "any_space_1")
                          .Field(DT::REAL, A::WRITE, "any_space_1")
                          .Build());
    // 2: a user kernel with an illegal scalar access
    registry.Register(ContractBuilder("testkern_type")
                          .On(OperatesOn::CELL_COLUMN)
                          .Scalar(DT::REAL, A::INC)
                          .Field(DT::REAL, A::INC, "w1")
                          .Operator(DT::REAL, A::READ, "w0", "w0")
                          .Build());
    // 3: a valid user kernel
    registry.Register(ContractBuilder("testkern_w0")
                          .On(OperatesOn::CELL_COLUMN)
                          .Field(DT::REAL, A::INC, "w0")
                          .Field(DT::REAL, A::READ, "w0")
                          .Build());
    registry.Seal();

    invocations.push_back(Call("aX_plus_Y",
                               {InvocationArgument("f3"),
                                InvocationArgument("a", K::SCALAR, DT::REAL),
                                InvocationArgument("f1")},
                               3));
    invocations.push_back(Call(
        "bad_copy", {InvocationArgument("f1"), InvocationArgument("f2")}, 4));
    invocations.push_back(Call("testkern_type",
                               {InvocationArgument("a"), InvocationArgument("f1"),
                                InvocationArgument("m1")},
                               5));
    invocations.push_back(
        Call("testkern_w0", {InvocationArgument("f1")}, 6)); // arity
    invocations.push_back(
        Call("nokern", {InvocationArgument("f1")}, 7)); // undeclared
    invocations.push_back(Call(
        "TESTKERN_W0", {InvocationArgument("f1"), InvocationArgument("f2")}, 8));
  }

  static std::vector<std::string> Flatten(const UnitResult& res) {
    std::vector<std::string> out;
    for (auto& d : res.all) {
      std::ostringstream oss;
      oss << STR(d.kind) << "|" << d.subject << "|"
          << (d.arg_index ? std::to_string(*d.arg_index) : "-") << "|"
          << d.loc << "|" << STR(d);
      out.push_back(oss.str());
    }
    return out;
  }
};

TEST_F(UnitValidatorTest, RegistryMustBeSealed) {
  ContractRegistry open;
  EXPECT_THROW(UnitValidator v(open), std::logic_error);
}

TEST_F(UnitValidatorTest, ContractReports) {
  UnitValidator v(registry);
  auto reports = v.ValidateContracts();
  ASSERT_EQ(reports.size(), 4u);

  EXPECT_TRUE(reports[0].IsValid());
  EXPECT_EQ(reports[0].contract, &registry.Contracts()[0]);

  ASSERT_EQ(reports[1].diags.size(), 1u);
  EXPECT_EQ(reports[1].diags[0].kind, DiagKind::InvalidWriteCount);

  // user kernels only get the access rules: the operator is fine there
  ASSERT_EQ(reports[2].diags.size(), 1u);
  EXPECT_EQ(reports[2].diags[0].kind, DiagKind::IllegalAccessMode);
  EXPECT_EQ(reports[2].diags[0].arg_index, 0u);

  EXPECT_TRUE(reports[3].IsValid());
}

TEST_F(UnitValidatorTest, BindingsFollowInvocationOrder) {
  UnitValidator v(registry);
  auto res = v.Run(invocations);
  ASSERT_EQ(res.bindings.size(), invocations.size());

  EXPECT_TRUE(res.bindings[0].IsBound());
  EXPECT_EQ(&res.bindings[0].Contract(), &registry.Contracts()[0]);

  // bound to an invalid contract: rejected
  ASSERT_FALSE(res.bindings[1].IsBound());
  EXPECT_EQ(res.bindings[1].GetDiagnostics()[0].kind,
            DiagKind::InvalidContractBinding);
  EXPECT_EQ(res.bindings[1].GetDiagnostics()[0].loc.begin.line, 4);
  ASSERT_FALSE(res.bindings[2].IsBound());
  EXPECT_EQ(res.bindings[2].GetDiagnostics()[0].kind,
            DiagKind::InvalidContractBinding);

  ASSERT_FALSE(res.bindings[3].IsBound());
  EXPECT_EQ(res.bindings[3].GetDiagnostics()[0].kind, DiagKind::ArityMismatch);
  ASSERT_FALSE(res.bindings[4].IsBound());
  EXPECT_EQ(res.bindings[4].GetDiagnostics()[0].kind, DiagKind::UnknownKernel);
  EXPECT_TRUE(res.bindings[5].IsBound());
}

TEST_F(UnitValidatorTest, AllDiagnosticsInOrder) {
  UnitValidator v(registry);
  auto res = v.Run(invocations);

  std::vector<DiagKind> kinds;
  for (auto& d : res.all) kinds.push_back(d.kind);
  EXPECT_EQ(kinds, (std::vector<DiagKind>{
                       DiagKind::InvalidWriteCount,
                       DiagKind::IllegalAccessMode,
                       DiagKind::InvalidContractBinding,
                       DiagKind::InvalidContractBinding,
                       DiagKind::ArityMismatch,
                       DiagKind::UnknownKernel,
                   }));
  EXPECT_TRUE(res.HasErrors());
  EXPECT_EQ(res.ErrorCount(), 6u);
}

TEST_F(UnitValidatorTest, UnboundKernelAsWarning) {
  ValidatorOptions vo;
  vo.warn_unbound_kernel = true;
  auto res = UnitValidator(registry, vo).Run(invocations);
  auto& d = res.bindings[4].GetDiagnostics()[0];
  EXPECT_EQ(d.kind, DiagKind::UnknownKernel);
  EXPECT_EQ(d.severity, Severity::Warning);
  EXPECT_EQ(res.ErrorCount(), 5u);
}

TEST_F(UnitValidatorTest, DuplicatesComeFirst) {
  ContractRegistry r;
  auto kc = ContractBuilder("setval_c")
                .On(OperatesOn::DOF)
                .BuiltIn()
                .Field(DT::REAL, A::WRITE, "any_space_1")
                .Scalar(DT::REAL, A::READ)
                .Build();
  r.Register(kc);
  r.Register(kc);
  r.Seal();
  auto res = UnitValidator(r).Run({});
  ASSERT_EQ(res.all.size(), 1u);
  EXPECT_EQ(res.all[0].kind, DiagKind::DuplicateContract);
}

TEST_F(UnitValidatorTest, ParallelEqualsSequential) {
  // enough invocations for every worker to get several
  std::vector<Invocation> many;
  for (int round = 0; round < 25; ++round)
    for (auto& inv : invocations) many.push_back(inv);

  auto sequential = UnitValidator(registry).Run(many);
  for (size_t jobs : {2u, 3u, 8u, 64u}) {
    ValidatorOptions vo;
    vo.jobs = jobs;
    auto parallel = UnitValidator(registry, vo).Run(many);
    EXPECT_EQ(Flatten(parallel), Flatten(sequential)) << jobs << " jobs";
    ASSERT_EQ(parallel.bindings.size(), sequential.bindings.size());
    for (size_t i = 0; i < many.size(); ++i)
      EXPECT_EQ(parallel.bindings[i].IsBound(),
                sequential.bindings[i].IsBound());
  }
}

TEST_F(UnitValidatorTest, ZeroJobsRunsSequentially) {
  ValidatorOptions vo;
  vo.jobs = 0;
  auto res = UnitValidator(registry, vo).Run(invocations);
  EXPECT_EQ(res.bindings.size(), invocations.size());
}
