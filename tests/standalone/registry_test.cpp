#include "registry.hpp"
#include <gtest/gtest.h>

using namespace Kernval;

using A = Access;
using DT = DataType;

TEST(ContractModel, EmptyArgumentListIsRejected) {
  EXPECT_THROW(KernelContract("k", {}, OperatesOn::DOF, true),
               std::invalid_argument);
  EXPECT_THROW(ContractBuilder("k").On(OperatesOn::DOF).Build(),
               std::invalid_argument);
}

TEST(ContractModel, IterationSpaceMustBeGiven) {
  EXPECT_THROW(ContractBuilder("k").Scalar(DT::REAL, A::SUM).Build(),
               std::logic_error);
}

TEST(ContractModel, BuilderKeepsEverything) {
  location l("mod.kmd", 4, 9);
  auto kc = ContractBuilder("int_X")
                .On(OperatesOn::DOF)
                .BuiltIn()
                .CrossSpaceConversion()
                .At(l)
                .Field(DT::INTEGER, A::WRITE, "Any_Space_1")
                .Field(DT::REAL, A::READ, "any_space_2")
                .Build();
  EXPECT_EQ(kc.Name(), "int_X");
  EXPECT_EQ(kc.ArgCount(), 2u);
  EXPECT_TRUE(kc.IsBuiltIn());
  EXPECT_TRUE(kc.IsCrossSpaceConversion());
  EXPECT_EQ(kc.GetOperatesOn(), OperatesOn::DOF);
  EXPECT_EQ(kc.LOC(), l);
  EXPECT_EQ(kc.Argument(0).FunctionSpace()->Name(), "any_space_1");
  EXPECT_TRUE(kc.Argument(0).FunctionSpace()->IsPlaceholder());
  EXPECT_EQ(STR(kc), "int_X(field/integer/write@any_space_1, "
                     "field/real/read@any_space_2)");
  EXPECT_THROW(kc.Argument(2), std::out_of_range);
}

TEST(ContractModel, PlaceholdersAreNotWildcards) {
  EXPECT_NE(SpaceRef("any_space_1"), SpaceRef("any_space_2"));
  EXPECT_EQ(SpaceRef("W3"), SpaceRef("w3"));
  EXPECT_FALSE(SpaceRef("w3").IsPlaceholder());
}

TEST(ContractModel, KeywordSpellings) {
  EXPECT_EQ(AccessFromString("GH_INC"), Access::INC);
  EXPECT_EQ(AccessFromString("readwrite"), Access::READWRITE);
  EXPECT_EQ(ArgKindFromString("gh_operator"), ArgKind::OPERATOR);
  EXPECT_EQ(DataTypeFromString("Integer"), DataType::INTEGER);
  EXPECT_EQ(OperatesOnFromString("cell_column"), OperatesOn::CELL_COLUMN);
  EXPECT_FALSE(AccessFromString("gh_min").has_value());
  EXPECT_FALSE(ArgKindFromString("columnwise_operator").has_value());
}

TEST(ContractModel, PrintInDescriptionForm) {
  auto kc = ContractBuilder("X_innerproduct_Y")
                .On(OperatesOn::DOF)
                .BuiltIn()
                .Scalar(DT::REAL, A::SUM)
                .Field(DT::REAL, A::READ, "any_space_1")
                .Build();
  std::ostringstream oss;
  kc.Print(oss);
  EXPECT_EQ(oss.str(), "builtin kernel X_innerproduct_Y operates_on dof {\n"
                       "  scalar real sum;\n"
                       "  field real read any_space_1;\n"
                       "}\n");
}

class RegistryTest : public ::testing::Test {
protected:
  ContractRegistry registry;

  KernelContract setval = ContractBuilder("setval_c")
                              .On(OperatesOn::DOF)
                              .BuiltIn()
                              .Field(DT::REAL, A::WRITE, "any_space_1")
                              .Scalar(DT::REAL, A::READ)
                              .Build();
  KernelContract setval_int = ContractBuilder("setval_c")
                                  .On(OperatesOn::DOF)
                                  .BuiltIn()
                                  .Field(DT::INTEGER, A::WRITE, "any_space_1")
                                  .Scalar(DT::INTEGER, A::READ)
                                  .Build();
  KernelContract testkern = ContractBuilder("testkern_type")
                                .On(OperatesOn::CELL_COLUMN)
                                .Field(DT::REAL, A::INC, "w1")
                                .Build();
};

TEST_F(RegistryTest, CandidatesInDeclarationOrder) {
  EXPECT_TRUE(registry.Register(setval));
  EXPECT_TRUE(registry.Register(testkern));
  EXPECT_TRUE(registry.Register(setval_int));
  registry.Seal();

  auto cands = registry.Candidates("SETVAL_C");
  ASSERT_EQ(cands.size(), 2u);
  EXPECT_EQ(cands[0]->Argument(0).GetDataType(), DT::REAL);
  EXPECT_EQ(cands[1]->Argument(0).GetDataType(), DT::INTEGER);
  EXPECT_EQ(registry.Size(), 3u);
  EXPECT_EQ(registry.Contracts()[1].Name(), "testkern_type");
  EXPECT_TRUE(registry.Candidates("nokern").empty());
}

TEST_F(RegistryTest, NonAsciiNames) {
  auto kc = ContractBuilder("noyau_\xc3\xa9l\xc3\xa9ment")
                .On(OperatesOn::CELL_COLUMN)
                .Field(DT::REAL, A::INC, "w1")
                .Build();
  EXPECT_TRUE(registry.Register(kc));
  registry.Seal();
  EXPECT_EQ(registry.Candidates("NOYAU_\xc3\xa9l\xc3\xa9ment").size(), 1u);
  EXPECT_TRUE(registry.Candidates("noyau_element").empty());
}

TEST_F(RegistryTest, DuplicateIsRecorded) {
  EXPECT_TRUE(registry.Register(setval));
  EXPECT_FALSE(registry.Register(setval));
  EXPECT_EQ(registry.Size(), 1u);

  auto& diags = registry.RegistrationDiagnostics();
  ASSERT_EQ(diags.size(), 1u);
  EXPECT_EQ(diags[0].kind, DiagKind::DuplicateContract);
  EXPECT_EQ(diags[0].subject, "setval_c");
}

TEST_F(RegistryTest, SealIsTheInitializationBarrier) {
  EXPECT_THROW(registry.Candidates("setval_c"), std::logic_error);
  registry.Register(setval);
  registry.Seal();
  EXPECT_TRUE(registry.IsSealed());
  EXPECT_THROW(registry.Register(testkern), std::logic_error);
  EXPECT_EQ(registry.Candidates("setval_c").size(), 1u);
}

TEST_F(RegistryTest, CandidateAddressesAreStable) {
  registry.Register(setval);
  for (int i = 0; i < 100; ++i) {
    auto kc = ContractBuilder("k" + std::to_string(i))
                  .On(OperatesOn::CELL_COLUMN)
                  .Field(DT::REAL, A::INC, "w1")
                  .Build();
    registry.Register(kc);
  }
  registry.Seal();
  auto* first = registry.Candidates("setval_c").front();
  EXPECT_EQ(first, &registry.Contracts().front());
  EXPECT_TRUE(first->SameSignature(setval));
}
