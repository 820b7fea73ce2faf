#include "binder.hpp"
#include <gtest/gtest.h>

using namespace Kernval;

using A = Access;
using DT = DataType;
using K = ArgKind;

class BinderTest : public ::testing::Test {
protected:
  // testkern(scalar real, field real, field real)
  KernelContract three = ContractBuilder("testkern")
                             .On(OperatesOn::CELL_COLUMN)
                             .Scalar(DT::REAL, A::READ)
                             .Field(DT::REAL, A::INC, "w1")
                             .Field(DT::REAL, A::READ, "w2")
                             .Build();
  // testkern(field real, field real)
  KernelContract two = ContractBuilder("testkern")
                           .On(OperatesOn::CELL_COLUMN)
                           .Field(DT::REAL, A::INC, "w1")
                           .Field(DT::REAL, A::READ, "w2")
                           .Build();
  // testkern(field integer, field integer)
  KernelContract two_int = ContractBuilder("testkern")
                               .On(OperatesOn::CELL_COLUMN)
                               .Field(DT::INTEGER, A::INC, "w1")
                               .Field(DT::INTEGER, A::READ, "w2")
                               .Build();

  static Invocation Call(const std::string& kernel,
                         std::vector<InvocationArgument> args) {
    Invocation inv;
    inv.kernel = kernel;
    inv.args = std::move(args);
    inv.loc = location("alg.kmd", 7, 3);
    return inv;
  }
};

TEST_F(BinderTest, ArityFilterPicksTheOnlyFit) {
  auto inv = Call("testkern", {InvocationArgument("a"), InvocationArgument("f1"),
                               InvocationArgument("f2")});
  auto br = Bind(inv, {&two, &three});
  ASSERT_TRUE(br.IsBound());
  EXPECT_EQ(&br.Contract(), &three);
  EXPECT_TRUE(br.GetDiagnostics().empty());

  ASSERT_EQ(br.Mapping().size(), 3u);
  EXPECT_EQ(br.Mapping()[0].actual.handle, "a");
  EXPECT_EQ(br.Mapping()[0].formal.Kind(), K::SCALAR);
  EXPECT_EQ(br.Mapping()[2].actual.handle, "f2");
  EXPECT_EQ(br.Mapping()[2].formal, three.Argument(2));
}

TEST_F(BinderTest, ArityMismatch) {
  auto inv = Call("testkern", {InvocationArgument("f1")});
  auto br = Bind(inv, {&three, &two});
  ASSERT_FALSE(br.IsBound());
  ASSERT_EQ(br.GetDiagnostics().size(), 1u);

  auto& d = br.GetDiagnostics()[0];
  EXPECT_EQ(d.kind, DiagKind::ArityMismatch);
  EXPECT_EQ(d.subject, "testkern");
  EXPECT_EQ(d.actual_count, 1u);
  EXPECT_EQ(d.loc, inv.loc);
  EXPECT_NE(d.message.find("3 or 2"), std::string::npos);
  EXPECT_THROW(br.Contract(), std::logic_error);
}

TEST_F(BinderTest, AmbiguousInvocationListsBothCandidates) {
  auto inv = Call("testkern", {InvocationArgument("f1"), InvocationArgument("f2")});
  auto br = Bind(inv, {&two, &two_int});
  ASSERT_FALSE(br.IsBound());
  ASSERT_EQ(br.GetDiagnostics().size(), 1u);

  auto& d = br.GetDiagnostics()[0];
  EXPECT_EQ(d.kind, DiagKind::AmbiguousInvocation);
  EXPECT_EQ(d.candidates, (std::vector<std::string>{"testkern", "testkern"}));
  EXPECT_NE(d.message.find(STR(two)), std::string::npos);
  EXPECT_NE(d.message.find(STR(two_int)), std::string::npos);
}

TEST_F(BinderTest, AnnotationResolvesTheOverload) {
  auto inv = Call("testkern", {InvocationArgument("f1", K::FIELD, DT::INTEGER),
                               InvocationArgument("f2")});
  auto br = Bind(inv, {&two, &two_int});
  ASSERT_TRUE(br.IsBound());
  EXPECT_EQ(&br.Contract(), &two_int);
}

TEST_F(BinderTest, UnknownKindMatchesAnything) {
  auto inv = Call("testkern", {InvocationArgument("a"),
                               InvocationArgument("f1", std::nullopt, DT::REAL),
                               InvocationArgument("f2", K::FIELD)});
  auto br = Bind(inv, {&three});
  EXPECT_TRUE(br.IsBound());
}

TEST_F(BinderTest, TypeMismatchPerArgument) {
  auto inv = Call("testkern", {InvocationArgument("a", K::FIELD),
                               InvocationArgument("f1"),
                               InvocationArgument("f2", K::SCALAR, DT::REAL)});
  auto br = Bind(inv, {&three});
  ASSERT_FALSE(br.IsBound());
  auto& diags = br.GetDiagnostics();
  ASSERT_EQ(diags.size(), 2u);
  EXPECT_EQ(diags[0].kind, DiagKind::TypeMismatch);
  EXPECT_EQ(diags[0].arg_index, 0u);
  EXPECT_EQ(diags[0].expected, "real scalar");
  EXPECT_EQ(diags[0].actual, "field");
  EXPECT_EQ(diags[1].arg_index, 2u);
  EXPECT_EQ(diags[1].expected, "real field");
  EXPECT_EQ(diags[1].actual, "real scalar");
}

TEST_F(BinderTest, MismatchesAreMergedAcrossCandidates) {
  // both overloads reject the first argument; only the integer one the second
  auto inv = Call("testkern", {InvocationArgument("s", K::SCALAR),
                               InvocationArgument("f2", K::FIELD, DT::REAL)});
  auto br = Bind(inv, {&two, &two_int});
  ASSERT_FALSE(br.IsBound());
  auto& diags = br.GetDiagnostics();
  ASSERT_EQ(diags.size(), 2u);
  EXPECT_EQ(diags[0].arg_index, 0u);
  EXPECT_EQ(diags[0].expected, "real field"); // first seen wins
  EXPECT_EQ(diags[1].arg_index, 1u);
  EXPECT_EQ(diags[1].expected, "integer field");
}

TEST_F(BinderTest, UnknownKernel) {
  auto inv = Call("nokern", {InvocationArgument("f1")});
  auto br = Bind(inv, {});
  ASSERT_FALSE(br.IsBound());
  ASSERT_EQ(br.GetDiagnostics().size(), 1u);
  EXPECT_EQ(br.GetDiagnostics()[0].kind, DiagKind::UnknownKernel);
  EXPECT_EQ(br.GetDiagnostics()[0].subject, "nokern");
}

TEST_F(BinderTest, BindingIsRepeatable) {
  auto inv = Call("testkern", {InvocationArgument("f1"), InvocationArgument("f2")});
  for (int i = 0; i < 3; ++i) {
    auto br = Bind(inv, {&three, &two});
    ASSERT_TRUE(br.IsBound());
    EXPECT_EQ(&br.Contract(), &two);
  }
}

TEST_F(BinderTest, PrintBoundMapping) {
  auto inv = Call("testkern", {InvocationArgument("f1", K::FIELD),
                               InvocationArgument("f2")});
  auto br = Bind(inv, {&two});
  std::ostringstream oss;
  br.Print(oss);
  EXPECT_EQ(oss.str(), "bound to testkern(field/real/inc@w1, field/real/read@w2)\n"
                       "  [0] field/real/inc@w1 <- f1 : field\n"
                       "  [1] field/real/read@w2 <- f2\n");
}
