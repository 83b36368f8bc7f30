// ConflictTests.cpp - duplicate members are collected and reported together

#include <catch2/catch_test_macros.hpp>

#include <Propel/Properties/Properties.hpp>

#include <string>

namespace ConflictDemo {
using namespace Propel::Properties;

struct DoubleSetter {
  double value{0.0};
  double getValue() const { return value; }
  void setValue(int v) { value = v; }
  void setValue(double v) { value = v; }
  friend void PropelReflect(Tag<DoubleSetter>, ClassBuilder<DoubleSetter> &b) {
    b.Method<&DoubleSetter::getValue>("getValue");
    b.Method<static_cast<void (DoubleSetter::*)(int)>(&DoubleSetter::setValue)>("setValue");
    b.Method<static_cast<void (DoubleSetter::*)(double)>(&DoubleSetter::setValue)>("setValue");
  }
};

// Under {"m_", ""} both fields map to "amount"; "rate" has two setters.
struct Messy {
  int m_amount{0};
  int amount{0};
  int getAmount() const { return amount; }
  double rate{0.0};
  void setRate(double v) { rate = v; }
  void setRate(std::string v) { rate = std::stod(v); }
  friend void PropelReflect(Tag<Messy>, ClassBuilder<Messy> &b) {
    b.Field<&Messy::m_amount>();
    b.Field<&Messy::amount>();
    b.Method<&Messy::getAmount>("getAmount");
    b.Method<static_cast<void (Messy::*)(double)>(&Messy::setRate)>("setRate");
    b.Method<static_cast<void (Messy::*)(std::string)>(&Messy::setRate)>("setRate");
  }
};

struct Clean {
  int getSize() const { return 1; }
  friend void PropelReflect(Tag<Clean>, ClassBuilder<Clean> &b) { b.Method<&Clean::getSize>("getSize"); }
};

// Problems in a supertype fail the build of every subtype.
struct TaintedImpl : Clean, DoubleSetter {
  friend void PropelReflect(Tag<TaintedImpl>, ClassBuilder<TaintedImpl> &b) {
    b.Superclass<Clean>();
    b.Interface<DoubleSetter>();
  }
};
} // namespace ConflictDemo

TEST_CASE("TwoConcreteSettersFailTheBuild", "[properties][Conflicts]") {
  using namespace Propel::Properties;
  using ConflictDemo::DoubleSetter;

  auto reg = RegistryBuilder{}.Build<DoubleSetter>();
  REQUIRE_FALSE(reg.has_value());
  const auto &err = reg.error();
  CHECK(err.code == ErrorCode::BuildFailed);
  CHECK(err.message.starts_with("Found property errors with class: ConflictDemo::DoubleSetter\n"));
  REQUIRE(err.problems.Size() == 1);
  CHECK(err.problems[0].property == "value");
  CHECK(err.problems[0].code == ErrorCode::DuplicateMember);
  CHECK(err.problems[0].message.starts_with("Multiple setters found: "));
}

TEST_CASE("ProblemsAreAggregatedAcrossProperties", "[properties][Conflicts]") {
  using namespace Propel::Properties;
  using ConflictDemo::Messy;

  auto reg = RegistryBuilder{}.WithFieldPrefixes({"m_", ""}).Build<Messy>();
  REQUIRE_FALSE(reg.has_value());
  const auto &err = reg.error();
  CHECK(err.code == ErrorCode::BuildFailed);
  REQUIRE(err.problems.Size() == 2);
  CHECK(err.problems[0].property == "amount");
  CHECK(err.problems[0].message == "Found multiple fields for name: amount");
  CHECK(err.problems[1].property == "rate");
  CHECK(err.problems[1].code == ErrorCode::DuplicateMember);
  CHECK(err.message.find("\t1)\tamount ->Found multiple fields for name: amount\n") != std::string::npos);
  CHECK(err.message.find("\t2)\trate ->") != std::string::npos);

  // Default conventions only see one field, the setter clash remains.
  auto defaults = RegistryBuilder{}.Build<Messy>();
  REQUIRE_FALSE(defaults.has_value());
  REQUIRE(defaults.error().problems.Size() == 1);
  CHECK(defaults.error().problems[0].property == "rate");
}

TEST_CASE("SupertypeProblemsFailTheSubtypeBuild", "[properties][Conflicts]") {
  using namespace Propel::Properties;
  using ConflictDemo::TaintedImpl;

  auto all = RegistryBuilder{}.BuildAll<TaintedImpl>();
  REQUIRE_FALSE(all.has_value());
  CHECK(all.error().message.starts_with("Found property errors with class: ConflictDemo::TaintedImpl\n"));
  REQUIRE(all.error().problems.Size() >= 1);
  CHECK(all.error().problems[0].property == "value");
}
