// FieldAccessTests.cpp - properties formed from fields, getters and setters

#include <catch2/catch_test_macros.hpp>

#include <Propel/Properties/Properties.hpp>

#include <optional>
#include <string>

namespace FieldDemo {
using namespace Propel::Properties;

class Counter {
public:
  Counter() = default;
  explicit Counter(int start) : count(start) {}

  int getCount() const { return count; }
  void setCount(int v) { count = v; }

private:
  int count{0};

  friend void PropelReflect(Tag<Counter>, ClassBuilder<Counter> &b) {
    b.Field<&Counter::count>();
    b.Method<&Counter::getCount>("getCount");
    b.Method<&Counter::setCount>("setCount");
  }
};

struct Gauge {
  double level{0.5};
  double getLevel() const { return level; }
  friend void PropelReflect(Tag<Gauge>, ClassBuilder<Gauge> &b) {
    b.Field<&Gauge::level>();
    b.Method<&Gauge::getLevel>("getLevel");
  }
};

struct Sink {
  std::string last{};
  void setMessage(std::string v) { last = std::move(v); }
  friend void PropelReflect(Tag<Sink>, ClassBuilder<Sink> &b) { b.Method<&Sink::setMessage>("setMessage"); }
};

// A field on its own names nothing.
struct Bare {
  int hidden{1};
  bool isEnabled() const { return enabled; }
  void setEnabled(bool v) { enabled = v; }
  bool enabled{true};
  friend void PropelReflect(Tag<Bare>, ClassBuilder<Bare> &b) {
    b.Field<&Bare::hidden>();
    b.Method<&Bare::isEnabled>("isEnabled");
    b.Method<&Bare::setEnabled>("setEnabled");
  }
};

struct Profile {
  std::optional<std::string> nick{};
  std::optional<std::string> getNick() const { return nick; }
  void setNick(std::string v) { nick = std::move(v); }
  friend void PropelReflect(Tag<Profile>, ClassBuilder<Profile> &b) {
    b.Method<&Profile::getNick>("getNick");
    b.Method<&Profile::setNick>("setNick");
  }
};

// Optional on the setter side and on a numeric getter.
struct Member {
  std::optional<std::string> alias{};
  std::optional<int> age{};
  std::optional<std::string> getAlias() const { return alias; }
  void setAlias(std::optional<std::string> v) { alias = std::move(v); }
  std::optional<int> getAge() const { return age; }
  void setAge(std::optional<int> v) { age = v; }
  friend void PropelReflect(Tag<Member>, ClassBuilder<Member> &b) {
    b.Method<&Member::getAlias>("getAlias");
    b.Method<&Member::setAlias>("setAlias");
    b.Method<&Member::getAge>("getAge");
    b.Method<&Member::setAge>("setAge");
  }
};
} // namespace FieldDemo

TEST_CASE("FieldGetterSetterYieldOneReadWriteProperty", "[properties][Fields]") {
  using namespace Propel::Properties;
  using FieldDemo::Counter;

  auto registry = RegistryBuilder{}.Build<Counter>();
  REQUIRE(registry.has_value());
  const auto &reg = **registry;
  CHECK(reg.AllNames() == NameSet{"count"});
  CHECK(reg.LocalNames() == NameSet{"count"});

  auto d = reg.Get("count").value();
  CHECK(d->Name() == std::string_view{"count"});
  CHECK(d->BaseClass() == GetClass<Counter>());
  CHECK(d->Kind() == DescriptorKind::Int);
  CHECK(d->FieldRef().has_value());
  CHECK(d->GetterRef().has_value());
  CHECK(d->SetterRef().has_value());
  CHECK_FALSE(d->AccessorRef().has_value());
  CHECK(d->IsReadable());
  CHECK(d->IsWritable());
  CHECK(d->Mutability().ToString() == "[Read, Write]");

  Counter c{3};
  CHECK(d->GetValue(ObjectRef::Of(c)).value()->Cast<int>() == 3);
  REQUIRE(d->SetValue(ObjectRef::Of(c), Any{5}).has_value());
  CHECK(c.getCount() == 5);
  CHECK(d->GetValue(ObjectRef::Of(c)).value()->Cast<int>() == 5);

  auto count = reg.GetIntProperty("count").value();
  CHECK(count.Set(c, 11).has_value());
  CHECK(count.Get(c).value() == 11);
}

TEST_CASE("DescribeNamesBaseClassAndMutability", "[properties][Fields]") {
  using namespace Propel::Properties;

  auto d = RegistryBuilder{}.Build<FieldDemo::Counter>().value()->Get("count").value();
  const auto text = d->Describe();
  CHECK(text.starts_with("Property@FieldDemo::Counter{count: "));
  CHECK(text.ends_with(", [Read, Write]}"));
}

TEST_CASE("GetterOnlyPropertyRejectsWrites", "[properties][Fields]") {
  using namespace Propel::Properties;
  using FieldDemo::Gauge;

  auto d = RegistryBuilder{}.Build<Gauge>().value()->Get("level").value();
  CHECK(d->Kind() == DescriptorKind::Double);
  CHECK(d->Mutability().ToString() == "[Read]");

  Gauge g{};
  CHECK(d->GetDouble(ObjectRef::Of(g)).value() == 0.5);

  auto write = d->SetValue(ObjectRef::Of(g), Any{1.0});
  REQUIRE_FALSE(write.has_value());
  CHECK(write.error().code == ErrorCode::ReadOnlyViolation);
  CHECK(write.error().message == "Property level on FieldDemo::Gauge is read-only, no setter.");

  auto typed = d->SetDouble(ObjectRef::Of(g), 1.0);
  REQUIRE_FALSE(typed.has_value());
  CHECK(typed.error().code == ErrorCode::ReadOnlyViolation);
  CHECK(g.level == 0.5);
}

TEST_CASE("SetterOnlyPropertyRejectsReads", "[properties][Fields]") {
  using namespace Propel::Properties;
  using FieldDemo::Sink;

  auto d = RegistryBuilder{}.Build<Sink>().value()->Get("message").value();
  CHECK(d->Kind() == DescriptorKind::Object);
  CHECK(d->Mutability().ToString() == "[Write]");
  CHECK(d->ValueType().id == TokenOf<std::string>().id);

  Sink s{};
  REQUIRE(d->SetValue(ObjectRef::Of(s), Any{std::string{"hello"}}).has_value());
  CHECK(s.last == "hello");

  auto read = d->GetValue(ObjectRef::Of(s));
  REQUIRE_FALSE(read.has_value());
  CHECK(read.error().code == ErrorCode::WriteOnlyViolation);
  CHECK(read.error().message == "Property message on FieldDemo::Sink is write-only, no getter.");
}

TEST_CASE("FieldWithoutAccessorsProducesNoProperty", "[properties][Fields]") {
  using namespace Propel::Properties;
  using FieldDemo::Bare;

  auto reg = RegistryBuilder{}.Build<Bare>().value();
  CHECK(reg->AllNames() == NameSet{"enabled"});
  CHECK(reg->Find("hidden") == nullptr);

  auto missing = reg->Get("hidden");
  REQUIRE_FALSE(missing.has_value());
  CHECK(missing.error().code == ErrorCode::PropertyNotFound);
  CHECK(missing.error().message == "Property hidden does not exist on type FieldDemo::Bare");

  auto enabled = reg->Get("enabled").value();
  CHECK(enabled->Kind() == DescriptorKind::Object);
  Bare b{};
  REQUIRE(enabled->SetValue(ObjectRef::Of(b), Any{false}).has_value());
  CHECK_FALSE(b.enabled);
  CHECK(enabled->GetValue(ObjectRef::Of(b)).value()->Cast<bool>() == false);
}

TEST_CASE("OptionalGetterUnwrapsToValueType", "[properties][Fields]") {
  using namespace Propel::Properties;
  using FieldDemo::Profile;

  auto reg = RegistryBuilder{}.Build<Profile>().value();
  auto d = reg->Get("nick").value();
  CHECK(d->ValueType().id == TokenOf<std::string>().id);
  CHECK(d->Kind() == DescriptorKind::Object);

  Profile p{};
  auto empty = d->GetValue(ObjectRef::Of(p));
  REQUIRE(empty.has_value());
  CHECK_FALSE(empty->has_value());

  auto typed = reg->GetProperty<std::string>("nick").value();
  REQUIRE(typed.Set(p, "ace").has_value());
  CHECK(typed.Get(p).value() == std::optional<std::string>{"ace"});
}

TEST_CASE("OptionalSetterAcceptsPayloadValues", "[properties][Fields]") {
  using namespace Propel::Properties;
  using FieldDemo::Member;

  auto reg = RegistryBuilder{}.Build<Member>().value();
  auto alias = reg->GetProperty<std::string>("alias").value();
  Member m{};

  REQUIRE(alias.Set(m, "ghost").has_value());
  CHECK(m.alias == std::optional<std::string>{"ghost"});
  CHECK(alias.Get(m).value() == std::optional<std::string>{"ghost"});

  REQUIRE(reg->Get("alias").value()->SetValue(ObjectRef::Of(m), Any{std::string{"shade"}}).has_value());
  CHECK(m.alias == std::optional<std::string>{"shade"});

  auto wrong = alias.Descriptor().SetValue(ObjectRef::Of(m), Any{3});
  REQUIRE_FALSE(wrong.has_value());
  CHECK(wrong.error().code == ErrorCode::TypeMismatch);
}

TEST_CASE("EmptyOptionalNumericGetterReadsAsNoValue", "[properties][Fields]") {
  using namespace Propel::Properties;
  using FieldDemo::Member;

  auto reg = RegistryBuilder{}.Build<Member>().value();
  auto d = reg->Get("age").value();
  CHECK(d->Kind() == DescriptorKind::Int);

  Member m{};
  auto empty = d->GetValue(ObjectRef::Of(m));
  REQUIRE(empty.has_value());
  CHECK_FALSE(empty->has_value());

  // The unboxed read has no way to say "nothing".
  auto typed = d->GetInt(ObjectRef::Of(m));
  REQUIRE_FALSE(typed.has_value());
  CHECK(typed.error().code == ErrorCode::TypeMismatch);

  auto age = reg->GetIntProperty("age").value();
  REQUIRE(age.Set(m, 41).has_value());
  CHECK(m.age == std::optional<int>{41});
  CHECK(age.Get(m).value() == 41);
  CHECK(d->GetValue(ObjectRef::Of(m)).value()->Cast<int>() == 41);
}
