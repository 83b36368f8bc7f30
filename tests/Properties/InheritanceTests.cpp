// InheritanceTests.cpp - properties merged across superclasses and interfaces

#include <catch2/catch_test_macros.hpp>

#include <Propel/Properties/Properties.hpp>

#include <cstdint>
#include <string>

namespace InheritDemo {
using namespace Propel::Properties;

struct FooSource {
  virtual ~FooSource() = default;
  virtual std::int64_t getFoo() const = 0;
  virtual void setFoo(std::int64_t v) = 0;
  friend void PropelReflect(Tag<FooSource>, ClassBuilder<FooSource> &b) {
    b.Method<&FooSource::getFoo>("getFoo", MemberFlags::Abstract);
    b.Method<&FooSource::setFoo>("setFoo", MemberFlags::Abstract);
  }
};

struct BarSource {
  virtual ~BarSource() = default;
  virtual Observable<std::string> &barProperty() = 0;
  friend void PropelReflect(Tag<BarSource>, ClassBuilder<BarSource> &b) {
    b.Method<&BarSource::barProperty>("barProperty", MemberFlags::Abstract);
  }
};

// BarSource sits at a non-zero offset, so every BarSource call needs an adjusted `this`.
struct FooBar : FooSource, BarSource {
  std::int64_t foo{0};
  SimpleObservable<std::string> bar{"bar"};
  std::int64_t getFoo() const override { return foo; }
  void setFoo(std::int64_t v) override { foo = v; }
  Observable<std::string> &barProperty() override { return bar; }
  friend void PropelReflect(Tag<FooBar>, ClassBuilder<FooBar> &b) {
    b.Interface<FooSource>();
    b.Interface<BarSource>();
    b.Method<&FooBar::getFoo>("getFoo");
    b.Method<&FooBar::setFoo>("setFoo");
    b.Method<&FooBar::barProperty>("barProperty");
  }
};

// Declares nothing of its own.
struct QuietFooBar : FooBar {
  friend void PropelReflect(Tag<QuietFooBar>, ClassBuilder<QuietFooBar> &b) { b.Superclass<FooBar>(); }
};

struct Identified {
  int id{7};
  int getId() const { return id; }
  void setId(int v) { id = v; }
  friend void PropelReflect(Tag<Identified>, ClassBuilder<Identified> &b) {
    b.Method<&Identified::getId>("getId");
    b.Method<&Identified::setId>("setId");
  }
};

struct Left : virtual Identified {
  std::string getLeft() const { return "left"; }
  friend void PropelReflect(Tag<Left>, ClassBuilder<Left> &b) {
    b.Superclass<Identified>();
    b.Method<&Left::getLeft>("getLeft");
  }
};

struct Right : virtual Identified {
  double getRight() const { return 2.5; }
  friend void PropelReflect(Tag<Right>, ClassBuilder<Right> &b) {
    b.Superclass<Identified>();
    b.Method<&Right::getRight>("getRight");
  }
};

// Identified is reachable through both Left and Right.
struct Diamond : Left, Right {
  friend void PropelReflect(Tag<Diamond>, ClassBuilder<Diamond> &b) {
    b.Superclass<Left>();
    b.Interface<Right>();
  }
};

struct HasName {
  virtual ~HasName() = default;
  virtual std::string getName() const = 0;
  friend void PropelReflect(Tag<HasName>, ClassBuilder<HasName> &b) {
    b.Method<&HasName::getName>("getName", MemberFlags::Abstract);
  }
};

struct AlsoHasName {
  virtual ~AlsoHasName() = default;
  virtual std::string getName() const = 0;
  friend void PropelReflect(Tag<AlsoHasName>, ClassBuilder<AlsoHasName> &b) {
    b.Method<&AlsoHasName::getName>("getName", MemberFlags::Abstract);
  }
};

// Two unrelated abstract declarations of the same getter.
struct BothNames : HasName, AlsoHasName {
  friend void PropelReflect(Tag<BothNames>, ClassBuilder<BothNames> &b) {
    b.Interface<HasName>();
    b.Interface<AlsoHasName>();
  }
};

struct Shadow : Identified {
  int extra{0};
  int getId() const { return id * 10; }
  friend void PropelReflect(Tag<Shadow>, ClassBuilder<Shadow> &b) {
    b.Superclass<Identified>();
    b.Method<&Shadow::getId>("getId");
  }
};

// Excluded by the default "std::" namespace prefix.
struct Errorish : std::exception {
  const char *getReason() const { return "why"; }
  friend void PropelReflect(Tag<Errorish>, ClassBuilder<Errorish> &b) {
    b.Superclass<std::exception>();
    b.Method<&Errorish::getReason>("getReason");
  }
};
} // namespace InheritDemo

TEST_CASE("InterfacesContributeProperties", "[properties][Inheritance]") {
  using namespace Propel::Properties;
  using namespace InheritDemo;

  auto all = RegistryBuilder{}.BuildAll<FooBar>();
  REQUIRE(all.has_value());
  CHECK(all->Contains(GetClass<FooSource>().GetTypeId()));
  CHECK(all->Contains(GetClass<BarSource>().GetTypeId()));

  auto fooSource = all->Find<FooSource>();
  REQUIRE(fooSource != nullptr);
  CHECK(fooSource->AllNames() == NameSet{"foo"});
  CHECK(fooSource->Get("foo").value()->GetterRef()->IsAbstract());

  auto reg = all->Find<FooBar>();
  REQUIRE(reg != nullptr);
  CHECK(reg->AllNames() == NameSet{"bar", "foo"});
  CHECK(reg->LocalNames() == NameSet{"bar", "foo"});

  auto foo = reg->Get("foo").value();
  CHECK(foo->Kind() == DescriptorKind::Long);
  CHECK(foo->Mutability().ToString() == "[Read, Write]");
  CHECK(foo->GetterRef()->DeclaringClass() == GetClass<FooBar>());
  CHECK_FALSE(foo->GetterRef()->IsAbstract());

  auto bar = reg->Get("bar").value();
  CHECK(bar->Kind() == DescriptorKind::Object);
  CHECK(bar->Mutability().ToString() == "[Read, Write]");
}

TEST_CASE("AbstractDescriptorsDispatchToOverride", "[properties][Inheritance]") {
  using namespace Propel::Properties;
  using namespace InheritDemo;

  auto all = RegistryBuilder{}.BuildAll<FooBar>().value();
  FooBar fb{};

  auto foo = all.Find<FooSource>()->GetLongProperty("foo").value();
  REQUIRE(foo.Set(fb, 12).has_value());
  CHECK(fb.foo == 12);
  CHECK(foo.Get(fb).value() == 12);

  auto bar = all.Find<BarSource>()->GetProperty<std::string>("bar").value();
  CHECK(bar.Get(fb).value() == std::optional<std::string>{"bar"});
  REQUIRE(bar.Set(fb, "baz").has_value());
  CHECK(fb.bar.GetValue() == "baz");
}

TEST_CASE("InheritedMethodsAreRescannedOnSubclass", "[properties][Inheritance]") {
  using namespace Propel::Properties;
  using namespace InheritDemo;

  auto all = RegistryBuilder{}.BuildAll<QuietFooBar>().value();
  auto quiet = all.Find<QuietFooBar>();
  REQUIRE(quiet != nullptr);
  CHECK(quiet->AllNames() == NameSet{"bar", "foo"});
  CHECK(quiet->LocalNames() == NameSet{"bar", "foo"});

  auto foo = quiet->Get("foo").value();
  CHECK(foo->BaseClass() == GetClass<QuietFooBar>());
  CHECK(foo->GetterRef()->DeclaringClass() == GetClass<FooBar>());
  CHECK(foo != all.Find<FooBar>()->Find("foo"));

  QuietFooBar q{};
  auto typed = quiet->GetLongProperty("foo").value();
  REQUIRE(typed.Set(q, 3).has_value());
  CHECK(q.getFoo() == 3);
}

TEST_CASE("DiamondReachesSharedBaseOnce", "[properties][Inheritance]") {
  using namespace Propel::Properties;
  using namespace InheritDemo;

  auto all = RegistryBuilder{}.BuildAll<Diamond>();
  REQUIRE(all.has_value());
  CHECK(all->Size() == 4);

  auto reg = all->Find<Diamond>();
  REQUIRE(reg != nullptr);
  CHECK(reg->AllNames() == NameSet{"id", "left", "right"});

  Diamond d{};
  auto id = reg->GetIntProperty("id").value();
  CHECK(id.Get(d).value() == 7);
  REQUIRE(id.Set(d, 9).has_value());
  CHECK(d.id == 9);
  CHECK(reg->GetDoubleProperty("right").value().Get(d).value() == 2.5);
}

TEST_CASE("AbstractTwinsDoNotConflict", "[properties][Inheritance]") {
  using namespace Propel::Properties;
  using InheritDemo::BothNames;

  auto reg = RegistryBuilder{}.Build<BothNames>();
  REQUIRE(reg.has_value());
  auto name = (*reg)->Get("name").value();
  CHECK(name->Mutability().ToString() == "[Read]");
  CHECK(name->GetterRef()->IsAbstract());
}

TEST_CASE("SubclassGetterReplacesInheritedDescriptor", "[properties][Inheritance]") {
  using namespace Propel::Properties;
  using InheritDemo::Shadow;

  auto all = RegistryBuilder{}.BuildAll<Shadow>().value();
  auto reg = all.Find<Shadow>();
  CHECK(reg->LocalNames() == NameSet{"id"});

  auto id = reg->Get("id").value();
  CHECK(id->BaseClass() == GetClass<Shadow>());
  CHECK(id->GetterRef()->DeclaringClass() == GetClass<Shadow>());
  CHECK(id->SetterRef()->DeclaringClass() == GetClass<InheritDemo::Identified>());

  Shadow s{};
  auto typed = reg->GetIntProperty("id").value();
  REQUIRE(typed.Set(s, 4).has_value());
  CHECK(typed.Get(s).value() == 40);
}

TEST_CASE("ExcludedNamespacesAreNotWalked", "[properties][Inheritance]") {
  using namespace Propel::Properties;
  using InheritDemo::Errorish;

  auto all = RegistryBuilder{}.BuildAll<Errorish>().value();
  CHECK(all.Size() == 1);
  CHECK_FALSE(all.Contains(GetClass<std::exception>().GetTypeId()));
  CHECK(all.Find<Errorish>()->AllNames() == NameSet{"reason"});

  auto excludedRoot = RegistryBuilder{}.Build<std::exception>();
  REQUIRE_FALSE(excludedRoot.has_value());
  CHECK(excludedRoot.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("SeededBuildMatchesFreshBuild", "[properties][Inheritance]") {
  using namespace Propel::Properties;
  using namespace InheritDemo;

  auto fresh = RegistryBuilder{}.BuildAll<Diamond>().value();

  auto entries = fresh.GetEntries();
  entries.erase(GetClass<Diamond>().GetTypeId());
  const RegistryCache seed{entries};

  auto viaBuilder = RegistryBuilder{}.WithCache(seed).BuildAll<Diamond>().value();
  auto viaArgument = RegistryBuilder{}.BuildAll(GetClass<Diamond>(), seed).value();

  for (const auto *rebuilt : {&viaBuilder, &viaArgument}) {
    CHECK(rebuilt->Size() == fresh.Size());
    CHECK(rebuilt->Find<Left>() == fresh.Find<Left>());

    auto a = fresh.Find<Diamond>();
    auto b = rebuilt->Find<Diamond>();
    REQUIRE(b != nullptr);
    CHECK(b != a);
    CHECK(b->AllNames() == a->AllNames());
    for (const auto &[name, descriptor] : a->Properties()) {
      auto other = b->Find(name);
      REQUIRE(other != nullptr);
      CHECK(other->Mutability() == descriptor->Mutability());
      CHECK(other->ValueType().id == descriptor->ValueType().id);
      CHECK(other->Kind() == descriptor->Kind());
    }
  }
}
