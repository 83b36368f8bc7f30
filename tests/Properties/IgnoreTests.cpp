// IgnoreTests.cpp - ignore markers on fields, accessors and single methods

#include <catch2/catch_test_macros.hpp>

#include <Propel/Properties/Properties.hpp>

#include <string>

namespace IgnoreDemo {
using namespace Propel::Properties;

struct Secretive {
  int secret{1};
  SimpleObservable<int> box{1};
  int getSecret() const { return secret; }
  void setSecret(int v) { secret = v; }
  Observable<int> &secretProperty() { return box; }
  std::string getPublicName() const { return "open"; }
  friend void PropelReflect(Tag<Secretive>, ClassBuilder<Secretive> &b) {
    b.Field<&Secretive::secret>("secret", MemberFlags::Ignored);
    b.Method<&Secretive::getSecret>("getSecret");
    b.Method<&Secretive::setSecret>("setSecret");
    b.Method<&Secretive::secretProperty>("secretProperty");
    b.Method<&Secretive::getPublicName>("getPublicName");
  }
};

// Redeclares the getter; the inherited ignore still applies.
struct Revealer : Secretive {
  int getSecret() const { return 2; }
  friend void PropelReflect(Tag<Revealer>, ClassBuilder<Revealer> &b) {
    b.Superclass<Secretive>();
    b.Method<&Revealer::getSecret>("getSecret");
  }
};

struct Coded {
  int code{0};
  friend void PropelReflect(Tag<Coded>, ClassBuilder<Coded> &b) { b.Field<&Coded::code>("code", MemberFlags::Ignored); }
};

struct Catalogued {
  int getCode() const { return 42; }
  friend void PropelReflect(Tag<Catalogued>, ClassBuilder<Catalogued> &b) { b.Method<&Catalogued::getCode>("getCode"); }
};

// "code" comes from Catalogued but Coded ignores it.
struct Product : Catalogued, Coded {
  friend void PropelReflect(Tag<Product>, ClassBuilder<Product> &b) {
    b.Superclass<Catalogued>();
    b.Interface<Coded>();
  }
};

struct Labelled {
  virtual ~Labelled() = default;
  virtual Observable<std::string> &labelProperty() = 0;
  friend void PropelReflect(Tag<Labelled>, ClassBuilder<Labelled> &b) {
    b.Method<&Labelled::labelProperty>("labelProperty", MemberFlags::Abstract);
  }
};

struct QuietLabelled : Labelled {
  Observable<std::string> &labelProperty() override = 0;
  friend void PropelReflect(Tag<QuietLabelled>, ClassBuilder<QuietLabelled> &b) {
    b.Interface<Labelled>();
    b.Method<&QuietLabelled::labelProperty>("labelProperty", MemberFlags::Abstract | MemberFlags::Ignored);
  }
};

struct Sticker : QuietLabelled {
  SimpleObservable<std::string> label{};
  Observable<std::string> &labelProperty() override { return label; }
  std::string getLabel() const { return label.GetValue(); }
  void setLabel(std::string v) { label.SetValue(std::move(v)); }
  friend void PropelReflect(Tag<Sticker>, ClassBuilder<Sticker> &b) {
    b.Interface<QuietLabelled>();
    b.Method<&Sticker::labelProperty>("labelProperty");
    b.Method<&Sticker::getLabel>("getLabel");
    b.Method<&Sticker::setLabel>("setLabel");
  }
};

struct PartlyHidden {
  int level{3};
  int getLevel() const { return level; }
  void setLevel(int v) { level = v; }
  friend void PropelReflect(Tag<PartlyHidden>, ClassBuilder<PartlyHidden> &b) {
    b.Method<&PartlyHidden::setLevel>("setLevel");
    b.Method<&PartlyHidden::getLevel>("getLevel", MemberFlags::Ignored);
  }
};
} // namespace IgnoreDemo

TEST_CASE("IgnoredFieldRemovesWholeProperty", "[properties][Ignore]") {
  using namespace Propel::Properties;
  using IgnoreDemo::Secretive;

  auto reg = RegistryBuilder{}.Build<Secretive>().value();
  CHECK(reg->AllNames() == NameSet{"publicName"});
  CHECK(reg->IgnoredNames() == NameSet{"secret"});
  CHECK(reg->Find("secret") == nullptr);

  auto lookup = reg->Get("secret");
  REQUIRE_FALSE(lookup.has_value());
  CHECK(lookup.error().code == ErrorCode::PropertyNotFound);
}

TEST_CASE("IgnoreIsInheritedBySubclasses", "[properties][Ignore]") {
  using namespace Propel::Properties;
  using IgnoreDemo::Revealer;

  auto reg = RegistryBuilder{}.Build<Revealer>().value();
  CHECK(reg->AllNames() == NameSet{"publicName"});
  CHECK(reg->IgnoredNames().contains("secret"));
}

TEST_CASE("IgnoreFromUnrelatedSupertypeWins", "[properties][Ignore]") {
  using namespace Propel::Properties;
  using namespace IgnoreDemo;

  auto all = RegistryBuilder{}.BuildAll<Product>().value();
  CHECK(all.Find<Catalogued>()->AllNames() == NameSet{"code"});
  CHECK(all.Find<Coded>()->AllNames().empty());

  auto product = all.Find<Product>();
  REQUIRE(product != nullptr);
  CHECK(product->AllNames().empty());
  CHECK(product->IgnoredNames() == NameSet{"code"});
}

TEST_CASE("IgnoredAccessorOnInterfaceHidesProperty", "[properties][Ignore]") {
  using namespace Propel::Properties;
  using namespace IgnoreDemo;

  auto all = RegistryBuilder{}.BuildAll<Sticker>().value();
  CHECK(all.Find<Labelled>()->AllNames() == NameSet{"label"});
  CHECK(all.Find<QuietLabelled>()->AllNames().empty());
  CHECK(all.Find<QuietLabelled>()->IgnoredNames() == NameSet{"label"});

  auto sticker = all.Find<Sticker>();
  REQUIRE(sticker != nullptr);
  CHECK(sticker->AllNames().empty());
  CHECK(sticker->IgnoredNames() == NameSet{"label"});
}

TEST_CASE("IgnoredGetterOnlySuppressesReads", "[properties][Ignore]") {
  using namespace Propel::Properties;
  using IgnoreDemo::PartlyHidden;

  auto reg = RegistryBuilder{}.Build<PartlyHidden>().value();
  CHECK(reg->IgnoredNames().empty());

  auto level = reg->Get("level").value();
  CHECK(level->Mutability().ToString() == "[Write]");
  CHECK_FALSE(level->GetterRef().has_value());

  PartlyHidden p{};
  REQUIRE(level->SetInt(ObjectRef::Of(p), 8).has_value());
  CHECK(p.level == 8);
  auto read = level->GetInt(ObjectRef::Of(p));
  REQUIRE_FALSE(read.has_value());
  CHECK(read.error().code == ErrorCode::WriteOnlyViolation);
}
