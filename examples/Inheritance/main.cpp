#include <Propel/Properties/Properties.hpp>

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace Demo
{
  using namespace Propel::Properties;

  struct Named
  {
    virtual ~Named() = default;
    virtual std::string getName() const = 0;
    virtual void setName(std::string v) = 0;

    friend void PropelReflect(Tag<Named>, ClassBuilder<Named> &b)
    {
      b.Method<&Named::getName>("getName", MemberFlags::Abstract);
      b.Method<&Named::setName>("setName", MemberFlags::Abstract);
    }
  };

  struct Tagged
  {
    virtual ~Tagged() = default;
    virtual Observable<std::vector<std::string>> &tagsProperty() = 0;

    friend void PropelReflect(Tag<Tagged>, ClassBuilder<Tagged> &b)
    {
      b.Method<&Tagged::tagsProperty>("tagsProperty", MemberFlags::Abstract);
    }
  };

  struct Entity
  {
    std::int64_t id{1};
    std::int64_t internal{0};
    std::int64_t getId() const { return id; }
    std::int64_t getInternal() const { return internal; }

    friend void PropelReflect(Tag<Entity>, ClassBuilder<Entity> &b)
    {
      b.Method<&Entity::getId>("getId");
      b.Field<&Entity::internal>("internal", MemberFlags::Ignored);
      b.Method<&Entity::getInternal>("getInternal");
    }
  };

  struct Document : Entity, Named, Tagged
  {
    std::string name{"draft"};
    SimpleObservable<std::vector<std::string>> tags{};

    std::string getName() const override { return name; }
    void setName(std::string v) override { name = std::move(v); }
    Observable<std::vector<std::string>> &tagsProperty() override { return tags; }

    friend void PropelReflect(Tag<Document>, ClassBuilder<Document> &b)
    {
      b.Superclass<Entity>();
      b.Interface<Named>();
      b.Interface<Tagged>();
      b.Method<&Document::getName>("getName");
      b.Method<&Document::setName>("setName");
      b.Method<&Document::tagsProperty>("tagsProperty");
    }
  };
}

int main()
{
  using namespace Propel::Properties;
  using Demo::Document;

  auto all = RegistryBuilder{}.BuildAll<Document>();
  if (!all)
  {
    std::cerr << all.error().message << "\n";
    return 1;
  }

  for (const auto &[id, registry] : *all)
  {
    std::cout << registry->BaseClass().QualifiedName() << ":";
    for (const auto &name : registry->AllNames())
      std::cout << " " << name;
    if (!registry->IgnoredNames().empty())
      std::cout << " (ignored: " << registry->IgnoredNames().size() << ")";
    std::cout << "\n";
  }

  Document doc{};
  auto reg = all->Find<Document>();

  // The interface descriptor reaches the override through the adjusted Named subobject.
  auto name = all->Find<Demo::Named>()->GetProperty<std::string>("name").value();
  (void)name.Set(doc, "final");
  std::cout << "name => " << doc.getName() << "\n";

  auto tags = reg->GetListProperty<std::vector<std::string>>("tags").value();
  if (auto box = tags.GetObservable(doc))
    (*box)->SetValue({"draft", "reviewed"});
  std::cout << "tags => " << doc.tags.GetValue().size() << "\n";
  return 0;
}
