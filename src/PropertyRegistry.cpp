#include <Propel/Properties/PropertyRegistry.hpp>

#include <utility>

namespace Propel::Properties
{

  namespace
  {
    NameSet KeysOf(const PropertyMap &map)
    {
      NameSet out;
      for (const auto &[name, _] : map)
        out.insert(name);
      return out;
    }
  } // namespace

  PropertyRegistry::PropertyRegistry(ClassInfo base, PropertyMap local, PropertyMap all, NameSet ignored)
      : m_base(base), m_local(std::move(local)), m_all(std::move(all)), m_ignored(std::move(ignored))
  {
    m_localNames = KeysOf(m_local);
    m_allNames = KeysOf(m_all);
  }

  DescriptorPtr PropertyRegistry::Find(std::string_view name) const
  {
    auto it = m_all.find(name);
    if (it == m_all.end())
      return nullptr;
    return it->second;
  }

  std::expected<DescriptorPtr, Error> PropertyRegistry::Get(std::string_view name) const
  {
    if (auto d = Find(name))
      return d;
    return std::unexpected(Error{ErrorCode::PropertyNotFound, "Property " + std::string{name} + " does not exist on type " +
                                                                  std::string{m_base.QualifiedName()}});
  }

  std::expected<DescriptorPtr, Error> PropertyRegistry::GetChecked(std::string_view name, const TypeToken &wanted) const
  {
    auto d = Get(name);
    if (!d)
      return d;
    const auto &actual = (*d)->ValueType();
    if (actual.id != wanted.id)
    {
      return std::unexpected(Error{ErrorCode::TypeMismatch, "Property " + std::string{name} + " has type " +
                                                                std::string{actual.name} + ", requested " +
                                                                std::string{wanted.name}});
    }
    return d;
  }

  std::expected<DescriptorPtr, Error> PropertyRegistry::GetKind(std::string_view name, DescriptorKind kind) const
  {
    auto d = Get(name);
    if (!d)
      return d;
    if ((*d)->Kind() != kind)
    {
      return std::unexpected(Error{ErrorCode::TypeMismatch, "Property " + std::string{name} + " is " +
                                                                std::string{ToString((*d)->Kind())} + ", requested " +
                                                                std::string{ToString(kind)}});
    }
    return d;
  }

  std::expected<IntProperty, Error> PropertyRegistry::GetIntProperty(std::string_view name) const
  {
    auto d = GetKind(name, DescriptorKind::Int);
    if (!d)
      return std::unexpected(d.error());
    return IntProperty{std::move(*d)};
  }

  std::expected<LongProperty, Error> PropertyRegistry::GetLongProperty(std::string_view name) const
  {
    auto d = GetKind(name, DescriptorKind::Long);
    if (!d)
      return std::unexpected(d.error());
    return LongProperty{std::move(*d)};
  }

  std::expected<DoubleProperty, Error> PropertyRegistry::GetDoubleProperty(std::string_view name) const
  {
    auto d = GetKind(name, DescriptorKind::Double);
    if (!d)
      return std::unexpected(d.error());
    return DoubleProperty{std::move(*d)};
  }

  std::expected<DescriptorPtr, Error> PropertyRegistry::GetProperty(std::string_view name, PropertyVisitor &visitor) const
  {
    auto d = Get(name);
    if (d)
      Visit(*d, visitor);
    return d;
  }

  // RegistryCache

  RegistryCache::RegistryCache() : m_entries(std::make_shared<const Entries>()) {}

  RegistryCache::RegistryCache(Entries entries) : m_entries(std::make_shared<const Entries>(std::move(entries))) {}

  RegistryPtr RegistryCache::Find(TypeId id) const
  {
    auto it = m_entries->find(id);
    if (it == m_entries->end())
      return nullptr;
    return it->second;
  }

  bool RegistryCache::Contains(TypeId id) const
  {
    return m_entries->find(id) != m_entries->end();
  }

  RegistryCache RegistryCache::Merge(const RegistryCache &other) const
  {
    if (other.Empty())
      return *this;
    Entries merged = *m_entries;
    for (const auto &[id, registry] : other)
      merged.emplace(id, registry);
    return RegistryCache{std::move(merged)};
  }

} // namespace Propel::Properties
