// PropertyRegistry.hpp
// Immutable per-class property registry and the class -> registry snapshot
#pragma once

#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <string_view>

#include <Propel/Properties/Export.hpp>
#include <Propel/Properties/PropertyDescriptor.hpp>
#include <Propel/Properties/PropertyVisitor.hpp>
#include <Propel/Properties/TypedProperties.hpp>

namespace Propel::Properties
{

  using NameSet = std::set<std::string, std::less<>>;
  using PropertyMap = std::map<std::string, DescriptorPtr, std::less<>>;

  class PROPEL_PROPERTIES_API PropertyRegistry
  {
  public:
    // `all` must contain every entry of `local`.
    PropertyRegistry(ClassInfo base, PropertyMap local, PropertyMap all, NameSet ignored);

    [[nodiscard]] ClassInfo BaseClass() const noexcept { return m_base; }

    // Sorted views.
    [[nodiscard]] const NameSet &AllNames() const noexcept { return m_allNames; }
    [[nodiscard]] const NameSet &LocalNames() const noexcept { return m_localNames; }
    [[nodiscard]] const NameSet &IgnoredNames() const noexcept { return m_ignored; }

    [[nodiscard]] const PropertyMap &Properties() const noexcept { return m_all; }
    [[nodiscard]] const PropertyMap &LocalProperties() const noexcept { return m_local; }
    [[nodiscard]] std::size_t Size() const noexcept { return m_all.size(); }

    [[nodiscard]] DescriptorPtr Find(std::string_view name) const;
    [[nodiscard]] std::expected<DescriptorPtr, Error> Get(std::string_view name) const;

    // Kind-checked lookups.
    [[nodiscard]] std::expected<IntProperty, Error> GetIntProperty(std::string_view name) const;
    [[nodiscard]] std::expected<LongProperty, Error> GetLongProperty(std::string_view name) const;
    [[nodiscard]] std::expected<DoubleProperty, Error> GetDoubleProperty(std::string_view name) const;

    // Exact value type match.
    template <class V>
    [[nodiscard]] std::expected<TypedProperty<V>, Error> GetProperty(std::string_view name) const
    {
      auto d = GetChecked(name, TokenOf<V>());
      if (!d)
        return std::unexpected(d.error());
      return TypedProperty<V>{std::move(*d)};
    }

    template <class L>
    [[nodiscard]] std::expected<ListProperty<L>, Error> GetListProperty(std::string_view name) const
    {
      static_assert(Adapters::is_sequence_v<L>, "GetListProperty expects a sequence container type");
      auto d = GetChecked(name, TokenOf<L>());
      if (!d)
        return std::unexpected(d.error());
      return ListProperty<L>{std::move(*d)};
    }

    template <class S>
    [[nodiscard]] std::expected<SetProperty<S>, Error> GetSetProperty(std::string_view name) const
    {
      static_assert(Adapters::is_set_v<S>, "GetSetProperty expects a set container type");
      auto d = GetChecked(name, TokenOf<S>());
      if (!d)
        return std::unexpected(d.error());
      return SetProperty<S>{std::move(*d)};
    }

    template <class M>
    [[nodiscard]] std::expected<MapProperty<M>, Error> GetMapProperty(std::string_view name) const
    {
      static_assert(Adapters::is_map_v<M>, "GetMapProperty expects a map container type");
      auto d = GetChecked(name, TokenOf<M>());
      if (!d)
        return std::unexpected(d.error());
      return MapProperty<M>{std::move(*d)};
    }

    // Look up `name` and dispatch it to `visitor`.
    [[nodiscard]] std::expected<DescriptorPtr, Error> GetProperty(std::string_view name, PropertyVisitor &visitor) const;

  private:
    [[nodiscard]] std::expected<DescriptorPtr, Error> GetChecked(std::string_view name, const TypeToken &wanted) const;
    [[nodiscard]] std::expected<DescriptorPtr, Error> GetKind(std::string_view name, DescriptorKind kind) const;

    ClassInfo m_base;
    PropertyMap m_local;
    PropertyMap m_all;
    NameSet m_localNames;
    NameSet m_allNames;
    NameSet m_ignored;
  };

  using RegistryPtr = std::shared_ptr<const PropertyRegistry>;

  // Immutable class -> registry snapshot. Copies share storage.
  class PROPEL_PROPERTIES_API RegistryCache
  {
  public:
    using Entries = std::map<TypeId, RegistryPtr>;

    RegistryCache();
    explicit RegistryCache(Entries entries);

    [[nodiscard]] RegistryPtr Find(TypeId id) const;
    [[nodiscard]] RegistryPtr Find(const ClassInfo &cls) const { return Find(cls.GetTypeId()); }
    template <class T>
    [[nodiscard]] RegistryPtr Find() const
    {
      return Find(detail::TypeIdOf<T>());
    }

    [[nodiscard]] bool Contains(TypeId id) const;
    [[nodiscard]] std::size_t Size() const noexcept { return m_entries->size(); }
    [[nodiscard]] bool Empty() const noexcept { return m_entries->empty(); }
    [[nodiscard]] const Entries &GetEntries() const noexcept { return *m_entries; }
    [[nodiscard]] Entries::const_iterator begin() const noexcept { return m_entries->begin(); }
    [[nodiscard]] Entries::const_iterator end() const noexcept { return m_entries->end(); }

    // New snapshot holding both; entries already present here win.
    [[nodiscard]] RegistryCache Merge(const RegistryCache &other) const;

  private:
    std::shared_ptr<const Entries> m_entries;
  };

} // namespace Propel::Properties
