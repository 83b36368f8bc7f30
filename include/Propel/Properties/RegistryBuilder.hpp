// RegistryBuilder.hpp
// Immutable build configuration and the entry points that resolve class hierarchies
#pragma once

#include <expected>
#include <string>
#include <vector>

#include <Propel/Properties/Catalog.hpp>
#include <Propel/Properties/Conventions.hpp>
#include <Propel/Properties/Export.hpp>
#include <Propel/Properties/PropertyRegistry.hpp>

namespace Propel::Properties
{

  // Every With* returns a modified copy; the receiver is never changed.
  class PROPEL_PROPERTIES_API RegistryBuilder
  {
  public:
    RegistryBuilder() = default;

    // Empty sets fall back to the defaults of NamingConventions.
    [[nodiscard]] RegistryBuilder WithFieldPrefixes(std::vector<std::string> prefixes) const;
    [[nodiscard]] RegistryBuilder WithPropertySuffixes(std::vector<std::string> suffixes) const;
    [[nodiscard]] RegistryBuilder WithGetterPrefixes(std::vector<std::string> prefixes) const;
    [[nodiscard]] RegistryBuilder WithSetterPrefixes(std::vector<std::string> prefixes) const;
    [[nodiscard]] RegistryBuilder WithExcludedNamespaces(std::vector<std::string> prefixes) const;
    // Add entries to the seed cache; existing seed entries win.
    [[nodiscard]] RegistryBuilder WithCache(const RegistryCache &cache) const;

    [[nodiscard]] const NamingConventions &Conventions() const noexcept { return m_conventions; }
    [[nodiscard]] const std::vector<std::string> &FieldPrefixes() const noexcept { return m_conventions.fieldPrefixes; }
    [[nodiscard]] const std::vector<std::string> &PropertySuffixes() const noexcept { return m_conventions.propertySuffixes; }
    [[nodiscard]] const std::vector<std::string> &GetterPrefixes() const noexcept { return m_conventions.getterPrefixes; }
    [[nodiscard]] const std::vector<std::string> &SetterPrefixes() const noexcept { return m_conventions.setterPrefixes; }
    [[nodiscard]] const std::vector<std::string> &ExcludedNamespaces() const noexcept { return m_conventions.excludedNamespaces; }
    [[nodiscard]] const RegistryCache &Cache() const noexcept { return m_cache; }

    // Registries for `root` and every walked supertype, plus the seed entries.
    [[nodiscard]] std::expected<RegistryCache, Error> BuildAll(const ClassInfo &root) const;
    [[nodiscard]] std::expected<RegistryCache, Error> BuildAll(const ClassInfo &root, const RegistryCache &seed) const;

    template <class T>
    [[nodiscard]] std::expected<RegistryCache, Error> BuildAll() const
    {
      return BuildAll(GetClass<T>());
    }

    // Just the registry of `root`.
    [[nodiscard]] std::expected<RegistryPtr, Error> Build(const ClassInfo &root) const;

    template <class T>
    [[nodiscard]] std::expected<RegistryPtr, Error> Build() const
    {
      return Build(GetClass<T>());
    }

  private:
    NamingConventions m_conventions{};
    RegistryCache m_cache{};
  };

} // namespace Propel::Properties
