#include <Propel/Properties/RegistryBuilder.hpp>

#include "BuildSession.hpp"

#include <utility>

namespace Propel::Properties
{

  namespace
  {
    void Replace(std::vector<std::string> &target, std::vector<std::string> values, const std::vector<std::string> &defaults)
    {
      target.clear();
      for (const auto &v : values)
        AppendUnique(target, v);
      if (target.empty())
        target = defaults;
    }
  } // namespace

  RegistryBuilder RegistryBuilder::WithFieldPrefixes(std::vector<std::string> prefixes) const
  {
    RegistryBuilder copy{*this};
    Replace(copy.m_conventions.fieldPrefixes, std::move(prefixes), NamingConventions{}.fieldPrefixes);
    return copy;
  }

  RegistryBuilder RegistryBuilder::WithPropertySuffixes(std::vector<std::string> suffixes) const
  {
    RegistryBuilder copy{*this};
    Replace(copy.m_conventions.propertySuffixes, std::move(suffixes), NamingConventions{}.propertySuffixes);
    return copy;
  }

  RegistryBuilder RegistryBuilder::WithGetterPrefixes(std::vector<std::string> prefixes) const
  {
    RegistryBuilder copy{*this};
    Replace(copy.m_conventions.getterPrefixes, std::move(prefixes), NamingConventions{}.getterPrefixes);
    return copy;
  }

  RegistryBuilder RegistryBuilder::WithSetterPrefixes(std::vector<std::string> prefixes) const
  {
    RegistryBuilder copy{*this};
    Replace(copy.m_conventions.setterPrefixes, std::move(prefixes), NamingConventions{}.setterPrefixes);
    return copy;
  }

  RegistryBuilder RegistryBuilder::WithExcludedNamespaces(std::vector<std::string> prefixes) const
  {
    RegistryBuilder copy{*this};
    Replace(copy.m_conventions.excludedNamespaces, std::move(prefixes), NamingConventions{}.excludedNamespaces);
    return copy;
  }

  RegistryBuilder RegistryBuilder::WithCache(const RegistryCache &cache) const
  {
    RegistryBuilder copy{*this};
    copy.m_cache = m_cache.Merge(cache);
    return copy;
  }

  std::expected<RegistryCache, Error> RegistryBuilder::BuildAll(const ClassInfo &root) const
  {
    return BuildAll(root, RegistryCache{});
  }

  std::expected<RegistryCache, Error> RegistryBuilder::BuildAll(const ClassInfo &root, const RegistryCache &seed) const
  {
    if (!root.IsValid())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "invalid root class"});
    detail::BuildSession session{root, m_conventions, m_cache.Merge(seed)};
    return session.Run();
  }

  std::expected<RegistryPtr, Error> RegistryBuilder::Build(const ClassInfo &root) const
  {
    auto all = BuildAll(root);
    if (!all)
      return std::unexpected(all.error());
    if (auto registry = all->Find(root))
      return registry;
    return std::unexpected(Error{ErrorCode::InvalidArgument,
                                 "Could not get registry for base type " + std::string{root.QualifiedName()}});
  }

} // namespace Propel::Properties
