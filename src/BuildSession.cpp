#include "BuildSession.hpp"
#include "DescriptorFactory.hpp"

#include <Propel/Properties/Logging.hpp>

#include <deque>
#include <utility>

namespace Propel::Properties::detail
{

  namespace
  {
    // Type id of the universal root ("no superclass").
    constexpr TypeId RootTypeId = 0;
  } // namespace

  BuildSession::BuildSession(ClassInfo root, const NamingConventions &conventions, RegistryCache seed)
      : m_root(root), m_conventions(conventions), m_seed(std::move(seed))
  {
  }

  bool BuildSession::IsExcluded(const ClassInfo &cls) const
  {
    const auto name = cls.QualifiedName();
    for (const auto &prefix : m_conventions.excludedNamespaces)
    {
      if (!prefix.empty() && name.starts_with(prefix))
        return true;
    }
    return false;
  }

  std::expected<RegistryCache, Error> BuildSession::Run()
  {
    Log().trace("build {} (seed: {} registr{})", m_root.QualifiedName(), m_seed.Size(), m_seed.Size() == 1 ? "y" : "ies");

    Walk();
    if (!m_problems.Empty())
    {
      auto err = m_problems.ToError(m_root.QualifiedName());
      Log().error("build {} failed with {} problem(s)", m_root.QualifiedName(), m_problems.Size());
      return std::unexpected(std::move(err));
    }

    std::set<TypeId> visited;
    std::vector<ClassInfo> order;
    Order(m_root, visited, order);
    for (const auto &cls : order)
    {
      auto it = m_collectors.find(cls.GetTypeId());
      if (it == m_collectors.end())
        return std::unexpected(Error{ErrorCode::BuildFailed, "class " + std::string{cls.QualifiedName()} + " was not collected"});
      auto registry = Assemble(*it->second);
      if (!registry)
        return std::unexpected(registry.error());
      m_built.emplace(cls.GetTypeId(), std::move(*registry));
    }

    auto entries = m_seed.GetEntries();
    for (auto &[id, registry] : m_built)
      entries.emplace(id, registry);
    Log().trace("build {} done: {} new registr{}", m_root.QualifiedName(), m_built.size(), m_built.size() == 1 ? "y" : "ies");
    return RegistryCache{std::move(entries)};
  }

  void BuildSession::Walk()
  {
    std::set<TypeId> visited{RootTypeId};
    for (const auto &[id, _] : m_seed)
      visited.insert(id);

    std::deque<ClassInfo> queue{m_root};
    while (!queue.empty())
    {
      const auto cls = queue.front();
      queue.pop_front();
      if (visited.contains(cls.GetTypeId()) || IsExcluded(cls))
        continue;

      for (NGIN::UIntSize i = 0; i < cls.InterfaceCount(); ++i)
        queue.push_back(cls.InterfaceAt(i));

      auto collector = std::make_unique<MemberCollector>(cls, m_conventions, m_problems);
      collector->Collect();
      m_collectors.emplace(cls.GetTypeId(), std::move(collector));
      visited.insert(cls.GetTypeId());

      if (auto super = cls.Superclass(); super && !visited.contains(super->GetTypeId()))
        queue.push_back(*super);
    }
  }

  void BuildSession::Order(const ClassInfo &cls, std::set<TypeId> &visited, std::vector<ClassInfo> &out) const
  {
    const auto id = cls.GetTypeId();
    if (visited.contains(id) || m_seed.Contains(id) || IsExcluded(cls))
      return;
    visited.insert(id);
    for (const auto &super : cls.DirectSupertypes())
      Order(super, visited, out);
    out.push_back(cls);
  }

  RegistryPtr BuildSession::Lookup(TypeId id) const
  {
    if (auto it = m_built.find(id); it != m_built.end())
      return it->second;
    return m_seed.Find(id);
  }

  std::expected<RegistryPtr, Error> BuildSession::Assemble(const MemberCollector &collector) const
  {
    const auto &cls = collector.Class();

    std::vector<RegistryPtr> supers;
    NameSet ignored = collector.IgnoredNames();
    for (const auto &super : cls.DirectSupertypes())
    {
      if (IsExcluded(super))
        continue;
      auto registry = Lookup(super.GetTypeId());
      if (!registry)
      {
        return std::unexpected(Error{ErrorCode::BuildFailed, "supertype " + std::string{super.QualifiedName()} + " of " +
                                                                 std::string{cls.QualifiedName()} + " has no registry"});
      }
      ignored.insert(registry->IgnoredNames().begin(), registry->IgnoredNames().end());
      supers.push_back(std::move(registry));
    }

    PropertyMap local;
    for (const auto &name : collector.CandidateNames())
    {
      if (ignored.contains(name))
        continue;
      auto members = collector.MembersOf(name);
      // A field alone does not make a property.
      if (!members.getter && !members.setter && !members.accessor)
        continue;
      const auto *valueType = collector.ValueTypeOf(members);
      local.emplace(name, MakeDescriptor(DescriptorInputs{name, cls, valueType, std::move(members)}));
    }

    PropertyMap all = local;
    for (const auto &registry : supers)
    {
      for (const auto &[name, descriptor] : registry->Properties())
      {
        if (local.contains(name) || ignored.contains(name))
          continue;
        // First supertype wins: superclass, then interfaces in declaration order.
        all.emplace(name, descriptor);
      }
    }

    Log().debug("{}: {} local, {} total, {} ignored", cls.QualifiedName(), local.size(), all.size(), ignored.size());
    return std::make_shared<const PropertyRegistry>(cls, std::move(local), std::move(all), std::move(ignored));
  }

} // namespace Propel::Properties::detail
