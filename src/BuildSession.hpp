// BuildSession.hpp
// One build call: breadth-first collection, error gate, then post-order assembly
#pragma once

#include <expected>
#include <map>
#include <memory>
#include <set>
#include <vector>

#include <Propel/Properties/Catalog.hpp>
#include <Propel/Properties/Conventions.hpp>
#include <Propel/Properties/PropertyRegistry.hpp>

#include "MemberCollector.hpp"
#include "ProblemLog.hpp"

namespace Propel::Properties::detail
{

  class BuildSession
  {
  public:
    BuildSession(ClassInfo root, const NamingConventions &conventions, RegistryCache seed);

    // Single use. Fails with BuildFailed listing every problem found in the hierarchy.
    [[nodiscard]] std::expected<RegistryCache, Error> Run();

  private:
    [[nodiscard]] bool IsExcluded(const ClassInfo &cls) const;

    // Collection phase.
    void Walk();

    // Assembly phase.
    void Order(const ClassInfo &cls, std::set<TypeId> &visited, std::vector<ClassInfo> &out) const;
    [[nodiscard]] RegistryPtr Lookup(TypeId id) const;
    [[nodiscard]] std::expected<RegistryPtr, Error> Assemble(const MemberCollector &collector) const;

    ClassInfo m_root;
    const NamingConventions &m_conventions;
    RegistryCache m_seed;

    ProblemLog m_problems;
    std::map<TypeId, std::unique_ptr<MemberCollector>> m_collectors;
    std::map<TypeId, RegistryPtr> m_built;
  };

} // namespace Propel::Properties::detail
