// MemberCollector.hpp
// Per-class scan of fields and visible methods into property candidates
#pragma once

#include <array>
#include <map>
#include <optional>
#include <string>

#include <Propel/Properties/Catalog.hpp>
#include <Propel/Properties/Conventions.hpp>
#include <Propel/Properties/PropertyDescriptor.hpp>
#include <Propel/Properties/PropertyRegistry.hpp>

#include "ProblemLog.hpp"

namespace Propel::Properties::detail
{

  // Candidate for one kind of one property name.
  struct MethodSlot
  {
    std::optional<MethodInfo> method{};
    // Set by a method carrying the Ignored flag; the kind stays empty at this class.
    bool suppressed{false};
  };

  using MethodSlots = std::array<MethodSlot, 3>; // indexed by MemberKind

  class MemberCollector
  {
  public:
    MemberCollector(ClassInfo cls, const NamingConventions &conventions, ProblemLog &problems);

    // Fields first, then visible methods; finally drops names ignored at this class.
    void Collect();

    [[nodiscard]] const ClassInfo &Class() const noexcept { return m_class; }
    [[nodiscard]] const std::map<std::string, FieldInfo, std::less<>> &Fields() const noexcept { return m_fields; }
    [[nodiscard]] const std::map<std::string, MethodSlots, std::less<>> &Methods() const noexcept { return m_methods; }
    [[nodiscard]] const NameSet &IgnoredNames() const noexcept { return m_ignored; }

    // Names that have a field or method candidate, sorted.
    [[nodiscard]] NameSet CandidateNames() const;

    // Members recorded for `name`; suppressed kinds are left empty.
    [[nodiscard]] PropertyDescriptor::Members MembersOf(const std::string &name) const;

    // Value type by fixed priority: field, getter return, setter parameter, accessor box.
    // Optional and observable wrappers are unwrapped.
    [[nodiscard]] const TypeToken *ValueTypeOf(const PropertyDescriptor::Members &members) const;

  private:
    void SearchFields();
    void SearchMethods();
    void HandleMethod(MemberKind kind, const std::string &name, const MethodInfo &method);

    ClassInfo m_class;
    const NamingConventions &m_conventions;
    ProblemLog &m_problems;

    std::map<std::string, FieldInfo, std::less<>> m_fields;
    std::map<std::string, MethodSlots, std::less<>> m_methods;
    NameSet m_ignored;
  };

} // namespace Propel::Properties::detail
