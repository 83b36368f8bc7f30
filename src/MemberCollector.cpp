#include "MemberCollector.hpp"

#include <Propel/Properties/Logging.hpp>

#include <utility>

namespace Propel::Properties::detail
{

  namespace
  {
    std::string_view KindName(MemberKind kind) noexcept
    {
      switch (kind)
      {
      case MemberKind::Getter:
        return "getters";
      case MemberKind::Setter:
        return "setters";
      case MemberKind::Accessor:
        return "accessors";
      }
      return "members";
    }

    // "Class::name(Param, ...)"
    std::string Signature(const MethodInfo &m)
    {
      std::string out{m.DeclaringClass().QualifiedName()};
      out += "::";
      out += m.Name();
      out += "(";
      for (NGIN::UIntSize i = 0; i < m.ParameterCount(); ++i)
      {
        if (i != 0)
          out += ", ";
        out += m.ParameterType(i).name;
      }
      out += ")";
      return out;
    }
  } // namespace

  MemberCollector::MemberCollector(ClassInfo cls, const NamingConventions &conventions, ProblemLog &problems)
      : m_class(cls), m_conventions(conventions), m_problems(problems)
  {
  }

  void MemberCollector::Collect()
  {
    SearchFields();
    SearchMethods();
    for (const auto &name : m_ignored)
    {
      m_fields.erase(name);
      if (auto it = m_methods.find(name); it != m_methods.end())
        m_methods.erase(it);
    }
    Log().debug("{}: {} field(s), {} method name(s), {} ignored", m_class.QualifiedName(), m_fields.size(),
                m_methods.size(), m_ignored.size());
  }

  void MemberCollector::SearchFields()
  {
    for (NGIN::UIntSize i = 0; i < m_class.FieldCount(); ++i)
    {
      const auto field = m_class.FieldAt(i);
      const auto raw = field.Name();
      auto prefix = MatchesPrefix(raw, m_conventions.fieldPrefixes);
      if (!prefix)
        continue;
      auto name = RemovePrefix(raw, *prefix);
      if (!name)
      {
        m_problems.Report(raw, name.error().code, name.error().message);
        continue;
      }
      if (field.IsIgnored())
      {
        Log().trace("{}: field {} ignores property {}", m_class.QualifiedName(), raw, *name);
        m_ignored.insert(*name);
        continue;
      }
      if (m_fields.contains(*name))
      {
        m_problems.Report(*name, ErrorCode::DuplicateMember, "Found multiple fields for name: " + *name);
        continue;
      }
      Log().trace("{}: field {} -> {}", m_class.QualifiedName(), raw, *name);
      m_fields.emplace(std::move(*name), field);
    }
  }

  void MemberCollector::SearchMethods()
  {
    for (const auto &method : m_class.VisibleMethods())
    {
      const auto raw = method.Name();
      const auto &ret = method.ReturnType();
      const auto params = method.ParameterCount();

      if (auto suffix = MatchesSuffix(raw, m_conventions.propertySuffixes); suffix && params == 0 && IsReadOnlyObservable(ret))
      {
        auto name = RemoveSuffix(raw, *suffix);
        if (!name)
        {
          m_problems.Report(raw, name.error().code, name.error().message);
          continue;
        }
        if (method.IsIgnored())
        {
          // The accessor is the property itself.
          Log().trace("{}: accessor {} ignores property {}", m_class.QualifiedName(), raw, *name);
          m_ignored.insert(*name);
          continue;
        }
        HandleMethod(MemberKind::Accessor, *name, method);
        continue;
      }

      if (auto prefix = MatchesPrefix(raw, m_conventions.getterPrefixes); prefix && params == 0 && ret.category != TypeCategory::Void)
      {
        auto name = RemovePrefix(raw, *prefix);
        if (!name)
        {
          m_problems.Report(raw, name.error().code, name.error().message);
          continue;
        }
        HandleMethod(MemberKind::Getter, *name, method);
        continue;
      }

      if (auto prefix = MatchesPrefix(raw, m_conventions.setterPrefixes); prefix && params == 1)
      {
        auto name = RemovePrefix(raw, *prefix);
        if (!name)
        {
          m_problems.Report(raw, name.error().code, name.error().message);
          continue;
        }
        HandleMethod(MemberKind::Setter, *name, method);
      }
    }
  }

  void MemberCollector::HandleMethod(MemberKind kind, const std::string &name, const MethodInfo &method)
  {
    auto &slot = m_methods[name][static_cast<std::size_t>(kind)];
    if (method.IsIgnored())
    {
      slot.suppressed = true;
      slot.method.reset();
      return;
    }
    if (slot.suppressed)
      return;
    if (!slot.method)
    {
      Log().trace("{}: {} -> {} ({})", m_class.QualifiedName(), method.Name(), name, KindName(kind));
      slot.method = method;
      return;
    }
    const auto &stored = *slot.method;
    if (stored == method)
      return;
    if (stored.IsAbstract() && !method.IsAbstract())
    {
      slot.method = method;
      return;
    }
    if (method.IsAbstract())
      return;
    m_problems.Report(name, ErrorCode::DuplicateMember,
                      "Multiple " + std::string{KindName(kind)} + " found: " + Signature(method) + " and " + Signature(stored));
  }

  NameSet MemberCollector::CandidateNames() const
  {
    NameSet out;
    for (const auto &[name, _] : m_fields)
      out.insert(name);
    for (const auto &[name, _] : m_methods)
      out.insert(name);
    return out;
  }

  PropertyDescriptor::Members MemberCollector::MembersOf(const std::string &name) const
  {
    PropertyDescriptor::Members members{};
    if (auto it = m_fields.find(name); it != m_fields.end())
      members.field = it->second;
    if (auto it = m_methods.find(name); it != m_methods.end())
    {
      members.getter = it->second[static_cast<std::size_t>(MemberKind::Getter)].method;
      members.setter = it->second[static_cast<std::size_t>(MemberKind::Setter)].method;
      members.accessor = it->second[static_cast<std::size_t>(MemberKind::Accessor)].method;
    }
    return members;
  }

  const TypeToken *MemberCollector::ValueTypeOf(const PropertyDescriptor::Members &members) const
  {
    if (members.field)
      return &UnwrapValueType(members.field->Type());
    if (members.getter)
      return &UnwrapValueType(members.getter->ReturnType());
    if (members.setter)
      return &UnwrapValueType(members.setter->ParameterType(0));
    if (members.accessor)
      return &UnwrapValueType(members.accessor->ReturnType());
    return nullptr;
  }

} // namespace Propel::Properties::detail
