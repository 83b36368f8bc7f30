#include <Propel/Properties/Catalog.hpp>

#include <string>

namespace Propel::Properties::detail
{

  Catalog &GetCatalog() noexcept
  {
    static Catalog catalog{};
    return catalog;
  }

  namespace
  {
    constexpr NameId InvalidNameId = static_cast<NameId>(StringInterner::INVALID_ID);
  }

  NameId InternNameId(std::string_view s) noexcept
  {
    auto &cat = GetCatalog();
    const auto id = cat.names.InsertOrGet(s);
    if (id == StringInterner::INVALID_ID)
      return InvalidNameId;
    return static_cast<NameId>(id);
  }

  bool FindNameId(std::string_view s, NameId &out) noexcept
  {
    auto &cat = GetCatalog();
    StringInterner::IdType id{};
    if (!cat.names.TryGetId(s, id))
      return false;
    out = static_cast<NameId>(id);
    return true;
  }

  std::string_view NameFromId(NameId id) noexcept
  {
    auto &cat = GetCatalog();
    return cat.names.View(static_cast<StringInterner::IdType>(id));
  }

  void *UpcastTo(void *object, TypeId from, TypeId to) noexcept
  {
    if (object == nullptr)
      return nullptr;
    if (from == to)
      return object;
    const auto &cat = GetCatalog();
    const auto *idx = cat.byTypeId.GetPtr(from);
    if (idx == nullptr)
      return nullptr;
    const auto &cls = cat.classes[*idx];
    if (cls.superclass)
    {
      if (auto *p = UpcastTo(cls.superclass->Upcast(object), cls.superclass->baseTypeId, to))
        return p;
    }
    for (NGIN::UIntSize i = 0; i < cls.interfaces.Size(); ++i)
    {
      const auto &iface = cls.interfaces[i];
      if (auto *p = UpcastTo(iface.Upcast(object), iface.baseTypeId, to))
        return p;
    }
    return nullptr;
  }

  std::expected<void *, Error> AdjustTo(const ObjectRef &ref, TypeId declaring)
  {
    if (ref.object == nullptr)
      return std::unexpected(Error{ErrorCode::InvalidArgument, "null object"});
    if (auto *p = UpcastTo(ref.object, ref.type, declaring))
      return p;
    const auto &cat = GetCatalog();
    std::string msg{"object of type "};
    if (const auto *from = cat.byTypeId.GetPtr(ref.type))
      msg += std::string{cat.classes[*from].qualifiedName};
    else
      msg += "<unregistered>";
    msg += " is not a ";
    if (const auto *to = cat.byTypeId.GetPtr(declaring))
      msg += std::string{cat.classes[*to].qualifiedName};
    else
      msg += "<unregistered>";
    return std::unexpected(Error{ErrorCode::TypeMismatch, std::move(msg)});
  }

  const FieldRuntimeDesc &Resolve(FieldHandle h) noexcept
  {
    return GetCatalog().classes[h.classIndex].fields[h.fieldIndex];
  }

  const MethodRuntimeDesc &Resolve(MethodHandle h) noexcept
  {
    return GetCatalog().classes[h.classIndex].methods[h.methodIndex];
  }

} // namespace Propel::Properties::detail

namespace Propel::Properties
{

  using detail::GetCatalog;
  namespace
  {
    bool IsClassAlive(NGIN::UInt32 index)
    {
      return index < GetCatalog().classes.Size();
    }

    bool IsFieldAlive(FieldHandle h)
    {
      if (!h.IsValid() || !IsClassAlive(h.classIndex))
        return false;
      return h.fieldIndex < GetCatalog().classes[h.classIndex].fields.Size();
    }

    bool IsMethodAlive(MethodHandle h)
    {
      if (!h.IsValid() || !IsClassAlive(h.classIndex))
        return false;
      return h.methodIndex < GetCatalog().classes[h.classIndex].methods.Size();
    }

    void CollectVisible(NGIN::UInt32 classIndex, std::vector<MethodInfo> &out);

    bool Overrides(NGIN::UInt32 classIndex, const MethodInfo &inherited)
    {
      const auto &cls = GetCatalog().classes[classIndex];
      for (NGIN::UIntSize i = 0; i < cls.methods.Size(); ++i)
      {
        MethodInfo own{MethodHandle{classIndex, static_cast<NGIN::UInt32>(i)}};
        if (own.SameSignature(inherited))
          return true;
      }
      return false;
    }

    void Inherit(NGIN::UInt32 classIndex, NGIN::UInt32 baseIndex, std::vector<MethodInfo> &out)
    {
      std::vector<MethodInfo> inherited;
      CollectVisible(baseIndex, inherited);
      for (const auto &m : inherited)
      {
        if (Overrides(classIndex, m))
          continue;
        bool seen = false;
        for (const auto &existing : out)
        {
          if (existing == m)
          {
            seen = true;
            break;
          }
        }
        if (!seen)
          out.push_back(m);
      }
    }

    void CollectVisible(NGIN::UInt32 classIndex, std::vector<MethodInfo> &out)
    {
      const auto &cls = GetCatalog().classes[classIndex];
      for (NGIN::UIntSize i = 0; i < cls.methods.Size(); ++i)
        out.push_back(MethodInfo{MethodHandle{classIndex, static_cast<NGIN::UInt32>(i)}});
      if (cls.superclass)
        Inherit(classIndex, cls.superclass->baseClassIndex, out);
      for (NGIN::UIntSize i = 0; i < cls.interfaces.Size(); ++i)
        Inherit(classIndex, cls.interfaces[i].baseClassIndex, out);
    }
  } // namespace

  // FieldInfo
  bool FieldInfo::IsValid() const noexcept
  {
    return IsFieldAlive(m_h);
  }

  std::string_view FieldInfo::Name() const
  {
    if (!IsValid())
      return {};
    return detail::Resolve(m_h).name;
  }

  ClassInfo FieldInfo::DeclaringClass() const
  {
    if (!IsValid())
      return ClassInfo{};
    return ClassInfo{ClassHandle{m_h.classIndex}};
  }

  const TypeToken &FieldInfo::Type() const
  {
    if (!IsValid())
      return TokenOf<void>();
    return *detail::Resolve(m_h).type;
  }

  MemberFlags FieldInfo::Flags() const
  {
    if (!IsValid())
      return MemberFlags::None;
    return detail::Resolve(m_h).flags;
  }

  std::expected<std::optional<Any>, Error> FieldInfo::Load(const ObjectRef &obj) const
  {
    if (!IsValid())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "invalid field handle"});
    const auto &f = detail::Resolve(m_h);
    if (!f.Load)
      return std::unexpected(Error{ErrorCode::InvalidArgument, "field is not copyable"});
    auto self = detail::AdjustTo(obj, GetCatalog().classes[m_h.classIndex].typeId);
    if (!self)
      return std::unexpected(self.error());
    return f.Load(*self);
  }

  std::expected<void, Error> FieldInfo::Store(const ObjectRef &obj, const Any &value) const
  {
    if (!IsValid())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "invalid field handle"});
    const auto &f = detail::Resolve(m_h);
    if (!f.Store)
      return std::unexpected(Error{ErrorCode::ReadOnlyViolation, "field is not assignable"});
    auto self = detail::AdjustTo(obj, GetCatalog().classes[m_h.classIndex].typeId);
    if (!self)
      return std::unexpected(self.error());
    return f.Store(*self, value);
  }

  // MethodInfo
  bool MethodInfo::IsValid() const noexcept
  {
    return IsMethodAlive(m_h);
  }

  std::string_view MethodInfo::Name() const
  {
    if (!IsValid())
      return {};
    return detail::Resolve(m_h).name;
  }

  ClassInfo MethodInfo::DeclaringClass() const
  {
    if (!IsValid())
      return ClassInfo{};
    return ClassInfo{ClassHandle{m_h.classIndex}};
  }

  const TypeToken &MethodInfo::ReturnType() const
  {
    if (!IsValid())
      return TokenOf<void>();
    return *detail::Resolve(m_h).returnType;
  }

  NGIN::UIntSize MethodInfo::ParameterCount() const
  {
    if (!IsValid())
      return 0;
    return detail::Resolve(m_h).paramTypes.Size();
  }

  const TypeToken &MethodInfo::ParameterType(NGIN::UIntSize i) const
  {
    if (!IsValid() || i >= ParameterCount())
      return TokenOf<void>();
    return *detail::Resolve(m_h).paramTypes[i];
  }

  MemberFlags MethodInfo::Flags() const
  {
    if (!IsValid())
      return MemberFlags::None;
    return detail::Resolve(m_h).flags;
  }

  bool MethodInfo::SameSignature(const MethodInfo &other) const
  {
    if (!IsValid() || !other.IsValid())
      return false;
    const auto &a = detail::Resolve(m_h);
    const auto &b = detail::Resolve(other.m_h);
    if (a.nameId != b.nameId || a.paramTypes.Size() != b.paramTypes.Size())
      return false;
    for (NGIN::UIntSize i = 0; i < a.paramTypes.Size(); ++i)
    {
      if (a.paramTypes[i]->id != b.paramTypes[i]->id)
        return false;
    }
    return true;
  }

  // ClassInfo
  bool ClassInfo::IsValid() const noexcept
  {
    return m_h.IsValid() && IsClassAlive(m_h.index);
  }

  std::string_view ClassInfo::QualifiedName() const
  {
    if (!IsValid())
      return {};
    return GetCatalog().classes[m_h.index].qualifiedName;
  }

  TypeId ClassInfo::GetTypeId() const
  {
    if (!IsValid())
      return 0;
    return GetCatalog().classes[m_h.index].typeId;
  }

  NGIN::UIntSize ClassInfo::SizeBytes() const
  {
    if (!IsValid())
      return 0;
    return GetCatalog().classes[m_h.index].sizeBytes;
  }

  bool ClassInfo::IsInterface() const
  {
    if (!IsValid())
      return false;
    return GetCatalog().classes[m_h.index].isInterface;
  }

  std::optional<ClassInfo> ClassInfo::Superclass() const
  {
    if (!IsValid())
      return std::nullopt;
    const auto &cls = GetCatalog().classes[m_h.index];
    if (!cls.superclass)
      return std::nullopt;
    return ClassInfo{ClassHandle{cls.superclass->baseClassIndex}};
  }

  NGIN::UIntSize ClassInfo::InterfaceCount() const
  {
    if (!IsValid())
      return 0;
    return GetCatalog().classes[m_h.index].interfaces.Size();
  }

  ClassInfo ClassInfo::InterfaceAt(NGIN::UIntSize i) const
  {
    if (!IsValid() || i >= InterfaceCount())
      return ClassInfo{};
    return ClassInfo{ClassHandle{GetCatalog().classes[m_h.index].interfaces[i].baseClassIndex}};
  }

  std::vector<ClassInfo> ClassInfo::DirectSupertypes() const
  {
    std::vector<ClassInfo> out;
    if (auto super = Superclass())
      out.push_back(*super);
    for (NGIN::UIntSize i = 0; i < InterfaceCount(); ++i)
      out.push_back(InterfaceAt(i));
    return out;
  }

  bool ClassInfo::IsSubclassOf(const ClassInfo &other) const
  {
    if (!IsValid() || !other.IsValid())
      return false;
    if (*this == other)
      return true;
    for (const auto &super : DirectSupertypes())
    {
      if (super.IsSubclassOf(other))
        return true;
    }
    return false;
  }

  NGIN::UIntSize ClassInfo::FieldCount() const
  {
    if (!IsValid())
      return 0;
    return GetCatalog().classes[m_h.index].fields.Size();
  }

  FieldInfo ClassInfo::FieldAt(NGIN::UIntSize i) const
  {
    if (!IsValid() || i >= FieldCount())
      return FieldInfo{};
    return FieldInfo{FieldHandle{m_h.index, static_cast<NGIN::UInt32>(i)}};
  }

  NGIN::UIntSize ClassInfo::MethodCount() const
  {
    if (!IsValid())
      return 0;
    return GetCatalog().classes[m_h.index].methods.Size();
  }

  MethodInfo ClassInfo::MethodAt(NGIN::UIntSize i) const
  {
    if (!IsValid() || i >= MethodCount())
      return MethodInfo{};
    return MethodInfo{MethodHandle{m_h.index, static_cast<NGIN::UInt32>(i)}};
  }

  std::vector<MethodInfo> ClassInfo::VisibleMethods() const
  {
    std::vector<MethodInfo> out;
    if (!IsValid())
      return out;
    CollectVisible(m_h.index, out);
    return out;
  }

  ExpectedClass FindClass(std::string_view qualifiedName)
  {
    auto &cat = GetCatalog();
    NameId nid{};
    if (detail::FindNameId(qualifiedName, nid))
    {
      if (auto *p = cat.byName.GetPtr(nid))
        return ClassInfo{ClassHandle{*p}};
    }
    return std::unexpected(Error{ErrorCode::InvalidArgument, "class not found: " + std::string{qualifiedName}});
  }

  ExpectedClass FindClass(TypeId id)
  {
    auto &cat = GetCatalog();
    if (auto *p = cat.byTypeId.GetPtr(id))
      return ClassInfo{ClassHandle{*p}};
    return std::unexpected(Error{ErrorCode::InvalidArgument, "class not registered"});
  }

  NGIN::UIntSize ClassCount()
  {
    return GetCatalog().classes.Size();
  }

} // namespace Propel::Properties
