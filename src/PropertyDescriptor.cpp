#include <Propel/Properties/PropertyDescriptor.hpp>
#include <Propel/Properties/Convert.hpp>

#include <optional>
#include <type_traits>
#include <utility>

namespace Propel::Properties
{

  namespace
  {
    using detail::Bound;

    template <class Fn, class... A>
    auto Call(const Bound<Fn> &bound, const ObjectRef &obj, A &&...args) -> decltype(bound.fn(nullptr, std::forward<A>(args)...))
    {
      auto self = detail::AdjustTo(obj, bound.owner);
      if (!self)
        return std::unexpected(self.error());
      return bound.fn(*self, std::forward<A>(args)...);
    }

    Error Missing(std::string_view name, std::string_view what)
    {
      return Error{ErrorCode::AccessorMissing, "Property " + std::string{name} + " has no usable " + std::string{what}};
    }

    std::expected<std::optional<Any>, Error> ReadObject(const detail::ObjectAccess &a, const ObjectRef &obj, std::string_view name)
    {
      if (!a.read)
        return std::unexpected(Missing(name, "getter"));
      return Call(a.read, obj);
    }

    std::expected<void, Error> WriteObject(const detail::ObjectAccess &a, const ObjectRef &obj, const Any &value, std::string_view name)
    {
      if (!a.write)
        return std::unexpected(Missing(name, "setter"));
      return Call(a.write, obj, value);
    }

    // Empty when a boxed read (an optional getter) has no value.
    template <class V>
    std::expected<std::optional<V>, Error> ReadPrimitiveMaybe(const detail::PrimitiveAccess<V> &a, const ObjectRef &obj,
                                                              std::string_view name)
    {
      if (a.read)
      {
        auto v = Call(a.read, obj);
        if (!v)
          return std::unexpected(v.error());
        return std::optional<V>{*v};
      }
      if (!a.boxedRead)
        return std::unexpected(Missing(name, "getter"));
      auto boxed = Call(a.boxedRead, obj);
      if (!boxed)
        return std::unexpected(boxed.error());
      if (!boxed->has_value())
        return std::optional<V>{};
      auto converted = detail::ConvertAny<V>(**boxed);
      if (!converted)
        return std::unexpected(converted.error());
      return std::optional<V>{*converted};
    }

    template <class V>
    std::expected<V, Error> ReadPrimitive(const detail::PrimitiveAccess<V> &a, const ObjectRef &obj, std::string_view name)
    {
      auto v = ReadPrimitiveMaybe(a, obj, name);
      if (!v)
        return std::unexpected(v.error());
      if (!v->has_value())
        return std::unexpected(Error{ErrorCode::TypeMismatch, "Property " + std::string{name} + " produced no value"});
      return **v;
    }

    template <class V>
    std::expected<void, Error> WritePrimitive(const detail::PrimitiveAccess<V> &a, const ObjectRef &obj, V value, std::string_view name)
    {
      if (a.write)
        return Call(a.write, obj, value);
      if (!a.boxedWrite)
        return std::unexpected(Missing(name, "setter"));
      return Call(a.boxedWrite, obj, Any{value});
    }

    template <class V>
    constexpr DescriptorKind PrimitiveKind() noexcept
    {
      if constexpr (std::is_same_v<V, int>)
        return DescriptorKind::Int;
      else if constexpr (std::is_same_v<V, std::int64_t>)
        return DescriptorKind::Long;
      else
        return DescriptorKind::Double;
    }
  } // namespace

  PropertyDescriptor::PropertyDescriptor(std::string name, ClassInfo base, const TypeToken &valueType, Members members,
                                         MutabilitySet mutability, detail::Access access)
      : m_name(std::move(name)), m_base(base), m_valueType(&valueType), m_members(std::move(members)),
        m_mutability(mutability), m_access(std::move(access))
  {
  }

  const TypeToken *PropertyDescriptor::ElementType() const noexcept
  {
    if (const auto *l = std::get_if<detail::ListAccess>(&m_access))
      return l->element;
    if (const auto *s = std::get_if<detail::SetAccess>(&m_access))
      return s->element;
    return nullptr;
  }

  const TypeToken *PropertyDescriptor::KeyType() const noexcept
  {
    if (const auto *m = std::get_if<detail::MapAccess>(&m_access))
      return m->key;
    return nullptr;
  }

  const TypeToken *PropertyDescriptor::MapValueType() const noexcept
  {
    if (const auto *m = std::get_if<detail::MapAccess>(&m_access))
      return m->value;
    return nullptr;
  }

  std::expected<std::optional<Any>, Error> PropertyDescriptor::GetValue(const ObjectRef &obj) const
  {
    if (!IsReadable())
      return std::unexpected(WriteOnly());
    return std::visit(
        [&](const auto &a) -> std::expected<std::optional<Any>, Error>
        {
          using A = std::decay_t<decltype(a)>;
          if constexpr (std::is_same_v<A, detail::ObjectAccess>)
          {
            return ReadObject(a, obj, m_name);
          }
          else if constexpr (std::is_same_v<A, detail::ListAccess> || std::is_same_v<A, detail::SetAccess> ||
                             std::is_same_v<A, detail::MapAccess>)
          {
            return ReadObject(a.object, obj, m_name);
          }
          else
          {
            auto v = ReadPrimitiveMaybe(a, obj, m_name);
            if (!v)
              return std::unexpected(v.error());
            if (!v->has_value())
              return std::optional<Any>{};
            return std::optional<Any>{Any{**v}};
          }
        },
        m_access);
  }

  std::expected<void, Error> PropertyDescriptor::SetValue(const ObjectRef &obj, const Any &value) const
  {
    if (!IsWritable())
      return std::unexpected(ReadOnly());
    return std::visit(
        [&](const auto &a) -> std::expected<void, Error>
        {
          using A = std::decay_t<decltype(a)>;
          if constexpr (std::is_same_v<A, detail::ObjectAccess>)
          {
            return WriteObject(a, obj, value, m_name);
          }
          else if constexpr (std::is_same_v<A, detail::ListAccess> || std::is_same_v<A, detail::SetAccess> ||
                             std::is_same_v<A, detail::MapAccess>)
          {
            return WriteObject(a.object, obj, value, m_name);
          }
          else
          {
            using V = typename A::value_type;
            auto converted = detail::ConvertAny<V>(value);
            if (!converted)
              return std::unexpected(converted.error());
            return WritePrimitive(a, obj, *converted, m_name);
          }
        },
        m_access);
  }

  std::expected<int, Error> PropertyDescriptor::GetInt(const ObjectRef &obj) const
  {
    const auto *a = std::get_if<detail::PrimitiveAccess<int>>(&m_access);
    if (a == nullptr)
      return std::unexpected(WrongKind(DescriptorKind::Int));
    if (!IsReadable())
      return std::unexpected(WriteOnly());
    return ReadPrimitive(*a, obj, m_name);
  }

  std::expected<void, Error> PropertyDescriptor::SetInt(const ObjectRef &obj, int value) const
  {
    const auto *a = std::get_if<detail::PrimitiveAccess<int>>(&m_access);
    if (a == nullptr)
      return std::unexpected(WrongKind(DescriptorKind::Int));
    if (!IsWritable())
      return std::unexpected(ReadOnly());
    return WritePrimitive(*a, obj, value, m_name);
  }

  std::expected<std::int64_t, Error> PropertyDescriptor::GetLong(const ObjectRef &obj) const
  {
    const auto *a = std::get_if<detail::PrimitiveAccess<std::int64_t>>(&m_access);
    if (a == nullptr)
      return std::unexpected(WrongKind(DescriptorKind::Long));
    if (!IsReadable())
      return std::unexpected(WriteOnly());
    return ReadPrimitive(*a, obj, m_name);
  }

  std::expected<void, Error> PropertyDescriptor::SetLong(const ObjectRef &obj, std::int64_t value) const
  {
    const auto *a = std::get_if<detail::PrimitiveAccess<std::int64_t>>(&m_access);
    if (a == nullptr)
      return std::unexpected(WrongKind(DescriptorKind::Long));
    if (!IsWritable())
      return std::unexpected(ReadOnly());
    return WritePrimitive(*a, obj, value, m_name);
  }

  std::expected<double, Error> PropertyDescriptor::GetDouble(const ObjectRef &obj) const
  {
    const auto *a = std::get_if<detail::PrimitiveAccess<double>>(&m_access);
    if (a == nullptr)
      return std::unexpected(WrongKind(DescriptorKind::Double));
    if (!IsReadable())
      return std::unexpected(WriteOnly());
    return ReadPrimitive(*a, obj, m_name);
  }

  std::expected<void, Error> PropertyDescriptor::SetDouble(const ObjectRef &obj, double value) const
  {
    const auto *a = std::get_if<detail::PrimitiveAccess<double>>(&m_access);
    if (a == nullptr)
      return std::unexpected(WrongKind(DescriptorKind::Double));
    if (!IsWritable())
      return std::unexpected(ReadOnly());
    return WritePrimitive(*a, obj, value, m_name);
  }

  const detail::BoxAccess *PropertyDescriptor::Boxes() const noexcept
  {
    if (const auto *l = std::get_if<detail::ListAccess>(&m_access))
      return &l->box;
    if (const auto *s = std::get_if<detail::SetAccess>(&m_access))
      return &s->box;
    if (const auto *m = std::get_if<detail::MapAccess>(&m_access))
      return &m->box;
    return nullptr;
  }

  const TypeToken *PropertyDescriptor::BoxValueType() const noexcept
  {
    if (m_members.accessor)
      return m_members.accessor->ReturnType().value;
    return nullptr;
  }

  std::expected<void *, Error> PropertyDescriptor::ReadOnlyBox(const ObjectRef &obj) const
  {
    const auto *boxes = Boxes();
    if (boxes == nullptr)
      return std::unexpected(Error{ErrorCode::TypeMismatch, "Property " + m_name + " is not a collection property"});
    if (!boxes->readOnly)
      return std::unexpected(Error{ErrorCode::AccessorMissing, "Property " + m_name + " has no observable accessor"});
    return Call(boxes->readOnly, obj);
  }

  std::expected<void *, Error> PropertyDescriptor::WritableBox(const ObjectRef &obj) const
  {
    const auto *boxes = Boxes();
    if (boxes == nullptr)
      return std::unexpected(Error{ErrorCode::TypeMismatch, "Property " + m_name + " is not a collection property"});
    if (!boxes->writable)
      return std::unexpected(Error{ErrorCode::AccessorMissing, "Property " + m_name + " has no writable observable accessor"});
    return Call(boxes->writable, obj);
  }

  std::string PropertyDescriptor::Describe() const
  {
    std::string out{"Property@"};
    out += m_base.QualifiedName();
    out += "{";
    out += m_name;
    out += ": ";
    out += m_valueType->name;
    out += ", ";
    out += m_mutability.ToString();
    out += "}";
    return out;
  }

  Error PropertyDescriptor::ReadOnly() const
  {
    return Error{ErrorCode::ReadOnlyViolation,
                 "Property " + m_name + " on " + std::string{m_base.QualifiedName()} + " is read-only, no setter."};
  }

  Error PropertyDescriptor::WriteOnly() const
  {
    return Error{ErrorCode::WriteOnlyViolation,
                 "Property " + m_name + " on " + std::string{m_base.QualifiedName()} + " is write-only, no getter."};
  }

  Error PropertyDescriptor::WrongKind(DescriptorKind wanted) const
  {
    return Error{ErrorCode::TypeMismatch, "Property " + m_name + " is " + std::string{ToString(Kind())} + ", not " +
                                              std::string{ToString(wanted)}};
  }

} // namespace Propel::Properties
