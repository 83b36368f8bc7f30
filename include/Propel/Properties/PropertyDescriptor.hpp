// PropertyDescriptor.hpp
// Immutable, kind-specialized description of one property and its access paths
#pragma once

#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <Propel/Properties/Catalog.hpp>
#include <Propel/Properties/Export.hpp>
#include <Propel/Properties/Types.hpp>

namespace Propel::Properties
{

  namespace detail
  {
    // Member thunk paired with the class its `this` must be adjusted to.
    template <class Fn>
    struct Bound
    {
      Fn fn{nullptr};
      TypeId owner{0};
      explicit operator bool() const noexcept { return fn != nullptr; }
    };

    template <class V>
    struct PrimitiveAccess
    {
      using value_type = V;
      // Unboxed path, set when the bound member's own type is exactly V.
      Bound<NumericReadFn<V>> read{};
      Bound<NumericWriteFn<V>> write{};
      Bound<ReadFn> boxedRead{};
      Bound<WriteFn> boxedWrite{};
    };

    struct ObjectAccess
    {
      Bound<ReadFn> read{};
      Bound<WriteFn> write{};
    };

    struct BoxAccess
    {
      Bound<BoxFn> readOnly{};
      Bound<BoxFn> writable{};
      // Value held by the accessor's box, when an accessor exists.
      const TypeToken *value{nullptr};
    };

    struct ListAccess
    {
      ObjectAccess object{};
      BoxAccess box{};
      const TypeToken *element{nullptr};
    };

    struct SetAccess
    {
      ObjectAccess object{};
      BoxAccess box{};
      const TypeToken *element{nullptr};
    };

    struct MapAccess
    {
      ObjectAccess object{};
      BoxAccess box{};
      const TypeToken *key{nullptr};
      const TypeToken *value{nullptr};
    };

    // Alternative order matches DescriptorKind.
    using Access = std::variant<PrimitiveAccess<int>, PrimitiveAccess<std::int64_t>, PrimitiveAccess<double>,
                                ObjectAccess, ListAccess, SetAccess, MapAccess>;
  } // namespace detail

  class PROPEL_PROPERTIES_API PropertyDescriptor
  {
  public:
    // Members that contributed to the property; any subset except "field only".
    struct Members
    {
      std::optional<FieldInfo> field{};
      std::optional<MethodInfo> getter{};
      std::optional<MethodInfo> setter{};
      std::optional<MethodInfo> accessor{};
    };

    PropertyDescriptor(std::string name, ClassInfo base, const TypeToken &valueType, Members members,
                       MutabilitySet mutability, detail::Access access);

    [[nodiscard]] std::string_view Name() const noexcept { return m_name; }
    // Class whose member scan produced this descriptor.
    [[nodiscard]] ClassInfo BaseClass() const noexcept { return m_base; }
    [[nodiscard]] const TypeToken &ValueType() const noexcept { return *m_valueType; }
    [[nodiscard]] DescriptorKind Kind() const noexcept { return static_cast<DescriptorKind>(m_access.index()); }
    [[nodiscard]] MutabilitySet Mutability() const noexcept { return m_mutability; }
    [[nodiscard]] bool IsReadable() const noexcept { return m_mutability.Contains(Properties::Mutability::Read); }
    [[nodiscard]] bool IsWritable() const noexcept { return m_mutability.Contains(Properties::Mutability::Write); }

    [[nodiscard]] const std::optional<FieldInfo> &FieldRef() const noexcept { return m_members.field; }
    [[nodiscard]] const std::optional<MethodInfo> &GetterRef() const noexcept { return m_members.getter; }
    [[nodiscard]] const std::optional<MethodInfo> &SetterRef() const noexcept { return m_members.setter; }
    [[nodiscard]] const std::optional<MethodInfo> &AccessorRef() const noexcept { return m_members.accessor; }

    // List/Set element type, nullptr for other kinds.
    [[nodiscard]] const TypeToken *ElementType() const noexcept;
    // Map key and value types, nullptr for other kinds.
    [[nodiscard]] const TypeToken *KeyType() const noexcept;
    [[nodiscard]] const TypeToken *MapValueType() const noexcept;

    // Boxed read; an empty optional getter yields std::nullopt.
    [[nodiscard]] std::expected<std::optional<Any>, Error> GetValue(const ObjectRef &obj) const;
    // Boxed write. Numeric kinds accept any arithmetic value.
    [[nodiscard]] std::expected<void, Error> SetValue(const ObjectRef &obj, const Any &value) const;

    // Unboxed paths; TypeMismatch unless Kind() matches.
    [[nodiscard]] std::expected<int, Error> GetInt(const ObjectRef &obj) const;
    [[nodiscard]] std::expected<void, Error> SetInt(const ObjectRef &obj, int value) const;
    [[nodiscard]] std::expected<std::int64_t, Error> GetLong(const ObjectRef &obj) const;
    [[nodiscard]] std::expected<void, Error> SetLong(const ObjectRef &obj, std::int64_t value) const;
    [[nodiscard]] std::expected<double, Error> GetDouble(const ObjectRef &obj) const;
    [[nodiscard]] std::expected<void, Error> SetDouble(const ObjectRef &obj, double value) const;

    // Value type held by the accessor's box, nullptr without an accessor.
    [[nodiscard]] const TypeToken *BoxValueType() const noexcept;
    // Collection kinds only. Points at a ReadOnlyObservable<V> / Observable<V> respectively.
    [[nodiscard]] std::expected<void *, Error> ReadOnlyBox(const ObjectRef &obj) const;
    [[nodiscard]] std::expected<void *, Error> WritableBox(const ObjectRef &obj) const;

    // "Property@<Base>{<name>: <type>, [Read, Write]}"
    [[nodiscard]] std::string Describe() const;

    [[nodiscard]] const detail::Access &Strategy() const noexcept { return m_access; }

  private:
    [[nodiscard]] Error ReadOnly() const;
    [[nodiscard]] Error WriteOnly() const;
    [[nodiscard]] Error WrongKind(DescriptorKind wanted) const;
    [[nodiscard]] const detail::BoxAccess *Boxes() const noexcept;

    std::string m_name;
    ClassInfo m_base;
    const TypeToken *m_valueType;
    Members m_members;
    MutabilitySet m_mutability;
    detail::Access m_access;
  };

  using DescriptorPtr = std::shared_ptr<const PropertyDescriptor>;

} // namespace Propel::Properties
