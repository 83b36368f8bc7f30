// TypedProperties.hpp
// Strongly-typed views over a PropertyDescriptor
#pragma once

#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

#include <Propel/Properties/Convert.hpp>
#include <Propel/Properties/Observable.hpp>
#include <Propel/Properties/PropertyDescriptor.hpp>

namespace Propel::Properties
{

  template <class Obj>
  concept ObjectLike = !std::is_pointer_v<std::remove_reference_t<Obj>> && !std::is_same_v<std::remove_cvref_t<Obj>, ObjectRef>;

  // Writes and writable boxes need a non-const object.
  template <class Obj>
  concept MutableObjectLike = ObjectLike<Obj> && !std::is_const_v<std::remove_reference_t<Obj>>;

  // Unboxed int / std::int64_t / double property.
  template <class V>
  class PrimitiveProperty
  {
  public:
    static_assert(std::is_same_v<V, int> || std::is_same_v<V, std::int64_t> || std::is_same_v<V, double>);

    explicit PrimitiveProperty(DescriptorPtr descriptor) : m_d(std::move(descriptor)) {}

    [[nodiscard]] const PropertyDescriptor &Descriptor() const noexcept { return *m_d; }
    [[nodiscard]] const DescriptorPtr &Share() const noexcept { return m_d; }

    [[nodiscard]] std::expected<V, Error> Get(const ObjectRef &obj) const
    {
      if constexpr (std::is_same_v<V, int>)
        return m_d->GetInt(obj);
      else if constexpr (std::is_same_v<V, std::int64_t>)
        return m_d->GetLong(obj);
      else
        return m_d->GetDouble(obj);
    }

    [[nodiscard]] std::expected<void, Error> Set(const ObjectRef &obj, V value) const
    {
      if constexpr (std::is_same_v<V, int>)
        return m_d->SetInt(obj, value);
      else if constexpr (std::is_same_v<V, std::int64_t>)
        return m_d->SetLong(obj, value);
      else
        return m_d->SetDouble(obj, value);
    }

    template <class Obj>
    requires ObjectLike<Obj>
    [[nodiscard]] std::expected<V, Error> Get(Obj &obj) const
    {
      return Get(ObjectRef::Of(obj));
    }

    template <class Obj>
    requires MutableObjectLike<Obj>
    [[nodiscard]] std::expected<void, Error> Set(Obj &obj, V value) const
    {
      return Set(ObjectRef::Of(obj), value);
    }

  private:
    DescriptorPtr m_d;
  };

  using IntProperty = PrimitiveProperty<int>;
  using LongProperty = PrimitiveProperty<std::int64_t>;
  using DoubleProperty = PrimitiveProperty<double>;

  // Boxed property with a known value type.
  template <class V>
  class TypedProperty
  {
  public:
    explicit TypedProperty(DescriptorPtr descriptor) : m_d(std::move(descriptor)) {}

    [[nodiscard]] const PropertyDescriptor &Descriptor() const noexcept { return *m_d; }
    [[nodiscard]] const DescriptorPtr &Share() const noexcept { return m_d; }

    [[nodiscard]] std::expected<std::optional<V>, Error> Get(const ObjectRef &obj) const
    {
      auto boxed = m_d->GetValue(obj);
      if (!boxed)
        return std::unexpected(boxed.error());
      if (!boxed->has_value())
        return std::optional<V>{};
      auto converted = detail::ConvertAny<V>(**boxed);
      if (!converted)
        return std::unexpected(converted.error());
      return std::optional<V>{std::move(*converted)};
    }

    [[nodiscard]] std::expected<void, Error> Set(const ObjectRef &obj, V value) const
    {
      return m_d->SetValue(obj, Any{std::move(value)});
    }

    template <class Obj>
    requires ObjectLike<Obj>
    [[nodiscard]] std::expected<std::optional<V>, Error> Get(Obj &obj) const
    {
      return Get(ObjectRef::Of(obj));
    }

    template <class Obj>
    requires MutableObjectLike<Obj>
    [[nodiscard]] std::expected<void, Error> Set(Obj &obj, V value) const
    {
      return Set(ObjectRef::Of(obj), std::move(value));
    }

  protected:
    DescriptorPtr m_d;
  };

  // Collection property; C is the full container type (e.g. std::vector<std::string>).
  template <class C>
  class CollectionProperty : public TypedProperty<C>
  {
  public:
    using TypedProperty<C>::TypedProperty;

    // The accessor's box itself, when the accessor returns a writable observable.
    [[nodiscard]] std::expected<Observable<C> *, Error> GetObservable(const ObjectRef &obj) const
    {
      if (auto bad = CheckBox())
        return std::unexpected(std::move(*bad));
      auto box = this->m_d->WritableBox(obj);
      if (!box)
        return std::unexpected(box.error());
      return static_cast<Observable<C> *>(*box);
    }

    [[nodiscard]] std::expected<const ReadOnlyObservable<C> *, Error> GetReadOnlyObservable(const ObjectRef &obj) const
    {
      if (auto bad = CheckBox())
        return std::unexpected(std::move(*bad));
      auto box = this->m_d->ReadOnlyBox(obj);
      if (!box)
        return std::unexpected(box.error());
      return static_cast<const ReadOnlyObservable<C> *>(*box);
    }

    template <class Obj>
    requires MutableObjectLike<Obj>
    [[nodiscard]] std::expected<Observable<C> *, Error> GetObservable(Obj &obj) const
    {
      return GetObservable(ObjectRef::Of(obj));
    }

    template <class Obj>
    requires ObjectLike<Obj>
    [[nodiscard]] std::expected<const ReadOnlyObservable<C> *, Error> GetReadOnlyObservable(Obj &obj) const
    {
      return GetReadOnlyObservable(ObjectRef::Of(obj));
    }

  private:
    [[nodiscard]] std::optional<Error> CheckBox() const
    {
      const auto *held = this->m_d->BoxValueType();
      if (held == nullptr)
        return Error{ErrorCode::AccessorMissing, "Property " + std::string{this->m_d->Name()} + " has no observable accessor"};
      if (held->id != detail::TypeIdOf<C>())
        return Error{ErrorCode::TypeMismatch, "Property " + std::string{this->m_d->Name()} + " accessor holds " + std::string{held->name}};
      return std::nullopt;
    }
  };

  template <class L>
  class ListProperty : public CollectionProperty<L>
  {
  public:
    using CollectionProperty<L>::CollectionProperty;
    [[nodiscard]] const TypeToken &ElementType() const noexcept { return *this->m_d->ElementType(); }
  };

  template <class S>
  class SetProperty : public CollectionProperty<S>
  {
  public:
    using CollectionProperty<S>::CollectionProperty;
    [[nodiscard]] const TypeToken &ElementType() const noexcept { return *this->m_d->ElementType(); }
  };

  template <class M>
  class MapProperty : public CollectionProperty<M>
  {
  public:
    using CollectionProperty<M>::CollectionProperty;
    [[nodiscard]] const TypeToken &KeyType() const noexcept { return *this->m_d->KeyType(); }
    [[nodiscard]] const TypeToken &ValueType() const noexcept { return *this->m_d->MapValueType(); }
  };

} // namespace Propel::Properties
