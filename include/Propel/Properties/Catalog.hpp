// Catalog.hpp
// Process-wide class catalog: registered classes, their supertypes, fields and methods
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>
#include <NGIN/Containers/HashMap.hpp>
#include <NGIN/Meta/TypeName.hpp>
#include <NGIN/Utilities/StringInterner.hpp>

#include <concepts>
#include <cstdint>
#include <expected>
#include <optional>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

#include <Propel/Properties/Export.hpp>
#include <Propel/Properties/Types.hpp>
#include <Propel/Properties/TypeToken.hpp>

namespace Propel::Properties
{
  using NameId = NGIN::UInt32;

  // Forward decls
  template <class T>
  struct Tag
  {
    using type = T;
  };
  template <class T>
  class ClassBuilder;

  // Optional external customization point for types you cannot modify
  // Specialize in namespace Propel::Properties: template<> struct Describe<MyType> { static void Do(ClassBuilder<MyType>&); };
  template <class T>
  struct Describe;

  namespace detail
  {
    template <class T>
    NGIN::UInt32 EnsureRegistered();
  } // namespace detail

  // Type-erased reference to a live object: the address of the most derived object
  // plus the type id it was registered under.
  struct ObjectRef
  {
    void *object{nullptr};
    TypeId type{0};

    template <class T>
    [[nodiscard]] static ObjectRef Of(T &obj)
    {
      using U = std::remove_cv_t<T>;
      // Upcasts walk the catalog, so T must be registered.
      detail::EnsureRegistered<U>();
      return ObjectRef{const_cast<U *>(&obj), detail::TypeIdOf<U>()};
    }
  };

  namespace detail
  {
    using StringInterner = NGIN::Utilities::StringInterner<>;

    // Convenience wrappers using the global catalog interner
    NameId InternNameId(std::string_view s) noexcept;
    bool FindNameId(std::string_view s, NameId &out) noexcept;
    std::string_view NameFromId(NameId id) noexcept;

    // Member thunks. All of them receive the object already adjusted to the declaring class.
    using ReadFn = std::expected<std::optional<Any>, Error> (*)(void *);
    using WriteFn = std::expected<void, Error> (*)(void *, const Any &);
    using BoxFn = std::expected<void *, Error> (*)(void *);

    template <class V>
    using NumericReadFn = std::expected<V, Error> (*)(void *);
    template <class V>
    using NumericWriteFn = std::expected<void, Error> (*)(void *, V);

    using NumericReader = std::variant<std::monostate, NumericReadFn<int>, NumericReadFn<std::int64_t>, NumericReadFn<double>>;
    using NumericWriter = std::variant<std::monostate, NumericWriteFn<int>, NumericWriteFn<std::int64_t>, NumericWriteFn<double>>;

    struct FieldRuntimeDesc
    {
      std::string_view name;
      NameId nameId{static_cast<NameId>(-1)};
      const TypeToken *type{nullptr};
      MemberFlags flags{MemberFlags::None};
      ReadFn Load{nullptr};
      WriteFn Store{nullptr};
    };

    struct MethodRuntimeDesc
    {
      std::string_view name;
      NameId nameId{static_cast<NameId>(-1)};
      MemberFlags flags{MemberFlags::None};
      // Observable boxes are described by the box type even when returned by reference or pointer.
      const TypeToken *returnType{nullptr};
      NGIN::Containers::Vector<const TypeToken *> paramTypes;
      // Zero-argument value read. For box-returning methods this reads the boxed value.
      ReadFn Read{nullptr};
      // Single-argument write.
      WriteFn Write{nullptr};
      // Box-returning methods only: write through the box, and the box itself.
      WriteFn BoxWrite{nullptr};
      BoxFn ReadOnlyBox{nullptr};
      BoxFn WritableBox{nullptr};
      // Unboxed paths for int, std::int64_t and double. For box-returning methods the
      // writer stores through the box; otherwise it is the single-argument call.
      NumericReader ReadNumeric{};
      NumericWriter WriteNumeric{};
    };

    struct BaseRuntimeDesc
    {
      NGIN::UInt32 baseClassIndex{static_cast<NGIN::UInt32>(-1)};
      TypeId baseTypeId{0};
      void *(*Upcast)(void *){nullptr};
    };

    struct ClassRuntimeDesc
    {
      std::string_view qualifiedName;
      NameId qualifiedNameId{static_cast<NameId>(-1)};
      TypeId typeId{0};
      NGIN::UIntSize sizeBytes{0};
      bool isInterface{false};
      std::optional<BaseRuntimeDesc> superclass;
      NGIN::Containers::Vector<BaseRuntimeDesc> interfaces;
      NGIN::Containers::Vector<FieldRuntimeDesc> fields;
      NGIN::Containers::Vector<MethodRuntimeDesc> methods;
    };

    struct Catalog
    {
      NGIN::Containers::Vector<ClassRuntimeDesc> classes;
      NGIN::Containers::FlatHashMap<TypeId, NGIN::UInt32> byTypeId;
      NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> byName;

      StringInterner names;
    };

    PROPEL_PROPERTIES_API Catalog &GetCatalog() noexcept;

    // Adjust `object` (an instance of `from`) to its `to` subobject by walking declared
    // supertypes. Returns nullptr when `to` is not reachable from `from`.
    PROPEL_PROPERTIES_API void *UpcastTo(void *object, TypeId from, TypeId to) noexcept;

    // Upcast plus a diagnostic when the object is not of a compatible type.
    PROPEL_PROPERTIES_API std::expected<void *, Error> AdjustTo(const ObjectRef &ref, TypeId declaring);

    PROPEL_PROPERTIES_API const FieldRuntimeDesc &Resolve(FieldHandle h) noexcept;
    PROPEL_PROPERTIES_API const MethodRuntimeDesc &Resolve(MethodHandle h) noexcept;

    template <class T>
    concept HasPropelReflectWithClassBuilder = requires(ClassBuilder<T> &b) {
      // ADL friend should be declared as: friend void PropelReflect(Tag<T>, ClassBuilder<T>&)
      { PropelReflect(Tag<T>{}, b) } -> std::same_as<void>;
    };

    // Detection for Describe<T>::Do(ClassBuilder<T>&)
    template <class, class = void>
    struct HasDescribeImpl : std::false_type
    {
    };
    template <class T>
    struct HasDescribeImpl<T, std::void_t<decltype(Propel::Properties::Describe<T>::Do(std::declval<ClassBuilder<T> &>()))>>
        : std::true_type
    {
    };
    template <class T>
    concept HasDescribeWithClassBuilder = HasDescribeImpl<T>::value;

    // Ensure a class is present; returns the class index
    template <class T>
    NGIN::UInt32 EnsureRegistered()
    {
      using U = std::remove_cvref_t<T>;
      auto &cat = GetCatalog();
      const auto tid = TypeIdOf<U>();
      if (auto *p = cat.byTypeId.GetPtr(tid))
        return *p;

      ClassRuntimeDesc rec{};
      rec.qualifiedNameId = InternNameId(NGIN::Meta::TypeName<U>::qualifiedName);
      rec.qualifiedName = NameFromId(rec.qualifiedNameId);
      rec.typeId = tid;
      rec.sizeBytes = sizeof(U);
      rec.isInterface = std::is_abstract_v<U>;

      const auto idx = static_cast<NGIN::UInt32>(cat.classes.Size());
      cat.classes.PushBack(std::move(rec));
      cat.byTypeId.Insert(tid, idx);
      cat.byName.Insert(cat.classes[idx].qualifiedNameId, idx);

      if constexpr (HasPropelReflectWithClassBuilder<U>)
      {
        ClassBuilder<U> b{idx};
        PropelReflect(Tag<U>{}, b); // ADL: user describes supertypes/fields/methods
      }
      else if constexpr (HasDescribeWithClassBuilder<U>)
      {
        ClassBuilder<U> b{idx};
        Propel::Properties::Describe<U>::Do(b); // Trait fallback, public access only
      }
      return idx;
    }

  } // namespace detail

  class FieldInfo
  {
  public:
    constexpr FieldInfo() = default;
    explicit constexpr FieldInfo(FieldHandle h) : m_h(h) {}

    [[nodiscard]] bool IsValid() const noexcept;
    [[nodiscard]] std::string_view Name() const;
    [[nodiscard]] ClassInfo DeclaringClass() const;
    [[nodiscard]] const TypeToken &Type() const;
    [[nodiscard]] MemberFlags Flags() const;
    [[nodiscard]] bool IsIgnored() const { return HasFlag(Flags(), MemberFlags::Ignored); }

    // Observable fields read and write the boxed value; empty optionals read as nullopt.
    [[nodiscard]] std::expected<std::optional<Any>, Error> Load(const ObjectRef &obj) const;
    [[nodiscard]] std::expected<void, Error> Store(const ObjectRef &obj, const Any &value) const;

    [[nodiscard]] FieldHandle Handle() const noexcept { return m_h; }
    [[nodiscard]] bool operator==(const FieldInfo &other) const noexcept { return m_h == other.m_h; }

  private:
    FieldHandle m_h{};
  };

  class MethodInfo
  {
  public:
    constexpr MethodInfo() = default;
    explicit constexpr MethodInfo(MethodHandle h) : m_h(h) {}

    [[nodiscard]] bool IsValid() const noexcept;
    [[nodiscard]] std::string_view Name() const;
    [[nodiscard]] ClassInfo DeclaringClass() const;
    [[nodiscard]] const TypeToken &ReturnType() const;
    [[nodiscard]] NGIN::UIntSize ParameterCount() const;
    [[nodiscard]] const TypeToken &ParameterType(NGIN::UIntSize i) const;
    [[nodiscard]] MemberFlags Flags() const;
    [[nodiscard]] bool IsAbstract() const { return HasFlag(Flags(), MemberFlags::Abstract); }
    [[nodiscard]] bool IsIgnored() const { return HasFlag(Flags(), MemberFlags::Ignored); }

    // Same name and parameter types.
    [[nodiscard]] bool SameSignature(const MethodInfo &other) const;

    [[nodiscard]] MethodHandle Handle() const noexcept { return m_h; }
    [[nodiscard]] bool operator==(const MethodInfo &other) const noexcept { return m_h == other.m_h; }

  private:
    MethodHandle m_h{};
  };

  class ClassInfo
  {
  public:
    constexpr ClassInfo() = default;
    explicit constexpr ClassInfo(ClassHandle h) : m_h(h) {}

    [[nodiscard]] bool IsValid() const noexcept;
    [[nodiscard]] std::string_view QualifiedName() const;
    [[nodiscard]] TypeId GetTypeId() const;
    [[nodiscard]] NGIN::UIntSize SizeBytes() const;
    [[nodiscard]] bool IsInterface() const;

    [[nodiscard]] std::optional<ClassInfo> Superclass() const;
    [[nodiscard]] NGIN::UIntSize InterfaceCount() const;
    [[nodiscard]] ClassInfo InterfaceAt(NGIN::UIntSize i) const;
    // Superclass first, then interfaces in declaration order.
    [[nodiscard]] std::vector<ClassInfo> DirectSupertypes() const;
    // Reflexive and transitive.
    [[nodiscard]] bool IsSubclassOf(const ClassInfo &other) const;

    [[nodiscard]] NGIN::UIntSize FieldCount() const;
    [[nodiscard]] FieldInfo FieldAt(NGIN::UIntSize i) const;
    [[nodiscard]] NGIN::UIntSize MethodCount() const;
    [[nodiscard]] MethodInfo MethodAt(NGIN::UIntSize i) const;

    // Declared methods plus every inherited method that no nearer declaration overrides.
    // A method reachable through several supertypes appears once.
    [[nodiscard]] std::vector<MethodInfo> VisibleMethods() const;

    [[nodiscard]] ClassHandle Handle() const noexcept { return m_h; }
    [[nodiscard]] bool operator==(const ClassInfo &other) const noexcept { return m_h == other.m_h; }

  private:
    ClassHandle m_h{};
  };

  template <class T>
  [[nodiscard]] inline ClassInfo GetClass()
  {
    auto idx = detail::EnsureRegistered<T>();
    return ClassInfo{ClassHandle{idx}};
  }

  [[nodiscard]] PROPEL_PROPERTIES_API ExpectedClass FindClass(std::string_view qualifiedName);
  [[nodiscard]] PROPEL_PROPERTIES_API ExpectedClass FindClass(TypeId id);

  [[nodiscard]] PROPEL_PROPERTIES_API NGIN::UIntSize ClassCount();

} // namespace Propel::Properties
