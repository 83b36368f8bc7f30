// ClassBuilder.hpp
// Public ClassBuilder<T> used inside the ADL friend to describe supertypes, fields and methods
#pragma once

#include <NGIN/Primitives.hpp>

#include <exception>
#include <expected>
#include <optional>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

#include <Propel/Properties/Catalog.hpp>
#include <Propel/Properties/Convert.hpp>
#include <Propel/Properties/Logging.hpp>
#include <Propel/Properties/NameUtils.hpp>
#include <Propel/Properties/Observable.hpp>

namespace Propel::Properties
{

  template <class T>
  class ClassBuilder
  {
  public:
    // Note: constructed by the catalog when invoking ADL reflect; binds to a specific class index.
    explicit ClassBuilder(NGIN::UInt32 classIndex) : m_index(classIndex) {}

    // Optional name override. If not set, defaults to Meta::TypeName<T>.
    ClassBuilder &Name(std::string_view qualified)
    {
      auto &cat = detail::GetCatalog();
      auto id = detail::InternNameId(qualified);
      cat.classes[m_index].qualifiedNameId = id;
      cat.classes[m_index].qualifiedName = detail::NameFromId(id);
      cat.byName.Insert(id, m_index);
      return *this;
    }

    // Declare the direct superclass. At most one; a later call replaces the earlier one.
    template <class B>
    ClassBuilder &Superclass();

    // Declare a directly implemented interface.
    template <class I>
    ClassBuilder &Interface();

    // Add a data member; name optional and auto-derived if omitted.
    template <auto MemberPtr>
    ClassBuilder &Field(std::string_view name = {}, MemberFlags flags = MemberFlags::None);

    // Add a const/non-const member method. Name required.
    template <auto MemFn>
    ClassBuilder &Method(std::string_view name, MemberFlags flags = MemberFlags::None);

  private:
    NGIN::UInt32 m_index{0};
  };

  namespace detail
  {
    // Traits for pointer-to-member decomposition
    template <class M>
    struct MemberPtrTraits;
    template <class C, class M>
    struct MemberPtrTraits<M C::*>
    {
      using Class = C;
      using Member = M;
    };

    template <auto MemberPtr>
    using MemberClassT = typename MemberPtrTraits<decltype(MemberPtr)>::Class;

    template <auto MemberPtr>
    using MemberTypeT = typename MemberPtrTraits<decltype(MemberPtr)>::Member;

    template <typename>
    struct MethodTraits;

    template <class C, class R, class... A>
    struct MethodTraits<R (C::*)(A...)>
    {
      using Class = C;
      using Object = C;
      using Ret = R;
      using Args = std::tuple<A...>;
      static constexpr NGIN::UIntSize Arity = sizeof...(A);
    };

    template <class C, class R, class... A>
    struct MethodTraits<R (C::*)(A...) const>
    {
      using Class = C;
      using Object = const C;
      using Ret = R;
      using Args = std::tuple<A...>;
      static constexpr NGIN::UIntSize Arity = sizeof...(A);
    };

    template <class C, class R, class... A>
    struct MethodTraits<R (C::*)(A...) noexcept> : MethodTraits<R (C::*)(A...)>
    {
    };

    template <class C, class R, class... A>
    struct MethodTraits<R (C::*)(A...) const noexcept> : MethodTraits<R (C::*)(A...) const>
    {
    };

    // How a method hands back its result: by value, or as a reference/pointer to an observable box.
    template <class R>
    struct ReturnShape
    {
      using Pointee = std::remove_reference_t<std::remove_pointer_t<std::remove_reference_t<R>>>;
      using Box = std::remove_cv_t<Pointee>;
      static constexpr bool IsBox = (std::is_reference_v<R> || std::is_pointer_v<R>) && IsReadOnlyObservableV<Box>;
      static constexpr bool IsWritableBox = IsBox && IsObservableV<Box> && !std::is_const_v<Pointee>;
    };

    template <class B>
    inline B *BoxAddress(B &box) noexcept
    {
      return &box;
    }

    template <class B>
    inline B *BoxAddress(B *box) noexcept
    {
      return box;
    }

    inline Error Threw(std::string_view what)
    {
      return Error{ErrorCode::InvocationFailure, std::string{what}, std::current_exception()};
    }

    template <class N>
    inline constexpr bool is_fast_numeric_v = std::is_same_v<N, int> || std::is_same_v<N, std::int64_t> || std::is_same_v<N, double>;

    template <class D, class B>
    void *UpcastThunk(void *p)
    {
      return static_cast<void *>(static_cast<B *>(static_cast<D *>(p)));
    }

    template <auto MemberPtr>
    struct FieldThunks
    {
      using C = MemberClassT<MemberPtr>;
      using M = MemberTypeT<MemberPtr>;
      using V = std::remove_cv_t<M>;

      static constexpr bool IsBox = IsReadOnlyObservableV<V>;
      static constexpr bool CanLoad = IsBox || (std::is_copy_constructible_v<V> && !std::is_array_v<V>);
      static constexpr bool CanStore = !std::is_const_v<M> && (IsBox ? IsObservableV<V> : (std::is_copy_assignable_v<V> && !std::is_array_v<V>));

      static std::expected<std::optional<Any>, Error> Load(void *obj)
      {
        const auto &member = static_cast<const C *>(obj)->*MemberPtr;
        try
        {
          if constexpr (IsBox)
          {
            return std::optional<Any>{Any{member.GetValue()}};
          }
          else if constexpr (Adapters::is_optional_v<V>)
          {
            if (!member.has_value())
              return std::optional<Any>{};
            return std::optional<Any>{Any{*member}};
          }
          else
          {
            return std::optional<Any>{Any{static_cast<const V &>(member)}};
          }
        }
        catch (...)
        {
          return std::unexpected(Threw("field read threw"));
        }
      }

      static std::expected<void, Error> Store(void *obj, const Any &value)
      {
        auto &member = static_cast<C *>(obj)->*MemberPtr;
        if constexpr (IsBox)
        {
          auto converted = ConvertAny<typename ObservableTraits<V>::Value>(value);
          if (!converted)
            return std::unexpected(converted.error());
          try
          {
            member.SetValue(std::move(*converted));
          }
          catch (...)
          {
            return std::unexpected(Threw("field write threw"));
          }
        }
        else
        {
          auto converted = ConvertAny<V>(value);
          if (!converted)
            return std::unexpected(converted.error());
          try
          {
            member = std::move(*converted);
          }
          catch (...)
          {
            return std::unexpected(Threw("field write threw"));
          }
        }
        return {};
      }
    };

    template <class Tuple>
    struct FirstParam
    {
      using type = void;
    };
    template <class A0, class... Rest>
    struct FirstParam<std::tuple<A0, Rest...>>
    {
      using type = A0;
    };

    template <auto MemFn>
    struct MethodThunks
    {
      using Traits = MethodTraits<decltype(MemFn)>;
      using Object = typename Traits::Object;
      using R = typename Traits::Ret;
      using Shape = ReturnShape<R>;
      using Result = std::remove_cvref_t<R>;

      static_assert(Shape::IsBox || !IsReadOnlyObservableV<Result>,
                    "observable boxes must be returned by reference or pointer");

      // Value a zero-argument call produces once boxes and optionals are looked through.
      template <class X, bool Box = Shape::IsBox, bool Opt = Adapters::is_optional_v<X>>
      struct ValueOf
      {
        using type = X;
      };
      template <class X, bool Opt>
      struct ValueOf<X, true, Opt>
      {
        using type = typename ObservableTraits<typename Shape::Box>::Value;
      };
      template <class X>
      struct ValueOf<X, false, true>
      {
        using type = typename Adapters::is_optional<X>::value_type;
      };
      using Value = typename ValueOf<Result>::type;

      static const TypeToken &ReturnToken()
      {
        if constexpr (Shape::IsWritableBox)
          return TokenOf<typename Shape::Box>();
        else if constexpr (Shape::IsBox)
          return TokenOf<ReadOnlyObservable<Value>>();
        else
          return TokenOf<R>();
      }

      static auto *Box(void *obj)
      {
        auto *self = static_cast<Object *>(obj);
        return BoxAddress((self->*MemFn)());
      }

      static std::expected<std::optional<Any>, Error> Read(void *obj)
      {
        try
        {
          if constexpr (Shape::IsBox)
          {
            auto *box = Box(obj);
            if (box == nullptr)
              return std::unexpected(Error{ErrorCode::InvocationFailure, "accessor returned no observable"});
            return std::optional<Any>{Any{box->GetValue()}};
          }
          else
          {
            auto *self = static_cast<Object *>(obj);
            Result r = (self->*MemFn)();
            if constexpr (Adapters::is_optional_v<Result>)
            {
              if (!r.has_value())
                return std::optional<Any>{};
              return std::optional<Any>{Any{std::move(*r)}};
            }
            else
            {
              return std::optional<Any>{Any{std::move(r)}};
            }
          }
        }
        catch (...)
        {
          return std::unexpected(Threw("getter threw"));
        }
      }

      template <class N>
      static std::expected<N, Error> ReadAs(void *obj)
      {
        try
        {
          if constexpr (Shape::IsBox)
          {
            auto *box = Box(obj);
            if (box == nullptr)
              return std::unexpected(Error{ErrorCode::InvocationFailure, "accessor returned no observable"});
            return box->GetValue();
          }
          else
          {
            auto *self = static_cast<Object *>(obj);
            return (self->*MemFn)();
          }
        }
        catch (...)
        {
          return std::unexpected(Threw("getter threw"));
        }
      }

      static std::expected<void, Error> BoxWrite(void *obj, const Any &value)
      {
        auto converted = ConvertAny<Value>(value);
        if (!converted)
          return std::unexpected(converted.error());
        try
        {
          auto *box = Box(obj);
          if (box == nullptr)
            return std::unexpected(Error{ErrorCode::InvocationFailure, "accessor returned no observable"});
          box->SetValue(std::move(*converted));
          return {};
        }
        catch (...)
        {
          return std::unexpected(Threw("observable write threw"));
        }
      }

      template <class N>
      static std::expected<void, Error> BoxWriteAs(void *obj, N value)
      {
        try
        {
          auto *box = Box(obj);
          if (box == nullptr)
            return std::unexpected(Error{ErrorCode::InvocationFailure, "accessor returned no observable"});
          box->SetValue(value);
          return {};
        }
        catch (...)
        {
          return std::unexpected(Threw("observable write threw"));
        }
      }

      static std::expected<void *, Error> ReadOnlyBox(void *obj)
      {
        try
        {
          auto *box = Box(obj);
          if (box == nullptr)
            return std::unexpected(Error{ErrorCode::InvocationFailure, "accessor returned no observable"});
          const ReadOnlyObservable<Value> *base = box;
          return const_cast<void *>(static_cast<const void *>(base));
        }
        catch (...)
        {
          return std::unexpected(Threw("accessor threw"));
        }
      }

      static std::expected<void *, Error> WritableBox(void *obj)
      {
        try
        {
          auto *box = Box(obj);
          if (box == nullptr)
            return std::unexpected(Error{ErrorCode::InvocationFailure, "accessor returned no observable"});
          Observable<Value> *base = box;
          return static_cast<void *>(base);
        }
        catch (...)
        {
          return std::unexpected(Threw("accessor threw"));
        }
      }

      using Param = typename FirstParam<typename Traits::Args>::type;
      using ParamValue = std::remove_cvref_t<Param>;

      static std::expected<void, Error> Write(void *obj, const Any &value)
      {
        auto converted = ConvertAny<ParamValue>(value);
        if (!converted)
          return std::unexpected(converted.error());
        try
        {
          auto *self = static_cast<Object *>(obj);
          ParamValue arg = std::move(*converted);
          if constexpr (std::is_rvalue_reference_v<Param>)
            (self->*MemFn)(std::move(arg));
          else
            (self->*MemFn)(arg);
          return {};
        }
        catch (...)
        {
          return std::unexpected(Threw("setter threw"));
        }
      }

      template <class N>
      static std::expected<void, Error> WriteAs(void *obj, N value)
      {
        try
        {
          auto *self = static_cast<Object *>(obj);
          (self->*MemFn)(value);
          return {};
        }
        catch (...)
        {
          return std::unexpected(Threw("setter threw"));
        }
      }

      static void Fill(MethodRuntimeDesc &m)
      {
        m.returnType = &ReturnToken();
        if constexpr (Traits::Arity > 0)
        {
          [&]<std::size_t... I>(std::index_sequence<I...>)
          {
            (m.paramTypes.PushBack(&TokenOf<std::tuple_element_t<I, typename Traits::Args>>()), ...);
          }(std::make_index_sequence<Traits::Arity>{});
        }

        if constexpr (Traits::Arity == 0 && Shape::IsBox)
        {
          m.Read = &Read;
          m.ReadOnlyBox = &ReadOnlyBox;
          if constexpr (is_fast_numeric_v<Value>)
            m.ReadNumeric = &ReadAs<Value>;
          if constexpr (Shape::IsWritableBox)
          {
            m.BoxWrite = &BoxWrite;
            m.WritableBox = &WritableBox;
            if constexpr (is_fast_numeric_v<Value>)
              m.WriteNumeric = &BoxWriteAs<Value>;
          }
        }
        else if constexpr (Traits::Arity == 0 && !std::is_void_v<R>)
        {
          if constexpr (std::is_copy_constructible_v<Result>)
            m.Read = &Read;
          if constexpr (is_fast_numeric_v<Result>)
            m.ReadNumeric = &ReadAs<Result>;
        }
        else if constexpr (Traits::Arity == 1)
        {
          if constexpr (std::is_copy_constructible_v<ParamValue>)
            m.Write = &Write;
          if constexpr (is_fast_numeric_v<ParamValue>)
            m.WriteNumeric = &WriteAs<ParamValue>;
        }
      }
    };
  } // namespace detail

  template <class T>
  template <class B>
  inline ClassBuilder<T> &ClassBuilder<T>::Superclass()
  {
    static_assert(std::is_base_of_v<B, T> && !std::is_same_v<B, T>, "Superclass must be a base of T");
    const auto baseIdx = detail::EnsureRegistered<B>();
    auto &cat = detail::GetCatalog();
    if (cat.classes[m_index].superclass && cat.classes[m_index].superclass->baseTypeId != detail::TypeIdOf<B>())
    {
      detail::Log().warn("{}: superclass {} replaces {}", cat.classes[m_index].qualifiedName,
                         cat.classes[baseIdx].qualifiedName,
                         cat.classes[cat.classes[m_index].superclass->baseClassIndex].qualifiedName);
    }
    cat.classes[m_index].superclass = detail::BaseRuntimeDesc{baseIdx, detail::TypeIdOf<B>(), &detail::UpcastThunk<T, B>};
    return *this;
  }

  template <class T>
  template <class I>
  inline ClassBuilder<T> &ClassBuilder<T>::Interface()
  {
    static_assert(std::is_base_of_v<I, T> && !std::is_same_v<I, T>, "Interface must be a base of T");
    const auto baseIdx = detail::EnsureRegistered<I>();
    auto &cat = detail::GetCatalog();
    cat.classes[m_index].interfaces.PushBack(detail::BaseRuntimeDesc{baseIdx, detail::TypeIdOf<I>(), &detail::UpcastThunk<T, I>});
    return *this;
  }

  template <class T>
  template <auto MemberPtr>
  inline ClassBuilder<T> &ClassBuilder<T>::Field(std::string_view name, MemberFlags flags)
  {
    using Thunks = detail::FieldThunks<MemberPtr>;
    static_assert(std::is_same_v<typename Thunks::C, T>, "Field must belong to T");
    auto &cat = detail::GetCatalog();
    detail::FieldRuntimeDesc f{};
    {
      auto svName = name.empty() ? detail::MemberName<MemberPtr>() : name;
      auto id = detail::InternNameId(svName);
      f.nameId = id;
      f.name = detail::NameFromId(id);
    }
    f.type = &TokenOf<typename Thunks::V>();
    f.flags = flags;
    if constexpr (Thunks::CanLoad)
      f.Load = &Thunks::Load;
    if constexpr (Thunks::CanStore)
      f.Store = &Thunks::Store;
    cat.classes[m_index].fields.PushBack(std::move(f));
    return *this;
  }

  template <class T>
  template <auto MemFn>
  inline ClassBuilder<T> &ClassBuilder<T>::Method(std::string_view name, MemberFlags flags)
  {
    using Thunks = detail::MethodThunks<MemFn>;
    static_assert(std::is_same_v<typename Thunks::Traits::Class, T>, "Method must belong to T");
    auto &cat = detail::GetCatalog();
    detail::MethodRuntimeDesc m{};
    auto nameId = detail::InternNameId(name);
    m.name = detail::NameFromId(nameId);
    m.nameId = nameId;
    m.flags = flags;
    Thunks::Fill(m);
    cat.classes[m_index].methods.PushBack(std::move(m));
    return *this;
  }

} // namespace Propel::Properties
