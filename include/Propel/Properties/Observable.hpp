// Observable.hpp
// Observable value boxes returned by "...Property" accessors
#pragma once

#include <type_traits>
#include <utility>

namespace Propel::Properties
{

  // Readable box around a value of type V.
  template <class V>
  class ReadOnlyObservable
  {
  public:
    using value_type = V;

    virtual ~ReadOnlyObservable() = default;

    [[nodiscard]] virtual V GetValue() const = 0;
  };

  // Readable and writable box around a value of type V.
  template <class V>
  class Observable : public ReadOnlyObservable<V>
  {
  public:
    virtual void SetValue(V value) = 0;
  };

  // Plain storage-backed box.
  template <class V>
  class SimpleObservable final : public Observable<V>
  {
  public:
    SimpleObservable() = default;
    explicit SimpleObservable(V initial) : m_value(std::move(initial)) {}

    [[nodiscard]] V GetValue() const override { return m_value; }
    void SetValue(V value) override { m_value = std::move(value); }

  private:
    V m_value{};
  };

  // Classifies box types. Recognized boxes derive from ReadOnlyObservable<value_type>.
  template <class Box, class = void>
  struct ObservableTraits
  {
    static constexpr bool IsReadOnlyObservable = false;
    static constexpr bool IsObservable = false;
  };

  template <class Box>
  struct ObservableTraits<Box, std::enable_if_t<std::is_base_of_v<ReadOnlyObservable<typename Box::value_type>, Box>>>
  {
    using Value = typename Box::value_type;
    static constexpr bool IsReadOnlyObservable = true;
    static constexpr bool IsObservable = std::is_base_of_v<Observable<Value>, Box>;
  };

  template <class Box>
  inline constexpr bool IsReadOnlyObservableV = ObservableTraits<std::remove_cvref_t<Box>>::IsReadOnlyObservable;

  template <class Box>
  inline constexpr bool IsObservableV = ObservableTraits<std::remove_cvref_t<Box>>::IsObservable;

} // namespace Propel::Properties
