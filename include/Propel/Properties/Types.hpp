// Types.hpp
// Public-facing error codes, member flags and small handle types
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Utilities/Any.hpp>
#include <NGIN/Containers/Vector.hpp>
#include <exception>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace Propel::Properties
{

  using Any = NGIN::Utilities::Any<>;
  using TypeId = NGIN::UInt64;

  enum class ErrorCode : unsigned
  {
    PropertyNotFound = 1,
    TypeMismatch = 2,
    ReadOnlyViolation = 3,
    WriteOnlyViolation = 4,
    InvocationFailure = 5,
    ConventionViolation = 6,
    DuplicateMember = 7,
    BuildFailed = 8,
    AccessorMissing = 9,
    InvalidArgument = 10,
  };

  [[nodiscard]] constexpr std::string_view ToString(ErrorCode code) noexcept
  {
    switch (code)
    {
    case ErrorCode::PropertyNotFound:
      return "PropertyNotFound";
    case ErrorCode::TypeMismatch:
      return "TypeMismatch";
    case ErrorCode::ReadOnlyViolation:
      return "ReadOnlyViolation";
    case ErrorCode::WriteOnlyViolation:
      return "WriteOnlyViolation";
    case ErrorCode::InvocationFailure:
      return "InvocationFailure";
    case ErrorCode::ConventionViolation:
      return "ConventionViolation";
    case ErrorCode::DuplicateMember:
      return "DuplicateMember";
    case ErrorCode::BuildFailed:
      return "BuildFailed";
    case ErrorCode::AccessorMissing:
      return "AccessorMissing";
    case ErrorCode::InvalidArgument:
      return "InvalidArgument";
    }
    return "Unknown";
  }

  // One entry of an aggregated build failure.
  struct PropertyProblem
  {
    std::string property{};
    ErrorCode code{ErrorCode::BuildFailed};
    std::string message{};
  };

  struct Error
  {
    ErrorCode code{ErrorCode::InvalidArgument};
    std::string message{};
    // Exception raised by user code, if any.
    std::exception_ptr cause{};
    NGIN::Containers::Vector<PropertyProblem> problems{};

    Error() = default;
    Error(ErrorCode c, std::string m) : code(c), message(std::move(m)) {}
    Error(ErrorCode c, std::string m, std::exception_ptr e)
        : code(c), message(std::move(m)), cause(std::move(e))
    {
    }
    Error(ErrorCode c, std::string m, NGIN::Containers::Vector<PropertyProblem> p)
        : code(c), message(std::move(m)), problems(std::move(p))
    {
    }
  };

  enum class MemberFlags : unsigned
  {
    None = 0,
    // Excluded from property discovery; sticky for the member's property name.
    Ignored = 1u << 0,
    // Declared without a body (pure virtual); a concrete member of the same kind replaces it.
    Abstract = 1u << 1,
  };

  [[nodiscard]] constexpr MemberFlags operator|(MemberFlags a, MemberFlags b) noexcept
  {
    return static_cast<MemberFlags>(static_cast<unsigned>(a) | static_cast<unsigned>(b));
  }

  [[nodiscard]] constexpr bool HasFlag(MemberFlags set, MemberFlags flag) noexcept
  {
    return (static_cast<unsigned>(set) & static_cast<unsigned>(flag)) != 0u;
  }

  // Role a method plays for a property.
  enum class MemberKind : unsigned char
  {
    Getter = 0,
    Setter = 1,
    Accessor = 2,
  };

  enum class Mutability : unsigned char
  {
    Read = 1u << 0,
    Write = 1u << 1,
  };

  class MutabilitySet
  {
  public:
    constexpr MutabilitySet() = default;

    constexpr MutabilitySet &Insert(Mutability m) noexcept
    {
      m_bits = static_cast<unsigned char>(m_bits | static_cast<unsigned char>(m));
      return *this;
    }
    [[nodiscard]] constexpr bool Contains(Mutability m) const noexcept
    {
      return (m_bits & static_cast<unsigned char>(m)) != 0u;
    }
    [[nodiscard]] constexpr bool Empty() const noexcept { return m_bits == 0u; }
    [[nodiscard]] constexpr bool operator==(const MutabilitySet &) const noexcept = default;

    // "[Read, Write]", "[Read]", "[Write]" or "[]"
    [[nodiscard]] std::string ToString() const
    {
      std::string out{"["};
      if (Contains(Mutability::Read))
        out += "Read";
      if (Contains(Mutability::Write))
        out += Contains(Mutability::Read) ? ", Write" : "Write";
      out += "]";
      return out;
    }

  private:
    unsigned char m_bits{0};
  };

  // Runtime shape of a property descriptor.
  enum class DescriptorKind : unsigned char
  {
    Int = 0,
    Long = 1,
    Double = 2,
    Object = 3,
    List = 4,
    Set = 5,
    Map = 6,
  };

  [[nodiscard]] constexpr std::string_view ToString(DescriptorKind kind) noexcept
  {
    switch (kind)
    {
    case DescriptorKind::Int:
      return "Int";
    case DescriptorKind::Long:
      return "Long";
    case DescriptorKind::Double:
      return "Double";
    case DescriptorKind::Object:
      return "Object";
    case DescriptorKind::List:
      return "List";
    case DescriptorKind::Set:
      return "Set";
    case DescriptorKind::Map:
      return "Map";
    }
    return "Unknown";
  }

  // Small opaque handles (indices into the append-only catalog).
  struct ClassHandle
  {
    NGIN::UInt32 index{static_cast<NGIN::UInt32>(-1)};
    constexpr bool IsValid() const noexcept { return index != static_cast<NGIN::UInt32>(-1); }
    constexpr bool operator==(const ClassHandle &) const noexcept = default;
  };

  struct FieldHandle
  {
    NGIN::UInt32 classIndex{static_cast<NGIN::UInt32>(-1)};
    NGIN::UInt32 fieldIndex{static_cast<NGIN::UInt32>(-1)};
    constexpr bool IsValid() const noexcept { return classIndex != static_cast<NGIN::UInt32>(-1) && fieldIndex != static_cast<NGIN::UInt32>(-1); }
    constexpr bool operator==(const FieldHandle &) const noexcept = default;
  };

  struct MethodHandle
  {
    NGIN::UInt32 classIndex{static_cast<NGIN::UInt32>(-1)};
    NGIN::UInt32 methodIndex{static_cast<NGIN::UInt32>(-1)};
    constexpr bool IsValid() const noexcept { return classIndex != static_cast<NGIN::UInt32>(-1) && methodIndex != static_cast<NGIN::UInt32>(-1); }
    constexpr bool operator==(const MethodHandle &) const noexcept = default;
  };

  // Forward decls of high-level wrappers
  class ClassInfo;
  class FieldInfo;
  class MethodInfo;
  class PropertyDescriptor;
  class PropertyRegistry;
  class RegistryCache;
  class RegistryBuilder;

  using ExpectedClass = std::expected<ClassInfo, Error>;

} // namespace Propel::Properties
