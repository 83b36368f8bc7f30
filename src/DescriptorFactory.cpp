#include "DescriptorFactory.hpp"

#include <utility>

namespace Propel::Properties::detail
{

  namespace
  {
    TypeId OwnerOf(const MethodInfo &m)
    {
      return m.DeclaringClass().GetTypeId();
    }

    Bound<ReadFn> BindRead(const PropertyDescriptor::Members &members, FunctionLocation where)
    {
      switch (where)
      {
      case FunctionLocation::Getter:
        return {Resolve(members.getter->Handle()).Read, OwnerOf(*members.getter)};
      case FunctionLocation::Accessor:
        return {Resolve(members.accessor->Handle()).Read, OwnerOf(*members.accessor)};
      default:
        return {};
      }
    }

    Bound<WriteFn> BindWrite(const PropertyDescriptor::Members &members, FunctionLocation where)
    {
      switch (where)
      {
      case FunctionLocation::Setter:
        return {Resolve(members.setter->Handle()).Write, OwnerOf(*members.setter)};
      case FunctionLocation::Accessor:
        return {Resolve(members.accessor->Handle()).BoxWrite, OwnerOf(*members.accessor)};
      default:
        return {};
      }
    }

    const MethodInfo *MethodAt(const PropertyDescriptor::Members &members, FunctionLocation where)
    {
      switch (where)
      {
      case FunctionLocation::Getter:
        return &*members.getter;
      case FunctionLocation::Setter:
        return &*members.setter;
      case FunctionLocation::Accessor:
        return &*members.accessor;
      default:
        return nullptr;
      }
    }

    template <class V>
    PrimitiveAccess<V> BindPrimitive(const PropertyDescriptor::Members &members, FunctionLocation readAt, FunctionLocation writeAt)
    {
      PrimitiveAccess<V> a{};
      a.boxedRead = BindRead(members, readAt);
      a.boxedWrite = BindWrite(members, writeAt);
      if (const auto *m = MethodAt(members, readAt))
      {
        if (const auto *fn = std::get_if<NumericReadFn<V>>(&Resolve(m->Handle()).ReadNumeric))
          a.read = {*fn, OwnerOf(*m)};
      }
      if (const auto *m = MethodAt(members, writeAt))
      {
        if (const auto *fn = std::get_if<NumericWriteFn<V>>(&Resolve(m->Handle()).WriteNumeric))
          a.write = {*fn, OwnerOf(*m)};
      }
      return a;
    }

    BoxAccess BindBoxes(const PropertyDescriptor::Members &members)
    {
      BoxAccess box{};
      if (!members.accessor)
        return box;
      const auto &m = Resolve(members.accessor->Handle());
      const auto owner = OwnerOf(*members.accessor);
      box.readOnly = {m.ReadOnlyBox, owner};
      box.writable = {m.WritableBox, owner};
      box.value = members.accessor->ReturnType().value;
      return box;
    }
  } // namespace

  MutabilitySet ClassifyMutability(const PropertyDescriptor::Members &members)
  {
    MutabilitySet out{};
    if (members.getter || members.accessor)
      out.Insert(Mutability::Read);
    if (members.setter || (members.accessor && IsObservable(members.accessor->ReturnType())))
      out.Insert(Mutability::Write);
    return out;
  }

  FunctionLocation ReadLocation(const PropertyDescriptor::Members &members, MutabilitySet mutability)
  {
    if (!mutability.Contains(Mutability::Read))
      return FunctionLocation::None;
    if (members.getter)
      return FunctionLocation::Getter;
    if (members.accessor)
      return FunctionLocation::Accessor;
    return FunctionLocation::None;
  }

  FunctionLocation WriteLocation(const PropertyDescriptor::Members &members, MutabilitySet mutability)
  {
    if (!mutability.Contains(Mutability::Write))
      return FunctionLocation::None;
    if (members.setter)
      return FunctionLocation::Setter;
    if (members.accessor)
      return FunctionLocation::Accessor;
    return FunctionLocation::None;
  }

  DescriptorPtr MakeDescriptor(DescriptorInputs inputs)
  {
    const auto mutability = ClassifyMutability(inputs.members);
    const auto readAt = ReadLocation(inputs.members, mutability);
    const auto writeAt = WriteLocation(inputs.members, mutability);
    const auto &type = *inputs.valueType;

    Access access{ObjectAccess{}};
    switch (type.category)
    {
    case TypeCategory::Int:
      access = BindPrimitive<int>(inputs.members, readAt, writeAt);
      break;
    case TypeCategory::Long:
      access = BindPrimitive<std::int64_t>(inputs.members, readAt, writeAt);
      break;
    case TypeCategory::Double:
      access = BindPrimitive<double>(inputs.members, readAt, writeAt);
      break;
    case TypeCategory::List:
      access = ListAccess{ObjectAccess{BindRead(inputs.members, readAt), BindWrite(inputs.members, writeAt)},
                          BindBoxes(inputs.members), type.element};
      break;
    case TypeCategory::Set:
      access = SetAccess{ObjectAccess{BindRead(inputs.members, readAt), BindWrite(inputs.members, writeAt)},
                         BindBoxes(inputs.members), type.element};
      break;
    case TypeCategory::Map:
      access = MapAccess{ObjectAccess{BindRead(inputs.members, readAt), BindWrite(inputs.members, writeAt)},
                         BindBoxes(inputs.members), type.key, type.value};
      break;
    default:
      access = ObjectAccess{BindRead(inputs.members, readAt), BindWrite(inputs.members, writeAt)};
      break;
    }

    return std::make_shared<const PropertyDescriptor>(std::move(inputs.name), inputs.base, type, std::move(inputs.members),
                                                      mutability, std::move(access));
  }

} // namespace Propel::Properties::detail
