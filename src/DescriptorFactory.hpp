// DescriptorFactory.hpp
// Classifies a resolved value type and binds the matching access strategy
#pragma once

#include <string>

#include <Propel/Properties/PropertyDescriptor.hpp>

namespace Propel::Properties::detail
{

  // Where a descriptor's read or write is routed.
  enum class FunctionLocation : unsigned char
  {
    None = 0,
    Getter,
    Setter,
    Accessor,
  };

  struct DescriptorInputs
  {
    std::string name;
    ClassInfo base;
    // Already unwrapped from Optional and observable boxes.
    const TypeToken *valueType{nullptr};
    PropertyDescriptor::Members members;
  };

  // Read if a getter or accessor exists; Write if a setter exists or the accessor box is writable.
  [[nodiscard]] MutabilitySet ClassifyMutability(const PropertyDescriptor::Members &members);

  [[nodiscard]] FunctionLocation ReadLocation(const PropertyDescriptor::Members &members, MutabilitySet mutability);
  [[nodiscard]] FunctionLocation WriteLocation(const PropertyDescriptor::Members &members, MutabilitySet mutability);

  [[nodiscard]] DescriptorPtr MakeDescriptor(DescriptorInputs inputs);

} // namespace Propel::Properties::detail
