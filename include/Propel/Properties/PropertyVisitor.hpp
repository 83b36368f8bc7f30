// PropertyVisitor.hpp
// Double dispatch over descriptor kinds
#pragma once

#include <Propel/Properties/Export.hpp>
#include <Propel/Properties/TypedProperties.hpp>

namespace Propel::Properties
{

  // One callback per descriptor kind. Unhandled kinds are ignored.
  class PropertyVisitor
  {
  public:
    virtual ~PropertyVisitor() = default;

    virtual void VisitInt(const IntProperty &) {}
    virtual void VisitLong(const LongProperty &) {}
    virtual void VisitDouble(const DoubleProperty &) {}
    virtual void VisitObject(const PropertyDescriptor &) {}
    virtual void VisitList(const PropertyDescriptor &) {}
    virtual void VisitSet(const PropertyDescriptor &) {}
    virtual void VisitMap(const PropertyDescriptor &) {}
  };

  PROPEL_PROPERTIES_API void Visit(const DescriptorPtr &descriptor, PropertyVisitor &visitor);

} // namespace Propel::Properties
