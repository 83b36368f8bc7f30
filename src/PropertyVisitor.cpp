#include <Propel/Properties/PropertyVisitor.hpp>

namespace Propel::Properties
{

  void Visit(const DescriptorPtr &descriptor, PropertyVisitor &visitor)
  {
    if (!descriptor)
      return;
    switch (descriptor->Kind())
    {
    case DescriptorKind::Int:
      visitor.VisitInt(IntProperty{descriptor});
      break;
    case DescriptorKind::Long:
      visitor.VisitLong(LongProperty{descriptor});
      break;
    case DescriptorKind::Double:
      visitor.VisitDouble(DoubleProperty{descriptor});
      break;
    case DescriptorKind::Object:
      visitor.VisitObject(*descriptor);
      break;
    case DescriptorKind::List:
      visitor.VisitList(*descriptor);
      break;
    case DescriptorKind::Set:
      visitor.VisitSet(*descriptor);
      break;
    case DescriptorKind::Map:
      visitor.VisitMap(*descriptor);
      break;
    }
  }

} // namespace Propel::Properties
