#pragma once

#include <string_view>

#include <Propel/Properties/Export.hpp>
#include <Propel/Properties/Types.hpp>
#include <Propel/Properties/TypeToken.hpp>
#include <Propel/Properties/Observable.hpp>
#include <Propel/Properties/Catalog.hpp>
#include <Propel/Properties/ClassBuilder.hpp>
#include <Propel/Properties/Conventions.hpp>
#include <Propel/Properties/PropertyDescriptor.hpp>
#include <Propel/Properties/TypedProperties.hpp>
#include <Propel/Properties/PropertyVisitor.hpp>
#include <Propel/Properties/PropertyRegistry.hpp>
#include <Propel/Properties/RegistryBuilder.hpp>
#include <Propel/Properties/Logging.hpp>

namespace Propel::Properties
{

    // For quick sanity checks / examples.
    [[nodiscard]] constexpr std::string_view LibraryName() noexcept { return "Propel.Properties"; }

} // namespace Propel::Properties
