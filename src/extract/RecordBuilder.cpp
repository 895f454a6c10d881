//===----------------------------------------------------------------------===//
//
// Part of the Scour project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/extract/RecordBuilder.cpp
// Purpose: Field selection and validation for each entity category.
// Key invariants: Only fields named by the category layout are consulted.
// Ownership/Lifetime: Stateless.
// Links: src/extract/RecordBuilder.hpp
//
//===----------------------------------------------------------------------===//

#include "extract/RecordBuilder.hpp"

#include "extract/ArgumentDecomposer.hpp"
#include "extract/FieldExtractors.hpp"

#include <string>

namespace scour::extract
{

namespace
{

support::Diag discard(std::string message)
{
    return support::makeError({}, std::move(message));
}

std::optional<std::string> requiredName(const DecomposedCall &call,
                                        std::optional<std::size_t> index,
                                        const config::PatternRegistry &registry)
{
    auto name = extractName(call.fields, index, registry.namePatches, registry.sentinel);
    if (name && name->empty())
        return std::nullopt;
    return name;
}

} // namespace

support::Expected<model::Function> buildFunction(std::string_view statement,
                                                 const config::CategoryPattern &pattern,
                                                 const config::PatternRegistry &registry)
{
    const config::FieldLayout &layout = pattern.layout;
    const DecomposedCall call = decomposeCall(statement, layout, registry);

    auto name = requiredName(call, layout.name, registry);
    if (!name)
        return discard("registration without a function name");

    model::Function fn;
    fn.name = std::move(*name);
    if (pattern.category == config::Category::TypeMethod)
    {
        auto type = requiredName(call, layout.typeName, registry);
        if (!type)
            return discard("method '" + fn.name + "' has no owning type");
        fn.typeName = std::move(*type);
    }

    auto minArgs = extractInt(call.fields, layout.minArgs);
    auto maxArgs = extractInt(call.fields, layout.maxArgs);
    if (!minArgs || !maxArgs)
        return discard("'" + fn.name + "' has a non-numeric argument count");
    if (*minArgs > *maxArgs)
        return discard("'" + fn.name + "' accepts more minimum than maximum arguments");

    fn.minArgs = *minArgs;
    fn.maxArgs = *maxArgs;
    fn.address = extractAddress(call.fields, layout.address);
    if (call.hasDescription)
        fn.description = call.description;
    return fn;
}

support::Expected<model::GlobalVariable> buildGlobalValue(std::string_view statement,
                                                          const config::CategoryPattern &pattern,
                                                          const config::PatternRegistry &registry)
{
    const config::FieldLayout &layout = pattern.layout;
    const DecomposedCall call = decomposeCall(statement, layout, registry);

    auto name = requiredName(call, layout.name, registry);
    if (!name)
        return discard("global value without a name");

    auto typeCode = extractInt(call.fields, layout.typeCode);
    if (!typeCode)
        return discard("global value '" + *name + "' has a non-numeric type code");

    model::GlobalVariable value;
    value.name = std::move(*name);
    value.typeCode = *typeCode;
    value.address = extractAddress(call.fields, layout.address);
    return value;
}

support::Expected<model::Property> buildProperty(std::string_view statement,
                                                 const config::CategoryPattern &pattern,
                                                 const config::PatternRegistry &registry)
{
    const config::FieldLayout &layout = pattern.layout;
    const DecomposedCall call = decomposeCall(statement, layout, registry);

    auto name = requiredName(call, layout.name, registry);
    if (!name)
        return discard("datablock field without a name");
    return model::Property(std::move(*name), extractAddress(call.fields, layout.address));
}

} // namespace scour::extract
