//===----------------------------------------------------------------------===//
//
// Part of the Scour project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/scour/model/Catalog.hpp
// Purpose: Declare the engine entity model reconstructed from a decompiled
//          corpus: functions, type-bound methods, global values and datablocks.
// Key invariants: Names are trimmed literal text; addresses are bare uppercase
//                 hex; a finished Catalog is never mutated.
// Ownership/Lifetime: Catalog owns every entity by value.
// Links: src/extract/CatalogAssembler.hpp, src/render/DokuWikiRenderer.hpp
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief The read-only entity catalog handed from extraction to rendering.
/// @details Entities are plain value types.  The catalog can only be filled by
///          the CatalogAssembler; renderers see const accessors only and never
///          interpret corpus text again.

#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace scour::extract
{
class CatalogAssembler;
} // namespace scour::extract

namespace scour::model
{

/// @brief Type name carried by every datablock property until property types
///        are inferred from the registration call.
inline constexpr std::string_view kUnresolvedPropertyType = "<unresolved>";

/// @brief Attributes shared by every extracted entity.
struct EngineComponent
{
    std::string name;                       ///< Literal name from the registration call.
    std::optional<std::string> address;     ///< Bare uppercase hex address.
    std::optional<std::string> typeName;    ///< Owning or declared type.
    std::optional<std::string> description; ///< Usage text, semicolons restored.

    bool operator==(const EngineComponent &) const = default;
};

/// @brief A console function, global or bound to an object type.
/// @invariant minArgs <= maxArgs.
struct Function : EngineComponent
{
    int minArgs = 0;
    int maxArgs = 0;

    /// @brief True when the function is a method of typeName.
    [[nodiscard]] bool isMethod() const
    {
        return typeName.has_value();
    }

    bool operator==(const Function &) const = default;
};

/// @brief A process-wide variable exposed to scripts.
struct GlobalVariable : EngineComponent
{
    /// Primitive type code as registered; labelled by the renderer.
    int typeCode = 0;

    bool operator==(const GlobalVariable &) const = default;
};

/// @brief A static field registered on a datablock type.
struct Property : EngineComponent
{
    Property() = default;

    Property(std::string propertyName, std::optional<std::string> offset)
    {
        name = std::move(propertyName);
        address = std::move(offset);
        typeName = std::string(kUnresolvedPropertyType);
    }

    /// @brief False while the type is the unresolved marker.
    [[nodiscard]] bool typeResolved() const
    {
        return typeName && *typeName != kUnresolvedPropertyType;
    }

    bool operator==(const Property &) const = default;
};

/// @brief A datablock record type and its registered fields.
struct Datablock : EngineComponent
{
    std::map<std::string, Property> properties;

    [[nodiscard]] const Property *findProperty(std::string_view propertyName) const;

    bool operator==(const Datablock &) const = default;
};

/// @brief The finished, immutable result of one extraction run.
class Catalog
{
  public:
    using MethodMap = std::map<std::string, std::vector<Function>>;
    using DatablockMap = std::map<std::string, Datablock>;

    /// @brief Global functions in corpus order.
    [[nodiscard]] const std::vector<Function> &globalFunctions() const
    {
        return globalFunctions_;
    }

    [[nodiscard]] std::size_t globalFunctionCount() const
    {
        return globalFunctions_.size();
    }

    /// @brief Type-bound methods grouped by owning type, corpus order per type.
    [[nodiscard]] const MethodMap &typeMethods() const
    {
        return typeMethods_;
    }

    /// @brief Number of methods registered for @p typeName, 0 if unknown.
    [[nodiscard]] std::size_t typeMethodCount(std::string_view typeName) const;

    /// @brief Grand total of type-bound methods over all types.
    [[nodiscard]] std::size_t typeMethodTotal() const
    {
        return typeMethodTotal_;
    }

    /// @brief Global values in corpus order.
    [[nodiscard]] const std::vector<GlobalVariable> &globalValues() const
    {
        return globalValues_;
    }

    /// @brief Datablocks keyed by resolved type name.
    [[nodiscard]] const DatablockMap &datablocks() const
    {
        return datablocks_;
    }

    [[nodiscard]] const Datablock *findDatablock(std::string_view typeName) const;

    bool operator==(const Catalog &) const = default;

  private:
    friend class scour::extract::CatalogAssembler;

    std::vector<Function> globalFunctions_;
    MethodMap typeMethods_;
    std::map<std::string, std::size_t> typeMethodCounts_;
    std::size_t typeMethodTotal_ = 0;
    std::vector<GlobalVariable> globalValues_;
    DatablockMap datablocks_;
};

} // namespace scour::model
