//===----------------------------------------------------------------------===//
//
// Part of the Scour project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/render/DokuWikiRenderer.cpp
// Purpose: DokuWiki page writer.
// Key invariants: Argument counts are printed minus one because the engine
//                 counts the callee name as an argument.
// Ownership/Lifetime: Stateless.
// Links: src/render/DokuWikiRenderer.hpp
//
//===----------------------------------------------------------------------===//

#include "render/DokuWikiRenderer.hpp"

namespace scour::render
{

namespace
{

bool contains(const std::string &text, const char *word)
{
    return text.find(word) != std::string::npos;
}

std::string orUnknown(const std::optional<std::string> &value)
{
    return value ? *value : std::string("<Unknown>");
}

void writeFunction(std::ostream &os, const model::Function &fn)
{
    os << "=== " << fn.name << " ===\n"
       << "Address in Executable: 0x" << orUnknown(fn.address) << "\n\n"
       << "Description: " << fn.description.value_or("") << "\n\n"
       << "Minimum Arguments: " << fn.minArgs - 1 << "\n\n"
       << "Maximum Arguments: " << fn.maxArgs - 1 << "\n";
}

void writeFunctionList(std::ostream &os,
                       const char *heading,
                       const std::vector<const model::Function *> &functions)
{
    os << heading << " (" << functions.size() << " total) ====\n\n";
    for (const model::Function *fn : functions)
        writeFunction(os, *fn);
    os << "\n";
}

std::string chainFor(const config::InheritanceTable &inheritance,
                     const std::string &type,
                     const std::set<std::string> &documented)
{
    auto it = inheritance.find(type);
    if (it == inheritance.end())
        return "<Unknown>";
    return inheritanceChain(it->second, documented);
}

} // namespace

GlobalFunctionGroups groupGlobalFunctions(const model::Catalog &catalog)
{
    GlobalFunctionGroups groups;
    for (const model::Function &fn : catalog.globalFunctions())
    {
        const std::string &name = fn.name;
        if ((!name.empty() && name.front() == 'm') || contains(name, "Vector") ||
            contains(name, "Matrix"))
            groups.arithmetic.push_back(&fn);
        else if (contains(name, "alx") || contains(name, "audio") || contains(name, "getAudio"))
            groups.audio.push_back(&fn);
        else
            groups.general.push_back(&fn);
    }
    return groups;
}

std::string inheritanceChain(const std::vector<std::string> &chain,
                             const std::set<std::string> &documented)
{
    std::string out;
    for (const std::string &type : chain)
    {
        if (!out.empty())
            out += " -> ";
        if (documented.count(type))
            out += "[[#" + type + "]]";
        else
            out += type;
    }
    return out;
}

void renderDokuWiki(const model::Catalog &catalog,
                    const config::InheritanceTable &inheritance,
                    const config::PrimitiveTypeLabels &labels,
                    const RenderOptions &options,
                    std::ostream &os)
{
    os << "====== " << options.title << " ======\n";
    if (!options.author.empty())
        os << "Compiled by " << options.author << "\n";
    os << "\n";

    // Global functions.
    const GlobalFunctionGroups groups = groupGlobalFunctions(catalog);
    // The heading counts every global function, grouped or not.
    os << "===== Global Methods (" << catalog.globalFunctionCount() << " total) =====\n\n";
    for (const model::Function *fn : groups.general)
        writeFunction(os, *fn);
    os << "\n";
    writeFunctionList(os, "==== Arithmetic Methods", groups.arithmetic);
    writeFunctionList(os, "==== Audio Methods", groups.audio);

    // Type methods.
    std::set<std::string> documentedTypes;
    for (const auto &[type, methods] : catalog.typeMethods())
        documentedTypes.insert(type);

    os << "===== Type Methods (" << catalog.typeMethodTotal() << " total methods, "
       << catalog.typeMethods().size() << " total types) =====\n\n";
    for (const auto &[type, methods] : catalog.typeMethods())
    {
        os << "==== " << type << " ====\n"
           << catalog.typeMethodCount(type) << " total native methods\n\n"
           << "Inheritance: " << chainFor(inheritance, type, documentedTypes) << "\n";
        for (const model::Function &fn : methods)
            writeFunction(os, fn);
        os << "\n";
    }

    // Global values.
    os << "===== Global Values (" << catalog.globalValues().size() << " total): =====\n\n";
    for (const model::GlobalVariable &value : catalog.globalValues())
    {
        const std::string name =
            !value.name.empty() && value.name.front() == '$' ? value.name : "$" + value.name;
        os << "=== " << name << " ===\n"
           << "Type: " << config::primitiveLabel(labels, value.typeCode) << "\n\n"
           << "Address in Executable: 0x" << orUnknown(value.address) << "\n\n";
    }
    os << "\n";

    // Datablocks.
    std::set<std::string> documentedBlocks;
    for (const auto &[type, block] : catalog.datablocks())
        documentedBlocks.insert(type);

    os << "===== Datablocks (" << catalog.datablocks().size() << " total) =====\n";
    for (const auto &[type, block] : catalog.datablocks())
    {
        os << "==== " << block.name << " ====\n"
           << "Total Properties: " << block.properties.size() << "\n\n"
           << "Inheritance: " << chainFor(inheritance, type, documentedBlocks) << "\n";
        for (const auto &[propertyName, property] : block.properties)
        {
            os << "=== " << property.name << " ===\n"
               << "Offset: " << orUnknown(property.address) << "\n"
               << "Type: " << property.typeName.value_or(std::string(model::kUnresolvedPropertyType))
               << "\n";
        }
    }
}

} // namespace scour::render
