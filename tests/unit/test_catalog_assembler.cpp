// File: tests/unit/test_catalog_assembler.cpp
// Purpose: Verify the assembler files records into catalog groups.
// Key invariants: Per-type method counts sum to the grand total; the first
//                 property of a given name on a datablock is kept.
// Ownership/Lifetime: Assembler owns the catalog until finish().
// Links: src/extract/CatalogAssembler.hpp, include/scour/model/Catalog.hpp

#include <gtest/gtest.h>

#include "extract/CatalogAssembler.hpp"

using namespace scour;
using namespace scour::extract;

namespace
{
model::Function method(const char *type, const char *name)
{
    model::Function fn;
    fn.name = name;
    fn.typeName = type;
    fn.minArgs = 2;
    fn.maxArgs = 2;
    return fn;
}
} // namespace

TEST(CatalogAssembler, MethodCountsSumToTotal)
{
    CatalogAssembler assembler;
    assembler.addTypeMethod(method("SimObject", "getName"));
    assembler.addTypeMethod(method("SimObject", "getId"));
    assembler.addTypeMethod(method("Sky", "realFog"));

    const model::Catalog &catalog = assembler.current();
    EXPECT_EQ(catalog.typeMethodCount("SimObject"), 2u);
    EXPECT_EQ(catalog.typeMethodCount("Sky"), 1u);
    EXPECT_EQ(catalog.typeMethodCount("Player"), 0u);
    EXPECT_EQ(catalog.typeMethodTotal(), 3u);

    std::size_t sum = 0;
    for (const auto &[type, methods] : catalog.typeMethods())
        sum += methods.size();
    EXPECT_EQ(sum, catalog.typeMethodTotal());

    const auto &simObject = catalog.typeMethods().at("SimObject");
    EXPECT_EQ(simObject[0].name, "getName");
    EXPECT_EQ(simObject[1].name, "getId");
    EXPECT_TRUE(simObject[0].isMethod());
}

TEST(CatalogAssembler, FirstPropertyWins)
{
    CatalogAssembler assembler;
    EXPECT_TRUE(assembler.addProperty("ExplosionData", model::Property("mass", "96")));
    EXPECT_TRUE(assembler.addProperty("ExplosionData", model::Property("offset", "100")));
    EXPECT_FALSE(assembler.addProperty("ExplosionData", model::Property("mass", "104")));

    const model::Datablock *block = assembler.current().findDatablock("ExplosionData");
    ASSERT_NE(block, nullptr);
    EXPECT_EQ(block->name, "ExplosionData");
    EXPECT_EQ(block->properties.size(), 2u);
    const model::Property *mass = block->findProperty("mass");
    ASSERT_NE(mass, nullptr);
    EXPECT_EQ(mass->address, "96");
    EXPECT_FALSE(mass->typeResolved());
    EXPECT_EQ(mass->typeName, std::string(model::kUnresolvedPropertyType));
}

TEST(CatalogAssembler, FinishLeavesAssemblerEmpty)
{
    CatalogAssembler assembler;
    model::Function fn;
    fn.name = "getWord";
    assembler.addGlobalFunction(fn);
    model::GlobalVariable value;
    value.name = "$pref::Net::LagThreshold";
    assembler.addGlobalValue(value);

    const model::Catalog catalog = assembler.finish();
    EXPECT_EQ(catalog.globalFunctionCount(), 1u);
    EXPECT_EQ(catalog.globalValues().size(), 1u);
    EXPECT_EQ(assembler.current(), model::Catalog{});
}
