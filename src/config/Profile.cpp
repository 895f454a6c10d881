//===----------------------------------------------------------------------===//
//
// Part of the Scour project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/config/Profile.cpp
// Purpose: Built-in configuration for the Tribes 2 decompiled listing and the
//          primitive label lookup.
// Key invariants: Addresses are stored uppercase without prefix.
// Ownership/Lifetime: Returns profiles by value.
// Links: src/config/Profile.hpp
//
//===----------------------------------------------------------------------===//

#include "config/Profile.hpp"

namespace scour::config
{

std::string_view primitiveLabel(const PrimitiveTypeLabels &labels, int code)
{
    if (code < 0 || static_cast<std::size_t>(code) >= labels.size())
        return "Unknown";
    return labels[static_cast<std::size_t>(code)];
}

namespace
{

void addTribes2Registry(PatternRegistry &registry)
{
    auto &globals = registry.pattern(Category::GlobalFunction);
    globals.addresses = {"426650", "426590", "4265D0", "426550", "426610"};
    globals.layout.name = 0;
    globals.layout.address = 1;
    globals.layout.description = 2;
    globals.layout.minArgs = 3;
    globals.layout.maxArgs = 4;
    globals.layout.fieldsAfterDescription = 2;

    // Method registrations carry the class name ahead of the method name.
    auto &methods = registry.pattern(Category::TypeMethod);
    methods.addresses = {"426450", "426510", "425960"};
    methods.layout.typeName = 1;
    methods.layout.name = 2;
    methods.layout.address = 3;
    methods.layout.description = 4;
    methods.layout.minArgs = 5;
    methods.layout.maxArgs = 6;
    methods.layout.fieldsAfterDescription = 2;

    auto &values = registry.pattern(Category::GlobalValue);
    values.addresses = {"4263B0"};
    values.layout.name = 0;
    values.layout.typeCode = 1;
    values.layout.address = 2;

    auto &fields = registry.pattern(Category::DatablockProperty);
    fields.addresses = {"423F20"};
    fields.layout.name = 0;
    fields.layout.address = 2;

    // The Sky class registers its methods through a pointer to its name.
    registry.namePatches.push_back({"(int)&off_7957AC", "Sky"});
}

DatablockOwnerTable tribes2Owners()
{
    return {
        {"61E7A0", "ExplosionData"},
        {"5B4F60", "WaterBlockData"},
        {"612400", "WheeledVehicleData"},
        {"6161E0", "HoverVehicleData"},
        {"5CE810", "PlayerData"},
        {"6034C0", "ItemData"},
        {"69C170", "TriggerData"},
        {"50DC70", "AudioProfileData"},
        {"62B3C0", "LinearProjectile"},
        {"60F820", "FlyingVehicleData"},
        {"6370D0", "SeekingProjectileData"},
        {"69B0F0", "PrecipitationData"},
        {"641480", "SniperProjectileData"},
        {"66A270", "SensorData"},
        {"6303F0", "GrenadeProjectileData"},
        {"6333D0", "GrenadeProjectileData"},
        {"694B40", "TracerProjectileData"},
        {"6470D0", "TargetProjectileData"},
        {"653E10", "TurretData"},
        {"654AE0", "TurretData"},
        {"5E4C20", "TurretData"},
        {"654330", "TurretImageData"},
        {"64E2B0", "LightningData"},
        {"627150", "LightningData"},
        {"621DF0", "ParticleEmitterData"},
        {"622E60", "ParticleData"},
        {"644910", "ELFProjectileData"},
        {"64A860", "ELFProjectileData"},
        {"5F4D90", "ShapeBaseImageData"},
        {"602940", "StaticShapeData"},
        {"66B000", "SpawnSphere"},
        {"6099E0", "VehicleData"},
        {"47D880", "AI Task?"},
        {"63D870", "LinearFlareData"},
        {"59A870", "TerrainData"},
        {"68C4B0", "ShockwaveData"},
        {"4B5840", "CorpseData"},
        {"619B30", "Sky"},
        {"5AB310", "Sky"},
        {"68AAA0", "PhysicalZone"},
        {"626240", "Debris"},
        {"684000", "Debris"},
        {"6751A0", "ForceFieldBareData"},
        {"631A50", "ProjectileData"},
        {"69AF10", "FireballAtmosphere"},
    };
}

InheritanceTable tribes2Inheritance()
{
    const std::vector<std::string> netObject = {"SceneObject", "NetObject", "SimObject"};
    const std::vector<std::string> dataBlock = {"GameBaseData", "SimDataBlock", "SimObject"};

    auto chain = [](std::vector<std::string> head, const std::vector<std::string> &tail)
    {
        head.insert(head.end(), tail.begin(), tail.end());
        return head;
    };

    InheritanceTable table;
    table["SimObject"] = {"SimObject"};
    table["HTTPObject"] = {"HTTPObject", "TCPObject", "SimObject"};
    table["FileObject"] = {"FileObject", "SimObject"};
    table["SimpleNetObject"] = {"SimpleNetObject", "SimObject"};
    table["SceneObject"] = netObject;
    table["GameBase"] = chain({"GameBase"}, netObject);
    table["Item"] = chain({"Item", "ShapeBase", "GameBase"}, netObject);
    table["Player"] = chain({"Player", "ShapeBase", "GameBase"}, netObject);
    table["StaticShape"] = chain({"StaticShape", "ShapeBase", "GameBase"}, netObject);
    table["Turret"] = chain({"Turret", "StaticShape", "ShapeBase", "GameBase"}, netObject);
    table["ForceFieldBare"] = chain({"ForceFieldBare", "GameBase"}, netObject);
    table["Trigger"] = chain({"Trigger", "GameBase"}, netObject);
    table["FireballAtmosphere"] = chain({"FireballAtmosphere", "GameBase"}, netObject);
    table["PhysicalZone"] = chain({"PhysicalZone"}, netObject);
    table["TerrainBlock"] = chain({"TerrainBlock"}, netObject);
    table["InteriorInstance"] = chain({"InteriorInstance"}, netObject);
    table["WaterBlock"] = chain({"WaterBlock"}, netObject);
    table["TSStatic"] = chain({"TSStatic"}, netObject);
    table["MissionArea"] = {"MissionArea", "NetObject", "SimObject"};
    table["DebugView"] = {"DebugView", "GuiTextCtrl", "GuiControl", "SimGroup", "SimSet", "SimObject"};
    table["Canvas"] = {"Canvas", "GuiCanvas", "GuiControl", "SimGroup", "SimSet", "SimObject"};
    table["GuiCanvas"] = {"GuiCanvas", "GuiControl", "SimGroup", "SimSet", "SimObject"};
    table["AIObjectiveQ"] = {"AIObjectiveQ", "SimSet", "SimObject"};
    table["AIConnection"] = {
        "AIConnection", "GameConnection", "NetConnection", "SimGroup", "SimSet", "SimObject"};

    table["LinearProjectile"] = chain({"LinearProjectile", "Projectile", "GameBase"}, netObject);
    table["GrenadeProjectile"] = chain({"GrenadeProjectile", "Projectile", "GameBase"}, netObject);
    table["EnergyProjectile"] =
        chain({"EnergyProjectile", "GrenadeProjectile", "Projectile", "GameBase"}, netObject);
    table["TargetProjectile"] = chain({"TargetProjectile", "Projectile", "GameBase"}, netObject);

    table["HoverVehicle"] = chain({"HoverVehicle", "Vehicle", "ShapeBase", "GameBase"}, netObject);
    table["FlyingVehicle"] =
        chain({"FlyingVehicle", "Vehicle", "ShapeBase", "GameBase"}, netObject);
    table["WheeledVehicle"] =
        chain({"WheeledVehicle", "Vehicle", "ShapeBase", "GameBase"}, netObject);

    table["PlayerData"] = chain({"PlayerData", "ShapeBaseData"}, dataBlock);
    table["HoverVehicleData"] = chain({"HoverVehicleData", "VehicleData", "ShapeBaseData"}, dataBlock);
    table["FlyingVehicleData"] =
        chain({"FlyingVehicleData", "VehicleData", "ShapeBaseData"}, dataBlock);
    table["WheeledVehicleData"] =
        chain({"WheeledVehicleData", "VehicleData", "ShapeBaseData"}, dataBlock);
    table["ForceFieldBareData"] = chain({"ForceFieldBareData"}, dataBlock);
    table["LinearProjectileData"] = chain({"LinearProjectileData", "ProjectileData"}, dataBlock);
    table["GrenadeProjectileData"] = chain({"GrenadeProjectileData", "ProjectileData"}, dataBlock);
    table["EnergyProjectileData"] =
        chain({"EnergyProjectileData", "GrenadeProjectileData", "ProjectileData"}, dataBlock);
    table["TargetProjectileData"] = chain({"TargetProjectileData", "ProjectileData"}, dataBlock);
    table["FireballAtmosphereData"] = chain({"FireballAtmosphereData"}, dataBlock);
    return table;
}

} // namespace

Profile makeTribes2Profile()
{
    Profile profile;
    addTribes2Registry(profile.registry);
    profile.owners = tribes2Owners();
    profile.inheritance = tribes2Inheritance();
    profile.primitiveLabels = {"Unknown", "Integer", "Unknown", "Boolean", "Unknown", "Float", "Unknown"};
    profile.skipLines = 33350;
    profile.title = "Tribes 2 Engine Reference";
    return profile;
}

} // namespace scour::config
