#include "catalog.hpp"

#include <utility>

const char* groupLabel(MaterialGroup g) {
    switch (g) {
        case MaterialGroup::Overworld: return "Overworld";
        case MaterialGroup::Animated:  return "Animated";
        case MaterialGroup::Nether:    return "Nether";
        case MaterialGroup::Special:   return "Special materials";
        case MaterialGroup::Bonus:     return "Bonus";
    }
    return "Other";
}

const std::vector<MaterialDef>& materialCatalog() {
    using G = MaterialGroup;
    static const std::vector<MaterialDef> defs = {
        { "grass_top",    G::Overworld, 1, 0.0f,  &generateGrassTop },
        { "grass_side",   G::Overworld, 1, 0.0f,  &generateGrassSide },
        { "dirt",         G::Overworld, 1, 0.0f,  &generateDirt },
        { "stone",        G::Overworld, 1, 0.0f,  &generateStone },
        { "wood",         G::Overworld, 1, 0.0f,  &generateWood },
        { "leaves",       G::Overworld, 1, 0.0f,  &generateLeaves },

        { "water",        G::Animated,  WATER_FRAMES,  0.30f, &generateWater },
        { "lava",         G::Animated,  LAVA_FRAMES,   0.20f, &generateLava },
        { "portal",       G::Animated,  PORTAL_FRAMES, 0.15f, &generatePortal },

        { "netherrack",   G::Nether,    1, 0.0f,  &generateNetherrack },
        { "nether_brick", G::Nether,    1, 0.0f,  &generateNetherBrick },
        { "soul_sand",    G::Nether,    1, 0.0f,  &generateSoulSand },
        { "glowstone",    G::Nether,    1, 0.0f,  &generateGlowstone },

        { "diamond",      G::Special,   1, 0.0f,  &generateDiamond },
        { "emerald",      G::Special,   1, 0.0f,  &generateEmerald },
        { "obsidian",     G::Special,   1, 0.0f,  &generateObsidian },
        { "ice",          G::Special,   1, 0.0f,  &generateIce },

        { "brick",        G::Bonus,     1, 0.0f,  &generateBrick },
        { "sand",         G::Bonus,     1, 0.0f,  &generateSand },
    };
    return defs;
}

const MaterialDef* findMaterial(const std::string& name) {
    for (const MaterialDef& def : materialCatalog()) {
        if (name == def.name) return &def;
    }
    return nullptr;
}

int catalogFileCount() {
    int n = 0;
    for (const MaterialDef& def : materialCatalog()) n += def.frameCount;
    return n;
}

bool generateMaterial(const MaterialDef& def, RNG& rng, const GenOptions& opt,
                      TextureSet& out, std::string* err) {
    if (!def.generate) {
        if (err) *err = std::string("no generator registered for ") + def.name;
        return false;
    }

    TextureSet set = def.generate(rng, opt);

    if (static_cast<int>(set.frames.size()) != def.frameCount) {
        if (err) {
            *err = std::string(def.name) + ": expected " + std::to_string(def.frameCount) +
                   " frame(s), generator produced " + std::to_string(set.frames.size());
        }
        return false;
    }
    for (size_t i = 0; i < set.frames.size(); ++i) {
        if (!set.frames[i].complete()) {
            if (err) *err = std::string(def.name) + ": frame " + std::to_string(i) + " has unassigned pixels";
            return false;
        }
    }

    out = std::move(set);
    return true;
}
