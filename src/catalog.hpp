#pragma once
#include "rng.hpp"
#include "texgen.hpp"
#include "texture.hpp"
#include <cstdint>
#include <string>
#include <vector>

enum class MaterialGroup : uint8_t {
    Overworld = 0,
    Animated,
    Nether,
    Special,
    Bonus,
};

const char* groupLabel(MaterialGroup g);

using GenerateFn = TextureSet (*)(RNG& rng, const GenOptions& opt);

struct MaterialDef {
    const char* name = "";
    MaterialGroup group = MaterialGroup::Overworld;
    int frameCount = 1;

    // How long the consuming renderer should hold each frame (0 = static).
    float frameSeconds = 0.0f;

    GenerateFn generate = nullptr;
};

// Every material in batch order.
const std::vector<MaterialDef>& materialCatalog();

// nullptr if the name is unknown.
const MaterialDef* findMaterial(const std::string& name);

// Total number of files a full batch produces (one per frame).
int catalogFileCount();

// Runs def.generate and checks the result: frame count matches the catalog
// and every frame is complete. Returns false (with `err` set) otherwise.
bool generateMaterial(const MaterialDef& def, RNG& rng, const GenOptions& opt,
                      TextureSet& out, std::string* err);
