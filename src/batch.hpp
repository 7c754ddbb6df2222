#pragma once
#include "catalog.hpp"
#include "texture_io.hpp"
#include <cstdint>
#include <string>
#include <vector>

struct BatchReport {
    int materials = 0;
    int stored = 0; // frames accepted by the sink (includes skipped files)
};

// Generates each material in order and hands every frame to the sink.
//
// Each material draws from its own stream, hashCombine(runSeed, fnv1a32(name)),
// so a single material regenerates identically with or without the others.
// Stops at the first failure (no retry); frames stored before it stay stored.
bool runBatch(const std::vector<const MaterialDef*>& materials, uint32_t runSeed,
              const GenOptions& opt, TextureSink& sink, bool verbose,
              BatchReport& report, std::string* err);
