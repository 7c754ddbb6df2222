#pragma once

#include <cstdint>
#include <string>

#include "texgen.hpp"

// Simple user-editable settings file (INI-ish: key = value).
// Every value can be overridden from the command line.
struct Settings {
    // Where textures are written (created if missing).
    std::string outputDir = "assets/textures";

    // 0 = unseeded (different output every run); anything else reproduces a batch.
    uint32_t seed = 0;

    WoodStyle woodStyle = WoodStyle::Rings; // rings|circles

    // Leave textures that already exist on disk untouched.
    bool skipExisting = false;

    // One console line per material.
    bool verbose = true;
};

// Loads settings from disk. If the file is missing or invalid, defaults are used.
Settings loadSettings(const std::string& path);

// Writes a commented default settings file. Returns true on success.
bool writeDefaultSettings(const std::string& path);

bool parseWoodStyle(const std::string& v, WoodStyle& out);
const char* woodStyleName(WoodStyle s);

// Accepts decimal or 0x-prefixed hex.
bool parseSeed(const std::string& v, uint32_t& out);
