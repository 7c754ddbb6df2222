#include "settings.hpp"
#include "common.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <string>

namespace {

bool parseBool(const std::string& v, bool& out) {
    const std::string s = toLower(trimCopy(v));
    if (s == "1" || s == "true" || s == "yes" || s == "on") {
        out = true;
        return true;
    }
    if (s == "0" || s == "false" || s == "no" || s == "off") {
        out = false;
        return true;
    }
    return false;
}

} // namespace

bool parseWoodStyle(const std::string& v, WoodStyle& out) {
    const std::string s = toLower(trimCopy(v));
    if (s == "rings" || s == "ring") {
        out = WoodStyle::Rings;
        return true;
    }
    if (s == "circles" || s == "circle") {
        out = WoodStyle::Circles;
        return true;
    }
    return false;
}

const char* woodStyleName(WoodStyle s) {
    switch (s) {
        case WoodStyle::Rings:   return "rings";
        case WoodStyle::Circles: return "circles";
    }
    return "rings";
}

bool parseSeed(const std::string& v, uint32_t& out) {
    const std::string s = trimCopy(v);
    if (s.empty() || s[0] == '-' || s[0] == '+') return false;

    char* end = nullptr;
    errno = 0;
    const unsigned long long n = std::strtoull(s.c_str(), &end, 0);
    if (errno != 0 || !end || *end != '\0') return false;
    if (n > 0xFFFFFFFFull) return false;

    out = static_cast<uint32_t>(n);
    return true;
}

Settings loadSettings(const std::string& path) {
    Settings s;

    std::ifstream f(path);
    if (!f) return s;

    std::string line;
    while (std::getline(f, line)) {
        // Strip comments (# or ;)
        auto hash = line.find('#');
        auto semi = line.find(';');
        size_t cut = std::min(hash == std::string::npos ? line.size() : hash,
                              semi == std::string::npos ? line.size() : semi);
        line = trimCopy(line.substr(0, cut));
        if (line.empty()) continue;

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = toLower(trimCopy(line.substr(0, eq)));
        std::string val = trimCopy(line.substr(eq + 1));

        if (key == "output_dir") {
            if (!val.empty()) s.outputDir = val;
        } else if (key == "seed") {
            uint32_t v = 0;
            if (parseSeed(val, v)) s.seed = v;
        } else if (key == "wood_style") {
            WoodStyle w = WoodStyle::Rings;
            if (parseWoodStyle(val, w)) s.woodStyle = w;
        } else if (key == "skip_existing") {
            bool b = false;
            if (parseBool(val, b)) s.skipExisting = b;
        } else if (key == "verbose") {
            bool b = true;
            if (parseBool(val, b)) s.verbose = b;
        }
    }

    return s;
}

bool writeDefaultSettings(const std::string& path) {
    std::ofstream f(path);
    if (!f) return false;

    f << R"INI(# ProcTex settings
#
# Lines are: key = value
# Comments start with # or ;
#
# Command-line flags override anything set here.

# Destination directory (created if missing)
output_dir = assets/textures

# 0 = new random textures every run; any other value reproduces a batch
seed = 0

# Wood grain: rings (radial ring index) or circles (drawn outlines)
wood_style = rings

# Keep textures that already exist instead of overwriting them
skip_existing = false

# Print one line per material
verbose = true
)INI";

    return static_cast<bool>(f);
}
