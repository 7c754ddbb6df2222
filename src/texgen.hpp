#pragma once
#include "common.hpp"
#include "rng.hpp"
#include "texture.hpp"
#include <cstdint>
#include <vector>

// Procedural material textures.
//
// Most materials are one of a handful of pattern shapes (noise fill, brick
// grid, radial facets, ...). Each shape is a fill routine driven by a small
// descriptor; the per-material functions at the bottom just pick a
// descriptor and wrap the result in a TextureSet.
//
// All randomness comes from the RNG passed in. Fill routines assign every
// pixel exactly once and never read back what they wrote.

// --- Uniform noise fill ---

enum class OverrideKind : uint8_t {
    Darken,   // subtract `amount` from every channel
    Brighten, // add `amount` to every channel
    Replace,  // substitute `color`
    Tint,     // add (dr, dg, db)
};

// Low-probability substitution applied after the primary noise.
struct OverrideRule {
    float probability = 0.0f;
    OverrideKind kind = OverrideKind::Darken;
    int amount = 0;
    Color color{};
    int dr = 0, dg = 0, db = 0;

    // Only rolled when the previous rule did not fire (if / else-if chains).
    bool chained = false;
};

// Deterministic vein: pixels where (mulX*x + mulY*y) mod modulus == 0 get
// `delta` added to every channel. modulus == 0 disables it.
struct PositionalRule {
    int mulX = 1;
    int mulY = 0;
    int modulus = 0;
    int delta = 0;
};

struct NoiseFill {
    Color base{};
    int amplitude = 0;
    PositionalRule vein;
    std::vector<OverrideRule> overrides;
};

Color applyOverride(RNG& rng, const OverrideRule& rule, Color c, bool& fired);
Bitmap fillNoise(RNG& rng, const NoiseFill& d);

// --- Banded fill ---

// Rows [0, splitRow) use the top band, the rest the bottom band.
struct BandFill {
    Color top{};
    int topAmplitude = 0;
    Color bottom{};
    int bottomAmplitude = 0;
    int splitRow = 4;
};

Bitmap fillBands(RNG& rng, const BandFill& d);

// --- Wood ---

enum class WoodStyle : uint8_t {
    Rings,   // floor(dist * 2) mod 2 alternates base / darker
    Circles, // noise fill plus concentric circle outlines
};

struct WoodFill {
    Color base{};
    int amplitude = 0;
    int ringDarken = 0;
    int radii[3] = {2, 4, 6};
};

Bitmap fillWoodRings(RNG& rng, const WoodFill& d);
Bitmap fillWoodCircles(RNG& rng, const WoodFill& d);

// --- Brick / mortar grid ---

// Mortar where (x + rowOffset) mod gridSize == 0 or y mod rowHeight == 0.
// rowOffset is `stagger` on every other brick row.
struct BrickGrid {
    Color brick{};
    int brickAmplitude = 0;
    Color mortar{};
    int mortarAmplitude = 0;
    int gridSize = 8;
    int rowHeight = 4;
    int stagger = 4;
};

bool isMortar(const BrickGrid& d, int x, int y);
Bitmap fillBrickGrid(RNG& rng, const BrickGrid& d);

// --- Radial facets ---

// facet = floor((|x-8| + |y-8|) * 2) mod 3 selects brighten / keep / darken.
struct FacetFill {
    Color base{};
    int amplitude = 0;
    int facetBrighten = 0;
    int facetDarken = 0;
    float sparkleChance = 0.0f;
    Color sparkle{};
};

int facetIndex(int x, int y);
Bitmap fillFacets(RNG& rng, const FacetFill& d);

// --- Crack lines ---

// Darken on (x+y) mod 7 == 0 or (x-y) mod 9 == 0, then highlight on
// (x*y) mod 5 == 0. The highlight is applied last.
struct CrackFill {
    Color base{};
    int amplitude = 0;
    int crackDarken = 0;
    int highlight = 0;
};

bool onCrack(int x, int y);
bool onHighlight(int x, int y);
Bitmap fillCracks(RNG& rng, const CrackFill& d);

// --- Animated frames ---

constexpr int WATER_FRAMES = 4;
constexpr int LAVA_FRAMES = 4;
constexpr int PORTAL_FRAMES = 6;

struct LavaFlow {
    float bubbleChance = 0.05f;
    Color bubble{255, 200, 50};
};

// ((x + 2*frame + y) mod 4) * 8 added to the base, capped at 255.
int waterWave(int x, int y, int frame);
Bitmap waterFrame(int frame);

// Flow scalar in [0,1): ((3x + 7y + 3*frame) mod 12) / 12.
double lavaFlow(int x, int y, int frame);
Color lavaRamp(double flow);
Bitmap lavaFrame(RNG& rng, int frame, const LavaFlow& d = LavaFlow{});

Color portalColor(int x, int y, int frame);
Bitmap portalFrame(int frame);

Bitmap fillGlowstone(RNG& rng);

// --- Material descriptors ---

NoiseFill grassTopFill();
NoiseFill dirtFill();
NoiseFill stoneFill();
NoiseFill leavesFill();
NoiseFill sandFill();
NoiseFill soulSandFill();
NoiseFill netherrackFill();
NoiseFill obsidianFill();
BandFill grassSideFill();
WoodFill woodFill();
BrickGrid brickGrid();
BrickGrid netherBrickGrid();
FacetFill diamondFacets();
FacetFill emeraldFacets();
CrackFill iceCracks();

// --- Material generators ---

struct GenOptions {
    WoodStyle wood = WoodStyle::Rings;
};

TextureSet generateGrassTop(RNG& rng, const GenOptions& opt);
TextureSet generateGrassSide(RNG& rng, const GenOptions& opt);
TextureSet generateDirt(RNG& rng, const GenOptions& opt);
TextureSet generateStone(RNG& rng, const GenOptions& opt);
TextureSet generateWood(RNG& rng, const GenOptions& opt);
TextureSet generateLeaves(RNG& rng, const GenOptions& opt);
TextureSet generateWater(RNG& rng, const GenOptions& opt);
TextureSet generateLava(RNG& rng, const GenOptions& opt);
TextureSet generatePortal(RNG& rng, const GenOptions& opt);
TextureSet generateNetherrack(RNG& rng, const GenOptions& opt);
TextureSet generateNetherBrick(RNG& rng, const GenOptions& opt);
TextureSet generateSoulSand(RNG& rng, const GenOptions& opt);
TextureSet generateGlowstone(RNG& rng, const GenOptions& opt);
TextureSet generateDiamond(RNG& rng, const GenOptions& opt);
TextureSet generateEmerald(RNG& rng, const GenOptions& opt);
TextureSet generateObsidian(RNG& rng, const GenOptions& opt);
TextureSet generateIce(RNG& rng, const GenOptions& opt);
TextureSet generateBrick(RNG& rng, const GenOptions& opt);
TextureSet generateSand(RNG& rng, const GenOptions& opt);
