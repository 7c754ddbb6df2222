#include "texgen.hpp"
#include "noise.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdlib>
#include <utility>

namespace {

constexpr int CENTER = TEXTURE_SIZE / 2;

// Non-negative modulo (crack lines use x - y, which goes negative).
inline int posMod(int v, int m) {
    int r = v % m;
    return r < 0 ? r + m : r;
}

using Mask = std::array<uint8_t, TEXTURE_SIZE * TEXTURE_SIZE>;

void markPx(Mask& m, int x, int y) {
    if (!Bitmap::inBounds(x, y)) return;
    m[static_cast<size_t>(y * TEXTURE_SIZE + x)] = 1;
}

// Midpoint circle outline.
void markCircleOutline(Mask& m, int cx, int cy, int r) {
    if (r <= 0) {
        markPx(m, cx, cy);
        return;
    }
    int x = r;
    int y = 0;
    int err = 1 - r;
    while (x >= y) {
        markPx(m, cx + x, cy + y);
        markPx(m, cx + y, cy + x);
        markPx(m, cx - y, cy + x);
        markPx(m, cx - x, cy + y);
        markPx(m, cx - x, cy - y);
        markPx(m, cx - y, cy - x);
        markPx(m, cx + y, cy - x);
        markPx(m, cx + x, cy - y);
        ++y;
        if (err < 0) {
            err += 2 * y + 1;
        } else {
            --x;
            err += 2 * (y - x) + 1;
        }
    }
}

TextureSet animatedSet(const char* name, std::vector<Bitmap> frames) {
    TextureSet set;
    set.name = name;
    set.frames = std::move(frames);
    return set;
}

} // namespace

// --- Uniform noise fill ---

Color applyOverride(RNG& rng, const OverrideRule& rule, Color c, bool& fired) {
    fired = rng.chance(rule.probability);
    if (!fired) return c;

    switch (rule.kind) {
        case OverrideKind::Darken:   return darken(c, rule.amount);
        case OverrideKind::Brighten: return brighten(c, rule.amount);
        case OverrideKind::Replace:  return rule.color;
        case OverrideKind::Tint:     return shift(c, rule.dr, rule.dg, rule.db);
    }
    return c;
}

Bitmap fillNoise(RNG& rng, const NoiseFill& d) {
    Bitmap bmp;
    for (int y = 0; y < Bitmap::h; ++y) {
        for (int x = 0; x < Bitmap::w; ++x) {
            Color c = perturb(rng, d.base, d.amplitude);

            const PositionalRule& v = d.vein;
            if (v.modulus > 0 && posMod(v.mulX * x + v.mulY * y, v.modulus) == 0) {
                c = shift(c, v.delta, v.delta, v.delta);
            }

            bool prevFired = false;
            for (const OverrideRule& rule : d.overrides) {
                // An else-if branch whose predecessor fired is not rolled, and
                // keeps suppressing the rest of its chain.
                if (rule.chained && prevFired) continue;
                c = applyOverride(rng, rule, c, prevFired);
            }

            bmp.set(x, y, c);
        }
    }
    return bmp;
}

// --- Banded fill ---

Bitmap fillBands(RNG& rng, const BandFill& d) {
    Bitmap bmp;
    for (int y = 0; y < Bitmap::h; ++y) {
        const bool top = y < d.splitRow;
        for (int x = 0; x < Bitmap::w; ++x) {
            bmp.set(x, y, top ? perturb(rng, d.top, d.topAmplitude)
                              : perturb(rng, d.bottom, d.bottomAmplitude));
        }
    }
    return bmp;
}

// --- Wood ---

Bitmap fillWoodRings(RNG& rng, const WoodFill& d) {
    const Color darker = darken(d.base, d.ringDarken);

    Bitmap bmp;
    for (int y = 0; y < Bitmap::h; ++y) {
        for (int x = 0; x < Bitmap::w; ++x) {
            const double dx = x - CENTER;
            const double dy = y - CENTER;
            const double dist = std::sqrt(dx * dx + dy * dy);
            const int ring = static_cast<int>(dist * 2.0) % 2;

            bmp.set(x, y, perturb(rng, ring == 0 ? d.base : darker, d.amplitude));
        }
    }
    return bmp;
}

Bitmap fillWoodCircles(RNG& rng, const WoodFill& d) {
    const Color darker = darken(d.base, d.ringDarken);

    // Rasterize the outlines first so each output pixel is written once.
    Mask rings{};
    for (int r : d.radii) markCircleOutline(rings, CENTER, CENTER, r);

    Bitmap bmp;
    for (int y = 0; y < Bitmap::h; ++y) {
        for (int x = 0; x < Bitmap::w; ++x) {
            const bool onRing = rings[static_cast<size_t>(y * TEXTURE_SIZE + x)] != 0;
            bmp.set(x, y, perturb(rng, onRing ? darker : d.base, d.amplitude));
        }
    }
    return bmp;
}

// --- Brick / mortar grid ---

bool isMortar(const BrickGrid& d, int x, int y) {
    if (d.gridSize <= 0 || d.rowHeight <= 0) return false;
    const int rowOffset = ((y / d.rowHeight) % 2) * d.stagger;
    return (x + rowOffset) % d.gridSize == 0 || y % d.rowHeight == 0;
}

Bitmap fillBrickGrid(RNG& rng, const BrickGrid& d) {
    Bitmap bmp;
    for (int y = 0; y < Bitmap::h; ++y) {
        for (int x = 0; x < Bitmap::w; ++x) {
            if (isMortar(d, x, y)) {
                bmp.set(x, y, perturb(rng, d.mortar, d.mortarAmplitude));
            } else {
                bmp.set(x, y, perturb(rng, d.brick, d.brickAmplitude));
            }
        }
    }
    return bmp;
}

// --- Radial facets ---

int facetIndex(int x, int y) {
    const int manhattan = std::abs(x - CENTER) + std::abs(y - CENTER);
    return (manhattan * 2) % 3;
}

Bitmap fillFacets(RNG& rng, const FacetFill& d) {
    Bitmap bmp;
    for (int y = 0; y < Bitmap::h; ++y) {
        for (int x = 0; x < Bitmap::w; ++x) {
            Color c = perturb(rng, d.base, d.amplitude);

            const int facet = facetIndex(x, y);
            if (facet == 0) c = brighten(c, d.facetBrighten);
            else if (facet == 2) c = darken(c, d.facetDarken);

            if (rng.chance(d.sparkleChance)) c = d.sparkle;

            bmp.set(x, y, c);
        }
    }
    return bmp;
}

// --- Crack lines ---

bool onCrack(int x, int y) {
    return posMod(x + y, 7) == 0 || posMod(x - y, 9) == 0;
}

bool onHighlight(int x, int y) {
    return (x * y) % 5 == 0;
}

Bitmap fillCracks(RNG& rng, const CrackFill& d) {
    Bitmap bmp;
    for (int y = 0; y < Bitmap::h; ++y) {
        for (int x = 0; x < Bitmap::w; ++x) {
            Color c = perturb(rng, d.base, d.amplitude);
            if (onCrack(x, y)) c = darken(c, d.crackDarken);
            if (onHighlight(x, y)) c = brighten(c, d.highlight);
            bmp.set(x, y, c);
        }
    }
    return bmp;
}

// --- Animated frames ---

int waterWave(int x, int y, int frame) {
    return ((x + frame * 2 + y) % 4) * 8;
}

Bitmap waterFrame(int frame) {
    const Color base{30, 80, 200};

    Bitmap bmp;
    for (int y = 0; y < Bitmap::h; ++y) {
        for (int x = 0; x < Bitmap::w; ++x) {
            const int wave = waterWave(x, y, frame);
            bmp.set(x, y, { static_cast<uint8_t>(std::min(255, base.r + wave)),
                            static_cast<uint8_t>(std::min(255, base.g + wave)),
                            static_cast<uint8_t>(std::min(255, base.b + wave)) });
        }
    }
    return bmp;
}

double lavaFlow(int x, int y, int frame) {
    return ((x * 3 + y * 7 + frame * 3) % 12) / 12.0;
}

Color lavaRamp(double flow) {
    // yellow-orange -> orange-red -> deep red
    if (flow < 0.3) {
        return { 255, clamp8(100 + static_cast<int>(flow * 200.0)), clamp8(static_cast<int>(flow * 50.0)) };
    }
    if (flow < 0.7) {
        return { 255, clamp8(180 - static_cast<int>(flow * 100.0)), 0 };
    }
    return { clamp8(200 + static_cast<int>(flow * 55.0)), 80, 0 };
}

Bitmap lavaFrame(RNG& rng, int frame, const LavaFlow& d) {
    Bitmap bmp;
    for (int y = 0; y < Bitmap::h; ++y) {
        for (int x = 0; x < Bitmap::w; ++x) {
            Color c = lavaRamp(lavaFlow(x, y, frame));
            if (rng.chance(d.bubbleChance)) c = d.bubble;
            bmp.set(x, y, c);
        }
    }
    return bmp;
}

Color portalColor(int x, int y, int frame) {
    const double pi = 3.14159265358979323846;
    const double phase = frame * pi / 3.0;
    const double center = TEXTURE_SIZE / 2.0;

    const double dx = x - center;
    const double dy = y - center;
    const double dist = std::sqrt(dx * dx + dy * dy);
    const double angle = std::atan2(dy, dx);

    const double wave = std::sin(dist * 0.8 + phase) * 50.0;
    const double swirl = std::sin(angle * 3.0 + phase) * 30.0;

    // Each channel is held to its own sub-range to stay in the violet band.
    const int purple = static_cast<int>(128.0 + wave + swirl);
    const int magenta = static_cast<int>(wave / 3.0 + swirl / 2.0);
    const int violet = static_cast<int>(200.0 + wave + swirl);

    return { static_cast<uint8_t>(clampi(purple, 80, 220)),
             static_cast<uint8_t>(clampi(magenta, 0, 120)),
             static_cast<uint8_t>(clampi(violet, 150, 255)) };
}

Bitmap portalFrame(int frame) {
    Bitmap bmp;
    for (int y = 0; y < Bitmap::h; ++y) {
        for (int x = 0; x < Bitmap::w; ++x) {
            bmp.set(x, y, portalColor(x, y, frame));
        }
    }
    return bmp;
}

Bitmap fillGlowstone(RNG& rng) {
    const Color base{255, 220, 100};

    Bitmap bmp;
    for (int y = 0; y < Bitmap::h; ++y) {
        for (int x = 0; x < Bitmap::w; ++x) {
            int brightness = rng.range(-20, 20);
            if ((x + y) % 3 == 0) brightness += 20; // crystal lattice
            bmp.set(x, y, shift(base, brightness, brightness, brightness));
        }
    }
    return bmp;
}

// --- Material descriptors ---

NoiseFill grassTopFill() {
    NoiseFill d;
    d.base = {50, 180, 50};
    d.amplitude = 20;
    OverrideRule shade;
    shade.probability = 0.15f;
    shade.kind = OverrideKind::Darken;
    shade.amount = 30;
    d.overrides.push_back(shade);
    return d;
}

NoiseFill dirtFill() {
    NoiseFill d;
    d.base = {130, 80, 40};
    d.amplitude = 25;
    OverrideRule pebble;
    pebble.probability = 0.05f;
    pebble.kind = OverrideKind::Replace;
    pebble.color = {90, 90, 90};
    d.overrides.push_back(pebble);
    return d;
}

NoiseFill stoneFill() {
    NoiseFill d;
    d.base = {100, 100, 100};
    d.amplitude = 30;

    OverrideRule crack;
    crack.probability = 0.10f;
    crack.kind = OverrideKind::Darken;
    crack.amount = 40;

    OverrideRule fleck;
    fleck.probability = 0.05f;
    fleck.kind = OverrideKind::Brighten;
    fleck.amount = 20;
    fleck.chained = true;

    d.overrides = {crack, fleck};
    return d;
}

NoiseFill leavesFill() {
    NoiseFill d;
    d.base = {40, 120, 40};
    d.amplitude = 35;

    OverrideRule shadow;
    shadow.probability = 0.15f;
    shadow.kind = OverrideKind::Darken;
    shadow.amount = 25;

    OverrideRule light;
    light.probability = 0.10f;
    light.kind = OverrideKind::Brighten;
    light.amount = 30;
    light.chained = true;

    d.overrides = {shadow, light};
    return d;
}

NoiseFill sandFill() {
    NoiseFill d;
    d.base = {210, 180, 140};
    d.amplitude = 18;
    OverrideRule grain;
    grain.probability = 0.03f;
    grain.kind = OverrideKind::Darken;
    grain.amount = 40;
    d.overrides.push_back(grain);
    return d;
}

NoiseFill soulSandFill() {
    NoiseFill d;
    d.base = {70, 50, 35};
    d.amplitude = 20;
    OverrideRule face;
    face.probability = 0.08f;
    face.kind = OverrideKind::Darken;
    face.amount = 35;
    d.overrides.push_back(face);
    return d;
}

NoiseFill netherrackFill() {
    NoiseFill d;
    d.base = {150, 50, 50};
    d.amplitude = 40;
    d.vein.mulX = 1;
    d.vein.mulY = 3;
    d.vein.modulus = 7;
    d.vein.delta = -30;
    return d;
}

NoiseFill obsidianFill() {
    NoiseFill d;
    d.base = {10, 5, 25};
    d.amplitude = 15;

    OverrideRule vein;
    vein.probability = 0.08f;
    vein.kind = OverrideKind::Tint;
    vein.dr = 15;
    vein.db = 40;

    OverrideRule glint;
    glint.probability = 0.05f;
    glint.kind = OverrideKind::Brighten;
    glint.amount = 50;

    d.overrides = {vein, glint};
    return d;
}

BandFill grassSideFill() {
    BandFill d;
    d.top = {50, 180, 50};
    d.topAmplitude = 15;
    d.bottom = {130, 80, 40};
    d.bottomAmplitude = 20;
    d.splitRow = 4;
    return d;
}

WoodFill woodFill() {
    WoodFill d;
    d.base = {80, 50, 20};
    d.amplitude = 10;
    d.ringDarken = 15;
    return d;
}

BrickGrid brickGrid() {
    BrickGrid d;
    d.brick = {150, 80, 60};
    d.brickAmplitude = 15;
    d.mortar = {180, 180, 180};
    d.mortarAmplitude = 10;
    d.gridSize = 8;
    d.rowHeight = 4;
    d.stagger = 4;
    return d;
}

BrickGrid netherBrickGrid() {
    BrickGrid d;
    d.brick = {50, 15, 15};
    d.brickAmplitude = 10;
    d.mortar = {20, 10, 10};
    d.mortarAmplitude = 5;
    d.gridSize = 8;
    d.rowHeight = 8;
    d.stagger = 0;
    return d;
}

FacetFill diamondFacets() {
    FacetFill d;
    d.base = {180, 230, 255};
    d.amplitude = 20;
    d.facetBrighten = 30;
    d.facetDarken = 20;
    d.sparkleChance = 0.05f;
    d.sparkle = {255, 255, 255};
    return d;
}

FacetFill emeraldFacets() {
    FacetFill d;
    d.base = {50, 230, 80};
    d.amplitude = 25;
    d.facetBrighten = 40;
    d.facetDarken = 25;
    d.sparkleChance = 0.03f;
    d.sparkle = {150, 255, 180};
    return d;
}

CrackFill iceCracks() {
    CrackFill d;
    d.base = {200, 230, 255};
    d.amplitude = 15;
    d.crackDarken = 40;
    d.highlight = 20;
    return d;
}

// --- Material generators ---

TextureSet generateGrassTop(RNG& rng, const GenOptions&) {
    return makeStaticSet("grass_top", fillNoise(rng, grassTopFill()));
}

TextureSet generateGrassSide(RNG& rng, const GenOptions&) {
    return makeStaticSet("grass_side", fillBands(rng, grassSideFill()));
}

TextureSet generateDirt(RNG& rng, const GenOptions&) {
    return makeStaticSet("dirt", fillNoise(rng, dirtFill()));
}

TextureSet generateStone(RNG& rng, const GenOptions&) {
    return makeStaticSet("stone", fillNoise(rng, stoneFill()));
}

TextureSet generateWood(RNG& rng, const GenOptions& opt) {
    const WoodFill d = woodFill();
    if (opt.wood == WoodStyle::Circles) return makeStaticSet("wood", fillWoodCircles(rng, d));
    return makeStaticSet("wood", fillWoodRings(rng, d));
}

TextureSet generateLeaves(RNG& rng, const GenOptions&) {
    return makeStaticSet("leaves", fillNoise(rng, leavesFill()));
}

TextureSet generateWater(RNG&, const GenOptions&) {
    std::vector<Bitmap> frames;
    frames.reserve(WATER_FRAMES);
    for (int f = 0; f < WATER_FRAMES; ++f) frames.push_back(waterFrame(f));
    return animatedSet("water", std::move(frames));
}

TextureSet generateLava(RNG& rng, const GenOptions&) {
    std::vector<Bitmap> frames;
    frames.reserve(LAVA_FRAMES);
    for (int f = 0; f < LAVA_FRAMES; ++f) frames.push_back(lavaFrame(rng, f));
    return animatedSet("lava", std::move(frames));
}

TextureSet generatePortal(RNG&, const GenOptions&) {
    std::vector<Bitmap> frames;
    frames.reserve(PORTAL_FRAMES);
    for (int f = 0; f < PORTAL_FRAMES; ++f) frames.push_back(portalFrame(f));
    return animatedSet("portal", std::move(frames));
}

TextureSet generateNetherrack(RNG& rng, const GenOptions&) {
    return makeStaticSet("netherrack", fillNoise(rng, netherrackFill()));
}

TextureSet generateNetherBrick(RNG& rng, const GenOptions&) {
    return makeStaticSet("nether_brick", fillBrickGrid(rng, netherBrickGrid()));
}

TextureSet generateSoulSand(RNG& rng, const GenOptions&) {
    return makeStaticSet("soul_sand", fillNoise(rng, soulSandFill()));
}

TextureSet generateGlowstone(RNG& rng, const GenOptions&) {
    return makeStaticSet("glowstone", fillGlowstone(rng));
}

TextureSet generateDiamond(RNG& rng, const GenOptions&) {
    return makeStaticSet("diamond", fillFacets(rng, diamondFacets()));
}

TextureSet generateEmerald(RNG& rng, const GenOptions&) {
    return makeStaticSet("emerald", fillFacets(rng, emeraldFacets()));
}

TextureSet generateObsidian(RNG& rng, const GenOptions&) {
    return makeStaticSet("obsidian", fillNoise(rng, obsidianFill()));
}

TextureSet generateIce(RNG& rng, const GenOptions&) {
    return makeStaticSet("ice", fillCracks(rng, iceCracks()));
}

TextureSet generateBrick(RNG& rng, const GenOptions&) {
    return makeStaticSet("brick", fillBrickGrid(rng, brickGrid()));
}

TextureSet generateSand(RNG& rng, const GenOptions&) {
    return makeStaticSet("sand", fillNoise(rng, sandFill()));
}
