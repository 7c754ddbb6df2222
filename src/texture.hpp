#pragma once
#include "common.hpp"
#include <cstdint>
#include <string>
#include <vector>

// Every texture in the set is this size. Not configurable.
constexpr int TEXTURE_SIZE = 16;

// One 16x16 frame.
//
// Pixels are only written through set(), which also counts writes so that a
// generation pass can be checked for full coverage (every pixel assigned
// exactly once).
struct Bitmap {
    static constexpr int w = TEXTURE_SIZE;
    static constexpr int h = TEXTURE_SIZE;

    std::vector<Color> px;       // row-major
    std::vector<uint8_t> writes; // per-pixel write count for this pass

    Bitmap()
        : px(static_cast<size_t>(w * h)),
          writes(static_cast<size_t>(w * h), 0) {}

    static bool inBounds(int x, int y) { return x >= 0 && y >= 0 && x < w && y < h; }

    const Color& at(int x, int y) const { return px[static_cast<size_t>(y * w + x)]; }

    void set(int x, int y, Color c) {
        if (!inBounds(x, y)) return;
        const size_t i = static_cast<size_t>(y * w + x);
        px[i] = c;
        if (writes[i] < 255) ++writes[i];
    }

    // True when every pixel was assigned exactly once.
    bool complete() const;
};

// A named group of frames. Static materials have one frame; animated ones
// carry their frames in playback order.
struct TextureSet {
    std::string name;
    std::vector<Bitmap> frames;
};

TextureSet makeStaticSet(const std::string& name, Bitmap frame);

// Playback helpers for renderers consuming the output.
//
// frameIndexAt() picks the frame shown at `seconds` when each frame is held
// for `frameSeconds` (looping). Static sets always return 0.
int frameIndexAt(const TextureSet& set, float seconds, float frameSeconds);

// Nearest-texel lookup with wrap-around (textures are tileable).
Color sampleBitmap(const Bitmap& bmp, float u, float v);
