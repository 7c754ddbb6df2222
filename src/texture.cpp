#include "texture.hpp"

#include <cmath>
#include <utility>

bool Bitmap::complete() const {
    for (uint8_t n : writes) {
        if (n != 1) return false;
    }
    return true;
}

TextureSet makeStaticSet(const std::string& name, Bitmap frame) {
    TextureSet set;
    set.name = name;
    set.frames.push_back(std::move(frame));
    return set;
}

int frameIndexAt(const TextureSet& set, float seconds, float frameSeconds) {
    const int count = static_cast<int>(set.frames.size());
    if (count <= 1 || frameSeconds <= 0.0f || seconds <= 0.0f) return 0;
    if (!std::isfinite(seconds) || !std::isfinite(frameSeconds)) return 0;

    const double steps = std::floor(static_cast<double>(seconds) / static_cast<double>(frameSeconds));
    if (!std::isfinite(steps)) return 0;
    return static_cast<int>(std::fmod(steps, static_cast<double>(count)));
}

Color sampleBitmap(const Bitmap& bmp, float u, float v) {
    // Non-finite coordinates map to texel 0.
    auto wrap = [](float t, int size) {
        if (!std::isfinite(t)) return 0;
        double f = std::fmod(std::floor(static_cast<double>(t) * size), static_cast<double>(size));
        if (f < 0.0) f += size;
        const int i = static_cast<int>(f);
        return i >= size ? 0 : i;
    };
    return bmp.at(wrap(u, Bitmap::w), wrap(v, Bitmap::h));
}
