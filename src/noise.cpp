#include "noise.hpp"

Color shift(Color c, int dr, int dg, int db) {
    return { clamp8(static_cast<int>(c.r) + dr),
             clamp8(static_cast<int>(c.g) + dg),
             clamp8(static_cast<int>(c.b) + db) };
}

Color darken(Color c, int amount) {
    return shift(c, -amount, -amount, -amount);
}

Color brighten(Color c, int amount) {
    return shift(c, amount, amount, amount);
}

Color perturb(RNG& rng, Color c, int amount) {
    // amount <= 0 still consumes one draw.
    if (amount <= 0) {
        rng.nextU32();
        return c;
    }
    const int n = rng.range(-amount, amount);
    return shift(c, n, n, n);
}
