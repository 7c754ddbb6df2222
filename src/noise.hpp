#pragma once
#include "common.hpp"
#include "rng.hpp"

// Shifts all three channels of `c` by one shared random offset drawn from
// [-amount, amount], then clamps each channel. amount <= 0 returns `c`.
Color perturb(RNG& rng, Color c, int amount);

// Clamped per-channel arithmetic used by the override rules.
Color darken(Color c, int amount);
Color brighten(Color c, int amount);
Color shift(Color c, int dr, int dg, int db);
