#pragma once

#include "traits.hpp"


struct Obliquity{
    int degrees;
    bool unstable;
};


Obliquity calc_obliquity(const WorldInputs& in, const WorldReport& report, Resonance resonance, Dice& dice);
