#pragma once

#include "traits.hpp"


struct Hydrology{
    Water water;
    double percent;
    bool runaway_greenhouse;
};


Hydrology calc_water(const WorldInputs& in, const WorldReport& report, Dice& dice);
