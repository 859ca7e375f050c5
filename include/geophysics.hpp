#pragma once

#include "traits.hpp"
#include "hydrology.hpp"


struct Geophysics{
    Lithosphere lithosphere;
    Tectonics tectonics;
    bool episodic_resurfacing;
    Hydrology hydrology; //crust can boil off or raise the oceans
};


//tidal stress on the crust, 0 when unstressed
double tidal_stress(const WorldInputs& in, const WorldReport& report, Resonance resonance);

Geophysics calc_geophysics(const WorldInputs& in, const WorldReport& report, Resonance resonance,
                           const Hydrology& hydrology, Dice& dice);
