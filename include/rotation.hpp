#pragma once

#include "traits.hpp"

#include <optional>


struct Rotation{
    double period_hours;
    Resonance resonance;
};


//sidereal rotation period and any tidal lock or spin-orbit resonance
Rotation calc_rotation_period(const WorldInputs& in, const WorldReport& report, Dice& dice);

//spin-orbit resonance an eccentric orbit settles into once tidally braked
Rotation adjust_for_eccentricity(double eccentricity, double orbital_period);


struct LocalDay{
    double hours;
    double days_per_year;
};

//solar day from rotation and orbital period, empty when the world keeps one face to its star
std::optional<LocalDay> local_day(const WorldReport& report, const Rotation& rotation);
