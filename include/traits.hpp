#pragma once

#include "world.hpp"
#include "dice.hpp"

#include <optional>


enum class Resonance {
    None,
    LockToSatellite,
    LockToPrimary,
    LockToStar,
    Resonance3To2,
    Resonance2To1,
    Resonance5To2,
    Resonance3To1
};

enum class Water { Trace, Minimal, Moderate, Extensive, Massive };

//ordered from most to least geologically active
enum class Lithosphere {
    Molten = 1,
    Soft,
    EarlyPlate,
    MaturePlate,
    AncientPlate,
    Solid
};

enum class Tectonics { None, Mobile, Fixed };


//characteristics that need dice
struct WorldTraits{

    double rotation_period_hours;
    Resonance resonance;

    int obliquity_degrees;
    bool obliquity_unstable;

    std::optional<double> local_day_hours;
    std::optional<double> days_per_year;

    Water water;
    double water_percent;
    bool runaway_greenhouse;

    Lithosphere lithosphere;
    Tectonics tectonics;
    bool episodic_resurfacing;
};


//runs rotation, obliquity, day length, water and geophysics in that order
WorldTraits derive_traits(const WorldInputs& in, const WorldReport& report, Dice& dice);

const char* resonance_label(Resonance r);
const char* water_label(Water w);
const char* lithosphere_label(Lithosphere l);
const char* tectonics_label(Tectonics t);
