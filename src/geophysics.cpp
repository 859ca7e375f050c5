#include "geophysics.hpp"
#include "tables.hpp"
#include "constants.hpp"

#include <algorithm>
#include <cmath>


namespace {

bool is_plate(Lithosphere l){
    return l == Lithosphere::EarlyPlate || l == Lithosphere::MaturePlate || l == Lithosphere::AncientPlate;
}

bool is_spin_orbit_resonance(Resonance r){
    return r == Resonance::Resonance3To2 || r == Resonance::Resonance2To1
        || r == Resonance::Resonance5To2 || r == Resonance::Resonance3To1;
}

//extreme inputs saturate instead of overflowing
int round_to_int(double x){
    return static_cast<int>(std::clamp(std::nearbyint(x), -1e6, 1e6));
}

}


double tidal_stress(const WorldInputs& in, const WorldReport& report, Resonance resonance){

    double radius = std::nearbyint(report.radius_km);

    if(in.type == WorldType::Satellite){
        if(!in.tidal_heating) return 0.0;
        return STRESS_K_SATELLITE * in.mass * radius / std::pow(in.satellite_distance, 3);
    }

    if(resonance == Resonance::None) return 0.0;

    if(in.eccentricity >= 0.05 || is_spin_orbit_resonance(resonance) || in.tidal_heating){
        return STRESS_K_STAR * in.star_mass * radius / std::pow(in.star_distance, 3);
    }
    return 0.0;
}


Geophysics calc_geophysics(const WorldInputs& in, const WorldReport& report, Resonance resonance,
                           const Hydrology& hydrology, Dice& dice){

    Geophysics g{Lithosphere::Solid, Tectonics::None, false, hydrology};

    //older, smaller and metal poor worlds have cooled further
    int age_mod = round_to_int(8.0 * in.age);
    int primordial_heat_mod = round_to_int(-60.0 * std::log10(report.gravity));
    int radiogenic_heat_mod = round_to_int(-10.0 * std::log10(in.metallicity));

    int selector = age_mod + primordial_heat_mod + radiogenic_heat_mod + dice.roll(3);
    g.lithosphere = look_up(lithosphere_table(), selector);

    double f = tidal_stress(in, report, resonance);
    if(f > 0.0){
        Lithosphere stressed = look_up(lithosphere_stressed_table(), f);
        if(stressed < g.lithosphere) g.lithosphere = stressed;
    }

    if(is_plate(g.lithosphere)){
        int roll = dice.roll(3);
        if(hydrology.water == Water::Extensive || hydrology.water == Water::Massive) roll += 6;
        if(hydrology.water == Water::Minimal || hydrology.water == Water::Trace) roll -= 6;
        if(g.lithosphere == Lithosphere::EarlyPlate) roll += 2;
        if(g.lithosphere == Lithosphere::AncientPlate) roll -= 2;
        g.tectonics = roll >= 11 ? Tectonics::Mobile : Tectonics::Fixed;
    }

    if((g.lithosphere == Lithosphere::EarlyPlate || g.lithosphere == Lithosphere::MaturePlate)
       && g.tectonics == Tectonics::Fixed){
        g.episodic_resurfacing = true;
    }

    Hydrology& h = g.hydrology;

    if(g.lithosphere == Lithosphere::Molten && h.water != Water::Massive){
        h.water = Water::Trace;
        h.percent = 0.0;
    }

    if(h.water == Water::Extensive){
        int roll = dice.roll(3);
        if(g.lithosphere == Lithosphere::Soft || g.lithosphere == Lithosphere::Solid){
            h.percent += roll + 10;
        } else if(g.lithosphere == Lithosphere::EarlyPlate || g.lithosphere == Lithosphere::AncientPlate){
            h.percent += roll;
        }
        h.percent = std::min(h.percent, 100.0);
    }

    return g;
}
