#include "traits.hpp"
#include "rotation.hpp"
#include "obliquity.hpp"
#include "hydrology.hpp"
#include "geophysics.hpp"


WorldTraits derive_traits(const WorldInputs& in, const WorldReport& report, Dice& dice){
    WorldTraits t;

    Rotation rotation = calc_rotation_period(in, report, dice);
    t.rotation_period_hours = rotation.period_hours;
    t.resonance = rotation.resonance;

    Obliquity obliquity = calc_obliquity(in, report, rotation.resonance, dice);
    t.obliquity_degrees = obliquity.degrees;
    t.obliquity_unstable = obliquity.unstable;

    std::optional<LocalDay> day = local_day(report, rotation);
    if(day){
        t.local_day_hours = day->hours;
        t.days_per_year = day->days_per_year;
    }

    Hydrology water = calc_water(in, report, dice);

    //geophysics reworks the water it is given
    Geophysics geo = calc_geophysics(in, report, rotation.resonance, water, dice);
    t.water = geo.hydrology.water;
    t.water_percent = geo.hydrology.percent;
    t.runaway_greenhouse = geo.hydrology.runaway_greenhouse;
    t.lithosphere = geo.lithosphere;
    t.tectonics = geo.tectonics;
    t.episodic_resurfacing = geo.episodic_resurfacing;

    return t;
}


const char* resonance_label(Resonance r){
    switch(r){
        case Resonance::None: return "";
        case Resonance::LockToSatellite: return "1:1 tidal lock with satellite";
        case Resonance::LockToPrimary: return "1:1 tidal lock with planet";
        case Resonance::LockToStar: return "1:1 tidal lock with star";
        case Resonance::Resonance3To2: return "3:2 resonance with star";
        case Resonance::Resonance2To1: return "2:1 resonance with star";
        case Resonance::Resonance5To2: return "5:2 resonance with star";
        case Resonance::Resonance3To1: return "3:1 resonance with star";
    }
    return "";
}


const char* water_label(Water w){
    switch(w){
        case Water::Trace: return "Trace";
        case Water::Minimal: return "Minimal";
        case Water::Moderate: return "Moderate";
        case Water::Extensive: return "Extensive";
        case Water::Massive: return "Massive";
    }
    return "";
}


const char* lithosphere_label(Lithosphere l){
    switch(l){
        case Lithosphere::Molten: return "Molten Lithosphere";
        case Lithosphere::Soft: return "Soft Lithosphere";
        case Lithosphere::EarlyPlate: return "Early Plate Lithosphere";
        case Lithosphere::MaturePlate: return "Mature Plate Lithosphere";
        case Lithosphere::AncientPlate: return "Ancient Plate Lithosphere";
        case Lithosphere::Solid: return "Solid Plate Lithosphere";
    }
    return "";
}


const char* tectonics_label(Tectonics t){
    switch(t){
        case Tectonics::None: return "No plate tectonics";
        case Tectonics::Mobile: return "Mobile plate tectonics";
        case Tectonics::Fixed: return "Fixed plate tectonics";
    }
    return "";
}
