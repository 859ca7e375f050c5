#include "rotation.hpp"
#include "tables.hpp"


Rotation adjust_for_eccentricity(double eccentricity, double orbital_period){

    if(eccentricity <= 0.12) return {orbital_period, Resonance::LockToStar};
    if(eccentricity < 0.25)  return {orbital_period * 2.0 / 3.0, Resonance::Resonance3To2};
    if(eccentricity < 0.35)  return {orbital_period * 0.5, Resonance::Resonance2To1};
    if(eccentricity < 0.45)  return {orbital_period * 0.4, Resonance::Resonance5To2};

    return {orbital_period / 3.0, Resonance::Resonance3To1};
}


Rotation calc_rotation_period(const WorldInputs& in, const WorldReport& report, Dice& dice){

    //always rolled so the dice stream doesn't depend on the world type
    int roll = dice.roll(3);

    if(in.type == WorldType::Satellite){
        return {report.orbital_period_hours, Resonance::LockToPrimary};
    }

    int adjusted = report.tide_adjustment + roll;

    //braked to a halt
    if(report.tide_number >= 2.0 || adjusted >= 24){
        if(in.type == WorldType::Lone){
            return adjust_for_eccentricity(in.eccentricity, report.orbital_period_hours);
        }
        return {*report.satellite_period_hours, Resonance::LockToSatellite};
    }

    const Range<double>& range = look_up(planet_rotation_rate(), adjusted);
    double period = dice.uniform(range.lo, range.hi);

    if(period >= report.orbital_period_hours){
        return adjust_for_eccentricity(in.eccentricity, report.orbital_period_hours);
    }

    return {period, Resonance::None};
}


std::optional<LocalDay> local_day(const WorldReport& report, const Rotation& rotation){

    if(rotation.resonance == Resonance::LockToStar) return std::nullopt;

    double p = report.orbital_period_hours;
    double r = rotation.period_hours;

    double day = p * r / (r + p);
    if(!(day > 0.0)) return std::nullopt;

    return LocalDay{day, p / day};
}
