#include "world.hpp"
#include "constants.hpp"

#include <algorithm>
#include <cmath>


double subject_mass(const WorldInputs& in){
    //in satellite mode "mass" is the primary, the subject is the satellite
    return in.type == WorldType::Satellite ? in.satellite_mass : in.mass;
}


double radius_km(double mass, double density){
    //spherical body: volume scales with mass / density
    return EARTH_RADIUS_KM * std::cbrt(mass / density);
}


double star_orbit_period(double star_distance, double star_mass){
    //kepler's third law in AU and sol masses
    return EARTH_YEAR_HOURS * std::sqrt(std::pow(star_distance, 3) / star_mass);
}


double satellite_orbit_period(double distance_km, double primary_mass, double satellite_mass){
    //same law in km and earth masses
    return SATELLITE_PERIOD_K * std::sqrt(std::pow(distance_km, 3) / (primary_mass + satellite_mass));
}


double tide_number(const WorldInputs& in, double radius){

    double k, mass, distance;
    switch(in.type){
        case WorldType::Lone:
            k = TIDE_K_STAR;
            mass = in.star_mass;
            distance = in.star_distance;
            break;
        case WorldType::Orbited:
            k = TIDE_K_SATELLITE;
            mass = in.satellite_mass;
            distance = in.satellite_distance;
            break;
        default:
            return 0.0;
    }

    return k * in.age * mass * mass * std::pow(radius, 3) / in.mass / std::pow(distance, 6);
}


int tide_adjustment(double tide){
    double adj = std::nearbyint(tide * 12.0);
    if(!(adj < TIDE_ADJ_LIMIT)) return static_cast<int>(TIDE_ADJ_LIMIT);
    return static_cast<int>(adj);
}


WorldReport compute_world(const WorldInputs& in){
    WorldReport r;

    double mass = subject_mass(in);
    r.radius_km = radius_km(mass, in.density);

    //the tables work on whole kilometres
    double radius = std::max(std::nearbyint(r.radius_km), 1.0);

    r.year_hours = star_orbit_period(in.star_distance, in.star_mass);
    r.orbital_period_hours = r.year_hours;

    if(in.type != WorldType::Lone){
        double s = satellite_orbit_period(in.satellite_distance, in.mass, in.satellite_mass);
        r.satellite_period_hours = s;
        if(in.type == WorldType::Satellite) r.orbital_period_hours = s;

        //month as seen from the sunlit side, prograde orbits only
        if(s < r.year_hours) r.synodic_month_hours = s * r.year_hours / (r.year_hours - s);
    }

    r.tide_number = tide_number(in, radius);
    r.tide_adjustment = tide_adjustment(r.tide_number);

    r.gravity = std::cbrt(mass * in.density * in.density);

    double bbt = std::nearbyint(BLACKBODY_1AU * std::pow(in.luminosity, 0.25) / std::sqrt(in.star_distance));
    if(!(bbt < BLACKBODY_LIMIT)) bbt = BLACKBODY_LIMIT;
    r.blackbody_temperature = static_cast<int>(bbt);

    double m = M_NUMBER_K * r.blackbody_temperature / in.density / (radius * radius);
    if(!(m < 1e6)) m = 1e6; //also catches nan
    r.m_number = static_cast<int>(m + 0.99999999);

    return r;
}


const char* world_type_label(WorldType type){
    switch(type){
        case WorldType::Lone: return "Lone Planet";
        case WorldType::Orbited: return "Planet with Satellite";
        case WorldType::Satellite: return "Satellite";
    }
    return "";
}


const char* world_type_token(WorldType type){
    switch(type){
        case WorldType::Lone: return "lone";
        case WorldType::Orbited: return "orbited";
        case WorldType::Satellite: return "satellite";
    }
    return "";
}


std::optional<WorldType> world_type_from_token(const std::string& token){
    if(token == "lone") return WorldType::Lone;
    if(token == "orbited") return WorldType::Orbited;
    if(token == "satellite") return WorldType::Satellite;
    return std::nullopt;
}
