#pragma once

#include "constants.hpp"

#include <optional>
#include <string>


enum class WorldType { Lone, Orbited, Satellite };


struct WorldInputs{

    std::string name;
    WorldType type = WorldType::Orbited;

    double mass = DEFAULT_MASS; //primary, or the planet a satellite orbits (earth masses)
    double density = DEFAULT_DENSITY; //of the subject body (earth densities)
    double star_mass = DEFAULT_STAR_MASS; //sol masses
    double star_distance = DEFAULT_STAR_DISTANCE; //AU
    double satellite_mass = DEFAULT_SATELLITE_MASS; //earth masses
    double satellite_distance = DEFAULT_SATELLITE_DISTANCE; //km
    double age = DEFAULT_AGE; //billions of years
    double eccentricity = DEFAULT_ECCENTRICITY;
    double luminosity = DEFAULT_LUMINOSITY; //sol luminosities
    double metallicity = DEFAULT_METALLICITY;

    bool outside_ice_line = false;
    bool grand_tack = false;
    bool rocky_satellite = false; //rocky satellite of a gas giant
    bool oort_cloud = false;
    bool runaway_greenhouse = false;
    bool tidal_heating = false;
};


//everything that follows directly from the inputs
struct WorldReport{

    double radius_km;
    double orbital_period_hours; //the subject's own orbit
    double year_hours; //star orbit (of the primary for a satellite)
    std::optional<double> satellite_period_hours;
    std::optional<double> synodic_month_hours;

    double tide_number;
    int tide_adjustment;

    double gravity; //earth g
    int blackbody_temperature; //kelvin
    int m_number;
};


WorldReport compute_world(const WorldInputs& in);

double subject_mass(const WorldInputs& in);
double radius_km(double mass, double density);
double star_orbit_period(double star_distance, double star_mass);
double satellite_orbit_period(double distance_km, double primary_mass, double satellite_mass);
double tide_number(const WorldInputs& in, double radius);
int tide_adjustment(double tide);

const char* world_type_label(WorldType type);
const char* world_type_token(WorldType type);
std::optional<WorldType> world_type_from_token(const std::string& token);
