#pragma once

//reference values, fitted so earth and luna come out exact
constexpr double EARTH_RADIUS_KM = 6378.0; //radius of a 1 M, 1 K world
constexpr double EARTH_YEAR_HOURS = 8766.0; //1 AU around a 1 Sol star
constexpr double SATELLITE_PERIOD_K = 2.768e-6; //hours for km and earth masses

//tide number constants
constexpr double TIDE_K_STAR = 9.6e-14;
constexpr double TIDE_K_SATELLITE = 1e25;
constexpr double TIDE_ADJ_LIMIT = 1000.0; //clamp for the x12 table modifier

//blackbody temperature of a 1 L world at 1 AU in kelvin
constexpr double BLACKBODY_1AU = 278.0;
constexpr double BLACKBODY_LIMIT = 1e9; //keeps grazing orbits inside an int
constexpr double M_NUMBER_K = 700000.0;

//tidal stress constants
constexpr double STRESS_K_SATELLITE = 1.59e15;
constexpr double STRESS_K_STAR = 1.57e-4;

//command line defaults
constexpr double DEFAULT_MASS = 1.0; //earth masses
constexpr double DEFAULT_STAR_MASS = 1.0; //sol masses
constexpr double DEFAULT_STAR_DISTANCE = 1.0; //AU
constexpr double DEFAULT_SATELLITE_MASS = 0.0123; //earth masses
constexpr double DEFAULT_SATELLITE_DISTANCE = 384400.0; //km
constexpr double DEFAULT_AGE = 4.568; //billions of years
constexpr double DEFAULT_DENSITY = 1.0; //earth densities
constexpr double DEFAULT_ECCENTRICITY = 0.0;
constexpr double DEFAULT_LUMINOSITY = 1.0; //sol luminosities
constexpr double DEFAULT_METALLICITY = 1.0; //sol = 1
