#include "cli.hpp"
#include "constants.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;


//message of the UsageError the arguments raise, empty if they parse
static std::string usage_error(const std::vector<std::string>& args){
    try {
        parse_args(args);
    } catch(const UsageError& e) {
        return e.what();
    }
    return "";
}


void test_defaults() {
    CliOptions opts = parse_args({"Earth", "orbited"});
    const WorldInputs& in = opts.inputs;

    assert(!opts.show_help);
    assert(!opts.seed);
    assert(in.name == "Earth");
    assert(in.type == WorldType::Orbited);
    assert(in.mass == DEFAULT_MASS);
    assert(in.star_mass == DEFAULT_STAR_MASS);
    assert(in.star_distance == DEFAULT_STAR_DISTANCE);
    assert(in.satellite_mass == DEFAULT_SATELLITE_MASS);
    assert(in.satellite_distance == DEFAULT_SATELLITE_DISTANCE);
    assert(in.age == DEFAULT_AGE);
    assert(in.density == DEFAULT_DENSITY);
    assert(in.eccentricity == DEFAULT_ECCENTRICITY);
    assert(in.luminosity == DEFAULT_LUMINOSITY);
    assert(in.metallicity == DEFAULT_METALLICITY);
    assert(!in.outside_ice_line && !in.grand_tack && !in.rocky_satellite);
    assert(!in.oort_cloud && !in.runaway_greenhouse && !in.tidal_heating);

    std::cout << "[PASS] Defaults fill every unset option.\n";
}


void test_option_forms() {
    CliOptions opts = parse_args({"Arcadia", "lone", "-m", "0.93", "--mass_star=0.94", "-D0.892",
                                  "--density", "0.879", "-e", "0.1", "--metal", "1.5"});
    const WorldInputs& in = opts.inputs;
    assert(in.type == WorldType::Lone);
    assert(in.mass == 0.93);
    assert(in.star_mass == 0.94);
    assert(in.star_distance == 0.892);
    assert(in.density == 0.879);
    assert(in.eccentricity == 0.1);
    assert(in.metallicity == 1.5);

    //options may come before the positionals
    opts = parse_args({"-s", "0.5", "-d", "100000", "Moon", "satellite", "-o", "-g", "-r", "-t",
                       "--oort_cloud", "--green_house"});
    assert(opts.inputs.name == "Moon");
    assert(opts.inputs.type == WorldType::Satellite);
    assert(opts.inputs.satellite_mass == 0.5);
    assert(opts.inputs.satellite_distance == 100000.0);
    assert(opts.inputs.outside_ice_line && opts.inputs.grand_tack && opts.inputs.rocky_satellite);
    assert(opts.inputs.tidal_heating && opts.inputs.oort_cloud && opts.inputs.runaway_greenhouse);

    //unique prefixes of long options
    opts = parse_args({"Sun", "lone", "--lum", "2", "--ag=3"});
    assert(opts.inputs.luminosity == 2.0);
    assert(opts.inputs.age == 3.0);

    //clustered short switches, a value may close the cluster
    opts = parse_args({"X", "lone", "-og", "-rtm0.5"});
    assert(opts.inputs.outside_ice_line && opts.inputs.grand_tack);
    assert(opts.inputs.rocky_satellite && opts.inputs.tidal_heating);
    assert(opts.inputs.mass == 0.5);
    assert(parse_args({"X", "lone", "-oh"}).show_help);

    //last one wins
    opts = parse_args({"X", "lone", "-m", "2", "-m", "3"});
    assert(opts.inputs.mass == 3.0);

    std::cout << "[PASS] Short, long, attached and prefixed option forms.\n";
}


void test_bad_values() {
    assert(usage_error({"X", "lone", "-m", "abc"}) == "argument -m/--mass: invalid float value: 'abc'");
    assert(usage_error({"X", "lone", "--metal", "0x10"}) == "argument --metal: invalid float value: '0x10'");
    assert(usage_error({"X", "lone", "-m", "-5"}) == "\"-5\" should be a positive float");
    assert(usage_error({"X", "lone", "-k", "0"}) == "\"0\" should be a positive float");
    assert(usage_error({"X", "lone", "-a", "0"}) == "\"0\" should be a positive float");
    assert(usage_error({"X", "lone", "-m", "inf"}) == "\"inf\" should be a finite float");
    assert(usage_error({"X", "lone", "-D", "nan"}) == "\"nan\" should be a finite float");
    assert(usage_error({"X", "lone", "-e", "-0.1"}) == "\"-0.1\" should be zero or a positive float");
    assert(usage_error({"X", "lone", "-e", "1"}) == "\"1\" should be less than 1");

    //positive values are checked before eccentricity, in option order
    assert(usage_error({"X", "lone", "-e", "2", "-k", "-1", "-m", "0"}) == "\"0\" should be a positive float");

    //every strictly positive option refuses zero and negatives
    for(const char* flag : {"-m", "-M", "-D", "-l", "-s", "-d", "-a", "-k", "--metal"}){
        assert(usage_error({"X", "orbited", flag, "0"}) == "\"0\" should be a positive float");
        assert(usage_error({"X", "orbited", flag, "-1"}) == "\"-1\" should be a positive float");
    }

    //each value is fine alone but together they overflow
    assert(usage_error({"X", "lone", "-m", "1e300", "-k", "1e-300"}) == "mass and density give a radius out of range");
    assert(usage_error({"X", "satellite", "-s", "1e300", "-k", "1e-300"}) == "mass and density give a radius out of range");
    assert(usage_error({"X", "lone", "-m", "1e-300", "-k", "1e300"}) == "mass and density give a radius out of range");
    assert(usage_error({"X", "lone", "-D", "1e200"}) == "distance and mass give an orbital period out of range");
    assert(usage_error({"X", "orbited", "-d", "1e200"}) == "distance and mass give an orbital period out of range");

    //zero eccentricity is a circular orbit
    assert(usage_error({"X", "lone", "-e", "0"}).empty());

    std::cout << "[PASS] Out of range and malformed numbers are rejected.\n";
}


void test_bad_arguments() {
    assert(usage_error({}) == "the following arguments are required: str, str");
    assert(usage_error({"X"}) == "the following arguments are required: str");
    assert(usage_error({"X", "planet"})
           == "argument str: invalid choice: 'planet' (choose from 'lone', 'orbited', 'satellite')");
    assert(usage_error({"X", "lone", "extra"}) == "unrecognized arguments: extra");
    assert(usage_error({"X", "lone", "--bogus", "-z"}) == "unrecognized arguments: --bogus -z");
    assert(usage_error({"X", "lone", "-m"}) == "argument -m/--mass: expected one argument");
    assert(usage_error({"X", "lone", "-m", "-g"}) == "argument -m/--mass: expected one argument");
    assert(usage_error({"X", "lone", "-oz"}) == "argument -o/--outside_ice_line: ignored explicit argument 'z'");
    assert(usage_error({"X", "lone", "-go1"}) == "argument -o/--outside_ice_line: ignored explicit argument '1'");
    assert(usage_error({"X", "lone", "--grand_tack=1"}) == "argument -g/--grand_tack: ignored explicit argument '1'");
    assert(usage_error({"X", "lone", "--ma", "2"}) == "ambiguous option: --ma could match --mass, --mass_star");
    assert(usage_error({"", "lone"}) == "argument str: the world needs a name");

    std::cout << "[PASS] Missing, unknown and ambiguous arguments are rejected.\n";
}


void test_help_and_usage() {
    assert(parse_args({"-h"}).show_help);
    assert(parse_args({"X", "lone", "--help"}).show_help);
    assert(parse_args({"--he"}).show_help);

    std::string usage = usage_text("worldsmith");
    assert(usage.rfind("usage: worldsmith [-h]", 0) == 0);
    assert(usage.find("[-m mass]") != std::string::npos);
    assert(usage.find("str str\n") != std::string::npos);

    size_t start = 0;
    while(start < usage.size()){
        size_t end = usage.find('\n', start);
        assert(end - start <= 80);
        start = end + 1;
    }

    std::string help = help_text("worldsmith");
    assert(help.rfind(usage, 0) == 0);
    assert(help.find("Mass of primary in Earth masses (default: 1.0)") != std::string::npos);
    assert(help.find("-e float, --ecc float") != std::string::npos);

    std::cout << "[PASS] Help and usage text.\n";
}


void test_seed() {
    assert(*parse_args({"X", "lone", "--seed", "42"}).seed == 42u);
    assert(*parse_args({"X", "lone", "--seed=4294967295"}).seed == 4294967295u);
    assert(usage_error({"X", "lone", "--seed", "4294967296"}) == "argument --seed: invalid int value: '4294967296'");
    assert(usage_error({"X", "lone", "--seed", "-1"}) == "argument --seed: invalid int value: '-1'");
    assert(usage_error({"X", "lone", "--seed", "1.5"}) == "argument --seed: invalid int value: '1.5'");

    std::cout << "[PASS] Seed option.\n";
}


void test_config_file() {
    fs::path path = fs::temp_directory_path() / "worldsmith_test.cfg";
    {
        std::ofstream out(path);
        out << "# system defaults\n";
        out << "mass = 2.0\n";
        out << "age = 3   # younger system\n";
        out << "grand_tack = 1\n";
        out << "seed = 7\n";
        out << "bogus = 4\n";
        out << "no equals here\n";
    }

    CliOptions opts = parse_args({"X", "lone", "-c", path.string(), "-m", "0.5"});
    assert(opts.inputs.mass == 0.5); //command line beats the file
    assert(opts.inputs.age == 3.0);
    assert(opts.inputs.grand_tack);
    assert(*opts.seed == 7u);

    std::map<std::string, double> cfg = parse_config(path.string());
    assert(cfg.size() == 5);
    assert(cfg.at("bogus") == 4.0);

    //values from the file go through the same range checks
    {
        std::ofstream out(path);
        out << "ecc = 1.5\n";
    }
    assert(usage_error({"X", "lone", "--config", path.string()}) == "\"1.5\" should be less than 1");

    fs::remove(path);

    std::string missing = (fs::temp_directory_path() / "worldsmith_missing.cfg").string();
    assert(usage_error({"X", "lone", "-c", missing}) == "can't open config file '" + missing + "'");

    std::cout << "[PASS] Config file values sit under the command line.\n";
}


int main() {
    test_defaults();
    test_option_forms();
    test_bad_values();
    test_bad_arguments();
    test_help_and_usage();
    test_seed();
    test_config_file();
    std::cout << "All cli tests passed.\n";
    return 0;
}
