#include "cli.hpp"
#include "constants.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <set>
#include <sstream>
#include <utility>


namespace {

enum class OptionKind { Float, Switch, Seed, Config };

enum class Domain { Any, Positive, Eccentricity };

struct OptionDef{
    char short_name; //'\0' when there is none
    const char* long_name; //also the config file key
    OptionKind kind;
    const char* metavar;
    const char* help;
    const char* default_text;
    Domain domain;
};


//help order, positive values are checked in this order too
const std::vector<OptionDef>& option_defs(){
    static const std::vector<OptionDef> defs = {
        {'m', "mass", OptionKind::Float, "mass", "Mass of primary in Earth masses", "1.0", Domain::Positive},
        {'M', "mass_star", OptionKind::Float, "mass", "Mass of star in Sol masses", "1.0", Domain::Positive},
        {'D', "distance_star", OptionKind::Float, "distance", "Distance of star in AU", "1.0", Domain::Positive},
        {'l', "luminosity", OptionKind::Float, "float", "Luminosity of star multiples of solar luminosity", "1.0", Domain::Positive},
        {'s', "satellite_mass", OptionKind::Float, "mass", "Mass of satellite in Earth masses", "0.0123", Domain::Positive},
        {'d', "distance_primary", OptionKind::Float, "distance km", "Distance of satellite in km", "384400", Domain::Positive},
        {'a', "age", OptionKind::Float, "float", "Age of system in billions of years", "4.568", Domain::Positive},
        {'k', "density", OptionKind::Float, "float", "Density of world in earth densities", "1.0", Domain::Positive},
        {'e', "ecc", OptionKind::Float, "float", "Eccentricity of orbit", "0.0", Domain::Eccentricity},
        {'\0', "metal", OptionKind::Float, "float", "Metallicity of system, with Sol being 1", "1.0", Domain::Positive},
        {'o', "outside_ice_line", OptionKind::Switch, nullptr, "Is outside formation ice line", "False", Domain::Any},
        {'g', "grand_tack", OptionKind::Switch, nullptr, "System has undergone Grand Tack event", "False", Domain::Any},
        {'r', "rocky_sat", OptionKind::Switch, nullptr, "World is rocky satellite of gas giant", "False", Domain::Any},
        {'\0', "oort_cloud", OptionKind::Switch, nullptr, "Planet in Oort cloud", "False", Domain::Any},
        {'\0', "green_house", OptionKind::Switch, nullptr, "Planet has experienced runaway greenhouse event", "False", Domain::Any},
        {'t', "tidal_heating", OptionKind::Switch, nullptr, "World is heated by orbital tides", "False", Domain::Any},
        {'\0', "seed", OptionKind::Seed, "int", "Seed for the dice, random when omitted", "None", Domain::Any},
        {'c', "config", OptionKind::Config, "file", "File of key = value defaults", "None", Domain::Any}
    };
    return defs;
}


const OptionDef* find_option(const std::string& long_name){
    for(const auto& opt : option_defs()){
        if(long_name == opt.long_name) return &opt;
    }
    return nullptr;
}


//"-m/--mass" or "--metal"
std::string option_name(const OptionDef& opt){
    std::string name;
    if(opt.short_name != '\0'){
        name += '-';
        name += opt.short_name;
        name += '/';
    }
    return name + "--" + opt.long_name;
}


//python float(): surrounding whitespace, decimal notation, inf and nan
bool parse_float(const std::string& text, double& out){
    size_t start = text.find_first_not_of(" \t\r\n");
    if(start == std::string::npos) return false;
    size_t end = text.find_last_not_of(" \t\r\n");
    std::string s = text.substr(start, end - start + 1);

    //strtod would also take hex
    if(s.find_first_of("xX") != std::string::npos) return false;

    char* stop = nullptr;
    double value = std::strtod(s.c_str(), &stop);
    if(stop != s.c_str() + s.size()) return false;

    out = value;
    return true;
}


bool parse_seed(const std::string& text, std::uint32_t& out){
    if(text.empty() || text.find_first_not_of("0123456789") != std::string::npos) return false;
    if(text.size() > 10) return false;

    unsigned long long value = std::strtoull(text.c_str(), nullptr, 10);
    if(value > std::numeric_limits<std::uint32_t>::max()) return false;

    out = static_cast<std::uint32_t>(value);
    return true;
}


//"-5" and "-.5" are values, not options
bool is_negative_number(const std::string& tok){
    if(tok.size() < 2 || tok[0] != '-') return false;
    std::string rest = tok.substr(1);
    size_t dot = rest.find('.');
    std::string whole = rest.substr(0, dot);
    if(whole.find_first_not_of("0123456789") != std::string::npos) return false;
    if(dot == std::string::npos) return !whole.empty();
    std::string frac = rest.substr(dot + 1);
    return !frac.empty() && frac.find_first_not_of("0123456789") == std::string::npos;
}


bool looks_like_option(const std::string& tok){
    return tok.size() > 1 && tok[0] == '-' && !is_negative_number(tok);
}


std::string format_number(double value){
    std::ostringstream out;
    out << std::setprecision(17) << value;
    return out.str();
}


struct Setting{
    double value;
    std::string text; //as the user wrote it, for error messages
};


struct ParsedArgs{
    std::map<std::string, Setting> values;
    std::set<std::string> switches;
    std::optional<std::uint32_t> seed;
    std::optional<std::string> config_path;
    std::vector<std::pair<size_t, std::string>> positionals;
    std::vector<std::pair<size_t, std::string>> unrecognized;
    bool help = false;
};


//exact long name first, then a unique prefix the way argparse does it
const OptionDef* match_long(const std::string& name, bool& is_help){
    is_help = false;
    if(name == "help"){
        is_help = true;
        return nullptr;
    }
    if(const OptionDef* exact = find_option(name)) return exact;

    std::vector<std::string> candidates;
    const OptionDef* match = nullptr;
    if(std::string("help").compare(0, name.size(), name) == 0) candidates.push_back("--help");
    for(const auto& opt : option_defs()){
        if(std::string(opt.long_name).compare(0, name.size(), name) == 0){
            candidates.push_back(std::string("--") + opt.long_name);
            match = &opt;
        }
    }

    if(candidates.size() > 1){
        std::string msg = "ambiguous option: --" + name + " could match ";
        for(size_t i = 0; i < candidates.size(); i++){
            if(i > 0) msg += ", ";
            msg += candidates[i];
        }
        throw UsageError(msg);
    }
    if(candidates.size() == 1 && !match) is_help = true;
    return match;
}


const OptionDef* match_short(char c){
    for(const auto& opt : option_defs()){
        if(opt.short_name == c) return &opt;
    }
    return nullptr;
}


ParsedArgs scan_args(const std::vector<std::string>& args){
    ParsedArgs parsed;
    bool options_done = false;

    std::vector<std::string> tokens = args;

    for(size_t i = 0; i < tokens.size(); i++){
        const std::string tok = tokens[i];

        if(options_done || !looks_like_option(tok)){
            parsed.positionals.emplace_back(i, tok);
            continue;
        }
        if(tok == "--"){
            options_done = true;
            continue;
        }

        const OptionDef* opt = nullptr;
        std::optional<std::string> explicit_value;
        bool is_help = false;

        if(tok.compare(0, 2, "--") == 0){
            std::string name = tok.substr(2);
            size_t eq = name.find('=');
            if(eq != std::string::npos){
                explicit_value = name.substr(eq + 1);
                name = name.substr(0, eq);
            }
            opt = match_long(name, is_help);
        } else {
            is_help = tok[1] == 'h';
            opt = match_short(tok[1]);
            if(tok.size() > 2) explicit_value = tok.substr(2);
        }

        if(is_help){
            parsed.help = true;
            return parsed;
        }
        if(!opt){
            parsed.unrecognized.emplace_back(i, tok);
            continue;
        }

        if(opt->kind == OptionKind::Switch){
            parsed.switches.insert(opt->long_name);
            if(!explicit_value) continue;

            //short switches cluster, -og reads as -o -g
            char next = (*explicit_value)[0];
            if(tok.compare(0, 2, "--") != 0 && (next == 'h' || match_short(next))){
                tokens[i] = "-" + *explicit_value;
                i--;
                continue;
            }
            throw UsageError("argument " + option_name(*opt) + ": ignored explicit argument '" + *explicit_value + "'");
        }

        std::string value;
        if(explicit_value){
            value = *explicit_value;
        } else if(i + 1 < tokens.size() && !looks_like_option(tokens[i + 1])){
            value = tokens[++i];
        } else {
            throw UsageError("argument " + option_name(*opt) + ": expected one argument");
        }

        switch(opt->kind){
            case OptionKind::Float: {
                double v;
                if(!parse_float(value, v)){
                    throw UsageError("argument " + option_name(*opt) + ": invalid float value: '" + value + "'");
                }
                parsed.values[opt->long_name] = Setting{v, value};
                break;
            }
            case OptionKind::Seed: {
                std::uint32_t seed;
                if(!parse_seed(value, seed)){
                    throw UsageError("argument " + option_name(*opt) + ": invalid int value: '" + value + "'");
                }
                parsed.seed = seed;
                break;
            }
            default:
                parsed.config_path = value;
                break;
        }
    }

    return parsed;
}


//config file values sit under the command line ones
void apply_config(ParsedArgs& parsed, const std::map<std::string, double>& cfg){
    for(const auto& [key, value] : cfg){
        const OptionDef* opt = find_option(key);
        if(!opt || opt->kind == OptionKind::Config){
            std::cerr << "WARNING: Ignoring unknown config key: " << key << "\n";
            continue;
        }

        switch(opt->kind){
            case OptionKind::Float:
                parsed.values.emplace(key, Setting{value, format_number(value)});
                break;
            case OptionKind::Switch:
                if(value != 0.0) parsed.switches.insert(key);
                break;
            default:
                if(parsed.seed) break;
                if(value < 0.0 || value > std::numeric_limits<std::uint32_t>::max() || value != std::floor(value)){
                    std::cerr << "WARNING: Ignoring config seed (not a 32 bit unsigned integer): " << format_number(value) << "\n";
                    break;
                }
                parsed.seed = static_cast<std::uint32_t>(value);
                break;
        }
    }
}


Setting setting(const ParsedArgs& parsed, const OptionDef& opt){
    auto it = parsed.values.find(opt.long_name);
    if(it != parsed.values.end()) return it->second;

    double v = 0.0;
    parse_float(opt.default_text, v);
    return Setting{v, opt.default_text};
}


void check_domain(const Setting& s, Domain domain){
    if(!std::isfinite(s.value)){
        throw UsageError("\"" + s.text + "\" should be a finite float");
    }
    if(domain == Domain::Positive && s.value <= 0.0){
        throw UsageError("\"" + s.text + "\" should be a positive float");
    }
    if(domain == Domain::Eccentricity){
        if(s.value < 0.0) throw UsageError("\"" + s.text + "\" should be zero or a positive float");
        if(s.value >= 1.0) throw UsageError("\"" + s.text + "\" should be less than 1");
    }
}


std::string join_tokens(std::vector<std::pair<size_t, std::string>> tokens){
    std::sort(tokens.begin(), tokens.end());
    std::string out;
    for(size_t i = 0; i < tokens.size(); i++){
        if(i > 0) out += " ";
        out += tokens[i].second;
    }
    return out;
}

}


std::map<std::string, double> parse_config(const std::string& filename){
    std::map<std::string, double> cfg;
    std::ifstream in(filename);
    if(!in.is_open()){
        throw UsageError("can't open config file '" + filename + "'");
    }

    std::string line;
    int line_num = 0;
    while(std::getline(in, line)){
        line_num++;

        //strip comments
        auto pos = line.find('#');
        if(pos != std::string::npos) line = line.substr(0, pos);

        //skip blank lines
        if(line.find_first_not_of(" \t\r\n") == std::string::npos) continue;

        //find '='
        auto eq = line.find('=');
        if(eq == std::string::npos){
            std::cerr << "WARNING: Skipping line " << line_num << " (no '=' found): " << line << "\n";
            continue;
        }

        //extract key and value
        std::string key = line.substr(0, eq);
        std::string val = line.substr(eq + 1);

        //trim whitespace
        auto trim = [](std::string& s){
            size_t start = s.find_first_not_of(" \t\r\n");
            size_t end   = s.find_last_not_of(" \t\r\n");
            s = (start == std::string::npos) ? "" : s.substr(start, end - start + 1);
        };
        trim(key);
        trim(val);

        if(key.empty() || val.empty()) continue;

        double v;
        if(!parse_float(val, v)){
            std::cerr << "WARNING: Skipping line " << line_num << " (bad number): " << val << "\n";
            continue;
        }
        cfg[key] = v;
    }

    return cfg;
}


CliOptions parse_args(const std::vector<std::string>& args){
    CliOptions opts;

    ParsedArgs parsed = scan_args(args);
    if(parsed.help){
        opts.show_help = true;
        return opts;
    }

    //positionals: name then type
    if(parsed.positionals.size() >= 2){
        const std::string& token = parsed.positionals[1].second;
        std::optional<WorldType> type = world_type_from_token(token);
        if(!type){
            throw UsageError("argument str: invalid choice: '" + token + "' (choose from 'lone', 'orbited', 'satellite')");
        }
        opts.inputs.type = *type;
    }
    if(parsed.positionals.size() < 2){
        throw UsageError(parsed.positionals.empty()
            ? "the following arguments are required: str, str"
            : "the following arguments are required: str");
    }

    for(size_t i = 2; i < parsed.positionals.size(); i++){
        parsed.unrecognized.push_back(parsed.positionals[i]);
    }
    if(!parsed.unrecognized.empty()){
        throw UsageError("unrecognized arguments: " + join_tokens(parsed.unrecognized));
    }

    opts.inputs.name = parsed.positionals[0].second;
    if(opts.inputs.name.empty()){
        throw UsageError("argument str: the world needs a name");
    }

    if(parsed.config_path) apply_config(parsed, parse_config(*parsed.config_path));

    //range checks, strictly positive values first
    for(const auto& opt : option_defs()){
        if(opt.domain == Domain::Positive) check_domain(setting(parsed, opt), opt.domain);
    }
    for(const auto& opt : option_defs()){
        if(opt.domain == Domain::Eccentricity) check_domain(setting(parsed, opt), opt.domain);
    }

    auto value = [&](const char* name){ return setting(parsed, *find_option(name)).value; };
    auto on = [&](const char* name){ return parsed.switches.count(name) > 0; };

    WorldInputs& in = opts.inputs;
    in.mass = value("mass");
    in.star_mass = value("mass_star");
    in.star_distance = value("distance_star");
    in.luminosity = value("luminosity");
    in.satellite_mass = value("satellite_mass");
    in.satellite_distance = value("distance_primary");
    in.age = value("age");
    in.density = value("density");
    in.eccentricity = value("ecc");
    in.metallicity = value("metal");

    in.outside_ice_line = on("outside_ice_line");
    in.grand_tack = on("grand_tack");
    in.rocky_satellite = on("rocky_sat");
    in.oort_cloud = on("oort_cloud");
    in.runaway_greenhouse = on("green_house");
    in.tidal_heating = on("tidal_heating");

    //values that pass one at a time can still overflow together
    double radius = radius_km(subject_mass(in), in.density);
    if(!std::isfinite(radius) || radius <= 0.0){
        throw UsageError("mass and density give a radius out of range");
    }
    bool period_ok = std::isfinite(star_orbit_period(in.star_distance, in.star_mass));
    if(in.type != WorldType::Lone){
        period_ok = period_ok && std::isfinite(satellite_orbit_period(in.satellite_distance, in.mass, in.satellite_mass));
    }
    if(!period_ok){
        throw UsageError("distance and mass give an orbital period out of range");
    }

    opts.seed = parsed.seed;
    return opts;
}


std::string usage_text(const std::string& prog){

    std::vector<std::string> parts = {"[-h]"};
    for(const auto& opt : option_defs()){
        std::string part = "[";
        if(opt.short_name != '\0'){
            part += '-';
            part += opt.short_name;
        } else {
            part += std::string("--") + opt.long_name;
        }
        if(opt.metavar) part += std::string(" ") + opt.metavar;
        parts.push_back(part + "]");
    }
    parts.push_back("str");
    parts.push_back("str");

    //wrap at 80 columns under the program name
    std::string head = "usage: " + prog + " ";
    std::string indent(head.size(), ' ');
    std::string out = head;
    size_t width = head.size();
    bool first = true;
    for(const auto& part : parts){
        if(!first && width + 1 + part.size() > 80){
            out += "\n" + indent;
            width = indent.size();
            first = true;
        }
        if(!first){
            out += " ";
            width++;
        }
        out += part;
        width += part.size();
        first = false;
    }
    return out + "\n";
}


std::string help_text(const std::string& prog){
    std::ostringstream out;

    auto row = [&](const std::string& invocation, const std::string& help){
        std::string lead = "  " + invocation;
        if(lead.size() <= 22){
            out << lead << std::string(24 - lead.size(), ' ') << help << "\n";
        } else {
            out << lead << "\n" << std::string(24, ' ') << help << "\n";
        }
    };

    out << usage_text(prog) << "\n";
    out << "Create worlds.\n\n";

    out << "positional arguments:\n";
    row("str", "The name of the world");
    row("str", "The type of the world, one of lone, orbited, satellite");
    out << "\n";

    out << "options:\n";
    row("-h, --help", "show this help message and exit");
    for(const auto& opt : option_defs()){
        std::string metavar = opt.metavar ? std::string(" ") + opt.metavar : "";
        std::string invocation;
        if(opt.short_name != '\0'){
            invocation += '-';
            invocation += opt.short_name;
            invocation += metavar + ", ";
        }
        invocation += std::string("--") + opt.long_name + metavar;
        row(invocation, std::string(opt.help) + " (default: " + opt.default_text + ")");
    }

    return out.str();
}
