#include "report.hpp"

#include <iomanip>
#include <sstream>


namespace {

//appends " text" unless text is empty
void suffix(std::ostream& out, const char* text){
    if(text[0] != '\0') out << " " << text;
}

}


void write_report(std::ostream& out, const WorldInputs& in, const WorldReport& report, const WorldTraits& traits){

    out << std::fixed;

    //header
    out << in.name << "\n";
    out << world_type_label(in.type) << " Age: " << std::setprecision(3) << in.age << " GYr\n";

    //body, star and companion
    out << "Mass: " << subject_mass(in) << " M♁ Density: " << in.density << " K♁ Radius: "
        << std::setprecision(0) << report.radius_km << " km\n";
    out << std::setprecision(3);
    out << "Star Mass: " << in.star_mass << " M☉ Distance: " << in.star_distance
        << " AU Lumin: " << in.luminosity << " L☉\n";

    if(in.type == WorldType::Orbited){
        out << "Satellite Mass: " << in.satellite_mass << " M♁ Distance: "
            << std::setprecision(0) << in.satellite_distance << " km\n";
    } else if(in.type == WorldType::Satellite){
        out << "Primary Mass: " << in.mass << " M♁ Distance: "
            << std::setprecision(0) << in.satellite_distance << " km\n";
    }

    out << "---\n";

    //periods
    out << std::setprecision(1);
    out << "Orbital Period = " << report.orbital_period_hours << " hours\n";
    if(in.type == WorldType::Orbited){
        out << "Satellite Period = " << *report.satellite_period_hours << " hours\n";
    } else if(in.type == WorldType::Satellite){
        out << "Year Length = " << report.year_hours << " hours\n";
    }
    if(report.synodic_month_hours){
        out << "Synodic Month = " << *report.synodic_month_hours << " hours\n";
    }

    out << "Rotation Period = " << traits.rotation_period_hours << " hours";
    suffix(out, resonance_label(traits.resonance));
    out << "\n";

    out << "Obliquity = " << traits.obliquity_degrees << "°";
    if(traits.obliquity_unstable) out << " Unstable";
    out << "\n";

    if(traits.local_day_hours){
        out << "Day length = " << *traits.local_day_hours << " hours "
            << std::setprecision(2) << *traits.days_per_year << " days in year\n";
    } else {
        out << "Day length: not applicable\n";
    }

    //climate and crust
    out << "Black body temperature = " << report.blackbody_temperature << " K";
    if(traits.runaway_greenhouse) out << " Runaway Greenhouse";
    out << "\n";

    out << "M number = " << report.m_number << "\n";

    out << "Water prevalence: " << water_label(traits.water) << " "
        << std::setprecision(1) << std::setw(5) << traits.water_percent << "%\n";

    out << lithosphere_label(traits.lithosphere) << " " << tectonics_label(traits.tectonics);
    if(traits.episodic_resurfacing) out << " Episodic Resurfacing";
    out << "\n";
}


std::string format_report(const WorldInputs& in, const WorldReport& report, const WorldTraits& traits){
    std::ostringstream out;
    write_report(out, in, report, traits);
    return out.str();
}
