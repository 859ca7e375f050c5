#include "hydrology.hpp"
#include "tables.hpp"


Hydrology calc_water(const WorldInputs& in, const WorldReport& report, Dice& dice){

    Hydrology h{Water::Trace, 0.0, in.runaway_greenhouse};
    int m = report.m_number;
    int bbt = report.blackbody_temperature;

    if(m <= 2){
        //holds on to everything
        h.water = Water::Massive;
        h.percent = 100.0;
    } else if(m >= 29){
        //too light to keep water unless it is frozen in
        if(bbt >= 125 || in.rocky_satellite){
            h.water = Water::Trace;
            h.percent = 0.0;
        } else {
            h.water = Water::Massive;
            h.percent = 100.0;
        }
    } else if(in.outside_ice_line){
        h.water = Water::Massive;
        h.percent = 100.0;
    } else {
        int mod = -m;
        if(in.grand_tack) mod += 6;
        if(in.oort_cloud) mod += 3;

        const HydroCover& cover = look_up(hydrographic_cover(), dice.roll(3) + mod);
        h.water = cover.water;
        h.percent = dice.uniform(cover.lo, cover.hi);
    }

    //hot worlds can lose their oceans
    if(m > 2 && bbt >= 300 && h.water != Water::Trace){
        if(dice.roll(3) + bbt >= 318){
            if(h.water != Water::Minimal) h.runaway_greenhouse = true;
            h.water = Water::Trace;
            h.percent = 0.0;
        }
    }

    return h;
}
