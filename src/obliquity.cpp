#include "obliquity.hpp"
#include "tables.hpp"


namespace {

int minimal_obliquity(int roll){
    return roll > 8 ? roll - 8 : 0;
}

}


Obliquity calc_obliquity(const WorldInputs& in, const WorldReport& report, Resonance resonance, Dice& dice){

    int roll = dice.roll(3);

    //locked bodies are held upright
    if(in.type == WorldType::Satellite || resonance != Resonance::None){
        return {minimal_obliquity(roll), false};
    }

    int mod = 0;
    bool unstable = false;

    //no large moon to steady the axis
    if(in.type == WorldType::Lone){
        int roll2 = dice.roll(3);
        if(roll2 < 8 || roll2 > 13){
            mod = -7;
            unstable = true;
        }
    }

    int selector = report.tide_adjustment + roll + mod;

    if(selector >= 25) return {minimal_obliquity(roll), unstable};

    if(selector <= 4){
        int roll3 = dice.roll();
        if(roll3 == 6){
            int roll4 = dice.roll(3);
            return {roll4 > 7 ? 90 - roll4 : 90, unstable};
        }
        const Range<int>& range = look_up(planet_extreme_obliquity(), roll3);
        return {dice.randint(range.lo, range.hi), unstable};
    }

    const Range<int>& range = look_up(planet_obliquity(), selector);
    return {dice.randint(range.lo, range.hi), unstable};
}
