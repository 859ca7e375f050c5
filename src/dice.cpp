#include "dice.hpp"

#include <utility>


Dice::Dice(std::uint32_t seed) : engine(seed) {}


Dice::Dice(std::uint32_t seed, std::vector<int> mocks) : engine(seed), mocks(std::move(mocks)) {}


int Dice::roll(){
    if(!mocks.empty()){
        int r = mocks[next_mock];
        next_mock = (next_mock + 1) % mocks.size();
        return r;
    }
    return randint(1, 6);
}


int Dice::roll(int count){
    int total = 0;
    for(int i = 0; i < count; i++) total += roll();
    return total;
}


double Dice::uniform(double lo, double hi){
    std::uniform_real_distribution<double> dist(lo, hi);
    return dist(engine);
}


int Dice::randint(int lo, int hi){
    //inclusive on both ends
    std::uniform_int_distribution<int> dist(lo, hi);
    return dist(engine);
}


std::uint32_t random_seed(){
    std::random_device rd;
    return rd();
}
