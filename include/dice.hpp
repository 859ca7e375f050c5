#pragma once

#include <cstdint>
#include <random>
#include <vector>


//stream of six sided dice rolls
//mocked rolls cycle forever and are used in place of the engine for d6 rolls,
//uniform/randint draws always come from the engine
class Dice {
    public:

    explicit Dice(std::uint32_t seed);
    Dice(std::uint32_t seed, std::vector<int> mocks);

    int roll();
    int roll(int count);

    double uniform(double lo, double hi);
    int randint(int lo, int hi);

    private:
    std::mt19937 engine;
    std::vector<int> mocks;
    std::size_t next_mock = 0;
};


std::uint32_t random_seed();
