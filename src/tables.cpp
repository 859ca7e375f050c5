#include "tables.hpp"


const Table<int, Range<double>>& planet_rotation_rate(){
    static const Table<int, Range<double>> table = {
        {3,  {4, 5}},
        {4,  {4, 6}},
        {5,  {5, 8}},
        {6,  {6, 10}},
        {7,  {8, 12}},
        {8,  {10, 16}},
        {9,  {12, 20}},
        {10, {16, 24}},
        {11, {20, 32}},
        {12, {24, 40}},
        {13, {32, 48}},
        {14, {40, 64}},
        {15, {48, 80}},
        {16, {64, 96}},
        {17, {80, 128}},
        {18, {96, 160}},
        {19, {128, 192}},
        {20, {160, 256}},
        {21, {192, 320}},
        {22, {256, 384}},
        {23, {320, 384}}
    };
    return table;
}


const Table<int, Range<int>>& planet_obliquity(){
    static const Table<int, Range<int>> table = {
        {5,  {46, 49}},
        {6,  {44, 48}},
        {7,  {42, 46}},
        {8,  {40, 44}},
        {9,  {38, 42}},
        {10, {36, 40}},
        {11, {34, 38}},
        {12, {32, 36}},
        {13, {30, 34}},
        {14, {28, 32}},
        {15, {26, 30}},
        {16, {24, 28}},
        {17, {22, 26}},
        {18, {20, 24}},
        {19, {18, 22}},
        {20, {16, 20}},
        {21, {14, 18}},
        {22, {12, 16}},
        {23, {10, 14}},
        {24, {10, 12}}
    };
    return table;
}


const Table<int, Range<int>>& planet_extreme_obliquity(){
    static const Table<int, Range<int>> table = {
        {2, {50, 60}},
        {3, {50, 70}},
        {4, {60, 80}},
        {5, {70, 80}}
    };
    return table;
}


const Table<int, HydroCover>& hydrographic_cover(){
    static const Table<int, HydroCover> table = {
        {-5, {0, 0, Water::Trace}},
        {-1, {0, 1, Water::Minimal}},
        {0,  {0, 2, Water::Minimal}},
        {1,  {1, 3, Water::Minimal}},
        {2,  {2, 5, Water::Minimal}},
        {3,  {3, 7.5, Water::Minimal}},
        {4,  {5, 10, Water::Moderate}},
        {5,  {7.5, 20, Water::Moderate}},
        {6,  {10, 30, Water::Moderate}},
        {7,  {20, 40, Water::Moderate}},
        {8,  {30, 50, Water::Moderate}},
        {9,  {40, 55, Water::Moderate}},
        {10, {50, 60, Water::Moderate}},
        {11, {55, 65, Water::Moderate}},
        {12, {60, 70, Water::Extensive}},
        {13, {65, 75, Water::Extensive}},
        {14, {70, 80, Water::Extensive}},
        {15, {75, 85, Water::Extensive}},
        {16, {80, 90, Water::Extensive}},
        {17, {85, 95, Water::Extensive}},
        {18, {90, 97.5, Water::Extensive}},
        {19, {95, 100, Water::Extensive}},
        {20, {100, 100, Water::Massive}}
    };
    return table;
}


const Table<int, Lithosphere>& lithosphere_table(){
    static const Table<int, Lithosphere> table = {
        {15, Lithosphere::Molten},
        {23, Lithosphere::Soft},
        {31, Lithosphere::EarlyPlate},
        {63, Lithosphere::MaturePlate},
        {87, Lithosphere::AncientPlate},
        {88, Lithosphere::Solid}
    };
    return table;
}


const Table<double, Lithosphere>& lithosphere_stressed_table(){
    static const Table<double, Lithosphere> table = {
        {200,   Lithosphere::Solid},
        {630,   Lithosphere::AncientPlate},
        {2000,  Lithosphere::MaturePlate},
        {6300,  Lithosphere::EarlyPlate},
        {20000, Lithosphere::Soft},
        {20001, Lithosphere::Molten}
    };
    return table;
}
