#pragma once

#include "traits.hpp"

#include <vector>


template <typename Key, typename Value>
struct TableRow{
    Key key;
    Value value;
};

template <typename Key, typename Value>
using Table = std::vector<TableRow<Key, Value>>;


//first row whose key is >= the selector, or the last row
template <typename Key, typename Value, typename Selector>
const Value& look_up(const Table<Key, Value>& table, Selector selector){
    for(const auto& row : table){
        if(selector <= row.key) return row.value;
    }
    return table.back().value;
}


template <typename T>
struct Range{
    T lo;
    T hi;
};

struct HydroCover{
    double lo;
    double hi;
    Water water;
};


//3d6 + tide adjustment -> sidereal rotation period in hours, 24+ is resonant
const Table<int, Range<double>>& planet_rotation_rate();

//3d6 + tide adjustment -> obliquity in degrees, <= 4 extreme, >= 25 minimal
const Table<int, Range<int>>& planet_obliquity();

//d6 -> extreme obliquity in degrees, 6 rolls again
const Table<int, Range<int>>& planet_extreme_obliquity();

//3d6 - M number + modifiers -> percentage of surface under water
const Table<int, HydroCover>& hydrographic_cover();

//3d6 + heat modifiers -> lithosphere
const Table<int, Lithosphere>& lithosphere_table();

//tidal stress f -> lithosphere
const Table<double, Lithosphere>& lithosphere_stressed_table();
