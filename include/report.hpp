#pragma once

#include "world.hpp"
#include "traits.hpp"

#include <ostream>
#include <string>

void write_report(std::ostream& out, const WorldInputs& in, const WorldReport& report, const WorldTraits& traits);
std::string format_report(const WorldInputs& in, const WorldReport& report, const WorldTraits& traits);
