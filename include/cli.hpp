#pragma once

#include "world.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>


//bad command line or config file, reported with the usage line and exit code 2
class UsageError : public std::runtime_error {
    public:
    using std::runtime_error::runtime_error;
};


struct CliOptions{
    WorldInputs inputs;
    std::optional<std::uint32_t> seed; //empty means seed from the system
    bool show_help = false;
};


CliOptions parse_args(const std::vector<std::string>& args);

std::string usage_text(const std::string& prog);
std::string help_text(const std::string& prog);

//key = value file, # starts a comment
std::map<std::string, double> parse_config(const std::string& filename);
