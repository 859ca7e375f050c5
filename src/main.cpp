#include <iostream>
#include <string>
#include <vector>
#include <filesystem>
#include "cli.hpp"
#include "world.hpp"
#include "traits.hpp"
#include "report.hpp"

namespace fs = std::filesystem;


int main(int argc, char* argv[]) {

    //argparse style program name
    std::string prog = argc > 0 ? fs::path(argv[0]).filename().string() : "worldsmith";
    if(prog.empty()) prog = "worldsmith";

    std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

    CliOptions opts;
    try {
        opts = parse_args(args);
    } catch(const UsageError& e) {
        std::cerr << usage_text(prog);
        std::cerr << prog << ": error: " << e.what() << "\n";
        return 2;
    }

    if(opts.show_help){
        std::cout << help_text(prog);
        return 0;
    }

    //deterministic part
    WorldReport report = compute_world(opts.inputs);

    //dice driven part
    Dice dice(opts.seed ? *opts.seed : random_seed());
    WorldTraits traits = derive_traits(opts.inputs, report, dice);

    write_report(std::cout, opts.inputs, report, traits);

    return 0;
}
