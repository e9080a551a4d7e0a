/**
 * @file blockplan_cli.cpp
 * @brief Command-line driver: load rules and a project, solve, print the layout
 *
 * Usage:
 *   blockplan --rules rules.json --project project.json
 *             [--options options.json] [--output result.json]
 *             [--timeout ms] [--verbose]
 *
 * Exit codes: 0 optimal or feasible, 1 infeasible or timeout,
 * 2 configuration or usage error, 3 internal error.
 */

#include "blockplan/config.hpp"
#include "blockplan/layout_engine.hpp"
#include "blockplan/log.hpp"
#include "blockplan/project_io.hpp"
#include "blockplan/rule_loader.hpp"

#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <string>

using namespace blockplan;

namespace {

constexpr int kExitSolved = 0;
constexpr int kExitNoLayout = 1;
constexpr int kExitUsage = 2;
constexpr int kExitInternal = 3;

struct CliArgs {
    std::string rules_path;
    std::string project_path;
    std::string options_path;
    std::string output_path;
    long timeout_ms = -1;
    bool verbose = false;
};

void print_usage(const char* argv0) {
    std::cerr << "usage: " << argv0
              << " --rules FILE --project FILE [--options FILE] [--output FILE]"
                 " [--timeout MS] [--verbose]\n";
}

bool parse_args(int argc, char** argv, CliArgs& args) {
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        auto next = [&](std::string& out) {
            if (i + 1 >= argc) {
                std::cerr << "missing value for " << arg << "\n";
                return false;
            }
            out = argv[++i];
            return true;
        };

        if (std::strcmp(arg, "--rules") == 0) {
            if (!next(args.rules_path)) return false;
        } else if (std::strcmp(arg, "--project") == 0) {
            if (!next(args.project_path)) return false;
        } else if (std::strcmp(arg, "--options") == 0) {
            if (!next(args.options_path)) return false;
        } else if (std::strcmp(arg, "--output") == 0) {
            if (!next(args.output_path)) return false;
        } else if (std::strcmp(arg, "--timeout") == 0) {
            std::string value;
            if (!next(value)) return false;
            char* end = nullptr;
            args.timeout_ms = std::strtol(value.c_str(), &end, 10);
            if (end == value.c_str() || *end != '\0' || args.timeout_ms <= 0) {
                std::cerr << "invalid timeout '" << value << "'\n";
                return false;
            }
        } else if (std::strcmp(arg, "--verbose") == 0 || std::strcmp(arg, "-v") == 0) {
            args.verbose = true;
        } else {
            std::cerr << "unknown argument " << arg << "\n";
            return false;
        }
    }
    return !args.rules_path.empty() && !args.project_path.empty();
}

void print_layout(const LayoutSolution& s) {
    std::cout << "Floor plate " << s.floor.width << " x " << s.floor.height << "\n\n";
    std::cout << std::left << std::setw(32) << "room"
              << std::right << std::setw(8) << "x" << std::setw(8) << "y"
              << std::setw(8) << "w" << std::setw(8) << "h" << "  doors\n";

    for (const auto& room : s.rooms) {
        std::cout << std::left << std::setw(32) << room.label()
                  << std::right << std::setw(8) << room.x << std::setw(8) << room.y
                  << std::setw(8) << room.width << std::setw(8) << room.height << "  ";
        if (room.doors.empty()) {
            std::cout << "-";
        }
        for (const auto& door : room.doors) {
            std::cout << "(" << door.x << "," << door.y;
            if (door.connects_to) {
                std::cout << " -> " << *door.connects_to;
            }
            std::cout << ") ";
        }
        std::cout << "\n";
    }

    std::cout << "\npenalty " << s.penalty_total << ", footprint " << s.footprint
              << ", objective " << s.objective_value << "\n";
}

int exit_code_for(LayoutStatus status) {
    switch (status) {
        case LayoutStatus::Optimal:
        case LayoutStatus::Feasible:
            return kExitSolved;
        case LayoutStatus::Infeasible:
        case LayoutStatus::Timeout:
            return kExitNoLayout;
        case LayoutStatus::ConfigurationError:
            return kExitUsage;
        case LayoutStatus::Error:
        default:
            return kExitInternal;
    }
}

} // namespace

int main(int argc, char** argv) {
    CliArgs args;
    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return kExitUsage;
    }

    if (args.verbose) {
        set_log_level(LogLevel::Debug);
    }

    try {
        Config config;
        if (!args.options_path.empty()) {
            config.load(args.options_path);
        }
        if (args.timeout_ms > 0) {
            config.mutable_options().timeout_ms = static_cast<unsigned>(args.timeout_ms);
        }
        if (args.verbose) {
            config.mutable_options().debug_mode = true;
        }

        RuleRegistry registry = RuleLoader::load_file(args.rules_path);
        ProjectRequest request = ProjectIO::load_file(args.project_path);

        LayoutEngine engine(registry, config.options());
        LayoutResult result = engine.solve(request);

        std::cout << result.summary();
        if (result.solution) {
            std::cout << "\n";
            print_layout(*result.solution);
        }

        if (!args.output_path.empty() && !ProjectIO::save_result(result, args.output_path)) {
            std::cerr << "failed to write " << args.output_path << "\n";
            return kExitInternal;
        }

        return exit_code_for(result.status);
    } catch (const ConfigurationError& e) {
        std::cerr << "configuration error: " << e.what() << "\n";
        return kExitUsage;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return kExitInternal;
    }
}
