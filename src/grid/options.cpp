#include "crossfill/grid/options.hpp"
#include <stdexcept>
#include <cerrno>
#include <climits>
#include <cstdlib>

namespace crossfill {
namespace grid {

namespace {

int parse_timeout(const std::string& arg) {
    errno = 0;
    char* end = nullptr;
    long value = std::strtol(arg.c_str(), &end, 10);
    if (arg.empty() || *end != '\0' || errno == ERANGE || value <= 0 || value > INT_MAX) {
        throw std::invalid_argument("Invalid timeout: " + arg);
    }
    return static_cast<int>(value);
}

}  // namespace

Options parse_command_line(int argc, const char* const* argv) {
    Options options;
    std::string files[3];
    int file_count = 0;

    for (int i = 1; i < argc; ++i) {
        const std::string arg(argv[i]);
        if (arg == "-s") {
            options.print_stats = true;
        } else if (arg == "-v") {
            options.verbose = true;
        } else if (arg == "-t") {
            if (i + 1 >= argc) {
                throw std::invalid_argument("Missing value for -t");
            }
            options.timeout_sec = parse_timeout(argv[++i]);
        } else if (arg == "--no-lcv") {
            options.lcv = false;
        } else if (arg == "--no-degree") {
            options.degree = false;
        } else if (arg == "--no-ac") {
            options.arc_consistency = false;
        } else if (arg == "-h" || arg == "--help") {
            options.show_help = true;
        } else if (!arg.empty() && arg[0] != '-') {
            if (file_count == 3) {
                throw std::invalid_argument("Too many arguments: " + arg);
            }
            files[file_count++] = arg;
        } else {
            throw std::invalid_argument("Unknown option: " + arg);
        }
    }

    if (options.show_help) {
        return options;
    }
    if (file_count < 2) {
        throw std::invalid_argument("Structure and words files are required");
    }
    options.structure_file = files[0];
    options.words_file = files[1];
    options.output_file = files[2];
    return options;
}

} // namespace grid
} // namespace crossfill
