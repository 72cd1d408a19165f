#ifndef COVCLASS_CLI_ARGS_HPP
#define COVCLASS_CLI_ARGS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

#include "covclass/classifier.hpp"

namespace covclass {
namespace cli {

// Thrown by parse_args instead of exiting: exit code 0 for --help/--version,
// 1 for usage errors. `what()` holds the message to print (may be empty).
class ParseArgsExit : public std::runtime_error {
public:
    explicit ParseArgsExit(int exit_code, const std::string& msg = "")
        : std::runtime_error(msg), exit_code_(exit_code) {}

    int exit_code() const { return exit_code_; }

private:
    int exit_code_;
};

struct Options {
    std::string data_file;                        // coverage table (TSV, optionally .gz)
    std::string output_file;                      // per-gene classification table
    std::string sample_detection_output;          // per-sample genome detection table
    std::string additional_layers_to_append;      // optional gene-keyed annotation table
    std::string samples_information_to_append;    // optional sample-keyed annotation table
    ClassifierParams params;
    int num_threads = 0;                          // 0 = OpenMP default
    bool verbose = false;
};

// Print version string to stdout
void print_version();

// Print usage/help to stdout
void print_usage(const char* program_name);

// Parse command-line arguments into Options.
// Throws ParseArgsExit(0) for --help/--version and ParseArgsExit(1) for
// missing/unknown options or malformed values.
Options parse_args(int argc, char* argv[]);

}  // namespace cli
}  // namespace covclass

#endif  // COVCLASS_CLI_ARGS_HPP
