#include "args.hpp"
#include "covclass/version.h"

#include <cmath>
#include <iostream>
#include <string>

namespace covclass {
namespace cli {

void print_version() {
    std::cout << "covclass " << COVCLASS_VERSION << "\n";
}

void print_usage(const char* program_name) {
    const ClassifierParams defaults;
    std::cout << "covclass v" << COVCLASS_VERSION << "\n\n";
    std::cout << "Classify the genes of a reference genome as taxon-specific/non-specific\n";
    std::cout << "and core/accessory from their coverage across metagenomes.\n\n";
    std::cout << "Usage: " << program_name
              << " -d <coverages.tsv> -o <gene_classes.tsv> -s <samples.tsv> [options]\n\n";
    std::cout << "Required:\n";
    std::cout << "  -d, --data <file>                 Gene coverage table (TSV or .gz)\n";
    std::cout << "  -o, --output <file>               Output gene class table\n";
    std::cout << "  -s, --sample-detection-output <file>\n";
    std::cout << "                                    Output per-sample genome detection table\n";
    std::cout << "\nModel parameters:\n";
    std::cout << "  --alpha <f>          Fraction of TSC genes that must be detected for the genome\n";
    std::cout << "                       to count as present in a sample (default: " << defaults.alpha << ")\n";
    std::cout << "  --beta <f>           Adjusted-variability cutoff for taxon-specific genes\n";
    std::cout << "                       (default: " << defaults.beta << ")\n";
    std::cout << "  --gamma <f>          Detection floor in standard deviations below the mean\n";
    std::cout << "                       (default: " << defaults.gamma << ")\n";
    std::cout << "  --eta <f>            Fraction of genome-positive samples for a core gene\n";
    std::cout << "                       (default: " << defaults.eta << ")\n";
    std::cout << "  --max-iterations <int>  Stop after this many iterations if the loss has not\n";
    std::cout << "                       converged (default: " << defaults.max_iterations << ")\n";
    std::cout << "\nAnnotations:\n";
    std::cout << "  --additional-layers-to-append <file>    Gene-keyed TSV appended to the gene table\n";
    std::cout << "  --samples-information-to-append <file>  Sample-keyed TSV appended to the sample table\n";
    std::cout << "\n";
    std::cout << "  -t, --threads <int>  Number of threads (default: auto)\n";
    std::cout << "  -v, --verbose        Verbose output\n";
    std::cout << "  -V, --version        Show version and exit\n";
    std::cout << "  -h, --help           Show this help message\n";
    std::cout << "\n";
    std::cout << "Example:\n";
    std::cout << "  " << program_name << " -d gene_coverages.txt -o gene_classes.txt"
              << " -s sample_detection.txt --beta 1 --gamma 3\n";
}

Options parse_args(int argc, char* argv[]) {
    Options opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto require_value = [&](const std::string& flag) -> std::string {
            if (i + 1 >= argc) {
                throw ParseArgsExit(1, "Error: Missing value for " + flag);
            }
            return argv[++i];
        };

        auto parse_real = [&](const std::string& flag, const std::string& value) -> double {
            double parsed = 0.0;
            try {
                size_t idx = 0;
                parsed = std::stod(value, &idx);
                if (idx != value.size()) {
                    throw ParseArgsExit(1, "Error: " + flag + " value must be a real number: " + value);
                }
            } catch (const ParseArgsExit&) {
                throw;
            } catch (const std::logic_error&) {
                throw ParseArgsExit(1, "Error: " + flag + " value must be a real number: " + value);
            }
            if (!std::isfinite(parsed)) {
                throw ParseArgsExit(1, "Error: " + flag + " value must be a real number: " + value);
            }
            return parsed;
        };

        auto parse_int = [&](const std::string& flag, const std::string& value) -> int {
            try {
                size_t idx = 0;
                int parsed = std::stoi(value, &idx);
                if (idx != value.size()) {
                    throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
                }
                return parsed;
            } catch (const ParseArgsExit&) {
                throw;
            } catch (const std::logic_error&) {
                throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
            }
        };

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            throw ParseArgsExit(0);
        } else if (arg == "-V" || arg == "--version") {
            print_version();
            throw ParseArgsExit(0);
        } else if (arg == "-d" || arg == "--data") {
            opts.data_file = require_value(arg);
        } else if (arg == "-o" || arg == "--output") {
            opts.output_file = require_value(arg);
        } else if (arg == "-s" || arg == "--sample-detection-output") {
            opts.sample_detection_output = require_value(arg);
        } else if (arg == "--additional-layers-to-append") {
            opts.additional_layers_to_append = require_value(arg);
        } else if (arg == "--samples-information-to-append") {
            opts.samples_information_to_append = require_value(arg);
        } else if (arg == "--alpha") {
            opts.params.alpha = parse_real("Alpha", require_value(arg));
        } else if (arg == "--beta") {
            opts.params.beta = parse_real("Beta", require_value(arg));
        } else if (arg == "--gamma") {
            opts.params.gamma = parse_real("Gamma", require_value(arg));
        } else if (arg == "--eta") {
            opts.params.eta = parse_real("Eta", require_value(arg));
        } else if (arg == "--max-iterations") {
            int n = parse_int(arg, require_value(arg));
            if (n < 1) {
                throw ParseArgsExit(1, "Error: --max-iterations must be >= 1");
            }
            opts.params.max_iterations = static_cast<uint32_t>(n);
        } else if (arg == "-t" || arg == "--threads") {
            opts.num_threads = parse_int(arg, require_value(arg));
            if (opts.num_threads < 1) {
                throw ParseArgsExit(1, "Error: --threads must be >= 1");
            }
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else {
            throw ParseArgsExit(1, "Error: Unknown option: " + arg);
        }
    }

    if (opts.data_file.empty()) {
        throw ParseArgsExit(1, "Error: No coverage table specified (-d)");
    }
    if (opts.output_file.empty()) {
        throw ParseArgsExit(1, "Error: No output file specified (-o)");
    }
    if (opts.sample_detection_output.empty()) {
        throw ParseArgsExit(1, "Error: No sample detection output specified (-s)");
    }

    return opts;
}

}  // namespace cli
}  // namespace covclass
