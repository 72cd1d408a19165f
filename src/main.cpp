// covclass: classify the genes of a reference genome from their coverage
// across metagenomes.
//
// Usage:
//   covclass -d coverages.tsv -o gene_classes.tsv -s sample_detection.tsv [options]

#include "cli/args.hpp"
#include "covclass/classifier.hpp"
#include "covclass/coverage_table.hpp"
#include "covclass/log_utils.hpp"
#include "covclass/version.h"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>

#ifdef _OPENMP
#include <omp.h>
#endif

int main(int argc, char* argv[]) {
    covclass::cli::Options opts;
    try {
        opts = covclass::cli::parse_args(argc, argv);
    } catch (const covclass::cli::ParseArgsExit& e) {
        if (e.what()[0] != '\0') {
            std::cerr << e.what() << "\n";
            if (e.exit_code() != 0) std::cerr << "Use --help for usage.\n";
        }
        return e.exit_code();
    }

    try {
        auto t_start = std::chrono::steady_clock::now();

        // Fail on bad parameters before touching any file
        opts.params.validate();

        int num_threads = opts.num_threads;
#ifdef _OPENMP
        if (num_threads == 0) {
            num_threads = omp_get_max_threads();
        }
        omp_set_num_threads(num_threads);
#else
        num_threads = 1;
#endif

        const auto& p = opts.params;
        std::cerr << "covclass v" << COVCLASS_VERSION << "\n";
        std::cerr << "Input: " << opts.data_file << "\n";
        std::cerr << "Output: " << opts.output_file << ", " << opts.sample_detection_output << "\n";
        std::cerr << "Parameters: alpha=" << p.alpha << " beta=" << p.beta
                  << " gamma=" << p.gamma << " eta=" << p.eta
                  << " max_iterations=" << p.max_iterations << "\n";
        if (opts.verbose) {
            std::cerr << "Threads: " << num_threads << "\n";
        }

        covclass::CoverageMatrix matrix = covclass::load_coverage_table(opts.data_file);
        std::cerr << "Loaded " << matrix.num_genes() << " genes x "
                  << matrix.num_samples() << " samples\n";

        std::unique_ptr<covclass::AnnotationTable> layers;
        if (!opts.additional_layers_to_append.empty()) {
            layers = std::make_unique<covclass::AnnotationTable>(
                covclass::load_annotation_table(opts.additional_layers_to_append, true));
            if (opts.verbose) {
                std::cerr << "Gene layers: " << layers->columns.size() << " columns, "
                          << layers->rows.size() << " genes\n";
            }
        }

        std::unique_ptr<covclass::AnnotationTable> sample_info;
        if (!opts.samples_information_to_append.empty()) {
            sample_info = std::make_unique<covclass::AnnotationTable>(
                covclass::load_annotation_table(opts.samples_information_to_append, false));
            if (opts.verbose) {
                std::cerr << "Sample information: " << sample_info->columns.size() << " columns, "
                          << sample_info->rows.size() << " samples\n";
            }
        }

        auto progress = [&](const covclass::IterationDiagnostics& d) {
            std::cerr << "Iteration " << d.iteration
                      << ": loss=" << std::fixed << std::setprecision(4) << d.loss;
            if (d.iteration > 1) {
                std::cerr << " (change " << std::setprecision(4) << d.loss_change << ")";
            }
            std::cerr << std::defaultfloat << "\n";
            if (d.positive_below_threshold > 0) {
                std::cerr << "  Note: " << d.positive_below_threshold
                          << " gene/sample pairs with non-zero coverage were marked as"
                          << " not detected by the detection criteria\n";
            }
            if (opts.verbose) {
                std::cerr << "  Reference genes: " << d.reference_genes << "\n";
                std::cerr << "  " << covclass::log_utils::format_class_counts(d.counts) << "\n";
            }
        };

        covclass::ClassificationResult result =
            covclass::classify_genes(matrix, opts.params, progress);

        if (result.converged()) {
            std::cerr << "Converged after " << result.iterations << " iterations\n";
        } else {
            std::cerr << "Warning: loss did not converge within " << result.iterations
                      << " iterations (last change >= " << 2.0 * p.beta
                      << "); writing the last iteration\n";
        }

        covclass::ClassCounts counts =
            covclass::count_classes(result.genes, result.genome_detected);
        std::cerr << "The number of TS is " << counts.ts << "\n";
        std::cerr << "The number of TSC is " << counts.tsc << "\n";
        std::cerr << "The number of TSA is " << counts.tsa << "\n";
        std::cerr << "The number of TNC is " << counts.tnc << "\n";
        std::cerr << "The number of TNA is " << counts.tna << "\n";
        std::cerr << "The number of NaN is " << counts.undefined << "\n";
        std::cerr << "The number of samples with the genome is "
                  << counts.genome_positive_samples << "\n";

        covclass::write_gene_table(opts.output_file, matrix, result, layers.get());
        covclass::write_sample_table(opts.sample_detection_output, matrix, result,
                                     sample_info.get());

        auto t_end = std::chrono::steady_clock::now();
        std::cerr << "Done in " << covclass::log_utils::format_elapsed(t_start, t_end) << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
