// Detection model
//
// OpenMP parallelizes the per-gene pass; genes are independent once the
// iteration's sample statistics are fixed.

#include "covclass/detection_model.hpp"

#include <stdexcept>
#include <string>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace covclass {

DetectionTable detect_genes(const CoverageMatrix& matrix,
                            const SampleStats& stats,
                            double gamma) {
    const uint32_t G = matrix.num_genes();
    const uint32_t S = matrix.num_samples();
    if (stats.num_samples() != S || stats.std.size() != S) {
        throw std::runtime_error("Sample statistics cover " +
                                 std::to_string(stats.num_samples()) +
                                 " samples, coverage matrix has " +
                                 std::to_string(S));
    }

    DetectionTable table;
    table.num_genes = G;
    table.num_samples = S;
    table.detected.assign(static_cast<size_t>(G) * S, 0);
    table.number_of_detections.assign(G, 0);

    std::vector<double> threshold(S);
    for (uint32_t s = 0; s < S; ++s) {
        threshold[s] = detection_threshold(stats.mean[s], stats.std[s], gamma);
    }

    uint64_t below = 0;

    #pragma omp parallel for schedule(static) reduction(+:below)
    for (uint32_t g = 0; g < G; ++g) {
        const double* row = matrix.row(g);
        uint8_t* flags = table.detected.data() + static_cast<size_t>(g) * S;
        uint32_t n = 0;
        for (uint32_t s = 0; s < S; ++s) {
            if (row[s] > threshold[s]) {
                flags[s] = 1;
                ++n;
            } else if (row[s] > 0.0) {
                ++below;
            }
        }
        table.number_of_detections[g] = n;
    }

    table.positive_below_threshold = below;
    return table;
}

std::vector<uint8_t> detect_genome_in_samples(const DetectionTable& detection,
                                              double alpha,
                                              const std::vector<uint32_t>& reference_genes) {
    const uint32_t S = detection.num_samples;
    const bool all_genes = reference_genes.empty();
    const size_t n = all_genes ? detection.num_genes : reference_genes.size();
    const double min_detected = alpha * static_cast<double>(n);

    std::vector<uint8_t> genome(S, 0);
    for (uint32_t s = 0; s < S; ++s) {
        uint32_t count = 0;
        for (size_t i = 0; i < n; ++i) {
            const uint32_t g = all_genes ? static_cast<uint32_t>(i) : reference_genes[i];
            if (detection.is_detected(g, s)) ++count;
        }
        genome[s] = static_cast<double>(count) > min_detected ? 1 : 0;
    }
    return genome;
}

}  // namespace covclass
