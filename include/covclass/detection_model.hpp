#pragma once
// Detection model: is a gene present in a sample, and is the genome present?
//
// A gene counts as detected in a sample when its coverage is above a
// sample-adaptive floor of `gamma` standard deviations below the mean coverage
// of the current taxon-specific genes:
//
//     detected(g, s)  <=>  cov[g][s] > max(0, mean[s] - gamma * std[s])
//
// The genome counts as detected in a sample when strictly more than
// `alpha * n` of the n reference genes are detected there.

#include <algorithm>
#include <cstdint>
#include <vector>

#include "covclass/sample_stats.hpp"
#include "covclass/types.hpp"

namespace covclass {

struct DetectionTable {
    uint32_t num_genes = 0;
    uint32_t num_samples = 0;
    std::vector<uint8_t> detected;                // detected[g * num_samples + s]
    std::vector<uint32_t> number_of_detections;   // per gene, == popcount of its row

    // (gene, sample) pairs with positive coverage that fell at or below the
    // detection floor. Informational only.
    uint64_t positive_below_threshold = 0;

    bool is_detected(uint32_t g, uint32_t s) const {
        return detected[static_cast<size_t>(g) * num_samples + s] != 0;
    }
};

inline double detection_threshold(double mean, double std, double gamma) {
    return std::max(0.0, mean - gamma * std);
}

// Gene-parallel under OpenMP. Throws std::runtime_error if `stats` does not
// cover the matrix's samples.
DetectionTable detect_genes(const CoverageMatrix& matrix,
                            const SampleStats& stats,
                            double gamma);

// Per-sample genome detection (1 = detected). `reference_genes` empty means
// every gene of the table is a reference gene.
std::vector<uint8_t> detect_genome_in_samples(const DetectionTable& detection,
                                              double alpha,
                                              const std::vector<uint32_t>& reference_genes);

}  // namespace covclass
