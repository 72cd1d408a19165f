#include "covclass/sample_stats.hpp"

#include <cmath>

namespace covclass {

SampleStats compute_sample_stats(const CoverageMatrix& matrix,
                                 const std::vector<uint32_t>& genes) {
    const uint32_t S = matrix.num_samples();
    SampleStats stats;
    stats.mean.assign(S, 0.0);
    stats.std.assign(S, 0.0);
    if (S == 0) return stats;

    const bool all_genes = genes.empty();
    const size_t n = all_genes ? matrix.num_genes() : genes.size();
    if (n == 0) return stats;

    // Two passes (mean, then squared deviations) to stay close to numpy's
    // np.mean / np.std on the same values.
    std::vector<double> sum(S, 0.0);
    for (size_t i = 0; i < n; ++i) {
        const uint32_t g = all_genes ? static_cast<uint32_t>(i) : genes[i];
        const double* row = matrix.row(g);
        for (uint32_t s = 0; s < S; ++s) sum[s] += row[s];
    }
    for (uint32_t s = 0; s < S; ++s) {
        stats.mean[s] = sum[s] / static_cast<double>(n);
    }

    std::vector<double> sq(S, 0.0);
    for (size_t i = 0; i < n; ++i) {
        const uint32_t g = all_genes ? static_cast<uint32_t>(i) : genes[i];
        const double* row = matrix.row(g);
        for (uint32_t s = 0; s < S; ++s) {
            const double d = row[s] - stats.mean[s];
            sq[s] += d * d;
        }
    }
    for (uint32_t s = 0; s < S; ++s) {
        stats.std[s] = std::sqrt(sq[s] / static_cast<double>(n));
    }

    return stats;
}

}  // namespace covclass
