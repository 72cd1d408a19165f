#pragma once
// Per-sample coverage statistics over a gene subset

#include <cstdint>
#include <vector>

#include "covclass/types.hpp"

namespace covclass {

struct SampleStats {
    std::vector<double> mean;   // mean[s]
    std::vector<double> std;    // population standard deviation (N divisor)

    uint32_t num_samples() const { return static_cast<uint32_t>(mean.size()); }
};

// Mean and population standard deviation of coverage for every sample,
// computed over the rows listed in `genes` (empty = all genes).
//
// A matrix without samples yields an empty statistic set, which turns every
// per-sample consumer into a no-op. A matrix without genes yields zeros.
SampleStats compute_sample_stats(const CoverageMatrix& matrix,
                                 const std::vector<uint32_t>& genes);

}  // namespace covclass
