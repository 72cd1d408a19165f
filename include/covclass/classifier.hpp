#pragma once
// Iterative gene classifier
//
// Alternates between estimating detection (of genes and of the genome) and
// re-estimating per-gene coverage dispersion restricted to the current
// taxon-specific core (TSC) genes, until the loss moves by less than 2*beta
// between consecutive iterations.
//
// Iteration k:
//   1. sample mean/std over the TSC genes of iteration k-1 (all genes at k=1)
//   2. gene detection, then genome detection with the same TSC genes as reference
//   3. adjusted variability per gene
//   4. specificity, core/accessory and gene class per gene
//   5. loss; TSC genes of iteration k become the next reference set
//
// After the last iteration the genome detection is recomputed once more with
// the final TSC set as reference; that map is what the result reports.

#include <cstdint>
#include <functional>
#include <limits>
#include <vector>

#include "covclass/detection_model.hpp"
#include "covclass/sample_stats.hpp"
#include "covclass/types.hpp"

namespace covclass {

struct ClassifierParams {
    double alpha = 0.5;            // fraction of reference genes needed to call the genome present
    double beta = 1.0;             // adjusted-variability cutoff for TS, also the per-gene loss penalty
    double gamma = 3.0;            // detection floor, in standard deviations below the mean
    double eta = 0.95;             // fraction of genome-positive samples needed to call a gene core
    uint32_t max_iterations = 100; // safety bound on the fixed-point loop

    // Throws ConfigError on the first invalid value.
    void validate() const;
};

struct ClassCounts {
    uint32_t ts = 0;
    uint32_t tsc = 0;
    uint32_t tsa = 0;
    uint32_t tnc = 0;
    uint32_t tna = 0;
    uint32_t undefined = 0;
    uint32_t genome_positive_samples = 0;
};

ClassCounts count_classes(const std::vector<GeneClassRecord>& records,
                          const std::vector<uint8_t>& genome_detected);

// Per-iteration diagnostics emitted by the classifier.
struct IterationDiagnostics {
    uint32_t iteration = 0;
    double loss = 0.0;
    double loss_change = std::numeric_limits<double>::infinity();  // inf on the first iteration
    uint32_t reference_genes = 0;    // size of the TSC set the iteration started from
    uint64_t positive_below_threshold = 0;
    ClassCounts counts;
};

using ClassifierProgressCallback = std::function<void(const IterationDiagnostics&)>;

// Everything one iteration derives from a reference gene set. Owned by the
// iteration; nothing in here is mutated afterwards.
struct IterationSnapshot {
    SampleStats stats;
    DetectionTable detection;
    std::vector<uint8_t> genome_detected;
    std::vector<GeneClassRecord> records;
    std::vector<uint32_t> tsc_genes;
    double loss = 0.0;
};

// One pass of steps 1-5 using `reference_genes` (empty = all genes).
IterationSnapshot run_iteration(const CoverageMatrix& matrix,
                                const ClassifierParams& params,
                                const std::vector<uint32_t>& reference_genes);

enum class ConvergenceStatus {
    CONVERGED,
    MAX_ITERATIONS_REACHED
};

inline const char* convergence_status_to_string(ConvergenceStatus s) {
    return s == ConvergenceStatus::CONVERGED ? "converged" : "max-iterations-reached";
}

struct ClassificationResult {
    std::vector<GeneClassRecord> genes;      // aligned with matrix.gene_ids
    std::vector<uint8_t> genome_detected;    // aligned with matrix.samples
    std::vector<uint32_t> tsc_genes;         // final taxon-specific core set
    ConvergenceStatus status = ConvergenceStatus::MAX_ITERATIONS_REACHED;
    uint32_t iterations = 0;
    double loss = 0.0;
    double previous_loss = std::numeric_limits<double>::quiet_NaN();

    bool converged() const { return status == ConvergenceStatus::CONVERGED; }
};

// Validates `params`, then runs the fixed-point loop.
ClassificationResult classify_genes(const CoverageMatrix& matrix,
                                    const ClassifierParams& params,
                                    ClassifierProgressCallback progress = nullptr);

}  // namespace covclass
