#pragma once
// Per-gene statistics and decision rules
//
// Adjusted variability: dispersion of a gene's coverage after normalizing by
// the taxon-specific mean coverage of each sample, so that abundance changes
// of the genome across samples cancel out. Only samples where the gene is
// detected and the sample mean is positive take part:
//
//     adj(g) = std_{s in D(g)} ( cov[g][s] / mean[s] ),  0 if D(g) is empty
//
// Decision rules:
//   specificity     n_det <= 1 -> UNDEFINED; adj < beta -> TS; else TNS
//   core/accessory  n_det == 0 -> UNDEFINED;
//                   n_det_pos < eta * n_pos_samples -> ACCESSORY; else CORE
//   gene class      UNDEFINED if either is UNDEFINED, else the 2x2 table
//
// Loss: sum over genes of adj(g) for TS genes and beta for everything else.

#include <cstdint>
#include <vector>

#include "covclass/detection_model.hpp"
#include "covclass/sample_stats.hpp"
#include "covclass/types.hpp"

namespace covclass {

double adjusted_variability(const CoverageMatrix& matrix,
                            uint32_t gene,
                            const SampleStats& stats,
                            const DetectionTable& detection);

// All genes, gene-parallel under OpenMP.
std::vector<double> compute_adjusted_variabilities(const CoverageMatrix& matrix,
                                                   const SampleStats& stats,
                                                   const DetectionTable& detection);

Specificity classify_specificity(uint32_t number_of_detections,
                                 double adjusted_var,
                                 double beta);

// With zero genome-positive samples the accessory test reads 0 < 0, so every
// gene detected at least once ends up CORE.
CoreAccessory classify_core_accessory(uint32_t number_of_detections,
                                      uint32_t detection_in_positive_samples,
                                      uint32_t num_positive_samples,
                                      double eta);

// Throws ConfigError for enumerators outside {TS, TNS} x {CORE, ACCESSORY}.
GeneClass combine_gene_class(Specificity specificity, CoreAccessory core_accessory);

double compute_loss(const std::vector<GeneClassRecord>& records, double beta);

}  // namespace covclass
