#include "covclass/gene_rules.hpp"

#include <cmath>
#include <string>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace covclass {

double adjusted_variability(const CoverageMatrix& matrix,
                            uint32_t gene,
                            const SampleStats& stats,
                            const DetectionTable& detection) {
    const uint32_t S = matrix.num_samples();
    const double* row = matrix.row(gene);

    double sum = 0.0;
    uint32_t n = 0;
    for (uint32_t s = 0; s < S; ++s) {
        if (detection.is_detected(gene, s) && stats.mean[s] > 0.0) {
            sum += row[s] / stats.mean[s];
            ++n;
        }
    }
    if (n == 0) return 0.0;

    const double mu = sum / static_cast<double>(n);
    double sq = 0.0;
    for (uint32_t s = 0; s < S; ++s) {
        if (detection.is_detected(gene, s) && stats.mean[s] > 0.0) {
            const double d = row[s] / stats.mean[s] - mu;
            sq += d * d;
        }
    }
    return std::sqrt(sq / static_cast<double>(n));
}

std::vector<double> compute_adjusted_variabilities(const CoverageMatrix& matrix,
                                                   const SampleStats& stats,
                                                   const DetectionTable& detection) {
    const uint32_t G = matrix.num_genes();
    std::vector<double> adj(G, 0.0);

    #pragma omp parallel for schedule(static)
    for (uint32_t g = 0; g < G; ++g) {
        adj[g] = adjusted_variability(matrix, g, stats, detection);
    }
    return adj;
}

Specificity classify_specificity(uint32_t number_of_detections,
                                 double adjusted_var,
                                 double beta) {
    // A single detection carries no dispersion information
    if (number_of_detections <= 1) return Specificity::UNDEFINED;
    return adjusted_var < beta ? Specificity::TS : Specificity::TNS;
}

CoreAccessory classify_core_accessory(uint32_t number_of_detections,
                                      uint32_t detection_in_positive_samples,
                                      uint32_t num_positive_samples,
                                      double eta) {
    if (number_of_detections == 0) return CoreAccessory::UNDEFINED;
    if (static_cast<double>(detection_in_positive_samples) <
        eta * static_cast<double>(num_positive_samples)) {
        return CoreAccessory::ACCESSORY;
    }
    return CoreAccessory::CORE;
}

GeneClass combine_gene_class(Specificity specificity, CoreAccessory core_accessory) {
    if (specificity == Specificity::UNDEFINED ||
        core_accessory == CoreAccessory::UNDEFINED) {
        return GeneClass::UNDEFINED;
    }

    if (core_accessory != CoreAccessory::CORE &&
        core_accessory != CoreAccessory::ACCESSORY) {
        throw ConfigError("Invalid core/accessory label " +
                          std::to_string(static_cast<int>(core_accessory)) +
                          ". Value should be 'core' or 'accessory'");
    }

    const bool core = core_accessory == CoreAccessory::CORE;
    switch (specificity) {
        case Specificity::TS:  return core ? GeneClass::TSC : GeneClass::TSA;
        case Specificity::TNS: return core ? GeneClass::TNC : GeneClass::TNA;
        default:
            throw ConfigError("Invalid specificity label " +
                              std::to_string(static_cast<int>(specificity)) +
                              ". Value should be 'TS' or 'TNS'");
    }
}

double compute_loss(const std::vector<GeneClassRecord>& records, double beta) {
    double loss = 0.0;
    for (const auto& r : records) {
        loss += (r.specificity == Specificity::TS) ? r.adjusted_variability : beta;
    }
    return loss;
}

}  // namespace covclass
