// Iterative gene classifier: fixed-point loop over detection and dispersion

#include "covclass/classifier.hpp"
#include "covclass/gene_rules.hpp"

#include <cmath>
#include <sstream>
#include <string>
#include <utility>

namespace covclass {

namespace {

std::string format_value(double v) {
    std::ostringstream oss;
    oss << v;
    return oss.str();
}

}  // namespace

void ClassifierParams::validate() const {
    if (!std::isfinite(gamma)) {
        throw ConfigError("Gamma value must be a real number (got " + format_value(gamma) + ")");
    }
    if (gamma < 0.0) {
        throw ConfigError("Gamma value must be >= 0 (got " + format_value(gamma) + ")");
    }
    if (!std::isfinite(alpha) || alpha < 0.0 || alpha > 1.0) {
        throw ConfigError("Alpha value must be in [0, 1] (got " + format_value(alpha) + ")");
    }
    if (!std::isfinite(beta) || beta <= 0.0) {
        throw ConfigError("Beta value must be a positive real number (got " + format_value(beta) + ")");
    }
    if (!std::isfinite(eta) || eta < 0.0 || eta > 1.0) {
        throw ConfigError("Eta value must be in [0, 1] (got " + format_value(eta) + ")");
    }
    if (max_iterations < 1) {
        throw ConfigError("Maximum number of iterations must be >= 1");
    }
}

ClassCounts count_classes(const std::vector<GeneClassRecord>& records,
                          const std::vector<uint8_t>& genome_detected) {
    ClassCounts c;
    for (const auto& r : records) {
        if (r.specificity == Specificity::TS) ++c.ts;
        switch (r.gene_class) {
            case GeneClass::TSC: ++c.tsc; break;
            case GeneClass::TSA: ++c.tsa; break;
            case GeneClass::TNC: ++c.tnc; break;
            case GeneClass::TNA: ++c.tna; break;
            default: ++c.undefined; break;
        }
    }
    for (uint8_t d : genome_detected) {
        if (d) ++c.genome_positive_samples;
    }
    return c;
}

IterationSnapshot run_iteration(const CoverageMatrix& matrix,
                                const ClassifierParams& params,
                                const std::vector<uint32_t>& reference_genes) {
    IterationSnapshot snap;
    const uint32_t G = matrix.num_genes();
    const uint32_t S = matrix.num_samples();

    snap.stats = compute_sample_stats(matrix, reference_genes);
    snap.detection = detect_genes(matrix, snap.stats, params.gamma);
    snap.genome_detected = detect_genome_in_samples(snap.detection, params.alpha, reference_genes);

    std::vector<uint32_t> positive_samples;
    for (uint32_t s = 0; s < S; ++s) {
        if (snap.genome_detected[s]) positive_samples.push_back(s);
    }
    const uint32_t n_positive = static_cast<uint32_t>(positive_samples.size());

    const std::vector<double> adj =
        compute_adjusted_variabilities(matrix, snap.stats, snap.detection);

    snap.records.resize(G);
    for (uint32_t g = 0; g < G; ++g) {
        GeneClassRecord& r = snap.records[g];
        r.adjusted_variability = adj[g];
        r.number_of_detections = snap.detection.number_of_detections[g];
        r.specificity = classify_specificity(r.number_of_detections, adj[g], params.beta);

        uint32_t in_positive = 0;
        for (uint32_t s : positive_samples) {
            if (snap.detection.is_detected(g, s)) ++in_positive;
        }
        r.detection_in_positive_samples = in_positive;
        r.portion_detected = (in_positive == 0)
            ? 0.0
            : static_cast<double>(in_positive) / static_cast<double>(n_positive);

        r.core_accessory = classify_core_accessory(r.number_of_detections, in_positive,
                                                   n_positive, params.eta);
        r.gene_class = combine_gene_class(r.specificity, r.core_accessory);

        if (r.gene_class == GeneClass::TSC) snap.tsc_genes.push_back(g);
    }

    snap.loss = compute_loss(snap.records, params.beta);
    return snap;
}

ClassificationResult classify_genes(const CoverageMatrix& matrix,
                                    const ClassifierParams& params,
                                    ClassifierProgressCallback progress) {
    params.validate();

    const double epsilon = 2.0 * params.beta;
    ClassificationResult result;

    std::vector<uint32_t> reference;  // empty = all genes
    IterationSnapshot snap;
    bool have_loss = false;
    double loss = 0.0;

    for (uint32_t iter = 1; iter <= params.max_iterations; ++iter) {
        const uint32_t n_reference = reference.empty()
            ? matrix.num_genes()
            : static_cast<uint32_t>(reference.size());

        snap = run_iteration(matrix, params, reference);

        IterationDiagnostics diag;
        diag.iteration = iter;
        diag.loss = snap.loss;
        diag.reference_genes = n_reference;
        diag.positive_below_threshold = snap.detection.positive_below_threshold;
        diag.counts = count_classes(snap.records, snap.genome_detected);

        bool converged = false;
        if (have_loss) {
            diag.loss_change = std::abs(snap.loss - loss);
            converged = diag.loss_change < epsilon;
            result.previous_loss = loss;
        }

        loss = snap.loss;
        have_loss = true;
        reference = snap.tsc_genes;
        result.iterations = iter;

        if (progress) progress(diag);

        if (converged) {
            result.status = ConvergenceStatus::CONVERGED;
            break;
        }
    }

    result.loss = loss;
    result.genome_detected =
        detect_genome_in_samples(snap.detection, params.alpha, snap.tsc_genes);
    result.genes = std::move(snap.records);
    result.tsc_genes = std::move(snap.tsc_genes);
    return result;
}

}  // namespace covclass
