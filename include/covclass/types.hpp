#pragma once
// Core data types shared by the classification engine and the table I/O layer.
//
// A coverage matrix is stored dense and row-major (one row per gene, one column
// per sample). Gene subsets are passed around as lists of row indices; an empty
// list always means "every gene".

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace covclass {

using GeneId = int64_t;

// Fatal configuration or invariant error. Never retried.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

struct CoverageMatrix {
    std::vector<GeneId> gene_ids;       // row order (input order)
    std::vector<std::string> samples;   // column order (input order)
    std::vector<double> values;         // values[g * num_samples() + s]

    uint32_t num_genes() const { return static_cast<uint32_t>(gene_ids.size()); }
    uint32_t num_samples() const { return static_cast<uint32_t>(samples.size()); }

    double at(uint32_t g, uint32_t s) const {
        return values[static_cast<size_t>(g) * samples.size() + s];
    }
    const double* row(uint32_t g) const {
        return values.data() + static_cast<size_t>(g) * samples.size();
    }
};

enum class Specificity : uint8_t {
    UNDEFINED,
    TS,     // taxon-specific
    TNS     // taxon-non-specific
};

enum class CoreAccessory : uint8_t {
    UNDEFINED,
    CORE,
    ACCESSORY
};

enum class GeneClass : uint8_t {
    UNDEFINED,
    TSC,
    TSA,
    TNC,
    TNA
};

inline const char* specificity_to_string(Specificity s) {
    switch (s) {
        case Specificity::TS:  return "TS";
        case Specificity::TNS: return "TNS";
        default: return "NaN";
    }
}

inline const char* core_accessory_to_string(CoreAccessory c) {
    switch (c) {
        case CoreAccessory::CORE:      return "core";
        case CoreAccessory::ACCESSORY: return "accessory";
        default: return "NaN";
    }
}

// "NaN" is the output spelling of UNDEFINED, kept for downstream tools that
// read the gene table.
inline const char* gene_class_to_string(GeneClass c) {
    switch (c) {
        case GeneClass::TSC: return "TSC";
        case GeneClass::TSA: return "TSA";
        case GeneClass::TNC: return "TNC";
        case GeneClass::TNA: return "TNA";
        default: return "NaN";
    }
}

// Per-gene classification snapshot produced by one iteration
struct GeneClassRecord {
    Specificity specificity = Specificity::UNDEFINED;
    CoreAccessory core_accessory = CoreAccessory::UNDEFINED;
    GeneClass gene_class = GeneClass::UNDEFINED;
    uint32_t number_of_detections = 0;            // across all samples
    uint32_t detection_in_positive_samples = 0;   // genome-positive samples only
    double portion_detected = 0.0;                // of genome-positive samples
    double adjusted_variability = 0.0;
};

}  // namespace covclass
