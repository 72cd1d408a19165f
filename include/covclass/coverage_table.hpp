#pragma once
// TAB-delimited table I/O around the classifier
//
// Input coverage table (plain or gzip-compressed):
//
//     gene_callers_id  sample_A  sample_B  ...
//     17               12.5      0.0       ...
//
// Annotation tables share the layout, but every non-key cell is kept as text.
// Output tables are written in the gene / sample order of the coverage table.

#include <iosfwd>
#include <string>
#include <unordered_map>
#include <vector>

#include "covclass/classifier.hpp"
#include "covclass/types.hpp"

namespace covclass {

// Free-form columns keyed by the first column of the table
struct AnnotationTable {
    std::string key_column;
    std::vector<std::string> columns;   // excludes the key column
    std::unordered_map<std::string, std::vector<std::string>> rows;

    // nullptr if `key` has no row
    const std::vector<std::string>* find(const std::string& key) const {
        auto it = rows.find(key);
        return it == rows.end() ? nullptr : &it->second;
    }
};

// Throws std::runtime_error on unreadable files and malformed content
// (non-integer gene id, non-numeric/negative coverage, short or long rows,
// duplicate gene ids).
CoverageMatrix load_coverage_table(const std::string& path);

// `integer_keys` normalizes the key column as an integer gene id ("007" -> "7")
// and rejects non-integer keys.
AnnotationTable load_annotation_table(const std::string& path, bool integer_keys);

// gene_callers_id, gene_class, number_of_detections, portion_detected, [layers...]
void write_gene_table(std::ostream& out,
                      const CoverageMatrix& matrix,
                      const ClassificationResult& result,
                      const AnnotationTable* layers = nullptr);

// samples, detection, [sample information...]
void write_sample_table(std::ostream& out,
                        const CoverageMatrix& matrix,
                        const ClassificationResult& result,
                        const AnnotationTable* info = nullptr);

void write_gene_table(const std::string& path,
                      const CoverageMatrix& matrix,
                      const ClassificationResult& result,
                      const AnnotationTable* layers = nullptr);

void write_sample_table(const std::string& path,
                        const CoverageMatrix& matrix,
                        const ClassificationResult& result,
                        const AnnotationTable* info = nullptr);

}  // namespace covclass
