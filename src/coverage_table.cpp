#include "covclass/coverage_table.hpp"

#include <cmath>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <unordered_set>
#include <zlib.h>

namespace covclass {

namespace {

// 4MB zlib buffer, as for the sequence readers
constexpr unsigned GZBUF_SIZE = 4 * 1024 * 1024;

// Line reader over zlib. gzopen reads uncompressed files transparently, so
// plain and .gz tables share one code path.
class TableReader {
public:
    explicit TableReader(const std::string& path) : path_(path) {
        gz_ = gzopen(path.c_str(), "rb");
        if (!gz_) {
            throw std::runtime_error("Cannot open table: " + path);
        }
        gzbuffer(gz_, GZBUF_SIZE);
    }

    ~TableReader() {
        if (gz_) gzclose(gz_);
    }

    TableReader(const TableReader&) = delete;
    TableReader& operator=(const TableReader&) = delete;

    // Next line without its line terminator. Returns false at EOF.
    bool getline(std::string& line) {
        line.clear();
        while (gzgets(gz_, buffer_, sizeof(buffer_)) != nullptr) {
            line.append(buffer_, strlen(buffer_));
            if (!line.empty() && line.back() == '\n') {
                ++line_no_;
                strip_eol(line);
                return true;
            }
        }
        int err = Z_OK;
        const char* msg = gzerror(gz_, &err);
        if (err != Z_OK) {
            throw std::runtime_error("Read error in " + path_ + ": " + msg);
        }
        if (line.empty()) return false;
        ++line_no_;
        strip_eol(line);
        return true;
    }

    size_t line_no() const { return line_no_; }
    const std::string& path() const { return path_; }

private:
    static void strip_eol(std::string& line) {
        while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
            line.pop_back();
        }
    }

    std::string path_;
    gzFile gz_ = nullptr;
    char buffer_[65536];
    size_t line_no_ = 0;
};

std::vector<std::string> split_tabs(const std::string& line) {
    std::vector<std::string> fields;
    size_t start = 0;
    while (true) {
        size_t tab = line.find('\t', start);
        if (tab == std::string::npos) {
            fields.push_back(line.substr(start));
            break;
        }
        fields.push_back(line.substr(start, tab - start));
        start = tab + 1;
    }
    return fields;
}

std::string where(const TableReader& reader) {
    return reader.path() + ":" + std::to_string(reader.line_no());
}

GeneId parse_gene_id(const std::string& value, const TableReader& reader) {
    try {
        size_t idx = 0;
        long long parsed = std::stoll(value, &idx);
        if (idx != value.size() || parsed < 0) {
            throw std::invalid_argument(value);
        }
        return static_cast<GeneId>(parsed);
    } catch (const std::logic_error&) {
        throw std::runtime_error(where(reader) + ": invalid gene id '" + value +
                                 "' (expected a non-negative integer)");
    }
}

double parse_coverage(const std::string& value, const std::string& sample,
                      const TableReader& reader) {
    double parsed = 0.0;
    try {
        size_t idx = 0;
        parsed = std::stod(value, &idx);
        if (idx != value.size()) {
            throw std::invalid_argument(value);
        }
    } catch (const std::logic_error&) {
        throw std::runtime_error(where(reader) + ": invalid coverage '" + value +
                                 "' for sample " + sample);
    }
    if (!std::isfinite(parsed) || parsed < 0.0) {
        throw std::runtime_error(where(reader) + ": coverage for sample " + sample +
                                 " must be a finite non-negative number (got " + value + ")");
    }
    return parsed;
}

bool read_header(TableReader& reader, std::vector<std::string>& header) {
    std::string line;
    while (reader.getline(line)) {
        if (line.empty()) continue;
        header = split_tabs(line);
        return true;
    }
    return false;
}

}  // namespace

CoverageMatrix load_coverage_table(const std::string& path) {
    TableReader reader(path);

    std::vector<std::string> header;
    if (!read_header(reader, header)) {
        throw std::runtime_error("Coverage table is empty: " + path);
    }

    CoverageMatrix matrix;
    matrix.samples.assign(header.begin() + 1, header.end());
    const size_t S = matrix.samples.size();

    std::unordered_set<std::string> seen_samples;
    for (const auto& s : matrix.samples) {
        if (!seen_samples.insert(s).second) {
            throw std::runtime_error("Duplicate sample '" + s + "' in header of " + path);
        }
    }

    std::unordered_set<GeneId> seen_genes;
    std::string line;
    while (reader.getline(line)) {
        if (line.empty()) continue;
        std::vector<std::string> fields = split_tabs(line);
        if (fields.size() != S + 1) {
            throw std::runtime_error(where(reader) + ": expected " + std::to_string(S + 1) +
                                     " columns, found " + std::to_string(fields.size()));
        }

        GeneId id = parse_gene_id(fields[0], reader);
        if (!seen_genes.insert(id).second) {
            throw std::runtime_error(where(reader) + ": duplicate gene id " + std::to_string(id));
        }
        matrix.gene_ids.push_back(id);
        for (size_t s = 0; s < S; ++s) {
            matrix.values.push_back(parse_coverage(fields[s + 1], matrix.samples[s], reader));
        }
    }

    return matrix;
}

AnnotationTable load_annotation_table(const std::string& path, bool integer_keys) {
    TableReader reader(path);

    std::vector<std::string> header;
    if (!read_header(reader, header)) {
        throw std::runtime_error("Annotation table is empty: " + path);
    }

    AnnotationTable table;
    table.key_column = header[0];
    table.columns.assign(header.begin() + 1, header.end());
    const size_t C = table.columns.size();

    std::string line;
    while (reader.getline(line)) {
        if (line.empty()) continue;
        std::vector<std::string> fields = split_tabs(line);
        if (fields.size() > C + 1) {
            throw std::runtime_error(where(reader) + ": expected at most " +
                                     std::to_string(C + 1) + " columns, found " +
                                     std::to_string(fields.size()));
        }
        fields.resize(C + 1);

        std::string key = integer_keys
            ? std::to_string(parse_gene_id(fields[0], reader))
            : fields[0];

        std::vector<std::string> values(fields.begin() + 1, fields.end());
        if (!table.rows.emplace(key, std::move(values)).second) {
            throw std::runtime_error(where(reader) + ": duplicate key '" + key + "'");
        }
    }

    return table;
}

namespace {

void write_header_extra(std::ostream& out, const AnnotationTable* extra) {
    if (!extra) return;
    for (const auto& c : extra->columns) out << '\t' << c;
}

void write_row_extra(std::ostream& out, const AnnotationTable* extra, const std::string& key) {
    if (!extra) return;
    const std::vector<std::string>* values = extra->find(key);
    for (size_t c = 0; c < extra->columns.size(); ++c) {
        out << '\t';
        if (values) out << (*values)[c];
    }
}

}  // namespace

void write_gene_table(std::ostream& out,
                      const CoverageMatrix& matrix,
                      const ClassificationResult& result,
                      const AnnotationTable* layers) {
    if (result.genes.size() != matrix.gene_ids.size()) {
        throw std::runtime_error("Classification covers " + std::to_string(result.genes.size()) +
                                 " genes, coverage table has " +
                                 std::to_string(matrix.gene_ids.size()));
    }

    out << "gene_callers_id\tgene_class\tnumber_of_detections\tportion_detected";
    write_header_extra(out, layers);
    out << '\n';

    out << std::fixed;
    for (uint32_t g = 0; g < matrix.num_genes(); ++g) {
        const GeneClassRecord& r = result.genes[g];
        const std::string key = std::to_string(matrix.gene_ids[g]);
        out << key
            << '\t' << gene_class_to_string(r.gene_class)
            << '\t' << r.number_of_detections
            << '\t' << std::setprecision(4) << r.portion_detected;
        write_row_extra(out, layers, key);
        out << '\n';
    }
}

void write_sample_table(std::ostream& out,
                        const CoverageMatrix& matrix,
                        const ClassificationResult& result,
                        const AnnotationTable* info) {
    if (result.genome_detected.size() != matrix.samples.size()) {
        throw std::runtime_error("Genome detection covers " +
                                 std::to_string(result.genome_detected.size()) +
                                 " samples, coverage table has " +
                                 std::to_string(matrix.samples.size()));
    }

    out << "samples\tdetection";
    write_header_extra(out, info);
    out << '\n';

    for (uint32_t s = 0; s < matrix.num_samples(); ++s) {
        out << matrix.samples[s] << '\t' << (result.genome_detected[s] ? "True" : "False");
        write_row_extra(out, info, matrix.samples[s]);
        out << '\n';
    }
}

void write_gene_table(const std::string& path,
                      const CoverageMatrix& matrix,
                      const ClassificationResult& result,
                      const AnnotationTable* layers) {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Cannot create output file: " + path);
    }
    write_gene_table(out, matrix, result, layers);
    if (!out) {
        throw std::runtime_error("Failed writing output file: " + path);
    }
}

void write_sample_table(const std::string& path,
                        const CoverageMatrix& matrix,
                        const ClassificationResult& result,
                        const AnnotationTable* info) {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Cannot create output file: " + path);
    }
    write_sample_table(out, matrix, result, info);
    if (!out) {
        throw std::runtime_error("Failed writing output file: " + path);
    }
}

}  // namespace covclass
