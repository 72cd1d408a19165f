// tests/test_coverage_table.cpp
//
// Coverage/annotation table loading (plain and gzip) and result writers.

#include "covclass/classifier.hpp"
#include "covclass/coverage_table.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <zlib.h>

namespace fs = std::filesystem;

namespace {

void expect(bool ok, const std::string& msg, int& failed) {
    if (!ok) {
        std::cerr << "  FAIL: " << msg << "\n";
        ++failed;
    }
}

fs::path temp_path(const std::string& name) {
    return fs::temp_directory_path() / ("covclass_test_" + name);
}

fs::path write_plain(const std::string& name, const std::string& content) {
    fs::path p = temp_path(name);
    std::ofstream out(p, std::ios::binary);
    out << content;
    return p;
}

fs::path write_gz(const std::string& name, const std::string& content) {
    fs::path p = temp_path(name);
    gzFile gz = gzopen(p.c_str(), "wb");
    if (!gz) throw std::runtime_error("cannot create " + p.string());
    gzwrite(gz, content.data(), static_cast<unsigned>(content.size()));
    gzclose(gz);
    return p;
}

template <typename Fn>
bool throws_runtime_error(Fn&& fn) {
    try {
        fn();
    } catch (const std::runtime_error&) {
        return true;
    }
    return false;
}

const std::string kCoverage =
    "gene_callers_id\tS1\tS2\tS3\n"
    "17\t5.5\t0\t2\n"
    "\n"
    "3\t1e1\t4.25\t0.0\r\n"
    "42\t0\t0\t7";   // no trailing newline

int check_coverage(const covclass::CoverageMatrix& m, const std::string& label) {
    int failed = 0;
    expect(m.samples == std::vector<std::string>({"S1", "S2", "S3"}), label + ": sample names", failed);
    expect(m.gene_ids == std::vector<covclass::GeneId>({17, 3, 42}), label + ": gene ids in file order", failed);
    expect(m.num_genes() == 3 && m.num_samples() == 3, label + ": dimensions", failed);
    if (failed) return failed;
    expect(m.at(0, 0) == 5.5 && m.at(0, 1) == 0.0 && m.at(0, 2) == 2.0, label + ": row 17", failed);
    expect(m.at(1, 0) == 10.0 && m.at(1, 1) == 4.25 && m.at(1, 2) == 0.0, label + ": row 3 (CRLF)", failed);
    expect(m.at(2, 2) == 7.0, label + ": last row without newline", failed);
    return failed;
}

int test_load_coverage() {
    std::cout << "[io] load coverage table (plain and gzip)\n";
    int failed = 0;

    auto plain = write_plain("cov.tsv", kCoverage);
    failed += check_coverage(covclass::load_coverage_table(plain.string()), "plain");

    auto gz = write_gz("cov.tsv.gz", kCoverage);
    failed += check_coverage(covclass::load_coverage_table(gz.string()), "gzip");

    fs::remove(plain);
    fs::remove(gz);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_load_coverage_errors() {
    std::cout << "[io] malformed coverage tables\n";
    int failed = 0;

    const std::vector<std::pair<std::string, std::string>> bad = {
        {"non-numeric coverage", "gene\tA\tB\n1\t2.0\tabc\n"},
        {"trailing garbage",     "gene\tA\tB\n1\t2.0x\t1\n"},
        {"negative coverage",    "gene\tA\tB\n1\t-2.0\t1\n"},
        {"nan coverage",         "gene\tA\tB\n1\tnan\t1\n"},
        {"short row",            "gene\tA\tB\n1\t2.0\n"},
        {"long row",             "gene\tA\tB\n1\t2.0\t3\t4\n"},
        {"duplicate gene id",    "gene\tA\n1\t2\n1\t3\n"},
        {"non-integer gene id",  "gene\tA\nfoo\t2\n"},
        {"negative gene id",     "gene\tA\n-4\t2\n"},
        {"duplicate sample",     "gene\tA\tA\n1\t2\t3\n"},
        {"empty file",           ""},
    };

    for (const auto& [label, content] : bad) {
        auto p = write_plain("bad.tsv", content);
        expect(throws_runtime_error([&] { (void)covclass::load_coverage_table(p.string()); }),
               label + " should throw", failed);
        fs::remove(p);
    }

    expect(throws_runtime_error([] {
               (void)covclass::load_coverage_table("/nonexistent/dir/coverage.tsv");
           }),
           "missing file should throw", failed);

    // The error names the offending line
    auto p = write_plain("bad_line.tsv", "gene\tA\n1\t2\n2\toops\n");
    try {
        (void)covclass::load_coverage_table(p.string());
        expect(false, "expected an error", failed);
    } catch (const std::runtime_error& e) {
        expect(std::string(e.what()).find(":3:") != std::string::npos,
               std::string("error should carry line 3: ") + e.what(), failed);
    }
    fs::remove(p);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_load_annotations() {
    std::cout << "[io] annotation tables\n";
    int failed = 0;

    auto genes = write_plain("layers.tsv",
                             "gene_callers_id\tcategory\tfunction\n"
                             "007\tribosomal\tL2\n"
                             "12\tphage\n");
    auto layers = covclass::load_annotation_table(genes.string(), true);
    expect(layers.key_column == "gene_callers_id", "key column name", failed);
    expect(layers.columns == std::vector<std::string>({"category", "function"}), "columns", failed);
    const auto* row7 = layers.find("7");
    expect(row7 != nullptr, "'007' should be normalized to '7'", failed);
    if (row7) expect((*row7)[0] == "ribosomal" && (*row7)[1] == "L2", "row 7 values", failed);
    const auto* row12 = layers.find("12");
    expect(row12 != nullptr && (*row12)[1].empty(), "short row padded with empty cells", failed);
    expect(layers.find("99") == nullptr, "absent key", failed);

    auto bad = write_plain("layers_bad.tsv", "gene_callers_id\tx\nabc\t1\n");
    expect(throws_runtime_error([&] { (void)covclass::load_annotation_table(bad.string(), true); }),
           "non-integer gene key should throw", failed);

    auto samples = write_plain("samples.tsv", "samples\tenvironment\nS1\tsoil\nS1\tgut\n");
    expect(throws_runtime_error([&] { (void)covclass::load_annotation_table(samples.string(), false); }),
           "duplicate sample key should throw", failed);

    fs::remove(genes);
    fs::remove(bad);
    fs::remove(samples);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_writers() {
    std::cout << "[io] gene and sample table writers\n";
    int failed = 0;

    covclass::CoverageMatrix m;
    m.gene_ids = {7, 9, 11};
    m.samples = {"S1", "S2", "S3"};
    m.values.assign(9, 1.0);

    covclass::ClassificationResult r;
    r.genes.resize(3);
    r.genes[0].gene_class = covclass::GeneClass::TSC;
    r.genes[0].number_of_detections = 3;
    r.genes[0].portion_detected = 1.0;
    r.genes[1].gene_class = covclass::GeneClass::UNDEFINED;
    r.genes[2].gene_class = covclass::GeneClass::TNA;
    r.genes[2].number_of_detections = 2;
    r.genes[2].portion_detected = 1.0 / 3.0;
    r.genome_detected = {1, 0, 1};

    {
        std::ostringstream out;
        covclass::write_gene_table(out, m, r);
        expect(out.str() ==
               "gene_callers_id\tgene_class\tnumber_of_detections\tportion_detected\n"
               "7\tTSC\t3\t1.0000\n"
               "9\tNaN\t0\t0.0000\n"
               "11\tTNA\t2\t0.3333\n",
               "gene table without layers:\n" + out.str(), failed);
    }

    covclass::AnnotationTable layers;
    layers.key_column = "gene_callers_id";
    layers.columns = {"category"};
    layers.rows["7"] = {"ribosomal"};
    layers.rows["11"] = {"phage"};
    {
        std::ostringstream out;
        covclass::write_gene_table(out, m, r, &layers);
        expect(out.str() ==
               "gene_callers_id\tgene_class\tnumber_of_detections\tportion_detected\tcategory\n"
               "7\tTSC\t3\t1.0000\tribosomal\n"
               "9\tNaN\t0\t0.0000\t\n"
               "11\tTNA\t2\t0.3333\tphage\n",
               "gene table with layers:\n" + out.str(), failed);
    }

    covclass::AnnotationTable info;
    info.key_column = "samples";
    info.columns = {"environment", "depth"};
    info.rows["S1"] = {"soil", "10m"};
    {
        std::ostringstream out;
        covclass::write_sample_table(out, m, r, &info);
        expect(out.str() ==
               "samples\tdetection\tenvironment\tdepth\n"
               "S1\tTrue\tsoil\t10m\n"
               "S2\tFalse\t\t\n"
               "S3\tTrue\t\t\n",
               "sample table with information:\n" + out.str(), failed);
    }

    r.genome_detected.pop_back();
    std::ostringstream sink;
    expect(throws_runtime_error([&] { covclass::write_sample_table(sink, m, r); }),
           "sample count mismatch should throw", failed);
    r.genes.pop_back();
    expect(throws_runtime_error([&] { covclass::write_gene_table(sink, m, r); }),
           "gene count mismatch should throw", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_end_to_end() {
    std::cout << "[io] load -> classify -> write\n";
    int failed = 0;

    std::ostringstream table;
    table << "gene_callers_id";
    for (int s = 0; s < 5; ++s) table << "\tmg_" << s;
    table << "\n";
    const double depth[5] = {4.0, 8.0, 16.0, 6.0, 10.0};
    for (int g = 0; g < 12; ++g) {
        table << (g + 1);
        for (int s = 0; s < 5; ++s) {
            table << '\t' << depth[s] * (1.0 + 0.05 * ((g + s) % 4));
        }
        table << "\n";
    }
    auto in = write_gz("e2e.tsv.gz", table.str());

    auto m = covclass::load_coverage_table(in.string());
    auto r = covclass::classify_genes(m, covclass::ClassifierParams{});
    expect(r.converged(), "should converge", failed);

    auto genes_out = temp_path("e2e_genes.tsv");
    auto samples_out = temp_path("e2e_samples.tsv");
    covclass::write_gene_table(genes_out.string(), m, r);
    covclass::write_sample_table(samples_out.string(), m, r);

    auto count_lines = [](const fs::path& p) {
        std::ifstream f(p);
        std::string line;
        size_t n = 0;
        while (std::getline(f, line)) ++n;
        return n;
    };
    expect(count_lines(genes_out) == 13, "gene table: header + 12 rows", failed);
    expect(count_lines(samples_out) == 6, "sample table: header + 5 rows", failed);

    expect(throws_runtime_error([&] {
               covclass::write_gene_table("/nonexistent/dir/out.tsv", m, r);
           }),
           "unwritable output should throw", failed);

    fs::remove(in);
    fs::remove(genes_out);
    fs::remove(samples_out);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

}  // anonymous namespace

int main() {
    int total = 0;
    total += test_load_coverage();
    total += test_load_coverage_errors();
    total += test_load_annotations();
    total += test_writers();
    total += test_end_to_end();

    if (total == 0) {
        std::cout << "\nAll table I/O tests passed.\n";
        return 0;
    }
    std::cerr << "\n" << total << " test(s) FAILED.\n";
    return 1;
}
