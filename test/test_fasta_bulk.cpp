#include "test_util.hpp"
#include "io/fasta_bulk.hpp"
#include "io/fasta_writer.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

using namespace fastaio;

static std::string g_test_dir;

static Logger quiet() { return Logger(Logger::kError); }

static std::vector<std::pair<std::string, std::string>> make_alignment() {
    std::vector<std::pair<std::string, std::string>> data;
    data.emplace_back("A0ADS9_STRAM/3-104",
                      std::string(43, '-') + "STVELTKEN-F--D-Q--T-V----T-D" +
                      std::string(60, '-') + "NP" + std::string(90, '-'));
    data.emplace_back("A0AHX4_LISW6/1-102",
                      std::string(43, '-') + "MVKEITDAT-F--E-Q--E-T----S-E" +
                      std::string(120, '-') + "RGE");
    data.emplace_back("A0AJ61_LISW6/3-103", "NLESVEQFD");
    data.emplace_back("A0AK08_LISW6/41-151",
                      std::string(41, '-') + "FLN--TISTKD-F--K-Q--Q-M----A-D" +
                      std::string(80, '-'));
    return data;
}

static std::vector<FastaRecord<>> as_records(
        const std::vector<std::pair<std::string, std::string>>& data) {
    std::vector<FastaRecord<>> out;
    for (const auto& [desc, seq] : data) out.push_back({desc, seq});
    return out;
}

static std::string read_raw(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

static void test_round_trip_stream() {
    std::fprintf(stderr, "-- test_round_trip_stream\n");

    auto data = make_alignment();
    std::ostringstream os;
    CHECK_EQ(write_fasta(os, data, quiet()), 0u);

    std::istringstream in(os.str());
    CHECK(read_fasta(in) == as_records(data));

    // every output line fits the line width
    std::istringstream lines(os.str());
    std::string line;
    size_t longest = 0;
    while (std::getline(lines, line)) longest = std::max(longest, line.size());
    CHECK(longest <= FASTA_LINE_WIDTH);
}

static void test_round_trip_files() {
    std::fprintf(stderr, "-- test_round_trip_files\n");

    auto data = make_alignment();
    for (const std::string name : {"bulk.fa", "bulk.fa.gz"}) {
        std::string path = g_test_dir + "/" + name;
        write_fasta(path, data, WriteMode::kTruncate, quiet());
        CHECK(read_fasta(path) == as_records(data));

        auto bytes = read_fasta<std::vector<uint8_t>>(path);
        CHECK_EQ(bytes.size(), data.size());
        CHECK(std::string(bytes[2].sequence.begin(), bytes[2].sequence.end()) == "NLESVEQFD");

        auto chars = read_fasta<std::vector<char>>(path);
        CHECK(std::string(chars[0].sequence.begin(), chars[0].sequence.end()) == data[0].second);
    }

    std::string raw = read_raw(g_test_dir + "/bulk.fa.gz");
    CHECK(raw.size() > 2 && static_cast<unsigned char>(raw[0]) == 0x1f);
}

static void test_writer_modes_agree() {
    std::fprintf(stderr, "-- test_writer_modes_agree\n");

    auto data = make_alignment();
    std::ostringstream bulk;
    write_fasta(bulk, data, quiet());

    // write_entry
    std::ostringstream entries;
    {
        FastaWriter writer(entries, quiet());
        for (const auto& [desc, seq] : data) writer.write_entry(desc, seq);
        writer.close();
    }
    CHECK(entries.str() == bulk.str());

    // the bulk output fed back one character at a time
    std::ostringstream chars;
    {
        FastaWriter writer(chars, quiet());
        for (char c : bulk.str()) writer.write(c);
        writer.close();
    }
    CHECK(chars.str() == bulk.str());

    // lines split at arbitrary points
    std::ostringstream pieces;
    {
        std::vector<std::string> tokens;
        for (const auto& [desc, seq] : data) {
            tokens.push_back(">" + desc);
            for (size_t i = 0; i < seq.size(); i += 7 + i % 5)
                tokens.push_back(seq.substr(i, 7 + i % 5));
        }
        FastaWriter writer(pieces, quiet());
        writer.write(tokens);
        writer.close();
    }
    std::istringstream in(pieces.str());
    CHECK(read_fasta(in) == as_records(data));
}

static void test_map_input() {
    std::fprintf(stderr, "-- test_map_input\n");

    std::map<std::string, std::string> dict = {
        {"zeta", "GGGG"}, {"alpha", "AAAA"}, {"mid", "CC CC"},
    };
    std::ostringstream os;
    write_fasta(os, dict, quiet());
    CHECK(os.str() == ">alpha\nAAAA\n>mid\nCCCC\n>zeta\nGGGG\n");

    std::vector<FastaRecord<>> recs = {{"r1", "AC"}, {"r2", "GT"}};
    std::ostringstream os2;
    write_fasta(os2, recs, quiet());
    CHECK(os2.str() == ">r1\nAC\n>r2\nGT\n");
}

static void test_wrap() {
    std::fprintf(stderr, "-- test_wrap\n");

    std::vector<std::pair<std::string, std::string>> data = {
        {"X", std::string(85, 'A')},
        {"Y", std::string(80, 'C')},
    };
    std::ostringstream os;
    write_fasta(os, data, quiet());
    CHECK(os.str() == ">X\n" + std::string(80, 'A') + "\n" + std::string(5, 'A') + "\n" +
                      ">Y\n" + std::string(80, 'C') + "\n");
}

static void test_invalid_records() {
    std::fprintf(stderr, "-- test_invalid_records\n");

    struct Case {
        std::string desc;
        std::string data;
        FastaErrc errc;
    };
    std::vector<Case> cases = {
        {"DE\nSC", "DATA", FastaErrc::kEmbeddedNewline},
        {"", "DATA", FastaErrc::kEmptyDescription},
        {"DESC", "", FastaErrc::kEmptySequenceData},
        {"\xce\x94\xce\x95", "DATA", FastaErrc::kNonAsciiDescription},
        {"DESC", "\xce\x94\xce\x91", FastaErrc::kNonAsciiCharacter},
        {"DESC", "DA>TA", FastaErrc::kStrayMarkerInSequenceData},
    };

    for (const auto& c : cases) {
        std::vector<std::pair<std::string, std::string>> one = {{c.desc, c.data}};
        std::ostringstream os;
        CHECK_THROWS_ERRC(write_fasta(os, one, quiet()), c.errc);
    }
}

static void test_no_partial_record() {
    std::fprintf(stderr, "-- test_no_partial_record\n");

    std::vector<std::pair<std::string, std::string>> data = {
        {"ok", "ACGT"},
        {"X\nY", "GGGG"},
    };
    std::ostringstream os;
    CHECK_THROWS_ERRC(write_fasta(os, data, quiet()), FastaErrc::kEmbeddedNewline);
    CHECK(os.str() == ">ok\nACGT\n");
}

static void test_long_description() {
    std::fprintf(stderr, "-- test_long_description\n");

    std::vector<std::pair<std::string, std::string>> data = {
        {std::string(79, 'd'), "A"},
        {std::string(80, 'd'), "C"},
        {std::string(120, 'd'), "G"},
    };
    std::ostringstream os;
    CHECK_EQ(write_fasta(os, data, quiet()), 2u);

    std::istringstream in(os.str());
    auto recs = read_fasta(in);
    CHECK_EQ(recs.size(), 3u);
    CHECK_EQ(recs[2].description.size(), 120u);
}

static void test_description_trimmed() {
    std::fprintf(stderr, "-- test_description_trimmed\n");

    std::vector<std::pair<std::string, std::string>> data = {{"  padded desc\t ", "AC"}};
    std::ostringstream os;
    write_fasta(os, data, quiet());
    CHECK(os.str() == ">padded desc\nAC\n");
}

static void test_append() {
    std::fprintf(stderr, "-- test_append\n");

    std::string path = g_test_dir + "/append.fa.gz";
    std::vector<std::pair<std::string, std::string>> a = {{"a", "AC"}};
    std::vector<std::pair<std::string, std::string>> b = {{"b", "GT"}};
    write_fasta(path, a, WriteMode::kTruncate, quiet());
    write_fasta(path, b, WriteMode::kAppend, quiet());

    auto recs = read_fasta(path);
    CHECK_EQ(recs.size(), 2u);
    CHECK(recs[0].description == "a");
    CHECK(recs[1].sequence == "GT");
}

static void test_read_errors() {
    std::fprintf(stderr, "-- test_read_errors\n");

    CHECK_THROWS_ERRC(read_fasta(g_test_dir + "/missing.fa"), FastaErrc::kOpenFailure);

    std::string empty = g_test_dir + "/empty.fa";
    std::ofstream(empty).close();
    CHECK_THROWS_ERRC(read_fasta(empty), FastaErrc::kEmptyFile);
}

static void test_standard_streams() {
    std::fprintf(stderr, "-- test_standard_streams\n");

    // "-" reads stdin
    std::istringstream in(">G1\nACGT\nAC\n>G2\nTTTT\n");
    std::streambuf* saved_in = std::cin.rdbuf(in.rdbuf());
    auto recs = read_fasta(std::string("-"));
    std::cin.rdbuf(saved_in);

    CHECK_EQ(recs.size(), 2u);
    CHECK(recs[0].description == "G1");
    CHECK(recs[0].sequence == "ACGTAC");
    CHECK(recs[1].sequence == "TTTT");

    // "-" writes stdout
    std::ostringstream out;
    std::streambuf* saved_out = std::cout.rdbuf(out.rdbuf());
    {
        FastaWriter writer(std::string("-"), WriteMode::kTruncate, quiet());
        CHECK(writer.output_name() == "<stdout>");
        writer.write_entry("G1", "ACGTAC");
        writer.write_entry("G2", "TTTT");
        writer.close();
    }
    std::cout.rdbuf(saved_out);

    CHECK(out.str() == ">G1\nACGTAC\n>G2\nTTTT\n");
}

int main() {
    g_test_dir = "/tmp/fastaio_bulk_test";
    std::filesystem::create_directories(g_test_dir);

    test_round_trip_stream();
    test_round_trip_files();
    test_writer_modes_agree();
    test_map_input();
    test_wrap();
    test_invalid_records();
    test_no_partial_record();
    test_long_description();
    test_description_trimmed();
    test_append();
    test_read_errors();
    test_standard_streams();

    std::filesystem::remove_all(g_test_dir);

    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
