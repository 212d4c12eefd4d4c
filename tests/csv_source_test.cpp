#include <gtest/gtest.h>
#include <fstream>
#include <unistd.h>

#include "csv_source.hpp"
#include "errors.hpp"
#include "fsutil.hpp"

using namespace labelsheet;

namespace {
std::string scratch_dir(const std::string& name) {
    std::string dir = join2(::testing::TempDir(), "labelsheet_" + name + "_" + std::to_string(::getpid()));
    ensure_dir(dir);
    return dir;
}

std::string write_text(const std::string& dir, const std::string& name, const std::string& text) {
    std::string p = join2(dir, name);
    std::ofstream f(p, std::ios::binary);
    f << text;
    return p;
}
}

TEST(CsvSourceTest, ParsesQuotedFields) {
    auto rows = parse_csv("\xEF\xBB\xBFid,barcode\r\n1,\"A,B\"\r\n2,\"say \"\"hi\"\"\"\n\n3,C");
    ASSERT_EQ(rows.size(), 4u);
    EXPECT_EQ(rows[0][0], "id");
    EXPECT_EQ(rows[1][1], "A,B");
    EXPECT_EQ(rows[2][1], "say \"hi\"");
    EXPECT_EQ(rows[3][1], "C");
}

TEST(CsvSourceTest, ReadsBarcodeColumnAndSkipsBlanks) {
    std::string dir = scratch_dir("read");
    std::string p = write_text(dir, "batch1.csv",
        "patient,barcode,notes\n"
        "p1, TS-0001 ,x\n"
        "p2,,missing\n"
        "p3\n"
        "p4,TS-0004,\n");
    CsvBatch b = read_barcodes(p);
    EXPECT_EQ(b.source, "batch1.csv");
    ASSERT_EQ(b.barcodes.size(), 2u);
    EXPECT_EQ(b.barcodes[0], "TS-0001");
    EXPECT_EQ(b.barcodes[1], "TS-0004");
    EXPECT_EQ(b.skipped, 2u);
}

TEST(CsvSourceTest, MissingBarcodeColumnIsInputError) {
    std::string dir = scratch_dir("nocol");
    std::string p = write_text(dir, "x.csv", "id,code\n1,2\n");
    EXPECT_THROW(read_barcodes(p), InputResolutionError);
}

TEST(CsvSourceTest, DirectoryPatternIsSorted) {
    std::string dir = scratch_dir("glob");
    write_text(dir, "b.csv", "barcode\nB1\n");
    write_text(dir, "a.csv", "barcode\nA1\nA2\n");
    write_text(dir, "notes.txt", "barcode\nN\n");
    InputSpec spec;
    spec.directory = dir;
    auto files = resolve_inputs(spec);
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(path_basename(files[0]), "a.csv");
    EXPECT_EQ(path_basename(files[1]), "b.csv");

    LoadedInput in = load_records(files);
    ASSERT_EQ(in.records.size(), 3u);
    EXPECT_EQ(in.records[0].identifier, "A1");
    EXPECT_EQ(in.records[0].source, "a.csv");
    EXPECT_EQ(in.records[2].identifier, "B1");
    EXPECT_EQ(in.records[2].source, "b.csv");
    EXPECT_EQ(in.skipped(), 0u);
}

TEST(CsvSourceTest, ExplicitPathsKeepOrder) {
    std::string dir = scratch_dir("order");
    std::string z = write_text(dir, "z.csv", "barcode\nZ\n");
    std::string a = write_text(dir, "a.csv", "barcode\nA\n");
    InputSpec spec;
    spec.paths = {z, a};
    auto files = resolve_inputs(spec);
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0], z);
    EXPECT_EQ(files[1], a);
}

TEST(CsvSourceTest, NothingFoundIsInputError) {
    std::string dir = scratch_dir("empty");
    InputSpec spec;
    spec.directory = dir;
    EXPECT_THROW(resolve_inputs(spec), InputResolutionError);

    InputSpec missing;
    missing.paths = {join2(dir, "does-not-exist.csv")};
    EXPECT_THROW(resolve_inputs(missing), InputResolutionError);

    InputSpec nodir;
    nodir.directory = join2(dir, "nope");
    EXPECT_THROW(resolve_inputs(nodir), InputResolutionError);
}
