#include <gtest/gtest.h>
#include "code128.hpp"
#include "errors.hpp"

using namespace labelsheet;

TEST(Code128Test, SetBWithChecksum) {
    Code128Symbol s = encode_code128("Wikipedia");
    std::vector<int> expected{104, 55, 73, 75, 73, 80, 69, 68, 73, 65, 88, 106};
    EXPECT_EQ(s.codewords, expected);
    EXPECT_EQ(s.modules, 11u * 11u + 13u);
}

TEST(Code128Test, EvenDigitsUseSetC) {
    Code128Symbol s = encode_code128("123456");
    std::vector<int> expected{105, 12, 34, 56, 44, 106};
    EXPECT_EQ(s.codewords, expected);
}

TEST(Code128Test, OddLeadingDigitsSwitchAfterOne) {
    Code128Symbol s = encode_code128("12345");
    std::vector<int> expected{104, 17, 99, 23, 45, 53, 106};
    EXPECT_EQ(s.codewords, expected);
}

TEST(Code128Test, LongInnerDigitRunSwitchesToC) {
    Code128Symbol s = encode_code128("TS-000123");
    std::vector<int> expected{104, 52, 51, 13, 99, 0, 1, 23, 36, 106};
    EXPECT_EQ(s.codewords, expected);
}

TEST(Code128Test, ShortInnerDigitRunStaysInB) {
    Code128Symbol s = encode_code128("AB1234CD");
    std::vector<int> expected{104, 33, 34, 17, 18, 19, 20, 35, 36, 46, 106};
    EXPECT_EQ(s.codewords, expected);
}

TEST(Code128Test, WidthsStartWithBarAndSumToModules) {
    Code128Symbol s = encode_code128("TASSO-42");
    unsigned sum = 0;
    for (uint8_t w : s.widths) {
        EXPECT_GE(w, 1);
        EXPECT_LE(w, 4);
        sum += w;
    }
    EXPECT_EQ(sum, s.modules);
    EXPECT_EQ(s.widths.size() % 2, 1u);   // ends on the stop bar
    EXPECT_EQ(s.modules, 11u * (s.codewords.size() - 1) + 13u);
}

TEST(Code128Test, RejectsUnsupportedCharacters) {
    try {
        encode_code128("AB\tC");
        FAIL() << "expected EncodingError";
    } catch (const EncodingError& e) {
        EXPECT_EQ(e.identifier, "AB\tC");
        EXPECT_NE(std::string(e.what()).find("0x09"), std::string::npos);
    }
    EXPECT_THROW(encode_code128("caf\xC3\xA9"), EncodingError);
    EXPECT_THROW(encode_code128(""), EncodingError);
}
