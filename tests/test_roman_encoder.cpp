/**
 * @file test_roman_encoder.cpp
 * @brief Unit tests for integer to Roman numeral conversion
 */

#include <gtest/gtest.h>
#include <cstdint>
#include <internal/numeral_config.hpp>
#include <internal/numeral_types.hpp>
#include <internal/roman/roman_encoder.hpp>
#include <internal/roman/roman_tables.hpp>
#include <string>
#include <vector>

using namespace numeral;
using namespace numeral::roman;

// ============================================================================
// RepeatLimiter
// ============================================================================

TEST(RepeatLimiterTest, FourthRepeatBecomesSubtractive) {
    const SymbolTable& table = SymbolTable::instance();
    const RomanSymbol* ten = table.findGlyph("Ⅹ");
    const RomanSymbol* fifty = table.findGlyph("Ⅼ");
    ASSERT_NE(ten, nullptr);
    ASSERT_NE(fifty, nullptr);

    RepeatLimiter limiter(3);
    std::vector<std::string> output;
    for (int i = 0; i < 3; ++i) {
        auto decision = limiter.decide(ten, fifty);
        EXPECT_EQ(decision.action, RepeatLimiter::Action::APPEND);
        limiter.apply(decision, output);
    }

    auto decision = limiter.decide(ten, fifty);
    EXPECT_EQ(decision.action, RepeatLimiter::Action::REPLACE_RUN);
    EXPECT_EQ(decision.symbol, fifty);
    limiter.apply(decision, output);

    ASSERT_EQ(output.size(), 2u);
    EXPECT_EQ(output[0], "Ⅹ");
    EXPECT_EQ(output[1], "Ⅼ");
}

TEST(RepeatLimiterTest, LargestSymbolRepeatsFreely) {
    const RomanSymbol* thousand = SymbolTable::instance().findGlyph("Ⅿ");
    ASSERT_NE(thousand, nullptr);

    RepeatLimiter limiter(3);
    for (int i = 0; i < 6; ++i) {
        EXPECT_EQ(limiter.decide(thousand, nullptr).action, RepeatLimiter::Action::APPEND);
    }
}

TEST(RepeatLimiterTest, Limits) {
    EXPECT_EQ(maxConsecutive(false), 3);
    EXPECT_EQ(maxConsecutive(true), 4);
    EXPECT_EQ(standardThreshold(false), 4000u);
    EXPECT_EQ(standardThreshold(true), 5000u);
}

// ============================================================================
// Unicode output
// ============================================================================

TEST(RomanEncoderTest, SmallNumbers) {
    const std::vector<std::string> expected = {
        "N", "Ⅰ", "Ⅱ", "Ⅲ", "Ⅳ", "Ⅴ", "Ⅵ", "Ⅶ", "Ⅷ", "Ⅸ", "Ⅹ", "Ⅺ", "Ⅻ",
    };
    for (int i = 0; i < static_cast<int>(expected.size()); ++i) {
        EXPECT_EQ(intToRoman(i), expected[i]) << "i=" << i;
    }
}

TEST(RomanEncoderTest, UnicodeLiterals) {
    EXPECT_EQ(intToRoman(44), "ⅩⅬⅣ");
    EXPECT_EQ(intToRoman(99), "ⅬⅩⅬⅨ");
    EXPECT_EQ(intToRoman(1666), "ⅯⅮⅭⅬⅩⅥ");
}

TEST(RomanEncoderTest, ClaudianLargeNumbers) {
    EXPECT_EQ(intToRoman(4000), "MⅮↃ");
    EXPECT_EQ(intToRoman(5000), "ⅮↃ");
    EXPECT_EQ(intToRoman(10000), "ⅭↀↃ");
    EXPECT_EQ(intToRoman(40000), "ⅭↀↃⅮↃↃ");
    EXPECT_EQ(intToRoman(50000), "ⅮↃↃ");
    EXPECT_EQ(intToRoman(100000), "ⅭⅭↀↃↃ");
    EXPECT_EQ(intToRoman(1000000), "ⅭⅭⅭↀↃↃↃ");
    EXPECT_EQ(intToRoman(16384), "ⅭↀↃⅮↃⅯⅭⅭⅭⅬⅩⅩⅩⅣ");
    EXPECT_EQ(intToRoman(65536), "ⅮↃↃⅭↀↃⅮↃⅮⅩⅩⅩⅥ");
}

TEST(RomanEncoderTest, ApostrophusLargeNumbers) {
    auto config = RomanConfig().withClaudian(false);
    EXPECT_EQ(intToRoman(4000, config), "ↀↁ");
    EXPECT_EQ(intToRoman(5000, config), "ↁ");
    EXPECT_EQ(intToRoman(40000, config), "ↂↇ");
    EXPECT_EQ(intToRoman(100000, config), "ↈ");
    EXPECT_EQ(intToRoman(150000, config), "ↈↇ");
    EXPECT_EQ(intToRoman(16384, config), "ↂↁⅯⅭⅭⅭⅬⅩⅩⅩⅣ");
}

// ============================================================================
// ASCII output
// ============================================================================

TEST(RomanEncoderTest, AsciiLiterals) {
    auto config = RomanConfig::Ascii();
    EXPECT_EQ(intToRoman(1666, config), "MDCLXVI");
    EXPECT_EQ(intToRoman(3999, config), "MMMDCDLXLIX");
    EXPECT_EQ(intToRoman(4000, config), "MDO");
    EXPECT_EQ(intToRoman(16384, config), "CCDODOMCCCLXXXIV");
    EXPECT_EQ(intToRoman(1000000, config), "CCCCDOOO");
    EXPECT_EQ(intToRoman(11, config), "XI");
    EXPECT_EQ(intToRoman(12, config), "XII");
}

TEST(RomanEncoderTest, AdditiveAscii) {
    auto config = RomanConfig::Additive().withAscii();
    EXPECT_EQ(intToRoman(4, config), "IIII");
    EXPECT_EQ(intToRoman(9, config), "VIIII");
    EXPECT_EQ(intToRoman(14, config), "XIIII");
    EXPECT_EQ(intToRoman(40, config), "XXXX");
    EXPECT_EQ(intToRoman(49, config), "XXXXVIIII");
    EXPECT_EQ(intToRoman(90, config), "LXXXX");
    EXPECT_EQ(intToRoman(400, config), "CCCC");
    EXPECT_EQ(intToRoman(4000, config), "MMMM");
    EXPECT_EQ(intToRoman(4999, config), "MMMMDCCCCLXXXXVIIII");
    EXPECT_EQ(intToRoman(5000, config), "DO");
}

TEST(RomanEncoderTest, AdditiveUnicode) {
    auto config = RomanConfig::Additive();
    EXPECT_EQ(intToRoman(4, config), "ⅡⅡ");
    EXPECT_EQ(intToRoman(9, config), "ⅧⅠ");
    EXPECT_EQ(intToRoman(14, config), "ⅩⅡⅡ");
}

// ============================================================================
// Glyph options
// ============================================================================

TEST(RomanEncoderTest, ArchaicGlyphs) {
    auto config = RomanConfig().withArchaic();
    EXPECT_EQ(intToRoman(26, config), "ⅩⅩↅ");
    EXPECT_EQ(intToRoman(55, config), "ↆⅤ");
    EXPECT_EQ(intToRoman(56, config), "ↆↅ");
    EXPECT_EQ(intToRoman(59, config), "ↆⅨ");
}

TEST(RomanEncoderTest, Lowercase) {
    auto config = RomanConfig().withUppercase(false);
    EXPECT_EQ(intToRoman(7, config), "ⅶ");
    EXPECT_EQ(intToRoman(1666, config), "ⅿⅾⅽⅼⅹⅵ");
    EXPECT_EQ(intToRoman(1666, config.withAscii()), "mdclxvi");
    EXPECT_EQ(intToRoman(4000, config.withAscii()), "mdo");
}

TEST(RomanEncoderTest, LowercaseTurnsClaudianBlocksIntoApostrophus) {
    auto config = RomanConfig().withUppercase(false);
    EXPECT_EQ(intToRoman(4000, config), "mↁ");
    EXPECT_EQ(intToRoman(5000, config), "ↁ");
    EXPECT_EQ(intToRoman(10000, config), "ↂ");
    EXPECT_EQ(intToRoman(40000, config), "ↂↇ");
    EXPECT_EQ(intToRoman(50000, config), "ↇ");
    EXPECT_EQ(intToRoman(100000, config), "ↈ");
    EXPECT_EQ(intToRoman(16384, config), "ↂↁⅿⅽⅽⅽⅼⅹⅹⅹⅳ");
    EXPECT_EQ(intToRoman(65536, config), "ↇↂↁⅾⅹⅹⅹⅵ");
}

TEST(RomanEncoderTest, LowercaseMatchesApostrophusRendering) {
    const auto lower = RomanConfig().withUppercase(false);
    const auto apostrophus = RomanConfig().withClaudian(false).withUppercase(false);
    for (int64_t n : {5000, 10000, 40000, 50000, 90000, 100000, 150000}) {
        EXPECT_EQ(intToRoman(n, lower), intToRoman(n, apostrophus)) << "n=" << n;
    }
}

TEST(RomanEncoderTest, LowercaseKeepsBlocksWithoutApostrophusGlyph) {
    // Only whole blocks are replaced, never a smaller block nested in a larger one
    auto config = RomanConfig().withUppercase(false);
    EXPECT_EQ(intToRoman(500000, config), "ⅾↄↄↄ");
    EXPECT_EQ(intToRoman(1000000, config), "ⅽⅽⅽↀↄↄↄ");
    EXPECT_EQ(intToRoman(1100000, config), "ⅽⅽⅽↀↄↄↄↈ");
}

TEST(RomanEncoderTest, Alternatives) {
    auto config = RomanConfig().withAlternatives({{"Ⅿ", "M"}, {"Ⅹ", "X"}});
    EXPECT_EQ(intToRoman(2024, config), "MMXXⅣ");
}

TEST(RomanEncoderTest, EmptyAlternativePatternIsRejected) {
    auto config = RomanConfig().withAlternatives({{"", "X"}});
    EXPECT_THROW(intToRoman(5, config), ConfigurationError);
}

// ============================================================================
// Signs
// ============================================================================

TEST(RomanEncoderTest, NegativeNumbers) {
    EXPECT_EQ(intToRoman(-1666, RomanConfig::Ascii()), "-MDCLXVI");
    EXPECT_EQ(intToRoman(-3, RomanConfig().withSigned(true, "neg ")), "neg Ⅲ");
    EXPECT_EQ(intToRoman(-7, RomanConfig().withUppercase(false)), "-ⅶ");
}

TEST(RomanEncoderTest, NegativeNeedsSignedOption) {
    EXPECT_THROW(intToRoman(-5, RomanConfig().withSigned(false)), ConfigurationError);
    EXPECT_THROW(intToRoman(-5, RomanConfig().withSigned(true, "")), ConfigurationError);
}

// ============================================================================
// Range limits
// ============================================================================

TEST(RomanEncoderTest, ClassicalRange) {
    auto config = RomanConfig::Classical();
    EXPECT_EQ(intToRoman(1, config), "I");
    EXPECT_EQ(intToRoman(3999, config), "MMMDCDLXLIX");
    EXPECT_THROW(intToRoman(0, config), ConfigurationError);
    EXPECT_THROW(intToRoman(4000, config), ConfigurationError);
    EXPECT_THROW(intToRoman(-1, config), ConfigurationError);
}

TEST(RomanEncoderTest, ExtendedOptionGatesZeroAndLargeNumbers) {
    auto config = RomanConfig().withExtended(false);
    EXPECT_THROW(intToRoman(0, config), ConfigurationError);
    EXPECT_THROW(intToRoman(5000, config), ConfigurationError);
    EXPECT_EQ(intToRoman(4999, config.withAdditive()), "ⅯⅯⅯⅯⅮⅭⅭⅭⅭⅬⅩⅩⅩⅩⅧⅠ");
}

TEST(RomanEncoderTest, ApostrophusRunsOutOfGlyphs) {
    EXPECT_THROW(intToRoman(400000, RomanConfig().withClaudian(false)), ConfigurationError);
}

TEST(RomanEncoderTest, ErrorCodeIsInvalidConfig) {
    try {
        intToRoman(0, RomanConfig::Classical());
        FAIL() << "expected ConfigurationError";
    } catch (const NumeralError& e) {
        EXPECT_EQ(e.code(), ErrorCode::INVALID_CONFIG);
    }
}
