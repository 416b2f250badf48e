/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 *
 * This file is part of the TCSV library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

/**
 * @file csv_reader_writer_test.cpp
 * @brief Tests for the CsvReader and CsvWriter primitives
 *
 * Test categories:
 *   1. Writer primitives per field kind
 *   2. Writer quoting modes and string protection
 *   3. Writer streaming to std::ostream
 *   4. Reader primitives per field kind
 *   5. Reader structure (separators, line ends, comments, quoted line breaks)
 *   6. Reader error reporting
 */

#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>

#include <tcsv/tcsv.h>

using tcsv::CsvOptions;
using tcsv::CsvParseError;
using tcsv::CsvReader;
using tcsv::CsvWriter;
using tcsv::QuoteMode;

namespace {

    CsvOptions withQuoteMode(QuoteMode mode) {
        CsvOptions options;
        options.quote_mode = mode;
        return options;
    }

} // namespace

// ============================================================================
// 1. Writer primitives
// ============================================================================

TEST(CsvWriterTest, IntegersAllWidths) {
    CsvWriter writer;
    writer.writeInt8(-128);
    writer.writeSeparator();
    writer.writeUInt8(255);
    writer.writeSeparator();
    writer.writeInt16(-32768);
    writer.writeSeparator();
    writer.writeUInt16(65535);
    writer.writeSeparator();
    writer.writeInt32(-2147483647 - 1);
    writer.writeSeparator();
    writer.writeUInt32(4294967295u);
    writer.writeSeparator();
    writer.writeInt64(std::numeric_limits<int64_t>::min());
    writer.writeSeparator();
    writer.writeUInt64(std::numeric_limits<uint64_t>::max());
    EXPECT_EQ(writer.str(),
              "-128,255,-32768,65535,-2147483648,4294967295,"
              "-9223372036854775808,18446744073709551615");
}

TEST(CsvWriterTest, FloatingPointShortestRoundTrip) {
    CsvWriter writer;
    writer.writeDouble(0.1);
    writer.writeSeparator();
    writer.writeFloat(1.5f);
    writer.writeSeparator();
    writer.writeDouble(3.0);
    writer.writeSeparator();
    writer.writeDouble(-2.5e-8);
    EXPECT_EQ(writer.str(), "0.1,1.5,3,-2.5e-08");
}

TEST(CsvWriterTest, BooleanDecimalAndChar) {
    CsvWriter writer;
    writer.writeBoolean(true);
    writer.writeSeparator();
    writer.writeBoolean(false);
    writer.writeSeparator();
    writer.writeDecimal(tcsv::Decimal(-1050, 2));
    writer.writeSeparator();
    writer.writeChar('x');
    writer.writeSeparator();
    writer.writeChar('\0');
    EXPECT_EQ(writer.str(), "true,false,-10.50,x,");
}

TEST(CsvWriterTest, EndOfLineUsesConfiguredNewline) {
    CsvOptions options;
    options.newline = "\r\n";
    CsvWriter writer(options);
    writer.writeInt32(1);
    writer.writeEndOfLine();
    writer.writeInt32(2);
    EXPECT_EQ(writer.str(), "1\r\n2");
}

TEST(CsvWriterTest, ClearAndBytesWritten) {
    CsvWriter writer;
    writer.writeString("abc");
    EXPECT_EQ(writer.bytesWritten(), 3u);
    writer.clear();
    EXPECT_TRUE(writer.view().empty());
    EXPECT_EQ(writer.bytesWritten(), 0u);
}

// ============================================================================
// 2. Quoting
// ============================================================================

TEST(CsvWriterTest, MinimalQuotesOnlyWhenNeeded) {
    CsvWriter writer;
    writer.writeString("plain");
    writer.writeSeparator();
    writer.writeString("a,b");
    writer.writeSeparator();
    writer.writeString("say \"hi\"");
    writer.writeSeparator();
    writer.writeString("two\nlines");
    EXPECT_EQ(writer.str(), "plain,\"a,b\",\"say \"\"hi\"\"\",\"two\nlines\"");
}

TEST(CsvWriterTest, MinimalQuotesCustomSeparator) {
    CsvOptions options;
    options.separator = ';';
    CsvWriter writer(options);
    writer.writeString("a,b");
    writer.writeSeparator();
    writer.writeString("a;b");
    EXPECT_EQ(writer.str(), "a,b;\"a;b\"");
}

TEST(CsvWriterTest, MinimalQuotesLeadingCommentMarker) {
    CsvOptions options;
    options.allow_comments = true;
    CsvWriter writer(options);
    writer.writeString("#tag");
    writer.writeSeparator();
    writer.writeString("a#b");
    EXPECT_EQ(writer.str(), "\"#tag\",a#b");
}

TEST(CsvWriterTest, QuoteAllWrapsEveryCell) {
    CsvWriter writer(withQuoteMode(QuoteMode::ALL));
    writer.writeInt32(7);
    writer.writeSeparator();
    writer.writeBoolean(true);
    writer.writeSeparator();
    writer.writeString("x");
    writer.writeSeparator();
    writer.writeChar('\0');
    EXPECT_EQ(writer.str(), "\"7\",\"true\",\"x\",\"\"");
}

TEST(CsvWriterTest, QuoteNonNumericLeavesNumbersBare) {
    CsvWriter writer(withQuoteMode(QuoteMode::NON_NUMERIC));
    writer.writeInt32(7);
    writer.writeSeparator();
    writer.writeDouble(1.25);
    writer.writeSeparator();
    writer.writeDecimal(tcsv::Decimal(5));
    writer.writeSeparator();
    writer.writeBoolean(false);
    writer.writeSeparator();
    writer.writeString("x");
    EXPECT_EQ(writer.str(), "7,1.25,5,\"false\",\"x\"");
}

TEST(CsvWriterTest, QuoteNoneWritesRaw) {
    CsvWriter writer(withQuoteMode(QuoteMode::NONE));
    writer.writeString("a,b");
    EXPECT_EQ(writer.str(), "a,b");
}

// ============================================================================
// 3. Streaming
// ============================================================================

TEST(CsvWriterTest, StreamFlushesPastThreshold) {
    std::ostringstream os;
    {
        CsvWriter writer(os, CsvOptions{}, 8);
        writer.writeString("0123456789");
        EXPECT_TRUE(os.str().empty());
        writer.writeEndOfLine();                 // past the threshold
        EXPECT_EQ(os.str(), "0123456789\n");
        writer.writeString("tail");
        EXPECT_EQ(writer.bytesWritten(), 15u);
    }                                            // destructor flushes the tail
    EXPECT_EQ(os.str(), "0123456789\ntail");
}

TEST(CsvWriterTest, ExplicitFlush) {
    std::ostringstream os;
    CsvWriter writer(os);
    writer.writeInt32(42);
    writer.flush();
    EXPECT_EQ(os.str(), "42");
    EXPECT_TRUE(writer.view().empty());
}

// ============================================================================
// 4. Reader primitives
// ============================================================================

TEST(CsvReaderTest, IntegersAllWidths) {
    CsvReader reader("-128,255,-32768,65535,-2147483648,4294967295,-9223372036854775808,18446744073709551615");
    EXPECT_EQ(reader.readInt8(), -128);
    ASSERT_TRUE(reader.tryReadSeparator());
    EXPECT_EQ(reader.readUInt8(), 255);
    ASSERT_TRUE(reader.tryReadSeparator());
    EXPECT_EQ(reader.readInt16(), -32768);
    ASSERT_TRUE(reader.tryReadSeparator());
    EXPECT_EQ(reader.readUInt16(), 65535);
    ASSERT_TRUE(reader.tryReadSeparator());
    EXPECT_EQ(reader.readInt32(), std::numeric_limits<int32_t>::min());
    ASSERT_TRUE(reader.tryReadSeparator());
    EXPECT_EQ(reader.readUInt32(), 4294967295u);
    ASSERT_TRUE(reader.tryReadSeparator());
    EXPECT_EQ(reader.readInt64(), std::numeric_limits<int64_t>::min());
    ASSERT_TRUE(reader.tryReadSeparator());
    EXPECT_EQ(reader.readUInt64(), std::numeric_limits<uint64_t>::max());
    EXPECT_TRUE(reader.tryReadEndOfLine(true));
    EXPECT_EQ(reader.remaining(), 0u);
}

TEST(CsvReaderTest, NumbersAreTrimmedAndAcceptPlus) {
    CsvReader reader(" 42 ,\t+7,+1.5 ");
    EXPECT_EQ(reader.readInt32(), 42);
    ASSERT_TRUE(reader.tryReadSeparator());
    EXPECT_EQ(reader.readInt32(), 7);
    ASSERT_TRUE(reader.tryReadSeparator());
    EXPECT_DOUBLE_EQ(reader.readDouble(), 1.5);
}

TEST(CsvReaderTest, EmptyCellsReadAsDefaults) {
    CsvReader reader(",,,,,");
    EXPECT_EQ(reader.readInt32(), 0);
    ASSERT_TRUE(reader.tryReadSeparator());
    EXPECT_DOUBLE_EQ(reader.readDouble(), 0.0);
    ASSERT_TRUE(reader.tryReadSeparator());
    EXPECT_FALSE(reader.readBoolean());
    ASSERT_TRUE(reader.tryReadSeparator());
    EXPECT_EQ(reader.readChar(), '\0');
    ASSERT_TRUE(reader.tryReadSeparator());
    EXPECT_EQ(reader.readString(), "");
    ASSERT_TRUE(reader.tryReadSeparator());
    EXPECT_EQ(reader.readDecimal(), tcsv::Decimal());
}

TEST(CsvReaderTest, BooleanSpellings) {
    CsvReader reader("true,FALSE,1,0,True");
    EXPECT_TRUE(reader.readBoolean());
    reader.tryReadSeparator();
    EXPECT_FALSE(reader.readBoolean());
    reader.tryReadSeparator();
    EXPECT_TRUE(reader.readBoolean());
    reader.tryReadSeparator();
    EXPECT_FALSE(reader.readBoolean());
    reader.tryReadSeparator();
    EXPECT_TRUE(reader.readBoolean());
}

TEST(CsvReaderTest, FloatingPointSpecialValues) {
    CsvReader reader("inf,-inf,nan,1e300");
    EXPECT_TRUE(std::isinf(reader.readDouble()));
    reader.tryReadSeparator();
    EXPECT_LT(reader.readDouble(), 0.0);
    reader.tryReadSeparator();
    EXPECT_TRUE(std::isnan(reader.readFloat()));
    reader.tryReadSeparator();
    EXPECT_DOUBLE_EQ(reader.readDouble(), 1e300);
}

TEST(CsvReaderTest, StringsKeepBlanks) {
    CsvReader reader("  padded  ,x");
    EXPECT_EQ(reader.readString(), "  padded  ");
    ASSERT_TRUE(reader.tryReadSeparator());
    EXPECT_EQ(reader.readChar(), 'x');
}

TEST(CsvReaderTest, QuotedStrings) {
    CsvReader reader("\"a,b\",\"say \"\"hi\"\"\",\"two\nlines\",\"\"");
    EXPECT_EQ(reader.readString(), "a,b");
    ASSERT_TRUE(reader.tryReadSeparator());
    EXPECT_EQ(reader.readString(), "say \"hi\"");
    ASSERT_TRUE(reader.tryReadSeparator());
    EXPECT_EQ(reader.readString(), "two\nlines");
    EXPECT_EQ(reader.line(), 2u);
    ASSERT_TRUE(reader.tryReadSeparator());
    EXPECT_EQ(reader.readString(), "");
    EXPECT_EQ(reader.remaining(), 0u);
}

TEST(CsvReaderTest, QuotedNumber) {
    CsvReader reader("\"7\",\"true\"");
    EXPECT_EQ(reader.readInt32(), 7);
    reader.tryReadSeparator();
    EXPECT_TRUE(reader.readBoolean());
}

TEST(CsvReaderTest, Decimal) {
    CsvReader reader("12.340,-0.5");
    EXPECT_EQ(reader.readDecimal().toString(), "12.340");
    reader.tryReadSeparator();
    EXPECT_EQ(reader.readDecimal(), tcsv::Decimal(-5, 1));
}

TEST(CsvReaderTest, ReadUtf8AppendsRawBytes) {
    CsvReader reader("\"Gr\xC3\xBC\xC3\x9F""e\",x");
    std::string key = "k:";
    reader.readUtf8(key);
    EXPECT_EQ(key, "k:Gr\xC3\xBC\xC3\x9F""e");
}

// ============================================================================
// 5. Reader structure
// ============================================================================

TEST(CsvReaderTest, LineEndings) {
    CsvReader reader("1\r\n2\n3\r4");
    EXPECT_EQ(reader.readInt32(), 1);
    EXPECT_TRUE(reader.tryReadEndOfLine());
    EXPECT_EQ(reader.readInt32(), 2);
    EXPECT_TRUE(reader.tryReadEndOfLine());
    EXPECT_EQ(reader.readInt32(), 3);
    EXPECT_TRUE(reader.tryReadEndOfLine());
    EXPECT_EQ(reader.readInt32(), 4);
    EXPECT_FALSE(reader.tryReadEndOfLine());
    EXPECT_TRUE(reader.tryReadEndOfLine(true));
    EXPECT_EQ(reader.line(), 4u);
}

TEST(CsvReaderTest, SkipFieldAndSkipLine) {
    CsvReader reader("skip,\"q,\nq\",3\n4");
    reader.skipField();
    ASSERT_TRUE(reader.tryReadSeparator());
    reader.skipLine();                           // quoted line break stays inside its cell
    EXPECT_EQ(reader.readInt32(), 4);
}

TEST(CsvReaderTest, CommentsAndSeparatorOption) {
    CsvOptions options;
    options.separator = ';';
    options.allow_comments = true;
    CsvReader reader("# header comment\n1;2", options);
    EXPECT_TRUE(reader.trySkipComment());
    EXPECT_FALSE(reader.trySkipComment());
    EXPECT_EQ(reader.readInt32(), 1);
    EXPECT_TRUE(reader.tryReadSeparator());
    EXPECT_EQ(reader.readInt32(), 2);
}

TEST(CsvReaderTest, ByteOrderMarkIsSkipped) {
    CsvReader reader("\xEF\xBB\xBF" "5");
    EXPECT_EQ(reader.readInt32(), 5);
}

TEST(CsvReaderTest, AtCellEnd) {
    CsvReader reader(",x");
    EXPECT_TRUE(reader.atCellEnd());
    reader.tryReadSeparator();
    EXPECT_FALSE(reader.atCellEnd());
    reader.skipField();
    EXPECT_TRUE(reader.atCellEnd());
}

TEST(CsvReaderTest, ViewsOnlyLongLivedText) {
    static_assert(!std::is_constructible_v<CsvReader, std::string&&>);
    static_assert(!std::is_constructible_v<CsvReader, std::string&&, CsvOptions>);
    static_assert(std::is_constructible_v<CsvReader, const std::string&>);
    static_assert(std::is_constructible_v<CsvReader, std::string_view>);

    const std::string text = "7";
    CsvReader reader(text);
    EXPECT_EQ(reader.readInt32(), 7);
}

TEST(CsvReaderTest, AtEmptyCell) {
    CsvReader reader("\"\",\"\"x,\"\"");
    EXPECT_FALSE(reader.atCellEnd());
    EXPECT_TRUE(reader.atEmptyCell());
    reader.skipField();
    ASSERT_TRUE(reader.tryReadSeparator());
    EXPECT_FALSE(reader.atEmptyCell());          // text after the closing quote
    reader.skipField();
    ASSERT_TRUE(reader.tryReadSeparator());
    EXPECT_TRUE(reader.atEmptyCell());           // at end of input
    EXPECT_EQ(reader.readString(), "");
    EXPECT_TRUE(reader.atEmptyCell());
}

// ============================================================================
// 6. Reader errors
// ============================================================================

TEST(CsvReaderTest, MalformedIntegerReportsPosition) {
    CsvReader reader("1,2\n3,12x");
    reader.skipLine();
    reader.skipField();
    reader.tryReadSeparator();
    try {
        reader.readInt32();
        FAIL() << "expected CsvParseError";
    } catch (const CsvParseError& ex) {
        EXPECT_EQ(ex.line(), 2u);
        EXPECT_EQ(ex.column(), 3u);
        EXPECT_NE(std::string(ex.what()).find("12x"), std::string::npos);
    }
}

TEST(CsvReaderTest, OutOfRangeInteger) {
    CsvReader reader("256,-1");
    EXPECT_THROW(reader.readUInt8(), CsvParseError);
    reader.tryReadSeparator();
    EXPECT_THROW(reader.readUInt32(), CsvParseError);
}

TEST(CsvReaderTest, InvalidBoolCharAndDecimal) {
    CsvReader reader("yes,ab,1.2.3");
    EXPECT_THROW(reader.readBoolean(), CsvParseError);
    reader.tryReadSeparator();
    EXPECT_THROW(reader.readChar(), CsvParseError);
    reader.tryReadSeparator();
    EXPECT_THROW(reader.readDecimal(), CsvParseError);
}

TEST(CsvReaderTest, UnterminatedQuote) {
    CsvReader reader("\"never closed");
    EXPECT_THROW(reader.readString(), CsvParseError);
}

TEST(CsvReaderTest, ParseErrorIsSerializationError) {
    CsvReader reader("x");
    EXPECT_THROW(reader.readInt64(), tcsv::CsvSerializationError);
}
