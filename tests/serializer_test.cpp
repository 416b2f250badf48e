/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 *
 * This file is part of the TCSV library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

/**
 * @file serializer_test.cpp
 * @brief Line terminator placement, cursor ownership and the CsvSerializer facade
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <array>
#include <list>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "test_records.h"

using namespace tcsv;
using tcsv_test::Sample;
using tcsv_test::Trade;
using tcsv_test::makeCodec;
using tcsv_test::writeAll;

namespace {

    /// Cursor over a copy of the records; reports how often it was advanced and when it dies.
    class TrackingCursor : public RecordCursor<Sample> {
        std::vector<Sample> records_;
        size_t              position_ = 0;
        size_t*             advances_;
        bool*               destroyed_;

    public:
        TrackingCursor(std::vector<Sample> records, size_t* advances, bool* destroyed)
            : records_(std::move(records)), advances_(advances), destroyed_(destroyed) {}

        ~TrackingCursor() override { *destroyed_ = true; }

        bool next() override {
            ++*advances_;
            if (position_ < records_.size()) {
                ++position_;
                return true;
            }
            return false;
        }

        const Sample& current() const override { return records_[position_ - 1]; }
    };

    /// Field type nobody registers a formatter for.
    struct Opaque {
        int value = 0;
        bool operator==(const Opaque&) const = default;
    };

    struct WithOpaque {
        int32_t id = 0;
        Opaque  payload;
        bool operator==(const WithOpaque&) const = default;
    };

    std::vector<Sample> samples(size_t count) {
        std::vector<Sample> out;
        for (size_t i = 0; i < count; ++i) {
            out.push_back(Sample{static_cast<int32_t>(i), "r" + std::to_string(i), 0.5});
        }
        return out;
    }

    size_t countTerminators(const std::string& text) {
        return static_cast<size_t>(std::count(text.begin(), text.end(), '\n'));
    }

} // namespace

template<> struct tcsv::RecordTraits<WithOpaque> {
    static constexpr auto columns = std::make_tuple(
        column<&WithOpaque::id>("id"),
        column<&WithOpaque::payload>("payload"));
};

// ============================================================================
// Line terminators
// ============================================================================

TEST(LineTerminatorTest, SpanVariant) {
    auto codec = makeCodec<Sample>();
    CsvOptions noHeader;
    noHeader.has_header = false;
    for (size_t n = 0; n < 5; ++n) {
        auto records = samples(n);
        EXPECT_EQ(countTerminators(writeAll(codec, records)), n) << n << " records with header";
        EXPECT_EQ(countTerminators(writeAll(codec, records, noHeader)), n == 0 ? 0 : n - 1) << n << " records";
    }
}

TEST(LineTerminatorTest, CursorVariant) {
    auto codec = makeCodec<Sample>();
    for (bool header : {true, false}) {
        CsvOptions options;
        options.has_header = header;
        for (size_t n = 0; n < 5; ++n) {
            auto records = samples(n);
            CsvWriter writer(options);
            codec.serializeRange(writer, records.begin(), records.end());
            const size_t expected = header ? n : (n == 0 ? 0 : n - 1);
            EXPECT_EQ(countTerminators(writer.str()), expected) << n << " records, header " << header;
            EXPECT_EQ(writer.str(), writeAll(codec, records, options));
        }
    }
}

TEST(LineTerminatorTest, ForwardOnlyRange) {
    auto codec = makeCodec<Sample>();
    auto records = samples(3);
    std::list<Sample> list(records.begin(), records.end());
    CsvWriter writer;
    codec.serializeRange(writer, list.begin(), list.end());
    EXPECT_EQ(writer.str(), writeAll(codec, records));
}

// ============================================================================
// Cursor ownership
// ============================================================================

TEST(RecordCursorTest, ConsumedOnceAndReleased) {
    auto codec = makeCodec<Sample>();
    size_t advances = 0;
    bool destroyed = false;
    CsvWriter writer;
    codec.serialize(writer, std::make_unique<TrackingCursor>(samples(3), &advances, &destroyed));
    EXPECT_TRUE(destroyed);
    EXPECT_EQ(advances, 4u);
    EXPECT_EQ(writer.str(), writeAll(codec, samples(3)));
}

TEST(RecordCursorTest, ReleasedWhenWriterFails) {
    auto codec = makeCodec<Sample>();
    size_t advances = 0;
    bool destroyed = false;

    std::ostringstream os;
    os.setstate(std::ios::badbit);
    CsvWriter writer(os, CsvOptions{}, 1);      // flush on every line break

    EXPECT_THROW(codec.serialize(writer, std::make_unique<TrackingCursor>(samples(3), &advances, &destroyed)),
                 std::runtime_error);
    EXPECT_TRUE(destroyed);
}

TEST(RecordCursorTest, ReleasedWhenFormatterMissing) {
    auto codec = makeCodec<WithOpaque>();

    class OpaqueCursor : public RecordCursor<WithOpaque> {
        WithOpaque  record_{};
        bool        done_ = false;
        bool*       destroyed_;
    public:
        explicit OpaqueCursor(bool* destroyed) : destroyed_(destroyed) {}
        ~OpaqueCursor() override { *destroyed_ = true; }
        bool next() override { return !std::exchange(done_, true); }
        const WithOpaque& current() const override { return record_; }
    };

    bool destroyed = false;
    CsvWriter writer;
    EXPECT_THROW(codec.serialize(writer, std::make_unique<OpaqueCursor>(&destroyed)), CsvSerializationError);
    EXPECT_TRUE(destroyed);
}

TEST(RecordCursorTest, NullCursorRejected) {
    auto codec = makeCodec<Sample>();
    CsvWriter writer;
    EXPECT_THROW(codec.serialize(writer, std::unique_ptr<RecordCursor<Sample>>{}), std::invalid_argument);
}

// ============================================================================
// CsvSerializer facade
// ============================================================================

class CsvSerializerTest : public ::testing::Test {
protected:
    CollectingDiagnosticSink sink_;

    std::vector<Trade> trades_ = {
        {1, "ACME", 10.25, 100, true},
        {2, "BETA", 7.0, 5, false},
    };

    void SetUp() override {
        CodecRegistry::global().clear();
        ASSERT_EQ((registerRecords<Trade, Sample>(CodecRegistry::global(), sink_)), 2u);
    }

    void TearDown() override {
        CodecRegistry::global().clear();
    }
};

TEST_F(CsvSerializerTest, StringRoundTrip) {
    const std::string text = CsvSerializer::serialize<Trade>(trades_);
    EXPECT_EQ(text, "id,symbol,price,quantity,active\n1,ACME,10.25,100,true\n2,BETA,7,5,false");
    EXPECT_EQ(CsvSerializer::deserialize<Trade>(text), trades_);
}

TEST_F(CsvSerializerTest, StreamRoundTrip) {
    std::ostringstream os;
    CsvSerializer::serialize<Trade>(os, trades_);
    EXPECT_EQ(os.str(), CsvSerializer::serialize<Trade>(trades_));

    std::istringstream is(os.str());
    EXPECT_EQ(CsvSerializer::deserialize<Trade>(is), trades_);
}

TEST_F(CsvSerializerTest, RangeAndCallerBuffer) {
    const std::string text = CsvSerializer::serializeRange<Trade>(trades_.begin(), trades_.end());
    EXPECT_EQ(text, CsvSerializer::serialize<Trade>(trades_));

    std::array<Trade, 4> buffer{};
    EXPECT_EQ(CsvSerializer::deserialize<Trade>(text, std::span<Trade>(buffer)), 2u);
    EXPECT_EQ(buffer[1], trades_[1]);
}

TEST_F(CsvSerializerTest, OptionsAreHonored) {
    CsvOptions options;
    options.separator = ';';
    options.has_header = false;
    std::vector<Sample> records = {{1, "a;b", 2.5}};
    const std::string text = CsvSerializer::serialize<Sample>(records, options);
    EXPECT_EQ(text, "1;\"a;b\";2.5");
    EXPECT_EQ(CsvSerializer::deserialize<Sample>(text, options), records);
}

TEST_F(CsvSerializerTest, UnregisteredTypeThrows) {
    std::vector<tcsv_test::Keyed> records(1);
    EXPECT_THROW(CsvSerializer::serialize<tcsv_test::Keyed>(records), CsvSerializationError);
    EXPECT_THROW(CsvSerializer::deserialize<tcsv_test::Keyed>("City,Temp"), CsvSerializationError);
}
