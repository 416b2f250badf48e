/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 *
 * This file is part of the TCSV library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

#pragma once

/**
 * @file csv_writer.h
 * @brief CsvWriter: primitive CSV text output used by record codecs.
 *
 * CsvWriter knows nothing about records. It exposes one write operation per
 * field kind plus the structural operations (raw bytes, separator, line end)
 * that a RecordCodec strings together.
 *
 * Design:
 *   - std::to_chars() for all numeric types (no locale, shortest round-trip floats)
 *   - Output collected in a reusable char vector; either read back with view()/str()
 *     or streamed to an attached std::ostream once the buffer passes a threshold
 *   - RFC 4180 quoting: quotes are escaped by doubling, QuoteMode decides which
 *     cells get wrapped
 *   - Header-only implementation (csv_writer.hpp)
 *
 * Usage:
 *     tcsv::CsvWriter writer;
 *     writer.writeInt32(1);
 *     writer.writeSeparator();
 *     writer.writeString("hello, world");
 *     writer.writeEndOfLine();
 *     std::string text = writer.str();   // 1,"hello, world"\n
 */

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "decimal.h"
#include "definitions.h"
#include "options.h"

namespace tcsv {

    class CsvWriter {
        CsvOptions              options_;
        std::vector<char>       buf_;                   // pending output
        std::ostream*           os_ = nullptr;          // optional sink, not owned
        size_t                  flush_threshold_ = WRITER_FLUSH_THRESHOLD;
        uint64_t                bytes_flushed_ = 0;

    public:
        explicit CsvWriter(CsvOptions options = {});
        CsvWriter(std::ostream& os, CsvOptions options = {}, size_t flushThreshold = WRITER_FLUSH_THRESHOLD);
        ~CsvWriter();

        CsvWriter(const CsvWriter&) = delete;
        CsvWriter& operator=(const CsvWriter&) = delete;

        const CsvOptions&       options() const                 { return options_; }
        uint64_t                bytesWritten() const            { return bytes_flushed_ + buf_.size(); }
        void                    clear()                         { buf_.clear(); }
        void                    flush();
        std::string             str() const                     { return std::string(buf_.data(), buf_.size()); }
        std::string_view        view() const                    { return std::string_view(buf_.data(), buf_.size()); }

        // Structure
        void                    writeRaw(char byte)             { buf_.push_back(byte); }
        void                    writeRaw(std::string_view bytes);
        void                    writeSeparator()                { buf_.push_back(options_.separator); }
        void                    writeEndOfLine();

        // One primitive per field kind
        void                    writeBoolean(bool value);
        void                    writeInt8(int8_t value)         { writeNumber(static_cast<int>(value)); }
        void                    writeUInt8(uint8_t value)       { writeNumber(static_cast<unsigned>(value)); }
        void                    writeInt16(int16_t value)       { writeNumber(value); }
        void                    writeUInt16(uint16_t value)     { writeNumber(value); }
        void                    writeInt32(int32_t value)       { writeNumber(value); }
        void                    writeUInt32(uint32_t value)     { writeNumber(value); }
        void                    writeInt64(int64_t value)       { writeNumber(value); }
        void                    writeUInt64(uint64_t value)     { writeNumber(value); }
        void                    writeFloat(float value)         { writeNumber(value); }
        void                    writeDouble(double value)       { writeNumber(value); }
        void                    writeDecimal(const Decimal& value);
        void                    writeChar(char value);
        void                    writeString(std::string_view value);

    private:
        template<typename T>
        void                    writeNumber(T value);

        template<typename T>
        void                    appendToChars(T value);

        void                    appendQuoted(std::string_view value);
        bool                    needsQuotes(std::string_view value) const;
    };

} // namespace tcsv
