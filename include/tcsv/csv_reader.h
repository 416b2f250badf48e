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
 * @file csv_reader.h
 * @brief CsvReader: primitive CSV text scanning used by record codecs.
 *
 * CsvReader is a cursor over an in-memory CSV text. It does not split lines
 * up front; a RecordCodec drives it cell by cell:
 *
 *     read cell → tryReadEndOfLine(true)? → tryReadSeparator()? → read cell ...
 *
 * Design:
 *   - Single pass over a std::string_view, no per-row allocation for unquoted cells
 *   - Quoted cells may contain separators, doubled quotes and line breaks
 *   - std::from_chars() for all numeric types (no locale, no virtual dispatch)
 *   - Numeric and bool cells are trimmed of blanks; string cells are kept verbatim
 *   - An empty cell reads as the kind's default (0, false, '\0', empty string)
 *   - A leading UTF-8 BOM is skipped
 *   - Malformed cells throw CsvParseError with line and column
 *
 * Usage:
 *     tcsv::CsvReader reader("1,hello\n2,world");
 *     while (reader.remaining() > 0) {
 *         int32_t id = reader.readInt32();
 *         reader.tryReadSeparator();
 *         std::string text = reader.readString();
 *         reader.tryReadEndOfLine(true);
 *     }
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "decimal.h"
#include "definitions.h"
#include "options.h"

namespace tcsv {

    class CsvReader {
        std::string_view        data_;
        size_t                  pos_ = 0;               // read position in data_
        size_t                  line_ = 1;              // 1-based line of pos_
        size_t                  line_start_ = 0;        // offset of the first byte of the current line
        size_t                  cell_column_ = 1;       // 1-based column of the last cell read
        CsvOptions              options_;
        std::string             scratch_;               // unescaped text of the last quoted cell

    public:
        explicit CsvReader(std::string_view data, CsvOptions options = {});
        explicit CsvReader(const char* data, CsvOptions options = {})
            : CsvReader(std::string_view(data), std::move(options)) {}

        // The reader keeps a view of data, a temporary would dangle
        CsvReader(std::string&& data, CsvOptions options = {}) = delete;

        CsvReader(const CsvReader&) = delete;
        CsvReader& operator=(const CsvReader&) = delete;

        const CsvOptions&       options() const                 { return options_; }
        size_t                  remaining() const               { return data_.size() - pos_; }
        size_t                  position() const                { return pos_; }
        size_t                  line() const                    { return line_; }
        size_t                  column() const                  { return pos_ - line_start_ + 1; }

        /// True when the next cell is empty (cursor on a separator, a line break or end of input)
        bool                    atCellEnd() const               { return pos_ >= data_.size() || isCellEnd(data_[pos_]); }

        /// True when the next cell is empty or a quoted empty string ("")
        bool                    atEmptyCell() const;

        // Structure
        bool                    tryReadEndOfLine(bool acceptEndOfData = false);
        bool                    trySkipComment();
        bool                    tryReadSeparator();
        void                    skipField();
        void                    skipLine();

        // One primitive per field kind
        bool                    readBoolean();
        int8_t                  readInt8()                      { return readInteger<int8_t>("int8"); }
        uint8_t                 readUInt8()                     { return readInteger<uint8_t>("uint8"); }
        int16_t                 readInt16()                     { return readInteger<int16_t>("int16"); }
        uint16_t                readUInt16()                    { return readInteger<uint16_t>("uint16"); }
        int32_t                 readInt32()                     { return readInteger<int32_t>("int32"); }
        uint32_t                readUInt32()                    { return readInteger<uint32_t>("uint32"); }
        int64_t                 readInt64()                     { return readInteger<int64_t>("int64"); }
        uint64_t                readUInt64()                    { return readInteger<uint64_t>("uint64"); }
        float                   readFloat()                     { return readFloating<float>("float"); }
        double                  readDouble()                    { return readFloating<double>("double"); }
        Decimal                 readDecimal();
        char                    readChar();
        std::string             readString();

        /// Append the raw, unescaped bytes of the next cell to out (header key capture).
        void                    readUtf8(std::string& out);

    private:
        std::string_view        readCell();
        bool                    isCellEnd(char c) const         { return c == options_.separator || c == '\n' || c == '\r'; }
        void                    newLine()                       { ++line_; line_start_ = pos_; }
        void                    skipToEndOfLineRaw();

        template<typename T>
        T                       readInteger(const char* kindName);

        template<typename T>
        T                       readFloating(const char* kindName);

        [[noreturn]] void       fail(const std::string& message, std::string_view cell) const;
    };

} // namespace tcsv
