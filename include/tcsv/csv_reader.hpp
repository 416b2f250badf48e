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
 * @file csv_reader.hpp
 * @brief CsvReader implementations.
 */

#include "csv_reader.h"
#include "csv_error.h"
#include "decimal.hpp"

#include <charconv>
#include <system_error>
#include <utility>

namespace tcsv {

    namespace detail {

        inline std::string_view trimBlanks(std::string_view cell) {
            while (!cell.empty() && (cell.front() == ' ' || cell.front() == '\t')) cell.remove_prefix(1);
            while (!cell.empty() && (cell.back() == ' ' || cell.back() == '\t')) cell.remove_suffix(1);
            return cell;
        }

        inline bool equalsIgnoreCase(std::string_view a, std::string_view b) {
            if (a.size() != b.size()) return false;
            for (size_t i = 0; i < a.size(); ++i) {
                char x = a[i];
                char y = b[i];
                if (x >= 'A' && x <= 'Z') x = static_cast<char>(x - 'A' + 'a');
                if (y >= 'A' && y <= 'Z') y = static_cast<char>(y - 'A' + 'a');
                if (x != y) return false;
            }
            return true;
        }

        /// std::from_chars does not accept a leading '+'
        inline const char* skipPlusSign(const char* first, const char* last) {
            if (first != last && *first == '+' && (first + 1 == last || first[1] != '-')) {
                return first + 1;
            }
            return first;
        }

    } // namespace detail

    // ── Constructor ─────────────────────────────────────────────────────

    inline CsvReader::CsvReader(std::string_view data, CsvOptions options)
        : data_(data)
        , options_(std::move(options))
    {
        // Strip BOM if present (UTF-8 BOM: EF BB BF)
        if (data_.size() >= 3 &&
            static_cast<unsigned char>(data_[0]) == 0xEF &&
            static_cast<unsigned char>(data_[1]) == 0xBB &&
            static_cast<unsigned char>(data_[2]) == 0xBF) {
            pos_ = 3;
            line_start_ = 3;
        }
    }

    // ── Structure ───────────────────────────────────────────────────────

    inline bool CsvReader::tryReadEndOfLine(bool acceptEndOfData) {
        if (pos_ >= data_.size()) {
            return acceptEndOfData;
        }
        const char c = data_[pos_];
        if (c == '\r') {
            ++pos_;
            if (pos_ < data_.size() && data_[pos_] == '\n') {
                ++pos_;
            }
            newLine();
            return true;
        }
        if (c == '\n') {
            ++pos_;
            newLine();
            return true;
        }
        return false;
    }

    inline bool CsvReader::trySkipComment() {
        if (pos_ < data_.size() && data_[pos_] == options_.comment_marker) {
            skipToEndOfLineRaw();
            return true;
        }
        return false;
    }

    inline bool CsvReader::atEmptyCell() const {
        if (atCellEnd()) {
            return true;
        }
        return data_.compare(pos_, 2, "\"\"") == 0
            && (pos_ + 2 >= data_.size() || isCellEnd(data_[pos_ + 2]));
    }

    inline bool CsvReader::tryReadSeparator() {
        if (pos_ < data_.size() && data_[pos_] == options_.separator) {
            ++pos_;
            return true;
        }
        return false;
    }

    inline void CsvReader::skipField() {
        const size_t size = data_.size();
        if (pos_ < size && data_[pos_] == '"') {
            ++pos_;
            while (pos_ < size) {
                const char c = data_[pos_++];
                if (c == '"') {
                    if (pos_ < size && data_[pos_] == '"') {
                        ++pos_;
                        continue;
                    }
                    break;
                }
                if (c == '\n') newLine();
            }
        }
        while (pos_ < size && !isCellEnd(data_[pos_])) {
            ++pos_;
        }
    }

    /// Skip the rest of the current line, cell by cell so quoted line breaks stay inside their cell
    inline void CsvReader::skipLine() {
        while (true) {
            skipField();
            if (tryReadEndOfLine(true)) {
                return;
            }
            tryReadSeparator();
        }
    }

    // ── Primitives ──────────────────────────────────────────────────────

    inline bool CsvReader::readBoolean() {
        const std::string_view cell = detail::trimBlanks(readCell());
        if (cell.empty() || cell == "0" || detail::equalsIgnoreCase(cell, "false")) {
            return false;
        }
        if (cell == "1" || detail::equalsIgnoreCase(cell, "true")) {
            return true;
        }
        fail("Invalid bool value", cell);
    }

    inline Decimal CsvReader::readDecimal() {
        const std::string_view cell = detail::trimBlanks(readCell());
        if (cell.empty()) {
            return Decimal{};
        }
        Decimal value;
        if (!Decimal::tryParse(cell, value)) {
            fail("Invalid decimal value", cell);
        }
        return value;
    }

    inline char CsvReader::readChar() {
        const std::string_view cell = readCell();
        if (cell.empty()) {
            return '\0';
        }
        if (cell.size() != 1) {
            fail("Invalid char value", cell);
        }
        return cell.front();
    }

    inline std::string CsvReader::readString() {
        return std::string(readCell());
    }

    inline void CsvReader::readUtf8(std::string& out) {
        const std::string_view cell = readCell();
        out.append(cell.data(), cell.size());
    }

    // ── Private helpers ─────────────────────────────────────────────────

    /// Read one cell and leave the cursor on the following separator / line end.
    /// Quoted cells are unescaped into scratch_; unquoted cells are views into data_.
    inline std::string_view CsvReader::readCell() {
        const size_t size = data_.size();
        cell_column_ = column();

        if (pos_ < size && data_[pos_] == '"') {
            const size_t startLine = line_;
            ++pos_;
            scratch_.clear();
            bool closed = false;
            while (pos_ < size) {
                const char c = data_[pos_++];
                if (c == '"') {
                    if (pos_ < size && data_[pos_] == '"') {
                        scratch_.push_back('"');
                        ++pos_;
                        continue;
                    }
                    closed = true;
                    break;
                }
                scratch_.push_back(c);
                if (c == '\n') newLine();
            }
            if (!closed) {
                throw CsvParseError("Unterminated quoted field", startLine, cell_column_);
            }
            // anything between the closing quote and the cell end is kept verbatim
            while (pos_ < size && !isCellEnd(data_[pos_])) {
                scratch_.push_back(data_[pos_++]);
            }
            return scratch_;
        }

        const size_t start = pos_;
        while (pos_ < size && !isCellEnd(data_[pos_])) {
            ++pos_;
        }
        return data_.substr(start, pos_ - start);
    }

    inline void CsvReader::skipToEndOfLineRaw() {
        while (pos_ < data_.size() && data_[pos_] != '\n' && data_[pos_] != '\r') {
            ++pos_;
        }
        tryReadEndOfLine();
    }

    template<typename T>
    T CsvReader::readInteger(const char* kindName) {
        const std::string_view cell = detail::trimBlanks(readCell());
        if (cell.empty()) {
            return T{};
        }
        const char* last = cell.data() + cell.size();
        const char* first = detail::skipPlusSign(cell.data(), last);
        T value{};
        auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec == std::errc::result_out_of_range) {
            fail(std::string("Value out of range for ") + kindName, cell);
        }
        if (ec != std::errc{} || ptr != last) {
            fail(std::string("Invalid ") + kindName + " value", cell);
        }
        return value;
    }

    template<typename T>
    T CsvReader::readFloating(const char* kindName) {
        const std::string_view cell = detail::trimBlanks(readCell());
        if (cell.empty()) {
            return T{};
        }
        const char* last = cell.data() + cell.size();
        const char* first = detail::skipPlusSign(cell.data(), last);
        T value{};
        auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec == std::errc::result_out_of_range) {
            fail(std::string("Value out of range for ") + kindName, cell);
        }
        if (ec != std::errc{} || ptr != last) {
            fail(std::string("Invalid ") + kindName + " value", cell);
        }
        return value;
    }

    inline void CsvReader::fail(const std::string& message, std::string_view cell) const {
        throw CsvParseError(message + " '" + std::string(cell) + "'", line_, cell_column_);
    }

} // namespace tcsv
