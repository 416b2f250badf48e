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
 * @file csv_writer.hpp
 * @brief CsvWriter implementations.
 */

#include "csv_writer.h"
#include "decimal.hpp"

#include <charconv>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace tcsv {

    // ── Constructor / Destructor ────────────────────────────────────────

    inline CsvWriter::CsvWriter(CsvOptions options)
        : options_(std::move(options))
    {
        buf_.reserve(4096);
    }

    inline CsvWriter::CsvWriter(std::ostream& os, CsvOptions options, size_t flushThreshold)
        : options_(std::move(options))
        , os_(&os)
        , flush_threshold_(flushThreshold)
    {
        buf_.reserve(flushThreshold < 4096 ? 4096 : flushThreshold);
    }

    inline CsvWriter::~CsvWriter() {
        if (os_ == nullptr || buf_.empty()) {
            return;
        }
        // Exceptions must not leave a destructor; report and drop the tail.
        try {
            flush();
        } catch (const std::exception& ex) {
            if constexpr (DEBUG_OUTPUTS) {
                std::cerr << "Warning: CsvWriter failed to flush on destruction: " << ex.what() << std::endl;
            }
        }
    }

    // ── Output ──────────────────────────────────────────────────────────

    inline void CsvWriter::flush() {
        if (os_ == nullptr) {
            return;
        }
        os_->write(buf_.data(), static_cast<std::streamsize>(buf_.size()));
        if (!os_->good()) {
            throw std::runtime_error("Error: Failed to write CSV output stream");
        }
        bytes_flushed_ += buf_.size();
        buf_.clear();
    }

    inline void CsvWriter::writeRaw(std::string_view bytes) {
        buf_.insert(buf_.end(), bytes.begin(), bytes.end());
    }

    inline void CsvWriter::writeEndOfLine() {
        writeRaw(options_.newline);
        if (os_ != nullptr && buf_.size() >= flush_threshold_) {
            flush();
        }
    }

    // ── Primitives ──────────────────────────────────────────────────────

    inline void CsvWriter::writeBoolean(bool value) {
        const bool quote = options_.quote_mode == QuoteMode::ALL || options_.quote_mode == QuoteMode::NON_NUMERIC;
        if (quote) buf_.push_back('"');
        if (value) {
            buf_.insert(buf_.end(), {'t','r','u','e'});
        } else {
            buf_.insert(buf_.end(), {'f','a','l','s','e'});
        }
        if (quote) buf_.push_back('"');
    }

    inline void CsvWriter::writeDecimal(const Decimal& value) {
        const bool quote = options_.quote_mode == QuoteMode::ALL;
        if (quote) buf_.push_back('"');
        std::string text;
        value.appendTo(text);
        writeRaw(text);
        if (quote) buf_.push_back('"');
    }

    inline void CsvWriter::writeChar(char value) {
        // '\0' is the char default and reads back from an empty cell
        if (value == '\0') {
            if (options_.quote_mode == QuoteMode::ALL || options_.quote_mode == QuoteMode::NON_NUMERIC) {
                buf_.insert(buf_.end(), {'"','"'});
            }
            return;
        }
        writeString(std::string_view(&value, 1));
    }

    inline void CsvWriter::writeString(std::string_view value) {
        switch (options_.quote_mode) {
            case QuoteMode::NONE:
                writeRaw(value);
                break;
            case QuoteMode::MINIMAL:
                if (needsQuotes(value)) {
                    appendQuoted(value);
                } else {
                    writeRaw(value);
                }
                break;
            case QuoteMode::ALL:
            case QuoteMode::NON_NUMERIC:
                appendQuoted(value);
                break;
        }
    }

    // ── Private helpers ─────────────────────────────────────────────────

    template<typename T>
    void CsvWriter::writeNumber(T value) {
        if (options_.quote_mode == QuoteMode::ALL) {
            buf_.push_back('"');
            appendToChars(value);
            buf_.push_back('"');
        } else {
            appendToChars(value);
        }
    }

    /// Append any numeric type via std::to_chars (no locale, no virtual dispatch)
    template<typename T>
    void CsvWriter::appendToChars(T value) {
        constexpr size_t kMaxDigits = 64;
        size_t oldSize = buf_.size();
        buf_.resize(oldSize + kMaxDigits);
        auto [ptr, ec] = std::to_chars(buf_.data() + oldSize,
                                       buf_.data() + oldSize + kMaxDigits, value);
        if (ec != std::errc{}) {
            buf_.resize(oldSize);
            throw std::runtime_error("Error: Failed to format numeric value");
        }
        buf_.resize(static_cast<size_t>(ptr - buf_.data()));
    }

    /// Append a cell wrapped in quotes, doubling embedded quotes (RFC 4180)
    inline void CsvWriter::appendQuoted(std::string_view value) {
        buf_.push_back('"');
        for (char c : value) {
            if (c == '"') buf_.push_back('"');
            buf_.push_back(c);
        }
        buf_.push_back('"');
    }

    inline bool CsvWriter::needsQuotes(std::string_view value) const {
        if (value.empty()) {
            return false;
        }
        if (options_.allow_comments && value.front() == options_.comment_marker) {
            return true;
        }
        for (char c : value) {
            if (c == options_.separator || c == '"' || c == '\n' || c == '\r') {
                return true;
            }
        }
        return false;
    }

} // namespace tcsv
