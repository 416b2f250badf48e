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
 * @file csv_error.h
 * @brief Exceptions raised while serializing or parsing records.
 *
 * Schema-definition problems are never thrown; they go to a DiagnosticSink
 * (see schema.h). Everything here stops the current read or write call.
 */

#include <cstddef>
#include <stdexcept>
#include <string>

namespace tcsv {

    class CsvSerializationError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;

        [[noreturn]] static void throwHeaderRequired() {
            throw CsvSerializationError(
                "Error: Header row is required to deserialize a record with named columns. "
                "Enable CsvOptions::has_header.");
        }

        [[noreturn]] static void throwFormatterNotRegistered(const std::string& typeName) {
            throw CsvSerializationError("Error: No CSV formatter registered for type " + typeName);
        }

        [[noreturn]] static void throwCodecNotRegistered(const std::string& typeName) {
            throw CsvSerializationError("Error: No CSV codec registered for type " + typeName);
        }
    };

    /// Malformed cell text. Carries the 1-based line and column of the offending cell.
    class CsvParseError : public CsvSerializationError {
        size_t line_;
        size_t column_;

    public:
        CsvParseError(const std::string& what, size_t line, size_t column)
            : CsvSerializationError(what + " at line " + std::to_string(line) +
                                    ", column " + std::to_string(column))
            , line_(line)
            , column_(column)
        {}

        size_t line() const     { return line_; }
        size_t column() const   { return column_; }
    };

} // namespace tcsv
