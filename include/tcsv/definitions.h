/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 *
 * This file is part of the TCSV library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

#pragma once

/* This file holds all constants and definitions used throughout the TCSV library */
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>

namespace tcsv {

    // Version information
    constexpr int VERSION_MAJOR = 1;
    constexpr int VERSION_MINOR = 0;
    constexpr int VERSION_PATCH = 0;

    inline std::string getVersion() {
        return std::to_string(VERSION_MAJOR) + "." +
               std::to_string(VERSION_MINOR) + "." +
               std::to_string(VERSION_PATCH);
    }

    // Build switches (see TCSV_DEBUG_OUTPUTS / TCSV_RANGE_CHECKING in CMakeLists.txt)
#ifdef TCSV_DEBUG_OUTPUTS
    constexpr bool DEBUG_OUTPUTS = true;
#else
    constexpr bool DEBUG_OUTPUTS = false;
#endif

#if defined(TCSV_RANGE_CHECKING) && TCSV_RANGE_CHECKING == 0
    constexpr bool RANGE_CHECKING = false;
#else
    constexpr bool RANGE_CHECKING = true;
#endif

    constexpr int    UNKNOWN_COLUMN   = -1;         // column map entry for headers without a matching field
    constexpr size_t MAX_COLUMN_COUNT = 65535-1;
    constexpr size_t WRITER_FLUSH_THRESHOLD = 64 * 1024; // bytes buffered before CsvWriter flushes to its ostream

    class Decimal;

    template<typename T>
    constexpr bool always_false = false;

    // Content kind of a record field. Everything but OTHER has a dedicated reader/writer primitive.
    enum class FieldKind : uint8_t {
        BOOL    = 0x01,
        INT8    = 0x02,
        UINT8   = 0x03,
        INT16   = 0x04,
        UINT16  = 0x05,
        INT32   = 0x06,
        UINT32  = 0x07,
        INT64   = 0x08,
        UINT64  = 0x09,
        FLOAT   = 0x0A,
        DOUBLE  = 0x0B,
        DECIMAL = 0x0C,
        CHAR    = 0x0D,
        STRING  = 0x0E,
        OTHER   = 0xFF
    };

    // How header cells are quoted and which values get wrapped in quotes.
    enum class QuoteMode : uint8_t {
        NONE,           // never quote
        MINIMAL,        // quote text only when it contains separator, quote or line break
        ALL,            // quote every cell
        NON_NUMERIC     // quote text, char and bool cells, leave numbers bare
    };

    // Column identity of a schema: fixed position or header name.
    enum class KeyStrategy : uint8_t {
        POSITIONAL,
        NAMED
    };

    template<typename T>
    constexpr FieldKind toFieldKind() {
        using U = std::remove_cv_t<T>;
        if constexpr (std::is_same_v<U, bool>) return FieldKind::BOOL;
        else if constexpr (std::is_same_v<U, char>) return FieldKind::CHAR;
        else if constexpr (std::is_same_v<U, wchar_t> || std::is_same_v<U, char8_t> ||
                           std::is_same_v<U, char16_t> || std::is_same_v<U, char32_t>) return FieldKind::OTHER;
        else if constexpr (std::is_integral_v<U>) {
            if constexpr (std::is_signed_v<U>) {
                if constexpr (sizeof(U) == 1) return FieldKind::INT8;
                else if constexpr (sizeof(U) == 2) return FieldKind::INT16;
                else if constexpr (sizeof(U) == 4) return FieldKind::INT32;
                else if constexpr (sizeof(U) == 8) return FieldKind::INT64;
                else return FieldKind::OTHER;
            } else {
                if constexpr (sizeof(U) == 1) return FieldKind::UINT8;
                else if constexpr (sizeof(U) == 2) return FieldKind::UINT16;
                else if constexpr (sizeof(U) == 4) return FieldKind::UINT32;
                else if constexpr (sizeof(U) == 8) return FieldKind::UINT64;
                else return FieldKind::OTHER;
            }
        }
        else if constexpr (std::is_same_v<U, float>) return FieldKind::FLOAT;
        else if constexpr (std::is_same_v<U, double>) return FieldKind::DOUBLE;
        else if constexpr (std::is_same_v<U, Decimal>) return FieldKind::DECIMAL;
        else if constexpr (std::is_same_v<U, std::string>) return FieldKind::STRING;
        else return FieldKind::OTHER;
    }

    template<typename T>
    constexpr bool isPrimitiveField = toFieldKind<T>() != FieldKind::OTHER;

    constexpr bool isNumericKind(FieldKind kind) {
        switch (kind) {
            case FieldKind::INT8:
            case FieldKind::UINT8:
            case FieldKind::INT16:
            case FieldKind::UINT16:
            case FieldKind::INT32:
            case FieldKind::UINT32:
            case FieldKind::INT64:
            case FieldKind::UINT64:
            case FieldKind::FLOAT:
            case FieldKind::DOUBLE:
            case FieldKind::DECIMAL:
                return true;
            default:
                return false;
        }
    }

    inline std::string_view fieldKindToString(FieldKind kind) {
        switch (kind) {
            case FieldKind::BOOL:    return "bool";
            case FieldKind::INT8:    return "int8";
            case FieldKind::UINT8:   return "uint8";
            case FieldKind::INT16:   return "int16";
            case FieldKind::UINT16:  return "uint16";
            case FieldKind::INT32:   return "int32";
            case FieldKind::UINT32:  return "uint32";
            case FieldKind::INT64:   return "int64";
            case FieldKind::UINT64:  return "uint64";
            case FieldKind::FLOAT:   return "float";
            case FieldKind::DOUBLE:  return "double";
            case FieldKind::DECIMAL: return "decimal";
            case FieldKind::CHAR:    return "char";
            case FieldKind::STRING:  return "string";
            case FieldKind::OTHER:   return "other";
            default:                 return "undefined";
        }
    }

    /// Readable type name for diagnostics and error messages
    template<typename T>
    std::string typeName() {
        constexpr FieldKind kind = toFieldKind<T>();
        if constexpr (kind != FieldKind::OTHER) {
            return std::string(fieldKindToString(kind));
        } else {
            return typeid(T).name();
        }
    }

    inline std::string_view keyStrategyToString(KeyStrategy strategy) {
        return strategy == KeyStrategy::NAMED ? "named" : "positional";
    }

} // namespace tcsv
