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
 * @file formatter.hpp
 * @brief FormatterProvider, built-in formatters and the per-kind value dispatch.
 */

#include "formatter.h"
#include "csv_error.h"
#include "csv_reader.hpp"
#include "csv_writer.hpp"

#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>

namespace tcsv {

    // ── Value dispatch ──────────────────────────────────────────────────

    template<typename V>
    void writeValue(CsvWriter& writer, const V& value) {
        constexpr FieldKind kind = toFieldKind<V>();
        if constexpr (kind == FieldKind::BOOL)          writer.writeBoolean(value);
        else if constexpr (kind == FieldKind::INT8)     writer.writeInt8(static_cast<int8_t>(value));
        else if constexpr (kind == FieldKind::UINT8)    writer.writeUInt8(static_cast<uint8_t>(value));
        else if constexpr (kind == FieldKind::INT16)    writer.writeInt16(static_cast<int16_t>(value));
        else if constexpr (kind == FieldKind::UINT16)   writer.writeUInt16(static_cast<uint16_t>(value));
        else if constexpr (kind == FieldKind::INT32)    writer.writeInt32(static_cast<int32_t>(value));
        else if constexpr (kind == FieldKind::UINT32)   writer.writeUInt32(static_cast<uint32_t>(value));
        else if constexpr (kind == FieldKind::INT64)    writer.writeInt64(static_cast<int64_t>(value));
        else if constexpr (kind == FieldKind::UINT64)   writer.writeUInt64(static_cast<uint64_t>(value));
        else if constexpr (kind == FieldKind::FLOAT)    writer.writeFloat(value);
        else if constexpr (kind == FieldKind::DOUBLE)   writer.writeDouble(value);
        else if constexpr (kind == FieldKind::DECIMAL)  writer.writeDecimal(value);
        else if constexpr (kind == FieldKind::CHAR)     writer.writeChar(value);
        else if constexpr (kind == FieldKind::STRING)   writer.writeString(value);
        else {
            writer.options().formatterProvider().template getFormatter<V>()->serialize(writer, value);
        }
    }

    template<typename V>
    V readValue(CsvReader& reader) {
        constexpr FieldKind kind = toFieldKind<V>();
        if constexpr (kind == FieldKind::BOOL)          return reader.readBoolean();
        else if constexpr (kind == FieldKind::INT8)     return static_cast<V>(reader.readInt8());
        else if constexpr (kind == FieldKind::UINT8)    return static_cast<V>(reader.readUInt8());
        else if constexpr (kind == FieldKind::INT16)    return static_cast<V>(reader.readInt16());
        else if constexpr (kind == FieldKind::UINT16)   return static_cast<V>(reader.readUInt16());
        else if constexpr (kind == FieldKind::INT32)    return static_cast<V>(reader.readInt32());
        else if constexpr (kind == FieldKind::UINT32)   return static_cast<V>(reader.readUInt32());
        else if constexpr (kind == FieldKind::INT64)    return static_cast<V>(reader.readInt64());
        else if constexpr (kind == FieldKind::UINT64)   return static_cast<V>(reader.readUInt64());
        else if constexpr (kind == FieldKind::FLOAT)    return reader.readFloat();
        else if constexpr (kind == FieldKind::DOUBLE)   return reader.readDouble();
        else if constexpr (kind == FieldKind::DECIMAL)  return reader.readDecimal();
        else if constexpr (kind == FieldKind::CHAR)     return reader.readChar();
        else if constexpr (kind == FieldKind::STRING)   return reader.readString();
        else {
            return reader.options().formatterProvider().template getFormatter<V>()->deserialize(reader);
        }
    }

    // ── Built-in formatters ─────────────────────────────────────────────

    template<EnumField E>
    void EnumFormatter<E>::serialize(CsvWriter& writer, const E& value) const {
        writeValue(writer, static_cast<std::underlying_type_t<E>>(value));
    }

    template<EnumField E>
    E EnumFormatter<E>::deserialize(CsvReader& reader) const {
        return static_cast<E>(readValue<std::underlying_type_t<E>>(reader));
    }

    template<OptionalPrimitive O>
    void OptionalFormatter<O>::serialize(CsvWriter& writer, const O& value) const {
        if (!value.has_value()) {
            return;
        }
        if constexpr (std::is_same_v<typename O::value_type, std::string>) {
            // keep an engaged empty string apart from std::nullopt
            if (value->empty()) {
                writer.writeRaw("\"\"");
                return;
            }
        }
        writeValue(writer, *value);
    }

    template<OptionalPrimitive O>
    O OptionalFormatter<O>::deserialize(CsvReader& reader) const {
        if constexpr (std::is_same_v<typename O::value_type, std::string>) {
            if (reader.atCellEnd()) {
                return std::nullopt;
            }
        } else if (reader.atEmptyCell()) {
            reader.skipField();
            return std::nullopt;
        }
        return readValue<typename O::value_type>(reader);
    }

    // ── FormatterProvider ───────────────────────────────────────────────

    inline FormatterProvider& FormatterProvider::defaultProvider() {
        static FormatterProvider provider;
        return provider;
    }

    template<typename T>
    void FormatterProvider::registerFormatter(std::shared_ptr<const CsvFormatter<T>> formatter) {
        if (!formatter) {
            throw std::invalid_argument("Error: Cannot register a null CSV formatter for type " + typeName<T>());
        }
        std::unique_lock lock(mutex_);
        formatters_[std::type_index(typeid(T))] = std::move(formatter);
        if constexpr (DEBUG_OUTPUTS) {
            std::cerr << "tcsv: registered CSV formatter for " << typeName<T>() << std::endl;
        }
    }

    template<typename T>
    bool FormatterProvider::unregisterFormatter() {
        std::unique_lock lock(mutex_);
        return formatters_.erase(std::type_index(typeid(T))) > 0;
    }

    template<typename T>
    std::shared_ptr<const CsvFormatter<T>> FormatterProvider::findFormatter() const {
        {
            std::shared_lock lock(mutex_);
            auto it = formatters_.find(std::type_index(typeid(T)));
            if (it != formatters_.end()) {
                return std::static_pointer_cast<const CsvFormatter<T>>(it->second);
            }
        }
        if constexpr (EnumField<T>) {
            static const auto builtin = std::make_shared<const EnumFormatter<T>>();
            return builtin;
        } else if constexpr (OptionalPrimitive<T>) {
            static const auto builtin = std::make_shared<const OptionalFormatter<T>>();
            return builtin;
        } else {
            return nullptr;
        }
    }

    template<typename T>
    std::shared_ptr<const CsvFormatter<T>> FormatterProvider::getFormatter() const {
        auto formatter = findFormatter<T>();
        if (!formatter) {
            CsvSerializationError::throwFormatterNotRegistered(typeName<T>());
        }
        return formatter;
    }

    inline size_t FormatterProvider::size() const {
        std::shared_lock lock(mutex_);
        return formatters_.size();
    }

    inline void FormatterProvider::clear() {
        std::unique_lock lock(mutex_);
        formatters_.clear();
    }

    // ── CsvOptions ──────────────────────────────────────────────────────

    inline const FormatterProvider& CsvOptions::formatterProvider() const {
        return formatter_provider ? *formatter_provider : FormatterProvider::defaultProvider();
    }

} // namespace tcsv
