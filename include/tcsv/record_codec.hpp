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
 * @file record_codec.hpp
 * @brief RecordCodec implementations.
 */

#include "record_codec.h"
#include "column_map.hpp"
#include "csv_error.h"
#include "csv_reader.hpp"
#include "csv_writer.hpp"
#include "formatter.hpp"
#include "schema.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

namespace tcsv {

    // ── Constructor ─────────────────────────────────────────────────────

    template<Record T>
    RecordCodec<T>::RecordCodec(Schema schema)
        : schema_(std::move(schema))
    {
        if (schema_.fieldCount() != COLUMN_COUNT) {
            throw std::invalid_argument("Error: Schema of " + schema_.typeName() + " has " +
                                        std::to_string(schema_.fieldCount()) + " fields, record type has " +
                                        std::to_string(COLUMN_COUNT));
        }

        if (schema_.strategy() == KeyStrategy::POSITIONAL) {
            position_table_ = schema_.positionTable();
            write_slots_ = position_table_;
        } else {
            resolver_.build(schema_);
            write_slots_.reserve(schema_.fieldCount());
            for (const auto& field : schema_.fields()) {
                write_slots_.push_back(field.ordinal);
            }
        }
    }

    // ── Serialization ───────────────────────────────────────────────────

    template<Record T>
    void RecordCodec<T>::serialize(CsvWriter& writer, std::span<const T> records) const {
        const bool header = writeHeader(writer);
        for (size_t i = 0; i < records.size(); ++i) {
            // terminators separate lines, the last line has none
            if (header || i > 0) {
                writer.writeEndOfLine();
            }
            writeRecord(writer, records[i]);
        }
    }

    template<Record T>
    void RecordCodec<T>::serialize(CsvWriter& writer, std::unique_ptr<RecordCursor<T>> cursor) const {
        if (!cursor) {
            throw std::invalid_argument("Error: Cannot serialize " + schema_.typeName() + " from a null cursor");
        }
        bool separateLine = writeHeader(writer);
        while (cursor->next()) {
            if (separateLine) {
                writer.writeEndOfLine();
            }
            writeRecord(writer, cursor->current());
            separateLine = true;
        }
    }

    template<Record T>
    template<std::input_iterator Iterator, std::sentinel_for<Iterator> Sentinel>
    void RecordCodec<T>::serializeRange(CsvWriter& writer, Iterator first, Sentinel last) const {
        serialize(writer, std::make_unique<IteratorCursor<T, Iterator, Sentinel>>(std::move(first), std::move(last)));
    }

    template<Record T>
    bool RecordCodec<T>::writeHeader(CsvWriter& writer) const {
        if (!writer.options().has_header) {
            return false;
        }
        const bool quote = writer.options().quoteHeader();
        for (size_t k = 0; k < write_slots_.size(); ++k) {
            if (k > 0) {
                writer.writeSeparator();
            }
            const int ordinal = write_slots_[k];
            if (ordinal == UNKNOWN_COLUMN) {
                continue;
            }
            if (quote) writer.writeRaw('"');
            writer.writeRaw(schema_.field(static_cast<size_t>(ordinal)).header);
            if (quote) writer.writeRaw('"');
        }
        return true;
    }

    template<Record T>
    void RecordCodec<T>::writeRecord(CsvWriter& writer, const T& record) const {
        // A lone empty cell would be a blank line, which readers skip
        if (write_slots_.size() == 1) {
            const uint64_t before = writer.bytesWritten();
            if (write_slots_[0] != UNKNOWN_COLUMN) {
                writeField(writer, record, write_slots_[0], std::make_index_sequence<COLUMN_COUNT>{});
            }
            if (writer.bytesWritten() == before) {
                writer.writeRaw("\"\"");
            }
            return;
        }
        for (size_t k = 0; k < write_slots_.size(); ++k) {
            if (k > 0) {
                writer.writeSeparator();
            }
            const int ordinal = write_slots_[k];
            if (ordinal != UNKNOWN_COLUMN) {
                writeField(writer, record, ordinal, std::make_index_sequence<COLUMN_COUNT>{});
            }
        }
    }

    template<Record T>
    template<size_t... Is>
    void RecordCodec<T>::writeField(CsvWriter& writer, const T& record, int ordinal, std::index_sequence<Is...>) const {
        ((ordinal == static_cast<int>(Is)
            ? (static_cast<void>(writeValue(writer, std::tuple_element_t<Is, Columns>::get(record))), true)
            : false) || ...);
    }

    // ── Deserialization ─────────────────────────────────────────────────

    template<Record T>
    std::vector<T> RecordCodec<T>::deserialize(CsvReader& reader) const {
        std::vector<T> records;
        readRecords(reader, [&records](size_t, T&& record) {
            records.push_back(std::move(record));
        });
        return records;
    }

    template<Record T>
    size_t RecordCodec<T>::deserialize(CsvReader& reader, std::span<T> destination) const {
        return readRecords(reader, [&destination](size_t index, T&& record) {
            if constexpr (RANGE_CHECKING) {
                if (index >= destination.size()) {
                    throw std::out_of_range("Error: Destination holds " + std::to_string(destination.size()) +
                                            " records, input has more");
                }
            }
            destination[index] = std::move(record);
        });
    }

    template<Record T>
    ColumnMap RecordCodec<T>::readColumnMap(CsvReader& reader) const {
        if (!reader.options().has_header) {
            CsvSerializationError::throwHeaderRequired();
        }

        ColumnMap map;
        skipIgnorableLines(reader);
        if (reader.remaining() == 0) {
            return map;
        }

        std::string key;
        while (true) {
            key.clear();
            reader.readUtf8(key);
            map.push_back(resolver_.resolve(key));
            if (reader.tryReadEndOfLine(true)) {
                return map;
            }
            if (!reader.tryReadSeparator()) {
                break;
            }
        }
        reader.skipLine();
        return map;
    }

    template<Record T>
    template<typename Store>
    size_t RecordCodec<T>::readRecords(CsvReader& reader, Store&& store) const {
        ColumnMap columnMap;
        const ColumnMap* slots = &position_table_;

        if (schema_.strategy() == KeyStrategy::NAMED) {
            columnMap = readColumnMap(reader);
            slots = &columnMap;
        } else {
            skipIgnorableLines(reader);
            if (reader.options().has_header && reader.remaining() > 0) {
                reader.skipLine();
            }
        }

        size_t count = 0;
        while (true) {
            skipIgnorableLines(reader);
            if (reader.remaining() == 0) {
                break;
            }
            store(count, readRecord(reader, *slots));
            ++count;
        }

        if constexpr (DEBUG_OUTPUTS) {
            std::cerr << "tcsv: read " << count << " " << schema_.typeName() << " records ("
                      << keyStrategyToString(schema_.strategy()) << ")" << std::endl;
        }
        return count;
    }

    template<Record T>
    T RecordCodec<T>::readRecord(CsvReader& reader, const ColumnMap& slots) const {
        Locals locals{};
        bool endOfLine = false;

        for (const int ordinal : slots) {
            if (ordinal == UNKNOWN_COLUMN) {
                reader.skipField();
            } else {
                readField(reader, locals, ordinal, std::make_index_sequence<COLUMN_COUNT>{});
            }
            if (reader.tryReadEndOfLine(true)) {
                endOfLine = true;
                break;
            }
            if (!reader.tryReadSeparator()) {
                break;
            }
        }

        T record = buildRecord(locals, std::make_index_sequence<COLUMN_COUNT>{});
        if (!endOfLine) {
            reader.skipLine();
        }
        return record;
    }

    template<Record T>
    template<size_t... Is>
    void RecordCodec<T>::readField(CsvReader& reader, Locals& locals, int ordinal, std::index_sequence<Is...>) const {
        ((ordinal == static_cast<int>(Is)
            ? (static_cast<void>(std::get<Is>(locals) = readValue<std::tuple_element_t<Is, Locals>>(reader)), true)
            : false) || ...);
    }

    template<Record T>
    template<size_t... Is>
    T RecordCodec<T>::buildRecord(Locals& locals, std::index_sequence<Is...>) {
        T record{};
        (std::tuple_element_t<Is, Columns>::set(record, std::move(std::get<Is>(locals))), ...);
        return record;
    }

    template<Record T>
    void RecordCodec<T>::skipIgnorableLines(CsvReader& reader) const {
        while (reader.remaining() > 0) {
            if (reader.tryReadEndOfLine()) {
                continue;
            }
            if (reader.options().allow_comments && reader.trySkipComment()) {
                continue;
            }
            break;
        }
    }

} // namespace tcsv
