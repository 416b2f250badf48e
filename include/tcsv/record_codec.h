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
 * @file record_codec.h
 * @brief RecordCodec<T>: CSV serializer/deserializer specialized for one record type.
 *
 * RecordCodec is monomorphized over RecordTraits<T>::columns. Every field read
 * or write resolves at compile time to a CsvReader/CsvWriter primitive (or to
 * the formatter lookup for FieldKind::OTHER); the only runtime decision per
 * cell is a switch over the field ordinal.
 *
 * Column resolution, chosen once from Schema::strategy():
 *   POSITIONAL  physical column k is the field with column index k. The header
 *               row, if any, is skipped without looking at it.
 *   NAMED       the header row is required; each header cell is resolved to a
 *               field through the ColumnMapResolver, building a column map that
 *               lives for one deserialize() call.
 *
 * Row handling (both modes):
 *   - blank lines are skipped, and so are comment lines when allow_comments is set
 *   - short rows keep value-initialized defaults for the missing fields
 *   - columns beyond the last known one are skipped to the end of the line
 *   - the last record is not followed by a line terminator
 *
 * A codec is immutable after construction and may be shared between threads,
 * each thread using its own CsvReader/CsvWriter.
 */

#include <concepts>
#include <cstddef>
#include <iterator>
#include <memory>
#include <span>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include "column_map.h"
#include "csv_reader.h"
#include "csv_writer.h"
#include "definitions.h"
#include "record_traits.h"
#include "schema.h"

namespace tcsv {

    /// Single-pass, forward-only source of records.
    template<typename T>
    class RecordCursor {
    public:
        virtual ~RecordCursor() = default;

        /// Advance to the next record. Must be called before the first current().
        virtual bool        next() = 0;
        virtual const T&    current() const = 0;
    };

    /// RecordCursor over an input iterator range.
    template<typename T, std::input_iterator Iterator, std::sentinel_for<Iterator> Sentinel = Iterator>
    class IteratorCursor : public RecordCursor<T> {
        static_assert(std::is_lvalue_reference_v<std::iter_reference_t<Iterator>>,
                      "IteratorCursor requires an iterator that yields references");

        Iterator    it_;
        Sentinel    end_;
        bool        started_ = false;

    public:
        IteratorCursor(Iterator first, Sentinel last) : it_(std::move(first)), end_(std::move(last)) {}

        bool next() override {
            if (started_) {
                ++it_;
            }
            started_ = true;
            return it_ != end_;
        }

        const T& current() const override { return *it_; }
    };

    namespace detail {

        template<typename Columns>
        struct LocalsOf;

        template<typename... Cs>
        struct LocalsOf<std::tuple<Cs...>> {
            using type = std::tuple<typename Cs::value_type...>;
        };

    } // namespace detail

    template<Record T>
    class RecordCodec {
        static_assert(std::is_default_constructible_v<T>, "RecordCodec requires a default constructible record type");
        static_assert(!std::is_abstract_v<T>, "RecordCodec requires a concrete record type");

    public:
        using Columns = RecordColumns<T>;
        using Locals  = typename detail::LocalsOf<Columns>::type;     // one value-initialized local per field

        static constexpr size_t COLUMN_COUNT = std::tuple_size_v<Columns>;

    private:
        Schema              schema_;
        ColumnMap           position_table_;    // physical column → ordinal (positional mode)
        ColumnMap           write_slots_;       // column order of header and rows
        ColumnMapResolver   resolver_;          // header bytes → ordinal (named mode)

    public:
        explicit RecordCodec(Schema schema);

        const Schema&               schema() const          { return schema_; }
        KeyStrategy                 strategy() const        { return schema_.strategy(); }
        const ColumnMap&            positionTable() const   { return position_table_; }
        const ColumnMapResolver&    resolver() const        { return resolver_; }

        // ── Serialization ───────────────────────────────────────────────

        void                serialize(CsvWriter& writer, std::span<const T> records) const;

        /// Consumes and releases the cursor, also when writing throws.
        void                serialize(CsvWriter& writer, std::unique_ptr<RecordCursor<T>> cursor) const;

        template<std::input_iterator Iterator, std::sentinel_for<Iterator> Sentinel>
        void                serializeRange(CsvWriter& writer, Iterator first, Sentinel last) const;

        // ── Deserialization ─────────────────────────────────────────────

        std::vector<T>      deserialize(CsvReader& reader) const;

        /// Writes into destination and returns the number of records read.
        /// Overflow throws std::out_of_range when RANGE_CHECKING is enabled.
        size_t              deserialize(CsvReader& reader, std::span<T> destination) const;

        /// Read the header row and resolve it against this schema (named mode).
        ColumnMap           readColumnMap(CsvReader& reader) const;

    private:
        bool                writeHeader(CsvWriter& writer) const;
        void                writeRecord(CsvWriter& writer, const T& record) const;

        template<size_t... Is>
        void                writeField(CsvWriter& writer, const T& record, int ordinal, std::index_sequence<Is...>) const;

        template<size_t... Is>
        void                readField(CsvReader& reader, Locals& locals, int ordinal, std::index_sequence<Is...>) const;

        template<size_t... Is>
        static T            buildRecord(Locals& locals, std::index_sequence<Is...>);

        T                   readRecord(CsvReader& reader, const ColumnMap& slots) const;
        void                skipIgnorableLines(CsvReader& reader) const;

        template<typename Store>
        size_t              readRecords(CsvReader& reader, Store&& store) const;
    };

} // namespace tcsv
