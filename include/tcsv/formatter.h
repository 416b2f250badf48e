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
 * @file formatter.h
 * @brief Fallback formatters for field types without a reader/writer primitive.
 *
 * Fields of FieldKind::OTHER are written and read through a CsvFormatter<T>
 * looked up by exact type in a FormatterProvider. The provider is consulted
 * when a field is first touched, never when a codec is built, so a missing
 * formatter surfaces as CsvSerializationError during serialize/deserialize.
 *
 * The default provider resolves two families without registration:
 *   - enums, written as their underlying integer
 *   - std::optional<P> of a primitive P, an empty cell being std::nullopt
 * Explicitly registered formatters take precedence over both.
 *
 * Usage:
 *     struct Point { int x; int y; };
 *
 *     class PointFormatter : public tcsv::CsvFormatter<Point> {
 *     public:
 *         void serialize(tcsv::CsvWriter& w, const Point& p) const override { ... }
 *         Point deserialize(tcsv::CsvReader& r) const override { ... }
 *     };
 *
 *     tcsv::FormatterProvider::defaultProvider()
 *         .registerFormatter<Point>(std::make_shared<PointFormatter>());
 */

#include <cstddef>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <type_traits>
#include <typeindex>
#include <unordered_map>

#include "csv_reader.h"
#include "csv_writer.h"
#include "definitions.h"
#include "options.h"

namespace tcsv {

    /// Symmetric text codec for one field type.
    template<typename T>
    class CsvFormatter {
    public:
        virtual ~CsvFormatter() = default;

        virtual void    serialize(CsvWriter& writer, const T& value) const = 0;
        virtual T       deserialize(CsvReader& reader) const = 0;
    };

    template<typename T>
    struct IsOptional : std::false_type {};

    template<typename T>
    struct IsOptional<std::optional<T>> : std::true_type {};

    template<typename T>
    concept OptionalPrimitive = IsOptional<T>::value && isPrimitiveField<typename T::value_type>;

    template<typename T>
    concept EnumField = std::is_enum_v<T>;

    /// Writes an enum as its underlying integer.
    template<EnumField E>
    class EnumFormatter : public CsvFormatter<E> {
    public:
        void    serialize(CsvWriter& writer, const E& value) const override;
        E       deserialize(CsvReader& reader) const override;
    };

    /// Writes std::optional<P> as P, or as an empty cell when disengaged.
    template<OptionalPrimitive O>
    class OptionalFormatter : public CsvFormatter<O> {
    public:
        void    serialize(CsvWriter& writer, const O& value) const override;
        O       deserialize(CsvReader& reader) const override;
    };

    /**
     * @brief Type-indexed table of fallback formatters.
     *
     * Lookups take a shared lock and hand out shared ownership, so a formatter
     * replaced or unregistered while a codec is using it stays alive until that
     * call returns.
     */
    class FormatterProvider {
        mutable std::shared_mutex                                       mutex_;
        std::unordered_map<std::type_index, std::shared_ptr<const void>> formatters_;

    public:
        FormatterProvider() = default;
        FormatterProvider(const FormatterProvider&) = delete;
        FormatterProvider& operator=(const FormatterProvider&) = delete;

        /// Provider used by every CsvOptions without a formatter_provider of its own.
        static FormatterProvider& defaultProvider();

        template<typename T>
        void                    registerFormatter(std::shared_ptr<const CsvFormatter<T>> formatter);

        template<typename T>
        bool                    unregisterFormatter();

        /// Registered or built-in formatter for T, nullptr if there is none.
        template<typename T>
        std::shared_ptr<const CsvFormatter<T>>  findFormatter() const;

        /// Like findFormatter(), throws CsvSerializationError if there is none.
        template<typename T>
        std::shared_ptr<const CsvFormatter<T>>  getFormatter() const;

        template<typename T>
        bool                    contains() const                { return findFormatter<T>() != nullptr; }

        size_t                  size() const;
        void                    clear();
    };

    // Fast path for primitive kinds, formatter lookup for everything else.
    template<typename V>
    void    writeValue(CsvWriter& writer, const V& value);

    template<typename V>
    V       readValue(CsvReader& reader);

} // namespace tcsv
