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
 * @file codec_registry.h
 * @brief Process-wide table of record codecs and the CsvSerializer facade.
 *
 * Codecs are registered explicitly during start-up, nothing registers itself
 * from a static initializer:
 *
 *     tcsv::StreamDiagnosticSink sink;                 // prints TCSVxxx diagnostics to std::cerr
 *     tcsv::registerRecords<Trade, Quote>(tcsv::CodecRegistry::global(), sink);
 *
 *     std::string text = tcsv::CsvSerializer::serialize<Trade>(trades);
 *     std::vector<Trade> back = tcsv::CsvSerializer::deserialize<Trade>(text);
 *
 * The registry is guarded by a shared mutex; lookups from many threads only
 * take the shared lock.
 */

#include <cstddef>
#include <iosfwd>
#include <iterator>
#include <memory>
#include <shared_mutex>
#include <source_location>
#include <span>
#include <string>
#include <string_view>
#include <typeindex>
#include <unordered_map>
#include <vector>

#include "options.h"
#include "record_codec.h"
#include "record_traits.h"
#include "schema.h"

namespace tcsv {

    class CodecRegistry {
        mutable std::shared_mutex                                       mutex_;
        std::unordered_map<std::type_index, std::shared_ptr<const void>> codecs_;

    public:
        CodecRegistry() = default;
        CodecRegistry(const CodecRegistry&) = delete;
        CodecRegistry& operator=(const CodecRegistry&) = delete;

        static CodecRegistry&   global();

        /// Adds or replaces the codec of T.
        template<Record T>
        void                    add(std::shared_ptr<const RecordCodec<T>> codec);

        template<Record T>
        std::shared_ptr<const RecordCodec<T>> find() const;

        /// Like find(), throws CsvSerializationError if T has no codec.
        template<Record T>
        std::shared_ptr<const RecordCodec<T>> get() const;

        template<typename T>
        bool                    contains() const;

        template<typename T>
        bool                    remove();

        size_t                  size() const;
        void                    clear();
    };

    /// Compile T's schema and register its codec. Returns false if diagnostics were reported.
    template<Record T>
    bool registerRecord(CodecRegistry& registry, DiagnosticSink& sink,
                        std::source_location location = std::source_location::current());

    /// Register a batch. A failing type is skipped, the others are still registered.
    /// Returns the number of codecs registered.
    template<Record... Ts>
    size_t registerRecords(CodecRegistry& registry, DiagnosticSink& sink,
                           std::source_location location = std::source_location::current());

    /**
     * @brief String / stream front end over CodecRegistry::global().
     *
     * T must be given explicitly, e.g. CsvSerializer::serialize<Trade>(trades).
     */
    class CsvSerializer {
    public:
        template<Record T>
        static std::string      serialize(std::span<const T> records, const CsvOptions& options = {});

        template<Record T>
        static void             serialize(std::ostream& os, std::span<const T> records, const CsvOptions& options = {});

        template<Record T, std::input_iterator Iterator, std::sentinel_for<Iterator> Sentinel>
        static std::string      serializeRange(Iterator first, Sentinel last, const CsvOptions& options = {});

        template<Record T>
        static std::vector<T>   deserialize(std::string_view text, const CsvOptions& options = {});

        template<Record T>
        static size_t           deserialize(std::string_view text, std::span<T> destination, const CsvOptions& options = {});

        /// Reads the remaining stream content, then parses it.
        template<Record T>
        static std::vector<T>   deserialize(std::istream& is, const CsvOptions& options = {});
    };

} // namespace tcsv
