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
 * @file codec_registry.hpp
 * @brief CodecRegistry, registration helpers and CsvSerializer implementations.
 */

#include "codec_registry.h"
#include "csv_error.h"
#include "record_codec.hpp"
#include "schema.hpp"

#include <exception>
#include <iostream>
#include <istream>
#include <iterator>
#include <mutex>
#include <ostream>
#include <stdexcept>
#include <utility>

namespace tcsv {

    // ── CodecRegistry ───────────────────────────────────────────────────

    inline CodecRegistry& CodecRegistry::global() {
        static CodecRegistry registry;
        return registry;
    }

    template<Record T>
    void CodecRegistry::add(std::shared_ptr<const RecordCodec<T>> codec) {
        if (!codec) {
            throw std::invalid_argument("Error: Cannot register a null codec for " + recordName<T>());
        }
        std::unique_lock lock(mutex_);
        codecs_[std::type_index(typeid(T))] = std::move(codec);
    }

    template<Record T>
    std::shared_ptr<const RecordCodec<T>> CodecRegistry::find() const {
        std::shared_lock lock(mutex_);
        auto it = codecs_.find(std::type_index(typeid(T)));
        if (it == codecs_.end()) {
            return nullptr;
        }
        return std::static_pointer_cast<const RecordCodec<T>>(it->second);
    }

    template<Record T>
    std::shared_ptr<const RecordCodec<T>> CodecRegistry::get() const {
        auto codec = find<T>();
        if (!codec) {
            CsvSerializationError::throwCodecNotRegistered(recordName<T>());
        }
        return codec;
    }

    template<typename T>
    bool CodecRegistry::contains() const {
        std::shared_lock lock(mutex_);
        return codecs_.find(std::type_index(typeid(T))) != codecs_.end();
    }

    template<typename T>
    bool CodecRegistry::remove() {
        std::unique_lock lock(mutex_);
        return codecs_.erase(std::type_index(typeid(T))) > 0;
    }

    inline size_t CodecRegistry::size() const {
        std::shared_lock lock(mutex_);
        return codecs_.size();
    }

    inline void CodecRegistry::clear() {
        std::unique_lock lock(mutex_);
        codecs_.clear();
    }

    // ── Registration ────────────────────────────────────────────────────

    template<Record T>
    bool registerRecord(CodecRegistry& registry, DiagnosticSink& sink, std::source_location location) {
        std::optional<Schema> schema = SchemaCompiler::compile(reflectMetadata<T>(SourceLocation::from(location)), sink);
        if (!schema.has_value()) {
            return false;
        }
        // Types the compiler rejects never reach this point; the guard keeps
        // RecordCodec from being instantiated for them.
        if constexpr (std::is_default_constructible_v<T> && !std::is_abstract_v<T>) {
            registry.add<T>(std::make_shared<const RecordCodec<T>>(std::move(*schema)));
            if constexpr (DEBUG_OUTPUTS) {
                std::cerr << "tcsv: registered codec for " << recordName<T>() << std::endl;
            }
            return true;
        } else {
            return false;
        }
    }

    template<Record... Ts>
    size_t registerRecords(CodecRegistry& registry, DiagnosticSink& sink, std::source_location location) {
        size_t registered = 0;
        auto registerOne = [&]<typename T>() {
            try {
                if (registerRecord<T>(registry, sink, location)) {
                    ++registered;
                }
            } catch (const std::exception& ex) {
                // An internal failure only drops this type; it is not a schema error.
                if constexpr (DEBUG_OUTPUTS) {
                    std::cerr << "tcsv: skipped " << recordName<T>() << ": " << ex.what() << std::endl;
                }
            }
        };
        (registerOne.template operator()<Ts>(), ...);
        return registered;
    }

    // ── CsvSerializer ───────────────────────────────────────────────────

    template<Record T>
    std::string CsvSerializer::serialize(std::span<const T> records, const CsvOptions& options) {
        auto codec = CodecRegistry::global().get<T>();
        CsvWriter writer(options);
        codec->serialize(writer, records);
        return writer.str();
    }

    template<Record T>
    void CsvSerializer::serialize(std::ostream& os, std::span<const T> records, const CsvOptions& options) {
        auto codec = CodecRegistry::global().get<T>();
        CsvWriter writer(os, options);
        codec->serialize(writer, records);
        writer.flush();
    }

    template<Record T, std::input_iterator Iterator, std::sentinel_for<Iterator> Sentinel>
    std::string CsvSerializer::serializeRange(Iterator first, Sentinel last, const CsvOptions& options) {
        auto codec = CodecRegistry::global().get<T>();
        CsvWriter writer(options);
        codec->serializeRange(writer, std::move(first), std::move(last));
        return writer.str();
    }

    template<Record T>
    std::vector<T> CsvSerializer::deserialize(std::string_view text, const CsvOptions& options) {
        auto codec = CodecRegistry::global().get<T>();
        CsvReader reader(text, options);
        return codec->deserialize(reader);
    }

    template<Record T>
    size_t CsvSerializer::deserialize(std::string_view text, std::span<T> destination, const CsvOptions& options) {
        auto codec = CodecRegistry::global().get<T>();
        CsvReader reader(text, options);
        return codec->deserialize(reader, destination);
    }

    template<Record T>
    std::vector<T> CsvSerializer::deserialize(std::istream& is, const CsvOptions& options) {
        std::string text{std::istreambuf_iterator<char>(is), std::istreambuf_iterator<char>()};
        if (is.bad()) {
            throw std::runtime_error("Error: Failed to read CSV input stream");
        }
        return deserialize<T>(std::string_view(text), options);
    }

} // namespace tcsv
