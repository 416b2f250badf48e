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
 * @file schema.h
 * @brief Schema model of a record type and the compiler that builds it.
 *
 * TypeMetadata is what a metadata collaborator knows about a record type
 * (usually produced by reflectMetadata<T>(), see record_traits.h).
 * SchemaCompiler validates it, assigns every field its key and column index,
 * precomputes the header bytes and picks the KeyStrategy. The result is an
 * immutable Schema that a RecordCodec consumes.
 *
 * Schema-definition problems are reported to a DiagnosticSink and are never
 * thrown. A type with at least one diagnostic yields no Schema.
 */

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <optional>
#include <ostream>
#include <source_location>
#include <string>
#include <string_view>
#include <vector>

#include "definitions.h"

namespace tcsv {

    /// Where a record type was declared or registered.
    struct SourceLocation {
        std::string     file;
        uint32_t        line = 0;
        uint32_t        column = 0;

        static SourceLocation from(const std::source_location& location) {
            return SourceLocation{location.file_name(), location.line(), location.column()};
        }

        bool            empty() const   { return file.empty(); }
        std::string     toString() const;
    };

    struct MemberMetadata {
        std::string                 name;
        std::string                 type_name;
        FieldKind                   kind = FieldKind::OTHER;
        std::optional<int>          index;          // explicit column index
        std::optional<std::string>  key;            // explicit header key
    };

    struct TypeMetadata {
        std::string                 name;
        SourceLocation              location;
        bool                        is_extensible = true;
        bool                        is_nested = false;
        bool                        is_abstract = false;
        bool                        key_as_property_name = false;
        std::vector<MemberMetadata> members;        // declaration order
    };

    // ── Diagnostics ─────────────────────────────────────────────────────

    enum class DiagnosticId : uint8_t {
        MUST_BE_EXTENSIBLE      = 1,
        NESTED_NOT_ALLOWED      = 2,
        ABSTRACT_NOT_ALLOWED    = 3,
        MIXED_KEY_KINDS         = 4,
        DUPLICATE_COLUMN_INDEX  = 5,
        NEGATIVE_COLUMN_INDEX   = 6
    };

    std::string_view diagnosticCode(DiagnosticId id);

    struct Diagnostic {
        DiagnosticId    id;
        std::string     type_name;
        SourceLocation  location;
        std::string     message;

        std::string_view code() const   { return diagnosticCode(id); }
        std::string     toString() const;
    };

    class DiagnosticSink {
    public:
        virtual ~DiagnosticSink() = default;
        virtual void report(const Diagnostic& diagnostic) = 0;
    };

    /// Keeps every reported diagnostic, mostly for tests and tooling.
    class CollectingDiagnosticSink : public DiagnosticSink {
        std::vector<Diagnostic> diagnostics_;

    public:
        void report(const Diagnostic& diagnostic) override { diagnostics_.push_back(diagnostic); }

        const std::vector<Diagnostic>&  diagnostics() const { return diagnostics_; }
        bool                            empty() const       { return diagnostics_.empty(); }
        size_t                          size() const        { return diagnostics_.size(); }
        size_t                          count(DiagnosticId id) const;
        void                            clear()             { diagnostics_.clear(); }
    };

    /// Prints each diagnostic as one line, e.g. "file.cpp:12:5: error TCSV004: ..."
    class StreamDiagnosticSink : public DiagnosticSink {
        std::ostream& os_;

    public:
        explicit StreamDiagnosticSink(std::ostream& os = std::cerr) : os_(os) {}
        void report(const Diagnostic& diagnostic) override;
    };

    // ── Schema ──────────────────────────────────────────────────────────

    struct FieldInfo {
        std::string     name;
        std::string     type_name;
        FieldKind       kind = FieldKind::OTHER;
        int             ordinal = 0;            // declaration position
        int             column_index = 0;       // physical column in positional mode, ordinal in named mode
        bool            numeric_key = true;
        std::string     header;                 // UTF-8 bytes of the header cell (the key)
    };

    class Schema {
        std::string             type_name_;
        KeyStrategy             strategy_ = KeyStrategy::POSITIONAL;
        std::vector<FieldInfo>  fields_;
        int                     max_column_index_ = -1;

    public:
        Schema(std::string typeName, KeyStrategy strategy, std::vector<FieldInfo> fields);

        const std::string&              typeName() const            { return type_name_; }
        KeyStrategy                     strategy() const            { return strategy_; }
        const std::vector<FieldInfo>&   fields() const              { return fields_; }
        const FieldInfo&                field(size_t ordinal) const { return fields_[ordinal]; }
        size_t                          fieldCount() const          { return fields_.size(); }
        int                             maxColumnIndex() const      { return max_column_index_; }

        /// Slot per physical column 0..maxColumnIndex(): the field ordinal or UNKNOWN_COLUMN.
        std::vector<int>                positionTable() const;
    };

    class SchemaCompiler {
    public:
        /// Schema for one type, or std::nullopt after reporting what is wrong with it.
        static std::optional<Schema>    compile(const TypeMetadata& type, DiagnosticSink& sink);

        /// Compiles every type that compiles; failures only skip their own type.
        static std::vector<Schema>      compileAll(const std::vector<TypeMetadata>& types, DiagnosticSink& sink);
    };

} // namespace tcsv
