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
 * @file schema.hpp
 * @brief Schema, diagnostics and SchemaCompiler implementations.
 */

#include "schema.h"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <utility>

namespace tcsv {

    inline std::string SourceLocation::toString() const {
        if (file.empty()) {
            return "<unknown>";
        }
        return file + ":" + std::to_string(line) + ":" + std::to_string(column);
    }

    inline std::string_view diagnosticCode(DiagnosticId id) {
        switch (id) {
            case DiagnosticId::MUST_BE_EXTENSIBLE:      return "TCSV001";
            case DiagnosticId::NESTED_NOT_ALLOWED:      return "TCSV002";
            case DiagnosticId::ABSTRACT_NOT_ALLOWED:    return "TCSV003";
            case DiagnosticId::MIXED_KEY_KINDS:         return "TCSV004";
            case DiagnosticId::DUPLICATE_COLUMN_INDEX:  return "TCSV005";
            case DiagnosticId::NEGATIVE_COLUMN_INDEX:   return "TCSV006";
            default:                                    return "TCSV000";
        }
    }

    inline std::string Diagnostic::toString() const {
        return location.toString() + ": error " + std::string(code()) + ": " + message;
    }

    inline size_t CollectingDiagnosticSink::count(DiagnosticId id) const {
        return static_cast<size_t>(std::count_if(diagnostics_.begin(), diagnostics_.end(),
            [id](const Diagnostic& d) { return d.id == id; }));
    }

    inline void StreamDiagnosticSink::report(const Diagnostic& diagnostic) {
        os_ << diagnostic.toString() << std::endl;
    }

    // ── Schema ──────────────────────────────────────────────────────────

    inline Schema::Schema(std::string typeName, KeyStrategy strategy, std::vector<FieldInfo> fields)
        : type_name_(std::move(typeName))
        , strategy_(strategy)
        , fields_(std::move(fields))
    {
        if (fields_.size() > MAX_COLUMN_COUNT) {
            throw std::runtime_error("Error: " + type_name_ + " has more than " +
                                     std::to_string(MAX_COLUMN_COUNT) + " fields");
        }
        for (const auto& field : fields_) {
            if (field.column_index < 0 || static_cast<size_t>(field.column_index) > MAX_COLUMN_COUNT) {
                throw std::out_of_range("Error: Column index " + std::to_string(field.column_index) +
                                        " of " + type_name_ + "::" + field.name + " out of range");
            }
            max_column_index_ = std::max(max_column_index_, field.column_index);
        }
    }

    inline std::vector<int> Schema::positionTable() const {
        std::vector<int> table(static_cast<size_t>(max_column_index_ + 1), UNKNOWN_COLUMN);
        for (const auto& field : fields_) {
            table[static_cast<size_t>(field.column_index)] = field.ordinal;
        }
        return table;
    }

    // ── SchemaCompiler ──────────────────────────────────────────────────

    inline std::optional<Schema> SchemaCompiler::compile(const TypeMetadata& type, DiagnosticSink& sink) {
        bool failed = false;
        auto report = [&](DiagnosticId id, std::string message) {
            failed = true;
            sink.report(Diagnostic{id, type.name, type.location, std::move(message)});
        };

        if (!type.is_extensible) {
            report(DiagnosticId::MUST_BE_EXTENSIBLE,
                   "Type '" + type.name + "' must be default constructible to have a CSV codec generated");
        }
        if (type.is_nested) {
            report(DiagnosticId::NESTED_NOT_ALLOWED,
                   "Nested type '" + type.name + "' cannot have a CSV codec generated");
        }
        if (type.is_abstract) {
            report(DiagnosticId::ABSTRACT_NOT_ALLOWED,
                   "Abstract type '" + type.name + "' cannot have a CSV codec generated");
        }

        // Keys: explicit index > explicit key > member name (key_as_property_name) > ordinal
        std::vector<FieldInfo> fields;
        fields.reserve(type.members.size());
        for (size_t i = 0; i < type.members.size(); ++i) {
            const MemberMetadata& member = type.members[i];
            FieldInfo field;
            field.name = member.name;
            field.type_name = member.type_name;
            field.kind = member.kind;
            field.ordinal = static_cast<int>(i);

            if (member.index.has_value()) {
                field.numeric_key = true;
                field.column_index = *member.index;
                field.header = std::to_string(*member.index);
                if (*member.index < 0) {
                    report(DiagnosticId::NEGATIVE_COLUMN_INDEX,
                           "Column index " + std::to_string(*member.index) + " of member '" +
                           member.name + "' in '" + type.name + "' must not be negative");
                }
            } else if (member.key.has_value()) {
                field.numeric_key = false;
                field.header = *member.key;
            } else if (type.key_as_property_name) {
                field.numeric_key = false;
                field.header = member.name;
            } else {
                field.numeric_key = true;
                field.column_index = field.ordinal;
                field.header = std::to_string(field.ordinal);
            }
            fields.push_back(std::move(field));
        }

        KeyStrategy strategy = KeyStrategy::POSITIONAL;
        if (type.key_as_property_name || (!fields.empty() && !fields.front().numeric_key)) {
            strategy = KeyStrategy::NAMED;
        }

        const bool mixed = std::any_of(fields.begin(), fields.end(), [&](const FieldInfo& f) {
            return f.numeric_key != fields.front().numeric_key;
        });
        if (mixed) {
            report(DiagnosticId::MIXED_KEY_KINDS,
                   "Type '" + type.name + "' mixes numeric column indices and string column keys");
        }

        if (strategy == KeyStrategy::NAMED) {
            for (auto& field : fields) {
                field.column_index = field.ordinal;
            }
        } else if (!mixed) {
            for (size_t i = 0; i < fields.size(); ++i) {
                for (size_t j = 0; j < i; ++j) {
                    if (fields[j].column_index == fields[i].column_index && fields[i].column_index >= 0) {
                        report(DiagnosticId::DUPLICATE_COLUMN_INDEX,
                               "Members '" + fields[j].name + "' and '" + fields[i].name + "' of '" +
                               type.name + "' share column index " + std::to_string(fields[i].column_index));
                        break;
                    }
                }
            }
        }

        if (failed) {
            return std::nullopt;
        }

        Schema schema(type.name, strategy, std::move(fields));
        if constexpr (DEBUG_OUTPUTS) {
            std::cerr << "tcsv: compiled " << schema.typeName() << " ("
                      << keyStrategyToString(schema.strategy()) << ", "
                      << schema.fieldCount() << " fields)" << std::endl;
        }
        return schema;
    }

    inline std::vector<Schema> SchemaCompiler::compileAll(const std::vector<TypeMetadata>& types, DiagnosticSink& sink) {
        std::vector<Schema> schemas;
        schemas.reserve(types.size());
        for (const auto& type : types) {
            try {
                std::optional<Schema> schema = compile(type, sink);
                if (schema.has_value()) {
                    schemas.push_back(std::move(*schema));
                }
            } catch (const std::exception& ex) {
                // An internal failure only drops this type; it is not a schema error.
                if constexpr (DEBUG_OUTPUTS) {
                    std::cerr << "tcsv: skipped " << type.name << ": " << ex.what() << std::endl;
                }
            }
        }
        return schemas;
    }

} // namespace tcsv
