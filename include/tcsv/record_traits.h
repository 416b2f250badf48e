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
 * @file record_traits.h
 * @brief Compile-time column descriptors of a record type.
 *
 * A record type opts in by specializing RecordTraits<T> with a tuple of
 * member-pointer columns in declaration order. Everything a codec needs is
 * derived from it at compile time; reflectMetadata<T>() turns the same
 * descriptor into the runtime TypeMetadata for the SchemaCompiler.
 *
 * Usage:
 *     struct Trade {
 *         int64_t     id;
 *         std::string symbol;
 *         double      price;
 *     };
 *
 *     template<> struct tcsv::RecordTraits<Trade> {
 *         static constexpr std::string_view name = "Trade";
 *         static constexpr bool key_as_property_name = true;      // header names instead of positions
 *         static constexpr auto columns = std::make_tuple(
 *             tcsv::column<&Trade::id>("id"),
 *             tcsv::column<&Trade::symbol>("symbol", "ticker"),     // explicit header key
 *             tcsv::column<&Trade::price>("price"));
 *     };
 *
 * Optional members: name, key_as_property_name, is_nested.
 * column<&T::m>("m", 3) pins a member to physical column 3 in positional mode.
 */

#include <concepts>
#include <source_location>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

#include "definitions.h"
#include "schema.h"

namespace tcsv {

    template<typename T>
    struct MemberPointerTraits;

    template<typename C, typename V>
    struct MemberPointerTraits<V C::*> {
        using class_type = C;
        using value_type = V;
    };

    template<auto Member>
    struct Column {
        using class_type = typename MemberPointerTraits<decltype(Member)>::class_type;
        using value_type = typename MemberPointerTraits<decltype(Member)>::value_type;

        static constexpr FieldKind kind = toFieldKind<value_type>();

        std::string_view    name;
        int                 index = 0;
        bool                has_index = false;
        std::string_view    key;
        bool                has_key = false;

        static const value_type&    get(const class_type& record)           { return record.*Member; }
        static void                 set(class_type& record, value_type&& v) { record.*Member = std::move(v); }
    };

    template<auto Member>
    constexpr Column<Member> column(std::string_view name) {
        return Column<Member>{name, 0, false, std::string_view{}, false};
    }

    template<auto Member>
    constexpr Column<Member> column(std::string_view name, int index) {
        return Column<Member>{name, index, true, std::string_view{}, false};
    }

    template<auto Member>
    constexpr Column<Member> column(std::string_view name, std::string_view key) {
        return Column<Member>{name, 0, false, key, true};
    }

    /// Specialize per record type, see file comment.
    template<typename T>
    struct RecordTraits;

    template<typename T>
    concept Record = requires {
        RecordTraits<T>::columns;
        std::tuple_size<std::remove_cvref_t<decltype(RecordTraits<T>::columns)>>::value;
    };

    template<Record T>
    using RecordColumns = std::remove_cvref_t<decltype(RecordTraits<T>::columns)>;

    template<Record T>
    constexpr size_t recordColumnCount = std::tuple_size_v<RecordColumns<T>>;

    template<Record T>
    constexpr bool keyAsPropertyName() {
        if constexpr (requires { { RecordTraits<T>::key_as_property_name } -> std::convertible_to<bool>; }) {
            return RecordTraits<T>::key_as_property_name;
        } else {
            return false;
        }
    }

    template<Record T>
    constexpr bool isNestedRecord() {
        if constexpr (requires { { RecordTraits<T>::is_nested } -> std::convertible_to<bool>; }) {
            return RecordTraits<T>::is_nested;
        } else {
            return false;
        }
    }

    template<Record T>
    std::string recordName() {
        if constexpr (requires { { RecordTraits<T>::name } -> std::convertible_to<std::string_view>; }) {
            return std::string(std::string_view(RecordTraits<T>::name));
        } else {
            return typeName<T>();
        }
    }

    /// Runtime metadata of a record type, for SchemaCompiler.
    template<Record T>
    TypeMetadata reflectMetadata(SourceLocation location = {}) {
        TypeMetadata type;
        type.name = recordName<T>();
        type.location = std::move(location);
        // an abstract type is reported as abstract only
        type.is_extensible = std::is_abstract_v<T> || std::is_default_constructible_v<T>;
        type.is_nested = isNestedRecord<T>();
        type.is_abstract = std::is_abstract_v<T>;
        type.key_as_property_name = keyAsPropertyName<T>();

        std::apply([&](const auto&... columns) {
            (type.members.push_back([&](const auto& col) {
                using C = std::remove_cvref_t<decltype(col)>;
                MemberMetadata member;
                member.name = std::string(col.name);
                member.type_name = typeName<typename C::value_type>();
                member.kind = C::kind;
                if (col.has_index) member.index = col.index;
                if (col.has_key) member.key = std::string(col.key);
                return member;
            }(columns)), ...);
        }, RecordTraits<T>::columns);
        return type;
    }

} // namespace tcsv
