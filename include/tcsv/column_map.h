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
 * @file column_map.h
 * @brief Header-key lookup for records with named columns.
 *
 * A named-mode read turns the input's header row into a column map: one slot
 * per physical column holding the field ordinal, or UNKNOWN_COLUMN. The map is
 * built per call; ColumnMapResolver is the immutable part shared by all calls.
 */

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "definitions.h"
#include "schema.h"

namespace tcsv {

    /// Ordered column map of one read: physical column → field ordinal or UNKNOWN_COLUMN.
    using ColumnMap = std::vector<int>;

    /**
     * @brief Resolves header bytes to a field ordinal.
     *
     * Works like a flat map bucketed by key length: buckets are kept sorted by
     * byte length and located by binary search, then the few candidates of that
     * length are compared byte for byte in declaration order. The first match
     * wins, so a schema with two equal keys always resolves to the earlier field.
     */
    class ColumnMapResolver {
    public:
        using Entry = std::pair<std::string, int>;      // {header bytes, ordinal}

        struct Bucket {
            size_t              length;
            std::vector<Entry>  entries;                // declaration order
        };

    private:
        std::vector<Bucket> buckets_;                   // ascending length

    public:
        ColumnMapResolver() = default;
        explicit ColumnMapResolver(const Schema& schema) { build(schema); }

        void                        build(const Schema& schema);
        void                        insert(std::string_view key, int ordinal);
        void                        clear()                 { buckets_.clear(); }

        /// Field ordinal for the header bytes, or UNKNOWN_COLUMN.
        int                         resolve(std::string_view key) const;

        const std::vector<Bucket>&  buckets() const         { return buckets_; }
        bool                        empty() const           { return buckets_.empty(); }
    };

} // namespace tcsv
