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
 * @file column_map.hpp
 * @brief ColumnMapResolver implementations.
 */

#include "column_map.h"

#include <algorithm>

namespace tcsv {

    namespace detail {

        struct BucketLengthLess {
            bool operator()(const ColumnMapResolver::Bucket& b, size_t length) const { return b.length < length; }
        };

    } // namespace detail

    inline void ColumnMapResolver::build(const Schema& schema) {
        buckets_.clear();
        for (const auto& field : schema.fields()) {
            insert(field.header, field.ordinal);
        }
    }

    inline void ColumnMapResolver::insert(std::string_view key, int ordinal) {
        auto it = std::lower_bound(buckets_.begin(), buckets_.end(), key.size(), detail::BucketLengthLess{});
        if (it == buckets_.end() || it->length != key.size()) {
            it = buckets_.insert(it, Bucket{key.size(), {}});
        }
        it->entries.emplace_back(std::string(key), ordinal);
    }

    inline int ColumnMapResolver::resolve(std::string_view key) const {
        auto it = std::lower_bound(buckets_.begin(), buckets_.end(), key.size(), detail::BucketLengthLess{});
        if (it == buckets_.end() || it->length != key.size()) {
            return UNKNOWN_COLUMN;
        }
        for (const auto& entry : it->entries) {
            if (std::string_view(entry.first) == key) {
                return entry.second;
            }
        }
        return UNKNOWN_COLUMN;
    }

} // namespace tcsv
