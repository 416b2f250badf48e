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
 * @file decimal.h
 * @brief Decimal: exact base-10 number used for the DECIMAL field kind.
 *
 * Value = coefficient * 10^-scale, with a signed 128-bit coefficient of at most
 * MAX_DIGITS significant digits and 0 <= scale <= MAX_SCALE. The scale is kept
 * as parsed, so "1.50" formats back as "1.50". Equality ignores trailing zeros
 * ("1.50" == "1.5").
 *
 * Text form: [+-]digits[.digits][(e|E)[+-]digits]. No locale, no thousands
 * separators.
 */

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

#include "definitions.h"

#if !defined(__SIZEOF_INT128__)
#error "tcsv::Decimal needs a 128-bit integer type (GCC or Clang on a 64-bit target)"
#endif

namespace tcsv {

    __extension__ typedef __int128 int128_t;

    class Decimal {
    public:
        static constexpr uint8_t MAX_SCALE  = 28;
        static constexpr int     MAX_DIGITS = 38;

    private:
        int128_t    coefficient_ = 0;
        uint8_t     scale_ = 0;

    public:
        constexpr Decimal() = default;
        constexpr Decimal(int64_t units, uint8_t scale = 0) : coefficient_(units), scale_(scale) {}

        static Decimal      fromCoefficient(int128_t coefficient, uint8_t scale);
        static Decimal      parse(std::string_view text);
        static bool         tryParse(std::string_view text, Decimal& result);

        int128_t            coefficient() const                 { return coefficient_; }
        uint8_t             scale() const                       { return scale_; }
        bool                isZero() const                      { return coefficient_ == 0; }
        bool                isNegative() const                  { return coefficient_ < 0; }

        Decimal             normalized() const;
        double              toDouble() const;
        std::string         toString() const;
        void                appendTo(std::string& out) const;

        friend bool operator==(const Decimal& lhs, const Decimal& rhs);
        friend bool operator!=(const Decimal& lhs, const Decimal& rhs) { return !(lhs == rhs); }
    };

    std::ostream& operator<<(std::ostream& os, const Decimal& value);

} // namespace tcsv
