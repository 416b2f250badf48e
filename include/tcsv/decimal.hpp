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
 * @file decimal.hpp
 * @brief Decimal implementations.
 */

#include "decimal.h"

#include <cmath>
#include <stdexcept>

namespace tcsv {

    inline Decimal Decimal::fromCoefficient(int128_t coefficient, uint8_t scale) {
        if (scale > MAX_SCALE) {
            throw std::invalid_argument("Decimal scale exceeds " + std::to_string(MAX_SCALE));
        }
        Decimal d;
        d.coefficient_ = coefficient;
        d.scale_ = scale;
        return d;
    }

    inline Decimal Decimal::parse(std::string_view text) {
        Decimal result;
        if (!tryParse(text, result)) {
            throw std::invalid_argument("Invalid decimal: '" + std::string(text) + "'");
        }
        return result;
    }

    inline bool Decimal::tryParse(std::string_view text, Decimal& result) {
        size_t i = 0;
        const size_t n = text.size();
        bool negative = false;

        if (i < n && (text[i] == '+' || text[i] == '-')) {
            negative = (text[i] == '-');
            ++i;
        }

        int128_t coefficient = 0;
        int digits = 0;          // significant digits accumulated in coefficient
        int fraction = 0;        // digits after the decimal point
        bool anyDigit = false;
        bool seenPoint = false;

        for (; i < n; ++i) {
            const char c = text[i];
            if (c >= '0' && c <= '9') {
                anyDigit = true;
                if (coefficient == 0 && c == '0') {
                    // leading zeros carry no precision but still count as fraction digits
                    if (seenPoint) ++fraction;
                    continue;
                }
                if (++digits > MAX_DIGITS) return false;
                coefficient = coefficient * 10 + (c - '0');
                if (seenPoint) ++fraction;
            } else if (c == '.' && !seenPoint) {
                seenPoint = true;
            } else {
                break;
            }
        }
        if (!anyDigit) return false;

        int exponent = 0;
        if (i < n && (text[i] == 'e' || text[i] == 'E')) {
            ++i;
            bool expNegative = false;
            if (i < n && (text[i] == '+' || text[i] == '-')) {
                expNegative = (text[i] == '-');
                ++i;
            }
            if (i >= n) return false;
            for (; i < n; ++i) {
                const char c = text[i];
                if (c < '0' || c > '9') return false;
                exponent = exponent * 10 + (c - '0');
                if (exponent > 2 * MAX_DIGITS) return false;
            }
            if (expNegative) exponent = -exponent;
        }
        if (i != n) return false;

        int scale = fraction - exponent;
        while (scale < 0) {
            if (coefficient != 0 && ++digits > MAX_DIGITS) return false;
            coefficient *= 10;
            ++scale;
        }
        if (scale > MAX_SCALE) return false;

        result.coefficient_ = negative ? -coefficient : coefficient;
        result.scale_ = static_cast<uint8_t>(scale);
        return true;
    }

    inline Decimal Decimal::normalized() const {
        Decimal d = *this;
        while (d.scale_ > 0 && d.coefficient_ % 10 == 0) {
            d.coefficient_ /= 10;
            --d.scale_;
        }
        return d;
    }

    inline double Decimal::toDouble() const {
        return static_cast<double>(coefficient_) / std::pow(10.0, scale_);
    }

    inline void Decimal::appendTo(std::string& out) const {
        char digits[MAX_DIGITS + 2];
        int len = 0;
        int128_t magnitude = coefficient_ < 0 ? -coefficient_ : coefficient_;
        do {
            digits[len++] = static_cast<char>('0' + static_cast<int>(magnitude % 10));
            magnitude /= 10;
        } while (magnitude != 0);

        // pad so there is at least one digit in front of the decimal point
        while (len <= scale_) {
            digits[len++] = '0';
        }

        if (coefficient_ < 0) out.push_back('-');
        for (int i = len - 1; i >= 0; --i) {
            out.push_back(digits[i]);
            if (i == scale_ && scale_ > 0) out.push_back('.');
        }
    }

    inline std::string Decimal::toString() const {
        std::string s;
        appendTo(s);
        return s;
    }

    inline bool operator==(const Decimal& lhs, const Decimal& rhs) {
        const Decimal a = lhs.normalized();
        const Decimal b = rhs.normalized();
        return a.coefficient_ == b.coefficient_ && a.scale_ == b.scale_;
    }

    inline std::ostream& operator<<(std::ostream& os, const Decimal& value) {
        return os << value.toString();
    }

} // namespace tcsv
