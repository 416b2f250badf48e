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
 * @file options.h
 * @brief CsvOptions: configuration shared by CsvReader, CsvWriter and record codecs.
 *
 * Usage:
 *     tcsv::CsvOptions options;
 *     options.separator = ';';
 *     options.quote_mode = tcsv::QuoteMode::ALL;
 *     options.allow_comments = true;
 *
 *     tcsv::CsvWriter writer(options);
 */

#include <memory>
#include <string>

#include "definitions.h"

namespace tcsv {

    class FormatterProvider;

    struct CsvOptions {
        char                                        separator       = ',';
        QuoteMode                                   quote_mode      = QuoteMode::MINIMAL;
        std::string                                 newline         = "\n";     // written line terminator; reader accepts \n, \r\n and \r
        bool                                        has_header      = true;
        bool                                        allow_comments  = false;
        char                                        comment_marker  = '#';
        std::shared_ptr<const FormatterProvider>    formatter_provider;        // nullptr selects FormatterProvider::defaultProvider()

        /// Header cells are quoted when values of non-numeric kinds are.
        bool quoteHeader() const {
            return quote_mode == QuoteMode::ALL || quote_mode == QuoteMode::NON_NUMERIC;
        }

        const FormatterProvider& formatterProvider() const;
    };

} // namespace tcsv
