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
 * @file tcsv.h
 * @brief Typed CSV (TCSV) Library - Main Header
 *
 * A C++20 header-only library that compiles record descriptors into
 * specialized CSV serializers and deserializers.
 *
 * This header includes all TCSV components:
 * - CsvReader / CsvWriter: primitive CSV scanning and output
 * - FormatterProvider: fallback formatters for non-primitive field types
 * - SchemaCompiler: schema validation, keys, header bytes, diagnostics
 * - RecordCodec: per-type serializer and deserializer
 * - CodecRegistry / CsvSerializer: process-wide registration and front end
 */

#include <iostream>
#include <string>

// Core definitions first
#include "definitions.h"

// Component declarations
#include "column_map.h"
#include "codec_registry.h"
#include "csv_error.h"
#include "csv_reader.h"
#include "csv_writer.h"
#include "decimal.h"
#include "formatter.h"
#include "options.h"
#include "record_codec.h"
#include "record_traits.h"
#include "schema.h"

// Implementations
#include "column_map.hpp"
#include "codec_registry.hpp"
#include "csv_reader.hpp"
#include "csv_writer.hpp"
#include "decimal.hpp"
#include "formatter.hpp"
#include "record_codec.hpp"
#include "schema.hpp"
