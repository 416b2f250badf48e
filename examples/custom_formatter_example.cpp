/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 *
 * This file is part of the TCSV library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

#include <charconv>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "tcsv/tcsv.h"

/**
 * TCSV Custom Formatter Example
 *
 * Fields whose type has no built-in reader/writer primitive go through a
 * CsvFormatter looked up in a FormatterProvider. Enums and optional
 * primitives are handled without registration; anything else needs a
 * formatter before the first record is written or read.
 */

struct GeoPoint {
    double lat = 0.0;
    double lon = 0.0;
};

enum class Status : int16_t {
    Active   = 1,
    Retired  = 2,
    Unknown  = -1
};

struct Station {
    std::string             code;
    GeoPoint                position;
    Status                  status = Status::Unknown;
    std::optional<double>   elevation;
};

template<> struct tcsv::RecordTraits<Station> {
    static constexpr std::string_view name = "Station";
    static constexpr bool key_as_property_name = true;
    static constexpr auto columns = std::make_tuple(
        column<&Station::code>("code"),
        column<&Station::position>("position"),
        column<&Station::status>("status"),
        column<&Station::elevation>("elevation"));
};

// Writes "lat lon" into a single cell
class GeoPointFormatter : public tcsv::CsvFormatter<GeoPoint> {
public:
    void serialize(tcsv::CsvWriter& writer, const GeoPoint& p) const override {
        char buf[64];
        auto res = std::to_chars(buf, buf + sizeof(buf), p.lat);
        *res.ptr++ = ' ';
        res = std::to_chars(res.ptr, buf + sizeof(buf), p.lon);
        writer.writeString(std::string_view(buf, static_cast<size_t>(res.ptr - buf)));
    }

    GeoPoint deserialize(tcsv::CsvReader& reader) const override {
        const std::string text = reader.readString();
        GeoPoint p;
        if (text.empty()) {
            return p;
        }
        const char* end = text.data() + text.size();
        auto res = std::from_chars(text.data(), end, p.lat);
        if (res.ec != std::errc{} || res.ptr == end || *res.ptr != ' ') {
            throw tcsv::CsvSerializationError("Invalid position '" + text + "'");
        }
        res = std::from_chars(res.ptr + 1, end, p.lon);
        if (res.ec != std::errc{} || res.ptr != end) {
            throw tcsv::CsvSerializationError("Invalid position '" + text + "'");
        }
        return p;
    }
};

int main() {
    try {
        std::cout << "TCSV Custom Formatter Example\n";
        std::cout << "=============================\n\n";

        tcsv::StreamDiagnosticSink sink;
        if (!tcsv::registerRecord<Station>(tcsv::CodecRegistry::global(), sink)) {
            return 1;
        }

        std::vector<Station> stations = {
            {"ZRH", {47.4647, 8.5492}, Status::Active, 432.0},
            {"TXL", {52.5597, 13.2877}, Status::Retired, std::nullopt},
        };

        // Without a formatter for GeoPoint the first record fails
        try {
            tcsv::CsvSerializer::serialize<Station>(stations);
        } catch (const tcsv::CsvSerializationError& e) {
            std::cout << "Expected failure: " << e.what() << "\n\n";
        }

        // Options can carry their own provider; the default provider serves all others
        auto provider = std::make_shared<tcsv::FormatterProvider>();
        provider->registerFormatter<GeoPoint>(std::make_shared<GeoPointFormatter>());
        tcsv::CsvOptions options;
        options.formatter_provider = provider;

        const std::string text = tcsv::CsvSerializer::serialize<Station>(stations, options);
        std::cout << "Stations as CSV:\n" << text << "\n\n";

        for (const auto& s : tcsv::CsvSerializer::deserialize<Station>(text, options)) {
            std::cout << s.code << " at (" << s.position.lat << ", " << s.position.lon << ")"
                      << ", status " << static_cast<int>(s.status)
                      << ", elevation " << (s.elevation ? std::to_string(*s.elevation) : std::string("n/a"))
                      << "\n";
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
