/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 *
 * This file is part of the TCSV library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

#include <iostream>
#include <string>
#include <vector>
#include "tcsv/tcsv.h"

struct Employee {
    int32_t     id = 0;
    std::string name;
    double      salary = 0.0;
    bool        remote = false;
};

// Named columns: the header row carries the member names
template<> struct tcsv::RecordTraits<Employee> {
    static constexpr std::string_view name = "Employee";
    static constexpr bool key_as_property_name = true;
    static constexpr auto columns = std::make_tuple(
        column<&Employee::id>("id"),
        column<&Employee::name>("name"),
        column<&Employee::salary>("salary", "annual_salary"),
        column<&Employee::remote>("remote"));
};

// Positional columns: physical column k is the member with index k
struct Measurement {
    double      value = 0.0;
    std::string unit;
    int64_t     timestamp = 0;
};

template<> struct tcsv::RecordTraits<Measurement> {
    static constexpr std::string_view name = "Measurement";
    static constexpr auto columns = std::make_tuple(
        column<&Measurement::value>("value", 1),
        column<&Measurement::unit>("unit", 2),
        column<&Measurement::timestamp>("timestamp", 0));
};

int main() {
    try {
        std::cout << "TCSV Simple Example\n";
        std::cout << "===================\n\n";

        // Register codecs once at start-up; schema problems are printed as TCSVxxx diagnostics
        tcsv::StreamDiagnosticSink sink(std::cerr);
        size_t registered = tcsv::registerRecords<Employee, Measurement>(tcsv::CodecRegistry::global(), sink);
        std::cout << "Registered " << registered << " codecs.\n\n";

        std::vector<Employee> staff = {
            {1, "Alice", 85000.0, true},
            {2, "Bob \"the builder\"", 62000.5, false},
            {3, "Carol, PhD", 99000.0, true},
        };

        std::string text = tcsv::CsvSerializer::serialize<Employee>(staff);
        std::cout << "Employees as CSV:\n" << text << "\n\n";

        // Columns may come in any order, unknown ones are skipped
        const std::string foreign =
            "remote,department,annual_salary,id,name\n"
            "false,R&D,70000,4,Dave\n"
            "true,Sales,55000.25,5,Eve\n";
        for (const auto& e : tcsv::CsvSerializer::deserialize<Employee>(foreign)) {
            std::cout << "id=" << e.id << ", name=\"" << e.name << "\", salary=" << e.salary
                      << ", remote=" << (e.remote ? "yes" : "no") << "\n";
        }
        std::cout << "\n";

        std::vector<Measurement> series = {
            {21.5, "degC", 1700000000},
            {22.25, "degC", 1700000060},
        };
        tcsv::CsvOptions options;
        options.separator = ';';
        options.has_header = false;
        text = tcsv::CsvSerializer::serialize<Measurement>(series, options);
        std::cout << "Measurements (timestamp;value;unit):\n" << text << "\n\n";

        auto back = tcsv::CsvSerializer::deserialize<Measurement>(text, options);
        std::cout << "Read " << back.size() << " measurements back.\n";

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
