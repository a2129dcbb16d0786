// Basic CborCursor usage example
// Compile: g++ -std=c++23 -I../include basic_usage.cpp -o basic_usage

#include <CborCursor/cursor.hpp>
#include <CborCursor/diagnostic.hpp>
#include <CborCursor/error_formatting.hpp>
#include <CborCursor/event_writer.hpp>
#include <CborCursor/generator.hpp>
#include <cstdint>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

using namespace CborCursor;

int main() {
    // {"app": "MyApp", "version": 1, "ports": [8080, 8443], "ratio": 0.5}
    std::vector<std::uint8_t> buffer;
    EventWriter writer(std::back_inserter(buffer));
    Generator gen(writer);

    gen.write_start_map(4);
    gen.write_text("app");
    gen.write_text("MyApp");
    gen.write_text("version");
    gen.write_integer(1);
    gen.write_text("ports");
    gen.write_start_indefinite_array();
    gen.write_integer(8080);
    gen.write_integer(8443);
    gen.write_break();
    gen.write_text("ratio");
    gen.write_double(0.5);

    if (gen.getError() != CborError::NO_ERROR) {
        std::cout << "Encode error: " << error_to_string(gen.getError()) << std::endl;
        return 1;
    }
    std::cout << "Encoded " << writer.bytesWritten() << " bytes" << std::endl;

    auto diag = RenderDiagnostic(std::span<const std::uint8_t>(buffer));
    if (!diag) {
        std::cout << "Render error: " << ErrorToString(diag.detail()) << std::endl;
        return 1;
    }
    std::cout << "Diagnostic: " << diag.value() << std::endl;

    Cursor cursor(buffer.cbegin(), buffer.cend());
    auto pairs = cursor.read_start_map();
    if (!pairs) {
        std::cout << "Read error: " << ErrorToString(pairs.detail()) << std::endl;
        return 1;
    }
    for (std::size_t i = 0; i < pairs.value(); ++i) {
        auto key = cursor.read_text();
        if (!key) {
            std::cout << "Read error: " << ErrorToString(key.detail()) << std::endl;
            return 1;
        }
        if (key.value() == "version") {
            auto version = cursor.read_integer();
            if (!version) {
                std::cout << "Read error: " << ErrorToString(version.detail()) << std::endl;
                return 1;
            }
            std::cout << "Version: " << version.value() << std::endl;
        } else {
            // A string where an integer is expected is reported without consuming it
            auto wrong = cursor.read_integer();
            if (!wrong) {
                std::cout << key.value() << ": " << ErrorToString(wrong.detail()) << std::endl;
            }
            if (auto skipped = cursor.skip_item(); !skipped) {
                std::cout << "Skip error: " << ErrorToString(skipped.detail()) << std::endl;
                return 1;
            }
        }
    }
    return 0;
}
