#include <array>
#include <cstdint>
#include <iterator>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

#include <CborCursor/cursor.hpp>
#include <CborCursor/event_sequence.hpp>
#include <CborCursor/event_writer.hpp>
#include <CborCursor/generator.hpp>
#include <CborCursor/transcode.hpp>

#include "../test_helpers.hpp"

using namespace CborCursor;
using TestHelpers::Check;
using TestHelpers::CheckCase;
using TestHelpers::Encode;
using TestHelpers::FailsWith;
using TestHelpers::Hex;
using TestHelpers::ToHex;

namespace {

struct CanonicalCase {
    std::int64_t value;
    std::string_view expected_hex;
};

void canonical_integer_tests() {
    const CanonicalCase cases[] = {
        {0, "00"},
        {23, "17"},
        {24, "1818"},
        {255, "18ff"},
        {256, "190100"},
        {65535, "19ffff"},
        {65536, "1a00010000"},
        {4294967295ll, "1affffffff"},
        {4294967296ll, "1b0000000100000000"},
        {-1, "20"},
        {-24, "37"},
        {-25, "3818"},
        {-256, "38ff"},
        {-257, "390100"},
        {-4294967296ll, "3affffffff"},
        {-4294967297ll, "3b0000000100000000"},
        {std::numeric_limits<std::int64_t>::min(), "3b7fffffffffffffff"},
        {std::numeric_limits<std::int64_t>::max(), "1b7fffffffffffffff"},
    };
    for (const auto& c : cases) {
        std::vector<std::uint8_t> out;
        EventWriter writer(std::back_inserter(out));
        Generator gen(writer);
        CheckCase(gen.write_integer(c.value), c, "write_integer");
        CheckCase(ToHex(out) == c.expected_hex, c, "canonical encoding");
    }
}

// Every constructible event survives encode -> decode unchanged
void roundtrip_tests() {
    std::vector<Event> events = {
        DataEvent::of_boolean(false),
        DataEvent::of_boolean(true),
        DataEvent::of_null(),
        DataEvent::of_undefined(),
        DataEvent::of_break(),
        DataEvent::of_simple_value(0).value(),
        DataEvent::of_simple_value(19).value(),
        DataEvent::of_simple_value(32).value(),
        DataEvent::of_simple_value(255).value(),
        DataEvent::of_unsigned(~std::uint64_t{0}),
        DataEvent::of_negative_argument(~std::uint64_t{0}),
        DataEvent::of_bytes(Bytes{}),
        DataEvent::of_bytes(Bytes::from_utf8(std::string(300, 'x'))),
        DataEvent::of_text("\xe6\xb0\xb4"),
        DataEvent::of_tag(0),
        DataEvent::of_tag(55799),
        DataEvent::start_array(0),
        DataEvent::start_array(70000),
        DataEvent::start_map(24),
        DataEvent::of_half_float_bits(0x3E00),
        DataEvent::half_nan(),
        DataEvent::half_infinity(),
        DataEvent::half_negative_infinity(),
        DataEvent::of_float(100000.0f),
        DataEvent::of_double(-4.1),
        DataEvent::start_indefinite_bytes(),
        DataEvent::start_indefinite_text(),
        DataEvent::start_indefinite_array(),
        DataEvent::start_indefinite_map(),
    };
    for (std::uint64_t v : {0ull, 23ull, 24ull, 255ull, 256ull, 65535ull, 65536ull, 4294967295ull, 4294967296ull}) {
        events.push_back(DataEvent::of_unsigned(v));
        events.push_back(DataEvent::of_negative_argument(v));
        events.push_back(DataEvent::of_tag(v));
        events.push_back(DataEvent::start_array(v));
        events.push_back(DataEvent::start_map(v));
    }
    // Non-canonical widths round trip too
    events.push_back(DataEvent::from_parts(*Header::from_byte(0x1B), 1, std::nullopt).value());
    events.push_back(DataEvent::from_parts(*Header::from_byte(0x59), 2, Bytes{0xAA, 0xBB}).value());

    std::vector<std::uint8_t> out;
    EventWriter writer(std::back_inserter(out));
    for (const auto& e : events) {
        Check(writer.next(e), "encode");
    }
    Check(writer.bytesWritten() == out.size(), "bytes written counter");

    Cursor cursor(out.cbegin(), out.cend());
    for (const auto& expected : events) {
        auto decoded = cursor.next();
        Check(decoded && *decoded.value() == *expected, "decoded event equals the written one");
        if (decoded && expected->header().format() == AdditionalInfoFormat::IMMEDIATE && !expected->payload()) {
            Check(decoded.value() == expected, "immediate events decode to the shared instance");
        }
    }
    Check(!cursor.has_next().value(), "nothing left");
}

void convenience_writer_tests() {
    std::vector<std::uint8_t> out;
    EventWriter writer(std::back_inserter(out));
    Generator gen(writer);

    gen.write_start_indefinite_map();
    gen.write_text("Fun");
    gen.write_boolean(true);
    gen.write_text("Amt");
    gen.write_integer(-2);
    gen.write_break();
    Check(ToHex(out) == "bf6346756ef563416d7421ff", "indefinite map");

    out.clear();
    const std::vector<Bytes> chunks = {Bytes{0x01, 0x02}, Bytes{0x03, 0x04, 0x05}};
    Check(gen.write_bytes(chunks), "chunked bytes");
    Check(ToHex(out) == "5f42010243030405ff", "chunked bytes encoding");

    out.clear();
    const std::array<std::string_view, 2> parts = {"strea", "ming"};
    Check(gen.write_text_stream(parts), "text stream");
    Check(ToHex(out) == "7f657374726561646d696e67ff", "text stream encoding");

    out.clear();
    gen.write_tag(1);
    gen.write_unsigned_long(1363896240);
    gen.write_null();
    gen.write_undefined();
    gen.write_negative_argument(0);
    gen.write_big_integer(BigInteger::from_negative_argument(255));
    gen.write_half_float(0x3C00);
    gen.write_float(1.5f);
    gen.write_double(1.1);
    gen.write_start_array(2);
    gen.write_start_map(1);
    gen.write_bytes(Bytes{0xFF});
    Check(gen.write_simple_value(16), "simple 16");
    Check(ToHex(out) == "c11a514b67b0f6f72038fff93c00fa3fc00000fb3ff199999999999a82a141fff0",
          "mixed encoding");
    Check(gen.getError() == CborError::NO_ERROR, "no error");

    Check(!gen.write_simple_value(24), "reserved simple value");
    Check(gen.getError() == CborError::INVALID_ARGUMENT, "reserved simple value error");
}

void bounded_sink_tests() {
    std::array<std::uint8_t, 4> buf{};
    EventWriter writer(buf.begin(), buf.end());
    Generator gen(writer);
    Check(gen.write_integer(1000), "fits");
    Check(!gen.write_integer(1000), "does not fit");
    Check(gen.getError() == CborError::SINK_ERROR, "sink error");
    Check(writer.bytesWritten() == 3, "only complete events are counted");
    Check(!gen.write_null(), "sink stays failed");
}

void event_sequence_tests() {
    EventSequence sequence;
    Generator gen(sequence);
    gen.write_start_array(2);
    gen.write_integer(1);
    gen.write_text("a");
    Check(sequence.size() == 3, "three events recorded");
    Check(sequence.next().value() == DataEvent::start_array(2), "replay reuses singleton");
    Check(sequence.next().value()->raw_value() == 1, "replay second");
    Check(sequence.peek().value()->as_text().value() == "a", "replay third");
    Check(static_cast<bool>(sequence.next()), "consume third");
    Check(!sequence.has_next().value(), "replay exhausted");
    Check(FailsWith(sequence.next(), CborError::NO_ELEMENT), "replay past end");
    sequence.rewind();
    Check(sequence.has_next().value(), "rewound");

    Check(!sequence.next(Event{}), "null event rejected");
    Check(sequence.getError() == CborError::INVALID_ARGUMENT, "null event error");
}

void transcode_tests() {
    {
        // Copy the first item only: [1, {_ "a": 2(h'00')}, (_ "x")] then 5
        const auto bytes = Hex("83 01 bf 61 61 c2 41 00 ff 7f 61 78 ff 05");
        Cursor cursor(bytes.cbegin(), bytes.cend());
        std::vector<std::uint8_t> out;
        EventWriter writer(std::back_inserter(out));
        Generator gen(writer);
        Check(static_cast<bool>(CopyItem(cursor, gen)), "copy item");
        Check(ToHex(out) == "8301bf6161c24100ff7f6178ff", "copied bytes");
        Check(cursor.read_integer().value() == 5, "source positioned after item");
    }
    {
        const auto bytes = Hex("82 01");
        Cursor cursor(bytes.cbegin(), bytes.cend());
        EventSequence sink;
        Generator gen(sink);
        Check(FailsWith(CopyItem(cursor, gen), CborError::NOT_WELL_FORMED), "truncated item");
    }
    {
        const auto bytes = Hex("ff");
        Cursor cursor(bytes.cbegin(), bytes.cend());
        EventSequence sink;
        Generator gen(sink);
        Check(FailsWith(CopyItem(cursor, gen), CborError::UNEXPECTED_BREAK), "stray break");
    }
    {
        const auto bytes = Hex("5f 01 ff");
        Cursor cursor(bytes.cbegin(), bytes.cend());
        EventSequence sink;
        Generator gen(sink);
        Check(FailsWith(CopyItem(cursor, gen), CborError::NOT_WELL_FORMED), "integer inside chunks");
    }
    {
        // CopyAll forwards events without checking structure
        const auto bytes = Hex("ff 01 9f");
        Cursor cursor(bytes.cbegin(), bytes.cend());
        EventSequence sink;
        Check(static_cast<bool>(CopyAll(cursor, sink)), "copy all");
        Check(sink.size() == 3, "all events copied");
        Check(sink.events().front() == DataEvent::of_break(), "break copied");
    }
    {
        EventSequence source(std::vector<Event>{DataEvent::of_integer(-1000), DataEvent::of_text("z")});
        std::vector<std::uint8_t> out;
        EventWriter writer(std::back_inserter(out));
        Check(static_cast<bool>(CopyAll(source, writer)), "replay into writer");
        Check(ToHex(out) == "3903e7617a", "replayed bytes");
    }
}

} // namespace

int main() {
    canonical_integer_tests();
    roundtrip_tests();
    convenience_writer_tests();
    bounded_sink_tests();
    event_sequence_tests();
    transcode_tests();
    return TestHelpers::Finish("generator");
}
