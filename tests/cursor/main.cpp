#include <cstdint>
#include <string>
#include <vector>

#include <CborCursor/cursor.hpp>

#include "../test_helpers.hpp"

using namespace CborCursor;
using TestHelpers::Check;
using TestHelpers::FailsWith;
using TestHelpers::Hex;

namespace {

using ByteCursor = Cursor<std::vector<std::uint8_t>::const_iterator>;

ByteCursor Open(const std::vector<std::uint8_t>& bytes) {
    return ByteCursor(bytes.begin(), bytes.end());
}

void lookahead_tests() {
    const auto bytes = Hex("01 02");
    auto cursor = Open(bytes);
    Check(cursor.has_next().value(), "has first");
    Check(cursor.peek().value() == cursor.peek().value(), "peek does not advance");
    Check(cursor.next().value()->raw_value() == 1, "first");
    Check(cursor.next().value()->raw_value() == 2, "second");
    Check(!cursor.has_next().value(), "exhausted");
    Check(FailsWith(cursor.peek(), CborError::NO_ELEMENT), "peek past end");
    Check(FailsWith(cursor.next(), CborError::NO_ELEMENT), "next past end");
    Check(cursor.getError() == CborError::NO_ERROR, "end of stream is not an error");
}

void typed_reader_tests() {
    const auto bytes = Hex("f5 f6 f7 f8 ff 1a 00 01 00 00 38 63 c1 f9 3c 00 fa 3f c0 00 00 fb 40 09 21 fb 54 44 2d 18");
    auto cursor = Open(bytes);
    Check(cursor.read_boolean().value() == true, "boolean");
    Check(static_cast<bool>(cursor.read_null()), "null");
    Check(static_cast<bool>(cursor.read_undefined()), "undefined");
    Check(cursor.read_simple_value().value() == 255, "simple value");
    Check(cursor.read_integer().value() == 65536, "integer");
    Check(cursor.read_long().value() == -100, "negative long");
    Check(cursor.read_tag().value() == 1, "tag");
    Check(cursor.read_half_float().value() == 0x3C00, "half float bits");
    Check(cursor.read_float().value() == 1.5f, "float");
    Check(cursor.read_double().value() == 3.141592653589793, "double");
    Check(!cursor.has_next().value(), "all consumed");
}

void non_consuming_failure_tests() {
    const auto bytes = Hex("1b 00 00 00 01 00 00 00 00 63 61 62 63");
    auto cursor = Open(bytes);

    // Overflow leaves the event staged
    Check(FailsWith(cursor.read_integer(), CborError::ARITHMETIC_OVERFLOW), "int32 overflow");
    Check(cursor.peek().value()->raw_value() == 4294967296ull, "still staged after overflow");
    Check(cursor.read_big_integer().value().to_string() == "4294967296", "big integer");

    // Type mismatch leaves the event staged
    auto r = cursor.read_boolean();
    Check(FailsWith(r, CborError::INCORRECT_LOGICAL_TYPE), "text is not boolean");
    Check(expects(r.detail(), LogicalType::BOOLEAN), "mismatch lists boolean");
    Check(FailsWith(cursor.read_start_array(), CborError::INCORRECT_LOGICAL_TYPE), "text is not array");
    Check(FailsWith(cursor.read_double(), CborError::INCORRECT_MAJOR_TYPE), "text is not double");
    Check(cursor.peek().value()->logical_type() == LogicalType::TEXT_CHUNK, "text still staged");
    Check(cursor.getError() == CborError::NO_ERROR, "mismatches are not sticky");
    Check(cursor.read_text().value() == "abc", "text");
}

void unsigned_and_negative_tests() {
    const auto bytes = Hex("1b ff ff ff ff ff ff ff ff 3b ff ff ff ff ff ff ff ff 20");
    auto cursor = Open(bytes);
    Check(FailsWith(cursor.read_negative_argument(), CborError::INCORRECT_MAJOR_TYPE), "unsigned is not negative");
    Check(cursor.read_unsigned_long().value() == ~std::uint64_t{0}, "max unsigned");
    Check(FailsWith(cursor.read_long(), CborError::ARITHMETIC_OVERFLOW), "-2^64 overflows");
    Check(cursor.read_negative_argument().value() == ~std::uint64_t{0}, "max negative argument");
    Check(cursor.read_integer().value() == -1, "-1");
}

void container_tests() {
    const auto bytes = Hex("83 9f ff a2 bf ff 99 01 00");
    auto cursor = Open(bytes);
    Check(cursor.read_start_array().value() == 3, "array of three");
    Check(FailsWith(cursor.read_start_array(), CborError::INCORRECT_LOGICAL_TYPE), "indefinite is not definite");
    Check(!cursor.read_array_count().value().has_value(), "indefinite array count");
    Check(static_cast<bool>(cursor.read_break()), "break");
    Check(cursor.read_map_count().value() == std::optional<std::size_t>{2}, "map of two");
    Check(static_cast<bool>(cursor.read_start_indefinite_map()), "indefinite map");
    Check(FailsWith(cursor.read_null(), CborError::INCORRECT_LOGICAL_TYPE), "break is not null");
    Check(static_cast<bool>(cursor.read_break()), "second break");
    Check(cursor.read_start_array().value() == 256, "array of 256");

    const auto more = Hex("9f ff a1 01 02");
    auto c2 = Open(more);
    Check(FailsWith(c2.read_start_map(), CborError::INCORRECT_LOGICAL_TYPE), "array is not a map");
    Check(static_cast<bool>(c2.read_start_indefinite_array()), "indefinite array");
    Check(FailsWith(c2.read_start_indefinite_array(), CborError::INCORRECT_LOGICAL_TYPE), "break is not a start");
    Check(static_cast<bool>(c2.read_break()), "closing break");
    Check(c2.read_start_map().value() == 1, "map of one");
    Check(c2.read_integer().value() == 1 && c2.read_integer().value() == 2, "pair");
    Check(!c2.has_next().value(), "exhausted");
}

void chunk_tests() {
    {
        const auto bytes = Hex("5f 42 01 02 41 03 ff");
        auto cursor = Open(bytes);
        Check(cursor.read_bytes().value() == Bytes{0x01, 0x02, 0x03}, "chunked bytes concatenated");
        Check(!cursor.has_next().value(), "break consumed");
    }
    {
        const auto bytes = Hex("43 01 02 03");
        auto cursor = Open(bytes);
        Check(cursor.read_bytes().value() == Bytes{0x01, 0x02, 0x03}, "definite bytes");
    }
    {
        const auto bytes = Hex("7f 65 73 74 72 65 61 64 6d 69 6e 67 ff");
        auto cursor = Open(bytes);
        Check(cursor.read_text().value() == "streaming", "chunked text");
    }
    {
        // Fold with a custom accumulator: count chunks
        const auto bytes = Hex("5f 41 01 40 41 02 ff");
        auto cursor = Open(bytes);
        auto chunks = cursor.collect_chunks(Major::BYTE_STRING, 0, [](int n, const Bytes&) { return n + 1; });
        Check(chunks.value() == 3, "three chunks");
    }
    {
        const auto bytes = Hex("5f ff");
        auto cursor = Open(bytes);
        Check(cursor.read_bytes().value().empty(), "empty chunked bytes");
    }
    {
        // Foreign event before the break
        const auto bytes = Hex("5f 42 01 02 01 ff");
        auto cursor = Open(bytes);
        auto r = cursor.read_bytes();
        Check(FailsWith(r, CborError::NOT_WELL_FORMED), "integer inside byte chunks");
        Check(cursor.getError() == CborError::NOT_WELL_FORMED, "malformed input is sticky");
        Check(FailsWith(cursor.next(), CborError::NOT_WELL_FORMED), "later calls keep failing");
    }
    {
        // Text chunk inside byte chunks
        const auto bytes = Hex("5f 61 61 ff");
        auto cursor = Open(bytes);
        Check(FailsWith(cursor.read_bytes(), CborError::NOT_WELL_FORMED), "text inside byte chunks");
    }
    {
        // Nested indefinite chunk
        const auto bytes = Hex("7f 7f ff ff");
        auto cursor = Open(bytes);
        Check(FailsWith(cursor.read_text(), CborError::NOT_WELL_FORMED), "nested indefinite text");
    }
    {
        // Stream ends before the break
        const auto bytes = Hex("5f 41 01");
        auto cursor = Open(bytes);
        Check(FailsWith(cursor.read_bytes(), CborError::NOT_WELL_FORMED), "unterminated chunks");
    }
    {
        const auto bytes = Hex("62 c3 28");
        auto cursor = Open(bytes);
        Check(FailsWith(cursor.read_text(), CborError::INVALID_UTF8), "invalid utf-8");
        Check(!cursor.has_next().value(), "invalid text was consumed");
    }
    {
        const auto bytes = Hex("41 00");
        auto cursor = Open(bytes);
        Check(FailsWith(cursor.read_text(), CborError::INCORRECT_MAJOR_TYPE), "bytes are not text");
        Check(cursor.read_bytes().value() == Bytes{0x00}, "bytes still staged");
        Check(FailsWith(cursor.consume_chunks(Major::ARRAY, [](const Bytes&) {}), CborError::INVALID_ARGUMENT),
              "only string majors have chunks");
    }
}

void skip_tests() {
    {
        // {_ "a": [1, [2]], "b": 2(h'00')} then 7
        const auto bytes = Hex("bf 61 61 82 01 81 02 61 62 c2 41 00 ff 07");
        auto cursor = Open(bytes);
        Check(static_cast<bool>(cursor.skip_item()), "skip nested map");
        Check(cursor.read_integer().value() == 7, "after skipped item");
    }
    {
        const auto bytes = Hex("7f 61 61 61 62 ff 01");
        auto cursor = Open(bytes);
        Check(static_cast<bool>(cursor.skip_item()), "skip chunked text");
        Check(cursor.read_integer().value() == 1, "after chunked text");
    }
    {
        const auto bytes = Hex("82 01");
        auto cursor = Open(bytes);
        Check(FailsWith(cursor.skip_item(), CborError::NOT_WELL_FORMED), "truncated array");
    }
    {
        const auto bytes = Hex("ff");
        auto cursor = Open(bytes);
        Check(FailsWith(cursor.skip_item(), CborError::UNEXPECTED_BREAK), "stray break");
    }
    {
        const auto bytes = Hex("bf 01 ff");
        auto cursor = Open(bytes);
        Check(FailsWith(cursor.skip_item(), CborError::UNEXPECTED_BREAK), "break in value position");
    }
    {
        std::vector<std::uint8_t> deep(10, 0x81);
        deep.push_back(0x00);
        Cursor<std::vector<std::uint8_t>::const_iterator, std::vector<std::uint8_t>::const_iterator, 4> cursor(
            deep.cbegin(), deep.cend());
        Check(FailsWith(cursor.skip_item(), CborError::NESTING_DEPTH_EXCEEDED), "nesting ceiling");
    }
    {
        std::vector<std::uint8_t> empty;
        auto cursor = Open(empty);
        Check(FailsWith(cursor.skip_item(), CborError::NO_ELEMENT), "nothing to skip");
    }
}

void malformed_input_tests() {
    const auto bytes = Hex("01 1c 02");
    auto cursor = Open(bytes);
    Check(cursor.read_integer().value() == 1, "before reserved byte");
    auto r = cursor.has_next();
    Check(FailsWith(r, CborError::NOT_WELL_FORMED), "reserved byte");
    Check(r.detail().header_byte == 0x1C, "reserved byte recorded");
    Check(cursor.errorDetail().header_byte == 0x1C, "sticky detail");
    Check(FailsWith(cursor.read_integer(), CborError::NOT_WELL_FORMED), "sticky");

    // Declared length above the chunk cap: header and argument are already gone
    const auto huge = Hex("5b 00 00 00 01 00 00 00 00 01 02");
    auto capped = Open(huge);
    auto first = capped.peek();
    Check(FailsWith(first, CborError::PAYLOAD_TOO_LARGE), "payload above the chunk cap");
    Check(error_category(first.error()) == ErrorCategory::resource_limit, "payload cap category");
    Check(!is_recoverable(first.error()), "payload cap is fatal");
    Check(capped.getError() == CborError::PAYLOAD_TOO_LARGE, "payload cap recorded");
    Check(FailsWith(capped.read_bytes(), CborError::PAYLOAD_TOO_LARGE), "payload cap is sticky");
}

} // namespace

int main() {
    lookahead_tests();
    typed_reader_tests();
    non_consuming_failure_tests();
    unsigned_and_negative_tests();
    container_tests();
    chunk_tests();
    skip_tests();
    malformed_input_tests();
    return TestHelpers::Finish("cursor");
}
