/* This file is part of Tessera project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <tessera/common/test.hpp>
#include <tessera/cbor/decoder.hpp>

using namespace tessera;
using namespace tessera::cbor;

namespace {
    using event_list = std::vector<std::string>;

    event_list decode_events(const buffer data, const decoder_config &cfg={})
    {
        buffer_source src { data };
        decoder dec { cfg };
        event_list res {};
        while (const auto ev = dec.next(src))
            res.emplace_back(fmt::format("{}", *ev));
        dec.finish(src);
        return res;
    }

    event_list decode_hex(const std::string_view hex, const decoder_config &cfg={})
    {
        return decode_events(uint8_vector::from_hex(hex), cfg);
    }

    template<typename E>
    bool fails_with(const std::string_view hex, const decoder_config &cfg={})
    {
        return throws<E>([&] { decode_hex(hex, cfg); });
    }

    std::string nested_arrays(const size_t depth)
    {
        std::string hex {};
        for (size_t i = 0; i < depth; ++i)
            hex += "9F";
        for (size_t i = 0; i < depth; ++i)
            hex += "FF";
        return hex;
    }
}

suite cbor_decoder_suite = [] {
    "cbor::decoder"_test = [] {
        "integers"_test = [] {
            test_same(decode_hex("00"), event_list { "uint(0)" });
            test_same(decode_hex("17"), event_list { "uint(23)" });
            test_same(decode_hex("1818"), event_list { "uint(24)" });
            test_same(decode_hex("1903E8"), event_list { "uint(1000)" });
            test_same(decode_hex("1B000000E8D4A51000"), event_list { "uint(1000000000000)" });
            test_same(decode_hex("1BFFFFFFFFFFFFFFFF"), event_list { "uint(18446744073709551615)" });
            test_same(decode_hex("20"), event_list { "nint(-1-0)" });
            test_same(decode_hex("3863"), event_list { "nint(-1-99)" });
            test_same(decode_hex("3BFFFFFFFFFFFFFFFF"), event_list { "nint(-1-18446744073709551615)" });
        };
        "non-canonical arguments are accepted"_test = [] {
            test_same(decode_hex("1800"), event_list { "uint(0)" });
            test_same(decode_hex("1B0000000000000001"), event_list { "uint(1)" });
            test_same(decode_hex("99000101"), event_list { "array(1)", "uint(1)" });
        };
        "floats"_test = [] {
            buffer_source src { uint8_vector::from_hex("F93C00") };
            decoder dec {};
            const auto ev = dec.next(src);
            expect(ev && std::holds_alternative<float_event>(*ev));
            test_same(std::get<float_event>(*ev).val, 1.0);
            test_same(decode_hex("F97BFF"), event_list { "float(65504)" });
            test_same(decode_hex("F90001"), event_list { fmt::format("float({})", std::ldexp(1.0, -24)) });
            test_same(decode_hex("FA47C35000"), event_list { "float(100000)" });
            test_same(decode_hex("FB3FF199999999999A"), event_list { "float(1.1)" });
            test_same(decode_hex("F97C00"), event_list { "float(inf)" });
            test_same(decode_hex("F9FC00"), event_list { "float(-inf)" });
            {
                buffer_source nan_src { uint8_vector::from_hex("F97E00") };
                decoder nan_dec {};
                const auto nan_ev = nan_dec.next(nan_src);
                expect(nan_ev && std::isnan(std::get<float_event>(*nan_ev).val));
            }
        };
        "simple values"_test = [] {
            test_same(decode_hex("F4"), event_list { "false" });
            test_same(decode_hex("F5"), event_list { "true" });
            test_same(decode_hex("F6"), event_list { "null" });
            test_same(decode_hex("F7"), event_list { "undefined" });
            test_same(decode_hex("F0"), event_list { "simple(16)" });
            test_same(decode_hex("F8FF"), event_list { "simple(255)" });
            test_same(decode_hex("F820"), event_list { "simple(32)" });
            expect(fails_with<malformed_header_error>("F818"));
            expect(fails_with<malformed_header_error>("F81F"));
        };
        "definite strings are a single final chunk"_test = [] {
            test_same(decode_hex("40"), event_list { "bytes()" });
            test_same(decode_hex("4401020304"), event_list { "bytes(01020304)" });
            test_same(decode_hex("6449455446"), event_list { "text('IETF')" });
            test_same(decode_hex("62C3BC"), event_list { "text('\xC3\xBC')" });
        };
        "indefinite strings"_test = [] {
            test_same(decode_hex("5F42010243030405FF"), event_list { "start_bytes(_)", "bytes(0102, partial)", "bytes(030405, partial)", "break" });
            test_same(decode_hex("7F657374726561646D696E67FF"), event_list { "start_text(_)", "text('strea', partial)", "text('ming', partial)", "break" });
            test_same(decode_hex("5FFF"), event_list { "start_bytes(_)", "break" });
        };
        "chunk of a different major type"_test = [] {
            expect(fails_with<invalid_indefinite_chunk_error>("5F6161FF"));
            expect(fails_with<invalid_indefinite_chunk_error>("7F4161FF"));
            expect(fails_with<invalid_indefinite_chunk_error>("5F01FF"));
            expect(fails_with<invalid_indefinite_chunk_error>("5F5FFFFF"));
            expect(fails_with<invalid_indefinite_chunk_error>("7FC06161FF"));
        };
        "arrays and maps"_test = [] {
            test_same(decode_hex("80"), event_list { "array(0)" });
            test_same(decode_hex("A0"), event_list { "map(0)" });
            test_same(decode_hex("83010203"), event_list { "array(3)", "uint(1)", "uint(2)", "uint(3)" });
            test_same(decode_hex("9F010203FF"), event_list { "array(_)", "uint(1)", "uint(2)", "uint(3)", "break" });
            test_same(decode_hex("A201020304"), event_list { "map(2)", "uint(1)", "uint(2)", "uint(3)", "uint(4)" });
            test_same(decode_hex("BF6346756EF563416D7421FF"),
                event_list { "map(_)", "text('Fun')", "true", "text('Amt')", "nint(-1-1)", "break" });
            test_same(decode_hex("826161BF61626163FF"),
                event_list { "array(2)", "text('a')", "map(_)", "text('b')", "text('c')", "break" });
            test_same(decode_hex("9F018202039F0405FFFF"),
                event_list { "array(_)", "uint(1)", "array(2)", "uint(2)", "uint(3)", "array(_)", "uint(4)", "uint(5)", "break", "break" });
        };
        "break placement"_test = [] {
            expect(fails_with<unpaired_map_break_error>("BF01FF"));
            expect(fails_with<unpaired_map_break_error>("BF010203FF"));
            expect(fails_with<malformed_header_error>("FF"));
            expect(fails_with<malformed_header_error>("8201FF"));
            expect(fails_with<malformed_header_error>("9FC0FF"));
        };
        "a map with fewer entries than declared"_test = [] {
            expect(fails_with<truncated_input_error>("A2010203"));
            expect(fails_with<truncated_input_error>("A201"));
        };
        "reserved headers"_test = [] {
            expect(fails_with<malformed_header_error>("1C"));
            expect(fails_with<malformed_header_error>("1D"));
            expect(fails_with<malformed_header_error>("5E"));
            expect(fails_with<malformed_header_error>("FC"));
            expect(fails_with<malformed_header_error>("1F"));
            expect(fails_with<malformed_header_error>("3F"));
            expect(fails_with<malformed_header_error>("DF"));
        };
        "tags"_test = [] {
            test_same(decode_hex("C074323031332D30332D32315432303A30343A30305A"),
                event_list { "tag(0)", "text('2013-03-21T20:04:00Z')" });
            test_same(decode_hex("DA000F423F01"), event_list { "tag(999999)", "uint(1)" });
            test_same(decode_hex("C1C2C301"), event_list { "tag(1)", "tag(2)", "tag(3)", "uint(1)" });
            expect(fails_with<truncated_input_error>("C1"));
        };
        "truncation by one byte"_test = [] {
            for (const auto hex: { "1818", "1903E8", "1A000F4240", "1B000000E8D4A51000", "3863", "6449455446",
                    "4401020304", "83010203", "A201020304", "9F0102FF", "5F4201024103FF", "F93C00", "FA47C35000",
                    "FB3FF199999999999A", "C11A514B67B0", "F8FF", "BF6346756EF563416D7421FF" }) {
                const auto data = uint8_vector::from_hex(hex);
                const auto truncated = buffer { data.data(), data.size() - 1 };
                expect(throws<truncated_input_error>([&] { decode_events(truncated); })) << hex;
            }
        };
        "invalid utf8"_test = [] {
            expect(fails_with<invalid_utf8_error>("62FFFE"));
            expect(fails_with<invalid_utf8_error>("7F61416180FF"));
            expect(fails_with<invalid_utf8_error>("61C3"));
        };
        "nesting ceiling"_test = [] {
            const decoder_config cfg { .max_nesting_depth = 4 };
            test_same(decode_hex(nested_arrays(4), cfg).size(), 8);
            expect(fails_with<nesting_too_deep_error>(nested_arrays(5), cfg));
            test_same(decode_hex("81818181" "00", cfg).size(), 5);
            expect(fails_with<nesting_too_deep_error>("8181818181" "00", cfg));
            test_same(decode_hex("C1C1C1C101", cfg).size(), 5);
            expect(fails_with<nesting_too_deep_error>("C1C1C1C1C101", cfg));
            test_same(decode_hex("C1C1819F00FF", cfg).size(), 6);
            expect(fails_with<nesting_too_deep_error>("C1C181819F00FF", cfg));
        };
        "indefinite strings at the nesting ceiling"_test = [] {
            const decoder_config cfg { .max_nesting_depth = 1 };
            test_same(decode_hex("8140", cfg).size(), 2);
            test_same(decode_hex("815FFF", cfg).size(), 3);
            test_same(decode_hex("817F6161FF", cfg).size(), 4);
            expect(fails_with<nesting_too_deep_error>("81815FFF", cfg));
            expect(fails_with<nesting_too_deep_error>("81C15FFF", cfg));
            buffer_source src { uint8_vector::from_hex("815F4101FF") };
            decoder dec { cfg };
            dec.next(src);
            test_same(dec.depth(), 1);
            dec.next(src);
            test_same(dec.depth(), 1);
            dec.next(src);
            test_same(dec.depth(), 1);
            dec.next(src);
            test_same(dec.depth(), 0);
            dec.finish(src);
        };
        "default nesting ceiling"_test = [] {
            test_same(decode_hex(nested_arrays(default_max_nesting_depth)).size(), default_max_nesting_depth * 2);
            expect(fails_with<nesting_too_deep_error>(nested_arrays(default_max_nesting_depth + 1)));
        };
        "chunks are views into the source"_test = [] {
            const auto data = uint8_vector::from_hex("824201026161");
            buffer_source src { data };
            decoder dec {};
            expect(std::holds_alternative<start_array>(*dec.next(src)));
            const auto ev = dec.next(src);
            const auto &chunk = std::get<bytes_chunk>(*ev);
            expect(chunk.final);
            expect(chunk.data.data() == data.data() + 2);
            test_same(chunk.data.size(), 2);
            const auto ev2 = dec.next(src);
            test_same(std::get<text_chunk>(*ev2).text(), std::string_view { "a" });
            expect(!dec.next(src));
        };
        "depth and item boundaries"_test = [] {
            buffer_source src { uint8_vector::from_hex("C1829F01FF02") };
            decoder dec {};
            expect(dec.at_item_boundary());
            dec.next(src);
            test_same(dec.depth(), 1);
            expect(!dec.at_item_boundary());
            dec.next(src);
            test_same(dec.depth(), 2);
            dec.next(src);
            test_same(dec.depth(), 3);
            dec.next(src);
            dec.next(src);
            test_same(dec.depth(), 2);
            dec.next(src);
            test_same(dec.depth(), 0);
            expect(dec.at_item_boundary());
            expect(!dec.next(src));
            dec.finish(src);
        };
        "finish"_test = [] {
            {
                buffer_source src { uint8_vector::from_hex("0102") };
                decoder dec {};
                dec.next(src);
                expect(throws<excess_data_error>([&] { dec.finish(src); }));
            }
            {
                buffer_source src { uint8_vector::from_hex("820102") };
                decoder dec {};
                dec.next(src);
                dec.next(src);
                expect(throws<truncated_input_error>([&] { dec.finish(src); }));
            }
        };
        "offset"_test = [] {
            buffer_source src { uint8_vector::from_hex("83190100626162F97C00") };
            decoder dec {};
            test_same(dec.offset(), 0);
            dec.next(src);
            dec.next(src);
            test_same(dec.offset(), 1);
            dec.next(src);
            test_same(dec.offset(), 4);
            dec.next(src);
            test_same(dec.offset(), 7);
            expect(!dec.next(src));
            test_same(dec.offset(), 10);
            buffer_source bad { uint8_vector::from_hex("82011C") };
            decoder bad_dec {};
            expect(throws<malformed_header_error>([&] { while (bad_dec.next(bad)) { } }));
            test_same(bad_dec.offset(), 2);
        };
        "poisoned after an error"_test = [] {
            buffer_source src { uint8_vector::from_hex("1C00") };
            decoder dec {};
            expect(throws<malformed_header_error>([&] { dec.next(src); }));
            expect(dec.failed());
            expect(throws<invalid_event_sequence_error>([&] { dec.next(src); }));
        };
        "resumable over a byte-by-byte feed"_test = [] {
            const auto data = uint8_vector::from_hex("A26161BF61628201C1FB3FF199999999999AFF6163827F6278796161FF5F4101FF");
            const auto expected = decode_events(data);
            feed_source src {};
            decoder dec {};
            event_list res {};
            size_t fed = 0;
            size_t need_more = 0;
            for (;;) {
                const auto step = dec.next_event(src);
                if (step.status == decode_status::end)
                    break;
                if (step.status == decode_status::need_more) {
                    ++need_more;
                    if (fed < data.size())
                        src.feed(buffer { data.data() + fed++, 1 });
                    else
                        src.close();
                    continue;
                }
                res.emplace_back(fmt::format("{}", step.ev));
            }
            dec.finish(src);
            test_same(res, expected);
            expect(need_more >= data.size());
        };
        "need_more leaves no partial input behind"_test = [] {
            feed_source src {};
            decoder dec {};
            src.feed(uint8_vector::from_hex("6449"));
            test_same(dec.next_event(src).status, decode_status::need_more);
            test_same(src.buffered(), 2);
            src.feed(uint8_vector::from_hex("455446"));
            const auto step = dec.next_event(src);
            test_same(step.status, decode_status::event);
            test_same(std::get<text_chunk>(step.ev).text(), std::string_view { "IETF" });
            test_same(dec.next_event(src).status, decode_status::need_more);
            src.close();
            test_same(dec.next_event(src).status, decode_status::end);
        };
        "a closed feed inside an item is truncated input"_test = [] {
            feed_source src {};
            decoder dec {};
            src.feed(uint8_vector::from_hex("8201"));
            src.close();
            test_same(dec.next_event(src).status, decode_status::event);
            test_same(dec.next_event(src).status, decode_status::event);
            expect(throws<truncated_input_error>([&] { dec.next_event(src); }));
        };
    };
};
