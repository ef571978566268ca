/* This file is part of Tessera project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cmath>
#include <tessera/common/test.hpp>
#include <tessera/cbor/header.hpp>

using namespace tessera;
using namespace tessera::cbor;

namespace {
    uint8_vector header_bytes(const major_type typ, const argument arg, const std::optional<argument_width> w={})
    {
        return uint8_vector { static_cast<buffer>(encode_header(typ, arg, w)) };
    }
}

suite cbor_header_suite = [] {
    "cbor::header"_test = [] {
        "decode_initial_byte"_test = [] {
            {
                const auto ib = decode_initial_byte(0x17);
                expect(ib.type == major_type::uint);
                expect(ib.width == argument_width::direct);
                test_same(ib.info, 23);
            }
            expect(decode_initial_byte(0x38).width == argument_width::one);
            expect(decode_initial_byte(0x59).width == argument_width::two);
            expect(decode_initial_byte(0x9A).width == argument_width::four);
            expect(decode_initial_byte(0xBB).width == argument_width::eight);
            expect(decode_initial_byte(0x5F).width == argument_width::indefinite);
            expect(decode_initial_byte(0x1C).width == argument_width::reserved);
            expect(decode_initial_byte(0xFE).width == argument_width::reserved);
            expect(decode_initial_byte(0xC0).type == major_type::tag);
            expect(decode_initial_byte(0xF6).type == major_type::simple);
        };
        "read_argument"_test = [] {
            test_same(*read_argument(decode_initial_byte(0x05), {}), 5);
            test_same(*read_argument(decode_initial_byte(0x18), uint8_vector::from_hex("FF")), 0xFF);
            test_same(*read_argument(decode_initial_byte(0x19), uint8_vector::from_hex("0102")), 0x0102);
            test_same(*read_argument(decode_initial_byte(0x1A), uint8_vector::from_hex("01020304")), 0x01020304);
            test_same(*read_argument(decode_initial_byte(0x1B), uint8_vector::from_hex("0102030405060708")), 0x0102030405060708ULL);
            expect(!read_argument(decode_initial_byte(0x9F), {}));
            expect(throws<malformed_header_error>([] { read_argument(decode_initial_byte(0x1F), {}); }));
            expect(throws<malformed_header_error>([] { read_argument(decode_initial_byte(0x3F), {}); }));
            expect(throws<malformed_header_error>([] { read_argument(decode_initial_byte(0xDF), {}); }));
            expect(throws<malformed_header_error>([] { read_argument(decode_initial_byte(0x1C), {}); }));
            expect(throws<malformed_header_error>([] { read_argument(decode_initial_byte(0x5D), {}); }));
        };
        "minimal width"_test = [] {
            test_same(header_bytes(major_type::uint, 0).size(), 1);
            test_same(header_bytes(major_type::uint, 23).size(), 1);
            test_same(header_bytes(major_type::uint, 24).size(), 2);
            test_same(header_bytes(major_type::uint, 255).size(), 2);
            test_same(header_bytes(major_type::uint, 256).size(), 3);
            test_same(header_bytes(major_type::uint, 65535).size(), 3);
            test_same(header_bytes(major_type::uint, 65536).size(), 5);
            test_same(header_bytes(major_type::uint, 4294967295ULL).size(), 5);
            test_same(header_bytes(major_type::uint, 4294967296ULL).size(), 9);
            test_same(header_bytes(major_type::nint, 9), uint8_vector::from_hex("29"));
            test_same(header_bytes(major_type::array, 1000), uint8_vector::from_hex("9903E8"));
            test_same(header_bytes(major_type::tag, 0xFFFFFFFFFFULL), uint8_vector::from_hex("DB000000FFFFFFFFFF"));
            test_same(header_bytes(major_type::map, {}), uint8_vector::from_hex("BF"));
        };
        "explicit width"_test = [] {
            test_same(header_bytes(major_type::uint, 1, argument_width::eight), uint8_vector::from_hex("1B0000000000000001"));
            test_same(header_bytes(major_type::text, 3, argument_width::one), uint8_vector::from_hex("7803"));
            expect(throws<invalid_event_sequence_error>([] { encode_header(major_type::uint, 0x100, argument_width::one); }));
            expect(throws<invalid_event_sequence_error>([] { encode_header(major_type::uint, {}); }));
            expect(throws<invalid_event_sequence_error>([] { encode_header(major_type::tag, {}); }));
        };
        "non-minimal arguments decode"_test = [] {
            const auto ib = decode_initial_byte(0x1B);
            test_same(*read_argument(ib, uint8_vector::from_hex("0000000000000001")), 1);
        };
        "half"_test = [] {
            test_same(half_to_double(0x0000), 0.0);
            test_same(half_to_double(0x3C00), 1.0);
            test_same(half_to_double(0x3E00), 1.5);
            test_same(half_to_double(0x7BFF), 65504.0);
            test_same(half_to_double(0x0001), 5.960464477539063e-8);
            test_same(half_to_double(0x0400), 0.00006103515625);
            test_same(half_to_double(0xC400), -4.0);
            expect(std::isinf(half_to_double(0x7C00)) && half_to_double(0x7C00) > 0);
            expect(std::isinf(half_to_double(0xFC00)) && half_to_double(0xFC00) < 0);
            expect(std::isnan(half_to_double(0x7E00)));
            expect(std::signbit(half_to_double(0x8000)));
        };
        "double_to_half"_test = [] {
            test_same(*double_to_half(0.0), 0x0000);
            test_same(*double_to_half(-0.0), 0x8000);
            test_same(*double_to_half(1.0), 0x3C00);
            test_same(*double_to_half(1.5), 0x3E00);
            test_same(*double_to_half(65504.0), 0x7BFF);
            test_same(*double_to_half(5.960464477539063e-8), 0x0001);
            test_same(*double_to_half(-4.0), 0xC400);
            test_same(*double_to_half(std::numeric_limits<double>::infinity()), 0x7C00);
            test_same(*double_to_half(std::nan("")), 0x7E00);
            expect(!double_to_half(100000.0));
            expect(!double_to_half(1.1));
            expect(!double_to_half(65505.0));
            expect(!double_to_half(1e-10));
        };
        "fits_float32"_test = [] {
            expect(fits_float32(100000.0));
            expect(fits_float32(3.4028234663852886e+38));
            expect(!fits_float32(1.1));
            expect(!fits_float32(1.0e+300));
        };
    };
};
