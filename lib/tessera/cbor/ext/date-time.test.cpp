/* This file is part of Tessera project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <tessera/common/test.hpp>
#include <tessera/cbor/ext/date-time.hpp>
#include <tessera/cbor/tree.hpp>

using namespace tessera;
using namespace tessera::cbor;
using namespace tessera::cbor::ext;

namespace {
    registry date_time_registry(const date_time_encode_style style=date_time_encode_style::prefer_text)
    {
        registry reg {};
        reg.add(std::make_shared<date_time_extension>(style));
        return reg;
    }

    value date_time(const int64_t seconds, const uint32_t nanos=0)
    {
        return value { std::make_shared<date_time_value>(seconds, nanos) };
    }
}

suite cbor_ext_date_time_suite = [] {
    "cbor::ext::date_time"_test = [] {
        "from_rfc3339"_test = [] {
            {
                const auto dt = date_time_value::from_rfc3339("2013-03-21T20:04:00Z");
                test_same(dt.seconds(), 1363896240);
                test_same(dt.nanos(), 0);
                test_same(dt.offset_minutes(), 0);
            }
            {
                const auto dt = date_time_value::from_rfc3339("2013-03-21T22:04:00+02:00");
                test_same(dt.seconds(), 1363896240);
                test_same(dt.offset_minutes(), 120);
                expect(dt == date_time_value { 1363896240 });
            }
            {
                const auto dt = date_time_value::from_rfc3339("1969-12-31T23:30:00.123456789-00:30");
                test_same(dt.seconds(), 0);
                test_same(dt.nanos(), 123456789);
                test_same(dt.offset_minutes(), -30);
            }
            test_same(date_time_value::from_rfc3339("1990-12-31t12:34:56.25z").nanos(), 250000000);
            test_same(date_time_value::from_rfc3339("1990-12-31T12:34:56.1234567891Z").nanos(), 123456789);
        };
        "invalid text"_test = [] {
            for (const auto text: { "2013-02-30T00:00:00Z", "2013-13-01T00:00:00Z", "2013-03-21 20:04:00Z", "2013-03-21T24:00:00Z",
                    "2013-03-21T20:04:00", "2013-03-21T20:04:00+2:00", "2013-03-21T20:04:00.Z", "2013-03-21T20:04:00Zjunk",
                    "13-03-21T20:04:00Z", "1399-12-31T23:59:59Z", "" }) {
                expect(throws([&] { date_time_value::from_rfc3339(text); })) << text;
            }
        };
        "to_rfc3339"_test = [] {
            test_same(date_time_value { 662646896 }.to_rfc3339(), std::string { "1990-12-31T12:34:56Z" });
            test_same(date_time_value { 662646896, 500000000 }.to_rfc3339(), std::string { "1990-12-31T12:34:56.5Z" });
            test_same(date_time_value { -1 }.to_rfc3339(), std::string { "1969-12-31T23:59:59Z" });
            test_same(date_time_value { -86400 }.to_rfc3339(), std::string { "1969-12-31T00:00:00Z" });
            test_same(date_time_value { 0, 1 }.to_rfc3339(), std::string { "1970-01-01T00:00:00.000000001Z" });
            test_same(date_time_value::from_rfc3339("2013-03-21T22:04:00+02:00").to_rfc3339(), std::string { "2013-03-21T20:04:00Z" });
        };
        "range"_test = [] {
            expect(throws([] { date_time_value { 0, 1'000'000'000 }; }));
            expect(throws([] { date_time_value { std::numeric_limits<int64_t>::max() }; }));
            expect(throws([] { date_time_value { 0, 0, 24 * 60 }; }));
        };
        "decode text"_test = [] {
            const auto reg = date_time_registry();
            const auto v = parse(uint8_vector::from_hex("C074323031332D30332D32315432303A30343A30305A"), reg);
            test_same(v.ext<date_time_value>().seconds(), 1363896240);
            const auto v2 = parse(uint8_vector::from_hex("C07F74313939302D31322D33315431323A33343A35365AFF"), reg);
            test_same(v2.ext<date_time_value>().seconds(), 662646896);
        };
        "decode numeric"_test = [] {
            const auto reg = date_time_registry();
            test_same(parse(uint8_vector::from_hex("C104"), reg).ext<date_time_value>().seconds(), 4);
            test_same(parse(uint8_vector::from_hex("C120"), reg).ext<date_time_value>().seconds(), -1);
            {
                const auto v = parse(uint8_vector::from_hex("C1FA3FA00000"), reg);
                test_same(v.ext<date_time_value>().seconds(), 1);
                test_same(v.ext<date_time_value>().nanos(), 250000000);
            }
            {
                const auto v = parse(uint8_vector::from_hex("C1F9BE00"), reg);
                test_same(v.ext<date_time_value>().seconds(), -2);
                test_same(v.ext<date_time_value>().nanos(), 500000000);
            }
        };
        "decode failures"_test = [] {
            const auto reg = date_time_registry();
            try {
                parse(uint8_vector::from_hex("C074323031332D30322D33305430303A30303A30305A"), reg);
                expect(false);
            } catch (const extension_decode_failed_error &ex) {
                test_same(ex.tag(), 0);
            }
            expect(throws<extension_decode_failed_error>([&] { parse(uint8_vector::from_hex("C001"), reg); }));
            expect(throws<extension_decode_failed_error>([&] { parse(uint8_vector::from_hex("C16161"), reg); }));
            expect(throws<extension_decode_failed_error>([&] { parse(uint8_vector::from_hex("C1F97C00"), reg); }));
            expect(throws<extension_decode_failed_error>([&] { parse(uint8_vector::from_hex("C11BFFFFFFFFFFFFFFFF"), reg); }));
        };
        "encode text"_test = [] {
            const auto reg = date_time_registry();
            test_same(encode(date_time(662646896), reg), uint8_vector::from_hex("C074313939302D31322D33315431323A33343A35365A"));
            test_same(encode(date_time(662646896, 500000000), reg), uint8_vector::from_hex("C076313939302D31322D33315431323A33343A35362E355A"));
        };
        "encode numeric"_test = [] {
            const auto reg = date_time_registry(date_time_encode_style::prefer_numeric);
            test_same(encode(date_time(4), reg), uint8_vector::from_hex("C104"));
            test_same(encode(date_time(-1), reg), uint8_vector::from_hex("C120"));
            test_same(encode(date_time(1, 250000000), reg), uint8_vector::from_hex("C1F93D00"));
        };
        "round trip"_test = [] {
            for (const auto style: { date_time_encode_style::prefer_text, date_time_encode_style::prefer_numeric }) {
                const auto reg = date_time_registry(style);
                for (const auto &v: { date_time(0), date_time(1363896240), date_time(-662646896), date_time(1363896240, 500000000) }) {
                    test_same(parse(encode(v, reg), reg), v);
                }
            }
        };
        "raw tag 0 without the extension"_test = [] {
            const auto v = parse(uint8_vector::from_hex("C074323031332D30332D32315432303A30343A30305A"));
            test_same(v.tag().id(), 0);
            test_same(v.tag().val().text(), std::string_view { "2013-03-21T20:04:00Z" });
        };
    };
};
