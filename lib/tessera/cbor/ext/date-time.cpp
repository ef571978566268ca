/* This file is part of Tessera project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cmath>
#include <boost/date_time/gregorian/gregorian.hpp>
#include <tessera/cbor/event.hpp>
#include <tessera/cbor/ext/date-time.hpp>

namespace tessera::cbor::ext {
    namespace {
        static constexpr int64_t seconds_per_day = 86400;

        const boost::gregorian::date &epoch()
        {
            static const boost::gregorian::date d { 1970, 1, 1 };
            return d;
        }

        int64_t days_since_epoch(const boost::gregorian::date &d)
        {
            return (d - epoch()).days();
        }

        int64_t min_seconds()
        {
            static const int64_t s = days_since_epoch(boost::gregorian::date { 1400, 1, 1 }) * seconds_per_day;
            return s;
        }

        int64_t max_seconds()
        {
            static const int64_t s = days_since_epoch(boost::gregorian::date { 9999, 12, 31 }) * seconds_per_day + seconds_per_day - 1;
            return s;
        }

        struct rfc3339_parser {
            std::string_view text;
            size_t pos = 0;

            int digits(const size_t num)
            {
                if (pos + num > text.size()) [[unlikely]]
                    throw tessera::error(fmt::format("a truncated RFC 3339 date-time: '{}'", text));
                int val = 0;
                for (size_t i = 0; i < num; ++i) {
                    const char k = text[pos + i];
                    if (k < '0' || k > '9') [[unlikely]]
                        throw tessera::error(fmt::format("expected a digit at position {} of RFC 3339 date-time '{}'", pos + i, text));
                    val = val * 10 + (k - '0');
                }
                pos += num;
                return val;
            }

            void consume(const std::string_view allowed)
            {
                if (pos >= text.size() || allowed.find(text[pos]) == allowed.npos) [[unlikely]]
                    throw tessera::error(fmt::format("expected one of '{}' at position {} of RFC 3339 date-time '{}'", allowed, pos, text));
                ++pos;
            }

            bool at(const char k) const noexcept
            {
                return pos < text.size() && text[pos] == k;
            }

            bool at_digit() const noexcept
            {
                return pos < text.size() && text[pos] >= '0' && text[pos] <= '9';
            }
        };
    }

    date_time_value date_time_value::from_rfc3339(const std::string_view text)
    {
        rfc3339_parser p { text };
        const auto year = p.digits(4);
        p.consume("-");
        const auto month = p.digits(2);
        p.consume("-");
        const auto day = p.digits(2);
        p.consume("Tt");
        const auto hour = p.digits(2);
        p.consume(":");
        const auto minute = p.digits(2);
        p.consume(":");
        const auto second = p.digits(2);
        uint32_t nanos = 0;
        if (p.at('.')) {
            ++p.pos;
            size_t num_digits = 0;
            for (; p.at_digit(); ++p.pos, ++num_digits) {
                if (num_digits < 9)
                    nanos = nanos * 10 + static_cast<uint32_t>(text[p.pos] - '0');
            }
            if (!num_digits) [[unlikely]]
                throw tessera::error(fmt::format("an empty fraction of a second in RFC 3339 date-time '{}'", text));
            for (size_t i = num_digits; i < 9; ++i)
                nanos *= 10;
        }
        int offset = 0;
        if (p.at('Z') || p.at('z')) {
            ++p.pos;
        } else {
            const bool negative = p.at('-');
            p.consume("+-");
            const auto off_hour = p.digits(2);
            p.consume(":");
            const auto off_minute = p.digits(2);
            if (off_hour > 23 || off_minute > 59) [[unlikely]]
                throw tessera::error(fmt::format("an invalid UTC offset in RFC 3339 date-time '{}'", text));
            offset = (off_hour * 60 + off_minute) * (negative ? -1 : 1);
        }
        if (p.pos != text.size()) [[unlikely]]
            throw tessera::error(fmt::format("unexpected characters at position {} of RFC 3339 date-time '{}'", p.pos, text));
        if (hour > 23 || minute > 59 || second > 60) [[unlikely]]
            throw tessera::error(fmt::format("an invalid time of day in RFC 3339 date-time '{}'", text));
        const boost::gregorian::date d { static_cast<unsigned short>(year), static_cast<unsigned short>(month), static_cast<unsigned short>(day) };
        const auto seconds = days_since_epoch(d) * seconds_per_day + hour * 3600 + minute * 60 + second - offset * 60;
        return date_time_value { seconds, nanos, static_cast<int16_t>(offset) };
    }

    date_time_value::date_time_value(const int64_t seconds, const uint32_t nanos, const int16_t offset_minutes):
        _seconds { seconds }, _nanos { nanos }, _offset_minutes { offset_minutes }
    {
        if (_nanos >= 1'000'000'000U) [[unlikely]]
            throw tessera::error(fmt::format("nanoseconds must be less than one second but got {}", _nanos));
        if (_seconds < min_seconds() || _seconds > max_seconds()) [[unlikely]]
            throw tessera::error(fmt::format("{} seconds since the epoch are outside of the supported date-time range", _seconds));
        if (_offset_minutes <= -24 * 60 || _offset_minutes >= 24 * 60) [[unlikely]]
            throw tessera::error(fmt::format("an invalid UTC offset of {} minutes", _offset_minutes));
    }

    std::string date_time_value::to_rfc3339() const
    {
        const auto days = _seconds >= 0 ? _seconds / seconds_per_day : -((-_seconds + seconds_per_day - 1) / seconds_per_day);
        const auto day_secs = _seconds - days * seconds_per_day;
        const auto d = epoch() + boost::gregorian::days { static_cast<long>(days) };
        auto res = fmt::format("{}T{:02}:{:02}:{:02}", boost::gregorian::to_iso_extended_string(d),
            day_secs / 3600, day_secs % 3600 / 60, day_secs % 60);
        if (_nanos) {
            auto frac = fmt::format("{:09}", _nanos);
            while (frac.back() == '0')
                frac.pop_back();
            res += '.';
            res += frac;
        }
        res += 'Z';
        return res;
    }

    bool date_time_value::operator==(const extension_value &o) const
    {
        const auto *dt = dynamic_cast<const date_time_value *>(&o);
        return dt && dt->_seconds == _seconds && dt->_nanos == _nanos;
    }

    std::string date_time_value::to_string() const
    {
        return fmt::format("date_time({})", to_rfc3339());
    }

    date_time_extension::date_time_extension(const date_time_encode_style style): _style { style }
    {
    }

    std::optional<value> date_time_extension::decode(const uint64_t tag, const value &inner) const
    {
        switch (tag) {
            case 0:
                return value { std::make_shared<date_time_value>(date_time_value::from_rfc3339(inner.text())) };
            case 1:
                switch (inner.type()) {
                    case value_type::uint: {
                        const auto secs = inner.uint();
                        if (secs > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) [[unlikely]]
                            throw tessera::error(fmt::format("epoch time {} is out of range", secs));
                        return value { std::make_shared<date_time_value>(static_cast<int64_t>(secs)) };
                    }
                    case value_type::nint: {
                        const auto secs = interpret_signed_checked(inner.nint());
                        if (!secs) [[unlikely]]
                            throw tessera::error(fmt::format("epoch time -1-{} is out of range", inner.nint()));
                        return value { std::make_shared<date_time_value>(*secs) };
                    }
                    case value_type::float64: {
                        const auto secs = inner.float64();
                        if (!std::isfinite(secs) || std::fabs(secs) > 1e15) [[unlikely]]
                            throw tessera::error(fmt::format("epoch time {} is out of range", secs));
                        const auto whole = std::floor(secs);
                        auto int_secs = static_cast<int64_t>(whole);
                        auto nanos = std::llround((secs - whole) * 1e9);
                        if (nanos >= 1'000'000'000) {
                            ++int_secs;
                            nanos -= 1'000'000'000;
                        }
                        return value { std::make_shared<date_time_value>(int_secs, static_cast<uint32_t>(nanos)) };
                    }
                    default:
                        throw tessera::error(fmt::format("an epoch-based date-time requires a number but got {}", inner.type_name()));
                }
            default:
                return {};
        }
    }

    std::optional<value> date_time_extension::encode(const extension_value &val) const
    {
        const auto *dt = dynamic_cast<const date_time_value *>(&val);
        if (!dt)
            return {};
        if (_style == date_time_encode_style::prefer_text)
            return value { tagged_value { 0, value { dt->to_rfc3339() } } };
        if (!dt->nanos())
            return value { tagged_value { 1, value::from_int(dt->seconds()) } };
        return value { tagged_value { 1, value { static_cast<double>(dt->seconds()) + static_cast<double>(dt->nanos()) / 1e9 } } };
    }
}
