/* This file is part of Tessera project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TESSERA_CBOR_EXT_DATE_TIME_HPP
#define TESSERA_CBOR_EXT_DATE_TIME_HPP

#include <tessera/cbor/registry.hpp>

namespace tessera::cbor::ext {
    /*
     * A point in time with nanosecond precision and the UTC offset it was written with.
     * The supported range is 1400-01-01T00:00:00Z to 9999-12-31T23:59:59.999999999Z.
     * Equality compares instants only; the offset is presentation.
     */
    struct date_time_value: extension_value {
        static date_time_value from_rfc3339(std::string_view text);

        explicit date_time_value(int64_t seconds, uint32_t nanos=0, int16_t offset_minutes=0);

        int64_t seconds() const noexcept
        {
            return _seconds;
        }

        uint32_t nanos() const noexcept
        {
            return _nanos;
        }

        int16_t offset_minutes() const noexcept
        {
            return _offset_minutes;
        }

        // always in UTC with a Z suffix; trailing zeros of the fraction are omitted
        std::string to_rfc3339() const;

        std::string_view type_name() const override
        {
            return "date-time";
        }

        bool operator==(const extension_value &o) const override;
        std::string to_string() const override;
    private:
        int64_t _seconds;
        uint32_t _nanos;
        int16_t _offset_minutes;
    };

    struct date_time_extension: extension {
        explicit date_time_extension(date_time_encode_style style=date_time_encode_style::prefer_text);

        std::string_view name() const override
        {
            return "date-time";
        }

        std::vector<uint64_t> tags() const override
        {
            return { 0, 1 };
        }

        std::optional<value> decode(uint64_t tag, const value &inner) const override;
        std::optional<value> encode(const extension_value &val) const override;
    private:
        date_time_encode_style _style;
    };
}

#endif // !TESSERA_CBOR_EXT_DATE_TIME_HPP
