/* This file is part of Tessera project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TESSERA_CBOR_HEADER_HPP
#define TESSERA_CBOR_HEADER_HPP

#include <array>
#include <limits>
#include <optional>
#include <tessera/common/bytes.hpp>
#include <tessera/cbor/error.hpp>
#include <tessera/cbor/types.hpp>

namespace tessera::cbor {
    enum class argument_width: uint8_t {
        direct, one, two, four, eight, indefinite, reserved
    };

    // an empty argument stands for the indefinite-length marker
    using argument = std::optional<uint64_t>;

    struct initial_byte {
        major_type type;
        argument_width width;
        uint8_t info;
    };

    constexpr initial_byte decode_initial_byte(const uint8_t b) noexcept
    {
        const auto typ = static_cast<major_type>(b >> 5);
        const uint8_t info = b & 0x1F;
        if (info < 24)
            return { typ, argument_width::direct, info };
        switch (info) {
            case 24: return { typ, argument_width::one, info };
            case 25: return { typ, argument_width::two, info };
            case 26: return { typ, argument_width::four, info };
            case 27: return { typ, argument_width::eight, info };
            case 31: return { typ, argument_width::indefinite, info };
            default: return { typ, argument_width::reserved, info };
        }
    }

    constexpr size_t argument_size(const argument_width w) noexcept
    {
        switch (w) {
            case argument_width::one: return 1;
            case argument_width::two: return 2;
            case argument_width::four: return 4;
            case argument_width::eight: return 8;
            default: return 0;
        }
    }

    constexpr argument_width minimal_width(const uint64_t val) noexcept
    {
        if (val < 24)
            return argument_width::direct;
        if (val <= std::numeric_limits<uint8_t>::max())
            return argument_width::one;
        if (val <= std::numeric_limits<uint16_t>::max())
            return argument_width::two;
        if (val <= std::numeric_limits<uint32_t>::max())
            return argument_width::four;
        return argument_width::eight;
    }

    // follow must contain exactly argument_size(ib.width) bytes
    extern argument read_argument(const initial_byte &ib, buffer follow);

    struct header {
        std::array<uint8_t, 9> bytes {};
        uint8_t size = 0;

        operator buffer() const noexcept
        {
            return { bytes.data(), size };
        }
    };

    // without an explicit width the shortest encoding is used; a wider width is allowed, a narrower one is an error
    extern header encode_header(major_type typ, argument arg, std::optional<argument_width> width={});

    extern double half_to_double(uint16_t half) noexcept;
    // returns a value only when the conversion is exact; NaN maps to the canonical quiet NaN 0x7E00
    extern std::optional<uint16_t> double_to_half(double val) noexcept;
    extern bool fits_float32(double val) noexcept;
}

namespace fmt {
    template<>
    struct formatter<tessera::cbor::argument_width>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using tessera::cbor::argument_width;
            switch (v) {
                case argument_width::direct: return fmt::format_to(ctx.out(), "direct");
                case argument_width::one: return fmt::format_to(ctx.out(), "one_byte");
                case argument_width::two: return fmt::format_to(ctx.out(), "two_bytes");
                case argument_width::four: return fmt::format_to(ctx.out(), "four_bytes");
                case argument_width::eight: return fmt::format_to(ctx.out(), "eight_bytes");
                case argument_width::indefinite: return fmt::format_to(ctx.out(), "indefinite");
                case argument_width::reserved: return fmt::format_to(ctx.out(), "reserved");
                default: return fmt::format_to(ctx.out(), "argument_width: {}", static_cast<int>(v));
            }
        }
    };
}

#endif // !TESSERA_CBOR_HEADER_HPP
