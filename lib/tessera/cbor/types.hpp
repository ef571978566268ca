/* This file is part of Tessera project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TESSERA_CBOR_TYPES_HPP
#define TESSERA_CBOR_TYPES_HPP

#include <cstdint>
#include <tessera/common/format.hpp>

namespace tessera::cbor {
    enum class major_type: uint8_t {
        uint = 0,
        nint = 1,
        bytes = 2,
        text = 3,
        array = 4,
        map = 5,
        tag = 6,
        simple = 7
    };

    enum class special_val: uint8_t {
        s_false = 20,
        s_true = 21,
        s_null = 22,
        s_undefined = 23,
        one_byte = 24,
        two_bytes = 25,
        four_bytes = 26,
        eight_bytes = 27,
        s_break = 31
    };

    static constexpr size_t default_max_nesting_depth = 512;
    static constexpr size_t default_max_tree_depth = 512;

    enum class date_time_encode_style: uint8_t {
        prefer_text, // tag 0
        prefer_numeric // tag 1
    };

    enum class bignum_decode_style: uint8_t {
        convert, // fitting values become plain integers, others stay generic tags
        force_convert, // values that do not fit 64 bits are an error
        num // always a bignum extension value
    };
}

namespace fmt {
    template<>
    struct formatter<tessera::cbor::special_val>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using tessera::cbor::special_val;
            switch (v) {
                case special_val::s_false: return fmt::format_to(ctx.out(), "false");
                case special_val::s_true: return fmt::format_to(ctx.out(), "true");
                case special_val::s_null: return fmt::format_to(ctx.out(), "null");
                case special_val::s_undefined: return fmt::format_to(ctx.out(), "undefined");
                case special_val::one_byte: return fmt::format_to(ctx.out(), "one_byte");
                case special_val::two_bytes: return fmt::format_to(ctx.out(), "two_bytes");
                case special_val::four_bytes: return fmt::format_to(ctx.out(), "four_bytes");
                case special_val::eight_bytes: return fmt::format_to(ctx.out(), "eight_bytes");
                case special_val::s_break: return fmt::format_to(ctx.out(), "break");
                default: return fmt::format_to(ctx.out(), "special_value: {}", static_cast<int>(v));
            }
        }
    };

    template<>
    struct formatter<tessera::cbor::date_time_encode_style>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using tessera::cbor::date_time_encode_style;
            switch (v) {
                case date_time_encode_style::prefer_text: return fmt::format_to(ctx.out(), "prefer_text");
                case date_time_encode_style::prefer_numeric: return fmt::format_to(ctx.out(), "prefer_numeric");
                default: return fmt::format_to(ctx.out(), "date_time_encode_style: {}", static_cast<int>(v));
            }
        }
    };

    template<>
    struct formatter<tessera::cbor::bignum_decode_style>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using tessera::cbor::bignum_decode_style;
            switch (v) {
                case bignum_decode_style::convert: return fmt::format_to(ctx.out(), "convert");
                case bignum_decode_style::force_convert: return fmt::format_to(ctx.out(), "force_convert");
                case bignum_decode_style::num: return fmt::format_to(ctx.out(), "num");
                default: return fmt::format_to(ctx.out(), "bignum_decode_style: {}", static_cast<int>(v));
            }
        }
    };

    template<>
    struct formatter<tessera::cbor::major_type>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using tessera::cbor::major_type;
            switch (v) {
                case major_type::uint: return fmt::format_to(ctx.out(), "uint");
                case major_type::nint: return fmt::format_to(ctx.out(), "nint");
                case major_type::bytes: return fmt::format_to(ctx.out(), "bytes");
                case major_type::text: return fmt::format_to(ctx.out(), "text");
                case major_type::array: return fmt::format_to(ctx.out(), "array");
                case major_type::map: return fmt::format_to(ctx.out(), "map");
                case major_type::tag: return fmt::format_to(ctx.out(), "tag");
                case major_type::simple: return fmt::format_to(ctx.out(), "simple");
                default: return fmt::format_to(ctx.out(), "major_type: {}", static_cast<int>(v));
            }
        }
    };
}

#endif // !TESSERA_CBOR_TYPES_HPP
