/* This file is part of Tessera project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cmath>
#include <limits>
#include <tessera/cbor/header.hpp>

namespace tessera::cbor {
    argument read_argument(const initial_byte &ib, const buffer follow)
    {
        if (follow.size() != argument_size(ib.width)) [[unlikely]]
            throw tessera::error(fmt::format("the argument of a {} header requires {} bytes but got {}", ib.width, argument_size(ib.width), follow.size()));
        switch (ib.width) {
            case argument_width::direct: return ib.info;
            case argument_width::one: return follow[0];
            case argument_width::two: return follow.to_host<uint16_t>();
            case argument_width::four: return follow.to_host<uint32_t>();
            case argument_width::eight: return follow.to_host<uint64_t>();
            case argument_width::indefinite:
                switch (ib.type) {
                    case major_type::bytes:
                    case major_type::text:
                    case major_type::array:
                    case major_type::map:
                        return {};
                    [[unlikely]] default:
                        throw malformed_header_error(fmt::format("the indefinite-length marker is not allowed for {}", ib.type));
                }
            [[unlikely]] default:
                throw malformed_header_error(fmt::format("reserved additional information value {} for {}", ib.info, ib.type));
        }
    }

    header encode_header(const major_type typ, const argument arg, const std::optional<argument_width> width)
    {
        header hdr {};
        const auto typ_bits = static_cast<uint8_t>(static_cast<uint8_t>(typ) << 5);
        if (!arg) {
            switch (typ) {
                case major_type::bytes:
                case major_type::text:
                case major_type::array:
                case major_type::map:
                    break;
                [[unlikely]] default:
                    throw invalid_event_sequence_error(fmt::format("the indefinite-length marker is not allowed for {}", typ));
            }
            hdr.bytes[hdr.size++] = typ_bits | static_cast<uint8_t>(special_val::s_break);
            return hdr;
        }
        const auto val = *arg;
        const auto min_w = minimal_width(val);
        const auto w = width.value_or(min_w);
        if (w == argument_width::indefinite || w == argument_width::reserved || w < min_w) [[unlikely]]
            throw invalid_event_sequence_error(fmt::format("value {} cannot be encoded with argument width {}", val, w));
        switch (w) {
            case argument_width::direct:
                hdr.bytes[hdr.size++] = typ_bits | static_cast<uint8_t>(val);
                break;
            case argument_width::one:
                hdr.bytes[hdr.size++] = typ_bits | static_cast<uint8_t>(special_val::one_byte);
                hdr.bytes[hdr.size++] = static_cast<uint8_t>(val);
                break;
            case argument_width::two: {
                hdr.bytes[hdr.size++] = typ_bits | static_cast<uint8_t>(special_val::two_bytes);
                const auto n_val = host_to_net<uint16_t>(static_cast<uint16_t>(val));
                memcpy(hdr.bytes.data() + hdr.size, &n_val, sizeof(n_val));
                hdr.size += sizeof(n_val);
                break;
            }
            case argument_width::four: {
                hdr.bytes[hdr.size++] = typ_bits | static_cast<uint8_t>(special_val::four_bytes);
                const auto n_val = host_to_net<uint32_t>(static_cast<uint32_t>(val));
                memcpy(hdr.bytes.data() + hdr.size, &n_val, sizeof(n_val));
                hdr.size += sizeof(n_val);
                break;
            }
            case argument_width::eight: {
                hdr.bytes[hdr.size++] = typ_bits | static_cast<uint8_t>(special_val::eight_bytes);
                const auto n_val = host_to_net<uint64_t>(val);
                memcpy(hdr.bytes.data() + hdr.size, &n_val, sizeof(n_val));
                hdr.size += sizeof(n_val);
                break;
            }
            default:
                throw tessera::error(fmt::format("internal error: unsupported argument width {}", w));
        }
        return hdr;
    }

    double half_to_double(const uint16_t half) noexcept
    {
        const int exp = (half >> 10) & 0x1F;
        const int mant = half & 0x3FF;
        double val;
        if (exp == 0)
            val = std::ldexp(mant, -24);
        else if (exp != 31)
            val = std::ldexp(mant + 1024, exp - 25);
        else
            val = mant == 0 ? std::numeric_limits<double>::infinity() : std::numeric_limits<double>::quiet_NaN();
        return half & 0x8000 ? -val : val;
    }

    std::optional<uint16_t> double_to_half(const double val) noexcept
    {
        if (std::isnan(val))
            return 0x7E00;
        const uint16_t sign = std::signbit(val) ? 0x8000 : 0;
        if (std::isinf(val))
            return sign | 0x7C00;
        const double a = std::fabs(val);
        if (a == 0.0)
            return sign;
        int e;
        std::frexp(a, &e);
        // a = 1.m * 2^exp
        const int exp = e - 1;
        if (exp > 15 || exp < -24)
            return {};
        uint16_t bits;
        if (exp >= -14) {
            const double scaled = (std::ldexp(a, -exp) - 1.0) * 1024.0;
            if (scaled != std::floor(scaled))
                return {};
            bits = static_cast<uint16_t>(((exp + 15) << 10) | static_cast<int>(scaled));
        } else {
            const double k = std::ldexp(a, 24);
            if (k != std::floor(k))
                return {};
            bits = static_cast<uint16_t>(k);
        }
        bits |= sign;
        if (half_to_double(bits) != val)
            return {};
        return bits;
    }

    bool fits_float32(const double val) noexcept
    {
        if (std::isnan(val) || std::isinf(val))
            return true;
        if (std::fabs(val) > static_cast<double>(std::numeric_limits<float>::max()))
            return false;
        return static_cast<double>(static_cast<float>(val)) == val;
    }
}
