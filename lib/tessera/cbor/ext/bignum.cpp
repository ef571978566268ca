/* This file is part of Tessera project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <tessera/cbor/event.hpp>
#include <tessera/cbor/ext/bignum.hpp>

namespace tessera::cbor::ext {
    namespace {
        std::optional<value> integer_value(const cpp_int &val)
        {
            const auto ev = create_signed_wide(val);
            if (!ev)
                return {};
            if (const auto *u = std::get_if<uint_event>(&*ev); u)
                return value { u->val };
            return value { nint_value { std::get<nint_event>(*ev).val } };
        }
    }

    bignum_extension::bignum_extension(const bignum_decode_style style): _style { style }
    {
    }

    std::optional<value> bignum_extension::decode(const uint64_t tag, const value &inner) const
    {
        if (tag != 2 && tag != 3)
            return {};
        const cpp_int mag = big_int_from_bytes(inner.bytes());
        const cpp_int val = tag == 2 ? mag : cpp_int { -1 - mag };
        if (_style == bignum_decode_style::num)
            return value { std::make_shared<bignum_value>(val) };
        if (auto int_val = integer_value(val); int_val)
            return int_val;
        if (_style == bignum_decode_style::force_convert) [[unlikely]]
            throw tessera::error(fmt::format("the bignum {} does not fit into a 64-bit integer", val));
        return {};
    }

    std::optional<value> bignum_extension::encode(const extension_value &val) const
    {
        const auto *b = dynamic_cast<const bignum_value *>(&val);
        if (!b)
            return {};
        if (auto int_val = integer_value(b->val()); int_val)
            return int_val;
        if (b->val() >= 0)
            return value { tagged_value { 2, value { big_int_to_bytes(b->val()) } } };
        return value { tagged_value { 3, value { big_int_to_bytes(cpp_int { -1 - b->val() }) } } };
    }
}
