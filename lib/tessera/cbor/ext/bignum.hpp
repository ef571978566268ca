/* This file is part of Tessera project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TESSERA_CBOR_EXT_BIGNUM_HPP
#define TESSERA_CBOR_EXT_BIGNUM_HPP

#include <tessera/common/big-int.hpp>
#include <tessera/cbor/registry.hpp>

namespace tessera::cbor::ext {
    struct bignum_value: extension_value {
        explicit bignum_value(cpp_int val): _val { std::move(val) }
        {
        }

        const cpp_int &val() const noexcept
        {
            return _val;
        }

        std::string_view type_name() const override
        {
            return "bignum";
        }

        bool operator==(const extension_value &o) const override
        {
            const auto *b = dynamic_cast<const bignum_value *>(&o);
            return b && b->_val == _val;
        }

        std::string to_string() const override
        {
            return fmt::format("bignum({})", _val);
        }
    private:
        cpp_int _val;
    };

    // tag 2 carries the big-endian bytes of n, tag 3 the bytes of n for the value -1 - n
    struct bignum_extension: extension {
        explicit bignum_extension(bignum_decode_style style=bignum_decode_style::convert);

        std::string_view name() const override
        {
            return "bignum";
        }

        std::vector<uint64_t> tags() const override
        {
            return { 2, 3 };
        }

        std::optional<value> decode(uint64_t tag, const value &inner) const override;
        std::optional<value> encode(const extension_value &val) const override;
    private:
        bignum_decode_style _style;
    };
}

#endif // !TESSERA_CBOR_EXT_BIGNUM_HPP
