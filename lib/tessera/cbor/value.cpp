/* This file is part of Tessera project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <array>
#include <tessera/cbor/value.hpp>

namespace tessera::cbor {
    const value &array_value::at(const size_t pos, const std::source_location &loc) const
    {
        if (pos < size()) [[likely]]
            return operator[](pos);
        throw tessera::error(fmt::format("invalid element index {} in the array of size {} in file {} line {}",
            pos, size(), loc.file_name(), loc.line()));
    }

    tagged_value::tagged_value(const uint64_t id, value val):
        _id { id }, _val { std::make_unique<value>(std::move(val)) }
    {
    }

    tagged_value::tagged_value(const tagged_value &o):
        _id { o._id }, _val { std::make_unique<value>(*o._val) }
    {
    }

    tagged_value &tagged_value::operator=(const tagged_value &o)
    {
        if (this != &o) {
            _id = o._id;
            _val = std::make_unique<value>(*o._val);
        }
        return *this;
    }

    bool tagged_value::operator==(const tagged_value &o) const
    {
        return _id == o._id && *_val == *o._val;
    }

    std::string_view value::type_name(const value_type typ)
    {
        static const std::array<std::string_view, 13> names {
            "unsigned integer", "negative integer", "bytes", "text",
            "array", "map", "tag", "simple",
            "boolean", "null", "undefined", "float",
            "extension"
        };
        const auto type_idx = static_cast<size_t>(typ);
        if (type_idx >= names.size()) [[unlikely]]
            throw tessera::error(fmt::format("unsupported CBOR value type index: {}", type_idx));
        return names[type_idx];
    }

    bool value::operator==(const value &o) const
    {
        if (_content.index() != o._content.index())
            return false;
        if (const auto *ext_ptr = std::get_if<extension_ptr>(&_content); ext_ptr) {
            const auto &o_ptr = std::get<extension_ptr>(o._content);
            if (!*ext_ptr || !o_ptr)
                return !*ext_ptr && !o_ptr;
            return **ext_ptr == *o_ptr;
        }
        return _content == o._content;
    }

    int64_t value::integer(const std::source_location &loc) const
    {
        switch (type()) {
            case value_type::uint: {
                const auto val = uint(loc);
                if (val > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) [[unlikely]]
                    throw tessera::error(fmt::format("the unsigned integer {} does not fit into int64_t in file {} line {}", val, loc.file_name(), loc.line()));
                return static_cast<int64_t>(val);
            }
            case value_type::nint: {
                const auto val = nint(loc);
                if (val > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) [[unlikely]]
                    throw tessera::error(fmt::format("the negative integer -1-{} does not fit into int64_t in file {} line {}", val, loc.file_name(), loc.line()));
                return -1 - static_cast<int64_t>(val);
            }
            default:
                throw tessera::error(fmt::format("invalid cbor value access, expecting an integer while the present value is {} in file {} line {}",
                    type_name(), loc.file_name(), loc.line()));
        }
    }

    cpp_int value::bigint(const std::source_location &loc) const
    {
        switch (type()) {
            case value_type::uint: return cpp_int { uint(loc) };
            case value_type::nint: return cpp_int { -1 } - nint(loc);
            default:
                throw tessera::error(fmt::format("invalid cbor value access, expecting an integer while the present value is {} in file {} line {}",
                    type_name(), loc.file_name(), loc.line()));
        }
    }
}
