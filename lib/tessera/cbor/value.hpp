/* This file is part of Tessera project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TESSERA_CBOR_VALUE_HPP
#define TESSERA_CBOR_VALUE_HPP

#include <memory>
#include <source_location>
#include <string>
#include <variant>
#include <vector>
#include <tessera/common/big-int.hpp>
#include <tessera/common/bytes.hpp>
#include <tessera/cbor/types.hpp>

namespace tessera::cbor {
    struct value;

    // a value produced by a registered extension; values are immutable once created
    struct extension_value {
        virtual ~extension_value() =default;
        virtual std::string_view type_name() const =0;
        virtual bool operator==(const extension_value &o) const =0;
        virtual std::string to_string() const =0;
    };
    using extension_ptr = std::shared_ptr<const extension_value>;

    // the represented integer is -1 - val
    struct nint_value {
        uint64_t val;
        bool operator==(const nint_value &) const =default;
    };

    struct simple_value {
        uint8_t val;
        bool operator==(const simple_value &) const =default;
    };

    struct null_value {
        bool operator==(const null_value &) const =default;
    };

    struct undefined_value {
        bool operator==(const undefined_value &) const =default;
    };

    struct array_value: std::vector<value> {
        using std::vector<value>::vector;
        const value &at(size_t pos, const std::source_location &loc=std::source_location::current()) const;
    };

    struct map_value: std::vector<std::pair<value, value>> {
        using std::vector<std::pair<value, value>>::vector;
    };

    struct tagged_value {
        tagged_value(uint64_t id, value val);
        tagged_value(const tagged_value &o);
        tagged_value(tagged_value &&o) =default;
        tagged_value &operator=(const tagged_value &o);
        tagged_value &operator=(tagged_value &&o) =default;
        bool operator==(const tagged_value &o) const;

        uint64_t id() const noexcept
        {
            return _id;
        }

        const value &val() const noexcept
        {
            return *_val;
        }
    private:
        uint64_t _id;
        std::unique_ptr<value> _val;
    };

    enum class value_type: uint8_t {
        uint, nint, bytes, text, array, map, tag, simple, boolean, null, undefined, float64, extension
    };

    struct value {
        // the alternatives follow the order of value_type
        using content_type = std::variant<uint64_t, nint_value, uint8_vector, std::string, array_value, map_value,
            tagged_value, simple_value, bool, null_value, undefined_value, double, extension_ptr>;

        static std::string_view type_name(value_type typ);

        static value from_int(const int64_t val)
        {
            if (val >= 0)
                return value { static_cast<uint64_t>(val) };
            return value { nint_value { static_cast<uint64_t>(-1 - val) } };
        }

        value(): _content { null_value {} }
        {
        }

        template<typename T>
            requires (!std::is_same_v<std::decay_t<T>, value>) && std::is_constructible_v<content_type, T>
        value(T &&val): _content { std::forward<T>(val) }
        {
        }

        bool operator==(const value &o) const;

        value_type type() const noexcept
        {
            return static_cast<value_type>(_content.index());
        }

        std::string_view type_name() const
        {
            return type_name(type());
        }

        const content_type &content() const noexcept
        {
            return _content;
        }

        uint64_t uint(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<uint64_t>(value_type::uint, loc);
        }

        // the raw argument: the represented integer is -1 - nint()
        uint64_t nint(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<nint_value>(value_type::nint, loc).val;
        }

        int64_t integer(const std::source_location &loc=std::source_location::current()) const;
        cpp_int bigint(const std::source_location &loc=std::source_location::current()) const;

        const uint8_vector &bytes(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<uint8_vector>(value_type::bytes, loc);
        }

        std::string_view text(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<std::string>(value_type::text, loc);
        }

        const array_value &array(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<array_value>(value_type::array, loc);
        }

        const map_value &map(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<map_value>(value_type::map, loc);
        }

        const tagged_value &tag(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<tagged_value>(value_type::tag, loc);
        }

        uint8_t simple(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<simple_value>(value_type::simple, loc).val;
        }

        bool boolean(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<bool>(value_type::boolean, loc);
        }

        double float64(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<double>(value_type::float64, loc);
        }

        const extension_value &ext(const std::source_location &loc=std::source_location::current()) const
        {
            return *_get<extension_ptr>(value_type::extension, loc);
        }

        template<typename T>
        const T &ext(const std::source_location &loc=std::source_location::current()) const
        {
            const auto &e = ext(loc);
            if (const auto *ptr = dynamic_cast<const T *>(&e); ptr) [[likely]]
                return *ptr;
            throw tessera::error(fmt::format("invalid cbor value access, expecting a different extension type while the present value is {} in file {} line {}",
                e.type_name(), loc.file_name(), loc.line()));
        }

        const value &at(const size_t idx, const std::source_location &loc=std::source_location::current()) const
        {
            return array(loc).at(idx, loc);
        }

        bool is_null() const noexcept
        {
            return type() == value_type::null;
        }

        bool is_undefined() const noexcept
        {
            return type() == value_type::undefined;
        }
    private:
        content_type _content;

        template<typename T>
        const T &_get(const value_type exp_type, const std::source_location &loc) const
        {
            if (const auto *ptr = std::get_if<T>(&_content); ptr) [[likely]]
                return *ptr;
            throw tessera::error(fmt::format("invalid cbor value access, expecting type {} while the present value is {} in file {} line {}",
                type_name(exp_type), type_name(), loc.file_name(), loc.line()));
        }
    };
}

namespace fmt {
    template<>
    struct formatter<tessera::cbor::value_type>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", tessera::cbor::value::type_name(v));
        }
    };

    template<>
    struct formatter<tessera::cbor::value>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using namespace tessera::cbor;
            return std::visit([&](const auto &c) {
                using T = std::decay_t<decltype(c)>;
                if constexpr (std::is_same_v<T, uint64_t>) {
                    return fmt::format_to(ctx.out(), "{}", c);
                } else if constexpr (std::is_same_v<T, nint_value>) {
                    const tessera::cpp_int val = tessera::cpp_int { -1 } - c.val;
                    return fmt::format_to(ctx.out(), "{}", val);
                } else if constexpr (std::is_same_v<T, tessera::uint8_vector>) {
                    return fmt::format_to(ctx.out(), "h'{}'", c);
                } else if constexpr (std::is_same_v<T, std::string>) {
                    return fmt::format_to(ctx.out(), "\"{}\"", c);
                } else if constexpr (std::is_same_v<T, array_value>) {
                    auto out_it = fmt::format_to(ctx.out(), "[");
                    for (auto it = c.begin(); it != c.end(); ++it) {
                        const std::string_view sep { it == c.begin() ? "" : ", " };
                        out_it = fmt::format_to(out_it, "{}{}", sep, *it);
                    }
                    return fmt::format_to(out_it, "]");
                } else if constexpr (std::is_same_v<T, map_value>) {
                    auto out_it = fmt::format_to(ctx.out(), "{{");
                    for (auto it = c.begin(); it != c.end(); ++it) {
                        const std::string_view sep { it == c.begin() ? "" : ", " };
                        out_it = fmt::format_to(out_it, "{}{}: {}", sep, it->first, it->second);
                    }
                    return fmt::format_to(out_it, "}}");
                } else if constexpr (std::is_same_v<T, tagged_value>) {
                    return fmt::format_to(ctx.out(), "{}({})", c.id(), c.val());
                } else if constexpr (std::is_same_v<T, simple_value>) {
                    return fmt::format_to(ctx.out(), "simple({})", c.val);
                } else if constexpr (std::is_same_v<T, bool>) {
                    return fmt::format_to(ctx.out(), "{}", c);
                } else if constexpr (std::is_same_v<T, null_value>) {
                    return fmt::format_to(ctx.out(), "null");
                } else if constexpr (std::is_same_v<T, undefined_value>) {
                    return fmt::format_to(ctx.out(), "undefined");
                } else if constexpr (std::is_same_v<T, double>) {
                    return fmt::format_to(ctx.out(), "{}", c);
                } else {
                    if (!c)
                        return fmt::format_to(ctx.out(), "ext(null)");
                    return fmt::format_to(ctx.out(), "{}", c->to_string());
                }
            }, v.content());
        }
    };
}

#endif // !TESSERA_CBOR_VALUE_HPP
