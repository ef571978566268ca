/* This file is part of Tessera project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TESSERA_CBOR_EVENT_HPP
#define TESSERA_CBOR_EVENT_HPP

#include <limits>
#include <optional>
#include <string_view>
#include <variant>
#include <tessera/common/big-int.hpp>
#include <tessera/common/bytes.hpp>

namespace tessera::cbor {
    struct uint_event {
        uint64_t val;
        bool operator==(const uint_event &) const =default;
    };

    // the represented integer is -1 - val
    struct nint_event {
        uint64_t val;
        bool operator==(const nint_event &) const =default;
    };

    // data is a view that stays valid until the next call to the decoder
    struct bytes_chunk {
        buffer data {};
        bool final = true;
        bool operator==(const bytes_chunk &) const =default;
    };

    struct text_chunk {
        buffer data {};
        bool final = true;
        bool operator==(const text_chunk &) const =default;

        std::string_view text() const noexcept
        {
            return data;
        }
    };

    struct start_array {
        std::optional<uint64_t> size {};
        bool operator==(const start_array &) const =default;
    };

    struct start_map {
        std::optional<uint64_t> size {};
        bool operator==(const start_map &) const =default;
    };

    struct start_bytes {
        std::optional<uint64_t> size {};
        bool operator==(const start_bytes &) const =default;
    };

    struct start_text {
        std::optional<uint64_t> size {};
        bool operator==(const start_text &) const =default;
    };

    struct tag_event {
        uint64_t id;
        bool operator==(const tag_event &) const =default;
    };

    // simple values other than false, true, null and undefined
    struct simple_event {
        uint8_t val;
        bool operator==(const simple_event &) const =default;
    };

    struct bool_event {
        bool val;
        bool operator==(const bool_event &) const =default;
    };

    struct null_event {
        bool operator==(const null_event &) const =default;
    };

    struct undefined_event {
        bool operator==(const undefined_event &) const =default;
    };

    struct float_event {
        double val;
        bool operator==(const float_event &) const =default;
    };

    struct break_event {
        bool operator==(const break_event &) const =default;
    };

    using event = std::variant<uint_event, nint_event, bytes_chunk, text_chunk,
        start_array, start_map, start_bytes, start_text, tag_event,
        simple_event, bool_event, null_event, undefined_event, float_event, break_event>;

    inline int64_t interpret_signed(const uint64_t val) noexcept
    {
        return -1 - static_cast<int64_t>(val);
    }

    inline std::optional<int64_t> interpret_signed_checked(const uint64_t val) noexcept
    {
        if (val > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
            return {};
        return -1 - static_cast<int64_t>(val);
    }

    inline cpp_int interpret_signed_wide(const uint64_t val)
    {
        return cpp_int { -1 } - cpp_int { val };
    }

    inline event create_signed(const int64_t val) noexcept
    {
        if (val >= 0)
            return uint_event { static_cast<uint64_t>(val) };
        return nint_event { static_cast<uint64_t>(-1 - val) };
    }

    // an empty result means the value is outside the range representable by the major types 0 and 1
    inline std::optional<event> create_signed_wide(const cpp_int &val)
    {
        static const cpp_int max_uint { std::numeric_limits<uint64_t>::max() };
        if (val >= 0) {
            if (val > max_uint)
                return {};
            return uint_event { static_cast<uint64_t>(val) };
        }
        const cpp_int mag = -1 - val;
        if (mag > max_uint)
            return {};
        return nint_event { static_cast<uint64_t>(mag) };
    }
}

namespace fmt {
    template<>
    struct formatter<tessera::cbor::event>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &ev, FormatContext &ctx) const -> decltype(ctx.out()) {
            using namespace tessera::cbor;
            return std::visit([&](const auto &v) {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, uint_event>) {
                    return fmt::format_to(ctx.out(), "uint({})", v.val);
                } else if constexpr (std::is_same_v<T, nint_event>) {
                    return fmt::format_to(ctx.out(), "nint(-1-{})", v.val);
                } else if constexpr (std::is_same_v<T, bytes_chunk>) {
                    return fmt::format_to(ctx.out(), "bytes({}{})", v.data, v.final ? "" : ", partial");
                } else if constexpr (std::is_same_v<T, text_chunk>) {
                    return fmt::format_to(ctx.out(), "text('{}'{})", v.text(), v.final ? "" : ", partial");
                } else if constexpr (std::is_same_v<T, start_array>) {
                    if (v.size)
                        return fmt::format_to(ctx.out(), "array({})", *v.size);
                    return fmt::format_to(ctx.out(), "array(_)");
                } else if constexpr (std::is_same_v<T, start_map>) {
                    if (v.size)
                        return fmt::format_to(ctx.out(), "map({})", *v.size);
                    return fmt::format_to(ctx.out(), "map(_)");
                } else if constexpr (std::is_same_v<T, start_bytes>) {
                    if (v.size)
                        return fmt::format_to(ctx.out(), "start_bytes({})", *v.size);
                    return fmt::format_to(ctx.out(), "start_bytes(_)");
                } else if constexpr (std::is_same_v<T, start_text>) {
                    if (v.size)
                        return fmt::format_to(ctx.out(), "start_text({})", *v.size);
                    return fmt::format_to(ctx.out(), "start_text(_)");
                } else if constexpr (std::is_same_v<T, tag_event>) {
                    return fmt::format_to(ctx.out(), "tag({})", v.id);
                } else if constexpr (std::is_same_v<T, simple_event>) {
                    return fmt::format_to(ctx.out(), "simple({})", v.val);
                } else if constexpr (std::is_same_v<T, bool_event>) {
                    return fmt::format_to(ctx.out(), "{}", v.val);
                } else if constexpr (std::is_same_v<T, null_event>) {
                    return fmt::format_to(ctx.out(), "null");
                } else if constexpr (std::is_same_v<T, undefined_event>) {
                    return fmt::format_to(ctx.out(), "undefined");
                } else if constexpr (std::is_same_v<T, float_event>) {
                    return fmt::format_to(ctx.out(), "float({})", v.val);
                } else {
                    return fmt::format_to(ctx.out(), "break");
                }
            }, ev);
        }
    };
}

#endif // !TESSERA_CBOR_EVENT_HPP
