/* This file is part of Tessera project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TESSERA_CBOR_DECODER_HPP
#define TESSERA_CBOR_DECODER_HPP

#include <optional>
#include <vector>
#include <tessera/cbor/event.hpp>
#include <tessera/cbor/header.hpp>
#include <tessera/cbor/source.hpp>

namespace tessera::cbor {
    struct decoder_config {
        size_t max_nesting_depth = default_max_nesting_depth;
    };

    enum class decode_status: uint8_t {
        event, need_more, end
    };

    struct decode_step {
        decode_status status;
        event ev {};
    };

    /*
     * A pull-based decoder: each call produces at most one event.
     * The bytes of a returned event are released from the source only at the start of the next call,
     * so chunk views remain valid until then and need_more never leaves partially consumed input behind.
     */
    struct decoder {
        explicit decoder(const decoder_config &cfg={});

        decode_step next_event(source &src);
        // for sources that never report need_more; a need_more is reported as truncated input
        std::optional<event> next(source &src);
        void finish(source &src);

        // open indefinite strings do not count: their chunks cannot nest
        size_t depth() const noexcept
        {
            size_t containers = _stack.size();
            if (!_stack.empty() && (_stack.back().type == frame_type::bytes || _stack.back().type == frame_type::text))
                --containers;
            return containers + _frame_tags + _pending_tags;
        }

        bool at_item_boundary() const noexcept
        {
            return _stack.empty() && _pending_tags == 0;
        }

        bool failed() const noexcept
        {
            return _failed;
        }

        // bytes consumed so far; after a failure, the position of the offending item
        size_t offset() const noexcept
        {
            return _offset;
        }
    private:
        enum class frame_type: uint8_t {
            array, map, bytes, text
        };

        struct frame {
            frame_type type;
            // empty for indefinite frames; the number of pairs for maps
            std::optional<uint64_t> remaining {};
            size_t tags = 0;
            bool expecting_value = false;
        };

        decoder_config _cfg;
        std::vector<frame> _stack {};
        size_t _frame_tags = 0;
        size_t _pending_tags = 0;
        size_t _pending_advance = 0;
        size_t _offset = 0;
        bool _failed = false;

        decode_step _next(source &src);
        decode_step _decode_break();
        decode_step _decode_chunk(const frame &f, source &src, const initial_byte &ib, size_t hdr_size, argument arg);
        event _decode_simple(const initial_byte &ib, argument arg);
        std::optional<buffer> _peek_string(source &src, size_t hdr_size, uint64_t len);
        void _release(source &src);
        void _check_depth() const;
        void _push(frame_type typ, std::optional<uint64_t> size);
        void _item_done();
    };
}

namespace fmt {
    template<>
    struct formatter<tessera::cbor::decode_status>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using tessera::cbor::decode_status;
            switch (v) {
                case decode_status::event: return fmt::format_to(ctx.out(), "event");
                case decode_status::need_more: return fmt::format_to(ctx.out(), "need_more");
                case decode_status::end: return fmt::format_to(ctx.out(), "end");
                default: return fmt::format_to(ctx.out(), "decode_status: {}", static_cast<int>(v));
            }
        }
    };
}

#endif // !TESSERA_CBOR_DECODER_HPP
