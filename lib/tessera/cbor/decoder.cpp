/* This file is part of Tessera project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cstring>
#include <limits>
#include <utf8.h>
#include <tessera/cbor/decoder.hpp>

namespace tessera::cbor {
    static void validate_utf8(const buffer data)
    {
        const std::string_view sv = data;
        if (const auto it = utf8::find_invalid(sv.begin(), sv.end()); it != sv.end()) [[unlikely]]
            throw invalid_utf8_error(fmt::format("an invalid utf8 sequence at offset {} of a text string: {}", it - sv.begin(), data));
    }

    decoder::decoder(const decoder_config &cfg): _cfg { cfg }
    {
    }

    decode_step decoder::next_event(source &src)
    {
        if (_failed) [[unlikely]]
            throw invalid_event_sequence_error("decoder used after a failure");
        try {
            return _next(src);
        } catch (...) {
            _failed = true;
            throw;
        }
    }

    std::optional<event> decoder::next(source &src)
    {
        auto step = next_event(src);
        switch (step.status) {
            case decode_status::event: return std::move(step.ev);
            case decode_status::end: return {};
            default:
                _failed = true;
                throw truncated_input_error(fmt::format("the source has no more data at nesting depth {}", depth()));
        }
    }

    void decoder::finish(source &src)
    {
        if (_failed) [[unlikely]]
            throw invalid_event_sequence_error("decoder used after a failure");
        try {
            _release(src);
            if (!at_item_boundary()) [[unlikely]]
                throw truncated_input_error(fmt::format("the document ended at nesting depth {}", depth()));
            switch (const auto res = src.peek(1); res.status) {
                case peek_status::ok:
                    throw excess_data_error(fmt::format("unexpected byte 0x{:02X} after the last top-level item", res.data[0]));
                case peek_status::need_more:
                    throw truncated_input_error("the source has not been closed");
                default:
                    break;
            }
        } catch (...) {
            _failed = true;
            throw;
        }
    }

    decode_step decoder::_next(source &src)
    {
        _release(src);
        const auto first = src.peek(1);
        switch (first.status) {
            case peek_status::need_more:
                return { decode_status::need_more };
            case peek_status::eof:
                if (at_item_boundary())
                    return { decode_status::end };
                throw truncated_input_error(fmt::format("the source ended at nesting depth {}", depth()));
            default:
                break;
        }
        const auto ib = decode_initial_byte(first.data[0]);
        if (ib.type == major_type::simple && ib.width == argument_width::indefinite)
            return _decode_break();
        const size_t hdr_size = 1 + argument_size(ib.width);
        const auto hdr = src.peek(hdr_size);
        switch (hdr.status) {
            case peek_status::need_more:
                return { decode_status::need_more };
            case peek_status::eof:
                throw truncated_input_error(fmt::format("the source ended inside the header of a {} item", ib.type));
            default:
                break;
        }
        const auto arg = read_argument(ib, hdr.data.subbuf(1));
        if (!_stack.empty()) {
            const auto &top = _stack.back();
            if (top.type == frame_type::bytes || top.type == frame_type::text)
                return _decode_chunk(top, src, ib, hdr_size, arg);
        }
        const auto scalar = [&](event ev) {
            _pending_tags = 0;
            _pending_advance = hdr_size;
            _item_done();
            return decode_step { decode_status::event, std::move(ev) };
        };
        switch (ib.type) {
            case major_type::uint:
                return scalar(uint_event { *arg });
            case major_type::nint:
                return scalar(nint_event { *arg });
            case major_type::bytes:
            case major_type::text: {
                const auto is_text = ib.type == major_type::text;
                if (!arg) {
                    _push(is_text ? frame_type::text : frame_type::bytes, arg);
                    _pending_advance = hdr_size;
                    if (is_text)
                        return { decode_status::event, start_text {} };
                    return { decode_status::event, start_bytes {} };
                }
                const auto data = _peek_string(src, hdr_size, *arg);
                if (!data)
                    return { decode_status::need_more };
                _pending_tags = 0;
                if (is_text) {
                    validate_utf8(*data);
                    _pending_advance = hdr_size + data->size();
                    _item_done();
                    return { decode_status::event, text_chunk { *data, true } };
                }
                _pending_advance = hdr_size + data->size();
                _item_done();
                return { decode_status::event, bytes_chunk { *data, true } };
            }
            case major_type::array:
            case major_type::map: {
                const auto is_map = ib.type == major_type::map;
                const event ev = is_map ? event { start_map { arg } } : event { start_array { arg } };
                if (arg && *arg == 0)
                    return scalar(ev);
                _push(is_map ? frame_type::map : frame_type::array, arg);
                _pending_advance = hdr_size;
                return { decode_status::event, ev };
            }
            case major_type::tag:
                _check_depth();
                ++_pending_tags;
                _pending_advance = hdr_size;
                return { decode_status::event, tag_event { *arg } };
            case major_type::simple:
                return scalar(_decode_simple(ib, arg));
            [[unlikely]] default:
                throw malformed_header_error(fmt::format("unsupported major type {}", ib.type));
        }
    }

    decode_step decoder::_decode_break()
    {
        if (_pending_tags) [[unlikely]]
            throw malformed_header_error("a break cannot follow a tag");
        if (_stack.empty()) [[unlikely]]
            throw malformed_header_error("a break outside of an indefinite-length item");
        const auto &top = _stack.back();
        if (top.remaining) [[unlikely]]
            throw malformed_header_error(fmt::format("a break inside a definite-length item with {} elements remaining", *top.remaining));
        if (top.type == frame_type::map && top.expecting_value) [[unlikely]]
            throw unpaired_map_break_error("a break between a map key and its value");
        _frame_tags -= top.tags;
        _stack.pop_back();
        _pending_advance = 1;
        _item_done();
        return { decode_status::event, break_event {} };
    }

    decode_step decoder::_decode_chunk(const frame &f, source &src, const initial_byte &ib, const size_t hdr_size, const argument arg)
    {
        const auto expected = f.type == frame_type::text ? major_type::text : major_type::bytes;
        if (ib.type != expected) [[unlikely]]
            throw invalid_indefinite_chunk_error(fmt::format("an indefinite-length {} string contains a {} item", expected, ib.type));
        if (!arg) [[unlikely]]
            throw invalid_indefinite_chunk_error(fmt::format("an indefinite-length {} string contains a nested indefinite-length chunk", expected));
        const auto data = _peek_string(src, hdr_size, *arg);
        if (!data)
            return { decode_status::need_more };
        _pending_advance = hdr_size + data->size();
        if (expected == major_type::text) {
            validate_utf8(*data);
            return { decode_status::event, text_chunk { *data, false } };
        }
        return { decode_status::event, bytes_chunk { *data, false } };
    }

    event decoder::_decode_simple(const initial_byte &ib, const argument arg)
    {
        switch (ib.width) {
            case argument_width::direct:
                switch (static_cast<special_val>(ib.info)) {
                    case special_val::s_false: return bool_event { false };
                    case special_val::s_true: return bool_event { true };
                    case special_val::s_null: return null_event {};
                    case special_val::s_undefined: return undefined_event {};
                    default: return simple_event { ib.info };
                }
            case argument_width::one:
                if (*arg < 32) [[unlikely]]
                    throw malformed_header_error(fmt::format("simple value {} must use the single-byte encoding", *arg));
                return simple_event { static_cast<uint8_t>(*arg) };
            case argument_width::two:
                return float_event { half_to_double(static_cast<uint16_t>(*arg)) };
            case argument_width::four: {
                const auto bits = static_cast<uint32_t>(*arg);
                float val;
                static_assert(sizeof(val) == sizeof(bits));
                memcpy(&val, &bits, sizeof(val));
                return float_event { static_cast<double>(val) };
            }
            case argument_width::eight: {
                const uint64_t bits = *arg;
                double val;
                static_assert(sizeof(val) == sizeof(bits));
                memcpy(&val, &bits, sizeof(val));
                return float_event { val };
            }
            [[unlikely]] default:
                throw malformed_header_error(fmt::format("reserved simple value encoding {}", ib.info));
        }
    }

    std::optional<buffer> decoder::_peek_string(source &src, const size_t hdr_size, const uint64_t len)
    {
        if (len > std::numeric_limits<size_t>::max() - hdr_size) [[unlikely]]
            throw truncated_input_error(fmt::format("a string of {} bytes exceeds the addressable memory", len));
        const auto res = src.peek(hdr_size + static_cast<size_t>(len));
        switch (res.status) {
            case peek_status::ok:
                return res.data.subbuf(hdr_size);
            case peek_status::need_more:
                return {};
            default:
                throw truncated_input_error(fmt::format("the source ended inside a string of {} bytes", len));
        }
    }

    void decoder::_release(source &src)
    {
        if (_pending_advance) {
            src.advance(_pending_advance);
            _offset += _pending_advance;
            _pending_advance = 0;
        }
    }

    void decoder::_check_depth() const
    {
        if (depth() >= _cfg.max_nesting_depth) [[unlikely]]
            throw nesting_too_deep_error(fmt::format("the document nests deeper than {} levels", _cfg.max_nesting_depth));
    }

    void decoder::_push(const frame_type typ, const std::optional<uint64_t> size)
    {
        if (typ == frame_type::array || typ == frame_type::map)
            _check_depth();
        _stack.push_back(frame { typ, size, _pending_tags });
        _frame_tags += _pending_tags;
        _pending_tags = 0;
    }

    void decoder::_item_done()
    {
        while (!_stack.empty()) {
            auto &top = _stack.back();
            if (top.type == frame_type::map) {
                if (!top.expecting_value) {
                    top.expecting_value = true;
                    return;
                }
                top.expecting_value = false;
            }
            if (!top.remaining)
                return;
            if (--*top.remaining > 0)
                return;
            _frame_tags -= top.tags;
            _stack.pop_back();
        }
    }
}
