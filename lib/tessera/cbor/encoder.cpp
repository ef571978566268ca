/* This file is part of Tessera project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cmath>
#include <cstring>
#include <tessera/cbor/encoder.hpp>

namespace tessera::cbor {
    encoder::encoder(sink &dst, const encoder_config &cfg): _sink { dst }, _cfg { cfg }
    {
    }

    void encoder::write_event(const event &ev)
    {
        if (_failed) [[unlikely]]
            throw invalid_event_sequence_error("encoder used after a failure");
        try {
            _write(ev);
        } catch (...) {
            _failed = true;
            throw;
        }
    }

    bool encoder::ready_to_finish() const noexcept
    {
        return _items > 0 && _stack.empty() && _pending_tags == 0;
    }

    void encoder::finish()
    {
        if (!ready_to_finish()) [[unlikely]] {
            _failed = true;
            if (_items == 0 && _stack.empty() && _pending_tags == 0)
                throw invalid_event_sequence_error("no item has been written");
            throw invalid_event_sequence_error(fmt::format("{} items and {} tags are still open", _stack.size(), _pending_tags));
        }
    }

    void encoder::_write(const event &ev)
    {
        std::visit([&](const auto &v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, uint_event>) {
                _check_not_in_string(major_type::uint);
                _write_header(major_type::uint, v.val);
                _item_done();
            } else if constexpr (std::is_same_v<T, nint_event>) {
                _check_not_in_string(major_type::nint);
                _write_header(major_type::nint, v.val);
                _item_done();
            } else if constexpr (std::is_same_v<T, bytes_chunk>) {
                _write_chunk(major_type::bytes, v.data, v.final);
            } else if constexpr (std::is_same_v<T, text_chunk>) {
                _write_chunk(major_type::text, v.data, v.final);
            } else if constexpr (std::is_same_v<T, start_array>) {
                _start(major_type::array, v.size);
            } else if constexpr (std::is_same_v<T, start_map>) {
                _start(major_type::map, v.size);
            } else if constexpr (std::is_same_v<T, start_bytes>) {
                _start(major_type::bytes, v.size);
            } else if constexpr (std::is_same_v<T, start_text>) {
                _start(major_type::text, v.size);
            } else if constexpr (std::is_same_v<T, tag_event>) {
                _check_not_in_string(major_type::tag);
                _write_header(major_type::tag, v.id);
                ++_pending_tags;
            } else if constexpr (std::is_same_v<T, simple_event>) {
                _check_not_in_string(major_type::simple);
                if (v.val >= 20 && v.val < 32) [[unlikely]]
                    throw invalid_event_sequence_error(fmt::format("simple value {} cannot be encoded", v.val));
                _write_header(major_type::simple, v.val);
                _item_done();
            } else if constexpr (std::is_same_v<T, bool_event>) {
                _check_not_in_string(major_type::simple);
                _write_header(major_type::simple, static_cast<uint8_t>(v.val ? special_val::s_true : special_val::s_false));
                _item_done();
            } else if constexpr (std::is_same_v<T, null_event>) {
                _check_not_in_string(major_type::simple);
                _write_header(major_type::simple, static_cast<uint8_t>(special_val::s_null));
                _item_done();
            } else if constexpr (std::is_same_v<T, undefined_event>) {
                _check_not_in_string(major_type::simple);
                _write_header(major_type::simple, static_cast<uint8_t>(special_val::s_undefined));
                _item_done();
            } else if constexpr (std::is_same_v<T, float_event>) {
                _check_not_in_string(major_type::simple);
                _write_float(v.val);
                _item_done();
            } else if constexpr (std::is_same_v<T, break_event>) {
                _write_break();
            } else {
                static_assert(std::is_same_v<T, void>, "unsupported event type");
            }
        }, ev);
    }

    void encoder::_write_header(const major_type typ, const argument arg, const std::optional<argument_width> width)
    {
        _sink.write(encode_header(typ, arg, width));
    }

    void encoder::_write_float(const double val)
    {
        if (_cfg.floats == float_width::shortest) {
            if (const auto half = double_to_half(val); half) {
                _write_header(major_type::simple, *half, argument_width::two);
                return;
            }
            if (fits_float32(val)) {
                const auto f_val = static_cast<float>(val);
                uint32_t bits;
                static_assert(sizeof(bits) == sizeof(f_val));
                memcpy(&bits, &f_val, sizeof(bits));
                _write_header(major_type::simple, bits, argument_width::four);
                return;
            }
        }
        uint64_t bits;
        static_assert(sizeof(bits) == sizeof(val));
        memcpy(&bits, &val, sizeof(bits));
        _write_header(major_type::simple, bits, argument_width::eight);
    }

    void encoder::_write_chunk(const major_type typ, const buffer data, const bool final)
    {
        const auto str_type = typ == major_type::text ? frame_type::text : frame_type::bytes;
        if (!_stack.empty() && (_stack.back().type == frame_type::bytes || _stack.back().type == frame_type::text)) {
            auto &top = _stack.back();
            if (top.type != str_type) [[unlikely]]
                throw invalid_event_sequence_error(fmt::format("a {} chunk inside a string of another major type", typ));
            if (!top.remaining) {
                _write_header(typ, data.size());
                _sink.write(data);
                return;
            }
            if (data.size() > *top.remaining) [[unlikely]]
                throw invalid_event_sequence_error(fmt::format("a chunk of {} bytes exceeds the {} bytes remaining in a definite-length {} string",
                    data.size(), *top.remaining, typ));
            _sink.write(data);
            *top.remaining -= data.size();
            if (final) {
                if (*top.remaining) [[unlikely]]
                    throw invalid_event_sequence_error(fmt::format("the final chunk leaves {} bytes of a definite-length {} string unwritten",
                        *top.remaining, typ));
                _stack.pop_back();
                _item_done();
            }
            return;
        }
        if (!final) [[unlikely]]
            throw invalid_event_sequence_error(fmt::format("a partial {} chunk outside of a string", typ));
        _write_header(typ, data.size());
        _sink.write(data);
        _item_done();
    }

    void encoder::_write_break()
    {
        if (_pending_tags) [[unlikely]]
            throw invalid_event_sequence_error("a break cannot follow a tag");
        if (_stack.empty()) [[unlikely]]
            throw invalid_event_sequence_error("a break without an open indefinite-length item");
        const auto &top = _stack.back();
        if (top.remaining) [[unlikely]]
            throw invalid_event_sequence_error(fmt::format("a break inside a definite-length item with {} elements remaining", *top.remaining));
        if (top.type == frame_type::map && top.expecting_value) [[unlikely]]
            throw invalid_event_sequence_error("a break between a map key and its value");
        static constexpr uint8_t break_byte = 0xFF;
        _sink.write(buffer { &break_byte, 1 });
        _stack.pop_back();
        _item_done();
    }

    void encoder::_start(const major_type typ, const std::optional<uint64_t> size)
    {
        _check_not_in_string(typ);
        _write_header(typ, size);
        switch (typ) {
            case major_type::array:
            case major_type::map:
                if (size && *size == 0) {
                    _item_done();
                    return;
                }
                _stack.push_back(frame { typ == major_type::map ? frame_type::map : frame_type::array, size });
                break;
            case major_type::bytes:
            case major_type::text:
                _stack.push_back(frame { typ == major_type::text ? frame_type::text : frame_type::bytes, size });
                break;
            [[unlikely]] default:
                throw invalid_event_sequence_error(fmt::format("{} is not a container type", typ));
        }
        _pending_tags = 0;
    }

    void encoder::_check_not_in_string(const major_type typ) const
    {
        if (!_stack.empty() && (_stack.back().type == frame_type::bytes || _stack.back().type == frame_type::text)) [[unlikely]]
            throw invalid_event_sequence_error(fmt::format("a {} item inside a string", typ));
    }

    void encoder::_item_done()
    {
        _pending_tags = 0;
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
            _stack.pop_back();
        }
        ++_items;
    }
}
