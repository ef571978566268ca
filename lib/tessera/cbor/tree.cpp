/* This file is part of Tessera project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <tessera/cbor/tree.hpp>
#include <tessera/logger.hpp>

namespace tessera::cbor {
    tree_builder::tree_builder(const registry &reg, const tree_config &cfg): _reg { reg }, _cfg { cfg }
    {
    }

    std::optional<value> tree_builder::build(decoder &dec, source &src)
    {
        auto ev = dec.next(src);
        if (!ev)
            return {};
        return _build(dec, src, *ev, 0);
    }

    value tree_builder::_build(decoder &dec, source &src, const event &ev, const size_t depth)
    {
        return std::visit([&](const auto &v) -> value {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, uint_event>) {
                return value { v.val };
            } else if constexpr (std::is_same_v<T, nint_event>) {
                return value { nint_value { v.val } };
            } else if constexpr (std::is_same_v<T, bytes_chunk>) {
                return value { uint8_vector { v.data } };
            } else if constexpr (std::is_same_v<T, text_chunk>) {
                return value { std::string { v.text() } };
            } else if constexpr (std::is_same_v<T, start_bytes>) {
                uint8_vector res {};
                for (;;) {
                    const auto chunk_ev = _next(dec, src);
                    if (std::holds_alternative<break_event>(chunk_ev))
                        break;
                    const auto &chunk = std::get<bytes_chunk>(chunk_ev);
                    res << chunk.data;
                    if (chunk.final && v.size)
                        break;
                }
                return value { std::move(res) };
            } else if constexpr (std::is_same_v<T, start_text>) {
                std::string res {};
                for (;;) {
                    const auto chunk_ev = _next(dec, src);
                    if (std::holds_alternative<break_event>(chunk_ev))
                        break;
                    const auto &chunk = std::get<text_chunk>(chunk_ev);
                    res += chunk.text();
                    if (chunk.final && v.size)
                        break;
                }
                return value { std::move(res) };
            } else if constexpr (std::is_same_v<T, start_array>) {
                _check_depth(depth);
                array_value res {};
                if (v.size) {
                    for (uint64_t i = 0; i < *v.size; ++i)
                        res.emplace_back(_build(dec, src, _next(dec, src), depth + 1));
                } else {
                    for (;;) {
                        const auto item_ev = _next(dec, src);
                        if (std::holds_alternative<break_event>(item_ev))
                            break;
                        res.emplace_back(_build(dec, src, item_ev, depth + 1));
                    }
                }
                return value { std::move(res) };
            } else if constexpr (std::is_same_v<T, start_map>) {
                _check_depth(depth);
                map_value res {};
                if (v.size) {
                    for (uint64_t i = 0; i < *v.size; ++i) {
                        auto key = _build(dec, src, _next(dec, src), depth + 1);
                        res.emplace_back(std::move(key), _build(dec, src, _next(dec, src), depth + 1));
                    }
                } else {
                    for (;;) {
                        const auto key_ev = _next(dec, src);
                        if (std::holds_alternative<break_event>(key_ev))
                            break;
                        auto key = _build(dec, src, key_ev, depth + 1);
                        res.emplace_back(std::move(key), _build(dec, src, _next(dec, src), depth + 1));
                    }
                }
                return value { std::move(res) };
            } else if constexpr (std::is_same_v<T, tag_event>) {
                return _build_tag(dec, src, v.id, depth);
            } else if constexpr (std::is_same_v<T, simple_event>) {
                return value { simple_value { v.val } };
            } else if constexpr (std::is_same_v<T, bool_event>) {
                return value { v.val };
            } else if constexpr (std::is_same_v<T, null_event>) {
                return value { null_value {} };
            } else if constexpr (std::is_same_v<T, undefined_event>) {
                return value { undefined_value {} };
            } else if constexpr (std::is_same_v<T, float_event>) {
                return value { v.val };
            } else {
                throw malformed_header_error("a break where a data item was expected");
            }
        }, ev);
    }

    value tree_builder::_build_tag(decoder &dec, source &src, const uint64_t id, const size_t depth)
    {
        _check_depth(depth);
        auto inner = _build(dec, src, _next(dec, src), depth + 1);
        if (const auto *ext = _reg.find(id); ext) {
            std::optional<value> res {};
            try {
                res = ext->decode(id, inner);
            } catch (const std::exception &ex) {
                throw extension_decode_failed_error(id, ex.what());
            }
            if (res)
                return std::move(*res);
            logger::trace("cbor extension {} left tag {} as a generic value", ext->name(), id);
        }
        return value { tagged_value { id, std::move(inner) } };
    }

    event tree_builder::_next(decoder &dec, source &src)
    {
        auto ev = dec.next(src);
        if (!ev) [[unlikely]]
            throw truncated_input_error("the document ended inside an item");
        return std::move(*ev);
    }

    void tree_builder::_check_depth(const size_t depth) const
    {
        if (depth >= _cfg.max_tree_depth) [[unlikely]]
            throw tree_too_deep_error(fmt::format("the value tree is deeper than {} levels", _cfg.max_tree_depth));
    }

    static void flatten_item(const value &val, encoder &enc, const registry &reg, const tree_config &cfg, const size_t depth)
    {
        std::visit([&](const auto &v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, uint64_t>) {
                enc.uint(v);
            } else if constexpr (std::is_same_v<T, nint_value>) {
                enc.nint(v.val);
            } else if constexpr (std::is_same_v<T, uint8_vector>) {
                enc.bytes(v);
            } else if constexpr (std::is_same_v<T, std::string>) {
                enc.text(v);
            } else if constexpr (std::is_same_v<T, array_value>) {
                if (depth >= cfg.max_tree_depth) [[unlikely]]
                    throw tree_too_deep_error(fmt::format("the value tree is deeper than {} levels", cfg.max_tree_depth));
                enc.array(v.size());
                for (const auto &item: v)
                    flatten_item(item, enc, reg, cfg, depth + 1);
            } else if constexpr (std::is_same_v<T, map_value>) {
                if (depth >= cfg.max_tree_depth) [[unlikely]]
                    throw tree_too_deep_error(fmt::format("the value tree is deeper than {} levels", cfg.max_tree_depth));
                enc.map(v.size());
                for (const auto &[k, item]: v) {
                    flatten_item(k, enc, reg, cfg, depth + 1);
                    flatten_item(item, enc, reg, cfg, depth + 1);
                }
            } else if constexpr (std::is_same_v<T, tagged_value>) {
                if (depth >= cfg.max_tree_depth) [[unlikely]]
                    throw tree_too_deep_error(fmt::format("the value tree is deeper than {} levels", cfg.max_tree_depth));
                enc.tag(v.id());
                flatten_item(v.val(), enc, reg, cfg, depth + 1);
            } else if constexpr (std::is_same_v<T, simple_value>) {
                enc.simple(v.val);
            } else if constexpr (std::is_same_v<T, bool>) {
                enc.boolean(v);
            } else if constexpr (std::is_same_v<T, null_value>) {
                enc.s_null();
            } else if constexpr (std::is_same_v<T, undefined_value>) {
                enc.s_undefined();
            } else if constexpr (std::is_same_v<T, double>) {
                enc.float64(v);
            } else {
                if (!v) [[unlikely]]
                    throw invalid_event_sequence_error("an empty extension value");
                const auto encoded = reg.encode(*v);
                if (!encoded) [[unlikely]]
                    throw invalid_event_sequence_error(fmt::format("no registered extension can encode a {} value", v->type_name()));
                if (depth >= cfg.max_tree_depth) [[unlikely]]
                    throw tree_too_deep_error(fmt::format("the value tree is deeper than {} levels", cfg.max_tree_depth));
                flatten_item(*encoded, enc, reg, cfg, depth + 1);
            }
        }, val.content());
    }

    void flatten(const value &val, encoder &enc, const registry &reg, const tree_config &cfg)
    {
        flatten_item(val, enc, reg, cfg, 0);
    }

    value parse(const buffer data, const registry &reg, const decoder_config &dec_cfg, const tree_config &tree_cfg)
    {
        buffer_source src { data };
        decoder dec { dec_cfg };
        tree_builder builder { reg, tree_cfg };
        auto val = builder.build(dec, src);
        if (!val) [[unlikely]]
            throw truncated_input_error("the data contains no items");
        dec.finish(src);
        return std::move(*val);
    }

    uint8_vector encode(const value &val, const registry &reg, const encoder_config &enc_cfg)
    {
        buffer_encoder enc { enc_cfg };
        flatten(val, enc, reg);
        enc.finish();
        return std::move(enc.cbor());
    }
}
