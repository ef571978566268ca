/* This file is part of Tessera project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TESSERA_CBOR_TREE_HPP
#define TESSERA_CBOR_TREE_HPP

#include <tessera/cbor/decoder.hpp>
#include <tessera/cbor/encoder.hpp>
#include <tessera/cbor/registry.hpp>
#include <tessera/cbor/value.hpp>

namespace tessera::cbor {
    struct tree_config {
        size_t max_tree_depth = default_max_tree_depth;
    };

    // Materializes complete items from the event stream; the source must provide each item in full.
    struct tree_builder {
        explicit tree_builder(const registry &reg=registry::none(), const tree_config &cfg={});

        // empty when the document has no more items
        std::optional<value> build(decoder &dec, source &src);
    private:
        const registry &_reg;
        tree_config _cfg;

        value _build(decoder &dec, source &src, const event &ev, size_t depth);
        value _build_tag(decoder &dec, source &src, uint64_t id, size_t depth);
        event _next(decoder &dec, source &src);
        void _check_depth(size_t depth) const;
    };

    // always emits definite lengths
    extern void flatten(const value &val, encoder &enc, const registry &reg=registry::none(), const tree_config &cfg={});

    // exactly one item; trailing bytes are reported as excess_data
    extern value parse(buffer data, const registry &reg=registry::none(), const decoder_config &dec_cfg={}, const tree_config &tree_cfg={});
    extern uint8_vector encode(const value &val, const registry &reg=registry::none(), const encoder_config &enc_cfg={});
}

#endif // !TESSERA_CBOR_TREE_HPP
