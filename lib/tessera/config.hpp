/* This file is part of Tessera project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TESSERA_CONFIG_HPP
#define TESSERA_CONFIG_HPP

#include <string>
#include <vector>
#include <tessera/common/json.hpp>
#include <tessera/cbor/decoder.hpp>
#include <tessera/cbor/encoder.hpp>
#include <tessera/cbor/registry.hpp>
#include <tessera/cbor/tree.hpp>

namespace tessera {
    /*
     * All codec settings in one place. The JSON form uses the member names as keys:
     * {
     *   "max_nesting_depth": 512,
     *   "max_tree_depth": 512,
     *   "float_width": "shortest" | "always_double",
     *   "date_time_encode_style": "prefer_text" | "prefer_numeric",
     *   "bignum_decode_style": "convert" | "force_convert" | "num",
     *   "extensions": [ "date_time", "bignum" ]
     * }
     */
    struct codec_config {
        cbor::decoder_config decoder {};
        cbor::encoder_config encoder {};
        cbor::tree_config tree {};
        cbor::date_time_encode_style date_time_style = cbor::date_time_encode_style::prefer_text;
        cbor::bignum_decode_style bignum_style = cbor::bignum_decode_style::convert;
        std::vector<std::string> extensions {};

        static codec_config from_json(const json::object &j);
        static codec_config load(const std::string &path);

        // registers the listed extensions; a name whose extension is not compiled in is an error
        cbor::registry make_registry() const;
    };
}

#endif // !TESSERA_CONFIG_HPP
