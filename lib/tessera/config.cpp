/* This file is part of Tessera project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <tessera/config.hpp>
#include <tessera/logger.hpp>
#ifdef TESSERA_EXT_DATE_TIME
#   include <tessera/cbor/ext/date-time.hpp>
#endif
#ifdef TESSERA_EXT_BIGNUM
#   include <tessera/cbor/ext/bignum.hpp>
#endif

namespace tessera {
    namespace {
        template<typename T>
        T parse_enum(const std::string_view key, const json::value &j, const std::initializer_list<std::pair<std::string_view, T>> names)
        {
            if (!j.is_string())
                throw error(fmt::format("config option {} must be a string but got: {}", key, json::serialize(j)));
            const auto &s = j.get_string();
            const std::string_view name { s.data(), s.size() };
            for (const auto &[n, v]: names) {
                if (n == name)
                    return v;
            }
            throw error(fmt::format("unsupported value of config option {}: {}", key, name));
        }

        size_t parse_depth(const std::string_view key, const json::value &j)
        {
            boost::system::error_code ec {};
            const auto depth = j.to_number<uint64_t>(ec);
            if (ec || depth == 0)
                throw error(fmt::format("config option {} must be a positive integer but got: {}", key, json::serialize(j)));
            return depth;
        }

        std::vector<std::string> parse_extensions(const json::value &j)
        {
            if (!j.is_array())
                throw error(fmt::format("config option extensions must be an array but got: {}", json::serialize(j)));
            std::vector<std::string> names {};
            for (const auto &item: j.get_array()) {
                if (!item.is_string())
                    throw error(fmt::format("extension names must be strings but got: {}", json::serialize(item)));
                const auto &s = item.get_string();
                names.emplace_back(s.data(), s.size());
            }
            return names;
        }
    }

    codec_config codec_config::from_json(const json::object &j)
    {
        codec_config cfg {};
        for (const auto &[key, val]: j) {
            const std::string_view k { key.data(), key.size() };
            if (k == "max_nesting_depth") {
                cfg.decoder.max_nesting_depth = parse_depth(k, val);
            } else if (k == "max_tree_depth") {
                cfg.tree.max_tree_depth = parse_depth(k, val);
            } else if (k == "float_width") {
                cfg.encoder.floats = parse_enum<cbor::float_width>(k, val, {
                    { "shortest", cbor::float_width::shortest },
                    { "always_double", cbor::float_width::always_double }
                });
            } else if (k == "date_time_encode_style") {
                cfg.date_time_style = parse_enum<cbor::date_time_encode_style>(k, val, {
                    { "prefer_text", cbor::date_time_encode_style::prefer_text },
                    { "prefer_numeric", cbor::date_time_encode_style::prefer_numeric }
                });
            } else if (k == "bignum_decode_style") {
                cfg.bignum_style = parse_enum<cbor::bignum_decode_style>(k, val, {
                    { "convert", cbor::bignum_decode_style::convert },
                    { "force_convert", cbor::bignum_decode_style::force_convert },
                    { "num", cbor::bignum_decode_style::num }
                });
            } else if (k == "extensions") {
                cfg.extensions = parse_extensions(val);
            } else {
                throw error(fmt::format("unsupported config option: {}", k));
            }
        }
        return cfg;
    }

    codec_config codec_config::load(const std::string &path)
    {
        logger::debug("loading the codec config from {}", path);
        const auto j = json::load(path);
        if (!j.is_object())
            throw error(fmt::format("the codec config in {} must be a json object", path));
        return from_json(j.get_object());
    }

    cbor::registry codec_config::make_registry() const
    {
        cbor::registry reg {};
        for (const auto &name: extensions) {
            if (name == "date_time") {
#ifdef TESSERA_EXT_DATE_TIME
                reg.add(std::make_shared<cbor::ext::date_time_extension>(date_time_style));
#else
                throw error("the date_time extension is not compiled in, rebuild with TESSERA_EXT_DATE_TIME");
#endif
            } else if (name == "bignum") {
#ifdef TESSERA_EXT_BIGNUM
                reg.add(std::make_shared<cbor::ext::bignum_extension>(bignum_style));
#else
                throw error("the bignum extension is not compiled in, rebuild with TESSERA_EXT_BIGNUM");
#endif
            } else {
                throw error(fmt::format("unknown extension: {}", name));
            }
        }
        return reg;
    }
}
