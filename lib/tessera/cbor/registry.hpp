/* This file is part of Tessera project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TESSERA_CBOR_REGISTRY_HPP
#define TESSERA_CBOR_REGISTRY_HPP

#include <map>
#include <memory>
#include <optional>
#include <vector>
#include <tessera/cbor/value.hpp>

namespace tessera::cbor {
    /*
     * A codec for one or more CBOR tags.
     * decode receives the fully built tagged item and returns an empty optional when the item should stay a generic tag.
     * Any exception thrown by decode is reported as extension_decode_failed.
     * encode returns an empty optional for extension values that belong to other extensions;
     * otherwise the returned value is flattened in place of the extension value, typically as a tagged_value.
     */
    struct extension {
        virtual ~extension() =default;
        virtual std::string_view name() const =0;
        virtual std::vector<uint64_t> tags() const =0;
        virtual std::optional<value> decode(uint64_t tag, const value &inner) const =0;
        virtual std::optional<value> encode(const extension_value &val) const =0;
    };

    struct registry {
        // a shared empty registry
        static const registry &none();

        registry() =default;
        registry &add(std::shared_ptr<const extension> ext);
        const extension *find(uint64_t tag) const;
        std::optional<value> encode(const extension_value &val) const;

        bool empty() const noexcept
        {
            return _by_tag.empty();
        }

        size_t size() const noexcept
        {
            return _exts.size();
        }
    private:
        std::map<uint64_t, std::shared_ptr<const extension>> _by_tag {};
        std::vector<std::shared_ptr<const extension>> _exts {};
    };
}

#endif // !TESSERA_CBOR_REGISTRY_HPP
