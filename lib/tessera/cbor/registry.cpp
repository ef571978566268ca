/* This file is part of Tessera project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <tessera/cbor/registry.hpp>
#include <tessera/logger.hpp>

namespace tessera::cbor {
    const registry &registry::none()
    {
        static const registry reg {};
        return reg;
    }

    registry &registry::add(std::shared_ptr<const extension> ext)
    {
        if (!ext) [[unlikely]]
            throw tessera::error("cannot register an empty extension");
        const auto ext_tags = ext->tags();
        if (ext_tags.empty()) [[unlikely]]
            throw tessera::error(fmt::format("cbor extension {} does not declare any tags", ext->name()));
        for (const auto tag: ext_tags) {
            if (const auto it = _by_tag.find(tag); it != _by_tag.end()) [[unlikely]]
                throw tessera::error(fmt::format("cbor tag {} of extension {} is already registered by extension {}", tag, ext->name(), it->second->name()));
        }
        for (const auto tag: ext_tags)
            _by_tag.try_emplace(tag, ext);
        logger::debug("registered cbor extension {} for tags {}", ext->name(), ext_tags);
        _exts.emplace_back(std::move(ext));
        return *this;
    }

    const extension *registry::find(const uint64_t tag) const
    {
        if (const auto it = _by_tag.find(tag); it != _by_tag.end())
            return it->second.get();
        return nullptr;
    }

    std::optional<value> registry::encode(const extension_value &val) const
    {
        for (const auto &ext: _exts) {
            if (auto res = ext->encode(val); res)
                return res;
        }
        return {};
    }
}
