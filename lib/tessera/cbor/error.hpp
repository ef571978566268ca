/* This file is part of Tessera project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TESSERA_CBOR_ERROR_HPP
#define TESSERA_CBOR_ERROR_HPP

#include <cstdint>
#include <string>
#include <tessera/common/error.hpp>
#include <tessera/common/format.hpp>

namespace tessera::cbor {
    enum class error_kind: uint8_t {
        malformed_header,
        truncated_input,
        invalid_indefinite_chunk,
        unpaired_map_break,
        nesting_too_deep,
        tree_too_deep,
        invalid_utf8,
        invalid_event_sequence,
        extension_decode_failed,
        excess_data
    };
}

namespace fmt {
    template<>
    struct formatter<tessera::cbor::error_kind>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using tessera::cbor::error_kind;
            switch (v) {
                case error_kind::malformed_header: return fmt::format_to(ctx.out(), "malformed header");
                case error_kind::truncated_input: return fmt::format_to(ctx.out(), "truncated input");
                case error_kind::invalid_indefinite_chunk: return fmt::format_to(ctx.out(), "invalid indefinite chunk");
                case error_kind::unpaired_map_break: return fmt::format_to(ctx.out(), "unpaired map break");
                case error_kind::nesting_too_deep: return fmt::format_to(ctx.out(), "nesting too deep");
                case error_kind::tree_too_deep: return fmt::format_to(ctx.out(), "tree too deep");
                case error_kind::invalid_utf8: return fmt::format_to(ctx.out(), "invalid utf-8");
                case error_kind::invalid_event_sequence: return fmt::format_to(ctx.out(), "invalid event sequence");
                case error_kind::extension_decode_failed: return fmt::format_to(ctx.out(), "extension decode failed");
                case error_kind::excess_data: return fmt::format_to(ctx.out(), "excess data");
                default: return fmt::format_to(ctx.out(), "error_kind: {}", static_cast<int>(v));
            }
        }
    };
}

namespace tessera::cbor {
    struct error: tessera::error {
        explicit error(const error_kind kind, const std::string_view msg):
            tessera::error { fmt::format("cbor {}: {}", kind, msg) },
            _kind { kind }
        {
        }

        error_kind kind() const noexcept
        {
            return _kind;
        }
    private:
        error_kind _kind;
    };

    template<error_kind K>
    struct error_of_kind: error {
        static constexpr error_kind kind_value = K;

        explicit error_of_kind(const std::string_view msg): error { K, msg }
        {
        }
    };

    using malformed_header_error = error_of_kind<error_kind::malformed_header>;
    using truncated_input_error = error_of_kind<error_kind::truncated_input>;
    using invalid_indefinite_chunk_error = error_of_kind<error_kind::invalid_indefinite_chunk>;
    using unpaired_map_break_error = error_of_kind<error_kind::unpaired_map_break>;
    using nesting_too_deep_error = error_of_kind<error_kind::nesting_too_deep>;
    using tree_too_deep_error = error_of_kind<error_kind::tree_too_deep>;
    using invalid_utf8_error = error_of_kind<error_kind::invalid_utf8>;
    using invalid_event_sequence_error = error_of_kind<error_kind::invalid_event_sequence>;
    using excess_data_error = error_of_kind<error_kind::excess_data>;

    // a registered extension rejected well-formed data; an unknown tag is never reported this way
    struct extension_decode_failed_error: error {
        explicit extension_decode_failed_error(const uint64_t tag, const std::string_view cause):
            error { error_kind::extension_decode_failed, fmt::format("tag {}: {}", tag, cause) },
            _tag { tag }, _cause { cause }
        {
        }

        uint64_t tag() const noexcept
        {
            return _tag;
        }

        const std::string &cause() const noexcept
        {
            return _cause;
        }
    private:
        uint64_t _tag;
        std::string _cause;
    };
}

#endif // !TESSERA_CBOR_ERROR_HPP
