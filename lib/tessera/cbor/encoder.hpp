/* This file is part of Tessera project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TESSERA_CBOR_ENCODER_HPP
#define TESSERA_CBOR_ENCODER_HPP

#include <vector>
#include <tessera/cbor/event.hpp>
#include <tessera/cbor/header.hpp>
#include <tessera/cbor/source.hpp>

namespace tessera::cbor {
    enum class float_width: uint8_t {
        shortest, always_double
    };

    struct encoder_config {
        float_width floats = float_width::shortest;
    };

    struct encoder {
        explicit encoder(sink &dst, const encoder_config &cfg={});

        void write_event(const event &ev);
        // true once a complete top-level item has been written and nothing is left open
        bool ready_to_finish() const noexcept;
        void finish();

        size_t depth() const noexcept
        {
            return _stack.size();
        }

        bool failed() const noexcept
        {
            return _failed;
        }

        encoder &uint(const uint64_t val)
        {
            write_event(uint_event { val });
            return *this;
        }

        // the negative value must be already converted to the uint64_t representation
        encoder &nint(const uint64_t val)
        {
            write_event(nint_event { val });
            return *this;
        }

        encoder &integer(const int64_t val)
        {
            write_event(create_signed(val));
            return *this;
        }

        encoder &bytes()
        {
            write_event(start_bytes {});
            return *this;
        }

        encoder &bytes(const buffer buf)
        {
            write_event(bytes_chunk { buf, true });
            return *this;
        }

        encoder &text()
        {
            write_event(start_text {});
            return *this;
        }

        encoder &text(const std::string_view sv)
        {
            write_event(text_chunk { buffer { sv }, true });
            return *this;
        }

        encoder &array()
        {
            write_event(start_array {});
            return *this;
        }

        encoder &array(const size_t sz)
        {
            write_event(start_array { sz });
            return *this;
        }

        encoder &map()
        {
            write_event(start_map {});
            return *this;
        }

        encoder &map(const size_t sz)
        {
            write_event(start_map { sz });
            return *this;
        }

        encoder &tag(const uint64_t id)
        {
            write_event(tag_event { id });
            return *this;
        }

        encoder &simple(const uint8_t val)
        {
            write_event(simple_event { val });
            return *this;
        }

        encoder &boolean(const bool val)
        {
            write_event(bool_event { val });
            return *this;
        }

        encoder &s_null()
        {
            write_event(null_event {});
            return *this;
        }

        encoder &s_undefined()
        {
            write_event(undefined_event {});
            return *this;
        }

        encoder &float64(const double val)
        {
            write_event(float_event { val });
            return *this;
        }

        encoder &s_break()
        {
            write_event(break_event {});
            return *this;
        }
    private:
        enum class frame_type: uint8_t {
            array, map, bytes, text
        };

        struct frame {
            frame_type type;
            // pairs for maps, bytes for definite strings; empty for indefinite frames
            std::optional<uint64_t> remaining {};
            bool expecting_value = false;
        };

        sink &_sink;
        encoder_config _cfg;
        std::vector<frame> _stack {};
        size_t _pending_tags = 0;
        size_t _items = 0;
        bool _failed = false;

        void _write(const event &ev);
        void _write_header(major_type typ, argument arg, std::optional<argument_width> width={});
        void _write_float(double val);
        void _write_chunk(major_type typ, buffer data, bool final);
        void _write_break();
        void _start(major_type typ, std::optional<uint64_t> size);
        void _check_not_in_string(major_type typ) const;
        void _item_done();
    };

    // owns the produced bytes
    struct buffer_encoder: encoder {
        explicit buffer_encoder(const encoder_config &cfg={}): encoder { _sink, cfg }
        {
        }

        [[nodiscard]] uint8_vector &cbor()
        {
            return _sink.data();
        }

        [[nodiscard]] const uint8_vector &cbor() const
        {
            return _sink.data();
        }
    private:
        vector_sink _sink {};
    };
}

#endif // !TESSERA_CBOR_ENCODER_HPP
