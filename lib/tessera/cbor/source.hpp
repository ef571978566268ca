/* This file is part of Tessera project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TESSERA_CBOR_SOURCE_HPP
#define TESSERA_CBOR_SOURCE_HPP

#include <tessera/common/bytes.hpp>

namespace tessera::cbor {
    enum class peek_status: uint8_t {
        ok, need_more, eof
    };

    struct peek_result {
        peek_status status;
        // valid only when status is ok; always exactly the requested number of bytes
        buffer data {};
    };

    // The byte source consumed by the decoder. peek never consumes; advance drops bytes that were peeked before.
    struct source {
        virtual ~source() =default;
        virtual peek_result peek(size_t num_bytes) =0;
        virtual void advance(size_t num_bytes) =0;
    };

    // The byte sink written by the encoder.
    struct sink {
        virtual ~sink() =default;
        virtual void write(buffer bytes) =0;
    };

    // A complete in-memory document; never asks for more data.
    struct buffer_source: source {
        explicit buffer_source(const buffer data) noexcept: _data { data }
        {
        }

        peek_result peek(const size_t num_bytes) override
        {
            if (num_bytes > _data.size() - _offset)
                return { peek_status::eof };
            return { peek_status::ok, _data.subbuf(_offset, num_bytes) };
        }

        void advance(const size_t num_bytes) override
        {
            if (num_bytes > _data.size() - _offset) [[unlikely]]
                throw tessera::error(fmt::format("cannot advance by {} bytes at offset {} of a {}-byte buffer", num_bytes, _offset, _data.size()));
            _offset += num_bytes;
        }

        size_t offset() const noexcept
        {
            return _offset;
        }

        size_t remaining() const noexcept
        {
            return _data.size() - _offset;
        }
    private:
        buffer _data;
        size_t _offset = 0;
    };

    // Bytes arrive over time through feed(); close() declares that no more bytes will come.
    // Feeding invalidates the views returned by earlier peeks.
    struct feed_source: source {
        void feed(const buffer bytes)
        {
            if (_closed) [[unlikely]]
                throw tessera::error("cannot feed data into a closed source");
            if (_offset > 0 && _offset >= _data.size() / 2) {
                _data.erase(_data.begin(), _data.begin() + static_cast<ptrdiff_t>(_offset));
                _offset = 0;
            }
            _data << bytes;
        }

        void close() noexcept
        {
            _closed = true;
        }

        bool closed() const noexcept
        {
            return _closed;
        }

        size_t buffered() const noexcept
        {
            return _data.size() - _offset;
        }

        peek_result peek(const size_t num_bytes) override
        {
            if (num_bytes > _data.size() - _offset)
                return { _closed ? peek_status::eof : peek_status::need_more };
            return { peek_status::ok, buffer { _data.data() + _offset, num_bytes } };
        }

        void advance(const size_t num_bytes) override
        {
            if (num_bytes > _data.size() - _offset) [[unlikely]]
                throw tessera::error(fmt::format("cannot advance by {} bytes with only {} bytes buffered", num_bytes, buffered()));
            _offset += num_bytes;
        }
    private:
        uint8_vector _data {};
        size_t _offset = 0;
        bool _closed = false;
    };

    struct vector_sink: sink {
        void write(const buffer bytes) override
        {
            _data << bytes;
        }

        uint8_vector &data() noexcept
        {
            return _data;
        }

        const uint8_vector &data() const noexcept
        {
            return _data;
        }
    private:
        uint8_vector _data {};
    };
}

#endif // !TESSERA_CBOR_SOURCE_HPP
