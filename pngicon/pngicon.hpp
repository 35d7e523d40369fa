/*
MIT License
Copyright (c) 2025 pngicon authors

Permission is hereby granted, free of charge, to any person obtaining a copy of
this software and associated documentation files (the "Software"), to deal in
the Software without restriction, including without limitation the rights to
use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies
of the Software, and to permit persons to whom the Software is furnished to do
so, subject to the following conditions:
The above copyright notice and this permission notice shall be included in all
copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
SOFTWARE.


ABOUT:

   This and the header files in the `detail` directory are a library for
   writing solid-color square PNG files, used to generate placeholder
   application icons.

   Exactly one PNG shape is produced: 8-bit RGB truecolor (color type 2),
   no interlacing, filter type 0 on every scanline, one IDAT chunk holding a
   zlib stream. Palettes, alpha and interlacing are not supported.

BUILDING:

   Header-only. Link against zlib (deflate and crc32 come from it).

USAGE:

     pngicon::Status pngicon::write_solid_png(const char* path, int size, Rgb color);
     pngicon::Status pngicon::encode_solid_png(int size, Rgb color, std::vector<std::uint8_t>& out);

   or, to stream into your own sink:

     pngicon::Encoder enc;
     enc.start_callbacks(&my_write, &my_ctx);
     pngicon::Status st = enc.write_solid_png(size, color);

   where the callback is:
      void my_write(void *context, const void *data, int size);

   Each function returns Status::Ok on success. A size <= 0 gives
   Status::InvalidSize before anything is written; failing to open or write
   the file gives Status::IoError.

   The deflate level defaults to 9 (best); change it per encoder with
   set_compression_level().
*/

#pragma once
// ------------------------------- Includes -----------------------------------
#include <cstddef>
#include <cstdint>
#include <climits>
#include <new>
#include <stdexcept>
#include <vector>

#include "detail/zlib.hpp"
#include "detail/file_sink.hpp"

namespace pngicon {
    // -------------------------------- Status --------------------------------

    enum class Status : std::uint8_t {
        Ok = 0,
        InvalidSize,    // size <= 0
        IoError,        // open/write/close failed
        CompressFailed, // zlib error, or IDAT too large for one chunk
        OutOfMemory,
        NoSink          // Encoder used before start_callbacks()
    };

    inline const char* status_str(Status s) noexcept {
        switch (s) {
        case Status::Ok:             return "ok";
        case Status::InvalidSize:    return "invalid size";
        case Status::IoError:        return "I/O error";
        case Status::CompressFailed: return "compression failed";
        case Status::OutOfMemory:    return "out of memory";
        case Status::NoSink:         return "no output sink";
        }
        return "unknown";
    }

    // --------------------------------- Color --------------------------------

    struct Rgb {
        std::uint8_t r;
        std::uint8_t g;
        std::uint8_t b;
    };

    constexpr inline bool operator==(Rgb a, Rgb b) noexcept {
        return a.r == b.r && a.g == b.g && a.b == b.b;
    }
    constexpr inline bool operator!=(Rgb a, Rgb b) noexcept { return !(a == b); }

    // keeps the low byte of each component, like raw byte packing
    constexpr inline Rgb rgb(int r, int g, int b) noexcept {
        return { static_cast<std::uint8_t>(r & 0xFF),
                 static_cast<std::uint8_t>(g & 0xFF),
                 static_cast<std::uint8_t>(b & 0xFF) };
    }

    // ------------------------------- Constants ------------------------------

    static constexpr Rgb default_color{ 0, 123, 255 };
    static constexpr int max_compression_level = 9;

    static constexpr std::uint8_t png_signature[8]{ 137,80,78,71,13,10,26,10 };

    static constexpr std::uint8_t IHDR_tag[4]{ 'I','H','D','R' };
    static constexpr std::uint8_t IDAT_tag[4]{ 'I','D','A','T' };
    static constexpr std::uint8_t IEND_tag[4]{ 'I','E','N','D' };

    // CRC-32 of the empty IEND chunk (tag only). Never recomputed.
    static constexpr std::uint32_t iend_crc = 0xAE426082u;

    static constexpr std::uint8_t bit_depth = 8;
    static constexpr std::uint8_t color_type_rgb = 2;

    // filter byte + 3 bytes per pixel, for every row
    constexpr inline std::size_t raw_image_size(int size) noexcept {
        return size <= 0 ? 0u
             : static_cast<std::size_t>(size)
               * (1u + 3u * static_cast<std::size_t>(size));
    }

    // -------------------------------- Tokens --------------------------------

    struct be32_t { std::uint32_t v; };
    struct raw_t { const void* p; std::size_t n; };

    constexpr inline be32_t be32(std::uint32_t x) noexcept { return { x }; }
    constexpr inline raw_t raw(const void* p, std::size_t n) noexcept {
        return { p, n };
    }

    // ------------------------------ Scanlines -------------------------------

    // Raw image buffer: `size` rows of [0, r,g,b, r,g,b, ...].
    inline Status build_scanlines(int size, Rgb color, std::vector<std::uint8_t>& out) noexcept {
        out.clear();
        if (size <= 0) return Status::InvalidSize;

        const std::size_t row_bytes = 1u + 3u * static_cast<std::size_t>(size);
        try {
            out.resize(raw_image_size(size));
        }
        catch (const std::bad_alloc&) {
            return Status::OutOfMemory;
        }
        catch (const std::length_error&) { // larger than vector::max_size()
            return Status::OutOfMemory;
        }

        // first row by hand, the others are copies of it
        std::uint8_t* row = out.data();
        row[0] = 0; // filter type: None
        for (int x = 0; x < size; ++x) {
            std::uint8_t* px = row + 1 + static_cast<std::size_t>(x) * 3u;
            px[0] = color.r;
            px[1] = color.g;
            px[2] = color.b;
        }
        for (int y = 1; y < size; ++y) {
            std::uint8_t* dst = out.data() + static_cast<std::size_t>(y) * row_bytes;
            for (std::size_t i = 0; i < row_bytes; ++i) dst[i] = row[i];
        }
        return Status::Ok;
    }


    struct Encoder {
        using Func = void (*)(void* ctx, const void* data, int size);

        Encoder() = default;

    private:
        Func _func{ nullptr };
        void* _ctx{ nullptr };
        unsigned char _buf[64]{ 0 };
        int _used = 0;

        int _compression_level{ max_compression_level };

    public:

        // defaults to 9; clamped to [0,9] when compressing
        inline void set_compression_level(int v) noexcept { _compression_level = v; }
        inline int get_compression_level() const noexcept { return _compression_level; }

        inline bool has_sink() const noexcept { return _func != nullptr; }

        inline bool is_exceeds_buffer_size(int size) const noexcept {
            return size > static_cast<int>(sizeof(_buf));
        }

        inline void start_callbacks(Func c, void* ctx) noexcept {
            _func = c;
            _ctx = ctx;
            _used = 0;
        }

        inline void flush() noexcept {
            if (_used && _func) {
                _func(_ctx, _buf, _used);
                _used = 0;
            }
        }

        // large payloads go straight to the sink, split to fit the int size
        inline void write_bytes_direct(const void* data, std::size_t n) noexcept {
            if (!_func || !data || n == 0) return;
            if (_used) flush();
            const auto* p = static_cast<const std::uint8_t*>(data);
            while (n > 0) {
                const std::size_t take = n > static_cast<std::size_t>(INT_MAX)
                    ? static_cast<std::size_t>(INT_MAX) : n;
                _func(_ctx, p, static_cast<int>(take));
                p += take;
                n -= take;
            }
        }

        inline void write_byte(std::uint8_t byte) noexcept {
            if (is_exceeds_buffer_size(_used + 1)) flush();
            _buf[_used++] = byte;
        }

    private:

        inline void emit(be32_t t) noexcept {
            if (is_exceeds_buffer_size(_used + 4)) flush();
            _buf[_used++] = static_cast<std::uint8_t>((t.v >> 24) & 0xFFu);
            _buf[_used++] = static_cast<std::uint8_t>((t.v >> 16) & 0xFFu);
            _buf[_used++] = static_cast<std::uint8_t>((t.v >> 8) & 0xFFu);
            _buf[_used++] = static_cast<std::uint8_t>(t.v & 0xFFu);
        }
        inline void emit(raw_t r) noexcept {
            // small pieces (tags, IHDR) stay in the staging buffer
            if (r.n <= sizeof(_buf)) {
                if (is_exceeds_buffer_size(_used + static_cast<int>(r.n))) flush();
                const auto* p = static_cast<const std::uint8_t*>(r.p);
                for (std::size_t i = 0; i < r.n; ++i) write_byte(p[i]);
                return;
            }
            write_bytes_direct(r.p, r.n);
        }

        template <typename... Ts>
        inline void write_tokens(Ts... ts) noexcept {
            int dummy[] = { 0, (emit(ts), 0)... }; // C++11 pack expansion
            (void)dummy;
        }

    public:
        inline Status write_signature() noexcept;

        // length, tag, data, CRC-32(tag + data)
        inline Status write_chunk(const std::uint8_t tag[4], const std::uint8_t* data, std::size_t len) noexcept;

        inline Status write_ihdr(std::uint32_t width, std::uint32_t height) noexcept;

        // fixed trailer: zero length, IEND, constant CRC
        inline Status write_iend() noexcept;

        // ---- MAIN IDEA: scanlines -> zlib -> IHDR/IDAT/IEND chunks -> sink ----
        inline Status write_solid_png(int size, Rgb color) noexcept;
    }; // struct Encoder




    Status Encoder::write_signature() noexcept {
        if (!_func) return Status::NoSink;
        write_tokens(raw(png_signature, 8));
        return Status::Ok;
    }

    Status Encoder::write_chunk(const std::uint8_t tag[4], const std::uint8_t* data, std::size_t len) noexcept {
        if (!_func) return Status::NoSink;
        if (len > 0x7FFFFFFFu) return Status::CompressFailed; // PNG chunk length limit
        if (len && !data) return Status::CompressFailed;

        const std::uint32_t crc = zlib::chunk_crc(tag, data, len);

        write_tokens(
            be32(static_cast<std::uint32_t>(len)),
            raw(tag, 4)
        );
        if (len) write_tokens(raw(data, len));
        write_tokens(be32(crc));
        return Status::Ok;
    }

    Status Encoder::write_ihdr(std::uint32_t width, std::uint32_t height) noexcept {
        std::uint8_t ihdr[13];
        zlib::store_be32(ihdr + 0, width);
        zlib::store_be32(ihdr + 4, height);
        ihdr[8] = bit_depth;
        ihdr[9] = color_type_rgb;
        ihdr[10] = 0;           // compression method
        ihdr[11] = 0;           // filter method
        ihdr[12] = 0;           // interlace method
        return write_chunk(IHDR_tag, ihdr, sizeof(ihdr));
    }

    Status Encoder::write_iend() noexcept {
        if (!_func) return Status::NoSink;
        write_tokens(
            be32(0),
            raw(IEND_tag, 4),
            be32(iend_crc)
        );
        return Status::Ok;
    }

    Status Encoder::write_solid_png(int size, Rgb color) noexcept {
        if (!_func) return Status::NoSink;
        if (size <= 0) return Status::InvalidSize;

        // compress everything first, so a failure leaves the sink untouched
        std::vector<std::uint8_t> raw_image;
        Status st = build_scanlines(size, color, raw_image);
        if (st != Status::Ok) return st;

        std::vector<std::uint8_t> idat;
        if (!zlib::zlib_compress(raw_image.data(), raw_image.size(), idat, _compression_level))
            return Status::CompressFailed;
        if (idat.size() > 0x7FFFFFFFu) return Status::CompressFailed;

        // release the raw rows before streaming
        std::vector<std::uint8_t>().swap(raw_image);

        if ((st = write_signature()) != Status::Ok) return st;
        if ((st = write_ihdr(static_cast<std::uint32_t>(size), static_cast<std::uint32_t>(size))) != Status::Ok) return st;
        if ((st = write_chunk(IDAT_tag, idat.data(), idat.size())) != Status::Ok) return st;
        if ((st = write_iend()) != Status::Ok) return st;

        flush();
        return Status::Ok;
    }



    // ------------------------------ Free helpers ----------------------------

    namespace detail {
        struct VectorSink {
            std::vector<std::uint8_t>* out{ nullptr };
            bool ok{ true };
        };

        // Encoder callback; ctx is a VectorSink*
        static inline void vector_sink_write(void* ctx, const void* data, int size) noexcept {
            VectorSink* s = static_cast<VectorSink*>(ctx);
            if (!s || !s->ok || !s->out || !data || size <= 0) return;
            const auto* p = static_cast<const std::uint8_t*>(data);
            try {
                s->out->insert(s->out->end(), p, p + size);
            }
            catch (const std::bad_alloc&) {
                s->ok = false;
            }
        }
    } // namespace detail

    inline Status encode_solid_png(int size, Rgb color, std::vector<std::uint8_t>& out) noexcept {
        out.clear();
        if (size <= 0) return Status::InvalidSize;

        detail::VectorSink sink;
        sink.out = &out;

        Encoder enc;
        enc.start_callbacks(&detail::vector_sink_write, &sink);

        Status st = enc.write_solid_png(size, color);
        if (st == Status::Ok && !sink.ok) st = Status::OutOfMemory;
        if (st != Status::Ok) out.clear();
        return st;
    }

    // The whole file is encoded in memory first; `path` is only opened once
    // encoding succeeded, so a failed encode leaves an existing file as it was.
    inline Status write_solid_png(const char* path, int size, Rgb color = default_color) noexcept {
        if (size <= 0) return Status::InvalidSize;

        std::vector<std::uint8_t> bytes;
        const Status st = encode_solid_png(size, color, bytes);
        if (st != Status::Ok) return st;

        detail::FileSink sink;
        if (!sink.open(path)) return Status::IoError;

        const std::uint8_t* p = bytes.data();
        std::size_t left = bytes.size();
        while (left > 0 && sink.ok) {
            const int n = left > static_cast<std::size_t>(INT_MAX) ? INT_MAX : static_cast<int>(left);
            detail::file_sink_write(&sink, p, n);
            p += n;
            left -= static_cast<std::size_t>(n);
        }
        return sink.close() ? Status::Ok : Status::IoError;
    }

} // namespace pngicon
