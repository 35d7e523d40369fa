#pragma once

// ------------------------------- Includes -----------------------------------
#include <cstddef>
#include <cstdint>
#include <new>
#include <vector>

#include <zlib.h>

namespace pngicon {
namespace zlib {

    // ------------------------------ CRC32 (PNG) ------------------------------
    // Standard CRC-32 (ISO-3309 polynomial) as computed by zlib.
    // Start with crc = 0; every returned value is already finalized and can be
    // fed back in to continue over more bytes.
    static inline std::uint32_t crc32_update(std::uint32_t crc, const std::uint8_t* buf, std::size_t len) noexcept {
        while (len > 0) {
            // zlib takes uInt lengths
            const uInt take = len > 0x40000000u ? 0x40000000u : static_cast<uInt>(len);
            crc = static_cast<std::uint32_t>(::crc32(static_cast<uLong>(crc), buf, take));
            buf += take;
            len -= take;
        }
        return crc;
    }

    static inline std::uint32_t crc32_one_shot(const std::uint8_t* buf, std::size_t len) noexcept {
        return crc32_update(0u, buf, len);
    }

    // CRC stored at the end of a chunk: covers the 4 tag bytes, then the data
    static inline std::uint32_t chunk_crc(const std::uint8_t tag[4], const std::uint8_t* data, std::size_t len) noexcept {
        std::uint32_t crc = crc32_update(0u, tag, 4);
        return crc32_update(crc, data, len);
    }

    // ------------------------------ zlib stream ------------------------------
    // zlib-wrapped deflate (CMF/FLG header + Adler-32 trailer), what
    // compress2() produces. quality is clamped to [0, 9].
    static inline bool zlib_compress(const std::uint8_t* data, std::size_t data_len,
                                     std::vector<std::uint8_t>& out, int quality) noexcept {
        if (quality < Z_NO_COMPRESSION) quality = Z_NO_COMPRESSION;
        if (quality > Z_BEST_COMPRESSION) quality = Z_BEST_COMPRESSION;

        uLongf zlen = ::compressBound(static_cast<uLong>(data_len));
        try {
            out.resize(static_cast<std::size_t>(zlen));
        }
        catch (const std::bad_alloc&) {
            out.clear();
            return false;
        }

        const int rc = ::compress2(out.data(), &zlen, data, static_cast<uLong>(data_len), quality);
        if (rc != Z_OK) {
            out.clear();
            return false;
        }
        out.resize(static_cast<std::size_t>(zlen));
        return true;
    }

    static inline void store_be32(std::uint8_t out[4], std::uint32_t v) noexcept {
        out[0] = static_cast<std::uint8_t>((v >> 24) & 0xFFu);
        out[1] = static_cast<std::uint8_t>((v >> 16) & 0xFFu);
        out[2] = static_cast<std::uint8_t>((v >> 8)  & 0xFFu);
        out[3] = static_cast<std::uint8_t>( v        & 0xFFu);
    }

} // namespace zlib
} // namespace pngicon
