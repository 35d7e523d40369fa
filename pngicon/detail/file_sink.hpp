#pragma once

// ----------------------------------------------
// stdio sink for pngicon::Encoder
//
// Opens the target with fopen(path, "wb"): the file is created or truncated.
// Directories are never created; a missing parent makes open() fail.
//
// The sink remembers the first failed fwrite in `ok`. Once that happens every
// later callback is ignored, so the caller checks `ok` (and close()) after
// the encoder is done.
// ----------------------------------------------

#include <cstddef>
#include <cstdint>
#include <cstdio>

namespace pngicon {
namespace detail {

    struct FileSink {
        std::FILE* fp{ nullptr };
        bool ok{ true };
        std::size_t written_total{ 0 };

        FileSink() = default;
        FileSink(const FileSink&) = delete;
        FileSink& operator=(const FileSink&) = delete;

        ~FileSink() { close(); }

        inline bool open(const char* path) noexcept {
            close();
            ok = true;
            written_total = 0;
            if (!path || !*path) return false;
            fp = std::fopen(path, "wb");
            return fp != nullptr;
        }

        inline bool is_open() const noexcept { return fp != nullptr; }

        // returns false if the stream could not be flushed/closed cleanly
        inline bool close() noexcept {
            if (!fp) return ok;
            if (std::fclose(fp) != 0) ok = false;
            fp = nullptr;
            return ok;
        }
    };

    // Encoder callback; ctx is a FileSink*
    static inline void file_sink_write(void* ctx, const void* data, int size) {
        FileSink* s = static_cast<FileSink*>(ctx);
        if (!s || !s->ok || !s->fp || !data || size <= 0) return;

        const std::size_t n = static_cast<std::size_t>(size);
        const std::size_t written = std::fwrite(data, 1, n, s->fp);
        s->written_total += written;
        if (written != n) s->ok = false;
    }

} // namespace detail
} // namespace pngicon
