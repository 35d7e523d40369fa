#pragma once

// ------------------------------- Includes -----------------------------------
#include <cerrno>
#include <climits>
#include <cstddef>
#include <cstdlib>
#include <ostream>
#include <string>

#include "pngicon.hpp"

namespace pngicon {

    // One placeholder icon: output name and square size in pixels.
    struct Icon {
        const char* filename;
        int size;
    };

    // The application icon set, generated in this order.
    static constexpr Icon icon_set_table[3]{
        { "32x32.png",      32 },
        { "128x128.png",    128 },
        { "128x128@2x.png", 256 }, // 2x variant of 128x128
    };

    struct Options {
        std::string out_dir;           // empty => current directory
        Rgb color{ default_color };
    };

    enum class ParseResult { Run, Help, Error };

    // "DIR" + "/" + name; no directory is created
    inline std::string output_path(const std::string& out_dir, const char* filename) {
        if (out_dir.empty()) return filename;
        std::string p = out_dir;
        if (p.back() != '/') p += '/';
        p += filename;
        return p;
    }

    namespace detail {
        static inline bool parse_component(const char* begin, const char* end, int& out) {
            if (begin == end) return false;
            // digits with an optional leading '-'; strtol alone would also take
            // leading whitespace and '+'
            const char* d = *begin == '-' ? begin + 1 : begin;
            if (d == end || *d < '0' || *d > '9') return false;
            std::string s(begin, end);
            char* stop = nullptr;
            errno = 0;
            const long v = std::strtol(s.c_str(), &stop, 10);
            if (errno == ERANGE || stop != s.c_str() + s.size()) return false;
            if (v < INT_MIN || v > INT_MAX) return false;
            out = static_cast<int>(v);
            return true;
        }
    } // namespace detail

    // "R,G,B" in decimal (no spaces, no '+'); each component keeps its low byte, as rgb() does
    inline bool parse_color(const std::string& text, Rgb& color) {
        const std::size_t c1 = text.find(',');
        if (c1 == std::string::npos) return false;
        const std::size_t c2 = text.find(',', c1 + 1);
        if (c2 == std::string::npos) return false;
        if (text.find(',', c2 + 1) != std::string::npos) return false;

        const char* s = text.c_str();
        int r = 0, g = 0, b = 0;
        if (!detail::parse_component(s, s + c1, r)) return false;
        if (!detail::parse_component(s + c1 + 1, s + c2, g)) return false;
        if (!detail::parse_component(s + c2 + 1, s + text.size(), b)) return false;

        color = rgb(r, g, b);
        return true;
    }

    inline ParseResult parse_options(int argc, const char* const* argv, Options& opt, std::string& err) {
        for (int i = 1; i < argc; ++i) {
            const std::string a = argv[i];
            if (a == "-h" || a == "--help") {
                return ParseResult::Help;
            }
            else if (a == "--out-dir") {
                if (i + 1 >= argc) { err = "--out-dir needs a directory"; return ParseResult::Error; }
                opt.out_dir = argv[++i];
            }
            else if (a == "--color") {
                if (i + 1 >= argc) { err = "--color needs R,G,B"; return ParseResult::Error; }
                const std::string v = argv[++i];
                if (!parse_color(v, opt.color)) { err = "bad color '" + v + "', expected R,G,B"; return ParseResult::Error; }
            }
            else {
                err = "unknown option '" + a + "'";
                return ParseResult::Error;
            }
        }
        return ParseResult::Run;
    }

    // Writes every icon of the table; stops at the first failure and reports
    // the path that failed. Progress lines go to `log` when given.
    inline Status generate_icon_set(const Options& opt, std::string& failed_path, std::ostream* log = nullptr) {
        failed_path.clear();
        for (const Icon& icon : icon_set_table) {
            const std::string path = output_path(opt.out_dir, icon.filename);
            const Status st = write_solid_png(path.c_str(), icon.size, opt.color);
            if (st != Status::Ok) {
                failed_path = path;
                return st;
            }
            if (log) *log << "wrote " << path << " (" << icon.size << "x" << icon.size << ")" << std::endl;
        }
        return Status::Ok;
    }

} // namespace pngicon
