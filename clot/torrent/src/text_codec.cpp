#include "../include/text_codec.hpp"
#include "../../bencode/include/utf8.hpp"
#include <cctype>
#include <cerrno>
#include <iconv.h>

namespace clot::torrent {

    namespace {

        // Owns one iconv conversion descriptor.
        class IconvHandle
        {
        public:
            IconvHandle(const char* to, const char* from) : cd_(::iconv_open(to, from)) {}
            ~IconvHandle() { if (valid()) ::iconv_close(cd_); }

            IconvHandle(const IconvHandle&) = delete;
            IconvHandle& operator=(const IconvHandle&) = delete;

            bool valid() const noexcept { return cd_ != reinterpret_cast<iconv_t>(-1); }
            iconv_t get() const noexcept { return cd_; }

        private:
            iconv_t cd_;
        };

        std::string normalized(std::string_view name) {
            std::string out;
            out.reserve(name.size());
            for (char c : name) {
                if (c == '-' || c == '_') continue;
                out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
            }
            return out;
        }

    } // namespace


    bool same_encoding(std::string_view a, std::string_view b) {
        return normalized(a) == normalized(b);
    }

    std::string codepage_encoding(uint64_t codepage) {
        if (codepage == 65001) return "UTF-8";
        return "CP" + std::to_string(codepage);
    }

    bool is_known_encoding(const std::string& encoding) {
        if (is_utf8_name(encoding)) return true;
        return IconvHandle("UTF-8", encoding.c_str()).valid();
    }

    Expected<std::string> decode_text(std::string_view bytes, const std::string& encoding) {

        // UTF-8 input is checked, not converted.
        if (is_utf8_name(encoding)) {
            if (!bencode::is_valid_utf8(bytes)) return Expected<std::string>::failure("invalid UTF-8 sequence");
            return Expected<std::string>::success(std::string(bytes));
        }

        IconvHandle cd("UTF-8", encoding.c_str());
        if (!cd.valid()) {
            return Expected<std::string>::failure("unknown encoding " + encoding);
        }

        std::string in(bytes);
        std::string out(bytes.size() * 4 + 16, '\0');

        char* inPtr = in.data();
        size_t inLeft = in.size();
        char* outPtr = out.data();
        size_t outLeft = out.size();

        while (inLeft > 0) {
            if (::iconv(cd.get(), &inPtr, &inLeft, &outPtr, &outLeft) != static_cast<size_t>(-1)) continue;

            if (errno == E2BIG) {
                const size_t used = out.size() - outLeft;
                out.resize(out.size() * 2);
                outPtr = out.data() + used;
                outLeft = out.size() - used;
                continue;
            }
            // EILSEQ or EINVAL (truncated sequence)
            return Expected<std::string>::failure("cannot convert byte at offset "
                                                  + std::to_string(in.size() - inLeft));
        }

        // Flush any shift state.
        if (::iconv(cd.get(), nullptr, nullptr, &outPtr, &outLeft) == static_cast<size_t>(-1)) {
            return Expected<std::string>::failure("incomplete shift sequence");
        }

        out.resize(out.size() - outLeft);
        return Expected<std::string>::success(std::move(out));
    }

} // namespace clot::torrent
