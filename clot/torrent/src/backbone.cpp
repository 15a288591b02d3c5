#include "../include/backbone.hpp"
#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <system_error>
#include <unistd.h>

namespace clot::torrent {

    using logger::LogLevel;

    static bencode::Dict top_level_dict(std::string_view raw, bencode::KeyMode keys) {
        // Fields are looked up by text key.
        if (keys == bencode::KeyMode::bytes) {
            throw ValueError("typed records need text keys, not KeyMode::bytes");
        }
        bencode::BencodeValue v = bencode::decode(raw, bencode::DecodeOptions{keys});
        if (!v.isDict()) {
            throw ExpectedTopLevelDict(std::string("expected top-level dictionary instead of ") + bencode::type_name(v.type()));
        }
        return std::move(v.asDict());
    }

    static void log_file(logger::Logger* lg, const std::string& msg, const std::filesystem::path& path) {
        if (!lg || !CLOT_LOG_ENABLED(LogLevel::debug)) return;

        logger::LogRecord rec;
        rec.level = LogLevel::debug;
        rec.logger = "backbone";
        rec.msg = msg;
        rec.path = path.string();
        lg->log(std::move(rec));
    }


    Backbone::Backbone(std::string_view rawBytes, const ParseOptions& opts,
                       std::optional<std::filesystem::path> filePath)
    : rawBytes_(rawBytes),
      data_(top_level_dict(rawBytes, opts.keys)),
      layout_(data_, *this),
      filePath_(std::move(filePath)),
      fallbackEncoding_(opts.fallbackEncoding),
      logger_(opts.logger)
    {
        CLOT_LOG(logger_, LogLevel::debug, "backbone") << "parsed " << rawBytes_.size() << " bytes, "
                                                       << data_.size() << " keys";
    }

    void Backbone::loadFields() {
        layout_.load();
        CLOT_LOG(logger_, LogLevel::debug, "backbone") << "loaded " << layout_.attrs().size() << " fields, "
                                                       << data_.size() << " unknown keys left";
    }

    void Backbone::saveFields() {
        layout_.save();
    }

    std::string Backbone::encodeData() {
        saveFields();
        return bencode::encode(bencode::BencodeValue(data_));
    }

    void Backbone::saveAs(const std::filesystem::path& path, bool overwrite) {
        std::string raw = encodeData();
        write_file(path, raw, overwrite);

        rawBytes_ = std::move(raw);
        filePath_ = path;
        log_file(logger_.get(), "saved " + std::to_string(rawBytes_.size()) + " bytes", path);
    }

    void Backbone::save() {
        if (!filePath_) throw NoAssociatedFileError();

        std::string raw = encodeData();
        write_file(*filePath_, raw, true);

        rawBytes_ = std::move(raw);
        log_file(logger_.get(), "saved " + std::to_string(rawBytes_.size()) + " bytes", *filePath_);
    }

    void Backbone::dump(const std::filesystem::path& path, const DumpOptions& opts) {
        const std::string text = dumps(opts);
        write_file(path, text, opts.overwrite);
        log_file(logger_.get(), "dumped " + std::to_string(text.size()) + " bytes", path);
    }


    // ---------- File helpers ----------

    [[noreturn]] static void throw_errno(int err, const std::string& what, const std::filesystem::path& path) {
        throw std::system_error(err, std::generic_category(), what + " " + path.string());
    }

    static bool write_all(int fd, std::string_view bytes) {
        const char* p = bytes.data();
        size_t left = bytes.size();
        while (left > 0) {
            const ssize_t n = ::write(fd, p, left);
            if (n < 0) {
                if (errno == EINTR) continue;
                return false;
            }
            p += n;
            left -= static_cast<size_t>(n);
        }
        return true;
    }

    std::string read_file(const std::filesystem::path& path) {
        const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd < 0) throw_errno(errno, "open", path);

        std::string out;
        char buf[64 * 1024];
        for (;;) {
            const ssize_t n = ::read(fd, buf, sizeof buf);
            if (n < 0) {
                if (errno == EINTR) continue;
                const int err = errno;
                ::close(fd);
                throw_errno(err, "read", path);
            }
            if (n == 0) break;
            out.append(buf, static_cast<size_t>(n));
        }

        ::close(fd);
        return out;
    }

    void write_file(const std::filesystem::path& path, std::string_view bytes, bool overwrite) {

        if (!overwrite) {
            // O_EXCL makes the existence check and the create one step.
            const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
            if (fd < 0) {
                if (errno == EEXIST) throw FileExistsError(path);
                throw_errno(errno, "open", path);
            }
            if (!write_all(fd, bytes)) {
                const int err = errno;
                ::close(fd);
                (void)::unlink(path.c_str());
                throw_errno(err, "write", path);
            }
            if (::close(fd) != 0) throw_errno(errno, "close", path);
            return;
        }

        // Readers see either the old contents or the new ones.
        std::string tmp = path.string() + ".XXXXXX";
        const int fd = ::mkstemp(tmp.data());
        if (fd < 0) throw_errno(errno, "mkstemp", tmp);

        if (::fchmod(fd, 0644) != 0 || !write_all(fd, bytes)) {
            const int err = errno;
            ::close(fd);
            (void)::unlink(tmp.c_str());
            throw_errno(err, "write", tmp);
        }
        if (::close(fd) != 0) {
            const int err = errno;
            (void)::unlink(tmp.c_str());
            throw_errno(err, "close", tmp);
        }
        if (::rename(tmp.c_str(), path.c_str()) != 0) {
            const int err = errno;
            (void)::unlink(tmp.c_str());
            throw_errno(err, "rename", path);
        }
    }

} // namespace clot::torrent
