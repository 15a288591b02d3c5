#pragma once
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>


namespace clot::torrent {

    // Wrong shape: a stored value of the wrong kind for its field.
    class TypeError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    // Right shape, wrong content.
    class ValueError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    class RangeError : public ValueError { public: using ValueError::ValueError; };
    class EmptyValueError : public ValueError { public: using ValueError::ValueError; };
    class ConversionError : public ValueError { public: using ValueError::ValueError; };
    class MissingTimezoneError : public ValueError { public: using ValueError::ValueError; };
    class InvalidNodeError : public ValueError { public: using ValueError::ValueError; };
    class ExpectedTopLevelDict : public ValueError { public: using ValueError::ValueError; };

    class TextDecodeError : public ValueError
    {
    public:
        TextDecodeError(const std::string& msg, std::vector<std::string> attempted)
        : ValueError(msg), attempted_(std::move(attempted)) {}

        // Encodings tried, in order.
        const std::vector<std::string>& attempted() const noexcept { return attempted_; }

    private:
        std::vector<std::string> attempted_;
    };

    enum class UrlDefect { missing_scheme, unexpected_scheme, missing_hostname };

    const char* to_string(UrlDefect d) noexcept;

    class IllFormedUrlError : public ValueError
    {
    public:
        IllFormedUrlError(const std::string& msg, UrlDefect defect)
        : ValueError(msg), defect_(defect) {}

        UrlDefect defect() const noexcept { return defect_; }

    private:
        UrlDefect defect_;
    };


    // ---------- Files ----------

    class FileExistsError : public std::runtime_error
    {
    public:
        explicit FileExistsError(const std::filesystem::path& p)
        : std::runtime_error("file exists: " + p.string()), path_(p) {}

        const std::filesystem::path& path() const noexcept { return path_; }

    private:
        std::filesystem::path path_;
    };

    class NoAssociatedFileError : public std::runtime_error
    {
    public:
        NoAssociatedFileError() : std::runtime_error("expected a torrent loaded from file") {}
    };

} // namespace clot::torrent
