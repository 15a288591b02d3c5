#pragma once
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include "../../bencode/include/bencode.hpp"
#include "../../logger/logger.hpp"
#include "layout.hpp"


namespace clot::torrent {

    struct ParseOptions
    {
        bool lazy{false};                                   // load fields on first access only
        bencode::KeyMode keys{bencode::KeyMode::text};       // text or textOrBytes; bytes is a ValueError
        std::optional<std::string> fallbackEncoding;
        std::shared_ptr<logger::Logger> logger;             // null: no logging
    };

    struct DumpOptions
    {
        std::optional<int> indent;                          // nullopt: one line
        bool indentWithTabs{false};
        bool sortKeys{false};
        bool overwrite{false};
    };


    /**
     * @brief A decoded metainfo dictionary with its declared fields and the
     * file it came from or was last saved to.
     *
     * Keys of declared fields leave data() once loaded; everything else in
     * data() is carried through save unchanged. Not safe for concurrent use.
     */
    class Backbone : public TextContext
    {
    public:
        explicit Backbone(std::string_view rawBytes, const ParseOptions& opts = {},
                          std::optional<std::filesystem::path> filePath = std::nullopt);
        ~Backbone() override = default;

        Backbone(const Backbone&) = delete;
        Backbone& operator=(const Backbone&) = delete;

        bencode::Dict& data() noexcept { return data_; }
        const bencode::Dict& data() const noexcept { return data_; }

        const std::optional<std::filesystem::path>& filePath() const noexcept { return filePath_; }

        // Bytes last parsed or written.
        const std::string& rawBytes() const noexcept { return rawBytes_; }

        void loadFields();
        void saveFields();

        // Writes back to filePath(); NoAssociatedFileError without one.
        void save();

        // Exclusive create unless overwrite; FileExistsError on conflict.
        void saveAs(const std::filesystem::path& path, bool overwrite = false);

        std::string dumps(const DumpOptions& opts = {});
        void dump(const std::filesystem::path& path, const DumpOptions& opts = {});

        void setFallbackEncoding(std::optional<std::string> encoding) { fallbackEncoding_ = std::move(encoding); }
        void setLogger(std::shared_ptr<logger::Logger> lg) { logger_ = std::move(lg); }

        // TextContext
        std::optional<std::string> recordEncoding() override { return std::nullopt; }
        const std::optional<std::string>& fallbackEncoding() const override { return fallbackEncoding_; }
        logger::Logger* log() const override { return logger_.get(); }

    protected:
        Layout& layout() noexcept { return layout_; }

    private:
        std::string encodeData();

        std::string rawBytes_;
        bencode::Dict data_;
        Layout layout_;
        std::optional<std::filesystem::path> filePath_;
        std::optional<std::string> fallbackEncoding_;
        std::shared_ptr<logger::Logger> logger_;
    };


    // ---------- File helpers ----------

    std::string read_file(const std::filesystem::path& path);

    // Exclusive create, or write-then-rename when overwriting.
    void write_file(const std::filesystem::path& path, std::string_view bytes, bool overwrite);


    // ---------- Factories ----------

    template <typename Record>
    std::unique_ptr<Record> parse_as(std::string_view rawBytes, const ParseOptions& opts = {},
                                     std::optional<std::filesystem::path> filePath = std::nullopt) {
        auto rec = std::make_unique<Record>(rawBytes, opts, std::move(filePath));
        if (!opts.lazy) rec->loadFields();
        return rec;
    }

    template <typename Record>
    std::unique_ptr<Record> create_as(const ParseOptions& opts = {}) {
        return parse_as<Record>("de", opts);
    }

    template <typename Record>
    std::unique_ptr<Record> load_as(const std::filesystem::path& path, const ParseOptions& opts = {}) {
        const std::string raw = read_file(path);
        return parse_as<Record>(raw, opts, path);
    }

} // namespace clot::torrent
