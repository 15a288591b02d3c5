#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>

namespace clot::logger {

    enum class LogLevel : uint8_t { trace=0, debug=1, info=2, warn=3, error=4, none=255 };

    struct LogRecord 
    {
        LogLevel level{LogLevel::info};
        std::chrono::system_clock::time_point ts{};
        std::string logger;        // e.g. "backbone", "text"
        std::string msg;           // rendered text

        // Optional structured fields:
        std::string field;         // record field name
        std::string path;          // file being read or written
        std::string encoding;      // character set involved
    };

    class ILoggerSink 
    {
    public:
        virtual ~ILoggerSink() = default;
        virtual void write(const LogRecord& rec) = 0;
    };

    class StdoutSink : public ILoggerSink 
    {
    public:
        void write(const LogRecord& rec) override;
    };

    class FileSink : public ILoggerSink 
    {
    public:
        explicit FileSink(const std::string& path);
        void write(const LogRecord& rec) override;
    private:
        std::mutex mu_;
        std::ofstream out_;
    };

    std::string render(const LogRecord& rec);

    class Logger 
    {
    public:
        using RedactorFn = std::function<std::string(std::string_view)>;

        explicit Logger(std::shared_ptr<ILoggerSink> sink = std::make_shared<StdoutSink>())
        : sink_(std::move(sink)) {}

        void setLevel(LogLevel lvl) { level_.store(lvl, std::memory_order_relaxed); }
        LogLevel level() const { return level_.load(std::memory_order_relaxed); }

        void setRedactor(RedactorFn r) { std::scoped_lock lk(mu_); redactor_ = std::move(r); }

        void log(LogRecord rec) {
            if (static_cast<unsigned>(rec.level) < static_cast<unsigned>(level())) return;
            rec.ts = std::chrono::system_clock::now();
            {
                std::scoped_lock lk(mu_);
                if (redactor_) {
                    rec.path = redactor_(rec.path);
                    rec.msg = redactor_(rec.msg);
                }
            }
            sink_->write(rec);
        }

        void trace(std::string msg, std::string logger = {}) { emit(LogLevel::trace, std::move(msg), std::move(logger)); }
        void debug(std::string msg, std::string logger = {}) { emit(LogLevel::debug, std::move(msg), std::move(logger)); }
        void info (std::string msg, std::string logger = {}) { emit(LogLevel::info , std::move(msg), std::move(logger)); }
        void warn (std::string msg, std::string logger = {}) { emit(LogLevel::warn , std::move(msg), std::move(logger)); }
        void error(std::string msg, std::string logger = {}) { emit(LogLevel::error, std::move(msg), std::move(logger)); }

    private:
        void emit(LogLevel lvl, std::string msg, std::string logger) {
            LogRecord rec;
            rec.level = lvl;
            rec.msg   = std::move(msg);
            rec.logger= std::move(logger);
            log(std::move(rec));
        }

        std::mutex mu_;
        std::shared_ptr<ILoggerSink> sink_;
        std::atomic<LogLevel> level_{LogLevel::info};
        RedactorFn redactor_;
    };

    #ifndef CLOT_LOG_LEVEL
    #define CLOT_LOG_LEVEL clot::logger::LogLevel::info
    #endif

    #define CLOT_LOG_ENABLED(lvl) (static_cast<unsigned>(lvl) >= static_cast<unsigned>(CLOT_LOG_LEVEL))

    // Usage: CLOT_LOG(loggerPtr, LogLevel::debug, "backbone") << "message " << x;
    #define CLOT_LOG(LOGGER_PTR, LVL, NAME) \
        if (!(LOGGER_PTR) || !CLOT_LOG_ENABLED(LVL)) ; \
        else ::clot::logger::detail::LogStreamHelper(*(LOGGER_PTR), (LVL), (NAME), __func__).stream()

    namespace detail {
        class LogStreamHelper 
        {
        public:
            LogStreamHelper(Logger& lg, LogLevel lvl, const char* name, const char* fn)
            : lg_(lg) { ss_ << "[" << fn << "] "; rec_.level = lvl; rec_.logger = name; }
            ~LogStreamHelper() {
                rec_.msg = ss_.str();
                lg_.log(std::move(rec_));
            }
            std::ostream& stream() { return ss_; }
        private:
            LogRecord rec_;
            Logger& lg_;
            std::ostringstream ss_;
        };
    }

} // namespace clot::logger
