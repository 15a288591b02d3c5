#include "../include/values.hpp"
#include <cstdio>
#include <cstdlib>

namespace clot::torrent {

    using namespace std::chrono;

    Timestamp Timestamp::fromUnix(int64_t seconds, minutes offset) {
        return aware(sys_seconds{std::chrono::seconds{seconds}} + offset, offset);
    }

    Timestamp Timestamp::aware(sys_seconds wallClock, minutes offset) {
        Timestamp t;
        t.wall_ = wallClock;
        t.offset_ = offset;
        return t;
    }

    Timestamp Timestamp::naive(sys_seconds wallClock) {
        Timestamp t;
        t.wall_ = wallClock;
        return t;
    }

    int64_t Timestamp::toUnix() const noexcept {
        const sys_seconds utc = wall_ - offset_.value_or(minutes{0});
        return static_cast<int64_t>(utc.time_since_epoch().count());
    }

    std::string Timestamp::isoformat(char sep) const {
        const auto day = floor<days>(wall_);
        const year_month_day ymd{day};
        const hh_mm_ss hms{wall_ - day};

        char buf[48];
        int n = std::snprintf(buf, sizeof buf, "%04d-%02u-%02u%c%02d:%02d:%02d",
                              static_cast<int>(ymd.year()),
                              static_cast<unsigned>(ymd.month()),
                              static_cast<unsigned>(ymd.day()),
                              sep,
                              static_cast<int>(hms.hours().count()),
                              static_cast<int>(hms.minutes().count()),
                              static_cast<int>(hms.seconds().count()));
        std::string out(buf, n > 0 ? static_cast<size_t>(n) : 0);

        if (offset_) {
            const auto total = offset_->count();
            std::snprintf(buf, sizeof buf, "%c%02d:%02d",
                          total < 0 ? '-' : '+',
                          static_cast<int>(std::abs(total) / 60),
                          static_cast<int>(std::abs(total) % 60));
            out += buf;
        }
        return out;
    }

} // namespace clot::torrent
