#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>


namespace clot::torrent {

    /**
     * @brief Ordered sequence whose every item went through a validating
     * function. The function may reject (throw) or normalize the item.
     *
     * Indices follow the usual sequence conventions: negative indices count
     * from the end, single-item access and assignment throw std::out_of_range,
     * insert positions and slice bounds are clamped. New items are validated
     * before the index is checked.
     */
    template <typename T>
    class List
    {
    public:
        using ValidItem = std::function<T(const T&)>;
        using value_type = T;
        using const_iterator = typename std::vector<T>::const_iterator;

        static constexpr std::ptrdiff_t npos = std::numeric_limits<std::ptrdiff_t>::max();

        explicit List(ValidItem validItem)
        : validItem_(std::make_shared<const ValidItem>(std::move(validItem))) {}

        List(ValidItem validItem, std::initializer_list<T> values)
        : List(std::move(validItem)) { extend(values); }

        // Builds a list around an existing validator, so that two lists can be
        // recognized as validated by the same function.
        static List of(std::shared_ptr<const ValidItem> validItem, const std::vector<T>& values = {}) {
            List out(std::move(validItem), Shared{});
            out.extend(values);
            return out;
        }

        std::size_t size() const noexcept { return items_.size(); }
        bool empty() const noexcept { return items_.empty(); }

        const_iterator begin() const noexcept { return items_.begin(); }
        const_iterator end() const noexcept { return items_.end(); }

        const std::vector<T>& items() const noexcept { return items_; }
        const std::shared_ptr<const ValidItem>& validator() const noexcept { return validItem_; }
        bool sharesValidator(const List& other) const noexcept { return validItem_ == other.validItem_; }

        const T& at(std::ptrdiff_t index) const { return items_[position(index, "list index out of range")]; }
        const T& operator[](std::ptrdiff_t index) const { return at(index); }

        void set(std::ptrdiff_t index, const T& value) {
            T item = (*validItem_)(value);
            items_[position(index, "list assignment index out of range")] = std::move(item);
        }

        void insert(std::ptrdiff_t index, const T& value) {
            T item = (*validItem_)(value);
            items_.insert(items_.begin() + clamp(index), std::move(item));
        }

        void append(const T& value) { items_.push_back((*validItem_)(value)); }

        // All or nothing: one bad item leaves the list unchanged.
        template <typename Range>
        void extend(const Range& values) {
            std::vector<T> valid = validated(values);
            items_.insert(items_.end(), std::make_move_iterator(valid.begin()), std::make_move_iterator(valid.end()));
        }

        void extend(std::initializer_list<T> values) { extend<std::initializer_list<T>>(values); }

        void erase(std::ptrdiff_t index) {
            items_.erase(items_.begin() + position(index, "list assignment index out of range"));
        }

        void erase(std::ptrdiff_t first, std::ptrdiff_t last) {
            const auto [lo, hi] = bounds(first, last);
            items_.erase(items_.begin() + lo, items_.begin() + hi);
        }

        // Replaces items_[first, last) with values, which may differ in count.
        template <typename Range>
        void assign(std::ptrdiff_t first, std::ptrdiff_t last, const Range& values) {
            std::vector<T> valid = validated(values);
            const auto [lo, hi] = bounds(first, last);
            items_.erase(items_.begin() + lo, items_.begin() + hi);
            items_.insert(items_.begin() + lo, std::make_move_iterator(valid.begin()), std::make_move_iterator(valid.end()));
        }

        void assign(std::ptrdiff_t first, std::ptrdiff_t last, std::initializer_list<T> values) {
            assign<std::initializer_list<T>>(first, last, values);
        }

        std::vector<T> slice(std::ptrdiff_t first, std::ptrdiff_t last = npos) const {
            const auto [lo, hi] = bounds(first, last);
            return std::vector<T>(items_.begin() + lo, items_.begin() + hi);
        }

        void clear() noexcept { items_.clear(); }

        bool operator==(const List& other) const { return items_ == other.items_; }
        bool operator==(const std::vector<T>& other) const { return items_ == other; }

    private:
        struct Shared {};

        List(std::shared_ptr<const ValidItem> validItem, Shared) : validItem_(std::move(validItem)) {}

        template <typename Range>
        std::vector<T> validated(const Range& values) const {
            std::vector<T> out;
            for (const auto& v : values) out.push_back((*validItem_)(v));
            return out;
        }

        std::ptrdiff_t count() const noexcept { return static_cast<std::ptrdiff_t>(items_.size()); }

        std::ptrdiff_t position(std::ptrdiff_t index, const char* what) const {
            if (index < 0) index += count();
            if (index < 0 || index >= count()) throw std::out_of_range(what);
            return index;
        }

        std::ptrdiff_t clamp(std::ptrdiff_t index) const noexcept {
            if (index < 0) index += count();
            if (index < 0) return 0;
            return index > count() ? count() : index;
        }

        std::pair<std::ptrdiff_t, std::ptrdiff_t> bounds(std::ptrdiff_t first, std::ptrdiff_t last) const noexcept {
            const std::ptrdiff_t lo = clamp(first);
            const std::ptrdiff_t hi = clamp(last);
            return {lo, hi < lo ? lo : hi};
        }

        std::shared_ptr<const ValidItem> validItem_;
        std::vector<T> items_;
    };


    /**
     * @brief Wall-clock date and time with an optional UTC offset.
     * Values loaded from a record always carry an offset; a naive value
     * (no offset) exists only to be rejected on assignment.
     */
    class Timestamp
    {
    public:
        Timestamp() = default;

        static Timestamp fromUnix(int64_t seconds, std::chrono::minutes offset = std::chrono::minutes{0});
        static Timestamp aware(std::chrono::sys_seconds wallClock, std::chrono::minutes offset);
        static Timestamp naive(std::chrono::sys_seconds wallClock);

        bool hasOffset() const noexcept { return offset_.has_value(); }
        std::optional<std::chrono::minutes> offset() const noexcept { return offset_; }
        std::chrono::sys_seconds wallClock() const noexcept { return wall_; }

        // Seconds since the epoch; a naive value is taken as UTC.
        int64_t toUnix() const noexcept;

        // YYYY-MM-DDTHH:MM:SS followed by +HH:MM when the offset is known.
        std::string isoformat(char sep = 'T') const;

        bool operator==(const Timestamp&) const = default;

    private:
        std::chrono::sys_seconds wall_{};
        std::optional<std::chrono::minutes> offset_;
    };

} // namespace clot::torrent
