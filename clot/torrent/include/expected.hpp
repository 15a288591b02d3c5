#pragma once
#include <optional>
#include <string>


namespace clot::torrent {

    struct Error {
    std::string message;
    };


    // Outcome of an operation whose failure is a normal result rather than an
    // exception (a candidate encoding that does not fit, say).
    template <typename T>
    struct Expected
    {
        std::optional<T> value;
        std::optional<Error> error;


        static Expected success(T v) {
            Expected e; e.value = std::move(v);
            return e;
        }
        static Expected failure(std::string msg) {
            Expected e; e.error = Error{std::move(msg)};
            return e;
        }
        bool has_value() const { return value.has_value(); }
        T& get() { return *value; }
        const T& get() const { return *value; }
    };

} // namespace clot::torrent
