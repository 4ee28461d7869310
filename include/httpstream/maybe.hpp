#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace httpstream {

/// Either a value or the exception that prevented it.
template <class T>
class Maybe {
public:
    static Maybe ok(T value) { return Maybe(std::move(value)); }
    static Maybe fail(std::exception_ptr error) { return Maybe(std::move(error)); }

    bool is_ok() const { return std::holds_alternative<T>(state_); }
    explicit operator bool() const { return is_ok(); }

    /// The value; rethrows the stored exception when there is none.
    const T& value() const& {
        rethrow();
        return std::get<T>(state_);
    }
    T value() && {
        rethrow();
        return std::get<T>(std::move(state_));
    }

    /// The stored exception, or nullptr on success.
    std::exception_ptr error() const {
        if (auto* e = std::get_if<std::exception_ptr>(&state_)) return *e;
        return nullptr;
    }

    /// what() of the stored exception; empty on success.
    std::string error_message() const {
        auto e = error();
        if (!e) return {};
        try {
            std::rethrow_exception(e);
        } catch (const std::exception& ex) {
            return ex.what();
        } catch (...) {
            return "unknown error";
        }
    }

    T with_default(T fallback) const {
        return is_ok() ? std::get<T>(state_) : std::move(fallback);
    }

    /// Rethrow the stored exception; no-op on success.
    void rethrow() const {
        if (auto e = error()) std::rethrow_exception(e);
    }

private:
    explicit Maybe(T value) : state_(std::in_place_index<0>, std::move(value)) {}
    explicit Maybe(std::exception_ptr error) : state_(std::in_place_index<1>, std::move(error)) {}

    std::variant<T, std::exception_ptr> state_;
};

/// Run `fn` and capture its result or exception.
template <class Fn>
auto capture(Fn&& fn) -> Maybe<std::invoke_result_t<Fn>> {
    using Result = std::invoke_result_t<Fn>;
    try {
        return Maybe<Result>::ok(std::forward<Fn>(fn)());
    } catch (...) {
        return Maybe<Result>::fail(std::current_exception());
    }
}

}  // namespace httpstream
