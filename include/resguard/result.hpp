#ifndef RESGUARD_RESULT_HPP
#define RESGUARD_RESULT_HPP

#include <new>
#include <stdexcept>
#include <string>
#include <utility>

// Result<T, E> - the outcome of a resource operation
//
// Guarantees:
// - Failures are values, never exceptions thrown by the library
// - Exactly one of the two alternatives is alive at any time
// - unwrap() on the wrong alternative throws instead of reading garbage

// @safe
namespace resguard {

template<typename T, typename E>
class Result {
private:
    bool ok_;
    union {
        T value_;
        E error_;
    };

    struct OkTag {};
    struct ErrTag {};

    Result(OkTag, T value) : ok_(true) {
        new (&value_) T(std::move(value));
    }

    Result(ErrTag, E error) : ok_(false) {
        new (&error_) E(std::move(error));
    }

    void destroy() {
        if (ok_) {
            value_.~T();
        } else {
            error_.~E();
        }
    }

    void construct_from(const Result& other) {
        ok_ = other.ok_;
        if (ok_) {
            new (&value_) T(other.value_);
        } else {
            new (&error_) E(other.error_);
        }
    }

    void construct_from(Result&& other) {
        ok_ = other.ok_;
        if (ok_) {
            new (&value_) T(std::move(other.value_));
        } else {
            new (&error_) E(std::move(other.error_));
        }
    }

public:
    // @lifetime: owned
    static Result Ok(T value) {
        return Result(OkTag{}, std::move(value));
    }

    // @lifetime: owned
    static Result Err(E error) {
        return Result(ErrTag{}, std::move(error));
    }

    Result(const Result& other) { construct_from(other); }

    Result(Result&& other) noexcept { construct_from(std::move(other)); }

    Result& operator=(const Result& other) {
        if (this != &other) {
            destroy();
            construct_from(other);
        }
        return *this;
    }

    Result& operator=(Result&& other) noexcept {
        if (this != &other) {
            destroy();
            construct_from(std::move(other));
        }
        return *this;
    }

    ~Result() { destroy(); }

    bool is_ok() const { return ok_; }
    bool is_err() const { return !ok_; }

    explicit operator bool() const { return ok_; }

    // Borrow the Ok value (throws if Err)
    // @lifetime: (&'a) -> &'a
    const T& value() const {
        if (!ok_) {
            throw std::runtime_error("Called value() on an Err result");
        }
        return value_;
    }

    // Borrow the Err value (throws if Ok)
    // @lifetime: (&'a) -> &'a
    const E& error() const {
        if (ok_) {
            throw std::runtime_error("Called error() on an Ok result");
        }
        return error_;
    }

    // @lifetime: owned
    T unwrap() {
        if (!ok_) {
            throw std::runtime_error("Called unwrap on an Err result");
        }
        return std::move(value_);
    }

    // @lifetime: owned
    T expect(const char* msg) {
        if (!ok_) {
            throw std::runtime_error(msg);
        }
        return std::move(value_);
    }

    // @lifetime: owned
    E unwrap_err() {
        if (ok_) {
            throw std::runtime_error("Called unwrap_err on an Ok result");
        }
        return std::move(error_);
    }

    // @lifetime: owned
    T unwrap_or(T fallback) {
        if (ok_) {
            return std::move(value_);
        }
        return fallback;
    }

    template<typename F>
    auto map(F f) const -> Result<decltype(f(std::declval<const T&>())), E> {
        using U = decltype(f(std::declval<const T&>()));
        if (ok_) {
            return Result<U, E>::Ok(f(value_));
        }
        return Result<U, E>::Err(error_);
    }

    template<typename F>
    auto map_err(F f) const -> Result<T, decltype(f(std::declval<const E&>()))> {
        using G = decltype(f(std::declval<const E&>()));
        if (ok_) {
            return Result<T, G>::Ok(value_);
        }
        return Result<T, G>::Err(f(error_));
    }
};

// Result<void, E> carries only the failure side
template<typename E>
class Result<void, E> {
private:
    bool ok_;
    union {
        E error_;
        char empty_;
    };

    Result() : ok_(true), empty_(0) {}

    void destroy() {
        if (!ok_) {
            error_.~E();
        }
    }

    void construct_from(const Result& other) {
        ok_ = other.ok_;
        if (ok_) {
            empty_ = 0;
        } else {
            new (&error_) E(other.error_);
        }
    }

    void construct_from(Result&& other) {
        ok_ = other.ok_;
        if (ok_) {
            empty_ = 0;
        } else {
            new (&error_) E(std::move(other.error_));
        }
    }

public:
    static Result Ok() {
        return Result();
    }

    static Result Err(E error) {
        Result r;
        r.ok_ = false;
        new (&r.error_) E(std::move(error));
        return r;
    }

    Result(const Result& other) { construct_from(other); }

    Result(Result&& other) noexcept { construct_from(std::move(other)); }

    Result& operator=(const Result& other) {
        if (this != &other) {
            destroy();
            construct_from(other);
        }
        return *this;
    }

    Result& operator=(Result&& other) noexcept {
        if (this != &other) {
            destroy();
            construct_from(std::move(other));
        }
        return *this;
    }

    ~Result() { destroy(); }

    bool is_ok() const { return ok_; }
    bool is_err() const { return !ok_; }

    explicit operator bool() const { return ok_; }

    // @lifetime: (&'a) -> &'a
    const E& error() const {
        if (ok_) {
            throw std::runtime_error("Called error() on an Ok result");
        }
        return error_;
    }

    // @lifetime: owned
    E unwrap_err() {
        if (ok_) {
            throw std::runtime_error("Called unwrap_err on an Ok result");
        }
        return std::move(error_);
    }

    template<typename F>
    auto map_err(F f) const -> Result<void, decltype(f(std::declval<const E&>()))> {
        using G = decltype(f(std::declval<const E&>()));
        if (ok_) {
            return Result<void, G>::Ok();
        }
        return Result<void, G>::Err(f(error_));
    }
};

} // namespace resguard

#endif // RESGUARD_RESULT_HPP
