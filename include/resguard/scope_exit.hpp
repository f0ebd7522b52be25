#ifndef RESGUARD_SCOPE_EXIT_HPP
#define RESGUARD_SCOPE_EXIT_HPP

#include <type_traits>
#include <utility>

// ScopeExit<F> - runs F when the enclosing scope ends, on every exit path
//
// Guarantees:
// - F runs at most once
// - dismiss() cancels it
// - Move only; a moved-from guard does nothing

// @safe
namespace resguard {

template<typename F>
class ScopeExit {
private:
    F action_;
    bool armed_;

public:
    explicit ScopeExit(F action) : action_(std::move(action)), armed_(true) {}

    ScopeExit(const ScopeExit&) = delete;
    ScopeExit& operator=(const ScopeExit&) = delete;
    ScopeExit& operator=(ScopeExit&&) = delete;

    ScopeExit(ScopeExit&& other) noexcept(std::is_nothrow_move_constructible<F>::value)
        : action_(std::move(other.action_)), armed_(other.armed_) {
        other.armed_ = false;
    }

    ~ScopeExit() {
        if (armed_) {
            action_();
        }
    }

    void dismiss() { armed_ = false; }
    bool is_armed() const { return armed_; }
};

template<typename F>
// @lifetime: owned
ScopeExit<typename std::decay<F>::type> make_scope_exit(F&& action) {
    return ScopeExit<typename std::decay<F>::type>(std::forward<F>(action));
}

} // namespace resguard

#endif // RESGUARD_SCOPE_EXIT_HPP
