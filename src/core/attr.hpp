#pragma once

#include <utility>

// Three-valued optional attribute as supplied by the declarative layer:
//   Unset   - the user did not set it
//   Unknown - explicitly deferred; the remote host decides the value
//   Known   - a concrete value
template <typename T>
class Attr {
public:
    enum class State { Unset, Unknown, Known };

    Attr() = default;

    static Attr unset() { return Attr(); }

    static Attr unknown() {
        Attr a;
        a.state_ = State::Unknown;
        return a;
    }

    static Attr known(T value) {
        Attr a;
        a.state_ = State::Known;
        a.value_ = std::move(value);
        return a;
    }

    State state() const { return state_; }
    bool is_unset() const { return state_ == State::Unset; }
    bool is_unknown() const { return state_ == State::Unknown; }
    bool is_known() const { return state_ == State::Known; }

    // Only meaningful when is_known()
    const T& value() const { return value_; }

    // Known and different from `observed`
    bool differs_from(const T& observed) const {
        return is_known() && !(value_ == observed);
    }

    bool operator==(const Attr& other) const {
        if (state_ != other.state_) return false;
        return state_ != State::Known || value_ == other.value_;
    }
    bool operator!=(const Attr& other) const { return !(*this == other); }

private:
    State state_ = State::Unset;
    T value_{};
};
