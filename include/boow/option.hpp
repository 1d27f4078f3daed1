#ifndef BOOW_OPTION_HPP
#define BOOW_OPTION_HPP

#include <memory>
#include <new>
#include <utility>

#ifdef BOOW_NO_STD
#include "boow/verify.hpp"
#else
#include <stdexcept>
#endif

// Option<T> - an optional value stored inline
// Equivalent to Rust's Option<T>
//
// Returned by Bow::extract(), which yields the value only when the
// holder owned it. Move-only payloads are supported.

// @safe
namespace boow {

struct NoneType {};
inline constexpr NoneType None{};

template<typename T>
class Option {
private:
    bool has_value;
    union {
        T value;
        char dummy;
    };

    static void panic(const char* msg) {
#ifdef BOOW_NO_STD
        BOOW_VERIFY(false, msg);
#else
        throw std::runtime_error(msg);
#endif
    }

    void reset() {
        if (has_value) {
            value.~T();
            has_value = false;
        }
    }

public:
    Option() : has_value(false), dummy(0) {}

    Option(NoneType) : has_value(false), dummy(0) {}

    // @lifetime: owned
    Option(T val) : has_value(true), value(std::move(val)) {}

    Option(const Option& other) : has_value(other.has_value), dummy(0) {
        if (has_value) {
            new (std::addressof(value)) T(other.value);
        }
    }

    // The source is left as None
    Option(Option&& other) noexcept : has_value(other.has_value), dummy(0) {
        if (has_value) {
            new (std::addressof(value)) T(std::move(other.value));
            other.reset();
        }
    }

    Option& operator=(Option&& other) noexcept {
        if (this != &other) {
            reset();
            if (other.has_value) {
                new (std::addressof(value)) T(std::move(other.value));
                has_value = true;
                other.reset();
            }
        }
        return *this;
    }

    Option& operator=(const Option&) = delete;

    ~Option() {
        reset();
    }

    bool is_some() const { return has_value; }
    bool is_none() const { return !has_value; }

    explicit operator bool() const { return has_value; }

    // Move the value out, leaving None. Panics if None.
    // @lifetime: owned
    T unwrap() {
        if (!has_value) {
            panic("Called unwrap on None");
        }
        T result = std::move(value);
        reset();
        return result;
    }

    // @lifetime: owned
    T expect(const char* msg) {
        if (!has_value) {
            panic(msg);
        }
        return unwrap();
    }

    // @lifetime: owned
    T unwrap_or(T default_value) {
        if (has_value) {
            return unwrap();
        }
        return default_value;
    }

    // @lifetime: (&'a) -> &'a
    const T& unwrap_ref() const {
        if (!has_value) {
            panic("Called unwrap_ref on None");
        }
        return value;
    }

    // @lifetime: owned
    Option<T> take() {
        Option<T> result(std::move(*this));
        return result;
    }
};

template<typename T>
// @lifetime: owned
Option<T> Some(T value) {
    return Option<T>(std::move(value));
}

template<typename T>
bool operator==(const Option<T>& lhs, const Option<T>& rhs) {
    if (lhs.is_none() && rhs.is_none()) return true;
    if (lhs.is_some() && rhs.is_some()) return lhs.unwrap_ref() == rhs.unwrap_ref();
    return false;
}

template<typename T>
bool operator!=(const Option<T>& lhs, const Option<T>& rhs) {
    return !(lhs == rhs);
}

} // namespace boow

#endif // BOOW_OPTION_HPP
