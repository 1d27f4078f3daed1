#ifndef BOOW_BOW_HPP
#define BOOW_BOW_HPP

#include <memory>
#include <new>
#include <type_traits>
#include <utility>

#ifndef BOOW_NO_STD
#include <cstddef>
#include <functional>
#include <ostream>
#endif

#include "boow/loan.hpp"
#include "boow/option.hpp"

// Bow<T> - Borrowed-Or-oWned value
//
// Holds either a reference to a T owned by someone else (Borrowed) or a
// T of its own (Owned), and gives the same read-only access to both.
// Unlike a copy-on-write holder, T never has to be copyable: a holder is
// built in one state and stays there until it is destroyed.
//
// Guarantees:
// - Exactly one of Borrowed / Owned, chosen at construction, never changed
// - No copy of T is made to build or read a holder
// - The owned value lives inline; the holder never allocates
// - ==, <, << and std::hash look only at the value, never at the state
//
// PRECONDITION: a borrowed referent must outlive every use of the holder.
// Nothing in the language checks this. The @lifetime annotations below
// let the Rusty C++ Checker do it statically; Lender<T> checks it at
// runtime for values that opt in.

// @safe
namespace boow {

template<typename T>
class Lender;

namespace detail {

struct InPlace {};

// Tagged union behind Bow<T>: owns the value or points at someone else's
template<typename T>
class BowStorage {
protected:
    enum class Tag : unsigned char { Owned, Borrowed };

    Tag tag;
    union {
        T owned_value;
        const T* borrowed_ptr;
    };
    // Set only on holders handed out by a Lender
    LoanCount* loan;

    template<typename... Args>
    explicit BowStorage(InPlace, Args&&... args)
        : tag(Tag::Owned), owned_value(std::forward<Args>(args)...), loan(nullptr) {}

    BowStorage(const T* ptr, LoanCount* count)
        : tag(Tag::Borrowed), borrowed_ptr(ptr), loan(count) {
        if (loan) {
            loan->acquire();
        }
    }

    // Copying a borrowed holder borrows the same referent; copying an
    // owned holder copies the value.
    BowStorage(const BowStorage& other) : tag(other.tag), loan(other.loan) {
        switch (tag) {
        case Tag::Owned:
            new (std::addressof(owned_value)) T(other.owned_value);
            break;
        case Tag::Borrowed:
            borrowed_ptr = other.borrowed_ptr;
            if (loan) {
                loan->acquire();
            }
            break;
        }
    }

    // A moved-from borrowed holder no longer counts as a loan
    BowStorage(BowStorage&& other) noexcept(std::is_nothrow_move_constructible<T>::value)
        : tag(other.tag), loan(other.loan) {
        switch (tag) {
        case Tag::Owned:
            new (std::addressof(owned_value)) T(std::move(other.owned_value));
            break;
        case Tag::Borrowed:
            borrowed_ptr = other.borrowed_ptr;
            other.loan = nullptr;
            break;
        }
    }

    BowStorage& operator=(const BowStorage&) = delete;
    BowStorage& operator=(BowStorage&&) = delete;

    ~BowStorage() {
        switch (tag) {
        case Tag::Owned:
            owned_value.~T();
            break;
        case Tag::Borrowed:
            if (loan) {
                loan->release();
            }
            break;
        }
    }
};

// Deletes the copy constructor of Bow<T> when T has none
template<bool Copyable>
struct CopyGate {};

template<>
struct CopyGate<false> {
    CopyGate() = default;
    CopyGate(const CopyGate&) = delete;
    CopyGate(CopyGate&&) = default;
    CopyGate& operator=(const CopyGate&) = default;
    CopyGate& operator=(CopyGate&&) = default;
};

} // namespace detail

template<typename T>
class Bow : private detail::BowStorage<T>,
            private detail::CopyGate<std::is_copy_constructible<T>::value> {
private:
    using Storage = detail::BowStorage<T>;
    using typename Storage::Tag;
    using Storage::tag;
    using Storage::owned_value;
    using Storage::borrowed_ptr;

    template<typename... Args>
    explicit Bow(detail::InPlace in_place, Args&&... args)
        : Storage(in_place, std::forward<Args>(args)...) {}

    Bow(const T* ptr, detail::LoanCount* count) : Storage(ptr, count) {}

    friend class Lender<T>;

public:
    // Owned, value-initialized T
    // @lifetime: owned
    Bow() : Storage(detail::InPlace{}) {}

    // Take ownership of value
    // @lifetime: owned
    static Bow owned(T value) {
        return Bow(detail::InPlace{}, std::move(value));
    }

    // Construct the owned value directly inside the holder.
    // Works for T that can be neither copied nor moved.
    template<typename... Args>
    // @lifetime: owned
    static Bow owned_in_place(Args&&... args) {
        return Bow(detail::InPlace{}, std::forward<Args>(args)...);
    }

    // Refer to a value owned elsewhere. Nothing is copied.
    // @lifetime: (&'a) -> &'a
    static Bow borrowed(const T& ref) {
        return Bow(std::addressof(ref), nullptr);
    }

    // A temporary dies at the end of the full expression
    static Bow borrowed(const T&&) = delete;

    // Only exists when T is copyable
    // @lifetime: (&'a) -> &'a
    Bow(const Bow&) = default;

    // @lifetime: owned
    Bow(Bow&&) = default;

    // A holder is never re-seated
    Bow& operator=(const Bow&) = delete;
    Bow& operator=(Bow&&) = delete;

    bool is_owned() const { return tag == Tag::Owned; }
    bool is_borrowed() const { return tag == Tag::Borrowed; }

    // The wrapped value, whichever state holds it
    // @lifetime: (&'a) -> &'a
    const T& get() const {
        switch (tag) {
        case Tag::Owned:
            return owned_value;
        case Tag::Borrowed:
            break;
        }
        return *borrowed_ptr;
    }

    // @lifetime: (&'a) -> &'a
    const T& borrow() const { return get(); }

    // @lifetime: (&'a) -> &'a
    const T& as_ref() const { return get(); }

    // @lifetime: (&'a) -> &'a
    const T& operator*() const { return get(); }

    // @lifetime: (&'a) -> &'a
    const T* operator->() const { return std::addressof(get()); }

    // Consume the holder; yields the value only if it was owned
    // @lifetime: owned
    Option<T> extract() && {
        if (tag == Tag::Owned) {
            return Option<T>(std::move(owned_value));
        }
        return Option<T>(None);
    }
};

template<typename T>
// @lifetime: owned
Bow<T> Owned(T value) {
    return Bow<T>::owned(std::move(value));
}

template<typename T>
// @lifetime: (&'a) -> &'a
Bow<T> Borrowed(const T& ref) {
    return Bow<T>::borrowed(ref);
}

template<typename T>
Bow<T> Borrowed(const T&&) = delete;

template<typename T, typename... Args>
// @lifetime: owned
Bow<T> make_owned(Args&&... args) {
    return Bow<T>::owned_in_place(std::forward<Args>(args)...);
}

// Comparisons delegate to T and ignore which state each side is in

template<typename T>
bool operator==(const Bow<T>& lhs, const Bow<T>& rhs) {
    return lhs.get() == rhs.get();
}

template<typename T>
bool operator!=(const Bow<T>& lhs, const Bow<T>& rhs) {
    return lhs.get() != rhs.get();
}

template<typename T>
bool operator<(const Bow<T>& lhs, const Bow<T>& rhs) {
    return lhs.get() < rhs.get();
}

template<typename T>
bool operator<=(const Bow<T>& lhs, const Bow<T>& rhs) {
    return lhs.get() <= rhs.get();
}

template<typename T>
bool operator>(const Bow<T>& lhs, const Bow<T>& rhs) {
    return lhs.get() > rhs.get();
}

template<typename T>
bool operator>=(const Bow<T>& lhs, const Bow<T>& rhs) {
    return lhs.get() >= rhs.get();
}

#ifndef BOOW_NO_STD
// Renders exactly as the wrapped value does
template<typename T>
std::ostream& operator<<(std::ostream& os, const Bow<T>& bow) {
    os << bow.get();
    return os;
}
#endif

} // namespace boow

#ifndef BOOW_NO_STD
namespace boow {
namespace detail {

// Disabled (not constructible) unless std::hash<T> is usable
template<typename T, typename = void>
struct BowHash {
    BowHash() = delete;
    BowHash(const BowHash&) = delete;
    BowHash& operator=(const BowHash&) = delete;
};

// Equal holders hash equally in either state
template<typename T>
struct BowHash<T, std::void_t<decltype(std::hash<T>{}(std::declval<const T&>()))>> {
    std::size_t operator()(const Bow<T>& bow) const {
        return std::hash<T>{}(bow.get());
    }
};

} // namespace detail
} // namespace boow

namespace std {
    template<typename T>
    struct hash<boow::Bow<T>> : boow::detail::BowHash<T> {};
}
#endif

#endif // BOOW_BOW_HPP
