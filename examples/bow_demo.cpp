// Demo of Borrowed-Or-oWned values
// Lifetime annotations here are checked by the Rusty C++ Checker

#include "boow/boow.hpp"
#include <cstdio>
#include <iostream>
#include <string>

// @safe
namespace demo {

// A resource that must never be duplicated
struct Connection {
    std::string peer;

    explicit Connection(std::string p) : peer(std::move(p)) {}
    Connection(const Connection&) = delete;
    Connection(Connection&&) = default;
};

// Works the same whether the caller lends its connection or hands one over
struct Session {
    boow::Bow<Connection> conn;

    // @lifetime: (&'a) -> &'a
    static Session attach(const Connection& shared) {
        return Session{boow::Borrowed(shared)};
    }

    // @lifetime: owned
    static Session open(std::string peer) {
        return Session{boow::make_owned<Connection>(std::move(peer))};
    }

    void describe() const {
        printf("session to %s (%s)\n", conn->peer.c_str(),
               conn.is_owned() ? "owned" : "borrowed");
    }
};

// Example 1: Borrowed vs Owned
// @safe
void demo_bow() {
    printf("\n=== Bow Demo ===\n");

    Connection shared("db.internal:5432");
    auto attached = Session::attach(shared);
    auto opened = Session::open("cache.internal:6379");

    attached.describe();
    opened.describe();

    // Same rendering, same equality, whatever the state
    std::string hello = "hello";
    auto owned = boow::Owned(std::string("hello"));
    auto borrowed = boow::Borrowed(hello);
    std::cout << owned << " == " << borrowed << ": "
              << (owned == borrowed ? "true" : "false") << std::endl;

    // Only an owned value can be taken back out
    auto back = std::move(owned).extract();
    printf("extracted from owned: %s\n", back.is_some() ? "yes" : "no");
    auto nothing = std::move(borrowed).extract();
    printf("extracted from borrowed: %s\n", nothing.is_some() ? "yes" : "no");
}

// Example 2: runtime-checked borrows
// @safe
void demo_lender() {
    printf("\n=== Lender Demo ===\n");

    boow::Lender<Connection> lender(Connection("queue.internal:5672"));
    {
        Session first{lender.lend()};
        Session second{lender.lend()};
        first.describe();
        second.describe();
        printf("loans out: %d\n", lender.loans());
    }
    printf("loans out after scope: %d\n", lender.loans());

    // Dropping the lender while a Session still borrowed from it would
    // abort with a stack trace instead of leaving a dangling reference.
}

} // namespace demo

int main() {
    printf("=== boow Demo ===\n");

    demo::demo_bow();
    demo::demo_lender();

    printf("\n=== Demo Complete ===\n");
    return 0;
}
