// Tests for boow built with BOOW_NO_STD (no iostream, no dbg, no exceptions)
#include "boow/boow.hpp"
#include <cassert>
#include <cstdio>

#ifndef BOOW_NO_STD
#error "this test must be built with BOOW_NO_STD"
#endif

using namespace boow;

struct Point {
    int x;
    int y;

    Point(int px, int py) : x(px), y(py) {}
    Point(const Point&) = delete;
    Point(Point&&) = default;

    bool operator==(const Point& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Point& other) const { return !(*this == other); }
};

// The holder keeps its value inline
static_assert(sizeof(Bow<Point>) <= sizeof(Point) + 2 * sizeof(void*),
              "owned value is stored inline");

void test_no_std_access() {
    printf("test_no_std_access: ");
    {
        Point origin(0, 0);
        auto borrowed = Borrowed(origin);
        auto owned = make_owned<Point>(0, 0);
        assert(&borrowed.get() == &origin);
        assert(owned->x == 0);
        assert(borrowed == owned);
        assert(owned != Owned(Point(1, 2)));
    }
    printf("PASS\n");
}

void test_no_std_extract() {
    printf("test_no_std_extract: ");
    {
        auto owned = Owned(Point(3, 4));
        auto point = std::move(owned).extract();
        assert(point.is_some());
        assert(point.unwrap_ref().y == 4);

        Point local(5, 6);
        auto borrowed = Borrowed(local);
        assert(std::move(borrowed).extract().is_none());
        assert(local.x == 5);
    }
    printf("PASS\n");
}

void test_no_std_lender() {
    printf("test_no_std_lender: ");
    {
        Lender<int> lender(11);
        {
            auto bow = lender.lend();
            assert(*bow == 11);
            assert(lender.loans() == 1);
        }
        assert(lender.loans() == 0);
    }
    printf("PASS\n");
}

int main() {
    printf("=== Testing boow with BOOW_NO_STD ===\n");

    test_no_std_access();
    test_no_std_extract();
    test_no_std_lender();

    printf("\nAll no-std tests passed!\n");
    return 0;
}
