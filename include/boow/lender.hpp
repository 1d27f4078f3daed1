#ifndef BOOW_LENDER_HPP
#define BOOW_LENDER_HPP

#include <cstdint>
#include <memory>
#include <utility>

#include "boow/bow.hpp"
#include "boow/loan.hpp"
#include "boow/verify.hpp"

namespace boow {

// Lender<T> owns a value and counts the Bow holders borrowing it.
//
// Use it where the borrowed referent's lifetime cannot be audited by
// hand: every holder from lend() takes a loan and gives it back when it
// is destroyed. Dropping or moving the lender while a loan is still out
// would leave those holders dangling, so it aborts with a diagnostic
// instead.
template <typename T>
class Lender {
   public:
	Lender(const Lender&) = delete;
	Lender& operator=(const Lender&) = delete;
	Lender& operator=(Lender&&) = delete;

	// @lifetime: owned
	explicit Lender(T value) : value_(std::move(value)) {}

	template <typename... Args>
	// @lifetime: owned
	static Lender in_place(Args&&... args) {
		return Lender(InPlace{}, std::forward<Args>(args)...);
	}

	// The moved-from lender keeps its (moved-from) value and refuses
	// any further lend()
	Lender(Lender&& other) : value_(take_unlent(other)) {}

	~Lender() {
		BOOW_VERIFY(loans_.idle(), "Lender dropped while borrowed");
	}

	// A borrowed holder tracked by this lender
	// @lifetime: (&'a) -> &'a
	Bow<T> lend() const { return Bow<T>(std::addressof(value_), &loans_); }

	// @lifetime: (&'a) -> &'a
	const T& get() const { return value_; }

	int32_t loans() const { return loans_.count(); }

   private:
	struct InPlace {};

	template <typename... Args>
	explicit Lender(InPlace, Args&&... args)
		: value_(std::forward<Args>(args)...) {}

	static T&& take_unlent(Lender& other) {
		other.loans_.invalidate();
		return std::move(other.value_);
	}

	T value_;
	mutable detail::LoanCount loans_;
};

}  // namespace boow

#endif // BOOW_LENDER_HPP
