#ifndef BOOW_LOAN_HPP
#define BOOW_LOAN_HPP

#include <atomic>
#include <cstdint>

#include "boow/verify.hpp"

namespace boow {
namespace detail {

// Number of live Bow holders borrowing from one Lender.
// Shared by the lender (owner) and every holder it lent to.
class LoanCount {
   public:
	// -2 marks the counter of a lender whose value was moved out
	static constexpr int32_t kMovedFrom = -2;

	LoanCount() = default;
	LoanCount(const LoanCount&) = delete;
	LoanCount& operator=(const LoanCount&) = delete;

	void acquire() {
		auto before_add = cnt_.fetch_add(1);
		BOOW_VERIFY(before_add >= 0, "loan taken on a moved-from lender");
	}

	void release() {
		auto before_sub = cnt_.fetch_sub(1);
		BOOW_VERIFY(before_sub > 0, "loan released more times than taken");
	}

	// No further loans may be taken once the owner gave its value away
	void invalidate() {
		auto i = cnt_.exchange(kMovedFrom);
		BOOW_VERIFY(i == 0, "Lender moved while borrowed");
	}

	// Nothing borrows from the owner (live or moved-from)
	bool idle() const {
		auto i = cnt_.load();
		return i == 0 || i == kMovedFrom;
	}

	int32_t count() const {
		auto i = cnt_.load();
		return i < 0 ? 0 : i;
	}

   private:
	std::atomic<int32_t> cnt_{0};
};

}  // namespace detail
}  // namespace boow

#endif // BOOW_LOAN_HPP
