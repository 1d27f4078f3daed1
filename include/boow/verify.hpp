#ifndef BOOW_VERIFY_HPP
#define BOOW_VERIFY_HPP

// Ownership invariant checks.
//
// A failed check is a programming error (a borrow outliving its owner),
// so it is reported and the process aborts. There is nothing to recover.

#ifdef BOOW_NO_STD

#define BOOW_VERIFY(x, errmsg) \
	do {                       \
		if (!(x)) {            \
			__builtin_trap();  \
		}                      \
	} while (0)

#else

#include <execinfo.h>

#include <cstdlib>
#include <iostream>

#define DBG_MACRO_NO_WARNING
#include <dbg.h>

#define BOOW_PRINT_STACK_TRACE()                                       \
	do {                                                               \
		void* buffer[30];                                              \
		int size = backtrace(buffer, 30);                              \
		char** symbols = backtrace_symbols(buffer, size);              \
		if (symbols == nullptr) {                                      \
			std::cerr << "Failed to obtain stack trace." << std::endl; \
			break;                                                     \
		}                                                              \
		std::cerr << "Stack trace:" << std::endl;                      \
		for (int i = 0; i < size; ++i) {                               \
			std::cerr << symbols[i] << std::endl;                      \
		}                                                              \
		free(symbols);                                                 \
	} while (0)

#define BOOW_VERIFY(x, errmsg)        \
	do {                              \
		if (!(x)) {                   \
			dbg(x, errmsg);           \
			BOOW_PRINT_STACK_TRACE(); \
			std::abort();             \
		}                             \
	} while (0)

#endif // BOOW_NO_STD

#endif // BOOW_VERIFY_HPP
