#ifndef BOOW_HPP
#define BOOW_HPP

// boow - Borrowed-Or-oWned values for C++
//
// Bow<T> holds either a borrowed reference or an owned value and reads
// the same way in both cases, without ever requiring T to be copyable.
//
// - Bow<T>      the holder (Borrowed / Owned)
// - Lender<T>   an owner that counts and checks the borrows it hands out
// - Option<T>   what Bow<T>::extract() returns

#include "boow/option.hpp"
#include "boow/bow.hpp"
#include "boow/lender.hpp"

#endif // BOOW_HPP
