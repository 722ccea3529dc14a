#pragma once

#include <cassert>

#include "lendcore/common/errors.hpp"

namespace lendcore::tests {

// Runs `fn` and asserts it throws LendingError with the expected code.
template <typename Fn>
void expect_error(common::ErrorCode expected, Fn&& fn) {
  bool thrown = false;
  try {
    fn();
  } catch (const common::LendingError& e) {
    thrown = true;
    assert(e.code() == expected);
  }
  assert(thrown);
}

}  // namespace lendcore::tests
