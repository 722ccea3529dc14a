#pragma once

namespace lendcore::tests {

void test_checked_math();
void test_error_codes();

}  // namespace lendcore::tests
