#pragma once

namespace lendcore::tests {

void test_market_registry();
void test_market_registry_rollback();

}  // namespace lendcore::tests
