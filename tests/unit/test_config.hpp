#pragma once

namespace lendcore::tests {

void test_config_defaults();
void test_config_parsing();
void test_config_validation();

}  // namespace lendcore::tests
