#pragma once

namespace lendcore::tests {

void test_canonical_deposit_message();
void test_signer_recovery();
void test_verify_deposit();
void test_nonce_registry();

}  // namespace lendcore::tests
