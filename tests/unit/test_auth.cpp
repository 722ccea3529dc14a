#include "test_auth.hpp"

#include <cassert>
#include <cstddef>

#include "lendcore/auth/authenticator.hpp"
#include "lendcore/auth/nonce_registry.hpp"
#include "lendcore/ledger/undo_journal.hpp"
#include "test_support.hpp"

namespace lendcore::tests {

void test_canonical_deposit_message() {
  const auto message = auth::Authenticator::canonical_deposit_message(0x01020304, 0x0a0b, 7, 0x1122);
  assert(message.size() == 7 + 4 + 8 + 8 + 8);

  const char tag[] = "deposit";
  for (std::size_t i = 0; i < 7; ++i) {
    assert(message[i] == static_cast<std::byte>(tag[i]));
  }
  // Fixed-width big-endian fields.
  assert(message[7] == std::byte{0x01});
  assert(message[10] == std::byte{0x04});
  assert(message[17] == std::byte{0x0a});
  assert(message[18] == std::byte{0x0b});
  assert(message[26] == std::byte{0x07});
  assert(message[33] == std::byte{0x11});
  assert(message[34] == std::byte{0x22});

  // Every field is bound into the digest.
  const auto base = auth::Authenticator::deposit_digest(1, 100, 0, 5'000);
  assert(base == auth::Authenticator::deposit_digest(1, 100, 0, 5'000));
  assert(base != auth::Authenticator::deposit_digest(2, 100, 0, 5'000));
  assert(base != auth::Authenticator::deposit_digest(1, 101, 0, 5'000));
  assert(base != auth::Authenticator::deposit_digest(1, 100, 1, 5'000));
  assert(base != auth::Authenticator::deposit_digest(1, 100, 0, 5'001));

  // The signed digest is the prefixed re-hash, not the raw message hash.
  const auto raw = auth::Authenticator::message_digest(message);
  assert(auth::Authenticator::signed_message_digest(raw) != raw);
}

void test_signer_recovery() {
  auth::PublicKey pk{};
  auth::SecretKey sk{};
  auth::Authenticator::generate_keypair(pk, sk);

  auth::PublicKey other_pk{};
  auth::SecretKey other_sk{};
  auth::Authenticator::generate_keypair(other_pk, other_sk);

  const auto account = auth::Authenticator::account_from_public_key(pk);
  assert(account != common::kNullAccount);
  assert(account == auth::Authenticator::account_from_public_key(pk));
  assert(account != auth::Authenticator::account_from_public_key(other_pk));

  const auto authorization = auth::Authenticator::authorize_deposit(pk, sk, 3, 250, 0, 1'000);
  const auto digest = auth::Authenticator::deposit_digest(3, 250, 0, 1'000);
  assert(auth::Authenticator::recover_signer(digest, pk, authorization.signature) == account);

  // Wrong key, tampered payload or tampered signature recover the null account.
  assert(auth::Authenticator::recover_signer(digest, other_pk, authorization.signature) == common::kNullAccount);
  const auto tampered = auth::Authenticator::deposit_digest(3, 251, 0, 1'000);
  assert(auth::Authenticator::recover_signer(tampered, pk, authorization.signature) == common::kNullAccount);
  auto bad_signature = authorization.signature;
  bad_signature[0] ^= 0x01;
  assert(auth::Authenticator::recover_signer(digest, pk, bad_signature) == common::kNullAccount);
}

void test_verify_deposit() {
  const auth::Authenticator authenticator;

  auth::PublicKey pk{};
  auth::SecretKey sk{};
  auth::Authenticator::generate_keypair(pk, sk);
  const auto caller = auth::Authenticator::account_from_public_key(pk);

  auth::PublicKey other_pk{};
  auth::SecretKey other_sk{};
  auth::Authenticator::generate_keypair(other_pk, other_sk);

  const auto valid = auth::Authenticator::authorize_deposit(pk, sk, 1, 500, 4, 2'000);
  authenticator.verify_deposit(caller, 1, 500, valid, 1'999, 4);
  // The deadline itself is still valid.
  authenticator.verify_deposit(caller, 1, 500, valid, 2'000, 4);

  expect_error(common::ErrorCode::kSignatureExpired,
               [&] { authenticator.verify_deposit(caller, 1, 500, valid, 2'001, 4); });
  expect_error(common::ErrorCode::kInvalidNonce,
               [&] { authenticator.verify_deposit(caller, 1, 500, valid, 1'000, 5); });
  expect_error(common::ErrorCode::kInvalidSignature,
               [&] { authenticator.verify_deposit(caller, 1, 501, valid, 1'000, 4); });
  expect_error(common::ErrorCode::kInvalidSignature,
               [&] { authenticator.verify_deposit(caller, 2, 500, valid, 1'000, 4); });

  // A valid signature from someone other than the caller is rejected.
  const auto foreign = auth::Authenticator::authorize_deposit(other_pk, other_sk, 1, 500, 4, 2'000);
  expect_error(common::ErrorCode::kInvalidSignature,
               [&] { authenticator.verify_deposit(caller, 1, 500, foreign, 1'000, 4); });

  // Zeroed authorization never verifies.
  auth::DepositAuthorization empty{.nonce = 4, .deadline = 2'000};
  expect_error(common::ErrorCode::kInvalidSignature,
               [&] { authenticator.verify_deposit(caller, 1, 500, empty, 1'000, 4); });
}

void test_nonce_registry() {
  auth::NonceRegistry nonces;
  ledger::UndoJournal journal;

  assert(nonces.current(77) == 0);
  nonces.advance(77, journal);
  nonces.advance(77, journal);
  journal.commit();
  assert(nonces.current(77) == 2);
  assert(nonces.current(78) == 0);

  nonces.advance(77, journal);
  assert(nonces.current(77) == 3);
  const auto failure = journal.rollback();
  assert(!failure);
  assert(nonces.current(77) == 2);
}

}  // namespace lendcore::tests
