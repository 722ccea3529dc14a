#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "lendcore/common/types.hpp"

namespace lendcore {
namespace auth {

// ed25519 key sizes
constexpr std::size_t kPublicKeySize = 32;
constexpr std::size_t kSecretKeySize = 64;
constexpr std::size_t kSignatureSize = 64;
constexpr std::size_t kDigestSize = 32;

using PublicKey = std::array<std::uint8_t, kPublicKeySize>;
using SecretKey = std::array<std::uint8_t, kSecretKeySize>;
using Signature = std::array<std::uint8_t, kSignatureSize>;
using Digest = std::array<std::uint8_t, kDigestSize>;

// Off-chain authorization for a single deposit. The signature covers the
// signed-message digest of the canonical deposit message.
struct DepositAuthorization {
  common::Nonce nonce{0};
  common::TimestampSec deadline{0};
  PublicKey signer_key{};
  Signature signature{};
};

class Authenticator {
 public:
  Authenticator();

  // Checks deadline, nonce and signer for a deposit submitted by `caller`.
  // Throws kSignatureExpired, kInvalidNonce or kInvalidSignature.
  void verify_deposit(common::AccountId caller,
                      common::AssetId asset,
                      common::Amount amount,
                      const DepositAuthorization& authorization,
                      common::TimestampSec now,
                      common::Nonce expected_nonce) const;

  // Message layout (big-endian, fixed width):
  // ["deposit":7][asset:4][amount:8][nonce:8][deadline:8]
  static std::vector<std::byte> canonical_deposit_message(common::AssetId asset,
                                                          common::Amount amount,
                                                          common::Nonce nonce,
                                                          common::TimestampSec deadline);

  // BLAKE2b-256 of the message.
  static Digest message_digest(std::span<const std::byte> message);

  // BLAKE2b-256 of the signed-message prefix followed by the digest.
  static Digest signed_message_digest(const Digest& digest);

  static Digest deposit_digest(common::AssetId asset,
                               common::Amount amount,
                               common::Nonce nonce,
                               common::TimestampSec deadline);

  // Account identity bound to a public key: first 8 bytes of its BLAKE2b-256 hash.
  static common::AccountId account_from_public_key(const PublicKey& public_key);

  // Returns the account of `public_key` when `signature` verifies over
  // `digest`, otherwise the null account.
  static common::AccountId recover_signer(const Digest& digest,
                                          const PublicKey& public_key,
                                          const Signature& signature);

  // Verify using explicit public key
  static bool verify_with_key(const PublicKey& public_key,
                              std::span<const std::byte> message,
                              const Signature& signature);

  // Sign a message with a secret key (for testing/client use)
  static bool sign(const SecretKey& secret_key,
                   std::span<const std::byte> message,
                   Signature& out_signature);

  // Produce a complete authorization for a deposit (for client use)
  static DepositAuthorization authorize_deposit(const PublicKey& public_key,
                                                const SecretKey& secret_key,
                                                common::AssetId asset,
                                                common::Amount amount,
                                                common::Nonce nonce,
                                                common::TimestampSec deadline);

  // Generate a new keypair (for testing/setup)
  static void generate_keypair(PublicKey& out_public, SecretKey& out_secret);
};

}  // namespace auth
}  // namespace lendcore
