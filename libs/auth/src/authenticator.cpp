#include "lendcore/auth/authenticator.hpp"

#include <sodium.h>

#include <stdexcept>
#include <string>
#include <string_view>

#include "lendcore/common/errors.hpp"

namespace lendcore {
namespace auth {

namespace {

constexpr std::string_view kDepositTag = "deposit";
constexpr std::string_view kSignedMessagePrefix = "\x19Lendcore Signed Message:\n32";

class SodiumInitializer {
 public:
  SodiumInitializer() {
    if (sodium_init() < 0) {
      throw std::runtime_error("Failed to initialize libsodium");
    }
  }
};

// Ensure sodium is initialized before any crypto operations
void ensure_sodium_init() {
  static SodiumInitializer init;
}

template <typename T>
void append_big_endian(std::vector<std::byte>& out, T value) {
  const auto raw = static_cast<std::uint64_t>(value);
  for (int shift = static_cast<int>(sizeof(T) * 8) - 8; shift >= 0; shift -= 8) {
    out.push_back(static_cast<std::byte>((raw >> shift) & 0xff));
  }
}

Digest blake2b(std::span<const std::byte> data) {
  ensure_sodium_init();
  Digest digest{};
  crypto_generichash(digest.data(), digest.size(),
                     reinterpret_cast<const unsigned char*>(data.data()), data.size(),
                     nullptr, 0);
  return digest;
}

}  // namespace

Authenticator::Authenticator() {
  ensure_sodium_init();
}

void Authenticator::verify_deposit(common::AccountId caller,
                                   common::AssetId asset,
                                   common::Amount amount,
                                   const DepositAuthorization& authorization,
                                   common::TimestampSec now,
                                   common::Nonce expected_nonce) const {
  if (now > authorization.deadline) {
    throw common::LendingError(common::ErrorCode::kSignatureExpired,
                               "deadline " + std::to_string(authorization.deadline));
  }

  if (authorization.nonce != expected_nonce) {
    throw common::LendingError(common::ErrorCode::kInvalidNonce,
                               "expected " + std::to_string(expected_nonce) + ", got " +
                                   std::to_string(authorization.nonce));
  }

  const Digest digest = deposit_digest(asset, amount, authorization.nonce, authorization.deadline);
  const common::AccountId signer = recover_signer(digest, authorization.signer_key, authorization.signature);
  if (signer == common::kNullAccount) {
    throw common::LendingError(common::ErrorCode::kInvalidSignature, "signature does not verify");
  }
  if (signer != caller) {
    throw common::LendingError(common::ErrorCode::kInvalidSignature, "signer is not the caller");
  }
}

std::vector<std::byte> Authenticator::canonical_deposit_message(common::AssetId asset,
                                                                common::Amount amount,
                                                                common::Nonce nonce,
                                                                common::TimestampSec deadline) {
  std::vector<std::byte> message;
  message.reserve(kDepositTag.size() + sizeof(asset) + sizeof(amount) + sizeof(nonce) + sizeof(deadline));
  for (const char c : kDepositTag) {
    message.push_back(static_cast<std::byte>(c));
  }
  append_big_endian(message, asset);
  append_big_endian(message, amount);
  append_big_endian(message, nonce);
  append_big_endian(message, deadline);
  return message;
}

Digest Authenticator::message_digest(std::span<const std::byte> message) {
  return blake2b(message);
}

Digest Authenticator::signed_message_digest(const Digest& digest) {
  std::vector<std::byte> prefixed;
  prefixed.reserve(kSignedMessagePrefix.size() + digest.size());
  for (const char c : kSignedMessagePrefix) {
    prefixed.push_back(static_cast<std::byte>(c));
  }
  for (const auto b : digest) {
    prefixed.push_back(static_cast<std::byte>(b));
  }
  return blake2b(prefixed);
}

Digest Authenticator::deposit_digest(common::AssetId asset,
                                     common::Amount amount,
                                     common::Nonce nonce,
                                     common::TimestampSec deadline) {
  const auto message = canonical_deposit_message(asset, amount, nonce, deadline);
  return signed_message_digest(message_digest(message));
}

common::AccountId Authenticator::account_from_public_key(const PublicKey& public_key) {
  const Digest digest = blake2b(std::as_bytes(std::span(public_key)));
  common::AccountId account = 0;
  for (std::size_t i = 0; i < sizeof(common::AccountId); ++i) {
    account = (account << 8) | digest[i];
  }
  return account;
}

common::AccountId Authenticator::recover_signer(const Digest& digest,
                                                const PublicKey& public_key,
                                                const Signature& signature) {
  if (!verify_with_key(public_key, std::as_bytes(std::span(digest)), signature)) {
    return common::kNullAccount;
  }
  return account_from_public_key(public_key);
}

bool Authenticator::verify_with_key(const PublicKey& public_key,
                                    std::span<const std::byte> message,
                                    const Signature& signature) {
  ensure_sodium_init();

  return crypto_sign_verify_detached(
             signature.data(),
             reinterpret_cast<const unsigned char*>(message.data()),
             message.size(),
             public_key.data()) == 0;
}

bool Authenticator::sign(const SecretKey& secret_key,
                         std::span<const std::byte> message,
                         Signature& out_signature) {
  ensure_sodium_init();

  return crypto_sign_detached(
             out_signature.data(),
             nullptr,
             reinterpret_cast<const unsigned char*>(message.data()),
             message.size(),
             secret_key.data()) == 0;
}

DepositAuthorization Authenticator::authorize_deposit(const PublicKey& public_key,
                                                      const SecretKey& secret_key,
                                                      common::AssetId asset,
                                                      common::Amount amount,
                                                      common::Nonce nonce,
                                                      common::TimestampSec deadline) {
  DepositAuthorization authorization{
      .nonce = nonce,
      .deadline = deadline,
      .signer_key = public_key,
      .signature = {},
  };
  const Digest digest = deposit_digest(asset, amount, nonce, deadline);
  if (!sign(secret_key, std::as_bytes(std::span(digest)), authorization.signature)) {
    throw std::runtime_error("failed to sign deposit authorization");
  }
  return authorization;
}

void Authenticator::generate_keypair(PublicKey& out_public, SecretKey& out_secret) {
  ensure_sodium_init();
  crypto_sign_keypair(out_public.data(), out_secret.data());
}

}  // namespace auth
}  // namespace lendcore
