#pragma once

#include "ResultOrError.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace pwl {

/**
 * P-256 key pair held in its portable form (base64 of the raw key bytes).
 * The base64 public key is also the wallet's address.
 */
class Wallet {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_KEYGEN = 1;       // Key generation failed
  constexpr static int32_t E_INVALID_KEY = 2;  // Key does not decode or is out of range
  constexpr static int32_t E_KEY_MISMATCH = 3; // Public key does not match private key

  Wallet() = default;

  static Roe<Wallet> generate();

  /**
   * Load a wallet from base64 keys.
   * @param publicKey May be empty, in which case it is derived
   */
  static Roe<Wallet> fromKeys(const std::string &privateKey,
                              const std::string &publicKey = "");

  const std::string &getPrivateKey() const { return privateKey_; }
  const std::string &getPublicKey() const { return publicKey_; }
  const std::string &getAddress() const { return publicKey_; }
  bool isEmpty() const { return privateKey_.empty(); }

  nlohmann::json toJson() const;

private:
  std::string privateKey_;
  std::string publicKey_;
};

} // namespace pwl
