#include "Wallet.h"
#include "Utilities.h"

namespace pwl {

Wallet::Roe<Wallet> Wallet::generate() {
  auto pair = utl::ecdsaGenerate();
  if (!pair) {
    return Error(E_KEYGEN, pair.error().message);
  }
  Wallet wallet;
  wallet.privateKey_ = utl::base64Encode(pair.value().privateKey);
  wallet.publicKey_ = utl::base64Encode(pair.value().publicKey);
  return wallet;
}

Wallet::Roe<Wallet> Wallet::fromKeys(const std::string &privateKey,
                                     const std::string &publicKey) {
  auto rawPrivate = utl::base64Decode(privateKey);
  if (!rawPrivate) {
    return Error(E_INVALID_KEY, "Private key is not valid base64");
  }
  auto derived = utl::ecdsaDerivePublic(rawPrivate.value());
  if (!derived) {
    return Error(E_INVALID_KEY, derived.error().message);
  }

  std::string derivedPublic = utl::base64Encode(derived.value());
  if (!publicKey.empty() && publicKey != derivedPublic) {
    return Error(E_KEY_MISMATCH, "Public key does not belong to private key");
  }

  Wallet wallet;
  wallet.privateKey_ = privateKey;
  wallet.publicKey_ = derivedPublic;
  return wallet;
}

nlohmann::json Wallet::toJson() const {
  nlohmann::json j;
  j["privateKey"] = privateKey_;
  j["publicKey"] = publicKey_;
  j["address"] = getAddress();
  return j;
}

} // namespace pwl
