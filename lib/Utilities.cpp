#include "Utilities.h"

#include <charconv>
#include <chrono>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <memory>
#include <new>
#include <sodium.h>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <openssl/param_build.h>

namespace pwl {
namespace utl {

// Initialize libsodium (safe to call multiple times)
namespace {
struct SodiumInitializer {
  SodiumInitializer() {
    if (sodium_init() < 0) {
      throw std::runtime_error("Failed to initialize libsodium");
    }
  }
};
static SodiumInitializer sodium_initializer;
} // namespace

int64_t getCurrentTime() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::string formatTimestamp(int64_t unixSeconds) {
  time_t t = static_cast<time_t>(unixSeconds);
  std::tm local{};
  if (!localtime_r(&t, &local)) {
    return std::to_string(unixSeconds);
  }
  char buf[32];
  if (std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &local) == 0) {
    return std::to_string(unixSeconds);
  }
  return std::string(buf);
}

bool parseUInt64(const std::string &str, uint64_t &value) {
  auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
  return ec == std::errc{} && ptr == str.data() + str.size();
}

Roe<nlohmann::json> loadJsonFile(const std::string &path) {
  if (!std::filesystem::exists(path)) {
    return Error(1, "File not found: " + path);
  }

  auto content = readFile(path);
  if (!content) {
    return content.error();
  }

  try {
    return nlohmann::json::parse(content.value());
  } catch (const nlohmann::json::parse_error &e) {
    return Error(3, "Failed to parse JSON in " + path + ": " + e.what());
  }
}

Roe<std::string> readFile(const std::string &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return Error(2, "Failed to open file: " + path);
  }
  std::string content((std::istreambuf_iterator<char>(file)),
                      std::istreambuf_iterator<char>());
  if (file.bad()) {
    return Error(2, "Failed to read file: " + path);
  }
  return content;
}

static Roe<void> ensureParentDir(const std::filesystem::path &path) {
  std::filesystem::path parentDir = path.parent_path();
  if (!parentDir.empty() && !std::filesystem::exists(parentDir)) {
    std::error_code ec;
    std::filesystem::create_directories(parentDir, ec);
    if (ec) {
      return Error(2, "Failed to create parent directories for " +
                          path.string() + ": " + ec.message());
    }
  }
  return {};
}

static Roe<void> writeFile(const std::string &filePath,
                           const std::string &content) {
  std::ofstream file(filePath, std::ios::binary | std::ios::trunc);
  if (!file.is_open()) {
    return Error(3, "Failed to open file for writing: " + filePath);
  }
  file << content;
  file.close();
  if (!file.good()) {
    return Error(4, "Failed to write content to file: " + filePath);
  }
  return {};
}

Roe<void> writeToNewFile(const std::string &filePath,
                         const std::string &content) {
  if (std::filesystem::exists(filePath)) {
    return Error(1, "File already exists: " + filePath);
  }
  auto dirResult = ensureParentDir(filePath);
  if (!dirResult) {
    return dirResult;
  }
  return writeFile(filePath, content);
}

Roe<void> writeFileAtomic(const std::string &filePath,
                          const std::string &content) {
  auto dirResult = ensureParentDir(filePath);
  if (!dirResult) {
    return dirResult;
  }

  std::string tempPath = filePath + ".tmp";
  auto writeResult = writeFile(tempPath, content);
  if (!writeResult) {
    return writeResult;
  }

  std::error_code ec;
  std::filesystem::rename(tempPath, filePath, ec);
  if (ec) {
    std::filesystem::remove(tempPath, ec);
    return Error(5, "Failed to replace " + filePath);
  }
  return {};
}

std::string sha256(const std::string &input) {
  unsigned char hash[crypto_hash_sha256_BYTES];

  if (crypto_hash_sha256(hash,
                         reinterpret_cast<const unsigned char *>(input.data()),
                         input.size()) != 0) {
    throw std::runtime_error("crypto_hash_sha256 failed");
  }

  return hexEncode(std::string(reinterpret_cast<const char *>(hash),
                               crypto_hash_sha256_BYTES));
}

static_assert(sizeof(crypto_hash_sha256_state) <= sizeof(Sha256),
              "Sha256 buffer too small for the libsodium state");

namespace {
crypto_hash_sha256_state *sha256State(unsigned char *buffer) {
  return std::launder(reinterpret_cast<crypto_hash_sha256_state *>(buffer));
}
} // namespace

Sha256::Sha256() {
  crypto_hash_sha256_init(new (state_) crypto_hash_sha256_state);
}

void Sha256::update(const std::string &data) {
  crypto_hash_sha256_update(sha256State(state_),
                            reinterpret_cast<const unsigned char *>(data.data()),
                            data.size());
}

std::string Sha256::hexDigest() const {
  // Finalizing consumes the state, so work on a copy
  Sha256 copy = *this;
  unsigned char hash[crypto_hash_sha256_BYTES];
  if (crypto_hash_sha256_final(sha256State(copy.state_), hash) != 0) {
    throw std::runtime_error("crypto_hash_sha256_final failed");
  }
  return hexEncode(std::string(reinterpret_cast<const char *>(hash),
                               crypto_hash_sha256_BYTES));
}

std::string hexEncode(const std::string &data) {
  std::stringstream ss;
  for (unsigned char c : data) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
  }
  return ss.str();
}

std::string base64Encode(const std::string &data) {
  const size_t maxLen =
      sodium_base64_ENCODED_LEN(data.size(), sodium_base64_VARIANT_ORIGINAL);
  std::string out(maxLen, '\0');
  sodium_bin2base64(out.data(), maxLen,
                    reinterpret_cast<const unsigned char *>(data.data()),
                    data.size(), sodium_base64_VARIANT_ORIGINAL);
  // maxLen counts the terminating NUL
  out.resize(std::strlen(out.c_str()));
  return out;
}

Roe<std::string> base64Decode(const std::string &b64) {
  std::string out(b64.size() / 4 * 3 + 3, '\0');
  size_t binLen = 0;
  const char *end = nullptr;
  if (sodium_base642bin(reinterpret_cast<unsigned char *>(out.data()),
                        out.size(), b64.data(), b64.size(), nullptr, &binLen,
                        &end, sodium_base64_VARIANT_ORIGINAL) != 0 ||
      end != b64.data() + b64.size()) {
    return Error(1, "Invalid base64 input");
  }
  out.resize(binLen);
  return out;
}

// --- ECDSA P-256

namespace {

constexpr size_t P256_SCALAR_SIZE = 32;
constexpr size_t P256_PUBLIC_KEY_SIZE = 64;
constexpr size_t P256_SIGNATURE_SIZE = 64;
constexpr const char *P256_GROUP_NAME = "prime256v1";

struct OsslFree {
  void operator()(EVP_PKEY *p) const { EVP_PKEY_free(p); }
  void operator()(EVP_PKEY_CTX *p) const { EVP_PKEY_CTX_free(p); }
  void operator()(EVP_MD_CTX *p) const { EVP_MD_CTX_free(p); }
  void operator()(BIGNUM *p) const { BN_free(p); }
  void operator()(EC_GROUP *p) const { EC_GROUP_free(p); }
  void operator()(EC_POINT *p) const { EC_POINT_free(p); }
  void operator()(ECDSA_SIG *p) const { ECDSA_SIG_free(p); }
  void operator()(OSSL_PARAM_BLD *p) const { OSSL_PARAM_BLD_free(p); }
  void operator()(OSSL_PARAM *p) const { OSSL_PARAM_free(p); }
};

template <typename T> using OsslPtr = std::unique_ptr<T, OsslFree>;

const unsigned char *bytes(const std::string &s) {
  return reinterpret_cast<const unsigned char *>(s.data());
}

// Uncompressed SEC1 point: 0x04 || X || Y
std::string toSec1(const std::string &rawPublicKey) {
  return std::string(1, '\x04') + rawPublicKey;
}

Roe<OsslPtr<EVP_PKEY>> buildKey(int selection, const std::string &privateKey,
                                const std::string &publicKey) {
  OsslPtr<OSSL_PARAM_BLD> bld(OSSL_PARAM_BLD_new());
  if (!bld) {
    return Error(10, "OSSL_PARAM_BLD_new failed");
  }

  OsslPtr<BIGNUM> priv;
  std::string sec1 = toSec1(publicKey);
  if (OSSL_PARAM_BLD_push_utf8_string(bld.get(), OSSL_PKEY_PARAM_GROUP_NAME,
                                      P256_GROUP_NAME, 0) != 1 ||
      OSSL_PARAM_BLD_push_octet_string(bld.get(), OSSL_PKEY_PARAM_PUB_KEY,
                                       sec1.data(), sec1.size()) != 1) {
    return Error(11, "Failed to build key parameters");
  }
  if (!privateKey.empty()) {
    priv.reset(BN_bin2bn(bytes(privateKey), static_cast<int>(privateKey.size()),
                         nullptr));
    if (!priv ||
        OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_PRIV_KEY, priv.get()) != 1) {
      return Error(11, "Failed to build key parameters");
    }
  }

  OsslPtr<OSSL_PARAM> params(OSSL_PARAM_BLD_to_param(bld.get()));
  OsslPtr<EVP_PKEY_CTX> ctx(EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr));
  if (!params || !ctx || EVP_PKEY_fromdata_init(ctx.get()) != 1) {
    return Error(12, "Failed to initialize EC key import");
  }

  EVP_PKEY *raw = nullptr;
  if (EVP_PKEY_fromdata(ctx.get(), &raw, selection, params.get()) != 1) {
    return Error(13, "Invalid P-256 key");
  }
  return OsslPtr<EVP_PKEY>(raw);
}

} // namespace

Roe<EcdsaKeyPair> ecdsaGenerate() {
  OsslPtr<EVP_PKEY> pkey(EVP_PKEY_Q_keygen(nullptr, nullptr, "EC", "P-256"));
  if (!pkey) {
    return Error(1, "EC key generation failed");
  }

  BIGNUM *rawPriv = nullptr;
  if (EVP_PKEY_get_bn_param(pkey.get(), OSSL_PKEY_PARAM_PRIV_KEY, &rawPriv) != 1) {
    return Error(2, "Failed to export private key");
  }
  OsslPtr<BIGNUM> priv(rawPriv);

  EcdsaKeyPair pair;
  pair.privateKey.assign(P256_SCALAR_SIZE, '\0');
  if (BN_bn2binpad(priv.get(),
                   reinterpret_cast<unsigned char *>(pair.privateKey.data()),
                   P256_SCALAR_SIZE) != static_cast<int>(P256_SCALAR_SIZE)) {
    return Error(2, "Failed to export private key");
  }

  auto pub = ecdsaDerivePublic(pair.privateKey);
  if (!pub) {
    return pub.error();
  }
  pair.publicKey = pub.value();
  return pair;
}

Roe<std::string> ecdsaDerivePublic(const std::string &privateKey) {
  if (privateKey.size() != P256_SCALAR_SIZE) {
    return Error(1, "P-256 private key must be 32 bytes");
  }

  OsslPtr<EC_GROUP> group(EC_GROUP_new_by_curve_name(NID_X9_62_prime256v1));
  OsslPtr<BIGNUM> d(BN_bin2bn(bytes(privateKey), P256_SCALAR_SIZE, nullptr));
  if (!group || !d) {
    return Error(2, "Failed to load P-256 parameters");
  }
  if (BN_is_zero(d.get()) || BN_cmp(d.get(), EC_GROUP_get0_order(group.get())) >= 0) {
    return Error(3, "P-256 private key out of range");
  }

  OsslPtr<EC_POINT> point(EC_POINT_new(group.get()));
  if (!point ||
      EC_POINT_mul(group.get(), point.get(), d.get(), nullptr, nullptr, nullptr) != 1) {
    return Error(4, "Failed to compute public key");
  }

  unsigned char sec1[1 + P256_PUBLIC_KEY_SIZE];
  if (EC_POINT_point2oct(group.get(), point.get(), POINT_CONVERSION_UNCOMPRESSED,
                         sec1, sizeof(sec1), nullptr) != sizeof(sec1)) {
    return Error(4, "Failed to compute public key");
  }
  return std::string(reinterpret_cast<const char *>(sec1 + 1),
                     P256_PUBLIC_KEY_SIZE);
}

Roe<std::string> ecdsaSign(const std::string &privateKey,
                           const std::string &message) {
  auto pub = ecdsaDerivePublic(privateKey);
  if (!pub) {
    return pub.error();
  }
  auto pkey = buildKey(EVP_PKEY_KEYPAIR, privateKey, pub.value());
  if (!pkey) {
    return pkey.error();
  }

  OsslPtr<EVP_MD_CTX> md(EVP_MD_CTX_new());
  if (!md || EVP_DigestSignInit(md.get(), nullptr, EVP_sha256(), nullptr,
                                pkey.value().get()) != 1) {
    return Error(5, "EVP_DigestSignInit failed");
  }

  size_t derLen = 0;
  if (EVP_DigestSign(md.get(), nullptr, &derLen, bytes(message), message.size()) != 1) {
    return Error(6, "EVP_DigestSign failed");
  }
  std::vector<unsigned char> der(derLen);
  if (EVP_DigestSign(md.get(), der.data(), &derLen, bytes(message), message.size()) != 1) {
    return Error(6, "EVP_DigestSign failed");
  }

  const unsigned char *p = der.data();
  OsslPtr<ECDSA_SIG> sig(d2i_ECDSA_SIG(nullptr, &p, static_cast<long>(derLen)));
  if (!sig) {
    return Error(7, "Failed to decode DER signature");
  }
  const BIGNUM *r = nullptr;
  const BIGNUM *s = nullptr;
  ECDSA_SIG_get0(sig.get(), &r, &s);

  std::string out(P256_SIGNATURE_SIZE, '\0');
  auto *outBytes = reinterpret_cast<unsigned char *>(out.data());
  if (BN_bn2binpad(r, outBytes, P256_SCALAR_SIZE) != static_cast<int>(P256_SCALAR_SIZE) ||
      BN_bn2binpad(s, outBytes + P256_SCALAR_SIZE, P256_SCALAR_SIZE) !=
          static_cast<int>(P256_SCALAR_SIZE)) {
    return Error(7, "Failed to encode signature");
  }
  return out;
}

bool ecdsaVerify(const std::string &publicKey, const std::string &message,
                 const std::string &signature) {
  if (publicKey.size() != P256_PUBLIC_KEY_SIZE ||
      signature.size() != P256_SIGNATURE_SIZE) {
    return false;
  }

  auto pkey = buildKey(EVP_PKEY_PUBLIC_KEY, "", publicKey);
  if (!pkey) {
    return false;
  }

  OsslPtr<ECDSA_SIG> sig(ECDSA_SIG_new());
  BIGNUM *r = BN_bin2bn(bytes(signature), P256_SCALAR_SIZE, nullptr);
  BIGNUM *s = BN_bin2bn(bytes(signature) + P256_SCALAR_SIZE, P256_SCALAR_SIZE, nullptr);
  if (!sig || !r || !s || ECDSA_SIG_set0(sig.get(), r, s) != 1) {
    BN_free(r);
    BN_free(s);
    return false;
  }

  unsigned char *der = nullptr;
  int derLen = i2d_ECDSA_SIG(sig.get(), &der);
  if (derLen <= 0) {
    return false;
  }
  std::unique_ptr<unsigned char, void (*)(unsigned char *)> derGuard(
      der, [](unsigned char *ptr) { OPENSSL_free(ptr); });

  OsslPtr<EVP_MD_CTX> md(EVP_MD_CTX_new());
  if (!md || EVP_DigestVerifyInit(md.get(), nullptr, EVP_sha256(), nullptr,
                                  pkey.value().get()) != 1) {
    return false;
  }
  return EVP_DigestVerify(md.get(), der, static_cast<size_t>(derLen),
                          bytes(message), message.size()) == 1;
}

} // namespace utl
} // namespace pwl
