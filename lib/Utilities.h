#ifndef POWLEDGER_UTILITIES_H
#define POWLEDGER_UTILITIES_H

#include "ResultOrError.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace pwl {

// Error type for utility functions
struct Error : public RoeErrorBase {
  using RoeErrorBase::RoeErrorBase;
};

template <typename T> using Roe = ResultOrError<T, Error>;

namespace utl {

/**
 * Get the current time in seconds since the epoch
 * @return Current time in seconds
 */
int64_t getCurrentTime();

/**
 * Format a unix time as local "YYYY-MM-DD HH:MM:SS"
 * @param unixSeconds Seconds since the epoch
 * @return Formatted timestamp
 */
std::string formatTimestamp(int64_t unixSeconds);

/**
 * Parse a 64-bit unsigned integer from a string
 * @param str String to parse
 * @param value Output parameter for the parsed value
 * @return true if the whole string was a valid number
 */
bool parseUInt64(const std::string &str, uint64_t &value);

/**
 * Load and parse a JSON file
 * @param path Path to the JSON file
 * @return Parsed document, or error if missing or malformed
 */
Roe<nlohmann::json> loadJsonFile(const std::string &path);

/**
 * Read a whole file into a string
 */
Roe<std::string> readFile(const std::string &path);

/**
 * Write a string to a non-existent file
 * Creates parent directories if needed. Fails if the file already exists.
 * @param filePath Path to the file to write
 * @param content String content to write to the file
 * @return Roe<void> indicating success or error
 */
Roe<void> writeToNewFile(const std::string &filePath, const std::string &content);

/**
 * Replace a file's content atomically.
 * Content is written to "<filePath>.tmp" first and then renamed over the
 * target, so readers see either the old or the new file, never a mix.
 */
Roe<void> writeFileAtomic(const std::string &filePath, const std::string &content);

/**
 * Compute SHA-256 hash using libsodium
 * @param input Input bytes to hash
 * @return Lowercase hexadecimal digest (64 characters)
 */
std::string sha256(const std::string &input);

/**
 * Incremental SHA-256 using libsodium.
 * The state is held by value, so copying a hasher that has absorbed a
 * common prefix is cheap and leaves the original untouched.
 */
class Sha256 {
public:
  Sha256();

  void update(const std::string &data);

  /** Lowercase hex digest of everything absorbed so far */
  std::string hexDigest() const;

private:
  // Large enough for crypto_hash_sha256_state (checked in Utilities.cpp)
  alignas(8) unsigned char state_[128];
};

/**
 * Encode binary data as lowercase hex
 */
std::string hexEncode(const std::string &data);

/**
 * Encode binary data as standard base64 (with padding)
 */
std::string base64Encode(const std::string &data);

/**
 * Decode standard base64
 * @return Decoded bytes, or error if the input is not valid base64
 */
Roe<std::string> base64Decode(const std::string &b64);

// --- ECDSA over NIST P-256 with SHA-256 (raw binary forms)
//   private key: 32-byte big-endian scalar
//   public key:  64 bytes, X || Y
//   signature:   64 bytes, r || s

struct EcdsaKeyPair {
  std::string publicKey;
  std::string privateKey;
};

/**
 * Generate a new P-256 key pair
 */
Roe<EcdsaKeyPair> ecdsaGenerate();

/**
 * Compute the public key belonging to a private key
 * @param privateKey 32-byte raw private scalar
 * @return 64-byte raw public key
 */
Roe<std::string> ecdsaDerivePublic(const std::string &privateKey);

/**
 * Sign SHA-256(message) with a P-256 private key
 * @param privateKey 32-byte raw private scalar
 * @param message Message to sign (arbitrary bytes)
 * @return 64-byte r || s signature
 */
Roe<std::string> ecdsaSign(const std::string &privateKey, const std::string &message);

/**
 * Verify a P-256 signature over SHA-256(message)
 * @return true only for a well-formed key and signature that verify
 */
bool ecdsaVerify(const std::string &publicKey, const std::string &message,
                 const std::string &signature);

} // namespace utl
} // namespace pwl

#endif // POWLEDGER_UTILITIES_H
