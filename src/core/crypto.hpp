/**
 * Tally: Personal Finance Tracker - Cryptographic Module Header
 * Purpose: PIN hashing and verification for the Credential Gate.
 */

#ifndef TALLY_CRYPTO_HPP
#define TALLY_CRYPTO_HPP

#include <string>

namespace tally {

/**
 * PinCredential
 * A stored PIN hash together with everything needed to recompute it.
 * Serialized as "pbkdf2_sha256$<iterations>$<salt-hex>$<hash-hex>".
 * A bare 64-char hex string is the legacy unsalted SHA-256 form.
 */
struct PinCredential {
    std::string algorithm;   // "pbkdf2_sha256" or "sha256"
    int iterations = 0;
    std::string salt_hex;
    std::string hash_hex;

    std::string encode() const;

    // Throws CorruptDataError if the text is neither supported form.
    static PinCredential parse(const std::string& text);
};

class TallyCrypto {
public:
    static constexpr int DEFAULT_PIN_ITERATIONS = 200000;
    static constexpr int SALT_BYTES = 16;

    static std::string generate_sha256(const std::string& str);

    /**
     * random_hex
     * Hex of `bytes` bytes drawn from the OpenSSL CSPRNG.
     */
    static std::string random_hex(int bytes);

    /**
     * hash_pin
     * Salts and stretches a PIN with PBKDF2-HMAC-SHA256.
     */
    static PinCredential hash_pin(const std::string& pin, int iterations = DEFAULT_PIN_ITERATIONS);

    /**
     * verify_pin
     * Recomputes the hash with the stored parameters and compares in
     * constant time. Legacy sha256 credentials are still honoured.
     */
    static bool verify_pin(const std::string& attempt, const PinCredential& stored);

    // Compares two secrets without an early exit on the first mismatch.
    static bool constant_time_equals(const std::string& a, const std::string& b);

    // True for credentials that should be re-hashed after the next unlock.
    static bool needs_rehash(const PinCredential& stored, int iterations);

private:
    static std::string pbkdf2_hex(const std::string& pin, const std::string& salt_hex, int iterations);
};

} // namespace tally

#endif
