#include "crypto.hpp"
#include "errors.hpp"
#include <openssl/crypto.h>
#include <openssl/evp.h> // Modern OpenSSL API
#include <openssl/rand.h>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <vector>

namespace tally {

namespace {

const char* PBKDF2_TAG = "pbkdf2_sha256";
const char* LEGACY_TAG = "sha256";
const int HASH_BYTES = 32;

std::string to_hex(const unsigned char* data, size_t len) {
    std::stringstream ss;
    for (size_t i = 0; i < len; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << (int)data[i];
    }
    return ss.str();
}

bool is_hex(const std::string& s) {
    if (s.empty() || s.size() % 2 != 0) return false;
    for (char c : s) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

std::vector<unsigned char> from_hex(const std::string& hex) {
    std::vector<unsigned char> out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i + 1 < hex.size(); i += 2) {
        out.push_back(static_cast<unsigned char>(std::stoi(hex.substr(i, 2), nullptr, 16)));
    }
    return out;
}

std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : s) {
        if (c == sep) {
            parts.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    parts.push_back(current);
    return parts;
}

} // namespace

// ----------------------------------------------------------------------------
// PinCredential
// ----------------------------------------------------------------------------
std::string PinCredential::encode() const {
    if (algorithm == LEGACY_TAG) return hash_hex;
    return algorithm + "$" + std::to_string(iterations) + "$" + salt_hex + "$" + hash_hex;
}

PinCredential PinCredential::parse(const std::string& text) {
    PinCredential cred;

    // v1 files hold the plain SHA-256 hex digest of the PIN.
    if (text.size() == 64 && is_hex(text)) {
        cred.algorithm = LEGACY_TAG;
        cred.hash_hex = text;
        return cred;
    }

    std::vector<std::string> parts = split(text, '$');
    if (parts.size() != 4 || parts[0] != PBKDF2_TAG) {
        throw CorruptDataError("Unrecognised PIN hash format.");
    }

    int iterations = 0;
    try {
        size_t used = 0;
        iterations = std::stoi(parts[1], &used);
        if (used != parts[1].size()) iterations = 0;
    } catch (const std::exception&) {
        iterations = 0;
    }
    if (iterations <= 0 || !is_hex(parts[2]) || parts[3].size() != HASH_BYTES * 2 || !is_hex(parts[3])) {
        throw CorruptDataError("Malformed PIN hash parameters.");
    }

    cred.algorithm = PBKDF2_TAG;
    cred.iterations = iterations;
    cred.salt_hex = parts[2];
    cred.hash_hex = parts[3];
    return cred;
}

// ----------------------------------------------------------------------------
// TallyCrypto
// ----------------------------------------------------------------------------
std::string TallyCrypto::generate_sha256(const std::string& str) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int length = 0;

    EVP_MD_CTX* context = EVP_MD_CTX_new();
    if (context == nullptr) {
        throw std::runtime_error("EVP_MD_CTX_new failed.");
    }
    bool ok = EVP_DigestInit_ex(context, EVP_sha256(), NULL) == 1
           && EVP_DigestUpdate(context, str.c_str(), str.size()) == 1
           && EVP_DigestFinal_ex(context, hash, &length) == 1;
    EVP_MD_CTX_free(context);
    if (!ok) {
        throw std::runtime_error("SHA-256 digest failed.");
    }

    return to_hex(hash, length);
}

std::string TallyCrypto::random_hex(int bytes) {
    std::vector<unsigned char> buf(static_cast<size_t>(bytes));
    if (RAND_bytes(buf.data(), bytes) != 1) {
        throw std::runtime_error("RAND_bytes failed to produce a salt.");
    }
    return to_hex(buf.data(), buf.size());
}

std::string TallyCrypto::pbkdf2_hex(const std::string& pin, const std::string& salt_hex, int iterations) {
    std::vector<unsigned char> salt = from_hex(salt_hex);
    unsigned char out[HASH_BYTES];
    if (PKCS5_PBKDF2_HMAC(pin.c_str(), static_cast<int>(pin.size()),
                          salt.data(), static_cast<int>(salt.size()),
                          iterations, EVP_sha256(), HASH_BYTES, out) != 1) {
        throw std::runtime_error("PBKDF2 derivation failed.");
    }
    return to_hex(out, HASH_BYTES);
}

PinCredential TallyCrypto::hash_pin(const std::string& pin, int iterations) {
    PinCredential cred;
    cred.algorithm = PBKDF2_TAG;
    cred.iterations = iterations;
    cred.salt_hex = random_hex(SALT_BYTES);
    cred.hash_hex = pbkdf2_hex(pin, cred.salt_hex, iterations);
    return cred;
}

bool TallyCrypto::verify_pin(const std::string& attempt, const PinCredential& stored) {
    std::string candidate;
    if (stored.algorithm == LEGACY_TAG) {
        candidate = generate_sha256(attempt);
    } else {
        candidate = pbkdf2_hex(attempt, stored.salt_hex, stored.iterations);
    }

    return constant_time_equals(candidate, stored.hash_hex);
}

bool TallyCrypto::constant_time_equals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

bool TallyCrypto::needs_rehash(const PinCredential& stored, int iterations) {
    return stored.algorithm != PBKDF2_TAG || stored.iterations < iterations;
}

} // namespace tally
