#pragma once

// Credential hashing and the two lookup services a server is wired with:
// the credential store (identity -> hashed secret) and the identity
// directory (identity <-> hostname).

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>

#include <openssl/crypto.h>
#include <openssl/evp.h>

namespace auth {

constexpr size_t DIGEST_SIZE = 32;  // SHA-256

// Base64(SHA-256(secret)). Used for both stored credentials and wire proofs.
inline std::string hash_secret(const std::string& secret) {
    uint8_t digest[DIGEST_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(secret.data(), secret.size(), digest, &digest_len,
                   EVP_sha256(), nullptr) != 1 || digest_len != DIGEST_SIZE) {
        return {};
    }

    // 4 * ceil(32 / 3) = 44 chars + NUL
    unsigned char encoded[48];
    int n = EVP_EncodeBlock(encoded, digest, static_cast<int>(digest_len));
    if (n <= 0) return {};
    return std::string(reinterpret_cast<const char*>(encoded), n);
}

// Timing does not depend on the position of the first differing byte.
// Unequal lengths still walk the whole of `a` before returning false.
inline bool constant_time_equals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        CRYPTO_memcmp(a.data(), a.data(), a.size());
        return false;
    }
    if (a.empty()) return true;
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

// ============================================================
// Credential Store
// ============================================================
class CredentialStore {
public:
    // Store an already-hashed credential
    void add(const std::string& identity, const std::string& credential);

    // Hash `secret` and store the result
    void add_secret(const std::string& identity, const std::string& secret);

    // Unknown identities compare against a dummy credential so the
    // rejection path is the same as for a wrong proof.
    bool verify(const std::string& identity, const std::string& proof) const;

    bool exists(const std::string& identity) const;
    std::set<std::string> all_identities() const;
    size_t size() const { return credentials_.size(); }

    // Lines of "<identity> <credential>", '#' starts a comment.
    // Throws ConfigError if the file cannot be read or a line is malformed.
    void load_file(const std::string& path);

private:
    std::map<std::string, std::string> credentials_;
};

// ============================================================
// Identity Directory
// ============================================================
class IdentityDirectory {
public:
    void add(const std::string& identity, const std::string& address);

    std::optional<std::string> address_for(const std::string& identity) const;

    // Case-insensitive reverse lookup, input is trimmed
    std::optional<std::string> identity_for(const std::string& address) const;

    size_t size() const { return addresses_.size(); }

    // Lines of "<identity> <address>", '#' starts a comment
    void load_file(const std::string& path);

private:
    std::map<std::string, std::string> addresses_;
};

// Leading/trailing whitespace removed
std::string trim(const std::string& s);

}  // namespace auth
