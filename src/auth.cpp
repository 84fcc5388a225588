// Credential store and identity directory

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

#include <fmt/core.h>
#include "auth.hpp"
#include "common.hpp"

namespace auth {

namespace {

// Same shape as a real credential so the comparison costs the same
const std::string kDummyCredential(44, 'A');

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Parse "<key> <value>" lines. Blank lines and '#' comments are skipped.
template<typename Fn>
void for_each_pair(const std::string& path, const char* what, Fn&& fn) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError(fmt::format("Cannot open {} file '{}'", what, path));
    }

    std::string line;
    int lineno = 0;
    while (std::getline(in, line)) {
        lineno++;
        size_t hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);
        line = trim(line);
        if (line.empty()) continue;

        std::istringstream fields(line);
        std::string key, value, extra;
        if (!(fields >> key >> value) || (fields >> extra)) {
            throw ConfigError(fmt::format("{}:{}: expected '<identity> <{}>'",
                                          path, lineno, what));
        }
        fn(key, value);
    }
}

}  // namespace

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) begin++;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
    return s.substr(begin, end - begin);
}

// ============================================================
// CredentialStore
// ============================================================

void CredentialStore::add(const std::string& identity, const std::string& credential) {
    credentials_[trim(identity)] = credential;
}

void CredentialStore::add_secret(const std::string& identity, const std::string& secret) {
    add(identity, hash_secret(secret));
}

bool CredentialStore::verify(const std::string& identity, const std::string& proof) const {
    auto it = credentials_.find(trim(identity));
    if (it == credentials_.end()) {
        constant_time_equals(kDummyCredential, proof);
        return false;
    }
    return constant_time_equals(it->second, proof);
}

bool CredentialStore::exists(const std::string& identity) const {
    return credentials_.count(trim(identity)) > 0;
}

std::set<std::string> CredentialStore::all_identities() const {
    std::set<std::string> out;
    for (const auto& [identity, credential] : credentials_) {
        out.insert(identity);
    }
    return out;
}

void CredentialStore::load_file(const std::string& path) {
    for_each_pair(path, "credential", [this](const std::string& id, const std::string& cred) {
        add(id, cred);
    });
}

// ============================================================
// IdentityDirectory
// ============================================================

void IdentityDirectory::add(const std::string& identity, const std::string& address) {
    addresses_[trim(identity)] = trim(address);
}

std::optional<std::string> IdentityDirectory::address_for(const std::string& identity) const {
    auto it = addresses_.find(trim(identity));
    if (it == addresses_.end()) return std::nullopt;
    return it->second;
}

std::optional<std::string> IdentityDirectory::identity_for(const std::string& address) const {
    std::string wanted = to_lower(trim(address));
    if (wanted.empty()) return std::nullopt;
    for (const auto& [identity, addr] : addresses_) {
        if (to_lower(addr) == wanted) return identity;
    }
    return std::nullopt;
}

void IdentityDirectory::load_file(const std::string& path) {
    for_each_pair(path, "address", [this](const std::string& id, const std::string& addr) {
        add(id, addr);
    });
}

}  // namespace auth
