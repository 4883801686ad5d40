#include "CryptoUtils.hpp"
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

Digest CryptoUtils::sha256(const uint8_t* data, size_t size) {
    Digest digest;
    SHA256(data, size, digest.data());
    return digest;
}

Digest CryptoUtils::sha256(const std::vector<uint8_t>& data) {
    return sha256(data.data(), data.size());
}

std::string CryptoUtils::to_hex(const Digest& digest) {
    std::ostringstream oss;
    for (uint8_t byte : digest) {
        oss << std::hex << std::setw(2) << std::setfill('0') << (int)byte;
    }
    return oss.str();
}

Digest CryptoUtils::digest_from_hex(const std::string& hex_string) {
    if (!is_hex_digest(hex_string)) {
        throw std::invalid_argument("Invalid digest: " + hex_string);
    }
    std::string raw = hex_to_raw(hex_string);
    Digest digest;
    std::copy(raw.begin(), raw.end(), digest.begin());
    return digest;
}

std::string CryptoUtils::hex_to_raw(const std::string& hex_string) {
    if (hex_string.size() % 2 != 0) {
        throw std::invalid_argument("Invalid hex string length");
    }
    std::string raw;
    raw.reserve(hex_string.size() / 2);

    for (size_t i = 0; i < hex_string.size(); i += 2) {
        std::string byteString = hex_string.substr(i, 2);
        char byte = static_cast<char>(std::stoi(byteString, nullptr, 16));
        raw.push_back(byte);
    }
    return raw;
}

bool CryptoUtils::is_hex_digest(const std::string& text) {
    if (text.size() != SHA256_DIGEST_LENGTH * 2) {
        return false;
    }
    for (char c : text) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

Sha256Stream::Sha256Stream() : ctx(EVP_MD_CTX_new()) {
    if (ctx == nullptr || EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        throw std::runtime_error("Failed to initialise SHA-256 context");
    }
}

Sha256Stream::~Sha256Stream() {
    EVP_MD_CTX_free(ctx);
}

void Sha256Stream::update(const uint8_t* data, size_t size) {
    if (finished) {
        throw std::logic_error("Sha256Stream already finished");
    }
    if (EVP_DigestUpdate(ctx, data, size) != 1) {
        throw std::runtime_error("SHA-256 update failed");
    }
}

Digest Sha256Stream::finish() {
    if (finished) {
        throw std::logic_error("Sha256Stream already finished");
    }
    Digest digest;
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx, digest.data(), &length) != 1 || length != digest.size()) {
        throw std::runtime_error("SHA-256 finalisation failed");
    }
    finished = true;
    return digest;
}
