#pragma once
#include <array>
#include <cstdint>
#include <string>
#include <vector>

using Digest = std::array<uint8_t, 32>;

struct evp_md_ctx_st;

class CryptoUtils {
public:
    static Digest sha256(const uint8_t* data, size_t size);
    static Digest sha256(const std::vector<uint8_t>& data);

    static std::string to_hex(const Digest& digest);
    static Digest digest_from_hex(const std::string& hex_string);
    static std::string hex_to_raw(const std::string& hex_string);
    static bool is_hex_digest(const std::string& text);
};

// Incremental SHA-256 for data that does not fit in one buffer.
class Sha256Stream {
public:
    Sha256Stream();
    ~Sha256Stream();
    Sha256Stream(const Sha256Stream&) = delete;
    Sha256Stream& operator=(const Sha256Stream&) = delete;

    void update(const uint8_t* data, size_t size);
    Digest finish();

private:
    evp_md_ctx_st* ctx;
    bool finished = false;
};
