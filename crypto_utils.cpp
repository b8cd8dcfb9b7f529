#include "crypto_utils.hpp"
#include <memory>
#include <stdexcept>
#include <vector>
#include <openssl/core_names.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/params.h>
#include <openssl/rand.h>

namespace {

struct MacDeleter {
    void operator()(EVP_MAC* mac) const { EVP_MAC_free(mac); }
};
struct MacCtxDeleter {
    void operator()(EVP_MAC_CTX* ctx) const { EVP_MAC_CTX_free(ctx); }
};
struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};

const char kB64Url[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

int b64UrlValue(unsigned char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '-') return 62;
    if (c == '_') return 63;
    return -1;
}

const unsigned char* bytesOf(const std::string& s) {
    return reinterpret_cast<const unsigned char*>(s.data());
}

} // namespace

std::string hmacSha256(const std::string& key, const std::string& data) {
    std::unique_ptr<EVP_MAC, MacDeleter> mac(EVP_MAC_fetch(nullptr, "HMAC", nullptr));
    if (!mac) throw std::runtime_error("EVP_MAC_fetch(HMAC) failed");
    std::unique_ptr<EVP_MAC_CTX, MacCtxDeleter> ctx(EVP_MAC_CTX_new(mac.get()));
    if (!ctx) throw std::runtime_error("EVP_MAC_CTX_new failed");

    OSSL_PARAM params[2] = {
        OSSL_PARAM_construct_utf8_string(OSSL_MAC_PARAM_DIGEST, const_cast<char*>("SHA256"), 0),
        OSSL_PARAM_construct_end()
    };
    if (EVP_MAC_init(ctx.get(), bytesOf(key), key.size(), params) != 1)
        throw std::runtime_error("EVP_MAC_init failed");
    if (EVP_MAC_update(ctx.get(), bytesOf(data), data.size()) != 1)
        throw std::runtime_error("EVP_MAC_update failed");

    unsigned char out[EVP_MAX_MD_SIZE];
    size_t len = 0;
    if (EVP_MAC_final(ctx.get(), out, &len, sizeof(out)) != 1)
        throw std::runtime_error("EVP_MAC_final failed");
    return std::string(reinterpret_cast<const char*>(out), len);
}

std::string base64UrlEncode(const std::string& bytes) {
    std::string out;
    out.reserve((bytes.size() + 2) / 3 * 4);
    size_t i = 0;
    for (; i + 2 < bytes.size(); i += 3) {
        uint32_t n = (uint32_t(uint8_t(bytes[i])) << 16) | (uint32_t(uint8_t(bytes[i + 1])) << 8)
                   | uint32_t(uint8_t(bytes[i + 2]));
        out.push_back(kB64Url[(n >> 18) & 63]);
        out.push_back(kB64Url[(n >> 12) & 63]);
        out.push_back(kB64Url[(n >> 6) & 63]);
        out.push_back(kB64Url[n & 63]);
    }
    size_t rest = bytes.size() - i;
    if (rest == 1) {
        uint32_t n = uint32_t(uint8_t(bytes[i])) << 16;
        out.push_back(kB64Url[(n >> 18) & 63]);
        out.push_back(kB64Url[(n >> 12) & 63]);
    } else if (rest == 2) {
        uint32_t n = (uint32_t(uint8_t(bytes[i])) << 16) | (uint32_t(uint8_t(bytes[i + 1])) << 8);
        out.push_back(kB64Url[(n >> 18) & 63]);
        out.push_back(kB64Url[(n >> 12) & 63]);
        out.push_back(kB64Url[(n >> 6) & 63]);
    }
    return out;
}

std::optional<std::string> base64UrlDecode(const std::string& text) {
    if (text.size() % 4 == 1) return std::nullopt;

    std::string out;
    out.reserve(text.size() / 4 * 3 + 2);
    uint32_t acc = 0;
    int bits = 0;
    for (unsigned char c : text) {
        int v = b64UrlValue(c);
        if (v < 0) return std::nullopt;
        acc = (acc << 6) | uint32_t(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<char>((acc >> bits) & 0xFF));
        }
    }
    return out;
}

std::string randomBytes(size_t n) {
    std::vector<unsigned char> buf(n);
    if (n > 0 && RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1)
        throw std::runtime_error("RAND_bytes failed");
    return std::string(buf.begin(), buf.end());
}

std::string aes256CbcEncrypt(const std::string& key, const std::string& iv, const std::string& plain) {
    if (key.size() != 32 || iv.size() != 16) throw std::invalid_argument("AES-256-CBC: bad key or iv size");

    std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter> ctx(EVP_CIPHER_CTX_new());
    if (!ctx) throw std::runtime_error("EVP_CIPHER_CTX_new failed");
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, bytesOf(key), bytesOf(iv)) != 1)
        throw std::runtime_error("EVP_EncryptInit_ex failed");

    std::vector<unsigned char> out(plain.size() + 16);
    int len = 0;
    int total = 0;
    if (EVP_EncryptUpdate(ctx.get(), out.data(), &len, bytesOf(plain), static_cast<int>(plain.size())) != 1)
        throw std::runtime_error("EVP_EncryptUpdate failed");
    total = len;
    if (EVP_EncryptFinal_ex(ctx.get(), out.data() + total, &len) != 1)
        throw std::runtime_error("EVP_EncryptFinal_ex failed");
    total += len;
    return std::string(reinterpret_cast<const char*>(out.data()), total);
}

std::optional<std::string> aes256CbcDecrypt(const std::string& key, const std::string& iv,
                                            const std::string& cipher) {
    if (key.size() != 32 || iv.size() != 16) throw std::invalid_argument("AES-256-CBC: bad key or iv size");
    if (cipher.empty() || cipher.size() % 16 != 0) return std::nullopt;

    std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter> ctx(EVP_CIPHER_CTX_new());
    if (!ctx) throw std::runtime_error("EVP_CIPHER_CTX_new failed");
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, bytesOf(key), bytesOf(iv)) != 1)
        throw std::runtime_error("EVP_DecryptInit_ex failed");

    std::vector<unsigned char> out(cipher.size() + 16);
    int len = 0;
    int total = 0;
    if (EVP_DecryptUpdate(ctx.get(), out.data(), &len, bytesOf(cipher), static_cast<int>(cipher.size())) != 1)
        return std::nullopt;
    total = len;
    // Неверное дополнение PKCS#7
    if (EVP_DecryptFinal_ex(ctx.get(), out.data() + total, &len) != 1) return std::nullopt;
    total += len;
    return std::string(reinterpret_cast<const char*>(out.data()), total);
}

bool constantTimeEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}
