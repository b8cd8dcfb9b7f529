#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

// Обёртки над OpenSSL. Все строки здесь - сырые байты.

// HMAC-SHA256, 32 байта
std::string hmacSha256(const std::string& key, const std::string& data);

// base64url без '=' в конце
std::string base64UrlEncode(const std::string& bytes);

// nullopt, если встретился символ вне алфавита base64url или длина невозможна
std::optional<std::string> base64UrlDecode(const std::string& text);

// Криптографически стойкие случайные байты (RAND_bytes)
std::string randomBytes(size_t n);

// AES-256-CBC с PKCS#7; key - 32 байта, iv - 16 байт
std::string aes256CbcEncrypt(const std::string& key, const std::string& iv, const std::string& plain);
std::optional<std::string> aes256CbcDecrypt(const std::string& key, const std::string& iv,
                                            const std::string& cipher);

// Сравнение за время, не зависящее от содержимого (CRYPTO_memcmp)
bool constantTimeEquals(const std::string& a, const std::string& b);
