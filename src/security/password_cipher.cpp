#include "security/password_cipher.hpp"
#include "core/base64.hpp"
#include "core/utils.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <format>
#include <stdexcept>
#include <vector>

namespace sqlorm {

namespace {

// AES-256-GCM constants
constexpr int kIvLen = 12;
constexpr int kTagLen = 16;
constexpr int kKeyLen = 32;

} // anonymous namespace

std::string PasswordCipher::derive_key(std::string_view username, std::string_view database) {
    const std::string material = std::format("{}@{}", username, database);
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(material.data(), material.size(), digest, &digest_len,
                   EVP_sha256(), nullptr) != 1 || digest_len != kKeyLen) {
        throw std::runtime_error("SHA-256 key derivation failed");
    }
    return std::string(reinterpret_cast<const char*>(digest), digest_len);
}

std::string PasswordCipher::encrypt_password(const PoolEntryConfig& config) {
    const std::string key = derive_key(config.username, config.database);
    const std::string& plaintext = config.password;

    uint8_t iv[kIvLen];
    if (RAND_bytes(iv, kIvLen) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }

    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
        throw std::runtime_error("EVP_CIPHER_CTX_new failed");
    }

    std::vector<uint8_t> ciphertext(plaintext.size() + EVP_MAX_BLOCK_LENGTH);
    uint8_t tag[kTagLen];
    int len = 0;
    int ciphertext_len = 0;

    const bool ok =
        EVP_EncryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1
        && EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, kIvLen, nullptr) == 1
        && EVP_EncryptInit_ex(ctx, nullptr, nullptr,
               reinterpret_cast<const uint8_t*>(key.data()), iv) == 1
        && EVP_EncryptUpdate(ctx, ciphertext.data(), &len,
               reinterpret_cast<const uint8_t*>(plaintext.data()),
               static_cast<int>(plaintext.size())) == 1
        && (ciphertext_len = len, true)
        && EVP_EncryptFinal_ex(ctx, ciphertext.data() + len, &len) == 1
        && (ciphertext_len += len, true)
        && EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_GET_TAG, kTagLen, tag) == 1;
    EVP_CIPHER_CTX_free(ctx);

    if (!ok) {
        throw std::runtime_error("AES-256-GCM encryption failed");
    }

    // Pack: iv + ciphertext + tag
    std::vector<uint8_t> packed;
    packed.reserve(kIvLen + ciphertext_len + kTagLen);
    packed.insert(packed.end(), iv, iv + kIvLen);
    packed.insert(packed.end(), ciphertext.begin(), ciphertext.begin() + ciphertext_len);
    packed.insert(packed.end(), tag, tag + kTagLen);

    return base64::encode_no_pad(packed.data(), packed.size());
}

std::optional<std::string> PasswordCipher::decrypt_password(const PoolEntryConfig& config) {
    const auto packed = base64::decode(config.password);
    if (!packed || packed->size() < static_cast<size_t>(kIvLen + kTagLen)) {
        return std::nullopt;
    }

    const std::string key = derive_key(config.username, config.database);

    const uint8_t* iv = packed->data();
    const size_t ct_len = packed->size() - kIvLen - kTagLen;
    const uint8_t* ct = packed->data() + kIvLen;
    const uint8_t* tag = packed->data() + kIvLen + ct_len;

    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) return std::nullopt;

    std::vector<uint8_t> plaintext(ct_len + EVP_MAX_BLOCK_LENGTH);
    int len = 0;
    int plaintext_len = 0;

    const bool ok =
        EVP_DecryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1
        && EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, kIvLen, nullptr) == 1
        && EVP_DecryptInit_ex(ctx, nullptr, nullptr,
               reinterpret_cast<const uint8_t*>(key.data()), iv) == 1
        && EVP_DecryptUpdate(ctx, plaintext.data(), &len, ct, static_cast<int>(ct_len)) == 1
        && (plaintext_len = len, true)
        // Set expected tag
        && EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_TAG, kTagLen,
               const_cast<uint8_t*>(tag)) == 1
        && EVP_DecryptFinal_ex(ctx, plaintext.data() + len, &len) > 0;
    EVP_CIPHER_CTX_free(ctx);

    if (!ok) {
        return std::nullopt;
    }
    plaintext_len += len;
    return std::string(reinterpret_cast<const char*>(plaintext.data()),
                       static_cast<size_t>(plaintext_len));
}

std::string PasswordCipher::unwrap_password(const PoolEntryConfig& config) {
    if (auto plaintext = decrypt_password(config)) {
        return std::move(*plaintext);
    }

    // Long enough to carry iv and tag but does not authenticate
    const auto packed = base64::decode(config.password);
    if (packed && packed->size() >= static_cast<size_t>(kIvLen + kTagLen)) {
        utils::log::warn(std::format(
            "Password for {}@{} looks encrypted but does not decrypt; using it verbatim",
            config.username, config.database));
    }
    return config.password;
}

} // namespace sqlorm
