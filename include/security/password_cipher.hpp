#pragma once

#include "config/config_types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace sqlorm {

/**
 * @brief Encrypts pool passwords at rest and unwraps them at pool construction
 *
 * AES-256-GCM with key = SHA-256("{username}@{database}"). The text form is
 * unpadded base64 of iv(12) || ciphertext || tag(16).
 */
class PasswordCipher {
public:
    /**
     * @brief Text form of the config's (plaintext) password
     * @throws std::runtime_error when OpenSSL fails
     */
    [[nodiscard]] static std::string encrypt_password(const PoolEntryConfig& config);

    /**
     * @brief Plaintext when the password is a text form that authenticates
     *        under this pool's key, nullopt otherwise
     */
    [[nodiscard]] static std::optional<std::string> decrypt_password(const PoolEntryConfig& config);

    /**
     * @brief Decrypted password, or the configured value verbatim
     */
    [[nodiscard]] static std::string unwrap_password(const PoolEntryConfig& config);

private:
    [[nodiscard]] static std::string derive_key(std::string_view username, std::string_view database);
};

} // namespace sqlorm
