#include "warden/crypto.hpp"
#include <sodium.h>
#include <cstring>
#include <stdexcept>

namespace warden::crypto
{

    // Initialize libsodium on library load
    static struct SodiumInitializer
    {
        SodiumInitializer()
        {
            if (sodium_init() < 0)
            {
                throw std::runtime_error("Failed to initialize libsodium");
            }
        }
    } sodium_initializer;

    void secure_wipe(std::string &value)
    {
        if (!value.empty())
        {
            sodium_memzero(value.data(), value.size());
        }
        value.clear();
    }

    void secure_wipe(Bytes &value)
    {
        if (!value.empty())
        {
            sodium_memzero(value.data(), value.size());
        }
        value.clear();
    }

    // ============================================================================
    // SecretBytes Implementation
    // ============================================================================

    SecretBytes::SecretBytes(Bytes bytes) : bytes_(std::move(bytes)) {}

    SecretBytes::SecretBytes(std::string_view text) : bytes_(text.begin(), text.end()) {}

    SecretBytes::SecretBytes(const SecretBytes &other) : bytes_(other.bytes_) {}

    SecretBytes::SecretBytes(SecretBytes &&other) noexcept : bytes_(std::move(other.bytes_))
    {
        other.bytes_.clear();
    }

    SecretBytes &SecretBytes::operator=(const SecretBytes &other)
    {
        if (this != &other)
        {
            secure_wipe(bytes_);
            bytes_ = other.bytes_;
        }
        return *this;
    }

    SecretBytes &SecretBytes::operator=(SecretBytes &&other) noexcept
    {
        if (this != &other)
        {
            secure_wipe(bytes_);
            bytes_ = std::move(other.bytes_);
            other.bytes_.clear();
        }
        return *this;
    }

    SecretBytes::~SecretBytes()
    {
        secure_wipe(bytes_);
    }

    bool SecretBytes::operator==(const SecretBytes &other) const
    {
        if (bytes_.size() != other.bytes_.size())
            return false;
        if (bytes_.empty())
            return true;
        return sodium_memcmp(bytes_.data(), other.bytes_.data(), bytes_.size()) == 0;
    }

    // ============================================================================
    // HmacSha256 Implementation
    // ============================================================================

    HmacTag HmacSha256::mac(const SecretBytes &key, std::string_view message)
    {
        HmacTag tag{};
        crypto_auth_hmacsha256_state state;
        crypto_auth_hmacsha256_init(&state, key.data(), key.size());
        crypto_auth_hmacsha256_update(&state,
                                      reinterpret_cast<const uint8_t *>(message.data()),
                                      message.size());
        crypto_auth_hmacsha256_final(&state, tag.data());
        sodium_memzero(&state, sizeof(state));
        return tag;
    }

    bool HmacSha256::verify(const SecretBytes &key, std::string_view message, const HmacTag &tag)
    {
        HmacTag expected = mac(key, message);
        bool ok = sodium_memcmp(expected.data(), tag.data(), tag.size()) == 0;
        sodium_memzero(expected.data(), expected.size());
        return ok;
    }

    // ============================================================================
    // AES256GCM Implementation
    // ============================================================================

    bool AES256GCM::is_available()
    {
        return crypto_aead_aes256gcm_is_available() == 1;
    }

    Result<Bytes> AES256GCM::encrypt(
        const AESKey &key,
        const Bytes &plaintext,
        const Bytes &associated_data)
    {
        if (!is_available())
        {
            return std::unexpected(WardenError::crypto("AES-256-GCM not supported on this CPU"));
        }

        AESNonce nonce;
        randombytes_buf(nonce.data(), nonce.size());

        // Allocate output: nonce + ciphertext + tag
        Bytes output(nonce.size() + plaintext.size() + crypto_aead_aes256gcm_ABYTES);
        std::copy(nonce.begin(), nonce.end(), output.begin());

        unsigned long long ciphertext_len;
        if (crypto_aead_aes256gcm_encrypt(
                output.data() + nonce.size(),
                &ciphertext_len,
                plaintext.data(),
                plaintext.size(),
                associated_data.data(),
                associated_data.size(),
                nullptr, // nsec (not used)
                nonce.data(),
                key.data()) != 0)
        {
            return std::unexpected(WardenError::crypto("AES-256-GCM encryption failed"));
        }

        output.resize(nonce.size() + ciphertext_len);
        return output;
    }

    Result<Bytes> AES256GCM::decrypt(
        const AESKey &key,
        const Bytes &ciphertext_with_nonce,
        const Bytes &associated_data)
    {
        if (!is_available())
        {
            return std::unexpected(WardenError::crypto("AES-256-GCM not supported on this CPU"));
        }
        if (ciphertext_with_nonce.size() < kNonceBytes + crypto_aead_aes256gcm_ABYTES)
        {
            return std::unexpected(WardenError::decryption("Ciphertext too short"));
        }

        AESNonce nonce;
        std::copy(ciphertext_with_nonce.begin(), ciphertext_with_nonce.begin() + kNonceBytes, nonce.begin());

        Bytes plaintext(ciphertext_with_nonce.size() - kNonceBytes - crypto_aead_aes256gcm_ABYTES);
        unsigned long long plaintext_len;

        if (crypto_aead_aes256gcm_decrypt(
                plaintext.data(),
                &plaintext_len,
                nullptr, // nsec (not used)
                ciphertext_with_nonce.data() + kNonceBytes,
                ciphertext_with_nonce.size() - kNonceBytes,
                associated_data.data(),
                associated_data.size(),
                nonce.data(),
                key.data()) != 0)
        {
            secure_wipe(plaintext);
            return std::unexpected(WardenError::decryption("AES-256-GCM authentication failed"));
        }

        plaintext.resize(plaintext_len);
        return plaintext;
    }

    AESKey AES256GCM::generate_key()
    {
        AESKey key;
        crypto_aead_aes256gcm_keygen(key.data());
        return key;
    }

    // ============================================================================
    // SHA256 / Hex Implementation
    // ============================================================================

    SHA256Hash SHA256::hash(const Bytes &data)
    {
        SHA256Hash output;
        crypto_hash_sha256(output.data(), data.data(), data.size());
        return output;
    }

    SHA256Hash SHA256::hash(std::string_view data)
    {
        SHA256Hash output;
        crypto_hash_sha256(output.data(),
                           reinterpret_cast<const uint8_t *>(data.data()),
                           data.size());
        return output;
    }

    std::string Hex::encode(const uint8_t *data, std::size_t size)
    {
        std::string hex(size * 2 + 1, '\0');
        sodium_bin2hex(hex.data(), hex.size(), data, size);
        hex.resize(size * 2);
        return hex;
    }

    Result<Bytes> Hex::decode(std::string_view hex)
    {
        if (hex.size() % 2 != 0)
        {
            return std::unexpected(WardenError::invalid_input("Odd hex length"));
        }

        Bytes out(hex.size() / 2);
        size_t out_len = 0;
        const char *end = nullptr;
        if (sodium_hex2bin(out.data(), out.size(), hex.data(), hex.size(),
                           nullptr, &out_len, &end) != 0 ||
            end != hex.data() + hex.size())
        {
            return std::unexpected(WardenError::invalid_input("Invalid hex character"));
        }
        out.resize(out_len);
        return out;
    }

    // ============================================================================
    // Base64 Implementation
    // ============================================================================

    std::string Base64::encode(const Bytes &data)
    {
        size_t b64_len = sodium_base64_encoded_len(data.size(), sodium_base64_VARIANT_ORIGINAL);
        std::string encoded(b64_len, '\0');

        sodium_bin2base64(
            encoded.data(),
            b64_len,
            data.data(),
            data.size(),
            sodium_base64_VARIANT_ORIGINAL);

        // Remove null terminator
        encoded.resize(std::strlen(encoded.c_str()));
        return encoded;
    }

    Result<Bytes> Base64::decode(const std::string &encoded)
    {
        Bytes decoded(encoded.size()); // Worst case size
        size_t decoded_len;

        if (sodium_base642bin(
                decoded.data(),
                decoded.size(),
                encoded.c_str(),
                encoded.size(),
                nullptr, // ignore characters
                &decoded_len,
                nullptr, // end pointer
                sodium_base64_VARIANT_ORIGINAL) != 0)
        {
            return std::unexpected(WardenError::invalid_input("Invalid base64 encoding"));
        }

        decoded.resize(decoded_len);
        return decoded;
    }

    Bytes SecureRandom::generate_bytes(std::size_t n)
    {
        Bytes buffer(n);
        randombytes_buf(buffer.data(), n);
        return buffer;
    }

} // namespace warden::crypto
