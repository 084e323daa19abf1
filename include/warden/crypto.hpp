#pragma once

#include "types.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace warden::crypto
{

    // Type aliases for clarity
    using Bytes = std::vector<uint8_t>;
    using SHA256Hash = std::array<uint8_t, 32>;
    using HmacTag = std::array<uint8_t, 32>;
    using AESKey = std::array<uint8_t, 32>;
    using AESNonce = std::array<uint8_t, 12>;

    inline constexpr std::size_t kNonceBytes = 12;
    inline constexpr std::size_t kTagBytes = 16;

    /**
     * Zero a string's storage in place, then clear it
     */
    void secure_wipe(std::string &value);

    /**
     * Zero a byte buffer in place, then clear it
     */
    void secure_wipe(Bytes &value);

    /**
     * Owning byte buffer for key material. Storage is zeroed on destruction
     * and before being overwritten.
     */
    class SecretBytes
    {
    public:
        SecretBytes() = default;
        explicit SecretBytes(Bytes bytes);
        explicit SecretBytes(std::string_view text);

        SecretBytes(const SecretBytes &other);
        SecretBytes(SecretBytes &&other) noexcept;
        SecretBytes &operator=(const SecretBytes &other);
        SecretBytes &operator=(SecretBytes &&other) noexcept;
        ~SecretBytes();

        const uint8_t *data() const { return bytes_.data(); }
        std::size_t size() const { return bytes_.size(); }
        bool empty() const { return bytes_.empty(); }

        bool operator==(const SecretBytes &other) const;

    private:
        Bytes bytes_;
    };

    /**
     * HMAC-SHA-256 with a key of any length
     */
    class HmacSha256
    {
    public:
        static HmacTag mac(const SecretBytes &key, std::string_view message);

        /**
         * Constant-time comparison of the expected tag against the supplied one
         */
        static bool verify(const SecretBytes &key, std::string_view message, const HmacTag &tag);
    };

    /**
     * AES-256-GCM encryption/decryption
     * Blob format: [12-byte nonce][ciphertext][16-byte tag]
     */
    class AES256GCM
    {
    public:
        static Result<Bytes> encrypt(
            const AESKey &key,
            const Bytes &plaintext,
            const Bytes &associated_data = {});

        /**
         * Fails on truncation or on any authentication failure; never returns
         * partially decrypted data.
         */
        static Result<Bytes> decrypt(
            const AESKey &key,
            const Bytes &ciphertext_with_nonce,
            const Bytes &associated_data = {});

        static AESKey generate_key();

        /** Hardware AES support is required by libsodium's implementation. */
        static bool is_available();
    };

    /**
     * SHA-256 hashing
     */
    class SHA256
    {
    public:
        static SHA256Hash hash(const Bytes &data);
        static SHA256Hash hash(std::string_view data);
    };

    /**
     * Lowercase hexadecimal encoding
     */
    class Hex
    {
    public:
        static std::string encode(const uint8_t *data, std::size_t size);

        template <std::size_t N>
        static std::string encode(const std::array<uint8_t, N> &data)
        {
            return encode(data.data(), data.size());
        }

        static Result<Bytes> decode(std::string_view hex);
    };

    /**
     * Base64 encoding/decoding (standard alphabet)
     */
    class Base64
    {
    public:
        static std::string encode(const Bytes &data);
        static Result<Bytes> decode(const std::string &encoded);
    };

    /**
     * Cryptographically secure random number generation
     */
    class SecureRandom
    {
    public:
        static Bytes generate_bytes(std::size_t n);
    };

} // namespace warden::crypto
