#pragma once

#include <cstdint>
#include <datapod/datapod.hpp>
#include <didwebvh/crypto/multibase.hpp>
#include <keylock/keylock.hpp>
#include <string>
#include <vector>

namespace didwebvh {

    /// multicodec prefix for an Ed25519 public key (0xed varint)
    constexpr uint8_t MULTICODEC_ED25519_PUB[2] = {0xed, 0x01};

    /// Ed25519 keypair used for update keys, witnesses and signing secrets
    /// Header-only, crypto operations go through keylock
    class Key {
      public:
        /// Generate new Ed25519 keypair
        inline static dp::Result<Key, dp::Error> generate() {
            keylock::keylock crypto(keylock::Algorithm::Ed25519);
            auto keypair = crypto.generate_keypair();

            if (keypair.private_key.empty()) {
                return dp::Result<Key, dp::Error>::err(dp::Error::io_error("Failed to generate keypair"));
            }

            return dp::Result<Key, dp::Error>::ok(Key(keypair));
        }

        inline explicit Key(const keylock::KeyPair &keypair) : keypair_(keypair) {}

        /// Load from keypair bytes (private key can be 32 or 64 bytes for Ed25519)
        inline static dp::Result<Key, dp::Error> fromKeypair(const std::vector<uint8_t> &public_key,
                                                             const std::vector<uint8_t> &private_key) {
            if (public_key.size() != 32) {
                return dp::Result<Key, dp::Error>::err(
                    dp::Error::invalid_argument("Ed25519 public key must be 32 bytes"));
            }
            if (private_key.size() != 32 && private_key.size() != 64) {
                return dp::Result<Key, dp::Error>::err(
                    dp::Error::invalid_argument("Ed25519 private key must be 32 or 64 bytes"));
            }

            keylock::KeyPair keypair;
            keypair.public_key = public_key;
            keypair.private_key = private_key;
            return dp::Result<Key, dp::Error>::ok(Key(keypair));
        }

        /// Load from public key only (for verification)
        inline static dp::Result<Key, dp::Error> fromPublicKey(const std::vector<uint8_t> &public_key) {
            if (public_key.size() != 32) {
                return dp::Result<Key, dp::Error>::err(
                    dp::Error::invalid_argument("Ed25519 public key must be 32 bytes"));
            }

            keylock::KeyPair keypair;
            keypair.public_key = public_key;
            return dp::Result<Key, dp::Error>::ok(Key(keypair));
        }

        /// Load a verification-only key from an Ed25519 multikey ("z6Mk...")
        inline static dp::Result<Key, dp::Error> fromMultikey(const std::string &multikey) {
            auto public_key = decodeMultikey(multikey);
            if (public_key.is_err()) {
                return dp::Result<Key, dp::Error>::err(public_key.error());
            }
            return fromPublicKey(public_key.value());
        }

        /// Encode an Ed25519 public key as multikey: "z" + base58btc(0xed 0x01 || key)
        inline static std::string encodeMultikey(const std::vector<uint8_t> &public_key) {
            std::vector<uint8_t> prefixed{MULTICODEC_ED25519_PUB[0], MULTICODEC_ED25519_PUB[1]};
            prefixed.insert(prefixed.end(), public_key.begin(), public_key.end());
            return multibaseEncode(prefixed);
        }

        /// Decode an Ed25519 multikey to the raw 32 byte public key
        inline static dp::Result<std::vector<uint8_t>, dp::Error> decodeMultikey(const std::string &multikey) {
            auto decoded = multibaseDecode(multikey);
            if (decoded.is_err()) {
                return decoded;
            }
            const auto &bytes = decoded.value();
            if (bytes.size() != 34 || bytes[0] != MULTICODEC_ED25519_PUB[0] || bytes[1] != MULTICODEC_ED25519_PUB[1]) {
                return dp::Result<std::vector<uint8_t>, dp::Error>::err(dp::Error::invalid_argument(
                    dp::String(("Not an Ed25519 multikey: '" + multikey + "'").c_str())));
            }
            return dp::Result<std::vector<uint8_t>, dp::Error>::ok(std::vector<uint8_t>(bytes.begin() + 2, bytes.end()));
        }

        /// Sign data
        inline dp::Result<std::vector<uint8_t>, dp::Error> sign(const std::vector<uint8_t> &data) const {
            if (keypair_.private_key.empty()) {
                return dp::Result<std::vector<uint8_t>, dp::Error>::err(
                    dp::Error::io_error("No private key available"));
            }

            keylock::keylock crypto(keylock::Algorithm::Ed25519);
            auto result = crypto.sign(data, keypair_.private_key);

            if (!result.success) {
                return dp::Result<std::vector<uint8_t>, dp::Error>::err(
                    dp::Error::io_error(dp::String(result.error_message.c_str())));
            }

            return dp::Result<std::vector<uint8_t>, dp::Error>::ok(result.data);
        }

        /// Verify signature; a mismatching signature yields ok(false)
        inline dp::Result<bool, dp::Error> verify(const std::vector<uint8_t> &data,
                                                  const std::vector<uint8_t> &signature) const {
            if (keypair_.public_key.empty()) {
                return dp::Result<bool, dp::Error>::err(dp::Error::invalid_argument("No public key available"));
            }

            keylock::keylock crypto(keylock::Algorithm::Ed25519);
            auto result = crypto.verify(data, signature, keypair_.public_key);
            return dp::Result<bool, dp::Error>::ok(result.success);
        }

        inline const std::vector<uint8_t> &getPublicKey() const { return keypair_.public_key; }

        inline const std::vector<uint8_t> &getPrivateKey() const { return keypair_.private_key; }

        inline bool hasPrivateKey() const { return !keypair_.private_key.empty(); }

        /// Public key as multikey, the form used in updateKeys
        inline std::string getMultikey() const { return encodeMultikey(keypair_.public_key); }

        /// did:key identifier for this key
        inline std::string getDidKey() const { return "did:key:" + getMultikey(); }

        /// did:key verification method id ("did:key:<mk>#<mk>")
        inline std::string getVerificationMethodId() const { return getDidKey() + "#" + getMultikey(); }

        inline bool operator==(const Key &other) const { return keypair_.public_key == other.keypair_.public_key; }

        inline bool operator!=(const Key &other) const { return !(*this == other); }

      private:
        keylock::KeyPair keypair_;
    };

} // namespace didwebvh
