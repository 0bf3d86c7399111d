#pragma once

#include <datapod/datapod.hpp>
#include <didwebvh/crypto/key.hpp>
#include <string>
#include <vector>

namespace didwebvh {

    /// did:key identifier carrying an Ed25519 multikey
    /// Format: did:key:<multikey>[#<multikey>]
    class DIDKey {
      public:
        static constexpr const char *METHOD = "key";
        static constexpr const char *PREFIX = "did:key:";

        DIDKey() = default;

        /// Parse a did:key DID or verification method id
        inline static dp::Result<DIDKey, dp::Error> parse(const std::string &did_string) {
            const std::string prefix(PREFIX);
            if (did_string.size() <= prefix.size() || did_string.compare(0, prefix.size(), prefix) != 0) {
                return dp::Result<DIDKey, dp::Error>::err(dp::Error::invalid_argument(
                    dp::String(("Invalid did:key: '" + did_string + "'").c_str())));
            }

            std::string multikey = did_string.substr(prefix.size());
            std::string fragment;
            size_t fragment_pos = multikey.find('#');
            if (fragment_pos != std::string::npos) {
                fragment = multikey.substr(fragment_pos + 1);
                multikey = multikey.substr(0, fragment_pos);
                if (fragment != multikey) {
                    return dp::Result<DIDKey, dp::Error>::err(dp::Error::invalid_argument(
                        dp::String(("did:key fragment does not match key: '" + did_string + "'").c_str())));
                }
            }

            auto public_key = Key::decodeMultikey(multikey);
            if (public_key.is_err()) {
                return dp::Result<DIDKey, dp::Error>::err(public_key.error());
            }

            DIDKey did;
            did.multikey_ = multikey;
            did.public_key_ = public_key.value();
            return dp::Result<DIDKey, dp::Error>::ok(did);
        }

        inline static DIDKey fromKey(const Key &key) {
            DIDKey did;
            did.multikey_ = key.getMultikey();
            did.public_key_ = key.getPublicKey();
            return did;
        }

        /// Full DID (did:key:<mk>)
        inline std::string toString() const { return std::string(PREFIX) + multikey_; }

        /// Verification method id (did:key:<mk>#<mk>)
        inline std::string getVerificationMethodId() const { return toString() + "#" + multikey_; }

        inline const std::string &getMultikey() const { return multikey_; }

        inline const std::vector<uint8_t> &getPublicKey() const { return public_key_; }

        inline bool isEmpty() const { return multikey_.empty(); }

        inline bool operator==(const DIDKey &other) const { return multikey_ == other.multikey_; }

        inline bool operator!=(const DIDKey &other) const { return !(*this == other); }

      private:
        std::string multikey_;
        std::vector<uint8_t> public_key_;
    };

    /// Resolves a verification method to its raw public key
    class DIDResolver {
      public:
        virtual ~DIDResolver() = default;

        virtual dp::Result<std::vector<uint8_t>, dp::Error>
        resolvePublicKey(const std::string &verification_method) const = 0;
    };

    /// did:key resolution is a pure decode of the identifier
    class DIDKeyResolver : public DIDResolver {
      public:
        inline dp::Result<std::vector<uint8_t>, dp::Error>
        resolvePublicKey(const std::string &verification_method) const override {
            auto did = DIDKey::parse(verification_method);
            if (did.is_err()) {
                return dp::Result<std::vector<uint8_t>, dp::Error>::err(did.error());
            }
            return dp::Result<std::vector<uint8_t>, dp::Error>::ok(did.value().getPublicKey());
        }
    };

} // namespace didwebvh
