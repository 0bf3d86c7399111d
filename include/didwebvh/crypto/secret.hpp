#pragma once

#include <datapod/datapod.hpp>
#include <didwebvh/crypto/key.hpp>
#include <string>

namespace didwebvh {

    /// Signing material handed to the log writer
    /// The id is the verification method that ends up in the proof
    class Secret {
      public:
        inline Secret(std::string id, Key key) : id_(std::move(id)), key_(std::move(key)) {}

        /// Generate a fresh Ed25519 secret identified by its did:key verification method
        inline static dp::Result<Secret, dp::Error> generate() {
            auto key = Key::generate();
            if (key.is_err()) {
                return dp::Result<Secret, dp::Error>::err(key.error());
            }
            return dp::Result<Secret, dp::Error>::ok(fromKey(key.value()));
        }

        /// Wrap a key as a did:key secret
        inline static Secret fromKey(const Key &key) { return Secret(key.getVerificationMethodId(), key); }

        inline const std::string &getId() const { return id_; }

        inline const Key &getKey() const { return key_; }

        /// Public key multikey, the value listed in updateKeys
        inline std::string getPublicKeyMultibase() const { return key_.getMultikey(); }

        inline dp::Result<std::vector<uint8_t>, dp::Error> sign(const std::vector<uint8_t> &data) const {
            return key_.sign(data);
        }

      private:
        std::string id_;
        Key key_;
    };

} // namespace didwebvh
