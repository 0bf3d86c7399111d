#pragma once

#include <datapod/datapod.hpp>
#include <didwebvh/common/error.hpp>
#include <didwebvh/common/time.hpp>
#include <didwebvh/crypto/key.hpp>
#include <didwebvh/crypto/secret.hpp>
#include <didwebvh/integrity/jcs.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace didwebvh {

    /// W3C Data Integrity proof
    struct DataIntegrityProof {
        static constexpr const char *TYPE = "DataIntegrityProof";
        static constexpr const char *PURPOSE_ASSERTION = "assertionMethod";

        std::string type = TYPE;
        std::string cryptosuite;
        std::string created;
        std::string verification_method;
        std::string proof_purpose = PURPOSE_ASSERTION;
        std::string proof_value;
        std::optional<nlohmann::json> context;

        /// Proof options, i.e. everything but proofValue
        inline nlohmann::json toConfigJson() const {
            nlohmann::json j;
            j["type"] = type;
            j["cryptosuite"] = cryptosuite;
            if (!created.empty()) {
                j["created"] = created;
            }
            j["verificationMethod"] = verification_method;
            j["proofPurpose"] = proof_purpose;
            if (context) {
                j["@context"] = *context;
            }
            return j;
        }

        inline nlohmann::json toJson() const {
            auto j = toConfigJson();
            j["proofValue"] = proof_value;
            return j;
        }

        inline static dp::Result<DataIntegrityProof, dp::Error> fromJson(const nlohmann::json &j) {
            if (!j.is_object()) {
                return dp::Result<DataIntegrityProof, dp::Error>::err(
                    deserialization_failed("DataIntegrityProof must be a JSON object"));
            }

            auto required = [&j](const char *name, std::string &out) {
                auto it = j.find(name);
                if (it == j.end() || !it->is_string()) {
                    return false;
                }
                out = it->get<std::string>();
                return true;
            };

            DataIntegrityProof proof;
            if (!required("type", proof.type) || !required("cryptosuite", proof.cryptosuite) ||
                !required("verificationMethod", proof.verification_method) ||
                !required("proofPurpose", proof.proof_purpose) || !required("proofValue", proof.proof_value)) {
                return dp::Result<DataIntegrityProof, dp::Error>::err(deserialization_failed(
                    "DataIntegrityProof is missing one of type, cryptosuite, verificationMethod, proofPurpose, "
                    "proofValue"));
            }

            auto created = j.find("created");
            if (created != j.end()) {
                if (!created->is_string()) {
                    return dp::Result<DataIntegrityProof, dp::Error>::err(
                        deserialization_failed("DataIntegrityProof created must be a string"));
                }
                proof.created = created->get<std::string>();
            }

            auto context = j.find("@context");
            if (context != j.end()) {
                proof.context = *context;
            }

            return dp::Result<DataIntegrityProof, dp::Error>::ok(proof);
        }

        inline bool operator==(const DataIntegrityProof &other) const { return toJson() == other.toJson(); }

        inline bool operator!=(const DataIntegrityProof &other) const { return !(*this == other); }
    };

    /// Data Integrity signing/verification capability
    class DataIntegrity {
      public:
        virtual ~DataIntegrity() = default;

        /// Sign a JSON document, the document must not carry a proof
        virtual dp::Result<DataIntegrityProof, dp::Error> sign(const nlohmann::json &document, const Secret &secret,
                                                               Timestamp created) const = 0;

        /// Verify a proof over a JSON document (proof excluded from the document)
        /// ok(false) means the signature did not match
        virtual dp::Result<bool, dp::Error> verify(const nlohmann::json &document, const DataIntegrityProof &proof,
                                                   const std::vector<uint8_t> &public_key) const = 0;
    };

    /// eddsa-jcs-2022 cryptosuite: Ed25519 over sha256(JCS(proof options)) || sha256(JCS(document))
    class EddsaJcs2022 : public DataIntegrity {
      public:
        static constexpr const char *CRYPTOSUITE = "eddsa-jcs-2022";

        inline dp::Result<DataIntegrityProof, dp::Error> sign(const nlohmann::json &document, const Secret &secret,
                                                              Timestamp created) const override {
            DataIntegrityProof proof;
            proof.cryptosuite = CRYPTOSUITE;
            proof.created = formatTimestamp(created);
            proof.verification_method = secret.getId();
            if (document.is_object() && document.contains("@context")) {
                proof.context = document["@context"];
            }

            auto hash_data = hashData(document, proof);
            if (hash_data.is_err()) {
                return dp::Result<DataIntegrityProof, dp::Error>::err(hash_data.error());
            }

            auto signature = secret.sign(hash_data.value());
            if (signature.is_err()) {
                return dp::Result<DataIntegrityProof, dp::Error>::err(
                    signature_error("Signing failed: " + errorMessage(signature.error())));
            }

            proof.proof_value = multibaseEncode(signature.value());
            return dp::Result<DataIntegrityProof, dp::Error>::ok(proof);
        }

        inline dp::Result<bool, dp::Error> verify(const nlohmann::json &document, const DataIntegrityProof &proof,
                                                  const std::vector<uint8_t> &public_key) const override {
            if (proof.type != DataIntegrityProof::TYPE) {
                return dp::Result<bool, dp::Error>::err(signature_error("Unsupported proof type: " + proof.type));
            }
            if (proof.cryptosuite != CRYPTOSUITE) {
                return dp::Result<bool, dp::Error>::err(
                    signature_error("Unsupported cryptosuite: " + proof.cryptosuite));
            }
            if (proof.proof_purpose != DataIntegrityProof::PURPOSE_ASSERTION) {
                return dp::Result<bool, dp::Error>::err(
                    signature_error("Unsupported proofPurpose: " + proof.proof_purpose));
            }

            if (!proof.created.empty()) {
                auto created = parseTimestamp(proof.created);
                if (created.is_err()) {
                    return dp::Result<bool, dp::Error>::err(signature_error("Invalid proof created timestamp"));
                }
                if (created.value() > std::chrono::system_clock::now()) {
                    return dp::Result<bool, dp::Error>::err(
                        signature_error("Proof created timestamp is in the future: " + proof.created));
                }
            }

            if (proof.context) {
                if (!document.is_object() || !document.contains("@context") ||
                    document["@context"] != *proof.context) {
                    return dp::Result<bool, dp::Error>::err(
                        signature_error("Proof @context does not match the document @context"));
                }
            }

            auto signature = multibaseDecode(proof.proof_value);
            if (signature.is_err()) {
                return dp::Result<bool, dp::Error>::err(signature_error("proofValue is not base58btc multibase"));
            }

            auto key = Key::fromPublicKey(public_key);
            if (key.is_err()) {
                return dp::Result<bool, dp::Error>::err(key.error());
            }

            auto hash_data = hashData(document, proof);
            if (hash_data.is_err()) {
                return dp::Result<bool, dp::Error>::err(hash_data.error());
            }

            return key.value().verify(hash_data.value(), signature.value());
        }

      private:
        inline static dp::Result<std::vector<uint8_t>, dp::Error> hashData(const nlohmann::json &document,
                                                                           const DataIntegrityProof &proof) {
            nlohmann::json unsecured = document;
            if (unsecured.is_object()) {
                unsecured.erase("proof");
            }

            auto canonical_config = jcs::canonicalize(proof.toConfigJson());
            if (canonical_config.is_err()) {
                return dp::Result<std::vector<uint8_t>, dp::Error>::err(canonical_config.error());
            }
            auto canonical_document = jcs::canonicalize(unsecured);
            if (canonical_document.is_err()) {
                return dp::Result<std::vector<uint8_t>, dp::Error>::err(canonical_document.error());
            }

            auto config_hash = sha256(canonical_config.value());
            if (config_hash.is_err()) {
                return config_hash;
            }
            auto document_hash = sha256(canonical_document.value());
            if (document_hash.is_err()) {
                return document_hash;
            }

            std::vector<uint8_t> out = config_hash.value();
            const auto &document_bytes = document_hash.value();
            out.insert(out.end(), document_bytes.begin(), document_bytes.end());
            return dp::Result<std::vector<uint8_t>, dp::Error>::ok(out);
        }
    };

} // namespace didwebvh
