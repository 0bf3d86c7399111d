#pragma once

#include <datapod/datapod.hpp>
#include <didwebvh/common/error.hpp>
#include <didwebvh/common/time.hpp>
#include <didwebvh/crypto/secret.hpp>
#include <didwebvh/identity/did_key.hpp>
#include <didwebvh/integrity/data_integrity.hpp>
#include <didwebvh/webvh/parameters.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace didwebvh {

    /// DID resolution metadata for one version of the log
    struct MetaData {
        std::string version_id;
        std::string version_time;
        std::string created;
        std::string updated;
        std::string scid;
        bool portable = false;
        bool deactivated = false;
        std::optional<Witnesses> witness;
        std::vector<std::string> watchers;
        std::optional<dp::u32> ttl;

        nlohmann::json toJson() const;
    };

    /// One version of a did:webvh DID: the DID Document, the parameter diff and the
    /// controller's proof, chained to the previous version through versionId
    class LogEntry {
      public:
        static constexpr const char *SCID_PLACEHOLDER = "{SCID}";

        std::string version_id;
        std::string version_time;
        Parameters parameters;
        nlohmann::json state;
        std::optional<DataIntegrityProof> proof;

        /// Create and sign the first LogEntry
        ///
        /// The document and parameters use "{SCID}" wherever the SCID belongs.
        /// The secret must be the did:key verification method of the first update key.
        static dp::Result<LogEntry, dp::Error> createFirstEntry(Timestamp version_time, const nlohmann::json &document,
                                                                const Parameters &parameters, const Secret &secret,
                                                                const DataIntegrity &integrity);

        /// Create and sign the LogEntry that follows previous
        /// parameters_diff holds only the changes against the previous version
        static dp::Result<LogEntry, dp::Error> createNewLogEntry(const LogEntry &previous, Timestamp version_time,
                                                                 const nlohmann::json &document,
                                                                 const Parameters &parameters_diff,
                                                                 const Secret &secret,
                                                                 const DataIntegrity &integrity);

        /// SCID of a preliminary first entry (placeholders in place of the SCID)
        dp::Result<std::string, dp::Error> generateScid() const;

        /// entryHash: base58btc multibase of the sha2-256 multihash of JCS(entry without proof)
        dp::Result<std::string, dp::Error> generateLogEntryHash() const;

        /// Verify this entry against its predecessor
        ///
        /// previous, previous_parameters and previous_metadata are all nullptr for the
        /// first entry. Returns the effective parameters and metadata of this version.
        dp::Result<std::pair<Parameters, MetaData>, dp::Error>
        verifyLogEntry(const LogEntry *previous, const Parameters *previous_parameters,
                       const MetaData *previous_metadata, const DataIntegrity &integrity,
                       const DIDResolver &resolver) const;

        /// Split "N-hash" into its number and hash
        static dp::Result<std::pair<dp::u32, std::string>, dp::Error> parseVersionId(const std::string &version_id);

        dp::Result<dp::u32, dp::Error> getVersionNumber() const;

        /// DID of the document (state.id), empty when missing
        std::string getDid() const;

        nlohmann::json toJson() const;

        /// JSON form used for hashing and signing
        nlohmann::json toJsonWithoutProof() const;

        static dp::Result<LogEntry, dp::Error> fromJson(const nlohmann::json &j);

        /// Parse one line of a did.jsonl log
        static dp::Result<LogEntry, dp::Error> fromString(const std::string &line);

        /// Single-line JSON, as written to did.jsonl
        std::string toString() const;

      private:
        dp::Result<void, dp::Error> verifyVersionId(const LogEntry *previous, const Parameters &parameters) const;

        dp::Result<void, dp::Error> verifyVersionTime(const LogEntry *previous) const;

        dp::Result<void, dp::Error> verifyScid() const;

        dp::Result<void, dp::Error> verifyDid(const LogEntry *previous, const Parameters *previous_parameters,
                                              const Parameters &parameters) const;
    };

    /// Fragment of a verification method ("did:key:<mk>#<mk>" -> "<mk>"), empty when absent
    std::string verificationMethodFragment(const std::string &verification_method);

} // namespace didwebvh
