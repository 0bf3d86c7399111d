#pragma once

#include <datapod/datapod.hpp>
#include <didwebvh/common/error.hpp>
#include <didwebvh/common/time.hpp>
#include <didwebvh/crypto/secret.hpp>
#include <didwebvh/identity/did_key.hpp>
#include <didwebvh/integrity/data_integrity.hpp>
#include <didwebvh/webvh/log_entry_state.hpp>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace didwebvh {

    /// Witness proofs for one version of the log
    struct WitnessProof {
        std::string version_id;
        std::vector<DataIntegrityProof> proof;

        nlohmann::json toJson() const;

        static dp::Result<WitnessProof, dp::Error> fromJson(const nlohmann::json &j);
    };

    /// A witness proof over a version of the current log
    struct WitnessProofState {
        dp::u32 version_number = 0;
        std::string version_id;
        DataIntegrityProof proof;
        std::optional<bool> verified; // memoised for the current pass
    };

    /// did-witness.json: proofs from witness nodes, keyed by versionId
    ///
    /// A witness proof over version N attests every version up to N. A witness whose
    /// newest proof does not verify falls back to its older ones. Duplicate proofs
    /// from the same witness for the same version are resolved last-write-wins.
    class WitnessProofCollection {
      public:
        WitnessProofCollection() = default;

        /// Document a witness signs for a version
        static nlohmann::json witnessDocument(const std::string &version_id);

        /// Produce a witness proof for a version (witness node side)
        static dp::Result<DataIntegrityProof, dp::Error> signProof(const std::string &version_id,
                                                                   const Secret &witness, Timestamp created,
                                                                   const DataIntegrity &integrity);

        /// Insert or append a proof for version_id, replacing an earlier proof by the same witness
        dp::Result<void, dp::Error> addProof(const std::string &version_id, const DataIntegrityProof &proof);

        void removeVersionId(const std::string &version_id);

        size_t getProofCount(const std::string &version_id) const;

        /// Proofs for a version, nullptr when none were supplied
        const WitnessProof *getProofs(const std::string &version_id) const;

        /// Drop every proof older than that witness's newest proof, then empty versions
        dp::Result<void, dp::Error> optimiseRecords();

        /// Recompute per-witness proofs, newest first, against the given log
        ///
        /// Only records whose versionId is exactly the versionId of the entry with
        /// that number are used. Proofs above the last entry are ignored.
        dp::Result<void, dp::Error> generateProofState(const std::vector<LogEntryState> &entries);

        /// Whether the entry's active witnesses reached their threshold
        ///
        /// A witness counts when any of its proofs at or above the entry's version
        /// verifies. Fails with a witness threshold error when too few do.
        dp::Result<void, dp::Error> validateLogEntry(const LogEntryState &entry, const DataIntegrity &integrity,
                                                     const DIDResolver &resolver);

        inline const std::vector<WitnessProof> &getRecords() const { return records_; }

        inline const std::map<std::string, std::vector<WitnessProofState>> &getProofState() const {
            return proof_state_;
        }

        inline bool isEmpty() const { return records_.empty(); }

        nlohmann::json toJson() const;

        static dp::Result<WitnessProofCollection, dp::Error> fromJson(const nlohmann::json &j);

        static dp::Result<WitnessProofCollection, dp::Error> fromString(const std::string &text);

      private:
        std::vector<WitnessProof> records_;
        std::map<std::string, std::vector<WitnessProofState>> proof_state_; // witness DID -> proofs, newest first
    };

} // namespace didwebvh
