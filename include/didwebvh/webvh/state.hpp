#pragma once

#include <datapod/datapod.hpp>
#include <didwebvh/common/error.hpp>
#include <didwebvh/common/time.hpp>
#include <didwebvh/crypto/secret.hpp>
#include <didwebvh/identity/did_key.hpp>
#include <didwebvh/integrity/data_integrity.hpp>
#include <didwebvh/webvh/log_entry.hpp>
#include <didwebvh/webvh/log_entry_state.hpp>
#include <didwebvh/webvh/parameters.hpp>
#include <didwebvh/webvh/witness_proofs.hpp>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace didwebvh {

    /// The verifiable history of one did:webvh DID
    ///
    /// Holds the ordered log and the witness proofs, and drives validation:
    /// entries are verified in order (chain, parameters, controller proof), the
    /// log is truncated at the first failure or after deactivation, then every
    /// surviving entry must meet its witness threshold.
    class DIDWebVHState {
      public:
        /// eddsa-jcs-2022 proofs, did:key verification methods
        DIDWebVHState();

        DIDWebVHState(std::shared_ptr<const DataIntegrity> integrity, std::shared_ptr<const DIDResolver> resolver);

        /// Load a did.jsonl log, replacing any loaded entries
        dp::Result<void, dp::Error> loadLogEntries(const std::string &jsonl);

        /// Load did-witness.json, replacing any loaded proofs
        dp::Result<void, dp::Error> loadWitnessProofs(const std::string &json);

        void setLogEntries(const std::vector<LogEntry> &entries);

        void setWitnessProofs(WitnessProofCollection proofs);

        dp::Result<void, dp::Error> addWitnessProof(const std::string &version_id, const DataIntegrityProof &proof);

        /// Validate the whole log
        ///
        /// Fails when the first entry is invalid or nothing survives. Later failures
        /// truncate the log to the last good entry. Re-running on the result is a no-op.
        dp::Result<void, dp::Error> validate();

        /// Author, verify and append a new LogEntry
        ///
        /// For the first entry parameters are the full initial parameters and the
        /// document uses "{SCID}" placeholders. Afterwards parameters are the desired
        /// effective parameters; only their difference to the current version is written.
        /// Fails, leaving the log untouched, while a previous entry lacks its witness proofs.
        dp::Result<const LogEntryState *, dp::Error> createLogEntry(Timestamp version_time,
                                                                    const nlohmann::json &document,
                                                                    const Parameters &parameters,
                                                                    const Secret &secret);

        /// Newest valid entry
        dp::Result<const LogEntryState *, dp::Error> getLastEntry() const;

        dp::Result<const LogEntryState *, dp::Error> getLogEntryByVersionId(const std::string &version_id) const;

        dp::Result<const LogEntryState *, dp::Error> getLogEntryByVersionNumber(dp::u32 version_number) const;

        /// Entry in effect at a point in time
        dp::Result<const LogEntryState *, dp::Error> getLogEntryAtTime(Timestamp time) const;

        /// DID Document of the newest valid entry
        dp::Result<nlohmann::json, dp::Error> getResolvedDocument() const;

        inline const std::vector<LogEntryState> &getLogEntries() const { return log_entries_; }

        inline const WitnessProofCollection &getWitnessProofs() const { return witness_proofs_; }

        inline bool isValidated() const { return validated_; }

        bool isDeactivated() const;

        std::string getScid() const;

        /// Log entries as did.jsonl text
        std::string toJsonl() const;

      private:
        dp::Result<void, dp::Error> requireValidated() const;

        std::vector<LogEntryState> log_entries_;
        WitnessProofCollection witness_proofs_;
        std::shared_ptr<const DataIntegrity> integrity_;
        std::shared_ptr<const DIDResolver> resolver_;
        bool validated_ = false;
    };

} // namespace didwebvh
