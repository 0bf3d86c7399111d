#include <algorithm>
#include <didwebvh/webvh/witness_proofs.hpp>
#include <iostream>

namespace didwebvh {

    namespace {

        /// DID part of a verification method ("did:key:<mk>#<mk>" -> "did:key:<mk>")
        std::string witnessDid(const std::string &verification_method) {
            return verification_method.substr(0, verification_method.find('#'));
        }

    } // namespace

    // ===========================================
    // WitnessProof
    // ===========================================

    nlohmann::json WitnessProof::toJson() const {
        nlohmann::json proofs = nlohmann::json::array();
        for (const auto &p : proof) {
            proofs.push_back(p.toJson());
        }
        return nlohmann::json{{"versionId", version_id}, {"proof", proofs}};
    }

    dp::Result<WitnessProof, dp::Error> WitnessProof::fromJson(const nlohmann::json &j) {
        if (!j.is_object()) {
            return dp::Result<WitnessProof, dp::Error>::err(witness_proof_error("Witness record must be an object"));
        }

        auto version_id = j.find("versionId");
        if (version_id == j.end() || !version_id->is_string()) {
            return dp::Result<WitnessProof, dp::Error>::err(
                witness_proof_error("Witness record requires a string versionId"));
        }

        WitnessProof record;
        record.version_id = version_id->get<std::string>();

        auto proofs = j.find("proof");
        if (proofs == j.end() || !proofs->is_array()) {
            return dp::Result<WitnessProof, dp::Error>::err(
                witness_proof_error("Witness record " + record.version_id + " requires a proof array"));
        }
        for (const auto &item : *proofs) {
            auto parsed = DataIntegrityProof::fromJson(item);
            if (parsed.is_err()) {
                return dp::Result<WitnessProof, dp::Error>::err(witness_proof_error(
                    "Invalid proof for " + record.version_id + ": " + errorMessage(parsed.error())));
            }
            record.proof.push_back(parsed.value());
        }

        return dp::Result<WitnessProof, dp::Error>::ok(record);
    }

    // ===========================================
    // WitnessProofCollection
    // ===========================================

    nlohmann::json WitnessProofCollection::witnessDocument(const std::string &version_id) {
        return nlohmann::json{{"versionId", version_id}};
    }

    dp::Result<DataIntegrityProof, dp::Error> WitnessProofCollection::signProof(const std::string &version_id,
                                                                                const Secret &witness,
                                                                                Timestamp created,
                                                                                const DataIntegrity &integrity) {
        return integrity.sign(witnessDocument(version_id), witness, created);
    }

    dp::Result<void, dp::Error> WitnessProofCollection::addProof(const std::string &version_id,
                                                                 const DataIntegrityProof &proof) {
        auto parsed = LogEntry::parseVersionId(version_id);
        if (parsed.is_err()) {
            return dp::Result<void, dp::Error>::err(parsed.error());
        }

        auto record = std::find_if(records_.begin(), records_.end(),
                                   [&version_id](const WitnessProof &r) { return r.version_id == version_id; });
        if (record == records_.end()) {
            records_.push_back(WitnessProof{version_id, {proof}});
            return dp::Result<void, dp::Error>::ok();
        }

        auto existing = std::find_if(record->proof.begin(), record->proof.end(), [&proof](const DataIntegrityProof &p) {
            return p.verification_method == proof.verification_method;
        });
        if (existing != record->proof.end()) {
            *existing = proof;
        } else {
            record->proof.push_back(proof);
        }

        return dp::Result<void, dp::Error>::ok();
    }

    void WitnessProofCollection::removeVersionId(const std::string &version_id) {
        records_.erase(std::remove_if(records_.begin(), records_.end(),
                                      [&version_id](const WitnessProof &r) { return r.version_id == version_id; }),
                       records_.end());
    }

    size_t WitnessProofCollection::getProofCount(const std::string &version_id) const {
        const auto *record = getProofs(version_id);
        return record ? record->proof.size() : 0;
    }

    const WitnessProof *WitnessProofCollection::getProofs(const std::string &version_id) const {
        for (const auto &record : records_) {
            if (record.version_id == version_id) {
                return &record;
            }
        }
        return nullptr;
    }

    dp::Result<void, dp::Error> WitnessProofCollection::optimiseRecords() {
        std::map<std::string, dp::u32> newest;
        for (const auto &record : records_) {
            auto parsed = LogEntry::parseVersionId(record.version_id);
            if (parsed.is_err()) {
                return dp::Result<void, dp::Error>::err(parsed.error());
            }
            dp::u32 number = parsed.value().first;
            for (const auto &p : record.proof) {
                auto &slot = newest[p.verification_method];
                slot = std::max(slot, number);
            }
        }

        for (auto &record : records_) {
            dp::u32 number = LogEntry::parseVersionId(record.version_id).value().first;
            record.proof.erase(std::remove_if(record.proof.begin(), record.proof.end(),
                                              [&](const DataIntegrityProof &p) {
                                                  return number < newest[p.verification_method];
                                              }),
                               record.proof.end());
        }

        records_.erase(std::remove_if(records_.begin(), records_.end(),
                                      [](const WitnessProof &r) { return r.proof.empty(); }),
                       records_.end());

        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> WitnessProofCollection::generateProofState(const std::vector<LogEntryState> &entries) {
        proof_state_.clear();
        if (entries.empty()) {
            return dp::Result<void, dp::Error>::ok();
        }

        std::map<dp::u32, std::string> version_ids;
        for (const auto &entry : entries) {
            version_ids[entry.version_number] = entry.log_entry.version_id;
        }
        dp::u32 highest_version_number = entries.back().version_number;

        for (const auto &record : records_) {
            auto parsed = LogEntry::parseVersionId(record.version_id);
            if (parsed.is_err()) {
                return dp::Result<void, dp::Error>::err(
                    witness_proof_error("Invalid witness versionId: " + errorMessage(parsed.error())));
            }
            dp::u32 number = parsed.value().first;
            if (number > highest_version_number) {
                continue;
            }

            auto known = version_ids.find(number);
            if (known == version_ids.end() || known->second != record.version_id) {
                std::cerr << "Ignoring witness proofs for " << record.version_id << ": not a version of this log"
                          << std::endl;
                continue;
            }

            for (const auto &p : record.proof) {
                WitnessProofState state;
                state.version_number = number;
                state.version_id = record.version_id;
                state.proof = p;
                proof_state_[witnessDid(p.verification_method)].push_back(state);
            }
        }

        for (auto &witness : proof_state_) {
            std::stable_sort(witness.second.begin(), witness.second.end(),
                             [](const WitnessProofState &a, const WitnessProofState &b) {
                                 return a.version_number > b.version_number;
                             });
        }

        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> WitnessProofCollection::validateLogEntry(const LogEntryState &entry,
                                                                         const DataIntegrity &integrity,
                                                                         const DIDResolver &resolver) {
        if (!entry.validated_parameters) {
            return dp::Result<void, dp::Error>::err(
                witness_threshold_error("LogEntry " + entry.log_entry.version_id + " has no validated parameters"));
        }

        const auto &active = entry.validated_parameters->active_witness;
        if (!active) {
            return dp::Result<void, dp::Error>::ok();
        }

        dp::u32 valid = 0;
        for (const auto &witness : active->witnesses) {
            auto it = proof_state_.find(witness.id);
            if (it == proof_state_.end()) {
                continue;
            }

            for (auto &state : it->second) {
                if (state.version_number < entry.version_number) {
                    break;
                }

                if (!state.verified) {
                    auto public_key = resolver.resolvePublicKey(state.proof.verification_method);
                    if (public_key.is_err()) {
                        std::cerr << "Witness " << witness.id
                                  << ": couldn't resolve key: " << errorMessage(public_key.error()) << std::endl;
                        state.verified = false;
                    } else {
                        auto verified =
                            integrity.verify(witnessDocument(state.version_id), state.proof, public_key.value());
                        state.verified = verified.is_ok() && verified.value();
                        if (!*state.verified) {
                            std::cerr << "Witness " << witness.id << ": proof for " << state.version_id
                                      << " failed verification" << std::endl;
                        }
                    }
                }

                if (*state.verified) {
                    ++valid;
                    break;
                }
            }
        }

        if (valid < active->threshold) {
            return dp::Result<void, dp::Error>::err(witness_threshold_error(
                "LogEntry " + entry.log_entry.version_id + " has " + std::to_string(valid) +
                " valid witness proofs, threshold is " + std::to_string(active->threshold)));
        }

        return dp::Result<void, dp::Error>::ok();
    }

    nlohmann::json WitnessProofCollection::toJson() const {
        nlohmann::json j = nlohmann::json::array();
        for (const auto &record : records_) {
            j.push_back(record.toJson());
        }
        return j;
    }

    dp::Result<WitnessProofCollection, dp::Error> WitnessProofCollection::fromJson(const nlohmann::json &j) {
        if (!j.is_array()) {
            return dp::Result<WitnessProofCollection, dp::Error>::err(
                witness_proof_error("Witness proof file must be a JSON array"));
        }

        WitnessProofCollection collection;
        for (const auto &item : j) {
            auto record = WitnessProof::fromJson(item);
            if (record.is_err()) {
                return dp::Result<WitnessProofCollection, dp::Error>::err(record.error());
            }
            for (const auto &p : record.value().proof) {
                auto added = collection.addProof(record.value().version_id, p);
                if (added.is_err()) {
                    return dp::Result<WitnessProofCollection, dp::Error>::err(
                        witness_proof_error("Invalid witness versionId: " + errorMessage(added.error())));
                }
            }
        }

        return dp::Result<WitnessProofCollection, dp::Error>::ok(collection);
    }

    dp::Result<WitnessProofCollection, dp::Error> WitnessProofCollection::fromString(const std::string &text) {
        nlohmann::json j;
        try {
            j = nlohmann::json::parse(text);
        } catch (const nlohmann::json::exception &e) {
            return dp::Result<WitnessProofCollection, dp::Error>::err(
                witness_proof_error(std::string("Failed to parse witness proofs: ") + e.what()));
        }
        return fromJson(j);
    }

} // namespace didwebvh
