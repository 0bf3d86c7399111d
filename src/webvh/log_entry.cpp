#include <algorithm>
#include <didwebvh/webvh/log_entry.hpp>
#include <didwebvh/webvh/url.hpp>

namespace didwebvh {

    namespace {

        void replaceAll(std::string &text, const std::string &from, const std::string &to) {
            if (from.empty()) {
                return;
            }
            size_t pos = 0;
            while ((pos = text.find(from, pos)) != std::string::npos) {
                text.replace(pos, from.size(), to);
                pos += to.size();
            }
        }

    } // namespace

    std::string verificationMethodFragment(const std::string &verification_method) {
        size_t pos = verification_method.find('#');
        if (pos == std::string::npos) {
            return "";
        }
        return verification_method.substr(pos + 1);
    }

    // ===========================================
    // MetaData
    // ===========================================

    nlohmann::json MetaData::toJson() const {
        nlohmann::json j;
        j["versionId"] = version_id;
        j["versionTime"] = version_time;
        j["created"] = created;
        j["updated"] = updated;
        j["scid"] = scid;
        j["portable"] = portable;
        j["deactivated"] = deactivated;
        if (witness) {
            j["witness"] = witness->toJson();
        }
        if (!watchers.empty()) {
            j["watchers"] = watchers;
        }
        if (ttl) {
            j["ttl"] = *ttl;
        }
        return j;
    }

    // ===========================================
    // Creation
    // ===========================================

    dp::Result<LogEntry, dp::Error> LogEntry::createFirstEntry(Timestamp version_time, const nlohmann::json &document,
                                                               const Parameters &parameters, const Secret &secret,
                                                               const DataIntegrity &integrity) {
        Parameters first = parameters;
        first.scid = SCID_PLACEHOLDER;
        if (!first.method) {
            first.method = Parameters::METHOD;
        }

        auto validated = first.validate(nullptr);
        if (validated.is_err()) {
            return dp::Result<LogEntry, dp::Error>::err(validated.error());
        }

        // The first update key signs the first entry
        const auto &update_keys = first.getUpdateKeys();
        std::string expected_vm = "did:key:" + update_keys.front() + "#" + update_keys.front();
        if (secret.getId() != expected_vm) {
            return dp::Result<LogEntry, dp::Error>::err(signature_error(
                "Secret id (" + secret.getId() + ") does not match the first update key (" + expected_vm + ")"));
        }

        LogEntry preliminary;
        preliminary.version_id = SCID_PLACEHOLDER;
        preliminary.version_time = formatTimestamp(version_time);
        preliminary.parameters = first;
        preliminary.state = document;

        auto scid = preliminary.generateScid();
        if (scid.is_err()) {
            return dp::Result<LogEntry, dp::Error>::err(scid.error());
        }

        std::string text = preliminary.toJsonWithoutProof().dump();
        replaceAll(text, SCID_PLACEHOLDER, scid.value());

        nlohmann::json substituted;
        try {
            substituted = nlohmann::json::parse(text);
        } catch (const nlohmann::json::exception &e) {
            return dp::Result<LogEntry, dp::Error>::err(
                scid_error(std::string("Failed to re-read LogEntry after SCID substitution: ") + e.what()));
        }

        auto entry_result = fromJson(substituted);
        if (entry_result.is_err()) {
            return entry_result;
        }
        LogEntry entry = entry_result.value();

        // versionId is the SCID at this point
        auto entry_hash = entry.generateLogEntryHash();
        if (entry_hash.is_err()) {
            return dp::Result<LogEntry, dp::Error>::err(entry_hash.error());
        }
        entry.version_id = "1-" + entry_hash.value();

        auto proof = integrity.sign(entry.toJsonWithoutProof(), secret, version_time);
        if (proof.is_err()) {
            return dp::Result<LogEntry, dp::Error>::err(proof.error());
        }
        entry.proof = proof.value();

        return dp::Result<LogEntry, dp::Error>::ok(entry);
    }

    dp::Result<LogEntry, dp::Error> LogEntry::createNewLogEntry(const LogEntry &previous, Timestamp version_time,
                                                                const nlohmann::json &document,
                                                                const Parameters &parameters_diff,
                                                                const Secret &secret,
                                                                const DataIntegrity &integrity) {
        auto previous_version = parseVersionId(previous.version_id);
        if (previous_version.is_err()) {
            return dp::Result<LogEntry, dp::Error>::err(previous_version.error());
        }

        LogEntry entry;
        entry.version_id = previous.version_id;
        entry.version_time = formatTimestamp(version_time);
        entry.parameters = parameters_diff;
        entry.state = document;

        auto entry_hash = entry.generateLogEntryHash();
        if (entry_hash.is_err()) {
            return dp::Result<LogEntry, dp::Error>::err(entry_hash.error());
        }
        entry.version_id = std::to_string(previous_version.value().first + 1) + "-" + entry_hash.value();

        auto proof = integrity.sign(entry.toJsonWithoutProof(), secret, version_time);
        if (proof.is_err()) {
            return dp::Result<LogEntry, dp::Error>::err(proof.error());
        }
        entry.proof = proof.value();

        return dp::Result<LogEntry, dp::Error>::ok(entry);
    }

    // ===========================================
    // Hashing
    // ===========================================

    dp::Result<std::string, dp::Error> LogEntry::generateScid() const {
        auto hash = generateLogEntryHash();
        if (hash.is_err()) {
            return dp::Result<std::string, dp::Error>::err(
                scid_error("Couldn't generate SCID from preliminary LogEntry: " + errorMessage(hash.error())));
        }
        return hash;
    }

    dp::Result<std::string, dp::Error> LogEntry::generateLogEntryHash() const {
        auto canonical = jcs::canonicalize(toJsonWithoutProof());
        if (canonical.is_err()) {
            return dp::Result<std::string, dp::Error>::err(canonical.error());
        }
        return hashToMultibase(canonical.value());
    }

    // ===========================================
    // Verification
    // ===========================================

    dp::Result<std::pair<Parameters, MetaData>, dp::Error>
    LogEntry::verifyLogEntry(const LogEntry *previous, const Parameters *previous_parameters,
                             const MetaData *previous_metadata, const DataIntegrity &integrity,
                             const DIDResolver &resolver) const {
        using VerifyResult = dp::Result<std::pair<Parameters, MetaData>, dp::Error>;

        if ((previous == nullptr) != (previous_parameters == nullptr) ||
            (previous == nullptr) != (previous_metadata == nullptr)) {
            return VerifyResult::err(
                dp::Error::invalid_argument("previous entry, parameters and metadata must be given together"));
        }

        if (!proof) {
            return VerifyResult::err(signature_error("Missing proof in LogEntry " + version_id));
        }

        auto validated = parameters.validate(previous_parameters);
        if (validated.is_err()) {
            return VerifyResult::err(validated.error());
        }
        const Parameters &effective = validated.value();

        // Signing key must be one of the active update keys
        std::string signing_key = verificationMethodFragment(proof->verification_method);
        const auto &authorized = effective.active_update_keys;
        if (signing_key.empty() || std::find(authorized.begin(), authorized.end(), signing_key) == authorized.end()) {
            return VerifyResult::err(
                signature_error("Signing key (" + proof->verification_method + ") is not authorized"));
        }

        auto public_key = resolver.resolvePublicKey(proof->verification_method);
        if (public_key.is_err()) {
            return VerifyResult::err(signature_error("Couldn't resolve signing key (" + proof->verification_method +
                                                     "): " + errorMessage(public_key.error())));
        }

        auto verified = integrity.verify(toJsonWithoutProof(), *proof, public_key.value());
        if (verified.is_err()) {
            return VerifyResult::err(
                signature_error("Signature verification failed: " + errorMessage(verified.error())));
        }
        if (!verified.value()) {
            return VerifyResult::err(signature_error("Signature verification failed for LogEntry " + version_id));
        }

        auto version_ok = verifyVersionId(previous, effective);
        if (version_ok.is_err()) {
            return VerifyResult::err(version_ok.error());
        }

        auto time_ok = verifyVersionTime(previous);
        if (time_ok.is_err()) {
            return VerifyResult::err(time_ok.error());
        }

        if (previous == nullptr) {
            auto scid_ok = verifyScid();
            if (scid_ok.is_err()) {
                return VerifyResult::err(scid_ok.error());
            }
        }

        auto did_ok = verifyDid(previous, previous_parameters, effective);
        if (did_ok.is_err()) {
            return VerifyResult::err(did_ok.error());
        }

        MetaData metadata;
        metadata.version_id = version_id;
        metadata.version_time = version_time;
        metadata.created = previous_metadata ? previous_metadata->created : version_time;
        metadata.updated = version_time;
        metadata.scid = effective.scid.value_or("");
        metadata.portable = effective.isPortable();
        metadata.deactivated = effective.isDeactivated();
        if (const auto *witness = effective.getWitness()) {
            metadata.witness = *witness;
        }
        if (effective.watchers.isSet()) {
            metadata.watchers = effective.watchers.value();
        }
        if (effective.ttl.isSet()) {
            metadata.ttl = effective.ttl.value();
        }

        return VerifyResult::ok(std::make_pair(effective, metadata));
    }

    dp::Result<void, dp::Error> LogEntry::verifyVersionId(const LogEntry *previous,
                                                          const Parameters &parameters) const {
        auto current = parseVersionId(version_id);
        if (current.is_err()) {
            return dp::Result<void, dp::Error>::err(current.error());
        }
        auto [current_number, current_hash] = current.value();

        LogEntry working = *this;
        working.proof.reset();

        if (previous != nullptr) {
            auto previous_version = parseVersionId(previous->version_id);
            if (previous_version.is_err()) {
                return dp::Result<void, dp::Error>::err(previous_version.error());
            }
            if (current_number != previous_version.value().first + 1) {
                return dp::Result<void, dp::Error>::err(chain_integrity_error(
                    "LogEntry version number (" + std::to_string(current_number) +
                    ") must be one greater than the previous (" + std::to_string(previous_version.value().first) +
                    ")"));
            }
            working.version_id = previous->version_id;
        } else {
            if (current_number != 1) {
                return dp::Result<void, dp::Error>::err(chain_integrity_error(
                    "First LogEntry must have version number 1, got " + std::to_string(current_number)));
            }
            working.version_id = parameters.scid.value_or("");
        }

        auto entry_hash = working.generateLogEntryHash();
        if (entry_hash.is_err()) {
            return dp::Result<void, dp::Error>::err(entry_hash.error());
        }
        if (entry_hash.value() != current_hash) {
            return dp::Result<void, dp::Error>::err(
                chain_integrity_error("LogEntry " + version_id + " entryHash does not match calculated hash (" +
                                      entry_hash.value() + ")"));
        }

        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> LogEntry::verifyVersionTime(const LogEntry *previous) const {
        auto current = parseTimestamp(version_time);
        if (current.is_err()) {
            return dp::Result<void, dp::Error>::err(
                chain_integrity_error("Couldn't parse versionTime (" + version_time + ")"));
        }

        if (current.value() > std::chrono::system_clock::now()) {
            return dp::Result<void, dp::Error>::err(
                chain_integrity_error("versionTime (" + version_time + ") can not be in the future"));
        }

        if (previous != nullptr) {
            auto previous_time = parseTimestamp(previous->version_time);
            if (previous_time.is_err()) {
                return dp::Result<void, dp::Error>::err(
                    chain_integrity_error("Couldn't parse previous versionTime (" + previous->version_time + ")"));
            }
            if (current.value() < previous_time.value()) {
                return dp::Result<void, dp::Error>::err(
                    chain_integrity_error("versionTime (" + version_time + ") is earlier than the previous (" +
                                          previous->version_time + ")"));
            }
        }

        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> LogEntry::verifyScid() const {
        if (!parameters.scid || parameters.scid->empty()) {
            return dp::Result<void, dp::Error>::err(scid_error("First LogEntry must have a SCID"));
        }
        const std::string &scid = *parameters.scid;

        LogEntry working = *this;
        working.proof.reset();
        working.version_id = SCID_PLACEHOLDER;

        std::string text = working.toJsonWithoutProof().dump();
        replaceAll(text, scid, SCID_PLACEHOLDER);

        nlohmann::json preliminary_json;
        try {
            preliminary_json = nlohmann::json::parse(text);
        } catch (const nlohmann::json::exception &e) {
            return dp::Result<void, dp::Error>::err(
                scid_error(std::string("Failed to re-read LogEntry with SCID placeholders: ") + e.what()));
        }

        auto preliminary = fromJson(preliminary_json);
        if (preliminary.is_err()) {
            return dp::Result<void, dp::Error>::err(preliminary.error());
        }

        auto calculated = preliminary.value().generateScid();
        if (calculated.is_err()) {
            return dp::Result<void, dp::Error>::err(calculated.error());
        }
        if (calculated.value() != scid) {
            return dp::Result<void, dp::Error>::err(
                scid_error("SCID (" + scid + ") does not match calculated SCID (" + calculated.value() + ")"));
        }

        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> LogEntry::verifyDid(const LogEntry *previous, const Parameters *previous_parameters,
                                                    const Parameters &parameters) const {
        std::string did = getDid();
        if (did.empty()) {
            return dp::Result<void, dp::Error>::err(log_entry_error("DID Document is missing its id"));
        }

        auto url = WebVHURL::parseDidUrl(did);
        if (url.is_err()) {
            return dp::Result<void, dp::Error>::err(url.error());
        }
        if (url.value().getScid() != parameters.scid.value_or("")) {
            return dp::Result<void, dp::Error>::err(
                scid_error("DID (" + did + ") does not carry the SCID " + parameters.scid.value_or("")));
        }

        if (previous == nullptr || previous->getDid() == did) {
            return dp::Result<void, dp::Error>::ok();
        }

        // The DID moved to a new location
        std::string previous_did = previous->getDid();
        if (!previous_parameters->isPortable()) {
            return dp::Result<void, dp::Error>::err(
                parameters_error("DID changed from " + previous_did + " to " + did + " but is not portable"));
        }

        bool linked = false;
        auto aka = state.find("alsoKnownAs");
        if (aka != state.end() && aka->is_array()) {
            for (const auto &item : *aka) {
                if (item.is_string() && item.get<std::string>() == previous_did) {
                    linked = true;
                    break;
                }
            }
        }
        if (!linked) {
            return dp::Result<void, dp::Error>::err(
                parameters_error("Moved DID must list the previous DID (" + previous_did + ") in alsoKnownAs"));
        }

        return dp::Result<void, dp::Error>::ok();
    }

    // ===========================================
    // Accessors and serialization
    // ===========================================

    dp::Result<std::pair<dp::u32, std::string>, dp::Error> LogEntry::parseVersionId(const std::string &version_id) {
        using VersionResult = dp::Result<std::pair<dp::u32, std::string>, dp::Error>;

        size_t dash = version_id.find('-');
        if (dash == std::string::npos || dash == 0 || dash + 1 >= version_id.size()) {
            return VersionResult::err(
                chain_integrity_error("versionId (" + version_id + ") doesn't match format <int>-<hash>"));
        }

        std::string number = version_id.substr(0, dash);
        if (number.size() > 9 || number.find_first_not_of("0123456789") != std::string::npos) {
            return VersionResult::err(
                chain_integrity_error("versionId (" + version_id + ") number is not a valid integer"));
        }

        return VersionResult::ok(
            std::make_pair(static_cast<dp::u32>(std::stoul(number)), version_id.substr(dash + 1)));
    }

    dp::Result<dp::u32, dp::Error> LogEntry::getVersionNumber() const {
        auto parsed = parseVersionId(version_id);
        if (parsed.is_err()) {
            return dp::Result<dp::u32, dp::Error>::err(parsed.error());
        }
        return dp::Result<dp::u32, dp::Error>::ok(parsed.value().first);
    }

    std::string LogEntry::getDid() const {
        if (!state.is_object()) {
            return "";
        }
        auto id = state.find("id");
        if (id == state.end() || !id->is_string()) {
            return "";
        }
        return id->get<std::string>();
    }

    nlohmann::json LogEntry::toJsonWithoutProof() const {
        nlohmann::json j;
        j["versionId"] = version_id;
        j["versionTime"] = version_time;
        j["parameters"] = parameters.toJson();
        j["state"] = state;
        return j;
    }

    nlohmann::json LogEntry::toJson() const {
        auto j = toJsonWithoutProof();
        if (proof) {
            j["proof"] = proof->toJson();
        }
        return j;
    }

    dp::Result<LogEntry, dp::Error> LogEntry::fromJson(const nlohmann::json &j) {
        if (!j.is_object()) {
            return dp::Result<LogEntry, dp::Error>::err(log_entry_error("LogEntry must be a JSON object"));
        }

        LogEntry entry;

        auto version_id = j.find("versionId");
        auto version_time = j.find("versionTime");
        if (version_id == j.end() || !version_id->is_string() || version_time == j.end() ||
            !version_time->is_string()) {
            return dp::Result<LogEntry, dp::Error>::err(
                log_entry_error("LogEntry requires string versionId and versionTime"));
        }
        entry.version_id = version_id->get<std::string>();
        entry.version_time = version_time->get<std::string>();

        auto parameters = j.find("parameters");
        if (parameters == j.end()) {
            return dp::Result<LogEntry, dp::Error>::err(log_entry_error("LogEntry is missing parameters"));
        }
        auto parsed_parameters = Parameters::fromJson(*parameters);
        if (parsed_parameters.is_err()) {
            return dp::Result<LogEntry, dp::Error>::err(
                log_entry_error("Invalid LogEntry parameters: " + errorMessage(parsed_parameters.error())));
        }
        entry.parameters = parsed_parameters.value();

        auto state = j.find("state");
        if (state == j.end() || !state->is_object()) {
            return dp::Result<LogEntry, dp::Error>::err(log_entry_error("LogEntry state must be a JSON object"));
        }
        entry.state = *state;

        auto proof = j.find("proof");
        if (proof != j.end() && !proof->is_null()) {
            const nlohmann::json *proof_json = &*proof;
            if (proof->is_array()) {
                if (proof->size() != 1) {
                    return dp::Result<LogEntry, dp::Error>::err(
                        log_entry_error("LogEntry must carry exactly one controller proof"));
                }
                proof_json = &(*proof)[0];
            }
            auto parsed_proof = DataIntegrityProof::fromJson(*proof_json);
            if (parsed_proof.is_err()) {
                return dp::Result<LogEntry, dp::Error>::err(
                    log_entry_error("Invalid LogEntry proof: " + errorMessage(parsed_proof.error())));
            }
            entry.proof = parsed_proof.value();
        }

        return dp::Result<LogEntry, dp::Error>::ok(entry);
    }

    dp::Result<LogEntry, dp::Error> LogEntry::fromString(const std::string &line) {
        nlohmann::json j;
        try {
            j = nlohmann::json::parse(line);
        } catch (const nlohmann::json::exception &e) {
            return dp::Result<LogEntry, dp::Error>::err(
                log_entry_error(std::string("Failed to parse LogEntry JSON: ") + e.what()));
        }
        return fromJson(j);
    }

    std::string LogEntry::toString() const { return toJson().dump(); }

} // namespace didwebvh
