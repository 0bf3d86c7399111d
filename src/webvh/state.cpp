#include <didwebvh/webvh/state.hpp>
#include <iostream>
#include <optional>
#include <sstream>

namespace didwebvh {

    DIDWebVHState::DIDWebVHState()
        : integrity_(std::make_shared<EddsaJcs2022>()), resolver_(std::make_shared<DIDKeyResolver>()) {}

    DIDWebVHState::DIDWebVHState(std::shared_ptr<const DataIntegrity> integrity,
                                 std::shared_ptr<const DIDResolver> resolver)
        : integrity_(std::move(integrity)), resolver_(std::move(resolver)) {}

    dp::Result<void, dp::Error> DIDWebVHState::loadLogEntries(const std::string &jsonl) {
        std::vector<LogEntry> entries;
        std::istringstream stream(jsonl);
        std::string line;
        size_t line_number = 0;
        while (std::getline(stream, line)) {
            ++line_number;
            if (line.find_first_not_of(" \t\r") == std::string::npos) {
                continue;
            }
            auto entry = LogEntry::fromString(line);
            if (entry.is_err()) {
                return dp::Result<void, dp::Error>::err(
                    log_entry_error("Line " + std::to_string(line_number) + ": " + errorMessage(entry.error())));
            }
            entries.push_back(entry.value());
        }

        setLogEntries(entries);
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> DIDWebVHState::loadWitnessProofs(const std::string &json) {
        auto proofs = WitnessProofCollection::fromString(json);
        if (proofs.is_err()) {
            return dp::Result<void, dp::Error>::err(proofs.error());
        }
        setWitnessProofs(proofs.value());
        return dp::Result<void, dp::Error>::ok();
    }

    void DIDWebVHState::setLogEntries(const std::vector<LogEntry> &entries) {
        log_entries_.clear();
        for (const auto &entry : entries) {
            log_entries_.emplace_back(entry);
        }
        validated_ = false;
    }

    void DIDWebVHState::setWitnessProofs(WitnessProofCollection proofs) {
        witness_proofs_ = std::move(proofs);
        validated_ = false;
    }

    dp::Result<void, dp::Error> DIDWebVHState::addWitnessProof(const std::string &version_id,
                                                               const DataIntegrityProof &proof) {
        auto added = witness_proofs_.addProof(version_id, proof);
        if (added.is_ok()) {
            validated_ = false;
        }
        return added;
    }

    dp::Result<void, dp::Error> DIDWebVHState::validate() {
        validated_ = false;

        if (log_entries_.empty()) {
            return dp::Result<void, dp::Error>::err(validation_error("No LogEntries to validate"));
        }

        std::vector<LogEntryState> states;
        states.reserve(log_entries_.size());
        for (const auto &state : log_entries_) {
            states.emplace_back(state.log_entry);
        }

        // Pass 1: chain, parameters and controller proofs
        for (size_t i = 0; i < states.size(); ++i) {
            auto &current = states[i];
            const LogEntryState *previous = i > 0 ? &states[i - 1] : nullptr;

            auto verified = current.log_entry.verifyLogEntry(
                previous ? &previous->log_entry : nullptr, previous ? &*previous->validated_parameters : nullptr,
                previous ? &*previous->metadata : nullptr, *integrity_, *resolver_);

            if (verified.is_err()) {
                auto marked = current.markInvalid(errorMessage(verified.error()));
                if (marked.is_err()) {
                    return marked;
                }
                if (i == 0) {
                    return dp::Result<void, dp::Error>::err(verified.error());
                }
                std::cout << "LogEntry " << current.log_entry.version_id
                          << " failed validation, truncating log to version " << previous->version_number << ": "
                          << errorMessage(verified.error()) << std::endl;
                break;
            }

            auto [parameters, metadata] = verified.value();
            auto marked = current.markLogEntryOnly(parameters, metadata);
            if (marked.is_err()) {
                return marked;
            }

            if (current.isDeactivated()) {
                if (i + 1 < states.size()) {
                    std::cout << "DID deactivated at " << current.log_entry.version_id << ", ignoring "
                              << (states.size() - i - 1) << " later LogEntries" << std::endl;
                }
                break;
            }
        }

        std::vector<LogEntryState> retained;
        for (auto &state : states) {
            if (state.getStatus() == ValidationStatus::LogEntryOnly) {
                retained.push_back(std::move(state));
            }
        }
        if (retained.empty()) {
            return dp::Result<void, dp::Error>::err(validation_error("No validated LogEntries"));
        }

        // Pass 2: witness thresholds, repeated until no entry is cut
        while (true) {
            auto generated = witness_proofs_.generateProofState(retained);
            if (generated.is_err()) {
                return generated;
            }

            size_t failed_at = retained.size();
            std::optional<dp::Error> failure;
            for (size_t i = 0; i < retained.size(); ++i) {
                auto witnessed = witness_proofs_.validateLogEntry(retained[i], *integrity_, *resolver_);
                if (witnessed.is_err()) {
                    failed_at = i;
                    failure.emplace(witnessed.error());
                    break;
                }
            }

            if (failed_at == retained.size()) {
                break;
            }

            auto marked = retained[failed_at].markInvalid(errorMessage(*failure));
            if (marked.is_err()) {
                return marked;
            }
            if (failed_at == 0) {
                return dp::Result<void, dp::Error>::err(*failure);
            }

            std::cout << "LogEntry " << retained[failed_at].log_entry.version_id
                      << " failed witness validation, truncating log to version "
                      << retained[failed_at - 1].version_number << ": " << errorMessage(*failure) << std::endl;
            retained.erase(retained.begin() + static_cast<std::ptrdiff_t>(failed_at), retained.end());
        }

        for (auto &state : retained) {
            auto witnessed = state.markWitnessProof();
            if (witnessed.is_err()) {
                return witnessed;
            }
            auto ok = state.markOk();
            if (ok.is_err()) {
                return ok;
            }
        }

        log_entries_ = std::move(retained);
        validated_ = true;
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<const LogEntryState *, dp::Error> DIDWebVHState::createLogEntry(Timestamp version_time,
                                                                               const nlohmann::json &document,
                                                                               const Parameters &parameters,
                                                                               const Secret &secret) {
        using CreateResult = dp::Result<const LogEntryState *, dp::Error>;

        const LogEntryState *previous = nullptr;
        if (!log_entries_.empty()) {
            if (!validated_) {
                auto authored = log_entries_;
                auto validated = validate();
                if (validated.is_err()) {
                    return CreateResult::err(validated.error());
                }
                // Never build on a log that lost entries, e.g. ones still waiting for witness proofs
                if (log_entries_.size() < authored.size()) {
                    size_t dropped = authored.size() - log_entries_.size();
                    log_entries_ = std::move(authored);
                    validated_ = false;
                    return CreateResult::err(validation_error(
                        "Validation would discard " + std::to_string(dropped) + " of " +
                        std::to_string(log_entries_.size()) + " LogEntries, add their witness proofs first"));
                }
            }
            previous = &log_entries_.back();
            if (previous->isDeactivated()) {
                return CreateResult::err(deactivated_error("Can not add LogEntries to a deactivated DID"));
            }
        }

        dp::Result<LogEntry, dp::Error> created =
            previous == nullptr
                ? LogEntry::createFirstEntry(version_time, document, parameters, secret, *integrity_)
                : LogEntry::createNewLogEntry(previous->log_entry, version_time, document,
                                              parameters.diff(*previous->validated_parameters), secret,
                                              *integrity_);
        if (created.is_err()) {
            return CreateResult::err(created.error());
        }

        LogEntryState state(created.value());
        auto verified = state.log_entry.verifyLogEntry(
            previous ? &previous->log_entry : nullptr, previous ? &*previous->validated_parameters : nullptr,
            previous ? &*previous->metadata : nullptr, *integrity_, *resolver_);
        if (verified.is_err()) {
            return CreateResult::err(verified.error());
        }

        auto [effective, metadata] = verified.value();
        auto marked = state.markLogEntryOnly(effective, metadata);
        if (marked.is_err()) {
            return CreateResult::err(marked.error());
        }

        // Witnessed entries stay at LogEntryOnly until their proofs arrive
        if (!effective.active_witness) {
            auto witnessed = state.markWitnessProof();
            if (witnessed.is_err()) {
                return CreateResult::err(witnessed.error());
            }
            auto ok = state.markOk();
            if (ok.is_err()) {
                return CreateResult::err(ok.error());
            }
        }
        validated_ = !effective.active_witness.has_value();

        log_entries_.push_back(std::move(state));
        return CreateResult::ok(&log_entries_.back());
    }

    dp::Result<void, dp::Error> DIDWebVHState::requireValidated() const {
        if (!validated_) {
            return dp::Result<void, dp::Error>::err(validation_error("DID log has not been validated"));
        }
        if (log_entries_.empty()) {
            return dp::Result<void, dp::Error>::err(validation_error("No validated LogEntries"));
        }
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<const LogEntryState *, dp::Error> DIDWebVHState::getLastEntry() const {
        auto ready = requireValidated();
        if (ready.is_err()) {
            return dp::Result<const LogEntryState *, dp::Error>::err(ready.error());
        }
        return dp::Result<const LogEntryState *, dp::Error>::ok(&log_entries_.back());
    }

    dp::Result<const LogEntryState *, dp::Error>
    DIDWebVHState::getLogEntryByVersionId(const std::string &version_id) const {
        auto ready = requireValidated();
        if (ready.is_err()) {
            return dp::Result<const LogEntryState *, dp::Error>::err(ready.error());
        }
        for (const auto &state : log_entries_) {
            if (state.log_entry.version_id == version_id) {
                return dp::Result<const LogEntryState *, dp::Error>::ok(&state);
            }
        }
        return dp::Result<const LogEntryState *, dp::Error>::err(
            dp::Error::not_found(dp::String(("No LogEntry with versionId " + version_id).c_str())));
    }

    dp::Result<const LogEntryState *, dp::Error>
    DIDWebVHState::getLogEntryByVersionNumber(dp::u32 version_number) const {
        auto ready = requireValidated();
        if (ready.is_err()) {
            return dp::Result<const LogEntryState *, dp::Error>::err(ready.error());
        }
        for (const auto &state : log_entries_) {
            if (state.version_number == version_number) {
                return dp::Result<const LogEntryState *, dp::Error>::ok(&state);
            }
        }
        return dp::Result<const LogEntryState *, dp::Error>::err(dp::Error::not_found(
            dp::String(("No LogEntry with version number " + std::to_string(version_number)).c_str())));
    }

    dp::Result<const LogEntryState *, dp::Error> DIDWebVHState::getLogEntryAtTime(Timestamp time) const {
        auto ready = requireValidated();
        if (ready.is_err()) {
            return dp::Result<const LogEntryState *, dp::Error>::err(ready.error());
        }

        const LogEntryState *found = nullptr;
        for (const auto &state : log_entries_) {
            auto entry_time = parseTimestamp(state.log_entry.version_time);
            if (entry_time.is_err() || entry_time.value() > time) {
                break;
            }
            found = &state;
        }

        if (found == nullptr) {
            return dp::Result<const LogEntryState *, dp::Error>::err(
                dp::Error::not_found(dp::String(("No LogEntry at or before " + formatTimestamp(time)).c_str())));
        }
        return dp::Result<const LogEntryState *, dp::Error>::ok(found);
    }

    dp::Result<nlohmann::json, dp::Error> DIDWebVHState::getResolvedDocument() const {
        auto last = getLastEntry();
        if (last.is_err()) {
            return dp::Result<nlohmann::json, dp::Error>::err(last.error());
        }
        return dp::Result<nlohmann::json, dp::Error>::ok(last.value()->log_entry.state);
    }

    bool DIDWebVHState::isDeactivated() const { return !log_entries_.empty() && log_entries_.back().isDeactivated(); }

    std::string DIDWebVHState::getScid() const {
        if (log_entries_.empty() || !log_entries_.front().metadata) {
            return "";
        }
        return log_entries_.front().metadata->scid;
    }

    std::string DIDWebVHState::toJsonl() const {
        std::string out;
        for (const auto &state : log_entries_) {
            out += state.log_entry.toString();
            out += '\n';
        }
        return out;
    }

} // namespace didwebvh
