#pragma once

#include <doctest/doctest.h>

#include <chrono>
#include <didwebvh.hpp>
#include <string>
#include <vector>

// Shared fixtures for building DID logs in tests

namespace testing {

    using namespace didwebvh;

    inline Secret makeSecret() {
        auto secret = Secret::generate();
        REQUIRE(secret.is_ok());
        return secret.value();
    }

    /// Whole seconds in the past, so versionTime and proof created are never in the future
    inline Timestamp minutesAgo(int minutes) { return now() - std::chrono::minutes(minutes); }

    inline nlohmann::json makeDocument(const std::string &did) {
        return nlohmann::json{
            {"@context", {"https://www.w3.org/ns/did/v1"}},
            {"id", did},
            {"service", nlohmann::json::array()},
        };
    }

    /// Genesis document with the SCID placeholder
    inline nlohmann::json genesisDocument(const std::string &domain = "example.com") {
        return makeDocument(std::string(WebVHURL::PREFIX) + LogEntry::SCID_PLACEHOLDER + ":" + domain);
    }

    inline Parameters initialParameters(const Secret &secret) {
        Parameters parameters;
        parameters.method = Parameters::METHOD;
        parameters.update_keys = FieldAction<std::vector<std::string>>::set({secret.getPublicKeyMultibase()});
        return parameters;
    }

    inline Witnesses makeWitnesses(dp::u32 threshold, const std::vector<Secret> &nodes) {
        Witnesses witnesses;
        witnesses.threshold = threshold;
        for (const auto &node : nodes) {
            witnesses.witnesses.push_back(Witness{node.getKey().getDidKey()});
        }
        return witnesses;
    }

    /// Effective parameters of the newest entry, as a starting point for the next one
    inline Parameters currentParameters(const DIDWebVHState &state) {
        REQUIRE_FALSE(state.getLogEntries().empty());
        const auto &last = state.getLogEntries().back();
        REQUIRE(last.validated_parameters.has_value());
        return *last.validated_parameters;
    }

    inline nlohmann::json currentDocument(const DIDWebVHState &state) {
        REQUIRE_FALSE(state.getLogEntries().empty());
        return state.getLogEntries().back().log_entry.state;
    }

    inline DataIntegrityProof witnessProof(const Secret &witness, const std::string &version_id) {
        EddsaJcs2022 integrity;
        auto proof = WitnessProofCollection::signProof(version_id, witness, minutesAgo(1), integrity);
        REQUIRE(proof.is_ok());
        return proof.value();
    }

} // namespace testing
