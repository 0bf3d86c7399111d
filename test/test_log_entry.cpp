#include "helpers.hpp"

using namespace didwebvh;
using testing::genesisDocument;
using testing::initialParameters;
using testing::makeSecret;
using testing::minutesAgo;

namespace {

    struct Genesis {
        Secret secret;
        LogEntry entry;
        Parameters parameters;
        MetaData metadata;
    };

    Genesis createGenesis(Timestamp time = minutesAgo(60)) {
        auto secret = makeSecret();
        EddsaJcs2022 integrity;
        DIDKeyResolver resolver;

        auto entry = LogEntry::createFirstEntry(time, genesisDocument(), initialParameters(secret), secret, integrity);
        REQUIRE(entry.is_ok());

        auto verified = entry.value().verifyLogEntry(nullptr, nullptr, nullptr, integrity, resolver);
        REQUIRE(verified.is_ok());
        auto [parameters, metadata] = verified.value();
        return Genesis{secret, entry.value(), parameters, metadata};
    }

} // namespace

TEST_SUITE("LogEntry Tests") {
    TEST_CASE("Create first entry") {
        auto genesis = createGenesis();
        const auto &entry = genesis.entry;

        auto version = LogEntry::parseVersionId(entry.version_id);
        REQUIRE(version.is_ok());
        CHECK(version.value().first == 1);

        REQUIRE(entry.parameters.scid.has_value());
        const std::string &scid = *entry.parameters.scid;
        CHECK(scid.rfind("zQm", 0) == 0);
        CHECK(entry.getDid() == "did:webvh:" + scid + ":example.com");
        CHECK(entry.parameters.method == std::optional<std::string>(Parameters::METHOD));
        CHECK(entry.toString().find(LogEntry::SCID_PLACEHOLDER) == std::string::npos);

        REQUIRE(entry.proof.has_value());
        CHECK(entry.proof->verification_method == genesis.secret.getId());
        CHECK(entry.proof->created == entry.version_time);

        CHECK(genesis.metadata.version_id == entry.version_id);
        CHECK(genesis.metadata.scid == scid);
        CHECK(genesis.metadata.created == entry.version_time);
        CHECK(genesis.metadata.updated == entry.version_time);
        CHECK_FALSE(genesis.metadata.deactivated);
    }

    TEST_CASE("Creation is deterministic") {
        auto secret = makeSecret();
        EddsaJcs2022 integrity;
        auto time = minutesAgo(60);

        auto first = LogEntry::createFirstEntry(time, genesisDocument(), initialParameters(secret), secret, integrity);
        auto second = LogEntry::createFirstEntry(time, genesisDocument(), initialParameters(secret), secret, integrity);
        REQUIRE(first.is_ok());
        REQUIRE(second.is_ok());
        CHECK(first.value().toString() == second.value().toString());

        auto later = LogEntry::createFirstEntry(time + std::chrono::seconds(1), genesisDocument(),
                                                initialParameters(secret), secret, integrity);
        REQUIRE(later.is_ok());
        CHECK(later.value().parameters.scid != first.value().parameters.scid);
    }

    TEST_CASE("First entry must be signed by the first update key") {
        auto secret = makeSecret();
        auto other = makeSecret();
        EddsaJcs2022 integrity;

        auto entry =
            LogEntry::createFirstEntry(minutesAgo(60), genesisDocument(), initialParameters(secret), other, integrity);
        REQUIRE(entry.is_err());
        CHECK(errorCode(entry.error()) == ERR_SIGNATURE);
    }

    TEST_CASE("Invalid initial parameters are refused") {
        auto secret = makeSecret();
        EddsaJcs2022 integrity;

        Parameters parameters;
        auto entry = LogEntry::createFirstEntry(minutesAgo(60), genesisDocument(), parameters, secret, integrity);
        CHECK(entry.is_err());
    }

    TEST_CASE("Verify a chain of entries") {
        auto genesis = createGenesis();
        EddsaJcs2022 integrity;
        DIDKeyResolver resolver;

        auto document = genesis.entry.state;
        document["service"] = nlohmann::json::array({{{"id", "#files"}, {"type", "LinkedDomains"}}});

        auto next = LogEntry::createNewLogEntry(genesis.entry, minutesAgo(30), document, Parameters{}, genesis.secret,
                                                integrity);
        REQUIRE(next.is_ok());
        CHECK(next.value().version_id.rfind("2-", 0) == 0);
        CHECK(next.value().parameters.toJson() == nlohmann::json::object());

        auto verified = next.value().verifyLogEntry(&genesis.entry, &genesis.parameters, &genesis.metadata, integrity,
                                                    resolver);
        REQUIRE(verified.is_ok());
        auto [parameters, metadata] = verified.value();
        CHECK(metadata.version_id == next.value().version_id);
        CHECK(metadata.created == genesis.entry.version_time);
        CHECK(metadata.updated == next.value().version_time);
        CHECK(parameters.scid == genesis.parameters.scid);
    }

    TEST_CASE("Tampering is detected") {
        auto genesis = createGenesis();
        EddsaJcs2022 integrity;
        DIDKeyResolver resolver;

        SUBCASE("Document changed after signing") {
            auto tampered = genesis.entry;
            tampered.state["service"] = nlohmann::json::array({"injected"});
            auto result = tampered.verifyLogEntry(nullptr, nullptr, nullptr, integrity, resolver);
            REQUIRE(result.is_err());
            CHECK(errorCode(result.error()) == ERR_SIGNATURE);
        }

        SUBCASE("Missing proof") {
            auto tampered = genesis.entry;
            tampered.proof.reset();
            CHECK(tampered.verifyLogEntry(nullptr, nullptr, nullptr, integrity, resolver).is_err());
        }

        SUBCASE("Re-signed with a wrong entry hash") {
            auto tampered = genesis.entry;
            tampered.state["service"] = nlohmann::json::array({"injected"});
            tampered.proof.reset();
            auto proof = integrity.sign(tampered.toJsonWithoutProof(), genesis.secret, minutesAgo(60));
            REQUIRE(proof.is_ok());
            tampered.proof = proof.value();

            auto result = tampered.verifyLogEntry(nullptr, nullptr, nullptr, integrity, resolver);
            REQUIRE(result.is_err());
            CHECK(errorCode(result.error()) == ERR_CHAIN_INTEGRITY);
        }

        SUBCASE("Signed by a key that is not an update key") {
            auto stranger = makeSecret();
            auto next = LogEntry::createNewLogEntry(genesis.entry, minutesAgo(30), genesis.entry.state, Parameters{},
                                                    stranger, integrity);
            REQUIRE(next.is_ok());
            auto result = next.value().verifyLogEntry(&genesis.entry, &genesis.parameters, &genesis.metadata,
                                                      integrity, resolver);
            REQUIRE(result.is_err());
            CHECK(errorCode(result.error()) == ERR_SIGNATURE);
        }

        SUBCASE("versionTime before the previous entry") {
            auto next = LogEntry::createNewLogEntry(genesis.entry, minutesAgo(90), genesis.entry.state, Parameters{},
                                                    genesis.secret, integrity);
            REQUIRE(next.is_ok());
            auto result = next.value().verifyLogEntry(&genesis.entry, &genesis.parameters, &genesis.metadata,
                                                      integrity, resolver);
            REQUIRE(result.is_err());
            CHECK(errorCode(result.error()) == ERR_CHAIN_INTEGRITY);
        }

        SUBCASE("Skipped version number") {
            auto next = LogEntry::createNewLogEntry(genesis.entry, minutesAgo(30), genesis.entry.state, Parameters{},
                                                    genesis.secret, integrity);
            REQUIRE(next.is_ok());
            auto skipped = LogEntry::createNewLogEntry(next.value(), minutesAgo(20), genesis.entry.state,
                                                       Parameters{}, genesis.secret, integrity);
            REQUIRE(skipped.is_ok());
            auto result = skipped.value().verifyLogEntry(&genesis.entry, &genesis.parameters, &genesis.metadata,
                                                         integrity, resolver);
            REQUIRE(result.is_err());
            CHECK(errorCode(result.error()) == ERR_CHAIN_INTEGRITY);
        }
    }

    TEST_CASE("Genesis SCID must match the recomputed SCID") {
        auto genesis = createGenesis();
        EddsaJcs2022 integrity;
        DIDKeyResolver resolver;

        auto fake_scid = hashToMultibase("some other genesis");
        REQUIRE(fake_scid.is_ok());
        const std::string fake = fake_scid.value();

        // Consistent entry hash and signature, only the SCID derivation is wrong
        LogEntry forged = genesis.entry;
        forged.proof.reset();
        forged.parameters.scid = fake;
        forged.state["id"] = "did:webvh:" + fake + ":example.com";
        forged.version_id = fake;
        auto entry_hash = forged.generateLogEntryHash();
        REQUIRE(entry_hash.is_ok());
        forged.version_id = "1-" + entry_hash.value();
        auto proof = integrity.sign(forged.toJsonWithoutProof(), genesis.secret, minutesAgo(60));
        REQUIRE(proof.is_ok());
        forged.proof = proof.value();

        auto result = forged.verifyLogEntry(nullptr, nullptr, nullptr, integrity, resolver);
        REQUIRE(result.is_err());
        CHECK(errorCode(result.error()) == ERR_SCID);
    }

    TEST_CASE("versionId format") {
        auto parsed = LogEntry::parseVersionId("12-QmHash");
        REQUIRE(parsed.is_ok());
        CHECK(parsed.value().first == 12);
        CHECK(parsed.value().second == "QmHash");

        CHECK(LogEntry::parseVersionId("QmHash").is_err());
        CHECK(LogEntry::parseVersionId("-QmHash").is_err());
        CHECK(LogEntry::parseVersionId("1-").is_err());
        CHECK(LogEntry::parseVersionId("x1-QmHash").is_err());
    }

    TEST_CASE("JSON Lines form") {
        auto genesis = createGenesis();

        auto line = genesis.entry.toString();
        CHECK(line.find('\n') == std::string::npos);

        auto parsed = LogEntry::fromString(line);
        REQUIRE(parsed.is_ok());
        CHECK(parsed.value().toString() == line);

        SUBCASE("Proof as a one element array") {
            auto j = genesis.entry.toJson();
            j["proof"] = nlohmann::json::array({j["proof"]});
            auto from_array = LogEntry::fromJson(j);
            REQUIRE(from_array.is_ok());
            CHECK(from_array.value().toString() == line);

            j["proof"].push_back(j["proof"][0]);
            CHECK(LogEntry::fromJson(j).is_err());
        }

        SUBCASE("Malformed lines") {
            CHECK(LogEntry::fromString("not json").is_err());
            CHECK(LogEntry::fromString("[]").is_err());
            CHECK(LogEntry::fromString(R"({"versionId":"1-a","versionTime":"x","parameters":{}})").is_err());
            CHECK(LogEntry::fromString(R"({"versionId":"1-a","versionTime":"x","state":{}})").is_err());
        }
    }
}

TEST_SUITE("LogEntryState Tests") {
    TEST_CASE("Status moves forward only") {
        auto genesis = createGenesis();
        LogEntryState state(genesis.entry);
        CHECK(state.version_number == 1);
        CHECK(state.getStatus() == ValidationStatus::NotValidated);

        CHECK(state.markWitnessProof().is_err());
        CHECK(state.markOk().is_err());

        REQUIRE(state.markLogEntryOnly(genesis.parameters, genesis.metadata).is_ok());
        CHECK(state.getStatus() == ValidationStatus::LogEntryOnly);
        CHECK(state.validated_parameters.has_value());
        CHECK(state.markLogEntryOnly(genesis.parameters, genesis.metadata).is_err());

        REQUIRE(state.markWitnessProof().is_ok());
        REQUIRE(state.markOk().is_ok());
        CHECK(state.getStatus() == ValidationStatus::Ok);

        auto invalid = state.markInvalid("late failure");
        REQUIRE(invalid.is_err());
        CHECK(errorCode(invalid.error()) == ERR_STATUS_TRANSITION);
        CHECK(state.getStatus() == ValidationStatus::Ok);
    }

    TEST_CASE("Invalid is final") {
        auto genesis = createGenesis();
        LogEntryState state(genesis.entry);

        REQUIRE(state.markInvalid("broken chain").is_ok());
        CHECK(state.isInvalid());
        CHECK(state.getInvalidReason() == "broken chain");

        CHECK(state.markLogEntryOnly(genesis.parameters, genesis.metadata).is_err());
        CHECK(state.markInvalid("again").is_err());
        CHECK(state.getInvalidReason() == "broken chain");
    }

    TEST_CASE("Status names") {
        CHECK(validationStatusToString(ValidationStatus::NotValidated) == "NotValidated");
        CHECK(validationStatusToString(ValidationStatus::LogEntryOnly) == "LogEntryOnly");
        CHECK(validationStatusToString(ValidationStatus::WitnessProof) == "WitnessProof");
        CHECK(validationStatusToString(ValidationStatus::Ok) == "Ok");
        CHECK(validationStatusToString(ValidationStatus::Invalid) == "Invalid");
    }
}
