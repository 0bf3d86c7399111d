#include "helpers.hpp"

using namespace didwebvh;
using testing::initialParameters;
using testing::makeSecret;
using testing::makeWitnesses;

namespace {

    using StringList = FieldAction<std::vector<std::string>>;

    Parameters genesisParameters(const Secret &secret) {
        auto parameters = initialParameters(secret);
        parameters.scid = "QmTestScid";
        return parameters;
    }

    Parameters effectiveGenesis(const Parameters &parameters) {
        auto effective = parameters.validate(nullptr);
        REQUIRE(effective.is_ok());
        return effective.value();
    }

} // namespace

TEST_SUITE("Parameters Tests") {
    TEST_CASE("First entry requirements") {
        auto secret = makeSecret();

        SUBCASE("Valid genesis parameters") {
            auto effective = genesisParameters(secret).validate(nullptr);
            REQUIRE(effective.is_ok());
            const auto &p = effective.value();
            CHECK(p.method == std::optional<std::string>(Parameters::METHOD));
            CHECK(p.scid == std::optional<std::string>("QmTestScid"));
            CHECK(p.active_update_keys == std::vector<std::string>{secret.getPublicKeyMultibase()});
            CHECK_FALSE(p.isPortable());
            CHECK_FALSE(p.isDeactivated());
            CHECK_FALSE(p.pre_rotation_active);
            CHECK_FALSE(p.active_witness.has_value());
        }

        SUBCASE("Missing method") {
            auto p = genesisParameters(secret);
            p.method.reset();
            CHECK(p.validate(nullptr).is_err());
        }

        SUBCASE("Unknown method version") {
            auto p = genesisParameters(secret);
            p.method = "did:webvh:0.5";
            auto result = p.validate(nullptr);
            REQUIRE(result.is_err());
            CHECK(errorCode(result.error()) == ERR_PARAMETERS);
        }

        SUBCASE("Missing scid") {
            auto p = genesisParameters(secret);
            p.scid.reset();
            CHECK(p.validate(nullptr).is_err());
        }

        SUBCASE("Missing or empty updateKeys") {
            auto p = genesisParameters(secret);
            p.update_keys = StringList::unchanged();
            CHECK(p.validate(nullptr).is_err());
            p.update_keys = StringList::set({});
            CHECK(p.validate(nullptr).is_err());
            p.update_keys = StringList::cleared();
            CHECK(p.validate(nullptr).is_err());
        }

        SUBCASE("updateKeys must be multikeys") {
            auto p = genesisParameters(secret);
            p.update_keys = StringList::set({"not-a-key"});
            CHECK(p.validate(nullptr).is_err());
        }

        SUBCASE("Genesis witness is active immediately") {
            std::vector<Secret> nodes{makeSecret(), makeSecret()};
            auto p = genesisParameters(secret);
            p.witness = FieldAction<Witnesses>::set(makeWitnesses(1, nodes));
            auto effective = p.validate(nullptr);
            REQUIRE(effective.is_ok());
            REQUIRE(effective.value().active_witness.has_value());
            CHECK(effective.value().active_witness->threshold == 1);
        }

        SUBCASE("Invalid witness configuration") {
            std::vector<Secret> nodes{makeSecret()};
            auto p = genesisParameters(secret);
            p.witness = FieldAction<Witnesses>::set(makeWitnesses(2, nodes));
            CHECK(p.validate(nullptr).is_err());

            p.witness = FieldAction<Witnesses>::set(makeWitnesses(0, nodes));
            CHECK(p.validate(nullptr).is_err());

            Witnesses bad;
            bad.threshold = 1;
            bad.witnesses.push_back(Witness{"did:web:example.com"});
            p.witness = FieldAction<Witnesses>::set(bad);
            CHECK(p.validate(nullptr).is_err());

            Witnesses duplicate = makeWitnesses(1, nodes);
            duplicate.witnesses.push_back(duplicate.witnesses.front());
            p.witness = FieldAction<Witnesses>::set(duplicate);
            CHECK(p.validate(nullptr).is_err());
        }

        SUBCASE("Empty witness object disables witnessing") {
            auto p = genesisParameters(secret);
            p.witness = FieldAction<Witnesses>::set(Witnesses{});
            auto effective = p.validate(nullptr);
            REQUIRE(effective.is_ok());
            CHECK_FALSE(effective.value().active_witness.has_value());
            CHECK(effective.value().getWitness() == nullptr);
        }
    }

    TEST_CASE("Inheritance across entries") {
        auto secret = makeSecret();
        auto genesis = genesisParameters(secret);
        genesis.watchers = StringList::set({"https://watcher.example.com"});
        genesis.ttl = FieldAction<dp::u32>::set(3600);
        auto previous = effectiveGenesis(genesis);

        SUBCASE("Empty diff inherits everything") {
            Parameters diff;
            auto effective = diff.validate(&previous);
            REQUIRE(effective.is_ok());
            const auto &p = effective.value();
            CHECK(p.scid == previous.scid);
            CHECK(p.getUpdateKeys() == previous.getUpdateKeys());
            CHECK(p.active_update_keys == previous.getUpdateKeys());
            CHECK(p.watchers == previous.watchers);
            CHECK(p.ttl.isSet());
            CHECK(p.ttl.value() == 3600);
        }

        SUBCASE("Null clears a field") {
            Parameters diff;
            diff.watchers = StringList::cleared();
            diff.ttl = FieldAction<dp::u32>::cleared();
            auto effective = diff.validate(&previous);
            REQUIRE(effective.is_ok());
            CHECK_FALSE(effective.value().watchers.isSet());
            CHECK_FALSE(effective.value().ttl.isSet());
        }

        SUBCASE("New updateKeys apply from the next entry") {
            auto next = makeSecret();
            Parameters diff;
            diff.update_keys = StringList::set({next.getPublicKeyMultibase()});
            auto effective = diff.validate(&previous);
            REQUIRE(effective.is_ok());
            // this entry is still authorized by the old key
            CHECK(effective.value().active_update_keys == previous.getUpdateKeys());
            CHECK(effective.value().getUpdateKeys() == std::vector<std::string>{next.getPublicKeyMultibase()});
        }

        SUBCASE("scid can not change") {
            Parameters diff;
            diff.scid = "QmOtherScid";
            CHECK(diff.validate(&previous).is_err());
        }

        SUBCASE("Clearing updateKeys requires deactivation") {
            Parameters diff;
            diff.update_keys = StringList::cleared();
            CHECK(diff.validate(&previous).is_err());

            diff.deactivated = true;
            auto effective = diff.validate(&previous);
            REQUIRE(effective.is_ok());
            CHECK(effective.value().isDeactivated());
            CHECK(effective.value().getUpdateKeys().empty());
        }

        SUBCASE("Nothing follows deactivation") {
            Parameters deactivate;
            deactivate.deactivated = true;
            auto deactivated = deactivate.validate(&previous);
            REQUIRE(deactivated.is_ok());

            Parameters diff;
            auto result = diff.validate(&deactivated.value());
            REQUIRE(result.is_err());
            CHECK(errorCode(result.error()) == ERR_DEACTIVATED);
        }
    }

    TEST_CASE("portable is immutable once false") {
        auto secret = makeSecret();

        auto not_portable = effectiveGenesis(genesisParameters(secret));
        Parameters enable;
        enable.portable = true;
        CHECK(enable.validate(&not_portable).is_err());

        auto portable_genesis = genesisParameters(secret);
        portable_genesis.portable = true;
        auto portable = effectiveGenesis(portable_genesis);
        CHECK(portable.isPortable());

        Parameters disable;
        disable.portable = false;
        auto disabled = disable.validate(&portable);
        REQUIRE(disabled.is_ok());
        CHECK_FALSE(disabled.value().isPortable());
        CHECK(enable.validate(&disabled.value()).is_err());
    }

    TEST_CASE("Pre-rotation") {
        auto secret = makeSecret();
        auto next = makeSecret();
        auto stranger = makeSecret();

        auto next_hash = Parameters::hashUpdateKey(next.getPublicKeyMultibase());
        REQUIRE(next_hash.is_ok());

        auto genesis = genesisParameters(secret);
        genesis.next_key_hashes = StringList::set({next_hash.value()});
        auto previous = effectiveGenesis(genesis);
        CHECK(previous.pre_rotation_active);

        SUBCASE("Committed key is accepted and authorizes the entry") {
            Parameters diff;
            diff.update_keys = StringList::set({next.getPublicKeyMultibase()});
            auto effective = diff.validate(&previous);
            REQUIRE(effective.is_ok());
            CHECK(effective.value().active_update_keys == std::vector<std::string>{next.getPublicKeyMultibase()});
            // commitments are inherited
            CHECK(effective.value().pre_rotation_active);
        }

        SUBCASE("Uncommitted key is rejected") {
            Parameters diff;
            diff.update_keys = StringList::set({stranger.getPublicKeyMultibase()});
            auto result = diff.validate(&previous);
            REQUIRE(result.is_err());
            CHECK(errorCode(result.error()) == ERR_PARAMETERS);
        }

        SUBCASE("updateKeys are required") {
            Parameters diff;
            CHECK(diff.validate(&previous).is_err());
        }

        SUBCASE("Clearing nextKeyHashes ends pre-rotation") {
            Parameters diff;
            diff.update_keys = StringList::set({next.getPublicKeyMultibase()});
            diff.next_key_hashes = StringList::cleared();
            auto effective = diff.validate(&previous);
            REQUIRE(effective.is_ok());
            CHECK_FALSE(effective.value().pre_rotation_active);
        }
    }

    TEST_CASE("Witness changes apply from the next entry") {
        auto secret = makeSecret();
        std::vector<Secret> first_nodes{makeSecret()};
        std::vector<Secret> second_nodes{makeSecret(), makeSecret()};

        auto genesis = genesisParameters(secret);
        genesis.witness = FieldAction<Witnesses>::set(makeWitnesses(1, first_nodes));
        auto previous = effectiveGenesis(genesis);

        Parameters diff;
        diff.witness = FieldAction<Witnesses>::set(makeWitnesses(2, second_nodes));
        auto effective = diff.validate(&previous);
        REQUIRE(effective.is_ok());
        REQUIRE(effective.value().active_witness.has_value());
        CHECK(effective.value().active_witness->threshold == 1);
        REQUIRE(effective.value().getWitness() != nullptr);
        CHECK(effective.value().getWitness()->threshold == 2);

        Parameters disable;
        disable.witness = FieldAction<Witnesses>::cleared();
        auto disabled = disable.validate(&effective.value());
        REQUIRE(disabled.is_ok());
        // the disabling entry is still witnessed by the previous configuration
        REQUIRE(disabled.value().active_witness.has_value());
        CHECK(disabled.value().active_witness->threshold == 2);
        CHECK(disabled.value().getWitness() == nullptr);

        Parameters after;
        auto unwitnessed = after.validate(&disabled.value());
        REQUIRE(unwitnessed.is_ok());
        CHECK_FALSE(unwitnessed.value().active_witness.has_value());
    }

    TEST_CASE("Diff between effective parameters") {
        auto secret = makeSecret();
        auto previous = effectiveGenesis(genesisParameters(secret));

        SUBCASE("Identical parameters give an empty diff") {
            auto diff = previous.diff(previous);
            CHECK(diff.toJson() == nlohmann::json::object());
        }

        SUBCASE("Changed and new fields are set") {
            auto desired = previous;
            auto next = makeSecret();
            desired.update_keys = StringList::set({next.getPublicKeyMultibase()});
            desired.ttl = FieldAction<dp::u32>::set(300);
            auto diff = desired.diff(previous);
            auto j = diff.toJson();
            CHECK(j["updateKeys"] == nlohmann::json::array({next.getPublicKeyMultibase()}));
            CHECK(j["ttl"] == 300);
            CHECK_FALSE(j.contains("method"));
            CHECK_FALSE(j.contains("scid"));
            CHECK_FALSE(j.contains("watchers"));
        }

        SUBCASE("Removed fields are cleared") {
            auto with_watchers = previous;
            with_watchers.watchers = StringList::set({"https://watcher.example.com"});
            auto desired = previous;
            desired.watchers = StringList::unchanged();
            auto diff = desired.diff(with_watchers);
            CHECK(diff.watchers.isCleared());
            CHECK(diff.toJson()["watchers"].is_null());
        }

        SUBCASE("Diff merges back to the desired state") {
            auto desired = previous;
            desired.watchers = StringList::set({"https://watcher.example.com"});
            desired.portable = false;
            auto diff = desired.diff(previous);
            auto merged = diff.validate(&previous);
            REQUIRE(merged.is_ok());
            CHECK(merged.value().watchers == desired.watchers);
            CHECK(merged.value().getUpdateKeys() == desired.getUpdateKeys());
        }

        SUBCASE("Deactivation is emitted") {
            auto desired = previous;
            desired.deactivated = true;
            auto diff = desired.diff(previous);
            CHECK(diff.toJson()["deactivated"] == true);
        }

        SUBCASE("updateKeys are always written while pre-rotation is active") {
            auto next = makeSecret();
            auto hash = Parameters::hashUpdateKey(next.getPublicKeyMultibase());
            REQUIRE(hash.is_ok());
            auto genesis = genesisParameters(secret);
            genesis.next_key_hashes = StringList::set({hash.value()});
            auto rotating = effectiveGenesis(genesis);

            auto desired = rotating;
            desired.update_keys = StringList::set({next.getPublicKeyMultibase()});
            auto diff = desired.diff(rotating);
            REQUIRE(diff.update_keys.isSet());
            CHECK(diff.update_keys.value() == std::vector<std::string>{next.getPublicKeyMultibase()});
            CHECK(diff.validate(&rotating).is_ok());
        }
    }

    TEST_CASE("JSON tri-state") {
        auto j = nlohmann::json::parse(R"({
            "updateKeys": ["z6MkA"],
            "nextKeyHashes": null,
            "portable": true,
            "witness": {},
            "ttl": 60
        })");
        auto parsed = Parameters::fromJson(j);
        REQUIRE(parsed.is_ok());

        const auto &p = parsed.value();
        CHECK(p.update_keys.isSet());
        CHECK(p.next_key_hashes.isCleared());
        CHECK(p.watchers.isUnchanged());
        CHECK(p.portable == std::optional<bool>(true));
        CHECK_FALSE(p.deactivated.has_value());
        REQUIRE(p.witness.isSet());
        CHECK(p.witness.value().isDisabled());
        CHECK(p.ttl.isSet());

        // written back exactly as read, entry hashes depend on it
        CHECK(p.toJson() == j);

        CHECK(Parameters::fromJson(nlohmann::json::parse(R"({"updateKeys": "z6MkA"})")).is_err());
        CHECK(Parameters::fromJson(nlohmann::json::parse(R"({"portable": "yes"})")).is_err());
        CHECK(Parameters::fromJson(nlohmann::json::parse(R"({"ttl": -5})")).is_err());
        CHECK(Parameters::fromJson(nlohmann::json::array()).is_err());
    }
}
