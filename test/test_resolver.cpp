#include "helpers.hpp"

#include <map>
#include <thread>

using namespace didwebvh;
using testing::currentDocument;
using testing::currentParameters;
using testing::genesisDocument;
using testing::initialParameters;
using testing::makeSecret;
using testing::makeWitnesses;
using testing::minutesAgo;
using testing::witnessProof;

namespace {

    /// Serves files from memory, optionally slowly
    class MemoryFetcher : public Fetcher {
      public:
        std::map<std::string, std::string> files;
        std::map<std::string, std::chrono::milliseconds> delays;

        dp::Result<std::string, dp::Error> fetch(const std::string &url) const override {
            auto delay = delays.find(url);
            if (delay != delays.end()) {
                std::this_thread::sleep_for(delay->second);
            }
            auto file = files.find(url);
            if (file == files.end()) {
                return dp::Result<std::string, dp::Error>::err(
                    dp::Error::not_found(dp::String(("404 " + url).c_str())));
            }
            return dp::Result<std::string, dp::Error>::ok(file->second);
        }
    };

    const std::string LOG_URL = "https://example.com/.well-known/did.jsonl";
    const std::string WITNESS_URL = "https://example.com/.well-known/did-witness.json";

    struct Published {
        DIDWebVHState state;
        std::string did;
        std::shared_ptr<MemoryFetcher> fetcher;
    };

    /// Two versions, 60 and 40 minutes old, served at example.com
    Published publishTwoVersions() {
        auto controller = makeSecret();
        DIDWebVHState state;
        REQUIRE(state.createLogEntry(minutesAgo(60), genesisDocument(), initialParameters(controller), controller)
                    .is_ok());
        auto document = currentDocument(state);
        document["service"] = nlohmann::json::array({{{"id", "#v2"}, {"type", "LinkedDomains"}}});
        REQUIRE(state.createLogEntry(minutesAgo(40), document, currentParameters(state), controller).is_ok());

        auto fetcher = std::make_shared<MemoryFetcher>();
        fetcher->files[LOG_URL] = state.toJsonl();
        std::string did = state.getLogEntries().front().log_entry.getDid();
        return Published{state, did, fetcher};
    }

} // namespace

TEST_SUITE("Resolver Tests") {
    TEST_CASE("Resolve the latest version") {
        auto published = publishTwoVersions();
        DIDWebVHResolver resolver(published.fetcher);
        CHECK(resolver.getConfig().timeout == std::chrono::milliseconds(10000));

        auto resolved = resolver.resolve(published.did);
        REQUIRE(resolved.is_ok());

        const auto &last = published.state.getLogEntries().back();
        CHECK(resolved.value().document == last.log_entry.state);
        CHECK(resolved.value().metadata.version_id == last.log_entry.version_id);
        CHECK(resolved.value().metadata.scid == published.state.getScid());
        CHECK_FALSE(resolved.value().metadata.deactivated);
    }

    TEST_CASE("Version selection by query") {
        auto published = publishTwoVersions();
        DIDWebVHResolver resolver(published.fetcher);
        const auto &first = published.state.getLogEntries().front();

        SUBCASE("versionNumber") {
            auto resolved = resolver.resolve(published.did + "?versionNumber=1");
            REQUIRE(resolved.is_ok());
            CHECK(resolved.value().metadata.version_id == first.log_entry.version_id);
            CHECK(resolved.value().document == first.log_entry.state);
        }

        SUBCASE("versionId") {
            auto resolved = resolver.resolve(published.did + "?versionId=" + first.log_entry.version_id);
            REQUIRE(resolved.is_ok());
            CHECK(resolved.value().metadata.version_id == first.log_entry.version_id);
        }

        SUBCASE("versionTime") {
            auto resolved = resolver.resolve(published.did + "?versionTime=" + formatTimestamp(minutesAgo(50)));
            REQUIRE(resolved.is_ok());
            CHECK(resolved.value().metadata.version_id == first.log_entry.version_id);
        }

        SUBCASE("Unknown or malformed versions") {
            CHECK(resolver.resolve(published.did + "?versionNumber=7").is_err());
            CHECK(resolver.resolve(published.did + "?versionNumber=abc").is_err());
            CHECK(resolver.resolve(published.did + "?versionId=1-QmNope").is_err());
            CHECK(resolver.resolve(published.did + "?versionTime=yesterday").is_err());
        }
    }

    TEST_CASE("Resolution failures") {
        auto published = publishTwoVersions();

        SUBCASE("Missing log") {
            published.fetcher->files.clear();
            DIDWebVHResolver resolver(published.fetcher);
            auto resolved = resolver.resolve(published.did);
            REQUIRE(resolved.is_err());
            CHECK(errorCode(resolved.error()) == ERR_TRANSPORT);
        }

        SUBCASE("Slow log times out") {
            published.fetcher->delays[LOG_URL] = std::chrono::milliseconds(500);
            DIDWebVHResolver resolver(published.fetcher, ResolverConfig{std::chrono::milliseconds(50)});
            auto resolved = resolver.resolve(published.did);
            REQUIRE(resolved.is_err());
            CHECK(errorCode(resolved.error()) == ERR_TIMEOUT);
        }

        SUBCASE("SCID of the log does not match the DID") {
            DIDWebVHResolver resolver(published.fetcher);
            auto resolved = resolver.resolve("did:webvh:zQmSomeOtherScid:example.com");
            REQUIRE(resolved.is_err());
            CHECK(errorCode(resolved.error()) == ERR_SCID);
        }

        SUBCASE("Not a did:webvh DID") {
            DIDWebVHResolver resolver(published.fetcher);
            auto resolved = resolver.resolve("did:web:example.com");
            REQUIRE(resolved.is_err());
            CHECK(errorCode(resolved.error()) == ERR_UNSUPPORTED_METHOD);
        }

        SUBCASE("whois is not resolved") {
            DIDWebVHResolver resolver(published.fetcher);
            CHECK(resolver.resolve(published.did + ":whois").is_err());
        }
    }

    TEST_CASE("Witness proofs are optional for unwitnessed DIDs") {
        auto published = publishTwoVersions();

        SUBCASE("Slow witness file") {
            published.fetcher->delays[WITNESS_URL] = std::chrono::milliseconds(500);
            DIDWebVHResolver resolver(published.fetcher, ResolverConfig{std::chrono::milliseconds(200)});
            CHECK(resolver.resolve(published.did).is_ok());
        }

        SUBCASE("Corrupt witness file") {
            published.fetcher->files[WITNESS_URL] = "not json";
            DIDWebVHResolver resolver(published.fetcher);
            CHECK(resolver.resolve(published.did).is_ok());
        }
    }

    TEST_CASE("Witnessed DID needs its proofs") {
        auto controller = makeSecret();
        auto w1 = makeSecret();
        auto parameters = initialParameters(controller);
        parameters.witness = FieldAction<Witnesses>::set(makeWitnesses(1, {w1}));

        DIDWebVHState state;
        auto created = state.createLogEntry(minutesAgo(60), genesisDocument(), parameters, controller);
        REQUIRE(created.is_ok());
        const std::string version_id = created.value()->log_entry.version_id;
        const std::string did = created.value()->log_entry.getDid();

        auto fetcher = std::make_shared<MemoryFetcher>();
        fetcher->files[LOG_URL] = state.toJsonl();
        DIDWebVHResolver resolver(fetcher);

        auto unwitnessed = resolver.resolve(did);
        REQUIRE(unwitnessed.is_err());
        CHECK(errorCode(unwitnessed.error()) == ERR_WITNESS_THRESHOLD);

        WitnessProofCollection proofs;
        REQUIRE(proofs.addProof(version_id, witnessProof(w1, version_id)).is_ok());
        fetcher->files[WITNESS_URL] = proofs.toJson().dump();

        auto witnessed = resolver.resolve(did);
        REQUIRE(witnessed.is_ok());
        REQUIRE(witnessed.value().metadata.witness.has_value());
        CHECK(witnessed.value().metadata.witness->threshold == 1);
    }
}
