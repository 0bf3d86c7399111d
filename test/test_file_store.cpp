#include "helpers.hpp"

#include <filesystem>

using namespace didwebvh;
using namespace didwebvh::storage;
using testing::currentDocument;
using testing::currentParameters;
using testing::genesisDocument;
using testing::initialParameters;
using testing::makeSecret;
using testing::makeWitnesses;
using testing::minutesAgo;
using testing::witnessProof;

// Test helper: cleanup storage directory
struct TestStore {
    std::filesystem::path path;
    FileStore store;

    explicit TestStore(const std::string &name)
        : path(std::filesystem::temp_directory_path() / (name + "_store")) {
        cleanup();
    }

    ~TestStore() { cleanup(); }

    void cleanup() {
        if (std::filesystem::exists(path)) {
            std::filesystem::remove_all(path);
        }
    }
};

TEST_SUITE("File Store Tests") {
    TEST_CASE("Operations need an open store") {
        FileStore store;
        CHECK_FALSE(store.isOpen());
        CHECK(store.readLogEntries().is_err());
        CHECK(store.readWitnessProofs().is_err());
        CHECK(store.writeWitnessProofs(WitnessProofCollection{}).is_err());
    }

    TEST_CASE("Write and read a log") {
        TestStore t("didwebvh_log");
        REQUIRE(t.store.open(t.path.string()).is_ok());
        CHECK(t.store.isOpen());
        CHECK(t.store.getLogPath().filename() == "did.jsonl");
        CHECK(t.store.getWitnessPath().filename() == "did-witness.json");

        auto controller = makeSecret();
        DIDWebVHState state;
        REQUIRE(state.createLogEntry(minutesAgo(60), genesisDocument(), initialParameters(controller), controller)
                    .is_ok());
        REQUIRE(state.createLogEntry(minutesAgo(50), currentDocument(state), currentParameters(state), controller)
                    .is_ok());

        REQUIRE(t.store.writeLogEntries(state).is_ok());
        CHECK(std::filesystem::exists(t.store.getLogPath()));

        auto read = t.store.readLogEntries();
        REQUIRE(read.is_ok());
        CHECK(read.value().getLogEntries().size() == 2);
        CHECK_FALSE(read.value().isValidated());
        CHECK(read.value().toJsonl() == state.toJsonl());

        // no did-witness.json yet
        auto proofs = t.store.readWitnessProofs();
        REQUIRE(proofs.is_ok());
        CHECK(proofs.value().isEmpty());

        auto loaded = t.store.load();
        REQUIRE(loaded.is_ok());
        CHECK(loaded.value().isValidated());
        CHECK(loaded.value().getLogEntries().size() == 2);
    }

    TEST_CASE("Witness proofs are persisted") {
        TestStore t("didwebvh_witness");
        REQUIRE(t.store.open(t.path.string()).is_ok());

        auto controller = makeSecret();
        auto w1 = makeSecret();
        auto parameters = initialParameters(controller);
        parameters.witness = FieldAction<Witnesses>::set(makeWitnesses(1, {w1}));

        DIDWebVHState state;
        auto created = state.createLogEntry(minutesAgo(60), genesisDocument(), parameters, controller);
        REQUIRE(created.is_ok());
        const std::string version_id = created.value()->log_entry.version_id;
        REQUIRE(t.store.writeLogEntries(state).is_ok());

        // without proofs the witnessed genesis does not validate
        CHECK(t.store.load().is_err());

        REQUIRE(state.addWitnessProof(version_id, witnessProof(w1, version_id)).is_ok());
        REQUIRE(t.store.writeWitnessProofs(state.getWitnessProofs()).is_ok());

        auto proofs = t.store.readWitnessProofs();
        REQUIRE(proofs.is_ok());
        CHECK(proofs.value().getProofCount(version_id) == 1);

        auto loaded = t.store.load();
        REQUIRE(loaded.is_ok());
        CHECK(loaded.value().getLastEntry().value()->getStatus() == ValidationStatus::Ok);
    }

    TEST_CASE("Missing or corrupt files") {
        TestStore t("didwebvh_missing");
        REQUIRE(t.store.open(t.path.string()).is_ok());

        CHECK(t.store.readLogEntries().is_err());
        CHECK(t.store.load().is_err());

        {
            std::ofstream out(t.store.getWitnessPath());
            out << "not json";
        }
        CHECK(t.store.readWitnessProofs().is_err());
    }

    TEST_CASE("Failed write keeps the published log") {
        // /dev/full fails every write with ENOSPC
        if (!std::filesystem::exists("/dev/full")) {
            return;
        }

        TestStore t("didwebvh_full");
        REQUIRE(t.store.open(t.path.string()).is_ok());

        auto controller = makeSecret();
        DIDWebVHState state;
        REQUIRE(state.createLogEntry(minutesAgo(60), genesisDocument(), initialParameters(controller), controller)
                    .is_ok());
        REQUIRE(t.store.writeLogEntries(state).is_ok());
        const std::string published = state.toJsonl();

        REQUIRE(state.createLogEntry(minutesAgo(50), currentDocument(state), currentParameters(state), controller)
                    .is_ok());

        auto tmp_path = t.store.getLogPath();
        tmp_path += ".tmp";
        std::filesystem::create_symlink("/dev/full", tmp_path);

        auto written = t.store.writeLogEntries(state);
        REQUIRE(written.is_err());
        CHECK_FALSE(std::filesystem::exists(std::filesystem::symlink_status(tmp_path)));

        auto read = t.store.readLogEntries();
        REQUIRE(read.is_ok());
        CHECK(read.value().getLogEntries().size() == 1);
        CHECK(read.value().toJsonl() == published);
    }
}
