/// did:webvh Demo
/// Creates a witnessed DID, updates it with key pre-rotation, publishes the files
/// and validates them again from disk

#include <didwebvh.hpp>
#include <filesystem>
#include <iostream>

using namespace didwebvh;
using namespace didwebvh::storage;

int main() {
    std::cout << "=== did:webvh Demo ===" << std::endl;
    std::cout << std::endl;

    // === Part 1: Keys ===
    std::cout << "--- Part 1: Generating keys ---" << std::endl;

    auto controller = Secret::generate();
    auto next_controller = Secret::generate();
    auto witness = Secret::generate();
    if (controller.is_err() || next_controller.is_err() || witness.is_err()) {
        std::cerr << "Failed to generate keys" << std::endl;
        return 1;
    }
    std::cout << "Update key:  " << controller.value().getPublicKeyMultibase() << std::endl;
    std::cout << "Witness:     " << witness.value().getKey().getDidKey() << std::endl;
    std::cout << std::endl;

    // === Part 2: Genesis entry ===
    std::cout << "--- Part 2: Creating the DID ---" << std::endl;

    auto next_hash = Parameters::hashUpdateKey(next_controller.value().getPublicKeyMultibase());
    if (next_hash.is_err()) {
        std::cerr << "Failed to hash next key: " << next_hash.error().message.c_str() << std::endl;
        return 1;
    }

    Parameters parameters;
    parameters.method = Parameters::METHOD;
    parameters.update_keys =
        FieldAction<std::vector<std::string>>::set({controller.value().getPublicKeyMultibase()});
    parameters.next_key_hashes = FieldAction<std::vector<std::string>>::set({next_hash.value()});

    Witnesses witnesses;
    witnesses.threshold = 1;
    witnesses.witnesses.push_back(Witness{witness.value().getKey().getDidKey()});
    parameters.witness = FieldAction<Witnesses>::set(witnesses);
    parameters.ttl = FieldAction<dp::u32>::set(3600);

    nlohmann::json document = {
        {"@context", {"https://www.w3.org/ns/did/v1"}},
        {"id", std::string(WebVHURL::PREFIX) + LogEntry::SCID_PLACEHOLDER + ":example.com"},
    };

    DIDWebVHState state;
    auto genesis = state.createLogEntry(now(), document, parameters, controller.value());
    if (genesis.is_err()) {
        std::cerr << "Failed to create DID: " << genesis.error().message.c_str() << std::endl;
        return 1;
    }
    const std::string genesis_version = genesis.value()->log_entry.version_id;
    std::cout << "DID:        " << genesis.value()->log_entry.getDid() << std::endl;
    std::cout << "SCID:       " << state.getScid() << std::endl;
    std::cout << "versionId:  " << genesis_version << std::endl;

    auto proof = WitnessProofCollection::signProof(genesis_version, witness.value(), now(), EddsaJcs2022{});
    if (proof.is_err() || state.addWitnessProof(genesis_version, proof.value()).is_err()) {
        std::cerr << "Witness failed to sign " << genesis_version << std::endl;
        return 1;
    }
    std::cout << "Witnessed by " << witness.value().getKey().getDidKey() << std::endl;
    std::cout << std::endl;

    // === Part 3: Rotate to the pre-committed key ===
    std::cout << "--- Part 3: Updating the DID ---" << std::endl;

    auto validated = state.validate();
    if (validated.is_err()) {
        std::cerr << "Genesis did not validate: " << validated.error().message.c_str() << std::endl;
        return 1;
    }
    auto current = *state.getLogEntries().back().validated_parameters;
    current.update_keys =
        FieldAction<std::vector<std::string>>::set({next_controller.value().getPublicKeyMultibase()});
    current.next_key_hashes = FieldAction<std::vector<std::string>>::unchanged();

    auto updated_document = state.getLogEntries().back().log_entry.state;
    updated_document["service"] = nlohmann::json::array(
        {{{"id", "#files"}, {"type", "relativeRef"}, {"serviceEndpoint", "https://example.com/files/"}}});

    auto update = state.createLogEntry(now(), updated_document, current, next_controller.value());
    if (update.is_err()) {
        std::cerr << "Failed to update DID: " << update.error().message.c_str() << std::endl;
        return 1;
    }
    const std::string update_version = update.value()->log_entry.version_id;
    std::cout << "versionId:  " << update_version << std::endl;
    std::cout << "Parameters: " << update.value()->log_entry.parameters.toJson().dump() << std::endl;

    auto update_proof = WitnessProofCollection::signProof(update_version, witness.value(), now(), EddsaJcs2022{});
    if (update_proof.is_err() || state.addWitnessProof(update_version, update_proof.value()).is_err()) {
        std::cerr << "Witness failed to sign " << update_version << std::endl;
        return 1;
    }
    std::cout << std::endl;

    // === Part 4: Publish and reload ===
    std::cout << "--- Part 4: Publishing ---" << std::endl;

    auto dir = std::filesystem::temp_directory_path() / "didwebvh_demo";
    FileStore store;
    if (store.open(dir.string()).is_err()) {
        std::cerr << "Failed to open " << dir << std::endl;
        return 1;
    }
    if (store.writeLogEntries(state).is_err() || store.writeWitnessProofs(state.getWitnessProofs()).is_err()) {
        std::cerr << "Failed to write DID files" << std::endl;
        return 1;
    }
    std::cout << "Wrote " << store.getLogPath() << std::endl;
    std::cout << "Wrote " << store.getWitnessPath() << std::endl;

    auto loaded = store.load();
    if (loaded.is_err()) {
        std::cerr << "Published log failed validation: " << loaded.error().message.c_str() << std::endl;
        return 1;
    }
    auto last = loaded.value().getLastEntry();
    std::cout << "Validated " << loaded.value().getLogEntries().size() << " entries" << std::endl;
    std::cout << "Metadata: " << last.value()->metadata->toJson().dump(2) << std::endl;
    std::cout << std::endl;

    std::cout << "=== Demo Complete ===" << std::endl;
    return 0;
}
