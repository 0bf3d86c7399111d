/// Validates a published did:webvh DID
/// Usage: validate_log <directory containing did.jsonl [and did-witness.json]> [versionNumber]

#include <didwebvh.hpp>
#include <iostream>
#include <string>

using namespace didwebvh;
using namespace didwebvh::storage;

int main(int argc, char **argv) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <directory> [versionNumber]" << std::endl;
        return 1;
    }

    FileStore store;
    auto opened = store.open(argv[1]);
    if (opened.is_err()) {
        std::cerr << "Failed to open " << argv[1] << ": " << opened.error().message.c_str() << std::endl;
        return 1;
    }

    auto state = store.load();
    if (state.is_err()) {
        std::cerr << "Invalid DID log: " << state.error().message.c_str() << std::endl;
        return 1;
    }
    const auto &history = state.value();

    std::cout << "SCID:        " << history.getScid() << std::endl;
    std::cout << "Entries:     " << history.getLogEntries().size() << std::endl;
    std::cout << "Deactivated: " << (history.isDeactivated() ? "yes" : "no") << std::endl;
    for (const auto &entry : history.getLogEntries()) {
        std::cout << "  " << entry.log_entry.version_id << "  " << entry.log_entry.version_time << std::endl;
    }
    std::cout << std::endl;

    auto selected = history.getLastEntry();
    if (argc > 2) {
        try {
            selected = history.getLogEntryByVersionNumber(static_cast<dp::u32>(std::stoul(argv[2])));
        } catch (const std::exception &e) {
            std::cerr << "Invalid versionNumber '" << argv[2] << "': " << e.what() << std::endl;
            return 1;
        }
    }
    if (selected.is_err()) {
        std::cerr << selected.error().message.c_str() << std::endl;
        return 1;
    }

    std::cout << selected.value()->log_entry.state.dump(2) << std::endl;
    return 0;
}
