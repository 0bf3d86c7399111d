#pragma once

#include <datapod/datapod.hpp>
#include <didwebvh/common/error.hpp>
#include <didwebvh/webvh/state.hpp>
#include <didwebvh/webvh/url.hpp>
#include <didwebvh/webvh/witness_proofs.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>

namespace didwebvh::storage {

    /// Directory holding the published files of one DID (did.jsonl, did-witness.json)
    class FileStore {
      public:
        inline FileStore() : is_open_(false) {}

        /// Open or create storage at given path (directory)
        inline dp::Result<void, dp::Error> open(const std::string &path) {
            try {
                base_path_ = path;
                std::filesystem::create_directories(base_path_);
                is_open_ = true;
                return dp::Result<void, dp::Error>::ok();
            } catch (const std::exception &e) {
                is_open_ = false;
                return dp::Result<void, dp::Error>::err(dp::Error::io_error(dp::String(e.what())));
            }
        }

        inline bool isOpen() const { return is_open_; }

        inline std::filesystem::path getLogPath() const { return base_path_ / std::string(WebVHURL::LOG_FILE); }

        inline std::filesystem::path getWitnessPath() const {
            return base_path_ / std::string(WebVHURL::WITNESS_FILE);
        }

        /// Write the log as did.jsonl
        inline dp::Result<void, dp::Error> writeLogEntries(const DIDWebVHState &state) {
            return writeFile(getLogPath(), state.toJsonl());
        }

        /// Read did.jsonl into a fresh state (not yet validated)
        inline dp::Result<DIDWebVHState, dp::Error> readLogEntries() const {
            auto text = readFile(getLogPath());
            if (text.is_err()) {
                return dp::Result<DIDWebVHState, dp::Error>::err(text.error());
            }

            DIDWebVHState state;
            auto loaded = state.loadLogEntries(text.value());
            if (loaded.is_err()) {
                return dp::Result<DIDWebVHState, dp::Error>::err(loaded.error());
            }
            return dp::Result<DIDWebVHState, dp::Error>::ok(std::move(state));
        }

        inline dp::Result<void, dp::Error> writeWitnessProofs(const WitnessProofCollection &proofs) {
            return writeFile(getWitnessPath(), proofs.toJson().dump());
        }

        /// Read did-witness.json, an absent file is an empty collection
        inline dp::Result<WitnessProofCollection, dp::Error> readWitnessProofs() const {
            if (!is_open_) {
                return dp::Result<WitnessProofCollection, dp::Error>::err(
                    dp::Error::invalid_argument("Store not open"));
            }
            if (!std::filesystem::exists(getWitnessPath())) {
                return dp::Result<WitnessProofCollection, dp::Error>::ok(WitnessProofCollection{});
            }

            auto text = readFile(getWitnessPath());
            if (text.is_err()) {
                return dp::Result<WitnessProofCollection, dp::Error>::err(text.error());
            }
            return WitnessProofCollection::fromString(text.value());
        }

        /// Read the log and witness proofs, then validate
        inline dp::Result<DIDWebVHState, dp::Error> load() const {
            auto state = readLogEntries();
            if (state.is_err()) {
                return state;
            }
            auto proofs = readWitnessProofs();
            if (proofs.is_err()) {
                return dp::Result<DIDWebVHState, dp::Error>::err(proofs.error());
            }

            auto history = std::move(state.value());
            history.setWitnessProofs(proofs.value());
            auto validated = history.validate();
            if (validated.is_err()) {
                return dp::Result<DIDWebVHState, dp::Error>::err(validated.error());
            }
            return dp::Result<DIDWebVHState, dp::Error>::ok(std::move(history));
        }

      private:
        inline dp::Result<void, dp::Error> writeFile(const std::filesystem::path &path,
                                                     const std::string &content) const {
            if (!is_open_) {
                return dp::Result<void, dp::Error>::err(dp::Error::invalid_argument("Store not open"));
            }

            auto tmp_path = path;
            tmp_path += ".tmp";
            try {
                {
                    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
                    if (!out) {
                        return dp::Result<void, dp::Error>::err(
                            dp::Error::io_error(dp::String(("Cannot write " + tmp_path.string()).c_str())));
                    }
                    out << content;
                    out.flush();
                    if (!out.good()) {
                        out.close();
                        removeQuietly(tmp_path);
                        return dp::Result<void, dp::Error>::err(
                            dp::Error::io_error(dp::String(("Short write to " + tmp_path.string()).c_str())));
                    }
                }
                std::filesystem::rename(tmp_path, path);
                return dp::Result<void, dp::Error>::ok();
            } catch (const std::exception &e) {
                removeQuietly(tmp_path);
                return dp::Result<void, dp::Error>::err(dp::Error::io_error(dp::String(e.what())));
            }
        }

        /// Drop a partial write
        inline static void removeQuietly(const std::filesystem::path &path) {
            std::error_code ec;
            std::filesystem::remove(path, ec);
        }

        inline dp::Result<std::string, dp::Error> readFile(const std::filesystem::path &path) const {
            if (!is_open_) {
                return dp::Result<std::string, dp::Error>::err(dp::Error::invalid_argument("Store not open"));
            }

            std::ifstream in(path, std::ios::binary);
            if (!in) {
                return dp::Result<std::string, dp::Error>::err(
                    dp::Error::not_found(dp::String(("No such file: " + path.string()).c_str())));
            }
            std::ostringstream oss;
            oss << in.rdbuf();
            return dp::Result<std::string, dp::Error>::ok(oss.str());
        }

        std::filesystem::path base_path_;
        bool is_open_;
    };

} // namespace didwebvh::storage
