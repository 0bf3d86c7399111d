#pragma once

#include <datapod/datapod.hpp>
#include <didwebvh/common/error.hpp>
#include <didwebvh/webvh/field_action.hpp>
#include <didwebvh/webvh/witness.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace didwebvh {

    /// did:webvh DID processing parameters
    ///
    /// A LogEntry carries only the changes against the previous version's
    /// effective parameters. validate() merges such a diff onto the inherited
    /// state and returns the effective parameters for the version, including
    /// the derived active_update_keys / active_witness / pre_rotation_active.
    ///
    /// In effective parameters a tri-state field is either Set or Unchanged
    /// (meaning "not in use"), never Cleared.
    class Parameters {
      public:
        static constexpr const char *METHOD = "did:webvh:1.0";

        std::optional<std::string> method;
        std::optional<std::string> scid;
        FieldAction<std::vector<std::string>> update_keys;
        FieldAction<std::vector<std::string>> next_key_hashes;
        std::optional<bool> portable;
        FieldAction<Witnesses> witness;
        FieldAction<std::vector<std::string>> watchers;
        std::optional<bool> deactivated;
        FieldAction<dp::u32> ttl;

        // Derived during validate(), never serialized
        std::vector<std::string> active_update_keys;
        std::optional<Witnesses> active_witness;
        bool pre_rotation_active = false;

        /// Merge this diff onto previous effective parameters (nullptr for the first entry)
        dp::Result<Parameters, dp::Error> validate(const Parameters *previous) const;

        /// Minimal diff that turns old (effective) into this (desired) parameters
        /// While pre-rotation is active on old, updateKeys is always emitted
        Parameters diff(const Parameters &old) const;

        /// Wire form, only fields that are not Unchanged are written
        nlohmann::json toJson() const;

        static dp::Result<Parameters, dp::Error> fromJson(const nlohmann::json &j);

        /// Pre-rotation commitment for an update key (multihash of the multikey string)
        static dp::Result<std::string, dp::Error> hashUpdateKey(const std::string &multikey);

        inline bool isDeactivated() const { return deactivated.value_or(false); }

        inline bool isPortable() const { return portable.value_or(false); }

        /// Effective update keys, empty when not set
        inline const std::vector<std::string> &getUpdateKeys() const {
            static const std::vector<std::string> empty;
            return update_keys.isSet() ? update_keys.value() : empty;
        }

        inline const std::vector<std::string> &getNextKeyHashes() const {
            static const std::vector<std::string> empty;
            return next_key_hashes.isSet() ? next_key_hashes.value() : empty;
        }

        /// Configured witnesses, nullptr when witnessing is off
        inline const Witnesses *getWitness() const { return witness.get(); }

        inline bool operator==(const Parameters &other) const {
            return method == other.method && scid == other.scid && update_keys == other.update_keys &&
                   next_key_hashes == other.next_key_hashes && portable == other.portable &&
                   witness == other.witness && watchers == other.watchers && deactivated == other.deactivated &&
                   ttl == other.ttl;
        }

        inline bool operator!=(const Parameters &other) const { return !(*this == other); }
    };

} // namespace didwebvh
