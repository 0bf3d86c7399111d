#include <algorithm>
#include <didwebvh/crypto/key.hpp>
#include <didwebvh/crypto/multibase.hpp>
#include <didwebvh/webvh/parameters.hpp>

namespace didwebvh {

    namespace {

        /// Effective form of a list field: non-empty Set, otherwise not in use
        FieldAction<std::vector<std::string>> normalizeList(const FieldAction<std::vector<std::string>> &field) {
            if (field.isSet() && !field.value().empty()) {
                return field;
            }
            return FieldAction<std::vector<std::string>>::unchanged();
        }

        /// Tri-state merge of an optional field onto its inherited effective value
        template <typename T> FieldAction<T> mergeField(const FieldAction<T> &diff, const FieldAction<T> &inherited) {
            if (diff.isSet()) {
                return diff;
            }
            if (diff.isCleared()) {
                return FieldAction<T>::unchanged();
            }
            return inherited;
        }

        /// Tri-state diff of one field, desired and old are both in effective form
        template <typename T> FieldAction<T> diffField(const FieldAction<T> &desired, const FieldAction<T> &old) {
            const T *want = desired.get();
            const T *have = old.get();
            if (want == nullptr && have == nullptr) {
                return FieldAction<T>::unchanged();
            }
            if (want == nullptr) {
                return FieldAction<T>::cleared();
            }
            if (have != nullptr && *want == *have) {
                return FieldAction<T>::unchanged();
            }
            return FieldAction<T>::set(*want);
        }

        /// witness: {} reads as Set(disabled), which means the same as null
        FieldAction<Witnesses> normalizeWitness(const FieldAction<Witnesses> &field) {
            if (field.isSet() && field.value().isDisabled()) {
                return FieldAction<Witnesses>::cleared();
            }
            return field;
        }

        dp::Result<void, dp::Error> checkUpdateKeys(const std::vector<std::string> &keys) {
            for (const auto &key : keys) {
                auto decoded = Key::decodeMultikey(key);
                if (decoded.is_err()) {
                    return dp::Result<void, dp::Error>::err(
                        parameters_error("updateKeys entry is not an Ed25519 multikey: '" + key + "'"));
                }
            }
            return dp::Result<void, dp::Error>::ok();
        }

        dp::Result<FieldAction<std::vector<std::string>>, dp::Error> readStringList(const nlohmann::json &j,
                                                                                   const char *name) {
            using Field = FieldAction<std::vector<std::string>>;
            auto it = j.find(name);
            if (it == j.end()) {
                return dp::Result<Field, dp::Error>::ok(Field::unchanged());
            }
            if (it->is_null()) {
                return dp::Result<Field, dp::Error>::ok(Field::cleared());
            }
            if (!it->is_array()) {
                return dp::Result<Field, dp::Error>::err(
                    deserialization_failed(std::string("parameters.") + name + " must be an array or null"));
            }
            std::vector<std::string> values;
            for (const auto &item : *it) {
                if (!item.is_string()) {
                    return dp::Result<Field, dp::Error>::err(
                        deserialization_failed(std::string("parameters.") + name + " must contain strings"));
                }
                values.push_back(item.get<std::string>());
            }
            return dp::Result<Field, dp::Error>::ok(Field::set(values));
        }

        dp::Result<std::optional<bool>, dp::Error> readBool(const nlohmann::json &j, const char *name) {
            auto it = j.find(name);
            if (it == j.end() || it->is_null()) {
                return dp::Result<std::optional<bool>, dp::Error>::ok(std::nullopt);
            }
            if (!it->is_boolean()) {
                return dp::Result<std::optional<bool>, dp::Error>::err(
                    deserialization_failed(std::string("parameters.") + name + " must be a boolean"));
            }
            return dp::Result<std::optional<bool>, dp::Error>::ok(it->get<bool>());
        }

        dp::Result<std::optional<std::string>, dp::Error> readString(const nlohmann::json &j, const char *name) {
            auto it = j.find(name);
            if (it == j.end() || it->is_null()) {
                return dp::Result<std::optional<std::string>, dp::Error>::ok(std::nullopt);
            }
            if (!it->is_string()) {
                return dp::Result<std::optional<std::string>, dp::Error>::err(
                    deserialization_failed(std::string("parameters.") + name + " must be a string"));
            }
            return dp::Result<std::optional<std::string>, dp::Error>::ok(it->get<std::string>());
        }

    } // namespace

    dp::Result<std::string, dp::Error> Parameters::hashUpdateKey(const std::string &multikey) {
        return hashToMultibase(multikey);
    }

    dp::Result<Parameters, dp::Error> Parameters::validate(const Parameters *previous) const {
        Parameters effective;

        if (previous == nullptr) {
            // First LogEntry
            if (!method) {
                return dp::Result<Parameters, dp::Error>::err(
                    parameters_error("method must be set in the first LogEntry"));
            }
            if (*method != METHOD) {
                return dp::Result<Parameters, dp::Error>::err(
                    parameters_error("Unsupported method '" + *method + "', expected '" + METHOD + "'"));
            }
            effective.method = method;

            if (!scid || scid->empty()) {
                return dp::Result<Parameters, dp::Error>::err(
                    parameters_error("scid must be set in the first LogEntry"));
            }
            effective.scid = scid;

            if (!update_keys.isSet() || update_keys.value().empty()) {
                return dp::Result<Parameters, dp::Error>::err(
                    parameters_error("updateKeys must be set and non-empty in the first LogEntry"));
            }
            auto keys_ok = checkUpdateKeys(update_keys.value());
            if (keys_ok.is_err()) {
                return dp::Result<Parameters, dp::Error>::err(keys_ok.error());
            }
            effective.update_keys = update_keys;
            effective.active_update_keys = update_keys.value();

            effective.next_key_hashes = normalizeList(next_key_hashes);
            effective.pre_rotation_active = effective.next_key_hashes.isSet();

            effective.portable = portable.value_or(false);

            auto witness_diff = normalizeWitness(witness);
            if (witness_diff.isSet()) {
                auto witness_ok = witness_diff.value().validate();
                if (witness_ok.is_err()) {
                    return dp::Result<Parameters, dp::Error>::err(witness_ok.error());
                }
                effective.witness = witness_diff;
                effective.active_witness = witness_diff.value();
            }

            effective.watchers = normalizeList(watchers);
            effective.ttl = mergeField(ttl, FieldAction<dp::u32>::unchanged());
            effective.deactivated = deactivated.value_or(false);

            return dp::Result<Parameters, dp::Error>::ok(effective);
        }

        if (previous->isDeactivated()) {
            return dp::Result<Parameters, dp::Error>::err(
                deactivated_error("DID was deactivated, no further LogEntries are accepted"));
        }

        if (method && *method != METHOD) {
            return dp::Result<Parameters, dp::Error>::err(
                parameters_error("Unsupported method '" + *method + "', expected '" + METHOD + "'"));
        }
        effective.method = method ? method : previous->method;

        if (scid && scid != previous->scid) {
            return dp::Result<Parameters, dp::Error>::err(
                parameters_error("scid can not change after the first LogEntry"));
        }
        effective.scid = previous->scid;

        // portable is immutable once false
        if (portable && *portable && !previous->isPortable()) {
            return dp::Result<Parameters, dp::Error>::err(
                parameters_error("portable can not be enabled after it has been disabled"));
        }
        effective.portable = portable ? *portable : previous->isPortable();

        effective.deactivated = deactivated.value_or(false);

        if (previous->pre_rotation_active) {
            if (!update_keys.isSet() || update_keys.value().empty()) {
                return dp::Result<Parameters, dp::Error>::err(
                    parameters_error("updateKeys must be provided while pre-rotation is active"));
            }
            const auto &commitments = previous->getNextKeyHashes();
            for (const auto &key : update_keys.value()) {
                auto hashed = hashUpdateKey(key);
                if (hashed.is_err()) {
                    return dp::Result<Parameters, dp::Error>::err(hashed.error());
                }
                if (std::find(commitments.begin(), commitments.end(), hashed.value()) == commitments.end()) {
                    return dp::Result<Parameters, dp::Error>::err(parameters_error(
                        "updateKey '" + key + "' does not match any nextKeyHashes of the previous LogEntry"));
                }
            }
            effective.active_update_keys = update_keys.value();
        } else {
            effective.active_update_keys = previous->getUpdateKeys();
        }

        if (effective.active_update_keys.empty()) {
            return dp::Result<Parameters, dp::Error>::err(
                parameters_error("No active updateKeys to authorize this LogEntry"));
        }

        if (update_keys.isSet()) {
            auto keys_ok = checkUpdateKeys(update_keys.value());
            if (keys_ok.is_err()) {
                return dp::Result<Parameters, dp::Error>::err(keys_ok.error());
            }
            effective.update_keys = update_keys;
        } else if (update_keys.isCleared()) {
            effective.update_keys = FieldAction<std::vector<std::string>>::set({});
        } else {
            effective.update_keys = previous->update_keys;
        }

        if (effective.getUpdateKeys().empty() && !effective.isDeactivated()) {
            return dp::Result<Parameters, dp::Error>::err(
                parameters_error("updateKeys can only be empty when the DID is deactivated"));
        }

        if (next_key_hashes.isUnchanged()) {
            effective.next_key_hashes = previous->next_key_hashes;
        } else {
            effective.next_key_hashes = normalizeList(next_key_hashes);
        }
        effective.pre_rotation_active = effective.next_key_hashes.isSet();

        auto witness_diff = normalizeWitness(witness);
        if (witness_diff.isSet()) {
            auto witness_ok = witness_diff.value().validate();
            if (witness_ok.is_err()) {
                return dp::Result<Parameters, dp::Error>::err(witness_ok.error());
            }
        }
        effective.witness = mergeField(witness_diff, previous->witness);
        // Witness changes take effect from the next version
        if (previous->witness.isSet()) {
            effective.active_witness = previous->witness.value();
        }

        if (watchers.isUnchanged()) {
            effective.watchers = previous->watchers;
        } else {
            effective.watchers = normalizeList(watchers);
        }
        effective.ttl = mergeField(ttl, previous->ttl);

        return dp::Result<Parameters, dp::Error>::ok(effective);
    }

    Parameters Parameters::diff(const Parameters &old) const {
        Parameters result;

        if (method && method != old.method) {
            result.method = method;
        }

        if (old.pre_rotation_active) {
            result.update_keys = FieldAction<std::vector<std::string>>::set(getUpdateKeys());
        } else if (update_keys.isSet() && update_keys.value() != old.getUpdateKeys()) {
            result.update_keys = update_keys;
        }

        result.next_key_hashes = diffField(normalizeList(next_key_hashes), old.next_key_hashes);

        if (portable && *portable != old.isPortable()) {
            result.portable = portable;
        }

        auto desired_witness = normalizeWitness(witness);
        result.witness =
            diffField(desired_witness.isSet() ? desired_witness : FieldAction<Witnesses>::unchanged(), old.witness);
        result.watchers = diffField(normalizeList(watchers), old.watchers);
        result.ttl = diffField(ttl.isSet() ? ttl : FieldAction<dp::u32>::unchanged(), old.ttl);

        if (isDeactivated() && !old.isDeactivated()) {
            result.deactivated = true;
        }

        return result;
    }

    nlohmann::json Parameters::toJson() const {
        nlohmann::json j = nlohmann::json::object();

        auto writeList = [&j](const char *name, const FieldAction<std::vector<std::string>> &field) {
            if (field.isSet()) {
                j[name] = field.value();
            } else if (field.isCleared()) {
                j[name] = nullptr;
            }
        };

        if (method) {
            j["method"] = *method;
        }
        if (scid) {
            j["scid"] = *scid;
        }
        writeList("updateKeys", update_keys);
        writeList("nextKeyHashes", next_key_hashes);
        if (portable) {
            j["portable"] = *portable;
        }
        if (witness.isSet()) {
            j["witness"] = witness.value().toJson();
        } else if (witness.isCleared()) {
            j["witness"] = nullptr;
        }
        writeList("watchers", watchers);
        if (deactivated) {
            j["deactivated"] = *deactivated;
        }
        if (ttl.isSet()) {
            j["ttl"] = ttl.value();
        } else if (ttl.isCleared()) {
            j["ttl"] = nullptr;
        }

        return j;
    }

    dp::Result<Parameters, dp::Error> Parameters::fromJson(const nlohmann::json &j) {
        if (!j.is_object()) {
            return dp::Result<Parameters, dp::Error>::err(deserialization_failed("parameters must be an object"));
        }

        Parameters params;

        auto method = readString(j, "method");
        if (method.is_err()) {
            return dp::Result<Parameters, dp::Error>::err(method.error());
        }
        params.method = method.value();

        auto scid = readString(j, "scid");
        if (scid.is_err()) {
            return dp::Result<Parameters, dp::Error>::err(scid.error());
        }
        params.scid = scid.value();

        auto update_keys = readStringList(j, "updateKeys");
        if (update_keys.is_err()) {
            return dp::Result<Parameters, dp::Error>::err(update_keys.error());
        }
        params.update_keys = update_keys.value();

        auto next_key_hashes = readStringList(j, "nextKeyHashes");
        if (next_key_hashes.is_err()) {
            return dp::Result<Parameters, dp::Error>::err(next_key_hashes.error());
        }
        params.next_key_hashes = next_key_hashes.value();

        auto watchers = readStringList(j, "watchers");
        if (watchers.is_err()) {
            return dp::Result<Parameters, dp::Error>::err(watchers.error());
        }
        params.watchers = watchers.value();

        auto portable = readBool(j, "portable");
        if (portable.is_err()) {
            return dp::Result<Parameters, dp::Error>::err(portable.error());
        }
        params.portable = portable.value();

        auto deactivated = readBool(j, "deactivated");
        if (deactivated.is_err()) {
            return dp::Result<Parameters, dp::Error>::err(deactivated.error());
        }
        params.deactivated = deactivated.value();

        auto witness = j.find("witness");
        if (witness != j.end()) {
            if (witness->is_null()) {
                params.witness = FieldAction<Witnesses>::cleared();
            } else {
                auto parsed = Witnesses::fromJson(*witness);
                if (parsed.is_err()) {
                    return dp::Result<Parameters, dp::Error>::err(parsed.error());
                }
                params.witness = FieldAction<Witnesses>::set(parsed.value());
            }
        }

        auto ttl = j.find("ttl");
        if (ttl != j.end()) {
            if (ttl->is_null()) {
                params.ttl = FieldAction<dp::u32>::cleared();
            } else if (ttl->is_number_unsigned()) {
                params.ttl = FieldAction<dp::u32>::set(ttl->get<dp::u32>());
            } else {
                return dp::Result<Parameters, dp::Error>::err(
                    deserialization_failed("parameters.ttl must be an unsigned integer"));
            }
        }

        return dp::Result<Parameters, dp::Error>::ok(params);
    }

} // namespace didwebvh
