#pragma once

#include <datapod/datapod.hpp>
#include <didwebvh/common/error.hpp>
#include <didwebvh/identity/did_key.hpp>
#include <nlohmann/json.hpp>
#include <set>
#include <string>
#include <vector>

namespace didwebvh {

    /// A witness node, identified by its did:key DID
    struct Witness {
        std::string id;

        /// Verification method the witness signs with (did:key:<mk>#<mk>)
        inline std::string getVerificationMethodId() const {
            auto did = DIDKey::parse(id);
            if (did.is_err()) {
                return id;
            }
            return did.value().getVerificationMethodId();
        }

        inline bool operator==(const Witness &other) const { return id == other.id; }

        inline bool operator!=(const Witness &other) const { return !(*this == other); }
    };

    /// Witness policy: how many of which witnesses must attest a version
    struct Witnesses {
        dp::u32 threshold = 0;
        std::vector<Witness> witnesses;

        inline bool isEmpty() const { return witnesses.empty(); }

        /// Checks threshold >= 1, threshold <= witness count, unique did:key ids
        inline dp::Result<void, dp::Error> validate() const {
            if (witnesses.empty()) {
                return dp::Result<void, dp::Error>::err(
                    parameters_error("Witnesses are enabled, but no witness nodes are specified"));
            }
            if (threshold < 1) {
                return dp::Result<void, dp::Error>::err(parameters_error("Witness threshold must be 1 or more"));
            }
            if (witnesses.size() < threshold) {
                return dp::Result<void, dp::Error>::err(
                    parameters_error("Number of witnesses (" + std::to_string(witnesses.size()) +
                                     ") is less than the threshold (" + std::to_string(threshold) + ")"));
            }

            std::set<std::string> seen;
            for (const auto &witness : witnesses) {
                auto did = DIDKey::parse(witness.id);
                if (did.is_err()) {
                    return dp::Result<void, dp::Error>::err(
                        parameters_error("Witness id must be a did:key DID: '" + witness.id + "'"));
                }
                if (!seen.insert(witness.id).second) {
                    return dp::Result<void, dp::Error>::err(
                        parameters_error("Duplicate witness id: '" + witness.id + "'"));
                }
            }

            return dp::Result<void, dp::Error>::ok();
        }

        /// Whether a DID is one of the configured witnesses
        inline bool contains(const std::string &did) const {
            for (const auto &witness : witnesses) {
                if (witness.id == did) {
                    return true;
                }
            }
            return false;
        }

        /// The "{}" form, witnessing switched off
        inline bool isDisabled() const { return threshold == 0 && witnesses.empty(); }

        inline nlohmann::json toJson() const {
            if (isDisabled()) {
                return nlohmann::json::object();
            }
            nlohmann::json list = nlohmann::json::array();
            for (const auto &witness : witnesses) {
                list.push_back({{"id", witness.id}});
            }
            return nlohmann::json{{"threshold", threshold}, {"witnesses", list}};
        }

        inline static dp::Result<Witnesses, dp::Error> fromJson(const nlohmann::json &j) {
            if (!j.is_object()) {
                return dp::Result<Witnesses, dp::Error>::err(deserialization_failed("witness must be an object"));
            }

            Witnesses result;
            auto threshold = j.find("threshold");
            if (threshold != j.end()) {
                if (!threshold->is_number_unsigned()) {
                    return dp::Result<Witnesses, dp::Error>::err(
                        deserialization_failed("witness.threshold must be an unsigned integer"));
                }
                result.threshold = threshold->get<dp::u32>();
            }

            auto list = j.find("witnesses");
            if (list != j.end()) {
                if (!list->is_array()) {
                    return dp::Result<Witnesses, dp::Error>::err(
                        deserialization_failed("witness.witnesses must be an array"));
                }
                for (const auto &item : *list) {
                    if (!item.is_object() || !item.contains("id") || !item["id"].is_string()) {
                        return dp::Result<Witnesses, dp::Error>::err(
                            deserialization_failed("witness.witnesses[] entries need a string id"));
                    }
                    result.witnesses.push_back(Witness{item["id"].get<std::string>()});
                }
            }

            return dp::Result<Witnesses, dp::Error>::ok(result);
        }

        inline bool operator==(const Witnesses &other) const {
            return threshold == other.threshold && witnesses == other.witnesses;
        }

        inline bool operator!=(const Witnesses &other) const { return !(*this == other); }
    };

} // namespace didwebvh
