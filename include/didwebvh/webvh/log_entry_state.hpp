#pragma once

#include <datapod/datapod.hpp>
#include <didwebvh/common/error.hpp>
#include <didwebvh/webvh/log_entry.hpp>
#include <didwebvh/webvh/parameters.hpp>
#include <optional>
#include <string>

namespace didwebvh {

    /// Validation progress of a LogEntry
    /// NotValidated -> LogEntryOnly -> WitnessProof -> Ok, or Invalid from any non-final state
    enum class ValidationStatus : dp::u8 {
        NotValidated = 0,
        LogEntryOnly = 1, // chain, parameters and controller proof verified
        WitnessProof = 2, // witness threshold met
        Ok = 3,
        Invalid = 4,
    };

    inline std::string validationStatusToString(ValidationStatus status) {
        switch (status) {
        case ValidationStatus::NotValidated:
            return "NotValidated";
        case ValidationStatus::LogEntryOnly:
            return "LogEntryOnly";
        case ValidationStatus::WitnessProof:
            return "WitnessProof";
        case ValidationStatus::Ok:
            return "Ok";
        case ValidationStatus::Invalid:
            return "Invalid";
        default:
            return "Unknown";
        }
    }

    /// A LogEntry together with what validation derived for it
    /// Rebuilt from scratch on every validation pass
    class LogEntryState {
      public:
        LogEntry log_entry;
        dp::u32 version_number = 0;
        std::optional<Parameters> validated_parameters;
        std::optional<MetaData> metadata;

        inline explicit LogEntryState(LogEntry entry) : log_entry(std::move(entry)) {
            auto number = log_entry.getVersionNumber();
            if (number.is_ok()) {
                version_number = number.value();
            }
        }

        inline ValidationStatus getStatus() const { return status_; }

        inline const std::string &getInvalidReason() const { return invalid_reason_; }

        inline bool isInvalid() const { return status_ == ValidationStatus::Invalid; }

        /// Deactivation of this version, false until the entry has been verified
        inline bool isDeactivated() const { return metadata && metadata->deactivated; }

        /// Entry verified on its own
        inline dp::Result<void, dp::Error> markLogEntryOnly(Parameters parameters, MetaData entry_metadata) {
            if (status_ != ValidationStatus::NotValidated) {
                return transitionError(ValidationStatus::LogEntryOnly);
            }
            validated_parameters = std::move(parameters);
            metadata = std::move(entry_metadata);
            status_ = ValidationStatus::LogEntryOnly;
            return dp::Result<void, dp::Error>::ok();
        }

        inline dp::Result<void, dp::Error> markWitnessProof() {
            if (status_ != ValidationStatus::LogEntryOnly) {
                return transitionError(ValidationStatus::WitnessProof);
            }
            status_ = ValidationStatus::WitnessProof;
            return dp::Result<void, dp::Error>::ok();
        }

        inline dp::Result<void, dp::Error> markOk() {
            if (status_ != ValidationStatus::WitnessProof) {
                return transitionError(ValidationStatus::Ok);
            }
            status_ = ValidationStatus::Ok;
            return dp::Result<void, dp::Error>::ok();
        }

        inline dp::Result<void, dp::Error> markInvalid(const std::string &reason) {
            if (status_ == ValidationStatus::Ok || status_ == ValidationStatus::Invalid) {
                return transitionError(ValidationStatus::Invalid);
            }
            status_ = ValidationStatus::Invalid;
            invalid_reason_ = reason;
            return dp::Result<void, dp::Error>::ok();
        }

      private:
        inline dp::Result<void, dp::Error> transitionError(ValidationStatus to) const {
            return dp::Result<void, dp::Error>::err(
                status_transition_error("LogEntry " + log_entry.version_id + " can not move from " +
                                        validationStatusToString(status_) + " to " + validationStatusToString(to)));
        }

        ValidationStatus status_ = ValidationStatus::NotValidated;
        std::string invalid_reason_;
    };

} // namespace didwebvh
