#pragma once

#include <datapod/datapod.hpp>
#include <optional>
#include <utility>

namespace didwebvh {

    /// Tri-state value of an optional Parameters field in a LogEntry
    ///   Unchanged - field absent, inherit the previous value
    ///   Cleared   - field is JSON null, reset to the default
    ///   Set       - field carries a new value
    template <typename T> class FieldAction {
      public:
        enum class Kind : dp::u8 { Unchanged = 0, Cleared = 1, Set = 2 };

        FieldAction() = default;

        inline static FieldAction unchanged() { return FieldAction(); }

        inline static FieldAction cleared() {
            FieldAction action;
            action.kind_ = Kind::Cleared;
            return action;
        }

        inline static FieldAction set(T value) {
            FieldAction action;
            action.kind_ = Kind::Set;
            action.value_ = std::move(value);
            return action;
        }

        inline Kind kind() const { return kind_; }

        inline bool isUnchanged() const { return kind_ == Kind::Unchanged; }

        inline bool isCleared() const { return kind_ == Kind::Cleared; }

        inline bool isSet() const { return kind_ == Kind::Set; }

        /// Only valid when isSet()
        inline const T &value() const { return *value_; }

        /// Value if set, otherwise nullptr
        inline const T *get() const { return value_ ? &*value_ : nullptr; }

        inline bool operator==(const FieldAction &other) const {
            return kind_ == other.kind_ && value_ == other.value_;
        }

        inline bool operator!=(const FieldAction &other) const { return !(*this == other); }

      private:
        Kind kind_ = Kind::Unchanged;
        std::optional<T> value_;
    };

} // namespace didwebvh
