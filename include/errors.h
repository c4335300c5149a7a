#ifndef POKER_COACH_ERRORS_H
#define POKER_COACH_ERRORS_H

#include <stdexcept>
#include <string>

namespace poker_coach {

// Base class for every error raised by the coaching core.
class PokerCoachError : public std::runtime_error {
public:
    explicit PokerCoachError(const std::string& what) : std::runtime_error(what) {}
};

// A raw hand record could not be turned into a HandRecord.
// Batch parsing catches it per hand and only counts it.
class HandParseError : public PokerCoachError {
public:
    explicit HandParseError(const std::string& what) : PokerCoachError(what) {}
};

// Lookup miss in the store. Never answered with a fresh empty object.
class NotFoundError : public PokerCoachError {
public:
    enum class Kind { SCENARIO, ATTEMPT, SESSION };

    NotFoundError(Kind kind, const std::string& id)
        : PokerCoachError(kind_name(kind) + " not found: " + id), kind_(kind), id_(id) {}

    Kind kind() const { return kind_; }
    const std::string& id() const { return id_; }

    static std::string kind_name(Kind kind) {
        switch (kind) {
            case Kind::SCENARIO: return "Scenario";
            case Kind::ATTEMPT:  return "Attempt";
            case Kind::SESSION:  return "Live session";
        }
        return "Object";
    }

private:
    Kind kind_;
    std::string id_;
};

// A decision names an action or size outside the current legal set.
class IllegalActionError : public PokerCoachError {
public:
    explicit IllegalActionError(const std::string& what) : PokerCoachError(what) {}
};

// Bad configuration or request field (unknown street, table size, ...).
class ConfigError : public std::invalid_argument {
public:
    explicit ConfigError(const std::string& what) : std::invalid_argument(what) {}
};

} // namespace poker_coach

#endif // POKER_COACH_ERRORS_H
