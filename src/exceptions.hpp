#ifndef BLOCKALIGN_EXCEPTIONS_HPP
#define BLOCKALIGN_EXCEPTIONS_HPP

#include <stdexcept>
#include <string>

/* Base class of all errors reported to callers of align() */
class AlignError : public std::runtime_error {
public:
    AlignError(const std::string& message) : std::runtime_error(message) { }
};

/* Invalid gap costs, block sizes, lane width or scoring matrix */
class ConfigError : public AlignError {
public:
    ConfigError(const std::string& message) : AlignError(message) { }
};

class SequenceTooShortError : public AlignError {
public:
    SequenceTooShortError(const std::string& message) : AlignError(message) { }
};

class AlphabetError : public AlignError {
public:
    AlphabetError(const std::string& message) : AlignError(message) { }
};

/* The block controller needed more steps than AlignmentParameters::max_steps */
class StepBudgetExceeded : public AlignError {
public:
    StepBudgetExceeded(const std::string& message) : AlignError(message) { }
};

#endif
