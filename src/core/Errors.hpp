#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace marshal {

/**
 * Root of every error raised by the classification, swap and walk pipeline.
 * Nothing is retried internally; callers map these to user-visible failures.
 */
class MarshalError : public std::runtime_error {
public:
    explicit MarshalError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * No category or target type could be determined while parsing a subtree.
 */
class TypeResolutionError : public MarshalError {
public:
    explicit TypeResolutionError(const std::string& message)
        : MarshalError(message) {}
};

/**
 * A forward swap chain exceeded the configured depth bound.
 */
class SwapLoopError : public MarshalError {
public:
    explicit SwapLoopError(const std::string& message)
        : MarshalError(message) {}
};

/**
 * Attempted to parse into a type whose swap has no inverse.
 */
class UnswapError : public MarshalError {
public:
    explicit UnswapError(const std::string& message)
        : MarshalError(message) {}
};

/**
 * No from-string conversion exists for the target type.
 */
class NotConvertibleError : public MarshalError {
public:
    explicit NotConvertibleError(const std::string& message)
        : MarshalError(message) {}
};

/**
 * The selected string conversion raised; the original exception is kept.
 */
class ConversionError : public MarshalError {
public:
    ConversionError(const std::string& message, std::exception_ptr cause)
        : MarshalError(message), m_cause(std::move(cause)) {}

    std::exception_ptr cause() const { return m_cause; }

    [[noreturn]] void rethrowCause() const { std::rethrow_exception(m_cause); }

private:
    std::exception_ptr m_cause;
};

/**
 * Malformed input or a structural mismatch between data and target type.
 */
class ParseError : public MarshalError {
public:
    explicit ParseError(const std::string& message)
        : MarshalError(message) {}
};

/**
 * Output could not be produced (recursion, depth bound, unsupported value).
 */
class SerializeError : public MarshalError {
public:
    explicit SerializeError(const std::string& message)
        : MarshalError(message) {}
};

} // namespace marshal
