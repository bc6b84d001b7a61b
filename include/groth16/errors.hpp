#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace groth16 {

enum class ErrorKind {
    FieldError,
    InvalidPoint,
    InvalidData,
    BufferLength,
    PrepareInputsFailed,
    VkeyHashMismatch,
    ProofVerificationFailed,
    Config,
};

const char* to_string(ErrorKind kind);

/**
 * Groth16Error - root of every error the verifier reports for bad input.
 *
 * Exceptions raised by mcl itself (e.g. a failed curve initialisation) are not
 * wrapped; they indicate a broken installation, not hostile input.
 */
class Groth16Error : public std::runtime_error {
public:
    Groth16Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

    // Decode / shape / tag errors as opposed to a proof that does not verify
    bool is_input_error() const { return kind_ != ErrorKind::ProofVerificationFailed; }

private:
    ErrorKind kind_;
};

// Field element not below the modulus, or wrong field encoding length
class FieldError : public Groth16Error {
public:
    explicit FieldError(const std::string& message)
        : Groth16Error(ErrorKind::FieldError, "Field error: " + message) {}
};

// No square root, not on the curve, not in the subgroup, or unexpected infinity
class InvalidPointError : public Groth16Error {
public:
    explicit InvalidPointError(const std::string& message)
        : Groth16Error(ErrorKind::InvalidPoint, "Invalid point: " + message) {}
};

// Invalid flag bits or malformed hex
class InvalidDataError : public Groth16Error {
public:
    explicit InvalidDataError(const std::string& message)
        : Groth16Error(ErrorKind::InvalidData, "Invalid data: " + message) {}
};

class BufferLengthError : public Groth16Error {
public:
    BufferLengthError(const std::string& context, size_t expected, size_t actual)
        : Groth16Error(ErrorKind::BufferLength,
                       "Buffer length error (" + context + "): expected " + std::to_string(expected) +
                       " bytes, got " + std::to_string(actual)),
          context_(context), expected_(expected), actual_(actual) {}

    const std::string& context() const { return context_; }
    size_t expected() const { return expected_; }
    size_t actual() const { return actual_; }

private:
    std::string context_;
    size_t expected_;
    size_t actual_;
};

class PrepareInputsError : public Groth16Error {
public:
    PrepareInputsError(size_t num_inputs, size_t num_k)
        : Groth16Error(ErrorKind::PrepareInputsFailed,
                       "Prepare inputs failed: " + std::to_string(num_inputs) +
                       " public inputs for a verifying key with " + std::to_string(num_k) + " K points") {}
};

class VkeyHashMismatchError : public Groth16Error {
public:
    VkeyHashMismatchError()
        : Groth16Error(ErrorKind::VkeyHashMismatch, "Groth16 vkey hash mismatch") {}
};

class ProofVerificationError : public Groth16Error {
public:
    ProofVerificationError()
        : Groth16Error(ErrorKind::ProofVerificationFailed, "Proof verification failed") {}
};

class ConfigError : public Groth16Error {
public:
    explicit ConfigError(const std::string& message)
        : Groth16Error(ErrorKind::Config, "Invalid verifier config: " + message) {}
};

} // namespace groth16
