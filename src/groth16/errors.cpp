#include "groth16/errors.hpp"

namespace groth16 {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::FieldError: return "FieldError";
        case ErrorKind::InvalidPoint: return "InvalidPoint";
        case ErrorKind::InvalidData: return "InvalidData";
        case ErrorKind::BufferLength: return "BufferLength";
        case ErrorKind::PrepareInputsFailed: return "PrepareInputsFailed";
        case ErrorKind::VkeyHashMismatch: return "VkeyHashMismatch";
        case ErrorKind::ProofVerificationFailed: return "ProofVerificationFailed";
        case ErrorKind::Config: return "Config";
    }
    return "Unknown";
}

} // namespace groth16
