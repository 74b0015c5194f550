#include "common/errors.hpp"

const char* phase_to_string(CallPhase phase) {
    switch (phase) {
        case CallPhase::CONFIG:    return "config";
        case CallPhase::BUILDING:  return "building";
        case CallPhase::ENCODE:    return "encode";
        case CallPhase::ENCRYPT:   return "encrypt";
        case CallPhase::SIGN:      return "sign";
        case CallPhase::TRANSPORT: return "transport";
        case CallPhase::PARSE:     return "parse";
        case CallPhase::VERIFY:    return "verify";
        case CallPhase::DECRYPT:   return "decrypt";
        default: return "unknown";
    }
}
