#include "transfer/storage_client.hpp"
#include "common/errors.hpp"

const char* to_string(FinalityMode mode) {
    switch (mode) {
        case FinalityMode::TransactionPacked: return "packed";
        case FinalityMode::FileFinalized: return "finalized";
        default: return "unknown";
    }
}

FinalityMode parse_finality(const std::string& name) {
    if (name == "packed") return FinalityMode::TransactionPacked;
    if (name == "finalized") return FinalityMode::FileFinalized;
    throw ConfigInvalid("unknown finality mode: " + name);
}
