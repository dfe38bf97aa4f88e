#include "files/manifest.hpp"
#include "common/errors.hpp"
#include "crypto/hasher.hpp"

#include <iomanip>

void TransferManifest::append(TransferReceipt receipt) {
    if (receipt.fragment_index != receipts_.size()) {
        throw ShapeMismatch("receipt for fragment " + std::to_string(receipt.fragment_index) +
                            " appended at position " + std::to_string(receipts_.size()));
    }
    receipts_.push_back(std::move(receipt));
}

uint64_t TransferManifest::covered_bytes() const {
    uint64_t total = 0;
    for (const auto& receipt : receipts_) {
        total += receipt.length;
    }
    return total;
}

void TransferManifest::print(std::ostream& os) const {
    os << "--- Manifest ---\n"
       << "Source:        " << source_name << "\n"
       << "Source Size:   " << source_length << " bytes\n"
       << "Fragment Size: " << fragment_size << " bytes\n"
       << "Fragments:     " << receipts_.size() << "\n";
    for (const auto& receipt : receipts_) {
        os << "  [" << std::setw(4) << std::setfill(' ') << receipt.fragment_index << "]: "
           << Hasher::hash_to_hex(receipt.fingerprint)
           << " tx=" << receipt.transaction_id
           << (receipt.confirmed ? "" : " (unconfirmed)") << "\n";
    }
    os << "----------------\n";
}
