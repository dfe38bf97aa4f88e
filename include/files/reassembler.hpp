#ifndef FRAGXFER_REASSEMBLER_HPP
#define FRAGXFER_REASSEMBLER_HPP

#include <filesystem>
#include <ostream>
#include <vector>

#include "fragment_source.hpp"

// Concatenates fragments 0..N-1 into one output stream.
class Reassembler {
public:
    /**
     * @brief Appends each fragment to out and lets go of it right away.
     * @return Total bytes written.
     * @throws GapDetected if an index is missing or out of order.
     * @throws IOFailure if writing fails.
     */
    uint64_t combine(FragmentSource& fragments, std::ostream& out);

    uint64_t combine(std::vector<Fragment> fragments, std::ostream& out);

    // Writes to a new file; a partially written file is removed on failure.
    uint64_t combine_to_file(FragmentSource& fragments, const std::filesystem::path& output_path);
};

#endif // FRAGXFER_REASSEMBLER_HPP
