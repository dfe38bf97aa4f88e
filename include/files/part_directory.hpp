#ifndef FRAGXFER_PART_DIRECTORY_HPP
#define FRAGXFER_PART_DIRECTORY_HPP

#include <filesystem>
#include <string>
#include <vector>

#include "fragment_source.hpp"

namespace fs = std::filesystem;

/**
 * @brief Staging area for downloaded fragments on local disk.
 *
 * Fragment i lives in part_NN.bin (NN = i, two digits at least) so a large
 * download never has to sit in memory all at once.
 */
class PartDirectory {
public:
    explicit PartDirectory(fs::path directory);

    const fs::path& path() const { return directory_; }

    static std::string part_file_name(uint32_t index);
    fs::path part_path(uint32_t index) const;

    // Throws IOFailure if the directory or the file cannot be written.
    void write(const Fragment& fragment);

    // Indices of the part files present, ascending.
    std::vector<uint32_t> indices() const;

    // Removes every part file; the directory itself stays.
    void clear();

    /**
     * @brief Reads the staged parts back in index order.
     *
     * Offsets are cumulative lengths. Index gaps are reported as-is so the
     * reassembler can reject them.
     */
    class Reader : public FragmentSource {
    public:
        explicit Reader(const PartDirectory& directory);

        // Throws IOFailure if a part file cannot be read.
        std::optional<Fragment> next() override;
        void rewind() override;

    private:
        const PartDirectory& directory_;
        std::vector<uint32_t> indices_;
        size_t position_ = 0;
        uint64_t offset_ = 0;
    };

    Reader reader() const { return Reader(*this); }

private:
    fs::path directory_;
};

#endif // FRAGXFER_PART_DIRECTORY_HPP
