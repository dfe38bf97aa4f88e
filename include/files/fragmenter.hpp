#ifndef FRAGXFER_FRAGMENTER_HPP
#define FRAGXFER_FRAGMENTER_HPP

#include "fragment_source.hpp"
#include "../common/buffer_pool.hpp"
#include <istream>
#include <memory>
#include <string>
#include <filesystem>

namespace fs = std::filesystem;

/**
 * @brief Lazily cuts a seekable source stream into fixed-size fragments.
 *
 * Each next() reads exactly min(fragment_size, remaining) bytes. The cursor
 * stops after max_parts fragments or at the end of the source, whichever
 * comes first; bytes beyond fragment_size * max_parts are never read.
 */
class FragmentCursor : public FragmentSource {
public:
    /**
     * @throws IOFailure if the length of the stream cannot be determined.
     * @throws ConfigInvalid if fragment_size or max_parts is zero.
     */
    FragmentCursor(std::unique_ptr<std::istream> stream, std::string source_name,
                   uint64_t fragment_size, uint32_t max_parts, BufferPool* pool = nullptr);

    // Throws IOFailure if the source cannot be read.
    std::optional<Fragment> next() override;
    void rewind() override;
    void recycle(Fragment&& fragment) override;

    const std::string& source_name() const { return source_name_; }
    uint64_t source_length() const { return source_length_; }
    uint64_t fragment_size() const { return fragment_size_; }
    uint32_t max_parts() const { return max_parts_; }

private:
    std::unique_ptr<std::istream> stream_;
    std::string source_name_;
    uint64_t source_length_ = 0;
    uint64_t fragment_size_;
    uint32_t max_parts_;
    BufferPool* pool_;

    uint64_t offset_ = 0;
    uint32_t next_index_ = 0;
};

class Fragmenter {
public:
    static constexpr uint64_t DEFAULT_FRAGMENT_SIZE = 4 * 1024 * 1024;

    // The fragments split() would produce for a source of source_length bytes.
    static std::vector<FragmentSpec> plan(uint64_t source_length, uint64_t fragment_size, uint32_t max_parts);

    // min(source_length, fragment_size * max_parts)
    static uint64_t covered_bytes(uint64_t source_length, uint64_t fragment_size, uint32_t max_parts);

    /**
     * @brief Opens a file for fragmentation.
     * @throws IOFailure if the file does not exist or cannot be opened.
     */
    static FragmentCursor split(const fs::path& file_path, uint64_t fragment_size, uint32_t max_parts,
                                BufferPool* pool = nullptr);

    static FragmentCursor split(std::unique_ptr<std::istream> stream, uint64_t fragment_size, uint32_t max_parts,
                                BufferPool* pool = nullptr);

    // Eagerly splits an in-memory buffer.
    static std::vector<Fragment> split_bytes(const std::vector<uint8_t>& bytes, uint64_t fragment_size,
                                             uint32_t max_parts);
};

#endif //FRAGXFER_FRAGMENTER_HPP
