#ifndef FRAGXFER_SAMPLE_FILE_HPP
#define FRAGXFER_SAMPLE_FILE_HPP

#include <cstdint>
#include <filesystem>

namespace SampleFile {

constexpr size_t CHUNK_SIZE = 1024 * 1024;
constexpr size_t PROGRESS_EVERY = 100; // chunks

/**
 * @brief Writes a deterministic test file of exactly size bytes.
 *
 * Written in CHUNK_SIZE chunks; every byte of chunk i has the value i % 256.
 * @throws IOFailure if the file cannot be created or written.
 */
void generate(const std::filesystem::path& path, uint64_t size);

// The byte generate() puts at offset.
inline uint8_t byte_at(uint64_t offset) {
    return static_cast<uint8_t>((offset / CHUNK_SIZE) % 256);
}

} // namespace SampleFile
#endif // FRAGXFER_SAMPLE_FILE_HPP
