#include "files/sample_file.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>
#include <vector>

namespace SampleFile {

void generate(const std::filesystem::path& path, uint64_t size) {
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            throw IOFailure("cannot create directory " + path.parent_path().string() + ": " + ec.message());
        }
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw IOFailure("cannot create test file: " + path.string());
    }

    LOG_INFO("Generating test file ", path.string(), " (", size, " bytes)");

    std::vector<char> chunk(CHUNK_SIZE);
    uint64_t written = 0;
    size_t chunk_index = 0;
    while (written < size) {
        const size_t length = static_cast<size_t>(std::min<uint64_t>(CHUNK_SIZE, size - written));
        std::fill(chunk.begin(), chunk.begin() + length, static_cast<char>(chunk_index % 256));
        if (!file.write(chunk.data(), static_cast<std::streamsize>(length))) {
            throw IOFailure("failed to write test file: " + path.string());
        }
        written += length;
        ++chunk_index;
        if (chunk_index % PROGRESS_EVERY == 0) {
            LOG_INFO("Generated ", written / CHUNK_SIZE, " MiB of ", size / CHUNK_SIZE, " MiB");
        }
    }

    file.close();
    if (!file) {
        throw IOFailure("failed to close test file: " + path.string());
    }
    LOG_INFO("Test file ready: ", path.string());
}

} // namespace SampleFile