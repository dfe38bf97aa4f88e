#include "files/fragmenter.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>

FragmentCursor::FragmentCursor(std::unique_ptr<std::istream> stream, std::string source_name,
                               uint64_t fragment_size, uint32_t max_parts, BufferPool* pool)
    : stream_(std::move(stream)),
      source_name_(std::move(source_name)),
      fragment_size_(fragment_size),
      max_parts_(max_parts),
      pool_(pool) {
    if (fragment_size_ == 0) {
        throw ConfigInvalid("fragment size must be positive");
    }
    if (max_parts_ == 0) {
        throw ConfigInvalid("part count must be positive");
    }
    if (!stream_ || !*stream_) {
        throw IOFailure("Source stream is not readable: " + source_name_);
    }

    stream_->seekg(0, std::ios::end);
    std::streamoff end = stream_->tellg();
    if (end < 0) {
        throw IOFailure("Cannot determine length of source: " + source_name_);
    }
    source_length_ = static_cast<uint64_t>(end);
    stream_->seekg(0, std::ios::beg);
    if (!*stream_) {
        throw IOFailure("Cannot seek source: " + source_name_);
    }
}

std::optional<Fragment> FragmentCursor::next() {
    if (next_index_ >= max_parts_ || offset_ >= source_length_) {
        return std::nullopt;
    }

    uint64_t want = std::min(fragment_size_, source_length_ - offset_);

    Fragment fragment;
    fragment.spec.index = next_index_;
    fragment.spec.offset = offset_;
    fragment.spec.length = want;
    if (pool_) {
        fragment.bytes = pool_->acquire(next_index_, static_cast<size_t>(want));
    } else {
        fragment.bytes.resize(static_cast<size_t>(want));
    }

    stream_->read(reinterpret_cast<char*>(fragment.bytes.data()), static_cast<std::streamsize>(want));
    std::streamsize got = stream_->gcount();
    if (stream_->bad() || static_cast<uint64_t>(got) != want) {
        throw IOFailure("Failed to read fragment " + std::to_string(next_index_) + " of " + source_name_ +
                        ": got " + std::to_string(got) + " of " + std::to_string(want) + " bytes");
    }

    offset_ += want;
    ++next_index_;
    LOG_DEBUG("Read fragment ", fragment.spec.index, " (", want, " bytes at offset ", fragment.spec.offset, ")");
    return fragment;
}

void FragmentCursor::rewind() {
    stream_->clear();
    stream_->seekg(0, std::ios::beg);
    if (!*stream_) {
        throw IOFailure("Cannot rewind source: " + source_name_);
    }
    offset_ = 0;
    next_index_ = 0;
}

void FragmentCursor::recycle(Fragment&& fragment) {
    if (pool_) {
        pool_->release(fragment.spec.index, std::move(fragment.bytes));
    } else {
        fragment.bytes.clear();
    }
}

std::vector<FragmentSpec> Fragmenter::plan(uint64_t source_length, uint64_t fragment_size, uint32_t max_parts) {
    if (fragment_size == 0) {
        throw ConfigInvalid("fragment size must be positive");
    }
    std::vector<FragmentSpec> specs;
    uint64_t offset = 0;
    for (uint32_t i = 0; i < max_parts && offset < source_length; ++i) {
        uint64_t length = std::min(fragment_size, source_length - offset);
        specs.push_back({i, offset, length});
        offset += length;
    }
    return specs;
}

uint64_t Fragmenter::covered_bytes(uint64_t source_length, uint64_t fragment_size, uint32_t max_parts) {
    // Divide rather than multiply so huge fragment sizes cannot overflow.
    if (fragment_size == 0) return 0;
    if (source_length / fragment_size >= max_parts) {
        return fragment_size * max_parts;
    }
    return source_length;
}

FragmentCursor Fragmenter::split(const fs::path& file_path, uint64_t fragment_size, uint32_t max_parts,
                                 BufferPool* pool) {
    if (!fs::exists(file_path) || !fs::is_regular_file(file_path)) {
        throw IOFailure("File does not exist or is not a regular file: " + file_path.string());
    }

    auto file = std::make_unique<std::ifstream>(file_path, std::ios::binary);
    if (!file->is_open()) {
        throw IOFailure("Failed to open file: " + file_path.string());
    }

    LOG_INFO("Splitting file: ", file_path.string(), " (fragment size ", fragment_size,
             " bytes, at most ", max_parts, " parts)");
    return FragmentCursor(std::move(file), file_path.filename().string(), fragment_size, max_parts, pool);
}

FragmentCursor Fragmenter::split(std::unique_ptr<std::istream> stream, uint64_t fragment_size, uint32_t max_parts,
                                 BufferPool* pool) {
    return FragmentCursor(std::move(stream), "<stream>", fragment_size, max_parts, pool);
}

std::vector<Fragment> Fragmenter::split_bytes(const std::vector<uint8_t>& bytes, uint64_t fragment_size,
                                              uint32_t max_parts) {
    auto stream = std::make_unique<std::istringstream>(std::string(bytes.begin(), bytes.end()));
    FragmentCursor cursor(std::move(stream), "<memory>", fragment_size, max_parts);
    std::vector<Fragment> fragments;
    while (auto fragment = cursor.next()) {
        fragments.push_back(std::move(*fragment));
    }
    return fragments;
}
