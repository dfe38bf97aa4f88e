#include "files/part_directory.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <system_error>

namespace {
    constexpr const char* PART_PREFIX = "part_";
    constexpr const char* PART_SUFFIX = ".bin";

    // part_07.bin -> 7; false for anything else in the directory.
    bool parse_part_index(const std::string& name, uint32_t& index) {
        const std::string prefix(PART_PREFIX);
        const std::string suffix(PART_SUFFIX);
        if (name.size() <= prefix.size() + suffix.size()) return false;
        if (name.compare(0, prefix.size(), prefix) != 0) return false;
        if (name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) return false;

        std::string digits = name.substr(prefix.size(), name.size() - prefix.size() - suffix.size());
        if (digits.empty() || digits.size() > 9) return false;
        if (!std::all_of(digits.begin(), digits.end(), [](char c) { return c >= '0' && c <= '9'; })) return false;

        index = static_cast<uint32_t>(std::stoul(digits));
        return true;
    }
}

PartDirectory::PartDirectory(fs::path directory) : directory_(std::move(directory)) {}

std::string PartDirectory::part_file_name(uint32_t index) {
    char name[32];
    std::snprintf(name, sizeof(name), "%s%02u%s", PART_PREFIX, index, PART_SUFFIX);
    return name;
}

fs::path PartDirectory::part_path(uint32_t index) const {
    return directory_ / part_file_name(index);
}

void PartDirectory::write(const Fragment& fragment) {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        throw IOFailure("cannot create directory " + directory_.string() + ": " + ec.message());
    }

    fs::path target = part_path(fragment.spec.index);
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw IOFailure("cannot open part file: " + target.string());
    }
    out.write(reinterpret_cast<const char*>(fragment.bytes.data()),
              static_cast<std::streamsize>(fragment.bytes.size()));
    out.close();
    if (!out) {
        throw IOFailure("failed to write part file: " + target.string());
    }
    LOG_DEBUG("Saved part ", fragment.spec.index + 1, " to ", target.string());
}

std::vector<uint32_t> PartDirectory::indices() const {
    std::vector<uint32_t> found;
    std::error_code ec;
    if (!fs::is_directory(directory_, ec)) return found;

    for (const auto& entry : fs::directory_iterator(directory_, ec)) {
        uint32_t index = 0;
        if (entry.is_regular_file() && parse_part_index(entry.path().filename().string(), index)) {
            found.push_back(index);
        }
    }
    if (ec) {
        throw IOFailure("cannot list " + directory_.string() + ": " + ec.message());
    }
    std::sort(found.begin(), found.end());
    return found;
}

void PartDirectory::clear() {
    for (uint32_t index : indices()) {
        std::error_code ec;
        fs::remove(part_path(index), ec);
        if (ec) {
            throw IOFailure("cannot remove " + part_path(index).string() + ": " + ec.message());
        }
    }
}

PartDirectory::Reader::Reader(const PartDirectory& directory)
    : directory_(directory), indices_(directory.indices()) {}

std::optional<Fragment> PartDirectory::Reader::next() {
    if (position_ >= indices_.size()) return std::nullopt;

    const uint32_t index = indices_[position_++];
    fs::path source = directory_.part_path(index);
    std::ifstream in(source, std::ios::binary | std::ios::ate);
    if (!in) {
        throw IOFailure("cannot open part file: " + source.string());
    }

    const std::streamsize size = in.tellg();
    if (size < 0) {
        throw IOFailure("cannot determine size of " + source.string());
    }
    in.seekg(0, std::ios::beg);

    Fragment fragment;
    fragment.spec.index = index;
    fragment.spec.offset = offset_;
    fragment.spec.length = static_cast<uint64_t>(size);
    fragment.bytes.resize(static_cast<size_t>(size));
    if (size > 0 && !in.read(reinterpret_cast<char*>(fragment.bytes.data()), size)) {
        throw IOFailure("failed to read part file: " + source.string());
    }

    offset_ += fragment.spec.length;
    return fragment;
}

void PartDirectory::Reader::rewind() {
    indices_ = directory_.indices();
    position_ = 0;
    offset_ = 0;
}
