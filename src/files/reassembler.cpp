#include "files/reassembler.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"

#include <fstream>
#include <system_error>

uint64_t Reassembler::combine(FragmentSource& fragments, std::ostream& out) {
    uint32_t expected = 0;
    uint64_t written = 0;

    while (auto fragment = fragments.next()) {
        if (fragment->spec.index != expected) {
            throw GapDetected(expected, "expected fragment " + std::to_string(expected) + ", got " +
                                        std::to_string(fragment->spec.index));
        }

        if (!fragment->bytes.empty()) {
            out.write(reinterpret_cast<const char*>(fragment->bytes.data()),
                      static_cast<std::streamsize>(fragment->bytes.size()));
        }
        if (!out) {
            throw IOFailure("failed to write fragment " + std::to_string(expected) + " to output");
        }

        written += fragment->bytes.size();
        LOG_DEBUG("Combined part ", expected + 1, " (", fragment->bytes.size(), " bytes)");
        fragments.recycle(std::move(*fragment));
        ++expected;
    }

    out.flush();
    if (!out) {
        throw IOFailure("failed to flush combined output");
    }
    return written;
}

uint64_t Reassembler::combine(std::vector<Fragment> fragments, std::ostream& out) {
    // Drained front to back; each buffer is released as soon as it is written.
    class DrainingSource : public FragmentSource {
    public:
        explicit DrainingSource(std::vector<Fragment>& fragments) : fragments_(fragments) {}

        std::optional<Fragment> next() override {
            if (position_ >= fragments_.size()) return std::nullopt;
            return std::move(fragments_[position_++]);
        }

        void rewind() override { position_ = 0; }

        void recycle(Fragment&& fragment) override {
            std::vector<uint8_t>().swap(fragment.bytes);
        }

    private:
        std::vector<Fragment>& fragments_;
        size_t position_ = 0;
    };

    DrainingSource source(fragments);
    return combine(source, out);
}

uint64_t Reassembler::combine_to_file(FragmentSource& fragments, const std::filesystem::path& output_path) {
    if (output_path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(output_path.parent_path(), ec);
        if (ec) {
            throw IOFailure("cannot create directory " + output_path.parent_path().string() + ": " + ec.message());
        }
    }

    std::ofstream out(output_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw IOFailure("cannot open output file: " + output_path.string());
    }

    LOG_INFO("Combining parts into ", output_path.string());
    try {
        uint64_t written = combine(fragments, out);
        out.close();
        if (!out) {
            throw IOFailure("failed to close output file: " + output_path.string());
        }
        LOG_INFO("Combined file written: ", output_path.string(), " (", written, " bytes)");
        return written;
    } catch (const TransferError&) {
        out.close();
        std::error_code ec;
        std::filesystem::remove(output_path, ec);
        throw;
    }
}
