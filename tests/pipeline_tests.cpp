#include "gtest/gtest.h"
#include "gmock/gmock.h"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "crypto/fingerprint_oracle.hpp"
#include "files/fragmenter.hpp"
#include "files/integrity_verifier.hpp"
#include "files/part_directory.hpp"
#include "pipeline/pipeline_driver.hpp"
#include "storage/manifest_file.hpp"
#include "transfer/download_coordinator.hpp"
#include "transfer/upload_coordinator.hpp"
#include "test_doubles.hpp"

#include <chrono>
#include <filesystem>
#include <iterator>
#include <fstream>
#include <sstream>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace testing_support;
using ::testing::_;
using ::testing::Field;
using ::testing::Return;
using std::chrono::milliseconds;

namespace {
    constexpr uint64_t SCENARIO_LENGTH = 1000000;
    constexpr uint64_t SCENARIO_FRAGMENT = 300000;

    UploadPolicy quick_policy(size_t batch_size, int max_retries) {
        UploadPolicy policy;
        policy.batch_size = batch_size;
        policy.max_retries = max_retries;
        return policy;
    }

    std::vector<uint8_t> read_file(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        return std::vector<uint8_t>((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }

    void write_file(const fs::path& path, const std::vector<uint8_t>& bytes) {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    }
}

// --- UploadCoordinator ---

class UploadCoordinatorTest : public ::testing::Test {
protected:
    FakeStorageClient client_;
    MerkleFingerprintOracle oracle_;
    RecordingPacer pacer_;
    UploadCoordinator uploader_{client_, oracle_, pacer_};
    std::vector<Fragment> fragments_ =
        Fragmenter::split_bytes(striped_bytes(SCENARIO_LENGTH, SCENARIO_FRAGMENT), SCENARIO_FRAGMENT, 10);
};

TEST_F(UploadCoordinatorTest, ManifestIsIndexAlignedWithLocalFingerprints) {
    TransferManifest manifest = uploader_.upload(fragments_, quick_policy(2, 3));

    ASSERT_EQ(manifest.size(), 4u);
    for (size_t i = 0; i < manifest.size(); ++i) {
        EXPECT_EQ(manifest[i].fragment_index, i);
        EXPECT_EQ(manifest[i].fingerprint, oracle_.fingerprint(fragments_[i].bytes));
        EXPECT_EQ(manifest[i].length, fragments_[i].spec.length);
        EXPECT_TRUE(manifest[i].confirmed);
        EXPECT_FALSE(manifest[i].transaction_id.empty());
    }
    EXPECT_EQ(client_.upload_calls(), 4);
}

TEST_F(UploadCoordinatorTest, CooldownSeparatesBatchesOnly) {
    uploader_.upload(fragments_, quick_policy(2, 3));
    EXPECT_EQ(pacer_.nonzero_delays(), (std::vector<milliseconds>{milliseconds(5000)}));

    RecordingPacer single_pacer;
    UploadCoordinator single(client_, oracle_, single_pacer);
    single.upload(fragments_, quick_policy(1, 3));
    EXPECT_EQ(single_pacer.nonzero_delays(),
              (std::vector<milliseconds>{milliseconds(5000), milliseconds(5000), milliseconds(5000)}));
}

TEST_F(UploadCoordinatorTest, PermanentFailureUsesExactlyMaxRetriesAttempts) {
    client_.upload_hook = [](const std::vector<uint8_t>&) { throw NetworkFailure("connection refused"); };
    std::vector<Fragment> one(fragments_.begin(), fragments_.begin() + 1);

    try {
        uploader_.upload(one, quick_policy(1, 5));
        FAIL() << "expected UploadFailure";
    } catch (const UploadFailure& e) {
        EXPECT_EQ(e.fragment_index(), 0u);
        EXPECT_EQ(e.cause_kind(), ErrorKind::NetworkFailure);
        EXPECT_TRUE(e.partial_manifest().empty());
    }
    EXPECT_EQ(client_.upload_calls(), 5);
    EXPECT_EQ(pacer_.delays(), (std::vector<milliseconds>{milliseconds(0), milliseconds(1000), milliseconds(2000),
                                                          milliseconds(4000), milliseconds(8000)}));
}

TEST_F(UploadCoordinatorTest, ZeroRetriesStillMakesOneAttempt) {
    client_.upload_hook = [](const std::vector<uint8_t>&) { throw NetworkFailure("down"); };
    std::vector<Fragment> one(fragments_.begin(), fragments_.begin() + 1);
    EXPECT_THROW(uploader_.upload(one, quick_policy(1, 0)), UploadFailure);
    EXPECT_EQ(client_.upload_calls(), 1);
}

TEST_F(UploadCoordinatorTest, FailingThirdFragmentLeavesTwoReceipts) {
    client_.upload_hook = [](const std::vector<uint8_t>& bytes) {
        if (bytes[0] == 2) throw NetworkFailure("node unavailable");
    };

    try {
        uploader_.upload(fragments_, quick_policy(2, 3));
        FAIL() << "expected UploadFailure";
    } catch (const UploadFailure& e) {
        EXPECT_EQ(e.fragment_index(), 2u);
        EXPECT_EQ(e.cause_kind(), ErrorKind::NetworkFailure);
        ASSERT_EQ(e.partial_manifest().size(), 2u);
        EXPECT_EQ(e.partial_manifest()[0].fragment_index, 0u);
        EXPECT_EQ(e.partial_manifest()[1].fragment_index, 1u);
    }
    EXPECT_EQ(client_.attempts_for(2), 3);
    EXPECT_EQ(client_.attempts_for(3), 0);
}

TEST_F(UploadCoordinatorTest, TransientFailuresAreRetried) {
    int calls = 0;
    client_.upload_hook = [&calls](const std::vector<uint8_t>&) {
        ++calls;
        if (calls == 1) throw NetworkFailure("reset by peer");
        if (calls == 2) throw TimeoutError("attempt timed out");
    };
    std::vector<Fragment> one(fragments_.begin(), fragments_.begin() + 1);

    TransferManifest manifest = uploader_.upload(one, quick_policy(1, 3));
    EXPECT_EQ(manifest.size(), 1u);
    EXPECT_EQ(client_.upload_calls(), 3);
    EXPECT_EQ(pacer_.delays(), (std::vector<milliseconds>{milliseconds(0), milliseconds(1000), milliseconds(2000)}));
}

TEST_F(UploadCoordinatorTest, UnclassifiedClientErrorsCountAsNetworkFailures) {
    client_.upload_hook = [](const std::vector<uint8_t>&) { throw std::runtime_error("rpc error"); };
    std::vector<Fragment> one(fragments_.begin(), fragments_.begin() + 1);
    try {
        uploader_.upload(one, quick_policy(1, 3));
        FAIL() << "expected UploadFailure";
    } catch (const UploadFailure& e) {
        EXPECT_EQ(e.cause_kind(), ErrorKind::NetworkFailure);
    }
    EXPECT_EQ(client_.upload_calls(), 3);
}

TEST_F(UploadCoordinatorTest, InsufficientFundsIsNotRetried) {
    client_.upload_hook = [](const std::vector<uint8_t>&) { throw InsufficientFunds("balance too low"); };
    try {
        uploader_.upload(fragments_, quick_policy(2, 3));
        FAIL() << "expected UploadFailure";
    } catch (const UploadFailure& e) {
        EXPECT_EQ(e.fragment_index(), 0u);
        EXPECT_EQ(e.cause_kind(), ErrorKind::InsufficientFunds);
    }
    EXPECT_EQ(client_.attempts_for(0), 1);
}

TEST_F(UploadCoordinatorTest, OverallDeadlineEndsRetries) {
    client_.upload_hook = [](const std::vector<uint8_t>&) { throw NetworkFailure("down"); };
    UploadPolicy policy = quick_policy(1, 10);
    policy.overall_timeout = milliseconds(1500);
    std::vector<Fragment> one(fragments_.begin(), fragments_.begin() + 1);

    try {
        uploader_.upload(one, policy);
        FAIL() << "expected UploadFailure";
    } catch (const UploadFailure& e) {
        EXPECT_EQ(e.cause_kind(), ErrorKind::Timeout);
    }
    // Attempt 3 would wait 2 s, past the 1.5 s budget.
    EXPECT_EQ(client_.upload_calls(), 2);
}

TEST_F(UploadCoordinatorTest, ParallelBatchKeepsIndexOrder) {
    client_.upload_hook = [](const std::vector<uint8_t>& bytes) {
        if (bytes[0] == 0) std::this_thread::sleep_for(milliseconds(150));
    };
    UploadPolicy policy = quick_policy(2, 3);
    policy.parallel = true;
    std::vector<Fragment> two(fragments_.begin(), fragments_.begin() + 2);

    TransferManifest manifest = uploader_.upload(two, policy);

    EXPECT_EQ(client_.completion_order(), (std::vector<int>{1, 0}));
    ASSERT_EQ(manifest.size(), 2u);
    EXPECT_EQ(manifest[0].fingerprint, oracle_.fingerprint(fragments_[0].bytes));
    EXPECT_EQ(manifest[1].fingerprint, oracle_.fingerprint(fragments_[1].bytes));
}

TEST_F(UploadCoordinatorTest, ResumeSkipsUploadedFragments) {
    bool fail_third = true;
    client_.upload_hook = [&fail_third](const std::vector<uint8_t>& bytes) {
        if (fail_third && bytes[0] == 2) throw NetworkFailure("flaky");
    };

    TransferManifest partial;
    try {
        uploader_.upload(fragments_, quick_policy(2, 1));
        FAIL() << "expected UploadFailure";
    } catch (const UploadFailure& e) {
        partial = e.partial_manifest();
    }
    ASSERT_EQ(partial.size(), 2u);

    fail_third = false;
    FragmentList source(fragments_);
    TransferManifest manifest = uploader_.upload(source, quick_policy(2, 1), partial);

    ASSERT_EQ(manifest.size(), 4u);
    EXPECT_EQ(manifest[0].transaction_id, partial[0].transaction_id);
    EXPECT_EQ(client_.attempts_for(0), 1);
    EXPECT_EQ(client_.attempts_for(3), 1);
}

TEST_F(UploadCoordinatorTest, ResumeRefusesChangedFragments) {
    client_.upload_hook = [](const std::vector<uint8_t>& bytes) {
        if (bytes[0] == 2) throw NetworkFailure("flaky");
    };
    TransferManifest partial;
    try {
        uploader_.upload(fragments_, quick_policy(2, 1));
        FAIL() << "expected UploadFailure";
    } catch (const UploadFailure& e) {
        partial = e.partial_manifest();
    }
    ASSERT_EQ(partial.size(), 2u);
    client_.upload_hook = nullptr;
    const int calls_before = client_.upload_calls();

    std::vector<Fragment> edited = fragments_;
    for (auto& fragment : edited) {
        for (auto& byte : fragment.bytes) byte ^= 0xFF;
    }
    FragmentList source(edited);
    try {
        uploader_.upload(source, quick_policy(2, 1), partial);
        FAIL() << "expected UploadFailure";
    } catch (const UploadFailure& e) {
        EXPECT_EQ(e.fragment_index(), 0u);
        EXPECT_EQ(e.cause_kind(), ErrorKind::IntegrityMismatch);
        EXPECT_TRUE(e.partial_manifest().empty());
    }
    EXPECT_EQ(client_.upload_calls(), calls_before);
}

TEST_F(UploadCoordinatorTest, ResumeRefusesChangedFragmentLength) {
    TransferManifest full = uploader_.upload(fragments_, quick_policy(4, 1));
    ASSERT_EQ(full.size(), 4u);

    std::vector<Fragment> shorter = fragments_;
    shorter[1].bytes.pop_back();
    FragmentList source(shorter);
    try {
        uploader_.upload(source, quick_policy(4, 1), full);
        FAIL() << "expected UploadFailure";
    } catch (const UploadFailure& e) {
        EXPECT_EQ(e.fragment_index(), 1u);
        EXPECT_EQ(e.cause_kind(), ErrorKind::IntegrityMismatch);
        EXPECT_EQ(e.partial_manifest().size(), 1u);
    }
}

TEST_F(UploadCoordinatorTest, BrokenTimerDuringBackoffKeepsPartialManifest) {
    client_.upload_hook = [](const std::vector<uint8_t>& bytes) {
        if (bytes[0] == 1) throw NetworkFailure("flaky");
    };
    FailingPacer pacer;
    UploadCoordinator uploader(client_, oracle_, pacer);
    UploadPolicy policy = quick_policy(2, 3);
    policy.parallel = true;

    try {
        uploader.upload(fragments_, policy);
        FAIL() << "expected UploadFailure";
    } catch (const UploadFailure& e) {
        EXPECT_EQ(e.fragment_index(), 1u);
        EXPECT_EQ(e.cause_kind(), ErrorKind::NetworkFailure);
        ASSERT_EQ(e.partial_manifest().size(), 1u);
        EXPECT_EQ(e.partial_manifest()[0].fingerprint, oracle_.fingerprint(fragments_[0].bytes));
    }
    EXPECT_EQ(client_.attempts_for(1), 1);
}

TEST_F(UploadCoordinatorTest, BrokenTimerDuringCooldownKeepsPartialManifest) {
    FailingPacer pacer;
    UploadCoordinator uploader(client_, oracle_, pacer);

    try {
        uploader.upload(fragments_, quick_policy(2, 3));
        FAIL() << "expected UploadFailure";
    } catch (const UploadFailure& e) {
        EXPECT_EQ(e.fragment_index(), 2u);
        EXPECT_EQ(e.cause_kind(), ErrorKind::NetworkFailure);
        EXPECT_EQ(e.partial_manifest().size(), 2u);
    }
}

TEST(UploadCoordinatorMockTest, FingerprintFailureIsNotRetried) {
    MockStorageClient client;
    MockFingerprintOracle oracle;
    RecordingPacer pacer;
    EXPECT_CALL(oracle, fingerprint(_)).WillOnce(::testing::Throw(ComputeFailure("digest unavailable")));
    EXPECT_CALL(client, upload(_, _, _)).Times(0);

    UploadCoordinator uploader(client, oracle, pacer);
    try {
        uploader.upload(Fragmenter::split_bytes(patterned_bytes(100), 100, 1), quick_policy(1, 3));
        FAIL() << "expected UploadFailure";
    } catch (const UploadFailure& e) {
        EXPECT_EQ(e.cause_kind(), ErrorKind::ComputeFailure);
    }
}

TEST(UploadCoordinatorMockTest, OptionsReachTheClientUnchanged) {
    MockStorageClient client;
    MerkleFingerprintOracle oracle;
    RecordingPacer pacer;
    UploadPolicy policy = quick_policy(1, 3);
    policy.options.replica_count = 3;
    policy.options.finality = FinalityMode::FileFinalized;

    EXPECT_CALL(client, upload(_, ::testing::AllOf(Field(&UploadOptions::replica_count, 3u),
                                                   Field(&UploadOptions::finality, FinalityMode::FileFinalized)), _))
        .WillOnce(Return(TransactionHandle{"0xabc", false}));

    UploadCoordinator uploader(client, oracle, pacer);
    TransferManifest manifest = uploader.upload(Fragmenter::split_bytes(patterned_bytes(100), 100, 1), policy);
    ASSERT_EQ(manifest.size(), 1u);
    EXPECT_EQ(manifest[0].transaction_id, "0xabc");
    EXPECT_FALSE(manifest[0].confirmed);
}

// --- DownloadCoordinator ---

class DownloadCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        RecordingPacer pacer;
        UploadCoordinator uploader(client_, oracle_, pacer);
        manifest_ = uploader.upload(fragments_, quick_policy(4, 1));
    }

    FakeStorageClient client_;
    MerkleFingerprintOracle oracle_;
    DownloadCoordinator downloader_{client_};
    std::vector<Fragment> fragments_ = Fragmenter::split_bytes(patterned_bytes(1000), 300, 10);
    TransferManifest manifest_;
};

TEST_F(DownloadCoordinatorTest, ReturnsFragmentsInManifestOrder) {
    auto retrieved = downloader_.download_all(manifest_, DownloadPolicy());
    ASSERT_EQ(retrieved.size(), fragments_.size());
    for (size_t i = 0; i < retrieved.size(); ++i) {
        EXPECT_EQ(retrieved[i].spec, fragments_[i].spec);
        EXPECT_EQ(retrieved[i].bytes, fragments_[i].bytes);
    }
}

TEST_F(DownloadCoordinatorTest, WindowedDownloadPreservesOrder) {
    const Fingerprint first = manifest_[0].fingerprint;
    client_.download_hook = [first](const Fingerprint& fp) {
        if (fp == first) std::this_thread::sleep_for(milliseconds(100));
    };
    DownloadPolicy policy;
    policy.parallelism = 3;

    std::vector<uint32_t> order;
    downloader_.download(manifest_, policy, [&order](Fragment&& f) { order.push_back(f.spec.index); });
    EXPECT_EQ(order, (std::vector<uint32_t>{0, 1, 2, 3}));
}

TEST_F(DownloadCoordinatorTest, FailureNamesTheFragment) {
    ASSERT_TRUE(client_.forget(manifest_[2].fingerprint));
    for (size_t window : {1u, 4u}) {
        DownloadPolicy policy;
        policy.parallelism = window;
        try {
            downloader_.download_all(manifest_, policy);
            FAIL() << "expected DownloadFailure";
        } catch (const DownloadFailure& e) {
            EXPECT_EQ(e.fragment_index(), 2u);
            EXPECT_EQ(e.cause_kind(), ErrorKind::NotFound);
        }
    }
}

TEST_F(DownloadCoordinatorTest, ProofToggleIsPassedThrough) {
    ASSERT_TRUE(client_.corrupt(manifest_[1].fingerprint));

    DownloadPolicy checked;
    try {
        downloader_.download_all(manifest_, checked);
        FAIL() << "expected DownloadFailure";
    } catch (const DownloadFailure& e) {
        EXPECT_EQ(e.fragment_index(), 1u);
        EXPECT_EQ(e.cause_kind(), ErrorKind::ProofInvalid);
    }

    DownloadPolicy unchecked;
    unchecked.verify_proof = false;
    auto retrieved = downloader_.download_all(manifest_, unchecked);

    IntegrityVerifier verifier(oracle_);
    auto results = verifier.verify(fragments_, retrieved);
    EXPECT_FALSE(results[1].match);
    EXPECT_THROW(IntegrityVerifier::require_all_match(results), IntegrityMismatch);
}

TEST_F(DownloadCoordinatorTest, SizeDifferentFromReceiptIsRejected) {
    TransferManifest altered;
    for (size_t i = 0; i < manifest_.size(); ++i) {
        TransferReceipt r = manifest_[i];
        if (i == 3) r.length = 999;
        altered.append(r);
    }
    try {
        downloader_.download_all(altered, DownloadPolicy());
        FAIL() << "expected DownloadFailure";
    } catch (const DownloadFailure& e) {
        EXPECT_EQ(e.fragment_index(), 3u);
        EXPECT_EQ(e.cause_kind(), ErrorKind::ShapeMismatch);
    }
}

TEST_F(DownloadCoordinatorTest, ExpiredDeadlineIsTimeout) {
    DownloadPolicy policy;
    policy.timeout = milliseconds(-1);
    try {
        downloader_.download_all(manifest_, policy);
        FAIL() << "expected DownloadFailure";
    } catch (const DownloadFailure& e) {
        EXPECT_EQ(e.fragment_index(), 0u);
        EXPECT_EQ(e.cause_kind(), ErrorKind::Timeout);
    }
}

// --- PipelineDriver ---

class PipelineDriverTest : public ::testing::Test {
protected:
    void SetUp() override {
        fs::remove_all(work_dir_);
        fs::create_directories(work_dir_);
        source_ = striped_bytes(SCENARIO_LENGTH, SCENARIO_FRAGMENT);
        write_file(source_path_, source_);

        settings_.fragment_size = SCENARIO_FRAGMENT;
        settings_.max_parts = 10;
        settings_.upload = quick_policy(2, 3);
    }

    void TearDown() override {
        fs::remove_all(work_dir_);
    }

    PipelineDriver make_driver() {
        return PipelineDriver(client_, oracle_, pacer_, settings_);
    }

    fs::path work_dir_ = fs::temp_directory_path() / "fragxfer_pipeline_test";
    fs::path source_path_ = work_dir_ / "input.bin";
    fs::path output_dir_ = work_dir_ / "output";
    std::vector<uint8_t> source_;
    FakeStorageClient client_;
    MerkleFingerprintOracle oracle_;
    RecordingPacer pacer_;
    PipelineSettings settings_;
};

TEST_F(PipelineDriverTest, RoundTripReproducesTheSource) {
    PipelineDriver driver = make_driver();
    PipelineReport report = driver.run(source_path_, output_dir_);

    ASSERT_TRUE(report.succeeded()) << (report.failure ? report.failure->message : "");
    EXPECT_EQ(driver.state(), PipelineState::Done);
    EXPECT_FALSE(report.failure.has_value());

    ASSERT_EQ(report.manifest.size(), 4u);
    std::vector<uint64_t> lengths;
    for (const auto& r : report.manifest.receipts()) lengths.push_back(r.length);
    EXPECT_EQ(lengths, (std::vector<uint64_t>{300000, 300000, 300000, 100000}));

    ASSERT_EQ(report.verification.size(), 4u);
    for (const auto& result : report.verification) {
        EXPECT_TRUE(result.match);
    }

    EXPECT_EQ(report.output, PipelineDriver::final_path(output_dir_));
    EXPECT_EQ(report.bytes_written, SCENARIO_LENGTH);
    EXPECT_EQ(read_file(report.output), source_);
    EXPECT_TRUE(fs::exists(PipelineDriver::manifest_path(output_dir_)));
    EXPECT_TRUE(fs::exists(PipelineDriver::staging_path(output_dir_) / "part_03.bin"));
    EXPECT_EQ(pacer_.nonzero_delays(), (std::vector<milliseconds>{milliseconds(5000)}));

    std::ostringstream summary;
    report.print_summary(summary);
    EXPECT_NE(summary.str().find("Total parts: 4"), std::string::npos);
}

TEST_F(PipelineDriverTest, InMemorySourceRoundTrip) {
    std::vector<uint8_t> bytes = patterned_bytes(4321);
    settings_.fragment_size = 1000;
    PipelineDriver driver = make_driver();

    PipelineReport report = driver.run(std::make_unique<std::istringstream>(std::string(bytes.begin(), bytes.end())),
                                       "memory.bin", output_dir_);
    ASSERT_TRUE(report.succeeded());
    EXPECT_EQ(report.manifest.source_name, "memory.bin");
    EXPECT_EQ(report.manifest.size(), 5u);
    EXPECT_EQ(read_file(report.output), bytes);
}

TEST_F(PipelineDriverTest, UploadFailureStopsWithPartialManifest) {
    client_.upload_hook = [](const std::vector<uint8_t>& bytes) {
        if (bytes[0] == 2) throw NetworkFailure("node unavailable");
    };
    PipelineDriver driver = make_driver();
    PipelineReport report = driver.run(source_path_, output_dir_);

    EXPECT_EQ(report.state, PipelineState::Failed);
    EXPECT_EQ(driver.state(), PipelineState::Failed);
    ASSERT_TRUE(report.failure.has_value());
    EXPECT_EQ(report.failure->stage, Stage::Upload);
    EXPECT_EQ(report.failure->cause_kind, ErrorKind::NetworkFailure);
    EXPECT_EQ(report.failure->fragment_index, std::optional<uint32_t>(2));
    EXPECT_EQ(report.manifest.size(), 2u);
    EXPECT_EQ(client_.attempts_for(2), 3);

    TransferManifest saved = ManifestFile(PipelineDriver::manifest_path(output_dir_)).load();
    EXPECT_EQ(saved.size(), 2u);
    EXPECT_EQ(client_.download_calls(), 0);
    EXPECT_FALSE(fs::exists(PipelineDriver::final_path(output_dir_)));
}

TEST_F(PipelineDriverTest, TruncationIsRefusedUnlessAllowed) {
    settings_.max_parts = 3;
    PipelineDriver driver = make_driver();
    PipelineReport report = driver.run(source_path_, output_dir_);

    ASSERT_TRUE(report.failure.has_value());
    EXPECT_EQ(report.failure->stage, Stage::Fragment);
    EXPECT_EQ(report.failure->cause_kind, ErrorKind::ConfigInvalid);
    EXPECT_EQ(client_.upload_calls(), 0);

    settings_.allow_truncation = true;
    PipelineDriver lenient = make_driver();
    PipelineReport truncated = lenient.run(source_path_, output_dir_);
    ASSERT_TRUE(truncated.succeeded());
    EXPECT_EQ(truncated.bytes_written, 900000u);
    std::vector<uint8_t> prefix(source_.begin(), source_.begin() + 900000);
    EXPECT_EQ(read_file(truncated.output), prefix);
}

TEST_F(PipelineDriverTest, MissingSourceFailsFragmentStage) {
    PipelineDriver driver = make_driver();
    PipelineReport report = driver.run(work_dir_ / "missing.bin", output_dir_);
    ASSERT_TRUE(report.failure.has_value());
    EXPECT_EQ(report.failure->stage, Stage::Fragment);
    EXPECT_EQ(report.failure->cause_kind, ErrorKind::IOFailure);
}

TEST_F(PipelineDriverTest, DownloadFailureNamesFragment) {
    Fingerprint fourth = oracle_.fingerprint(std::vector<uint8_t>(source_.begin() + 900000, source_.end()));
    client_.download_hook = [fourth](const Fingerprint& fp) {
        if (fp == fourth) throw NetworkFailure("timeout talking to node");
    };
    PipelineDriver driver = make_driver();
    PipelineReport report = driver.run(source_path_, output_dir_);

    ASSERT_TRUE(report.failure.has_value());
    EXPECT_EQ(report.failure->stage, Stage::Download);
    EXPECT_EQ(report.failure->cause_kind, ErrorKind::NetworkFailure);
    EXPECT_EQ(report.failure->fragment_index, std::optional<uint32_t>(3));
    EXPECT_EQ(report.manifest.size(), 4u);
}

TEST_F(PipelineDriverTest, CorruptedFragmentFailsVerification) {
    Fingerprint second = oracle_.fingerprint(std::vector<uint8_t>(source_.begin() + 300000, source_.begin() + 600000));
    client_.download_hook = [this, second](const Fingerprint& fp) {
        if (fp == second) client_.corrupt(fp);
    };
    settings_.download.verify_proof = false;
    PipelineDriver driver = make_driver();
    PipelineReport report = driver.run(source_path_, output_dir_);

    ASSERT_TRUE(report.failure.has_value());
    EXPECT_EQ(report.failure->stage, Stage::Verify);
    EXPECT_EQ(report.failure->cause_kind, ErrorKind::IntegrityMismatch);
    EXPECT_EQ(report.failure->fragment_index, std::optional<uint32_t>(1));
    ASSERT_EQ(report.verification.size(), 4u);
    EXPECT_FALSE(report.verification[1].match);
    EXPECT_FALSE(fs::exists(PipelineDriver::final_path(output_dir_)));
}

TEST_F(PipelineDriverTest, CorruptedFragmentWithProofFailsDownload) {
    Fingerprint second = oracle_.fingerprint(std::vector<uint8_t>(source_.begin() + 300000, source_.begin() + 600000));
    client_.download_hook = [this, second](const Fingerprint& fp) {
        if (fp == second) client_.corrupt(fp);
    };
    PipelineDriver driver = make_driver();
    PipelineReport report = driver.run(source_path_, output_dir_);

    ASSERT_TRUE(report.failure.has_value());
    EXPECT_EQ(report.failure->stage, Stage::Download);
    EXPECT_EQ(report.failure->cause_kind, ErrorKind::ProofInvalid);
    EXPECT_EQ(report.failure->fragment_index, std::optional<uint32_t>(1));
}

TEST_F(PipelineDriverTest, SeparateUploadAndDownloadPhases) {
    {
        PipelineDriver uploader = make_driver();
        PipelineReport uploaded = uploader.upload_file(source_path_, output_dir_);
        ASSERT_TRUE(uploaded.succeeded());
        EXPECT_EQ(uploaded.manifest.size(), 4u);
        EXPECT_EQ(client_.download_calls(), 0);
    }

    PipelineDriver downloader = make_driver();
    PipelineReport report = downloader.download_file(output_dir_);
    ASSERT_TRUE(report.succeeded()) << (report.failure ? report.failure->message : "");
    EXPECT_EQ(report.verification.size(), 4u);
    EXPECT_EQ(read_file(report.output), source_);
}

TEST_F(PipelineDriverTest, UploadResumesFromSavedManifest) {
    bool fail_third = true;
    client_.upload_hook = [&fail_third](const std::vector<uint8_t>& bytes) {
        if (fail_third && bytes[0] == 2) throw NetworkFailure("flaky");
    };

    PipelineDriver driver = make_driver();
    PipelineReport first = driver.upload_file(source_path_, output_dir_);
    ASSERT_FALSE(first.succeeded());
    EXPECT_EQ(first.manifest.size(), 2u);

    fail_third = false;
    PipelineReport resumed = driver.upload_file(source_path_, output_dir_, true);
    ASSERT_TRUE(resumed.succeeded()) << (resumed.failure ? resumed.failure->message : "");
    EXPECT_EQ(resumed.manifest.size(), 4u);
    EXPECT_EQ(client_.attempts_for(0), 1);
    EXPECT_EQ(client_.attempts_for(1), 1);

    PipelineReport downloaded = driver.download_file(output_dir_);
    ASSERT_TRUE(downloaded.succeeded());
    EXPECT_EQ(read_file(downloaded.output), source_);
}

TEST_F(PipelineDriverTest, ResumeAfterSourceEditIsRefused) {
    bool fail_third = true;
    client_.upload_hook = [&fail_third](const std::vector<uint8_t>& bytes) {
        if (fail_third && bytes[0] == 2) throw NetworkFailure("flaky");
    };

    PipelineDriver driver = make_driver();
    PipelineReport first = driver.upload_file(source_path_, output_dir_);
    ASSERT_FALSE(first.succeeded());
    ASSERT_EQ(first.manifest.size(), 2u);

    std::vector<uint8_t> edited = source_;
    for (auto& byte : edited) byte ^= 0xFF;
    write_file(source_path_, edited);
    fail_third = false;

    PipelineReport resumed = driver.upload_file(source_path_, output_dir_, true);
    ASSERT_TRUE(resumed.failure.has_value());
    EXPECT_EQ(resumed.failure->stage, Stage::Upload);
    EXPECT_EQ(resumed.failure->cause_kind, ErrorKind::IntegrityMismatch);
    EXPECT_EQ(resumed.failure->fragment_index, std::optional<uint32_t>(0));
    EXPECT_EQ(client_.attempts_for(0xFF), 0);

    TransferManifest saved = ManifestFile(PipelineDriver::manifest_path(output_dir_)).load();
    EXPECT_EQ(saved.size(), 2u);
    EXPECT_EQ(saved[0].fingerprint, first.manifest[0].fingerprint);
}

TEST_F(PipelineDriverTest, DownloadWithoutManifestFails) {
    PipelineDriver driver = make_driver();
    PipelineReport report = driver.download_file(output_dir_);
    ASSERT_TRUE(report.failure.has_value());
    EXPECT_EQ(report.failure->stage, Stage::Download);
    EXPECT_EQ(report.failure->cause_kind, ErrorKind::IOFailure);
}

TEST(PipelineSettingsTest, VeryLongTimeoutsDoNotExpireImmediately) {
    Config config = Config::parse(R"({
        "upload": {"timeout_minutes": 200000000},
        "download": {"timeout_minutes": 200000000}
    })");
    PipelineSettings settings = PipelineSettings::from_config(config);

    EXPECT_FALSE(Deadline::after(settings.upload.overall_timeout).expired());
    EXPECT_FALSE(Deadline::after(settings.upload.attempt_timeout).expired());
    EXPECT_FALSE(Deadline::after(settings.download.timeout).expired());
}

TEST(PipelineSettingsTest, BuiltFromConfig) {
    Config config = Config::parse(R"({
        "file": {"fragment_size": 1000, "number_of_parts": 4},
        "upload": {"max_retries": 2, "timeout_minutes": 5, "batch_size": 3, "batch_cooldown_seconds": 1},
        "download": {"verify_proof": false, "parallelism": 2}
    })");
    PipelineSettings settings = PipelineSettings::from_config(config);

    EXPECT_EQ(settings.fragment_size, 1000u);
    EXPECT_EQ(settings.max_parts, 4u);
    EXPECT_EQ(settings.upload.batch_size, 3u);
    EXPECT_EQ(settings.upload.max_retries, 2);
    EXPECT_EQ(settings.upload.overall_timeout, std::chrono::minutes(5));
    EXPECT_EQ(settings.upload.attempt_timeout, std::chrono::minutes(5));
    EXPECT_EQ(settings.upload.batch_cooldown, std::chrono::seconds(1));
    EXPECT_FALSE(settings.download.verify_proof);
    EXPECT_EQ(settings.download.parallelism, 2u);
}
