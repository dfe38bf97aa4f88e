#include "cli/cli.hpp"
#include "common/logger.hpp"
#include "files/sample_file.hpp"
#include "storage/manifest_file.hpp"
#include <iostream>
#include <algorithm>
#include <filesystem>
#include <iterator>

namespace fs = std::filesystem;

namespace {
    // Positional argument i, or fallback when it was not given.
    std::string arg_or(const std::vector<std::string>& args, size_t i, const std::string& fallback) {
        return i < args.size() ? args[i] : fallback;
    }

    std::vector<std::string> without_flags(const std::vector<std::string>& args) {
        std::vector<std::string> positional;
        std::copy_if(args.begin(), args.end(), std::back_inserter(positional),
                     [](const std::string& a) { return a.rfind("--", 0) != 0; });
        return positional;
    }

    bool has_flag(const std::vector<std::string>& args, const std::string& flag) {
        return std::find(args.begin(), args.end(), flag) != args.end();
    }
}

CLI::CLI(const Config& config, PipelineDriver& driver, LocalFragmentStore& store)
    : config_(config), driver_(driver), store_(store) {}

void CLI::print_help(std::ostream& os) {
    os << "Usage: fragxfer <command> [arguments] [--config <file>]\n"
       << "Commands:\n"
       << "  run [input] [output_dir]          - Split, upload, download, verify and combine\n"
       << "  upload [input] [output_dir]       - Split and upload; writes <output_dir>/manifest.json\n"
       << "         [--resume]                   continue from the saved partial manifest\n"
       << "  download [output_dir]             - Download, verify and combine from the saved manifest\n"
       << "  generate [path] [size_bytes]      - Write a deterministic test file\n"
       << "  manifest [output_dir]             - Print the saved manifest\n"
       << "  status                            - Show what the local fragment store holds\n"
       << "  help                              - Show this help\n"
       << std::endl;
}

int CLI::handle_command(const std::string& cmd, const std::vector<std::string>& args) {
    if (cmd == "run") return cmd_run(args);
    if (cmd == "upload") return cmd_upload(args);
    if (cmd == "download") return cmd_download(args);
    if (cmd == "generate") return cmd_generate(args);
    if (cmd == "manifest") return cmd_manifest(args);
    if (cmd == "status") return cmd_status(args);
    if (cmd == "help" || cmd == "--help" || cmd == "-h") {
        print_help();
        return 0;
    }
    std::cerr << "Unknown command: " << cmd << std::endl;
    print_help(std::cerr);
    return 1;
}

void CLI::prepare_input(const std::string& input_file) {
    if (!config_.file.generate_test_file) return;
    SampleFile::generate(input_file, config_.file.test_file_size);
}

int CLI::cmd_run(const std::vector<std::string>& args) {
    auto positional = without_flags(args);
    std::string input = arg_or(positional, 0, config_.file.input_file);
    fs::path output_dir = arg_or(positional, 1, config_.file.output_directory);

    prepare_input(input);
    PipelineReport report = driver_.run(input, output_dir);
    report.print_summary(std::cout);
    return report.succeeded() ? 0 : 1;
}

int CLI::cmd_upload(const std::vector<std::string>& args) {
    auto positional = without_flags(args);
    std::string input = arg_or(positional, 0, config_.file.input_file);
    fs::path output_dir = arg_or(positional, 1, config_.file.output_directory);
    bool resume = has_flag(args, "--resume");

    if (!resume) prepare_input(input);
    PipelineReport report = driver_.upload_file(input, output_dir, resume);
    report.print_summary(std::cout);
    if (report.succeeded()) {
        std::cout << "Manifest: " << PipelineDriver::manifest_path(output_dir).string() << std::endl;
    } else if (report.failure && report.failure->stage == Stage::Upload) {
        std::cout << "Run 'fragxfer upload --resume' to continue after part "
                  << report.manifest.size() << "." << std::endl;
    }
    return report.succeeded() ? 0 : 1;
}

int CLI::cmd_download(const std::vector<std::string>& args) {
    fs::path output_dir = arg_or(without_flags(args), 0, config_.file.output_directory);

    PipelineReport report = driver_.download_file(output_dir);
    report.print_summary(std::cout);
    return report.succeeded() ? 0 : 1;
}

int CLI::cmd_generate(const std::vector<std::string>& args) {
    auto positional = without_flags(args);
    std::string path = arg_or(positional, 0, config_.file.input_file);
    uint64_t size = config_.file.test_file_size;
    if (positional.size() > 1) {
        try {
            size = std::stoull(positional[1]);
        } catch (const std::exception&) {
            std::cerr << "Invalid size: " << positional[1] << std::endl;
            return 1;
        }
    }

    SampleFile::generate(path, size);
    std::cout << "Test file created: " << path << " (" << size << " bytes)" << std::endl;
    return 0;
}

int CLI::cmd_manifest(const std::vector<std::string>& args) {
    fs::path output_dir = arg_or(without_flags(args), 0, config_.file.output_directory);
    ManifestFile manifest_file(PipelineDriver::manifest_path(output_dir));
    if (!manifest_file.exists()) {
        std::cout << "No manifest at " << manifest_file.path().string() << std::endl;
        return 1;
    }
    manifest_file.load().print(std::cout);
    return 0;
}

int CLI::cmd_status(const std::vector<std::string>& args) {
    (void)args;
    std::cout << "Fragment store: " << config_.storage.database << "\n"
              << "Fragments:      " << store_.fragment_count() << "\n"
              << "Stored bytes:   " << store_.stored_bytes() << "\n"
              << "Transactions:   " << store_.transaction_count() << std::endl;
    if (config_.storage.capacity_bytes != 0) {
        std::cout << "Capacity:       " << config_.storage.capacity_bytes << " bytes" << std::endl;
    }
    return 0;
}
