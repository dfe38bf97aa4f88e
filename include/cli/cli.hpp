#ifndef FRAGXFER_CLI_HPP
#define FRAGXFER_CLI_HPP

#include <string>
#include <vector>
#include <iostream>

#include "../common/config.hpp"
#include "../pipeline/pipeline_driver.hpp"
#include "../storage/local_fragment_store.hpp"

class CLI {
public:
    CLI(const Config& config, PipelineDriver& driver, LocalFragmentStore& store);

    // Runs one command; returns the process exit code.
    int handle_command(const std::string& cmd, const std::vector<std::string>& args);

    static void print_help(std::ostream& os = std::cout);

private:
    int cmd_run(const std::vector<std::string>& args);
    int cmd_upload(const std::vector<std::string>& args);
    int cmd_download(const std::vector<std::string>& args);
    int cmd_generate(const std::vector<std::string>& args);
    int cmd_manifest(const std::vector<std::string>& args);
    int cmd_status(const std::vector<std::string>& args);

    // Creates the input file first when file.generate_test_file is set.
    void prepare_input(const std::string& input_file);

    const Config& config_;
    PipelineDriver& driver_;
    LocalFragmentStore& store_;
};

#endif // FRAGXFER_CLI_HPP
