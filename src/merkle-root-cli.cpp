// Copyright Cartesi and individual authors (see AUTHORS)
// SPDX-License-Identifier: Apache-2.0
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
// http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
//

#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "block-sequence.h"
#include "hash-algorithm.h"
#include "hex-util.h"
#include "protobuf-util.h"

/// \file
/// \brief Computes the Merkle tree root hash of a sequence of words or serialized blocks.

using namespace merkle_root;

namespace {

struct cli_settings {
    std::string hash_name{"keccak-256"};
    std::string filler{};
    std::string input_path{};
    std::string proto_input_path{};
    std::string proto_output_path{};
    std::string log_level{"warn"};
    std::vector<std::string> words{};
};

/// \brief Accepts exactly the names parse_hash_algorithm() accepts
CLI::Validator get_hash_algorithm_validator(void) {
    std::string names;
    for (auto alg : hash_algorithms) {
        names += names.empty() ? "{" : ",";
        names += get_hash_algorithm_name(alg);
    }
    names += "}";
    return CLI::Validator{[](std::string &name) -> std::string {
                              try {
                                  parse_hash_algorithm(name);
                              } catch (const std::invalid_argument &e) {
                                  return e.what();
                              }
                              return {};
                          },
        names, "HASH_ALGORITHM"};
}

std::string read_text(const std::string &path) {
    if (path == "-") {
        return {std::istreambuf_iterator<char>{std::cin}, std::istreambuf_iterator<char>{}};
    }
    std::ifstream file{path, std::ios::binary};
    if (!file) {
        throw std::runtime_error{"unable to open '" + path + "' for reading"};
    }
    return {std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};
}

block_sequence read_blocks(const cli_settings &settings) {
    if (!settings.proto_input_path.empty()) {
        std::ifstream file{settings.proto_input_path, std::ios::binary};
        if (!file) {
            throw std::runtime_error{"unable to open '" + settings.proto_input_path + "' for reading"};
        }
        MerkleRoot::BlockSequence proto_blocks;
        if (!proto_blocks.ParseFromIstream(&file)) {
            throw std::runtime_error{"'" + settings.proto_input_path + "' is not a serialized BlockSequence"};
        }
        return get_proto_block_sequence(proto_blocks);
    }
    if (!settings.input_path.empty()) {
        return tokenize_whitespace(read_text(settings.input_path));
    }
    std::ostringstream text;
    for (const auto &word : settings.words) {
        text << word << ' ';
    }
    return tokenize_whitespace(text.str());
}

void write_report(const std::string &path, hash_algorithm alg, const block_sequence &blocks,
    const std::vector<unsigned char> &root) {
    MerkleRoot::RootReport report;
    set_proto_root_report(alg, blocks.size(), root, &report);
    std::ofstream file{path, std::ios::binary | std::ios::trunc};
    if (!file || !report.SerializeToOstream(&file)) {
        throw std::runtime_error{"unable to write root report to '" + path + "'"};
    }
}

} // namespace

int main(int argc, char *argv[]) {
    CLI::App app{"Computes the root hash of a balanced Merkle tree over whitespace-delimited words"};

    cli_settings settings;
    app.add_option("words", settings.words, "Words to hash (ignored with --input or --proto-input)");
    app.add_option("--hash", settings.hash_name, "Hash algorithm")
        ->check(get_hash_algorithm_validator())
        ->capture_default_str();
    app.add_option("--filler", settings.filler, "Block used to pad the base layer to a power of two");
    auto *input = app.add_option("--input", settings.input_path, "Read words from file ('-' for stdin)");
    app.add_option("--proto-input", settings.proto_input_path, "Read blocks from a serialized BlockSequence")
        ->check(CLI::ExistingFile)
        ->excludes(input);
    app.add_option("--proto-output", settings.proto_output_path, "Also write a serialized RootReport");
    app.add_option("--log-level", settings.log_level, "Log level")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical", "off"}))
        ->capture_default_str();

    CLI11_PARSE(app, argc, argv)

    spdlog::set_default_logger(spdlog::stderr_color_mt("merkle-root"));
    spdlog::set_level(spdlog::level::from_str(settings.log_level));

    try {
        const auto alg = parse_hash_algorithm(settings.hash_name);
        const auto blocks = read_blocks(settings);
        spdlog::info("computing {} root of {} blocks", get_hash_algorithm_name(alg), blocks.size());
        root_calculator_config config;
        config.filler = settings.filler;
        const auto root = get_root_hash(alg, blocks, config);
        if (!settings.proto_output_path.empty()) {
            write_report(settings.proto_output_path, alg, blocks, root);
        }
        std::cout << to_hex(root) << '\n';
    } catch (const std::exception &e) {
        spdlog::error("{}", e.what());
        return 1;
    }
    return 0;
}
