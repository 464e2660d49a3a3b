/**
 * @file cli_main.cpp
 * @brief treepatch command-line tool
 *
 * Commands:
 * - apply DOC INSTR [--out FILE]  apply an instruction (or batch) to a document
 * - inverse DOC INSTR             print the undo batch for an instruction file
 * - validate INSTR                decode and validate an instruction file
 * - check DOC INSTR               verify that apply followed by the inverse
 *                                 restores the document
 */

#include "treepatch/Batch.hpp"
#include "treepatch/Codec.hpp"
#include "treepatch/Config.hpp"
#include "treepatch/Errors.hpp"
#include "treepatch/Loader.hpp"
#include "treepatch/Path.hpp"

#include <cxxopts.hpp>
#include <glog/logging.h>

#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace treepatch;

namespace {

const char* const kCommands =
    "Commands: apply DOC INSTR [--out FILE] | inverse DOC INSTR | validate INSTR | "
    "check DOC INSTR\n";

std::string describe(const Error& err) {
    std::string out = std::string(to_string(err.kind)) + " error: " + err.message;
    if (!err.path.empty()) {
        out += " [path: " + join_path(err.path) + "]";
    }
    return out;
}

std::vector<Instruction> load_instructions(const std::string& file) {
    auto batch = decode_batch(load_document(file));
    if (!batch) {
        throw std::runtime_error("Invalid instruction file '" + file + "': " +
                                 describe(batch.error()));
    }
    return std::move(batch).value();
}

/**
 * @brief Apply, invert and re-apply; returns the forward result
 */
Value round_trip(const Value& doc, const std::vector<Instruction>& batch) {
    auto undo = inverse_all(doc, batch);
    if (!undo) {
        throw std::runtime_error(describe(undo.error()));
    }
    auto after = apply_all(doc, batch);
    if (!after) {
        throw std::runtime_error(describe(after.error()));
    }
    auto restored = apply_all(after.value(), undo.value());
    if (!restored) {
        throw std::runtime_error("Inverse failed to apply: " + describe(restored.error()));
    }
    if (restored.value() != doc) {
        throw std::runtime_error("Round trip mismatch: inverse did not restore the document");
    }
    return std::move(after).value();
}

std::map<std::string, std::string> parse_overrides(const std::vector<std::string>& items) {
    std::map<std::string, std::string> out;
    for (const auto& item : items) {
        auto eq = item.find('=');
        if (eq == std::string::npos || eq == 0) {
            throw std::runtime_error("Invalid --set '" + item + "' (expected key=value)");
        }
        out[item.substr(0, eq)] = item.substr(eq + 1);
    }
    return out;
}

} // anonymous namespace

int main(int argc, char** argv) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;

    try {
        cxxopts::Options options("treepatch", "Apply, invert and check path-addressed edits on JSON/TOML documents");
        options.positional_help("COMMAND [ARGS]");

        options.add_options()
            ("s,settings", "Path to JSON/TOML settings file", cxxopts::value<std::string>())
            ("env-prefix", "Env-var prefix for settings", cxxopts::value<std::string>()->default_value("TREEPATCH"))
            ("set", "Settings override key=value (repeatable)", cxxopts::value<std::vector<std::string>>())
            ("o,out", "Write the resulting document to FILE", cxxopts::value<std::string>())
            ("h,help", "Show help");

        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            std::cout << options.help() << "\n" << kCommands;
            return 0;
        }

        LoadOptions load;
        if (result.count("settings")) load.file_path = result["settings"].as<std::string>();
        load.prefix = result["env-prefix"].as<std::string>();
        if (result.count("set")) {
            load.overrides = parse_overrides(result["set"].as<std::vector<std::string>>());
        }
        Settings settings = load_settings(load);
        FLAGS_v = settings.verbosity;

        auto cmdv = result["command"].as<std::vector<std::string>>();
        const std::string cmd = cmdv[0];

        auto expect_args = [&](std::size_t want) {
            if (cmdv.size() != want) {
                throw std::runtime_error("Wrong number of arguments for command '" + cmd + "'");
            }
        };

        // APPLY
        if (cmd == "apply") {
            expect_args(3);
            Value doc = load_document(cmdv[1]);
            auto batch = load_instructions(cmdv[2]);

            Value out;
            if (settings.check_round_trip) {
                out = round_trip(doc, batch);
            } else {
                auto applied = apply_all(doc, batch);
                if (!applied) {
                    std::cerr << "Error: " << describe(applied.error()) << "\n";
                    return 1;
                }
                out = std::move(applied).value();
            }

            if (result.count("out")) {
                const auto path = result["out"].as<std::string>();
                write_document(path, out, settings.indent);
                LOG(INFO) << "Wrote " << path;
            } else {
                std::cout << dump_document(out, settings.format, settings.indent) << "\n";
            }
            return 0;
        }

        // INVERSE
        if (cmd == "inverse") {
            expect_args(3);
            Value doc = load_document(cmdv[1]);
            auto batch = load_instructions(cmdv[2]);
            auto undo = inverse_all(doc, batch);
            if (!undo) {
                std::cerr << "Error: " << describe(undo.error()) << "\n";
                return 1;
            }
            std::cout << encode_batch(undo.value()).dump(settings.indent) << "\n";
            return 0;
        }

        // VALIDATE
        if (cmd == "validate") {
            expect_args(2);
            auto batch = load_instructions(cmdv[1]);
            std::cout << "OK: " << batch.size() << " instruction(s)\n";
            return 0;
        }

        // CHECK
        if (cmd == "check") {
            expect_args(3);
            Value doc = load_document(cmdv[1]);
            auto batch = load_instructions(cmdv[2]);
            round_trip(doc, batch);
            std::cout << "Round trip OK: " << batch.size() << " instruction(s)\n";
            return 0;
        }

        std::cerr << "Error: Unknown command '" << cmd << "'\n" << kCommands;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
