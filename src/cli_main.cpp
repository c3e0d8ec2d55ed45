#include <cxxopts.hpp>
#include <iostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "pathpatch/Errors.hpp"
#include "pathpatch/Flatten.hpp"
#include "pathpatch/KeyPath.hpp"
#include "pathpatch/Loader.hpp"
#include "pathpatch/Parse.hpp"
#include "pathpatch/Patch.hpp"
#include "pathpatch/Reconcile.hpp"
#include "pathpatch/TextEncoding.hpp"

using namespace pathpatch;

namespace {

/**
 * @brief Split "PATH=VALUE" at the first '='
 * @return false if there is no '='
 */
bool split_assignment(const std::string& raw, std::string& path, std::string& value) {
    auto pos = raw.find('=');
    if (pos == std::string::npos) return false;
    path = raw.substr(0, pos);
    value = raw.substr(pos + 1);
    return true;
}

/**
 * @brief Append the entries of a JSON patch payload to edits
 */
Result<void> append_patch_payload(const Bytes& payload, EditList& edits) {
    auto patch_set = parse_patch_set(payload);
    if (!patch_set) {
        return patch_set.error();
    }
    for (const auto& [path, value] : *patch_set) {
        edits.emplace_back(path, value);
    }
    return {};
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("pathpatch", "Apply key-path patches to JSON/TOML documents");
        options.positional_help("COMMAND [ARGS]");

        options.add_options()
            ("i,input", "Path to JSON/TOML document", cxxopts::value<std::string>())
            ("s,set", "Edit as PATH=VALUE (repeatable, applied in order)", cxxopts::value<std::vector<std::string>>())
            ("p,patch", "Path to a JSON patch file mapping key paths to values", cxxopts::value<std::string>())
            ("patch-json", "JSON patch given inline", cxxopts::value<std::string>())
            ("e,encoding", "Text encoding for --patch-json", cxxopts::value<std::string>()->default_value("utf-8"))
            ("o,out", "Write the result to FILE instead of stdout", cxxopts::value<std::string>())
            ("to", "Output format for stdout: json|toml", cxxopts::value<std::string>()->default_value("json"))
            ("indent", "JSON indentation", cxxopts::value<int>()->default_value("2"))
            ("h,help", "Show help");

        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            std::cout << options.help() << "\n";
            std::cout << "Commands: apply | get PATH | paths\n";
            return 0;
        }

        auto cmdv = result["command"].as<std::vector<std::string>>();
        const std::string cmd = cmdv[0];

        if (!result.count("input")) {
            std::cerr << "Error: --input must be provided\n";
            return 1;
        }
        Value document = load_document_file(result["input"].as<std::string>());
        const int indent = result["indent"].as<int>();

        // GET
        if (cmd == "get") {
            if (cmdv.size() < 2) {
                std::cerr << "Error: insufficient arguments for command 'get'\n";
                return 1;
            }
            const std::string path = cmdv[1];
            auto found = find_by_key_path(document, path);
            if (!found) {
                std::cerr << "Error: " << found.error().message() << "\n";
                return 1;
            }
            if (*found == nullptr) {
                std::cerr << "Key not found: " << path << "\n";
                return 1;
            }
            std::cout << (*found)->dump(indent) << "\n";
            return 0;
        }

        // PATHS
        if (cmd == "paths") {
            for (const auto& [path, value] : flatten_to_key_paths(document)) {
                std::cout << path << " = " << value.dump() << "\n";
            }
            return 0;
        }

        // APPLY
        if (cmd == "apply") {
            EditList edits;

            if (result.count("patch")) {
                auto appended = append_patch_payload(
                    read_file_bytes(result["patch"].as<std::string>()), edits);
                if (!appended) {
                    std::cerr << "Error: " << appended.error().message() << "\n";
                    return 1;
                }
            }

            if (result.count("patch-json")) {
                const std::string name = result["encoding"].as<std::string>();
                auto encoding = text_encoding_from_name(name);
                if (!encoding) {
                    std::cerr << "Error: "
                              << PatchError::serialization_failed("Unknown text encoding '" + name + "'").message()
                              << "\n";
                    return 1;
                }
                auto bytes = encode_text(result["patch-json"].as<std::string>(), *encoding);
                if (!bytes) {
                    std::cerr << "Error: " << bytes.error().message() << "\n";
                    return 1;
                }
                auto appended = append_patch_payload(*bytes, edits);
                if (!appended) {
                    std::cerr << "Error: " << appended.error().message() << "\n";
                    return 1;
                }
            }

            if (result.count("set")) {
                for (const auto& raw : result["set"].as<std::vector<std::string>>()) {
                    std::string path, value;
                    if (!split_assignment(raw, path, value)) {
                        std::cerr << "Error: expected PATH=VALUE, got '" << raw << "'\n";
                        return 1;
                    }
                    edits.emplace_back(path, parse_value(value));
                }
            }

            auto patched = apply_edit_list(std::move(document), edits);
            if (!patched) {
                std::cerr << "Error: " << patched.error().message() << "\n";
                return 1;
            }

            if (result.count("out")) {
                const std::string out = result["out"].as<std::string>();
                write_document_file(out, *patched, indent);
                std::cout << "Wrote " << edits.size() << " edit(s) to " << out << "\n";
            } else if (result["to"].as<std::string>() == "toml") {
                std::cout << to_toml_string(*patched) << "\n";
            } else {
                std::cout << patched->dump(indent) << "\n";
            }
            return 0;
        }

        std::cerr << "Unknown command: " << cmd << "\n";
        return 1;

    } catch (const DocumentError& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
