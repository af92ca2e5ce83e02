#include <cxxopts.hpp>
#include <iostream>
#include <string>
#include <vector>
#include "deepmerge/Errors.hpp"
#include "deepmerge/JsonMerge.hpp"
#include "deepmerge/Loader.hpp"

using namespace deepmerge;

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("deepmerge", "Apply JSON Merge Patch (RFC 7396) documents to a JSON/TOML document");
        options.positional_help("BASE PATCH [PATCH...]");

        options.add_options()
            ("to", "Output format: json or toml (default: extension of FILE, else format of BASE)", cxxopts::value<std::string>())
            ("indent", "JSON indentation, negative for compact", cxxopts::value<int>()->default_value("2"))
            ("o,out", "Write the result to FILE instead of stdout", cxxopts::value<std::string>())
            ("h,help", "Show help");

        options.add_options()
            ("documents", "Base document followed by patches", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"documents"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("documents")) {
            std::cout << options.help() << "\n";
            return 0;
        }

        auto paths = result["documents"].as<std::vector<std::string>>();
        if (paths.size() < 2) {
            std::cerr << "Error: need a base document and at least one patch\n";
            return 1;
        }

        // --to wins, then the -o extension, then BASE's format
        DocumentFormat format;
        if (result.count("to")) {
            format = format_from_name(result["to"].as<std::string>());
        } else if (result.count("out")) {
            format = format_from_extension(result["out"].as<std::string>());
        } else {
            format = format_from_extension(paths[0]);
        }

        Value merged = load_document(paths[0]);
        for (size_t i = 1; i < paths.size(); ++i) {
            merge_patch(merged, load_document(paths[i]));
        }

        const int indent = result["indent"].as<int>();
        if (result.count("out")) {
            const std::string out = result["out"].as<std::string>();
            write_document(out, merged, format, indent);
            std::cout << "Wrote " << (format == DocumentFormat::Toml ? "TOML" : "JSON")
                      << " to " << out << "\n";
        } else {
            std::cout << dump_document(merged, format, indent) << "\n";
        }
        return 0;

    } catch (const DeepMergeError& err) {
        std::cerr << "Error: " << err.what() << "\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
