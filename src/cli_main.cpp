#include <cxxopts.hpp>
#include <iostream>
#include <string>
#include <vector>
#include "tidymerge/Document.hpp"
#include "tidymerge/Errors.hpp"
#include "tidymerge/Merge.hpp"
#include "tidymerge/Parse.hpp"
#include "tidymerge/Settings.hpp"

using namespace tidymerge;

namespace {

void print_usage(const cxxopts::Options& options) {
    std::cout << options.help() << "\n";
    std::cout << "Commands:\n"
              << "  merge DOCUMENT ELEMENTS   merge ELEMENTS into DOCUMENT, write when changed\n"
              << "  check DOCUMENT ELEMENTS   exit 1 if merging would change DOCUMENT\n"
              << "  sort DOCUMENT             sort DOCUMENT's elements by key\n"
              << "  render DOCUMENT           print DOCUMENT as flat text\n";
}

} // namespace

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("tidymerge", "Merge elements into a document, keeping it sorted and its formatting intact");
        options.positional_help("COMMAND [ARGS]");

        options.add_options()
            ("c,config", "Path to JSON/TOML settings file", cxxopts::value<std::string>())
            ("p,prefix", "Env-var prefix for settings", cxxopts::value<std::string>()->default_value("TIDYMERGE"))
            ("overrides", "Comma-separated dot.key:value pairs", cxxopts::value<std::string>()->default_value(""))
            ("k,key", "Key selector: name | field:<dot.path>", cxxopts::value<std::string>())
            ("o,out", "Write result here instead of in place", cxxopts::value<std::string>())
            ("v,verbose", "Report merge details on stderr")
            ("h,help", "Show help");

        options.add_options()
            ("command", "Subcommand and arguments", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            print_usage(options);
            return 0;
        }

        LoadOptions load;
        if (result.count("config")) load.file_path = result["config"].as<std::string>();
        load.prefix = result["prefix"].as<std::string>();
        load.overrides = parse_overrides(result["overrides"].as<std::string>());
        if (result.count("key")) load.overrides["merge.key"] = result["key"].as<std::string>();
        if (result.count("verbose")) load.overrides["log.verbose"] = true;

        const Settings settings = Settings::load(load);
        const KeySelector key_of = settings.key_selector();
        const bool verbose = settings.verbose();

        auto cmdv = result["command"].as<std::vector<std::string>>();
        const std::string cmd = cmdv[0];

        auto expect_args = [&](size_t want) {
            if (cmdv.size() < want) {
                throw TidyMergeError("insufficient arguments for command '" + cmd + "'");
            }
        };

        auto output_path = [&](const std::string& document) {
            return result.count("out") ? result["out"].as<std::string>() : document;
        };

        // MERGE / CHECK
        if (cmd == "merge" || cmd == "check") {
            expect_args(3);
            const std::string& doc_path = cmdv[1];
            Container doc = load_document(doc_path);
            auto elements = load_elements(cmdv[2]);
            const size_t incoming = elements.size();

            MergeReport report = merge_elements_report(doc, std::move(elements), key_of);
            if (verbose) {
                std::cerr << "[tidymerge] " << incoming << " incoming, "
                          << report.inserted << " inserted, "
                          << report.replaced << " replaced"
                          << (report.resorted ? ", existing elements re-sorted" : "") << "\n";
            }

            if (cmd == "check") {
                std::cout << (report.changed ? "changed" : "unchanged") << "\n";
                return report.changed ? 1 : 0;
            }

            if (!report.changed) {
                std::cout << "No changes to " << doc_path << "\n";
                return 0;
            }
            const std::string out = output_path(doc_path);
            write_document(out, doc, settings.output_indent());
            std::cout << "Updated " << out << "\n";
            return 0;
        }

        // SORT
        if (cmd == "sort") {
            expect_args(2);
            const std::string& doc_path = cmdv[1];
            Container doc = load_document(doc_path);
            if (!sort_elements(doc, key_of)) {
                std::cout << "Already sorted: " << doc_path << "\n";
                return 0;
            }
            const std::string out = output_path(doc_path);
            write_document(out, doc, settings.output_indent());
            std::cout << "Sorted " << out << "\n";
            return 0;
        }

        // RENDER
        if (cmd == "render") {
            expect_args(2);
            std::cout << render(load_document(cmdv[1]));
            return 0;
        }

        std::cerr << "Unknown command: " << cmd << "\n";
        return 1;

    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
