#include <fmt/args.h>
#include <fmt/format.h>

#include <argparse.hpp>
#include <iostream>
#include <optional>
#include <regex>
#include <rfmt/common.hpp>
#include <rfmt/rmanifest.hpp>

using namespace rfmt;

struct Main {
    struct CLI {
        std::string manifest = {};
        std::string format = {};
        std::optional<std::regex> langs = {};
        std::optional<std::regex> path = {};
    } cli = {};

    auto parse_args(int argc, char** argv) -> void {
        argparse::ArgumentParser program(fs::path(argv[0]).filename().generic_string());
        program.add_description("Lists files in manifest.");
        program.add_argument("manifest").help("Manifest file to read from.").required();

        program.add_argument("--format")
            .help("Format output.")
            .default_value(std::string("{path},{size},{fileId},{langs}"));

        program.add_argument("-l", "--filter-lang")
            .help("Filter: language(none for international files).")
            .default_value(std::optional<std::regex>{})
            .action([](std::string const& value) -> std::optional<std::regex> {
                if (value.empty()) {
                    return std::nullopt;
                } else {
                    return std::regex{value, std::regex::optimize | std::regex::icase};
                }
            });
        program.add_argument("-p", "--filter-path")
            .help("Filter: path with regex match.")
            .default_value(std::optional<std::regex>{})
            .action([](std::string const& value) -> std::optional<std::regex> {
                if (value.empty()) {
                    return std::nullopt;
                } else {
                    return std::regex{value, std::regex::optimize | std::regex::icase};
                }
            });

        program.parse_args(argc, argv);

        cli.format = program.get<std::string>("--format");
        cli.langs = program.get<std::optional<std::regex>>("--filter-lang");
        cli.path = program.get<std::optional<std::regex>>("--filter-path");
        cli.manifest = program.get<std::string>("manifest");
    }

    auto run() -> void {
        auto manifest = RMAN::read_file(cli.manifest);
        auto resolver = RMAN::Resolver(manifest);
        for (auto const& file : manifest.body.files) {
            auto path = resolver.path(file);
            auto langs = resolver.langs(file);
            if (cli.path && !std::regex_search(path, *cli.path)) {
                continue;
            }
            if (cli.langs && !std::regex_search(langs, *cli.langs)) {
                continue;
            }
            fmt::dynamic_format_arg_store<fmt::format_context> store{};
            store.push_back(fmt::arg("path", path));
            store.push_back(fmt::arg("size", file.size));
            store.push_back(fmt::arg("fileId", file.fileId));
            store.push_back(fmt::arg("langs", langs));
            store.push_back(fmt::arg("link", file.symlink));
            store.push_back(fmt::arg("chunks", file.chunkIds.size()));
            std::cout << fmt::vformat(cli.format, store) << std::endl;
        }
    }
};

int main(int argc, char** argv) {
    auto main = Main{};
    try {
        main.parse_args(argc, argv);
        main.run();
    } catch (std::exception const& e) {
        std::cerr << e.what() << std::endl;
        for (auto const& error : error_stack()) {
            std::cerr << error << std::endl;
        }
        error_stack().clear();
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
