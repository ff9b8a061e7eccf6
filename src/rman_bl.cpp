#include <fmt/args.h>
#include <fmt/format.h>

#include <argparse.hpp>
#include <iostream>
#include <rfmt/common.hpp>
#include <rfmt/rmanifest.hpp>

using namespace rfmt;

struct Main {
    struct CLI {
        std::vector<std::string> inputs = {};
        std::string format = {};
    } cli = {};

    auto parse_args(int argc, char** argv) -> void {
        argparse::ArgumentParser program(fs::path(argv[0]).filename().generic_string());
        program.add_description("Lists bundles used in manifest.");
        program.add_argument("--format")
            .help("Format output.")
            .default_value(std::string("/{bundleId}.bundle,{chunks},{size}"));
        program.add_argument("input").help("Manifest file(s) to read from.").remaining().required();
        program.parse_args(argc, argv);
        cli.format = program.get<std::string>("--format");
        cli.inputs = program.get<std::vector<std::string>>("input");
    }

    auto run() -> void {
        for (auto const& path : cli.inputs) {
            auto manifest = RMAN::read_file(path);
            for (auto const& bundle : manifest.body.bundles) {
                std::uint64_t size = 0;
                for (auto const& chunk : bundle.chunks) {
                    size += chunk.compressed_size;
                }
                fmt::dynamic_format_arg_store<fmt::format_context> store{};
                store.push_back(fmt::arg("bundleId", bundle.bundleId));
                store.push_back(fmt::arg("chunks", bundle.chunks.size()));
                store.push_back(fmt::arg("size", size));
                std::cout << fmt::vformat(cli.format, store) << std::endl;
            }
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
