#include <fmt/args.h>
#include <fmt/format.h>

#include <argparse.hpp>
#include <iostream>
#include <rfmt/common.hpp>
#include <rfmt/wad.hpp>

using namespace rfmt;

struct Main {
    struct CLI {
        std::string wad = {};
        std::string format = {};
    } cli = {};

    auto parse_args(int argc, char** argv) -> void {
        argparse::ArgumentParser program(fs::path(argv[0]).filename().generic_string());
        program.add_description("Lists entries in wad.");
        program.add_argument("wad").help("Wad file to read from.").required();
        program.add_argument("--format")
            .help("Format output.")
            .default_value(std::string("{hash:016X},{offset},{compressed},{uncompressed},{type}"));
        program.parse_args(argc, argv);
        cli.format = program.get<std::string>("--format");
        cli.wad = program.get<std::string>("wad");
    }

    auto run() -> void {
        auto wad = WAD::read_file(cli.wad);
        for (auto const& entry : wad.content) {
            auto const* v2 = std::get_if<WAD::ContentV2>(&entry.version);
            fmt::dynamic_format_arg_store<fmt::format_context> store{};
            store.push_back(fmt::arg("hash", entry.hash));
            store.push_back(fmt::arg("offset", entry.data_offset));
            store.push_back(fmt::arg("compressed", entry.compressed_size));
            store.push_back(fmt::arg("uncompressed", entry.uncompressed_size));
            store.push_back(fmt::arg("type", entry.compression_type));
            store.push_back(fmt::arg("duplicate", v2 && v2->is_duplicate));
            store.push_back(fmt::arg("checksum", v2 ? v2->sha256 : 0));
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
