#include <argparse.hpp>
#include <iostream>
#include <rfmt/common.hpp>
#include <rfmt/json.hpp>
#include <rfmt/rmanifest.hpp>

using namespace rfmt;

struct Main {
    struct CLI {
        std::string manifest = {};
    } cli = {};

    auto parse_args(int argc, char** argv) -> void {
        argparse::ArgumentParser program(fs::path(argv[0]).filename().generic_string());
        program.add_description("Dumps decoded manifest as json.");
        program.add_argument("manifest").help("Manifest file to read from.").required();
        program.parse_args(argc, argv);
        cli.manifest = program.get<std::string>("manifest");
    }

    auto run() -> void {
        auto manifest = RMAN::read_file(cli.manifest);
        std::cout << to_json(manifest) << std::endl;
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
