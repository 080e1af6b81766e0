#include <argparse.hpp>
#include <elib/common.hpp>
#include <elib/emanifest.hpp>
#include <iostream>

using namespace elib;

struct Main {
    struct CLI {
        std::string manifest = {};
        std::string format = {};
        EMAN::Filter filter = {};
    } cli = {};

    auto parse_args(int argc, char** argv) -> void {
        argparse::ArgumentParser program(fs::path(argv[0]).filename().generic_string());
        program.add_description("Lists files in manifest.");
        program.add_argument("manifest").help("Manifest file to read from.").required();

        program.add_argument("--format")
            .help("Format output.")
            .default_value(std::string("{name},{size},{hash},{chunks},{tags}"));

        program.add_argument("--files")
            .help("Filter: comma separated list of file names.")
            .default_value(std::string{});

        program.parse_args(argc, argv);

        cli.format = program.get<std::string>("--format");
        cli.filter.names = str_list(program.get<std::string>("--files"));
        cli.manifest = program.get<std::string>("manifest");
    }

    auto run() -> void {
        elib_trace("Manifest file: %s", cli.manifest.c_str());
        auto manifest = EMAN::read_file(cli.manifest);
        manifest.filter(cli.filter);

        for (auto const& file : manifest.files) {
            fmt::dynamic_format_arg_store<fmt::format_context> store{};
            store.push_back(fmt::arg("name", file.name));
            store.push_back(fmt::arg("size", file.size()));
            store.push_back(fmt::arg("hash", to_hex(file.hash)));
            store.push_back(fmt::arg("chunks", file.parts.size()));
            store.push_back(fmt::arg("tags", fmt::format("{}", fmt::join(file.install_tags, ";"))));
            store.push_back(fmt::arg("executable", file.executable));
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
