#include <argparse.hpp>
#include <atomic>
#include <csignal>
#include <elib/common.hpp>
#include <elib/ecatalog.hpp>
#include <elib/ecdn.hpp>
#include <elib/einstall.hpp>
#include <elib/emanifest.hpp>
#include <elib/iofile.hpp>
#include <iostream>

using namespace elib;

static std::atomic_bool interrupted = false;

struct Main {
    struct CLI {
        std::string manifest = {};
        std::string manifest_id = {};
        std::string catalog = {};
        std::string cache = {};
        std::uint32_t retry = {};
        std::uint32_t backoff = {};
        EMAN::Filter filter = {};
        EInstall::Options install = {};
        ECDN::Options cdn = {};
    } cli = {};
    std::unique_ptr<ECDN> cdn = {};

    auto parse_args(int argc, char** argv) -> void {
        argparse::ArgumentParser program(fs::path(argv[0]).filename().generic_string());
        program.add_description("Downloads or repairs files in manifest.");
        // Common options
        program.add_argument("manifest")
            .help("Manifest file or url to read from, empty to use manifest id, cache or catalog.")
            .default_value(std::string{});
        program.add_argument("output")
            .help("Output directory to store and verify files from.")
            .default_value(std::string("files"));
        program.add_argument("--manifest-id")
            .help("Download manifest with this id from first cdn url.")
            .default_value(std::string{});
        program.add_argument("--catalog").help("Catalog json to find manifest url in.").default_value(std::string{});
        program.add_argument("--cache")
            .help("Directory to keep catalog.json and manifest.json in, empty to disable.")
            .default_value(std::string("cache"));
        program.add_argument("--files")
            .help("Comma separated list of file names to download, empty for all.")
            .default_value(std::string{});
        program.add_argument("--no-verify")
            .help("Skip hash check of files after download.")
            .default_value(false)
            .implicit_value(true);
        program.add_argument("--no-progress").help("Do not print progress.").default_value(false).implicit_value(true);

        // CDN options
        program.add_argument("--cdn")
            .help("Comma separated list of urls to download chunks from.")
            .default_value(std::string(ECDN::DEFAULT_URL));
        program.add_argument("--cdn-retry")
            .help("Number of retries to download chunk.")
            .default_value(std::uint32_t{3})
            .action([](std::string const& value) -> std::uint32_t {
                return std::clamp((std::uint32_t)std::stoul(value), 0u, 8u);
            });
        program.add_argument("--cdn-backoff")
            .help("Delay before retry in miliseconds, grows with each attempt.")
            .default_value(std::uint32_t{500})
            .action([](std::string const& value) -> std::uint32_t {
                return std::clamp((std::uint32_t)std::stoul(value), 0u, 30000u);
            });
        program.add_argument("--cdn-verbose").help("Curl: verbose logging.").default_value(false).implicit_value(true);
        program.add_argument("--cdn-buffer")
            .help("Curl buffer size in killobytes [1, 512].")
            .default_value(long{512})
            .action(
                [](std::string const& value) -> long { return std::clamp((long)std::stoul(value), 1l, 512l) * 1024; });
        program.add_argument("--cdn-timeout")
            .help("Curl: connect timeout in seconds, 0 for default.")
            .default_value(long{0})
            .action([](std::string const& value) -> long { return std::clamp((long)std::stoul(value), 0l, 600l); });
        program.add_argument("--cdn-proxy").help("Curl: proxy.").default_value(std::string{});
        program.add_argument("--cdn-useragent").help("Curl: user agent string.").default_value(std::string{});

        program.parse_args(argc, argv);

        cli.manifest = program.get<std::string>("manifest");
        cli.manifest_id = program.get<std::string>("--manifest-id");
        cli.catalog = program.get<std::string>("--catalog");
        cli.cache = program.get<std::string>("--cache");
        cli.retry = program.get<std::uint32_t>("--cdn-retry");
        cli.backoff = program.get<std::uint32_t>("--cdn-backoff");
        cli.filter.names = str_list(program.get<std::string>("--files"));

        cli.install = {
            .output = program.get<std::string>("output"),
            .no_verify = program.get<bool>("--no-verify"),
            .no_progress = program.get<bool>("--no-progress"),
            .cancel = &interrupted,
        };

        cli.cdn = {
            .urls = str_list(program.get<std::string>("--cdn")),
            .verbose = program.get<bool>("--cdn-verbose"),
            .buffer = program.get<long>("--cdn-buffer"),
            .connect_timeout = program.get<long>("--cdn-timeout"),
            .proxy = program.get<std::string>("--cdn-proxy"),
            .useragent = program.get<std::string>("--cdn-useragent"),
        };
    }

    auto run() -> bool {
        cdn = std::make_unique<ECDN>(cli.cdn);

        auto manifest = read_manifest();
        manifest.filter(cli.filter);
        std::cout << fmt::format("MANIFEST: {} {} ({} files, {} chunks)",
                                 manifest.app_name,
                                 manifest.build_version,
                                 manifest.files.size(),
                                 manifest.chunks.size())
                  << std::endl;

        auto source = Retry(*cdn, cli.retry, std::chrono::milliseconds(cli.backoff));
        auto install = EInstall(cli.install);
        auto summary = install.run(manifest, source);

        std::cout << fmt::format("DONE: found {}, downloaded {}, failed {}, chunks fetched {}, corrupt {}",
                                 summary.found,
                                 summary.downloaded,
                                 summary.failed,
                                 summary.fetched,
                                 summary.mismatches.size())
                  << std::endl;
        for (auto const& name : summary.failed_files) {
            std::cerr << "FAILED: " << name << std::endl;
        }
        return summary.ok();
    }

    auto cache_path(char const* name) const -> fs::path {
        if (cli.cache.empty()) {
            return {};
        }
        return fs::path(cli.cache) / name;
    }

    auto store(char const* name, std::span<char const> data) const -> void {
        auto path = cache_path(name);
        if (path.empty()) {
            return;
        }
        elib_trace("cache: %s", path.generic_string().c_str());
        auto outfile = IO::File(path, IO::WRITE | IO::TRUNCATE);
        elib_assert(outfile.write(0, data));
    }

    auto download_manifest(std::string const& url, bool cache) -> EMAN {
        std::cout << "MANIFEST URL: " << url << std::endl;
        auto data = cdn->get(url);
        auto manifest = EMAN::read(data);
        if (cache) {
            store("manifest.json", data);
        }
        return manifest;
    }

    auto read_manifest() -> EMAN {
        if (cli.manifest.starts_with("http://") || cli.manifest.starts_with("https://")) {
            return download_manifest(cli.manifest, false);
        }
        if (!cli.manifest.empty()) {
            return EMAN::read_file(cli.manifest);
        }
        if (!cli.manifest_id.empty()) {
            return download_manifest(fmt::format("{}/{}.manifest", cdn->next_url(), cli.manifest_id), false);
        }
        if (auto path = cache_path("manifest.json"); !path.empty() && fs::exists(path)) {
            return EMAN::read_file(path);
        }
        return download_manifest(read_catalog().manifest_url(), true);
    }

    auto read_catalog() -> ECatalog {
        if (!cli.catalog.empty()) {
            auto infile = IO::File(cli.catalog, IO::READ);
            auto data = infile.copy(0, infile.size());
            auto catalog = ECatalog::read(data);
            store("catalog.json", data);
            return catalog;
        }
        if (auto path = cache_path("catalog.json"); !path.empty() && fs::exists(path)) {
            return ECatalog::read_file(path);
        }
        elib_error("No manifest, manifest id, cached manifest or catalog given");
    }
};

int main(int argc, char** argv) {
    std::signal(SIGINT, [](int) { interrupted = true; });
    auto main = Main{};
    try {
        main.parse_args(argc, argv);
        if (!main.run()) {
            return EXIT_FAILURE;
        }
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
