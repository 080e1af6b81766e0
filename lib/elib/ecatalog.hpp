#pragma once
#include <span>
#include <string>
#include <vector>

#include "common.hpp"

namespace elib {
    // Launcher catalog listing builds and the manifests describing them.
    struct ECatalog {
        struct QueryParam {
            std::string name;
            std::string value;
        };

        struct Manifest {
            std::string uri;
            std::vector<QueryParam> query_params;
        };

        struct Element {
            std::string app_name;
            std::string label_name;
            std::string build_version;
            std::string hash;
            std::vector<Manifest> manifests;
        };

        std::vector<Element> elements;

        static auto read(std::span<char const> data) -> ECatalog;
        static auto read_file(fs::path const& path) -> ECatalog;

        // First manifest uri of the only element, with its query parameters.
        auto manifest_url() const -> std::string;

    private:
        struct Raw;
    };
}
