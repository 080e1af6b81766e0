#include "ecatalog.hpp"

#include <json_struct/json_struct.h>

#include "iofile.hpp"

using namespace elib;

struct ECatalog::Raw {
    struct QueryParam {
        std::string name;
        std::string value;

        JS_OBJ(name, value);
    };

    struct Manifest {
        std::string uri;
        std::vector<QueryParam> queryParams;

        JS_OBJ(uri, queryParams);
    };

    struct Element {
        std::string appName;
        std::string labelName;
        std::string buildVersion;
        std::string hash;
        std::vector<Manifest> manifests;

        JS_OBJ(appName, labelName, buildVersion, hash, manifests);
    };

    std::vector<Element> elements;

    JS_OBJ(elements);
};

auto ECatalog::read(std::span<char const> data) -> ECatalog {
    auto raw = Raw{};
    auto context = JS::ParseContext(data.data(), data.size());
    context.allow_missing_members = true;
    context.allow_unnasigned_required_members = true;
    if (auto error = context.parseTo(raw); error != JS::Error::NoError) [[unlikely]] {
        elib_raise(ErrorKind::Generic, (": " + context.makeErrorString()).c_str());
    }
    auto result = ECatalog{};
    for (auto const& element : raw.elements) {
        auto& out = result.elements.emplace_back(Element{
            .app_name = element.appName,
            .label_name = element.labelName,
            .build_version = element.buildVersion,
            .hash = element.hash,
            .manifests = {},
        });
        for (auto const& manifest : element.manifests) {
            auto& dst = out.manifests.emplace_back(Manifest{.uri = manifest.uri, .query_params = {}});
            for (auto const& param : manifest.queryParams) {
                dst.query_params.push_back(QueryParam{.name = param.name, .value = param.value});
            }
        }
    }
    return result;
}

auto ECatalog::read_file(fs::path const& path) -> ECatalog {
    elib_trace("catalog: %s", path.generic_string().c_str());
    auto infile = IO::File(path, IO::READ);
    return ECatalog::read(infile.copy(0, infile.size()));
}

auto ECatalog::manifest_url() const -> std::string {
    if (elements.size() != 1 || elements.front().manifests.empty()) [[unlikely]] {
        elib_error("Unsupported catalog");
    }
    auto const& manifest = elements.front().manifests.front();
    auto result = manifest.uri;
    for (char sep = '?'; auto const& param : manifest.query_params) {
        result += sep;
        result += param.name;
        result += '=';
        result += param.value;
        sep = '&';
    }
    return result;
}
