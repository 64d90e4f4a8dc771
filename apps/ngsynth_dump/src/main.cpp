// apps/ngsynth_dump/src/main.cpp
// ngsynth: ngsynth_dump
// Purpose: run one synthesis pass over a YAML cluster snapshot and print the result.
// This is a debugging utility, not a controller.
//
// Usage:
//   ./ngsynth_dump <config.yaml> <snapshot.yaml> [--debug]
//
// Output: one JSON object per line: servers, then backends, then diagnostics.

#include <cstring>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "ngsynth/annotations/extractor.hpp"
#include "ngsynth/config/config_loader.hpp"
#include "ngsynth/obs/observability.hpp"
#include "ngsynth/store/memory_store.hpp"
#include "ngsynth/store/snapshot.hpp"
#include "ngsynth/synthesis/assembler.hpp"
#include "ngsynth/version.hpp"

using namespace ngsynth;

static std::string_view severity_name(synthesis::Severity s) {
    switch (s) {
        case synthesis::Severity::Info:    return "info";
        case synthesis::Severity::Warning: return "warning";
        case synthesis::Severity::Error:   return "error";
    }
    return "warning";
}

static void print(const synthesis::SynthesisResult& result) {
    const auto& cfg = result.configuration;
    for (const auto& server : cfg.servers) {
        std::vector<std::string> locs;
        for (const auto& loc : server.locations) {
            locs.push_back(fmt::format("{}[{}]->{}{}", loc.path, model::to_string(loc.kind), loc.backend,
                                       loc.is_def_backend ? "(default)" : ""));
        }
        std::cout << fmt::format(R"({{"server":"{}","aliases":{},"tls":{},"locations":{}}})",
                                 server.hostname, server.aliases,
                                 server.ssl_cert ? "\"" + server.ssl_cert->name + "\"" : "null", locs)
                  << '\n';
    }
    for (const auto& b : cfg.backends) {
        std::vector<std::string> endps;
        for (const auto& e : b.endpoints) endps.push_back(fmt::format("{}:{}", e.address, e.port));
        std::cout << fmt::format(R"({{"backend":"{}","endpoints":{},"alternatives":{},"no_server":{}}})",
                                 b.name, endps, b.alternative_backends, b.no_server)
                  << '\n';
    }
    for (const auto& d : result.diagnostics) {
        std::cout << fmt::format(R"({{"diagnostic":"{}","subject":"{}","message":"{}"}})",
                                 severity_name(d.severity), d.subject, d.message)
                  << '\n';
    }
    std::cout << fmt::format(R"({{"checksum":"{}","hosts":{}}})", cfg.backend_config_checksum, result.hosts)
              << std::endl;
}

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: " << argv[0] << " <config.yaml> <snapshot.yaml> [--debug]" << std::endl;
        return 2;
    }
    if (argc > 3 && std::strcmp(argv[3], "--debug") == 0) obs::log().set_level(spdlog::level::debug);

    obs::log().info("ngsynth_dump {}", version_string);

    auto cfg = config::Loader::load_from_file(argv[1]);
    if (!cfg) {
        obs::log().error("config: {}", cfg.error().message);
        return 1;
    }

    store::InMemoryStore st(cfg->backend);
    auto loaded = store::load_snapshot_file(argv[2], st);
    if (!loaded) {
        obs::log().error("snapshot: {}", loaded.error().message);
        return 1;
    }

    const annotations::DefaultAnnotationExtractor extractor(cfg->controller.annotations_prefix, st);
    st.extract_annotations(extractor);

    const synthesis::ConfigurationAssembler assembler(st, st, &st, cfg->controller);
    print(assembler.assemble(st.list_routing_resources()));
    return 0;
}
