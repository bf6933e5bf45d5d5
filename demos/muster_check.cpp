// muster_check.cpp
//
// Loads a service configuration, resolves the startup order and runs every
// cross-service check. Run it with:
//
//     ./muster-check                       # ./Muster.toml plus global/local layers
//     ./muster-check site.toml --units     # also print Wants=/After=/Conflicts=
//     ./muster-check --tree postgres       # who depends on postgres
//
// Exit status: 0 when the configuration can be activated, 1 when it has
// fatal issues, 2 when the configuration itself cannot be loaded.

#include <muster/config.hpp>
#include <muster/engine/engine.hpp>
#include <muster/log.hpp>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace muster;

struct Options {
    std::string path = "Muster.toml";
    bool use_global = true;
    bool use_local = true;
    bool show_units = false;
    bool auto_enable = false;
    std::vector<std::string> trees;
};

static void usage() {
    std::cerr <<
        "Usage: muster-check [config.toml] [options]\n"
        "  --units             print supervisor directives per service\n"
        "  --tree <service>    print services depending on <service>\n"
        "  --auto-enable       enable providers for unmet requirements\n"
        "  --no-global         skip ~/.muster/config.toml\n"
        "  --no-local          skip <config>.local.toml\n"
        "  --log-level <lvl>   trace, debug, info, warn, error, off\n";
}

static Result<Options> parse_args(int argc, char** argv) {
    Options opts;
    bool have_path = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--units") {
            opts.show_units = true;
        } else if (arg == "--auto-enable") {
            opts.auto_enable = true;
        } else if (arg == "--no-global") {
            opts.use_global = false;
        } else if (arg == "--no-local") {
            opts.use_local = false;
        } else if (arg == "--tree" || arg == "--log-level") {
            if (i + 1 >= argc) {
                return MusterError{MusterError::InvalidArg,
                    "missing value for " + arg};
            }
            std::string value = argv[++i];
            if (arg == "--tree") {
                opts.trees.push_back(value);
                continue;
            }
            log::Level lvl;
            if (!log::parse_level(value, lvl)) {
                return MusterError{MusterError::InvalidArg,
                    "unknown log level '" + value + "'",
                    "use one of: trace, debug, info, warn, error, off"};
            }
            log::set_level(lvl);
        } else if (arg == "-h" || arg == "--help") {
            usage();
            std::exit(0);
        } else if (!arg.empty() && arg[0] == '-') {
            return MusterError{MusterError::InvalidArg,
                "unknown option '" + arg + "'", "see muster-check --help"};
        } else if (!have_path) {
            opts.path = arg;
            have_path = true;
        } else {
            return MusterError{MusterError::InvalidArg,
                "more than one config file given"};
        }
    }
    return Result<Options>::ok(std::move(opts));
}

// Optional layer: absent file is fine, a broken one is not
static Result<std::optional<Config>> load_layer(const std::string& path) {
    std::error_code ec;
    if (path.empty() || !fs::exists(path, ec)) {
        return Result<std::optional<Config>>::ok(std::nullopt);
    }
    log::debug("loading config layer %s", path.c_str());
    auto cfg = Config::load(path);
    MUSTER_TRY(cfg);
    return Result<std::optional<Config>>::ok(std::move(cfg).value());
}

static std::string local_path_for(const std::string& path) {
    fs::path p(path);
    return (p.parent_path() / (p.stem().string() + ".local.toml")).string();
}

static Result<Config> load_config(const Options& opts) {
    auto project = Config::load(opts.path);
    MUSTER_TRY(project);

    std::optional<Config> global;
    if (opts.use_global) {
        auto g = load_layer(global_config_path());
        MUSTER_TRY(g);
        global = std::move(g).value();
    }

    std::optional<Config> local;
    if (opts.use_local) {
        auto l = load_layer(local_path_for(opts.path));
        MUSTER_TRY(l);
        local = std::move(l).value();
    }

    Config cfg = Config::effective(global, std::move(project).value(), local);
    if (opts.auto_enable) cfg.auto_enable = true;
    return Result<Config>::ok(std::move(cfg));
}

int main(int argc, char** argv) {
    auto opts = parse_args(argc, argv);
    if (opts.is_err()) {
        std::cerr << opts.error().format() << "\n";
        return 2;
    }

    auto cfg = load_config(opts.value());
    if (cfg.is_err()) {
        std::cerr << cfg.error().format() << "\n";
        return 2;
    }

    auto catalog = cfg.value().build_catalog();
    if (catalog.is_err()) {
        std::cerr << catalog.error().format() << "\n";
        return 2;
    }

    // The plan and the dependents trees share one service set
    auto instances = planned_instances(cfg.value(), catalog.value());
    if (instances.is_err()) {
        std::cerr << instances.error().format() << "\n";
        return 2;
    }
    Plan p = plan(catalog.value(), instances.value(), cfg.value().policy);

    std::cout << p.report.format();

    if (opts.value().show_units) {
        for (const auto& unit : p.units) {
            std::cout << "\n[" << unit.service << ".service]\n" << format_unit(unit);
        }
    }

    if (!opts.value().trees.empty()) {
        std::vector<std::string> enabled;
        for (const auto& inst : instances.value()) {
            enabled.push_back(inst.name);
        }
        auto graph = DependencyGraph::build(catalog.value(), enabled);
        for (const auto& root : opts.value().trees) {
            std::string tree = graph.dependents_tree(root);
            if (tree.empty()) {
                log::warn("'%s' is not an enabled service", root.c_str());
                continue;
            }
            std::cout << "\n" << tree;
        }
    }

    return p.report.ok() ? 0 : 1;
}
