// demo_resolve.cpp
//
// Loads the configuration layers the way every pgbranch command does and
// shows what they resolve to. Run it from inside a project:
//
//     ./demo_resolve                         # effective config for the cwd
//     ./demo_resolve . feature/login main    # plus per-branch decisions
//
// PGBRANCH_* variables and .pgbranch.local.yml are honoured. Set
// PGBRANCH_LOG=debug to watch discovery.

#include <pgbranch/branch_filter.hpp>
#include <pgbranch/effective_config.hpp>
#include <pgbranch/log.hpp>
#include <pgbranch/naming.hpp>
#include <pgbranch/template.hpp>

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;
using namespace pgbranch;

static const char* yes_no(bool b) { return b ? "yes" : "no"; }

static void describe_branch(const std::string& branch, const BaseConfig& cfg,
                            const EffectiveConfig& ec) {
    std::cout << "\nbranch: " << branch << "\n";
    std::cout << "  normalized:    " << get_normalized_branch_name(branch) << "\n";
    std::cout << "  database:      " << get_database_name(branch, cfg) << "\n";
    std::cout << "  should create: " << yes_no(should_create_branch(branch, cfg)) << "\n";
    std::cout << "  should switch: " << yes_no(should_switch_on_branch(branch, cfg)) << "\n";
    std::cout << "  disabled:      " << yes_no(ec.is_branch_disabled(branch)) << "\n";

    auto ctx = TemplateContext::for_branch(cfg, branch);
    for (const auto& [name, value] : template_variables(ctx)) {
        std::cout << "    " << name << " = " << value << "\n";
    }
}

int main(int argc, char** argv) {
    log::init_from_env();

    fs::path start = argc > 1 ? fs::path(argv[1]) : fs::current_path();
    auto loaded = load_effective_config(start);
    if (loaded.is_err()) {
        std::cerr << loaded.error().format() << "\n";
        return 1;
    }

    const auto& ec = loaded.value().config;
    if (loaded.value().config_path) {
        log::info("using %s", loaded.value().config_path->string().c_str());
    }
    if (ec.local()) ec.local()->warn_active();

    auto valid = ec.validate();
    if (valid.is_err()) {
        std::cerr << valid.error().format() << "\n";
        return 1;
    }

    BaseConfig cfg = ec.merged();
    std::cout << cfg.to_yaml();
    std::cout << "\ndisabled: " << yes_no(ec.disabled())
              << "\nskip hooks: " << yes_no(ec.skip_hooks())
              << "\ncurrent branch disabled: " << yes_no(ec.current_branch_disabled()) << "\n";

    for (int i = 2; i < argc; ++i) {
        describe_branch(argv[i], cfg, ec);
    }
    return 0;
}
