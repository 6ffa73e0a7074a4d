// demo_install.cpp
//
// Installs bundles into the workspace around the current directory, creating
// .stow/ when there is none. Run it with:
//
//     ./demo_install                        # install what .stow/Stow.toml declares
//     ./demo_install ../my-bundles          # add a directory source, then install
//     ./demo_install github:org/repo --dry-run
//     ./demo_install --uninstall my-bundle
//     ./demo_install --list
//
// Set STOW_LOG=debug to see resolution and file actions on stderr.

#include <stow/cache.hpp>
#include <stow/fetch.hpp>
#include <stow/installer.hpp>
#include <stow/log.hpp>
#include <stow/workspace.hpp>

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace stow;

struct Args {
    std::string source;
    std::vector<std::string> platforms;
    std::vector<std::string> uninstall;
    bool list = false;
    bool frozen = false;
    bool update = false;
    bool dry_run = false;
};

static Result<Args> parse_args(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--frozen") {
            args.frozen = true;
        } else if (a == "--update") {
            args.update = true;
        } else if (a == "--dry-run") {
            args.dry_run = true;
        } else if (a == "--list") {
            args.list = true;
        } else if (a == "--platform" && i + 1 < argc) {
            args.platforms.push_back(argv[++i]);
        } else if (a == "--uninstall" && i + 1 < argc) {
            args.uninstall.push_back(argv[++i]);
        } else if (!a.empty() && a[0] == '-') {
            return StowError{StowError::InvalidArg, "unknown option: " + a,
                "usage: demo_install [source] [--platform ID] [--frozen] [--update] "
                "[--dry-run] [--uninstall NAME] [--list]"};
        } else if (args.source.empty()) {
            args.source = a;
        } else {
            return StowError{StowError::InvalidArg, "more than one source given"};
        }
    }
    return Result<Args>::ok(std::move(args));
}

static void print_report(const InstallReport& report) {
    for (const auto& a : report.actions) {
        std::cout << (report.dry_run ? "would " : "") << action_kind_name(a.kind)
                  << "  " << a.path << "  (" << a.detail << ")\n";
    }
    std::cout << report.bundles.size() << " bundle(s) locked";
    if (!report.removed.empty()) std::cout << ", " << report.removed.size() << " removed";
    std::cout << "\n";
}

static int fail(const StowError& e) {
    std::cerr << e.format() << "\n";
    return e.exit_code();
}

int main(int argc, char** argv) {
    log::init_from_env();

    auto args = parse_args(argc, argv);
    if (args.is_err()) return fail(args.error());

    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    auto ws = Workspace::discover(cwd);
    if (ws.is_err()) ws = Workspace::init(cwd);
    if (ws.is_err()) return fail(ws.error());

    auto config = ws.value().config();
    if (config.is_err()) return fail(config.error());
    if (config.value().log_level) {
        log::Level lvl;
        if (log::parse_level(*config.value().log_level, lvl)) log::set_level(lvl);
        log::init_from_env();
    }

    Cache cache;
    std::string cache_root = config.value().cache_root();
    auto opened = cache.open(cache_root);
    if (opened.is_err()) return fail(opened.error());
    SourceFetcher fetcher(cache_root);

    Installer installer(ws.value(), cache, fetcher);

    if (args.value().list) {
        auto bundles = installer.list();
        if (bundles.is_err()) return fail(bundles.error());
        for (const auto& b : bundles.value()) {
            std::cout << b.name << (b.is_workspace ? " (workspace)" : "")
                      << "  " << b.source << "  " << b.file_count << " file(s), "
                      << b.installed_count << " installed\n";
        }
        return 0;
    }

    if (!args.value().uninstall.empty()) {
        UninstallOptions opts;
        opts.names = args.value().uninstall;
        opts.dry_run = args.value().dry_run;
        auto report = installer.uninstall(opts);
        if (report.is_err()) return fail(report.error());
        print_report(report.value());
        return 0;
    }

    InstallOptions opts;
    opts.source = args.value().source;
    opts.platforms = args.value().platforms;
    opts.frozen = args.value().frozen;
    opts.update = args.value().update;
    opts.dry_run = args.value().dry_run;
    auto report = installer.install(opts);
    if (report.is_err()) return fail(report.error());
    print_report(report.value());
    return 0;
}
