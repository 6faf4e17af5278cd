// ghostcomment command line front end.
//
//     ghostcomment scan                 # list ghost comments
//     ghostcomment count                # print how many there are
//     ghostcomment validate             # check they can be removed safely
//     ghostcomment clean --dry-run      # show what clean would remove
//     ghostcomment clean                # remove them (with backups + rollback)

#include <ghostcomment/cleaner.hpp>
#include <ghostcomment/config.hpp>
#include <ghostcomment/enumerator.hpp>
#include <ghostcomment/file_store.hpp>
#include <ghostcomment/log.hpp>
#include <ghostcomment/scanner.hpp>

#include <getopt.h>

#include <cstdio>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;
using namespace ghostcomment;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

struct CliOptions {
    std::string command;
    fs::path working_dir = ".";
    std::string config_path;
    std::string prefix;
    bool fail_on_found = false;
    bool verbose = false;
    CleanOptions clean;
};

enum LongOnly {
    kNoBackup = 256,
    kKeepBackups,
    kNoRestore,
    kFailOnFound,
};

void print_usage(std::FILE* out) {
    std::fprintf(out,
        "usage: ghostcomment [options] <scan|count|validate|clean>\n"
        "\n"
        "options:\n"
        "  -C <dir>          run as if started in <dir>\n"
        "  -c <file>         config file (default: .ghostcomment.toml, .ghostcommentrc)\n"
        "  -p <prefix>       override the marker prefix\n"
        "  -n, --dry-run     report what clean would remove without writing\n"
        "      --no-backup   do not back up files before cleaning\n"
        "      --keep-backups  keep backup files after a successful clean\n"
        "      --no-restore  do not roll back cleaned files when another file fails\n"
        "      --fail-on-found exit 1 when ghost comments are found\n"
        "  -v, --verbose     debug logging\n"
        "  -h, --help        show this help\n");
}

// Returns kExitOk to continue, anything else is the process exit code
int parse_args(int argc, char** argv, CliOptions& opts) {
    static const struct option long_opts[] = {
        {"dir",           required_argument, nullptr, 'C'},
        {"config",        required_argument, nullptr, 'c'},
        {"prefix",        required_argument, nullptr, 'p'},
        {"dry-run",       no_argument,       nullptr, 'n'},
        {"no-backup",     no_argument,       nullptr, kNoBackup},
        {"keep-backups",  no_argument,       nullptr, kKeepBackups},
        {"no-restore",    no_argument,       nullptr, kNoRestore},
        {"fail-on-found", no_argument,       nullptr, kFailOnFound},
        {"verbose",       no_argument,       nullptr, 'v'},
        {"help",          no_argument,       nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    opts.clean.remove_backups = true;

    int c;
    while ((c = getopt_long(argc, argv, "C:c:p:nvh", long_opts, nullptr)) != -1) {
        switch (c) {
            case 'C': opts.working_dir = optarg; break;
            case 'c': opts.config_path = optarg; break;
            case 'p': opts.prefix = optarg; break;
            case 'n': opts.clean.dry_run = true; break;
            case 'v': opts.verbose = true; break;
            case kNoBackup: opts.clean.create_backups = false; break;
            case kKeepBackups: opts.clean.remove_backups = false; break;
            case kNoRestore: opts.clean.restore_on_error = false; break;
            case kFailOnFound: opts.fail_on_found = true; break;
            case 'h':
                print_usage(stdout);
                return -1;
            default:
                print_usage(stderr);
                return kExitUsage;
        }
    }

    if (optind != argc - 1) {
        print_usage(stderr);
        return kExitUsage;
    }
    opts.command = argv[optind];
    return kExitOk;
}

int report_error(const GcError& err) {
    std::fprintf(stderr, "%s\n", err.format().c_str());
    return err.code == GcError::Config ? kExitUsage : kExitFailure;
}

int cmd_scan(Scanner& scanner, const ScanConfig& cfg, const CliOptions& opts) {
    auto comments = scanner.scan(cfg, opts.working_dir);
    if (comments.is_err()) return report_error(comments.error());

    for (const auto& c : comments.value()) {
        std::printf("%s:%d: %s\n", c.file_path.c_str(), c.line_number, c.content.c_str());
    }
    log::info("found %zu ghost comment(s)", comments.value().size());

    if (cfg.fail_on_found && !comments.value().empty()) return kExitFailure;
    return kExitOk;
}

int cmd_count(Scanner& scanner, const ScanConfig& cfg, const CliOptions& opts) {
    auto n = scanner.count(cfg, opts.working_dir);
    if (n.is_err()) return report_error(n.error());

    std::printf("%zu\n", n.value());
    if (cfg.fail_on_found && n.value() > 0) return kExitFailure;
    return kExitOk;
}

int print_validation(const ValidationResult& v) {
    for (const auto& e : v.errors) {
        std::fprintf(stderr, "  %s\n", e.c_str());
    }
    return v.valid ? kExitOk : kExitFailure;
}

int cmd_validate(Scanner& scanner, Cleaner& cleaner, const ScanConfig& cfg,
                 const CliOptions& opts) {
    auto comments = scanner.scan(cfg, opts.working_dir);
    if (comments.is_err()) return report_error(comments.error());

    auto v = cleaner.validate_for_cleaning(comments.value(), opts.working_dir);
    if (v.valid) {
        log::info("%zu ghost comment(s) can be removed safely", comments.value().size());
    } else {
        log::error("%zu problem(s) found:", v.errors.size());
    }
    return print_validation(v);
}

int cmd_clean(Scanner& scanner, Cleaner& cleaner, const ScanConfig& cfg,
              const CliOptions& opts) {
    auto comments = scanner.scan(cfg, opts.working_dir);
    if (comments.is_err()) return report_error(comments.error());
    if (comments.value().empty()) {
        log::info("no ghost comments to clean");
        return kExitOk;
    }

    auto v = cleaner.validate_for_cleaning(comments.value(), opts.working_dir);
    if (!v.valid) {
        log::error("refusing to clean, %zu problem(s) found:", v.errors.size());
        return print_validation(v);
    }

    auto result = cleaner.remove_comments(comments.value(), opts.clean, opts.working_dir);
    if (result.is_err()) return report_error(result.error());

    const auto& r = result.value();
    log::info("%s%zu comment(s) removed from %zu file(s)",
        opts.clean.dry_run ? "[dry-run] " : "", r.comments_removed, r.modified_files.size());
    for (const auto& f : r.failures) {
        std::fprintf(stderr, "%s\n", f.error.format().c_str());
    }
    if (!r.restored_files.empty()) {
        log::warn("%zu file(s) restored from backup", r.restored_files.size());
    }
    return r.has_errors ? kExitFailure : kExitOk;
}

} // namespace

int main(int argc, char** argv) {
    CliOptions opts;
    int rc = parse_args(argc, argv, opts);
    if (rc < 0) return kExitOk;
    if (rc != kExitOk) return rc;

    if (opts.verbose || env_flag("GC_DEBUG")) log::set_level(log::Debug);
    if (env_flag("GC_DRY_RUN")) opts.clean.dry_run = true;

    auto cfg = discover_config(opts.working_dir, opts.config_path);
    if (cfg.is_err()) return report_error(cfg.error());
    if (!opts.prefix.empty()) {
        cfg.value().prefix = opts.prefix;
        auto st = validate_scan_config(cfg.value());
        if (st.is_err()) return report_error(st.error());
    }
    if (opts.fail_on_found) cfg.value().fail_on_found = true;

    DiskFileStore store;
    GlobEnumerator enumerator;
    Scanner scanner(enumerator, store);
    Cleaner cleaner(store);

    if (opts.command == "scan") return cmd_scan(scanner, cfg.value(), opts);
    if (opts.command == "count") return cmd_count(scanner, cfg.value(), opts);
    if (opts.command == "validate") return cmd_validate(scanner, cleaner, cfg.value(), opts);
    if (opts.command == "clean") return cmd_clean(scanner, cleaner, cfg.value(), opts);

    log::error("unknown command '%s'", opts.command.c_str());
    print_usage(stderr);
    return kExitUsage;
}
