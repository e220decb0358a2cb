#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include "config.hpp"
#include "dbpool.hpp"
#include "ddl_visitor.hpp"
#include "lib.hpp"
#include "log.hpp"
#include "migration.hpp"

namespace {

    struct Args {
        std::string cmd;
        std::string config = "ormigrate.json";
        std::vector<std::string> models;
        std::vector<std::string> positional;
        bool yes = false;
        bool quiet = false;
        bool verbose = false;
    };

    void usage(std::ostream& out) {
        out << "Usage: ormigrate [--config FILE] [-v] [-q] <command> [options]\n"
               "\n"
               "Commands:\n"
               "  makemigrations [-y] [--model NAME]...   Create migration files\n"
               "  runmigrations [--model NAME]...         Apply the migrations created by makemigrations\n"
               "  migrate [-y] [--model NAME]...          Create and apply migrations\n"
               "  delete_migration_files <start> <end>    Delete queued migration files from start to end index\n"
               "  status [--model NAME]...                List migration units and their state\n"
               "\n"
               "Options:\n"
               "  -y, --yes       Confirm all\n"
               "  -q, --quiet     Suppress messages\n"
               "  -v, --verbose   Show generated SQL\n"
               "  --config FILE   Configuration file (default ormigrate.json)\n";
    }

    Args parse_args(int argc, char** argv) {
        Args a;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            auto value = [&]() -> std::string {
                if (i + 1 >= argc) THROW_AS(std::invalid_argument, "Missing value for %s", arg.c_str());
                return argv[++i];
            };
            if (arg == "-y" || arg == "--yes") a.yes = true;
            else if (arg == "-q" || arg == "--quiet") a.quiet = true;
            else if (arg == "-v" || arg == "--verbose") a.verbose = true;
            else if (arg == "--config") a.config = value();
            else if (arg == "--model") a.models.push_back(value());
            else if (arg == "-h" || arg == "--help") a.cmd = "help";
            else if (!arg.empty() && arg[0] == '-') THROW_AS(std::invalid_argument, "Unknown option: %s", arg.c_str());
            else if (a.cmd.empty()) a.cmd = arg;
            else a.positional.push_back(arg);
        }
        return a;
    }

    int to_index(const std::string& s) {
        size_t pos = 0;
        int v = std::stoi(s, &pos);
        if (pos != s.size()) THROW_AS(std::invalid_argument, "Not an index: %s", s.c_str());
        return v;
    }

    bool ask_yes_no(const std::string& model, const ChangeSet& cs, const std::vector<std::string>& sql) {
        std::cout << "\n* Migration for model " << model << ":\n";
        for (const auto& c : cs.changes) std::cout << "  " << c.describe() << "\n";
        std::cout << join_sql(sql) << "\n";
        std::cout << "Is this correct? [Y/n]: " << std::flush;
        std::string yn;
        if (!std::getline(std::cin, yn)) return false;
        return yn == "Y" || yn == "y" || yn.empty();
    }

    void print_status(Migration& mgr, const std::vector<std::string>& models) {
        for (const auto& [model, units] : mgr.status(models)) {
            std::cout << model << "\n";
            if (units.empty()) std::cout << "  (no migrations)\n";
            for (const auto& u : units) {
                std::cout << "  " << mgr.queue().unit_name(model, u.sequence) << "  " << unit_state_name(u.state);
                if (!u.error.empty()) std::cout << "  " << u.error;
                std::cout << "\n";
            }
        }
    }

}

int main(int argc, char** argv) {
    Args args;
    try {
        args = parse_args(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        usage(std::cerr);
        return 2;
    }
    if (args.cmd.empty() || args.cmd == "help") {
        usage(args.cmd.empty() ? std::cerr : std::cout);
        return args.cmd.empty() ? 2 : 0;
    }

    const bool makes = args.cmd == "makemigrations" || args.cmd == "migrate";
    const bool runs = args.cmd == "runmigrations" || args.cmd == "migrate";
    if (!makes && !runs && args.cmd != "delete_migration_files" && args.cmd != "status") {
        std::cerr << "E: Invalid command: " << args.cmd << "\n";
        usage(std::cerr);
        return 2;
    }

    int start = 0, end = 0;
    if (args.cmd == "delete_migration_files") {
        try {
            if (args.positional.size() != 2) THROW_AS(std::invalid_argument, "start_index and end_index must be given");
            start = to_index(args.positional[0]);
            end = to_index(args.positional[1]);
            if (start < 1 || start > end)
                THROW_AS(std::invalid_argument, "Invalid start (%d) and end index (%d)", start, end);
        } catch (const std::exception& e) {
            std::cerr << "E: " << e.what() << "\n";
            return 2;
        }
    }

    try {
        Config cfg = Config::load(args.config);
        logging::init(args.verbose ? "debug" : cfg.log_level, args.quiet);
        ModelRegistry registry = cfg.load_models();

        std::unique_ptr<DbPool> db;
        if (runs) {
            if (cfg.dsn.empty()) THROW("No dsn configured (set it in %s or %s)", args.config.c_str(), ENV_DSN);
            db = std::make_unique<DbPool>(cfg.pool_size, cfg.dsn, [driver = cfg.driver]() { return make_connection(driver); });
        }

        Migration mgr(registry, cfg.migration_dir, db.get(), cfg.index_length);
        if (runs) {
            mgr.runner().set_parallelism(cfg.pool_size);
            mgr.runner().set_statement_timeout(cfg.statement_timeout_ms);
        }

        if (makes) {
            SPDLOG_INFO("=> Making migrations ...");
            Migration::MakeOptions opts;
            opts.yes = args.yes;
            opts.models = args.models;
            opts.confirm = ask_yes_no;
            mgr.make_migrations(opts);
        }
        if (runs) {
            SPDLOG_INFO("=> Applying migrations ...");
            mgr.run(args.models);
        }
        if (args.cmd == "delete_migration_files") {
            SPDLOG_INFO("=> Deleting migration files from index {} to {}", start, end);
            int n = mgr.delete_migration_files(start, end, args.models);
            SPDLOG_INFO("   {} migration file(s) moved to trash", n);
        }
        if (args.cmd == "status") print_status(mgr, args.models);
        if (db) db->shutdown();
    } catch (const ApplyError& e) {
        SPDLOG_ERROR("Migration {} #{} failed: {}", e.model(), e.sequence(), e.db_error());
        return 1;
    } catch (const std::exception& e) {
        SPDLOG_ERROR("{}", e.what());
        return 1;
    }
    return 0;
}
