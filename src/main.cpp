#include <csignal>
#include <cstring>
#include <fstream>
#include <iostream>
#include <optional>
#include <pthread.h>
#include <string>
#include <thread>

#include <spdlog/spdlog.h>

#include "config.hpp"
#include "errors.hpp"
#include "journal_store.hpp"
#include "pomoclock.hpp"
#include "sqlite.hpp"
#include "task_list.hpp"

namespace {

void PrintUsage(const char *argv0) {
    std::cout << "Usage: " << argv0 << " [options]\n"
              << "  --config <path>      settings file (default $XDG_CONFIG_HOME/pomoclock/config.json)\n"
              << "  --db <path>          database file\n"
              << "  --port <n>           HTTP port on 127.0.0.1 (default "
              << POMOCLOCK_DEFAULT_PORT << ")\n"
              << "  --export-csv <path>  write the session log as CSV and exit\n"
              << "  --debug              verbose logging\n"
              << "  --quiet              no logging\n"
              << "  --help               this text\n";
}

struct Options {
    std::optional<std::string> config;
    std::optional<std::string> db;
    std::optional<unsigned> port;
    std::optional<std::string> exportCsv;
    std::optional<LogLevel> logLevel;
    bool help = false;
};

Options ParseArgs(int argc, char *argv[]) {
    Options opt;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw ValidationError(arg + " needs a value");
            }
            return argv[++i];
        };

        if (arg == "--config") {
            opt.config = value();
        } else if (arg == "--db") {
            opt.db = value();
        } else if (arg == "--port") {
            const std::string v = value();
            try {
                const int port = std::stoi(v);
                if (port < 1 || port > 65535) {
                    throw std::out_of_range(v);
                }
                opt.port = static_cast<unsigned>(port);
            } catch (const std::exception &) {
                throw ValidationError("--port must be between 1 and 65535");
            }
        } else if (arg == "--export-csv") {
            opt.exportCsv = value();
        } else if (arg == "--debug") {
            opt.logLevel = LOG_DEBUG;
        } else if (arg == "--quiet") {
            opt.logLevel = LOG_OFF;
        } else if (arg == "--help" || arg == "-h") {
            opt.help = true;
        } else {
            throw ValidationError("unknown option " + arg);
        }
    }
    return opt;
}

int ExportCsv(const Config &config, const std::string &path) {
    const std::filesystem::path dbpath = config.db_path.empty() ? DefaultDBPath() : config.db_path;
    SQLite db(dbpath.string());
    JournalStore journal(db);
    TaskList tasks(db);

    std::ofstream out(path, std::ios::binary);
    if (!out) {
        throw PersistenceError("cannot write " + path);
    }
    out << journal.ExportCsv([&](int64_t id) { return tasks.DisplayTitle(id); });
    spdlog::info("Session log exported to {}", path);
    return 0;
}

} // namespace

// ─────────────────────────────────────
int main(int argc, char *argv[]) {
    try {
        const Options opt = ParseArgs(argc, argv);
        if (opt.help) {
            PrintUsage(argv[0]);
            return 0;
        }

        Config config = LoadConfig(opt.config ? std::filesystem::path(*opt.config)
                                              : DefaultConfigPath());
        if (opt.db) {
            config.db_path = *opt.db;
        }
        if (opt.port) {
            config.port = *opt.port;
        }
        if (opt.logLevel) {
            config.log_level = *opt.logLevel;
        }

        if (opt.exportCsv) {
            return ExportCsv(config, *opt.exportCsv);
        }

        // Signals are taken by a dedicated thread; every other thread inherits the mask
        sigset_t signals;
        sigemptyset(&signals);
        sigaddset(&signals, SIGINT);
        sigaddset(&signals, SIGTERM);
        pthread_sigmask(SIG_BLOCK, &signals, nullptr);

        PomoClock app(config);
        std::thread signalThread([&app, signals]() {
            int sig = 0;
            if (sigwait(&signals, &sig) == 0) {
                spdlog::info("Received {}", strsignal(sig));
            }
            app.RequestShutdown();
        });

        try {
            app.Run();
        } catch (...) {
            // Unblock the signal thread before unwinding
            pthread_kill(signalThread.native_handle(), SIGTERM);
            signalThread.join();
            throw;
        }
        signalThread.join();
        return 0;
    } catch (const ValidationError &e) {
        spdlog::error("Invalid configuration: {}", e.what());
        return 2;
    } catch (const PersistenceError &e) {
        spdlog::error("Storage error: {}", e.what());
        return 1;
    } catch (const std::exception &e) {
        spdlog::error("Fatal: {}", e.what());
        return 1;
    }
}
