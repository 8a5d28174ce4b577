// =============================================================================
// polystore CLI - streaming multi-store ingest
// =============================================================================
//
// Usage:
//   polystore [global options] <command> [options]
//
// Commands:
//   ingest      Ingest a file through the streaming-upload saga
//   recover     Report sagas interrupted by a crash or kill
//   failures    Print the failure log
//   version     Show version information
//   help        Show this help message
//
// Examples:
//   polystore ingest --meta title=report --meta category=finance report.pdf
//   polystore --no-db ingest --chunk-size 1048576 big.bin
//   polystore failures --kind orphaned_chunk
//   polystore recover
//
// =============================================================================

#include <atomic>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "polystore/config.hpp"
#include "polystore/db/connection.hpp"
#include "polystore/error.hpp"
#include "polystore/failure_log.hpp"
#include "polystore/logging.hpp"
#include "polystore/saga_journal.hpp"
#include "polystore/saga_monitor.hpp"
#include "polystore/source.hpp"
#include "polystore/stores/pg_record_store.hpp"
#include "polystore/streaming_ingest.hpp"

#ifdef HAS_HNSWLIB
#include "polystore/stores/hnsw_vector_store.hpp"
#endif

namespace polystore::cli {
    int cmd_ingest(int argc, char* argv[]);
    int cmd_recover(int argc, char* argv[]);
    int cmd_failures(int argc, char* argv[]);
    int cmd_version(int argc, char* argv[]);
    int cmd_help(int argc, char* argv[]);
}

// =============================================================================
// Version Info
// =============================================================================

#define POLYSTORE_VERSION_STRING "1.0.0"

// =============================================================================
// Command Registry
// =============================================================================

struct Command {
    const char* name;
    const char* description;
    int (*handler)(int argc, char* argv[]);
};

static const Command g_commands[] = {
    {"ingest",   "Ingest a file through the streaming-upload saga", polystore::cli::cmd_ingest},
    {"recover",  "Report sagas interrupted before reaching a terminal state", polystore::cli::cmd_recover},
    {"failures", "Print the failure log", polystore::cli::cmd_failures},
    {"version",  "Show version information", polystore::cli::cmd_version},
    {"help",     "Show this help message", polystore::cli::cmd_help},
    {nullptr, nullptr, nullptr}
};

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    std::string config_file = "polystore.conf";
    std::vector<std::string> db_args;    // -d/-h/-p/-U/-W, applied over the loaded config
    bool no_db = false;
    bool verbose = false;
    bool quiet = false;
};

static GlobalOptions g_options;

// Ctrl-C cancels the running saga, which then rolls back
static polystore::CancellationToken g_cancel;

extern "C" void on_interrupt(int) {
    g_cancel.cancel();
}

namespace polystore::cli {

// Exit codes for ingest
constexpr int EXIT_OK = 0;
constexpr int EXIT_USAGE = 1;
constexpr int EXIT_ROLLED_BACK = 2;
constexpr int EXIT_MANUAL_CLEANUP = 3;

static bool load_config() {
    if (!init_config(g_options.config_file)) {
        std::cerr << "Invalid configuration, see log output above\n";
        return false;
    }
    if (g_options.verbose) set_log_level(LogLevel::DEBUG);
    if (g_options.quiet) set_log_level(LogLevel::WARN);
    return true;
}

static db::ConnectionConfig db_config() {
    db::ConnectionConfig c = db::ConnectionConfig::from_config(Config::getInstance());
    std::vector<char*> args;
    for (auto& a : g_options.db_args) args.push_back(a.data());
    for (int i = 0; i < static_cast<int>(args.size()); ++i) {
        c.parse_arg(static_cast<int>(args.size()), args.data(), i);
    }
    return c;
}

// =============================================================================
// Help Command
// =============================================================================

int cmd_help([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "polystore - streaming multi-store ingest\n";
    std::cout << "Version " << POLYSTORE_VERSION_STRING << "\n\n";
    std::cout << "Usage: polystore [global options] <command> [options]\n\n";
    std::cout << "Commands:\n";

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        std::cout << "  " << cmd->name;
        for (size_t i = strlen(cmd->name); i < 12; ++i) std::cout << ' ';
        std::cout << cmd->description << "\n";
    }

    std::cout << "\nGlobal Options:\n";
    std::cout << "  -c, --config <file>     Config file (default: polystore.conf)\n";
    std::cout << "  -d, --dbname <name>     Database name\n";
    std::cout << "  -U, --user <user>       Database user\n";
    std::cout << "  -h, --host <host>       Database host\n";
    std::cout << "  -p, --port <port>       Database port\n";
    std::cout << "  -W, --password <pass>   Database password\n";
    std::cout << "      --no-db             Skip the PostgreSQL graph and relational stores\n";
    std::cout << "  -v, --verbose           Debug logging\n";
    std::cout << "  -q, --quiet             Warnings and errors only\n";
    std::cout << "\nIngest Options:\n";
    std::cout << "  --chunk-size <bytes>    Chunk size (default: chunk.size)\n";
    std::cout << "  --max-attempts <n>      Upload attempts (default: upload.max_attempts)\n";
    std::cout << "  --retry-delay-ms <ms>   Delay between attempts (default: upload.retry_delay_ms)\n";
    std::cout << "  --meta <key=value>      Document metadata, repeatable\n";
    std::cout << "\nEnvironment:\n";
    std::cout << "  PS_CHUNK_SIZE, PS_UPLOAD_MAX_ATTEMPTS, PS_UPLOAD_RETRY_DELAY_MS\n";
    std::cout << "  PS_FAILURE_LOG, PS_JOURNAL, PS_CHUNK_DIR, PS_VECTOR_INDEX\n";
    std::cout << "  PS_DB_HOST, PS_DB_PORT, PS_DB_NAME, PS_DB_USER, PS_DB_PASS\n";
    std::cout << "  PS_LOG_LEVEL, PS_LOG_FILE\n";

    return 0;
}

int cmd_version([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "polystore " << POLYSTORE_VERSION_STRING << "\n";
#ifdef HAS_HNSWLIB
    std::cout << "vector store: hnswlib\n";
#else
    std::cout << "vector store: not built\n";
#endif
    return 0;
}

// =============================================================================
// Ingest Command
// =============================================================================

static bool parse_u64(const char* text, uint64_t& out) {
    try {
        size_t used = 0;
        std::string s(text);
        if (s.empty() || s[0] == '-') return false;
        out = std::stoull(s, &used);
        return used == s.size();
    } catch (const std::exception&) {
        return false;
    }
}

int cmd_ingest(int argc, char* argv[]) {
    if (!load_config()) return EXIT_USAGE;

    IngestOptions opts = IngestOptions::from_config(Config::getInstance());
    Metadata metadata;
    std::string path;

    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        uint64_t n = 0;
        if (arg == "--chunk-size" && i + 1 < argc) {
            if (!parse_u64(argv[++i], n) || n == 0) {
                std::cerr << "Invalid --chunk-size\n";
                return EXIT_USAGE;
            }
            opts.chunk_size = n;
        } else if (arg == "--max-attempts" && i + 1 < argc) {
            if (!parse_u64(argv[++i], n) || n == 0 || n > 1000) {
                std::cerr << "Invalid --max-attempts\n";
                return EXIT_USAGE;
            }
            opts.max_attempts = static_cast<int>(n);
        } else if (arg == "--retry-delay-ms" && i + 1 < argc) {
            if (!parse_u64(argv[++i], n)) {
                std::cerr << "Invalid --retry-delay-ms\n";
                return EXIT_USAGE;
            }
            opts.retry_delay = std::chrono::milliseconds(n);
        } else if (arg == "--meta" && i + 1 < argc) {
            std::string kv = argv[++i];
            auto eq = kv.find('=');
            if (eq == std::string::npos || eq == 0) {
                std::cerr << "--meta expects key=value\n";
                return EXIT_USAGE;
            }
            metadata[kv.substr(0, eq)] = kv.substr(eq + 1);
        } else if (arg[0] != '-' && path.empty()) {
            path = arg;
        } else {
            std::cerr << "Unknown ingest option: " << arg << "\n";
            return EXIT_USAGE;
        }
    }

    if (path.empty()) {
        std::cerr << "Usage: polystore ingest [options] <file>\n";
        return EXIT_USAGE;
    }

    try {
        FileChunkStore chunk_store(opts.chunk_store_dir);
        FailureLog failure_log(opts.failure_log_path);
        SagaJournal journal(opts.journal_path);
        SagaMonitor monitor(&failure_log);

        DownstreamStores stores;
        std::unique_ptr<PgRecordStore> relational;
        std::unique_ptr<PgRecordStore> graph;
        if (!g_options.no_db) {
            auto cfg = db_config();
            graph = std::make_unique<PgRecordStore>("postgres-graph", cfg, "ingest_graph_node");
            relational = std::make_unique<PgRecordStore>("postgres-relational", cfg, "ingest_document");
            stores.graph = graph.get();
            stores.relational = relational.get();
        }

#ifdef HAS_HNSWLIB
        HnswVectorStore vector_store("hnsw", HnswConfig{});
        if (std::filesystem::exists(opts.vector_index_path)) {
            vector_store.load(opts.vector_index_path);
        }
        stores.vector = &vector_store;
#endif

        StreamingIngestService service(chunk_store, stores, failure_log, monitor, &journal, opts);

        ProgressSink progress;
        if (!g_options.quiet) {
            progress = [](const UploadProgress& p) {
                std::cerr << "\r  " << static_cast<int>(p.percent_complete) << "%  "
                          << format_bytes(static_cast<uint64_t>(p.bytes_per_second)) << "/s  ETA "
                          << format_duration(p.estimated_seconds_remaining) << "    " << std::flush;
            };
        }

        std::signal(SIGINT, on_interrupt);
        FileSource source(path);
        SubmitResult r = service.submit_streaming_upload(source, opts.chunk_size, opts.max_attempts,
                                                         metadata, progress, &g_cancel);
        std::signal(SIGINT, SIG_DFL);
        if (!g_options.quiet) std::cerr << "\n";

#ifdef HAS_HNSWLIB
        // Rolled-back inserts are persisted as deletions too
        vector_store.save(opts.vector_index_path);
#endif

        std::cout << "saga:      " << r.saga_id << "\n";
        std::cout << "status:    " << r.status << "\n";
        std::cout << "operation: " << r.operation_id << "\n";
        if (r.document_id) std::cout << "document:  " << *r.document_id << "\n";
        if (r.rollback_status) std::cout << "rollback:  " << *r.rollback_status << "\n";
        for (const auto& e : r.attempt_failures) std::cout << "  retry:   " << e << "\n";
        for (const auto& e : r.errors) std::cout << "  error:   " << e << "\n";
        for (const auto& e : r.compensation_errors) std::cout << "  cleanup: " << e << "\n";

        if (r.success) return EXIT_OK;
        if (!r.compensation_errors.empty()) {
            std::cerr << "Manual cleanup required, see " << opts.failure_log_path << "\n";
            return EXIT_MANUAL_CLEANUP;
        }
        return EXIT_ROLLED_BACK;

    } catch (const PolystoreException& e) {
        std::cerr << e.what() << "\n";
        return EXIT_USAGE;
    }
}

// =============================================================================
// Recover Command
// =============================================================================

int cmd_recover([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    if (!load_config()) return EXIT_USAGE;
    IngestOptions opts = IngestOptions::from_config(Config::getInstance());

    try {
        SagaJournal journal(opts.journal_path);
        FailureLog failure_log(opts.failure_log_path);

        size_t n = report_interrupted_sagas(journal, failure_log);
        if (n == 0) {
            std::cout << "No interrupted sagas\n";
        } else {
            std::cout << n << " interrupted saga(s) recorded in " << opts.failure_log_path << "\n";
        }
        return EXIT_OK;
    } catch (const PolystoreException& e) {
        std::cerr << e.what() << "\n";
        return EXIT_USAGE;
    }
}

// =============================================================================
// Failures Command
// =============================================================================

int cmd_failures(int argc, char* argv[]) {
    if (!load_config()) return EXIT_USAGE;
    IngestOptions opts = IngestOptions::from_config(Config::getInstance());

    std::optional<FailureKind> kind;
    std::string saga;
    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--kind" && i + 1 < argc) {
            kind = parse_failure_kind(argv[++i]);
            if (!kind) {
                std::cerr << "Unknown kind: " << argv[i] << "\n";
                return EXIT_USAGE;
            }
        } else if (arg == "--saga" && i + 1 < argc) {
            saga = argv[++i];
        } else {
            std::cerr << "Unknown failures option: " << arg << "\n";
            return EXIT_USAGE;
        }
    }

    try {
        FailureLog failure_log(opts.failure_log_path);
        size_t shown = 0;
        for (const FailureRecord& rec : failure_log.read_all()) {
            if (kind && rec.kind != *kind) continue;
            if (!saga.empty() && rec.saga_id != saga) continue;

            std::cout << format_iso8601(rec.timestamp) << "  " << to_string(rec.kind)
                      << "  " << rec.saga_id << "\n";
            for (const auto& [k, v] : rec.detail) {
                std::cout << "    " << k << ": " << v << "\n";
            }
            ++shown;
        }
        std::cout << shown << " record(s)\n";
        return EXIT_OK;
    } catch (const PolystoreException& e) {
        std::cerr << e.what() << "\n";
        return EXIT_USAGE;
    }
}

}  // namespace polystore::cli

// =============================================================================
// Main Entry Point
// =============================================================================

static void parse_global_options(int& argc, char**& argv) {
    int i = 1;  // Skip program name
    while (i < argc) {
        std::string arg = argv[i];

        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            g_options.config_file = argv[++i];
        } else if (arg == "--no-db") {
            g_options.no_db = true;
        } else if (arg == "-v" || arg == "--verbose") {
            g_options.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            g_options.quiet = true;
        } else if (arg[0] == '-') {
            polystore::db::ConnectionConfig scratch;
            int start = i;
            if (!scratch.parse_arg(argc, argv, i)) {
                // Unknown global option, let the command handle it
                break;
            }
            for (int j = start; j <= i; ++j) g_options.db_args.emplace_back(argv[j]);
        } else {
            // First non-option is the command
            break;
        }
        ++i;
    }

    argc -= i;
    argv += i;
}

int main(int argc, char* argv[]) {
    parse_global_options(argc, argv);

    if (argc < 1) {
        polystore::cli::cmd_help(0, nullptr);
        return 1;
    }

    const char* cmd_name = argv[0];
    ++argv;
    --argc;

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        if (strcmp(cmd->name, cmd_name) == 0) {
            return cmd->handler(argc, argv);
        }
    }

    std::cerr << "Unknown command: " << cmd_name << "\n";
    std::cerr << "Run 'polystore help' for usage.\n";
    return 1;
}
