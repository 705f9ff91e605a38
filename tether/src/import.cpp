// tether_import: Import tasks from the legacy SQLite task database
//
// Usage: tether_import <sqlite-db> <base-dir> [OPTIONS]
//
// Copies rows of the `tasks` table into per-project task documents,
// keeping ids and parent links. Rows of `task_memory_connections` become
// edges when the memory already exists under <base-dir>.
//
// Options:
//   --project NAME    Project for rows without one (default: "default")
//   --dry-run         Show what would be imported
//   --verbose, -v     Show every row

#include <tether/tether.hpp>
#include <sqlite3.h>
#include <iostream>
#include <algorithm>
#include <map>
#include <set>
#include <string>
#include <cstring>
#include <vector>

using namespace tether;

struct ImportStats {
    size_t tasks = 0;
    size_t skipped = 0;        // Already present
    size_t orphaned = 0;       // Parent missing; imported top-level
    size_t connections = 0;
};

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <sqlite-db> <base-dir> [options]\n"
              << "Options:\n"
              << "  --project NAME    Project for rows without one (default: default)\n"
              << "  --dry-run         Show what would be imported\n"
              << "  --verbose, -v     Show every row\n"
              << "  --help, -h        Show this help\n";
}

bool table_exists(sqlite3* db, const char* table) {
    const char* sql = "SELECT 1 FROM sqlite_master WHERE type='table' AND name=?";
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) return false;
    sqlite3_bind_text(stmt, 1, table, -1, SQLITE_TRANSIENT);
    bool exists = sqlite3_step(stmt) == SQLITE_ROW;
    sqlite3_finalize(stmt);
    return exists;
}

std::string column_text(sqlite3_stmt* stmt, int col) {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? std::string(text) : std::string();
}

// Legacy DATETIME columns are "YYYY-MM-DD HH:MM:SS" in UTC
Timestamp column_time(sqlite3_stmt* stmt, int col, Timestamp fallback) {
    auto ts = from_iso8601(column_text(stmt, col));
    return ts ? *ts : fallback;
}

int read_tasks(sqlite3* db, Index& index, const std::string& default_project,
               std::vector<std::string>& imported, ImportStats& stats, bool verbose) {
    if (!table_exists(db, "tasks")) {
        std::cerr << "No tasks table found\n";
        return -1;
    }

    const char* sql =
        "SELECT id, title, description, level, parent_id, status, project, priority, "
        "created_at, updated_at FROM tasks ORDER BY created_at, id";
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Error preparing tasks query: " << sqlite3_errmsg(db) << "\n";
        return -1;
    }

    Timestamp fallback = now();
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        Task t;
        t.id = column_text(stmt, 0);
        if (t.id.empty()) continue;
        if (index.contains(t.id)) {
            stats.skipped++;
            if (verbose) std::cerr << "  skip " << t.id << " (already present)\n";
            continue;
        }

        t.title = trim(column_text(stmt, 1));
        if (t.title.empty()) t.title = "Untitled task " + t.id;
        t.description = column_text(stmt, 2);
        std::string level = column_text(stmt, 3);
        if (!level.empty()) t.tags.push_back("level:" + level);
        t.parent_id = column_text(stmt, 4);
        t.status = parse_status(column_text(stmt, 5)).value_or(Status::Todo);
        t.project = trim(column_text(stmt, 6));
        if (t.project.empty()) t.project = default_project;
        t.priority = parse_priority(column_text(stmt, 7)).value_or(Priority::Medium);
        t.created = column_time(stmt, 8, fallback);
        t.updated = column_time(stmt, 9, t.created);
        t.serial = index.next_serial(t.project, t.category);

        if (verbose) std::cerr << "  " << t.serial << " " << t.id << " " << t.title << "\n";
        index.put(t);
        imported.push_back(t.id);
        stats.tasks++;
    }
    if (rc != SQLITE_DONE) {
        std::cerr << "Error reading tasks: " << sqlite3_errmsg(db) << "\n";
    }

    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE ? 0 : -1;
}

// Parents gain their subtask lists once every row is in the Index
void link_parents(Index& index, const std::vector<std::string>& imported,
                  std::set<std::string>& touched, ImportStats& stats) {
    for (const auto& id : imported) {
        Task t = *index.find_task(id);
        if (t.parent_id.empty()) continue;

        const Task* parent = index.find_task(t.parent_id);
        if (!parent) {
            std::cerr << "  " << id << ": parent " << t.parent_id << " not found, importing top-level\n";
            t.parent_id.clear();
            index.put(t);
            stats.orphaned++;
            continue;
        }
        Task p = *parent;
        if (std::find(p.subtasks.begin(), p.subtasks.end(), id) == p.subtasks.end()) {
            p.subtasks.push_back(id);
            index.put(p);
            touched.insert(p.id);
        }
    }
}

int read_connections(sqlite3* db, Index& index, std::set<std::string>& touched,
                     ImportStats& stats, bool verbose) {
    if (!table_exists(db, "task_memory_connections")) {
        if (verbose) std::cerr << "  No task_memory_connections table found\n";
        return 0;
    }

    const char* sql = "SELECT task_id, memory_id, relevance_score, created_at FROM task_memory_connections";
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Error preparing connections query: " << sqlite3_errmsg(db) << "\n";
        return -1;
    }

    Timestamp fallback = now();
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        std::string task_id = column_text(stmt, 0);
        std::string memory_id = column_text(stmt, 1);
        const Task* task = index.find_task(task_id);
        const Memory* memory = index.find_memory(memory_id);
        if (!task || !memory) {
            if (verbose) std::cerr << "  skip edge " << task_id << " -> " << memory_id << "\n";
            continue;
        }

        Connection c;
        c.type = ConnectionType::Related;
        c.relevance = clamp01(static_cast<float>(sqlite3_column_double(stmt, 2)));
        c.created = c.updated = column_time(stmt, 3, fallback);

        Task t = *task;
        Memory m = *memory;
        auto add = [&](std::vector<Connection>& conns, const std::string& from, const std::string& to) {
            for (const auto& existing : conns) {
                if (existing.to_id == to) return false;
            }
            Connection e = c;
            e.from_id = from;
            e.to_id = to;
            conns.push_back(e);
            return true;
        };
        bool changed = add(t.connections, t.id, m.id);
        changed = add(m.connections, m.id, t.id) || changed;
        if (!changed) continue;

        index.put(t);
        index.put(m);
        touched.insert(t.id);
        touched.insert(m.id);
        stats.connections++;
    }

    sqlite3_finalize(stmt);
    return 0;
}

int main(int argc, char* argv[]) {
    std::string db_path;
    std::string base_dir;
    std::string default_project = "default";
    bool dry_run = false;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--project") == 0 && i + 1 < argc) {
            default_project = argv[++i];
        } else if (strcmp(argv[i], "--dry-run") == 0) {
            dry_run = true;
        } else if (strcmp(argv[i], "--verbose") == 0 || strcmp(argv[i], "-v") == 0) {
            verbose = true;
        } else if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (argv[i][0] == '-') {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        } else if (db_path.empty()) {
            db_path = argv[i];
        } else if (base_dir.empty()) {
            base_dir = argv[i];
        }
    }
    if (db_path.empty() || base_dir.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    std::cerr << "tether_import: " << db_path << " -> " << base_dir << "\n";
    if (dry_run) std::cerr << "  (dry run - no changes will be made)\n";

    sqlite3* db;
    if (sqlite3_open_v2(db_path.c_str(), &db, SQLITE_OPEN_READONLY, nullptr) != SQLITE_OK) {
        std::cerr << "Error opening database: " << sqlite3_errmsg(db) << "\n";
        sqlite3_close(db);
        return 1;
    }

    StoreConfig store_config;
    store_config.base_dir = base_dir;
    store_config.default_project = default_project;
    DocumentStore store(std::make_shared<FileBackend>(), store_config, !verbose);

    Index index;
    index.rebuild(store.load_all());

    ImportStats stats;
    std::vector<std::string> imported;
    std::set<std::string> touched;

    int rc = read_tasks(db, index, default_project, imported, stats, verbose);
    if (rc == 0) {
        link_parents(index, imported, touched, stats);
        rc = read_connections(db, index, touched, stats, verbose);
    }
    sqlite3_close(db);
    if (rc != 0) return 1;

    for (const auto& id : imported) touched.insert(id);

    if (!dry_run) {
        try {
            for (const auto& id : touched) {
                if (const Task* t = index.find_task(id)) {
                    store.save(t->project, *t);
                } else if (const Memory* m = index.find_memory(id)) {
                    store.save(m->project, *m);
                }
            }
        } catch (const Error& e) {
            std::cerr << "Import failed: " << e.what() << "\n";
            return 1;
        }
    }

    std::cerr << "\nImport " << (dry_run ? "preview" : "complete") << ":\n"
              << "  Tasks:       " << stats.tasks << "\n"
              << "  Skipped:     " << stats.skipped << "\n"
              << "  Orphaned:    " << stats.orphaned << "\n"
              << "  Connections: " << stats.connections << "\n";
    return 0;
}
