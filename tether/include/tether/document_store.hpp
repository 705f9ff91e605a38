#pragma once
// DocumentStore: durable per-project persistence of memories and tasks
//
// Layout: {base}/{project}/tasks.md and {base}/{project}/memories.md.
// Every save or remove rewrites the whole project file through the
// backend. Writes to one project must be serialized by the caller.
//
// The backend is the only thing that touches bytes. FileBackend writes
// atomically (temp + fsync + rename); MemoryBackend keeps files in a map.

#include "types.hpp"
#include "errors.hpp"
#include "config.hpp"
#include "document.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <vector>
#include <iostream>

namespace tether {

// ═══════════════════════════════════════════════════════════════════════════
// Storage backends
// ═══════════════════════════════════════════════════════════════════════════

class StorageBackend {
public:
    virtual ~StorageBackend() = default;

    // Returns nullopt when the file does not exist; throws StorageError on I/O failure
    virtual std::optional<std::string> read(const std::string& path) const = 0;
    virtual void write(const std::string& path, const std::string& data) = 0;
    virtual bool exists(const std::string& path) const = 0;
    virtual void mkdir(const std::string& path) = 0;
    // Immediate subdirectory names
    virtual std::vector<std::string> list_dirs(const std::string& path) const = 0;
};

class FileBackend : public StorageBackend {
public:
    std::optional<std::string> read(const std::string& path) const override {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) return std::nullopt;
        std::ifstream in(path, std::ios::binary);
        if (!in) throw StorageError("read", path, "cannot open");
        std::stringstream ss;
        ss << in.rdbuf();
        if (in.bad()) throw StorageError("read", path, "read error");
        return ss.str();
    }

    void write(const std::string& path, const std::string& data) override {
        bool ok = safe_save(path, [&](FILE* f) {
            return std::fwrite(data.data(), 1, data.size(), f) == data.size();
        });
        if (!ok) throw StorageError("write", path, std::strerror(errno));
    }

    bool exists(const std::string& path) const override {
        std::error_code ec;
        return std::filesystem::exists(path, ec);
    }

    void mkdir(const std::string& path) override {
        std::error_code ec;
        std::filesystem::create_directories(path, ec);
        if (ec) throw StorageError("mkdir", path, ec.message());
    }

    std::vector<std::string> list_dirs(const std::string& path) const override {
        std::vector<std::string> out;
        std::error_code ec;
        if (!std::filesystem::is_directory(path, ec)) return out;
        for (const auto& entry : std::filesystem::directory_iterator(path, ec)) {
            if (entry.is_directory()) out.push_back(entry.path().filename().string());
        }
        if (ec) throw StorageError("list", path, ec.message());
        std::sort(out.begin(), out.end());
        return out;
    }
};

// In-process backend for tests and ephemeral sessions
class MemoryBackend : public StorageBackend {
public:
    std::optional<std::string> read(const std::string& path) const override {
        if (fail_reads) throw StorageError("read", path, "injected failure");
        auto it = files_.find(path);
        if (it == files_.end()) return std::nullopt;
        return it->second;
    }

    void write(const std::string& path, const std::string& data) override {
        if (fail_writes) throw StorageError("write", path, "injected failure");
        files_[path] = data;
        ++writes;
    }

    bool exists(const std::string& path) const override {
        return files_.count(path) > 0 || dirs_.count(path) > 0;
    }

    void mkdir(const std::string& path) override {
        dirs_.insert(path);
    }

    std::vector<std::string> list_dirs(const std::string& path) const override {
        std::vector<std::string> out;
        std::string prefix = path + "/";
        for (const auto& d : dirs_) {
            if (d.compare(0, prefix.size(), prefix) != 0) continue;
            std::string rest = d.substr(prefix.size());
            if (!rest.empty() && rest.find('/') == std::string::npos) out.push_back(rest);
        }
        return out;
    }

    bool fail_reads = false;
    bool fail_writes = false;
    size_t writes = 0;

private:
    std::map<std::string, std::string> files_;
    std::set<std::string> dirs_;
};

// ═══════════════════════════════════════════════════════════════════════════
// DocumentStore
// ═══════════════════════════════════════════════════════════════════════════

struct LoadResult {
    std::vector<Memory> memories;
    std::vector<Task> tasks;
    size_t files = 0;
    size_t skipped = 0;                  // Malformed blocks or unreadable files
    std::vector<std::string> warnings;
};

class DocumentStore {
public:
    DocumentStore(std::shared_ptr<StorageBackend> backend, StoreConfig config, bool quiet = false)
        : backend_(std::move(backend)), config_(std::move(config)), quiet_(quiet) {}

    const std::string& base_dir() const { return config_.base_dir; }

    // Scan every project directory. Malformed content is skipped with a warning.
    LoadResult load_all() const {
        LoadResult result;
        std::vector<std::string> projects;
        try {
            projects = backend_->list_dirs(config_.base_dir);
        } catch (const StorageError& e) {
            warn(result, e.what());
            return result;
        }
        for (const auto& project : projects) {
            load_project_into(project, result);
        }
        if (!quiet_) {
            std::cerr << "[DocumentStore] Loaded " << result.tasks.size() << " tasks, "
                      << result.memories.size() << " memories from " << result.files
                      << " files";
            if (result.skipped) std::cerr << " (" << result.skipped << " skipped)";
            std::cerr << "\n";
        }
        return result;
    }

    LoadResult load_project(const std::string& project) const {
        LoadResult result;
        load_project_into(safe_name(project), result);
        return result;
    }

    std::vector<std::string> projects() const {
        return backend_->list_dirs(config_.base_dir);
    }

    // Lazily creates {base}/{project}
    std::string get_project_path(const std::string& project) {
        std::string path = config_.base_dir + "/" + safe_name(project);
        if (!backend_->exists(path)) backend_->mkdir(path);
        return path;
    }

    // Upsert one task and rewrite the project's task file
    void save(const std::string& project, const Task& task) {
        std::string path = get_project_path(project) + "/" + config_.tasks_file;
        auto tasks = read_tasks(path);
        upsert(tasks, task);
        write_file(path, render_tasks(project, tasks));
    }

    void save(const std::string& project, const Memory& memory) {
        std::string path = get_project_path(project) + "/" + config_.memories_file;
        auto memories = read_memories(path);
        upsert(memories, memory);
        write_file(path, render_memories(project, memories));
    }

    // Returns false when the id was not in the file
    bool remove_task(const std::string& project, const std::string& id) {
        std::string path = get_project_path(project) + "/" + config_.tasks_file;
        auto tasks = read_tasks(path);
        if (!erase(tasks, id)) return false;
        write_file(path, render_tasks(project, tasks));
        return true;
    }

    bool remove_memory(const std::string& project, const std::string& id) {
        std::string path = get_project_path(project) + "/" + config_.memories_file;
        auto memories = read_memories(path);
        if (!erase(memories, id)) return false;
        write_file(path, render_memories(project, memories));
        return true;
    }

    // Directory names never carry path separators
    static std::string safe_name(const std::string& project) {
        std::string out;
        for (char c : project) {
            out += (c == '/' || c == '\\' || c == '\0') ? '_' : c;
        }
        if (out.empty() || out == "." || out == "..") out = "_" + out;
        return out;
    }

private:
    template <typename T>
    static void upsert(std::vector<T>& items, const T& item) {
        for (auto& existing : items) {
            if (existing.id == item.id) { existing = item; return; }
        }
        items.push_back(item);
    }

    template <typename T>
    static bool erase(std::vector<T>& items, const std::string& id) {
        auto before = items.size();
        items.erase(std::remove_if(items.begin(), items.end(),
                                   [&](const T& x) { return x.id == id; }),
                    items.end());
        return items.size() != before;
    }

    void write_file(const std::string& path, const std::string& data) {
        backend_->write(path, data);
    }

    // Parse a file for rewriting. A file with malformed blocks is copied
    // aside first so the rewrite never silently discards them.
    ParsedDocument read_for_rewrite(const std::string& path) {
        auto text = backend_->read(path);
        if (!text) return {};
        auto doc = parse_document(*text);
        if (!doc.errors.empty()) {
            std::string backup = path + ".bak-" + std::to_string(now());
            backend_->write(backup, *text);
            std::cerr << "[DocumentStore] " << path << " has " << doc.errors.size()
                      << " malformed block(s); original kept at " << backup << "\n";
        }
        return doc;
    }

    std::vector<Task> read_tasks(const std::string& path) {
        std::vector<Task> out;
        auto doc = read_for_rewrite(path);
        for (const auto& b : doc.blocks) {
            try {
                out.push_back(task_from_block(b));
            } catch (const std::exception& e) {
                std::cerr << "[DocumentStore] Dropping unreadable task at " << path << ":"
                          << b.line << ": " << e.what() << "\n";
            }
        }
        return out;
    }

    std::vector<Memory> read_memories(const std::string& path) {
        std::vector<Memory> out;
        auto doc = read_for_rewrite(path);
        for (const auto& b : doc.blocks) {
            try {
                out.push_back(memory_from_block(b));
            } catch (const std::exception& e) {
                std::cerr << "[DocumentStore] Dropping unreadable memory at " << path << ":"
                          << b.line << ": " << e.what() << "\n";
            }
        }
        return out;
    }

    void load_project_into(const std::string& project, LoadResult& result) const {
        std::string dir = config_.base_dir + "/" + project;
        load_file(dir + "/" + config_.tasks_file, "tasks", result);
        load_file(dir + "/" + config_.memories_file, "memories", result);
    }

    void load_file(const std::string& path, const std::string& kind, LoadResult& result) const {
        std::optional<std::string> text;
        try {
            text = backend_->read(path);
        } catch (const StorageError& e) {
            ++result.skipped;
            warn(result, e.what());
            return;
        }
        if (!text) return;
        ++result.files;

        auto doc = parse_document(*text);
        for (const auto& err : doc.errors) {
            ++result.skipped;
            warn(result, path + ": " + err);
        }
        if (doc.header) {
            if (!header_compatible(*doc.header)) {
                ++result.skipped;
                warn(result, path + ": unsupported format " + header_field(*doc.header, "format", "?"));
                return;
            }
            std::string declared = header_field(*doc.header, "kind", kind);
            if (declared != kind) {
                warn(result, path + ": header declares kind '" + declared + "', reading as " + kind);
            }
        }

        for (const auto& block : doc.blocks) {
            try {
                if (kind == "tasks") {
                    result.tasks.push_back(task_from_block(block));
                } else {
                    result.memories.push_back(memory_from_block(block));
                }
            } catch (const std::exception& e) {
                ++result.skipped;
                warn(result, path + ":" + std::to_string(block.line) + ": " + e.what());
            }
        }
    }

    void warn(LoadResult& result, const std::string& msg) const {
        result.warnings.push_back(msg);
        std::cerr << "[DocumentStore] Skipping " << msg << "\n";
    }

    std::shared_ptr<StorageBackend> backend_;
    StoreConfig config_;
    bool quiet_;
};

} // namespace tether
