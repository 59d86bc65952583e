#include <penv/version_cache.hpp>
#include <penv/fs.hpp>
#include <penv/log.hpp>
#include <penv/sha256.hpp>
#include <sqlite3.h>

#include <algorithm>
#include <map>

namespace penv {

const CachedBinary* CacheEntry::binary(Binary b) const {
    for (const auto& cb : binaries) {
        if (cb.binary == b) return &cb;
    }
    return nullptr;
}

Status verify_entry(const CacheEntry& entry) {
    for (const auto& cb : entry.binaries) {
        auto digest = Sha256::hash_file(cb.path);
        if (digest.is_err()) {
            return PenvError{PenvError::IO,
                std::string(binary_name(cb.binary)) + " " + entry.version.to_string() +
                " is missing from the cache (" + cb.path + ")"};
        }
        if (digest.value() != cb.sha256) {
            return PenvError{PenvError::Checksum,
                std::string(binary_name(cb.binary)) + " " + entry.version.to_string() +
                " does not match its recorded digest",
                "expected " + cb.sha256 + ", found " + digest.value()};
        }
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// pImpl
// ---------------------------------------------------------------------------

static const std::string SCHEMA_VERSION = "1";

struct VersionCache::Impl {
    sqlite3* db = nullptr;
    std::filesystem::path versions_dir;

    sqlite3_stmt* stmt_list_versions = nullptr;
    sqlite3_stmt* stmt_list_binaries = nullptr;
    sqlite3_stmt* stmt_insert_version = nullptr;
    sqlite3_stmt* stmt_insert_binary = nullptr;
    sqlite3_stmt* stmt_delete_version = nullptr;
    sqlite3_stmt* stmt_delete_binaries = nullptr;

    ~Impl() {
        finalize_all();
        if (db) sqlite3_close(db);
    }

    void finalize_all() {
        auto fin = [](sqlite3_stmt*& s) {
            if (s) { sqlite3_finalize(s); s = nullptr; }
        };
        fin(stmt_list_versions);
        fin(stmt_list_binaries);
        fin(stmt_insert_version);
        fin(stmt_insert_binary);
        fin(stmt_delete_version);
        fin(stmt_delete_binaries);
    }

    PenvError db_error(const std::string& what) const {
        return PenvError(PenvError::IO, what + ": " + sqlite3_errmsg(db));
    }

    Status prepare(const char* sql, sqlite3_stmt*& out) {
        if (out) {
            sqlite3_reset(out);
            sqlite3_clear_bindings(out);
            return ok_status();
        }
        if (sqlite3_prepare_v2(db, sql, -1, &out, nullptr) != SQLITE_OK) {
            return db_error("SQLite prepare failed");
        }
        return ok_status();
    }

    Status exec(const char* sql) {
        char* errmsg = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK) {
            std::string msg = errmsg ? errmsg : "unknown error";
            sqlite3_free(errmsg);
            return PenvError(PenvError::IO, "SQLite exec failed: " + msg);
        }
        return ok_status();
    }

    Status init_schema() {
        PENV_TRY(exec(
            "CREATE TABLE IF NOT EXISTS schema_info ("
            "  key TEXT PRIMARY KEY,"
            "  value TEXT"
            ");"
            "CREATE TABLE IF NOT EXISTS installed_version ("
            "  version TEXT PRIMARY KEY,"
            "  root_dir TEXT NOT NULL,"
            "  installed_at INTEGER NOT NULL"
            ");"
            "CREATE TABLE IF NOT EXISTS installed_binary ("
            "  version TEXT NOT NULL,"
            "  binary TEXT NOT NULL,"
            "  path TEXT NOT NULL,"
            "  sha256 TEXT NOT NULL,"
            "  PRIMARY KEY (version, binary)"
            ");"
        ));

        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db, "SELECT value FROM schema_info WHERE key='version'",
                               -1, &stmt, nullptr) != SQLITE_OK) {
            return db_error("cannot read schema version");
        }
        int rc = sqlite3_step(stmt);
        std::string found;
        if (rc == SQLITE_ROW) {
            const unsigned char* text = sqlite3_column_text(stmt, 0);
            if (text) found = reinterpret_cast<const char*>(text);
        }
        sqlite3_finalize(stmt);

        if (found.empty()) {
            std::string sql = "INSERT OR REPLACE INTO schema_info (key, value) "
                              "VALUES ('version', '" + SCHEMA_VERSION + "');";
            return exec(sql.c_str());
        }
        if (found != SCHEMA_VERSION) {
            // The index is the record of what is installed; never silently drop it
            return PenvError{PenvError::Config,
                "cache index schema version " + found + " is not supported",
                "this penv understands schema version " + SCHEMA_VERSION};
        }
        return ok_status();
    }
};

// ---------------------------------------------------------------------------
// VersionCache public interface
// ---------------------------------------------------------------------------

VersionCache::VersionCache() : impl_(std::make_unique<Impl>()) {}
VersionCache::~VersionCache() = default;
VersionCache::VersionCache(VersionCache&&) noexcept = default;
VersionCache& VersionCache::operator=(VersionCache&&) noexcept = default;

Status VersionCache::open(const std::filesystem::path& db_path,
                          const std::filesystem::path& versions_dir) {
    close();
    impl_->versions_dir = versions_dir;

    PENV_TRY(ensure_dir(db_path.parent_path()));
    PENV_TRY(ensure_dir(versions_dir));

    if (sqlite3_open(db_path.c_str(), &impl_->db) != SQLITE_OK) {
        std::string msg = impl_->db ? sqlite3_errmsg(impl_->db) : "out of memory";
        close();
        return PenvError(PenvError::IO,
            "cannot open cache index " + db_path.string() + ": " + msg);
    }

    sqlite3_busy_timeout(impl_->db, 10000);

    auto setup = [&]() -> Status {
        PENV_TRY(impl_->exec(
            "PRAGMA journal_mode=WAL;"
            "PRAGMA synchronous=FULL;"
        ));
        PENV_TRY(impl_->init_schema());
        return ok_status();
    };

    auto status = setup();
    if (status.is_err()) {
        close();
        auto err = std::move(status).error();
        err.file = db_path.string();
        return err;
    }
    return ok_status();
}

void VersionCache::close() {
    if (impl_->db) {
        impl_->finalize_all();
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
    }
}

bool VersionCache::is_open() const {
    return impl_->db != nullptr;
}

const std::filesystem::path& VersionCache::versions_dir() const {
    return impl_->versions_dir;
}

std::filesystem::path VersionCache::version_dir(const Version& v) const {
    return impl_->versions_dir / v.to_string();
}

static std::string column_text(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

Result<std::vector<CacheEntry>> VersionCache::list(const std::optional<Requirement>& req) {
    if (!is_open()) return PenvError(PenvError::IO, "cache index is not open");

    PENV_TRY(impl_->prepare(
        "SELECT version, root_dir, installed_at FROM installed_version",
        impl_->stmt_list_versions));

    std::map<std::string, CacheEntry> by_version;
    int rc;
    while ((rc = sqlite3_step(impl_->stmt_list_versions)) == SQLITE_ROW) {
        std::string ver = column_text(impl_->stmt_list_versions, 0);
        auto parsed = Version::parse(ver);
        if (parsed.is_err()) {
            log::warn("ignoring unparseable cache entry '%s'", ver.c_str());
            continue;
        }
        CacheEntry e;
        e.version = std::move(parsed).value();
        e.root_dir = column_text(impl_->stmt_list_versions, 1);
        e.installed_at = sqlite3_column_int64(impl_->stmt_list_versions, 2);
        by_version.emplace(ver, std::move(e));
    }
    if (rc != SQLITE_DONE) return impl_->db_error("cannot read cache index");

    PENV_TRY(impl_->prepare(
        "SELECT version, binary, path, sha256 FROM installed_binary",
        impl_->stmt_list_binaries));
    while ((rc = sqlite3_step(impl_->stmt_list_binaries)) == SQLITE_ROW) {
        auto it = by_version.find(column_text(impl_->stmt_list_binaries, 0));
        if (it == by_version.end()) continue;
        auto bin = parse_binary(column_text(impl_->stmt_list_binaries, 1));
        if (bin.is_err()) continue;
        it->second.binaries.push_back(CachedBinary{
            bin.value(),
            column_text(impl_->stmt_list_binaries, 2),
            column_text(impl_->stmt_list_binaries, 3)});
    }
    if (rc != SQLITE_DONE) return impl_->db_error("cannot read cache index");

    std::vector<CacheEntry> out;
    for (auto& kv : by_version) {
        if (req && !req->accepts(kv.second.version)) continue;
        std::sort(kv.second.binaries.begin(), kv.second.binaries.end(),
                  [](const CachedBinary& a, const CachedBinary& b) { return a.binary < b.binary; });
        out.push_back(std::move(kv.second));
    }
    std::sort(out.begin(), out.end(),
              [](const CacheEntry& a, const CacheEntry& b) { return a.version > b.version; });
    return Result<std::vector<CacheEntry>>::ok(std::move(out));
}

Result<std::vector<Version>> VersionCache::versions() {
    auto entries = list();
    if (entries.is_err()) return std::move(entries).error();

    std::vector<Version> out;
    for (const auto& e : entries.value()) out.push_back(e.version);
    return Result<std::vector<Version>>::ok(std::move(out));
}

Result<std::optional<CacheEntry>> VersionCache::find(const Version& v) {
    auto entries = list();
    if (entries.is_err()) return std::move(entries).error();

    for (auto& e : entries.value()) {
        if (e.version == v) {
            return Result<std::optional<CacheEntry>>::ok(std::move(e));
        }
    }
    return Result<std::optional<CacheEntry>>::ok(std::nullopt);
}

Result<bool> VersionCache::is_installed(const Version& v) {
    auto found = find(v);
    if (found.is_err()) return std::move(found).error();
    return Result<bool>::ok(found.value().has_value());
}

Status VersionCache::insert(const CacheEntry& entry) {
    if (!is_open()) return PenvError(PenvError::IO, "cache index is not open");

    std::string ver = entry.version.to_string();
    PENV_TRY(impl_->exec("BEGIN IMMEDIATE;"));

    auto write = [&]() -> Status {
        PENV_TRY(impl_->prepare(
            "INSERT INTO installed_version (version, root_dir, installed_at) VALUES (?, ?, ?)",
            impl_->stmt_insert_version));
        sqlite3_bind_text(impl_->stmt_insert_version, 1, ver.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(impl_->stmt_insert_version, 2, entry.root_dir.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(impl_->stmt_insert_version, 3, entry.installed_at);
        if (sqlite3_step(impl_->stmt_insert_version) != SQLITE_DONE) {
            return impl_->db_error("cannot record " + ver + " in the cache index");
        }

        PENV_TRY(impl_->prepare(
            "INSERT INTO installed_binary (version, binary, path, sha256) VALUES (?, ?, ?, ?)",
            impl_->stmt_insert_binary));
        for (const auto& cb : entry.binaries) {
            sqlite3_reset(impl_->stmt_insert_binary);
            sqlite3_bind_text(impl_->stmt_insert_binary, 1, ver.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(impl_->stmt_insert_binary, 2, binary_name(cb.binary), -1, SQLITE_STATIC);
            sqlite3_bind_text(impl_->stmt_insert_binary, 3, cb.path.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(impl_->stmt_insert_binary, 4, cb.sha256.c_str(), -1, SQLITE_TRANSIENT);
            if (sqlite3_step(impl_->stmt_insert_binary) != SQLITE_DONE) {
                return impl_->db_error("cannot record " + ver + " binaries in the cache index");
            }
        }
        return ok_status();
    };

    auto status = write();
    if (status.is_err()) {
        sqlite3_reset(impl_->stmt_insert_version);
        sqlite3_reset(impl_->stmt_insert_binary);
        auto rollback = impl_->exec("ROLLBACK;");
        if (rollback.is_err()) {
            log::error("%s", rollback.error().message.c_str());
        }
        return status;
    }
    return impl_->exec("COMMIT;");
}

Status VersionCache::uninstall(const Version& v) {
    if (!is_open()) return PenvError(PenvError::IO, "cache index is not open");

    auto found = find(v);
    if (found.is_err()) return std::move(found).error();
    if (!found.value()) {
        return PenvError{PenvError::NotFound,
            "version " + v.to_string() + " is not installed"};
    }

    std::string ver = v.to_string();
    PENV_TRY(impl_->exec("BEGIN IMMEDIATE;"));
    auto remove_rows = [&]() -> Status {
        PENV_TRY(impl_->prepare("DELETE FROM installed_binary WHERE version=?",
                                impl_->stmt_delete_binaries));
        sqlite3_bind_text(impl_->stmt_delete_binaries, 1, ver.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(impl_->stmt_delete_binaries) != SQLITE_DONE) {
            return impl_->db_error("cannot remove " + ver + " from the cache index");
        }
        PENV_TRY(impl_->prepare("DELETE FROM installed_version WHERE version=?",
                                impl_->stmt_delete_version));
        sqlite3_bind_text(impl_->stmt_delete_version, 1, ver.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(impl_->stmt_delete_version) != SQLITE_DONE) {
            return impl_->db_error("cannot remove " + ver + " from the cache index");
        }
        return ok_status();
    };

    auto status = remove_rows();
    if (status.is_err()) {
        auto rollback = impl_->exec("ROLLBACK;");
        if (rollback.is_err()) {
            log::error("%s", rollback.error().message.c_str());
        }
        return status;
    }
    PENV_TRY(impl_->exec("COMMIT;"));

    // The entry is gone, so a leftover directory is only an orphan that the
    // next install of this version replaces.
    std::filesystem::path dir = found.value()->root_dir;
    auto removed = remove_tree(dir);
    if (removed.is_err()) {
        log::warn("%s", removed.error().message.c_str());
    }
    log::info("uninstalled %s", ver.c_str());
    return ok_status();
}

} // namespace penv
