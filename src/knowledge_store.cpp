#include "knowledge_store.hpp"
#include "utils.hpp"
#include <sqlite3.h>
#include <algorithm>
#include <cctype>
#include <iostream>
#include <set>
#include <stdexcept>

namespace orga {

static std::vector<std::string> words_of(const std::string& text) {
    std::vector<std::string> words;
    std::string cur;
    for (char c : text) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            cur += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        } else if (!cur.empty()) {
            words.push_back(std::move(cur));
            cur.clear();
        }
    }
    if (!cur.empty()) words.push_back(std::move(cur));
    return words;
}

SqliteKnowledgeStore::SqliteKnowledgeStore(const std::string& db_path) {
    std::string path = expand_path(db_path);
    if (path != ":memory:") {
        auto parent = fs::path(path).parent_path();
        if (!parent.empty()) fs::create_directories(parent);
    }

    int rc = sqlite3_open(path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::cerr << "[knowledge] Failed to open database: " << sqlite3_errmsg(db_) << "\n";
        sqlite3_close(db_);
        db_ = nullptr;
        return;
    }

    init_tables();
}

SqliteKnowledgeStore::~SqliteKnowledgeStore() {
    if (db_) sqlite3_close(db_);
}

void SqliteKnowledgeStore::init_tables() {
    const char* sql = R"SQL(
        CREATE TABLE IF NOT EXISTS facts (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            subject TEXT NOT NULL,
            predicate TEXT NOT NULL,
            object TEXT NOT NULL,
            content TEXT NOT NULL,
            confidence REAL NOT NULL DEFAULT 0.8,
            created_at INTEGER
        );

        CREATE VIRTUAL TABLE IF NOT EXISTS facts_fts USING fts5(
            content, content='facts', content_rowid='id'
        );

        CREATE TRIGGER IF NOT EXISTS facts_ai AFTER INSERT ON facts BEGIN
            INSERT INTO facts_fts(rowid, content) VALUES (new.id, new.content);
        END;

        CREATE TRIGGER IF NOT EXISTS facts_ad AFTER DELETE ON facts BEGIN
            INSERT INTO facts_fts(facts_fts, rowid, content)
                VALUES ('delete', old.id, old.content);
        END;
    )SQL";

    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::cerr << "[knowledge] Schema init error: " << (err ? err : "unknown") << "\n";
        if (err) sqlite3_free(err);
    }
}

std::string SqliteKnowledgeStore::match_expression(const std::string& text) {
    std::string expr;
    std::set<std::string> seen;
    for (auto& w : words_of(text)) {
        if (!seen.insert(w).second) continue;
        if (!expr.empty()) expr += " OR ";
        expr += "\"" + w + "\"";
    }
    return expr;
}

std::string SqliteKnowledgeStore::store(const std::string& subject, const std::string& predicate,
                                        const std::string& object, float confidence) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) throw std::runtime_error("knowledge store is not open");

    const char* sql = "INSERT INTO facts (subject, predicate, object, content, confidence, created_at) "
                      "VALUES (?, ?, ?, ?, ?, ?)";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("store prepare error: ") + sqlite3_errmsg(db_));
    }

    std::string content = subject + " " + predicate + " " + object;
    sqlite3_bind_text(stmt, 1, subject.c_str(), static_cast<int>(subject.size()), SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, predicate.c_str(), static_cast<int>(predicate.size()), SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, object.c_str(), static_cast<int>(object.size()), SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, content.c_str(), static_cast<int>(content.size()), SQLITE_TRANSIENT);
    sqlite3_bind_double(stmt, 5, confidence);
    sqlite3_bind_int64(stmt, 6, epoch_now());

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        throw std::runtime_error(std::string("store error: ") + sqlite3_errmsg(db_));
    }
    return std::to_string(sqlite3_last_insert_rowid(db_));
}

std::vector<KnowledgeItem> SqliteKnowledgeStore::query(const std::string& text, size_t k) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_ || k == 0) return {};

    std::string match = match_expression(text);
    if (match.empty()) return {};

    // Top k*3 by bm25, re-ranked below by query coverage
    const char* sql = R"SQL(
        SELECT f.id, f.content, f.confidence
        FROM facts_fts
        JOIN facts f ON f.id = facts_fts.rowid
        WHERE facts_fts MATCH ?
        ORDER BY rank
        LIMIT ?
    )SQL";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "[knowledge] query prepare error: " << sqlite3_errmsg(db_) << "\n";
        return {};
    }
    sqlite3_bind_text(stmt, 1, match.c_str(), static_cast<int>(match.size()), SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 2, static_cast<int>(k * 3));

    auto query_words = words_of(text);
    std::set<std::string> query_set(query_words.begin(), query_words.end());

    std::vector<KnowledgeItem> items;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        KnowledgeItem item;
        item.id = std::to_string(sqlite3_column_int64(stmt, 0));
        const char* content = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
        item.content = content ? content : "";
        item.source = "fact";
        float confidence = static_cast<float>(sqlite3_column_double(stmt, 2));

        std::set<std::string> fact_words;
        for (auto& w : words_of(item.content)) fact_words.insert(w);
        size_t covered = 0;
        for (auto& w : fact_words) covered += query_set.count(w);
        float coverage = fact_words.empty() ? 0.0f
                                            : static_cast<float>(covered) / static_cast<float>(fact_words.size());
        item.score = coverage * std::clamp(confidence, 0.0f, 1.0f);
        items.push_back(std::move(item));
    }
    if (rc != SQLITE_DONE) {
        std::cerr << "[knowledge] query error: " << sqlite3_errmsg(db_) << "\n";
    }
    sqlite3_finalize(stmt);

    std::stable_sort(items.begin(), items.end(),
                     [](const KnowledgeItem& a, const KnowledgeItem& b) { return a.score > b.score; });
    if (items.size() > k) items.resize(k);
    return items;
}

int64_t SqliteKnowledgeStore::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return 0;
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM facts", -1, &stmt, nullptr) != SQLITE_OK) return 0;
    int64_t n = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) n = sqlite3_column_int64(stmt, 0);
    sqlite3_finalize(stmt);
    return n;
}

} // namespace orga
