#pragma once
#include "knowledge_bridge.hpp"
#include <string>
#include <vector>
#include <mutex>
#include <cstdint>

struct sqlite3;

namespace orga {

// Subject-predicate-object facts in SQLite with an FTS5 index over the
// rendered fact text. Candidates come from FTS5 and are re-ranked by how
// much of the fact the query covers.
class SqliteKnowledgeStore : public KnowledgeStore {
public:
    // ":memory:" gives a private in-memory database.
    explicit SqliteKnowledgeStore(const std::string& db_path);
    ~SqliteKnowledgeStore() override;

    SqliteKnowledgeStore(const SqliteKnowledgeStore&) = delete;
    SqliteKnowledgeStore& operator=(const SqliteKnowledgeStore&) = delete;

    std::vector<KnowledgeItem> query(const std::string& text, size_t k) override;
    std::string store(const std::string& subject, const std::string& predicate,
                      const std::string& object, float confidence) override;

    bool is_open() const { return db_ != nullptr; }
    int64_t count() const;

    // FTS5 MATCH expression OR-ing the quoted alphanumeric words of text.
    static std::string match_expression(const std::string& text);

private:
    sqlite3* db_ = nullptr;
    mutable std::mutex mutex_;

    void init_tables();
};

} // namespace orga
