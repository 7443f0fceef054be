#pragma once

#include <string>

struct sqlite3;      // Forward declaration for SQLite database handle

namespace socialgraph {
namespace db {

/*
 * Low-level RAII wrapper around a SQLite database connection.
 * All public methods forward to the underlying C API while enforcing
 * exception-based error handling and ownership semantics.
 */
class SQLiteConnection {
public:
    // Opens ~/.socialgraph/socialgraph.db, or ./socialgraph.db when the home
    // directory cannot be used.
    SQLiteConnection();
    // Opens an explicit path; ":memory:" gives a private in-memory database.
    explicit SQLiteConnection(const std::string& path);
    ~SQLiteConnection();

    SQLiteConnection(const SQLiteConnection&) = delete;
    SQLiteConnection& operator=(const SQLiteConnection&) = delete;

    // Execute one or more SQL statements separated by semicolons.
    void exec(const std::string& sql);

    // Return the raw sqlite3* handle (use with care).
    sqlite3* getDbHandle();

    const std::string& getPath() const { return m_path; }

    static std::string defaultDatabasePath();

private:
    void open(const std::string& path);

    sqlite3* db = nullptr;
    std::string m_path;
};

} // namespace db
} // namespace socialgraph
