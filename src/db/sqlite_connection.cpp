#include <socialgraph/db/sqlite_connection.h>
#include <sqlite3.h>
#include <stdexcept>
#include <filesystem>
#include <cstdlib>
#include <iostream>

namespace socialgraph {
namespace db {

namespace { // Anonymous namespace for helper
std::filesystem::path get_home_directory_path() {
    #ifdef _WIN32
        const char* userprofile = std::getenv("USERPROFILE");
        if (userprofile) {
            return std::filesystem::path(userprofile);
        }
    #else // POSIX-like systems
        const char* home_env = std::getenv("HOME");
        if (home_env) {
            return std::filesystem::path(home_env);
        }
    #endif
    return ""; // Return empty path if home directory cannot be determined
}

const char* kSchema = R"(
    CREATE TABLE IF NOT EXISTS settings (
        key TEXT PRIMARY KEY NOT NULL,
        value TEXT
    );
)";
} // end anonymous namespace

std::string SQLiteConnection::defaultDatabasePath() {
    std::filesystem::path home = get_home_directory_path();
    if (home.empty()) {
        std::cerr << "Warning: Could not determine home directory. Using current directory for database." << std::endl;
        return "socialgraph.db";
    }
    try {
        std::filesystem::path app_config_dir = home / ".socialgraph";
        if (!std::filesystem::exists(app_config_dir)) {
            std::filesystem::create_directories(app_config_dir);
        }
        return (app_config_dir / "socialgraph.db").string();
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "Filesystem error constructing database path in home directory: " << e.what()
                  << ". Using current directory as fallback." << std::endl;
        return "socialgraph.db";
    }
}

SQLiteConnection::SQLiteConnection() {
    open(defaultDatabasePath());
}

SQLiteConnection::SQLiteConnection(const std::string& path) {
    open(path);
}

void SQLiteConnection::open(const std::string& path) {
    m_path = path;
    if (sqlite3_open(path.c_str(), &db) != SQLITE_OK) {
        std::string err_msg = "Database connection failed: ";
        if (db) {
            err_msg += sqlite3_errmsg(db);
            sqlite3_close(db);
            db = nullptr;
        } else {
            err_msg += "Could not allocate memory for database handle.";
        }
        throw std::runtime_error(err_msg);
    }

    try {
        exec(kSchema);
    } catch (const std::exception&) {
        sqlite3_close(db);
        db = nullptr;
        throw;
    }
}

SQLiteConnection::~SQLiteConnection() {
    if (db) {
        sqlite3_close(db);
    }
}

void SQLiteConnection::exec(const std::string& sql) {
    char* err_msg_ptr = nullptr;
    if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err_msg_ptr) != SQLITE_OK) {
        std::string error_message_str = "SQL error executing '";
        error_message_str += sql;
        error_message_str += "': ";
        if (err_msg_ptr) {
            error_message_str += err_msg_ptr;
            sqlite3_free(err_msg_ptr);
        } else {
            error_message_str += "Unknown SQLite error";
        }
        throw std::runtime_error(error_message_str);
    }
}

sqlite3* SQLiteConnection::getDbHandle() {
    return db;
}

} // namespace db
} // namespace socialgraph
