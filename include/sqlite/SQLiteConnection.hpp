#pragma once

/**
 * @file SQLiteConnection.hpp
 * @brief RAII wrapper for an SQLite database connection.
 *
 * The filesystem holds exactly one of these for the lifetime of the mount.
 */

#include <sqlite3.h>
#include <string>
#include <chrono>

namespace blobfs {

/**
 * @class SQLiteConnection
 * @brief RAII wrapper for an SQLite database file connection.
 *
 * SQLiteConnection manages a connection to an SQLite database file.
 * The connection is automatically closed when the object is destroyed.
 *
 * The mounted filesystem opens its connection with SQLITE_OPEN_READONLY,
 * which also makes a missing database file an open failure rather than
 * silently creating an empty database.
 *
 * Usage:
 * @code
 *   SQLiteConnection conn("/path/to/database.db");
 *   if (conn.isValid() && conn.healthCheck()) {
 *       SQLiteResultSet rs(conn.prepare("SELECT name FROM sqlite_master"));
 *       while (rs.step()) {
 *           // ...
 *       }
 *   }
 * @endcode
 *
 * Thread Safety:
 * - Not synchronised. The filesystem dispatches one call at a time.
 */
class SQLiteConnection {
public:
    /**
     * @brief Open a connection to an SQLite database file.
     * @param dbPath Path to the SQLite database file.
     * @param readOnly Open with SQLITE_OPEN_READONLY (default). When false the
     *        file is opened read-write and created if missing.
     *
     * On failure the error is logged and isValid() returns false.
     */
    explicit SQLiteConnection(const std::string& dbPath, bool readOnly = true);

    /**
     * @brief Destructor - closes the database connection.
     */
    ~SQLiteConnection();

    // Non-copyable
    SQLiteConnection(const SQLiteConnection&) = delete;
    SQLiteConnection& operator=(const SQLiteConnection&) = delete;

    // Movable
    SQLiteConnection(SQLiteConnection&& other) noexcept;
    SQLiteConnection& operator=(SQLiteConnection&& other) noexcept;

    /**
     * @brief Get the underlying sqlite3 handle.
     * @return Raw sqlite3* pointer (still owned by this object).
     */
    sqlite3* get() const { return m_db; }

    /**
     * @brief Check if the connection is valid and open.
     */
    bool isValid() const { return m_db != nullptr; }

    /**
     * @brief Path the connection was opened with.
     */
    const std::string& path() const { return m_path; }

    /**
     * @brief Execute a SQL statement without returning results.
     * @param sql The SQL statement to execute.
     * @return true on success, false on error (check error() for details).
     *
     * Only usable on read-write connections; the filesystem itself never
     * calls it.
     */
    bool execute(const std::string& sql);

    /**
     * @brief Prepare a SQL statement for execution.
     * @param sql The SQL statement to prepare.
     * @return sqlite3_stmt* owned by the caller, typically wrapped in
     *         SQLiteResultSet.
     * @throws StoreException if the statement cannot be compiled.
     *
     * The SQL text is logged at debug level.
     */
    sqlite3_stmt* prepare(const std::string& sql);

    /**
     * @brief Verify the file is a readable SQLite database.
     * @return true if the schema catalog can be queried.
     *
     * sqlite3_open_v2 succeeds on arbitrary files; the first real query is
     * what detects "file is not a database".
     */
    bool healthCheck();

    /**
     * @brief Set how long to wait on a locked database before failing.
     * @param timeout Zero disables waiting.
     */
    void setBusyTimeout(std::chrono::milliseconds timeout);

    /**
     * @brief Get the last SQLite error message.
     */
    const char* error() const;

    /**
     * @brief Get the last SQLite error code.
     */
    int errorCode() const;

private:
    sqlite3* m_db = nullptr;  ///< SQLite database handle
    std::string m_path;       ///< Path to database file
};

}  // namespace blobfs
