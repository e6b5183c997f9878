#pragma once

/**
 * @file SQLiteResultSet.hpp
 * @brief RAII wrapper for SQLite prepared statement results.
 *
 * Owns a sqlite3_stmt, binds parameters, steps through rows and gives
 * typed access to column values. The statement is finalized when the
 * wrapper is destroyed.
 */

#include <sqlite3.h>
#include <string>
#include <cstdint>

namespace blobfs {

/**
 * @class SQLiteResultSet
 * @brief RAII wrapper for SQLite prepared statement results.
 *
 * SQLite uses step() to both execute and fetch rows. Each call to step()
 * advances to the next row.
 *
 * Usage:
 * @code
 *   SQLiteResultSet rs(conn.prepare("SELECT source FROM source_file WHERE hash = ?"));
 *   rs.bindText(1, hash);
 *   while (rs.step()) {
 *       std::string bytes = rs.getBytes(0);
 *   }
 * @endcode
 *
 * Thread Safety:
 * - Not thread-safe; each thread should have its own result set.
 */
class SQLiteResultSet {
public:
    /**
     * @brief Construct a result set wrapper.
     * @param stmt sqlite3_stmt handle to manage (takes ownership), or nullptr.
     */
    explicit SQLiteResultSet(sqlite3_stmt* stmt = nullptr);

    /**
     * @brief Destructor - finalizes the statement if still owned.
     */
    ~SQLiteResultSet();

    // Non-copyable
    SQLiteResultSet(const SQLiteResultSet&) = delete;
    SQLiteResultSet& operator=(const SQLiteResultSet&) = delete;

    // Movable
    SQLiteResultSet(SQLiteResultSet&& other) noexcept;
    SQLiteResultSet& operator=(SQLiteResultSet&& other) noexcept;

    /**
     * @brief Get the underlying sqlite3_stmt handle.
     */
    sqlite3_stmt* get() const { return m_stmt; }

    /**
     * @brief Boolean conversion - true if statement is valid.
     */
    operator bool() const { return m_stmt != nullptr; }

    /**
     * @brief Bind a text parameter.
     * @param index One-based parameter index.
     * @param value Value to bind (copied by SQLite).
     * @throws StoreException if binding fails.
     */
    void bindText(int index, const std::string& value);

    /**
     * @brief Step to the next row.
     * @return true if a row is available, false once the statement is done.
     * @throws StoreException if sqlite3_step() reports an error.
     */
    bool step();

    /**
     * @brief Storage class of a column in the current row.
     * @return SQLITE_INTEGER, SQLITE_FLOAT, SQLITE_TEXT, SQLITE_BLOB or SQLITE_NULL.
     */
    int columnType(int index) const;

    /**
     * @brief Get a column value as a string.
     * @return String value, or empty string if NULL. Stops at an embedded NUL.
     */
    std::string getString(int index) const;

    /**
     * @brief Get the raw bytes of a TEXT or BLOB column.
     * @return Exactly sqlite3_column_bytes() bytes, embedded NULs included.
     */
    std::string getBytes(int index) const;

    /**
     * @brief Get a column value as a 64-bit integer.
     */
    int64_t getInt64(int index) const;

    /**
     * @brief Get a column value as a double.
     */
    double getDouble(int index) const;

    /**
     * @brief Check if a column value is NULL.
     */
    bool isNull(int index) const;

    /**
     * @brief Finalize the statement and release resources.
     *
     * Called automatically by the destructor.
     */
    void finalize();

private:
    sqlite3_stmt* m_stmt;  ///< SQLite prepared statement handle (owned)
};

}  // namespace blobfs
