#pragma once

#include <libpq-fe.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace secplane {

struct PgResultDeleter {
    void operator()(PGresult* res) const { if (res) PQclear(res); }
};

using PgResultPtr = std::unique_ptr<PGresult, PgResultDeleter>;

/**
 * @brief Owning wrapper around a PGconn*
 *
 * All libpq calls are encapsulated here. Every statement goes through
 * PQexecParams so values are never spliced into SQL text.
 * Failures throw SecurityError(PERSISTENCE_UNAVAILABLE).
 */
class PgConnection {
public:
    /// Takes ownership of conn
    explicit PgConnection(PGconn* conn);
    ~PgConnection();

    PgConnection(const PgConnection&) = delete;
    PgConnection& operator=(const PgConnection&) = delete;

    /// @throws SecurityError(PERSISTENCE_UNAVAILABLE) if the server is unreachable
    [[nodiscard]] static std::unique_ptr<PgConnection> connect(const std::string& connection_string);

    /// Run a parameterized statement; std::nullopt parameters are sent as SQL NULL
    PgResultPtr execute(const std::string& sql,
                        const std::vector<std::optional<std::string>>& params = {});

    /// Rows touched by a command result
    [[nodiscard]] static uint64_t affected_rows(PGresult* res);

    /// Column value or std::nullopt for SQL NULL
    [[nodiscard]] static std::optional<std::string> get(PGresult* res, int row, int col);

    bool set_query_timeout(uint32_t timeout_ms);
    [[nodiscard]] bool is_connected() const;
    void close();

private:
    PGconn* conn_;
};

} // namespace secplane
