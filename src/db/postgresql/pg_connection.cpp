#include "db/postgresql/pg_connection.hpp"
#include "db/postgresql/pg_type_map.hpp"
#include "core/utils.hpp"

#include <format>
#include <memory>

namespace sqlorm {

namespace {

constexpr uint16_t kDefaultPort = 5432;

struct PgResultDeleter {
    void operator()(PGresult* res) const { PQclear(res); }
};

using PgResultPtr = std::unique_ptr<PGresult, PgResultDeleter>;

DbResultSet read_rows(const PGresult* res) {
    DbResultSet rs;
    rs.success = true;
    rs.has_rows = true;

    const int width = PQnfields(res);
    for (int col = 0; col < width; ++col) {
        rs.column_names.emplace_back(PQfname(res, col));
        rs.column_types.push_back(
            PgTypeMap::oid_to_type_name(static_cast<uint32_t>(PQftype(res, col))));
    }

    const int height = PQntuples(res);
    rs.rows.reserve(static_cast<size_t>(height));
    for (int row = 0; row < height; ++row) {
        auto& out = rs.rows.emplace_back();
        out.reserve(static_cast<size_t>(width));
        for (int col = 0; col < width; ++col) {
            if (PQgetisnull(res, row, col)) {
                out.emplace_back(std::nullopt);
            } else {
                out.emplace_back(std::string(PQgetvalue(res, row, col),
                                             static_cast<size_t>(PQgetlength(res, row, col))));
            }
        }
    }

    rs.affected_rows = static_cast<uint64_t>(height);
    return rs;
}

// Single-quote a conninfo value, escaping quotes and backslashes
std::string quote_conninfo(std::string_view value) {
    std::string quoted = "'";
    for (const char c : value) {
        if (c == '\'' || c == '\\') quoted += '\\';
        quoted += c;
    }
    quoted += '\'';
    return quoted;
}

} // anonymous namespace

// ============================================================================
// PgConnection
// ============================================================================

PgConnection::PgConnection(PGconn* handle)
    : handle_(handle) {}

PgConnection::~PgConnection() {
    close();
}

DbResultSet PgConnection::execute(const std::string& sql) {
    DbResultSet failed;
    if (!handle_) {
        failed.error_message = "connection is closed";
        return failed;
    }

    const PgResultPtr res(PQexec(handle_, sql.c_str()));
    if (!res) {
        failed.error_message = PQerrorMessage(handle_);
        return failed;
    }

    switch (PQresultStatus(res.get())) {
        case PGRES_TUPLES_OK:
            return read_rows(res.get());
        case PGRES_COMMAND_OK:
        case PGRES_EMPTY_QUERY: {
            DbResultSet rs;
            rs.success = true;
            // "" for statements that report no row count
            rs.affected_rows = utils::parse_int<uint64_t>(PQcmdTuples(res.get()), 0);
            return rs;
        }
        default:
            failed.error_message = PQresultErrorMessage(res.get());
            return failed;
    }
}

bool PgConnection::is_healthy(const std::string& health_check_query) {
    if (!is_connected()) {
        return false;
    }
    const PgResultPtr res(PQexec(handle_, health_check_query.c_str()));
    if (!res) {
        return false;
    }
    const ExecStatusType status = PQresultStatus(res.get());
    return status == PGRES_TUPLES_OK || status == PGRES_COMMAND_OK;
}

bool PgConnection::is_connected() const {
    return handle_ != nullptr && PQstatus(handle_) == CONNECTION_OK;
}

void PgConnection::close() {
    if (handle_) {
        PQfinish(handle_);
        handle_ = nullptr;
    }
}

// ============================================================================
// PgConnectionFactory
// ============================================================================

std::string PgConnectionFactory::build_conninfo(const ConnectOptions& options) {
    std::string conninfo = std::format("host={} port={} dbname={} user={} password={}",
        quote_conninfo(options.host),
        options.port == 0 ? kDefaultPort : options.port,
        quote_conninfo(options.database),
        quote_conninfo(options.username),
        quote_conninfo(options.password));
    if (!options.application_name.empty()) {
        conninfo += " application_name=" + quote_conninfo(options.application_name);
    }
    return conninfo;
}

std::unique_ptr<IDbConnection> PgConnectionFactory::create(const ConnectOptions& options) {
    PGconn* handle = PQconnectdb(build_conninfo(options).c_str());
    if (!handle) {
        utils::log::error("PQconnectdb failed: out of memory");
        return nullptr;
    }

    if (PQstatus(handle) != CONNECTION_OK) {
        utils::log::error(std::format("Cannot connect to PostgreSQL {}:{}/{} as '{}': {}",
            options.host, options.port == 0 ? kDefaultPort : options.port,
            options.database, options.username, utils::trim(PQerrorMessage(handle))));
        PQfinish(handle);
        return nullptr;
    }

    return std::make_unique<PgConnection>(handle);
}

} // namespace sqlorm
