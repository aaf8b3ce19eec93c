#include "db/mysql/mysql_connection.hpp"
#include "db/mysql/mysql_type_map.hpp"
#include "core/utils.hpp"

#include <mysql/errmsg.h>
#include <format>

namespace sqlorm {

namespace {

constexpr uint16_t kDefaultPort = 3306;
constexpr unsigned int kConnectTimeoutSeconds = 5;

DbResultSet read_rows(MYSQL_RES* res) {
    DbResultSet rs;
    rs.success = true;
    rs.has_rows = true;

    const unsigned int width = mysql_num_fields(res);
    const MYSQL_FIELD* fields = mysql_fetch_fields(res);
    for (unsigned int col = 0; col < width; ++col) {
        rs.column_names.emplace_back(fields[col].name);
        rs.column_types.push_back(MysqlTypeMap::field_type_name(fields[col]));
    }

    rs.rows.reserve(static_cast<size_t>(mysql_num_rows(res)));
    while (MYSQL_ROW cells = mysql_fetch_row(res)) {
        const unsigned long* sizes = mysql_fetch_lengths(res);
        auto& out = rs.rows.emplace_back();
        out.reserve(width);
        for (unsigned int col = 0; col < width; ++col) {
            out.push_back(cells[col] ? DbValue(std::string(cells[col], sizes[col])) : std::nullopt);
        }
    }

    rs.affected_rows = rs.rows.size();
    return rs;
}

} // anonymous namespace

MysqlConnection::MysqlConnection(MYSQL* handle)
    : handle_(handle) {}

MysqlConnection::~MysqlConnection() {
    close();
}

DbResultSet MysqlConnection::driver_failure() {
    const unsigned int code = mysql_errno(handle_);
    if (code == CR_SERVER_GONE_ERROR || code == CR_SERVER_LOST) {
        lost_ = true;
    }
    DbResultSet rs;
    rs.error_message = std::format("{} ({})", mysql_error(handle_), code);
    return rs;
}

DbResultSet MysqlConnection::execute(const std::string& sql) {
    if (!handle_) {
        DbResultSet rs;
        rs.error_message = "connection is closed";
        return rs;
    }

    if (mysql_real_query(handle_, sql.data(), static_cast<unsigned long>(sql.size())) != 0) {
        return driver_failure();
    }

    MYSQL_RES* res = mysql_store_result(handle_);
    if (res) {
        DbResultSet rs = read_rows(res);
        mysql_free_result(res);
        return rs;
    }
    // No result set: a statement without columns, or a failed fetch
    if (mysql_field_count(handle_) != 0) {
        return driver_failure();
    }

    DbResultSet rs;
    rs.success = true;
    rs.affected_rows = static_cast<uint64_t>(mysql_affected_rows(handle_));
    return rs;
}

bool MysqlConnection::is_healthy(const std::string& health_check_query) {
    if (!is_connected() || mysql_ping(handle_) != 0) {
        return false;
    }
    if (health_check_query.empty()) {
        return true;
    }
    if (mysql_query(handle_, health_check_query.c_str()) != 0) {
        return false;
    }
    // Drain the reply so the handle is ready for the next statement
    if (MYSQL_RES* res = mysql_store_result(handle_)) {
        mysql_free_result(res);
    }
    return true;
}

bool MysqlConnection::is_connected() const {
    return handle_ != nullptr && !lost_;
}

void MysqlConnection::close() {
    if (handle_) {
        mysql_close(handle_);
        handle_ = nullptr;
    }
}

// ============================================================================
// MysqlConnectionFactory
// ============================================================================

std::unique_ptr<IDbConnection> MysqlConnectionFactory::create(const ConnectOptions& options) {
    MYSQL* handle = mysql_init(nullptr);
    if (!handle) {
        utils::log::error("mysql_init failed: out of memory");
        return nullptr;
    }

    const unsigned int timeout = kConnectTimeoutSeconds;
    mysql_options(handle, MYSQL_OPT_CONNECT_TIMEOUT, &timeout);
    mysql_options(handle, MYSQL_SET_CHARSET_NAME, "utf8mb4");
    if (!options.application_name.empty()) {
        mysql_options4(handle, MYSQL_OPT_CONNECT_ATTR_ADD,
                       "program_name", options.application_name.c_str());
    }

    const uint16_t port = options.port == 0 ? kDefaultPort : options.port;
    if (!mysql_real_connect(handle, options.host.c_str(), options.username.c_str(),
                            options.password.c_str(), options.database.c_str(),
                            port, /*unix_socket=*/nullptr, kClientFlags)) {
        utils::log::error(std::format("Cannot connect to MySQL {}:{}/{} as '{}': {}",
            options.host, port, options.database, options.username, mysql_error(handle)));
        mysql_close(handle);
        return nullptr;
    }

    return std::make_unique<MysqlConnection>(handle);
}

} // namespace sqlorm
