#include "querylab/mysql_connector.h"
#include "querylab/utils.h"
#include <cstdlib>
#include <stdexcept>

namespace querylab {

MySQLConnector::MySQLConnector(std::shared_ptr<Logger> logger)
    : mysql_(nullptr), connected_(false), logger_(std::move(logger)) {
    mysql_ = mysql_init(nullptr);
    if (!mysql_) {
        throw std::runtime_error("Failed to initialize MySQL client");
    }
}

MySQLConnector::~MySQLConnector() {
    if (mysql_) {
        mysql_close(mysql_);
        mysql_ = nullptr;
    }
}

void MySQLConnector::fail(const std::string& context) {
    last_error_ = context + ": " + mysql_error(mysql_);
    if (logger_) logger_->error(last_error_);
}

bool MySQLConnector::connect(const std::string& host, const std::string& user,
                             const std::string& password, const std::string& database,
                             unsigned int port) {
    if (!mysql_) return false;

    if (mysql_real_connect(mysql_, host.c_str(), user.c_str(), password.c_str(),
                           database.empty() ? nullptr : database.c_str(), port, nullptr, 0)) {
        connected_ = true;
        if (logger_) logger_->info("Connected to MySQL at " + host + ":" + std::to_string(port));
        return true;
    }

    fail("MySQL connection failed");
    return false;
}

void MySQLConnector::disconnect() {
    if (connected_) {
        mysql_close(mysql_);
        mysql_ = mysql_init(nullptr);
        connected_ = false;
    }
}

bool MySQLConnector::isConnected() const {
    return connected_;
}

std::vector<std::string> MySQLConnector::getDatabases() {
    std::vector<std::string> databases;
    RawResult result = executeQuery("SHOW DATABASES");
    for (const auto& row : result.rows) {
        if (!row.empty()) databases.push_back(row[0].to_string());
    }
    return databases;
}

bool MySQLConnector::selectDatabase(const std::string& database) {
    if (!connected_) return false;

    if (mysql_select_db(mysql_, database.c_str()) == 0) {
        return true;
    }

    fail("Failed to select database " + database);
    return false;
}

Value MySQLConnector::convertField(const char* data, unsigned long length, const MYSQL_FIELD& field) {
    if (!data) return Value::null();
    std::string text(data, length);

    switch (field.type) {
        case MYSQL_TYPE_TINY:
            if (field.length == 1) return Value::boolean(text != "0");
            return Value::integer(std::strtoll(text.c_str(), nullptr, 10));
        case MYSQL_TYPE_SHORT:
        case MYSQL_TYPE_LONG:
        case MYSQL_TYPE_INT24:
        case MYSQL_TYPE_LONGLONG:
        case MYSQL_TYPE_YEAR:
            return Value::integer(std::strtoll(text.c_str(), nullptr, 10));
        case MYSQL_TYPE_FLOAT:
        case MYSQL_TYPE_DOUBLE:
        case MYSQL_TYPE_DECIMAL:
        case MYSQL_TYPE_NEWDECIMAL:
            return Value::real(std::strtod(text.c_str(), nullptr));
        case MYSQL_TYPE_DATE:
        case MYSQL_TYPE_DATETIME:
        case MYSQL_TYPE_TIMESTAMP: {
            auto date = parse_date(text);
            // Zero dates ("0000-00-00") do not parse.
            return date ? Value::date(*date) : Value::null();
        }
        default:
            return Value::text(text);
    }
}

MySQLConnector::RawResult MySQLConnector::executeQuery(const std::string& sql) {
    RawResult result;

    if (!connected_) {
        result.error_message = "Not connected to database";
        return result;
    }

    if (mysql_query(mysql_, sql.c_str()) != 0) {
        fail("Query failed");
        result.error_message = mysql_error(mysql_);
        return result;
    }

    MYSQL_RES* res = mysql_store_result(mysql_);
    if (!res) {
        if (mysql_field_count(mysql_) != 0) {
            fail("Fetching result failed");
            result.error_message = mysql_error(mysql_);
            return result;
        }
        result.affected_rows = mysql_affected_rows(mysql_);
        result.success = true;
        return result;
    }

    unsigned int num_fields = mysql_num_fields(res);
    MYSQL_FIELD* fields = mysql_fetch_fields(res);
    for (unsigned int i = 0; i < num_fields; ++i) {
        result.columns.push_back(fields[i].name);
    }

    MYSQL_ROW row;
    while ((row = mysql_fetch_row(res))) {
        unsigned long* lengths = mysql_fetch_lengths(res);
        std::vector<Value> cells;
        cells.reserve(num_fields);
        for (unsigned int i = 0; i < num_fields; ++i) {
            cells.push_back(convertField(row[i], lengths[i], fields[i]));
        }
        result.rows.push_back(std::move(cells));
    }

    mysql_free_result(res);
    result.success = true;
    return result;
}

std::vector<std::string> MySQLConnector::getTables() {
    std::vector<std::string> tables;
    RawResult result = executeQuery("SHOW TABLES");
    for (const auto& row : result.rows) {
        if (!row.empty()) tables.push_back(row[0].to_string());
    }
    return tables;
}

MySQLConnector::TableInfo MySQLConnector::getTableInfo(const std::string& table_name) {
    TableInfo info;
    info.name = table_name;

    RawResult count = executeQuery("SELECT COUNT(*) FROM `" + table_name + "`");
    if (count.success && !count.rows.empty() && !count.rows[0].empty() && count.rows[0][0].is_numeric()) {
        info.row_count = static_cast<unsigned long long>(count.rows[0][0].as_int());
    }

    RawResult desc = executeQuery("DESCRIBE `" + table_name + "`");
    for (const auto& row : desc.rows) {
        if (!row.empty()) info.columns.push_back(row[0].to_string());
    }

    // SHOW INDEX: Non_unique(1), Key_name(2), Seq_in_index(3), Column_name(4)
    RawResult idx = executeQuery("SHOW INDEX FROM `" + table_name + "`");
    for (const auto& row : idx.rows) {
        if (row.size() < 5 || row[4].is_null() || row[3].to_string() != "1") continue;
        IndexInfo index;
        index.name = row[2].to_string();
        index.column = row[4].to_string();
        index.unique = row[1].to_string() == "0";
        info.indexes.push_back(index);
    }

    return info;
}

size_t load_dataset_from_mysql(MySQLConnector& connector, Dataset& dataset, size_t row_limit) {
    size_t loaded = 0;
    for (const auto& name : connector.getTables()) {
        MySQLConnector::TableInfo info = connector.getTableInfo(name);
        MySQLConnector::RawResult data =
            connector.executeQuery("SELECT * FROM `" + name + "` LIMIT " + std::to_string(row_limit));
        if (!data.success) continue;

        std::string table = to_lower(name);
        std::vector<Row> rows;
        rows.reserve(data.rows.size());
        for (const auto& cells : data.rows) {
            Row row;
            for (size_t i = 0; i < cells.size() && i < data.columns.size(); ++i) {
                row.append(data.columns[i], cells[i]);
            }
            rows.push_back(std::move(row));
        }

        dataset.add_table(table, data.columns, rows,
                          "MySQL table " + name + " (" + std::to_string(info.row_count) + " rows)");
        for (const auto& index : info.indexes) {
            dataset.add_index(table, index.name, index.column, index.unique);
        }
        ++loaded;
    }
    return loaded;
}

} // namespace querylab
