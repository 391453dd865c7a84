#pragma once
#include <mysql/mysql.h>
#include <memory>
#include <string>
#include <vector>
#include "querylab/dataset.h"
#include "querylab/logger.h"
#include "querylab/value.h"

namespace querylab {

// Thin libmysqlclient wrapper used to pull a live schema into a Dataset.
class MySQLConnector {
public:
    explicit MySQLConnector(std::shared_ptr<Logger> logger = nullptr);
    ~MySQLConnector();

    MySQLConnector(const MySQLConnector&) = delete;
    MySQLConnector& operator=(const MySQLConnector&) = delete;

    // Connection management
    bool connect(const std::string& host, const std::string& user,
                 const std::string& password, const std::string& database = "",
                 unsigned int port = 3306);
    void disconnect();
    bool isConnected() const;
    const std::string& lastError() const { return last_error_; }

    std::vector<std::string> getDatabases();
    bool selectDatabase(const std::string& database);

    // Result of a statement, with cells typed by the MySQL field type.
    struct RawResult {
        std::vector<std::vector<Value>> rows;
        std::vector<std::string> columns;
        unsigned long long affected_rows = 0;
        std::string error_message;
        bool success = false;
    };

    RawResult executeQuery(const std::string& sql);

    struct IndexInfo {
        std::string name;
        std::string column;  // first column of the index
        bool unique = false;
    };

    struct TableInfo {
        std::string name;
        unsigned long long row_count = 0;
        std::vector<std::string> columns;
        std::vector<IndexInfo> indexes;
    };

    std::vector<std::string> getTables();
    TableInfo getTableInfo(const std::string& table_name);

private:
    MYSQL* mysql_;
    bool connected_;
    std::string last_error_;
    std::shared_ptr<Logger> logger_;

    void fail(const std::string& context);
    static Value convertField(const char* data, unsigned long length, const MYSQL_FIELD& field);
};

// Copies every table of the selected database (at most `row_limit` rows each)
// and its indexes into `dataset`. Returns the number of tables loaded.
size_t load_dataset_from_mysql(MySQLConnector& connector, Dataset& dataset, size_t row_limit);

} // namespace querylab
