#include <cctype>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include "querylab/btree.h"
#include "querylab/config.h"
#include "querylab/dataset.h"
#include "querylab/executor.h"
#include "querylab/explain.h"
#include "querylab/formatter.h"
#include "querylab/logger.h"
#include "querylab/mysql_connector.h"
#include "querylab/parser.h"
#include "querylab/query_analyzer.h"
#include "querylab/utils.h"

using namespace querylab;

static std::string env(const char* name, const std::string& fallback = "") {
    const char* v = std::getenv(name);
    return v ? std::string(v) : fallback;
}

static void loadEnvironment(Config& cfg) {
    cfg.setString("mysql_host", env("MYSQL_HOST", cfg.getString("mysql_host")));
    cfg.setString("mysql_user", env("MYSQL_USER", cfg.getString("mysql_user")));
    cfg.setString("mysql_password", env("MYSQL_PWD", env("MYSQL_PASSWORD", cfg.getString("mysql_password"))));
    cfg.setString("mysql_database", env("MYSQL_DB", cfg.getString("mysql_database")));
    std::string port = env("MYSQL_PORT");
    if (!port.empty()) {
        try {
            cfg.setInt("mysql_port", std::stoi(port));
        } catch (const std::exception&) {
            std::cerr << "Ignoring invalid MYSQL_PORT: " << port << "\n";
        }
    }
    std::string level = env("QUERYLAB_LOG_LEVEL");
    if (!level.empty()) cfg.setString("log_level", level);
    std::string file = env("QUERYLAB_LOG_FILE");
    if (!file.empty()) cfg.setString("log_file", file);
    std::string depth = env("QUERYLAB_MAX_RECURSION");
    if (!depth.empty()) {
        try {
            cfg.setInt("max_recursion_depth", std::stoi(depth));
        } catch (const std::exception&) {
            std::cerr << "Ignoring invalid QUERYLAB_MAX_RECURSION: " << depth << "\n";
        }
    }
}

static bool loadFromMySQL(const Config& cfg, std::shared_ptr<Logger> logger, Dataset& dataset) {
    MySQLConnector conn(logger);
    if (!conn.connect(cfg.getString("mysql_host"), cfg.getString("mysql_user"), cfg.getString("mysql_password"),
                      "", static_cast<unsigned int>(cfg.getInt("mysql_port")))) {
        std::cerr << conn.lastError() << "\n";
        return false;
    }
    std::string db = cfg.getString("mysql_database");
    if (!conn.selectDatabase(db)) {
        std::cerr << conn.lastError() << "\n";
        return false;
    }
    size_t n = load_dataset_from_mysql(conn, dataset, static_cast<size_t>(cfg.getInt("mysql_row_limit")));
    std::cout << "Loaded " << n << " tables from MySQL database " << db << "\n";
    return true;
}

static void printHelp() {
    std::cout << "Enter a SELECT query, or EXPLAIN <query>. Commands:\n"
              << "  .tables                         list tables\n"
              << "  .schema <table>                 columns and row count\n"
              << "  .indexes <table>                advertised indexes\n"
              << "  .analyze <query>                issues, recommendations and tips\n"
              << "  .btree <table> <index> [order]  build and draw the B-tree for an index\n"
              << "  .search <table> <index> <key>   trace a lookup\n"
              << "  .range <table> <index> <lo> <hi>  trace a range scan\n"
              << "  .help, .quit\n";
}

// Integers and dates come back typed; anything else is a string key.
static Value parseKey(const std::string& text) {
    std::string t = trim(text);
    if (t.size() >= 2 && (t.front() == '\'' || t.front() == '"') && t.back() == t.front())
        t = t.substr(1, t.size() - 2);
    if (auto d = parse_date(t)) return Value::date(*d);
    try {
        size_t used = 0;
        long long i = std::stoll(t, &used);
        if (used == t.size()) return Value::integer(i);
        double f = std::stod(t, &used);
        if (used == t.size()) return Value::real(f);
    } catch (const std::exception&) {
        // not a number
    }
    return Value::text(t);
}

class Shell {
private:
    const Dataset& dataset_;
    Config cfg_;
    std::shared_ptr<Logger> logger_;

    bool requireIndex(const std::string& table, const std::string& index) const {
        if (!dataset_.has_table(table)) {
            std::cout << format_error(unknown_table_error(table, dataset_.table_names()));
            return false;
        }
        if (!dataset_.find_index(table, index)) {
            std::cout << "No index '" << index << "' on " << table << ". Try .indexes " << table << "\n";
            return false;
        }
        return true;
    }

    BTree buildTree(const std::string& table, const std::string& index, int order) const {
        return build_index(dataset_.index_entries(table, index), order);
    }

    void runQuery(const std::string& sql) {
        QueryExecutor executor(dataset_, cfg_, logger_);
        std::cout << format_result(executor.execute(sql));
    }

    void runExplain(const std::string& sql) {
        Explainer explainer(dataset_);
        ParsedQuery q = parse_query(sql);
        ExplainReport report = explainer.explain(q);
        std::cout << format_explain(report);
        if (!report.ok()) return;
        for (const auto& table : q.tables) {
            if (!dataset_.has_table(table)) continue;
            std::cout << "\n" << format_comparison(explainer.compare(q, table));
        }
    }

    void command(const std::string& line) {
        std::istringstream in(line);
        std::string cmd;
        in >> cmd;
        std::vector<std::string> args;
        for (std::string a; in >> a;) args.push_back(a);

        if (cmd == ".help") {
            printHelp();
        } else if (cmd == ".tables") {
            for (const auto& t : dataset_.table_names()) {
                std::cout << "  " << t << " (" << dataset_.row_count(t) << " rows)";
                std::string d = dataset_.description(t);
                if (!d.empty()) std::cout << " - " << d;
                std::cout << "\n";
            }
        } else if (cmd == ".schema" && args.size() == 1) {
            if (!dataset_.has_table(args[0])) {
                std::cout << format_error(unknown_table_error(args[0], dataset_.table_names()));
                return;
            }
            std::cout << args[0] << " (" << dataset_.row_count(args[0]) << " rows)\n";
            for (const auto& c : dataset_.get_table_columns(args[0])) std::cout << "    - " << c << "\n";
        } else if (cmd == ".indexes" && args.size() == 1) {
            if (!dataset_.has_table(args[0])) {
                std::cout << format_error(unknown_table_error(args[0], dataset_.table_names()));
                return;
            }
            for (const auto& idx : dataset_.indexes(args[0])) {
                std::cout << "  " << idx.name << " on (" << idx.column << ")" << (idx.unique ? " unique" : "")
                          << ", " << idx.sorted_values.size() << " keys\n";
            }
        } else if (cmd == ".analyze") {
            std::string sql = trim(line.substr(cmd.size()));
            QueryAnalyzer analyzer(dataset_, cfg_, logger_);
            std::cout << format_analysis(analyzer.analyze(sql));
        } else if (cmd == ".btree" && (args.size() == 2 || args.size() == 3)) {
            if (!requireIndex(args[0], args[1])) return;
            int order = cfg_.getInt("btree_order", 4);
            if (args.size() == 3) {
                try {
                    order = std::stoi(args[2]);
                } catch (const std::exception&) {
                    std::cout << "Invalid order: " << args[2] << "\n";
                    return;
                }
            }
            try {
                BTree tree = buildTree(args[0], args[1], order);
                std::cout << "order " << tree.order() << ", " << tree.size() << " keys, height " << tree.height()
                          << "\n"
                          << format_tree(tree.treeStructure());
            } catch (const std::invalid_argument& e) {
                std::cout << e.what() << "\n";
            }
        } else if (cmd == ".search" && args.size() == 3) {
            if (!requireIndex(args[0], args[1])) return;
            BTree tree = buildTree(args[0], args[1], cfg_.getInt("btree_order", 4));
            SearchResult r = tree.search(parseKey(args[2]));
            std::cout << format_trace(r.trace);
            if (r.value) std::cout << "found row " << *r.value << "\n";
            else std::cout << "not found\n";
        } else if (cmd == ".range" && args.size() == 4) {
            if (!requireIndex(args[0], args[1])) return;
            BTree tree = buildTree(args[0], args[1], cfg_.getInt("btree_order", 4));
            RangeResult r = tree.rangeSearch(parseKey(args[2]), parseKey(args[3]));
            std::cout << format_trace(r.trace);
            std::cout << r.entries.size() << " entries:";
            for (const auto& e : r.entries) std::cout << " " << e.first.to_string() << "->" << e.second;
            std::cout << "\n";
        } else {
            std::cout << "Unknown or malformed command: " << line << " (try .help)\n";
        }
    }

public:
    Shell(const Dataset& dataset, const Config& cfg, std::shared_ptr<Logger> logger)
        : dataset_(dataset), cfg_(cfg), logger_(std::move(logger)) {}

    // Returns false when the shell should exit.
    bool handle(std::string line) {
        line = trim(line);
        if (line.empty()) return true;
        if (line == ".quit" || line == ".exit") return false;
        if (line[0] == '.') {
            command(line);
            return true;
        }
        if (line.size() > 7 && iequals(line.substr(0, 7), "explain") && std::isspace((unsigned char)line[7])) {
            runExplain(trim(line.substr(7)));
        } else {
            runQuery(line);
        }
        std::cout << "\n";
        return true;
    }
};

int main(int argc, char* argv[]) {
    (void)argc; (void)argv;
    std::ios::sync_with_stdio(false);

    Config cfg;
    loadEnvironment(cfg);

    auto logger = std::make_shared<Logger>(parse_log_level(cfg.getString("log_level")), cfg.getString("log_file"),
                                           cfg.getBool("log_console"));

    Dataset dataset;
    if (!cfg.getString("mysql_database").empty()) {
        try {
            if (!loadFromMySQL(cfg, logger, dataset)) return 1;
        } catch (const std::runtime_error& e) {
            std::cerr << e.what() << "\n";
            return 1;
        }
    } else {
        dataset = make_sample_dataset();
        std::cout << "Using the built-in sample dataset (set MYSQL_DB to load a MySQL schema)\n";
    }

    Shell shell(dataset, cfg, logger);
    std::cout << "querylab> type SQL. Use EXPLAIN prefix to show the access plan, .help for commands. Ctrl-D to exit.\n";
    std::string line;
    while (true) {
        std::cout << "sql> " << std::flush;
        if (!std::getline(std::cin, line)) break;
        if (!shell.handle(line)) break;
    }
    return 0;
}
