#pragma once
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace querylab {

enum class ValueKind { Null, Integer, Float, Text, Boolean, Date };

const char* kind_name(ValueKind kind);

struct DateValue {
    int year = 1970;
    int month = 1;
    int day = 1;
    int hour = 0;
    int minute = 0;
    int second = 0;
    bool has_time = false;
};

// Accepts YYYY-MM-DD with an optional " HH:MM[:SS]" (or 'T' separator).
std::optional<DateValue> parse_date(const std::string& text);
std::string format_date(const DateValue& date);

class Value {
private:
    std::variant<std::monostate, int64_t, double, std::string, bool, DateValue> data_;

public:
    Value() = default;

    static Value null();
    static Value integer(int64_t v);
    static Value real(double v);
    static Value text(std::string v);
    static Value boolean(bool v);
    static Value date(const DateValue& v);
    static Value date(int year, int month, int day);
    static Value datetime(int year, int month, int day, int hour, int minute, int second = 0);

    ValueKind kind() const;
    bool is_null() const { return kind() == ValueKind::Null; }
    bool is_numeric() const;

    int64_t as_int() const;
    double as_double() const;
    const std::string& as_text() const;
    bool as_bool() const;
    const DateValue& as_date() const;

    // Display form; Null renders as "NULL".
    std::string to_string() const;
    // Form used when echoing a value back into SQL text.
    std::string to_literal() const;
};

// Three-way comparison. nullopt means unknown: either side is Null or the
// kinds cannot be compared (see comparable()).
std::optional<int> compare_values(const Value& a, const Value& b);

// True when both values are non-null and of comparable kinds.
bool comparable(const Value& a, const Value& b);

// Total order used by ORDER BY and MIN/MAX: Null first, incomparable kinds
// ordered by kind.
int order_values(const Value& a, const Value& b);

// Grouping/DISTINCT equality: Null equals Null, 1 equals 1.0.
bool same_value(const Value& a, const Value& b);
std::string group_key(const Value& v);

// op is one of + - * / %. Null operands, incompatible kinds and division by
// zero produce Null.
Value arithmetic(const Value& a, char op, const Value& b);

class Row {
private:
    std::vector<std::pair<std::string, Value>> cells_;

public:
    Row() = default;
    Row(std::initializer_list<std::pair<std::string, Value>> cells) : cells_(cells) {}

    void set(const std::string& column, Value value);
    void append(const std::string& column, Value value) { cells_.emplace_back(column, std::move(value)); }

    // Case-insensitive lookup; nullptr when the column is absent.
    const Value* find(const std::string& column) const;
    Value get(const std::string& column) const;
    bool has(const std::string& column) const { return find(column) != nullptr; }

    size_t size() const { return cells_.size(); }
    bool empty() const { return cells_.empty(); }
    const std::string& column(size_t i) const { return cells_[i].first; }
    const Value& at(size_t i) const { return cells_[i].second; }
    std::vector<std::string> columns() const;

    std::vector<std::pair<std::string, Value>>::const_iterator begin() const { return cells_.begin(); }
    std::vector<std::pair<std::string, Value>>::const_iterator end() const { return cells_.end(); }
};

} // namespace querylab
