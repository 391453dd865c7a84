#include "querylab/value.h"
#include "querylab/utils.h"
#include <cmath>
#include <cstdio>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace querylab {

const char* kind_name(ValueKind kind) {
    switch (kind) {
        case ValueKind::Null: return "NULL";
        case ValueKind::Integer: return "INTEGER";
        case ValueKind::Float: return "FLOAT";
        case ValueKind::Text: return "TEXT";
        case ValueKind::Boolean: return "BOOLEAN";
        case ValueKind::Date: return "DATE";
        default: return "UNKNOWN";
    }
}

static bool read_number(const std::string& s, size_t& pos, size_t digits, int& out) {
    if (pos + digits > s.size()) return false;
    int v = 0;
    for (size_t k = 0; k < digits; ++k) {
        char c = s[pos + k];
        if (!std::isdigit((unsigned char)c)) return false;
        v = v * 10 + (c - '0');
    }
    out = v;
    pos += digits;
    return true;
}

std::optional<DateValue> parse_date(const std::string& raw) {
    std::string s = trim(raw);
    DateValue d;
    size_t pos = 0;
    if (!read_number(s, pos, 4, d.year)) return std::nullopt;
    if (pos >= s.size() || s[pos++] != '-') return std::nullopt;
    if (!read_number(s, pos, 2, d.month)) return std::nullopt;
    if (pos >= s.size() || s[pos++] != '-') return std::nullopt;
    if (!read_number(s, pos, 2, d.day)) return std::nullopt;
    if (d.month < 1 || d.month > 12 || d.day < 1 || d.day > 31) return std::nullopt;
    if (pos == s.size()) return d;

    if (s[pos] != ' ' && s[pos] != 'T') return std::nullopt;
    ++pos;
    if (!read_number(s, pos, 2, d.hour)) return std::nullopt;
    if (pos >= s.size() || s[pos++] != ':') return std::nullopt;
    if (!read_number(s, pos, 2, d.minute)) return std::nullopt;
    if (pos < s.size()) {
        if (s[pos++] != ':') return std::nullopt;
        if (!read_number(s, pos, 2, d.second)) return std::nullopt;
    }
    if (pos != s.size()) return std::nullopt;
    if (d.hour > 23 || d.minute > 59 || d.second > 59) return std::nullopt;
    d.has_time = true;
    return d;
}

std::string format_date(const DateValue& d) {
    char buf[32];
    if (d.has_time) {
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d",
                      d.year, d.month, d.day, d.hour, d.minute, d.second);
    } else {
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", d.year, d.month, d.day);
    }
    return buf;
}

Value Value::null() {
    return Value();
}

Value Value::integer(int64_t v) {
    Value out;
    out.data_ = v;
    return out;
}

Value Value::real(double v) {
    Value out;
    out.data_ = v;
    return out;
}

Value Value::text(std::string v) {
    Value out;
    out.data_ = std::move(v);
    return out;
}

Value Value::boolean(bool v) {
    Value out;
    out.data_ = v;
    return out;
}

Value Value::date(const DateValue& v) {
    Value out;
    out.data_ = v;
    return out;
}

Value Value::date(int year, int month, int day) {
    DateValue d;
    d.year = year;
    d.month = month;
    d.day = day;
    return date(d);
}

Value Value::datetime(int year, int month, int day, int hour, int minute, int second) {
    DateValue d;
    d.year = year;
    d.month = month;
    d.day = day;
    d.hour = hour;
    d.minute = minute;
    d.second = second;
    d.has_time = true;
    return date(d);
}

ValueKind Value::kind() const {
    switch (data_.index()) {
        case 1: return ValueKind::Integer;
        case 2: return ValueKind::Float;
        case 3: return ValueKind::Text;
        case 4: return ValueKind::Boolean;
        case 5: return ValueKind::Date;
        default: return ValueKind::Null;
    }
}

bool Value::is_numeric() const {
    ValueKind k = kind();
    return k == ValueKind::Integer || k == ValueKind::Float || k == ValueKind::Boolean;
}

int64_t Value::as_int() const {
    switch (kind()) {
        case ValueKind::Integer: return std::get<int64_t>(data_);
        case ValueKind::Float: return static_cast<int64_t>(std::get<double>(data_));
        case ValueKind::Boolean: return std::get<bool>(data_) ? 1 : 0;
        default: throw std::logic_error(std::string("value of kind ") + kind_name(kind()) + " is not numeric");
    }
}

double Value::as_double() const {
    switch (kind()) {
        case ValueKind::Integer: return static_cast<double>(std::get<int64_t>(data_));
        case ValueKind::Float: return std::get<double>(data_);
        case ValueKind::Boolean: return std::get<bool>(data_) ? 1.0 : 0.0;
        default: throw std::logic_error(std::string("value of kind ") + kind_name(kind()) + " is not numeric");
    }
}

const std::string& Value::as_text() const {
    return std::get<std::string>(data_);
}

bool Value::as_bool() const {
    if (kind() == ValueKind::Boolean) return std::get<bool>(data_);
    return as_double() != 0.0;
}

const DateValue& Value::as_date() const {
    return std::get<DateValue>(data_);
}

static std::string format_double(double v) {
    std::ostringstream oss;
    oss << std::setprecision(15) << v;
    std::string s = oss.str();
    if (std::isfinite(v) && s.find_first_of(".e") == std::string::npos) s += ".0";
    return s;
}

std::string Value::to_string() const {
    switch (kind()) {
        case ValueKind::Null: return "NULL";
        case ValueKind::Integer: return std::to_string(std::get<int64_t>(data_));
        case ValueKind::Float: return format_double(std::get<double>(data_));
        case ValueKind::Text: return std::get<std::string>(data_);
        case ValueKind::Boolean: return std::get<bool>(data_) ? "TRUE" : "FALSE";
        case ValueKind::Date: return format_date(std::get<DateValue>(data_));
    }
    return "";
}

std::string Value::to_literal() const {
    switch (kind()) {
        case ValueKind::Text: {
            std::string out = "'";
            for (char c : std::get<std::string>(data_)) {
                if (c == '\'') out += "''";
                else out += c;
            }
            return out + "'";
        }
        case ValueKind::Date: return "'" + to_string() + "'";
        default: return to_string();
    }
}

static int sign(double d) { return d < 0 ? -1 : (d > 0 ? 1 : 0); }

static int compare_dates(const DateValue& a, const DateValue& b) {
    int lhs[6] = {a.year, a.month, a.day, a.hour, a.minute, a.second};
    int rhs[6] = {b.year, b.month, b.day, b.hour, b.minute, b.second};
    for (int k = 0; k < 6; ++k) {
        if (lhs[k] != rhs[k]) return lhs[k] < rhs[k] ? -1 : 1;
    }
    return 0;
}

std::optional<int> compare_values(const Value& a, const Value& b) {
    if (a.is_null() || b.is_null()) return std::nullopt;
    ValueKind ka = a.kind(), kb = b.kind();

    if (a.is_numeric() && b.is_numeric()) {
        if (ka == ValueKind::Integer && kb == ValueKind::Integer) {
            int64_t x = a.as_int(), y = b.as_int();
            return x < y ? -1 : (x > y ? 1 : 0);
        }
        return sign(a.as_double() - b.as_double());
    }
    if (ka == ValueKind::Text && kb == ValueKind::Text) {
        int c = a.as_text().compare(b.as_text());
        return c < 0 ? -1 : (c > 0 ? 1 : 0);
    }
    if (ka == ValueKind::Date && kb == ValueKind::Date) {
        return compare_dates(a.as_date(), b.as_date());
    }
    if (ka == ValueKind::Date && kb == ValueKind::Text) {
        auto d = parse_date(b.as_text());
        if (!d) return std::nullopt;
        return compare_dates(a.as_date(), *d);
    }
    if (ka == ValueKind::Text && kb == ValueKind::Date) {
        auto d = parse_date(a.as_text());
        if (!d) return std::nullopt;
        return compare_dates(*d, b.as_date());
    }
    return std::nullopt;
}

bool comparable(const Value& a, const Value& b) {
    return compare_values(a, b).has_value();
}

static int kind_rank(ValueKind k) {
    switch (k) {
        case ValueKind::Null: return 0;
        case ValueKind::Boolean:
        case ValueKind::Integer:
        case ValueKind::Float: return 1;
        case ValueKind::Date: return 2;
        case ValueKind::Text: return 3;
    }
    return 4;
}

int order_values(const Value& a, const Value& b) {
    if (a.is_null() && b.is_null()) return 0;
    if (a.is_null()) return -1;
    if (b.is_null()) return 1;
    auto c = compare_values(a, b);
    if (c) return *c;
    int ra = kind_rank(a.kind()), rb = kind_rank(b.kind());
    if (ra != rb) return ra < rb ? -1 : 1;
    int t = a.to_string().compare(b.to_string());
    return t < 0 ? -1 : (t > 0 ? 1 : 0);
}

bool same_value(const Value& a, const Value& b) {
    if (a.is_null() || b.is_null()) return a.is_null() && b.is_null();
    auto c = compare_values(a, b);
    if (c) return *c == 0;
    return false;
}

std::string group_key(const Value& v) {
    switch (v.kind()) {
        case ValueKind::Null: return "N";
        case ValueKind::Integer:
        case ValueKind::Float:
        case ValueKind::Boolean: return "#" + format_double(v.as_double());
        case ValueKind::Date: return "D" + v.to_string();
        case ValueKind::Text: return "T" + v.as_text();
    }
    return "?";
}

Value arithmetic(const Value& a, char op, const Value& b) {
    if (a.is_null() || b.is_null()) return Value::null();
    if (!a.is_numeric() || !b.is_numeric()) return Value::null();

    bool ints = a.kind() != ValueKind::Float && b.kind() != ValueKind::Float;
    if (ints) {
        int64_t x = a.as_int(), y = b.as_int(), r = 0;
        // Results outside int64 are promoted to Float.
        switch (op) {
            case '+':
                if (__builtin_add_overflow(x, y, &r)) return Value::real(double(x) + double(y));
                return Value::integer(r);
            case '-':
                if (__builtin_sub_overflow(x, y, &r)) return Value::real(double(x) - double(y));
                return Value::integer(r);
            case '*':
                if (__builtin_mul_overflow(x, y, &r)) return Value::real(double(x) * double(y));
                return Value::integer(r);
            case '/':
                if (y == 0) return Value::null();
                return Value::real(double(x) / double(y));
            case '%':
                if (y == 0) return Value::null();
                if (y == -1) return Value::integer(0);
                return Value::integer(x % y);
            default: return Value::null();
        }
    }

    double x = a.as_double(), y = b.as_double();
    switch (op) {
        case '+': return Value::real(x + y);
        case '-': return Value::real(x - y);
        case '*': return Value::real(x * y);
        case '/':
            if (y == 0.0) return Value::null();
            return Value::real(x / y);
        case '%':
            if (y == 0.0) return Value::null();
            return Value::real(std::fmod(x, y));
        default: return Value::null();
    }
}

void Row::set(const std::string& column, Value value) {
    for (auto& cell : cells_) {
        if (iequals(cell.first, column)) {
            cell.second = std::move(value);
            return;
        }
    }
    cells_.emplace_back(column, std::move(value));
}

const Value* Row::find(const std::string& column) const {
    for (const auto& cell : cells_) {
        if (iequals(cell.first, column)) return &cell.second;
    }
    return nullptr;
}

Value Row::get(const std::string& column) const {
    const Value* v = find(column);
    return v ? *v : Value::null();
}

std::vector<std::string> Row::columns() const {
    std::vector<std::string> out;
    out.reserve(cells_.size());
    for (const auto& cell : cells_) out.push_back(cell.first);
    return out;
}

} // namespace querylab
