#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "querylab/ast.h"
#include "querylab/errors.h"
#include "querylab/value.h"

namespace querylab {

// One column of an intermediate relation. `qualifier` is the alias, or the
// table name when the table has no alias.
struct ColumnSlot { std::string qualifier; std::string table; std::string name; };

enum class TriBool { False, True, Unknown };

TriBool tri_and(TriBool a, TriBool b);
TriBool tri_or(TriBool a, TriBool b);
TriBool tri_not(TriBool a);

struct EvalDiagnostics {
    std::optional<QueryError> type_mismatch;
};

struct RowScope {
    const std::vector<Value> *row = nullptr;
    // Rows of the current group; aggregates read these.
    const std::vector<const std::vector<Value>*> *group = nullptr;
    // Projected select items, visible to HAVING and ORDER BY by name.
    const std::vector<std::pair<std::string, Value>> *outputs = nullptr;
};

class ExpressionEvaluator {
private:
    const std::vector<ColumnSlot> &slots_;
    EvalDiagnostics *diagnostics_;

    Value aggregate(const Expr &e, const RowScope &scope) const;
    Value scalar(const Expr &e, const RowScope &scope) const;
    TriBool compare(const Condition &c, const RowScope &scope) const;
    std::optional<int> compareChecked(const Expr &left, const Value &a, const Value &b) const;

public:
    explicit ExpressionEvaluator(const std::vector<ColumnSlot> &slots, EvalDiagnostics *diagnostics = nullptr)
        : slots_(slots), diagnostics_(diagnostics) {}

    // Slot index for a column reference, or -1.
    int resolve(const std::string &qualifier, const std::string &name) const;
    Value evaluate(const Expr &e, const RowScope &scope) const;
    TriBool test(const Predicate &p, const RowScope &scope) const;
};

// SQL LIKE with % and _, case-insensitive.
bool like_match(const std::string &text, const std::string &pattern);

} // namespace querylab
