#pragma once

#include "schema.hpp"
#include "types.hpp"
#include <memory>
#include <string>
#include <vector>

namespace strata {

enum class compare_op {
    eq,
    ne,
    lt,
    le,
    gt,
    ge,
    contains
};

const char* to_string(compare_op op);

struct query_expr;
using query_ptr = std::shared_ptr<const query_expr>;

// Filter AST. A null query_ptr matches every record.
struct query_expr {
    enum class kind {
        comparison,
        conjunction,
        disjunction,
        negation
    };

    kind node = kind::comparison;

    // comparison
    std::string property;
    compare_op op = compare_op::eq;
    value_t operand;

    // conjunction / disjunction use both, negation uses lhs only
    query_ptr lhs;
    query_ptr rhs;

    static query_ptr compare(std::string property, compare_op op, value_t operand);
    static query_ptr conjunction(query_ptr lhs, query_ptr rhs);
    static query_ptr disjunction(query_ptr lhs, query_ptr rhs);
    static query_ptr negation(query_ptr operand);
};

/// Render a filter for logs ("(done == false and title contains 'x')").
std::string describe(const query_ptr& filter);

struct sort_descriptor {
    std::string property;
    bool ascending = true;
};

/// Parse the filter language:
///
///   expr       := or_expr
///   or_expr    := and_expr (('or' | '||') and_expr)*
///   and_expr   := unary (('and' | '&&') unary)*
///   unary      := ('not' | '!') unary | '(' expr ')' | comparison
///   comparison := property op operand
///   op         := '==' | '=' | '!=' | '<' | '<=' | '>' | '>=' | 'contains'
///   operand    := integer | float | 'string' | "string" | true | false | null | $N
///
/// Keywords are case-insensitive. $N takes args[N]. An empty (or blank) filter
/// returns nullptr. Throws invalid_query_error on syntax errors.
query_ptr parse_query(const std::string& filter, const std::vector<value_t>& args = {});

// A filter checked against one entity's schema, with operands normalized to the
// stored representation of the property they compare against.
struct compiled_query {
    const entity_schema* entity = nullptr;
    query_ptr filter;
    std::vector<sort_descriptor> sort;

    /// Properties referenced by the filter or the sort.
    std::vector<std::string> referenced_properties() const;
};

/// Throws invalid_query_error for an unknown or embedded entity, unknown
/// properties, type-incompatible comparisons and unsortable properties.
compiled_query compile_query(const schema_graph& graph,
                             const std::string& entity,
                             const query_ptr& filter,
                             const std::vector<sort_descriptor>& sort = {});

compiled_query compile_query(const schema_graph& graph,
                             const std::string& entity,
                             const std::string& filter,
                             const std::vector<value_t>& args = {},
                             const std::vector<sort_descriptor>& sort = {});

} // namespace strata
