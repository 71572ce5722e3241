#include "strata/query.hpp"
#include "strata/errors.hpp"
#include "strata/log.hpp"

#include <cctype>
#include <set>
#include <stdexcept>

namespace strata {

const char* to_string(compare_op op) {
    switch (op) {
        case compare_op::eq: return "==";
        case compare_op::ne: return "!=";
        case compare_op::lt: return "<";
        case compare_op::le: return "<=";
        case compare_op::gt: return ">";
        case compare_op::ge: return ">=";
        case compare_op::contains: return "contains";
    }
    return "?";
}

query_ptr query_expr::compare(std::string property, compare_op op, value_t operand) {
    auto expr = std::make_shared<query_expr>();
    expr->node = kind::comparison;
    expr->property = std::move(property);
    expr->op = op;
    expr->operand = std::move(operand);
    return expr;
}

query_ptr query_expr::conjunction(query_ptr lhs, query_ptr rhs) {
    auto expr = std::make_shared<query_expr>();
    expr->node = kind::conjunction;
    expr->lhs = std::move(lhs);
    expr->rhs = std::move(rhs);
    return expr;
}

query_ptr query_expr::disjunction(query_ptr lhs, query_ptr rhs) {
    auto expr = std::make_shared<query_expr>();
    expr->node = kind::disjunction;
    expr->lhs = std::move(lhs);
    expr->rhs = std::move(rhs);
    return expr;
}

query_ptr query_expr::negation(query_ptr operand) {
    auto expr = std::make_shared<query_expr>();
    expr->node = kind::negation;
    expr->lhs = std::move(operand);
    return expr;
}

std::string describe(const query_ptr& filter) {
    if (!filter) return "TRUEPREDICATE";
    switch (filter->node) {
        case query_expr::kind::comparison:
            return filter->property + " " + to_string(filter->op) + " " + describe(filter->operand);
        case query_expr::kind::conjunction:
            return "(" + describe(filter->lhs) + " and " + describe(filter->rhs) + ")";
        case query_expr::kind::disjunction:
            return "(" + describe(filter->lhs) + " or " + describe(filter->rhs) + ")";
        case query_expr::kind::negation:
            return "not " + describe(filter->lhs);
    }
    return "?";
}

// ============================================================================
// Parser
// ============================================================================

namespace {

struct token {
    enum class type {
        identifier,
        integer,
        floating,
        string,
        argument,
        op,
        lparen,
        rparen,
        end
    };

    type kind = type::end;
    std::string text;
    size_t pos = 0;
};

std::string lower(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

class tokenizer {
public:
    explicit tokenizer(const std::string& src) : src_(src) {}

    std::vector<token> run() {
        std::vector<token> tokens;
        while (true) {
            skip_space();
            if (pos_ >= src_.size()) {
                tokens.push_back({token::type::end, "", pos_});
                return tokens;
            }
            tokens.push_back(next());
        }
    }

private:
    void skip_space() {
        while (pos_ < src_.size() && std::isspace(static_cast<unsigned char>(src_[pos_]))) ++pos_;
    }

    [[noreturn]] void fail(const std::string& msg, size_t at) const {
        throw invalid_query_error(msg + " at offset " + std::to_string(at) + " in '" + src_ + "'");
    }

    token next() {
        size_t start = pos_;
        char c = src_[pos_];

        if (c == '(') { ++pos_; return {token::type::lparen, "(", start}; }
        if (c == ')') { ++pos_; return {token::type::rparen, ")", start}; }

        if (c == '\'' || c == '"') return quoted(c);

        if (c == '$') {
            ++pos_;
            size_t digits = pos_;
            while (pos_ < src_.size() && std::isdigit(static_cast<unsigned char>(src_[pos_]))) ++pos_;
            if (digits == pos_) fail("Expected argument index after '$'", start);
            return {token::type::argument, src_.substr(digits, pos_ - digits), start};
        }

        if (std::isdigit(static_cast<unsigned char>(c)) ||
            ((c == '-' || c == '+') && pos_ + 1 < src_.size() &&
             (std::isdigit(static_cast<unsigned char>(src_[pos_ + 1])) || src_[pos_ + 1] == '.'))) {
            return number();
        }

        if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
            while (pos_ < src_.size() &&
                   (std::isalnum(static_cast<unsigned char>(src_[pos_])) || src_[pos_] == '_')) {
                ++pos_;
            }
            return {token::type::identifier, src_.substr(start, pos_ - start), start};
        }

        static const char* two_char_ops[] = {"==", "!=", "<=", ">=", "&&", "||"};
        for (const char* op : two_char_ops) {
            if (src_.compare(pos_, 2, op) == 0) {
                pos_ += 2;
                return {token::type::op, op, start};
            }
        }
        if (c == '=' || c == '<' || c == '>' || c == '!') {
            ++pos_;
            return {token::type::op, std::string(1, c), start};
        }

        fail(std::string("Unexpected character '") + c + "'", start);
    }

    token quoted(char quote) {
        size_t start = pos_++;
        std::string text;
        while (pos_ < src_.size() && src_[pos_] != quote) {
            if (src_[pos_] == '\\' && pos_ + 1 < src_.size()) {
                ++pos_;
                switch (src_[pos_]) {
                    case 'n': text += '\n'; break;
                    case 't': text += '\t'; break;
                    default: text += src_[pos_]; break;
                }
            } else {
                text += src_[pos_];
            }
            ++pos_;
        }
        if (pos_ >= src_.size()) fail("Unterminated string literal", start);
        ++pos_;  // closing quote
        return {token::type::string, text, start};
    }

    token number() {
        size_t start = pos_;
        if (src_[pos_] == '-' || src_[pos_] == '+') ++pos_;
        bool is_float = false;
        while (pos_ < src_.size()) {
            char c = src_[pos_];
            if (std::isdigit(static_cast<unsigned char>(c))) {
                ++pos_;
            } else if (c == '.' || c == 'e' || c == 'E') {
                is_float = true;
                ++pos_;
                if ((c == 'e' || c == 'E') && pos_ < src_.size() && (src_[pos_] == '-' || src_[pos_] == '+')) ++pos_;
            } else {
                break;
            }
        }
        return {is_float ? token::type::floating : token::type::integer, src_.substr(start, pos_ - start), start};
    }

    const std::string& src_;
    size_t pos_ = 0;
};

class parser {
public:
    parser(const std::string& src, const std::vector<value_t>& args)
        : src_(src), args_(args), tokens_(tokenizer(src).run()) {}

    query_ptr run() {
        auto expr = parse_or();
        if (peek().kind != token::type::end) {
            fail("Unexpected '" + peek().text + "'", peek().pos);
        }
        return expr;
    }

private:
    [[noreturn]] void fail(const std::string& msg, size_t at) const {
        throw invalid_query_error(msg + " at offset " + std::to_string(at) + " in '" + src_ + "'");
    }

    const token& peek() const { return tokens_[index_]; }
    const token& advance() { return tokens_[index_++]; }

    bool is_keyword(const token& t, const char* keyword) const {
        return t.kind == token::type::identifier && lower(t.text) == keyword;
    }

    bool accept_connective(const char* keyword, const char* symbol) {
        const auto& t = peek();
        if (is_keyword(t, keyword) || (t.kind == token::type::op && t.text == symbol)) {
            ++index_;
            return true;
        }
        return false;
    }

    query_ptr parse_or() {
        auto lhs = parse_and();
        while (accept_connective("or", "||")) {
            lhs = query_expr::disjunction(lhs, parse_and());
        }
        return lhs;
    }

    query_ptr parse_and() {
        auto lhs = parse_unary();
        while (accept_connective("and", "&&")) {
            lhs = query_expr::conjunction(lhs, parse_unary());
        }
        return lhs;
    }

    query_ptr parse_unary() {
        if (accept_connective("not", "!")) {
            return query_expr::negation(parse_unary());
        }
        if (peek().kind == token::type::lparen) {
            advance();
            auto inner = parse_or();
            if (peek().kind != token::type::rparen) {
                fail("Expected ')'", peek().pos);
            }
            advance();
            return inner;
        }
        return parse_comparison();
    }

    query_ptr parse_comparison() {
        const auto& name = advance();
        if (name.kind != token::type::identifier) {
            fail(name.kind == token::type::end ? "Unexpected end of filter" : "Expected property name, got '" + name.text + "'",
                 name.pos);
        }

        const auto& op_token = advance();
        compare_op op;
        if (op_token.kind == token::type::op) {
            if (op_token.text == "==" || op_token.text == "=") op = compare_op::eq;
            else if (op_token.text == "!=") op = compare_op::ne;
            else if (op_token.text == "<") op = compare_op::lt;
            else if (op_token.text == "<=") op = compare_op::le;
            else if (op_token.text == ">") op = compare_op::gt;
            else if (op_token.text == ">=") op = compare_op::ge;
            else fail("Unexpected operator '" + op_token.text + "'", op_token.pos);
        } else if (is_keyword(op_token, "contains")) {
            op = compare_op::contains;
        } else {
            fail("Expected comparison operator after '" + name.text + "'", op_token.pos);
        }

        return query_expr::compare(name.text, op, parse_operand());
    }

    // The whole token must convert; std::sto* stop quietly at the first bad character
    template<typename Convert>
    auto convert(const token& t, const char* what, Convert fn) const -> decltype(fn(t.text, nullptr)) {
        size_t used = 0;
        try {
            auto value = fn(t.text, &used);
            if (used == t.text.size()) return value;
        } catch (const std::out_of_range&) {
            fail(std::string(what) + " '" + t.text + "' out of range", t.pos);
        } catch (const std::invalid_argument&) {
            // reported as malformed below
        }
        fail(std::string("Malformed ") + lower(what) + " '" + t.text + "'", t.pos);
    }

    value_t parse_operand() {
        const auto& t = advance();
        switch (t.kind) {
            case token::type::integer:
                return static_cast<int64_t>(convert(t, "Integer literal", [](const std::string& s, size_t* used) {
                    return std::stoll(s, used);
                }));
            case token::type::floating:
                return convert(t, "Number", [](const std::string& s, size_t* used) { return std::stod(s, used); });
            case token::type::string:
                return t.text;
            case token::type::argument: {
                size_t n = convert(t, "Argument index", [](const std::string& s, size_t* used) {
                    return std::stoul(s, used);
                });
                if (n >= args_.size()) {
                    fail("Argument $" + t.text + " out of range (" + std::to_string(args_.size()) + " given)", t.pos);
                }
                return args_[n];
            }
            case token::type::identifier: {
                auto word = lower(t.text);
                if (word == "true") return true;
                if (word == "false") return false;
                if (word == "null" || word == "nil") return nullptr;
                fail("Expected a literal, got '" + t.text + "'", t.pos);
            }
            case token::type::end:
                fail("Unexpected end of filter", t.pos);
            default:
                fail("Expected a literal, got '" + t.text + "'", t.pos);
        }
    }

    const std::string& src_;
    const std::vector<value_t>& args_;
    std::vector<token> tokens_;
    size_t index_ = 0;
};

bool is_blank(const std::string& s) {
    for (char c : s) {
        if (!std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

bool is_orderable(property_type type) {
    return type == property_type::integer || type == property_type::floating ||
           type == property_type::string || type == property_type::date;
}

bool is_sortable(property_type type) {
    return is_orderable(type) || type == property_type::boolean || type == property_type::object_id;
}

// Checks one comparison against the schema and returns it with a normalized operand
query_ptr compile_comparison(const schema_graph& graph, const entity_schema& entity, const query_expr& cmp) {
    const std::string where = entity.name + "." + cmp.property;
    auto* prop = entity.property(cmp.property);
    if (!prop) {
        throw invalid_query_error("Unknown property '" + cmp.property + "' on " + entity.name);
    }
    if (prop->type == property_type::backlink || prop->type == property_type::embedded) {
        throw invalid_query_error(where + " (" + to_string(prop->type) + ") cannot be queried");
    }

    auto incompatible = [&](const std::string& why) -> invalid_query_error {
        return invalid_query_error("Cannot compare " + where + " (" + to_string(prop->type) + ") " +
                                   to_string(cmp.op) + " " + describe(cmp.operand) + ": " + why);
    };

    if (is_null(cmp.operand)) {
        if (cmp.op != compare_op::eq && cmp.op != compare_op::ne) {
            throw incompatible("null only supports == and !=");
        }
        if (!prop->optional) {
            throw incompatible("property is not optional");
        }
        return query_expr::compare(cmp.property, cmp.op, nullptr);
    }

    // The property type the operand must be normalized to
    property_descriptor operand_desc;
    operand_desc.name = prop->name;

    if (prop->type == property_type::list) {
        if (cmp.op != compare_op::contains) {
            throw incompatible("lists only support contains");
        }
        operand_desc.type = prop->is_link_list() ? graph.key_type(prop->target_entity) : prop->element_type;
    } else if (prop->type == property_type::link) {
        if (cmp.op != compare_op::eq && cmp.op != compare_op::ne && cmp.op != compare_op::contains) {
            throw incompatible("links only support ==, != and contains");
        }
        operand_desc.type = graph.key_type(prop->target_entity);
    } else {
        if (cmp.op == compare_op::contains) {
            throw incompatible("contains requires a link or list property");
        }
        if (cmp.op != compare_op::eq && cmp.op != compare_op::ne && !is_orderable(prop->type)) {
            throw incompatible("property is not ordered");
        }
        operand_desc.type = prop->type;
    }

    try {
        return query_expr::compare(cmp.property, cmp.op, graph.normalize(entity, operand_desc, cmp.operand));
    } catch (const error& e) {
        throw incompatible(e.what());
    }
}

query_ptr compile_filter(const schema_graph& graph, const entity_schema& entity, const query_ptr& filter) {
    if (!filter) return nullptr;
    switch (filter->node) {
        case query_expr::kind::comparison:
            return compile_comparison(graph, entity, *filter);
        case query_expr::kind::conjunction:
            return query_expr::conjunction(compile_filter(graph, entity, filter->lhs),
                                           compile_filter(graph, entity, filter->rhs));
        case query_expr::kind::disjunction:
            return query_expr::disjunction(compile_filter(graph, entity, filter->lhs),
                                           compile_filter(graph, entity, filter->rhs));
        case query_expr::kind::negation:
            return query_expr::negation(compile_filter(graph, entity, filter->lhs));
    }
    return nullptr;
}

void collect_properties(const query_ptr& filter, std::set<std::string>& out) {
    if (!filter) return;
    if (filter->node == query_expr::kind::comparison) {
        out.insert(filter->property);
        return;
    }
    collect_properties(filter->lhs, out);
    collect_properties(filter->rhs, out);
}

} // namespace

query_ptr parse_query(const std::string& filter, const std::vector<value_t>& args) {
    if (is_blank(filter)) return nullptr;
    return parser(filter, args).run();
}

std::vector<std::string> compiled_query::referenced_properties() const {
    std::set<std::string> names;
    collect_properties(filter, names);
    for (const auto& s : sort) names.insert(s.property);
    return {names.begin(), names.end()};
}

compiled_query compile_query(const schema_graph& graph,
                             const std::string& entity,
                             const query_ptr& filter,
                             const std::vector<sort_descriptor>& sort) {
    auto* schema = graph.find(entity);
    if (!schema) {
        throw invalid_query_error("Unknown entity '" + entity + "'");
    }
    if (schema->embedded) {
        throw invalid_query_error("Embedded entity '" + entity + "' cannot be queried directly");
    }

    compiled_query result;
    result.entity = schema;
    result.filter = compile_filter(graph, *schema, filter);

    for (const auto& s : sort) {
        auto* prop = schema->property(s.property);
        if (!prop) {
            throw invalid_query_error("Unknown sort property '" + s.property + "' on " + entity);
        }
        if (!is_sortable(prop->type)) {
            throw invalid_query_error("Cannot sort on " + entity + "." + s.property + " (" +
                                      to_string(prop->type) + ")");
        }
        result.sort.push_back(s);
    }

    LOG_DEBUG("query", "Compiled %s where %s (%zu sort keys)",
              entity.c_str(), describe(result.filter).c_str(), result.sort.size());
    return result;
}

compiled_query compile_query(const schema_graph& graph,
                             const std::string& entity,
                             const std::string& filter,
                             const std::vector<value_t>& args,
                             const std::vector<sort_descriptor>& sort) {
    return compile_query(graph, entity, parse_query(filter, args), sort);
}

} // namespace strata
