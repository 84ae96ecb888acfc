#include <algorithm>
#include <chklib/ctype.hh>
#include <chklib/lang/lexer.hh>
#include <chklib/lang/parser.hh>
#include <chklib/limits.hh>
#include <cstdint>
#include <span>
#include <utility>

namespace chk::lang {
namespace {

std::string_view describe_invalid_target(const Expr& expr) {
    switch (expr.kind) {
    case NodeKind::Call: return "function call";
    case NodeKind::Constant: {
        const auto& value = static_cast<const ConstantExpr&>(expr).value;
        if (std::holds_alternative<NoneType>(value)) {
            return "None";
        }
        if (const auto* b = std::get_if<bool>(&value)) {
            return *b ? "True" : "False";
        }
        if (std::holds_alternative<EllipsisType>(value)) {
            return "ellipsis";
        }
        return "literal";
    }
    case NodeKind::Compare: return "comparison";
    case NodeKind::Lambda: return "lambda";
    case NodeKind::IfExp: return "conditional expression";
    case NodeKind::Dict: return "dict literal";
    case NodeKind::Set: return "set display";
    case NodeKind::ListComp: return "list comprehension";
    case NodeKind::SetComp: return "set comprehension";
    case NodeKind::DictComp: return "dict comprehension";
    case NodeKind::GeneratorExp: return "generator expression";
    case NodeKind::JoinedStr:
    case NodeKind::FormattedValue: return "f-string expression";
    default: return "expression";
    }
}

enum class TargetContext : uint8_t {
    ASSIGN_STMT,
    ASSIGN,
    DELETE,
};

struct BinaryOperatorToken {
    std::string_view text;
    BinaryOperator op;
};

constexpr BinaryOperatorToken bit_or_operators[] = {{"|", BinaryOperator::BIT_OR}};
constexpr BinaryOperatorToken bit_xor_operators[] = {{"^", BinaryOperator::BIT_XOR}};
constexpr BinaryOperatorToken bit_and_operators[] = {{"&", BinaryOperator::BIT_AND}};
constexpr BinaryOperatorToken shift_operators[] = {
    {"<<", BinaryOperator::LSHIFT},
    {">>", BinaryOperator::RSHIFT},
};
constexpr BinaryOperatorToken sum_operators[] = {
    {"+", BinaryOperator::ADD},
    {"-", BinaryOperator::SUB},
};
constexpr BinaryOperatorToken term_operators[] = {
    {"*", BinaryOperator::MULT},
    {"/", BinaryOperator::DIV},
    {"//", BinaryOperator::FLOOR_DIV},
    {"%", BinaryOperator::MOD},
    {"@", BinaryOperator::MAT_MULT},
};

// From the loosest binding to the tightest binding
constexpr std::span<const BinaryOperatorToken> binary_levels[] = {
    bit_or_operators,
    bit_xor_operators,
    bit_and_operators,
    shift_operators,
    sum_operators,
    term_operators,
};

constexpr BinaryOperatorToken augmented_assignments[] = {
    {"+=", BinaryOperator::ADD},
    {"-=", BinaryOperator::SUB},
    {"*=", BinaryOperator::MULT},
    {"@=", BinaryOperator::MAT_MULT},
    {"/=", BinaryOperator::DIV},
    {"%=", BinaryOperator::MOD},
    {"**=", BinaryOperator::POW},
    {"<<=", BinaryOperator::LSHIFT},
    {">>=", BinaryOperator::RSHIFT},
    {"|=", BinaryOperator::BIT_OR},
    {"^=", BinaryOperator::BIT_XOR},
    {"&=", BinaryOperator::BIT_AND},
    {"//=", BinaryOperator::FLOOR_DIV},
};

StrPtr make_str_constant(std::string str) {
    return std::make_shared<const std::string>(std::move(str));
}

class Parser {
    std::vector<Token> tokens_;
    size_t pos_ = 0;
    size_t depth_ = 0;
    size_t chain_links_ = 0;

    enum class Counted : uint8_t {
        NESTING, // brackets, unary operators, blocks
        CHAIN_LINKS, // links of operator, trailer and elif chains
    };

    // Charges the syntax tree depth that the guarded construct adds
    class DepthGuard {
        Parser& parser_;
        size_t Parser::*counter_;
        size_t limit_;
        size_t entered_ = 0;

    public:
        explicit DepthGuard(Parser& parser, Counted counted = Counted::NESTING, bool enter = true)
        : parser_{parser}
        , counter_{counted == Counted::NESTING ? &Parser::depth_ : &Parser::chain_links_}
        , limit_{
              counted == Counted::NESTING ? limits::max_syntax_nesting
                                          : limits::max_syntax_chain_links
          } {
            if (enter) {
                add();
            }
        }

        DepthGuard(const DepthGuard&) = delete;
        DepthGuard(DepthGuard&&) = delete;
        DepthGuard& operator=(const DepthGuard&) = delete;
        DepthGuard& operator=(DepthGuard&&) = delete;

        void add() {
            ++entered_;
            if (++(parser_.*counter_) > limit_) {
                parser_.error_at(parser_.peek(), "too many nested expressions or blocks");
            }
        }

        ~DepthGuard() { parser_.*counter_ -= entered_; }
    };

public:
    explicit Parser(std::vector<Token> tokens) : tokens_{std::move(tokens)} {}

    std::unique_ptr<Module> parse_file();

    ExprPtr parse_eval_input();

private:
    [[nodiscard]] const Token& peek(size_t offset = 0) const noexcept {
        return tokens_[std::min(pos_ + offset, tokens_.size() - 1)];
    }

    const Token& next() noexcept {
        const Token& tok = tokens_[pos_];
        if (pos_ + 1 < tokens_.size()) {
            ++pos_;
        }
        return tok;
    }

    [[nodiscard]] bool at(Token::Kind kind) const noexcept { return peek().kind == kind; }

    [[nodiscard]] bool at_op(std::string_view op) const noexcept { return peek().is_op(op); }

    [[nodiscard]] bool at_keyword(std::string_view kw) const noexcept {
        return peek().is_keyword(kw);
    }

    bool accept_op(std::string_view op) noexcept {
        if (at_op(op)) {
            next();
            return true;
        }
        return false;
    }

    bool accept_keyword(std::string_view kw) noexcept {
        if (at_keyword(kw)) {
            next();
            return true;
        }
        return false;
    }

    template <class... Args>
    [[noreturn]] void error_at(size_t line, Args&&... msg) const {
        throw SyntaxErrorException(line, std::forward<Args>(msg)...);
    }

    template <class... Args>
    [[noreturn]] void error_at(const Token& tok, Args&&... msg) const {
        error_at(tok.line, std::forward<Args>(msg)...);
    }

    [[noreturn]] void invalid_syntax() const {
        const Token& tok = peek();
        if (tok.kind == Token::Kind::INDENT) {
            error_at(tok, "unexpected indent");
        }
        error_at(tok, "invalid syntax");
    }

    void expect_op(std::string_view op) {
        if (accept_op(op)) {
            return;
        }
        if (op == ":") {
            error_at(peek(), "expected ':'");
        }
        invalid_syntax();
    }

    std::string expect_name() {
        if (not at(Token::Kind::NAME) or is_keyword(peek().text)) {
            invalid_syntax();
        }
        return next().text;
    }

    [[nodiscard]] bool at_expression_start() const noexcept;
    [[nodiscard]] bool at_target_start() const noexcept;

    void check_target(const Expr& expr, TargetContext ctx) const;

    // Statements
    void parse_statement(Body& body);
    void parse_simple_statements(Body& body);
    StmtPtr parse_simple_statement();
    StmtPtr parse_expression_statement();
    StmtPtr parse_import();
    StmtPtr parse_import_from();
    Body parse_block(std::string_view construct, size_t line);
    StmtPtr parse_decorated();
    StmtPtr parse_function_def(std::vector<ExprPtr> decorators);
    StmtPtr parse_class_def(std::vector<ExprPtr> decorators);
    StmtPtr parse_if();
    StmtPtr parse_while();
    StmtPtr parse_for();
    StmtPtr parse_try();
    StmtPtr parse_with();
    std::unique_ptr<Arguments> parse_parameters(bool allow_annotations, std::string_view terminator);

    // Expressions
    ExprPtr parse_star_expressions();
    ExprPtr parse_star_expression();
    ExprPtr parse_expression();
    ExprPtr parse_lambda();
    ExprPtr parse_disjunction();
    ExprPtr parse_conjunction();
    ExprPtr parse_inversion();
    ExprPtr parse_comparison();
    ExprPtr parse_binary(size_t level);
    ExprPtr parse_factor();
    ExprPtr parse_power();
    ExprPtr parse_primary();
    ExprPtr parse_atom();
    ExprPtr parse_parenthesized();
    ExprPtr parse_list_display();
    ExprPtr parse_brace_display();
    ExprPtr parse_slices();
    ExprPtr parse_slice_item();
    ExprPtr parse_target();
    ExprPtr parse_target_list();
    void parse_call_arguments(
        std::vector<ExprPtr>& args, std::vector<std::unique_ptr<Keyword>>& keywords
    );
    void parse_comprehension_generators(ComprehensionExpr& comp);
    ExprPtr parse_comprehension(NodeKind kind, size_t line, ExprPtr elt);

    // Strings
    ExprPtr parse_strings();
    void parse_fstring_body(
        std::string_view body,
        bool raw,
        size_t line,
        JoinedStrExpr& out,
        std::string& pending,
        size_t nesting
    );
    size_t parse_fstring_field(
        std::string_view body, size_t beg, bool raw, size_t line, JoinedStrExpr& out, size_t nesting
    );
    static ExprPtr parse_fstring_expression(std::string_view text, size_t line);
};

bool Parser::at_expression_start() const noexcept {
    const Token& tok = peek();
    switch (tok.kind) {
    case Token::Kind::NAME:
        return not is_keyword(tok.text) or tok.text == "True" or tok.text == "False" or
            tok.text == "None" or tok.text == "not" or tok.text == "lambda" or
            tok.text == "yield" or tok.text == "await";
    case Token::Kind::INT:
    case Token::Kind::FLOAT:
    case Token::Kind::STRING: return true;
    case Token::Kind::OP:
        return tok.text == "(" or tok.text == "[" or tok.text == "{" or tok.text == "-" or
            tok.text == "+" or tok.text == "~" or tok.text == "*" or tok.text == "...";
    default: return false;
    }
}

bool Parser::at_target_start() const noexcept {
    const Token& tok = peek();
    if (tok.kind == Token::Kind::NAME) {
        return not is_keyword(tok.text);
    }
    return tok.is_op("(") or tok.is_op("[") or tok.is_op("*");
}

void Parser::check_target(const Expr& expr, TargetContext ctx) const {
    std::string_view verb = (ctx == TargetContext::DELETE ? "delete" : "assign to");
    switch (expr.kind) {
    case NodeKind::Name:
    case NodeKind::Attribute:
    case NodeKind::Subscript: return;
    case NodeKind::Tuple:
    case NodeKind::List: {
        size_t starred = 0;
        for (const auto& elt : static_cast<const CollectionExpr&>(expr).elts) {
            if (elt->kind == NodeKind::Starred) {
                if (ctx == TargetContext::DELETE) {
                    error_at(elt->line, "cannot delete starred");
                }
                if (++starred > 1) {
                    error_at(elt->line, "multiple starred expressions in assignment");
                }
                check_target(*static_cast<const StarredExpr&>(*elt).value, ctx);
            } else {
                check_target(*elt, ctx);
            }
        }
        return;
    }
    case NodeKind::Starred:
        if (ctx == TargetContext::DELETE) {
            error_at(expr.line, "cannot delete starred");
        }
        error_at(expr.line, "starred assignment target must be in a list or tuple");
    default: break;
    }

    auto what = describe_invalid_target(expr);
    if (ctx == TargetContext::ASSIGN_STMT and what != "True" and what != "False" and
        what != "None")
    {
        error_at(expr.line, "cannot ", verb, ' ', what, " here. Maybe you meant '==' instead of '='?");
    }
    error_at(expr.line, "cannot ", verb, ' ', what);
}

/* Statements */

std::unique_ptr<Module> Parser::parse_file() {
    auto module = std::make_unique<Module>();
    while (not at(Token::Kind::END_MARKER)) {
        if (at(Token::Kind::NEWLINE)) {
            next();
            continue;
        }
        parse_statement(module->body);
    }
    return module;
}

ExprPtr Parser::parse_eval_input() {
    auto expr = parse_star_expressions();
    while (at(Token::Kind::NEWLINE)) {
        next();
    }
    if (not at(Token::Kind::END_MARKER)) {
        invalid_syntax();
    }
    return expr;
}

void Parser::parse_statement(Body& body) {
    const Token& tok = peek();
    if (tok.kind == Token::Kind::INDENT) {
        error_at(tok, "unexpected indent");
    }
    if (tok.kind == Token::Kind::NAME) {
        const auto& kw = tok.text;
        if (kw == "def") {
            body.emplace_back(parse_function_def({}));
            return;
        }
        if (kw == "class") {
            body.emplace_back(parse_class_def({}));
            return;
        }
        if (kw == "if") {
            body.emplace_back(parse_if());
            return;
        }
        if (kw == "while") {
            body.emplace_back(parse_while());
            return;
        }
        if (kw == "for") {
            body.emplace_back(parse_for());
            return;
        }
        if (kw == "try") {
            body.emplace_back(parse_try());
            return;
        }
        if (kw == "with") {
            body.emplace_back(parse_with());
            return;
        }
        if (kw == "async") {
            error_at(tok, "'async' is not supported");
        }
    }
    if (tok.is_op("@")) {
        body.emplace_back(parse_decorated());
        return;
    }
    parse_simple_statements(body);
}

void Parser::parse_simple_statements(Body& body) {
    for (;;) {
        body.emplace_back(parse_simple_statement());
        if (not accept_op(";") or at(Token::Kind::NEWLINE)) {
            break;
        }
    }
    if (not at(Token::Kind::NEWLINE)) {
        invalid_syntax();
    }
    next();
}

StmtPtr Parser::parse_simple_statement() {
    const Token& tok = peek();
    size_t line = tok.line;
    if (tok.kind != Token::Kind::NAME) {
        return parse_expression_statement();
    }

    const auto& kw = tok.text;
    if (kw == "pass" or kw == "break" or kw == "continue") {
        next();
        auto kind = kw == "pass" ? NodeKind::Pass
            : kw == "break"      ? NodeKind::Break
                                 : NodeKind::Continue;
        return std::make_unique<SimpleStmt>(kind, line);
    }
    if (kw == "return") {
        next();
        auto node = std::make_unique<ReturnStmt>(line);
        if (at_expression_start()) {
            node->value = parse_star_expressions();
        }
        return node;
    }
    if (kw == "raise") {
        next();
        auto node = std::make_unique<RaiseStmt>(line);
        if (at_expression_start()) {
            node->exc = parse_expression();
            if (accept_keyword("from")) {
                node->cause = parse_expression();
            }
        }
        return node;
    }
    if (kw == "global" or kw == "nonlocal") {
        next();
        auto node = std::make_unique<NamesStmt>(
            kw == "global" ? NodeKind::Global : NodeKind::Nonlocal, line
        );
        do {
            node->names.emplace_back(expect_name());
        } while (accept_op(","));
        return node;
    }
    if (kw == "del") {
        next();
        auto node = std::make_unique<DeleteStmt>(line);
        do {
            if (not at_target_start()) {
                invalid_syntax();
            }
            auto target = parse_target();
            check_target(*target, TargetContext::DELETE);
            node->targets.emplace_back(std::move(target));
        } while (accept_op(",") and at_target_start());
        return node;
    }
    if (kw == "assert") {
        next();
        auto node = std::make_unique<AssertStmt>(line);
        node->test = parse_expression();
        if (accept_op(",")) {
            node->msg = parse_expression();
        }
        return node;
    }
    if (kw == "import") {
        return parse_import();
    }
    if (kw == "from") {
        return parse_import_from();
    }
    return parse_expression_statement();
}

StmtPtr Parser::parse_expression_statement() {
    size_t line = peek().line;
    auto first = parse_star_expressions();

    if (at_op("=")) {
        auto node = std::make_unique<AssignStmt>(line);
        node->targets.emplace_back(std::move(first));
        while (accept_op("=")) {
            if (at_keyword("yield")) {
                error_at(peek(), "'yield' is not supported");
            }
            node->targets.emplace_back(parse_star_expressions());
        }
        node->value = std::move(node->targets.back());
        node->targets.pop_back();
        for (const auto& target : node->targets) {
            check_target(*target, TargetContext::ASSIGN_STMT);
        }
        if (node->value->kind == NodeKind::Starred) {
            error_at(node->value->line, "can't use starred expression here");
        }
        return node;
    }

    for (const auto& aug : augmented_assignments) {
        if (not at_op(aug.text)) {
            continue;
        }
        if (first->kind != NodeKind::Name and first->kind != NodeKind::Attribute and
            first->kind != NodeKind::Subscript)
        {
            std::string_view what = first->kind == NodeKind::Tuple ? "tuple"
                : first->kind == NodeKind::List                    ? "list"
                                                                   : describe_invalid_target(*first);
            error_at(first->line, '\'', what, "' is an illegal expression for augmented assignment");
        }
        next();
        auto node = std::make_unique<AugAssignStmt>(line);
        node->target = std::move(first);
        node->op = aug.op;
        node->value = parse_star_expressions();
        return node;
    }

    if (at_op(":")) {
        if (first->kind != NodeKind::Name and first->kind != NodeKind::Attribute and
            first->kind != NodeKind::Subscript)
        {
            if (first->kind == NodeKind::Tuple) {
                error_at(first->line, "only single target (not tuple) can be annotated");
            }
            error_at(first->line, "illegal target for annotation");
        }
        next();
        auto node = std::make_unique<AnnAssignStmt>(line);
        node->target = std::move(first);
        node->annotation = parse_expression();
        if (accept_op("=")) {
            node->value = parse_star_expressions();
        }
        return node;
    }

    if (first->kind == NodeKind::Starred) {
        error_at(first->line, "can't use starred expression here");
    }
    auto node = std::make_unique<ExprStmt>(line);
    node->value = std::move(first);
    return node;
}

StmtPtr Parser::parse_import() {
    auto node = std::make_unique<ImportStmt>(next().line);
    do {
        auto alias = std::make_unique<Alias>(peek().line);
        alias->name = expect_name();
        while (accept_op(".")) {
            back_insert(alias->name, '.', expect_name());
        }
        if (accept_keyword("as")) {
            alias->asname = expect_name();
        }
        node->names.emplace_back(std::move(alias));
    } while (accept_op(","));
    return node;
}

StmtPtr Parser::parse_import_from() {
    auto node = std::make_unique<ImportFromStmt>(next().line);
    while (at_op(".") or at_op("...")) {
        node->level += next().text.size();
    }
    if (not at_keyword("import")) {
        std::string module = expect_name();
        while (accept_op(".")) {
            back_insert(module, '.', expect_name());
        }
        node->module = std::move(module);
    } else if (node->level == 0) {
        invalid_syntax();
    }
    if (not accept_keyword("import")) {
        invalid_syntax();
    }

    if (at_op("*")) {
        auto alias = std::make_unique<Alias>(next().line);
        alias->name = "*";
        node->names.emplace_back(std::move(alias));
        return node;
    }
    bool parenthesized = accept_op("(");
    do {
        if (parenthesized and at_op(")")) {
            break;
        }
        auto alias = std::make_unique<Alias>(peek().line);
        alias->name = expect_name();
        if (accept_keyword("as")) {
            alias->asname = expect_name();
        }
        node->names.emplace_back(std::move(alias));
    } while (accept_op(","));
    if (parenthesized) {
        expect_op(")");
    }
    return node;
}

Body Parser::parse_block(std::string_view construct, size_t line) {
    expect_op(":");
    Body body;
    DepthGuard guard{*this};
    if (not at(Token::Kind::NEWLINE)) {
        parse_simple_statements(body);
        return body;
    }
    next();
    if (not at(Token::Kind::INDENT)) {
        error_at(peek(), "expected an indented block after ", construct, " on line ", line);
    }
    next();
    while (not at(Token::Kind::DEDENT) and not at(Token::Kind::END_MARKER)) {
        parse_statement(body);
    }
    next();
    return body;
}

StmtPtr Parser::parse_decorated() {
    std::vector<ExprPtr> decorators;
    while (accept_op("@")) {
        decorators.emplace_back(parse_expression());
        if (not at(Token::Kind::NEWLINE)) {
            invalid_syntax();
        }
        next();
    }
    if (at_keyword("def")) {
        return parse_function_def(std::move(decorators));
    }
    if (at_keyword("class")) {
        return parse_class_def(std::move(decorators));
    }
    invalid_syntax();
}

StmtPtr Parser::parse_function_def(std::vector<ExprPtr> decorators) {
    auto node = std::make_unique<FunctionDefStmt>(next().line);
    node->decorator_list = std::move(decorators);
    node->name = expect_name();
    if (not at_op("(")) {
        error_at(peek(), "expected '('");
    }
    next();
    node->args = parse_parameters(true, ")");
    expect_op(")");
    if (accept_op("->")) {
        node->returns = parse_expression();
    }
    node->body = parse_block("function definition", node->line);
    return node;
}

StmtPtr Parser::parse_class_def(std::vector<ExprPtr> decorators) {
    auto node = std::make_unique<ClassDefStmt>(next().line);
    node->decorator_list = std::move(decorators);
    node->name = expect_name();
    if (accept_op("(")) {
        parse_call_arguments(node->bases, node->keywords);
    }
    node->body = parse_block("class definition", node->line);
    return node;
}

StmtPtr Parser::parse_if() {
    const Token& kw = next();
    std::string_view construct = kw.text == "if" ? "'if' statement" : "'elif' statement";
    auto node = std::make_unique<IfStmt>(kw.line);
    node->test = parse_expression();
    node->body = parse_block(construct, node->line);
    if (at_keyword("elif")) {
        DepthGuard guard{*this, Counted::CHAIN_LINKS};
        node->orelse.emplace_back(parse_if());
    } else if (at_keyword("else")) {
        size_t else_line = next().line;
        node->orelse = parse_block("'else' statement", else_line);
    }
    return node;
}

StmtPtr Parser::parse_while() {
    auto node = std::make_unique<WhileStmt>(next().line);
    node->test = parse_expression();
    node->body = parse_block("'while' statement", node->line);
    if (at_keyword("else")) {
        size_t else_line = next().line;
        node->orelse = parse_block("'else' statement", else_line);
    }
    return node;
}

StmtPtr Parser::parse_for() {
    auto node = std::make_unique<ForStmt>(next().line);
    if (not at_target_start()) {
        invalid_syntax();
    }
    node->target = parse_target_list();
    check_target(*node->target, TargetContext::ASSIGN);
    if (not accept_keyword("in")) {
        invalid_syntax();
    }
    node->iter = parse_star_expressions();
    node->body = parse_block("'for' statement", node->line);
    if (at_keyword("else")) {
        size_t else_line = next().line;
        node->orelse = parse_block("'else' statement", else_line);
    }
    return node;
}

StmtPtr Parser::parse_try() {
    auto node = std::make_unique<TryStmt>(next().line);
    node->body = parse_block("'try' statement", node->line);
    while (at_keyword("except")) {
        auto handler = std::make_unique<ExceptHandler>(next().line);
        if (at_op("*")) {
            error_at(peek(), "'except*' is not supported");
        }
        if (not at_op(":")) {
            handler->type = parse_expression();
            if (at_op(",")) {
                error_at(peek(), "multiple exception types must be parenthesized");
            }
            if (accept_keyword("as")) {
                handler->name = expect_name();
            }
        }
        handler->body = parse_block("'except' statement", handler->line);
        node->handlers.emplace_back(std::move(handler));
    }
    if (not node->handlers.empty() and at_keyword("else")) {
        size_t else_line = next().line;
        node->orelse = parse_block("'else' statement", else_line);
    }
    bool has_finally = false;
    if (at_keyword("finally")) {
        has_finally = true;
        size_t finally_line = next().line;
        node->finalbody = parse_block("'finally' statement", finally_line);
    }
    if (node->handlers.empty() and not has_finally) {
        error_at(peek(), "expected 'except' or 'finally' block");
    }
    return node;
}

StmtPtr Parser::parse_with() {
    auto node = std::make_unique<WithStmt>(next().line);
    do {
        auto item = std::make_unique<WithItem>(peek().line);
        item->context_expr = parse_expression();
        if (accept_keyword("as")) {
            if (not at_target_start()) {
                invalid_syntax();
            }
            item->optional_vars = parse_target();
            check_target(*item->optional_vars, TargetContext::ASSIGN);
        }
        node->items.emplace_back(std::move(item));
    } while (accept_op(","));
    node->body = parse_block("'with' statement", node->line);
    return node;
}

std::unique_ptr<Arguments>
Parser::parse_parameters(bool allow_annotations, std::string_view terminator) {
    auto args = std::make_unique<Arguments>(peek().line);
    bool seen_star = false;
    bool seen_slash = false;
    bool seen_default = false;
    auto parse_arg = [&] {
        auto arg = std::make_unique<Arg>(peek().line);
        arg->name = expect_name();
        if (allow_annotations and accept_op(":")) {
            arg->annotation = parse_expression();
        }
        return arg;
    };

    while (not at_op(terminator)) {
        if (at_op("/")) {
            if (seen_slash) {
                error_at(peek(), "/ may appear only once");
            }
            if (seen_star) {
                error_at(peek(), "/ must be ahead of *");
            }
            if (args->args.empty()) {
                error_at(peek(), "at least one argument must precede /");
            }
            next();
            seen_slash = true;
            args->posonlyargs = std::move(args->args);
            args->args.clear();
        } else if (accept_op("**")) {
            args->kwarg = parse_arg();
            accept_op(",");
            if (not at_op(terminator)) {
                error_at(peek(), "arguments cannot follow var-keyword argument");
            }
            break;
        } else if (at_op("*")) {
            if (seen_star) {
                error_at(peek(), "* argument may appear only once");
            }
            next();
            seen_star = true;
            if (not at_op(",") and not at_op(terminator)) {
                args->vararg = parse_arg();
            }
        } else {
            auto arg = parse_arg();
            ExprPtr default_value;
            if (accept_op("=")) {
                default_value = parse_expression();
            }
            if (seen_star) {
                args->kwonlyargs.emplace_back(std::move(arg));
                args->kw_defaults.emplace_back(std::move(default_value));
            } else {
                if (default_value) {
                    seen_default = true;
                    args->defaults.emplace_back(std::move(default_value));
                } else if (seen_default) {
                    error_at(arg->line, "non-default argument follows default argument");
                }
                args->args.emplace_back(std::move(arg));
            }
        }
        if (not accept_op(",")) {
            break;
        }
    }
    if (seen_star and not args->vararg and args->kwonlyargs.empty()) {
        error_at(peek(), "named arguments must follow bare *");
    }
    return args;
}

/* Expressions */

ExprPtr Parser::parse_star_expressions() {
    auto first = parse_star_expression();
    if (not at_op(",")) {
        return first;
    }
    auto tuple = std::make_unique<CollectionExpr>(NodeKind::Tuple, first->line);
    tuple->elts.emplace_back(std::move(first));
    while (accept_op(",")) {
        if (not at_expression_start()) {
            break;
        }
        tuple->elts.emplace_back(parse_star_expression());
    }
    return tuple;
}

ExprPtr Parser::parse_star_expression() {
    if (at_op("*")) {
        auto node = std::make_unique<StarredExpr>(next().line);
        DepthGuard guard{*this};
        node->value = parse_binary(0);
        return node;
    }
    return parse_expression();
}

ExprPtr Parser::parse_expression() {
    DepthGuard guard{*this};
    if (at_keyword("lambda")) {
        return parse_lambda();
    }
    auto body = parse_disjunction();
    if (at_op(":=")) {
        error_at(peek(), "assignment expressions are not supported");
    }
    if (not at_keyword("if")) {
        return body;
    }
    next();
    auto node = std::make_unique<IfExpExpr>(body->line);
    node->body = std::move(body);
    node->test = parse_disjunction();
    if (not accept_keyword("else")) {
        error_at(peek(), "expected 'else' after 'if' expression");
    }
    node->orelse = parse_expression();
    return node;
}

ExprPtr Parser::parse_lambda() {
    auto node = std::make_unique<LambdaExpr>(next().line);
    node->args = parse_parameters(false, ":");
    expect_op(":");
    node->body = parse_expression();
    return node;
}

ExprPtr Parser::parse_disjunction() {
    auto first = parse_conjunction();
    if (not at_keyword("or")) {
        return first;
    }
    auto node = std::make_unique<BoolOpExpr>(first->line);
    node->op = BoolOperator::OR;
    node->values.emplace_back(std::move(first));
    while (accept_keyword("or")) {
        node->values.emplace_back(parse_conjunction());
    }
    return node;
}

ExprPtr Parser::parse_conjunction() {
    auto first = parse_inversion();
    if (not at_keyword("and")) {
        return first;
    }
    auto node = std::make_unique<BoolOpExpr>(first->line);
    node->op = BoolOperator::AND;
    node->values.emplace_back(std::move(first));
    while (accept_keyword("and")) {
        node->values.emplace_back(parse_inversion());
    }
    return node;
}

ExprPtr Parser::parse_inversion() {
    if (not at_keyword("not")) {
        return parse_comparison();
    }
    DepthGuard guard{*this};
    auto node = std::make_unique<UnaryOpExpr>(next().line);
    node->op = UnaryOperator::NOT;
    node->operand = parse_inversion();
    return node;
}

ExprPtr Parser::parse_comparison() {
    auto left = parse_binary(0);
    std::unique_ptr<CompareExpr> node;
    for (;;) {
        std::optional<CompareOperator> op;
        const Token& tok = peek();
        if (tok.kind == Token::Kind::OP) {
            if (tok.text == "==") {
                op = CompareOperator::EQ;
            } else if (tok.text == "!=") {
                op = CompareOperator::NOT_EQ;
            } else if (tok.text == "<") {
                op = CompareOperator::LT;
            } else if (tok.text == "<=") {
                op = CompareOperator::LT_E;
            } else if (tok.text == ">") {
                op = CompareOperator::GT;
            } else if (tok.text == ">=") {
                op = CompareOperator::GT_E;
            }
            if (op) {
                next();
            }
        } else if (tok.is_keyword("in")) {
            next();
            op = CompareOperator::IN;
        } else if (tok.is_keyword("not") and peek(1).is_keyword("in")) {
            next();
            next();
            op = CompareOperator::NOT_IN;
        } else if (tok.is_keyword("is")) {
            next();
            op = accept_keyword("not") ? CompareOperator::IS_NOT : CompareOperator::IS;
        }
        if (not op) {
            break;
        }
        if (not node) {
            node = std::make_unique<CompareExpr>(left->line);
            node->left = std::move(left);
        }
        node->ops.emplace_back(*op);
        node->comparators.emplace_back(parse_binary(0));
    }
    if (node) {
        return node;
    }
    return left;
}

ExprPtr Parser::parse_binary(size_t level) {
    if (level == std::size(binary_levels)) {
        return parse_factor();
    }
    auto left = parse_binary(level + 1);
    DepthGuard chain{*this, Counted::CHAIN_LINKS, false};
    for (;;) {
        const BinaryOperatorToken* matched = nullptr;
        for (const auto& candidate : binary_levels[level]) {
            if (at_op(candidate.text)) {
                matched = &candidate;
                break;
            }
        }
        if (matched == nullptr) {
            return left;
        }
        chain.add();
        next();
        auto node = std::make_unique<BinOpExpr>(left->line);
        node->left = std::move(left);
        node->op = matched->op;
        node->right = parse_binary(level + 1);
        left = std::move(node);
    }
}

ExprPtr Parser::parse_factor() {
    std::optional<UnaryOperator> op;
    if (at_op("-")) {
        op = UnaryOperator::USUB;
    } else if (at_op("+")) {
        op = UnaryOperator::UADD;
    } else if (at_op("~")) {
        op = UnaryOperator::INVERT;
    }
    if (not op) {
        return parse_power();
    }
    DepthGuard guard{*this};
    auto node = std::make_unique<UnaryOpExpr>(next().line);
    node->op = *op;
    node->operand = parse_factor();
    return node;
}

ExprPtr Parser::parse_power() {
    auto base = parse_primary();
    if (not at_op("**")) {
        return base;
    }
    DepthGuard guard{*this};
    next();
    auto node = std::make_unique<BinOpExpr>(base->line);
    node->left = std::move(base);
    node->op = BinaryOperator::POW;
    node->right = parse_factor();
    return node;
}

ExprPtr Parser::parse_primary() {
    auto expr = parse_atom();
    DepthGuard chain{*this, Counted::CHAIN_LINKS, false};
    for (;;) {
        if (at_op(".")) {
            chain.add();
            next();
            auto node = std::make_unique<AttributeExpr>(expr->line);
            node->value = std::move(expr);
            node->attr = expect_name();
            expr = std::move(node);
        } else if (at_op("(")) {
            chain.add();
            next();
            auto node = std::make_unique<CallExpr>(expr->line);
            node->func = std::move(expr);
            parse_call_arguments(node->args, node->keywords);
            expr = std::move(node);
        } else if (at_op("[")) {
            chain.add();
            next();
            auto node = std::make_unique<SubscriptExpr>(expr->line);
            node->value = std::move(expr);
            node->slice = parse_slices();
            expect_op("]");
            expr = std::move(node);
        } else {
            return expr;
        }
    }
}

ExprPtr Parser::parse_atom() {
    const Token& tok = peek();
    switch (tok.kind) {
    case Token::Kind::NAME: {
        if (tok.text == "True" or tok.text == "False") {
            next();
            return std::make_unique<ConstantExpr>(tok.line, tok.text == "True");
        }
        if (tok.text == "None") {
            next();
            return std::make_unique<ConstantExpr>(tok.line, NoneType{});
        }
        if (tok.text == "yield") {
            error_at(tok, "'yield' is not supported");
        }
        if (tok.text == "await") {
            error_at(tok, "'await' is not supported");
        }
        if (is_keyword(tok.text)) {
            invalid_syntax();
        }
        next();
        return std::make_unique<NameExpr>(tok.line, tok.text);
    }
    case Token::Kind::INT: next(); return std::make_unique<ConstantExpr>(tok.line, tok.int_value);
    case Token::Kind::FLOAT:
        next();
        return std::make_unique<ConstantExpr>(tok.line, tok.float_value);
    case Token::Kind::STRING: return parse_strings();
    case Token::Kind::OP:
        if (tok.text == "(") {
            return parse_parenthesized();
        }
        if (tok.text == "[") {
            return parse_list_display();
        }
        if (tok.text == "{") {
            return parse_brace_display();
        }
        if (tok.text == "...") {
            next();
            return std::make_unique<ConstantExpr>(tok.line, EllipsisType{});
        }
        break;
    default: break;
    }
    invalid_syntax();
}

ExprPtr Parser::parse_comprehension(NodeKind kind, size_t line, ExprPtr elt) {
    if (elt->kind == NodeKind::Starred) {
        error_at(elt->line, "iterable unpacking cannot be used in comprehension");
    }
    auto comp = std::make_unique<ComprehensionExpr>(kind, line);
    comp->elt = std::move(elt);
    parse_comprehension_generators(*comp);
    return comp;
}

ExprPtr Parser::parse_parenthesized() {
    size_t line = next().line;
    if (accept_op(")")) {
        return std::make_unique<CollectionExpr>(NodeKind::Tuple, line);
    }
    if (at_keyword("yield")) {
        error_at(peek(), "'yield' is not supported");
    }
    auto first = parse_star_expression();
    if (at_keyword("for")) {
        auto comp = parse_comprehension(NodeKind::GeneratorExp, line, std::move(first));
        expect_op(")");
        return comp;
    }
    if (accept_op(")")) {
        if (first->kind == NodeKind::Starred) {
            error_at(first->line, "cannot use starred expression here");
        }
        return first;
    }
    if (not at_op(",")) {
        if (at_expression_start()) {
            error_at(peek(), "invalid syntax. Perhaps you forgot a comma?");
        }
        invalid_syntax();
    }
    auto tuple = std::make_unique<CollectionExpr>(NodeKind::Tuple, line);
    tuple->elts.emplace_back(std::move(first));
    while (accept_op(",")) {
        if (at_op(")")) {
            break;
        }
        tuple->elts.emplace_back(parse_star_expression());
    }
    expect_op(")");
    return tuple;
}

ExprPtr Parser::parse_list_display() {
    size_t line = next().line;
    auto list = std::make_unique<CollectionExpr>(NodeKind::List, line);
    if (accept_op("]")) {
        return list;
    }
    auto first = parse_star_expression();
    if (at_keyword("for")) {
        auto comp = parse_comprehension(NodeKind::ListComp, line, std::move(first));
        expect_op("]");
        return comp;
    }
    list->elts.emplace_back(std::move(first));
    while (accept_op(",")) {
        if (at_op("]")) {
            break;
        }
        list->elts.emplace_back(parse_star_expression());
    }
    if (not at_op("]") and at_expression_start()) {
        error_at(peek(), "invalid syntax. Perhaps you forgot a comma?");
    }
    expect_op("]");
    return list;
}

ExprPtr Parser::parse_brace_display() {
    size_t line = next().line;
    if (accept_op("}")) {
        return std::make_unique<DictExpr>(line);
    }

    auto parse_dict_rest = [&](std::unique_ptr<DictExpr> dict) -> ExprPtr {
        while (accept_op(",")) {
            if (at_op("}")) {
                break;
            }
            if (accept_op("**")) {
                dict->keys.emplace_back(nullptr);
                dict->values.emplace_back(parse_binary(0));
                continue;
            }
            auto key = parse_expression();
            expect_op(":");
            dict->keys.emplace_back(std::move(key));
            dict->values.emplace_back(parse_expression());
        }
        expect_op("}");
        return dict;
    };

    if (accept_op("**")) {
        auto dict = std::make_unique<DictExpr>(line);
        dict->keys.emplace_back(nullptr);
        dict->values.emplace_back(parse_binary(0));
        return parse_dict_rest(std::move(dict));
    }

    auto first = parse_star_expression();
    if (accept_op(":")) {
        if (first->kind == NodeKind::Starred) {
            error_at(first->line, "cannot use a starred expression in a dictionary key");
        }
        auto value = parse_expression();
        if (at_keyword("for")) {
            auto comp = std::make_unique<ComprehensionExpr>(NodeKind::DictComp, line);
            comp->key = std::move(first);
            comp->elt = std::move(value);
            parse_comprehension_generators(*comp);
            expect_op("}");
            return comp;
        }
        auto dict = std::make_unique<DictExpr>(line);
        dict->keys.emplace_back(std::move(first));
        dict->values.emplace_back(std::move(value));
        return parse_dict_rest(std::move(dict));
    }

    if (at_keyword("for")) {
        auto comp = parse_comprehension(NodeKind::SetComp, line, std::move(first));
        expect_op("}");
        return comp;
    }
    auto set = std::make_unique<CollectionExpr>(NodeKind::Set, line);
    set->elts.emplace_back(std::move(first));
    while (accept_op(",")) {
        if (at_op("}")) {
            break;
        }
        set->elts.emplace_back(parse_star_expression());
    }
    expect_op("}");
    return set;
}

ExprPtr Parser::parse_slices() {
    auto first = parse_slice_item();
    if (not at_op(",")) {
        return first;
    }
    auto tuple = std::make_unique<CollectionExpr>(NodeKind::Tuple, first->line);
    tuple->elts.emplace_back(std::move(first));
    while (accept_op(",")) {
        if (at_op("]")) {
            break;
        }
        tuple->elts.emplace_back(parse_slice_item());
    }
    return tuple;
}

ExprPtr Parser::parse_slice_item() {
    size_t line = peek().line;
    ExprPtr lower;
    if (not at_op(":")) {
        lower = parse_star_expression();
        if (not at_op(":")) {
            return lower;
        }
    }
    next();
    auto slice = std::make_unique<SliceExpr>(line);
    slice->lower = std::move(lower);
    if (not at_op(":") and not at_op("]") and not at_op(",")) {
        slice->upper = parse_expression();
    }
    if (accept_op(":") and not at_op("]") and not at_op(",")) {
        slice->step = parse_expression();
    }
    return slice;
}

ExprPtr Parser::parse_target() {
    if (at_op("*")) {
        auto node = std::make_unique<StarredExpr>(next().line);
        node->value = parse_target();
        return node;
    }
    return parse_primary();
}

ExprPtr Parser::parse_target_list() {
    auto first = parse_target();
    if (not at_op(",")) {
        return first;
    }
    auto tuple = std::make_unique<CollectionExpr>(NodeKind::Tuple, first->line);
    tuple->elts.emplace_back(std::move(first));
    while (accept_op(",")) {
        if (not at_target_start()) {
            break;
        }
        tuple->elts.emplace_back(parse_target());
    }
    return tuple;
}

void Parser::parse_call_arguments(
    std::vector<ExprPtr>& args, std::vector<std::unique_ptr<Keyword>>& keywords
) {
    bool seen_keyword = false;
    bool seen_keyword_unpacking = false;
    while (not at_op(")")) {
        const Token& tok = peek();
        if (tok.is_op("*")) {
            auto node = std::make_unique<StarredExpr>(next().line);
            node->value = parse_expression();
            if (seen_keyword_unpacking) {
                error_at(node->line, "iterable argument unpacking follows keyword argument unpacking");
            }
            args.emplace_back(std::move(node));
        } else if (tok.is_op("**")) {
            auto kw = std::make_unique<Keyword>(next().line);
            kw->value = parse_expression();
            seen_keyword_unpacking = true;
            keywords.emplace_back(std::move(kw));
        } else if (tok.kind == Token::Kind::NAME and peek(1).is_op("=")) {
            if (is_keyword(tok.text)) {
                error_at(tok, "cannot assign to ", tok.text);
            }
            auto kw = std::make_unique<Keyword>(tok.line);
            kw->arg = next().text;
            next();
            kw->value = parse_expression();
            seen_keyword = true;
            keywords.emplace_back(std::move(kw));
        } else {
            auto expr = parse_expression();
            if (at_keyword("for")) {
                bool sole = args.empty() and keywords.empty();
                size_t line = expr->line;
                expr = parse_comprehension(NodeKind::GeneratorExp, line, std::move(expr));
                if (not sole or not at_op(")")) {
                    error_at(expr->line, "Generator expression must be parenthesized");
                }
            }
            if (seen_keyword_unpacking) {
                error_at(expr->line, "positional argument follows keyword argument unpacking");
            }
            if (seen_keyword) {
                error_at(expr->line, "positional argument follows keyword argument");
            }
            args.emplace_back(std::move(expr));
        }
        if (not accept_op(",")) {
            break;
        }
    }
    if (not at_op(")") and at_expression_start()) {
        error_at(peek(), "invalid syntax. Perhaps you forgot a comma?");
    }
    expect_op(")");
}

void Parser::parse_comprehension_generators(ComprehensionExpr& comp) {
    while (at_keyword("for")) {
        auto gen = std::make_unique<Comprehension>(next().line);
        if (not at_target_start()) {
            invalid_syntax();
        }
        gen->target = parse_target_list();
        check_target(*gen->target, TargetContext::ASSIGN);
        if (not accept_keyword("in")) {
            invalid_syntax();
        }
        gen->iter = parse_disjunction();
        while (accept_keyword("if")) {
            gen->ifs.emplace_back(parse_disjunction());
        }
        comp.generators.emplace_back(std::move(gen));
    }
}

/* Strings */

ExprPtr Parser::parse_strings() {
    size_t line = peek().line;
    std::vector<const Token*> parts;
    bool any_fstring = false;
    while (at(Token::Kind::STRING)) {
        parts.emplace_back(&next());
        any_fstring |= parts.back()->is_fstring;
    }

    if (not any_fstring) {
        std::string str;
        for (const auto* part : parts) {
            str += part->text;
        }
        return std::make_unique<ConstantExpr>(line, make_str_constant(std::move(str)));
    }

    auto joined = std::make_unique<JoinedStrExpr>(line);
    std::string pending;
    for (const auto* part : parts) {
        if (part->is_fstring) {
            parse_fstring_body(part->text, part->is_raw, part->line, *joined, pending, 0);
        } else {
            pending += part->text;
        }
    }
    if (not pending.empty()) {
        joined->values.emplace_back(
            std::make_unique<ConstantExpr>(line, make_str_constant(std::move(pending)))
        );
    }
    return joined;
}

void Parser::parse_fstring_body(
    std::string_view body,
    bool raw,
    size_t line,
    JoinedStrExpr& out,
    std::string& pending,
    size_t nesting
) {
    std::string literal;
    auto flush_literal = [&] {
        if (not literal.empty()) {
            pending += raw ? literal : decode_string_escapes(literal, line);
            literal.clear();
        }
    };

    size_t i = 0;
    while (i < body.size()) {
        char c = body[i];
        if (c == '{') {
            if (i + 1 < body.size() and body[i + 1] == '{') {
                literal += '{';
                i += 2;
                continue;
            }
            flush_literal();
            if (not pending.empty()) {
                out.values.emplace_back(
                    std::make_unique<ConstantExpr>(line, make_str_constant(std::move(pending)))
                );
                pending.clear();
            }
            i = parse_fstring_field(body, i + 1, raw, line, out, nesting);
            continue;
        }
        if (c == '}') {
            if (i + 1 < body.size() and body[i + 1] == '}') {
                literal += '}';
                i += 2;
                continue;
            }
            error_at(line, "f-string: single '}' is not allowed");
        }
        literal += c;
        ++i;
    }
    flush_literal();
}

size_t Parser::parse_fstring_field(
    std::string_view body, size_t beg, bool raw, size_t line, JoinedStrExpr& out, size_t nesting
) {
    if (nesting >= 2) {
        error_at(line, "f-string: expressions nested too deeply");
    }

    size_t i = beg;
    size_t depth = 0;
    char quote = 0;
    bool self_documenting = false;
    for (; i < body.size(); ++i) {
        char c = body[i];
        if (quote != 0) {
            if (c == quote) {
                quote = 0;
            }
            continue;
        }
        if (c == '\\') {
            error_at(line, "f-string expression part cannot include a backslash");
        }
        if (c == '#') {
            error_at(line, "f-string expression part cannot include '#'");
        }
        if (c == '\'' or c == '"') {
            quote = c;
        } else if (c == '(' or c == '[' or c == '{') {
            ++depth;
        } else if ((c == ')' or c == ']' or c == '}') and depth > 0) {
            --depth;
        } else if (depth == 0) {
            char next_c = (i + 1 < body.size() ? body[i + 1] : '\0');
            char prev_c = (i > beg ? body[i - 1] : '\0');
            if (c == '}' or c == ':') {
                break;
            }
            if (c == '!' and next_c != '=') {
                break;
            }
            if (c == '=' and next_c != '=' and
                std::string_view{"=!<>"}.find(prev_c) == std::string_view::npos)
            {
                self_documenting = true;
                break;
            }
        }
    }
    if (quote != 0) {
        error_at(line, "f-string: unterminated string");
    }
    if (i >= body.size()) {
        error_at(line, "f-string: expecting '}'");
    }

    std::string_view expr_text = body.substr(beg, i - beg);
    if (std::all_of(expr_text.begin(), expr_text.end(), [](char c) { return is_space(c); })) {
        error_at(line, "f-string: empty expression not allowed");
    }

    auto field = std::make_unique<FormattedValueExpr>(line);
    field->value = parse_fstring_expression(expr_text, line);
    if (self_documenting) {
        ++i;
        out.values.emplace_back(
            std::make_unique<ConstantExpr>(line, make_str_constant(concat_tostr(expr_text, '=')))
        );
    }
    if (i < body.size() and body[i] == '!') {
        char conversion = (i + 1 < body.size() ? body[i + 1] : '\0');
        if (conversion != 's' and conversion != 'r' and conversion != 'a') {
            error_at(line, "f-string: invalid conversion character: expected 's', 'r', or 'a'");
        }
        field->conversion = conversion;
        i += 2;
    }
    if (i < body.size() and body[i] == ':') {
        size_t spec_beg = i + 1;
        size_t spec_depth = 0;
        for (i = spec_beg; i < body.size(); ++i) {
            if (body[i] == '{') {
                ++spec_depth;
            } else if (body[i] == '}') {
                if (spec_depth == 0) {
                    break;
                }
                --spec_depth;
            }
        }
        if (i >= body.size()) {
            error_at(line, "f-string: expecting '}'");
        }
        auto spec = std::make_unique<JoinedStrExpr>(line);
        std::string spec_pending;
        parse_fstring_body(body.substr(spec_beg, i - spec_beg), raw, line, *spec, spec_pending, nesting + 1);
        if (not spec_pending.empty()) {
            spec->values.emplace_back(
                std::make_unique<ConstantExpr>(line, make_str_constant(std::move(spec_pending)))
            );
        }
        field->format_spec = std::move(spec);
    }
    if (i >= body.size() or body[i] != '}') {
        error_at(line, "f-string: expecting '}'");
    }
    if (self_documenting and field->conversion == 0 and not field->format_spec) {
        field->conversion = 'r';
    }
    out.values.emplace_back(std::move(field));
    return i + 1;
}

ExprPtr Parser::parse_fstring_expression(std::string_view text, size_t line) {
    try {
        Parser sub{tokenize_or_throw(concat_tostr('(', text, ')'))};
        return sub.parse_eval_input();
    } catch (const SyntaxErrorException& e) {
        throw SyntaxErrorException(line + e.error().line - 1, "f-string: ", e.error().message);
    }
}

} // namespace

Result<std::unique_ptr<Module>, SyntaxError> parse_module(std::string_view source) {
    try {
        return Ok{Parser{tokenize_or_throw(source)}.parse_file()};
    } catch (const SyntaxErrorException& e) {
        return Err{e.error()};
    }
}

Result<ExprPtr, SyntaxError> parse_expression(std::string_view source) {
    while (not source.empty() and (source.front() == ' ' or source.front() == '\t')) {
        source.remove_prefix(1);
    }
    try {
        return Ok{Parser{tokenize_or_throw(source)}.parse_eval_input()};
    } catch (const SyntaxErrorException& e) {
        return Err{e.error()};
    }
}

Result<ExprPtr, SyntaxError> parse_expression(std::vector<Token> tokens) {
    try {
        return Ok{Parser{std::move(tokens)}.parse_eval_input()};
    } catch (const SyntaxErrorException& e) {
        return Err{e.error()};
    }
}

} // namespace chk::lang
