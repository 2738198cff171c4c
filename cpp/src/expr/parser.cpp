// ==============================================================================
// parser.cpp - Лексер и парсер выражений правил
// ==============================================================================

#include "ruleval/parser.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <limits>
#include <unordered_set>

namespace ruleval::expr {

namespace {

// ============================================================================
// Токены
// ============================================================================

enum class TokenKind {
    Ident,   // идентификатор (включая true/false/null)
    Int,     // целое без знака в тексте; знак применяет парсер
    Uint,    // 123u
    Double,  // 1.5, 1e3
    String,  // "..."
    Bytes,   // b"..."
    Punct,   // оператор или разделитель (включая "in")
    End
};

struct Token {
    TokenKind kind = TokenKind::End;
    std::string text;  // исходный текст (для Ident, Punct, Int)
    Value value;       // декодированное значение литерала
    std::size_t offset = 0;
};

/// Синтаксическая ошибка (не выходит за пределы parse())
struct SyntaxError {
    std::size_t offset;
    std::string message;
};

// Зарезервированные слова, запрещённые как идентификаторы
const std::unordered_set<std::string>& reserved_words() {
    static const std::unordered_set<std::string> words = {
        "as",     "break",   "const",   "continue", "else", "for",  "function", "if",
        "import", "let",     "loop",    "package",  "namespace", "return", "var", "void",
        "while"};
    return words;
}

bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

void append_utf8(std::string& out, std::uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

int hex_value(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

// ============================================================================
// Lexer
// ============================================================================

class Lexer {
public:
    explicit Lexer(std::string_view src) : src_(src) {}

    std::vector<Token> tokenize() {
        std::vector<Token> tokens;
        while (true) {
            skip_space_and_comments();
            if (pos_ >= src_.size()) {
                Token end;
                end.kind = TokenKind::End;
                end.offset = src_.size();
                tokens.push_back(std::move(end));
                return tokens;
            }

            char c = src_[pos_];
            char next = pos_ + 1 < src_.size() ? src_[pos_ + 1] : '\0';

            if (std::isdigit(static_cast<unsigned char>(c)) ||
                (c == '.' && std::isdigit(static_cast<unsigned char>(next)))) {
                tokens.push_back(number());
            } else if (c == '"' || c == '\'') {
                tokens.push_back(string_literal(pos_, false, false));
            } else if (is_string_prefix()) {
                tokens.push_back(prefixed_string());
            } else if (is_ident_start(c)) {
                tokens.push_back(identifier());
            } else {
                tokens.push_back(punct());
            }
        }
    }

private:
    void skip_space_and_comments() {
        while (pos_ < src_.size()) {
            char c = src_[pos_];
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f') {
                ++pos_;
            } else if (c == '/' && pos_ + 1 < src_.size() && src_[pos_ + 1] == '/') {
                while (pos_ < src_.size() && src_[pos_] != '\n') {
                    ++pos_;
                }
            } else {
                break;
            }
        }
    }

    // r"..", b"..", rb"..", br".." (регистр префикса не важен)
    bool is_string_prefix() const {
        std::size_t p = pos_;
        std::size_t letters = 0;
        while (p < src_.size() && letters < 2) {
            char c = static_cast<char>(std::tolower(static_cast<unsigned char>(src_[p])));
            if (c != 'r' && c != 'b') {
                break;
            }
            ++p;
            ++letters;
        }
        if (letters == 0 || p >= src_.size()) {
            return false;
        }
        if (letters == 2 && std::tolower(static_cast<unsigned char>(src_[pos_])) ==
                                std::tolower(static_cast<unsigned char>(src_[pos_ + 1]))) {
            return false;  // "rr", "bb": это идентификаторы
        }
        return src_[p] == '"' || src_[p] == '\'';
    }

    Token prefixed_string() {
        std::size_t start = pos_;
        bool raw = false;
        bool bytes = false;
        while (src_[pos_] != '"' && src_[pos_] != '\'') {
            char c = static_cast<char>(std::tolower(static_cast<unsigned char>(src_[pos_])));
            raw = raw || c == 'r';
            bytes = bytes || c == 'b';
            ++pos_;
        }
        return string_literal(start, raw, bytes);
    }

    Token identifier() {
        Token token;
        token.offset = pos_;
        std::size_t start = pos_;
        while (pos_ < src_.size() && is_ident_char(src_[pos_])) {
            ++pos_;
        }
        token.text = std::string(src_.substr(start, pos_ - start));
        token.kind = token.text == "in" ? TokenKind::Punct : TokenKind::Ident;
        return token;
    }

    Token number() {
        Token token;
        token.offset = pos_;
        std::size_t start = pos_;

        // Шестнадцатеричный литерал
        if (src_[pos_] == '0' && pos_ + 1 < src_.size() &&
            (src_[pos_ + 1] == 'x' || src_[pos_ + 1] == 'X')) {
            pos_ += 2;
            std::size_t digits_start = pos_;
            while (pos_ < src_.size() && hex_value(src_[pos_]) >= 0) {
                ++pos_;
            }
            if (pos_ == digits_start) {
                throw SyntaxError{start, "Syntax error: invalid hex literal"};
            }
            token.text = std::string(src_.substr(start, pos_ - start));
            if (pos_ < src_.size() && (src_[pos_] == 'u' || src_[pos_] == 'U')) {
                ++pos_;
                token.kind = TokenKind::Uint;
                token.value = Value(parse_unsigned(token.text.substr(2), 16, start));
            } else {
                token.kind = TokenKind::Int;
            }
            check_number_end(start);
            return token;
        }

        bool is_double = false;
        while (pos_ < src_.size() && std::isdigit(static_cast<unsigned char>(src_[pos_]))) {
            ++pos_;
        }
        if (pos_ + 1 < src_.size() && src_[pos_] == '.' &&
            std::isdigit(static_cast<unsigned char>(src_[pos_ + 1]))) {
            is_double = true;
            ++pos_;
            while (pos_ < src_.size() && std::isdigit(static_cast<unsigned char>(src_[pos_]))) {
                ++pos_;
            }
        }
        if (pos_ < src_.size() && (src_[pos_] == 'e' || src_[pos_] == 'E')) {
            std::size_t exp = pos_ + 1;
            if (exp < src_.size() && (src_[exp] == '+' || src_[exp] == '-')) {
                ++exp;
            }
            if (exp < src_.size() && std::isdigit(static_cast<unsigned char>(src_[exp]))) {
                is_double = true;
                pos_ = exp;
                while (pos_ < src_.size() &&
                       std::isdigit(static_cast<unsigned char>(src_[pos_]))) {
                    ++pos_;
                }
            }
        }

        token.text = std::string(src_.substr(start, pos_ - start));

        if (is_double) {
            token.kind = TokenKind::Double;
            token.value = Value(std::strtod(token.text.c_str(), nullptr));
        } else if (pos_ < src_.size() && (src_[pos_] == 'u' || src_[pos_] == 'U')) {
            ++pos_;
            token.kind = TokenKind::Uint;
            token.value = Value(parse_unsigned(token.text, 10, start));
        } else {
            token.kind = TokenKind::Int;
        }
        check_number_end(start);
        return token;
    }

    // Число не может сразу продолжаться буквой: "12abc"
    void check_number_end(std::size_t start) const {
        if (pos_ < src_.size() && is_ident_char(src_[pos_])) {
            throw SyntaxError{start, "Syntax error: invalid number literal"};
        }
    }

    std::uint64_t parse_unsigned(const std::string& digits, int base, std::size_t offset) const {
        std::uint64_t result = 0;
        auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), result, base);
        if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
            throw SyntaxError{offset, "Syntax error: uint literal out of range"};
        }
        return result;
    }

    Token string_literal(std::size_t start, bool raw, bool bytes) {
        Token token;
        token.offset = start;
        char quote = src_[pos_];
        bool triple = pos_ + 2 < src_.size() && src_[pos_ + 1] == quote && src_[pos_ + 2] == quote;
        pos_ += triple ? 3 : 1;

        std::string out;
        while (true) {
            if (pos_ >= src_.size()) {
                throw SyntaxError{start, "Syntax error: unterminated string literal"};
            }
            char c = src_[pos_];
            if (triple) {
                if (c == quote && pos_ + 2 < src_.size() && src_[pos_ + 1] == quote &&
                    src_[pos_ + 2] == quote) {
                    pos_ += 3;
                    break;
                }
            } else if (c == quote) {
                ++pos_;
                break;
            } else if (c == '\n' || c == '\r') {
                throw SyntaxError{start, "Syntax error: unterminated string literal"};
            }

            if (c == '\\' && !raw) {
                escape(out, bytes);
                continue;
            }
            out += c;
            ++pos_;
        }

        token.kind = bytes ? TokenKind::Bytes : TokenKind::String;
        token.value = bytes ? Value::make_bytes(std::move(out)) : Value(std::move(out));
        return token;
    }

    void escape(std::string& out, bool bytes) {
        std::size_t at = pos_;
        ++pos_;  // '\'
        if (pos_ >= src_.size()) {
            throw SyntaxError{at, "Syntax error: invalid escape sequence"};
        }
        char c = src_[pos_++];
        switch (c) {
        case 'a':
            out += '\a';
            return;
        case 'b':
            out += '\b';
            return;
        case 'f':
            out += '\f';
            return;
        case 'n':
            out += '\n';
            return;
        case 'r':
            out += '\r';
            return;
        case 't':
            out += '\t';
            return;
        case 'v':
            out += '\v';
            return;
        case '\\':
        case '\'':
        case '"':
        case '`':
        case '?':
            out += c;
            return;
        case 'x':
        case 'X':
            append_code(out, read_hex(2, at), bytes);
            return;
        case 'u':
            if (bytes) {
                throw SyntaxError{at, "Syntax error: \\u escape in bytes literal"};
            }
            append_utf8(out, read_hex(4, at));
            return;
        case 'U':
            if (bytes) {
                throw SyntaxError{at, "Syntax error: \\U escape in bytes literal"};
            }
            append_utf8(out, read_hex(8, at));
            return;
        default:
            break;
        }

        // Восьмеричный \ooo
        if (c >= '0' && c <= '3' && pos_ + 1 < src_.size() && src_[pos_] >= '0' &&
            src_[pos_] <= '7' && src_[pos_ + 1] >= '0' && src_[pos_ + 1] <= '7') {
            int value = (c - '0') * 64 + (src_[pos_] - '0') * 8 + (src_[pos_ + 1] - '0');
            pos_ += 2;
            append_code(out, static_cast<std::uint32_t>(value), bytes);
            return;
        }
        throw SyntaxError{at, "Syntax error: invalid escape sequence"};
    }

    // \xHH и \ooo: в bytes это один байт, в строке кодовая точка U+00HH
    static void append_code(std::string& out, std::uint32_t code, bool bytes) {
        if (bytes) {
            out += static_cast<char>(code);
        } else {
            append_utf8(out, code);
        }
    }

    std::uint32_t read_hex(int count, std::size_t at) {
        std::uint32_t value = 0;
        for (int i = 0; i < count; ++i) {
            int h = pos_ < src_.size() ? hex_value(src_[pos_]) : -1;
            if (h < 0) {
                throw SyntaxError{at, "Syntax error: invalid escape sequence"};
            }
            value = value * 16 + static_cast<std::uint32_t>(h);
            ++pos_;
        }
        if (value > 0x10FFFF || (value >= 0xD800 && value <= 0xDFFF)) {
            throw SyntaxError{at, "Syntax error: invalid unicode code point"};
        }
        return value;
    }

    Token punct() {
        static const char* const two_char[] = {"||", "&&", "==", "!=", "<=", ">="};
        static const char single_char[] = "<>+-*/%!?:.,()[]{}";

        Token token;
        token.kind = TokenKind::Punct;
        token.offset = pos_;

        for (const char* op : two_char) {
            if (src_.compare(pos_, 2, op) == 0) {
                token.text = op;
                pos_ += 2;
                return token;
            }
        }
        for (const char* p = single_char; *p != '\0'; ++p) {
            if (src_[pos_] == *p) {
                token.text = std::string(1, *p);
                ++pos_;
                return token;
            }
        }
        throw SyntaxError{pos_, std::string("Syntax error: token recognition error at: '") +
                                    src_[pos_] + "'"};
    }

    std::string_view src_;
    std::size_t pos_ = 0;
};

// ============================================================================
// Parser
// ============================================================================

class Parser {
public:
    explicit Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

    Expression parse_root() {
        Expression root = expression();
        if (peek().kind != TokenKind::End) {
            unexpected(peek());
        }
        return root;
    }

private:
    // Ограничение глубины рекурсии
    void descend() {
        if (++depth_ > MAX_RECURSION_DEPTH) {
            throw SyntaxError{peek().offset, "expression recursion limit exceeded: " +
                                                 std::to_string(MAX_RECURSION_DEPTH)};
        }
    }

    class DepthGuard {
    public:
        explicit DepthGuard(Parser& parser) : parser_(parser) { parser_.descend(); }
        ~DepthGuard() { --parser_.depth_; }
        DepthGuard(const DepthGuard&) = delete;
        DepthGuard& operator=(const DepthGuard&) = delete;

    private:
        Parser& parser_;
    };

    // Левоассоциативная цепочка (a + b + c, a.b.c): каждое звено добавляет
    // уровень дерева и учитывается в той же глубине
    class ChainGuard {
    public:
        explicit ChainGuard(Parser& parser) : parser_(parser), saved_(parser.depth_) {}
        ~ChainGuard() { parser_.depth_ = saved_; }
        ChainGuard(const ChainGuard&) = delete;
        ChainGuard& operator=(const ChainGuard&) = delete;

        void link() { parser_.descend(); }

    private:
        Parser& parser_;
        int saved_;
    };

    const Token& peek() const { return tokens_[pos_]; }

    bool is_punct(std::string_view text) const {
        return peek().kind == TokenKind::Punct && peek().text == text;
    }

    bool match(std::string_view text) {
        if (is_punct(text)) {
            ++pos_;
            return true;
        }
        return false;
    }

    void expect(std::string_view text) {
        if (!match(text)) {
            const Token& t = peek();
            if (t.kind == TokenKind::End) {
                throw SyntaxError{t.offset, "Syntax error: mismatched input '<EOF>' expecting '" +
                                                std::string(text) + "'"};
            }
            throw SyntaxError{t.offset, "Syntax error: mismatched input '" + token_text(t) +
                                            "' expecting '" + std::string(text) + "'"};
        }
    }

    [[noreturn]] void unexpected(const Token& t) const {
        if (t.kind == TokenKind::End) {
            throw SyntaxError{t.offset, "Syntax error: unexpected end of input"};
        }
        throw SyntaxError{t.offset, "Syntax error: extraneous input '" + token_text(t) + "'"};
    }

    static std::string token_text(const Token& t) {
        if (!t.text.empty()) {
            return t.text;
        }
        if (t.value.is_string()) {
            return "\"" + t.value.as_string() + "\"";
        }
        return "literal";
    }

    Expression make(std::size_t offset, ExpressionVariant v) {
        return Expression(next_id_++, offset, std::move(v));
    }

    static ExpressionPtr boxed(Expression e) { return std::make_unique<Expression>(std::move(e)); }

    // expr: or ('?' or ':' expr)?
    Expression expression() {
        DepthGuard guard(*this);
        Expression condition = or_expression();
        if (is_punct("?")) {
            std::size_t offset = peek().offset;
            ++pos_;
            Expression when_true = or_expression();
            expect(":");
            Expression when_false = expression();
            return make(offset, ExprConditional{boxed(std::move(condition)),
                                                boxed(std::move(when_true)),
                                                boxed(std::move(when_false))});
        }
        return condition;
    }

    // Цепочки || и && ассоциативны: дерево строится сбалансированным,
    // глубина log2(n) вместо n
    Expression balanced(BinaryOp op, std::vector<Expression>& terms,
                        const std::vector<std::size_t>& offsets, std::size_t lo, std::size_t hi) {
        if (lo == hi) {
            return std::move(terms[lo]);
        }
        std::size_t mid = lo + (hi - lo) / 2;
        Expression left = balanced(op, terms, offsets, lo, mid);
        Expression right = balanced(op, terms, offsets, mid + 1, hi);
        return make(offsets[mid], ExprBinary{op, boxed(std::move(left)), boxed(std::move(right))});
    }

    Expression or_expression() {
        std::vector<Expression> terms;
        std::vector<std::size_t> offsets;
        terms.push_back(and_expression());
        while (is_punct("||")) {
            offsets.push_back(peek().offset);
            ++pos_;
            terms.push_back(and_expression());
        }
        return balanced(BinaryOp::Or, terms, offsets, 0, terms.size() - 1);
    }

    Expression and_expression() {
        std::vector<Expression> terms;
        std::vector<std::size_t> offsets;
        terms.push_back(relation());
        while (is_punct("&&")) {
            offsets.push_back(peek().offset);
            ++pos_;
            terms.push_back(relation());
        }
        return balanced(BinaryOp::And, terms, offsets, 0, terms.size() - 1);
    }

    Expression relation() {
        ChainGuard chain(*this);
        Expression left = addition();
        while (true) {
            BinaryOp op;
            if (is_punct("==")) {
                op = BinaryOp::Equal;
            } else if (is_punct("!=")) {
                op = BinaryOp::NotEqual;
            } else if (is_punct("<")) {
                op = BinaryOp::Less;
            } else if (is_punct("<=")) {
                op = BinaryOp::LessEqual;
            } else if (is_punct(">")) {
                op = BinaryOp::Greater;
            } else if (is_punct(">=")) {
                op = BinaryOp::GreaterEqual;
            } else if (is_punct("in")) {
                op = BinaryOp::In;
            } else {
                return left;
            }
            std::size_t offset = peek().offset;
            chain.link();
            ++pos_;
            Expression right = addition();
            left = make(offset, ExprBinary{op, boxed(std::move(left)), boxed(std::move(right))});
        }
    }

    Expression addition() {
        ChainGuard chain(*this);
        Expression left = multiplication();
        while (is_punct("+") || is_punct("-")) {
            BinaryOp op = peek().text == "+" ? BinaryOp::Add : BinaryOp::Subtract;
            std::size_t offset = peek().offset;
            chain.link();
            ++pos_;
            Expression right = multiplication();
            left = make(offset, ExprBinary{op, boxed(std::move(left)), boxed(std::move(right))});
        }
        return left;
    }

    Expression multiplication() {
        ChainGuard chain(*this);
        Expression left = unary();
        while (is_punct("*") || is_punct("/") || is_punct("%")) {
            BinaryOp op = peek().text == "*"   ? BinaryOp::Multiply
                          : peek().text == "/" ? BinaryOp::Divide
                                               : BinaryOp::Modulo;
            std::size_t offset = peek().offset;
            chain.link();
            ++pos_;
            Expression right = unary();
            left = make(offset, ExprBinary{op, boxed(std::move(left)), boxed(std::move(right))});
        }
        return left;
    }

    Expression unary() {
        DepthGuard guard(*this);
        if (is_punct("!")) {
            std::size_t offset = peek().offset;
            ++pos_;
            Expression operand = unary();
            return make(offset, ExprUnary{UnaryOp::Not, boxed(std::move(operand))});
        }
        if (is_punct("-")) {
            std::size_t offset = peek().offset;
            ++pos_;
            // -<int literal>: отдельный литерал, иначе INT64_MIN не выразить
            if (peek().kind == TokenKind::Int) {
                Token literal = peek();
                ++pos_;
                Expression value = make(offset, ExprLiteral{int_literal(literal, true)});
                return member_suffix(std::move(value));
            }
            Expression operand = unary();
            return make(offset, ExprUnary{UnaryOp::Negate, boxed(std::move(operand))});
        }
        return member_suffix(primary());
    }

    Value int_literal(const Token& token, bool negative) const {
        std::string_view digits = token.text;
        int base = 10;
        if (digits.size() > 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
            digits.remove_prefix(2);
            base = 16;
        }
        std::uint64_t magnitude = 0;
        auto [ptr, ec] =
            std::from_chars(digits.data(), digits.data() + digits.size(), magnitude, base);
        constexpr auto max = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
        if (ec != std::errc{} || ptr != digits.data() + digits.size() ||
            magnitude > max + (negative ? 1 : 0)) {
            throw SyntaxError{token.offset, "Syntax error: int literal out of range"};
        }
        if (!negative) {
            return Value(static_cast<std::int64_t>(magnitude));
        }
        if (magnitude == max + 1) {
            return Value(std::numeric_limits<std::int64_t>::min());
        }
        return Value(-static_cast<std::int64_t>(magnitude));
    }

    // Суффиксы: .field, .method(args), [index]
    Expression member_suffix(Expression operand) {
        ChainGuard chain(*this);
        while (true) {
            if (is_punct(".")) {
                std::size_t offset = peek().offset;
                chain.link();
                ++pos_;
                if (peek().kind != TokenKind::Ident) {
                    unexpected(peek());
                }
                std::string name = peek().text;
                ++pos_;
                if (is_punct("(")) {
                    ++pos_;
                    ExpressionVec args = arguments(")");
                    operand = receiver_call(offset, std::move(operand), std::move(name),
                                            std::move(args));
                } else {
                    operand = make(offset, ExprSelect{boxed(std::move(operand)), std::move(name)});
                }
            } else if (is_punct("[")) {
                std::size_t offset = peek().offset;
                chain.link();
                ++pos_;
                Expression index = expression();
                expect("]");
                operand =
                    make(offset, ExprIndex{boxed(std::move(operand)), boxed(std::move(index))});
            } else {
                return operand;
            }
        }
    }

    // Список выражений через запятую до закрывающего токена (допускается хвостовая запятая)
    ExpressionVec arguments(std::string_view close) {
        ExpressionVec args;
        if (match(close)) {
            return args;
        }
        while (true) {
            args.push_back(expression());
            if (match(close)) {
                return args;
            }
            expect(",");
            if (match(close)) {
                return args;
            }
        }
    }

    Expression receiver_call(std::size_t offset, Expression target, std::string name,
                             ExpressionVec args) {
        static const std::pair<const char*, MacroKind> macros[] = {
            {"all", MacroKind::All},
            {"exists", MacroKind::Exists},
            {"exists_one", MacroKind::ExistsOne},
            {"filter", MacroKind::Filter},
            {"map", MacroKind::Map}};

        if (args.size() == 2) {
            for (const auto& [macro_name, macro] : macros) {
                if (name != macro_name) {
                    continue;
                }
                const auto* variable = args[0].get<ExprIdent>();
                if (variable == nullptr) {
                    throw SyntaxError{args[0].offset,
                                      "argument must be a simple name"};
                }
                std::string var_name = variable->name;
                return make(offset, ExprComprehension{macro, std::move(var_name),
                                                      boxed(std::move(target)),
                                                      boxed(std::move(args[1]))});
            }
        }
        return make(offset, ExprCall{std::move(name), boxed(std::move(target)), std::move(args)});
    }

    Expression primary() {
        const Token& token = peek();
        std::size_t offset = token.offset;

        switch (token.kind) {
        case TokenKind::Int: {
            Value v = int_literal(token, false);
            ++pos_;
            return make(offset, ExprLiteral{std::move(v)});
        }
        case TokenKind::Uint:
        case TokenKind::Double:
        case TokenKind::String:
        case TokenKind::Bytes: {
            Value v = token.value;
            ++pos_;
            return make(offset, ExprLiteral{std::move(v)});
        }
        case TokenKind::Ident:
            return identifier_or_call();
        case TokenKind::Punct:
            break;
        case TokenKind::End:
            unexpected(token);
        }

        if (match("(")) {
            Expression inner = expression();
            expect(")");
            return inner;
        }
        if (match("[")) {
            ExpressionVec elements = arguments("]");
            return make(offset, ExprList{std::move(elements)});
        }
        if (match("{")) {
            return map_literal(offset);
        }
        unexpected(token);
    }

    Expression identifier_or_call() {
        const Token& token = peek();
        std::size_t offset = token.offset;
        std::string name = token.text;
        ++pos_;

        if (name == "true" || name == "false") {
            return make(offset, ExprLiteral{Value(name == "true")});
        }
        if (name == "null") {
            return make(offset, ExprLiteral{Value::make_null()});
        }
        if (reserved_words().count(name) > 0) {
            throw SyntaxError{offset, "reserved identifier: " + name};
        }

        if (!match("(")) {
            return make(offset, ExprIdent{std::move(name)});
        }

        ExpressionVec args = arguments(")");

        // has(a.b) -> Select с test_only
        if (name == "has") {
            if (args.size() != 1 || args[0].get<ExprSelect>() == nullptr) {
                throw SyntaxError{offset, "invalid argument to has() macro"};
            }
            Expression select = std::move(args[0]);
            std::get<ExprSelect>(select.data).test_only = true;
            return select;
        }
        return make(offset, ExprCall{std::move(name), nullptr, std::move(args)});
    }

    Expression map_literal(std::size_t offset) {
        ExprMap map;
        if (match("}")) {
            return make(offset, std::move(map));
        }
        while (true) {
            Expression key = expression();
            expect(":");
            Expression value = expression();
            map.entries.push_back(MapEntry{boxed(std::move(key)), boxed(std::move(value))});
            if (match("}")) {
                break;
            }
            expect(",");
            if (match("}")) {
                break;
            }
        }
        return make(offset, std::move(map));
    }

    std::vector<Token> tokens_;
    std::size_t pos_ = 0;
    std::int64_t next_id_ = 1;
    int depth_ = 0;
};

}  // namespace

// ============================================================================
// Public API
// ============================================================================

ParseResult parse(std::string_view source) {
    ParseResult result;
    try {
        Lexer lexer(source);
        Parser parser(lexer.tokenize());
        result.expression = parser.parse_root();
        result.ok = true;
    } catch (const SyntaxError& e) {
        result.ok = false;
        result.issues.push_back(Issue{e.offset, e.message});
    }
    return result;
}

}  // namespace ruleval::expr
