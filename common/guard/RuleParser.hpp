#pragma once

#include "GuardRule.hpp"
#include "common/utils/AppException.hpp"

/**
 * @brief 规则字符串解析器
 *
 * 语法：
 * @code
 * rules := [ rule ( "|" rule )* ]
 * rule  := ["!"] NAME [ "[" args "]" | "(" args ")" ]
 * arg   := list | r"regex" | "quoted" | bare
 * @endcode
 *
 * 裸字面量按类型解析：true/false、none/null、整数、小数，其余为去除首尾空白的字符串。
 * r"..." 中的反斜杠原样保留，只有 \" 表示引号。
 */
class RuleParser {
public:
    explicit RuleParser(std::string statement)
        : statement_(std::move(statement)) {}

    std::vector<GuardRule> parse() {
        std::vector<GuardRule> rules;
        pos_ = 0;
        skipWhitespace();
        if (atEnd()) return rules;

        while (true) {
            rules.push_back(parseRule());
            skipWhitespace();
            if (atEnd()) break;
            if (peek() != '|') fail("Expected | or end of rule");
            ++pos_;
            skipWhitespace();
            if (atEnd() || peek() == '|') fail("Expected rule after |");
        }
        return rules;
    }

private:
    std::string statement_;
    size_t pos_ = 0;

    // ========== 规则 ==========

    GuardRule parseRule() {
        GuardRule rule;
        if (peek() == '!') {
            rule.negate = true;
            ++pos_;
            skipWhitespace();
        }
        rule.name = parseName();
        skipWhitespace();
        if (!atEnd() && (peek() == '[' || peek() == '(')) {
            char close = peek() == '[' ? ']' : ')';
            ++pos_;
            rule.args = parseArgs(close);
        }
        return rule;
    }

    std::string parseName() {
        size_t start = pos_;
        if (atEnd()) fail("Expected guard name");
        unsigned char head = static_cast<unsigned char>(peek());
        if (!std::isalpha(head) && head != '_') fail("Expected guard name");
        while (!atEnd()) {
            unsigned char c = static_cast<unsigned char>(peek());
            if (!std::isalnum(c) && c != '_') break;
            ++pos_;
        }
        return statement_.substr(start, pos_ - start);
    }

    // ========== 参数 ==========

    /**
     * @brief 解析参数直到 close（开括号已消费，闭括号在此消费）
     */
    std::vector<Json::Value> parseArgs(char close) {
        std::vector<Json::Value> args;
        skipWhitespace();
        if (atEnd()) fail(std::string("Expected ") + close);
        if (peek() == close) {
            ++pos_;
            return args;
        }

        while (true) {
            skipWhitespace();
            args.push_back(parseArg());
            skipWhitespace();
            if (atEnd()) fail(std::string("Expected ") + close);
            char c = peek();
            if (c == close) {
                ++pos_;
                return args;
            }
            if (c != ',') fail(std::string("Expected , or ") + close);
            ++pos_;
        }
    }

    Json::Value parseArg() {
        if (atEnd()) fail("Expected argument");
        char c = peek();
        if (c == '[' || c == '(') {
            ++pos_;
            Json::Value list(Json::arrayValue);
            for (auto& item : parseArgs(c == '[' ? ']' : ')')) {
                list.append(std::move(item));
            }
            return list;
        }
        if (c == 'r' && peekAt(1) == '"') return parseRegex();
        if (c == '"') return parseQuoted();
        return parseBare();
    }

    Json::Value parseRegex() {
        size_t start = pos_;
        pos_ += 2;
        std::string pattern;
        while (true) {
            if (atEnd()) fail("Unterminated regex literal", start);
            char c = statement_[pos_];
            if (c == '\\' && pos_ + 1 < statement_.size()) {
                // \" 表示引号，其余转义对原样保留给正则引擎
                char next = statement_[pos_ + 1];
                if (next != '"') pattern += c;
                pattern += next;
                pos_ += 2;
                continue;
            }
            ++pos_;
            if (c == '"') break;
            pattern += c;
        }
        return Json::Value(pattern);
    }

    Json::Value parseQuoted() {
        size_t start = pos_;
        ++pos_;
        std::string text;
        while (true) {
            if (atEnd()) fail("Unterminated string literal", start);
            char c = statement_[pos_];
            if (c == '\\') {
                if (pos_ + 1 >= statement_.size()) fail("Unterminated string literal", start);
                text += statement_[pos_ + 1];
                pos_ += 2;
                continue;
            }
            ++pos_;
            if (c == '"') break;
            text += c;
        }
        return Json::Value(text);
    }

    Json::Value parseBare() {
        size_t start = pos_;
        std::string token;
        while (!atEnd() && !isPunctuator(peek())) {
            if (peek() == '\\') {
                ++pos_;
                if (atEnd()) fail("Dangling escape");
            }
            token += statement_[pos_];
            ++pos_;
        }
        token = StringUtils::trim(token);
        if (token.empty()) fail("Empty argument", start);
        return typeLiteral(token);
    }

    static Json::Value typeLiteral(const std::string& token) {
        static const std::regex integerPattern(R"(^-?\d+$)");
        static const std::regex realPattern(R"(^-?\d+\.\d+$)");

        std::string lower = StringUtils::toLower(token);
        if (lower == "true") return Json::Value(true);
        if (lower == "false") return Json::Value(false);
        if (lower == "none" || lower == "null") return Json::Value(Json::nullValue);

        try {
            if (std::regex_match(token, integerPattern)) {
                return Json::Value(static_cast<Json::Int64>(std::stoll(token)));
            }
            if (std::regex_match(token, realPattern)) {
                return Json::Value(std::stod(token));
            }
        } catch (const std::out_of_range&) {
            // 超出范围的数字按字符串处理
        }
        return Json::Value(token);
    }

    // ========== 游标 ==========

    bool atEnd() const { return pos_ >= statement_.size(); }

    char peek() const { return statement_[pos_]; }

    char peekAt(size_t offset) const {
        return pos_ + offset < statement_.size() ? statement_[pos_ + offset] : '\0';
    }

    void skipWhitespace() {
        while (!atEnd() && std::isspace(static_cast<unsigned char>(peek()))) {
            ++pos_;
        }
    }

    static bool isPunctuator(char c) {
        return c == '(' || c == ')' || c == '[' || c == ']' || c == ',' || c == '"' || c == '|';
    }

    [[noreturn]] void fail(const std::string& reason) const {
        fail(reason, pos_);
    }

    [[noreturn]] void fail(const std::string& reason, size_t position) const {
        throw MalformedRuleException(reason, statement_, position);
    }
};
