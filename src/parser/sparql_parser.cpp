/*
 * @FileName   : sparql_parser.cpp
 * @CreateAt   : 2026/9/21
 * @Description: tokenizer and recursive descent parser for SPARQL requests and RDF data blocks
 */

#include "parser/sparql_parser.hpp"

#include <regex>
#include <cctype>
#include <algorithm>
#include <cstdint>
#include <unordered_set>

#include <boost/algorithm/string.hpp>
#include <spdlog/spdlog.h>

#include "common/error.hpp"

namespace quint {

namespace {

const std::regex DOUBLE_PATTERN(R"(([0-9]+\.?[0-9]*|\.[0-9]+)[eE][+-]?[0-9]+)");
const std::regex DECIMAL_PATTERN(R"([0-9]*\.[0-9]+)");
const std::regex INTEGER_PATTERN(R"([0-9]+)");
const std::regex PNAME_PATTERN(R"(([A-Za-z][A-Za-z0-9_.-]*)?:((?:[A-Za-z0-9_:%.-]|\\.)+)?)");
const std::regex LANGTAG_PATTERN(R"(@[A-Za-z]+(-[A-Za-z0-9]+)*)");

/* query blank nodes are non-distinguished variables */
const char *BLANK_VARIABLE_PREFIX = "__b";

const std::unordered_set<std::string> BUILTIN_CALLS = {
    "str", "lang", "langmatches", "datatype", "bound", "iri", "uri", "bnode", "rand",
    "abs", "ceil", "floor", "round", "concat", "strlen", "ucase", "lcase", "encode_for_uri",
    "contains", "strstarts", "strends", "strbefore", "strafter", "year", "month", "day",
    "hours", "minutes", "seconds", "timezone", "tz", "now", "uuid", "struuid", "md5",
    "sha1", "sha256", "sha384", "sha512", "coalesce", "if", "strlang", "strdt", "sameterm",
    "isiri", "isuri", "isblank", "isliteral", "isnumeric", "regex", "substr", "replace",
};

const std::unordered_set<std::string> AGGREGATES = {
    "count", "sum", "min", "max", "avg", "sample", "group_concat",
};

const std::unordered_set<std::string> UPDATE_KEYWORDS = {
    "insert", "delete", "load", "clear", "drop", "create", "add", "move", "copy", "with",
};

struct Token {
    enum token_type {
        IRI,
        PNAME,
        BLANK,
        VAR,
        STRING,
        LANGTAG,
        INTEGER,
        DECIMAL,
        DOUBLE,
        NAME,
        PUNCT,
        END,
    };

    token_type type;
    std::string text;
    size_t offset;
};

bool isNameChar(char ch) {
    auto c = static_cast<unsigned char>(ch);
    return std::isalnum(c) || ch == '_' || c >= 0x80;
}

void appendUtf8(std::string &out, uint32_t cp) {
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

class Lexer {
public:
    explicit Lexer(const std::string &text) : text_(text) {}

    std::vector<Token> tokenize() {
        std::vector<Token> tokens;
        while (true) {
            skipSpace_();
            if (pos_ >= text_.size()) {
                tokens.push_back({Token::END, "", text_.size()});
                break;
            }
            tokens.push_back(next_());
        }
        return tokens;
    }

private:
    const std::string &text_;
    size_t pos_ = 0;

    void skipSpace_() {
        while (pos_ < text_.size()) {
            char ch = text_[pos_];
            if (std::isspace(static_cast<unsigned char>(ch))) {
                ++pos_;
            } else if (ch == '#') {
                while (pos_ < text_.size() && text_[pos_] != '\n') ++pos_;
            } else {
                break;
            }
        }
    }

    bool match_(const std::regex &pattern, std::smatch &match) const {
        return std::regex_search(text_.cbegin() + static_cast<std::ptrdiff_t>(pos_), text_.cend(),
                                 match, pattern, std::regex_constants::match_continuous);
    }

    Token next_() {
        size_t start = pos_;
        char ch = text_[pos_];
        bool has_next = pos_ + 1 < text_.size();

        if (ch == '<') {
            std::string iri;
            if (iri_(iri)) return {Token::IRI, iri, start};
        }
        if ((ch == '?' || ch == '$') && has_next && isNameChar(text_[pos_ + 1])) {
            ++pos_;
            std::string name;
            while (pos_ < text_.size() && isNameChar(text_[pos_])) name += text_[pos_++];
            return {Token::VAR, name, start};
        }
        if (ch == '"' || ch == '\'') {
            return {Token::STRING, string_(), start};
        }
        if (ch == '_' && has_next && text_[pos_ + 1] == ':') {
            pos_ += 2;
            std::string label;
            while (pos_ < text_.size() && (isNameChar(text_[pos_]) || text_[pos_] == '.' || text_[pos_] == '-')) {
                label += text_[pos_++];
            }
            while (!label.empty() && label.back() == '.') {
                label.pop_back();
                --pos_;
            }
            if (label.empty()) throw ParseError("empty blank node label", start);
            return {Token::BLANK, label, start};
        }
        std::smatch match;
        if (ch == '@') {
            if (!match_(LANGTAG_PATTERN, match)) throw ParseError("invalid language tag", start);
            pos_ += match.length(0);
            return {Token::LANGTAG, match.str(0).substr(1), start};
        }
        if (std::isdigit(static_cast<unsigned char>(ch))
            || (ch == '.' && has_next && std::isdigit(static_cast<unsigned char>(text_[pos_ + 1])))) {
            if (match_(DOUBLE_PATTERN, match)) {
                pos_ += match.length(0);
                return {Token::DOUBLE, match.str(0), start};
            }
            if (match_(DECIMAL_PATTERN, match)) {
                pos_ += match.length(0);
                return {Token::DECIMAL, match.str(0), start};
            }
            if (!match_(INTEGER_PATTERN, match)) throw ParseError("invalid number", start);
            pos_ += match.length(0);
            return {Token::INTEGER, match.str(0), start};
        }
        if (std::isalpha(static_cast<unsigned char>(ch)) || ch == ':') {
            if (match_(PNAME_PATTERN, match)) {
                std::string text = match.str(0);
                // a trailing dot ends the statement
                while (text.back() == '.' && (text.size() < 2 || text[text.size() - 2] != '\\')) {
                    text.pop_back();
                }
                pos_ += text.size();
                return {Token::PNAME, text, start};
            }
            std::string name;
            while (pos_ < text_.size() && (std::isalnum(static_cast<unsigned char>(text_[pos_])) || text_[pos_] == '_')) {
                name += text_[pos_++];
            }
            return {Token::NAME, name, start};
        }
        for (const char *punct : {"&&", "||", "!=", "<=", ">=", "^^"}) {
            if (text_.compare(pos_, 2, punct) == 0) {
                pos_ += 2;
                return {Token::PUNCT, punct, start};
            }
        }
        static const std::string SINGLE_PUNCT = "{}()[].,;*=<>!+-/|^?";
        if (SINGLE_PUNCT.find(ch) != std::string::npos) {
            ++pos_;
            return {Token::PUNCT, std::string(1, ch), start};
        }
        throw ParseError(std::string("unexpected character '") + ch + "'", start);
    }

    bool iri_(std::string &iri) {
        static const std::string FORBIDDEN = "<\"{}|^`";
        for (size_t i = pos_ + 1; i < text_.size(); ++i) {
            char ch = text_[i];
            if (ch == '>') {
                iri = text_.substr(pos_ + 1, i - pos_ - 1);
                pos_ = i + 1;
                return true;
            }
            if (static_cast<unsigned char>(ch) <= 0x20 || FORBIDDEN.find(ch) != std::string::npos) {
                return false;
            }
        }
        return false;
    }

    std::string string_() {
        size_t start = pos_;
        char quote = text_[pos_];
        std::string triple(3, quote);
        bool long_form = text_.compare(pos_, 3, triple) == 0;
        pos_ += long_form ? 3 : 1;

        std::string out;
        while (true) {
            if (pos_ >= text_.size()) throw ParseError("unterminated string", start);
            char ch = text_[pos_];
            if (ch == '\\') {
                escape_(out);
                continue;
            }
            if (long_form) {
                if (text_.compare(pos_, 3, triple) == 0) {
                    pos_ += 3;
                    break;
                }
            } else {
                if (ch == quote) {
                    ++pos_;
                    break;
                }
                if (ch == '\n' || ch == '\r') throw ParseError("line break in string", pos_);
            }
            out += ch;
            ++pos_;
        }
        return out;
    }

    void escape_(std::string &out) {
        size_t start = pos_;
        if (pos_ + 1 >= text_.size()) throw ParseError("dangling escape", start);
        char ch = text_[pos_ + 1];
        pos_ += 2;
        switch (ch) {
            case 't':  out += '\t'; return;
            case 'n':  out += '\n'; return;
            case 'r':  out += '\r'; return;
            case 'b':  out += '\b'; return;
            case 'f':  out += '\f'; return;
            case '"':  out += '"'; return;
            case '\'': out += '\''; return;
            case '\\': out += '\\'; return;
            case 'u':
            case 'U': {
                size_t digits = ch == 'u' ? 4 : 8;
                if (pos_ + digits > text_.size()) throw ParseError("truncated unicode escape", start);
                std::string hex = text_.substr(pos_, digits);
                for (char h : hex) {
                    if (!std::isxdigit(static_cast<unsigned char>(h))) {
                        throw ParseError("invalid unicode escape", start);
                    }
                }
                appendUtf8(out, static_cast<uint32_t>(std::stoul(hex, nullptr, 16)));
                pos_ += digits;
                return;
            }
            default:
                throw ParseError(std::string("unknown escape '\\") + ch + "'", start);
        }
    }
};

bool isEmptyBgp(const OperationPtr &op) {
    return op->type == Operation::BGP && op->patterns.empty();
}

OperationPtr join(const OperationPtr &left, const OperationPtr &right) {
    if (!left || isEmptyBgp(left)) return right;
    if (isEmptyBgp(right)) return left;
    return Operation::make(Operation::JOIN, {left, right});
}

void addVariable(const Term &term, std::vector<Term> &variables) {
    if (!term.isVariable() || boost::algorithm::starts_with(term.value(), BLANK_VARIABLE_PREFIX)) return;
    if (std::find(variables.begin(), variables.end(), term) == variables.end()) {
        variables.push_back(term);
    }
}

/* variables in scope of a pattern, in order of appearance */
void inScopeVariables(const OperationPtr &op, std::vector<Term> &variables) {
    if (!op) return;
    switch (op->type) {
        case Operation::BGP:
            for (const auto &pattern : op->patterns) {
                for (auto name : {SUBJECT, PREDICATE, OBJECT, GRAPH}) {
                    addVariable(pattern.at(name), variables);
                }
            }
            return;
        case Operation::GRAPH:
            addVariable(op->graph, variables);
            inScopeVariables(op->input(), variables);
            return;
        case Operation::MINUS:
            inScopeVariables(op->input(), variables);
            return;
        default:
            for (const auto &input : op->inputs) inScopeVariables(input, variables);
    }
}

void collectPatterns(const OperationPtr &op, std::vector<TriplePattern> &patterns) {
    if (!op) return;
    if (op->type == Operation::BGP) {
        patterns.insert(patterns.end(), op->patterns.begin(), op->patterns.end());
    }
    for (const auto &input : op->inputs) collectPatterns(input, patterns);
}

} // namespace

class SparqlParser::Impl {
public:
    bool distinct_ = false;
    std::vector<std::string> query_variables_;
    std::vector<TriplePattern> query_triplets_;
    QuintList insert_quints_;

    ParsedQuery parse(const std::string &sparql) {
        reset_(sparql, Term::defaultGraph());

        ParsedQuery query;
        parsePrologue_();
        if (isKeyword_("SELECT")) {
            parseSelect_(query);
        } else if (isKeyword_("ASK")) {
            parseAsk_(query);
        } else if (isKeyword_("CONSTRUCT")) {
            parseConstruct_(query);
        } else if (isKeyword_("DESCRIBE")) {
            parseDescribe_(query);
        } else if (isUpdateKeyword_()) {
            query.form = UPDATE_REQUEST;
            parseUpdate_(query);
        } else {
            throw error_("expected SELECT, ASK, CONSTRUCT, DESCRIBE or an update operation");
        }
        if (!atEnd_()) throw error_("unexpected trailing input");

        query.prefixes = prefixes_;
        query.base = base_;

        query_variables_.clear();
        query_triplets_.clear();
        if (query.form == SELECT_QUERY) {
            for (const auto &variable : findProject_(query.root)->variables) {
                query_variables_.push_back("?" + variable.value());
            }
        }
        collectPatterns(query.root, query_triplets_);
        insert_quints_ = query.insert_data;

        spdlog::debug("[SPARQL parser] parsed {} triple patterns, {} data quints",
                      query_triplets_.size(), query.insert_data.size() + query.delete_data.size());
        return query;
    }

    QuintList parseData(const std::string &text, const Term &default_graph) {
        reset_(text, default_graph);
        data_mode_ = true;

        QuintList quints;
        std::vector<TriplePattern> patterns;
        while (!atEnd_()) {
            if (peek_().type == Token::LANGTAG && peek_().text == "prefix") {
                next_();
                parsePrefixDecl_();
                expectPunct_(".");
            } else if (peek_().type == Token::LANGTAG && peek_().text == "base") {
                next_();
                base_ = expectIriRef_();
                expectPunct_(".");
            } else if (isKeyword_("PREFIX") || isKeyword_("BASE")) {
                parsePrologue_();
            } else if (isKeyword_("INSERT")) {
                next_();
                expectKeyword_("DATA");
                parseQuadData_(quints);
                if (isPunct_(";")) next_();
            } else if (isKeyword_("GRAPH")) {
                next_();
                Term graph = parseGraphName_();
                parseGraphBlock_(graph, patterns);
            } else if (isPunct_("{")) {
                parseGraphBlock_(default_graph_, patterns);
            } else if (isGraphNameToken_() && isPunct_("{", 1)) {
                Term graph = parseGraphName_();
                parseGraphBlock_(graph, patterns);
            } else {
                parseTriplesSameSubject_(patterns);
                if (!atEnd_()) expectPunct_(".");
            }
        }
        for (auto &pattern : patterns) {
            quints.emplace_back(std::move(pattern.subject), std::move(pattern.predicate),
                                std::move(pattern.object), std::move(pattern.graph));
        }
        return quints;
    }

    static query_form classify(const std::string &sparql) {
        auto tokens = Lexer(sparql).tokenize();
        size_t i = 0;
        while (tokens[i].type == Token::NAME) {
            std::string keyword = boost::algorithm::to_lower_copy(tokens[i].text);
            if (keyword == "prefix") {
                i = std::min(i + 3, tokens.size() - 1);
            } else if (keyword == "base") {
                i = std::min(i + 2, tokens.size() - 1);
            } else if (keyword == "select") {
                return SELECT_QUERY;
            } else if (keyword == "ask") {
                return ASK_QUERY;
            } else if (keyword == "construct") {
                return CONSTRUCT_QUERY;
            } else if (keyword == "describe") {
                return DESCRIBE_QUERY;
            } else if (UPDATE_KEYWORDS.count(keyword)) {
                return UPDATE_REQUEST;
            } else {
                break;
            }
        }
        throw ParseError("unknown request form", tokens[i].offset);
    }

private:
    std::vector<Token> tokens_;
    size_t pos_ = 0;
    std::map<std::string, std::string> prefixes_;
    std::string base_;
    bool data_mode_ = false;
    size_t blank_count_ = 0;
    Term default_graph_;
    Term current_graph_;

    void reset_(const std::string &text, const Term &default_graph) {
        tokens_ = Lexer(text).tokenize();
        pos_ = 0;
        prefixes_.clear();
        base_.clear();
        data_mode_ = false;
        blank_count_ = 0;
        default_graph_ = default_graph;
        current_graph_ = default_graph;
    }

    /* token stream */

    const Token &peek_(size_t k = 0) const {
        return tokens_[std::min(pos_ + k, tokens_.size() - 1)];
    }

    const Token &next_() {
        const Token &token = peek_();
        if (pos_ + 1 < tokens_.size()) ++pos_;
        return token;
    }

    bool atEnd_() const {
        return peek_().type == Token::END;
    }

    bool isPunct_(const std::string &punct, size_t k = 0) const {
        return peek_(k).type == Token::PUNCT && peek_(k).text == punct;
    }

    bool isKeyword_(const std::string &keyword, size_t k = 0) const {
        return peek_(k).type == Token::NAME && boost::algorithm::iequals(peek_(k).text, keyword);
    }

    bool isUpdateKeyword_() const {
        return peek_().type == Token::NAME
            && UPDATE_KEYWORDS.count(boost::algorithm::to_lower_copy(peek_().text));
    }

    void expectPunct_(const std::string &punct) {
        if (!isPunct_(punct)) throw error_("expected '" + punct + "'");
        next_();
    }

    void expectKeyword_(const std::string &keyword) {
        if (!isKeyword_(keyword)) throw error_("expected " + keyword);
        next_();
    }

    ParseError error_(const std::string &message) const {
        const Token &token = peek_();
        if (token.type == Token::END) {
            return ParseError(message + " at end of input", token.offset);
        }
        return ParseError(message + " near '" + token.text + "'", token.offset);
    }

    /* prologue and terms */

    void parsePrologue_() {
        while (true) {
            if (isKeyword_("BASE")) {
                next_();
                base_ = expectIriRef_();
            } else if (isKeyword_("PREFIX")) {
                next_();
                parsePrefixDecl_();
            } else {
                break;
            }
        }
    }

    void parsePrefixDecl_() {
        const Token &name = peek_();
        if (name.type != Token::PNAME || name.text.back() != ':'
            || name.text.find(':') != name.text.size() - 1) {
            throw error_("expected a prefix name");
        }
        next_();
        prefixes_[name.text.substr(0, name.text.size() - 1)] = expectIriRef_();
    }

    std::string expectIriRef_() {
        if (peek_().type != Token::IRI) throw error_("expected an IRI");
        return resolve_(next_().text);
    }

    std::string resolve_(const std::string &iri) const {
        if (base_.empty() || iri.find(':') != std::string::npos) return iri;
        return base_ + iri;
    }

    std::string expand_(const Token &token) const {
        auto colon = token.text.find(':');
        auto prefix = token.text.substr(0, colon);
        auto it = prefixes_.find(prefix);
        if (it == prefixes_.end()) {
            throw ParseError("unknown prefix '" + prefix + ":'", token.offset);
        }
        std::string local;
        const std::string raw = token.text.substr(colon + 1);
        for (size_t i = 0; i < raw.size(); ++i) {
            if (raw[i] == '\\' && i + 1 < raw.size()) ++i;
            local += raw[i];
        }
        return it->second + local;
    }

    Term parseIri_() {
        const Token &token = peek_();
        if (token.type == Token::IRI) {
            next_();
            return Term::namedNode(resolve_(token.text));
        }
        if (token.type == Token::PNAME) {
            next_();
            return Term::namedNode(expand_(token));
        }
        throw error_("expected an IRI");
    }

    Term freshBlank_() {
        std::string label = "genid" + std::to_string(blank_count_++);
        return data_mode_ ? Term::blankNode(label) : Term::variable(BLANK_VARIABLE_PREFIX + label);
    }

    Term parseNumeric_(const std::string &sign) {
        const Token &token = next_();
        std::string lexical = (sign == "-" ? "-" : "") + token.text;
        switch (token.type) {
            case Token::INTEGER: return Term::typedLiteral(lexical, xsd::INTEGER);
            case Token::DECIMAL: return Term::typedLiteral(lexical, xsd::DECIMAL);
            default:             return Term::typedLiteral(lexical, xsd::DOUBLE);
        }
    }

    bool isNumericToken_(size_t k = 0) const {
        auto type = peek_(k).type;
        return type == Token::INTEGER || type == Token::DECIMAL || type == Token::DOUBLE;
    }

    Term parseLiteral_() {
        std::string lexical = next_().text;
        if (peek_().type == Token::LANGTAG) {
            return Term::langLiteral(lexical, next_().text);
        }
        if (isPunct_("^^")) {
            next_();
            return Term::typedLiteral(lexical, parseIri_().value());
        }
        return Term::literal(lexical);
    }

    Term parseTerm_() {
        const Token &token = peek_();
        switch (token.type) {
            case Token::VAR:
                if (data_mode_) throw error_("variables are not allowed in data");
                next_();
                return Term::variable(token.text);
            case Token::IRI:
            case Token::PNAME:
                return parseIri_();
            case Token::BLANK:
                next_();
                return data_mode_ ? Term::blankNode(token.text)
                                  : Term::variable(BLANK_VARIABLE_PREFIX + token.text);
            case Token::STRING:
                return parseLiteral_();
            case Token::INTEGER:
            case Token::DECIMAL:
            case Token::DOUBLE:
                return parseNumeric_("");
            case Token::PUNCT:
                if (token.text == "[" && isPunct_("]", 1)) {
                    next_();
                    next_();
                    return freshBlank_();
                }
                if ((token.text == "+" || token.text == "-") && isNumericToken_(1)) {
                    std::string sign = next_().text;
                    return parseNumeric_(sign);
                }
                break;
            case Token::NAME:
                if (isKeyword_("true") || isKeyword_("false")) {
                    return Term::typedLiteral(boost::algorithm::to_lower_copy(next_().text), xsd::BOOLEAN);
                }
                break;
            default:
                break;
        }
        throw error_("expected an RDF term");
    }

    bool isGraphNameToken_() const {
        auto type = peek_().type;
        return type == Token::IRI || type == Token::PNAME || type == Token::BLANK;
    }

    Term parseGraphName_() {
        if (peek_().type == Token::VAR && !data_mode_) {
            return Term::variable(next_().text);
        }
        if (!isGraphNameToken_()) throw error_("expected a graph name");
        return parseTerm_();
    }

    /* triples */

    bool isTriplesStart_() const {
        switch (peek_().type) {
            case Token::VAR:
            case Token::IRI:
            case Token::PNAME:
            case Token::BLANK:
            case Token::STRING:
            case Token::INTEGER:
            case Token::DECIMAL:
            case Token::DOUBLE:
                return true;
            case Token::PUNCT:
                return isPunct_("[") || isPunct_("(")
                    || ((isPunct_("+") || isPunct_("-")) && isNumericToken_(1));
            case Token::NAME:
                return isKeyword_("true") || isKeyword_("false");
            default:
                return false;
        }
    }

    bool isVerbStart_() const {
        auto type = peek_().type;
        return type == Token::VAR || type == Token::IRI || type == Token::PNAME
            || (type == Token::NAME && peek_().text == "a")
            || isPunct_("^") || isPunct_("!") || isPunct_("(");
    }

    void parseTriplesBlock_(std::vector<TriplePattern> &out) {
        while (isTriplesStart_()) {
            parseTriplesSameSubject_(out);
            if (!isPunct_(".")) break;
            next_();
        }
    }

    void parseTriplesSameSubject_(std::vector<TriplePattern> &out) {
        if (isPunct_("(")) throw error_("RDF collections are not supported");
        if (isPunct_("[") && !isPunct_("]", 1)) {
            next_();
            Term subject = freshBlank_();
            parsePropertyListNotEmpty_(subject, out);
            expectPunct_("]");
            if (isVerbStart_()) parsePropertyListNotEmpty_(subject, out);
            return;
        }
        Term subject = parseTerm_();
        parsePropertyListNotEmpty_(subject, out);
    }

    void parsePropertyListNotEmpty_(const Term &subject, std::vector<TriplePattern> &out) {
        while (true) {
            Term verb = parseVerb_();
            parseObjectList_(subject, verb, out);
            if (!isPunct_(";")) break;
            while (isPunct_(";")) next_();
            if (!isVerbStart_()) break;
        }
    }

    Term parseVerb_() {
        if (isPunct_("^") || isPunct_("!") || isPunct_("(")) {
            throw error_("property paths are not supported");
        }
        Term verb;
        if (peek_().type == Token::NAME && peek_().text == "a") {
            next_();
            verb = Term::namedNode(rdf::TYPE);
        } else if (peek_().type == Token::VAR) {
            verb = parseTerm_();
        } else {
            verb = parseIri_();
        }
        for (const char *path : {"/", "|", "*", "+", "?"}) {
            if (isPunct_(path)) throw error_("property paths are not supported");
        }
        return verb;
    }

    void parseObjectList_(const Term &subject, const Term &verb, std::vector<TriplePattern> &out) {
        while (true) {
            Term object = parseObject_(out);
            Term graph = current_graph_;
            // N-Quads graph label
            if (data_mode_ && isGraphNameToken_()) {
                graph = parseTerm_();
            }
            out.push_back({subject, verb, object, graph});
            if (!isPunct_(",")) break;
            next_();
        }
    }

    Term parseObject_(std::vector<TriplePattern> &out) {
        if (isPunct_("(")) throw error_("RDF collections are not supported");
        if (isPunct_("[") && !isPunct_("]", 1)) {
            next_();
            Term node = freshBlank_();
            parsePropertyListNotEmpty_(node, out);
            expectPunct_("]");
            return node;
        }
        return parseTerm_();
    }

    /* graph patterns */

    OperationPtr parseGroupGraphPattern_() {
        expectPunct_("{");
        if (isKeyword_("SELECT")) throw error_("sub-queries are not supported");

        OperationPtr group;
        std::vector<ExpressionPtr> filters;
        while (!isPunct_("}")) {
            if (atEnd_()) throw error_("unterminated group pattern");

            if (isTriplesStart_()) {
                std::vector<TriplePattern> triples;
                parseTriplesBlock_(triples);
                if (group && group->type == Operation::BGP) {
                    group->patterns.insert(group->patterns.end(), triples.begin(), triples.end());
                } else {
                    group = join(group, Operation::makeBgp(std::move(triples)));
                }
                continue;
            }

            if (isKeyword_("OPTIONAL")) {
                next_();
                auto optional = parseGroupGraphPattern_();
                auto left = group ? group : Operation::makeBgp({});
                if (optional->type == Operation::FILTER) {
                    group = Operation::make(Operation::LEFT_JOIN, {left, optional->input()});
                    group->expression = optional->expression;
                } else {
                    group = Operation::make(Operation::LEFT_JOIN, {left, optional});
                }
            } else if (isKeyword_("MINUS")) {
                next_();
                auto right = parseGroupGraphPattern_();
                group = Operation::make(Operation::MINUS, {group ? group : Operation::makeBgp({}), right});
            } else if (isKeyword_("GRAPH")) {
                next_();
                Term name = parseGraphName_();
                auto graph = Operation::make(Operation::GRAPH, {parseGroupGraphPattern_()});
                graph->graph = name;
                group = join(group, graph);
            } else if (isPunct_("{")) {
                auto alternative = parseGroupGraphPattern_();
                while (isKeyword_("UNION")) {
                    next_();
                    alternative = Operation::make(Operation::UNION, {alternative, parseGroupGraphPattern_()});
                }
                group = join(group, alternative);
            } else if (isKeyword_("FILTER")) {
                next_();
                filters.push_back(parseConstraint_());
            } else if (isKeyword_("BIND") || isKeyword_("VALUES") || isKeyword_("SERVICE")) {
                throw error_(boost::algorithm::to_upper_copy(peek_().text) + " is not supported");
            } else {
                throw error_("unexpected token in group pattern");
            }
            if (isPunct_(".")) next_();
        }
        next_();

        if (!group) group = Operation::makeBgp({});
        if (!filters.empty()) {
            auto condition = filters.front();
            for (size_t i = 1; i < filters.size(); ++i) {
                condition = Expression::makeOperator("&&", {condition, filters[i]});
            }
            auto filter = Operation::make(Operation::FILTER, {group});
            filter->expression = condition;
            group = filter;
        }
        return group;
    }

    /* expressions */

    ExpressionPtr parseConstraint_() {
        if (isPunct_("(")) {
            next_();
            auto expr = parseExpression_();
            expectPunct_(")");
            return expr;
        }
        auto type = peek_().type;
        if (type == Token::NAME || type == Token::IRI || type == Token::PNAME) {
            return parsePrimary_();
        }
        throw error_("expected a constraint");
    }

    ExpressionPtr parseExpression_() {
        auto expr = parseAnd_();
        while (isPunct_("||")) {
            next_();
            expr = Expression::makeOperator("||", {expr, parseAnd_()});
        }
        return expr;
    }

    ExpressionPtr parseAnd_() {
        auto expr = parseRelational_();
        while (isPunct_("&&")) {
            next_();
            expr = Expression::makeOperator("&&", {expr, parseRelational_()});
        }
        return expr;
    }

    ExpressionPtr parseRelational_() {
        auto expr = parseAdditive_();
        for (const char *op : {"=", "!=", "<", ">", "<=", ">="}) {
            if (isPunct_(op)) {
                next_();
                return Expression::makeOperator(op, {expr, parseAdditive_()});
            }
        }
        if (isKeyword_("IN") || (isKeyword_("NOT") && isKeyword_("IN", 1))) {
            std::string op = isKeyword_("NOT") ? "notin" : "in";
            if (op == "notin") next_();
            next_();
            std::vector<ExpressionPtr> args{expr};
            auto list = parseExpressionList_();
            args.insert(args.end(), list.begin(), list.end());
            return Expression::makeOperator(op, std::move(args));
        }
        return expr;
    }

    ExpressionPtr parseAdditive_() {
        auto expr = parseMultiplicative_();
        while (isPunct_("+") || isPunct_("-")) {
            std::string op = next_().text;
            expr = Expression::makeOperator(op, {expr, parseMultiplicative_()});
        }
        return expr;
    }

    ExpressionPtr parseMultiplicative_() {
        auto expr = parseUnary_();
        while (isPunct_("*") || isPunct_("/")) {
            std::string op = next_().text;
            expr = Expression::makeOperator(op, {expr, parseUnary_()});
        }
        return expr;
    }

    ExpressionPtr parseUnary_() {
        if (isPunct_("!")) {
            next_();
            return Expression::makeOperator("!", {parsePrimary_()});
        }
        if (isPunct_("+")) {
            next_();
            return parsePrimary_();
        }
        if (isPunct_("-")) {
            next_();
            if (isNumericToken_()) {
                return Expression::makeTerm(parseNumeric_("-"));
            }
            return Expression::makeOperator("UMINUS", {parsePrimary_()});
        }
        return parsePrimary_();
    }

    std::vector<ExpressionPtr> parseExpressionList_() {
        expectPunct_("(");
        std::vector<ExpressionPtr> list;
        if (isPunct_(")")) {
            next_();
            return list;
        }
        while (true) {
            list.push_back(parseExpression_());
            if (!isPunct_(",")) break;
            next_();
        }
        expectPunct_(")");
        return list;
    }

    ExpressionPtr parsePrimary_() {
        if (isPunct_("(")) {
            next_();
            auto expr = parseExpression_();
            expectPunct_(")");
            return expr;
        }
        const Token &token = peek_();
        if (token.type == Token::NAME) {
            std::string name = boost::algorithm::to_lower_copy(token.text);
            if (name == "true" || name == "false") {
                return Expression::makeTerm(parseTerm_());
            }
            if (name == "exists") {
                next_();
                return Expression::makeExistence(false, parseGroupGraphPattern_());
            }
            if (name == "not" && isKeyword_("EXISTS", 1)) {
                next_();
                next_();
                return Expression::makeExistence(true, parseGroupGraphPattern_());
            }
            if (AGGREGATES.count(name)) throw error_("aggregates are not supported");
            if (BUILTIN_CALLS.count(name)) {
                next_();
                return Expression::makeOperator(name, parseExpressionList_());
            }
            throw error_("unknown function");
        }
        if (token.type == Token::IRI || token.type == Token::PNAME) {
            Term iri = parseIri_();
            if (isPunct_("(")) {
                return Expression::makeNamed(iri, parseExpressionList_());
            }
            return Expression::makeTerm(iri);
        }
        if (token.type == Token::VAR || token.type == Token::STRING || token.type == Token::BLANK
            || isNumericToken_()) {
            return Expression::makeTerm(parseTerm_());
        }
        throw error_("expected an expression");
    }

    /* query forms */

    void parseDatasetClauses_() {
        if (isKeyword_("FROM")) throw error_("FROM clauses are not supported");
    }

    bool isOrderConditionStart_() const {
        auto type = peek_().type;
        if (type == Token::VAR || type == Token::IRI || type == Token::PNAME || isPunct_("(")) return true;
        if (type != Token::NAME) return false;
        if (isKeyword_("ASC") || isKeyword_("DESC")) return true;
        return BUILTIN_CALLS.count(boost::algorithm::to_lower_copy(peek_().text)) > 0;
    }

    OperationPtr parseOrderBy_(OperationPtr pattern) {
        if (isKeyword_("GROUP") || isKeyword_("HAVING")) throw error_("GROUP BY and HAVING are not supported");
        if (!isKeyword_("ORDER")) return pattern;
        next_();
        expectKeyword_("BY");

        std::vector<OrderCondition> conditions;
        while (isOrderConditionStart_()) {
            OrderCondition condition;
            if (isKeyword_("ASC") || isKeyword_("DESC")) {
                condition.ascending = isKeyword_("ASC");
                next_();
                expectPunct_("(");
                condition.expression = parseExpression_();
                expectPunct_(")");
            } else if (peek_().type == Token::VAR) {
                condition.expression = Expression::makeTerm(parseTerm_());
            } else {
                condition.expression = parseConstraint_();
            }
            conditions.push_back(std::move(condition));
        }
        if (conditions.empty()) throw error_("expected an order condition");

        auto order = Operation::make(Operation::ORDER_BY, {std::move(pattern)});
        order->order = std::move(conditions);
        return order;
    }

    size_t parseCount_() {
        if (peek_().type != Token::INTEGER) throw error_("expected an integer");
        auto error = error_("integer out of range");
        try {
            return std::stoull(next_().text);
        } catch (const std::out_of_range &) {
            throw error;
        } catch (const std::invalid_argument &) {
            throw error;
        }
    }

    OperationPtr parseSlice_(OperationPtr root) {
        std::optional<size_t> start, length;
        for (int i = 0; i < 2; ++i) {
            if (isKeyword_("LIMIT") && !length) {
                next_();
                length = parseCount_();
            } else if (isKeyword_("OFFSET") && !start) {
                next_();
                start = parseCount_();
            }
        }
        if (isKeyword_("VALUES")) throw error_("VALUES is not supported");
        if (!start && !length) return root;

        auto slice = Operation::make(Operation::SLICE, {std::move(root)});
        slice->start = start;
        slice->length = length;
        return slice;
    }

    OperationPtr parseWhere_() {
        parseDatasetClauses_();
        if (isKeyword_("WHERE")) next_();
        return parseGroupGraphPattern_();
    }

    void parseSelect_(ParsedQuery &query) {
        next_();
        bool distinct = false, reduced = false;
        if (isKeyword_("DISTINCT")) {
            distinct = true;
            next_();
        } else if (isKeyword_("REDUCED")) {
            reduced = true;
            next_();
        }

        std::vector<Term> variables;
        bool star = false;
        if (isPunct_("*")) {
            star = true;
            next_();
        } else {
            while (peek_().type == Token::VAR || isPunct_("(")) {
                if (isPunct_("(")) throw error_("SELECT expressions are not supported");
                variables.push_back(Term::variable(next_().text));
            }
            if (variables.empty()) throw error_("expected a projection");
        }

        auto pattern = parseOrderBy_(parseWhere_());
        if (star) inScopeVariables(pattern, variables);

        auto root = Operation::make(Operation::PROJECT, {pattern});
        root->variables = std::move(variables);
        if (distinct) {
            root = Operation::make(Operation::DISTINCT, {root});
        } else if (reduced) {
            root = Operation::make(Operation::REDUCED, {root});
        }
        query.form = SELECT_QUERY;
        query.root = parseSlice_(root);
        distinct_ = distinct;
    }

    void parseAsk_(ParsedQuery &query) {
        next_();
        auto pattern = parseSlice_(parseOrderBy_(parseWhere_()));
        query.form = ASK_QUERY;
        query.root = Operation::make(Operation::ASK, {pattern});
        distinct_ = false;
    }

    void parseConstruct_(ParsedQuery &query) {
        next_();
        std::vector<TriplePattern> construct_template;
        OperationPtr pattern;
        if (isPunct_("{")) {
            next_();
            parseTriplesBlock_(construct_template);
            expectPunct_("}");
            pattern = parseWhere_();
        } else {
            // CONSTRUCT WHERE { triples }
            parseDatasetClauses_();
            expectKeyword_("WHERE");
            expectPunct_("{");
            parseTriplesBlock_(construct_template);
            expectPunct_("}");
            pattern = Operation::makeBgp(construct_template);
        }
        pattern = parseSlice_(parseOrderBy_(pattern));
        query.form = CONSTRUCT_QUERY;
        query.root = Operation::make(Operation::CONSTRUCT, {pattern});
        query.root->patterns = std::move(construct_template);
        distinct_ = false;
    }

    void parseDescribe_(ParsedQuery &query) {
        next_();
        std::vector<Term> targets;
        if (isPunct_("*")) {
            next_();
        } else {
            while (peek_().type == Token::VAR || peek_().type == Token::IRI || peek_().type == Token::PNAME) {
                targets.push_back(parseTerm_());
            }
            if (targets.empty()) throw error_("expected a variable or an IRI");
        }
        parseDatasetClauses_();
        OperationPtr pattern = Operation::makeBgp({});
        if (isKeyword_("WHERE") || isPunct_("{")) {
            pattern = parseWhere_();
        }
        if (targets.empty()) inScopeVariables(pattern, targets);
        pattern = parseSlice_(parseOrderBy_(pattern));
        query.form = DESCRIBE_QUERY;
        query.root = Operation::make(Operation::DESCRIBE, {pattern});
        query.root->variables = std::move(targets);
        distinct_ = false;
    }

    static OperationPtr findProject_(const OperationPtr &op) {
        for (auto cur = op; cur; cur = cur->input()) {
            if (cur->type == Operation::PROJECT) return cur;
        }
        return Operation::make(Operation::PROJECT);
    }

    /* updates */

    void parseUpdate_(ParsedQuery &query) {
        while (true) {
            parsePrologue_();
            if (atEnd_()) break;
            if (isKeyword_("INSERT") || isKeyword_("DELETE")) {
                bool insert = isKeyword_("INSERT");
                next_();
                if (!isKeyword_("DATA")) {
                    throw error_(std::string("only ") + (insert ? "INSERT" : "DELETE") + " DATA is supported");
                }
                next_();
                parseQuadData_(insert ? query.insert_data : query.delete_data);
            } else if (isUpdateKeyword_()) {
                throw error_(boost::algorithm::to_upper_copy(peek_().text) + " is not supported");
            } else {
                throw error_("expected an update operation");
            }
            if (!isPunct_(";")) break;
            next_();
        }
        distinct_ = false;
    }

    void parseGraphBlock_(const Term &graph, std::vector<TriplePattern> &out) {
        expectPunct_("{");
        current_graph_ = graph;
        while (!isPunct_("}")) {
            if (!isTriplesStart_()) throw error_("expected a triple");
            parseTriplesBlock_(out);
        }
        next_();
        current_graph_ = default_graph_;
    }

    void parseQuadData_(QuintList &quints) {
        bool data_mode = data_mode_;
        data_mode_ = true;

        std::vector<TriplePattern> patterns;
        expectPunct_("{");
        while (!isPunct_("}")) {
            if (isKeyword_("GRAPH")) {
                next_();
                Term graph = parseGraphName_();
                parseGraphBlock_(graph, patterns);
            } else if (isTriplesStart_()) {
                parseTriplesBlock_(patterns);
            } else {
                throw error_("expected a triple or a GRAPH block");
            }
            if (isPunct_(".")) next_();
        }
        next_();

        for (auto &pattern : patterns) {
            quints.emplace_back(std::move(pattern.subject), std::move(pattern.predicate),
                                std::move(pattern.object), std::move(pattern.graph));
        }
        data_mode_ = data_mode;
    }
};

SparqlParser::SparqlParser() : impl_(std::make_shared<Impl>()) {}

SparqlParser::~SparqlParser() = default;

ParsedQuery SparqlParser::parse(const std::string &sparql) {
    return impl_->parse(sparql);
}

QuintList SparqlParser::parseData(const std::string &text, const Term &default_graph) {
    return impl_->parseData(text, default_graph);
}

query_form SparqlParser::classify(const std::string &sparql) {
    return Impl::classify(sparql);
}

std::vector<std::string> SparqlParser::getQueryVariables() const {
    return impl_->query_variables_;
}

std::vector<TriplePattern> SparqlParser::getQueryTriplets() const {
    return impl_->query_triplets_;
}

QuintList SparqlParser::getInsertQuints() const {
    return impl_->insert_quints_;
}

bool SparqlParser::isDistinctQuery() const {
    return impl_->distinct_;
}

} // namespace quint
