#pragma once
// Query language for pattern search
//
//   refactor workflow        either term (ranked, more matches score higher)
//   refactor*                prefix, expands over the vocabulary
//   "extract method"         phrase, tokens must be adjacent
//   a AND b, a OR b          explicit boolean (operators are uppercase)
//   NOT legacy, -legacy      exclusion
//   (a OR b) AND c           grouping
//
// Precedence: NOT, then juxtaposition, then AND, then OR. Within a
// juxtaposed sequence the positive parts are OR'ed and the negated parts
// are removed from the result.

#include "../status.hpp"
#include "../types.hpp"
#include <string>
#include <vector>

namespace cortex {

struct QueryNode {
    enum class Type { Term, Prefix, Phrase, And, Or, Not, Sequence };

    Type type = Type::Sequence;
    std::string term;                   // Term, Prefix
    std::vector<std::string> phrase;    // Phrase tokens
    std::vector<QueryNode> children;

    bool empty() const {
        return (type == Type::Sequence || type == Type::Or || type == Type::And) && children.empty();
    }
};

namespace detail {

struct QueryToken {
    enum class Kind { Word, Phrase, LParen, RParen, And, Or, Not, Minus };
    Kind kind;
    std::string text;
};

inline Result<std::vector<QueryToken>> lex_query(const std::string& query) {
    std::vector<QueryToken> out;
    size_t i = 0;
    while (i < query.size()) {
        char c = query[i];
        if (std::isspace(static_cast<unsigned char>(c))) { ++i; continue; }
        if (c == '(') { out.push_back({QueryToken::Kind::LParen, "("}); ++i; continue; }
        if (c == ')') { out.push_back({QueryToken::Kind::RParen, ")"}); ++i; continue; }
        if (c == '"') {
            size_t end = query.find('"', i + 1);
            if (end == std::string::npos) return Status::validation("unterminated phrase in query");
            out.push_back({QueryToken::Kind::Phrase, query.substr(i + 1, end - i - 1)});
            i = end + 1;
            continue;
        }
        if (c == '-' && i + 1 < query.size() &&
            !std::isspace(static_cast<unsigned char>(query[i + 1])) &&
            (out.empty() || i == 0 || std::isspace(static_cast<unsigned char>(query[i - 1])) ||
             query[i - 1] == '(')) {
            out.push_back({QueryToken::Kind::Minus, "-"});
            ++i;
            continue;
        }

        size_t start = i;
        while (i < query.size() && !std::isspace(static_cast<unsigned char>(query[i])) &&
               query[i] != '(' && query[i] != ')' && query[i] != '"') {
            ++i;
        }
        std::string word = query.substr(start, i - start);
        if (word == "AND") out.push_back({QueryToken::Kind::And, word});
        else if (word == "OR") out.push_back({QueryToken::Kind::Or, word});
        else if (word == "NOT") out.push_back({QueryToken::Kind::Not, word});
        else out.push_back({QueryToken::Kind::Word, word});
    }
    return out;
}

class QueryParser {
public:
    explicit QueryParser(std::vector<QueryToken> tokens) : tokens_(std::move(tokens)) {}

    Result<QueryNode> parse() {
        auto node = parse_or();
        if (!node.ok()) return node;
        if (pos_ < tokens_.size()) {
            return Status::validation("unexpected '" + tokens_[pos_].text + "' in query");
        }
        return node;
    }

private:
    bool at(QueryToken::Kind kind) const {
        return pos_ < tokens_.size() && tokens_[pos_].kind == kind;
    }

    bool starts_unary() const {
        return at(QueryToken::Kind::Word) || at(QueryToken::Kind::Phrase) ||
               at(QueryToken::Kind::LParen) || at(QueryToken::Kind::Not) ||
               at(QueryToken::Kind::Minus);
    }

    Result<QueryNode> parse_or() {
        auto first = parse_and();
        if (!first.ok()) return first;
        QueryNode node;
        node.type = QueryNode::Type::Or;
        node.children.push_back(std::move(*first));
        while (at(QueryToken::Kind::Or)) {
            ++pos_;
            auto next = parse_and();
            if (!next.ok()) return next;
            node.children.push_back(std::move(*next));
        }
        return collapse(std::move(node));
    }

    Result<QueryNode> parse_and() {
        auto first = parse_sequence();
        if (!first.ok()) return first;
        QueryNode node;
        node.type = QueryNode::Type::And;
        node.children.push_back(std::move(*first));
        while (at(QueryToken::Kind::And)) {
            ++pos_;
            auto next = parse_sequence();
            if (!next.ok()) return next;
            node.children.push_back(std::move(*next));
        }
        return collapse(std::move(node));
    }

    Result<QueryNode> parse_sequence() {
        QueryNode node;
        node.type = QueryNode::Type::Sequence;
        while (starts_unary()) {
            auto next = parse_unary();
            if (!next.ok()) return next;
            if (!next->empty()) node.children.push_back(std::move(*next));
        }
        if (node.children.empty() && pos_ < tokens_.size() && !at(QueryToken::Kind::RParen)) {
            return Status::validation("operator '" + tokens_[pos_].text + "' is missing an operand");
        }
        return collapse(std::move(node));
    }

    Result<QueryNode> parse_unary() {
        if (at(QueryToken::Kind::Not) || at(QueryToken::Kind::Minus)) {
            ++pos_;
            if (!starts_unary()) return Status::validation("NOT is missing an operand");
            auto inner = parse_unary();
            if (!inner.ok()) return inner;
            QueryNode node;
            node.type = QueryNode::Type::Not;
            node.children.push_back(std::move(*inner));
            return node;
        }
        if (at(QueryToken::Kind::LParen)) {
            ++pos_;
            auto inner = parse_or();
            if (!inner.ok()) return inner;
            if (!at(QueryToken::Kind::RParen)) return Status::validation("unbalanced '(' in query");
            ++pos_;
            return inner;
        }

        const QueryToken& tok = tokens_[pos_++];
        if (tok.kind == QueryToken::Kind::Phrase) {
            return phrase_node(tokenize(tok.text));
        }

        // Word: trailing '*' makes it a prefix
        std::string word = tok.text;
        bool prefix = !word.empty() && word.back() == '*';
        while (!word.empty() && word.back() == '*') word.pop_back();
        auto parts = tokenize(word);

        if (prefix) {
            std::string stem;
            for (char c : word) {
                if (std::isalnum(static_cast<unsigned char>(c)) || c == '_') {
                    stem += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
                }
            }
            if (stem.empty()) return Status::validation("empty prefix in query");
            QueryNode node;
            node.type = QueryNode::Type::Prefix;
            node.term = stem;
            return node;
        }
        return phrase_node(std::move(parts));
    }

    static QueryNode phrase_node(std::vector<std::string> parts) {
        QueryNode node;
        if (parts.empty()) {
            node.type = QueryNode::Type::Sequence;   // Nothing searchable
        } else if (parts.size() == 1) {
            node.type = QueryNode::Type::Term;
            node.term = std::move(parts[0]);
        } else {
            node.type = QueryNode::Type::Phrase;
            node.phrase = std::move(parts);
        }
        return node;
    }

    static QueryNode collapse(QueryNode node) {
        if (node.children.size() == 1) return std::move(node.children[0]);
        return node;
    }

    std::vector<QueryToken> tokens_;
    size_t pos_ = 0;
};

} // namespace detail

// Empty or stopword-only queries parse to an empty node
inline Result<QueryNode> parse_query(const std::string& query) {
    auto tokens = detail::lex_query(query);
    if (!tokens.ok()) return tokens.status;
    if (tokens->empty()) return QueryNode{};
    return detail::QueryParser(std::move(*tokens)).parse();
}

} // namespace cortex
