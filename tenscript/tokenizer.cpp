#include "tokenizer.hpp"
#include <cctype>

namespace pretenst {
namespace tenscript {

namespace {

constexpr size_t MAX_NUMBER_DIGITS = 9;

struct Punctuation {
    char symbol;
    TokenType type;
};

constexpr Punctuation PUNCTUATION[] = {
    {',', TokenType::Comma},
    {':', TokenType::Colon},
    {'=', TokenType::Equals},
    {'-', TokenType::Minus},
    {'(', TokenType::LParen},
    {')', TokenType::RParen},
};

bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }
bool is_letter(char c) { return std::isalpha(static_cast<unsigned char>(c)) != 0; }
bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

}  // namespace

Tokenizer::Tokenizer(std::string_view input) : input_(input) {}

bool Tokenizer::at_end() const {
    return pos_ >= input_.size();
}

char Tokenizer::current() const {
    return at_end() ? '\0' : input_[pos_];
}

void Tokenizer::advance() {
    if (at_end()) return;
    if (input_[pos_] == '\n') {
        ++line_;
        column_ = 1;
    } else {
        ++column_;
    }
    ++pos_;
}

template <typename Predicate>
std::string Tokenizer::take_while(Predicate predicate) {
    std::string taken;
    while (!at_end() && predicate(current())) {
        taken += current();
        advance();
    }
    return taken;
}

Token Tokenizer::peek() {
    if (!peeked_) {
        peeked_ = scan_token();
    }
    return *peeked_;
}

Token Tokenizer::next() {
    if (!peeked_) {
        return scan_token();
    }
    Token token = std::move(*peeked_);
    peeked_.reset();
    return token;
}

Token Tokenizer::scan_token() {
    take_while(is_space);

    uint32_t line = line_;
    uint32_t column = column_;
    if (at_end()) {
        return Token{TokenType::EndOfFile, "", line, column, std::nullopt};
    }

    char c = current();
    for (const auto& punctuation : PUNCTUATION) {
        if (punctuation.symbol == c) {
            advance();
            return Token{punctuation.type, std::string(1, c), line, column, std::nullopt};
        }
    }
    if (c == '\'') {
        return scan_name(line, column);
    }
    if (is_digit(c)) {
        std::string digits = take_while(is_digit);
        if (digits.size() > MAX_NUMBER_DIGITS) {
            return Token{TokenType::Unknown, digits, line, column, std::nullopt};
        }
        auto value = static_cast<uint32_t>(std::stoul(digits));
        return Token{TokenType::Number, digits, line, column, value};
    }
    // Letters only, so "S90" reads as "S" then 90
    if (is_letter(c)) {
        return Token{TokenType::Word, take_while(is_letter), line, column, std::nullopt};
    }

    advance();
    return Token{TokenType::Unknown, std::string(1, c), line, column, std::nullopt};
}

// A quoted name may not span lines
Token Tokenizer::scan_name(uint32_t line, uint32_t column) {
    advance();
    std::string name = take_while([](char c) { return c != '\'' && c != '\n'; });
    if (current() != '\'') {
        return Token{TokenType::Unknown, "'" + name, line, column, std::nullopt};
    }
    advance();
    return Token{TokenType::Name, name, line, column, std::nullopt};
}

}  // namespace tenscript
}  // namespace pretenst
