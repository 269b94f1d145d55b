#ifndef PRETENST_TENSCRIPT_TOKEN_HPP
#define PRETENST_TENSCRIPT_TOKEN_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace pretenst {
namespace tenscript {

enum class TokenType {
    Name,       // 'quoted name'
    Word,       // run of letters: spins, items, faces, actions
    Number,

    // Structure
    Comma, Colon, Equals, Minus,
    LParen, RParen,

    // Special
    EndOfFile, Unknown
};

struct Token {
    TokenType type;
    std::string text;
    uint32_t line;
    uint32_t column;
    std::optional<uint32_t> number;  // For Number tokens
};

}  // namespace tenscript
}  // namespace pretenst

#endif // PRETENST_TENSCRIPT_TOKEN_HPP
