#ifndef PRETENST_TENSCRIPT_TOKENIZER_HPP
#define PRETENST_TENSCRIPT_TOKENIZER_HPP

#include "token.hpp"
#include <string_view>

namespace pretenst {
namespace tenscript {

// Splits tenscript source into tokens, tracking line and column.
// Malformed input becomes Unknown tokens; the parser reports them.
class Tokenizer {
public:
    explicit Tokenizer(std::string_view input);

    Token next();           // Get next token
    Token peek();           // Look ahead without consuming
    bool at_end() const;

private:
    std::string_view input_;
    size_t pos_ = 0;
    uint32_t line_ = 1;
    uint32_t column_ = 1;
    std::optional<Token> peeked_;

    void advance();
    char current() const;

    template <typename Predicate>
    std::string take_while(Predicate predicate);

    Token scan_token();
    Token scan_name(uint32_t line, uint32_t column);
};

}  // namespace tenscript
}  // namespace pretenst

#endif // PRETENST_TENSCRIPT_TOKENIZER_HPP
