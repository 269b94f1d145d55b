#ifndef PRETENST_TENSCRIPT_PARSER_HPP
#define PRETENST_TENSCRIPT_PARSER_HPP

#include "tokenizer.hpp"
#include "ast.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace pretenst {
namespace tenscript {

class Parser {
public:
    explicit Parser(Tokenizer tokenizer);

    Tenscript parse();

    const std::vector<std::string>& errors() const { return errors_; }
    bool has_errors() const { return !errors_.empty(); }

private:
    Tokenizer tokenizer_;
    Token current_;
    std::vector<std::string> errors_;

    void advance();
    bool check(TokenType type) const;
    bool match(TokenType type);
    void expect(TokenType type, const std::string& message);
    void error(const std::string& message);

    std::optional<Spin> parse_spin();
    TreeNode parse_body();
    void parse_item(TreeNode& node);
    std::optional<FaceName> parse_face_letter(std::string_view letter);
    void parse_mark_item(TreeNode& node);
    void parse_markdef(Tenscript& script);
};

// Parse a complete script. Throws std::runtime_error listing every error
// if the script does not parse cleanly.
Tenscript parse_tenscript(std::string_view source);

}  // namespace tenscript
}  // namespace pretenst

#endif // PRETENST_TENSCRIPT_PARSER_HPP
