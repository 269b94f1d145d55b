#include "parser.hpp"
#include <sstream>
#include <stdexcept>

namespace pretenst {
namespace tenscript {

Parser::Parser(Tokenizer tokenizer) : tokenizer_(std::move(tokenizer)) {
    advance();
}

void Parser::advance() {
    current_ = tokenizer_.next();
}

bool Parser::check(TokenType type) const {
    return current_.type == type;
}

bool Parser::match(TokenType type) {
    if (check(type)) {
        advance();
        return true;
    }
    return false;
}

void Parser::expect(TokenType type, const std::string& message) {
    if (!match(type)) {
        error(message);
    }
}

void Parser::error(const std::string& message) {
    std::ostringstream oss;
    oss << "line " << current_.line << ", column " << current_.column << ": " << message;
    if (!current_.text.empty()) {
        oss << " (got '" << current_.text << "')";
    }
    errors_.push_back(oss.str());
}

Tenscript Parser::parse() {
    Tenscript script;

    // Optional 'name':
    if (check(TokenType::Name)) {
        script.name = current_.text;
        advance();
        expect(TokenType::Colon, "Expected ':' after name");
    }

    auto spin = parse_spin();
    if (spin) {
        script.spin = *spin;
    } else {
        error("Expected spin L, R, LR or RL");
    }

    if (check(TokenType::Number)) {
        if (*current_.number < 3) {
            error("A twist needs at least 3 pushes");
        } else {
            script.pushes_per_twist = *current_.number;
        }
        advance();
    }

    expect(TokenType::LParen, "Expected '(' to open the tree");
    script.tree = parse_body();
    expect(TokenType::RParen, "Expected ')' to close the tree");

    while (match(TokenType::Colon)) {
        parse_markdef(script);
    }

    if (!check(TokenType::EndOfFile)) {
        error("Unexpected input after tenscript");
    }
    return script;
}

std::optional<Spin> Parser::parse_spin() {
    if (!check(TokenType::Word)) {
        return std::nullopt;
    }
    std::optional<Spin> spin;
    if (current_.text == "L") {
        spin = Spin::Left;
    } else if (current_.text == "R") {
        spin = Spin::Right;
    } else if (current_.text == "LR") {
        spin = Spin::LeftRight;
    } else if (current_.text == "RL") {
        spin = Spin::RightLeft;
    }
    if (spin) {
        advance();
    }
    return spin;
}

TreeNode Parser::parse_body() {
    TreeNode node;
    if (check(TokenType::RParen)) {
        return node;
    }
    while (!check(TokenType::EndOfFile)) {
        parse_item(node);
        if (!match(TokenType::Comma)) {
            break;
        }
    }
    return node;
}

std::optional<FaceName> Parser::parse_face_letter(std::string_view letter) {
    if (letter.size() != 1) {
        return std::nullopt;
    }
    return face_name_from_char(letter[0]);
}

void Parser::parse_item(TreeNode& node) {
    if (check(TokenType::Number)) {
        node.forward = static_cast<int>(*current_.number);
        advance();
        return;
    }
    if (!check(TokenType::Word)) {
        error("Expected tree item");
        // Skip it unless it closes the body
        if (!check(TokenType::RParen) && !check(TokenType::EndOfFile)) {
            advance();
        }
        return;
    }

    const std::string word = current_.text;
    if (word == "S") {
        advance();
        if (check(TokenType::Number)) {
            node.scale = Percent{static_cast<float>(*current_.number)};
            advance();
        } else {
            error("Expected scale percent after 'S'");
        }
        return;
    }
    if (word == "X") {
        advance();
        node.omni = true;
        return;
    }
    if (word[0] == 'M') {
        parse_mark_item(node);
        return;
    }

    auto face = parse_face_letter(word);
    if (!face) {
        error("Unknown tree item");
        advance();
        return;
    }
    advance();
    expect(TokenType::LParen, "Expected '(' after face name");
    Subtree subtree;
    subtree.face = *face;
    subtree.tree = parse_body();
    expect(TokenType::RParen, "Expected ')' to close subtree");
    node.subtrees.push_back(std::move(subtree));
}

// "Mb2" and "M b 2" both mark face b with 2
void Parser::parse_mark_item(TreeNode& node) {
    std::string letters = current_.text.substr(1);
    advance();
    if (letters.empty() && check(TokenType::Word)) {
        letters = current_.text;
        advance();
    }
    auto face = parse_face_letter(letters);
    if (!face) {
        error("Expected face name after 'M'");
        return;
    }
    if (check(TokenType::Number)) {
        node.marks[*face] = static_cast<int>(*current_.number);
        advance();
    } else {
        error("Expected mark number");
    }
}

void Parser::parse_markdef(Tenscript& script) {
    if (!check(TokenType::Number)) {
        error("Expected mark number");
        return;
    }
    int number = static_cast<int>(*current_.number);
    advance();
    expect(TokenType::Equals, "Expected '=' after mark number");

    if (!check(TokenType::Word)) {
        error("Expected mark action");
        return;
    }
    Mark mark;
    const std::string action = current_.text;
    if (action == "join") {
        mark.action = MarkAction::JoinFaces;
    } else if (action == "distance") {
        mark.action = MarkAction::FaceDistance;
    } else if (action == "base") {
        mark.action = MarkAction::BaseFace;
    } else if (action == "subtree") {
        mark.action = MarkAction::Subtree;
    } else if (action == "anchor") {
        mark.action = MarkAction::Anchor;
    } else {
        error("Unknown mark action");
        advance();
        return;
    }
    advance();

    if (mark.action == MarkAction::FaceDistance && match(TokenType::Minus)) {
        if (check(TokenType::Number)) {
            mark.scale = Percent{static_cast<float>(*current_.number)};
            advance();
        } else {
            error("Expected distance percent after '-'");
        }
    }
    script.marks[number] = mark;
}

Tenscript parse_tenscript(std::string_view source) {
    Parser parser{Tokenizer(source)};
    Tenscript script = parser.parse();
    if (parser.has_errors()) {
        std::ostringstream oss;
        oss << "Tenscript has " << parser.errors().size() << " error(s)";
        for (const auto& message : parser.errors()) {
            oss << "\n  " << message;
        }
        throw std::runtime_error(oss.str());
    }
    return script;
}

}  // namespace tenscript
}  // namespace pretenst
