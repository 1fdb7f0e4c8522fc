#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlir/parser.h — Recursive-descent GraphQL parsers
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    auto document = parseDocument(R"(
//        query HeroName($episode: Episode) {
//            hero(episode: $episode) { name }
//        }
//    )", "queries/hero.graphql");
//
//  Commas, whitespace, line terminators, a leading BOM and `#`
//  comments are ignored tokens. Errors are GraphQLError with the
//  line and column of the offending character.
//
//  Selection sets, list and object values and list types may nest at
//  most `maxDepth` levels; deeper input is a syntax error.
//
// ═══════════════════════════════════════════════════════════════════

#include "ast.h"
#include "errors.h"
#include "options.h"
#include "schema.h"
#include "type_ref.h"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gqlir {

namespace detail {

// ═══════════════════════════════════════════
//  SourceReader — character-level scanning and the lexical
//  productions shared by the document and SDL parsers
// ═══════════════════════════════════════════
class SourceReader {
public:
    explicit SourceReader(std::string_view source,
                          std::size_t maxDepth = kDefaultMaxSelectionDepth)
        : source_(source), pos_(0), maxDepth_(maxDepth) {}

protected:
    std::string_view source_;
    std::size_t pos_;
    std::size_t maxDepth_;
    std::size_t depth_ = 0;

    // Held while parsing one nested construct
    class NestingGuard {
    public:
        explicit NestingGuard(SourceReader& reader) : reader_(reader) {
            if (reader_.depth_ >= reader_.maxDepth_) {
                reader_.fail("Nesting exceeds " + std::to_string(reader_.maxDepth_) + " levels");
            }
            reader_.depth_++;
        }
        ~NestingGuard() { reader_.depth_--; }

        NestingGuard(const NestingGuard&) = delete;
        NestingGuard& operator=(const NestingGuard&) = delete;

    private:
        SourceReader& reader_;
    };

    char peek(std::size_t ahead = 0) const {
        return pos_ + ahead < source_.size() ? source_[pos_ + ahead] : '\0';
    }

    char advance() {
        return pos_ < source_.size() ? source_[pos_++] : '\0';
    }

    bool atEnd() {
        skipIgnored();
        return pos_ >= source_.size();
    }

    void skipIgnored();
    void expect(char c);
    bool consumeIf(char c);
    // "..." after ignored tokens
    bool consumeSpread();
    bool peekKeyword(std::string_view keyword);
    void expectKeyword(std::string_view keyword);

    std::string parseName();
    std::string parseStringLiteral();
    ast::Value parseValue(bool isConst);
    TypeRef parseTypeRef();
    std::vector<ast::Argument> parseArguments(bool isConst);
    std::vector<ast::Directive> parseDirectives(bool isConst);

    SourceLocation location() const { return locationAt(pos_); }
    SourceLocation locationAt(std::size_t offset) const;
    [[noreturn]] void fail(const std::string& message) const;
    [[noreturn]] void unexpected() const;

    static bool isNameStart(char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
    }
    static bool isNameContinue(char c) {
        return isNameStart(c) || (c >= '0' && c <= '9');
    }

private:
    std::string parseQuotedString();
    std::string parseBlockString();
    ast::Value parseNumber();
};

// ═══════════════════════════════════════════
//  DocumentParser — operations and fragments
// ═══════════════════════════════════════════
class DocumentParser : public SourceReader {
public:
    explicit DocumentParser(std::string_view source,
                            std::optional<std::string> filePath = std::nullopt,
                            std::size_t maxDepth = kDefaultMaxSelectionDepth)
        : SourceReader(source, maxDepth), filePath_(std::move(filePath)) {}

    ast::Document parse();

private:
    std::optional<std::string> filePath_;

    ast::OperationDefinition parseOperation();
    ast::FragmentDefinition parseFragment();
    std::vector<ast::VariableDefinition> parseVariableDefinitions();
    std::vector<ast::Selection> parseSelectionSet();
    ast::Selection parseSelection();
    ast::Selection parseField();
};

// ═══════════════════════════════════════════
//  SchemaParser — type-system definitions
// ═══════════════════════════════════════════
class SchemaParser : public SourceReader {
public:
    explicit SchemaParser(std::string_view source) : SourceReader(source) {}

    // Fills `schema`; the caller validates it afterwards.
    void parseInto(Schema& schema);

private:
    std::optional<std::string> parseDescription();
    void parseSchemaDefinition(Schema& schema);
    void skipDirectiveDefinition();
    NamedType parseObjectLike(TypeKind kind);
    NamedType parseUnion();
    NamedType parseEnum();
    NamedType parseInputObject();
    FieldDefinition parseFieldDefinition();
    InputValueDefinition parseInputValueDefinition();
    std::vector<InputValueDefinition> parseArgumentDefinitions();
    std::vector<std::string> parseImplementsInterfaces();

    static void applyDeprecation(const std::vector<ast::Directive>& directives,
                                 bool& isDeprecated,
                                 std::optional<std::string>& reason);
};

} // namespace detail

ast::Document parseDocument(std::string_view source,
                            std::optional<std::string> filePath = std::nullopt,
                            std::size_t maxDepth = kDefaultMaxSelectionDepth);

} // namespace gqlir
