// ═══════════════════════════════════════════════════════════════════
//  src/parser.cpp — Lexical scanning and executable-document parsing
// ═══════════════════════════════════════════════════════════════════

#include "gqlir/parser.h"

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

namespace gqlir {

namespace detail {

namespace {

void appendUtf8(std::string& out, std::uint32_t cp) {
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

int hexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool isBlank(const std::string& line) {
    return std::all_of(line.begin(), line.end(), [](char c) { return c == ' ' || c == '\t'; });
}

// Common-indentation removal for """block strings"""
std::string dedentBlockString(const std::string& raw) {
    std::vector<std::string> lines;
    std::string current;
    for (std::size_t i = 0; i < raw.size(); i++) {
        char c = raw[i];
        if (c == '\r' || c == '\n') {
            lines.push_back(current);
            current.clear();
            if (c == '\r' && i + 1 < raw.size() && raw[i + 1] == '\n') i++;
        } else {
            current += c;
        }
    }
    lines.push_back(current);

    std::size_t commonIndent = std::string::npos;
    for (std::size_t i = 1; i < lines.size(); i++) {
        auto& line = lines[i];
        std::size_t indent = 0;
        while (indent < line.size() && (line[indent] == ' ' || line[indent] == '\t')) indent++;
        if (indent < line.size() && indent < commonIndent) commonIndent = indent;
    }
    if (commonIndent != std::string::npos) {
        for (std::size_t i = 1; i < lines.size(); i++) {
            lines[i].erase(0, std::min(commonIndent, lines[i].size()));
        }
    }

    while (!lines.empty() && isBlank(lines.front())) lines.erase(lines.begin());
    while (!lines.empty() && isBlank(lines.back())) lines.pop_back();

    std::string result;
    for (std::size_t i = 0; i < lines.size(); i++) {
        if (i > 0) result += '\n';
        result += lines[i];
    }
    return result;
}

} // namespace

// ═══════════════════════════════════════════
//  SourceReader
// ═══════════════════════════════════════════

void SourceReader::skipIgnored() {
    while (pos_ < source_.size()) {
        char c = source_[pos_];
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == ',') {
            pos_++;
        } else if (c == '#') {
            while (pos_ < source_.size() && source_[pos_] != '\n' && source_[pos_] != '\r') pos_++;
        } else if (source_.compare(pos_, 3, "\xEF\xBB\xBF") == 0) {
            pos_ += 3;
        } else {
            break;
        }
    }
}

SourceLocation SourceReader::locationAt(std::size_t offset) const {
    SourceLocation loc;
    std::size_t lineStart = 0;
    for (std::size_t i = 0; i < offset && i < source_.size(); i++) {
        char c = source_[i];
        if (c == '\n' || (c == '\r' && (i + 1 >= source_.size() || source_[i + 1] != '\n'))) {
            loc.line++;
            lineStart = i + 1;
        }
    }
    loc.column = offset - lineStart + 1;
    return loc;
}

void SourceReader::fail(const std::string& message) const {
    throw GraphQLError("Syntax Error: " + message, location());
}

void SourceReader::unexpected() const {
    if (pos_ >= source_.size()) fail("Unexpected <EOF>");
    fail(std::string("Unexpected character '") + source_[pos_] + "'");
}

void SourceReader::expect(char c) {
    skipIgnored();
    if (peek() != c) {
        if (pos_ >= source_.size()) {
            fail(std::string("Expected '") + c + "', found <EOF>");
        }
        fail(std::string("Expected '") + c + "', found '" + peek() + "'");
    }
    advance();
}

bool SourceReader::consumeIf(char c) {
    skipIgnored();
    if (peek() != c) return false;
    advance();
    return true;
}

bool SourceReader::consumeSpread() {
    skipIgnored();
    if (peek() == '.' && peek(1) == '.' && peek(2) == '.') {
        pos_ += 3;
        return true;
    }
    return false;
}

bool SourceReader::peekKeyword(std::string_view keyword) {
    skipIgnored();
    return source_.compare(pos_, keyword.size(), keyword) == 0 &&
           !isNameContinue(peek(keyword.size()));
}

void SourceReader::expectKeyword(std::string_view keyword) {
    if (!peekKeyword(keyword)) {
        fail("Expected \"" + std::string(keyword) + "\"");
    }
    pos_ += keyword.size();
}

std::string SourceReader::parseName() {
    skipIgnored();
    if (!isNameStart(peek())) {
        if (pos_ >= source_.size()) fail("Expected Name, found <EOF>");
        fail(std::string("Expected Name, found '") + peek() + "'");
    }
    std::size_t start = pos_;
    while (pos_ < source_.size() && isNameContinue(source_[pos_])) pos_++;
    return std::string(source_.substr(start, pos_ - start));
}

std::string SourceReader::parseStringLiteral() {
    skipIgnored();
    if (peek() == '"' && peek(1) == '"' && peek(2) == '"') return parseBlockString();
    if (peek() == '"') return parseQuotedString();
    fail("Expected String");
}

std::string SourceReader::parseQuotedString() {
    advance(); // opening quote
    std::string result;
    while (true) {
        if (pos_ >= source_.size() || peek() == '\n' || peek() == '\r') {
            fail("Unterminated string");
        }
        char c = advance();
        if (c == '"') break;
        if (c != '\\') {
            result += c;
            continue;
        }
        char esc = advance();
        switch (esc) {
            case '"': result += '"'; break;
            case '\\': result += '\\'; break;
            case '/': result += '/'; break;
            case 'b': result += '\b'; break;
            case 'f': result += '\f'; break;
            case 'n': result += '\n'; break;
            case 'r': result += '\r'; break;
            case 't': result += '\t'; break;
            case 'u': {
                auto readCodeUnit = [this]() -> std::uint32_t {
                    std::uint32_t value = 0;
                    for (int i = 0; i < 4; i++) {
                        int digit = hexDigit(peek());
                        if (digit < 0) fail("Invalid Unicode escape sequence");
                        value = (value << 4) | static_cast<std::uint32_t>(digit);
                        advance();
                    }
                    return value;
                };
                std::uint32_t cp = readCodeUnit();
                if (cp >= 0xD800 && cp <= 0xDBFF && peek() == '\\' && peek(1) == 'u') {
                    pos_ += 2;
                    std::uint32_t low = readCodeUnit();
                    if (low < 0xDC00 || low > 0xDFFF) fail("Invalid Unicode escape sequence");
                    cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                }
                appendUtf8(result, cp);
                break;
            }
            default:
                fail(std::string("Invalid character escape sequence: \\") + esc);
        }
    }
    return result;
}

std::string SourceReader::parseBlockString() {
    pos_ += 3;
    std::string raw;
    while (true) {
        if (pos_ >= source_.size()) fail("Unterminated string");
        if (peek() == '"' && peek(1) == '"' && peek(2) == '"') {
            pos_ += 3;
            break;
        }
        if (peek() == '\\' && peek(1) == '"' && peek(2) == '"' && peek(3) == '"') {
            raw += "\"\"\"";
            pos_ += 4;
            continue;
        }
        raw += advance();
    }
    return dedentBlockString(raw);
}

ast::Value SourceReader::parseNumber() {
    std::size_t start = pos_;
    bool isFloat = false;
    auto digits = [this]() {
        if (!(peek() >= '0' && peek() <= '9')) {
            fail("Invalid number, expected digit");
        }
        while (peek() >= '0' && peek() <= '9') advance();
    };

    if (peek() == '-') advance();
    if (peek() == '0') {
        advance();
        if (peek() >= '0' && peek() <= '9') fail("Invalid number, unexpected digit after 0");
    } else {
        digits();
    }
    if (peek() == '.') {
        isFloat = true;
        advance();
        digits();
    }
    if (peek() == 'e' || peek() == 'E') {
        isFloat = true;
        advance();
        if (peek() == '+' || peek() == '-') advance();
        digits();
    }
    if (peek() == '.' || isNameStart(peek())) {
        fail("Invalid number");
    }

    ast::Value value;
    value.kind = isFloat ? ast::Value::Kind::Float : ast::Value::Kind::Int;
    value.text = std::string(source_.substr(start, pos_ - start));
    return value;
}

ast::Value SourceReader::parseValue(bool isConst) {
    skipIgnored();
    char c = peek();

    if (c == '$') {
        if (isConst) fail("Unexpected variable in constant value");
        advance();
        return ast::Value::variable(parseName());
    }
    if (c == '[') {
        NestingGuard guard(*this);
        advance();
        ast::Value list;
        list.kind = ast::Value::Kind::List;
        while (!consumeIf(']')) {
            if (atEnd()) fail("Expected ']', found <EOF>");
            list.values.push_back(parseValue(isConst));
        }
        return list;
    }
    if (c == '{') {
        NestingGuard guard(*this);
        advance();
        ast::Value object;
        object.kind = ast::Value::Kind::Object;
        while (!consumeIf('}')) {
            auto name = parseName();
            expect(':');
            object.fields.emplace_back(std::move(name), parseValue(isConst));
        }
        return object;
    }
    if (c == '"') {
        return ast::Value::string(parseStringLiteral());
    }
    if (c == '-' || (c >= '0' && c <= '9')) {
        return parseNumber();
    }
    if (isNameStart(c)) {
        auto name = parseName();
        if (name == "true" || name == "false") return ast::Value::boolValue(name == "true");
        if (name == "null") return ast::Value{};
        return ast::Value::enumValue(std::move(name));
    }
    unexpected();
}

TypeRef SourceReader::parseTypeRef() {
    TypeRef type;
    if (consumeIf('[')) {
        NestingGuard guard(*this);
        auto inner = parseTypeRef();
        expect(']');
        type = inner.listOf();
    } else {
        type = TypeRef(parseName());
    }
    if (consumeIf('!')) type = type.nonNull();
    return type;
}

std::vector<ast::Argument> SourceReader::parseArguments(bool isConst) {
    std::vector<ast::Argument> args;
    if (!consumeIf('(')) return args;
    do {
        ast::Argument arg;
        arg.name = parseName();
        expect(':');
        arg.value = parseValue(isConst);
        args.push_back(std::move(arg));
    } while (!consumeIf(')'));
    return args;
}

std::vector<ast::Directive> SourceReader::parseDirectives(bool isConst) {
    std::vector<ast::Directive> directives;
    while (true) {
        skipIgnored();
        if (peek() != '@') break;
        ast::Directive directive;
        directive.location = location();
        advance();
        directive.name = parseName();
        directive.arguments = parseArguments(isConst);
        directives.push_back(std::move(directive));
    }
    return directives;
}

// ═══════════════════════════════════════════
//  DocumentParser
// ═══════════════════════════════════════════

ast::Document DocumentParser::parse() {
    ast::Document document;
    if (atEnd()) fail("Unexpected <EOF>");

    while (!atEnd()) {
        if (peek() == '{' || peekKeyword("query") || peekKeyword("mutation") ||
            peekKeyword("subscription")) {
            document.operations.push_back(parseOperation());
            document.definitionOrder.push_back(ast::Document::DefinitionKind::Operation);
        } else if (peekKeyword("fragment")) {
            document.fragments.push_back(parseFragment());
            document.definitionOrder.push_back(ast::Document::DefinitionKind::Fragment);
        } else if (isNameStart(peek())) {
            auto start = pos_;
            auto name = parseName();
            pos_ = start;
            fail("Unexpected Name \"" + name + "\"");
        } else {
            unexpected();
        }
    }
    return document;
}

ast::OperationDefinition DocumentParser::parseOperation() {
    ast::OperationDefinition operation;
    skipIgnored();
    operation.location = location();
    operation.filePath = filePath_;

    if (peek() == '{') {
        operation.operation = OperationType::Query;
        operation.selectionSet = parseSelectionSet();
        return operation;
    }

    auto keyword = parseName();
    if (keyword == "query") {
        operation.operation = OperationType::Query;
    } else if (keyword == "mutation") {
        operation.operation = OperationType::Mutation;
    } else {
        operation.operation = OperationType::Subscription;
    }

    skipIgnored();
    if (isNameStart(peek())) {
        operation.name = parseName();
        skipIgnored();
    }
    if (peek() == '(') {
        operation.variables = parseVariableDefinitions();
    }
    operation.directives = parseDirectives(false);
    operation.selectionSet = parseSelectionSet();
    return operation;
}

std::vector<ast::VariableDefinition> DocumentParser::parseVariableDefinitions() {
    std::vector<ast::VariableDefinition> variables;
    expect('(');
    do {
        ast::VariableDefinition variable;
        expect('$');
        variable.name = parseName();
        expect(':');
        variable.type = parseTypeRef();
        if (consumeIf('=')) {
            variable.defaultValue = parseValue(true);
        }
        parseDirectives(true);
        variables.push_back(std::move(variable));
    } while (!consumeIf(')'));
    return variables;
}

ast::FragmentDefinition DocumentParser::parseFragment() {
    ast::FragmentDefinition fragment;
    skipIgnored();
    fragment.location = location();
    fragment.filePath = filePath_;

    expectKeyword("fragment");
    if (peekKeyword("on")) fail("Unexpected Name \"on\"");
    fragment.name = parseName();
    expectKeyword("on");
    fragment.typeCondition = parseName();
    fragment.directives = parseDirectives(false);
    fragment.selectionSet = parseSelectionSet();
    return fragment;
}

std::vector<ast::Selection> DocumentParser::parseSelectionSet() {
    NestingGuard guard(*this);
    expect('{');
    std::vector<ast::Selection> selections;
    do {
        if (atEnd()) fail("Expected '}', found <EOF>");
        selections.push_back(parseSelection());
    } while (!consumeIf('}'));
    return selections;
}

ast::Selection DocumentParser::parseSelection() {
    skipIgnored();
    auto loc = location();
    if (!consumeSpread()) return parseField();

    ast::Selection selection;
    selection.location = loc;
    if (peekKeyword("on")) {
        expectKeyword("on");
        selection.kind = ast::Selection::Kind::InlineFragment;
        selection.typeCondition = parseName();
    } else if (isNameStart(peek())) {
        selection.kind = ast::Selection::Kind::FragmentSpread;
        selection.name = parseName();
        selection.directives = parseDirectives(false);
        return selection;
    } else {
        selection.kind = ast::Selection::Kind::InlineFragment;
    }
    selection.directives = parseDirectives(false);
    selection.selectionSet = parseSelectionSet();
    return selection;
}

ast::Selection DocumentParser::parseField() {
    ast::Selection field;
    field.kind = ast::Selection::Kind::Field;
    skipIgnored();
    field.location = location();

    auto nameOrAlias = parseName();
    if (consumeIf(':')) {
        field.alias = nameOrAlias;
        field.name = parseName();
    } else {
        field.name = nameOrAlias;
    }

    field.arguments = parseArguments(false);
    field.directives = parseDirectives(false);

    skipIgnored();
    if (peek() == '{') {
        field.selectionSet = parseSelectionSet();
    }
    return field;
}

} // namespace detail

ast::Document parseDocument(std::string_view source, std::optional<std::string> filePath,
                            std::size_t maxDepth) {
    detail::DocumentParser parser(source, std::move(filePath), maxDepth);
    return parser.parse();
}

} // namespace gqlir
