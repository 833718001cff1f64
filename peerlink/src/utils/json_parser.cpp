#include "../../include/utils/json_parser.hpp"
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <cctype>
#include <cstdint>

namespace peerlink {

namespace {

bool hexToInt(char c, uint32_t& value) {
    if (c >= '0' && c <= '9') {
        value = static_cast<uint32_t>(c - '0');
        return true;
    }
    if (c >= 'a' && c <= 'f') {
        value = static_cast<uint32_t>(10 + (c - 'a'));
        return true;
    }
    if (c >= 'A' && c <= 'F') {
        value = static_cast<uint32_t>(10 + (c - 'A'));
        return true;
    }
    return false;
}

bool parseHex4(const std::string& input, size_t start, uint32_t& codepoint) {
    if (start + 4 > input.size()) {
        return false;
    }
    codepoint = 0;
    for (size_t i = 0; i < 4; i++) {
        uint32_t nibble = 0;
        if (!hexToInt(input[start + i], nibble)) {
            return false;
        }
        codepoint = (codepoint << 4) | nibble;
    }
    return true;
}

void appendUtf8(std::string& out, uint32_t codepoint) {
    if (codepoint <= 0x7F) {
        out += static_cast<char>(codepoint);
    } else if (codepoint <= 0x7FF) {
        out += static_cast<char>(0xC0 | (codepoint >> 6));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else if (codepoint <= 0xFFFF) {
        out += static_cast<char>(0xE0 | (codepoint >> 12));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else if (codepoint <= 0x10FFFF) {
        out += static_cast<char>(0xF0 | (codepoint >> 18));
        out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else {
        out += '?';
    }
}

// Decodes the escape sequence starting at input[pos] (a backslash) and
// advances pos past it. Returns false on a malformed sequence.
bool appendEscapedChar(const std::string& input, size_t& pos, std::string& out) {
    if (pos + 1 >= input.size()) {
        return false;
    }

    const char esc = input[pos + 1];
    switch (esc) {
        case '"': out += '"'; pos += 2; return true;
        case '\\': out += '\\'; pos += 2; return true;
        case '/': out += '/'; pos += 2; return true;
        case 'n': out += '\n'; pos += 2; return true;
        case 'r': out += '\r'; pos += 2; return true;
        case 't': out += '\t'; pos += 2; return true;
        case 'b': out += '\b'; pos += 2; return true;
        case 'f': out += '\f'; pos += 2; return true;
        case 'u': {
            uint32_t codepoint = 0;
            if (!parseHex4(input, pos + 2, codepoint)) {
                return false;
            }
            pos += 6;
            if (codepoint >= 0xD800 && codepoint <= 0xDBFF) {
                if (pos + 1 < input.size() && input[pos] == '\\' && input[pos + 1] == 'u') {
                    uint32_t low = 0;
                    if (parseHex4(input, pos + 2, low) && low >= 0xDC00 && low <= 0xDFFF) {
                        codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
                        pos += 6;
                    }
                }
            }
            appendUtf8(out, codepoint);
            return true;
        }
        default:
            return false;
    }
}

class FlatObjectReader {
public:
    explicit FlatObjectReader(const std::string& input) : input_(input), pos_(0) {}

    std::map<std::string, std::string> read() {
        std::map<std::string, std::string> result;

        skipWhitespace();
        expect('{');
        skipWhitespace();
        if (peek() == '}') {
            pos_++;
        } else {
            while (true) {
                skipWhitespace();
                std::string key = readString();
                skipWhitespace();
                expect(':');
                skipWhitespace();
                result[key] = readValue();
                skipWhitespace();

                const char c = next();
                if (c == ',') continue;
                if (c == '}') break;
                fail("expected ',' or '}'");
            }
        }

        skipWhitespace();
        if (pos_ != input_.size()) {
            fail("trailing characters after object");
        }
        return result;
    }

private:
    const std::string& input_;
    size_t pos_;

    [[noreturn]] void fail(const std::string& what) const {
        throw std::invalid_argument("Malformed JSON at offset " + std::to_string(pos_) + ": " + what);
    }

    char peek() const {
        return pos_ < input_.size() ? input_[pos_] : '\0';
    }

    char next() {
        if (pos_ >= input_.size()) {
            fail("unexpected end of input");
        }
        return input_[pos_++];
    }

    void expect(char c) {
        if (next() != c) {
            pos_--;
            fail(std::string("expected '") + c + "'");
        }
    }

    void skipWhitespace() {
        while (pos_ < input_.size() && std::isspace(static_cast<unsigned char>(input_[pos_]))) {
            pos_++;
        }
    }

    std::string readString() {
        expect('"');
        std::string out;
        while (true) {
            if (pos_ >= input_.size()) {
                fail("unterminated string");
            }
            const char c = input_[pos_];
            if (c == '"') {
                pos_++;
                return out;
            }
            if (c == '\\') {
                if (!appendEscapedChar(input_, pos_, out)) {
                    fail("invalid escape sequence");
                }
                continue;
            }
            if (static_cast<unsigned char>(c) < 0x20) {
                fail("control character in string");
            }
            out += c;
            pos_++;
        }
    }

    std::string readValue() {
        const char c = peek();
        if (c == '"') {
            return readString();
        }
        if (c == '{' || c == '[') {
            return readNested();
        }
        return readLiteral();
    }

    // Nested values are returned verbatim; only their bracket structure is checked.
    std::string readNested() {
        const size_t start = pos_;
        std::string closers;
        bool in_string = false;
        while (pos_ < input_.size()) {
            const char c = input_[pos_++];
            if (in_string) {
                if (c == '\\') {
                    pos_++;
                } else if (c == '"') {
                    in_string = false;
                }
                continue;
            }
            if (c == '"') {
                in_string = true;
            } else if (c == '{') {
                closers.push_back('}');
            } else if (c == '[') {
                closers.push_back(']');
            } else if (c == '}' || c == ']') {
                if (closers.empty() || closers.back() != c) {
                    fail("mismatched bracket");
                }
                closers.pop_back();
                if (closers.empty()) {
                    return input_.substr(start, pos_ - start);
                }
            }
        }
        fail("unterminated nested value");
    }

    std::string readLiteral() {
        const size_t start = pos_;
        while (pos_ < input_.size()) {
            const char c = input_[pos_];
            if (c == ',' || c == '}' || c == ']' || std::isspace(static_cast<unsigned char>(c))) {
                break;
            }
            pos_++;
        }
        std::string literal = input_.substr(start, pos_ - start);
        if (literal == "true" || literal == "false" || literal == "null") {
            return literal;
        }
        if (literal.empty() || !(literal[0] == '-' || std::isdigit(static_cast<unsigned char>(literal[0])))) {
            fail("invalid literal");
        }
        for (char c : literal) {
            if (!std::isdigit(static_cast<unsigned char>(c)) && c != '-' && c != '+' &&
                c != '.' && c != 'e' && c != 'E') {
                fail("invalid number");
            }
        }
        return literal;
    }
};

} // namespace

std::map<std::string, std::string> JsonParser::parse(const std::string& json) {
    FlatObjectReader reader(json);
    return reader.read();
}

std::string JsonParser::stringify(const std::map<std::string, std::string>& data) {
    std::ostringstream oss;
    oss << "{";

    bool first = true;
    for (const auto& pair : data) {
        if (!first) oss << ",";
        first = false;
        oss << "\"" << escapeJson(pair.first) << "\":\"" << escapeJson(pair.second) << "\"";
    }

    oss << "}";
    return oss.str();
}

std::string JsonParser::escapeJson(const std::string& str) {
    std::string result;
    result.reserve(str.size());
    for (char c : str) {
        switch (c) {
            case '"': result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    std::ostringstream oss;
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(static_cast<unsigned char>(c));
                    result += oss.str();
                } else {
                    result += c;
                }
                break;
        }
    }
    return result;
}

std::string JsonParser::unescapeJson(const std::string& str) {
    std::string result;
    for (size_t i = 0; i < str.length();) {
        if (str[i] == '\\') {
            if (!appendEscapedChar(str, i, result)) {
                result += str[i];
                i++;
            }
            continue;
        }
        result += str[i];
        i++;
    }
    return result;
}

} // namespace peerlink
