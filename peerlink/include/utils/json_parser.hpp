#ifndef JSON_PARSER_HPP
#define JSON_PARSER_HPP

#include <string>
#include <map>

namespace peerlink {

/**
 * Minimal JSON support for flat objects.
 *
 * String values are unescaped, literals (numbers, true, false, null) are kept
 * as their text, nested objects and arrays are kept as raw JSON text.
 */
class JsonParser {
public:
    /**
     * Parse a single JSON object.
     * Throws std::invalid_argument when the input is not a well-formed object.
     */
    static std::map<std::string, std::string> parse(const std::string& json);

    /**
     * Serialize all values as JSON strings.
     */
    static std::string stringify(const std::map<std::string, std::string>& data);

    static std::string escapeJson(const std::string& str);
    static std::string unescapeJson(const std::string& str);
};

} // namespace peerlink

#endif // JSON_PARSER_HPP
