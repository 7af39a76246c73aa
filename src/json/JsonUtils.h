#pragma once

#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace json
{
struct JsonValue
{
    enum class Type
    {
        Null,
        Number,
        String,
        Object,
        Array,
        Bool
    };

    Type type = Type::Null;
    double number = 0.0;
    bool boolean = false;
    std::string string;
    std::unordered_map<std::string, JsonValue> object;
    std::vector<JsonValue> array;
};

/// Recursive-descent reader for config files, the client store and wire payloads.
/// Rejects trailing content and nesting deeper than kMaxDepth.
class JsonParser
{
  public:
    static constexpr int kMaxDepth = 64;

    explicit JsonParser(const std::string &text) : m_text(text) {}

    std::optional<JsonValue> parse()
    {
        JsonValue root;
        if (!readValue(root))
        {
            return std::nullopt;
        }
        skipSpace();
        if (m_pos != m_text.size())
        {
            return std::nullopt;
        }
        return root;
    }

    /// Offset of the first character the parser could not accept.
    std::size_t position() const { return m_pos; }

  private:
    bool atEnd() const { return m_pos >= m_text.size(); }
    char peek() const { return atEnd() ? '\0' : m_text[m_pos]; }

    void skipSpace()
    {
        while (!atEnd() && (peek() == ' ' || peek() == '\t' || peek() == '\n' || peek() == '\r'))
        {
            ++m_pos;
        }
    }

    bool consume(char expected)
    {
        skipSpace();
        if (peek() != expected)
        {
            return false;
        }
        ++m_pos;
        return true;
    }

    bool literal(const char *word, std::size_t length)
    {
        if (m_text.compare(m_pos, length, word) != 0)
        {
            return false;
        }
        m_pos += length;
        return true;
    }

    bool readValue(JsonValue &out)
    {
        skipSpace();
        switch (peek())
        {
        case '{':
            return readContainer(out, JsonValue::Type::Object);
        case '[':
            return readContainer(out, JsonValue::Type::Array);
        case '"':
            out.type = JsonValue::Type::String;
            return readString(out.string);
        case 't':
            out.type = JsonValue::Type::Bool;
            out.boolean = true;
            return literal("true", 4);
        case 'f':
            out.type = JsonValue::Type::Bool;
            out.boolean = false;
            return literal("false", 5);
        case 'n':
            out.type = JsonValue::Type::Null;
            return literal("null", 4);
        default:
            return readNumber(out);
        }
    }

    bool readContainer(JsonValue &out, JsonValue::Type type)
    {
        if (++m_depth > kMaxDepth)
        {
            return false;
        }
        const bool isObject = type == JsonValue::Type::Object;
        const char close = isObject ? '}' : ']';
        out.type = type;
        ++m_pos;
        if (consume(close))
        {
            --m_depth;
            return true;
        }
        do
        {
            JsonValue element;
            if (isObject)
            {
                std::string key;
                skipSpace();
                if (peek() != '"' || !readString(key) || !consume(':') || !readValue(element))
                {
                    return false;
                }
                // Later duplicates win.
                out.object[std::move(key)] = std::move(element);
            }
            else
            {
                if (!readValue(element))
                {
                    return false;
                }
                out.array.push_back(std::move(element));
            }
        } while (consume(','));

        if (!consume(close))
        {
            return false;
        }
        --m_depth;
        return true;
    }

    bool readDigits()
    {
        const std::size_t first = m_pos;
        while (!atEnd() && std::isdigit(static_cast<unsigned char>(peek())))
        {
            ++m_pos;
        }
        return m_pos > first;
    }

    bool readNumber(JsonValue &out)
    {
        const std::size_t first = m_pos;
        if (peek() == '-')
        {
            ++m_pos;
        }
        if (!readDigits())
        {
            return false;
        }
        if (peek() == '.')
        {
            ++m_pos;
            if (!readDigits())
            {
                return false;
            }
        }
        if (peek() == 'e' || peek() == 'E')
        {
            ++m_pos;
            if (peek() == '+' || peek() == '-')
            {
                ++m_pos;
            }
            if (!readDigits())
            {
                return false;
            }
        }
        const std::string token = m_text.substr(first, m_pos - first);
        char *parsedEnd = nullptr;
        const double value = std::strtod(token.c_str(), &parsedEnd);
        if (parsedEnd != token.c_str() + token.size() || !std::isfinite(value))
        {
            return false;
        }
        out.type = JsonValue::Type::Number;
        out.number = value;
        return true;
    }

    bool readHex4(std::uint32_t &code)
    {
        if (m_pos + 4 > m_text.size())
        {
            return false;
        }
        code = 0;
        for (int i = 0; i < 4; ++i)
        {
            const char c = m_text[m_pos++];
            code <<= 4;
            if (c >= '0' && c <= '9')
            {
                code |= static_cast<std::uint32_t>(c - '0');
            }
            else if (c >= 'a' && c <= 'f')
            {
                code |= static_cast<std::uint32_t>(c - 'a' + 10);
            }
            else if (c >= 'A' && c <= 'F')
            {
                code |= static_cast<std::uint32_t>(c - 'A' + 10);
            }
            else
            {
                return false;
            }
        }
        return true;
    }

    static void appendUtf8(std::string &out, std::uint32_t code)
    {
        if (code < 0x80)
        {
            out.push_back(static_cast<char>(code));
        }
        else if (code < 0x800)
        {
            out.push_back(static_cast<char>(0xC0 | (code >> 6)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        }
        else if (code < 0x10000)
        {
            out.push_back(static_cast<char>(0xE0 | (code >> 12)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        }
        else
        {
            out.push_back(static_cast<char>(0xF0 | (code >> 18)));
            out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        }
    }

    bool readEscape(std::string &out)
    {
        const char c = m_text[m_pos++];
        switch (c)
        {
        case '"':
        case '\\':
        case '/':
            out.push_back(c);
            return true;
        case 'b': out.push_back('\b'); return true;
        case 'f': out.push_back('\f'); return true;
        case 'n': out.push_back('\n'); return true;
        case 'r': out.push_back('\r'); return true;
        case 't': out.push_back('\t'); return true;
        case 'u':
            break;
        default:
            return false;
        }

        std::uint32_t code = 0;
        if (!readHex4(code))
        {
            return false;
        }
        if (code >= 0xD800 && code <= 0xDBFF)
        {
            std::uint32_t low = 0;
            if (!literal("\\u", 2) || !readHex4(low) || low < 0xDC00 || low > 0xDFFF)
            {
                return false;
            }
            code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
        }
        else if (code >= 0xDC00 && code <= 0xDFFF)
        {
            return false;
        }
        appendUtf8(out, code);
        return true;
    }

    bool readString(std::string &out)
    {
        ++m_pos;
        while (!atEnd())
        {
            const char c = m_text[m_pos++];
            if (c == '"')
            {
                return true;
            }
            if (static_cast<unsigned char>(c) < 0x20)
            {
                return false;
            }
            if (c != '\\')
            {
                out.push_back(c);
            }
            else if (atEnd() || !readEscape(out))
            {
                return false;
            }
        }
        return false;
    }

    const std::string &m_text;
    std::size_t m_pos = 0;
    int m_depth = 0;
};

inline std::optional<JsonValue> parseJson(const std::string &text)
{
    return JsonParser(text).parse();
}

inline const JsonValue *getObjectField(const JsonValue &obj, const std::string &key)
{
    if (obj.type != JsonValue::Type::Object)
    {
        return nullptr;
    }
    auto it = obj.object.find(key);
    if (it == obj.object.end())
    {
        return nullptr;
    }
    return &it->second;
}

inline float getNumber(const JsonValue &obj, const std::string &key, float fallback)
{
    if (const JsonValue *value = getObjectField(obj, key))
    {
        if (value->type == JsonValue::Type::Number)
        {
            return static_cast<float>(value->number);
        }
    }
    return fallback;
}

inline int getInt(const JsonValue &obj, const std::string &key, int fallback)
{
    if (const JsonValue *value = getObjectField(obj, key))
    {
        if (value->type == JsonValue::Type::Number)
        {
            return static_cast<int>(value->number);
        }
    }
    return fallback;
}

inline bool getBool(const JsonValue &obj, const std::string &key, bool fallback)
{
    if (const JsonValue *value = getObjectField(obj, key))
    {
        if (value->type == JsonValue::Type::Bool)
        {
            return value->boolean;
        }
    }
    return fallback;
}

inline std::string getString(const JsonValue &obj, const std::string &key, std::string fallback)
{
    if (const JsonValue *value = getObjectField(obj, key))
    {
        if (value->type == JsonValue::Type::String)
        {
            return value->string;
        }
    }
    return fallback;
}

inline std::vector<std::string> getStringArray(const JsonValue &obj, const std::string &key)
{
    std::vector<std::string> result;
    if (const JsonValue *value = getObjectField(obj, key))
    {
        if (value->type == JsonValue::Type::Array)
        {
            for (const JsonValue &elem : value->array)
            {
                if (elem.type == JsonValue::Type::String)
                {
                    result.push_back(elem.string);
                }
            }
        }
        else if (value->type == JsonValue::Type::String)
        {
            result.push_back(value->string);
        }
    }
    return result;
}

inline double getDouble(const JsonValue &obj, const std::string &key, double fallback)
{
    if (const JsonValue *value = getObjectField(obj, key))
    {
        if (value->type == JsonValue::Type::Number)
        {
            return value->number;
        }
    }
    return fallback;
}

inline bool hasNumber(const JsonValue &obj, const std::string &key)
{
    const JsonValue *value = getObjectField(obj, key);
    return value && value->type == JsonValue::Type::Number;
}

inline JsonValue makeObject()
{
    JsonValue v;
    v.type = JsonValue::Type::Object;
    return v;
}

inline JsonValue makeArray()
{
    JsonValue v;
    v.type = JsonValue::Type::Array;
    return v;
}

inline JsonValue makeNumber(double number)
{
    JsonValue v;
    v.type = JsonValue::Type::Number;
    v.number = number;
    return v;
}

inline JsonValue makeString(std::string text)
{
    JsonValue v;
    v.type = JsonValue::Type::String;
    v.string = std::move(text);
    return v;
}

inline void setField(JsonValue &obj, const std::string &key, JsonValue value)
{
    if (obj.type != JsonValue::Type::Object)
    {
        obj = makeObject();
    }
    obj.object[key] = std::move(value);
}

inline void escapeInto(std::string &out, const std::string &value)
{
    out.push_back('"');
    for (char ch : value)
    {
        switch (ch)
        {
        case '\\': out += "\\\\"; break;
        case '"': out += "\\\""; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        case '\b': out += "\\b"; break;
        case '\f': out += "\\f"; break;
        default:
            if (static_cast<unsigned char>(ch) < 0x20)
            {
                char buffer[8];
                std::snprintf(buffer, sizeof(buffer), "\\u%04X", static_cast<unsigned>(static_cast<unsigned char>(ch)));
                out += buffer;
            }
            else
            {
                out.push_back(ch);
            }
            break;
        }
    }
    out.push_back('"');
}

inline void serializeInto(std::string &out, const JsonValue &value)
{
    switch (value.type)
    {
    case JsonValue::Type::Null:
        out += "null";
        break;
    case JsonValue::Type::Bool:
        out += value.boolean ? "true" : "false";
        break;
    case JsonValue::Type::Number:
    {
        if (!std::isfinite(value.number))
        {
            out += "null";
            break;
        }
        char buffer[32];
        if (value.number == std::floor(value.number) && std::fabs(value.number) < 1e15)
        {
            std::snprintf(buffer, sizeof(buffer), "%.0f", value.number);
        }
        else
        {
            std::snprintf(buffer, sizeof(buffer), "%.17g", value.number);
        }
        out += buffer;
        break;
    }
    case JsonValue::Type::String:
        escapeInto(out, value.string);
        break;
    case JsonValue::Type::Array:
    {
        out.push_back('[');
        bool first = true;
        for (const auto &element : value.array)
        {
            if (!first)
            {
                out.push_back(',');
            }
            first = false;
            serializeInto(out, element);
        }
        out.push_back(']');
        break;
    }
    case JsonValue::Type::Object:
    {
        // Keys are written in sorted order.
        std::map<std::string, const JsonValue *> sorted;
        for (const auto &kv : value.object)
        {
            sorted.emplace(kv.first, &kv.second);
        }
        out.push_back('{');
        bool first = true;
        for (const auto &kv : sorted)
        {
            if (!first)
            {
                out.push_back(',');
            }
            first = false;
            escapeInto(out, kv.first);
            out.push_back(':');
            serializeInto(out, *kv.second);
        }
        out.push_back('}');
        break;
    }
    }
}

inline std::string serialize(const JsonValue &value)
{
    std::string out;
    serializeInto(out, value);
    return out;
}

} // namespace json
