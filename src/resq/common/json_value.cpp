/**
 * @file json_value.cpp
 */
#include "resq/common/json_value.hpp"
#include "resq/common/errors.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace resq
{

// ============================================================================
// Construction helpers
// ============================================================================

JsonValue JsonValue::make_null()
{
    return JsonValue{};
}

JsonValue JsonValue::make_bool(bool value)
{
    JsonValue v;
    v.kind = Kind::Bool;
    v.bool_value = value;
    return v;
}

JsonValue JsonValue::make_number(double value)
{
    JsonValue v;
    v.kind = Kind::Number;
    v.number_value = value;
    return v;
}

JsonValue JsonValue::make_string(std::string value)
{
    JsonValue v;
    v.kind = Kind::String;
    v.string_value = std::move(value);
    return v;
}

JsonValue JsonValue::make_object()
{
    JsonValue v;
    v.kind = Kind::Object;
    return v;
}

JsonValue JsonValue::make_array()
{
    JsonValue v;
    v.kind = Kind::Array;
    return v;
}

// ============================================================================
// Typed access
// ============================================================================

namespace
{

const char* kind_name(JsonValue::Kind kind)
{
    switch (kind)
    {
    case JsonValue::Kind::Null:
        return "null";
    case JsonValue::Kind::Bool:
        return "bool";
    case JsonValue::Kind::Number:
        return "number";
    case JsonValue::Kind::String:
        return "string";
    case JsonValue::Kind::Object:
        return "object";
    case JsonValue::Kind::Array:
        return "array";
    }
    return "unknown";
}

[[noreturn]] void throw_kind_mismatch(
    const std::string& context, const char* expected, JsonValue::Kind actual)
{
    throw ConfigError(
        context + ": expected " + expected + " but found " + kind_name(actual));
}

} // namespace

const JsonValue* JsonValue::find(const std::string& key) const
{
    if (kind != Kind::Object)
    {
        return nullptr;
    }
    auto it = object_values.find(key);
    return it == object_values.end() ? nullptr : &it->second;
}

const JsonValue& JsonValue::at(const std::string& key, const std::string& context) const
{
    if (kind != Kind::Object)
    {
        throw_kind_mismatch(context, "object", kind);
    }
    auto it = object_values.find(key);
    if (it == object_values.end())
    {
        throw ConfigError(context + ": missing required key '" + key + "'");
    }
    return it->second;
}

const std::string& JsonValue::as_string(const std::string& context) const
{
    if (kind != Kind::String)
    {
        throw_kind_mismatch(context, "string", kind);
    }
    return string_value;
}

double JsonValue::as_number(const std::string& context) const
{
    if (kind != Kind::Number)
    {
        throw_kind_mismatch(context, "number", kind);
    }
    return number_value;
}

int JsonValue::as_int(const std::string& context) const
{
    double value = as_number(context);
    if (std::floor(value) != value ||
        value < static_cast<double>(std::numeric_limits<int>::min()) ||
        value > static_cast<double>(std::numeric_limits<int>::max()))
    {
        throw ConfigError(context + ": expected an integer but found " + std::to_string(value));
    }
    return static_cast<int>(value);
}

bool JsonValue::as_bool(const std::string& context) const
{
    if (kind != Kind::Bool)
    {
        throw_kind_mismatch(context, "bool", kind);
    }
    return bool_value;
}

const std::vector<JsonValue>& JsonValue::as_array(const std::string& context) const
{
    if (kind != Kind::Array)
    {
        throw_kind_mismatch(context, "array", kind);
    }
    return array_values;
}

const std::map<std::string, JsonValue>& JsonValue::as_object(const std::string& context) const
{
    if (kind != Kind::Object)
    {
        throw_kind_mismatch(context, "object", kind);
    }
    return object_values;
}

void JsonValue::expect_only_keys(
    const std::set<std::string>& allowed, const std::string& context) const
{
    for (const auto& [key, value] : as_object(context))
    {
        if (allowed.count(key) == 0)
        {
            throw ConfigError(context + ": unknown key '" + key + "'");
        }
    }
}

JsonValue& JsonValue::set(const std::string& key, JsonValue value)
{
    if (kind == Kind::Null)
    {
        kind = Kind::Object;
    }
    object_values[key] = std::move(value);
    return object_values[key];
}

JsonValue& JsonValue::push_back(JsonValue value)
{
    if (kind == Kind::Null)
    {
        kind = Kind::Array;
    }
    array_values.push_back(std::move(value));
    return array_values.back();
}

// ============================================================================
// Parser
// ============================================================================

namespace
{

class JsonParser
{
public:
    explicit JsonParser(const std::string& text)
        : m_text(text)
    {
    }

    JsonValue parse_document()
    {
        JsonValue value = parse_value(0);
        skip_ws();
        if (m_pos != m_text.size())
        {
            fail("trailing characters after document");
        }
        return value;
    }

private:
    static constexpr size_t max_depth = 128;

    const std::string& m_text;
    size_t m_pos = 0;

    [[noreturn]] void fail(const std::string& what) const
    {
        throw ConfigError("JSON parse error at offset " + std::to_string(m_pos) + ": " + what);
    }

    void skip_ws()
    {
        while (m_pos < m_text.size() &&
               (m_text[m_pos] == ' ' || m_text[m_pos] == '\t' ||
                m_text[m_pos] == '\r' || m_text[m_pos] == '\n'))
        {
            ++m_pos;
        }
    }

    bool consume_literal(const char* literal)
    {
        std::string lit(literal);
        if (m_text.compare(m_pos, lit.size(), lit) == 0)
        {
            m_pos += lit.size();
            return true;
        }
        return false;
    }

    JsonValue parse_value(size_t depth)
    {
        if (depth > max_depth)
        {
            fail("nesting too deep");
        }
        skip_ws();
        if (m_pos >= m_text.size())
        {
            fail("unexpected end of input");
        }
        char c = m_text[m_pos];
        if (c == '"')
        {
            return JsonValue::make_string(parse_string());
        }
        if (c == '{')
        {
            return parse_object(depth);
        }
        if (c == '[')
        {
            return parse_array(depth);
        }
        if (c == '-' || (c >= '0' && c <= '9'))
        {
            return JsonValue::make_number(parse_number());
        }
        if (consume_literal("true"))
        {
            return JsonValue::make_bool(true);
        }
        if (consume_literal("false"))
        {
            return JsonValue::make_bool(false);
        }
        if (consume_literal("null"))
        {
            return JsonValue::make_null();
        }
        fail(std::string("unexpected character '") + c + "'");
    }

    static void append_utf8(std::string& out, unsigned int cp)
    {
        if (cp < 0x80)
        {
            out.push_back(static_cast<char>(cp));
        }
        else if (cp < 0x800)
        {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
        else if (cp < 0x10000)
        {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
        else
        {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }

    unsigned int parse_hex4()
    {
        if (m_pos + 4 > m_text.size())
        {
            fail("truncated unicode escape");
        }
        unsigned int cp = 0;
        for (int i = 0; i < 4; ++i)
        {
            char h = m_text[m_pos++];
            cp <<= 4;
            if (h >= '0' && h <= '9')
                cp |= static_cast<unsigned int>(h - '0');
            else if (h >= 'a' && h <= 'f')
                cp |= static_cast<unsigned int>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F')
                cp |= static_cast<unsigned int>(h - 'A' + 10);
            else
                fail("invalid hex digit in unicode escape");
        }
        return cp;
    }

    std::string parse_string()
    {
        ++m_pos; // opening quote
        std::string out;
        while (m_pos < m_text.size())
        {
            char c = m_text[m_pos++];
            if (c == '"')
            {
                return out;
            }
            if (c != '\\')
            {
                out.push_back(c);
                continue;
            }
            if (m_pos >= m_text.size())
            {
                break;
            }
            char esc = m_text[m_pos++];
            switch (esc)
            {
            case '"':
            case '\\':
            case '/':
                out.push_back(esc);
                break;
            case 'b':
                out.push_back('\b');
                break;
            case 'f':
                out.push_back('\f');
                break;
            case 'n':
                out.push_back('\n');
                break;
            case 'r':
                out.push_back('\r');
                break;
            case 't':
                out.push_back('\t');
                break;
            case 'u':
            {
                unsigned int cp = parse_hex4();
                if (cp >= 0xD800 && cp <= 0xDBFF && m_text.compare(m_pos, 2, "\\u") == 0)
                {
                    m_pos += 2;
                    unsigned int low = parse_hex4();
                    cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                }
                append_utf8(out, cp);
                break;
            }
            default:
                fail(std::string("invalid escape '\\") + esc + "'");
            }
        }
        fail("unterminated string");
    }

    double parse_number()
    {
        const char* begin = m_text.c_str() + m_pos;
        char* end = nullptr;
        double value = std::strtod(begin, &end);
        if (end == begin)
        {
            fail("malformed number");
        }
        m_pos += static_cast<size_t>(end - begin);
        return value;
    }

    JsonValue parse_array(size_t depth)
    {
        ++m_pos; // '['
        JsonValue out = JsonValue::make_array();
        skip_ws();
        if (m_pos < m_text.size() && m_text[m_pos] == ']')
        {
            ++m_pos;
            return out;
        }
        while (true)
        {
            out.array_values.push_back(parse_value(depth + 1));
            skip_ws();
            if (m_pos >= m_text.size())
            {
                fail("unterminated array");
            }
            char c = m_text[m_pos++];
            if (c == ']')
            {
                return out;
            }
            if (c != ',')
            {
                fail("expected ',' or ']' in array");
            }
        }
    }

    JsonValue parse_object(size_t depth)
    {
        ++m_pos; // '{'
        JsonValue out = JsonValue::make_object();
        skip_ws();
        if (m_pos < m_text.size() && m_text[m_pos] == '}')
        {
            ++m_pos;
            return out;
        }
        while (true)
        {
            skip_ws();
            if (m_pos >= m_text.size() || m_text[m_pos] != '"')
            {
                fail("expected string key in object");
            }
            std::string key = parse_string();
            skip_ws();
            if (m_pos >= m_text.size() || m_text[m_pos] != ':')
            {
                fail("expected ':' after object key");
            }
            ++m_pos;
            if (out.object_values.count(key) > 0)
            {
                fail("duplicate key '" + key + "'");
            }
            out.object_values.emplace(key, parse_value(depth + 1));
            skip_ws();
            if (m_pos >= m_text.size())
            {
                fail("unterminated object");
            }
            char c = m_text[m_pos++];
            if (c == '}')
            {
                return out;
            }
            if (c != ',')
            {
                fail("expected ',' or '}' in object");
            }
        }
    }
};

// ============================================================================
// Serializer
// ============================================================================

void write_escaped(const std::string& s, std::string& out)
{
    out += '"';
    for (char c : s)
    {
        switch (c)
        {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20)
            {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(c));
                out += buf;
            }
            else
            {
                out += c;
            }
        }
    }
    out += '"';
}

void write_number(double value, std::string& out)
{
    if (!std::isfinite(value))
    {
        out += "null";
        return;
    }
    if (std::floor(value) == value && std::fabs(value) < 1e15)
    {
        out += std::to_string(static_cast<long long>(value));
        return;
    }
    std::ostringstream oss;
    oss.precision(10);
    oss << value;
    out += oss.str();
}

void stringify(const JsonValue& v, std::string& out, int indent, int level)
{
    const bool pretty = indent > 0;
    auto newline = [&](int lvl) {
        if (pretty)
        {
            out += '\n';
            out.append(static_cast<size_t>(indent * lvl), ' ');
        }
    };

    switch (v.kind)
    {
    case JsonValue::Kind::Null:
        out += "null";
        break;
    case JsonValue::Kind::Bool:
        out += v.bool_value ? "true" : "false";
        break;
    case JsonValue::Kind::Number:
        write_number(v.number_value, out);
        break;
    case JsonValue::Kind::String:
        write_escaped(v.string_value, out);
        break;
    case JsonValue::Kind::Object:
    {
        out += '{';
        size_t count = 0;
        for (const auto& [key, member] : v.object_values)
        {
            if (count++ > 0)
            {
                out += ',';
            }
            newline(level + 1);
            write_escaped(key, out);
            out += pretty ? ": " : ":";
            stringify(member, out, indent, level + 1);
        }
        if (!v.object_values.empty())
        {
            newline(level);
        }
        out += '}';
        break;
    }
    case JsonValue::Kind::Array:
    {
        out += '[';
        for (size_t i = 0; i < v.array_values.size(); ++i)
        {
            if (i > 0)
            {
                out += ',';
            }
            newline(level + 1);
            stringify(v.array_values[i], out, indent, level + 1);
        }
        if (!v.array_values.empty())
        {
            newline(level);
        }
        out += ']';
        break;
    }
    }
}

} // namespace

JsonValue json_parse(const std::string& text)
{
    JsonParser parser(text);
    return parser.parse_document();
}

JsonValue json_parse_file(const std::string& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        throw ConfigError("Cannot open configuration file '" + path + "'");
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    try
    {
        return json_parse(buffer.str());
    }
    catch (const ConfigError& e)
    {
        throw ConfigError(path + ": " + e.what());
    }
}

std::string json_stringify(const JsonValue& value, int indent)
{
    std::string out;
    stringify(value, out, indent, 0);
    return out;
}

} // namespace resq
