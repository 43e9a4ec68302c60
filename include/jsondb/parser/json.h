// Copyright 2024 Robert A. Dunnagan
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
#pragma once

#include <jsondb/core/Object.h>
#include <jsondb/support/parse.h>
#include <jsondb/support/exception.h>

#include <charconv>
#include <cstdlib>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <optional>
#include <string>

namespace jsondb {
namespace json {

namespace impl {

constexpr unsigned max_depth = 512;

inline
bool is_digit(char c) { return c >= '0' && c <= '9'; }

inline
void append_utf8(std::string& str, uint32_t code_point) {
    if (code_point < 0x80) {
        str.push_back((char)code_point);
    } else if (code_point < 0x800) {
        str.push_back((char)(0xC0 | (code_point >> 6)));
        str.push_back((char)(0x80 | (code_point & 0x3F)));
    } else if (code_point < 0x10000) {
        str.push_back((char)(0xE0 | (code_point >> 12)));
        str.push_back((char)(0x80 | ((code_point >> 6) & 0x3F)));
        str.push_back((char)(0x80 | (code_point & 0x3F)));
    } else {
        str.push_back((char)(0xF0 | (code_point >> 18)));
        str.push_back((char)(0x80 | ((code_point >> 12) & 0x3F)));
        str.push_back((char)(0x80 | ((code_point >> 6) & 0x3F)));
        str.push_back((char)(0x80 | (code_point & 0x3F)));
    }
}

// RFC 8259 number grammar: -?(0|[1-9][0-9]*)(\.[0-9]+)?([eE][+-]?[0-9]+)?
inline
bool is_json_number(const std::string& str, bool& is_float) {
    size_t i = 0;
    size_t n = str.size();
    if (i < n && str[i] == '-') ++i;
    if (i >= n) return false;
    if (str[i] == '0') {
        ++i;
    } else if (is_digit(str[i])) {
        while (i < n && is_digit(str[i])) ++i;
    } else {
        return false;
    }
    if (i < n && str[i] == '.') {
        is_float = true;
        if (++i >= n || !is_digit(str[i])) return false;
        while (i < n && is_digit(str[i])) ++i;
    }
    if (i < n && (str[i] == 'e' || str[i] == 'E')) {
        is_float = true;
        ++i;
        if (i < n && (str[i] == '+' || str[i] == '-')) ++i;
        if (i >= n || !is_digit(str[i])) return false;
        while (i < n && is_digit(str[i])) ++i;
    }
    return i == n;
}

template <typename StreamType>
struct Parser
{
  public:
    Parser(const StreamType& stream) : m_it{stream} {}

    Parser(Parser&&) =  default;
    Parser(const Parser&) = delete;
    auto operator = (Parser&&) = delete;
    auto operator = (const Parser&) = delete;

    bool parse_document();
    bool parse_object();
    bool parse_number();
    bool parse_string();
    bool parse_string(std::string& str);
    bool parse_hex4(uint32_t& value);
    bool parse_map();
    bool parse_list();

    template <typename T>
    bool expect(const char* seq, T value);

    void consume_whitespace();

    bool create_error(const std::string& message);

    StreamType m_it;
    Object m_curr;
    std::string m_scratch;
    unsigned m_depth = 0;
    size_t m_error_offset = 0;
    std::string m_error_message;
};

/// Parses exactly one value, which may be surrounded by whitespace.
template <typename StreamType>
bool Parser<StreamType>::parse_document()
{
    consume_whitespace();
    if (m_it.done()) return create_error("No object in json stream");
    if (!parse_object()) return false;
    consume_whitespace();
    if (!m_it.done()) return create_error("Extra data after json value");
    return true;
}

template <typename StreamType>
bool Parser<StreamType>::parse_object()
{
    consume_whitespace();
    switch (m_it.peek())
    {
        case '-':
        case '0':
        case '1':
        case '2':
        case '3':
        case '4':
        case '5':
        case '6':
        case '7':
        case '8':
        case '9':
            return parse_number();

        case '"': return parse_string();

        case '[': return parse_list();
        case '{': return parse_map();

        case 't': return expect("true", true);
        case 'f': return expect("false", false);
        case 'n': return expect("null", nil);

        default:
            return create_error("Expected value");
    }
}

template <typename StreamType>
bool Parser<StreamType>::parse_number() {
    m_scratch.clear();

    for (; !m_it.done(); m_it.next()) {
        char c = m_it.peek();
        if (!is_digit(c) && c != '+' && c != '-' && c != '.' && c != 'e' && c != 'E') break;
        m_scratch.push_back(c);
    }

    bool is_float = false;
    if (!is_json_number(m_scratch, is_float))
        return create_error("Numeric syntax error");

    const char* str = m_scratch.data();
    const char* str_end = str + m_scratch.size();

    if (!is_float) {
        Int i_value;
        auto [end, ec] = std::from_chars(str, str_end, i_value);
        if (ec == std::errc()) {
            m_curr = i_value;
            return true;
        }

        if (m_scratch[0] != '-') {
            UInt u_value;
            auto [u_end, u_ec] = std::from_chars(str, str_end, u_value);
            if (u_ec == std::errc()) {
                m_curr = u_value;
                return true;
            }
        }
        // integers beyond 64 bits degrade to floating point
    }

    errno = 0;
    char* end = nullptr;
    Float f_value = strtod(str, &end);
    if (end != str_end)
        return create_error("Numeric syntax error");
    if (errno == ERANGE && std::isinf(f_value))
        return create_error(strerror(errno));
    errno = 0;

    m_curr = f_value;
    return true;
}

template <typename StreamType>
bool Parser<StreamType>::parse_hex4(uint32_t& value) {
    value = 0;
    for (int i=0; i<4; ++i, m_it.next()) {
        char c = m_it.peek();
        value <<= 4;
        if (c >= '0' && c <= '9')      value |= (uint32_t)(c - '0');
        else if (c >= 'a' && c <= 'f') value |= (uint32_t)(c - 'a' + 10);
        else if (c >= 'A' && c <= 'F') value |= (uint32_t)(c - 'A' + 10);
        else return create_error("Invalid unicode escape");
    }
    return true;
}

template <typename StreamType>
bool Parser<StreamType>::parse_string(std::string& str) {
    m_it.next();  // consume "
    while (!m_it.done()) {
        char c = m_it.peek();
        if (c == '"') {
            m_it.next();
            return true;
        }

        if ((unsigned char)c < 0x20)
            return create_error("Invalid control character in string");

        if (c != '\\') {
            str.push_back(c);
            m_it.next();
            continue;
        }

        m_it.next();  // consume backslash
        c = m_it.peek();
        switch (c) {
            case '"':  str.push_back('"'); break;
            case '\\': str.push_back('\\'); break;
            case '/':  str.push_back('/'); break;
            case 'b':  str.push_back('\b'); break;
            case 'f':  str.push_back('\f'); break;
            case 'n':  str.push_back('\n'); break;
            case 'r':  str.push_back('\r'); break;
            case 't':  str.push_back('\t'); break;
            case 'u': {
                m_it.next();
                uint32_t code_point;
                if (!parse_hex4(code_point)) return false;
                if (code_point >= 0xD800 && code_point < 0xDC00) {
                    // high surrogate, combine with a following low surrogate
                    if (m_it.peek() == '\\') {
                        m_it.next();
                        if (m_it.peek() != 'u') return create_error("Invalid escape sequence");
                        m_it.next();
                        uint32_t low;
                        if (!parse_hex4(low)) return false;
                        if (low >= 0xDC00 && low < 0xE000) {
                            append_utf8(str, 0x10000 + ((code_point - 0xD800) << 10) + (low - 0xDC00));
                        } else {
                            append_utf8(str, code_point);
                            append_utf8(str, low);
                        }
                        continue;
                    }
                }
                append_utf8(str, code_point);
                continue;
            }
            default:
                return create_error("Invalid escape sequence");
        }
        m_it.next();
    }

    return create_error("Unterminated string");
}

template <typename StreamType>
bool Parser<StreamType>::parse_string() {
    std::string str;
    if (!parse_string(str)) return false;
    m_curr = std::move(str);
    return true;
}

template <typename StreamType>
bool Parser<StreamType>::parse_list() {
    if (++m_depth > max_depth) return create_error("Maximum nesting depth exceeded");

    List list;
    m_it.next();  // consume [
    consume_whitespace();
    if (m_it.peek() == ']') {
        m_it.next();
        m_curr = std::move(list);
        --m_depth;
        return true;
    }

    while (!m_it.done()) {
        if (!parse_object()) return false;

        list.push_back(m_curr);
        consume_whitespace();

        char c = m_it.peek();
        if (c == ']') {
            m_it.next();
            m_curr = std::move(list);
            --m_depth;
            return true;
        } else if (c == ',') {
            m_it.next();
            continue;
        } else if (!m_it.done()) {
            return create_error("Expected token ',' or ']'");
        }
    }

    return create_error("Unterminated list");
}

template <typename StreamType>
bool Parser<StreamType>::parse_map() {
    if (++m_depth > max_depth) return create_error("Maximum nesting depth exceeded");

    Map map;
    m_it.next();  // consume {
    consume_whitespace();
    if (m_it.peek() == '}') {
        m_it.next();
        m_curr = std::move(map);
        --m_depth;
        return true;
    }

    while (!m_it.done()) {
        // key
        consume_whitespace();
        if (m_it.peek() != '"') return create_error("Expected string key");

        std::string key;
        if (!parse_string(key)) return false;

        consume_whitespace();
        if (m_it.peek() != ':') return create_error("Expected token ':'");
        m_it.next();

        // value
        if (!parse_object()) return false;

        map.insert_or_assign(std::move(key), m_curr);
        consume_whitespace();

        char c = m_it.peek();
        if (c == '}') {
            m_it.next();
            m_curr = std::move(map);
            --m_depth;
            return true;
        } else if (c == ',') {
            m_it.next();
            continue;
        } else if (!m_it.done()) {
            return create_error("Expected token ',' or '}'");
        }
    }

    return create_error("Unterminated map");
}

template <typename StreamType>
template <typename T>
bool Parser<StreamType>::expect(const char* seq, T value) {
    for (const char* seq_it = seq; *seq_it != 0; m_it.next(), seq_it++) {
        if (m_it.done() || *seq_it != m_it.peek())
            return create_error("Invalid literal");
    }
    m_curr = value;
    return true;
}

template <typename StreamType>
void Parser<StreamType>::consume_whitespace()
{
    for (;;) {
        switch (m_it.peek()) {
            case ' ':
            case '\t':
            case '\r':
            case '\n':
                m_it.next();
                continue;
            default:
                return;
        }
    }
}

// Keeps the innermost error, and always returns false.
template <typename StreamType>
bool Parser<StreamType>::create_error(const std::string& message)
{
    if (m_error_message.size() == 0) {
        m_error_message = message;
        m_error_offset = m_it.consumed();
    }
    return false;
}

} // namespace impl


struct Error
{
    size_t error_offset = 0;
    std::string error_message;

    std::string to_str() const {
        if (error_message.size() > 0)
            return fmt::format("JSON parse error at {}: {}", error_offset, error_message);
        return "";
    }
};


inline
Object parse(const std::string_view& str, std::optional<Error>& error) {
    impl::Parser parser{jsondb::parse::StringStreamAdapter{str}};
    if (!parser.parse_document()) {
        error = Error{parser.m_error_offset, std::move(parser.m_error_message)};
        return nil;
    }
    return parser.m_curr;
}

inline
Object parse(const std::string_view& str) {
    impl::Parser parser{jsondb::parse::StringStreamAdapter{str}};
    if (!parser.parse_document()) {
        throw jsondb::parse::SyntaxError(str, parser.m_error_offset, parser.m_error_message);
    }
    return parser.m_curr;
}

} // namespace json
} // namespace jsondb
