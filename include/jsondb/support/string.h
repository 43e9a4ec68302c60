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

#include <string>
#include <charconv>
#include <ostream>
#include <sstream>

#include <fmt/format.h>

#include <jsondb/support/types.h>
#include <jsondb/support/exception.h>

namespace jsondb {

inline
std::string int_to_str(Int v) {
    char buf[24];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), v);
    JSONDB_ASSERT(ec == std::errc());
    return {buf, (size_t)(end - buf)};
}

inline
std::string int_to_str(UInt v) {
    char buf[24];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), v);
    JSONDB_ASSERT(ec == std::errc());
    return {buf, (size_t)(end - buf)};
}

/// Shortest representation that parses back to the same double.
/// Integral values keep a trailing ".0" so they read back as floating point.
inline
std::string float_to_str(Float v) {
    auto str = fmt::format("{}", v);
    if (str.find_first_of(".eEn") == std::string::npos)
        str.append(".0");
    return str;
}

inline
void write_quoted(std::ostream& os, const StringView& str) {
    os << '"';
    for (char c : str) {
        switch (c) {
            case '"':  os << "\\\""; break;
            case '\\': os << "\\\\"; break;
            case '\b': os << "\\b"; break;
            case '\f': os << "\\f"; break;
            case '\n': os << "\\n"; break;
            case '\r': os << "\\r"; break;
            case '\t': os << "\\t"; break;
            default:
                if ((unsigned char)c < 0x20) {
                    os << fmt::format("\\u{:04x}", (unsigned)(unsigned char)c);
                } else {
                    os << c;
                }
                break;
        }
    }
    os << '"';
}

inline
std::string quoted(const StringView& str) {
    std::stringstream ss;
    write_quoted(ss, str);
    return ss.str();
}

} // namespace jsondb
