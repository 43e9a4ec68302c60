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

#include <jsondb/support/exception.h>

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <string_view>

namespace jsondb::parse {

/// Character cursor over an in-memory buffer.
/// peek() returns '\0' once the buffer is exhausted.
class StringStreamAdapter
{
  public:
    StringStreamAdapter(const std::string_view& str) : m_str{str} {}

    char peek() const       { return (m_pos < m_str.size())? m_str[m_pos]: '\0'; }
    void next()             { if (m_pos < m_str.size()) ++m_pos; }
    size_t consumed() const { return m_pos; }
    bool done() const       { return m_pos >= m_str.size(); }

  private:
    std::string_view m_str;
    size_t m_pos = 0;
};


constexpr int syntax_context = 72;

struct SyntaxError : public JsondbException
{
    static std::string make_message(const std::string_view& text, std::ptrdiff_t offset, const std::string& message) {
        std::ptrdiff_t ctx_end = std::min(offset + syntax_context, (std::ptrdiff_t)text.size());
        std::ptrdiff_t ctx_begin = std::max(ctx_end - syntax_context, (std::ptrdiff_t)0);
        std::stringstream ss;
        ss << message << " at offset " << offset << std::endl;
        auto it = text.cbegin();
        auto end = it + ctx_end;
        it += ctx_begin;
        for (; it != end; ++it) ss << *it;
        ss << std::endl;
        ss << std::setfill('-') << std::setw(offset - ctx_begin + 1) << '^';
        return ss.str();
    }

    SyntaxError(const std::string_view& text, std::ptrdiff_t offset, const std::string& message)
      : JsondbException(make_message(text, offset, message)), m_offset{offset} {}

    std::ptrdiff_t offset() const { return m_offset; }

  private:
    std::ptrdiff_t m_offset;
};

} // namespace jsondb::parse
