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
/** @file */
#pragma once

#include <string>
#include <vector>

#include <jsondb/support/string.h>
#include <jsondb/support/exception.h>
#include <jsondb/support/types.h>

namespace jsondb {

/////////////////////////////////////////////////////////////////////////////
/// Raised when a key of the wrong type is used against a container:
/// a map only accepts string keys, and a list only accepts integer indices.
/////////////////////////////////////////////////////////////////////////////
struct KeyTypeError : public JsondbException
{
    KeyTypeError(const std::string_view& actual, const std::string_view& container)
      : JsondbException(fmt::format("{} key used against a {}", actual, container)) {}
};

/////////////////////////////////////////////////////////////////////////////
/// A key into a container.
/// - A string key addresses an entry of a map.
/// - An integer key addresses an element of a list. Negative indices count
///   from the end of the list.
/////////////////////////////////////////////////////////////////////////////
class Key
{
  public:
    enum ReprIX {
        NIL,
        INT,
        STR
    };

    static std::string_view type_name(ReprIX repr_ix) {
        switch (repr_ix) {
            case NIL: return "nil";
            case INT: return "int";
            case STR: return "string";
            default:  return "<undefined>";
        }
    }

  public:
    Key()                      : m_repr_ix{NIL} {}
    Key(nil_t)                 : m_repr_ix{NIL} {}
    Key(const String& s)       : m_str{s}, m_repr_ix{STR} {}
    Key(String&& s)            : m_str{std::move(s)}, m_repr_ix{STR} {}
    Key(const StringView& s)   : m_str{s}, m_repr_ix{STR} {}
    Key(const char* s)         : m_str{s}, m_repr_ix{STR} { JSONDB_ASSERT(s != nullptr); }
    Key(is_like_Int auto v)    : m_int{(Int)v}, m_repr_ix{INT} {}
    Key(is_like_UInt auto v)   : m_int{(Int)v}, m_repr_ix{INT} {}

    ReprIX type() const                { return m_repr_ix; }
    std::string_view type_name() const { return type_name(m_repr_ix); }

    bool is_nil() const { return m_repr_ix == NIL; }
    bool is_int() const { return m_repr_ix == INT; }
    bool is_str() const { return m_repr_ix == STR; }

    const String& as_str() const {
        if (m_repr_ix != STR) throw WrongType(type_name(), type_name(STR));
        return m_str;
    }

    Int as_int() const {
        if (m_repr_ix != INT) throw WrongType(type_name(), type_name(INT));
        return m_int;
    }

    String to_str() const {
        switch (m_repr_ix) {
            case NIL: return "nil";
            case INT: return int_to_str(m_int);
            case STR: return m_str;
            default:  return "<undefined>";
        }
    }

    bool operator == (const Key& other) const {
        if (m_repr_ix != other.m_repr_ix) return false;
        switch (m_repr_ix) {
            case INT: return m_int == other.m_int;
            case STR: return m_str == other.m_str;
            default:  return true;
        }
    }

    bool operator == (nil_t) const { return m_repr_ix == NIL; }

  private:
    String m_str;
    Int m_int = 0;
    ReprIX m_repr_ix;
};

using KeyList = std::vector<Key>;

inline
Key operator ""_key (const char* str, size_t size) {
    return Key{StringView{str, size}};
}

} // namespace jsondb
