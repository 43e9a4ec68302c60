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

#include <cmath>
#include <cstdint>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <tsl/ordered_map.h>
#include <fmt/format.h>

#include "Key.h"

#include <jsondb/support/exception.h>
#include <jsondb/support/string.h>
#include <jsondb/support/types.h>

using namespace std::literals::string_literals;

namespace jsondb {

struct EmptyReference : public JsondbException
{
    EmptyReference() : JsondbException("uninitialized object"s) {}
};

struct NotFoundError : public JsondbException
{
    NotFoundError(const Key& key) : JsondbException(fmt::format("key not found: {}", jsondb::quoted(key.to_str()))) {}
};

struct IndexError : public JsondbException
{
    IndexError(Int index, size_t size)
      : JsondbException(fmt::format("list index {} out of range (size={})", index, size)) {}
};

/// Raised at save time, when the tree holds a value that JSON cannot represent.
struct SerializationError : public JsondbException
{
    SerializationError(std::string&& error) : JsondbException(std::forward<std::string>(error)) {}
};


class Object;
template <class Target> class Subscript;

struct IRCString;
struct IRCList;
struct IRCMap;

using List = std::vector<Object>;
using Map = tsl::ordered_map<String, Object>;

using Item = std::pair<Key, Object>;
using ItemList = std::vector<Item>;

using IRCStringPtr = IRCString*;
using IRCListPtr = IRCList*;
using IRCMapPtr = IRCMap*;


//////////////////////////////////////////////////////////////////////////////
/// @brief Receives a notification each time a container bound to it is
/// mutated.
//////////////////////////////////////////////////////////////////////////////
class Owner
{
  public:
    virtual ~Owner() = default;
    virtual void mark_modified() = 0;
};


//////////////////////////////////////////////////////////////////////////////
/// @brief Dynamic JSON value.
/// - Strings, lists and maps are reference counted, and a copy of an Object
///   refers to the same underlying value. Use Object::copy() for a deep copy.
/// - A list or map may be bound to an Owner. Every mutation of a bound
///   container calls Owner::mark_modified().
/// - A list or map that is inserted into a container is always deep copied,
///   even when it is already bound to the same Owner, and the copy is bound
///   to the Owner of the container. The stored copy is
///   returned by the inserting method. Therefore, no container is ever
///   reachable from two places in a tree, and a bound tree never contains
///   an unbound container.
//////////////////////////////////////////////////////////////////////////////
class Object
{
  public:
    enum ReprIX {
        EMPTY,   // uninitialized reference
        NIL,     // json null, and used to indicate non-existence
        BOOL,
        INT,
        UINT,
        FLOAT,
        STR,
        LIST,
        MAP,     // insertion ordered map
    };

    union Repr {
        Repr()               : z{nullptr} {}
        Repr(bool v)         : b{v} {}
        Repr(Int v)          : i{v} {}
        Repr(UInt v)         : u{v} {}
        Repr(Float v)        : f{v} {}
        Repr(IRCStringPtr p) : ps{p} {}
        Repr(IRCListPtr p)   : pl{p} {}
        Repr(IRCMapPtr p)    : pm{p} {}

        void*        z;
        bool         b;
        Int          i;
        UInt         u;
        Float        f;
        IRCStringPtr ps;
        IRCListPtr   pl;
        IRCMapPtr    pm;
    };

    static std::string_view type_name(uint8_t repr_ix) {
      switch (repr_ix) {
          case EMPTY: return "empty";
          case NIL:   return "nil";
          case BOOL:  return "bool";
          case INT:   return "int";
          case UINT:  return "uint";
          case FLOAT: return "double";
          case STR:   return "string";
          case LIST:  return "list";
          case MAP:   return "map";
          default:    return "<undefined>";
      }
    }

  public:
    Object()                     : m_repr{}, m_repr_ix{EMPTY} {}
    Object(nil_t)                : m_repr{}, m_repr_ix{NIL} {}
    Object(const String& str);
    Object(String&& str);
    Object(const StringView& sv);
    Object(const char* v);
    Object(bool v)               : m_repr{v}, m_repr_ix{BOOL} {}
    Object(is_like_Float auto v) : m_repr{(Float)v}, m_repr_ix{FLOAT} {}
    Object(is_like_Int auto v)   : m_repr{(Int)v}, m_repr_ix{INT} {}
    Object(is_like_UInt auto v)  : m_repr{(UInt)v}, m_repr_ix{UINT} {}

    Object(const List&);
    Object(List&&);
    Object(const Map&);
    Object(Map&&);

    Object(ReprIX type);

    Object(const Object& other);
    Object(Object&& other);

    ~Object();

    Object& operator = (const Object& other);
    Object& operator = (Object&& other);

    ReprIX type() const                { return (ReprIX)m_repr_ix; }
    std::string_view type_name() const { return type_name(m_repr_ix); }

    bool is_empty() const     { return m_repr_ix == EMPTY; }
    bool is_nil() const       { return m_repr_ix == NIL; }
    bool is_bool() const      { return m_repr_ix == BOOL; }
    bool is_int() const       { return m_repr_ix == INT; }
    bool is_uint() const      { return m_repr_ix == UINT; }
    bool is_float() const     { return m_repr_ix == FLOAT; }
    bool is_num() const       { return m_repr_ix == INT || m_repr_ix == UINT || m_repr_ix == FLOAT; }
    bool is_str() const       { return m_repr_ix == STR; }
    bool is_list() const      { return m_repr_ix == LIST; }
    bool is_map() const       { return m_repr_ix == MAP; }
    bool is_container() const { return m_repr_ix == LIST || m_repr_ix == MAP; }

    template <typename T>
    T as() const requires is_byvalue<T>;

    template <typename T>
    const T& as() const requires std::is_same<T, String>::value;

    bool to_bool() const;
    Int to_int() const;
    UInt to_uint() const;
    Float to_float() const;
    String to_str() const;

    String to_json(unsigned indent = 0) const;
    void to_json(std::ostream&, unsigned indent = 0) const;

    size_t size() const;
    KeyList keys() const;
    List values() const;
    ItemList items() const;

    // pure lookup, returns nil when the key is absent
    Object get(const Key& key) const;

    // inserts the default value when the key is absent (side-effecting read)
    Object get_or_insert(const Key& key, const Object& default_value = nil);

    Object set(const Key& key, const Object& value);
    void del(const Key& key);
    bool contains(const Key& key) const;

    Object append(const Object& value);
    void extend(const Object& values);
    void concat_in_place(const Object& values) { extend(values); }
    Object& operator += (const Object& values) { extend(values); return *this; }

    Subscript<Object> operator [] (const Key& key);

    bool operator == (const Object&) const;
    bool operator == (nil_t) const { return m_repr_ix == NIL; }

    bool is(const Object& other) const;
    Object copy() const;
    refcnt_t ref_count() const;

    Owner* owner() const;
    bool is_bound() const { return owner() != nullptr; }

    static WrongType wrong_type(uint8_t actual)                   { return type_name(actual); };
    static WrongType wrong_type(uint8_t actual, uint8_t expected) { return {type_name(actual), type_name(expected)}; };
    static EmptyReference empty_reference()                       { return {}; }

  protected:
    Object(IRCListPtr p) : m_repr{p}, m_repr_ix{LIST} {}
    Object(IRCMapPtr p)  : m_repr{p}, m_repr_ix{MAP} {}

    static bool norm_index(Int& index, UInt size);
    static bool num_equal(const Object& lhs, const Object& rhs);

    Int list_index(const Key& key) const;
    const String& map_key(const Key& key) const;

    void mark_modified() const;
    Object bind_copy(Owner* p_owner) const;
    void bind(Owner* p_owner) const;
    void unbind() const { bind(nullptr); }

    void inc_ref_count() const;
    void dec_ref_count() const;

    void write_json(std::ostream& os, unsigned indent, unsigned depth) const;

  protected:
    Repr m_repr;
    uint8_t m_repr_ix;

  friend class Document;
};


struct IRCString
{
    String str;
    refcnt_t ref_count = 1;
};

struct IRCList
{
    List list;
    Owner* p_owner = nullptr;
    refcnt_t ref_count = 1;
};

struct IRCMap
{
    Map map;
    Owner* p_owner = nullptr;
    refcnt_t ref_count = 1;
};


//////////////////////////////////////////////////////////////////////////////
/// @brief Proxy returned by the subscript operator.
/// Assignment stores a value in the target, and conversion to Object looks
/// the key up in the target. Subscripts may be chained, as in
/// `doc["a"]["b"].append(1)`, in which case each intermediate subscript is
/// resolved with a pure lookup.
//////////////////////////////////////////////////////////////////////////////
template <class Target>
class Subscript
{
  public:
    Subscript(Target target, const Key& key) : m_target{target}, m_key{key} {}

    Subscript& operator = (const Subscript& other) { m_target.set(m_key, other.value()); return *this; }
    Subscript& operator = (const Object& value)    { m_target.set(m_key, value); return *this; }

    operator Object () const { return value(); }
    Object value() const     { return m_target.get(m_key); }

    Subscript<Object> operator [] (const Key& key) const { return {value(), key}; }

    Object get(const Key& key) const                                              { return value().get(key); }
    Object get_or_insert(const Key& key, const Object& default_value = nil) const { return value().get_or_insert(key, default_value); }
    Object set(const Key& key, const Object& obj) const                           { return value().set(key, obj); }
    void del(const Key& key) const                                                { value().del(key); }
    bool contains(const Key& key) const                                           { return value().contains(key); }
    Object append(const Object& obj) const                                        { return value().append(obj); }
    void extend(const Object& values) const                                       { value().extend(values); }
    size_t size() const                                                           { return value().size(); }
    String to_json(unsigned indent = 0) const                                     { return value().to_json(indent); }

  private:
    Target m_target;
    Key m_key;
};


inline
Object::Object(const String& str)    : m_repr{new IRCString{str}}, m_repr_ix{STR} {}

inline
Object::Object(String&& str)         : m_repr{new IRCString{std::move(str)}}, m_repr_ix{STR} {}

inline
Object::Object(const StringView& sv) : m_repr{new IRCString{String{sv}}}, m_repr_ix{STR} {}

inline
Object::Object(const char* v) : m_repr{}, m_repr_ix{STR} {
    JSONDB_ASSERT(v != nullptr);
    m_repr.ps = new IRCString{v};
}

inline
Object::Object(const List& list) : m_repr{new IRCList{list}}, m_repr_ix{LIST} {}

inline
Object::Object(List&& list)      : m_repr{new IRCList{std::move(list)}}, m_repr_ix{LIST} {}

inline
Object::Object(const Map& map)   : m_repr{new IRCMap{map}}, m_repr_ix{MAP} {}

inline
Object::Object(Map&& map)        : m_repr{new IRCMap{std::move(map)}}, m_repr_ix{MAP} {}

inline
Object::Object(ReprIX type) : m_repr{}, m_repr_ix{(uint8_t)type} {
    switch (type) {
        case EMPTY: break;
        case NIL:   break;
        case BOOL:  m_repr.b = false; break;
        case INT:   m_repr.i = 0; break;
        case UINT:  m_repr.u = 0; break;
        case FLOAT: m_repr.f = 0; break;
        case STR:   m_repr.ps = new IRCString{}; break;
        case LIST:  m_repr.pl = new IRCList{}; break;
        case MAP:   m_repr.pm = new IRCMap{}; break;
        default:    throw wrong_type(type);
    }
}

inline
Object::Object(const Object& other) : m_repr{other.m_repr}, m_repr_ix{other.m_repr_ix} {
    inc_ref_count();
}

inline
Object::Object(Object&& other) : m_repr{other.m_repr}, m_repr_ix{other.m_repr_ix} {
    other.m_repr_ix = EMPTY;
    other.m_repr.z = nullptr;
}

inline
Object::~Object() {
    dec_ref_count();
}

inline
Object& Object::operator = (const Object& other) {
    other.inc_ref_count();
    dec_ref_count();
    m_repr = other.m_repr;
    m_repr_ix = other.m_repr_ix;
    return *this;
}

inline
Object& Object::operator = (Object&& other) {
    if (this == &other) return *this;
    dec_ref_count();
    m_repr = other.m_repr;
    m_repr_ix = other.m_repr_ix;
    other.m_repr_ix = EMPTY;
    other.m_repr.z = nullptr;
    return *this;
}

inline
void Object::inc_ref_count() const {
    switch (m_repr_ix) {
        case STR:  ++m_repr.ps->ref_count; break;
        case LIST: ++m_repr.pl->ref_count; break;
        case MAP:  ++m_repr.pm->ref_count; break;
        default:   break;
    }
}

inline
void Object::dec_ref_count() const {
    switch (m_repr_ix) {
        case STR:  if (--m_repr.ps->ref_count == 0) delete m_repr.ps; break;
        case LIST: if (--m_repr.pl->ref_count == 0) delete m_repr.pl; break;
        case MAP:  if (--m_repr.pm->ref_count == 0) delete m_repr.pm; break;
        default:   break;
    }
}

inline
refcnt_t Object::ref_count() const {
    switch (m_repr_ix) {
        case STR:  return m_repr.ps->ref_count;
        case LIST: return m_repr.pl->ref_count;
        case MAP:  return m_repr.pm->ref_count;
        default:   return 1;
    }
}

template <typename T>
T Object::as() const requires is_byvalue<T> {
    if constexpr (std::is_same<T, bool>::value) {
        if (m_repr_ix == BOOL) return m_repr.b;
        throw wrong_type(m_repr_ix, BOOL);
    } else if constexpr (is_like_Float<T>) {
        if (m_repr_ix == FLOAT) return (T)m_repr.f;
        throw wrong_type(m_repr_ix, FLOAT);
    } else if constexpr (std::is_signed<T>::value) {
        if (m_repr_ix == INT) return (T)m_repr.i;
        throw wrong_type(m_repr_ix, INT);
    } else {
        if (m_repr_ix == UINT) return (T)m_repr.u;
        throw wrong_type(m_repr_ix, UINT);
    }
}

template <typename T>
const T& Object::as() const requires std::is_same<T, String>::value {
    if (m_repr_ix == STR) return m_repr.ps->str;
    throw wrong_type(m_repr_ix, STR);
}

inline
bool Object::to_bool() const {
    switch (m_repr_ix) {
        case EMPTY: throw empty_reference();
        case NIL:   return false;
        case BOOL:  return m_repr.b;
        case INT:   return m_repr.i;
        case UINT:  return m_repr.u;
        case FLOAT: return m_repr.f;
        case STR:   return m_repr.ps->str.size() > 0;
        case LIST:  [[fallthrough]];
        case MAP:   return size() > 0;
        default:    throw wrong_type(m_repr_ix, BOOL);
    }
}

inline
Int Object::to_int() const {
    switch (m_repr_ix) {
        case EMPTY: throw empty_reference();
        case BOOL:  return m_repr.b;
        case INT:   return m_repr.i;
        case UINT:  return m_repr.u;
        case FLOAT: return m_repr.f;
        default:    throw wrong_type(m_repr_ix, INT);
    }
}

inline
UInt Object::to_uint() const {
    switch (m_repr_ix) {
        case EMPTY: throw empty_reference();
        case BOOL:  return m_repr.b;
        case INT:   return m_repr.i;
        case UINT:  return m_repr.u;
        case FLOAT: return m_repr.f;
        default:    throw wrong_type(m_repr_ix, UINT);
    }
}

inline
Float Object::to_float() const {
    switch (m_repr_ix) {
        case EMPTY: throw empty_reference();
        case BOOL:  return m_repr.b;
        case INT:   return m_repr.i;
        case UINT:  return m_repr.u;
        case FLOAT: return m_repr.f;
        default:    throw wrong_type(m_repr_ix, FLOAT);
    }
}

inline
String Object::to_str() const {
    switch (m_repr_ix) {
        case EMPTY: throw empty_reference();
        case STR:   return m_repr.ps->str;
        default:    return to_json();
    }
}

inline
Owner* Object::owner() const {
    switch (m_repr_ix) {
        case LIST: return m_repr.pl->p_owner;
        case MAP:  return m_repr.pm->p_owner;
        default:   return nullptr;
    }
}

inline
void Object::mark_modified() const {
    auto p_owner = owner();
    if (p_owner != nullptr) p_owner->mark_modified();
}

inline
void Object::bind(Owner* p_owner) const {
    switch (m_repr_ix) {
        case LIST: {
            m_repr.pl->p_owner = p_owner;
            for (const auto& item : m_repr.pl->list)
                item.bind(p_owner);
            break;
        }
        case MAP: {
            m_repr.pm->p_owner = p_owner;
            for (const auto& [key, value] : m_repr.pm->map)
                value.bind(p_owner);
            break;
        }
        default:
            break;
    }
}

inline
Object Object::bind_copy(Owner* p_owner) const {
    switch (m_repr_ix) {
        case EMPTY: throw empty_reference();
        case LIST: {
            auto p_list = new IRCList{};
            p_list->p_owner = p_owner;
            Object result{p_list};
            auto& src = m_repr.pl->list;
            p_list->list.reserve(src.size());
            for (const auto& item : src)
                p_list->list.push_back(item.bind_copy(p_owner));
            return result;
        }
        case MAP: {
            auto p_map = new IRCMap{};
            p_map->p_owner = p_owner;
            Object result{p_map};
            auto& src = m_repr.pm->map;
            p_map->map.reserve(src.size());
            for (const auto& [key, value] : src)
                p_map->map.emplace(key, value.bind_copy(p_owner));
            return result;
        }
        default:
            return *this;  // strings are never modified in place, so they are shared
    }
}

inline
Object Object::copy() const {
    return bind_copy(nullptr);
}

inline
bool Object::is(const Object& other) const {
    if (m_repr_ix != other.m_repr_ix) return false;
    switch (m_repr_ix) {
        case EMPTY: return true;
        case NIL:   return true;
        case BOOL:  return m_repr.b == other.m_repr.b;
        case INT:   return m_repr.i == other.m_repr.i;
        case UINT:  return m_repr.u == other.m_repr.u;
        case FLOAT: return m_repr.f == other.m_repr.f;
        default:    return m_repr.z == other.m_repr.z;
    }
}

inline
bool Object::norm_index(Int& index, UInt size) {
    if (index < 0) index += size;
    if (index < 0 || (UInt)index >= size) return false;
    return true;
}

inline
Int Object::list_index(const Key& key) const {
    if (!key.is_int()) throw KeyTypeError(key.type_name(), type_name(LIST));
    return key.as_int();
}

inline
const String& Object::map_key(const Key& key) const {
    if (!key.is_str()) throw KeyTypeError(key.type_name(), type_name(MAP));
    return key.as_str();
}

inline
size_t Object::size() const {
    switch (m_repr_ix) {
        case EMPTY: throw empty_reference();
        case STR:   return m_repr.ps->str.size();
        case LIST:  return m_repr.pl->list.size();
        case MAP:   return m_repr.pm->map.size();
        default:    throw wrong_type(m_repr_ix);
    }
}

inline
KeyList Object::keys() const {
    KeyList keys;
    switch (m_repr_ix) {
        case EMPTY: throw empty_reference();
        case LIST: {
            auto size = m_repr.pl->list.size();
            keys.reserve(size);
            for (size_t i=0; i<size; ++i)
                keys.push_back(i);
            break;
        }
        case MAP: {
            keys.reserve(m_repr.pm->map.size());
            for (const auto& [key, value] : m_repr.pm->map)
                keys.push_back(key);
            break;
        }
        default:
            throw wrong_type(m_repr_ix);
    }
    return keys;
}

inline
List Object::values() const {
    switch (m_repr_ix) {
        case EMPTY: throw empty_reference();
        case LIST:  return m_repr.pl->list;
        case MAP: {
            List values;
            values.reserve(m_repr.pm->map.size());
            for (const auto& [key, value] : m_repr.pm->map)
                values.push_back(value);
            return values;
        }
        default:
            throw wrong_type(m_repr_ix);
    }
}

inline
ItemList Object::items() const {
    ItemList items;
    switch (m_repr_ix) {
        case EMPTY: throw empty_reference();
        case LIST: {
            auto& list = m_repr.pl->list;
            items.reserve(list.size());
            for (size_t i=0; i<list.size(); ++i)
                items.emplace_back(i, list[i]);
            break;
        }
        case MAP: {
            items.reserve(m_repr.pm->map.size());
            for (const auto& [key, value] : m_repr.pm->map)
                items.emplace_back(key, value);
            break;
        }
        default:
            throw wrong_type(m_repr_ix);
    }
    return items;
}

inline
Object Object::get(const Key& key) const {
    switch (m_repr_ix) {
        case EMPTY: throw empty_reference();
        case LIST: {
            auto& list = m_repr.pl->list;
            auto index = list_index(key);
            if (!norm_index(index, list.size())) return nil;
            return list[index];
        }
        case MAP: {
            auto& map = m_repr.pm->map;
            auto it = map.find(map_key(key));
            if (it == map.end()) return nil;
            return it->second;
        }
        default:
            throw wrong_type(m_repr_ix);
    }
}

inline
Object Object::get_or_insert(const Key& key, const Object& default_value) {
    if (m_repr_ix == EMPTY) throw empty_reference();
    if (m_repr_ix != MAP) throw wrong_type(m_repr_ix, MAP);

    auto& map = m_repr.pm->map;
    auto it = map.find(map_key(key));
    if (it != map.end()) return it->second;
    return set(key, default_value);
}

inline
Object Object::set(const Key& key, const Object& in_val) {
    switch (m_repr_ix) {
        case EMPTY: throw empty_reference();
        case LIST: {
            auto& list = m_repr.pl->list;
            auto index = list_index(key);
            if (!norm_index(index, list.size())) throw IndexError(key.as_int(), list.size());
            auto out_val = in_val.bind_copy(m_repr.pl->p_owner);
            list[index].unbind();
            list[index] = out_val;
            mark_modified();
            return out_val;
        }
        case MAP: {
            auto& map = m_repr.pm->map;
            auto& map_key_str = map_key(key);
            auto out_val = in_val.bind_copy(m_repr.pm->p_owner);
            auto it = map.find(map_key_str);
            if (it != map.end()) {
                it->second.unbind();
                it.value() = out_val;
            } else {
                map.emplace(map_key_str, out_val);
            }
            mark_modified();
            return out_val;
        }
        default:
            throw wrong_type(m_repr_ix);
    }
}

inline
void Object::del(const Key& key) {
    switch (m_repr_ix) {
        case EMPTY: throw empty_reference();
        case LIST: {
            auto& list = m_repr.pl->list;
            auto index = list_index(key);
            if (!norm_index(index, list.size())) throw IndexError(key.as_int(), list.size());
            auto it = list.begin() + index;
            it->unbind();
            list.erase(it);
            mark_modified();
            break;
        }
        case MAP: {
            auto& map = m_repr.pm->map;
            auto it = map.find(map_key(key));
            if (it == map.end()) throw NotFoundError(key);
            it->second.unbind();
            map.erase(it);
            mark_modified();
            break;
        }
        default:
            throw wrong_type(m_repr_ix);
    }
}

inline
bool Object::contains(const Key& key) const {
    switch (m_repr_ix) {
        case EMPTY: throw empty_reference();
        case MAP:   return m_repr.pm->map.count(map_key(key)) > 0;
        default:    throw wrong_type(m_repr_ix, MAP);
    }
}

inline
Object Object::append(const Object& value) {
    if (m_repr_ix == EMPTY) throw empty_reference();
    if (m_repr_ix != LIST) throw wrong_type(m_repr_ix, LIST);

    auto& list = m_repr.pl->list;
    list.push_back(value.bind_copy(m_repr.pl->p_owner));
    mark_modified();
    return list.back();
}

inline
void Object::extend(const Object& values) {
    if (m_repr_ix == EMPTY) throw empty_reference();
    if (m_repr_ix != LIST) throw wrong_type(m_repr_ix, LIST);
    if (values.m_repr_ix != LIST) throw wrong_type(values.m_repr_ix, LIST);

    // values may be this list
    List in_vals = values.m_repr.pl->list;

    auto p_owner = m_repr.pl->p_owner;
    auto& list = m_repr.pl->list;
    list.reserve(list.size() + in_vals.size());
    for (const auto& value : in_vals)
        list.push_back(value.bind_copy(p_owner));
    mark_modified();
}

inline
Subscript<Object> Object::operator [] (const Key& key) {
    return {*this, key};
}

inline
bool Object::num_equal(const Object& lhs, const Object& rhs) {
    if (lhs.m_repr_ix == FLOAT || rhs.m_repr_ix == FLOAT)
        return lhs.to_float() == rhs.to_float();
    if (lhs.m_repr_ix == rhs.m_repr_ix)
        return lhs.m_repr.u == rhs.m_repr.u;
    auto& signed_obj = (lhs.m_repr_ix == INT)? lhs: rhs;
    auto& unsigned_obj = (lhs.m_repr_ix == INT)? rhs: lhs;
    return signed_obj.m_repr.i >= 0 && (UInt)signed_obj.m_repr.i == unsigned_obj.m_repr.u;
}

inline
bool Object::operator == (const Object& other) const {
    switch (m_repr_ix) {
        case EMPTY: return other.m_repr_ix == EMPTY;
        case NIL:   return other.m_repr_ix == NIL;
        case BOOL:  return other.m_repr_ix == BOOL && m_repr.b == other.m_repr.b;
        case INT:   [[fallthrough]];
        case UINT:  [[fallthrough]];
        case FLOAT: return other.is_num() && num_equal(*this, other);
        case STR:   return other.m_repr_ix == STR && m_repr.ps->str == other.m_repr.ps->str;
        case LIST: {
            if (other.m_repr_ix != LIST) return false;
            auto& lhs = m_repr.pl->list;
            auto& rhs = other.m_repr.pl->list;
            if (lhs.size() != rhs.size()) return false;
            for (size_t i=0; i<lhs.size(); ++i) {
                if (!(lhs[i] == rhs[i])) return false;
            }
            return true;
        }
        case MAP: {
            if (other.m_repr_ix != MAP) return false;
            auto& lhs = m_repr.pm->map;
            auto& rhs = other.m_repr.pm->map;
            if (lhs.size() != rhs.size()) return false;
            for (const auto& [key, value] : lhs) {
                auto it = rhs.find(key);
                if (it == rhs.end() || !(it->second == value)) return false;
            }
            return true;
        }
        default:
            return false;
    }
}

inline
String Object::to_json(unsigned indent) const {
    StringStream ss;
    to_json(ss, indent);
    return ss.str();
}

inline
void Object::to_json(std::ostream& os, unsigned indent) const {
    write_json(os, indent, 0);
}

inline
void Object::write_json(std::ostream& os, unsigned indent, unsigned depth) const {
    // indent == 0 renders a single line with ", " and ": " separators
    auto line_break = [&os, indent] (unsigned level, bool first) {
        if (indent > 0) {
            os << '\n';
            for (unsigned i=0; i < level * indent; ++i) os << ' ';
        } else if (!first) {
            os << ' ';
        }
    };

    switch (m_repr_ix) {
        case EMPTY: throw SerializationError("uninitialized object is not representable in JSON"s);
        case NIL:   os << "null"; break;
        case BOOL:  os << (m_repr.b? "true": "false"); break;
        case INT:   os << int_to_str(m_repr.i); break;
        case UINT:  os << int_to_str(m_repr.u); break;
        case FLOAT: {
            if (!std::isfinite(m_repr.f))
                throw SerializationError(fmt::format("{} is not representable in JSON", m_repr.f));
            os << float_to_str(m_repr.f);
            break;
        }
        case STR: write_quoted(os, m_repr.ps->str); break;
        case LIST: {
            auto& list = m_repr.pl->list;
            if (list.empty()) { os << "[]"; break; }
            os << '[';
            bool first = true;
            for (const auto& item : list) {
                if (!first) os << ',';
                line_break(depth + 1, first);
                item.write_json(os, indent, depth + 1);
                first = false;
            }
            if (indent > 0) line_break(depth, true);
            os << ']';
            break;
        }
        case MAP: {
            auto& map = m_repr.pm->map;
            if (map.empty()) { os << "{}"; break; }
            os << '{';
            bool first = true;
            for (const auto& [key, value] : map) {
                if (!first) os << ',';
                line_break(depth + 1, first);
                write_quoted(os, key);
                os << ": ";
                value.write_json(os, indent, depth + 1);
                first = false;
            }
            if (indent > 0) line_break(depth, true);
            os << '}';
            break;
        }
        default:
            throw wrong_type(m_repr_ix);
    }
}

inline
std::ostream& operator<< (std::ostream& ostream, const Object& obj) {
    if (obj.is_empty()) return ostream << "<empty>";
    ostream << obj.to_str();
    return ostream;
}

inline
std::ostream& operator<< (std::ostream& ostream, const Key& key) {
    ostream << key.to_str();
    return ostream;
}

} // namespace jsondb
