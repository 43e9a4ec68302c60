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

#include "Object.h"
#include "Registry.h"

#include <jsondb/filesystem/AtomicFile.h>
#include <jsondb/parser/json.h>
#include <jsondb/support/exception.h>
#include <jsondb/support/Finally.h>
#include <jsondb/support/logging.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>

#include <fmt/format.h>

namespace jsondb {

/// Raised when the file of a Document exists but does not contain valid JSON.
class LoadParseError : public JsondbException
{
  public:
    LoadParseError(const std::filesystem::path& path, size_t offset, const std::string& error)
      : JsondbException(fmt::format("JSON parse error at offset {}: {} ({})", offset, error, path.string()))
      , m_path{path}
      , m_offset{offset}
    {}

    const std::filesystem::path& path() const { return m_path; }
    size_t offset() const                     { return m_offset; }

  private:
    std::filesystem::path m_path;
    size_t m_offset;
};

struct KindMismatchError : public JsondbException
{
    KindMismatchError(const std::string_view& actual, const std::string_view& requested)
      : JsondbException(fmt::format("document root is a {}, not a {}", actual, requested)) {}
};

struct ClosedDocument : public JsondbException
{
    ClosedDocument(const std::filesystem::path& path)
      : JsondbException(fmt::format("document is closed ({})", path.string())) {}
};


//////////////////////////////////////////////////////////////////////////////
/// @brief JSON document bound to a file.
/// The file is read, if it exists, when the Document is constructed. The
/// root of the document is either a map or a list. The kind of the root is
/// fixed by the file, or else by the first write, and never changes.
///
/// Every list and map in the document is bound to the Document, so that any
/// mutation, including mutation through a handle obtained from the document,
/// marks the document dirty. A dirty document is written by save(), by
/// close(), when the Document is destroyed, and at process exit or on
/// SIGINT/SIGTERM.
///
/// Saving writes the whole document to a temporary file and renames it over
/// the target, so the target always holds either the previous or the new
/// content.
//////////////////////////////////////////////////////////////////////////////
class Document : public Owner
{
  public:
    enum class Kind
    {
        UNINITIALIZED,
        MAPPING,
        SEQUENCE,
        SCALAR     // loaded file whose top-level value is not a container
    };

    struct Options
    {
        unsigned indent = 2;          // 0 saves the document on a single line
        bool flush_on_close = true;   // save a dirty document in close() and the destructor
        bool sync = true;             // fsync before the temporary file replaces the target
        bool quiet_write = false;     // do not log failures of best-effort flushes
    };

    static std::string_view kind_name(Kind kind);

  public:
    explicit Document(const std::filesystem::path& path);
    Document(const std::filesystem::path& path, const Options& options);
    ~Document() override;

    Document(const Document&) = delete;
    Document(Document&&) = delete;
    Document& operator = (const Document&) = delete;
    Document& operator = (Document&&) = delete;

    const std::filesystem::path& path() const      { return m_path; }
    const Options& options() const                 { return m_options; }
    Kind kind() const                              { return m_kind; }
    std::string_view kind_name() const             { return kind_name(m_kind); }
    bool is_dirty() const                          { return m_dirty; }
    bool is_open() const                           { return m_open; }
    bool is_saving() const                         { return m_saving; }
    const std::optional<String>& snapshot() const  { return m_snapshot; }

    Object root() const;
    Object ensure_mapping();
    Object ensure_sequence();

    Object get(const Key& key) const;
    Object get_or_insert(const Key& key, const Object& default_value = nil);
    Object set(const Key& key, const Object& value);
    Subscript<Document&> operator [] (const Key& key);
    void del(const Key& key);
    bool contains(const Key& key) const;

    Object append(const Object& value);
    void extend(const Object& values);
    void concat_in_place(const Object& values) { extend(values); }
    Document& operator += (const Object& values) { extend(values); return *this; }

    size_t size() const;
    String to_json(unsigned indent = 0) const;

    void mark_modified() override;

    void save();
    bool flush() noexcept;
    void close();

  private:
    void load();
    void check_open() const;
    Object ensure(Kind kind);
    Object ensure_for(const Key& key);
    const Object& require_for(const Key& key) const;

    std::filesystem::path m_path;
    Options m_options;
    Kind m_kind = Kind::UNINITIALIZED;
    Object m_root;
    std::optional<String> m_snapshot;
    bool m_dirty = false;
    bool m_open = true;
    bool m_saving = false;
};

/// Opens the document stored at the given path.
inline
std::unique_ptr<Document> open(const std::filesystem::path& path, const Document::Options& options = {}) {
    return std::make_unique<Document>(path, options);
}

inline
std::string_view Document::kind_name(Kind kind) {
    switch (kind) {
        case Kind::UNINITIALIZED: return "uninitialized";
        case Kind::MAPPING:       return "mapping";
        case Kind::SEQUENCE:      return "sequence";
        case Kind::SCALAR:        return "scalar";
        default:                  return "<undefined>";
    }
}

inline
Document::Document(const std::filesystem::path& path) : Document(path, Options{}) {}

inline
Document::Document(const std::filesystem::path& path, const Options& options)
  : m_path{path}
  , m_options{options}
{
    load();
    Registry::instance().add(this);
}

inline
Document::~Document() {
    close();
}

inline
void Document::load() {
    std::error_code err;
    auto status = std::filesystem::status(m_path, err);
    if (!std::filesystem::exists(status)) {
        JSONDB_DEBUG("{}: new document", m_path.string());
        return;
    }

    if (std::filesystem::is_directory(status))
        throw filesystem::PersistenceError(m_path, {}, "path is a directory");

    std::ifstream f_in{m_path, std::ios::in | std::ios::binary};
    if (!f_in.is_open())
        throw filesystem::PersistenceError(m_path, {}, fmt::format("open failed: {}", std::strerror(errno)));

    std::string text{std::istreambuf_iterator<char>{f_in}, std::istreambuf_iterator<char>{}};
    if (f_in.bad())
        throw filesystem::PersistenceError(m_path, {}, "read failed");

    std::optional<json::Error> error;
    auto root = json::parse(text, error);
    if (error)
        throw LoadParseError(m_path, error->error_offset, error->error_message);

    switch (root.type()) {
        case Object::MAP:  m_kind = Kind::MAPPING; break;
        case Object::LIST: m_kind = Kind::SEQUENCE; break;
        default:           m_kind = Kind::SCALAR; break;
    }

    root.bind(this);
    m_root = root;
    m_snapshot = m_root.to_json(m_options.indent);
    JSONDB_DEBUG("{}: loaded {}", m_path.string(), kind_name(m_kind));
}

inline
void Document::check_open() const {
    if (!m_open) throw ClosedDocument(m_path);
}

inline
Object Document::root() const {
    check_open();
    return m_root;
}

inline
Object Document::ensure(Kind kind) {
    check_open();
    if (m_kind == Kind::UNINITIALIZED) {
        m_root = Object{kind == Kind::MAPPING? Object::MAP: Object::LIST};
        m_root.bind(this);
        m_kind = kind;
        mark_modified();
    } else if (m_kind != kind) {
        throw KindMismatchError(kind_name(m_kind), kind_name(kind));
    }
    return m_root;
}

inline
Object Document::ensure_mapping() {
    return ensure(Kind::MAPPING);
}

inline
Object Document::ensure_sequence() {
    return ensure(Kind::SEQUENCE);
}

// Keyed writes address a mapping root. Integer keys are only accepted by a
// root that is already a sequence, and a bad key never initializes the root.
inline
Object Document::ensure_for(const Key& key) {
    check_open();
    if (m_kind == Kind::SEQUENCE && key.is_int()) return m_root;
    if (m_kind == Kind::UNINITIALIZED && !key.is_str())
        throw KeyTypeError(key.type_name(), Object::type_name(Object::MAP));
    return ensure_mapping();
}

inline
const Object& Document::require_for(const Key& key) const {
    if (m_kind == Kind::SCALAR || (m_kind == Kind::SEQUENCE && !key.is_int()))
        throw KindMismatchError(kind_name(m_kind), kind_name(Kind::MAPPING));
    return m_root;
}

inline
Object Document::get(const Key& key) const {
    check_open();
    if (m_kind == Kind::UNINITIALIZED) return nil;
    return require_for(key).get(key);
}

inline
Object Document::get_or_insert(const Key& key, const Object& default_value) {
    return ensure_mapping().get_or_insert(key, default_value);
}

inline
Object Document::set(const Key& key, const Object& value) {
    return ensure_for(key).set(key, value);
}

inline
Subscript<Document&> Document::operator [] (const Key& key) {
    return {*this, key};
}

inline
void Document::del(const Key& key) {
    ensure_for(key).del(key);
}

inline
bool Document::contains(const Key& key) const {
    check_open();
    if (m_kind == Kind::UNINITIALIZED) return false;
    if (m_kind != Kind::MAPPING)
        throw KindMismatchError(kind_name(m_kind), kind_name(Kind::MAPPING));
    return m_root.contains(key);
}

inline
Object Document::append(const Object& value) {
    return ensure_sequence().append(value);
}

inline
void Document::extend(const Object& values) {
    ensure_sequence().extend(values);
}

inline
size_t Document::size() const {
    check_open();
    switch (m_kind) {
        case Kind::UNINITIALIZED: return 0;
        case Kind::SCALAR:        throw KindMismatchError(kind_name(m_kind), "container");
        default:                  return m_root.size();
    }
}

inline
String Document::to_json(unsigned indent) const {
    check_open();
    if (m_kind == Kind::UNINITIALIZED) return "{}";
    return m_root.to_json(indent);
}

inline
void Document::mark_modified() {
    m_dirty = true;
}

inline
void Document::save() {
    check_open();
    if (!m_dirty || m_kind == Kind::UNINITIALIZED) return;

    m_saving = true;
    Finally finally{[this] () { m_saving = false; }};

    auto text = m_root.to_json(m_options.indent);
    if (m_snapshot && *m_snapshot == text) {
        JSONDB_DEBUG("{}: unchanged", m_path.string());
        m_dirty = false;
        return;
    }

    filesystem::atomic_write(m_path, text, m_options.sync);

    m_snapshot = std::move(text);
    m_dirty = false;
    JSONDB_DEBUG("{}: saved", m_path.string());
}

/// Saves the document, logging instead of throwing.
/// Returns false if the document could not be saved, or if a save of the
/// document is already in progress.
inline
bool Document::flush() noexcept {
    if (m_saving) return false;
    if (!m_open) return true;
    try {
        save();
        return true;
    } catch (const JsondbException& err) {
        if (!m_options.quiet_write)
            JSONDB_WARN("{}: save failed: {}", m_path.string(), err.message());
    } catch (const std::exception& err) {
        if (!m_options.quiet_write)
            JSONDB_WARN("{}: save failed: {}", m_path.string(), err.what());
    }
    return false;
}

inline
void Document::close() {
    if (!m_open) return;
    if (m_options.flush_on_close) flush();
    Registry::instance().remove(this);
    m_root.unbind();
    m_open = false;
}

inline
std::ostream& operator<< (std::ostream& ostream, const Document& doc) {
    return ostream << doc.to_json();
}


// Registry members that call into Document

inline
size_t Registry::flush_locked() {
    size_t failed = 0;
    for (auto p_doc : m_docs) {
        if (!p_doc->flush()) ++failed;
    }
    return failed;
}

} // namespace jsondb
