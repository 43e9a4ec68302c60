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

#include <jsondb/support/logging.h>

#include <algorithm>
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <mutex>
#include <vector>

namespace jsondb {

class Document;

/////////////////////////////////////////////////////////////////////////////
/// @brief Process-wide set of open Documents.
/// The registry does not own the documents it holds. A Document adds itself
/// when it is constructed and removes itself when it is closed or destroyed.
///
/// The first registration installs the shutdown hooks:
/// - an atexit handler that flushes every registered Document.
/// - SIGINT and SIGTERM handlers that flush every registered Document,
///   restore the default disposition of the signal and exit with status 1.
///   The sweep is skipped while any thread is inside a registry call,
///   since the interrupted thread may hold the registry mutex.
///
/// The members that call into Document are defined in jsondb/core/Document.h.
/////////////////////////////////////////////////////////////////////////////
class Registry
{
  public:
    static Registry& instance();

    void add(Document* p_doc);
    void remove(Document* p_doc);
    bool contains(const Document* p_doc) const;
    size_t size() const;

    // returns the number of documents that could not be flushed
    size_t flush_all();

    void install_shutdown_hooks();
    bool hooks_installed() const;

  private:
    Registry() = default;
    Registry(const Registry&) = delete;
    Registry& operator = (const Registry&) = delete;

    // Raises m_busy before locking and lowers it after unlocking.
    class Guard
    {
      public:
        Guard(const Registry& registry) : m_registry{registry} {
            ++m_registry.m_busy;
            m_registry.m_mutex.lock();
        }
        ~Guard() {
            m_registry.m_mutex.unlock();
            --m_registry.m_busy;
        }
        Guard(const Guard&) = delete;
        Guard& operator = (const Guard&) = delete;

      private:
        const Registry& m_registry;
    };

    void install_hooks_locked();
    size_t flush_locked();

    static void on_exit();
    static void on_signal(int signum);

    mutable std::mutex m_mutex;
    mutable std::atomic<int> m_busy = 0;
    std::vector<Document*> m_docs;
    bool m_hooks_installed = false;
};

inline
Registry& Registry::instance() {
    static Registry registry;
    return registry;
}

inline
void Registry::add(Document* p_doc) {
    Guard guard{*this};
    if (!m_hooks_installed) install_hooks_locked();
    if (std::find(m_docs.begin(), m_docs.end(), p_doc) == m_docs.end())
        m_docs.push_back(p_doc);
}

inline
void Registry::remove(Document* p_doc) {
    Guard guard{*this};
    auto it = std::find(m_docs.begin(), m_docs.end(), p_doc);
    if (it != m_docs.end()) m_docs.erase(it);
}

inline
bool Registry::contains(const Document* p_doc) const {
    Guard guard{*this};
    return std::find(m_docs.begin(), m_docs.end(), p_doc) != m_docs.end();
}

inline
size_t Registry::size() const {
    Guard guard{*this};
    return m_docs.size();
}

inline
size_t Registry::flush_all() {
    Guard guard{*this};
    return flush_locked();
}

inline
void Registry::install_shutdown_hooks() {
    Guard guard{*this};
    if (!m_hooks_installed) install_hooks_locked();
}

inline
bool Registry::hooks_installed() const {
    Guard guard{*this};
    return m_hooks_installed;
}

inline
void Registry::install_hooks_locked() {
    if (std::atexit(&Registry::on_exit) != 0)
        JSONDB_WARN("failed to register the atexit flush");
    std::signal(SIGINT, &Registry::on_signal);
    std::signal(SIGTERM, &Registry::on_signal);
    m_hooks_installed = true;
}

inline
void Registry::on_exit() {
    instance().flush_all();
}

inline
void Registry::on_signal(int signum) {
    auto& registry = instance();
    if (registry.m_busy == 0) {
        std::unique_lock lock{registry.m_mutex, std::try_to_lock};
        if (lock.owns_lock()) {
            JSONDB_WARN("signal {}, flushing {} document(s)", signum, registry.m_docs.size());
            registry.flush_locked();
        }
    }
    std::signal(signum, SIG_DFL);
    std::_Exit(1);
}

} // namespace jsondb
