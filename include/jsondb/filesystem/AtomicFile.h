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
#include <jsondb/support/logging.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <string>
#include <string_view>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <fmt/format.h>

namespace jsondb::filesystem {

/////////////////////////////////////////////////////////////////////////////
/// Raised when a document cannot be read from, or written to, the filesystem.
/// When the failure happened while writing the temporary file, temp_path()
/// names the file that was left behind.
/////////////////////////////////////////////////////////////////////////////
class PersistenceError : public JsondbException
{
  public:
    PersistenceError(const std::filesystem::path& target, const std::filesystem::path& temp, const std::string& error)
      : JsondbException(fmt::format("{} ({})", error, temp.empty()? target.string(): temp.string()))
      , m_target{target}
      , m_temp{temp}
    {}

    const std::filesystem::path& target_path() const { return m_target; }
    const std::filesystem::path& temp_path() const   { return m_temp; }

  private:
    std::filesystem::path m_target;
    std::filesystem::path m_temp;
};

/// Sibling of the target through which the target is atomically replaced.
inline
std::filesystem::path temp_path(const std::filesystem::path& target) {
    auto path = target;
    path += ".tmp";
    return path;
}

/////////////////////////////////////////////////////////////////////////////
/// @brief Replaces a file atomically.
/// Text is written to a temporary file in the same directory as the target,
/// and commit() renames it over the target. The target is never observed in
/// a partially written state. If the AtomicFile is destroyed before commit()
/// succeeds, the temporary file is closed and left in place.
/////////////////////////////////////////////////////////////////////////////
class AtomicFile
{
  public:
    AtomicFile(const std::filesystem::path& target, bool sync = true);
    ~AtomicFile();

    AtomicFile(const AtomicFile&) = delete;
    AtomicFile& operator = (const AtomicFile&) = delete;

    void write(const std::string_view& text);
    void commit();

    const std::filesystem::path& target() const { return m_target; }
    const std::filesystem::path& temp() const   { return m_temp; }
    bool is_committed() const                   { return m_committed; }

  private:
    [[noreturn]] void report_error(const char* operation, int error) const;
    void sync_parent() const;

    std::filesystem::path m_target;
    std::filesystem::path m_temp;
    bool m_sync;
    int m_fd = -1;
    bool m_committed = false;
};

inline
AtomicFile::AtomicFile(const std::filesystem::path& target, bool sync)
  : m_target{target}
  , m_temp{temp_path(target)}
  , m_sync{sync}
{
    m_fd = ::open(m_temp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0666);
    if (m_fd < 0) report_error("open", errno);
}

inline
AtomicFile::~AtomicFile() {
    if (m_fd >= 0) {
        ::close(m_fd);
        JSONDB_DEBUG("left uncommitted temporary file: {}", m_temp.string());
    }
}

inline
void AtomicFile::write(const std::string_view& text) {
    JSONDB_ASSERT(m_fd >= 0);
    const char* buf = text.data();
    size_t written = 0;
    while (written < text.size()) {
        auto n = ::write(m_fd, buf + written, text.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            report_error("write", errno);
        }
        written += (size_t)n;
    }
}

inline
void AtomicFile::commit() {
    JSONDB_ASSERT(m_fd >= 0);

    if (m_sync && ::fsync(m_fd) != 0)
        report_error("fsync", errno);

    // keep the permissions of the file being replaced
    struct stat target_stat;
    if (::stat(m_target.c_str(), &target_stat) == 0) {
        if (::fchmod(m_fd, target_stat.st_mode & 07777) != 0)
            report_error("fchmod", errno);
    }

    int fd = m_fd;
    m_fd = -1;
    if (::close(fd) != 0)
        report_error("close", errno);

    if (std::rename(m_temp.c_str(), m_target.c_str()) != 0)
        report_error("rename", errno);

    m_committed = true;

    if (m_sync) sync_parent();
}

// Makes the new directory entry durable. The rename already happened, so a
// failure here is only logged.
inline
void AtomicFile::sync_parent() const {
    auto dir = m_target.parent_path();
    if (dir.empty()) dir = ".";
    int dfd = ::open(dir.c_str(), O_DIRECTORY | O_RDONLY | O_CLOEXEC);
    if (dfd < 0) {
        JSONDB_WARN("open(dir) failed for '{}': {}", dir.string(), std::strerror(errno));
        return;
    }
    if (::fsync(dfd) != 0)
        JSONDB_WARN("fsync(dir) failed for '{}': {}", dir.string(), std::strerror(errno));
    ::close(dfd);
}

inline
void AtomicFile::report_error(const char* operation, int error) const {
    throw PersistenceError(m_target, m_temp, fmt::format("{} failed: {}", operation, std::strerror(error)));
}

/// Writes text to the target through an AtomicFile.
inline
void atomic_write(const std::filesystem::path& target, const std::string_view& text, bool sync = true) {
    AtomicFile file{target, sync};
    file.write(text);
    file.commit();
}

} // namespace jsondb::filesystem
