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

#include <fmt/format.h>
#include <cstring>
#include <iostream>
#include <string_view>

// Compile-time log level, see jsondb::log::Level.
#ifndef JSONDB_LOG_LEVEL
#define JSONDB_LOG_LEVEL 2
#endif

namespace jsondb {
namespace log {

enum Level
{
    FATAL,
    ERROR,
    WARNING,
    DEBUG,
};

constexpr static int level = JSONDB_LOG_LEVEL;

constexpr auto HEADING = "\033[38;5;39m";
constexpr auto MESSAGE = " \033[38;5;39m";
constexpr auto SOURCE = "\033[38;5;7m";
constexpr auto RESTORE = "\033[0m";

/// Stream that receives log records, std::clog unless redirected.
inline
std::ostream*& sink() {
    static std::ostream* p_stream = &std::clog;
    return p_stream;
}

inline
void redirect(std::ostream& stream) { sink() = &stream; }

inline
void restore() { sink() = &std::clog; }

inline
std::string_view trim_file_name(const char* file) {
    auto len = std::strlen(file);
    return (len > 20)? std::string_view{(file + len - 20), 20}: std::string_view{file, len};
}

inline
void write(const char* file, int line, const char* level_name, const std::string_view& message) {
    auto& stream = *sink();
    stream << HEADING << level_name << SOURCE << trim_file_name(file) << ':' << line << MESSAGE <<
        message << RESTORE << std::endl;
}

template <typename ... Args>
void log(const char* file, int line, const char* level_name, const char *format, Args&& ... args) {
    write(file, line, level_name, fmt::format(fmt::runtime(format), std::forward<Args>(args)...));
}

#define JSONDB_DEBUG(...) { if (::jsondb::log::level >= ::jsondb::log::Level::DEBUG)   ::jsondb::log::log(__FILE__, __LINE__, "[DEBUG] ",   __VA_ARGS__); }
#define JSONDB_WARN(...)  { if (::jsondb::log::level >= ::jsondb::log::Level::WARNING) ::jsondb::log::log(__FILE__, __LINE__, "[WARNING] ", __VA_ARGS__); }
#define JSONDB_ERROR(...) { if (::jsondb::log::level >= ::jsondb::log::Level::ERROR)   ::jsondb::log::log(__FILE__, __LINE__, "[ERROR] ",   __VA_ARGS__); }
#define JSONDB_FATAL(...) { if (::jsondb::log::level >= ::jsondb::log::Level::FATAL)   ::jsondb::log::log(__FILE__, __LINE__, "[FATAL] ",   __VA_ARGS__); }

} // namespace log
} // namespace jsondb
