// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of VaultRelay, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <ctime>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace vaultrelay
{
namespace core
{

namespace detail
{
  /// \brief Strip the directory part of a source path at compile time.
  constexpr const char *basename(const char *path)
  {
    const char *file = path;
    while (*path)
    {
      if (*path == '/' || *path == '\\')
      {
        file = path + 1;
      }
      ++path;
    }
    return file;
  }
} // namespace detail

/// \brief Process-wide logger with levels, optional async writer, daily file
/// rotation with retention, a pre-compiled line format and an external sink.
///
/// Without a file path every line goes to stdout. Once an external handler
/// is installed, lines are delivered to it instead of stdout or the file.
class Logger
{
public:
  enum class Level
  {
    Trace,
    Debug,
    Info,
    Warning,
    Error,
    Fatal
  };

  /// \brief Receives the level, the formatted line (no trailing newline)
  /// and the bare message.
  using ExternalHandler = std::function<void(Level level, const std::string &formatted,
                                             const std::string &message)>;

  /// \brief (Re)initialise the logger.
  /// \param filePath base path for rotated files; empty logs to stdout
  static void init(Level level = Level::Info, const std::string &filePath = "",
                   bool async = false, int retentionDays = 7,
                   const std::string &timeFormat = "%Y-%m-%d %H:%M:%S")
  {
    auto &s = state();
    {
      std::lock_guard<std::mutex> lock(s.mutex);
      s.minLevel = level;
      s.basePath = filePath;
      s.retentionDays = retentionDays;
      s.timeFormat = timeFormat;
      s.currentDate.clear();
      s.file.reset();
      s.async = async;
      s.exit = false;
    }
    if (async && !s.worker.joinable())
    {
      s.worker = std::thread(&Logger::runWorker);
    }
  }

  static void setLevel(Level level)
  {
    auto &s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.minLevel = level;
  }

  static Level level()
  {
    auto &s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.minLevel;
  }

  static bool enabled(Level level)
  {
    auto &s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    return level >= s.minLevel;
  }

  /// \brief Parse "trace", "debug", "info", "warn"/"warning", "error" or
  /// "fatal" (case-insensitive).
  /// \throws std::invalid_argument for any other name
  static Level parseLevel(const std::string &name)
  {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "trace")
      return Level::Trace;
    if (lower == "debug")
      return Level::Debug;
    if (lower == "info")
      return Level::Info;
    if (lower == "warn" || lower == "warning")
      return Level::Warning;
    if (lower == "error")
      return Level::Error;
    if (lower == "fatal")
      return Level::Fatal;
    throw std::invalid_argument("unknown log level: " + name);
  }

  static const char *levelToString(Level level)
  {
    switch (level)
    {
    case Level::Trace:
      return "TRACE";
    case Level::Debug:
      return "DEBUG";
    case Level::Info:
      return "INFO";
    case Level::Warning:
      return "WARN";
    case Level::Error:
      return "ERROR";
    case Level::Fatal:
      return "FATAL";
    }
    return "UNKNOWN";
  }

  static void setExternalHandler(ExternalHandler handler)
  {
    auto &s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.external = std::move(handler);
    s.file.reset();
    s.currentDate.clear();
  }

  static void clearExternalHandler()
  {
    auto &s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.external = nullptr;
  }

  /// \brief Set the line format.
  ///
  /// Placeholders: %T timestamp, %t thread id, %L level, %m message,
  /// %F source file, %l source line, %f function, %% literal percent.
  /// An empty format is ignored.
  static void setLogFormat(const std::string &format)
  {
    if (format.empty())
    {
      return;
    }
    auto &s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.format = format;
    s.segments = compileFormat(format);
  }

  static std::string getLogFormat()
  {
    auto &s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.format;
  }

  static void log(Level level, const std::string &message)
  {
    log(level, message, "", 0, "");
  }

  static void log(Level level, const std::string &message, const char *file, int line,
                  const char *function)
  {
    auto &s = state();
    Record record{level, message, detail::basename(file), line, function,
                  std::chrono::system_clock::now(), std::this_thread::get_id()};

    std::unique_lock<std::mutex> lock(s.mutex);
    if (level < s.minLevel)
    {
      return;
    }
    if (s.async && !s.exit)
    {
      s.pending.push_back(std::move(record));
      lock.unlock();
      s.cv.notify_one();
      return;
    }
    deliver(lock, record);
  }

  /// \brief Write everything queued by the async writer.
  static void flush()
  {
    auto &s = state();
    std::unique_lock<std::mutex> lock(s.mutex);
    drain(lock);
    if (s.file)
    {
      s.file->flush();
    }
    std::cout.flush();
  }

  /// \brief Drain the queue and join the async writer.
  static void shutdown()
  {
    auto &s = state();
    {
      std::lock_guard<std::mutex> lock(s.mutex);
      s.exit = true;
    }
    s.cv.notify_all();
    if (s.worker.joinable())
    {
      s.worker.join();
    }
    flush();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.async = false;
  }

private:
  enum class Token
  {
    Literal,
    Timestamp,
    ThreadId,
    Level,
    Message,
    File,
    Line,
    Function
  };

  struct Segment
  {
    Token token;
    std::string literal;
  };

  struct Record
  {
    Level level;
    std::string message;
    const char *file;
    int line;
    const char *function;
    std::chrono::system_clock::time_point when;
    std::thread::id thread;
  };

  struct State
  {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<Record> pending;
    std::thread worker;
    bool async = false;
    bool exit = false;
    Level minLevel = Level::Info;
    std::string basePath;
    std::string currentDate;
    int retentionDays = 7;
    std::string timeFormat = "%Y-%m-%d %H:%M:%S";
    std::unique_ptr<std::ofstream> file;
    ExternalHandler external;
    std::string format = "[%T] [%L] %m";
    std::vector<Segment> segments;

    State() : segments(compileFormat(format)) {}

    ~State()
    {
      {
        std::lock_guard<std::mutex> lock(mutex);
        exit = true;
      }
      cv.notify_all();
      if (worker.joinable())
      {
        worker.join();
      }
    }
  };

  static State &state()
  {
    static State s;
    return s;
  }

  static std::vector<Segment> compileFormat(const std::string &format)
  {
    std::vector<Segment> segments;
    std::string literal;
    auto push = [&](Token token)
    {
      if (!literal.empty())
      {
        segments.push_back({Token::Literal, literal});
        literal.clear();
      }
      segments.push_back({token, ""});
    };

    for (std::size_t i = 0; i < format.size(); ++i)
    {
      if (format[i] != '%' || i + 1 == format.size())
      {
        literal += format[i];
        continue;
      }
      switch (format[++i])
      {
      case 'T':
        push(Token::Timestamp);
        break;
      case 't':
        push(Token::ThreadId);
        break;
      case 'L':
        push(Token::Level);
        break;
      case 'm':
        push(Token::Message);
        break;
      case 'F':
        push(Token::File);
        break;
      case 'l':
        push(Token::Line);
        break;
      case 'f':
        push(Token::Function);
        break;
      case '%':
        literal += '%';
        break;
      default:
        // Unknown placeholders are kept verbatim
        literal += '%';
        literal += format[i];
        break;
      }
    }
    if (!literal.empty())
    {
      segments.push_back({Token::Literal, literal});
    }
    return segments;
  }

  static std::string formatTime(std::chrono::system_clock::time_point when,
                                const std::string &fmt)
  {
    auto t = std::chrono::system_clock::to_time_t(when);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, fmt.c_str());
    if (fmt.find("%S") != std::string::npos)
    {
      auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(when.time_since_epoch()) % 1000;
      oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    }
    return oss.str();
  }

  static std::string render(const State &s, const Record &r)
  {
    std::ostringstream oss;
    for (const auto &seg : s.segments)
    {
      switch (seg.token)
      {
      case Token::Literal:
        oss << seg.literal;
        break;
      case Token::Timestamp:
        oss << formatTime(r.when, s.timeFormat);
        break;
      case Token::ThreadId:
        oss << std::hex << std::setfill('0') << std::setw(sizeof(std::size_t) * 2)
            << std::hash<std::thread::id>{}(r.thread) << std::dec;
        break;
      case Token::Level:
        oss << levelToString(r.level);
        break;
      case Token::Message:
        oss << r.message;
        break;
      case Token::File:
        oss << r.file;
        break;
      case Token::Line:
        if (r.line > 0)
        {
          oss << r.line;
        }
        break;
      case Token::Function:
        oss << r.function;
        break;
      }
    }
    return oss.str();
  }

  /// \brief Emit one record. Called with the state lock held; the lock is
  /// released around the external handler call.
  static void deliver(std::unique_lock<std::mutex> &lock, const Record &record)
  {
    auto &s = state();
    std::string line = render(s, record);
    if (s.external)
    {
      auto handler = s.external;
      lock.unlock();
      handler(record.level, line, record.message);
      lock.lock();
      return;
    }

    openFileForToday(s);
    if (s.file)
    {
      (*s.file) << line << '\n';
      s.file->flush();
    }
    else
    {
      std::cout << line << '\n';
    }
  }

  static void drain(std::unique_lock<std::mutex> &lock)
  {
    auto &s = state();
    while (!s.pending.empty())
    {
      Record record = std::move(s.pending.front());
      s.pending.pop_front();
      deliver(lock, record);
    }
  }

  static void runWorker()
  {
    auto &s = state();
    std::unique_lock<std::mutex> lock(s.mutex);
    for (;;)
    {
      s.cv.wait(lock, [&s] { return s.exit || !s.pending.empty(); });
      drain(lock);
      if (s.exit)
      {
        return;
      }
    }
  }

  static void openFileForToday(State &s)
  {
    if (s.basePath.empty())
    {
      return;
    }
    namespace fs = std::filesystem;
    std::string today = formatTime(std::chrono::system_clock::now(), "%Y-%m-%d");
    if (today == s.currentDate && s.file)
    {
      return;
    }

    fs::path base(s.basePath);
    fs::path dir = base.parent_path().empty() ? fs::current_path() : base.parent_path();
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec)
    {
      std::cerr << "[Logger] cannot create log directory " << dir << ": " << ec.message()
                << std::endl;
      return;
    }

    s.currentDate = today;
    fs::path rotated = dir / (base.filename().string() + "." + today + ".log");
    s.file = std::make_unique<std::ofstream>(rotated, std::ios::app);
    if (!s.file->is_open())
    {
      std::cerr << "[Logger] cannot open log file " << rotated << std::endl;
      s.file.reset();
    }
    pruneOldFiles(s, dir, base.filename().string() + ".");
  }

  static void pruneOldFiles(const State &s, const std::filesystem::path &dir,
                            const std::string &prefix)
  {
    if (s.retentionDays <= 0)
    {
      return;
    }
    namespace fs = std::filesystem;
    auto now = std::chrono::system_clock::now();
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec))
    {
      std::string name = it->path().filename().string();
      if (name.rfind(prefix, 0) != 0 || name.size() < prefix.size() + 10)
      {
        continue;
      }
      std::tm tm{};
      std::istringstream date(name.substr(prefix.size(), 10));
      date >> std::get_time(&tm, "%Y-%m-%d");
      if (date.fail())
      {
        continue;
      }
      auto age = std::chrono::duration_cast<std::chrono::hours>(
                   now - std::chrono::system_clock::from_time_t(std::mktime(&tm)))
                   .count() /
                 24;
      if (age >= s.retentionDays)
      {
        std::error_code rmEc;
        fs::remove(it->path(), rmEc);
        if (rmEc)
        {
          std::cerr << "[Logger] cannot remove " << it->path() << ": " << rmEc.message()
                    << std::endl;
        }
      }
    }
  }
};

} // namespace core
} // namespace vaultrelay

/// \brief Stream-style logging with source location, e.g.
/// VAULTRELAY_LOG_INFO("session " << id << " open").
#define VAULTRELAY_LOG_WITH_LEVEL(level, msg)                                                     \
  do                                                                                               \
  {                                                                                                \
    if (vaultrelay::core::Logger::enabled(vaultrelay::core::Logger::Level::level))                \
    {                                                                                              \
      std::ostringstream _vrOss;                                                                   \
      _vrOss << msg;                                                                               \
      vaultrelay::core::Logger::log(vaultrelay::core::Logger::Level::level, _vrOss.str(),         \
                                    __FILE__, __LINE__, __func__);                                 \
    }                                                                                              \
  } while (0)

#define VAULTRELAY_LOG_TRACE(msg) VAULTRELAY_LOG_WITH_LEVEL(Trace, msg)
#define VAULTRELAY_LOG_DEBUG(msg) VAULTRELAY_LOG_WITH_LEVEL(Debug, msg)
#define VAULTRELAY_LOG_INFO(msg) VAULTRELAY_LOG_WITH_LEVEL(Info, msg)
#define VAULTRELAY_LOG_WARN(msg) VAULTRELAY_LOG_WITH_LEVEL(Warning, msg)
#define VAULTRELAY_LOG_ERROR(msg) VAULTRELAY_LOG_WITH_LEVEL(Error, msg)
#define VAULTRELAY_LOG_FATAL(msg) VAULTRELAY_LOG_WITH_LEVEL(Fatal, msg)
