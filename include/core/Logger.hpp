#pragma once
/** @file  Logger.hpp
 *  @brief Asynchronous CSV event logger (runs its own worker thread).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

#include "io/FileLogger.hpp"

namespace susres {
  namespace core {

    enum class LogLevel : std::uint8_t { Trace, Info, Warning, Error };

    inline const char* toString(LogLevel l) {
      switch (l) {
      case LogLevel::Trace:
        return "TRACE";
      case LogLevel::Info:
        return "INFO";
      case LogLevel::Warning:
        return "WARN";
      case LogLevel::Error:
        return "ERROR";
      default:
        return "?";
      }
    }

    struct LogEvent {
      std::chrono::system_clock::time_point when{ std::chrono::system_clock::now() };
      LogLevel level{ LogLevel::Info };
      std::string component;
      std::string message;
    };

    template <typename T> class RingBuffer; // forward decl to avoid heavy include

    /**
 * @class Logger
 * @brief One CSV line per event: `epoch_ms,LEVEL,component,message`.
 *
 *  * `log()` never blocks on I/O; when the ring is full the oldest event is dropped.
 *  * Events logged before `startNewRun()` or after `finishRun()` are discarded.
 */
    class Logger {

    public:
      Logger();
      ~Logger(); ///< finishRun() if still running

      // --- public API ---
      void startNewRun(const std::string& path); ///< open file + launch worker thread
      void log(const LogEvent& event);           ///< enqueue event (non-blocking)
      void log(LogLevel level, std::string component, std::string message);
      void finishRun(); ///< flush + join worker thread

      bool running() const { return running_.load(); }

      /// CSV encoding of one event, message quoted when it contains ',' or '"'.
      static std::string toCsv(const LogEvent& event);

      Logger(const Logger&) = delete;
      Logger& operator=(const Logger&) = delete;

    private:
      void drain();

      static constexpr std::size_t kCapacity = 1024;

      io::FileLogger csvFile_;
      std::unique_ptr<RingBuffer<LogEvent>> buffer_;
      std::thread worker_;
      std::atomic<bool> running_{ false };
    };

  } // namespace core
} // namespace susres
