/* @file Logger.cpp
 * @brief bounded queue + worker thread that feeds the CSV file
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <condition_variable>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <vector>

// SusRes headers
#include "core/Logger.hpp"

namespace susres {
  namespace core {

    /// Mutex-protected bounded FIFO; push drops the oldest element when full.
    template <typename T> class RingBuffer {
    public:
      explicit RingBuffer(std::size_t capacity) : capacity_(capacity) {}

      void push(T item) {
        {
          std::lock_guard<std::mutex> lk(mtx_);
          if (items_.size() == capacity_)
            items_.pop_front();
          items_.push_back(std::move(item));
        }
        cv_.notify_one();
      }

      /// Moves everything queued into \p out; waits up to \p wait for the first item.
      bool popAll(std::vector<T>& out, std::chrono::milliseconds wait) {
        std::unique_lock<std::mutex> lk(mtx_);
        cv_.wait_for(lk, wait, [this] { return !items_.empty() || closed_; });
        while (!items_.empty()) {
          out.push_back(std::move(items_.front()));
          items_.pop_front();
        }
        return !closed_;
      }

      void close() {
        {
          std::lock_guard<std::mutex> lk(mtx_);
          closed_ = true;
        }
        cv_.notify_all();
      }

    private:
      std::size_t capacity_;
      std::deque<T> items_;
      bool closed_{ false };
      std::mutex mtx_;
      std::condition_variable cv_;
    };

  } // namespace core
} // namespace susres

using namespace susres::core;

Logger::Logger() = default;

Logger::~Logger() { finishRun(); }

void Logger::startNewRun(const std::string& path) {
  finishRun();

  if (!csvFile_.open(path))
    throw std::runtime_error("[Logger] cannot open event log: " + path);

  buffer_ = std::make_unique<RingBuffer<LogEvent>>(kCapacity);
  running_ = true;
  worker_ = std::thread([this] { drain(); });
}

void Logger::log(const LogEvent& event) {
  if (!running_)
    return;
  buffer_->push(event);
}

void Logger::log(LogLevel level, std::string component, std::string message) {
  LogEvent event;
  event.level = level;
  event.component = std::move(component);
  event.message = std::move(message);
  log(event);
}

void Logger::finishRun() {
  if (!running_.exchange(false))
    return;
  buffer_->close();
  if (worker_.joinable())
    worker_.join();
  csvFile_.close();
}

void Logger::drain() {
  std::vector<LogEvent> batch;
  bool open = true;
  while (open) {
    open = buffer_->popAll(batch, std::chrono::milliseconds{ 200 });
    for (const auto& ev : batch)
      csvFile_.write(toCsv(ev));
    if (!batch.empty())
      csvFile_.flush();
    batch.clear();
  }
}

std::string Logger::toCsv(const LogEvent& event) {
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(event.when.time_since_epoch());

  std::string msg = event.message;
  if (msg.find_first_of(",\"\n") != std::string::npos) {
    std::string quoted = "\"";
    for (char c : msg) {
      if (c == '"')
        quoted += '"';
      quoted += c;
    }
    quoted += '"';
    msg = std::move(quoted);
  }

  return std::to_string(ms.count()) + "," + toString(event.level) + "," + event.component + "," +
         msg + "\n";
}
