/* @file NotificationManager.cpp
 * @brief manages the blocking notify/ack round-trips with subscriber servers
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <string>
#include <utility>

// SusRes headers
#include "core/NotificationManager.hpp"

using namespace susres::core;

NotificationManager::NotificationManager(std::shared_ptr<ErrorMonitor> errorMonitor,
                                         io::ChannelFactory factory, Clock clock)
    : errorMonitor_(std::move(errorMonitor)), factory_(std::move(factory)),
      clock_(std::move(clock)) {
  if (!errorMonitor_)
    throw std::invalid_argument("[NotificationManager] error monitor is nullptr");
  if (!factory_ || !clock_)
    throw std::invalid_argument("[NotificationManager] channel factory and clock are required");
}

susres::io::MessageChannel& NotificationManager::channelFor(const SubscriberEntry& entry) {
  auto it = links_.find(entry.identity);
  if (it != links_.end() && it->second.address == entry.address && it->second.channel->isOpen())
    return *it->second.channel;

  auto channel = factory_(entry.address);
  if (!channel || !channel->open(entry.address)) {
    links_.erase(entry.identity);
    std::string errMsg = "[NotificationManager] subscriber: " + entry.identity +
                         " unreachable at " + entry.address;
    errorMonitor_->notifyFailure(errMsg);
    throw std::runtime_error(errMsg);
  }

  auto& link = links_[entry.identity];
  link.address = entry.address;
  link.channel = std::move(channel);
  return *link.channel;
}

void NotificationManager::sendNotification(const SubscriberEntry& entry,
                                           const protocols::Notification& n) {
  auto& channel = channelFor(entry);

  if (!channel.writeLine(n.toWire())) {
    links_.erase(entry.identity);
    std::string errMsg = "[NotificationManager] failed to write " + std::string(toString(n.phase)) +
                         " to subscriber: " + entry.identity;
    errorMonitor_->notifyFailure(errMsg);
    throw std::runtime_error(errMsg);
  }
}

std::optional<susres::protocols::Ack>
NotificationManager::awaitAck(const std::string& identity, std::uint64_t cycleId,
                              std::chrono::milliseconds timeout) {
  auto it = links_.find(identity);
  if (it == links_.end())
    return std::nullopt;

  const auto deadline = clock_() + timeout;
  while (true) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock_());
    if (left.count() <= 0)
      return std::nullopt;

    auto line = it->second.channel->readLine(left);
    if (!line)
      return std::nullopt; // timeout or peer closed

    auto ack = protocols::Ack::fromWire(*line);
    if (ack && ack->cycleId == cycleId)
      return ack;
    // left over from an earlier cycle, or not an ack at all
  }
}

void NotificationManager::dropChannel(const std::string& identity) { links_.erase(identity); }
