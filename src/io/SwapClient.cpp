/* @file SwapClient.cpp
 * @brief request/response client for the swap server
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <iostream>
#include <stdexcept>
#include <utility>

// SusRes headers
#include "io/SwapClient.hpp"

using namespace susres::io;

ChannelSwapClient::ChannelSwapClient(std::unique_ptr<MessageChannel> channel, std::string address,
                                     std::chrono::milliseconds timeout)
    : channel_(std::move(channel)), address_(std::move(address)), timeout_(timeout) {
  if (!channel_)
    throw std::invalid_argument("[ChannelSwapClient] channel is nullptr");
}

bool ChannelSwapClient::roundTrip(const std::string& request) {
  if (!channel_->isOpen() && !channel_->open(address_)) {
    std::cerr << "[ChannelSwapClient] swap server at " << address_ << " unreachable\n";
    return false;
  }

  if (!channel_->writeLine(request)) {
    channel_->close();
    return false;
  }

  auto reply = channel_->readLine(timeout_);
  if (!reply) {
    std::cerr << "[ChannelSwapClient] no reply to " << request << "\n";
    channel_->close();
    return false;
  }
  if (*reply != "OK") {
    std::cerr << "[ChannelSwapClient] " << request << " failed: " << *reply << "\n";
    return false;
  }
  return true;
}
