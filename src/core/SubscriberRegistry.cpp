/* @file SubscriberRegistry.cpp
 * @brief ordered subscriber table
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <stdexcept>
#include <tuple>

// SusRes headers
#include "core/SubscriberRegistry.hpp"

namespace susres::core {

  const char* toString(SuspendOrder o) {
    switch (o) {
    case SuspendOrder::Early:
      return "early";
    case SuspendOrder::Normal:
      return "normal";
    case SuspendOrder::Late:
      return "late";
    case SuspendOrder::Later:
      return "later";
    case SuspendOrder::Last:
      return "last";
    default:
      return "unknown";
    }
  }

  std::optional<SuspendOrder> suspendOrderFromString(const std::string& name) {
    for (auto o : { SuspendOrder::Early, SuspendOrder::Normal, SuspendOrder::Late,
                    SuspendOrder::Later, SuspendOrder::Last }) {
      if (name == toString(o))
        return o;
    }
    return std::nullopt;
  }

  std::uint64_t SubscriberRegistry::registerSubscriber(const std::string& identity,
                                                       std::string address, std::uint32_t tag,
                                                       SuspendOrder order) {
    if (identity.empty())
      throw std::invalid_argument("[SubscriberRegistry] empty identity");

    auto [it, inserted] = entries_.try_emplace(identity);
    SubscriberEntry& entry = it->second;
    if (inserted) {
      entry.identity = identity;
      entry.sequence = nextSequence_++;
    }
    entry.address = std::move(address);
    entry.tag = tag;
    entry.order = order;
    return entry.sequence;
  }

  bool SubscriberRegistry::unregisterSubscriber(const std::string& identity) {
    return entries_.erase(identity) != 0;
  }

  std::optional<SubscriberEntry> SubscriberRegistry::find(const std::string& identity) const {
    auto it = entries_.find(identity);
    if (it == entries_.end())
      return std::nullopt;
    return it->second;
  }

  SubscriberRegistry::OrderedView SubscriberRegistry::orderedView() const {
    OrderedView view;
    view.suspend.reserve(entries_.size());
    for (const auto& [id, entry] : entries_)
      view.suspend.push_back(entry);

    std::sort(view.suspend.begin(), view.suspend.end(),
              [](const SubscriberEntry& a, const SubscriberEntry& b) {
                return std::tie(a.order, a.sequence) < std::tie(b.order, b.sequence);
              });
    return view;
  }

} // namespace susres::core
