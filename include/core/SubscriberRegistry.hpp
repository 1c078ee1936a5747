#pragma once
/** @file  SubscriberRegistry.hpp
 *  @brief Identity -> notification target, in suspend order.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace susres::core {

  /// Coarse ordering class; registration order breaks ties inside a class.
  enum class SuspendOrder : std::uint8_t { Early, Normal, Late, Later, Last };

  const char* toString(SuspendOrder o);
  std::optional<SuspendOrder> suspendOrderFromString(const std::string& name);

  struct SubscriberEntry {
    std::string identity;   ///< opaque connection handle
    std::string address;    ///< notification target (socket path)
    std::uint32_t tag{ 0 }; ///< notification opcode
    SuspendOrder order{ SuspendOrder::Normal };
    std::uint64_t sequence{ 0 }; ///< registration sequence number, stable across updates
  };

  /**
 * @class SubscriberRegistry
 * @brief One live entry per identity; no I/O.
 *
 *  * The suspend order is stored nowhere: it is sorted out of the map on
 *    every read and the resume order is its reverse.
 *  * Re-registration keeps the sequence number, so an update never moves an
 *    entry to the back.
 */
  class SubscriberRegistry {
  public:
    struct OrderedView {
      std::vector<SubscriberEntry> suspend; ///< ascending

      /// Descending; always the exact reverse of `suspend`.
      std::vector<SubscriberEntry> resume() const { return { suspend.rbegin(), suspend.rend() }; }
    };

    /// Insert or update in place. Returns the registration id (sequence number).
    std::uint64_t registerSubscriber(const std::string& identity, std::string address,
                                     std::uint32_t tag,
                                     SuspendOrder order = SuspendOrder::Normal);

    /// Removes \p identity; returns false (and does nothing) if it was never registered.
    bool unregisterSubscriber(const std::string& identity);

    std::optional<SubscriberEntry> find(const std::string& identity) const;
    bool contains(const std::string& identity) const { return entries_.count(identity) != 0; }
    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    OrderedView orderedView() const;

  private:
    std::unordered_map<std::string, SubscriberEntry> entries_;
    std::uint64_t nextSequence_{ 1 };
  };

} // namespace susres::core
