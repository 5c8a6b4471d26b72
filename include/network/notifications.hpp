// Copyright (c) 2025 The Synclink Authors
// Distributed under the MIT software license

#pragma once

#include <functional>
#include <mutex>
#include <vector>

namespace synclink {
namespace network {

class GenericListener;

/**
 * AddressChangeNotifier - fan-out of "this listener's addresses changed"
 *
 * Each listener owns one. The connection service subscribes to learn when
 * WANAddresses()/LANAddresses() should be re-read (e.g. to re-announce to
 * discovery servers).
 *
 * Design:
 * - Simple observer pattern with std::function
 * - RAII-based subscription management
 * - Callbacks run synchronously on the notifying thread, outside the
 *   notifier's lock. The notifying listener also releases its own state
 *   lock first, since callbacks usually call back into WANAddresses().
 */
class AddressChangeNotifier {
public:
  /**
   * Subscription handle - RAII wrapper
   * Automatically unsubscribes when destroyed
   */
  class Subscription {
  public:
    Subscription() = default;
    ~Subscription();

    // Movable but not copyable
    Subscription(Subscription &&other) noexcept;
    Subscription &operator=(Subscription &&other) noexcept;
    Subscription(const Subscription &) = delete;
    Subscription &operator=(const Subscription &) = delete;

    void Unsubscribe();

  private:
    friend class AddressChangeNotifier;
    Subscription(AddressChangeNotifier *owner, size_t id);

    AddressChangeNotifier *owner_{nullptr};
    size_t id_{0};
    bool active_{false};
  };

  using AddressesChangedCallback = std::function<void(const GenericListener &listener)>;

  AddressChangeNotifier() = default;
  AddressChangeNotifier(const AddressChangeNotifier &) = delete;
  AddressChangeNotifier &operator=(const AddressChangeNotifier &) = delete;

  [[nodiscard]] Subscription SubscribeAddressesChanged(AddressesChangedCallback callback);

  // Invoke every subscriber with `listener`. Exceptions from subscribers
  // propagate to the caller.
  void NotifyAddressesChanged(const GenericListener &listener);

  size_t SubscriberCount() const;

private:
  void Unsubscribe(size_t id);

  struct CallbackEntry {
    size_t id;
    AddressesChangedCallback addresses_changed;
  };

  mutable std::mutex mutex_;
  std::vector<CallbackEntry> callbacks_;
  size_t next_id_{1}; // 0 reserved for invalid
};

} // namespace network
} // namespace synclink
