// Copyright (c) 2025 The Synclink Authors
// Distributed under the MIT software license

#include "network/notifications.hpp"
#include <algorithm>

namespace synclink {
namespace network {

// ============================================================================
// AddressChangeNotifier::Subscription
// ============================================================================

AddressChangeNotifier::Subscription::Subscription(AddressChangeNotifier *owner,
                                                  size_t id)
    : owner_(owner), id_(id), active_(true) {}

AddressChangeNotifier::Subscription::~Subscription() { Unsubscribe(); }

AddressChangeNotifier::Subscription::Subscription(Subscription &&other) noexcept
    : owner_(other.owner_), id_(other.id_), active_(other.active_) {
  other.owner_ = nullptr;
  other.active_ = false;
}

AddressChangeNotifier::Subscription &
AddressChangeNotifier::Subscription::operator=(Subscription &&other) noexcept {
  if (this != &other) {
    Unsubscribe();
    owner_ = other.owner_;
    id_ = other.id_;
    active_ = other.active_;
    other.owner_ = nullptr;
    other.active_ = false;
  }
  return *this;
}

void AddressChangeNotifier::Subscription::Unsubscribe() {
  if (active_ && owner_) {
    owner_->Unsubscribe(id_);
    active_ = false;
  }
}

// ============================================================================
// AddressChangeNotifier
// ============================================================================

AddressChangeNotifier::Subscription
AddressChangeNotifier::SubscribeAddressesChanged(AddressesChangedCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t id = next_id_++;

  CallbackEntry entry;
  entry.id = id;
  entry.addresses_changed = std::move(callback);
  callbacks_.push_back(std::move(entry));

  return Subscription(this, id);
}

void AddressChangeNotifier::NotifyAddressesChanged(const GenericListener &listener) {
  std::vector<AddressesChangedCallback> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot.reserve(callbacks_.size());
    for (const auto &entry : callbacks_) {
      if (entry.addresses_changed) snapshot.push_back(entry.addresses_changed);
    }
  }
  for (auto &cb : snapshot) {
    cb(listener);
  }
}

size_t AddressChangeNotifier::SubscriberCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return callbacks_.size();
}

void AddressChangeNotifier::Unsubscribe(size_t id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it =
      std::find_if(callbacks_.begin(), callbacks_.end(),
                   [id](const CallbackEntry &entry) { return entry.id == id; });

  if (it != callbacks_.end()) {
    callbacks_.erase(it);
  }
}

} // namespace network
} // namespace synclink
