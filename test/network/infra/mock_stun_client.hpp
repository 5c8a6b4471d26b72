#pragma once

#include "network/stun.hpp"
#include <boost/asio/error.hpp>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace synclink {
namespace network {

// Scripted STUN answers shared between a test and the clients it hands out.
//
// Discover() and Keepalive() pop their queue; the last keepalive answer
// sticks so a stable mapping can run for any number of rounds. An empty
// queue answers with connection_refused.
class MockStunScript {
public:
    static StunResult Mapped(NatType type, const std::string& ip, uint16_t port) {
        StunResult r;
        r.nat_type = type;
        r.external = UdpEndpoint(boost::asio::ip::make_address(ip), port);
        return r;
    }

    static StunResult Failed() {
        StunResult r;
        r.nat_type = NatType::ERROR;
        r.error = boost::asio::error::connection_refused;
        return r;
    }

    void QueueDiscover(StunResult result) {
        std::lock_guard<std::mutex> lock(mutex_);
        discover_.push_back(std::move(result));
    }

    void QueueKeepalive(StunResult result) {
        std::lock_guard<std::mutex> lock(mutex_);
        keepalive_.push_back(std::move(result));
    }

    StunResult NextDiscover() {
        std::lock_guard<std::mutex> lock(mutex_);
        ++discover_calls_;
        discover_times_.push_back(std::chrono::steady_clock::now());
        cv_.notify_all();
        if (discover_.empty()) return Failed();
        StunResult r = discover_.front();
        discover_.pop_front();
        return r;
    }

    StunResult NextKeepalive() {
        std::lock_guard<std::mutex> lock(mutex_);
        ++keepalive_calls_;
        cv_.notify_all();
        if (keepalive_.empty()) return Failed();
        StunResult r = keepalive_.front();
        if (keepalive_.size() > 1) keepalive_.pop_front();
        return r;
    }

    void RecordServer(const UdpEndpoint& server) {
        std::lock_guard<std::mutex> lock(mutex_);
        servers_.push_back(server);
    }

    void RecordSoftwareName(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        software_names_.push_back(name);
    }

    bool WaitForDiscoverCalls(int calls, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&]() { return discover_calls_ >= calls; });
    }

    bool WaitForKeepaliveCalls(int calls, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&]() { return keepalive_calls_ >= calls; });
    }

    int discover_calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return discover_calls_;
    }

    int keepalive_calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return keepalive_calls_;
    }

    std::vector<std::chrono::steady_clock::time_point> discover_times() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return discover_times_;
    }

    std::vector<UdpEndpoint> servers() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return servers_;
    }

    std::vector<std::string> software_names() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return software_names_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<StunResult> discover_;
    std::deque<StunResult> keepalive_;
    int discover_calls_ = 0;
    int keepalive_calls_ = 0;
    std::vector<std::chrono::steady_clock::time_point> discover_times_;
    std::vector<UdpEndpoint> servers_;
    std::vector<std::string> software_names_;
};

class MockStunClient : public StunClient {
public:
    MockStunClient(std::shared_ptr<MockStunScript> script, PacketConnPtr conn)
        : script_(std::move(script)), conn_(std::move(conn)) {}

    void SetServerAddress(const UdpEndpoint& server) override { script_->RecordServer(server); }
    void SetSoftwareName(const std::string& name) override { script_->RecordSoftwareName(name); }
    StunResult Discover() override { return script_->NextDiscover(); }
    StunResult Keepalive() override { return script_->NextKeepalive(); }

    const PacketConnPtr& conn() const { return conn_; }

private:
    std::shared_ptr<MockStunScript> script_;
    PacketConnPtr conn_;
};

inline StunClientFactory MockStunClientFactory(std::shared_ptr<MockStunScript> script) {
    return [script](PacketConnPtr conn) -> std::unique_ptr<StunClient> {
        return std::make_unique<MockStunClient>(script, std::move(conn));
    };
}

} // namespace network
} // namespace synclink
