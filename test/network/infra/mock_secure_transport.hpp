#pragma once

#include "network/secure_transport.hpp"
#include <boost/asio/error.hpp>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <variant>
#include <vector>

namespace synclink {
namespace network {

// Stream that records writes and serves scripted reads
class MockSecureStream : public SecureStream {
public:
    size_t Read(std::vector<uint8_t>& buffer, boost::system::error_code& ec) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || inbound_.empty()) {
            ec = boost::asio::error::eof;
            return 0;
        }
        buffer = std::move(inbound_.front());
        inbound_.pop_front();
        ec.clear();
        return buffer.size();
    }

    size_t Write(const std::vector<uint8_t>& data, boost::system::error_code& ec) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            ec = boost::asio::error::broken_pipe;
            return 0;
        }
        written_.push_back(data);
        ec.clear();
        return data.size();
    }

    void Close() override {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }

    void QueueInbound(std::vector<uint8_t> data) {
        std::lock_guard<std::mutex> lock(mutex_);
        inbound_.push_back(std::move(data));
    }

    std::vector<std::vector<uint8_t>> written() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return written_;
    }

    bool IsClosed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

private:
    mutable std::mutex mutex_;
    std::deque<std::vector<uint8_t>> inbound_;
    std::vector<std::vector<uint8_t>> written_;
    bool closed_ = false;
};

// Session whose first stream arrives when the test calls OpenStream()
class MockSecureSession : public SecureSession {
public:
    MockSecureSession(UdpEndpoint remote = UdpEndpoint(boost::asio::ip::make_address("192.0.2.7"), 40001),
                      UdpEndpoint local = UdpEndpoint(boost::asio::ip::make_address("127.0.0.1"), 22000))
        : remote_(remote), local_(local) {}

    SecureStreamPtr AcceptStream(boost::system::error_code& ec) override {
        std::unique_lock<std::mutex> lock(mutex_);
        ++accept_stream_calls_;
        cv_.notify_all();
        cv_.wait(lock, [this]() { return closed_ || stream_ != nullptr; });
        if (closed_) {
            ec = boost::asio::error::operation_aborted;
            return nullptr;
        }
        ec.clear();
        return stream_;
    }

    void Close() override {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        ++close_calls_;
        cv_.notify_all();
    }

    UdpEndpoint RemoteEndpoint() const override { return remote_; }
    UdpEndpoint LocalEndpoint() const override { return local_; }

    std::shared_ptr<MockSecureStream> OpenStream() {
        auto stream = std::make_shared<MockSecureStream>();
        std::lock_guard<std::mutex> lock(mutex_);
        stream_ = stream;
        cv_.notify_all();
        return stream;
    }

    bool IsClosed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    int close_calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return close_calls_;
    }

    // Wait until the listener is blocked in AcceptStream()
    bool WaitForAcceptStream(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this]() { return accept_stream_calls_ > 0; });
    }

private:
    const UdpEndpoint remote_;
    const UdpEndpoint local_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::shared_ptr<MockSecureStream> stream_;
    bool closed_ = false;
    int close_calls_ = 0;
    int accept_stream_calls_ = 0;
};

// Sessions and accept errors queued by the test, handed out by Accept()
class MockAcceptQueue {
public:
    void PushSession(std::shared_ptr<MockSecureSession> session) {
        std::lock_guard<std::mutex> lock(mutex_);
        items_.push_back(std::move(session));
        cv_.notify_all();
    }

    void PushError(boost::system::error_code ec) {
        std::lock_guard<std::mutex> lock(mutex_);
        items_.push_back(ec);
        cv_.notify_all();
    }

    SecureSessionPtr Accept(boost::system::error_code& ec) {
        std::unique_lock<std::mutex> lock(mutex_);
        ++accept_calls_;
        cv_.notify_all();
        cv_.wait(lock, [this]() { return closed_ || !items_.empty(); });
        if (closed_) {
            ec = boost::asio::error::operation_aborted;
            return nullptr;
        }
        auto item = std::move(items_.front());
        items_.pop_front();
        if (auto* err = std::get_if<boost::system::error_code>(&item)) {
            ec = *err;
            return nullptr;
        }
        ec.clear();
        return std::get<std::shared_ptr<MockSecureSession>>(item);
    }

    void Close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        cv_.notify_all();
    }

    bool IsClosed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    // Wait until Accept() has been entered at least `calls` times
    bool WaitForAcceptCalls(int calls, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this, calls]() { return accept_calls_ >= calls; });
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::variant<std::shared_ptr<MockSecureSession>, boost::system::error_code>> items_;
    bool closed_ = false;
    int accept_calls_ = 0;
};

class MockSessionListener : public SessionListener {
public:
    explicit MockSessionListener(std::shared_ptr<MockAcceptQueue> queue) : queue_(std::move(queue)) {}

    SecureSessionPtr Accept(boost::system::error_code& ec) override { return queue_->Accept(ec); }
    void Close() override { queue_->Close(); }

private:
    std::shared_ptr<MockAcceptQueue> queue_;
};

// Secure transport whose listeners are driven by the test through MockAcceptQueue
class MockSecureTransport : public SecureTransport {
public:
    std::unique_ptr<SessionListener> Listen(PacketConnPtr conn, const TlsConfig&,
                                            boost::system::error_code& ec) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++listen_calls_;
        if (listen_error_) {
            ec = listen_error_;
            cv_.notify_all();
            return nullptr;
        }
        ec.clear();
        conn_ = std::move(conn);
        queue_ = std::make_shared<MockAcceptQueue>();
        cv_.notify_all();
        return std::make_unique<MockSessionListener>(queue_);
    }

    void SetListenError(boost::system::error_code ec) {
        std::lock_guard<std::mutex> lock(mutex_);
        listen_error_ = ec;
    }

    // Accept queue of the most recent successful Listen(), waiting for it if needed
    std::shared_ptr<MockAcceptQueue> WaitForListen(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this]() { return queue_ != nullptr; });
        return queue_;
    }

    PacketConnPtr listened_conn() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return conn_;
    }

    int listen_calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return listen_calls_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    boost::system::error_code listen_error_;
    PacketConnPtr conn_;
    std::shared_ptr<MockAcceptQueue> queue_;
    int listen_calls_ = 0;
};

} // namespace network
} // namespace synclink
