#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <rtc/rtc.hpp>
#include <rtc/websocket.hpp>

#include "Transport.hpp"

namespace noiselink {

// Transport over a libdatachannel WebSocket. Every binary message is one
// chunk of PCM; text messages are not part of the protocol and are dropped.
class WebSocketTransport : public Transport {
public:
    explicit WebSocketTransport(std::chrono::milliseconds connectTimeout);
    ~WebSocketTransport() override;

    WebSocketTransport(const WebSocketTransport&) = delete;
    WebSocketTransport& operator=(const WebSocketTransport&) = delete;

    bool Open(const std::string& url) override;
    bool Send(const Bytes& payload) override;
    std::optional<Bytes> Receive() override;
    void Close() override;
    bool IsOpen() const override;
    std::string GetLastError() const override;

    // Chunks received but not yet handed out by Receive().
    size_t GetQueuedCount() const;
    // Chunks dropped unread by a local Close().
    size_t GetDiscardedCount() const;

private:
    // Shared with the websocket callbacks, which run on libdatachannel threads
    // and may outlive a single Receive() call.
    class Inbox {
    public:
        void Push(Bytes message);
        std::optional<Bytes> Pop();
        void MarkClosed();
        void Cancel();
        void SetError(const std::string& error);
        std::string GetError() const;
        bool IsCancelled() const;
        size_t GetQueuedCount() const;
        size_t GetDiscardedCount() const;

    private:
        mutable std::mutex _mutex;
        std::condition_variable _cv;
        std::deque<Bytes> _messages;
        bool _closed = false;
        bool _cancelled = false;
        size_t _discarded = 0;
        std::string _error;
    };

    std::shared_ptr<rtc::WebSocket> Socket() const;

    // Close() may run on another thread while Open() is still waiting.
    mutable std::mutex _wsMutex;
    std::shared_ptr<rtc::WebSocket> _ws;
    std::shared_ptr<Inbox> _inbox;
    std::chrono::milliseconds _connectTimeout;
};

// Factory producing a fresh WebSocketTransport per connection attempt.
TransportFactory MakeWebSocketTransportFactory(std::chrono::milliseconds connectTimeout);

} // namespace noiselink
