#include "WebSocketTransport.hpp"
#include "../common/debug_log.hpp"

#include <atomic>
#include <future>

namespace noiselink {

void WebSocketTransport::Inbox::Push(Bytes message) {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_cancelled) {
            return;
        }
        _messages.push_back(std::move(message));
    }
    _cv.notify_one();
}

std::optional<Bytes> WebSocketTransport::Inbox::Pop() {
    std::unique_lock<std::mutex> lock(_mutex);
    _cv.wait(lock, [this]() { return _cancelled || _closed || !_messages.empty(); });

    // A remote close still hands out what already arrived; a local cancel does not.
    if (_cancelled || _messages.empty()) {
        return std::nullopt;
    }
    Bytes message = std::move(_messages.front());
    _messages.pop_front();
    return message;
}

void WebSocketTransport::Inbox::MarkClosed() {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _closed = true;
    }
    _cv.notify_all();
}

void WebSocketTransport::Inbox::Cancel() {
    size_t discarded = 0;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _cancelled = true;
        _closed = true;
        discarded = _messages.size();
        _discarded += discarded;
        _messages.clear();
    }
    _cv.notify_all();
    if (discarded > 0) {
        NOISELINK_LOG("WebSocketTransport: discarding " << discarded << " queued chunks" << NOISELINK_LOG_ENDL);
    }
}

size_t WebSocketTransport::Inbox::GetQueuedCount() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _messages.size();
}

size_t WebSocketTransport::Inbox::GetDiscardedCount() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _discarded;
}

void WebSocketTransport::Inbox::SetError(const std::string& error) {
    std::lock_guard<std::mutex> lock(_mutex);
    _error = error;
}

std::string WebSocketTransport::Inbox::GetError() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _error;
}

bool WebSocketTransport::Inbox::IsCancelled() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _cancelled;
}

WebSocketTransport::WebSocketTransport(std::chrono::milliseconds connectTimeout)
    : _inbox(std::make_shared<Inbox>())
    , _connectTimeout(connectTimeout) {
}

WebSocketTransport::~WebSocketTransport() {
    Close();
    if (auto ws = Socket()) {
        ws->resetCallbacks();
    }
}

size_t WebSocketTransport::GetQueuedCount() const {
    return _inbox->GetQueuedCount();
}

size_t WebSocketTransport::GetDiscardedCount() const {
    return _inbox->GetDiscardedCount();
}

std::shared_ptr<rtc::WebSocket> WebSocketTransport::Socket() const {
    std::lock_guard<std::mutex> lock(_wsMutex);
    return _ws;
}

bool WebSocketTransport::Open(const std::string& url) {
    auto promise = std::make_shared<std::promise<bool>>();
    auto settled = std::make_shared<std::atomic<bool>>(false);
    std::future<bool> future = promise->get_future();
    auto inbox = _inbox;
    auto ws = std::make_shared<rtc::WebSocket>();

    ws->onOpen([promise, settled]() {
        if (!settled->exchange(true)) {
            promise->set_value(true);
        }
    });
    ws->onError([promise, settled, inbox](std::string error) {
        inbox->SetError(error);
        if (!settled->exchange(true)) {
            promise->set_value(false);
        }
    });
    ws->onClosed([promise, settled, inbox]() {
        NOISELINK_LOG("WebSocketTransport: closed" << NOISELINK_LOG_ENDL);
        inbox->MarkClosed();
        if (!settled->exchange(true)) {
            promise->set_value(false);
        }
    });
    ws->onMessage(
        [inbox](rtc::binary message) {
            inbox->Push(std::move(message));
        },
        [](rtc::string text) {
            NOISELINK_LOG("WebSocketTransport: ignoring text message (" << text.size() << " bytes)" << NOISELINK_LOG_ENDL);
        }
    );

    {
        std::lock_guard<std::mutex> lock(_wsMutex);
        if (_ws) {
            _inbox->SetError("transport already used");
            return false;
        }
        if (_inbox->IsCancelled()) {
            _inbox->SetError("closed before connecting");
            return false;
        }
        _ws = ws;
    }

    try {
        ws->open(url);
    } catch (const std::exception& e) {
        _inbox->SetError(e.what());
        return false;
    }

    if (future.wait_for(_connectTimeout) != std::future_status::ready) {
        _inbox->SetError("timed out connecting to " + url);
        Close();
        return false;
    }

    if (!future.get() || _inbox->IsCancelled()) {
        if (_inbox->GetError().empty()) {
            _inbox->SetError("connection to " + url + " was closed during handshake");
        }
        return false;
    }

    NOISELINK_LOG("WebSocketTransport: connected to " << url << NOISELINK_LOG_ENDL);
    return true;
}

bool WebSocketTransport::Send(const Bytes& payload) {
    auto ws = Socket();
    if (!ws || !ws->isOpen()) {
        _inbox->SetError("send on a transport that is not open");
        return false;
    }

    try {
        if (!ws->send(payload.data(), payload.size())) {
            // libdatachannel returns false when the message is only buffered.
            NOISELINK_LOG("WebSocketTransport: " << payload.size() << " bytes buffered" << NOISELINK_LOG_ENDL);
        }
    } catch (const std::exception& e) {
        _inbox->SetError(e.what());
        return false;
    }
    return true;
}

std::optional<Bytes> WebSocketTransport::Receive() {
    return _inbox->Pop();
}

void WebSocketTransport::Close() {
    _inbox->Cancel();
    auto ws = Socket();
    if (!ws || ws->isClosed()) {
        return;
    }

    try {
        ws->close();
    } catch (const std::exception& e) {
        NOISELINK_ERROR("WebSocketTransport: error closing connection: " << e.what());
    }
}

bool WebSocketTransport::IsOpen() const {
    auto ws = Socket();
    return ws && ws->isOpen() && !_inbox->IsCancelled();
}

std::string WebSocketTransport::GetLastError() const {
    return _inbox->GetError();
}

TransportFactory MakeWebSocketTransportFactory(std::chrono::milliseconds connectTimeout) {
    return [connectTimeout]() -> TransportPtr {
        return std::make_shared<WebSocketTransport>(connectTimeout);
    };
}

} // namespace noiselink
