#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "../common/AudioUnit.hpp"

namespace noiselink {

// A persistent bidirectional byte-stream connection. Send and Receive may be
// called concurrently from different threads.
class Transport {
public:
    virtual ~Transport() = default;

    // Blocks until the connection is open or has failed.
    virtual bool Open(const std::string& url) = 0;

    virtual bool Send(const Bytes& payload) = 0;

    // Blocks until a message arrives. Returns std::nullopt once the transport
    // is closed, including when Close() is called during the wait.
    virtual std::optional<Bytes> Receive() = 0;

    virtual void Close() = 0;
    virtual bool IsOpen() const = 0;

    virtual std::string GetLastError() const = 0;
};

using TransportPtr = std::shared_ptr<Transport>;
using TransportFactory = std::function<TransportPtr()>;

} // namespace noiselink
