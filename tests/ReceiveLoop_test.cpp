#include "AudioSink/CollectingSink.hpp"
#include "ReceiveLoop/ReceiveLoop.hpp"
#include "test_utils.hpp"

using namespace test_utils;

namespace {

bool PreservesArrivalOrder() {
    MockNetwork network;
    auto transport = std::make_shared<MockTransport>(network);
    CHECK(transport->Open("mock://endpoint"));

    nl::CollectingSink sink;
    nl::ReceiveLoop loop(transport, sink, 16000, 1);
    loop.Start();
    CHECK(loop.IsRunning());

    transport->Feed(MakeTagged('A'));
    transport->Feed(MakeTagged('B'));
    transport->Feed(MakeTagged('C'));
    CHECK(WaitFor([&]() { return sink.GetUnitCount() == 3; }));

    auto units = sink.GetUnits();
    CHECK(units[0].data == MakeTagged('A'));
    CHECK(units[1].data == MakeTagged('B'));
    CHECK(units[2].data == MakeTagged('C'));
    for (const auto& unit : units) {
        CHECK(unit.sampleRate == 16000);
        CHECK(unit.channels == 1);
    }
    CHECK(loop.GetReceivedCount() == 3);

    loop.Stop();
    CHECK(!loop.IsRunning());
    return true;
}

bool RemoteCloseEndsLoop() {
    MockNetwork network;
    auto transport = std::make_shared<MockTransport>(network);
    CHECK(transport->Open("mock://endpoint"));

    nl::CollectingSink sink;
    nl::ReceiveLoop loop(transport, sink, 48000, 2);
    loop.Start();

    transport->Feed(MakeTagged('X'));
    transport->RemoteClose();
    CHECK(WaitFor([&]() { return !loop.IsRunning(); }));

    // What arrived before the close is still delivered.
    CHECK(sink.GetUnitCount() == 1);
    CHECK(sink.GetErrors().size() == 1);
    return true;
}

bool StopInterruptsPendingReceive() {
    MockNetwork network;
    auto transport = std::make_shared<MockTransport>(network);
    CHECK(transport->Open("mock://endpoint"));

    nl::CollectingSink sink;
    nl::ReceiveLoop loop(transport, sink, 16000, 1);
    loop.Start();
    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    auto start = std::chrono::steady_clock::now();
    loop.Stop();
    CHECK(std::chrono::steady_clock::now() - start < std::chrono::seconds(1));
    CHECK(!loop.IsRunning());
    CHECK(!transport->IsOpen());
    // A requested stop is not reported as a failure.
    CHECK(sink.GetErrors().empty());

    loop.Stop();
    return true;
}

// Stops its own loop from inside the first callback.
class StoppingSink : public nl::AudioSink {
public:
    void PushAudio(nl::OutputUnit unit) override {
        (void)unit;
        ++pushed;
        if (loop) {
            loop->Stop();
        }
    }

    nl::ReceiveLoop* loop = nullptr;
    std::atomic<int> pushed{0};
};

bool StopFromSinkCallback() {
    MockNetwork network;
    auto transport = std::make_shared<MockTransport>(network);
    CHECK(transport->Open("mock://endpoint"));

    StoppingSink sink;
    nl::ReceiveLoop loop(transport, sink, 16000, 1);
    sink.loop = &loop;
    loop.Start();

    transport->Feed(MakeTagged('A'));
    CHECK(WaitFor([&]() { return !loop.IsRunning(); }));
    CHECK(sink.pushed == 1);
    return true;
}

bool EmptyChunksAreSkipped() {
    MockNetwork network;
    auto transport = std::make_shared<MockTransport>(network);
    CHECK(transport->Open("mock://endpoint"));

    nl::CollectingSink sink;
    nl::ReceiveLoop loop(transport, sink, 16000, 1);
    loop.Start();

    transport->Feed(nl::Bytes());
    transport->Feed(MakeTagged('Z'));
    CHECK(WaitFor([&]() { return sink.GetUnitCount() == 1; }));
    CHECK(sink.GetUnits()[0].data == MakeTagged('Z'));
    return true;
}

} // namespace

int main() {
    TestRunner runner("ReceiveLoop");
    runner.Run("preserves arrival order", PreservesArrivalOrder);
    runner.Run("remote close ends the loop", RemoteCloseEndsLoop);
    runner.Run("stop interrupts a pending receive", StopInterruptsPendingReceive);
    runner.Run("stop from a sink callback", StopFromSinkCallback);
    runner.Run("empty chunks are skipped", EmptyChunksAreSkipped);
    return runner.Finish();
}
