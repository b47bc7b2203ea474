// =============================================================================
// CastLink - Session
// =============================================================================
// The single end-to-end mirroring connection and its state machine:
//
//   Disconnected -> Connecting -> Connected -> {Disconnected, Error}
//   Error -> Disconnected only via reset() or disconnect()
//
// Threads per session:
//   connect worker  - Transport::connect, so connect() never blocks the caller
//   receive worker  - blocking read -> decode -> decrypt -> DataReceivedEvent
//   sender worker   - drains the bounded send queue in submission order
//
// At most one Session per process is outside Disconnected at any time.
// All notifications go to events(); nothing calls back into caller code.
// =============================================================================
#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "crypto_engine.hpp"
#include "event_channel.hpp"
#include "link_monitor.hpp"
#include "result.hpp"
#include "session_events.hpp"
#include "transport.hpp"

namespace castlink {

class Session {
public:
    struct Options {
        size_t send_queue_capacity = 64;    // frames
        size_t event_queue_capacity = 256;  // data events; lifecycle events bypass
        uint32_t auth_failure_limit = 3;    // consecutive decrypt failures -> Error
    };

    Session(std::shared_ptr<CryptoEngine> crypto,
            TransportFactory factory = defaultTransportFactory());
    Session(std::shared_ptr<CryptoEngine> crypto, TransportFactory factory, const Options& options);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Starts an asynchronous connect. AlreadyActive if this session is
    // Connecting/Connected or another session holds the process slot.
    Result<void> connect(TransportKind kind, const std::string& target);

    // Runs the session over an already-connected carrier (receiver side)
    Result<void> attach(std::unique_ptr<Transport> transport, const std::string& peer = "");

    // Idempotent. Always posts exactly one DisconnectedEvent.
    void disconnect();

    // Error -> Disconnected. AlreadyActive while Connecting/Connected.
    Result<void> reset();

    // Encrypt + frame + enqueue. False when not Connected or the frame was dropped.
    // Video timestamps must not decrease within a connection; an older
    // timestamp is dropped.
    bool sendVideoFrame(const uint8_t* payload, size_t len, uint32_t flags, int64_t timestamp_us);
    bool sendInputEvent(const InputEvent& event);

    SessionState state() const;
    EventChannel<SessionEvent>& events() { return events_; }
    LinkMonitor& link() { return link_; }

private:
    struct Outbound {
        uint64_t generation;
        std::vector<uint8_t> bytes;
    };

    bool acquireSlot();
    void releaseSlot();

    bool isCurrent(uint64_t gen) const { return generation_.load() == gen; }
    Result<void> begin(TransportKind kind, const std::string& target,
                       std::unique_ptr<Transport> transport, bool already_connected);
    bool startStreams(uint64_t gen, Transport* transport);
    void shutdown(bool notify, const std::string& cause);
    void joinWorkers();
    void closeTransport();
    void wakeSender();

    bool enqueue(std::vector<uint8_t> bytes);
    bool deliver(uint64_t gen, SessionEvent event);

    void connectWorker(uint64_t gen, Transport* transport, std::string target);
    void receiveWorker(uint64_t gen, Transport* transport);
    void senderWorker(uint64_t gen, Transport* transport);
    bool handleFrame(uint64_t gen, Frame& frame);

    // Fatal fault from a worker. Ignored unless `gen` is still current, so
    // one fault produces one terminal notification.
    void fail(uint64_t gen, ErrorKind kind, const std::string& cause);

    std::shared_ptr<CryptoEngine> crypto_;
    TransportFactory factory_;
    Options options_;

    // Serializes connect/attach/disconnect/reset
    std::mutex lifecycle_mtx_;

    // State plus generation; generation_ is written only under state_mtx_
    mutable std::mutex state_mtx_;
    SessionState state_ = SessionState::Disconnected;
    std::atomic<uint64_t> generation_{0};
    TransportKind kind_ = TransportKind::WifiSocket;
    std::string target_;

    std::mutex transport_mtx_;
    std::unique_ptr<Transport> transport_;

    std::thread connect_thread_;
    std::thread recv_thread_;
    std::thread send_thread_;

    // Held across seal+enqueue so queued video stays in timestamp order
    std::mutex video_mtx_;
    bool have_video_ts_ = false;
    int64_t last_video_ts_ = 0;

    std::mutex queue_mtx_;
    std::condition_variable send_cv_;
    std::deque<Outbound> send_queue_;

    EventChannel<SessionEvent> events_;
    LinkMonitor link_;
};

} // namespace castlink
