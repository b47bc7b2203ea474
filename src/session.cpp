#include "session.hpp"

#include <system_error>

#include "castlink_log.hpp"
#include "castlink_protocol.hpp"
#include "frame_codec.hpp"

namespace castlink {

using namespace protocol;

namespace {

// Process-wide single-session slot
std::mutex g_slot_mtx;
const Session* g_slot_owner = nullptr;

ErrorKind streamFailureKind(ErrorKind k) {
    return k == ErrorKind::PeerClosed ? ErrorKind::PeerClosed : ErrorKind::IoError;
}

} // anonymous namespace

Session::Session(std::shared_ptr<CryptoEngine> crypto, TransportFactory factory)
    : Session(std::move(crypto), std::move(factory), Options{}) {}

Session::Session(std::shared_ptr<CryptoEngine> crypto, TransportFactory factory,
                 const Options& options)
    : crypto_(std::move(crypto)),
      factory_(std::move(factory)),
      options_(options),
      events_(options.event_queue_capacity) {
    if (options_.send_queue_capacity == 0) options_.send_queue_capacity = 1;
    if (options_.auth_failure_limit == 0) options_.auth_failure_limit = 1;
}

Session::~Session() {
    shutdown(false, "session destroyed");
}

// -----------------------------------------------------------------------------
// Process slot (lock order: state_mtx_ -> g_slot_mtx)
// -----------------------------------------------------------------------------

bool Session::acquireSlot() {
    std::lock_guard<std::mutex> lock(g_slot_mtx);
    if (g_slot_owner && g_slot_owner != this) return false;
    g_slot_owner = this;
    return true;
}

void Session::releaseSlot() {
    std::lock_guard<std::mutex> lock(g_slot_mtx);
    if (g_slot_owner == this) g_slot_owner = nullptr;
}

SessionState Session::state() const {
    std::lock_guard<std::mutex> lock(state_mtx_);
    return state_;
}

// -----------------------------------------------------------------------------
// Lifecycle
// -----------------------------------------------------------------------------

Result<void> Session::connect(TransportKind kind, const std::string& target) {
    return begin(kind, target, nullptr, false);
}

Result<void> Session::attach(std::unique_ptr<Transport> transport, const std::string& peer) {
    if (!transport) {
        return Err<void>(ErrorKind::InvalidArgument, "attach without a transport");
    }
    const TransportKind kind = transport->kind();
    return begin(kind, peer, std::move(transport), true);
}

Result<void> Session::begin(TransportKind kind, const std::string& target,
                            std::unique_ptr<Transport> transport, bool already_connected) {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mtx_);

    {
        std::lock_guard<std::mutex> lock(state_mtx_);
        if (state_ == SessionState::Connecting || state_ == SessionState::Connected) {
            return Err<void>(ErrorKind::AlreadyActive,
                             std::string("session is already ") + sessionStateName(state_));
        }
    }

    // Workers of a previous failed run have already been told to stop
    joinWorkers();
    {
        std::lock_guard<std::mutex> lock(transport_mtx_);
        transport_.reset();
    }
    {
        std::lock_guard<std::mutex> lock(queue_mtx_);
        send_queue_.clear();
    }
    {
        std::lock_guard<std::mutex> lock(video_mtx_);
        have_video_ts_ = false;
        last_video_ts_ = 0;
    }

    if (!transport) {
        transport = factory_ ? factory_(kind) : nullptr;
        if (!transport) {
            return Err<void>(ErrorKind::InvalidArgument,
                             std::string("no transport available for ") + transportKindName(kind));
        }
    }
    Transport* raw = transport.get();

    uint64_t gen = 0;
    bool stream_failed = false;
    {
        std::lock_guard<std::mutex> lock(state_mtx_);
        if (!acquireSlot()) {
            return Err<void>(ErrorKind::AlreadyActive, "another session is active in this process");
        }

        gen = generation_.load() + 1;
        generation_.store(gen);
        const SessionState from = state_;
        state_ = SessionState::Connecting;
        kind_ = kind;
        target_ = target;
        link_.reset();
        {
            std::lock_guard<std::mutex> tlock(transport_mtx_);
            transport_ = std::move(transport);
        }

        CLOG_INFO("session", "%s -> Connecting (%s %s)", sessionStateName(from),
                  transportKindName(kind), target.c_str());
        events_.push(StateChangedEvent{from, SessionState::Connecting,
                                       std::string("connect ") + transportKindName(kind) + " " + target});

        if (already_connected) {
            state_ = SessionState::Connected;
            events_.push(StateChangedEvent{SessionState::Connecting, SessionState::Connected, "carrier attached"});
            events_.push(ConnectedEvent{kind, target});
            if (!startStreams(gen, raw)) {
                fail(gen, ErrorKind::IoError, "failed to start session workers");
                stream_failed = true;
            }
        }
    }
    if (stream_failed) {
        closeTransport();
        wakeSender();
        return Err<void>(ErrorKind::IoError, "failed to start session workers");
    }

    if (!already_connected) {
        try {
            connect_thread_ = std::thread(&Session::connectWorker, this, gen, raw, target);
        } catch (const std::system_error& e) {
            CLOG_ERROR("session", "Failed to start connect worker: %s", e.what());
            {
                std::lock_guard<std::mutex> lock(state_mtx_);
                fail(gen, ErrorKind::IoError, std::string("connect worker: ") + e.what());
            }
            closeTransport();
            return Err<void>(ErrorKind::IoError, std::string("connect worker: ") + e.what());
        }
    }
    return Ok();
}

void Session::disconnect() {
    shutdown(true, "disconnect requested");
}

void Session::shutdown(bool notify, const std::string& cause) {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mtx_);

    {
        std::lock_guard<std::mutex> lock(state_mtx_);
        generation_.store(generation_.load() + 1);
        const SessionState from = state_;
        state_ = SessionState::Disconnected;
        releaseSlot();

        if (from != SessionState::Disconnected) {
            CLOG_INFO("session", "%s -> Disconnected (%s)", sessionStateName(from), cause.c_str());
        }
        if (notify) {
            if (from != SessionState::Disconnected) {
                events_.push(StateChangedEvent{from, SessionState::Disconnected, cause});
            }
            events_.push(DisconnectedEvent{cause});
        }
    }

    closeTransport();
    wakeSender();
    joinWorkers();

    {
        std::lock_guard<std::mutex> lock(transport_mtx_);
        transport_.reset();
    }
    {
        std::lock_guard<std::mutex> lock(queue_mtx_);
        send_queue_.clear();
    }
    link_.setBacklog(0);
}

Result<void> Session::reset() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mtx_);

    {
        std::lock_guard<std::mutex> lock(state_mtx_);
        if (state_ == SessionState::Disconnected) return Ok();
        if (state_ != SessionState::Error) {
            return Err<void>(ErrorKind::AlreadyActive,
                             std::string("reset while ") + sessionStateName(state_));
        }
    }

    joinWorkers();
    {
        std::lock_guard<std::mutex> lock(transport_mtx_);
        transport_.reset();
    }
    {
        std::lock_guard<std::mutex> lock(queue_mtx_);
        send_queue_.clear();
    }
    link_.setBacklog(0);

    std::lock_guard<std::mutex> lock(state_mtx_);
    state_ = SessionState::Disconnected;
    releaseSlot();
    CLOG_INFO("session", "Error -> Disconnected (reset)");
    events_.push(StateChangedEvent{SessionState::Error, SessionState::Disconnected, "reset"});
    return Ok();
}

// Caller holds state_mtx_
bool Session::startStreams(uint64_t gen, Transport* transport) {
    try {
        recv_thread_ = std::thread(&Session::receiveWorker, this, gen, transport);
        send_thread_ = std::thread(&Session::senderWorker, this, gen, transport);
    } catch (const std::system_error& e) {
        CLOG_ERROR("session", "Failed to start stream workers: %s", e.what());
        return false;
    }
    return true;
}

// Caller holds state_mtx_
void Session::fail(uint64_t gen, ErrorKind kind, const std::string& cause) {
    if (!isCurrent(gen)) return;
    if (state_ != SessionState::Connecting && state_ != SessionState::Connected) return;

    generation_.store(gen + 1);
    const SessionState from = state_;
    const SessionState to = (kind == ErrorKind::PeerClosed) ? SessionState::Disconnected
                                                            : SessionState::Error;
    state_ = to;

    if (to == SessionState::Disconnected) {
        CLOG_INFO("session", "%s -> Disconnected: %s", sessionStateName(from), cause.c_str());
        events_.push(StateChangedEvent{from, to, cause});
        events_.push(DisconnectedEvent{cause});
        releaseSlot();
    } else {
        CLOG_ERROR("session", "%s -> Error (%s): %s", sessionStateName(from),
                   errorKindName(kind), cause.c_str());
        events_.push(StateChangedEvent{from, to, cause});
        events_.push(ErrorEvent{kind, cause});
    }
}

void Session::closeTransport() {
    std::lock_guard<std::mutex> lock(transport_mtx_);
    if (transport_) transport_->close();
}

void Session::wakeSender() {
    { std::lock_guard<std::mutex> lock(queue_mtx_); }
    send_cv_.notify_all();
}

void Session::joinWorkers() {
    // The connect worker may still be starting the stream workers
    const auto self = std::this_thread::get_id();
    if (connect_thread_.joinable() && connect_thread_.get_id() != self) connect_thread_.join();
    if (recv_thread_.joinable() && recv_thread_.get_id() != self) recv_thread_.join();
    if (send_thread_.joinable() && send_thread_.get_id() != self) send_thread_.join();
}

// -----------------------------------------------------------------------------
// Workers
// -----------------------------------------------------------------------------

void Session::connectWorker(uint64_t gen, Transport* transport, std::string target) {
    auto rc = transport->connect(target);

    bool stream_failed = false;
    {
        std::lock_guard<std::mutex> lock(state_mtx_);
        if (rc.is_err()) {
            fail(gen, rc.error().kind, rc.error().message);
        } else if (isCurrent(gen) && state_ == SessionState::Connecting) {
            state_ = SessionState::Connected;
            CLOG_INFO("session", "Connecting -> Connected (%s %s)",
                      transportKindName(kind_), target.c_str());
            events_.push(StateChangedEvent{SessionState::Connecting, SessionState::Connected,
                                           "carrier established"});
            events_.push(ConnectedEvent{kind_, target});
            if (!startStreams(gen, transport)) {
                fail(gen, ErrorKind::IoError, "failed to start session workers");
                stream_failed = true;
            }
        }
    }

    if (rc.is_err() || stream_failed) {
        closeTransport();
        wakeSender();
    }
}

void Session::receiveWorker(uint64_t gen, Transport* transport) {
    CLOG_DEBUG("session", "Receive worker started");

    std::vector<uint8_t> buf(RECV_CHUNK_SIZE);
    FrameDecoder decoder;

    while (isCurrent(gen)) {
        auto rc = transport->receive(buf.data(), buf.size());
        if (rc.is_err()) {
            const ErrorKind kind = streamFailureKind(rc.error().kind);
            {
                std::lock_guard<std::mutex> lock(state_mtx_);
                fail(gen, kind, "receive: " + rc.error().message);
            }
            closeTransport();
            wakeSender();
            break;
        }

        link_.recordRecv(rc.value());
        decoder.feed(buf.data(), rc.value());

        bool keep_going = true;
        while (keep_going) {
            auto d = decoder.decodeNext();
            if (d.status == FrameDecoder::Status::NeedMoreData) break;
            if (d.status == FrameDecoder::Status::Malformed) {
                link_.recordMalformed();
                CLOG_WARN("session", "Dropped malformed frame: %s", d.error.c_str());
                continue;
            }
            keep_going = handleFrame(gen, d.frame);
        }
        if (!keep_going) break;
    }

    CLOG_DEBUG("session", "Receive worker ended");
}

bool Session::handleFrame(uint64_t gen, Frame& frame) {
    DataReceivedEvent ev;
    ev.type = frame.type;

    if (frame.type == FrameType::Video) {
        if (!crypto_) {
            {
                std::lock_guard<std::mutex> lock(state_mtx_);
                fail(gen, ErrorKind::IoError, "video received without a crypto engine");
            }
            closeTransport();
            wakeSender();
            return false;
        }

        auto plain = crypto_->open(frame.video.payload.data(), frame.video.payload.size());
        if (plain.is_err()) {
            if (plain.error().kind != ErrorKind::AuthFailed) {
                {
                    std::lock_guard<std::mutex> lock(state_mtx_);
                    fail(gen, ErrorKind::IoError, "decrypt: " + plain.error().message);
                }
                closeTransport();
                wakeSender();
                return false;
            }

            const uint32_t streak = link_.recordAuthFailure();
            if (streak >= options_.auth_failure_limit) {
                {
                    std::lock_guard<std::mutex> lock(state_mtx_);
                    fail(gen, ErrorKind::AuthFailed,
                         std::to_string(streak) + " consecutive video frames failed authentication");
                }
                closeTransport();
                wakeSender();
                return false;
            }
            CLOG_WARN("session", "Dropped video frame: %s (streak %u)",
                      plain.error().message.c_str(), streak);
            return true;
        }

        link_.recordAuthSuccess();
        ev.video.flags = frame.video.flags;
        ev.video.timestamp_us = frame.video.timestamp_us;
        ev.video.payload = std::move(plain.value());
    } else {
        ev.input = frame.input;
    }

    link_.recordFrameReceived();
    return deliver(gen, std::move(ev));
}

bool Session::deliver(uint64_t gen, SessionEvent event) {
    std::lock_guard<std::mutex> lock(state_mtx_);
    if (!isCurrent(gen)) return false;
    if (!events_.push(std::move(event), false)) {
        CLOG_DEBUG("session", "Event queue full, dropped received frame");
    }
    return true;
}

void Session::senderWorker(uint64_t gen, Transport* transport) {
    CLOG_DEBUG("session", "Sender worker started");

    for (;;) {
        Outbound item;
        {
            std::unique_lock<std::mutex> lock(queue_mtx_);
            send_cv_.wait(lock, [&] { return !send_queue_.empty() || !isCurrent(gen); });
            if (!isCurrent(gen)) break;
            item = std::move(send_queue_.front());
            send_queue_.pop_front();
            link_.setBacklog(static_cast<uint32_t>(send_queue_.size()));
        }
        if (item.generation != gen) continue;

        auto rc = transport->send(item.bytes.data(), item.bytes.size());
        if (rc.is_err()) {
            {
                std::lock_guard<std::mutex> lock(state_mtx_);
                fail(gen, streamFailureKind(rc.error().kind), "send: " + rc.error().message);
            }
            closeTransport();
            wakeSender();
            break;
        }
        link_.recordSend(item.bytes.size());
    }

    CLOG_DEBUG("session", "Sender worker ended");
}

// -----------------------------------------------------------------------------
// Outbound
// -----------------------------------------------------------------------------

bool Session::enqueue(std::vector<uint8_t> bytes) {
    const uint64_t gen = generation_.load();
    {
        std::lock_guard<std::mutex> lock(queue_mtx_);
        if (send_queue_.size() >= options_.send_queue_capacity) {
            link_.recordDrop();
            CLOG_DEBUG("session", "Send queue full (%zu), frame dropped", send_queue_.size());
            return false;
        }
        Outbound item;
        item.generation = gen;
        item.bytes = std::move(bytes);
        send_queue_.push_back(std::move(item));
        link_.setBacklog(static_cast<uint32_t>(send_queue_.size()));
    }
    send_cv_.notify_one();
    return true;
}

bool Session::sendVideoFrame(const uint8_t* payload, size_t len, uint32_t flags,
                             int64_t timestamp_us) {
    if (state() != SessionState::Connected) return false;
    if (!crypto_) {
        CLOG_ERROR("session", "sendVideoFrame without a crypto engine");
        return false;
    }

    std::lock_guard<std::mutex> lock(video_mtx_);
    if (have_video_ts_ && timestamp_us < last_video_ts_) {
        CLOG_WARN("session", "Video timestamp %lld behind %lld, frame dropped",
                  static_cast<long long>(timestamp_us), static_cast<long long>(last_video_ts_));
        link_.recordDrop();
        return false;
    }

    auto sealed = crypto_->seal(payload, len);
    if (sealed.is_err()) {
        CLOG_ERROR("session", "Encrypt failed: %s", sealed.error().message.c_str());
        link_.recordDrop();
        return false;
    }

    auto frame = encodeVideoFrame(sealed.value().data(), sealed.value().size(), flags, timestamp_us);
    if (frame.is_err()) {
        CLOG_WARN("session", "Video frame rejected: %s", frame.error().message.c_str());
        link_.recordDrop();
        return false;
    }
    if (!enqueue(std::move(frame.value()))) return false;

    have_video_ts_ = true;
    last_video_ts_ = timestamp_us;
    return true;
}

bool Session::sendInputEvent(const InputEvent& event) {
    if (state() != SessionState::Connected) return false;
    return enqueue(encodeInputEvent(event));
}

} // namespace castlink
