// =============================================================================
// CastLink - Stream Socket
// =============================================================================
// Blocking stream socket shared by the TCP and RFCOMM carriers: connect with a
// bounded timeout, full writes, chunked reads, and a close() that is safe to
// call from another thread while any of those are in flight.
// =============================================================================
#pragma once
#include <atomic>
#include <cstdint>
#include <cstddef>
#include <mutex>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <winsock2.h>
#include <ws2tcpip.h>
#else
#include <sys/socket.h>
#endif

#include "result.hpp"

namespace castlink {

class StreamSocket {
public:
#ifdef _WIN32
    using Handle = SOCKET;
    static constexpr Handle INVALID_HANDLE = INVALID_SOCKET;
    using AddrLen = int;
#else
    using Handle = int;
    static constexpr Handle INVALID_HANDLE = -1;
    using AddrLen = socklen_t;
#endif

    StreamSocket();
    ~StreamSocket();

    StreamSocket(const StreamSocket&) = delete;
    StreamSocket& operator=(const StreamSocket&) = delete;

    Result<void> open(int family, int type, int protocol);

    // Take ownership of an already-connected handle (accepted connection)
    void adopt(Handle handle);

    // Non-blocking connect polled in short slices so close() can abort it.
    // ECONNREFUSED -> ConnectRefused, expiry -> ConnectTimeout, other -> IoError
    // with the OS error in Error::code.
    Result<void> connect(const sockaddr* addr, AddrLen len, int timeout_ms);

    Result<void> sendAll(const uint8_t* data, size_t len);
    Result<size_t> receive(uint8_t* buf, size_t cap);

    // shutdown(); the handle itself is released in the destructor so another
    // thread never races on a reused descriptor
    void close();

    bool isClosed() const { return closed_.load(); }
    Handle handle() const { return fd_; }

    static int lastError();

private:
    Result<void> setBlocking(bool blocking);

    Handle fd_ = INVALID_HANDLE;
    std::atomic<bool> closed_{false};
    std::mutex fd_mtx_;
};

// WSAStartup once per process on Windows, no-op elsewhere
bool ensureSocketRuntime();

} // namespace castlink
