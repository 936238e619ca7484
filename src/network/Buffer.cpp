#include "apisim/network/Buffer.h"

#include <cerrno>
#include <sys/uio.h>
#include <unistd.h>

namespace apisim {
namespace network {

namespace {
// Spill area for reads larger than the free tail; one per loop thread.
constexpr size_t kSpillSize = 64 * 1024;
thread_local char tSpill[kSpillSize];
} // namespace

ssize_t Buffer::ReadFd(int fd, int* savedErrno) {
    const size_t room = WritableBytes();
    struct iovec iov[2] = {
        {BeginWrite(), room},
        {tSpill, kSpillSize},
    };
    const ssize_t n = ::readv(fd, iov, room < kSpillSize ? 2 : 1);
    if (n < 0) {
        *savedErrno = errno;
        return n;
    }

    const size_t got = static_cast<size_t>(n);
    HasWritten(got < room ? got : room);
    if (got > room) {
        Append(tSpill, got - room);
    }
    return n;
}

} // namespace network
} // namespace apisim
