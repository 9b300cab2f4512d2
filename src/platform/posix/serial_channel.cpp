#include "fonalink/platform/posix/serial_channel.h"

#include "fonalink/core/logging.h"

#include <cerrno>
#include <cstring>
#include <memory>
#include <string>

#if !defined(_WIN32)

#include <fcntl.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>

namespace fonalink::platform::posix {

static constexpr const char* TAG = "serial";

static bool baud_to_speed(std::uint32_t baud, speed_t& out)
{
    switch (baud) {
    case 300:    out = B300;    return true;
    case 1200:   out = B1200;   return true;
    case 2400:   out = B2400;   return true;
    case 4800:   out = B4800;   return true;
    case 9600:   out = B9600;   return true;
    case 19200:  out = B19200;  return true;
    case 38400:  out = B38400;  return true;
    case 57600:  out = B57600;  return true;
    case 115200: out = B115200; return true;
    case 230400: out = B230400; return true;
    default:     return false;
    }
}

class SerialChannel : public fonalink::io::Channel {
public:
    explicit SerialChannel(int fd)
        : _fd(fd)
    {}

    ~SerialChannel() override {
        if (_fd >= 0) {
            ::close(_fd);
        }
    }

    std::size_t available() override {
        if (_fd < 0) {
            return 0;
        }

        int n = 0;
        if (::ioctl(_fd, FIONREAD, &n) != 0 || n <= 0) {
            return 0;
        }
        return static_cast<std::size_t>(n);
    }

    std::size_t read(std::uint8_t* buffer, std::size_t maxLen) override {
        if (_fd < 0 || !buffer || maxLen == 0) {
            return 0;
        }

        ssize_t n = ::read(_fd, buffer, maxLen);
        if (n <= 0) {
            return 0;
        }
        return static_cast<std::size_t>(n);
    }

    std::size_t write(const std::uint8_t* buffer, std::size_t len) override {
        if (_fd < 0) {
            return 0;
        }

        const std::uint8_t* ptr = buffer;
        std::size_t remaining = len;

        while (remaining > 0) {
            ssize_t n = ::write(_fd, ptr, remaining);
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                // Output queue full.
                if (!wait_writable()) {
                    break;
                }
                continue;
            }
            if (n <= 0) {
                FL_LOGE(TAG, "write failed: %s", std::strerror(errno));
                break;
            }
            remaining -= static_cast<std::size_t>(n);
            ptr       += n;
        }
        return len - remaining;
    }

    bool flush() override {
        if (_fd < 0) {
            return false;
        }
        return ::tcdrain(_fd) == 0;
    }

private:
    static constexpr int WRITE_WAIT_MS = 1000;

    bool wait_writable()
    {
        struct pollfd pfd;
        pfd.fd      = _fd;
        pfd.events  = POLLOUT;
        pfd.revents = 0;

        int ret = ::poll(&pfd, 1, WRITE_WAIT_MS);
        if (ret <= 0) {
            FL_LOGE(TAG, "write stalled: %s", ret == 0 ? "timeout" : std::strerror(errno));
            return false;
        }
        return (pfd.revents & POLLOUT) != 0;
    }

    int _fd;
};

std::unique_ptr<fonalink::io::Channel>
open_serial_channel(const std::string& port, std::uint32_t baud, std::string& error)
{
    speed_t speed{};
    if (!baud_to_speed(baud, speed)) {
        error = "unsupported baud rate " + std::to_string(baud);
        return nullptr;
    }

    int fd = ::open(port.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd < 0) {
        error = port + ": " + std::strerror(errno);
        return nullptr;
    }

    termios t{};
    if (::tcgetattr(fd, &t) != 0) {
        error = port + ": tcgetattr: " + std::strerror(errno);
        ::close(fd);
        return nullptr;
    }

    ::cfmakeraw(&t);
    t.c_cflag |= (CLOCAL | CREAD);
    t.c_cflag &= static_cast<tcflag_t>(~(PARENB | CSTOPB | CSIZE));
    t.c_cflag |= CS8;
    t.c_cc[VMIN] = 0;
    t.c_cc[VTIME] = 0;
    ::cfsetispeed(&t, speed);
    ::cfsetospeed(&t, speed);

    if (::tcsetattr(fd, TCSANOW, &t) != 0) {
        error = port + ": tcsetattr: " + std::strerror(errno);
        ::close(fd);
        return nullptr;
    }

    (void)::tcflush(fd, TCIOFLUSH);

    FL_LOGD(TAG, "opened %s at %u baud", port.c_str(), static_cast<unsigned>(baud));
    return std::make_unique<SerialChannel>(fd);
}

std::unique_ptr<fonalink::io::Channel>
SerialChannelFactory::open(const std::string& port, std::uint32_t baud, std::string& error)
{
    return open_serial_channel(port, baud, error);
}

} // namespace fonalink::platform::posix

#endif // !_WIN32
