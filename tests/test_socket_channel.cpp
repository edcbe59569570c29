#include "multiplexer_device.hpp"
#include "socket_channel.hpp"
#include "test_support.hpp"
#include <arpa/inet.h>
#include <cstring>
#include <fcntl.h>
#include <gtest/gtest.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace nmeascout;
using namespace nmeascout::test;

namespace
{

// Loopback listener. With `saturate` its accept backlog is filled so further
// connects stay pending.
class LoopbackListener {
public:
    explicit LoopbackListener(bool saturate)
    {
        fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        ::bind(fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr));
        ::listen(fd_, 0);
        socklen_t len = sizeof(addr);
        ::getsockname(fd_, reinterpret_cast<sockaddr *>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        if (!saturate)
            return;
        for (int i = 0; i < 4; ++i)
        {
            int c = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0);
            ::connect(c, reinterpret_cast<sockaddr *>(&addr), sizeof(addr));
            fillers_.push_back(c);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    ~LoopbackListener()
    {
        for (int c : fillers_)
            ::close(c);
        ::close(fd_);
    }

    int port() const { return port_; }
    int fd() const { return fd_; }

private:
    int fd_;
    int port_;
    std::vector<int> fillers_;
};

int msSince(const std::chrono::steady_clock::time_point &start)
{
    return static_cast<int>(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count());
}

} // namespace

TEST(SocketChannel, SplitAddressRejectsMalformedPorts)
{
    std::string host;
    int port = 0;
    EXPECT_TRUE(SocketChannel::splitAddress("127.0.0.1:2947", host, port));
    EXPECT_EQ(host, "127.0.0.1");
    EXPECT_EQ(port, 2947);
    EXPECT_FALSE(SocketChannel::splitAddress("localhost", host, port));
    EXPECT_FALSE(SocketChannel::splitAddress("localhost:gpsd", host, port));
    EXPECT_FALSE(SocketChannel::splitAddress("localhost:70000", host, port));
    EXPECT_FALSE(SocketChannel::splitAddress("localhost:99999999999999999999", host, port));
}

TEST(SocketChannel, ReadsWhatTheDaemonSends)
{
    LoopbackListener listener(false);
    std::thread server([&listener]() {
        int c = ::accept(listener.fd(), nullptr, nullptr);
        if (c < 0)
            return;
        ssize_t n = ::send(c, kGgaSentence, strlen(kGgaSentence), MSG_NOSIGNAL);
        (void)n;
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        ::close(c);
    });

    SocketChannel channel("127.0.0.1", listener.port());
    ASSERT_NO_THROW(channel.open());
    uint8_t buf[128];
    ReadResult r = channel.read(buf, sizeof(buf), 2000);
    server.join();
    EXPECT_EQ(r.status, ReadStatus::Ok);
    EXPECT_GT(r.bytes, 0u);
    EXPECT_EQ(buf[0], '$');
}

TEST(SocketChannel, RefusedConnectionIsTransportUnavailable)
{
    int port = 0;
    {
        LoopbackListener closed(false);
        port = closed.port();
    }
    SocketChannel channel("127.0.0.1", port);
    try
    {
        channel.open();
        FAIL() << "connect to a closed port succeeded";
    }
    catch (const DeviceError &ex)
    {
        EXPECT_EQ(ex.kind(), ErrorKind::TransportUnavailable);
    }
    EXPECT_FALSE(channel.isOpen());
}

TEST(SocketChannel, InterruptEndsAPendingConnect)
{
    LoopbackListener listener(true);
    SocketChannel channel("127.0.0.1", listener.port(), 10000);

    auto start = std::chrono::steady_clock::now();
    std::thread canceler([&channel]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        channel.interrupt();
    });
    EXPECT_THROW(channel.open(), DeviceError);
    canceler.join();
    EXPECT_LT(msSince(start), 3000);
    EXPECT_FALSE(channel.isOpen());
}

TEST(SocketChannel, ConnectTimeoutBoundsOpen)
{
    LoopbackListener listener(true);
    SocketChannel channel("127.0.0.1", listener.port(), 300);

    auto start = std::chrono::steady_clock::now();
    try
    {
        channel.open();
        FAIL() << "connect into a full backlog succeeded";
    }
    catch (const DeviceError &ex)
    {
        EXPECT_EQ(ex.kind(), ErrorKind::TransportUnavailable);
    }
    EXPECT_LT(msSince(start), 3000);
}

TEST(SocketChannel, CancelingAMultiplexerStuckInConnectIsNotAFailure)
{
    LoopbackListener listener(true);
    auto store = std::make_shared<MemoryProfileStore>();
    int port = listener.port();
    auto device = std::make_shared<PlatformMultiplexerDevice>(
        "127.0.0.1:" + std::to_string(port), store,
        [port]() { return std::make_unique<SocketChannel>("127.0.0.1", port, 10000); });

    auto signal = device->beginDetection();
    ASSERT_TRUE(waitUntil([&]() { return device->state() == DeviceState::Opening; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    auto start = std::chrono::steady_clock::now();
    device->cancelDetection();
    EXPECT_TRUE(signal->waitFor(std::chrono::seconds(3)));
    EXPECT_LT(msSince(start), 3000);
    EXPECT_FALSE(device->isDetectionInProgress());
    EXPECT_EQ(device->profile().failCount, 0u);
    EXPECT_EQ(device->state(), DeviceState::Idle);
}
