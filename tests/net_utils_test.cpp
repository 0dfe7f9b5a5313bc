/*
 * Tests for the network utilities
 *
 * - port 0 asks the kernel for any free port
 * - a port that is already bound is skipped
 */

#include <gtest/gtest.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cstring>

#include "utils/net_utils.h"

namespace websink {
namespace test {

class NetUtilsTest : public ::testing::Test {
protected:
    void TearDown() override {
        if (fd_ >= 0) close(fd_);
    }

    // Hold a listening socket on any free port; returns the port
    int occupy_port() {
        fd_ = socket(AF_INET, SOCK_STREAM, 0);
        if (fd_ < 0) return -1;

        struct sockaddr_in addr;
        memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = INADDR_ANY;
        addr.sin_port = 0;
        if (bind(fd_, (struct sockaddr*)&addr, sizeof(addr)) < 0) return -1;
        if (listen(fd_, 1) < 0) return -1;

        socklen_t len = sizeof(addr);
        if (getsockname(fd_, (struct sockaddr*)&addr, &len) < 0) return -1;
        return ntohs(addr.sin_port);
    }

    int fd_ = -1;
};

TEST_F(NetUtilsTest, PortZeroReturnsAnyFreePort) {
    int port = net_utils::find_available_port(0);
    EXPECT_GT(port, 0);
    EXPECT_LE(port, 65535);
}

TEST_F(NetUtilsTest, SkipsPortInUse) {
    int busy = occupy_port();
    ASSERT_GT(busy, 0);

    int port = net_utils::find_available_port(busy);
    EXPECT_NE(port, busy);
    if (port > 0) {
        EXPECT_GT(port, busy);
        EXPECT_LT(port, busy + net_utils::PORT_SEARCH_RANGE);
    }
}

TEST(NetUtilsNamesTest, HostAndAddressAreNeverEmpty) {
    EXPECT_FALSE(net_utils::host_name().empty());
    EXPECT_FALSE(net_utils::external_ip().empty());
}

} // namespace test
} // namespace websink
