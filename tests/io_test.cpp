// SusRes-Prod headers
#include "io/ControlSocket.hpp"
#include "io/MessageChannel.hpp"
#include "io/PowerGateway.hpp"
#include "io/SwapClient.hpp"
#include "io/TokenSlot.hpp"

// GTest headers
#include <gtest/gtest.h>

#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>
#include <thread>
#include <vector>

#include <stdlib.h>
#include <sys/socket.h>
#include <unistd.h>

namespace susres::test {

  using namespace std::chrono_literals;
  using io::ControlSocket;
  using io::MessageChannel;
  using protocols::SuspendToken;
  using protocols::TokenOrigin;

  class SocketDirTest : public ::testing::Test {
  protected:
    void SetUp() override {
      char tmpl[] = "/tmp/susres_io_XXXXXX";
      ASSERT_NE(::mkdtemp(tmpl), nullptr);
      dir = tmpl;
    }
    void TearDown() override {
      for (const auto& f : created)
        std::remove(f.c_str());
      ::rmdir(dir.c_str());
    }
    std::string file(const std::string& name) {
      created.push_back(dir + "/" + name);
      return created.back();
    }

    std::string dir;
    std::vector<std::string> created;
  };

  TEST(message_channel, reads_buffered_lines_from_one_write) {
    int sv[2];
    ASSERT_EQ(0, ::socketpair(AF_UNIX, SOCK_STREAM, 0, sv));
    MessageChannel chan(sv[0]);

    const char* msg = "READY 1\r\nDENY 1 2\r\n";
    ASSERT_EQ(::write(sv[1], msg, strlen(msg)), static_cast<ssize_t>(strlen(msg)));

    EXPECT_EQ(chan.readLine(100ms), "READY 1");
    EXPECT_EQ(chan.readLine(100ms), "DENY 1 2");
    EXPECT_FALSE(chan.readLine(20ms));
    ::close(sv[1]);
  }

  TEST(message_channel, write_appends_crlf_once) {
    int sv[2];
    ASSERT_EQ(0, ::socketpair(AF_UNIX, SOCK_STREAM, 0, sv));
    MessageChannel chan(sv[0]);

    ASSERT_TRUE(chan.writeLine("1 PREPARE 3"));
    ASSERT_TRUE(chan.writeLine("1 ABORT 3\r\n"));

    char buf[64] = { 0 };
    ssize_t n = 0, total = 0;
    while (total < 24 && (n = ::read(sv[1], buf + total, sizeof(buf) - 1 - total)) > 0)
      total += n;
    EXPECT_STREQ(buf, "1 PREPARE 3\r\n1 ABORT 3\r\n");
    ::close(sv[1]);
  }

  TEST(message_channel, peer_close_is_detected) {
    int sv[2];
    ASSERT_EQ(0, ::socketpair(AF_UNIX, SOCK_STREAM, 0, sv));
    MessageChannel chan(sv[0]);
    ::close(sv[1]);

    EXPECT_FALSE(chan.readLine(100ms));
    EXPECT_FALSE(chan.isOpen());
    EXPECT_FALSE(chan.writeLine("1 RESUME 1"));
  }

  TEST(message_channel, move_transfers_the_socket) {
    int sv[2];
    ASSERT_EQ(0, ::socketpair(AF_UNIX, SOCK_STREAM, 0, sv));
    MessageChannel a(sv[0]);
    MessageChannel b(std::move(a));

    EXPECT_FALSE(a.isOpen());
    EXPECT_TRUE(b.isOpen());
    ::close(sv[1]);
  }

  TEST_F(SocketDirTest, open_fails_when_nobody_listens) {
    MessageChannel chan;
    EXPECT_FALSE(chan.open(dir + "/nobody.sock"));
    EXPECT_FALSE(chan.isOpen());
  }

  TEST_F(SocketDirTest, control_socket_accepts_and_exchanges_lines) {
    const auto path = file("ctl.sock");
    ControlSocket server;
    ASSERT_TRUE(server.listen(path));

    MessageChannel client;
    ASSERT_TRUE(client.open(path));

    auto peer = server.accept(500ms);
    ASSERT_TRUE(peer);

    ASSERT_TRUE(client.writeLine("STATE"));
    EXPECT_EQ(peer->readLine(500ms), "STATE");
    ASSERT_TRUE(peer->writeLine("OK Idle"));
    EXPECT_EQ(client.readLine(500ms), "OK Idle");
  }

  TEST_F(SocketDirTest, control_socket_replaces_stale_file_and_times_out) {
    const auto path = file("ctl.sock");
    std::ofstream(path) << "stale";

    ControlSocket server;
    ASSERT_TRUE(server.listen(path));
    EXPECT_FALSE(server.accept(20ms));
  }

  TEST_F(SocketDirTest, swap_client_round_trips) {
    const auto path = file("swap.sock");
    ControlSocket server;
    ASSERT_TRUE(server.listen(path));

    std::thread swapServer([&server] {
      auto peer = server.accept(2000ms);
      if (!peer)
        return;
      if (peer->readLine(2000ms) == std::optional<std::string>("FLUSH"))
        peer->writeLine("OK");
      if (peer->readLine(2000ms) == std::optional<std::string>("RESTORE"))
        peer->writeLine("ERR disk");
    });

    io::ChannelSwapClient swap(std::make_unique<MessageChannel>(), path, 2000ms);
    EXPECT_TRUE(swap.flush());
    EXPECT_FALSE(swap.restore());
    swapServer.join();
  }

  TEST_F(SocketDirTest, swap_client_without_server_fails) {
    io::ChannelSwapClient swap(std::make_unique<MessageChannel>(), dir + "/none.sock", 50ms);
    EXPECT_FALSE(swap.flush());
  }

  //---sysfs gateway against plain files-----------------------------------

  TEST_F(SocketDirTest, power_gateway_writes_mem_and_returns_the_token) {
    const auto state = file("state");
    std::ofstream(state).flush();
    io::SysfsPowerGateway gateway(state, file("handoff"));

    SuspendToken t;
    t.origin = TokenOrigin::Suspend;
    t.epoch = 3;
    auto wake = gateway.powerDown(t);

    ASSERT_TRUE(wake);
    EXPECT_EQ(wake->token, t);
    std::ifstream in(state);
    std::stringstream ss;
    ss << in.rdbuf();
    EXPECT_EQ(ss.str(), "mem");
  }

  TEST_F(SocketDirTest, power_gateway_reports_refused_transition) {
    io::SysfsPowerGateway gateway(dir + "/missing/state", file("handoff"));
    EXPECT_FALSE(gateway.powerDown(SuspendToken{}));
  }

  TEST_F(SocketDirTest, boot_context_is_consumed_once) {
    const auto handoff = file("handoff");
    SuspendToken t;
    t.origin = TokenOrigin::RebootTest;
    t.epoch = 9;
    ASSERT_TRUE(io::FileTokenSlot(handoff).write(t));

    io::SysfsPowerGateway gateway(file("state"), handoff);
    EXPECT_EQ(gateway.takeBootContext(), t);
    EXPECT_FALSE(gateway.takeBootContext());
  }

} // namespace susres::test
