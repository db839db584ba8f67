#include "PacketChannel.hpp"

#include "RawFdUtils.hpp"
#include "TestHeaders.hpp"

using namespace fdmux;

TEST_CASE("Packets cross a pipe intact", "[PacketChannel]") {
  auto pipeFds = RawFdUtils::createPipe();
  FdPacketReader reader(pipeFds.first, true);
  FdPacketSender sender(pipeFds.second, true);

  // Bigger than the pipe, so the reader has to drain concurrently
  string bigPayload(200 * 1024, 'z');
  std::thread senderThread([&sender, &bigPayload]() {
    sender.sendPacket(Packet(1, "first"));
    sender.sendPacket(Packet(2, ""));
    sender.sendPacket(Packet(3, bigPayload));
  });

  Packet packet;
  REQUIRE(reader.next(&packet));
  REQUIRE(packet.getHeader() == 1);
  REQUIRE(packet.getPayload() == "first");
  REQUIRE(reader.next(&packet));
  REQUIRE(packet.getHeader() == 2);
  REQUIRE(packet.getPayload().empty());
  REQUIRE(reader.next(&packet));
  REQUIRE(packet.getHeader() == 3);
  REQUIRE(packet.getPayload() == bigPayload);
  senderThread.join();
}

TEST_CASE("Concurrent senders never interleave frames", "[PacketChannel]") {
  auto pipeFds = RawFdUtils::createPipe();
  FdPacketReader reader(pipeFds.first, true);
  shared_ptr<FdPacketSender> sender(new FdPacketSender(pipeFds.second, true));

  vector<std::thread> threads;
  for (int t = 0; t < 4; t++) {
    threads.emplace_back([sender, t]() {
      for (int a = 0; a < 50; a++) {
        sender->sendPacket(Packet(uint8_t(t), string(5000, char('a' + t))));
      }
    });
  }
  map<int, int> counts;
  for (int a = 0; a < 200; a++) {
    Packet packet;
    REQUIRE(reader.next(&packet));
    REQUIRE(packet.getPayload() ==
            string(5000, char('a' + packet.getHeader())));
    counts[packet.getHeader()]++;
  }
  for (auto& it : threads) {
    it.join();
  }
  REQUIRE(counts.size() == 4);
  REQUIRE(counts[0] == 50);
}

TEST_CASE("Reader ends cleanly at a frame boundary", "[PacketChannel]") {
  auto pipeFds = RawFdUtils::createPipe();
  FdPacketReader reader(pipeFds.first, true);
  {
    FdPacketSender sender(pipeFds.second, true);
    sender.sendPacket(Packet(1, "last"));
  }
  Packet packet;
  REQUIRE(reader.next(&packet));
  REQUIRE_FALSE(reader.next(&packet));
}

TEST_CASE("Reader rejects corrupt frames", "[PacketChannel]") {
  auto pipeFds = RawFdUtils::createPipe();
  FdPacketReader reader(pipeFds.first, true);

  SECTION("Truncated frame") {
    uint32_t length = htonl(100);
    RawFdUtils::writeAll(pipeFds.second, (const char*)&length, 4);
    RawFdUtils::writeAll(pipeFds.second, "short", 5);
    ::close(pipeFds.second);
    Packet packet;
    REQUIRE_THROWS(reader.next(&packet));
  }

  SECTION("Empty frame") {
    uint32_t length = 0;
    RawFdUtils::writeAll(pipeFds.second, (const char*)&length, 4);
    ::close(pipeFds.second);
    Packet packet;
    REQUIRE_THROWS(reader.next(&packet));
  }

  SECTION("Oversized frame") {
    uint32_t length = htonl(uint32_t(FdPacketReader::MAX_FRAME_SIZE + 1));
    RawFdUtils::writeAll(pipeFds.second, (const char*)&length, 4);
    ::close(pipeFds.second);
    Packet packet;
    REQUIRE_THROWS(reader.next(&packet));
  }
}

TEST_CASE("Closing a reader unblocks next", "[PacketChannel]") {
  auto pipeFds = RawFdUtils::createPipe();
  FdPacketReader reader(pipeFds.first, true);
  std::thread closer([&reader]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    reader.close();
  });
  Packet packet;
  REQUIRE_FALSE(reader.next(&packet));
  closer.join();
  ::close(pipeFds.second);
}

TEST_CASE("PacketQueue delivers queued packets before closing",
          "[PacketChannel]") {
  PacketQueue queue;
  queue.sendPacket(Packet(1, "a"));
  queue.sendPacket(Packet(2, "b"));
  queue.close();
  REQUIRE(queue.isClosed());
  REQUIRE_THROWS(queue.sendPacket(Packet(3, "c")));

  Packet packet;
  REQUIRE(queue.next(&packet));
  REQUIRE(packet.getPayload() == "a");
  REQUIRE(queue.tryNext(&packet, std::chrono::milliseconds(10)));
  REQUIRE(packet.getPayload() == "b");
  REQUIRE_FALSE(queue.next(&packet));
}

TEST_CASE("PacketQueue tryNext times out", "[PacketChannel]") {
  PacketQueue queue;
  Packet packet;
  REQUIRE_FALSE(queue.tryNext(&packet, std::chrono::milliseconds(20)));
  REQUIRE(queue.size() == 0);
}

TEST_CASE("Packet serialization", "[PacketChannel]") {
  Packet packet(7, "payload");
  string serialized = packet.serialize();
  REQUIRE(serialized.length() == 8);
  REQUIRE(packet.length() == 8);
  Packet parsed(serialized);
  REQUIRE(parsed.getHeader() == 7);
  REQUIRE(parsed.getPayload() == "payload");
  REQUIRE_THROWS(Packet(string()));
}
