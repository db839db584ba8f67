#include "PacketChannel.hpp"

#include "RawFdUtils.hpp"

namespace fdmux {
void PacketQueue::sendPacket(const Packet& packet) {
  lock_guard<std::mutex> guard(queueMutex);
  if (closed) {
    throw std::runtime_error("Tried to send on a closed packet queue");
  }
  packets.push_back(packet);
  queueCv.notify_one();
}

bool PacketQueue::next(Packet* packet) {
  unique_lock<std::mutex> guard(queueMutex);
  queueCv.wait(guard, [this] { return closed || !packets.empty(); });
  if (packets.empty()) {
    return false;
  }
  *packet = packets.front();
  packets.pop_front();
  return true;
}

bool PacketQueue::tryNext(Packet* packet, std::chrono::milliseconds timeout) {
  unique_lock<std::mutex> guard(queueMutex);
  queueCv.wait_for(guard, timeout,
                   [this] { return closed || !packets.empty(); });
  if (packets.empty()) {
    return false;
  }
  *packet = packets.front();
  packets.pop_front();
  return true;
}

void PacketQueue::close() {
  lock_guard<std::mutex> guard(queueMutex);
  closed = true;
  queueCv.notify_all();
}

size_t PacketQueue::size() {
  lock_guard<std::mutex> guard(queueMutex);
  return packets.size();
}

bool PacketQueue::isClosed() {
  lock_guard<std::mutex> guard(queueMutex);
  return closed;
}

FdPacketReader::FdPacketReader(int _fd, bool _shouldClose)
    : fd(_fd), shouldClose(_shouldClose), closed(false) {
  auto wakeupPipe = RawFdUtils::createPipe();
  wakeupRead = wakeupPipe.first;
  wakeupWrite = wakeupPipe.second;
}

FdPacketReader::~FdPacketReader() {
  close();
  if (shouldClose) {
    RawFdUtils::closeFd(&fd);
  }
  RawFdUtils::closeFd(&wakeupRead);
  RawFdUtils::closeFd(&wakeupWrite);
}

bool FdPacketReader::waitForData() {
  return RawFdUtils::waitOnFdOrWakeup(fd, wakeupRead, false);
}

bool FdPacketReader::next(Packet* packet) {
  {
    lock_guard<std::mutex> guard(readerMutex);
    if (closed) {
      return false;
    }
  }
  if (!waitForData()) {
    return false;
  }

  uint32_t messageSize;
  if (!RawFdUtils::readAll(fd, (char*)&messageSize, sizeof(uint32_t))) {
    VLOG(1) << "Packet stream on fd " << fd << " ended";
    return false;
  }
  messageSize = ntohl(messageSize);
  if (messageSize == 0 || int64_t(messageSize) > MAX_FRAME_SIZE) {
    throw std::runtime_error("Invalid packet frame size: " +
                             to_string(messageSize));
  }
  string s(messageSize, '\0');
  if (!RawFdUtils::readAll(fd, &s[0], messageSize)) {
    throw std::runtime_error("Packet stream ended inside a frame");
  }
  VLOG(3) << "Read packet frame of length " << messageSize;
  *packet = Packet(s);
  return true;
}

void FdPacketReader::close() {
  lock_guard<std::mutex> guard(readerMutex);
  if (closed) {
    return;
  }
  closed = true;
  char c = 'x';
  FATAL_FAIL(::write(wakeupWrite, &c, 1));
}

FdPacketSender::FdPacketSender(int _fd, bool _shouldClose)
    : fd(_fd), shouldClose(_shouldClose) {}

FdPacketSender::~FdPacketSender() {
  if (shouldClose) {
    RawFdUtils::closeFd(&fd);
  }
}

void FdPacketSender::sendPacket(const Packet& packet) {
  string serialized = packet.serialize();
  uint32_t messageSize = htonl(uint32_t(serialized.length()));
  string s(sizeof(uint32_t), '\0');
  memcpy(&s[0], &messageSize, sizeof(uint32_t));
  s.append(serialized);

  lock_guard<std::mutex> guard(senderMutex);
  RawFdUtils::writeAll(fd, s.c_str(), s.length());
}
}  // namespace fdmux
