#include "FdReader.hpp"

#include "Multiplexer.hpp"
#include "RawFdUtils.hpp"

namespace fdmux {
FdReader::FdReader(Multiplexer* _mux, int _fd, int _fdNum, bool _shouldClose,
                   bool _isPty)
    : mux(_mux),
      fd(_fd),
      fdNum(_fdNum),
      shouldClose(_shouldClose),
      pty(_isPty),
      closed(false),
      loopRunning(false),
      bytesInFlight(0),
      totalRead(0),
      maxInFlight(_mux->getConfig().maxInFlightBytes) {
  auto wakeupPipe = RawFdUtils::createPipe();
  wakeupRead = wakeupPipe.first;
  wakeupWrite = wakeupPipe.second;
}

FdReader::~FdReader() {
  close();
  RawFdUtils::closeFd(&wakeupRead);
  RawFdUtils::closeFd(&wakeupWrite);
}

void FdReader::readLoop(WaitGroup* wg) {
  {
    lock_guard<std::mutex> guard(readerMutex);
    if (closed) {
      VLOG(1) << "Reader for fd " << fdNum << " closed before starting";
      if (wg) {
        wg->done();
      }
      return;
    }
    loopRunning = true;
  }

  const MultiplexerConfig& config = mux->getConfig();
  vector<char> buf(config.readBufferSize);
  try {
    while (true) {
      if (!RawFdUtils::waitOnFdOrWakeup(fd, wakeupRead, false)) {
        VLOG(1) << "Reader for fd " << fdNum << " was closed";
        break;
      }
      ssize_t bytesRead = ::read(fd, &buf[0], buf.size());
      if (bytesRead < 0) {
        auto localErrno = GetErrno();
        if (localErrno == EINTR || localErrno == EAGAIN) {
          continue;
        }
        if (pty && localErrno == EIO) {
          // The slave side hung up, which is how a pty reports end-of-file
          bytesRead = 0;
        } else {
          LOG(INFO) << "Read error on fd " << fdNum << ": "
                    << strerror(localErrno);
          mux->sendDataPacket(fdNum, "", false,
                              string("read error: ") + strerror(localErrno));
          break;
        }
      }
      if (bytesRead == 0) {
        VLOG(1) << "EOF on fd " << fdNum << " after " << getTotalRead()
                << " bytes";
        mux->sendDataPacket(fdNum, "", true, "");
        break;
      }
      if (!waitForWindow(bytesRead)) {
        VLOG(1) << "Reader for fd " << fdNum
                << " was closed waiting for acks";
        break;
      }
      if (!sendChunks(&buf[0], bytesRead)) {
        break;
      }
    }
  } catch (const std::runtime_error& ex) {
    LOG(ERROR) << "Cannot send packets for fd " << fdNum << ": " << ex.what();
  }
  finishLoop(wg);
}

bool FdReader::sendChunks(const char* buf, int64_t count) {
  const int64_t maxChunk = mux->getConfig().maxSingleWriteSize;
  for (int64_t offset = 0; offset < count; offset += maxChunk) {
    if (isClosed()) {
      return false;
    }
    int64_t chunkSize = std::min(maxChunk, count - offset);
    mux->sendDataPacket(fdNum, string(buf + offset, chunkSize), false, "");
  }
  return true;
}

bool FdReader::waitForWindow(int64_t count) {
  unique_lock<std::mutex> guard(readerMutex);
  windowCv.wait(guard, [this, count] {
    return closed || bytesInFlight + count <= maxInFlight;
  });
  if (closed) {
    return false;
  }
  bytesInFlight += count;
  totalRead += count;
  return true;
}

void FdReader::notifyAck(int64_t ackLen) {
  lock_guard<std::mutex> guard(readerMutex);
  if (ackLen > bytesInFlight) {
    LOG(WARNING) << "Ack of " << ackLen << " bytes on fd " << fdNum
                 << " exceeds the " << bytesInFlight << " bytes in flight";
    bytesInFlight = 0;
  } else {
    bytesInFlight -= ackLen;
  }
  windowCv.notify_all();
}

void FdReader::close() {
  lock_guard<std::mutex> guard(readerMutex);
  if (closed) {
    return;
  }
  closed = true;
  windowCv.notify_all();
  if (loopRunning) {
    // The loop owns fd until it exits
    char c = 'x';
    FATAL_FAIL(::write(wakeupWrite, &c, 1));
  } else {
    closeFdLocked();
  }
}

void FdReader::finishLoop(WaitGroup* wg) {
  {
    lock_guard<std::mutex> guard(readerMutex);
    loopRunning = false;
    closed = true;
    closeFdLocked();
  }
  if (wg) {
    wg->done();
  }
}

void FdReader::closeFdLocked() {
  if (shouldClose) {
    RawFdUtils::closeFd(&fd);
  }
}

int64_t FdReader::getBytesInFlight() {
  lock_guard<std::mutex> guard(readerMutex);
  return bytesInFlight;
}

int64_t FdReader::getTotalRead() {
  lock_guard<std::mutex> guard(readerMutex);
  return totalRead;
}

bool FdReader::isClosed() {
  lock_guard<std::mutex> guard(readerMutex);
  return closed;
}
}  // namespace fdmux
