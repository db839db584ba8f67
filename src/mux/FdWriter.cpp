#include "FdWriter.hpp"

#include "Multiplexer.hpp"
#include "RawFdUtils.hpp"

namespace fdmux {
FdWriter::FdWriter(Multiplexer* _mux, int _fd, int _fdNum, bool _shouldClose)
    : mux(_mux),
      fd(_fd),
      fdNum(_fdNum),
      shouldClose(_shouldClose),
      buffer(_mux->getConfig().writeBufferSize),
      closed(_fd < 0),
      eof(false),
      loopRunning(false),
      totalWritten(0),
      wakeupRead(-1),
      wakeupWrite(-1) {
  if (fd < 0) {
    // Placeholders never run a loop, so they need no descriptors
    return;
  }
  if (shouldClose) {
    // A blocking write could not be interrupted by close()
    RawFdUtils::setNonBlocking(fd);
  }
  auto wakeupPipe = RawFdUtils::createPipe();
  wakeupRead = wakeupPipe.first;
  wakeupWrite = wakeupPipe.second;
}

FdWriter::~FdWriter() {
  close();
  RawFdUtils::closeFd(&wakeupRead);
  RawFdUtils::closeFd(&wakeupWrite);
}

void FdWriter::addData(const string& data, bool _eof) {
  lock_guard<std::mutex> guard(writerMutex);
  if (closed) {
    throw std::runtime_error("write to closed file");
  }
  if (eof) {
    if (data.empty()) {
      return;
    }
    throw std::runtime_error("write to closed file (eof)");
  }
  if (!buffer.canAccept(data.length())) {
    throw std::runtime_error(
        "write buffer overflow on fd " + to_string(fdNum) + ": " +
        to_string(buffer.size()) + " bytes pending, " +
        to_string(data.length()) + " more would exceed " +
        to_string(buffer.getCapacity()));
  }
  buffer.enqueue(data);
  if (_eof) {
    eof = true;
  }
  dataCv.notify_all();
}

void FdWriter::writeLoop(WaitGroup* wg) {
  {
    lock_guard<std::mutex> guard(writerMutex);
    if (closed) {
      VLOG(1) << "Writer for fd " << fdNum << " closed before starting";
      if (wg) {
        wg->done();
      }
      return;
    }
    loopRunning = true;
  }

  const size_t maxChunk = size_t(mux->getConfig().maxSingleWriteSize);
  try {
    while (true) {
      string chunk;
      {
        unique_lock<std::mutex> guard(writerMutex);
        dataCv.wait(guard, [this] {
          return closed || eof || buffer.hasPendingData();
        });
        if (closed) {
          break;
        }
        if (!buffer.hasPendingData()) {
          VLOG(1) << "Writer for fd " << fdNum << " reached EOF after "
                  << totalWritten << " bytes";
          break;
        }
        chunk = buffer.peek(maxChunk);
      }

      if (!RawFdUtils::waitOnFdOrWakeup(fd, wakeupRead, true)) {
        VLOG(1) << "Writer for fd " << fdNum << " was closed";
        break;
      }
      ssize_t bytesWritten = ::write(fd, chunk.c_str(), chunk.length());
      if (bytesWritten < 0) {
        auto localErrno = GetErrno();
        if (localErrno == EINTR || localErrno == EAGAIN) {
          continue;
        }
        LOG(INFO) << "Write error on fd " << fdNum << ": "
                  << strerror(localErrno);
        {
          lock_guard<std::mutex> guard(writerMutex);
          closed = true;
          buffer.clear();
        }
        mux->sendDataAckPacket(fdNum, 0,
                               string("write error: ") + strerror(localErrno));
        break;
      }
      {
        lock_guard<std::mutex> guard(writerMutex);
        buffer.consume(bytesWritten);
        totalWritten += bytesWritten;
      }
      mux->sendDataAckPacket(fdNum, bytesWritten, "");
    }
  } catch (const std::runtime_error& ex) {
    LOG(ERROR) << "Cannot send acks for fd " << fdNum << ": " << ex.what();
  }
  finishLoop(wg);
}

void FdWriter::close() {
  lock_guard<std::mutex> guard(writerMutex);
  if (closed && !loopRunning) {
    closeFdLocked();
    return;
  }
  closed = true;
  buffer.clear();
  dataCv.notify_all();
  if (loopRunning) {
    // The loop owns fd until it exits
    char c = 'x';
    FATAL_FAIL(::write(wakeupWrite, &c, 1));
  } else {
    closeFdLocked();
  }
}

void FdWriter::finishLoop(WaitGroup* wg) {
  {
    lock_guard<std::mutex> guard(writerMutex);
    loopRunning = false;
    closed = true;
    closeFdLocked();
  }
  if (wg) {
    wg->done();
  }
}

void FdWriter::closeFdLocked() {
  if (shouldClose) {
    RawFdUtils::closeFd(&fd);
  }
}

bool FdWriter::isClosed() {
  lock_guard<std::mutex> guard(writerMutex);
  return closed;
}

bool FdWriter::isEof() {
  lock_guard<std::mutex> guard(writerMutex);
  return eof;
}

int64_t FdWriter::getTotalWritten() {
  lock_guard<std::mutex> guard(writerMutex);
  return totalWritten;
}

size_t FdWriter::getPendingBytes() {
  lock_guard<std::mutex> guard(writerMutex);
  return buffer.size();
}
}  // namespace fdmux
