#include "RawFdUtils.hpp"

namespace fdmux {
void RawFdUtils::writeAll(int fd, const char* buf, size_t count) {
  if (fd < 0) {
    throw std::runtime_error("Invalid file descriptor for writeAll");
  }
  size_t bytesWritten = 0;
  while (bytesWritten < count) {
    ssize_t rc = ::write(fd, buf + bytesWritten, count - bytesWritten);
    if (rc < 0) {
      auto localErrno = GetErrno();
      if (localErrno == EINTR) {
        continue;
      }
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        continue;
      }
      throw std::runtime_error(string("Cannot write to fd: ") +
                               strerror(localErrno));
    }
    if (rc == 0) {
      throw std::runtime_error("Cannot write to fd: fd closed");
    }
    bytesWritten += rc;
  }
}

bool RawFdUtils::readAll(int fd, char* buf, size_t count) {
  if (fd < 0) {
    throw std::runtime_error("Invalid file descriptor for readAll");
  }
  size_t bytesRead = 0;
  while (bytesRead < count) {
    ssize_t rc = ::read(fd, buf + bytesRead, count - bytesRead);
    if (rc < 0) {
      auto localErrno = GetErrno();
      if (localErrno == EINTR || localErrno == EAGAIN ||
          localErrno == EWOULDBLOCK) {
        continue;
      }
      throw std::runtime_error(string("Cannot read from fd: ") +
                               strerror(localErrno));
    }
    if (rc == 0) {
      if (bytesRead == 0) {
        return false;
      }
      throw std::runtime_error("fd closed in the middle of a read");
    }
    bytesRead += rc;
  }
  return true;
}

pair<int, int> RawFdUtils::createPipe() {
  int fds[2];
  if (::pipe(fds) == -1) {
    throw std::runtime_error(string("Cannot create pipe: ") +
                             strerror(GetErrno()));
  }
  return make_pair(fds[0], fds[1]);
}

void RawFdUtils::setNonBlocking(int fd) {
  int flags = fcntl(fd, F_GETFL, 0);
  if (flags == -1 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) {
    throw std::runtime_error(string("Cannot make fd non-blocking: ") +
                             strerror(GetErrno()));
  }
}

void RawFdUtils::closeFd(int* fd) {
  if (*fd >= 0) {
    ::close(*fd);
    *fd = -1;
  }
}

bool RawFdUtils::waitOnFdOrWakeup(int fd, int wakeupFd, bool forWrite) {
  while (true) {
    fd_set readFds;
    fd_set writeFds;
    FD_ZERO(&readFds);
    FD_ZERO(&writeFds);
    FD_SET(wakeupFd, &readFds);
    if (forWrite) {
      FD_SET(fd, &writeFds);
    } else {
      FD_SET(fd, &readFds);
    }
    int rc = select(std::max(fd, wakeupFd) + 1, &readFds, &writeFds, NULL,
                    NULL);
    if (rc < 0) {
      if (GetErrno() == EINTR) {
        continue;
      }
      FATAL_FAIL(rc);
    }
    if (FD_ISSET(wakeupFd, &readFds)) {
      return false;
    }
    if (FD_ISSET(fd, forWrite ? &writeFds : &readFds)) {
      return true;
    }
  }
}
}  // namespace fdmux
