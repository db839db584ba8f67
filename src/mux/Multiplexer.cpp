#include "Multiplexer.hpp"

#include "JsonLib.hpp"
#include "MuxPackets.hpp"
#include "RawFdUtils.hpp"

namespace fdmux {
const char* multiplexerPhaseName(MultiplexerPhase phase) {
  switch (phase) {
    case MultiplexerPhase::CREATED:
      return "created";
    case MultiplexerPhase::STARTED:
      return "started";
    case MultiplexerPhase::RUNNING:
      return "running";
    case MultiplexerPhase::DRAINING:
      return "draining";
    case MultiplexerPhase::CLOSED:
      return "closed";
  }
  return "unknown";
}

Multiplexer::Multiplexer(
    const CommandKey& _commandKey,
    shared_ptr<UnknownPacketReporter> _unknownPacketReporter,
    const MultiplexerConfig& _config)
    : commandKey(_commandKey),
      config(_config),
      unknownPacketReporter(_unknownPacketReporter),
      ptyFd(-1),
      cmdPid(-1),
      phase(MultiplexerPhase::CREATED) {
  config.validate();
  if (!unknownPacketReporter) {
    unknownPacketReporter.reset(new LoggingUnknownPacketReporter());
  }
}

Multiplexer::~Multiplexer() {
  close();
  vector<std::thread> threads;
  {
    lock_guard<std::recursive_mutex> guard(muxMutex);
    threads.swap(loopThreads);
  }
  for (auto& it : threads) {
    if (it.joinable()) {
      it.join();
    }
  }
}

void Multiplexer::setPtyFd(int _ptyFd) {
  lock_guard<std::recursive_mutex> guard(muxMutex);
  ptyFd = _ptyFd;
}

void Multiplexer::setCmdPid(pid_t _cmdPid) {
  lock_guard<std::recursive_mutex> guard(muxMutex);
  cmdPid = _cmdPid;
}

int Multiplexer::makeReaderPipe(int fdNum) {
  auto pipeFds = RawFdUtils::createPipe();
  lock_guard<std::recursive_mutex> guard(muxMutex);
  if (phase != MultiplexerPhase::CREATED ||
      fdReaders.find(fdNum) != fdReaders.end()) {
    ::close(pipeFds.first);
    ::close(pipeFds.second);
    throw std::runtime_error("Cannot create a reader pipe for fd " +
                             to_string(fdNum) + " in phase " +
                             multiplexerPhaseName(phase));
  }
  fdReaders[fdNum].reset(
      new FdReader(this, pipeFds.first, fdNum, true, false));
  closeAfterStart.push_back(pipeFds.second);
  return pipeFds.second;
}

int Multiplexer::makeWriterPipe(int fdNum) {
  return createWriterPipe(fdNum, NULL);
}

int Multiplexer::makeStaticWriterPipe(int fdNum, const string& data) {
  return createWriterPipe(fdNum, &data);
}

int Multiplexer::createWriterPipe(int fdNum, const string* staticData) {
  auto pipeFds = RawFdUtils::createPipe();
  lock_guard<std::recursive_mutex> guard(muxMutex);
  if (phase != MultiplexerPhase::CREATED ||
      fdWriters.find(fdNum) != fdWriters.end()) {
    ::close(pipeFds.first);
    ::close(pipeFds.second);
    throw std::runtime_error("Cannot create a writer pipe for fd " +
                             to_string(fdNum) + " in phase " +
                             multiplexerPhaseName(phase));
  }
  shared_ptr<FdWriter> fdWriter;
  try {
    fdWriter.reset(new FdWriter(this, pipeFds.second, fdNum, true));
    if (staticData) {
      // Static input is complete, the child sees EOF right after it
      fdWriter->addData(*staticData, true);
    }
  } catch (const std::runtime_error&) {
    if (fdWriter) {
      fdWriter->close();
    } else {
      ::close(pipeFds.second);
    }
    ::close(pipeFds.first);
    throw;
  }
  fdWriters[fdNum] = fdWriter;
  closeAfterStart.push_back(pipeFds.first);
  return pipeFds.first;
}

void Multiplexer::makeRawFdReader(int fdNum, int fd, bool shouldClose,
                                  bool isPty) {
  lock_guard<std::recursive_mutex> guard(muxMutex);
  if (phase == MultiplexerPhase::DRAINING ||
      phase == MultiplexerPhase::CLOSED ||
      fdReaders.find(fdNum) != fdReaders.end()) {
    throw std::runtime_error("Cannot attach a reader for fd " +
                             to_string(fdNum) + " in phase " +
                             multiplexerPhaseName(phase));
  }
  shared_ptr<FdReader> fdReader(
      new FdReader(this, fd, fdNum, shouldClose, isPty));
  fdReaders[fdNum] = fdReader;
  if (phase == MultiplexerPhase::RUNNING) {
    VLOG(1) << "Launching late reader for fd " << fdNum;
    loopThreads.emplace_back([fdReader]() {
      el::Helpers::setThreadName("reader");
      fdReader->readLoop(NULL);
    });
  }
}

void Multiplexer::makeRawFdWriter(int fdNum, int fd, bool shouldClose) {
  lock_guard<std::recursive_mutex> guard(muxMutex);
  if (phase == MultiplexerPhase::DRAINING ||
      phase == MultiplexerPhase::CLOSED ||
      fdWriters.find(fdNum) != fdWriters.end()) {
    throw std::runtime_error("Cannot attach a writer for fd " +
                             to_string(fdNum) + " in phase " +
                             multiplexerPhaseName(phase));
  }
  shared_ptr<FdWriter> fdWriter(new FdWriter(this, fd, fdNum, shouldClose));
  fdWriters[fdNum] = fdWriter;
  if (phase == MultiplexerPhase::RUNNING) {
    VLOG(1) << "Launching late writer for fd " << fdNum;
    loopThreads.emplace_back([fdWriter]() {
      el::Helpers::setThreadName("writer");
      fdWriter->writeLoop(NULL);
    });
  }
}

void Multiplexer::close() {
  lock_guard<std::recursive_mutex> guard(muxMutex);
  if (phase == MultiplexerPhase::CLOSED) {
    return;
  }
  VLOG(1) << "Closing multiplexer for " << commandKey << " in phase "
          << multiplexerPhaseName(phase);
  phase = MultiplexerPhase::CLOSED;
  for (auto& it : fdReaders) {
    it.second->close();
  }
  for (auto& it : fdWriters) {
    it.second->close();
  }
  for (auto& fd : closeAfterStart) {
    RawFdUtils::closeFd(&fd);
  }
  closeAfterStart.clear();
  if (input) {
    input->close();
  }
}

void Multiplexer::handleInputDone() {
  lock_guard<std::recursive_mutex> guard(muxMutex);
  if (phase != MultiplexerPhase::CLOSED) {
    phase = MultiplexerPhase::DRAINING;
  }
  // No more acks can arrive, so no reader may keep waiting for one
  for (auto& it : fdReaders) {
    it.second->close();
  }
  for (auto& it : fdWriters) {
    try {
      it.second->addData("", true);
    } catch (const std::runtime_error& ex) {
      VLOG(1) << "Writer for fd " << it.first
              << " already finished: " << ex.what();
    }
  }
}

void Multiplexer::sendDataPacket(int fdNum, const string& data, bool eof,
                                 const string& error) {
  sendPacket(MuxPackets::makeDataPacket(commandKey, fdNum, data, eof, error));
}

void Multiplexer::sendDataAckPacket(int fdNum, int64_t ackLen,
                                    const string& error) {
  sendPacket(MuxPackets::makeDataAckPacket(commandKey, fdNum, ackLen, error));
}

void Multiplexer::sendPacket(const Packet& packet) {
  shared_ptr<PacketSink> localSender;
  {
    lock_guard<std::recursive_mutex> guard(muxMutex);
    localSender = sender;
  }
  if (!localSender) {
    throw std::runtime_error("Multiplexer has no packet sender");
  }
  localSender->sendPacket(packet);
}

void Multiplexer::startIO(shared_ptr<PacketSource> _input,
                          shared_ptr<PacketSink> _sender) {
  lock_guard<std::recursive_mutex> guard(muxMutex);
  if (phase != MultiplexerPhase::CREATED) {
    STFATAL << "Multiplexer is already running, cannot start again";
  }
  input = _input;
  sender = _sender;
  phase = MultiplexerPhase::STARTED;
  if (config.verbose >= 0) {
    el::Loggers::setVerboseLevel(config.verbose);
  }
  LOG(INFO) << "Starting IO for " << commandKey << " with "
            << fdReaders.size() << " readers and " << fdWriters.size()
            << " writers";
}

void Multiplexer::closeTempStartFds() {
  lock_guard<std::recursive_mutex> guard(muxMutex);
  for (auto& fd : closeAfterStart) {
    RawFdUtils::closeFd(&fd);
  }
  closeAfterStart.clear();
}

void Multiplexer::launchReaders(WaitGroup* wg) {
  lock_guard<std::recursive_mutex> guard(muxMutex);
  for (auto& it : fdReaders) {
    shared_ptr<FdReader> fdReader = it.second;
    if (wg) {
      wg->add(1);
    }
    loopThreads.emplace_back([fdReader, wg]() {
      el::Helpers::setThreadName("reader");
      fdReader->readLoop(wg);
    });
  }
}

void Multiplexer::launchWriters(WaitGroup* wg) {
  lock_guard<std::recursive_mutex> guard(muxMutex);
  for (auto& it : fdWriters) {
    shared_ptr<FdWriter> fdWriter = it.second;
    if (wg) {
      wg->add(1);
    }
    loopThreads.emplace_back([fdWriter, wg]() {
      el::Helpers::setThreadName("writer");
      fdWriter->writeLoop(wg);
    });
  }
}

shared_ptr<CmdDonePacket> Multiplexer::runIOAndWait(
    shared_ptr<PacketSource> _input, shared_ptr<PacketSink> _sender,
    bool waitOnReaders, bool waitOnWriters, bool waitForInputLoop) {
  startIO(_input, _sender);
  closeTempStartFds();

  WaitGroup wg;
  {
    // Launch under the lock so a late raw reader/writer is either in the
    // tables already or sees RUNNING and launches itself.
    lock_guard<std::recursive_mutex> guard(muxMutex);
    launchReaders(waitOnReaders ? &wg : NULL);
    launchWriters(waitOnWriters ? &wg : NULL);
    if (phase == MultiplexerPhase::STARTED) {
      phase = MultiplexerPhase::RUNNING;
    }
    WaitGroup* inputWg = NULL;
    if (waitForInputLoop) {
      wg.add(1);
      inputWg = &wg;
    }
    loopThreads.emplace_back([this, inputWg]() {
      el::Helpers::setThreadName("mux-input");
      shared_ptr<CmdDonePacket> localDonePacket = runPacketInputLoop();
      if (localDonePacket) {
        lock_guard<std::recursive_mutex> guard(muxMutex);
        donePacket = localDonePacket;
      }
      if (inputWg) {
        inputWg->done();
      }
    });
  }
  wg.wait();

  lock_guard<std::recursive_mutex> guard(muxMutex);
  return donePacket;
}

shared_ptr<CmdDonePacket> Multiplexer::runPacketInputLoop() {
  shared_ptr<CmdDonePacket> localDonePacket;
  try {
    Packet packet;
    while (!localDonePacket && input->next(&packet)) {
      if (config.debug) {
        LOG(INFO) << "PK-M> " << MuxPackets::packetToString(packet);
      }
      switch (packet.getHeader()) {
        case FdMuxPacketType::DATA: {
          DataPacket dataPacket;
          if (!tryStringToProto(packet.getPayload(), &dataPacket)) {
            LOG(ERROR) << "Invalid data packet for " << commandKey;
            unknownPacketReporter->unknownPacket(packet);
            break;
          }
          string error = processDataPacket(dataPacket);
          if (!error.empty()) {
            sendDataAckPacket(dataPacket.fd_num(), 0, error);
          }
          break;
        }
        case FdMuxPacketType::DATA_ACK: {
          DataAckPacket ackPacket;
          if (!tryStringToProto(packet.getPayload(), &ackPacket)) {
            LOG(ERROR) << "Invalid ack packet for " << commandKey;
            unknownPacketReporter->unknownPacket(packet);
            break;
          }
          processAckPacket(ackPacket);
          break;
        }
        case FdMuxPacketType::CMD_DONE: {
          shared_ptr<CmdDonePacket> cmdDone(new CmdDonePacket());
          if (!tryStringToProto(packet.getPayload(), cmdDone.get())) {
            LOG(ERROR) << "Invalid done packet for " << commandKey;
            unknownPacketReporter->unknownPacket(packet);
            break;
          }
          LOG(INFO) << "Command " << commandKey << " done with exit code "
                    << cmdDone->exit_code();
          localDonePacket = cmdDone;
          break;
        }
        case FdMuxPacketType::SPECIAL_INPUT: {
          SpecialInputPacket inputPacket;
          if (!tryStringToProto(packet.getPayload(), &inputPacket)) {
            LOG(ERROR) << "Invalid special input packet for " << commandKey;
            unknownPacketReporter->unknownPacket(packet);
            break;
          }
          processSpecialInputPacket(inputPacket);
          break;
        }
        default:
          unknownPacketReporter->unknownPacket(packet);
          break;
      }
    }
  } catch (const std::runtime_error& ex) {
    LOG(ERROR) << "Packet input for " << commandKey
               << " failed: " << ex.what();
  }
  handleInputDone();
  return localDonePacket;
}

string Multiplexer::processDataPacket(const DataPacket& dataPacket) {
  string data;
  try {
    data = MuxPackets::decodeData(dataPacket);
  } catch (const std::runtime_error& ex) {
    return ex.what();
  }
  bool eof = dataPacket.eof();
  if (dataPacket.has_error()) {
    LOG(INFO) << "Remote source for fd " << dataPacket.fd_num()
              << " failed: " << dataPacket.error();
    eof = true;
  }

  lock_guard<std::recursive_mutex> guard(muxMutex);
  auto it = fdWriters.find(dataPacket.fd_num());
  if (it == fdWriters.end()) {
    // Install a closed writer so the error is only reported once
    try {
      shared_ptr<FdWriter> placeholder(
          new FdWriter(this, -1, dataPacket.fd_num(), false));
      fdWriters[dataPacket.fd_num()] = placeholder;
    } catch (const std::runtime_error& ex) {
      LOG(ERROR) << "Cannot track closed fd " << dataPacket.fd_num() << ": "
                 << ex.what();
    }
    return "write to closed file";
  }
  shared_ptr<FdWriter> fdWriter = it->second;
  if (fdWriter->isClosed()) {
    VLOG(1) << "Dropping data for closed fd " << dataPacket.fd_num();
    return "";
  }
  try {
    fdWriter->addData(data, eof);
  } catch (const std::runtime_error& ex) {
    fdWriter->close();
    return ex.what();
  }
  return "";
}

void Multiplexer::processAckPacket(const DataAckPacket& ackPacket) {
  lock_guard<std::recursive_mutex> guard(muxMutex);
  auto it = fdReaders.find(ackPacket.fd_num());
  if (it == fdReaders.end()) {
    VLOG(1) << "Ignoring ack for unknown fd " << ackPacket.fd_num();
    return;
  }
  it->second->notifyAck(ackPacket.ack_len());
  if (ackPacket.has_error()) {
    // The remote writer is gone, nothing will ever ack this reader again
    LOG(INFO) << "Remote write for fd " << ackPacket.fd_num()
              << " failed: " << ackPacket.error();
    it->second->close();
  }
}

void Multiplexer::processSpecialInputPacket(
    const SpecialInputPacket& inputPacket) {
  int localPtyFd;
  pid_t localCmdPid;
  {
    lock_guard<std::recursive_mutex> guard(muxMutex);
    localPtyFd = ptyFd;
    localCmdPid = cmdPid;
  }
  if (localPtyFd < 0) {
    VLOG(1) << "Ignoring special input for " << commandKey << ": no pty";
    return;
  }
  if (!inputPacket.has_win_size()) {
    return;
  }
  winsize tmpwin;
  tmpwin.ws_row = config.boundRows(inputPacket.win_size().rows());
  tmpwin.ws_col = config.boundCols(inputPacket.win_size().cols());
  tmpwin.ws_xpixel = 0;
  tmpwin.ws_ypixel = 0;
  VLOG(1) << "Resizing pty for " << commandKey << " to " << tmpwin.ws_row
          << "x" << tmpwin.ws_col;
  if (ioctl(localPtyFd, TIOCSWINSZ, &tmpwin) == -1) {
    LOG(WARNING) << "Cannot resize pty: " << strerror(GetErrno());
    return;
  }
  if (localCmdPid > 0 && ::kill(localCmdPid, SIGWINCH) == -1) {
    LOG(WARNING) << "Cannot signal " << localCmdPid
                 << " with SIGWINCH: " << strerror(GetErrno());
  }
}

MultiplexerPhase Multiplexer::getPhase() {
  lock_guard<std::recursive_mutex> guard(muxMutex);
  return phase;
}

bool Multiplexer::isStarted() {
  lock_guard<std::recursive_mutex> guard(muxMutex);
  return phase != MultiplexerPhase::CREATED;
}

int Multiplexer::numReaders() {
  lock_guard<std::recursive_mutex> guard(muxMutex);
  return int(fdReaders.size());
}

int Multiplexer::numWriters() {
  lock_guard<std::recursive_mutex> guard(muxMutex);
  return int(fdWriters.size());
}

string Multiplexer::toJsonString() {
  lock_guard<std::recursive_mutex> guard(muxMutex);
  json state;
  state["commandKey"] = commandKey.str();
  state["phase"] = multiplexerPhaseName(phase);
  state["hasPty"] = ptyFd >= 0;
  state["readers"] = json::object();
  state["writers"] = json::object();
  for (auto& it : fdReaders) {
    json reader;
    reader["pty"] = it.second->isPty();
    reader["closed"] = it.second->isClosed();
    reader["inFlight"] = it.second->getBytesInFlight();
    reader["totalRead"] = it.second->getTotalRead();
    state["readers"][to_string(it.first)] = reader;
  }
  for (auto& it : fdWriters) {
    json writer;
    writer["closed"] = it.second->isClosed();
    writer["eof"] = it.second->isEof();
    writer["pending"] = it.second->getPendingBytes();
    writer["totalWritten"] = it.second->getTotalWritten();
    state["writers"][to_string(it.first)] = writer;
  }
  return state.dump();
}
}  // namespace fdmux
