#include "MuxPackets.hpp"

namespace fdmux {
Packet MuxPackets::makeDataPacket(const CommandKey& ck, int fdNum,
                                  const string& data, bool eof,
                                  const string& error) {
  DataPacket dataPacket;
  dataPacket.set_command_key(ck.str());
  dataPacket.set_fd_num(fdNum);
  string data64;
  if (!Base64::Encode(data, &data64)) {
    STFATAL << "Could not base64 encode " << data.length() << " bytes";
  }
  dataPacket.set_data64(data64);
  dataPacket.set_eof(eof);
  if (!error.empty()) {
    dataPacket.set_error(error);
  }
  return protoToPacket(FdMuxPacketType::DATA, dataPacket);
}

Packet MuxPackets::makeDataAckPacket(const CommandKey& ck, int fdNum,
                                     int64_t ackLen, const string& error) {
  DataAckPacket ackPacket;
  ackPacket.set_command_key(ck.str());
  ackPacket.set_fd_num(fdNum);
  ackPacket.set_ack_len(ackLen);
  if (!error.empty()) {
    ackPacket.set_error(error);
  }
  return protoToPacket(FdMuxPacketType::DATA_ACK, ackPacket);
}

Packet MuxPackets::makeSpecialInputPacket(const CommandKey& ck, int rows,
                                          int cols) {
  SpecialInputPacket inputPacket;
  inputPacket.set_command_key(ck.str());
  inputPacket.mutable_win_size()->set_rows(rows);
  inputPacket.mutable_win_size()->set_cols(cols);
  return protoToPacket(FdMuxPacketType::SPECIAL_INPUT, inputPacket);
}

Packet MuxPackets::makeCmdDonePacket(const CommandKey& ck, int exitCode,
                                     int64_t durationMs) {
  CmdDonePacket donePacket;
  donePacket.set_command_key(ck.str());
  donePacket.set_ts(std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::system_clock::now().time_since_epoch())
                        .count());
  donePacket.set_exit_code(exitCode);
  donePacket.set_duration_ms(durationMs);
  return protoToPacket(FdMuxPacketType::CMD_DONE, donePacket);
}

string MuxPackets::decodeData(const DataPacket& dataPacket) {
  const string& data64 = dataPacket.data64();
  string data;
  if (data64.empty()) {
    return data;
  }
  if (!isValidBase64(data64) || !Base64::Decode(data64, &data)) {
    throw std::runtime_error("decoding base64 data: invalid input of length " +
                             to_string(data64.length()));
  }
  return data;
}

string MuxPackets::packetToString(const Packet& packet) {
  std::ostringstream ss;
  switch (packet.getHeader()) {
    case FdMuxPacketType::DATA: {
      DataPacket dataPacket;
      if (tryStringToProto(packet.getPayload(), &dataPacket)) {
        ss << "data fd=" << dataPacket.fd_num()
           << " len64=" << dataPacket.data64().length()
           << " eof=" << dataPacket.eof();
        if (dataPacket.has_error()) {
          ss << " error=" << dataPacket.error();
        }
        return ss.str();
      }
      break;
    }
    case FdMuxPacketType::DATA_ACK: {
      DataAckPacket ackPacket;
      if (tryStringToProto(packet.getPayload(), &ackPacket)) {
        ss << "dataack fd=" << ackPacket.fd_num()
           << " acklen=" << ackPacket.ack_len();
        if (ackPacket.has_error()) {
          ss << " error=" << ackPacket.error();
        }
        return ss.str();
      }
      break;
    }
    case FdMuxPacketType::CMD_DONE:
      return "cmddone";
    case FdMuxPacketType::SPECIAL_INPUT:
      return "specialinput";
    default:
      break;
  }
  ss << "packet header=" << int(packet.getHeader())
     << " len=" << packet.getPayload().length();
  return ss.str();
}

bool MuxPackets::isValidBase64(const string& s) {
  if (s.length() % 4 != 0) {
    return false;
  }
  size_t padding = 0;
  for (size_t a = 0; a < s.length(); a++) {
    char c = s[a];
    if (c == '=') {
      padding++;
      continue;
    }
    if (padding > 0) {
      // Padding is only allowed at the end
      return false;
    }
    if (!isalnum((unsigned char)c) && c != '+' && c != '/') {
      return false;
    }
  }
  return padding <= 2;
}
}  // namespace fdmux
