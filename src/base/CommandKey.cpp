#include "CommandKey.hpp"

namespace fdmux {
string CommandKey::getSessionId() const {
  auto slash = key.find('/');
  if (slash == string::npos) {
    return string();
  }
  return key.substr(0, slash);
}

string CommandKey::getCmdId() const {
  auto slash = key.find('/');
  if (slash == string::npos) {
    return string();
  }
  return key.substr(slash + 1);
}

void CommandKey::validate() const {
  if (key.empty()) {
    throw std::runtime_error("Empty command key");
  }
  if (std::count(key.begin(), key.end(), '/') != 1) {
    throw std::runtime_error("Malformed command key: " + key);
  }
  if (!isUuidString(getSessionId())) {
    throw std::runtime_error("Invalid session id in command key: " + key);
  }
  if (!isUuidString(getCmdId())) {
    throw std::runtime_error("Invalid cmd id in command key: " + key);
  }
}

bool isUuidString(const string& s) {
  if (int(s.length()) != UUID_LENGTH) {
    return false;
  }
  for (int a = 0; a < UUID_LENGTH; a++) {
    if (a == 8 || a == 13 || a == 18 || a == 23) {
      if (s[a] != '-') {
        return false;
      }
    } else if (!isxdigit((unsigned char)s[a])) {
      return false;
    }
  }
  return true;
}
}  // namespace fdmux
