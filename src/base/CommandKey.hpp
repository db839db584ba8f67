#ifndef __FDMUX_COMMAND_KEY__
#define __FDMUX_COMMAND_KEY__

#include "Headers.hpp"

namespace fdmux {
/**
 * @brief Identifies one remote command execution as "<sessionId>/<cmdId>".
 *
 * Immutable once constructed.  A key must never be reused for a different
 * live command.
 */
class CommandKey {
 public:
  CommandKey() {}
  explicit CommandKey(const string& _key) : key(_key) {}

  static CommandKey make(const string& sessionId, const string& cmdId) {
    return CommandKey(sessionId + "/" + cmdId);
  }

  /** @brief Creates a key for a new command with a random UUID cmdId. */
  static CommandKey generate(const string& sessionId) {
    return make(sessionId, sole::uuid4().str());
  }

  string getSessionId() const;
  string getCmdId() const;
  const string& str() const { return key; }
  bool empty() const { return key.empty(); }

  /**
   * @throws std::runtime_error unless both halves are UUID strings.
   */
  void validate() const;

  bool operator==(const CommandKey& other) const { return key == other.key; }
  bool operator!=(const CommandKey& other) const { return key != other.key; }
  bool operator<(const CommandKey& other) const { return key < other.key; }

 protected:
  string key;
};

inline std::ostream& operator<<(std::ostream& os, const CommandKey& ck) {
  return os << ck.str();
}

/** @brief Returns true for the canonical 8-4-4-4-12 hex UUID format. */
bool isUuidString(const string& s);
}  // namespace fdmux

namespace std {
template <>
struct hash<fdmux::CommandKey> {
  size_t operator()(const fdmux::CommandKey& ck) const {
    return hash<string>()(ck.str());
  }
};
}  // namespace std

#endif  // __FDMUX_COMMAND_KEY__
