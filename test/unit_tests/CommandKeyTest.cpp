#include "CommandKey.hpp"

#include "TestHeaders.hpp"

using namespace fdmux;

namespace {
const string SESSION_ID = "9a0c1e52-3b5f-4a8d-9c2e-7f6b1d0e4a31";
const string CMD_ID = "1f2e3d4c-5b6a-4789-8a9b-0c1d2e3f4a5b";
}  // namespace

TEST_CASE("CommandKey splits into session and command", "[CommandKey]") {
  CommandKey ck = CommandKey::make(SESSION_ID, CMD_ID);
  REQUIRE(ck.str() == SESSION_ID + "/" + CMD_ID);
  REQUIRE(ck.getSessionId() == SESSION_ID);
  REQUIRE(ck.getCmdId() == CMD_ID);
  REQUIRE_NOTHROW(ck.validate());
  REQUIRE(ck == CommandKey(SESSION_ID + "/" + CMD_ID));
}

TEST_CASE("CommandKey generate makes distinct valid keys", "[CommandKey]") {
  CommandKey a = CommandKey::generate(SESSION_ID);
  CommandKey b = CommandKey::generate(SESSION_ID);
  REQUIRE(a != b);
  REQUIRE(a.getSessionId() == SESSION_ID);
  REQUIRE(isUuidString(a.getCmdId()));
  REQUIRE_NOTHROW(a.validate());

  unordered_set<CommandKey> keys;
  keys.insert(a);
  keys.insert(b);
  keys.insert(a);
  REQUIRE(keys.size() == 2);
}

TEST_CASE("CommandKey validate rejects malformed keys", "[CommandKey]") {
  REQUIRE_THROWS(CommandKey().validate());
  REQUIRE_THROWS(CommandKey(SESSION_ID).validate());
  REQUIRE_THROWS(CommandKey(SESSION_ID + "/" + CMD_ID + "/x").validate());
  REQUIRE_THROWS(CommandKey::make(SESSION_ID, "not-a-uuid").validate());
  REQUIRE_THROWS(CommandKey::make("", CMD_ID).validate());
  REQUIRE(CommandKey(SESSION_ID).getCmdId() == "");
}

TEST_CASE("isUuidString", "[CommandKey]") {
  REQUIRE(isUuidString(SESSION_ID));
  REQUIRE_FALSE(isUuidString(""));
  REQUIRE_FALSE(isUuidString("9a0c1e52x3b5f-4a8d-9c2e-7f6b1d0e4a31"));
  REQUIRE_FALSE(isUuidString("9a0c1e52-3b5f-4a8d-9c2e-7f6b1d0e4a3g"));
}
