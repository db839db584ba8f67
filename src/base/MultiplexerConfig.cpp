#include "MultiplexerConfig.hpp"

#include "SimpleIni.h"

namespace fdmux {
namespace {
int64_t readInt(const CSimpleIniA& ini, const char* section, const char* key,
                int64_t defaultValue) {
  const char* value = ini.GetValue(section, key, NULL);
  if (value == NULL) {
    return defaultValue;
  }
  try {
    return std::stoll(value);
  } catch (const std::logic_error& ex) {
    throw std::runtime_error(string("Invalid value for ") + section + "." +
                             key + ": " + value);
  }
}
}  // namespace

MultiplexerConfig MultiplexerConfig::loadFromFile(const string& path) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    throw std::runtime_error("Invalid config file: " + path);
  }

  MultiplexerConfig config;
  config.readBufferSize =
      readInt(ini, "Buffers", "read_buffer_size", config.readBufferSize);
  config.writeBufferSize =
      readInt(ini, "Buffers", "write_buffer_size", config.writeBufferSize);
  config.maxSingleWriteSize = readInt(ini, "Buffers", "max_single_write_size",
                                      config.maxSingleWriteSize);
  // The window follows the read buffer unless it is set explicitly.
  config.maxInFlightBytes = readInt(ini, "Buffers", "max_in_flight_bytes",
                                    10 * config.readBufferSize);

  config.minTermRows =
      int(readInt(ini, "Terminal", "min_rows", config.minTermRows));
  config.maxTermRows =
      int(readInt(ini, "Terminal", "max_rows", config.maxTermRows));
  config.minTermCols =
      int(readInt(ini, "Terminal", "min_cols", config.minTermCols));
  config.maxTermCols =
      int(readInt(ini, "Terminal", "max_cols", config.maxTermCols));

  config.debug = readInt(ini, "Debug", "debug", 0) != 0;
  config.verbose = int(readInt(ini, "Debug", "verbose", config.verbose));

  config.validate();
  LOG(INFO) << "Loaded multiplexer config from " << path;
  return config;
}

void MultiplexerConfig::validate() const {
  if (readBufferSize <= 0 || writeBufferSize <= 0 || maxSingleWriteSize <= 0 ||
      maxInFlightBytes <= 0) {
    throw std::runtime_error("Buffer sizes must be positive");
  }
  if (maxSingleWriteSize > readBufferSize) {
    throw std::runtime_error(
        "max_single_write_size cannot exceed read_buffer_size");
  }
  if (maxInFlightBytes < readBufferSize) {
    throw std::runtime_error(
        "max_in_flight_bytes must be at least read_buffer_size");
  }
  if (minTermRows <= 0 || minTermCols <= 0) {
    throw std::runtime_error("Terminal minimums must be positive");
  }
  if (minTermRows > maxTermRows || minTermCols > maxTermCols) {
    throw std::runtime_error("Terminal minimum exceeds maximum");
  }
  if (maxTermRows > USHRT_MAX || maxTermCols > USHRT_MAX) {
    throw std::runtime_error("Terminal maximums cannot exceed " +
                             to_string(USHRT_MAX));
  }
}
}  // namespace fdmux
