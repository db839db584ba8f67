#ifndef __FDMUX_MULTIPLEXER_CONFIG__
#define __FDMUX_MULTIPLEXER_CONFIG__

#include "Headers.hpp"

namespace fdmux {
/**
 * @brief Buffer sizes, flow-control window and terminal bounds used by a
 * Multiplexer and its readers/writers.
 */
struct MultiplexerConfig {
  int64_t readBufferSize = READ_BUFFER_SIZE;
  int64_t writeBufferSize = WRITE_BUFFER_SIZE;
  int64_t maxSingleWriteSize = MAX_SINGLE_WRITE_SIZE;
  int64_t maxInFlightBytes = MAX_IN_FLIGHT_BYTES;

  int minTermRows = MIN_TERM_ROWS;
  int maxTermRows = MAX_TERM_ROWS;
  int minTermCols = MIN_TERM_COLS;
  int maxTermCols = MAX_TERM_COLS;

  /** @brief Log every inbound packet in the dispatch loop. */
  bool debug = false;
  /** @brief easylogging verbose level, -1 leaves it untouched. */
  int verbose = -1;

  /**
   * @brief Loads an INI file on top of the defaults and validates it.
   * @throws std::runtime_error if the file cannot be read or is invalid.
   */
  static MultiplexerConfig loadFromFile(const string& path);

  /** @throws std::runtime_error describing the first invalid setting. */
  void validate() const;

  int boundRows(int rows) const {
    return std::min(std::max(rows, minTermRows), maxTermRows);
  }
  int boundCols(int cols) const {
    return std::min(std::max(cols, minTermCols), maxTermCols);
  }
};
}  // namespace fdmux

#endif  // __FDMUX_MULTIPLEXER_CONFIG__
