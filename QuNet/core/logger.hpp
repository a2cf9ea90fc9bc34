#ifndef QUNET_CORE_LOGGER_HPP
#define QUNET_CORE_LOGGER_HPP

#include <QuNet/core/utility/singleton.hpp>

#include <iostream>

namespace qunet {

/// controls logging within QuNet components, only useful for
/// troubleshooting/learning
struct Logger : public Singleton<Logger> {
  /// registry bookkeeping of TensorNetwork (add/remove/reindex/retag)
  bool tensor_network = false;
  /// pairwise contractions executed by the contraction engine
  bool contract = false;
  /// contraction path search
  bool path = false;
  /// choice of sliced indices
  bool slice = false;
  /// each rewrite applied by the simplifier
  bool simplify = false;
  /// truncating splits and 1D compression sweeps
  bool compress = false;
  /// 2D boundary sweeps
  bool boundary = false;

  /// the stream for logging; can be set to nullptr
  std::ostream* stream = &std::clog;

 private:
  friend class Singleton<Logger>;
  Logger(int log_level = 0) {
    if (log_level > 0) {
      tensor_network = true;
      contract = true;
      path = true;
      slice = true;
      simplify = true;
      compress = true;
      boundary = true;
    }
  }
};

template <typename... Args>
void write_log(Logger& l, Args const&... args) noexcept {
  if (l.stream) {
    ((*l.stream << args), ...);
    (*l.stream).flush();
  }
}

}  // namespace qunet

#endif  // QUNET_CORE_LOGGER_HPP
