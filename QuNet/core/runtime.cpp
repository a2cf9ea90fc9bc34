#include <QuNet/core/runtime.hpp>

#include <cstdlib>
#include <stdexcept>
#include <thread>

namespace qunet {

namespace detail {
int& nthreads_accessor() {
  auto init_nthreads = []() {
    const auto nthreads_cstr = std::getenv("QUNET_NUM_THREADS");
    int nthreads = nthreads_cstr ? std::atoi(nthreads_cstr)
                                 : (std::thread::hardware_concurrency() > 0
                                        ? std::thread::hardware_concurrency()
                                        : 1);
    return nthreads > 0 ? nthreads : 1;
  };
  static int nthreads = init_nthreads();
  return nthreads;
}
}  // namespace detail

void set_num_threads(int nt) {
  if (nt < 1)
    throw std::invalid_argument("set_num_threads(nthreads): invalid nthreads");
  detail::nthreads_accessor() = nt;
}

int num_threads() { return detail::nthreads_accessor(); }

}  // namespace qunet
