#include <QuNet/core/context.hpp>

#include <utility>

namespace qunet {

Context::Context(Options options)
    : truncation_(std::move(options.truncation)),
      contraction_(std::move(options.contraction)),
      simplification_(std::move(options.simplification)) {}

Context& Context::set(TruncationOptions opts) {
  truncation_ = std::move(opts);
  return *this;
}

Context& Context::set(ContractOptions opts) {
  contraction_ = std::move(opts);
  return *this;
}

Context& Context::set(SimplifyOptions opts) {
  simplification_ = std::move(opts);
  return *this;
}

namespace {

Context& default_context() {
  static Context ctx;
  return ctx;
}

}  // namespace

const Context& get_default_context() { return default_context(); }

void set_default_context(const Context& ctx) { default_context() = ctx; }

void reset_default_context() { default_context() = Context{}; }

ScopedContext::ScopedContext(const Context& ctx)
    : previous_(default_context()) {
  default_context() = ctx;
}

ScopedContext::~ScopedContext() { default_context() = previous_; }

ScopedContext set_scoped_default_context(const Context& ctx) {
  return ScopedContext(ctx);
}

}  // namespace qunet
