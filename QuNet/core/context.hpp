#ifndef QUNET_CORE_CONTEXT_HPP
#define QUNET_CORE_CONTEXT_HPP

#include <QuNet/core/options.hpp>

namespace qunet {

/// helper for the named-parameter constructor of Context
struct ContextOptions {
  TruncationOptions truncation = {};
  ContractOptions contraction = {};
  SimplifyOptions simplification = {};
};

/// @brief library-wide defaults used when a call site does not pass options
///
/// The context contains:
/// - `truncation`: default TruncationOptions of split(), compression and
///   boundary contraction; its cutoff is qunet::default_cutoff
/// - `contraction`: default ContractOptions of TensorNetwork::contract() and
///   contraction_width()
/// - `simplification`: default SimplifyOptions of full_simplify()
class Context {
 public:
  using Options = ContextOptions;

  /// Example:
  /// ```cpp
  ///   Context ctx({.truncation = {.cutoff = 1e-8}});
  /// ```
  Context(Options options = Options{});

  const TruncationOptions& truncation() const { return truncation_; }
  const ContractOptions& contraction() const { return contraction_; }
  const SimplifyOptions& simplification() const { return simplification_; }

  /// \return ref to `*this`, for chaining
  Context& set(TruncationOptions opts);
  /// \return ref to `*this`, for chaining
  Context& set(ContractOptions opts);
  /// \return ref to `*this`, for chaining
  Context& set(SimplifyOptions opts);

 private:
  TruncationOptions truncation_;
  ContractOptions contraction_;
  SimplifyOptions simplification_;
};

/// @return the default context
const Context& get_default_context();

/// sets the default context
void set_default_context(const Context& ctx);

/// resets the default context to Context{}
void reset_default_context();

/// @brief restores the previous default context when leaving scope
class ScopedContext {
 public:
  /// makes @p ctx the default context
  explicit ScopedContext(const Context& ctx);
  ~ScopedContext();

  ScopedContext(const ScopedContext&) = delete;
  ScopedContext& operator=(const ScopedContext&) = delete;

 private:
  Context previous_;
};

/// sets the default context until the returned object goes out of scope
[[nodiscard]] ScopedContext set_scoped_default_context(const Context& ctx);

}  // namespace qunet

#endif  // QUNET_CORE_CONTEXT_HPP
