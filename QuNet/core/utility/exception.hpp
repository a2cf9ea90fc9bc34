#ifndef QUNET_CORE_UTILITY_EXCEPTION_HPP
#define QUNET_CORE_UTILITY_EXCEPTION_HPP

#include <cstddef>
#include <exception>
#include <string>

namespace qunet {

/// basic QuNet exception
/// @sa QUNET_ASSERT
class Exception : public std::exception {
 public:
  Exception(const std::string& str) : msg_(str) {}
  virtual const char* what() const noexcept { return msg_.data(); }

 private:
  std::string msg_;
};  // class Exception

/// extents of an index disagree, or an array's shape disagrees with the
/// indices declared for it
class ShapeError : public Exception {
 public:
  using Exception::Exception;
};

/// the result of a contraction cannot be deduced without explicit output
/// indices (hyperindices present)
class AmbiguousContractionError : public Exception {
 public:
  using Exception::Exception;
};

/// a rename would merge previously-distinct indices or tags
class NameCollisionError : public Exception {
 public:
  using Exception::Exception;
};

/// the estimated contraction width exceeds the budget given by the caller;
/// thrown before any arithmetic is done
class ResourceExhaustion : public Exception {
 public:
  ResourceExhaustion(const std::string& str, double width, double budget)
      : Exception(str), width_(width), budget_(budget) {}

  /// @return log2 of the largest intermediate of the rejected contraction
  double width() const noexcept { return width_; }
  /// @return the budget that was exceeded
  double budget() const noexcept { return budget_; }

 private:
  double width_;
  double budget_;
};

}  // namespace qunet

#endif  // QUNET_CORE_UTILITY_EXCEPTION_HPP
