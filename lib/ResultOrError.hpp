#ifndef POWLEDGER_RESULT_OR_ERROR_HPP
#define POWLEDGER_RESULT_OR_ERROR_HPP

#include <cstdint>
#include <new>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace pwl {

/**
 * Common base for module error types.
 * Modules derive their own Error from it so results from different layers
 * cannot be mixed up by accident.
 */
struct RoeErrorBase {
  int32_t code{ 0 };
  std::string message;

  RoeErrorBase() = default;
  RoeErrorBase(int32_t c, const std::string &msg) : code(c), message(msg) {}
  RoeErrorBase(int32_t c, std::string &&msg) : code(c), message(std::move(msg)) {}
  explicit RoeErrorBase(const std::string &msg) : code(-1), message(msg) {}
  explicit RoeErrorBase(std::string &&msg) : code(-1), message(std::move(msg)) {}
};

/**
 * Holds either a value of type T or an error of type E.
 *
 * Both alternatives convert implicitly so a function returning
 * ResultOrError<T, E> can simply `return value;` or `return E(...);`.
 */
template <typename T, typename E = RoeErrorBase> class ResultOrError {
public:
  ResultOrError(const T &value) : hasValue_(true) { new (&storage_) T(value); }
  ResultOrError(T &&value) : hasValue_(true) {
    new (&storage_) T(std::move(value));
  }
  ResultOrError(const E &err) : hasValue_(false) { new (&storage_) E(err); }
  ResultOrError(E &&err) : hasValue_(false) {
    new (&storage_) E(std::move(err));
  }

  ResultOrError(const ResultOrError &other) : hasValue_(other.hasValue_) {
    if (hasValue_) {
      new (&storage_) T(other.val());
    } else {
      new (&storage_) E(other.err());
    }
  }

  ResultOrError(ResultOrError &&other) noexcept : hasValue_(other.hasValue_) {
    if (hasValue_) {
      new (&storage_) T(std::move(other.val()));
    } else {
      new (&storage_) E(std::move(other.err()));
    }
  }

  ~ResultOrError() { destroy(); }

  ResultOrError &operator=(const ResultOrError &other) {
    if (this != &other) {
      ResultOrError copy(other);
      *this = std::move(copy);
    }
    return *this;
  }

  ResultOrError &operator=(ResultOrError &&other) noexcept {
    if (this != &other) {
      destroy();
      hasValue_ = other.hasValue_;
      if (hasValue_) {
        new (&storage_) T(std::move(other.val()));
      } else {
        new (&storage_) E(std::move(other.err()));
      }
    }
    return *this;
  }

  bool isOk() const { return hasValue_; }
  bool isError() const { return !hasValue_; }
  explicit operator bool() const { return hasValue_; }

  const T &value() const {
    if (!hasValue_) {
      throw std::runtime_error("Accessing value of error result: " +
                               err().message);
    }
    return val();
  }

  T &value() {
    if (!hasValue_) {
      throw std::runtime_error("Accessing value of error result: " +
                               err().message);
    }
    return val();
  }

  T valueOr(const T &fallback) const { return hasValue_ ? val() : fallback; }

  const E &error() const {
    if (hasValue_) {
      throw std::runtime_error("Accessing error of success result");
    }
    return err();
  }

  E &error() {
    if (hasValue_) {
      throw std::runtime_error("Accessing error of success result");
    }
    return err();
  }

  const T &operator*() const { return value(); }
  T &operator*() { return value(); }
  const T *operator->() const { return &value(); }
  T *operator->() { return &value(); }

private:
  T &val() { return *reinterpret_cast<T *>(&storage_); }
  const T &val() const { return *reinterpret_cast<const T *>(&storage_); }
  E &err() { return *reinterpret_cast<E *>(&storage_); }
  const E &err() const { return *reinterpret_cast<const E *>(&storage_); }

  void destroy() {
    if (hasValue_) {
      val().~T();
    } else {
      err().~E();
    }
  }

  bool hasValue_;
  typename std::aligned_union<0, T, E>::type storage_;
};

// Success carries no payload; `return {};` reports success.
template <typename E> class ResultOrError<void, E> {
public:
  ResultOrError() : hasValue_(true) {}
  ResultOrError(const E &err) : hasValue_(false), error_(err) {}
  ResultOrError(E &&err) : hasValue_(false), error_(std::move(err)) {}

  bool isOk() const { return hasValue_; }
  bool isError() const { return !hasValue_; }
  explicit operator bool() const { return hasValue_; }

  const E &error() const {
    if (hasValue_) {
      throw std::runtime_error("Accessing error of success result");
    }
    return error_;
  }

  E &error() {
    if (hasValue_) {
      throw std::runtime_error("Accessing error of success result");
    }
    return error_;
  }

private:
  bool hasValue_;
  E error_;
};

} // namespace pwl

#endif // POWLEDGER_RESULT_OR_ERROR_HPP
