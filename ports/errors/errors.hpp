#pragma once

#ifndef PROCESS_MINER_ERRORS_HPP
#define PROCESS_MINER_ERRORS_HPP

#include <cstddef>
#include <format>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace errors {
class Error;
}
using error = std::shared_ptr<errors::Error>;

namespace errors {

/**
 * @class Error
 * @brief Base interface for every error value passed between modules.
 */
class Error {
 public:
  virtual ~Error() = default;
  [[nodiscard]] virtual std::string What() const = 0;

  // Next error in a wrapped chain.
  [[nodiscard]] virtual error Unwrap() const { return nullptr; }

  // Members of a joined error.
  [[nodiscard]] virtual std::vector<error> GetJoined() const { return {}; }
};

class StringError : public Error {
 public:
  explicit StringError(std::string msg) : message(std::move(msg)) {}
  [[nodiscard]] std::string What() const override { return message; }

 private:
  std::string message;
};

class WrappedError : public Error {
 public:
  WrappedError(std::string msg, error e)
      : message(std::move(msg)), err(std::move(e)) {}
  [[nodiscard]] std::string What() const override {
    return message + ": " + err->What();
  }
  [[nodiscard]] error Unwrap() const override { return err; }

 private:
  std::string message;
  error err;
};

class JoinedError : public Error {
 public:
  explicit JoinedError(std::vector<error> es) : errs(std::move(es)) {}
  [[nodiscard]] std::string What() const override {
    std::ostringstream ss;
    for (size_t i = 0; i < errs.size(); ++i) {
      if (i > 0) ss << "; ";
      ss << errs[i]->What();
    }
    return ss.str();
  }
  [[nodiscard]] std::vector<error> GetJoined() const override { return errs; }

 private:
  std::vector<error> errs;
};

/**
 * @class ContractError
 * @brief Input that breaks the engine's contract: an event with a missing
 * field, a reference flow with an empty or repeated label, a CSV without a
 * required column.
 *
 * @p subject names the offending record ("event #12", "ideal flow[3]"),
 * @p field the attribute that is wrong.
 */
class ContractError : public Error {
 public:
  ContractError(std::string subject, std::string field, std::string reason)
      : subject_(std::move(subject)),
        field_(std::move(field)),
        reason_(std::move(reason)) {}

  [[nodiscard]] std::string What() const override {
    return subject_ + ": " + field_ + " " + reason_;
  }

  const std::string& Subject() const { return subject_; }
  const std::string& Field() const { return field_; }

 private:
  std::string subject_;
  std::string field_;
  std::string reason_;
};

inline error New(const std::string& message) {
  return std::make_shared<StringError>(message);
}

template <typename... Args>
error Errorf(const std::format_string<Args...>& fmt, Args&&... args) {
  try {
    return errors::New(std::format(fmt, std::forward<Args>(args)...));
  } catch (const std::format_error& e) {
    return errors::New(std::string("errors::Errorf(): invalid format: ") +
                       e.what());
  }
}

inline error Contract(const std::string& subject, const std::string& field,
                      const std::string& reason) {
  return std::make_shared<ContractError>(subject, field, reason);
}

/**
 * @brief Adds context to @p err. A nullptr @p err yields a plain error with
 * @p msg.
 */
inline error Wrap(error err, const std::string& msg) {
  if (err == nullptr) {
    return errors::New(msg);
  }
  return std::make_shared<WrappedError>(msg, std::move(err));
}

template <typename... Args>
error Wrapf(error err, const std::format_string<Args...>& fmt,
            Args&&... args) {
  if (err == nullptr) {
    return errors::Errorf(fmt, std::forward<Args>(args)...);
  }
  try {
    return errors::Wrap(std::move(err),
                        std::format(fmt, std::forward<Args>(args)...));
  } catch (const std::format_error& e) {
    return errors::Wrap(std::move(err),
                        std::string("errors::Wrapf(): invalid format: ") +
                            e.what());
  }
}

/**
 * @brief Collapses accumulated errors: nullptr when none, the error itself
 * when there is one, a JoinedError otherwise.
 */
inline error Join(std::vector<error> errs) {
  std::vector<error> kept;
  kept.reserve(errs.size());
  for (auto& e : errs) {
    if (e) kept.push_back(std::move(e));
  }
  if (kept.empty()) return nullptr;
  if (kept.size() == 1) return kept.front();
  return std::make_shared<JoinedError>(std::move(kept));
}

namespace detail {

// Depth-first walk over wrapped and joined errors until visit returns true.
template <typename Visitor>
bool walk(const error& root, Visitor&& visit) {
  std::vector<error> stack;
  if (root) stack.push_back(root);

  while (!stack.empty()) {
    error current = stack.back();
    stack.pop_back();

    if (visit(current)) return true;

    auto joined = current->GetJoined();
    stack.insert(stack.end(), joined.rbegin(), joined.rend());
    if (error next = current->Unwrap()) {
      stack.push_back(next);
    }
  }
  return false;
}

}  // namespace detail

// Reports whether any error in err's chain is target.
inline bool Is(const error& err, const error& target) {
  if (target == nullptr) return err == nullptr;
  return detail::walk(err, [&](const error& e) { return e == target; });
}

// Finds the first error in err's chain of type T and stores it in *target.
template <typename T>
bool As(const error& err, std::shared_ptr<T>* target) {
  if (err == nullptr || target == nullptr) return false;
  return detail::walk(err, [&](const error& e) {
    if (auto specific = std::dynamic_pointer_cast<T>(e)) {
      *target = specific;
      return true;
    }
    return false;
  });
}

}  // namespace errors

#endif  // PROCESS_MINER_ERRORS_HPP
