#ifndef ARGUMENT_ERROR_H
#define ARGUMENT_ERROR_H

#include <stdexcept>
#include <string>

namespace compat_rand {

// Thrown when a caller passes a value outside an operation's domain, such as a
// negative upper bound or a lower bound above the upper bound.
class argument_error : public std::invalid_argument {
 public:
  argument_error(const std::string& param_name, const std::string& msg)
      : std::invalid_argument(msg), param(param_name) {}

  const std::string& param_name() const {
    return param;
  }

 private:
  std::string param;
};

} // namespace compat_rand

#endif //ARGUMENT_ERROR_H
