#ifndef INCLUDE_JSBOX_ERRORS_H_
#define INCLUDE_JSBOX_ERRORS_H_

#include <string>
#include <vector>
#include <stdexcept>

// Invalid caller-supplied options; fatal to the call that received them
class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

// A bootstrap template lacks one or more required markers
class TemplateIntegrityError : public std::runtime_error {
  std::vector<std::string> missing_;
 public:
  explicit TemplateIntegrityError(std::vector<std::string> missing);
  const std::vector<std::string>& Missing() const { return missing_; }
};

#endif  // INCLUDE_JSBOX_ERRORS_H_
