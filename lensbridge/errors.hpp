#include <stdexcept>
#include <string>

#ifndef __LENSBRIDGE_ERRORS_HPP
#define __LENSBRIDGE_ERRORS_HPP

namespace lensbridge_interface
{
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// Errors reported back to the caller (bad input, kernel failures). Caller
// misuse (inconsistent array sizes) is not reported: it is fatal.
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------
// ---------------------------------------------------------------------------

class Error : public std::runtime_error
{
  public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

class UnrecognizedOption : public Error
{
  public:
    UnrecognizedOption(const std::string& key, const std::string& option) :
      Error(key.empty() ? "Setting " + option + " not implemented" :
                          "Setting " + key + " = " + option + " not implemented"),
      key_(key),
      option_(option) {
      }
    const std::string& key() const {
      return this->key_;
    }
    const std::string& option() const {
      return this->option_;
    }
  private:
    std::string key_;
    std::string option_;
};

class MissingSetting : public Error
{
  public:
    explicit MissingSetting(const std::string& key) :
      Error("Setting " + key + " missing from the settings mapping"),
      key_(key) {
      }
    const std::string& key() const {
      return this->key_;
    }
  private:
    std::string key_;
};

class TypeMismatch : public Error
{
  public:
    TypeMismatch(const std::string& key, const std::string& expected) :
      Error("Setting " + key + " has the wrong type (" + expected + " expected)"),
      key_(key) {
      }
    const std::string& key() const {
      return this->key_;
    }
  private:
    std::string key_;
};

class EmptyComputation : public Error
{
  public:
    explicit EmptyComputation(const std::string& what) : Error(what) {}
};

// thrown by LensingKernel implementations, carries the kernel native message
class KernelError : public Error
{
  public:
    explicit KernelError(const std::string& what) : Error(what) {}
};

class ModelConstructionFailed : public Error
{
  public:
    explicit ModelConstructionFailed(const std::string& what) : Error(what) {}
};

class KernelComputationFailed : public Error
{
  public:
    explicit KernelComputationFailed(const std::string& what) : Error(what) {}
};

}  // namespace lensbridge_interface
#endif // HEADER GUARD
