#pragma once

#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>

namespace cfigen {

struct error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Input that can only come from a bug in the code generator. Unrecoverable
// for the compilation unit.
struct precondition_error : error {
  using error::error;
};

// A directive or relocation kind the pipeline does not represent yet.
struct unsupported_directive : precondition_error {
  using precondition_error::precondition_error;
};

struct read_error : error {
  using error::error;
};

class register_mapping_error : public error {
public:
  enum class kind { missing_bank, unsupported_architecture, unsupported_register_bank };

  register_mapping_error(kind k, std::string const &what)
      : error(what), _kind(k) {}

  kind get_kind() const noexcept { return _kind; }

private:
  kind _kind;
};

enum class compile_stage : uint8_t { translate, codegen, frame_layout, unwind };

class compile_error : public error {
public:
  compile_error(uint32_t function_index, compile_stage stage,
                std::string const &what, std::exception_ptr cause)
      : error(what), _function_index(function_index), _stage(stage),
        _cause(std::move(cause)) {}

  uint32_t function_index() const noexcept { return _function_index; }
  compile_stage stage() const noexcept { return _stage; }
  std::exception_ptr const &cause() const noexcept { return _cause; }
  [[noreturn]] void rethrow_cause() const { std::rethrow_exception(_cause); }

private:
  uint32_t _function_index;
  compile_stage _stage;
  std::exception_ptr _cause;
};

} // namespace cfigen
