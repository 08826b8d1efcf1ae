#ifndef GPCAM_TESTS_COMMON_CLI_DISPATCH_HPP_
#define GPCAM_TESTS_COMMON_CLI_DISPATCH_HPP_

#include "gpcam/cli/router.hpp"

#include <iostream>
#include <sstream>
#include <streambuf>
#include <string>
#include <vector>

namespace gpcam::tests::common {

inline int DispatchArgs(const std::vector<std::string>& argv_storage,
                        const gphoto::NativeApi& api) {
  std::vector<char*> argv;
  argv.reserve(argv_storage.size());
  for (const auto& arg : argv_storage) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  return gpcam::cli::Dispatch(static_cast<int>(argv.size()), argv.data(), api);
}

// Output of one dispatch with stdout and stderr captured separately.
struct CapturedDispatch {
  int exit_code = 0;
  std::string out;
  std::string err;
};

inline CapturedDispatch DispatchCaptured(const std::vector<std::string>& argv_storage,
                                         const gphoto::NativeApi& api) {
  std::ostringstream out;
  std::ostringstream err;
  std::streambuf* original_out = std::cout.rdbuf(out.rdbuf());
  std::streambuf* original_err = std::cerr.rdbuf(err.rdbuf());
  const int exit_code = DispatchArgs(argv_storage, api);
  std::cout.rdbuf(original_out);
  std::cerr.rdbuf(original_err);
  return CapturedDispatch{.exit_code = exit_code, .out = out.str(), .err = err.str()};
}

} // namespace gpcam::tests::common

#endif // GPCAM_TESTS_COMMON_CLI_DISPATCH_HPP_
