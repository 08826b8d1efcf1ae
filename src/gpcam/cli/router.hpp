#pragma once

#include "gphoto/native_api.hpp"

namespace gpcam::cli {

// Routes `gpcam` subcommands and returns process exit codes with a stable
// contract for scripts:
//   0  => success
//   1  => command failed after valid invocation
//   2  => usage error (unknown command / invalid args)
//   20 => no supported camera found
//   21 => camera busy
//   22 => invalid or read-only setting value
int Dispatch(int argc, char** argv);

// Same routing with every libgphoto2 call going through `api`.
int Dispatch(int argc, char** argv, const gphoto::NativeApi& api);

} // namespace gpcam::cli
