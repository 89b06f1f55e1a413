#include "xlformula/version.h"

namespace xlformula {

namespace {

#ifndef XLFORMULA_VERSION
#define XLFORMULA_VERSION "0.0.0"
#endif

#ifndef XLFORMULA_GIT_COMMIT
#define XLFORMULA_GIT_COMMIT "unknown"
#endif

#ifndef XLFORMULA_GIT_DIRTY
#define XLFORMULA_GIT_DIRTY 0
#endif

}  // namespace

VersionInfo get_version_info() {
  VersionInfo info;
  info.version = XLFORMULA_VERSION;
  info.git_commit = XLFORMULA_GIT_COMMIT;
  info.git_dirty = (XLFORMULA_GIT_DIRTY != 0);
  return info;
}

std::string version_string() {
  VersionInfo info = get_version_info();
  std::string out = info.version + " (" + info.git_commit;
  if (info.git_dirty) out += "-dirty";
  out += ")";
  return out;
}

}  // namespace xlformula
