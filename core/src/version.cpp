#include "cryoql/version.h"

#ifndef CRYOQL_VERSION
#define CRYOQL_VERSION "0.0.0"
#endif

#ifndef CRYOQL_GIT_COMMIT
#define CRYOQL_GIT_COMMIT "unknown"
#endif

#ifndef CRYOQL_GIT_DIRTY
#define CRYOQL_GIT_DIRTY 0
#endif

namespace cryoql {

std::string version() {
  return CRYOQL_VERSION;
}

std::string version_string() {
  std::string commit = CRYOQL_GIT_COMMIT;
  if (CRYOQL_GIT_DIRTY != 0) commit += "-dirty";
  return version() + " (" + commit + ")";
}

}  // namespace cryoql
