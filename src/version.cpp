#include "version.hpp"
#include "buildconfig.hpp"

std::string version_string() {
    return BLOCKALIGN_VERSION;
}
