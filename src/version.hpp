#ifndef BLOCKALIGN_VERSION_HPP
#define BLOCKALIGN_VERSION_HPP

#include <string>

std::string version_string();

#endif
