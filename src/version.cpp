#include "version.h"
#include <iostream>

namespace bridgelink {
namespace version {

void print_version_info() {
    std::cout << "bridgelink " << STRING;
    if (GIT_DESCRIBE[0] != '\0') {
        std::cout << " (" << GIT_DESCRIBE << ")";
    }
    if (BUILD[0] != '\0') {
        std::cout << " [" << BUILD << "]";
    }
    std::cout << std::endl;
}

} // namespace version
} // namespace bridgelink
