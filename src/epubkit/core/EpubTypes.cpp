#include "epubkit/core/EpubTypes.hpp"
#include <sstream>

namespace epubkit {
namespace core {

bool Item::hasProperty(const std::string& token) const {
    std::istringstream iss(properties);
    std::string part;
    while (iss >> part) {
        if (part == token) {
            return true;
        }
    }
    return false;
}

}} // namespace epubkit::core
