#ifndef XFSFIX_ERRORS_HPP
#define XFSFIX_ERRORS_HPP
#include <stdexcept>

namespace XFSFIX {
/* Raised when an image does not carry a usable XFS superblock. */
class FormatError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};
}
#endif
