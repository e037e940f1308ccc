#include "base.h"
#include "glog/logging.h"

namespace numsys {

static_assert(arraysize(kDigitAlphabet) == kMaxRadix + 1,
              "alphabet must cover the largest radix");
static_assert(kHex == kMaxRadix, "hex is the largest radix");

void EnvironmentInitialize() {
    DLOG(INFO) << "digit alphabet: " << kDigitAlphabet
               << " word bits: " << kWordBits;

#define LOG_RADIX(name, value) \
    DLOG(INFO) << "supported radix: " #name " (" << value << ")";
    NUMSYS_SUPPORTED_RADIXES(LOG_RADIX)
#undef LOG_RADIX
}

} // namespace numsys
