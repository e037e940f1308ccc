#include "radix-error.h"
#include "glog/logging.h"
#include <memory>
#include <stdio.h>

namespace numsys {

namespace {

RadixError MakeError(RadixError::Kind kind, int position, const char *message) {
    RadixError error;
    error.kind     = kind;
    error.position = position;
    error.message  = message;
    return error;
}

} // namespace

RadixError::RadixError()
    : kind(NONE)
    , position(-1)
    , message("ok") {
}

/*static*/ RadixError RadixError::NoError() {
    return RadixError();
}

/*static*/ RadixError RadixError::NullSource() {
    return MakeError(BAD_FORMAT, -1, "source value is null");
}

/*static*/ RadixError RadixError::EmptySource() {
    return MakeError(BAD_FORMAT, -1, "source value is empty");
}

/*static*/ RadixError RadixError::UnsupportedRadix(int radix) {
    DLOG(ERROR) << "unsupported radix: " << radix;
    return MakeError(BAD_RADIX, -1, "radix must be 8, 10, or 16");
}

/*static*/ RadixError RadixError::InvalidDigit(int position) {
    DCHECK_GE(position, 0);
    return MakeError(BAD_FORMAT, position,
                     "source does not represent a valid number in the given "
                     "numeral system");
}

/*static*/ RadixError RadixError::NoDigits() {
    return MakeError(BAD_FORMAT, -1, "source has no digits after the sign");
}

/*static*/ RadixError RadixError::NotPositive() {
    return MakeError(BAD_FORMAT, -1,
                     "source does not represent a positive number");
}

std::string RadixError::ToString() const {
    std::unique_ptr<char[]> buf(new char[1024]);

    if (position >= 0) {
        snprintf(buf.get(), 1024, "[%d] %s", position, message.c_str());
    } else {
        snprintf(buf.get(), 1024, "%s", message.c_str());
    }

    return std::string(buf.get());
}

void RadixError::Throw() const {
    switch (kind) {
        case BAD_RADIX:
            throw ConfigurationError(message);
        case BAD_FORMAT:
            throw FormatError(ToString());
        case NONE:
            break;
    }
    LOG(FATAL) << "no error to throw.";
}

} // namespace numsys
