#ifndef NUMSYS_RADIX_ERROR_H_
#define NUMSYS_RADIX_ERROR_H_

#include "base.h"
#include <stdexcept>
#include <string>

namespace numsys {

/**
 * Radix is not one of 8, 10 or 16. A programming error: it always surfaces,
 * even from the Try* family.
 */
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string &message)
        : std::invalid_argument(message) {}
}; // class ConfigurationError

/**
 * Source text is not a number of the requested numeral system.
 */
class FormatError : public std::invalid_argument {
public:
    explicit FormatError(const std::string &message)
        : std::invalid_argument(message) {}
}; // class FormatError

struct RadixError {
    enum Kind {
        NONE,
        BAD_RADIX,
        BAD_FORMAT,
    };

    Kind kind;
    int position; // offending char in the raw source, or -1
    std::string message;

    RadixError();

    bool ok() const { return kind == NONE; }

    static RadixError NoError();
    static RadixError NullSource();
    static RadixError EmptySource();
    static RadixError UnsupportedRadix(int radix);
    static RadixError InvalidDigit(int position);
    static RadixError NoDigits();
    static RadixError NotPositive();

    std::string ToString() const;

    /**
     * Raise the exception matching `kind'.
     * Must not be called on NONE.
     */
    void Throw() const;
}; // struct RadixError

} // namespace numsys

#endif // NUMSYS_RADIX_ERROR_H_
