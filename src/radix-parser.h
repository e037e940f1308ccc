#ifndef NUMSYS_RADIX_PARSER_H_
#define NUMSYS_RADIX_PARSER_H_

#include "radix-error.h"
#include "base.h"
#include <string.h>
#include <string>

namespace numsys {

/**
 * Outcome of one parsing: a value, or the error that stopped it.
 */
class ParseResult {
public:
    static ParseResult Ok(numsys_i32_t value) {
        return ParseResult(value, RadixError::NoError());
    }

    static ParseResult Fail(const RadixError &error) {
        return ParseResult(0, error);
    }

    bool ok() const { return error_.ok(); }

    DEF_GETTER(numsys_i32_t, value)
    DEF_GETTER(RadixError, error)

    numsys_i32_t ValueOrThrow() const {
        if (!ok()) {
            error_.Throw();
        }
        return value_;
    }

private:
    ParseResult(numsys_i32_t value, const RadixError &error)
        : value_(value)
        , error_(error) {}

    numsys_i32_t value_;
    RadixError   error_;
}; // class ParseResult


/**
 * Converts octal, decimal or hexadecimal text to a 32-bit signed integer.
 *
 * Grammar: [-] digit+
 *   The sign is accepted for radix 10 only; in radix 8 or 16 it is an
 *   invalid digit. Digits are the first `radix' chars of "0123456789ABCDEF",
 *   case insensitive.
 *
 * Overflow is not an error: the weighted sum of the digits is reduced
 * modulo 2^32 and reinterpreted as two's-complement, so "FFFFFFFF" in
 * radix 16 is -1 and "4294967296" in radix 10 is 0. Callers depend on it.
 *
 * Checking order: null source, radix, empty source, digits.
 *
 * Errors:
 *   ConfigurationError -> radix is not 8, 10 or 16. Thrown by every
 *                         entry, the Try* family included.
 *   FormatError        -> anything wrong with the source. Thrown by
 *                         Parse*By* and Parse*From*, reported as `false'
 *                         with a zero value by Try*.
 */
class RadixParser {
public:
    static bool IsSupportedRadix(int radix);

    // Value of `ch' in `radix', or -1 if `ch' is not one of its digits.
    static int DigitValue(int ch, int radix);

    // Status returning core, never throws.
    static ParseResult Parse(const char *z, size_t n, int radix);
    static ParseResult ParsePositive(const char *z, size_t n, int radix);

    static numsys_i32_t ParseByRadix(const char *z, size_t n, int radix);
    static numsys_i32_t ParseByRadix(const char *z, int radix) {
        return ParseByRadix(z, Length(z), radix);
    }
    static numsys_i32_t ParseByRadix(const std::string &s, int radix) {
        return ParseByRadix(s.data(), s.size(), radix);
    }

    static numsys_i32_t ParsePositiveByRadix(const char *z, size_t n, int radix);
    static numsys_i32_t ParsePositiveByRadix(const char *z, int radix) {
        return ParsePositiveByRadix(z, Length(z), radix);
    }
    static numsys_i32_t ParsePositiveByRadix(const std::string &s, int radix) {
        return ParsePositiveByRadix(s.data(), s.size(), radix);
    }

#define DECLARE_PARSE_POSITIVE_FROM(name, radix)                          \
    static numsys_i32_t ParsePositiveFrom##name(const char *z, size_t n) { \
        return ParsePositiveByRadix(z, n, radix);                         \
    }                                                                     \
    static numsys_i32_t ParsePositiveFrom##name(const char *z) {          \
        return ParsePositiveByRadix(z, radix);                            \
    }                                                                     \
    static numsys_i32_t ParsePositiveFrom##name(const std::string &s) {   \
        return ParsePositiveByRadix(s, radix);                            \
    }
    NUMSYS_SUPPORTED_RADIXES(DECLARE_PARSE_POSITIVE_FROM)
#undef DECLARE_PARSE_POSITIVE_FROM

    static bool TryParseByRadix(const char *z, size_t n, int radix,
                                numsys_i32_t *value);
    static bool TryParseByRadix(const char *z, int radix, numsys_i32_t *value) {
        return TryParseByRadix(z, Length(z), radix, value);
    }
    static bool TryParseByRadix(const std::string &s, int radix,
                                numsys_i32_t *value) {
        return TryParseByRadix(s.data(), s.size(), radix, value);
    }

    static bool TryParsePositiveByRadix(const char *z, size_t n, int radix,
                                        numsys_i32_t *value);
    static bool TryParsePositiveByRadix(const char *z, int radix,
                                        numsys_i32_t *value) {
        return TryParsePositiveByRadix(z, Length(z), radix, value);
    }
    static bool TryParsePositiveByRadix(const std::string &s, int radix,
                                        numsys_i32_t *value) {
        return TryParsePositiveByRadix(s.data(), s.size(), radix, value);
    }

#define DECLARE_TRY_PARSE_POSITIVE_FROM(name, radix)                      \
    static bool TryParsePositiveFrom##name(const char *z, size_t n,       \
                                           numsys_i32_t *value) {         \
        return TryParsePositiveByRadix(z, n, radix, value);               \
    }                                                                     \
    static bool TryParsePositiveFrom##name(const char *z,                 \
                                           numsys_i32_t *value) {         \
        return TryParsePositiveByRadix(z, radix, value);                  \
    }                                                                     \
    static bool TryParsePositiveFrom##name(const std::string &s,          \
                                           numsys_i32_t *value) {         \
        return TryParsePositiveByRadix(s, radix, value);                  \
    }
    NUMSYS_SUPPORTED_RADIXES(DECLARE_TRY_PARSE_POSITIVE_FROM)
#undef DECLARE_TRY_PARSE_POSITIVE_FROM

private:
    static size_t Length(const char *z) { return z ? strlen(z) : 0; }

    RadixParser() = delete;
    ~RadixParser() = delete;
}; // class RadixParser

} // namespace numsys

#endif // NUMSYS_RADIX_PARSER_H_
