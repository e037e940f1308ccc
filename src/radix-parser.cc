#include "radix-parser.h"
#include "glog/logging.h"

namespace numsys {

namespace {

// Format errors become `false', radix errors keep propagating.
bool Capture(const ParseResult &result, numsys_i32_t *value) {
    if (result.error().kind == RadixError::BAD_RADIX) {
        result.error().Throw();
    }
    *value = result.ok() ? result.value() : 0;
    return result.ok();
}

} // namespace

/*static*/
bool RadixParser::IsSupportedRadix(int radix) {
#define IS_RADIX(name, value) radix == value ||
    return NUMSYS_SUPPORTED_RADIXES(IS_RADIX) false;
#undef IS_RADIX
}

/*static*/
int RadixParser::DigitValue(int ch, int radix) {
    if (!IsSupportedRadix(radix)) {
        return -1;
    }
    if (ch >= 'a' && ch <= 'z') {
        ch -= 'a' - 'A';
    }
    for (int i = 0; i < radix; i++) {
        if (kDigitAlphabet[i] == ch) {
            return i;
        }
    }
    return -1;
}

/*static*/
ParseResult RadixParser::Parse(const char *z, size_t n, int radix) {
    if (!z) {
        return ParseResult::Fail(RadixError::NullSource());
    }
    if (!IsSupportedRadix(radix)) {
        return ParseResult::Fail(RadixError::UnsupportedRadix(radix));
    }
    if (n == 0) {
        return ParseResult::Fail(RadixError::EmptySource());
    }

    size_t i = 0;
    bool negative = false;
    if (radix == kDecimal && z[0] == kNegativeSign) {
        negative = true;
        i++;
        if (i == n) {
            return ParseResult::Fail(RadixError::NoDigits());
        }
    }

    // Horner's rule modulo 2^32 gives the same low bits as summing
    // digit * radix^k over the whole string.
    numsys_u64_t rv = 0;
    for (; i < n; i++) {
        auto digit = DigitValue(static_cast<unsigned char>(z[i]), radix);
        if (digit < 0) {
            return ParseResult::Fail(
                    RadixError::InvalidDigit(static_cast<int>(i)));
        }
        rv = (rv * radix + digit) & kWordMask;
    }

    auto bits = static_cast<numsys_u32_t>(rv);
    if (negative) {
        bits = 0u - bits;
    }
    return ParseResult::Ok(WrapToI32(bits));
}

/*static*/
ParseResult RadixParser::ParsePositive(const char *z, size_t n, int radix) {
    auto result = Parse(z, n, radix);
    if (result.ok() && result.value() < 0) {
        return ParseResult::Fail(RadixError::NotPositive());
    }
    return result;
}

/*static*/
numsys_i32_t RadixParser::ParseByRadix(const char *z, size_t n, int radix) {
    return Parse(z, n, radix).ValueOrThrow();
}

/*static*/
numsys_i32_t RadixParser::ParsePositiveByRadix(const char *z, size_t n,
                                               int radix) {
    return ParsePositive(z, n, radix).ValueOrThrow();
}

/*static*/
bool RadixParser::TryParseByRadix(const char *z, size_t n, int radix,
                                  numsys_i32_t *value) {
    DCHECK_NOTNULL(value);
    return Capture(Parse(z, n, radix), value);
}

/*static*/
bool RadixParser::TryParsePositiveByRadix(const char *z, size_t n, int radix,
                                          numsys_i32_t *value) {
    DCHECK_NOTNULL(value);
    return Capture(ParsePositive(z, n, radix), value);
}

} // namespace numsys
