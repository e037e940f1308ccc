#ifndef NUMSYS_BASE_H_
#define NUMSYS_BASE_H_

#include <stddef.h>
#include <stdint.h>

namespace numsys {

/**
 * The numsys types:
 *
 * numsys_i32_t -> fixed 32 bits, result of every parsing
 * numsys_u32_t -> fixed 32 bits, wrapped accumulator
 * numsys_u64_t -> fixed 64 bits, wide accumulator
 */
#define NUMSYS_SUPPORTED_RADIXES(M) \
    M(Octal,        8)              \
    M(Decimal,     10)              \
    M(Hex,         16)

typedef int32_t  numsys_i32_t;
typedef uint32_t numsys_u32_t;
typedef uint64_t numsys_u64_t;

/**
 * Constants
 *
 */
#define DEFINE_RADIX_CONSTANT(name, value) \
    static const int k##name = value;
NUMSYS_SUPPORTED_RADIXES(DEFINE_RADIX_CONSTANT)
#undef DEFINE_RADIX_CONSTANT

// Digits of every supported radix, radix N uses the first N chars.
static const char kDigitAlphabet[] = "0123456789ABCDEF";

static const int kMaxRadix = 16;

static const char kNegativeSign = '-';

static const int kWordBits = 32;

static const numsys_u64_t kWordMask = (static_cast<numsys_u64_t>(1) << kWordBits) - 1;

/**
 * Get size of array.
 */
template <class T, size_t N>
char (&ArraySizeHelper(T (&array)[N]))[N];

#ifndef _MSC_VER
template <class T, size_t N>
char (&ArraySizeHelper(const T (&array)[N]))[N];
#endif

#define arraysize(array) (sizeof(::numsys::ArraySizeHelper(array)))

/**
 * define getter
 */
#define DEF_GETTER(type, name) \
    inline const type &name() const { return name##_; }

// Reinterpret the low 32 bits as a two's-complement signed value.
inline numsys_i32_t WrapToI32(numsys_u32_t bits) {
    return bits <= static_cast<numsys_u32_t>(INT32_MAX)
           ? static_cast<numsys_i32_t>(bits)
           : -static_cast<numsys_i32_t>(~bits) - 1;
}

// base initializer
void EnvironmentInitialize();

} // namespace numsys

#endif // NUMSYS_BASE_H_
