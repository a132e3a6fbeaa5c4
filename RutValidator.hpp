#pragma once

#include <atomic>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

// ============================================================================
// COMPILER & PLATFORM DETECTION
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
#define LIKELY(x) __builtin_expect(!!(x), 1)
#define UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
#define LIKELY(x) (x)
#define UNLIKELY(x) (x)
#endif

#if defined(_MSC_VER)
#define FORCE_INLINE __forceinline
#elif defined(__GNUC__) || defined(__clang__)
#define FORCE_INLINE __attribute__((always_inline)) inline
#else
#define FORCE_INLINE inline
#endif

#ifndef NDEBUG
#define SAFE_ASSERT(condition, message)                        \
    do                                                         \
    {                                                          \
        const bool cond_result = !!(condition);                \
        if (!cond_result)                                      \
        {                                                      \
            std::cerr << "Safety violation: " << message       \
                      << " at " << __FILE__ << ":" << __LINE__ \
                      << std::endl;                            \
            assert(cond_result);                               \
        }                                                      \
    } while (0)
#else
#define SAFE_ASSERT(condition, message) ((void)0)
#endif

// ============================================================================
// STATISTICS TRACKER
// ============================================================================

class ValidationStats
{
private:
    mutable std::atomic<uint64_t> validationCount{0};
    mutable std::atomic<uint64_t> scanCount{0};
    mutable std::atomic<uint64_t> extractCount{0};
    mutable std::atomic<uint64_t> errorCount{0};

public:
    void recordValidation() noexcept { validationCount.fetch_add(1, std::memory_order_relaxed); }
    void recordScan() noexcept { scanCount.fetch_add(1, std::memory_order_relaxed); }
    void recordExtract() noexcept { extractCount.fetch_add(1, std::memory_order_relaxed); }
    void recordError() noexcept { errorCount.fetch_add(1, std::memory_order_relaxed); }

    [[nodiscard]] uint64_t getValidationCount() const noexcept
    {
        return validationCount.load(std::memory_order_acquire);
    }
    [[nodiscard]] uint64_t getScanCount() const noexcept
    {
        return scanCount.load(std::memory_order_acquire);
    }
    [[nodiscard]] uint64_t getExtractCount() const noexcept
    {
        return extractCount.load(std::memory_order_acquire);
    }
    [[nodiscard]] uint64_t getErrorCount() const noexcept
    {
        return errorCount.load(std::memory_order_acquire);
    }

    void reset() noexcept
    {
        validationCount.store(0, std::memory_order_relaxed);
        scanCount.store(0, std::memory_order_relaxed);
        extractCount.store(0, std::memory_order_relaxed);
        errorCount.store(0, std::memory_order_relaxed);
    }

    struct StatsSnapshot
    {
        uint64_t validations;
        uint64_t scans;
        uint64_t extracts;
        uint64_t errors;

        [[nodiscard]] double getErrorRate() const noexcept
        {
            return validations > 0
                       ? static_cast<double>(errors) / validations
                       : 0.0;
        }

        [[nodiscard]] uint64_t getSuccessCount() const noexcept
        {
            return validations > errors ? validations - errors : 0;
        }

        [[nodiscard]] bool hasErrors() const noexcept
        {
            return errors > 0;
        }
    };

    [[nodiscard]] StatsSnapshot getSnapshot() const noexcept
    {
        return {
            validationCount.load(std::memory_order_acquire),
            scanCount.load(std::memory_order_acquire),
            extractCount.load(std::memory_order_acquire),
            errorCount.load(std::memory_order_acquire)};
    }
};

// ============================================================================
// ERROR MODEL
// ============================================================================

class RutError
{
public:
    enum class Kind
    {
        INVALID_FORMAT,
        INVALID_DV,
        OUT_OF_RANGE
    };

private:
    Kind kind_;
    char expected_;
    char actual_;

    constexpr RutError(Kind kind, char expected, char actual) noexcept
        : kind_(kind), expected_(expected), actual_(actual) {}

public:
    [[nodiscard]] static constexpr RutError invalidFormat() noexcept
    {
        return {Kind::INVALID_FORMAT, '\0', '\0'};
    }

    [[nodiscard]] static constexpr RutError invalidDv(char mustBe, char instead) noexcept
    {
        return {Kind::INVALID_DV, mustBe, instead};
    }

    [[nodiscard]] static constexpr RutError outOfRange() noexcept
    {
        return {Kind::OUT_OF_RANGE, '\0', '\0'};
    }

    [[nodiscard]] constexpr Kind kind() const noexcept { return kind_; }

    // Only meaningful for INVALID_DV
    [[nodiscard]] constexpr char expectedDv() const noexcept { return expected_; }
    [[nodiscard]] constexpr char actualDv() const noexcept { return actual_; }

    [[nodiscard]] std::string message() const;

    constexpr bool operator==(const RutError &) const noexcept = default;
};

std::ostream &operator<<(std::ostream &out, const RutError &error);

// Either a value or the RutError explaining why there is none.
template <typename T>
class RutResult
{
private:
    std::variant<T, RutError> state_;

public:
    RutResult(T value) noexcept(std::is_nothrow_move_constructible_v<T>)
        : state_(std::in_place_index<0>, std::move(value)) {}

    RutResult(RutError error) noexcept
        : state_(std::in_place_index<1>, error) {}

    [[nodiscard]] bool ok() const noexcept { return state_.index() == 0; }

    explicit operator bool() const noexcept { return ok(); }

    [[nodiscard]] const T &value() const
    {
        if (UNLIKELY(!ok()))
        {
            throw std::logic_error("RutResult holds an error: " +
                                   std::get<1>(state_).message());
        }
        return std::get<0>(state_);
    }

    [[nodiscard]] const RutError &error() const
    {
        if (UNLIKELY(ok()))
        {
            throw std::logic_error("RutResult holds a value, not an error");
        }
        return std::get<1>(state_);
    }
};

// ============================================================================
// RANGE POLICY
// ============================================================================

class RutRange
{
public:
    static constexpr uint32_t MIN = 1'000'000;
    static constexpr uint32_t MAX = 99'999'999;

    // Half-open: MAX itself is neither accepted nor sampled.
    [[nodiscard]] static constexpr bool contains(uint32_t number) noexcept
    {
        return number >= MIN && number < MAX;
    }

    template <typename Generator>
    [[nodiscard]] static uint32_t randomNumber(Generator &generator)
    {
        std::uniform_int_distribution<uint32_t> distribution(MIN, MAX - 1);
        return distribution(generator);
    }

    // Draws from a per-thread engine seeded by std::random_device.
    [[nodiscard]] static uint32_t randomNumber();

    // Dot-grouped rendering, e.g. 1000000 -> "1.000.000"
    [[nodiscard]] static std::string toString(uint32_t number);
};

// ============================================================================
// CHARACTER CLASSIFICATION (Lookup Table)
// ============================================================================

class CharacterClassifier
{
private:
    static constexpr unsigned char CHAR_DIGIT = 0x01;
    static constexpr unsigned char CHAR_CHECK = 0x02;
    static constexpr unsigned char CHAR_ALPHA = 0x04;
    static constexpr unsigned char CHAR_GROUP_SEPARATOR = 0x08;
    static constexpr unsigned char CHAR_DASH = 0x10;

    inline static constexpr unsigned char charTable[256] = {
        // 0-31: control characters
        0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
        0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
        // 32-47: space and symbols, '-' and '.'
        0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x10, 0x08, 0x00,
        // 48-63: digits and more symbols
        0x03, 0x03, 0x03, 0x03, 0x03, 0x03, 0x03, 0x03, 0x03, 0x03, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
        // 64-79: @ and uppercase letters (K is a check character)
        0x00, 0x04, 0x04, 0x04, 0x04, 0x04, 0x04, 0x04, 0x04, 0x04, 0x04, 0x06, 0x04, 0x04, 0x04, 0x04,
        // 80-95: more uppercase and symbols
        0x04, 0x04, 0x04, 0x04, 0x04, 0x04, 0x04, 0x04, 0x04, 0x04, 0x04, 0x00, 0x00, 0x00, 0x00, 0x00,
        // 96-111: backtick and lowercase letters (k is a check character)
        0x00, 0x04, 0x04, 0x04, 0x04, 0x04, 0x04, 0x04, 0x04, 0x04, 0x04, 0x06, 0x04, 0x04, 0x04, 0x04,
        // 112-127: more lowercase and symbols
        0x04, 0x04, 0x04, 0x04, 0x04, 0x04, 0x04, 0x04, 0x04, 0x04, 0x04, 0x00, 0x00, 0x00, 0x00, 0x00,
        // 128-255: extended ASCII (never part of a RUT)
        0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
        0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
        0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
        0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
        0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
        0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
        0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
        0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00};

public:
    [[nodiscard]] static FORCE_INLINE bool isDigit(unsigned char c) noexcept
    {
        return (charTable[c] & CHAR_DIGIT) != 0;
    }

    [[nodiscard]] static FORCE_INLINE bool isCheckChar(unsigned char c) noexcept
    {
        return (charTable[c] & CHAR_CHECK) != 0;
    }

    [[nodiscard]] static FORCE_INLINE bool isAlphaNum(unsigned char c) noexcept
    {
        return (charTable[c] & (CHAR_ALPHA | CHAR_DIGIT)) != 0;
    }

    [[nodiscard]] static FORCE_INLINE bool isGroupSeparator(unsigned char c) noexcept
    {
        return (charTable[c] & CHAR_GROUP_SEPARATOR) != 0;
    }

    [[nodiscard]] static FORCE_INLINE bool isDash(unsigned char c) noexcept
    {
        return (charTable[c] & CHAR_DASH) != 0;
    }

    // Any character that may appear inside a written RUT
    [[nodiscard]] static FORCE_INLINE bool isRutChar(unsigned char c) noexcept
    {
        return (charTable[c] & (CHAR_DIGIT | CHAR_CHECK | CHAR_GROUP_SEPARATOR | CHAR_DASH)) != 0;
    }

    [[nodiscard]] static FORCE_INLINE bool isScanBoundary(unsigned char c) noexcept
    {
        return !isAlphaNum(c);
    }
};

// ============================================================================
// CHECK DIGIT CALCULATOR (modulo 11)
// ============================================================================

class CheckDigitCalculator
{
private:
    static constexpr uint32_t WEIGHT_INIT = 2;
    static constexpr uint32_t WEIGHT_LIMIT = 7;

public:
    [[nodiscard]] static constexpr uint32_t cycleWeight(uint32_t weight) noexcept
    {
        return weight > WEIGHT_LIMIT ? WEIGHT_INIT : weight;
    }

    // Digits are taken least significant first, weighted 2,3,4,5,6,7,2,3,...
    [[nodiscard]] static constexpr uint32_t sumProduct(uint32_t number) noexcept
    {
        uint32_t total = 0;
        uint32_t weight = WEIGHT_INIT;
        do
        {
            total += (number % 10) * weight;
            weight = cycleWeight(weight + 1);
            number /= 10;
        } while (number != 0);
        return total;
    }

    [[nodiscard]] static constexpr uint32_t modEleven(uint32_t total) noexcept
    {
        return 11 - (total % 11);
    }

    [[nodiscard]] static constexpr char compute(uint32_t number) noexcept
    {
        const uint32_t residue = modEleven(sumProduct(number));
        switch (residue)
        {
        case 10:
            return 'K';
        case 11:
            return '0';
        default:
            return static_cast<char>('0' + residue);
        }
    }
};

// ============================================================================
// PARSER
// ============================================================================

class RutParser
{
public:
    // Shape-checked but not yet verified against its check digit
    struct UnverifiedRut
    {
        uint32_t number;
        char dv;
    };

    // Accepts D{1,2} '.'? D{3} '.'? D{3} '-'? C, anchored on both ends,
    // where C is a digit or K/k.
    [[nodiscard]] static RutResult<UnverifiedRut> extract(std::string_view input) noexcept;

private:
    static constexpr size_t MIN_INPUT_SIZE = 8;  // 7 digits + dv
    static constexpr size_t MAX_INPUT_SIZE = 12; // 8 digits, 2 dots, dash, dv
    static constexpr size_t GROUP_DIGITS = 3;
    static constexpr size_t MAX_LEADING_DIGITS = 2;

    [[nodiscard]] static FORCE_INLINE bool consumeGroup(std::string_view body, size_t &pos) noexcept
    {
        for (size_t i = 0; i < GROUP_DIGITS; ++i)
        {
            if (UNLIKELY(pos == 0 || !CharacterClassifier::isDigit(body[pos - 1])))
                return false;
            --pos;
        }
        if (pos > 0 && CharacterClassifier::isGroupSeparator(body[pos - 1]))
            --pos;
        return true;
    }
};

// ============================================================================
// RUT ENTITY & FORMATTER
// ============================================================================

enum class Format
{
    DOTS,
    DASH,
    NONE
};

class Rut
{
private:
    uint32_t number_;
    char dv_;

    constexpr Rut(uint32_t number, char dv) noexcept : number_(number), dv_(dv) {}

    [[nodiscard]] static RutResult<Rut> checkDv(const RutParser::UnverifiedRut &unverified) noexcept;

public:
    // "17.951.585-7", "17951585-7" and "179515857" are all accepted.
    [[nodiscard]] static RutResult<Rut> parse(std::string_view input) noexcept;

    [[nodiscard]] static RutResult<Rut> fromNumber(uint32_t number) noexcept;

    [[nodiscard]] static Rut randomize();

    template <typename Generator>
    [[nodiscard]] static Rut randomize(Generator &generator)
    {
        const uint32_t number = RutRange::randomNumber(generator);
        return Rut(number, CheckDigitCalculator::compute(number));
    }

    [[nodiscard]] constexpr uint32_t number() const noexcept { return number_; }
    [[nodiscard]] constexpr char dv() const noexcept { return dv_; }

    [[nodiscard]] std::string format(Format format) const;

    [[nodiscard]] std::string toString() const { return format(Format::DASH); }

    constexpr bool operator==(const Rut &) const noexcept = default;
};

std::ostream &operator<<(std::ostream &out, const Rut &rut);

// ============================================================================
// INTERFACES
// ============================================================================

class IRutValidator
{
public:
    virtual ~IRutValidator() = default;
    [[nodiscard]] virtual bool isValid(std::string_view text) const noexcept = 0;
    [[nodiscard]] virtual RutResult<Rut> validate(std::string_view text) const noexcept = 0;
    [[nodiscard]] virtual const ValidationStats &getStats() const noexcept = 0;
};

class IRutScanner
{
public:
    virtual ~IRutScanner() = default;
    [[nodiscard]] virtual bool contains(std::string_view text) const noexcept = 0;
    [[nodiscard]] virtual std::vector<Rut> extract(std::string_view text) const noexcept = 0;
    [[nodiscard]] virtual const ValidationStats &getStats() const noexcept = 0;
};

// ============================================================================
// RUT VALIDATOR
// ============================================================================

class RutValidator : public IRutValidator
{
private:
    mutable ValidationStats stats_;

public:
    [[nodiscard]] bool isValid(std::string_view text) const noexcept override
    {
        return validate(text).ok();
    }

    [[nodiscard]] RutResult<Rut> validate(std::string_view text) const noexcept override;

    [[nodiscard]] const ValidationStats &getStats() const noexcept override
    {
        return stats_;
    }
};

// ============================================================================
// RUT SCANNER (free text extraction)
// ============================================================================
// A candidate:
// 1. starts at a digit that does not follow a letter or digit
// 2. spans digits, dots, dashes and K/k
// 3. drops trailing dots and dashes (sentence punctuation)
// 4. is not followed by a letter or digit
// 5. must pass Rut::parse, so shape, range and DV are all enforced
// ============================================================================

class RutScanner : public IRutScanner
{
private:
    static constexpr size_t MAX_INPUT_SIZE = 10 * 1024 * 1024;
    static constexpr size_t MAX_RUTS_EXTRACT = 10000;

    mutable ValidationStats stats_;

    struct Candidate
    {
        size_t start;
        size_t end;
        bool validBoundaries;
    };

    [[nodiscard]] static Candidate findCandidate(std::string_view text, size_t start) noexcept;

    // Calls onMatch for each valid RUT until it returns false.
    template <typename Callback>
    void scan(std::string_view text, Callback &&onMatch) const;

public:
    [[nodiscard]] bool contains(std::string_view text) const noexcept override;

    [[nodiscard]] std::vector<Rut> extract(std::string_view text) const noexcept override;

    [[nodiscard]] const ValidationStats &getStats() const noexcept override
    {
        return stats_;
    }
};

// ============================================================================
// FACTORY
// ============================================================================

class RutValidatorFactory
{
private:
    static IRutValidator &getSharedValidator()
    {
        static RutValidator instance;
        return instance;
    }

    static IRutScanner &getSharedScanner()
    {
        static RutScanner instance;
        return instance;
    }

public:
    [[nodiscard]] static std::unique_ptr<IRutValidator> createValidator()
    {
        return std::make_unique<RutValidator>();
    }

    [[nodiscard]] static std::unique_ptr<IRutScanner> createScanner()
    {
        return std::make_unique<RutScanner>();
    }

    // Shared instances; counters are atomic so concurrent use is safe
    [[nodiscard]] static IRutValidator &getValidator()
    {
        return getSharedValidator();
    }

    [[nodiscard]] static IRutScanner &getScanner()
    {
        return getSharedScanner();
    }
};
