#include "RutValidator.hpp"

#include <algorithm>
#include <locale>
#include <sstream>
#include <unordered_set>

// ============================================================================
// THOUSANDS GROUPING
// ============================================================================

namespace
{
    class DotGrouping : public std::numpunct<char>
    {
    protected:
        char do_thousands_sep() const override { return '.'; }
        std::string do_grouping() const override { return "\3"; }
    };

    const std::locale &groupedLocale()
    {
        // The locale owns the facet
        static const std::locale instance(std::locale::classic(), new DotGrouping);
        return instance;
    }

    std::string groupThousands(uint32_t number)
    {
        std::ostringstream out;
        out.imbue(groupedLocale());
        out << number;
        return out.str();
    }
}

// ============================================================================
// ERROR MODEL
// ============================================================================

std::string RutError::message() const
{
    switch (kind_)
    {
    case Kind::INVALID_FORMAT:
        return "The input format is invalid";
    case Kind::INVALID_DV:
        return std::string("Invalid DV, must be ") + expected_ + ", instead " + actual_ + ".";
    case Kind::OUT_OF_RANGE:
        return "The input number must be between " + RutRange::toString(RutRange::MIN) +
               " to " + RutRange::toString(RutRange::MAX);
    }
    return "Unknown RUT error";
}

std::ostream &operator<<(std::ostream &out, const RutError &error)
{
    return out << error.message();
}

// ============================================================================
// RANGE POLICY
// ============================================================================

uint32_t RutRange::randomNumber()
{
    thread_local std::mt19937 engine{std::random_device{}()};
    return randomNumber(engine);
}

std::string RutRange::toString(uint32_t number)
{
    return groupThousands(number);
}

// ============================================================================
// PARSER
// ============================================================================

RutResult<RutParser::UnverifiedRut> RutParser::extract(std::string_view input) noexcept
{
    const size_t len = input.length();

    if (UNLIKELY(len < MIN_INPUT_SIZE || len > MAX_INPUT_SIZE))
        return RutError::invalidFormat();

    // The check character is always the last one; an optional dash precedes it.
    const unsigned char check = static_cast<unsigned char>(input[len - 1]);
    if (!CharacterClassifier::isCheckChar(check))
        return RutError::invalidFormat();

    size_t bodyEnd = len - 1;
    if (CharacterClassifier::isDash(input[bodyEnd - 1]))
        --bodyEnd;

    const std::string_view body = input.substr(0, bodyEnd);

    // Walk right to left: two groups of three, then one or two leading digits.
    size_t pos = body.length();
    if (!consumeGroup(body, pos) || !consumeGroup(body, pos))
        return RutError::invalidFormat();

    size_t leading = 0;
    while (pos > 0 && leading < MAX_LEADING_DIGITS && CharacterClassifier::isDigit(body[pos - 1]))
    {
        --pos;
        ++leading;
    }

    if (leading == 0 || pos != 0)
        return RutError::invalidFormat();

    uint32_t number = 0;
    for (const char c : body)
    {
        if (CharacterClassifier::isGroupSeparator(c))
            continue;
        SAFE_ASSERT(CharacterClassifier::isDigit(c), "RutParser body holds only digits and dots");
        number = number * 10 + static_cast<uint32_t>(c - '0');
    }

    const char dv = (check == 'k') ? 'K' : static_cast<char>(check);
    return UnverifiedRut{number, dv};
}

// ============================================================================
// RUT ENTITY & FORMATTER
// ============================================================================

RutResult<Rut> Rut::parse(std::string_view input) noexcept
{
    const auto unverified = RutParser::extract(input);
    if (!unverified)
        return unverified.error();

    return checkDv(unverified.value());
}

RutResult<Rut> Rut::checkDv(const RutParser::UnverifiedRut &unverified) noexcept
{
    const auto signedRut = fromNumber(unverified.number);
    if (!signedRut)
        return signedRut.error();

    const char expected = signedRut.value().dv();
    if (expected != unverified.dv)
        return RutError::invalidDv(expected, unverified.dv);

    return signedRut;
}

RutResult<Rut> Rut::fromNumber(uint32_t number) noexcept
{
    if (!RutRange::contains(number))
        return RutError::outOfRange();

    return Rut(number, CheckDigitCalculator::compute(number));
}

Rut Rut::randomize()
{
    const uint32_t number = RutRange::randomNumber();
    return Rut(number, CheckDigitCalculator::compute(number));
}

std::string Rut::format(Format format) const
{
    switch (format)
    {
    case Format::DOTS:
        return groupThousands(number_) + '-' + dv_;
    case Format::DASH:
        return std::to_string(number_) + '-' + dv_;
    case Format::NONE:
        return std::to_string(number_) + dv_;
    }
    return std::to_string(number_) + '-' + dv_;
}

std::ostream &operator<<(std::ostream &out, const Rut &rut)
{
    return out << rut.toString();
}

// ============================================================================
// RUT VALIDATOR
// ============================================================================

RutResult<Rut> RutValidator::validate(std::string_view text) const noexcept
{
    stats_.recordValidation();

    auto result = Rut::parse(text);
    if (!result)
        stats_.recordError();

    return result;
}

// ============================================================================
// RUT SCANNER
// ============================================================================

RutScanner::Candidate RutScanner::findCandidate(std::string_view text, size_t start) noexcept
{
    const size_t len = text.length();
    SAFE_ASSERT(start < len, "findCandidate start bounds");

    size_t end = start;
    while (end < len && CharacterClassifier::isRutChar(text[end]))
        ++end;

    const size_t scanned = end;

    // Sentence punctuation after the check character is not part of the RUT
    while (end > start &&
           (CharacterClassifier::isGroupSeparator(text[end - 1]) || CharacterClassifier::isDash(text[end - 1])))
        --end;

    // Stopped on a letter, e.g. "12345678-9abc"
    const bool rightBoundary = scanned >= len || CharacterClassifier::isScanBoundary(text[scanned]);

    return {start, end, rightBoundary && end > start};
}

template <typename Callback>
void RutScanner::scan(std::string_view text, Callback &&onMatch) const
{
    const size_t len = text.length();
    size_t pos = 0;

    while (pos < len)
    {
        const unsigned char c = static_cast<unsigned char>(text[pos]);

        if (!CharacterClassifier::isDigit(c) ||
            (pos > 0 && !CharacterClassifier::isScanBoundary(text[pos - 1])))
        {
            ++pos;
            continue;
        }

        const Candidate candidate = findCandidate(text, pos);

        if (candidate.validBoundaries)
        {
            const auto rut = Rut::parse(text.substr(candidate.start, candidate.end - candidate.start));
            if (rut && !onMatch(rut.value()))
                return;
        }

        // Skip the whole run so its tail is not rescanned as a new candidate
        pos = std::max(candidate.end, pos + 1);
        while (pos < len && CharacterClassifier::isRutChar(text[pos]))
            ++pos;
    }
}

bool RutScanner::contains(std::string_view text) const noexcept
{
    stats_.recordScan();

    if (UNLIKELY(text.length() > MAX_INPUT_SIZE))
    {
        stats_.recordError();
        return false;
    }

    bool found = false;
    scan(text, [&found](const Rut &)
         {
             found = true;
             return false;
         });
    return found;
}

std::vector<Rut> RutScanner::extract(std::string_view text) const noexcept
{
    stats_.recordExtract();

    std::vector<Rut> ruts;

    if (UNLIKELY(text.length() > MAX_INPUT_SIZE))
    {
        stats_.recordError();
        return ruts;
    }

    try
    {
        std::unordered_set<uint32_t> seen;

        scan(text, [this, &ruts, &seen](const Rut &rut)
             {
                 if (UNLIKELY(ruts.size() >= MAX_RUTS_EXTRACT))
                 {
                     stats_.recordError();
                     return false;
                 }

                 if (seen.insert(rut.number()).second)
                     ruts.push_back(rut);
                 return true;
             });
    }
    catch (const std::bad_alloc &)
    {
        stats_.recordError();
        ruts.clear();
    }
    catch (const std::exception &)
    {
        stats_.recordError();
        ruts.clear();
    }

    return ruts;
}
